/**
 * @file input_decoder.inline.hpp
 */
#pragma once
#include "gridact/action/input_decoder.hpp"

namespace gridact
{

namespace detail
{

/**
 * @brief Check one value against its domain.
 * @return False if the value must be skipped (non-finite float).
 */
template <typename T>
bool accept_value(const ElementDomain& domain, size_t id, const T& value, const ValueDomain<T>& values)
{
    if constexpr (std::is_floating_point_v<T>)
    {
        (void)domain;
        (void)id;
        (void)values;
        return std::isfinite(value);
    }
    else
    {
        if (value < values.min)
        {
            throw IllegalAction(IllegalActionCode::ValueOutOfDomain,
                                "Value " + std::to_string(value) + " for " + domain.label + " " + std::to_string(id) +
                                    " is below the minimum " + std::to_string(values.min));
        }
        if (value > values.max)
        {
            throw IllegalAction(IllegalActionCode::ValueOutOfDomain,
                                "Value " + std::to_string(value) + " for " + domain.label + " " + std::to_string(id) +
                                    " is above the maximum " + std::to_string(values.max));
        }
        return true;
    }
}

template <typename T>
void assign_one(const ElementDomain& domain, size_t id, const T& value, const ValueDomain<T>& values,
                std::vector<T>& target)
{
    if (accept_value(domain, id, value, values))
    {
        target[domain.slot(id)] = value;
    }
}

/**
 * @brief Visit every `(first slot, local values)` entry of a substation input.
 * @details The dense alternative is not handled here.
 */
template <typename T, typename Visitor>
void visit_substation_entries(const SubstationInput<T>& input, const ElementDomain& substations,
                              const std::vector<size_t>& sub_info, const std::vector<TopoIdx>& sub_start,
                              Visitor&& visit)
{
    auto one = [&](const ElementRef& ref, const std::vector<T>& local) {
        const size_t sub = resolve_element(substations, ref);
        if (local.size() != sub_info[sub])
        {
            throw IllegalAction(IllegalActionCode::WrongInputShape,
                                "Substation " + std::to_string(sub) + " has " + std::to_string(sub_info[sub]) +
                                    " elements but " + std::to_string(local.size()) + " values were provided");
        }
        visit(sub_start[sub], local);
    };

    if (const auto* single = std::get_if<SubstationAssign<T>>(&input))
    {
        one(single->sub, single->values);
    }
    else if (const auto* list = std::get_if<std::vector<SubstationAssign<T>>>(&input))
    {
        for (const auto& entry : *list)
        {
            one(entry.sub, entry.values);
        }
    }
    else if (const auto* keyed = std::get_if<std::map<ElementRef, std::vector<T>>>(&input))
    {
        for (const auto& [ref, local] : *keyed)
        {
            one(ref, local);
        }
    }
}

} // namespace detail

template <typename T>
void apply_values(const ValueInput<T>& input, const ElementDomain& domain, const ValueDomain<T>& values,
                  std::vector<T>& target)
{
    if (const auto* pair = std::get_if<Assign<T>>(&input))
    {
        detail::assign_one(domain, resolve_element(domain, pair->id), pair->value.get(), values, target);
    }
    else if (const auto* list = std::get_if<AssignList<T>>(&input))
    {
        for (const auto& item : *list)
        {
            detail::assign_one(domain, resolve_element(domain, item.id), item.value.get(), values, target);
        }
    }
    else if (const auto* dense = std::get_if<Dense<T>>(&input))
    {
        if (dense->values.size() != domain.count)
        {
            throw IllegalAction(IllegalActionCode::WrongInputShape,
                                "A full vector for " + domain.label + " must have " + std::to_string(domain.count) +
                                    " entries, got " + std::to_string(dense->values.size()));
        }
        for (size_t id = 0; id < domain.count; ++id)
        {
            detail::assign_one(domain, id, dense->values[id], values, target);
        }
    }
    else
    {
        for (const auto& [ref, value] : std::get<KeyedValues<T>>(input))
        {
            detail::assign_one(domain, resolve_element(domain, ref), value.get(), values, target);
        }
    }
}

} // namespace gridact
