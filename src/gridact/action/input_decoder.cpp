/**
 * @file input_decoder.cpp
 */
#include "gridact/action/input_decoder.hpp"

namespace gridact
{

// ============================================================================
// Element resolution
// ============================================================================

size_t resolve_element(const ElementDomain& domain, const ElementRef& ref)
{
    if (ref.is_name())
    {
        if (domain.names == nullptr)
        {
            throw IllegalAction(IllegalActionCode::WrongInputShape,
                                "Elements of " + domain.label + " cannot be addressed by name (got " +
                                    ref.describe() + ")");
        }
        auto it = domain.names->find(ref.name());
        if (it == domain.names->end())
        {
            throw IllegalAction(IllegalActionCode::UnknownElementName,
                                "No known " + domain.label + " with name " + ref.describe());
        }
        return it->second;
    }

    const long long id = ref.id();
    if (id < 0)
    {
        throw IllegalAction(IllegalActionCode::OutOfRange,
                            "Impossible to modify a " + domain.label + " with negative id " + std::to_string(id));
    }
    if (static_cast<unsigned long long>(id) >= domain.count)
    {
        throw IllegalAction(IllegalActionCode::OutOfRange,
                            "Impossible to modify " + domain.label + " " + std::to_string(id) + ": there are only " +
                                std::to_string(domain.count) + " of them");
    }
    return static_cast<size_t>(id);
}

// ============================================================================
// Toggles and selections
// ============================================================================

std::vector<size_t> resolve_selection(const ToggleInput& input, const ElementDomain& domain)
{
    std::vector<size_t> ids;
    if (const auto* single = std::get_if<ElementRef>(&input))
    {
        ids.push_back(resolve_element(domain, *single));
    }
    else if (const auto* list = std::get_if<IdList>(&input))
    {
        for (const auto& ref : *list)
        {
            ids.push_back(resolve_element(domain, ref));
        }
    }
    else if (const auto* set = std::get_if<IdSet>(&input))
    {
        for (const auto& ref : *set)
        {
            ids.push_back(resolve_element(domain, ref));
        }
    }
    else
    {
        const auto& mask = std::get<Dense<bool>>(input).values;
        if (mask.size() != domain.count)
        {
            throw IllegalAction(IllegalActionCode::WrongInputShape,
                                "A boolean mask for " + domain.label + " must have " + std::to_string(domain.count) +
                                    " entries, got " + std::to_string(mask.size()));
        }
        for (size_t id = 0; id < mask.size(); ++id)
        {
            if (mask[id])
            {
                ids.push_back(id);
            }
        }
    }
    return ids;
}

void apply_toggles(const ToggleInput& input, const ElementDomain& domain, std::vector<bool>& target)
{
    // A listed id appearing twice toggles twice.
    for (size_t id : resolve_selection(input, domain))
    {
        const size_t slot = domain.slot(id);
        target[slot] = !target[slot];
    }
}

// ============================================================================
// Substation-level inputs
// ============================================================================

void apply_substation_values(const SubstationInput<int>& input, const ElementDomain& substations,
                             const std::vector<size_t>& sub_info, const std::vector<TopoIdx>& sub_start,
                             const ValueDomain<int>& values, std::vector<int>& target)
{
    const ElementDomain topology{"topology position", target.size(), nullptr, nullptr};
    if (const auto* dense = std::get_if<Dense<int>>(&input))
    {
        apply_values<int>(*dense, topology, values, target);
        return;
    }
    detail::visit_substation_entries(input, substations, sub_info, sub_start,
                                     [&](TopoIdx start, const std::vector<int>& local) {
                                         for (size_t i = 0; i < local.size(); ++i)
                                         {
                                             detail::assign_one(topology, start + i, local[i], values, target);
                                         }
                                     });
}

void apply_substation_toggles(const SubstationInput<bool>& input, const ElementDomain& substations,
                              const std::vector<size_t>& sub_info, const std::vector<TopoIdx>& sub_start,
                              std::vector<bool>& target)
{
    const ElementDomain topology{"topology position", target.size(), nullptr, nullptr};
    if (const auto* dense = std::get_if<Dense<bool>>(&input))
    {
        apply_toggles(*dense, topology, target);
        return;
    }
    detail::visit_substation_entries(input, substations, sub_info, sub_start,
                                     [&](TopoIdx start, const std::vector<bool>& local) {
                                         for (size_t i = 0; i < local.size(); ++i)
                                         {
                                             if (local[i])
                                             {
                                                 target[start + i] = !target[start + i];
                                             }
                                         }
                                     });
}

} // namespace gridact
