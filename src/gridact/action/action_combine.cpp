/**
 * @file action_combine.cpp
 * @brief Composition of two actions performed in the same step.
 */
#include "gridact/action/action_state.hpp"

namespace gridact
{

namespace
{

/**
 * @brief Merge set/change pairs of a two-state domain.
 *
 * @param invert Maps a pending set value to the value it takes after a toggle.
 */
template <typename Invert>
void merge_set_change(std::vector<int>& me_set, std::vector<bool>& me_change, const std::vector<int>& other_set,
                      const std::vector<bool>& other_change, Invert&& invert)
{
    for (size_t i = 0; i < me_set.size(); ++i)
    {
        const bool pending_change = me_change[i];
        const int pending_set = me_set[i];

        if (other_change[i])
        {
            // Two toggles cancel, one toggle stays pending.
            me_change[i] = !pending_change;
        }
        if (other_set[i] != 0)
        {
            me_change[i] = false;
        }
        if (pending_set != 0 && other_change[i])
        {
            me_set[i] = invert(pending_set);
            me_change[i] = false;
        }
        if (other_set[i] != 0)
        {
            me_set[i] = other_set[i];
        }
    }
}

bool any_finite_nonzero(const std::vector<double>& values) noexcept
{
    return std::any_of(values.begin(), values.end(), [](double v) { return std::isfinite(v) && v != 0.0; });
}

bool any_finite(const std::vector<double>& values) noexcept
{
    return std::any_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

std::string cut_message(ActionAttribute attribute)
{
    return std::string("The action added to me will be cut, because I don't support modification of \"") +
           to_string(attribute) + "\"";
}

} // namespace

// ============================================================================
// Composition
// ============================================================================

ActionDiagnostics ActionState::combine(const ActionState& other)
{
    if (!m_schema->same_grid(*other.m_schema))
    {
        throw IllegalAction(IllegalActionCode::IncompatibleGrid, "Cannot combine actions defined on different grids");
    }

    ActionDiagnostics diagnostics;
    const ActionCapabilities& caps = *m_capabilities;
    auto drop = [&](ActionAttribute attribute) {
        diagnostics.add_warning(DiagnosticCategory::DroppedModification, cut_message(attribute), attribute);
    };

    // Injections: finite incoming entries overwrite.
    for (const auto& [key, incoming] : other.m_injection)
    {
        const ActionAttribute attribute = to_attribute(key);
        if (!caps.supports(attribute))
        {
            if (any_finite(incoming))
            {
                drop(attribute);
            }
            continue;
        }
        auto it = m_injection.find(key);
        if (it == m_injection.end() || it->second.size() != incoming.size())
        {
            m_injection[key] = incoming;
        }
        else
        {
            for (size_t i = 0; i < incoming.size(); ++i)
            {
                if (std::isfinite(incoming[i]))
                {
                    it->second[i] = incoming[i];
                }
            }
        }
        m_modified.injection = true;
    }

    // Redispatch and storage: finite incoming entries accumulate.
    auto accumulate = [&](ActionAttribute attribute, std::vector<double>& mine, const std::vector<double>& incoming,
                          bool& flag, bool incoming_flag) {
        if (!caps.supports(attribute))
        {
            if (any_finite_nonzero(incoming))
            {
                drop(attribute);
            }
            return;
        }
        for (size_t i = 0; i < incoming.size(); ++i)
        {
            if (std::isfinite(incoming[i]))
            {
                mine[i] += incoming[i];
            }
        }
        flag = flag || incoming_flag;
    };
    accumulate(ActionAttribute::Redispatch, m_redispatch, other.m_redispatch, m_modified.redispatch,
               other.m_modified.redispatch);
    accumulate(ActionAttribute::StoragePower, m_storage_power, other.m_storage_power, m_modified.storage,
               other.m_modified.storage);

    // Set/change pairs are merged on copies, then assigned or cut.
    auto merge_pair = [&](ActionAttribute set_attr, ActionAttribute change_attr, std::vector<int>& set,
                          std::vector<bool>& change, const std::vector<int>& other_set,
                          const std::vector<bool>& other_change, auto&& invert) {
        std::vector<int> merged_set = set;
        std::vector<bool> merged_change = change;
        merge_set_change(merged_set, merged_change, other_set, other_change, invert);
        if (caps.supports(set_attr))
        {
            set.swap(merged_set);
        }
        else if (merged_set != set)
        {
            drop(set_attr);
        }
        if (caps.supports(change_attr))
        {
            change.swap(merged_change);
        }
        else if (merged_change != change)
        {
            drop(change_attr);
        }
    };

    merge_pair(ActionAttribute::SetLineStatus, ActionAttribute::ChangeLineStatus, m_set_line_status,
               m_change_line_status, other.m_set_line_status, other.m_change_line_status,
               [](int status) { return -status; });

    // Bus inversion swaps busbars 1 and 2; a pending disconnection stays.
    merge_pair(ActionAttribute::SetBus, ActionAttribute::ChangeBus, m_set_bus, m_change_bus, other.m_set_bus,
               other.m_change_bus, [](int bus) { return bus > 0 ? (kBusbarsPerSubstation + 1) - bus : bus; });

    // Hazards and maintenance: union.
    auto unite = [&](ActionAttribute attribute, std::vector<bool>& mine, const std::vector<bool>& incoming,
                     bool& flag, bool incoming_flag) {
        const bool incoming_any = std::find(incoming.begin(), incoming.end(), true) != incoming.end();
        if (!caps.supports(attribute))
        {
            if (incoming_any)
            {
                drop(attribute);
            }
            return;
        }
        for (size_t i = 0; i < incoming.size(); ++i)
        {
            mine[i] = mine[i] || incoming[i];
        }
        flag = flag || incoming_flag;
    };
    unite(ActionAttribute::Hazards, m_hazards, other.m_hazards, m_modified.hazards, other.m_modified.hazards);
    unite(ActionAttribute::Maintenance, m_maintenance, other.m_maintenance, m_modified.maintenance,
          other.m_modified.maintenance);

    // Shunts: last writer wins per finite (or non-zero bus) entry.
    if (m_schema->shunts_available())
    {
        auto overwrite = [&](ActionAttribute attribute, auto& mine, const auto& incoming, auto&& is_set) {
            auto merged = mine;
            for (size_t i = 0; i < incoming.size(); ++i)
            {
                if (is_set(incoming[i]))
                {
                    merged[i] = incoming[i];
                }
            }
            if (caps.supports(attribute))
            {
                mine.swap(merged);
            }
            else if (std::any_of(incoming.begin(), incoming.end(), is_set))
            {
                drop(attribute);
            }
        };
        auto finite = [](double v) { return std::isfinite(v); };
        overwrite(ActionAttribute::ShuntP, m_shunt_p, other.m_shunt_p, finite);
        overwrite(ActionAttribute::ShuntQ, m_shunt_q, other.m_shunt_q, finite);
        overwrite(ActionAttribute::ShuntBus, m_shunt_bus, other.m_shunt_bus, [](int bus) { return bus != 0; });
        if (caps.supports(ActionAttribute::ShuntP))
        {
            m_modified.shunt = m_modified.shunt || other.m_modified.shunt;
        }
    }

    if (caps.supports(ActionAttribute::SetBus))
    {
        m_modified.set_bus = m_modified.set_bus || other.m_modified.set_bus;
    }
    if (caps.supports(ActionAttribute::ChangeBus))
    {
        m_modified.change_bus = m_modified.change_bus || other.m_modified.change_bus;
    }
    if (caps.supports(ActionAttribute::SetLineStatus))
    {
        m_modified.set_status = m_modified.set_status || other.m_modified.set_status;
    }
    if (caps.supports(ActionAttribute::ChangeLineStatus))
    {
        m_modified.change_status = m_modified.change_status || other.m_modified.change_status;
    }

    touched();
    return diagnostics;
}

ActionState& ActionState::operator+=(const ActionState& other)
{
    // Warnings are available through combine().
    combine(other);
    return *this;
}

ActionState operator+(const ActionState& a, const ActionState& b)
{
    ActionState result = a;
    result += b;
    return result;
}

} // namespace gridact
