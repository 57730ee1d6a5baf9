/**
 * @file action_capabilities.cpp
 */
#include "gridact/schema/action_capabilities.hpp"
#include "gridact/schema/grid_schema.hpp"

namespace gridact
{

namespace
{

std::vector<ActionAttribute> profile_attributes(ActionProfile profile, bool shunts_available)
{
    using A = ActionAttribute;
    switch (profile)
    {
    case ActionProfile::Complete:
    {
        std::vector<A> all(kAllActionAttributes.begin(), kAllActionAttributes.end());
        if (!shunts_available)
        {
            all.erase(std::remove_if(all.begin(), all.end(),
                                     [](A a) { return a == A::ShuntP || a == A::ShuntQ || a == A::ShuntBus; }),
                      all.end());
        }
        return all;
    }
    case ActionProfile::Playable:
        return {A::Redispatch, A::SetLineStatus, A::ChangeLineStatus, A::SetBus, A::ChangeBus, A::StoragePower};
    case ActionProfile::Topology:
        return {A::SetLineStatus, A::ChangeLineStatus, A::SetBus, A::ChangeBus};
    case ActionProfile::TopologyAndDispatch:
        return {A::Redispatch, A::SetLineStatus, A::ChangeLineStatus, A::SetBus, A::ChangeBus};
    case ActionProfile::Dispatch:
        return {A::Redispatch};
    case ActionProfile::PowerlineSet:
        return {A::SetLineStatus};
    case ActionProfile::DoNothing:
        return {};
    }
    return {};
}

size_t schema_size(ActionAttribute attribute, const GridSchema& schema) noexcept
{
    switch (attribute)
    {
    case ActionAttribute::ProdP:
    case ActionAttribute::ProdV:
    case ActionAttribute::Redispatch:
        return schema.n_gen();
    case ActionAttribute::LoadP:
    case ActionAttribute::LoadQ:
        return schema.n_load();
    case ActionAttribute::SetLineStatus:
    case ActionAttribute::ChangeLineStatus:
    case ActionAttribute::Hazards:
    case ActionAttribute::Maintenance:
        return schema.n_line();
    case ActionAttribute::SetBus:
    case ActionAttribute::ChangeBus:
        return schema.dim_topo();
    case ActionAttribute::StoragePower:
        return schema.n_storage();
    case ActionAttribute::ShuntP:
    case ActionAttribute::ShuntQ:
    case ActionAttribute::ShuntBus:
        return schema.n_shunt();
    }
    return 0;
}

// Update keys in digest order, with the attribute that gates each of them.
const std::vector<std::pair<std::string, ActionAttribute>>& update_key_table()
{
    static const std::vector<std::pair<std::string, ActionAttribute>> table = {
        {"shunt", ActionAttribute::ShuntP},
        {"injection", ActionAttribute::ProdP},
        {"redispatch", ActionAttribute::Redispatch},
        {"set_storage", ActionAttribute::StoragePower},
        {"set_bus", ActionAttribute::SetBus},
        {"change_bus", ActionAttribute::ChangeBus},
        {"set_line_status", ActionAttribute::SetLineStatus},
        {"change_line_status", ActionAttribute::ChangeLineStatus},
        {"hazards", ActionAttribute::Hazards},
        {"maintenance", ActionAttribute::Maintenance},
    };
    return table;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ActionCapabilities::ActionCapabilities(ActionProfile profile, const GridSchema& schema)
    : m_profile(profile)
    , m_attributes(profile_attributes(profile, schema.shunts_available()))
{
    for (ActionAttribute attribute : m_attributes)
    {
        const size_t length = schema_size(attribute, schema);
        m_sizes[static_cast<size_t>(attribute)] = length;
        m_layout.push_back(AttributeSlice{attribute, m_vector_size, length});
        m_vector_size += length;
    }
    for (const auto& [key, attribute] : update_key_table())
    {
        if (supports(attribute))
        {
            m_authorized_keys.push_back(key);
        }
    }
}

// ============================================================================
// Query methods
// ============================================================================

bool ActionCapabilities::supports(ActionAttribute attribute) const noexcept
{
    return std::find(m_attributes.begin(), m_attributes.end(), attribute) != m_attributes.end();
}

bool ActionCapabilities::supports_injection() const noexcept
{
    return supports(ActionAttribute::ProdP) || supports(ActionAttribute::ProdV) ||
           supports(ActionAttribute::LoadP) || supports(ActionAttribute::LoadQ);
}

bool ActionCapabilities::authorizes(const std::string& update_key) const
{
    return std::find(m_authorized_keys.begin(), m_authorized_keys.end(), update_key) != m_authorized_keys.end();
}

size_t ActionCapabilities::attribute_size(ActionAttribute attribute) const noexcept
{
    return m_sizes[static_cast<size_t>(attribute)];
}

std::optional<ActionAttribute> ActionCapabilities::attribute_of_update_key(const std::string& update_key)
{
    for (const auto& [key, attribute] : update_key_table())
    {
        if (key == update_key)
        {
            return attribute;
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& ActionCapabilities::known_update_keys()
{
    static const std::vector<std::string> keys = [] {
        std::vector<std::string> result;
        for (const auto& entry : update_key_table())
        {
            result.push_back(entry.first);
        }
        return result;
    }();
    return keys;
}

} // namespace gridact
