/**
 * @file grid_enums.cpp
 */
#include "gridact/common/grid_enums.hpp"

namespace gridact
{

const char* to_string(ActionAttribute attribute) noexcept
{
    switch (attribute)
    {
    case ActionAttribute::ProdP:
        return "prod_p";
    case ActionAttribute::ProdV:
        return "prod_v";
    case ActionAttribute::LoadP:
        return "load_p";
    case ActionAttribute::LoadQ:
        return "load_q";
    case ActionAttribute::Redispatch:
        return "redispatch";
    case ActionAttribute::SetLineStatus:
        return "set_line_status";
    case ActionAttribute::ChangeLineStatus:
        return "change_line_status";
    case ActionAttribute::SetBus:
        return "set_bus";
    case ActionAttribute::ChangeBus:
        return "change_bus";
    case ActionAttribute::Hazards:
        return "hazards";
    case ActionAttribute::Maintenance:
        return "maintenance";
    case ActionAttribute::StoragePower:
        return "storage_power";
    case ActionAttribute::ShuntP:
        return "shunt_p";
    case ActionAttribute::ShuntQ:
        return "shunt_q";
    case ActionAttribute::ShuntBus:
        return "shunt_bus";
    }
    return "unknown";
}

const char* to_string(ActionProfile profile) noexcept
{
    switch (profile)
    {
    case ActionProfile::Complete:
        return "Complete";
    case ActionProfile::Playable:
        return "Playable";
    case ActionProfile::Topology:
        return "Topology";
    case ActionProfile::TopologyAndDispatch:
        return "TopologyAndDispatch";
    case ActionProfile::Dispatch:
        return "Dispatch";
    case ActionProfile::PowerlineSet:
        return "PowerlineSet";
    case ActionProfile::DoNothing:
        return "DoNothing";
    }
    return "unknown";
}

const char* to_string(InjectionKey key) noexcept
{
    switch (key)
    {
    case InjectionKey::LoadP:
        return "load_p";
    case InjectionKey::LoadQ:
        return "load_q";
    case InjectionKey::ProdP:
        return "prod_p";
    case InjectionKey::ProdV:
        return "prod_v";
    }
    return "unknown";
}

const char* to_string(ElementKind kind) noexcept
{
    switch (kind)
    {
    case ElementKind::Load:
        return "load";
    case ElementKind::Generator:
        return "generator";
    case ElementKind::LineOr:
        return "line (origin)";
    case ElementKind::LineEx:
        return "line (extremity)";
    case ElementKind::Storage:
        return "storage unit";
    }
    return "unknown";
}

const char* to_string(ObjectKind kind) noexcept
{
    switch (kind)
    {
    case ObjectKind::Load:
        return "load";
    case ObjectKind::Generator:
        return "generator";
    case ObjectKind::Line:
        return "powerline";
    case ObjectKind::Storage:
        return "storage unit";
    case ObjectKind::Substation:
        return "substation";
    case ObjectKind::Shunt:
        return "shunt";
    }
    return "unknown";
}

ActionAttribute to_attribute(InjectionKey key) noexcept
{
    switch (key)
    {
    case InjectionKey::LoadP:
        return ActionAttribute::LoadP;
    case InjectionKey::LoadQ:
        return ActionAttribute::LoadQ;
    case InjectionKey::ProdP:
        return ActionAttribute::ProdP;
    case InjectionKey::ProdV:
        return ActionAttribute::ProdV;
    }
    return ActionAttribute::ProdP;
}

std::optional<InjectionKey> parse_injection_key(const std::string& name)
{
    for (auto key : {InjectionKey::LoadP, InjectionKey::LoadQ, InjectionKey::ProdP, InjectionKey::ProdV})
    {
        if (name == to_string(key))
        {
            return key;
        }
    }
    return std::nullopt;
}

} // namespace gridact
