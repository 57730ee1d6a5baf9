/**
 * @file action_update.cpp
 * @brief Digestion of update documents into an ActionState.
 */
#include "gridact/action/action_state.hpp"
#include "gridact/action/action_update.hpp"

namespace gridact
{

namespace
{

[[noreturn]] void throw_empty_targets(const char* key)
{
    throw AmbiguousAction(AmbiguityCode::MalformedUpdate,
                          std::string("Invalid way to modify the topology: \"") + key +
                              "\" should name at least one of loads_id, generators_id, lines_or_id, lines_ex_id, "
                              "storages_id or substations_id");
}

} // namespace

// ============================================================================
// Public entry point
// ============================================================================

ActionDiagnostics ActionState::update(const ActionUpdate& update)
{
    ActionDiagnostics diagnostics;
    for (const std::string& key : update.unknown_keys)
    {
        diagnostics.add_warning(DiagnosticCategory::UnknownUpdateKey,
                                "The key \"" + key + "\" is not recognized and was ignored", std::nullopt, key);
    }

    ActionState working(*this);
    working.apply_update(update, diagnostics);
    *this = std::move(working);
    touched();
    return diagnostics;
}

// ============================================================================
// Digestion, one key at a time
// ============================================================================

void ActionState::apply_update(const ActionUpdate& update, ActionDiagnostics& diagnostics)
{
    auto authorized = [&](const char* key, bool present) {
        if (!present)
        {
            return false;
        }
        if (m_capabilities->authorizes(key))
        {
            return true;
        }
        diagnostics.add_warning(DiagnosticCategory::DroppedModification,
                                std::string("The key \"") + key + "\" cannot be used with a " +
                                    to_string(profile()) + " action and was ignored",
                                ActionCapabilities::attribute_of_update_key(key), key);
        return false;
    };

    if (authorized("shunt", update.shunt.has_value()))
    {
        const ShuntUpdate& shunt = *update.shunt;
        if (shunt.shunt_p)
        {
            set_shunt_p(*shunt.shunt_p);
        }
        if (shunt.shunt_q)
        {
            set_shunt_q(*shunt.shunt_q);
        }
        if (shunt.shunt_bus)
        {
            set_shunt_bus(*shunt.shunt_bus);
        }
    }

    if (authorized("injection", update.injection.has_value()))
    {
        for (const auto& [key, values] : *update.injection)
        {
            set_injection(key, values);
        }
    }

    if (authorized("redispatch", update.redispatch.has_value()))
    {
        set_redispatch(*update.redispatch);
    }

    if (authorized("set_storage", update.set_storage.has_value()))
    {
        set_storage_power(*update.set_storage);
    }

    if (authorized("set_bus", update.set_bus.has_value()))
    {
        if (const auto* dense = std::get_if<ValueInput<int>>(&*update.set_bus))
        {
            set_topology_bus(*dense);
        }
        else
        {
            const SetBusTargets& targets = std::get<SetBusTargets>(*update.set_bus);
            if (!targets.loads_id && !targets.generators_id && !targets.lines_or_id && !targets.lines_ex_id &&
                !targets.storages_id && !targets.substations_id)
            {
                throw_empty_targets("set_bus");
            }
            if (targets.loads_id)
            {
                set_element_bus(ElementKind::Load, *targets.loads_id);
            }
            if (targets.generators_id)
            {
                set_element_bus(ElementKind::Generator, *targets.generators_id);
            }
            if (targets.lines_or_id)
            {
                set_element_bus(ElementKind::LineOr, *targets.lines_or_id);
            }
            if (targets.lines_ex_id)
            {
                set_element_bus(ElementKind::LineEx, *targets.lines_ex_id);
            }
            if (targets.storages_id)
            {
                set_element_bus(ElementKind::Storage, *targets.storages_id);
            }
            if (targets.substations_id)
            {
                set_substation_bus(*targets.substations_id);
            }
        }
    }

    if (authorized("change_bus", update.change_bus.has_value()))
    {
        if (const auto* dense = std::get_if<ToggleInput>(&*update.change_bus))
        {
            change_topology_bus(*dense);
        }
        else
        {
            const ChangeBusTargets& targets = std::get<ChangeBusTargets>(*update.change_bus);
            if (!targets.loads_id && !targets.generators_id && !targets.lines_or_id && !targets.lines_ex_id &&
                !targets.storages_id && !targets.substations_id)
            {
                throw_empty_targets("change_bus");
            }
            if (targets.loads_id)
            {
                change_element_bus(ElementKind::Load, *targets.loads_id);
            }
            if (targets.generators_id)
            {
                change_element_bus(ElementKind::Generator, *targets.generators_id);
            }
            if (targets.lines_or_id)
            {
                change_element_bus(ElementKind::LineOr, *targets.lines_or_id);
            }
            if (targets.lines_ex_id)
            {
                change_element_bus(ElementKind::LineEx, *targets.lines_ex_id);
            }
            if (targets.storages_id)
            {
                change_element_bus(ElementKind::Storage, *targets.storages_id);
            }
            if (targets.substations_id)
            {
                change_substation_bus(*targets.substations_id);
            }
        }
    }

    if (authorized("set_line_status", update.set_line_status.has_value()))
    {
        set_line_status(*update.set_line_status);
    }

    if (authorized("change_line_status", update.change_line_status.has_value()))
    {
        change_line_status(*update.change_line_status);
    }

    // Outages last: they override every edit of the same lines above.
    if (authorized("hazards", update.hazards.has_value()))
    {
        set_hazards(*update.hazards);
    }

    if (authorized("maintenance", update.maintenance.has_value()))
    {
        set_maintenance(*update.maintenance);
    }
}

} // namespace gridact
