/**
 * @file action_report.cpp
 */
#include "gridact/action/action_report.hpp"
#include "gridact/action/action_state.hpp"

namespace gridact
{

namespace
{

PlacedElement place(const GridSchema& schema, TopoIdx pos, int bus)
{
    const auto [kind, id] = schema.element_at(pos);
    return PlacedElement{kind, id, schema.topo_vect_to_sub()[pos], bus};
}

template <typename Pred>
std::vector<size_t> where(size_t count, Pred&& pred)
{
    std::vector<size_t> result;
    for (size_t i = 0; i < count; ++i)
    {
        if (pred(i))
        {
            result.push_back(i);
        }
    }
    return result;
}

std::string format_mw(double value)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

template <typename T>
std::string join(const std::vector<T>& values)
{
    std::string result = "[";
    for (size_t i = 0; i < values.size(); ++i)
    {
        result += (i == 0 ? "" : ", ") + std::to_string(values[i]);
    }
    return result + "]";
}

// Bus assignments grouped by substation, the way as_dict reports them.
YAML::Node bus_summary(const std::vector<PlacedElement>& elements, bool with_bus)
{
    YAML::Node node;
    std::set<SubIdx> subs;
    for (const PlacedElement& e : elements)
    {
        // Ids are per kind, so a load and a generator may share one
        YAML::Node item;
        item["type"] = to_string(e.kind);
        if (with_bus)
        {
            item["new_bus"] = e.bus;
        }
        node[std::to_string(e.substation)][to_string(e.kind)][std::to_string(e.id)] = item;
        subs.insert(e.substation);
    }
    node["nb_modif_objects"] = elements.size();
    node["nb_modif_subs"] = subs.size();
    node["modif_subs_id"] = std::vector<SubIdx>(subs.begin(), subs.end());
    return node;
}

} // namespace

// ============================================================================
// impact_on_objects
// ============================================================================

ObjectImpact impact_on_objects(const ActionState& state)
{
    const GridSchema& schema = state.schema();
    ObjectImpact impact;

    for (InjectionKey key : {InjectionKey::LoadP, InjectionKey::ProdP, InjectionKey::LoadQ, InjectionKey::ProdV})
    {
        if (state.injection().count(key) > 0)
        {
            impact.injection.changed = true;
            impact.injection.keys.push_back(key);
        }
    }

    const auto& status = state.line_set_status();
    impact.force_line.reconnections = where(status.size(), [&](size_t l) { return status[l] == 1; });
    impact.force_line.disconnections = where(status.size(), [&](size_t l) { return status[l] == -1; });
    impact.force_line.changed = !impact.force_line.reconnections.empty() || !impact.force_line.disconnections.empty();

    const auto& toggles = state.line_change_status();
    impact.switch_line.powerlines = where(toggles.size(), [&](size_t l) { return bool(toggles[l]); });
    impact.switch_line.changed = !impact.switch_line.powerlines.empty();

    const auto& set_bus = state.set_bus();
    const auto& change_bus = state.change_bus();
    for (TopoIdx pos = 0; pos < schema.dim_topo(); ++pos)
    {
        if (change_bus[pos])
        {
            impact.topology.bus_switch.push_back(place(schema, pos, 0));
        }
        if (set_bus[pos] > 0)
        {
            impact.topology.assigned_bus.push_back(place(schema, pos, set_bus[pos]));
        }
        else if (set_bus[pos] < 0)
        {
            impact.topology.disconnect_bus.push_back(place(schema, pos, set_bus[pos]));
        }
    }
    impact.topology.changed = !impact.topology.bus_switch.empty() || !impact.topology.assigned_bus.empty() ||
                              !impact.topology.disconnect_bus.empty();

    const auto& redispatch = state.redispatch();
    for (GenIdx g = 0; g < redispatch.size(); ++g)
    {
        if (redispatch[g] != 0.0)
        {
            impact.redispatch.generators.emplace_back(g, redispatch[g]);
        }
    }
    impact.redispatch.changed = !impact.redispatch.generators.empty();

    if (state.modified().storage)
    {
        const auto& power = state.storage_power();
        for (StorageIdx s = 0; s < power.size(); ++s)
        {
            if (std::isfinite(power[s]))
            {
                impact.storage.setpoints.emplace_back(s, power[s]);
            }
        }
        impact.storage.changed = true;
    }

    impact.has_impact = impact.injection.changed || impact.force_line.changed || impact.switch_line.changed ||
                        impact.topology.changed || impact.redispatch.changed || impact.storage.changed;
    return impact;
}

// ============================================================================
// as_dict
// ============================================================================

YAML::Node as_dict(const ActionState& state)
{
    const GridSchema& schema = state.schema();
    const ObjectImpact impact = impact_on_objects(state);
    YAML::Node res(YAML::NodeType::Map);

    for (InjectionKey key : impact.injection.keys)
    {
        res[to_string(key)] = state.injection().at(key);
    }

    if (impact.force_line.changed)
    {
        YAML::Node node;
        node["nb_connected"] = impact.force_line.reconnections.size();
        node["nb_disconnected"] = impact.force_line.disconnections.size();
        node["connected_id"] = impact.force_line.reconnections;
        node["disconnected_id"] = impact.force_line.disconnections;
        res["set_line_status"] = node;
    }

    if (impact.switch_line.changed)
    {
        YAML::Node node;
        node["nb_changed"] = impact.switch_line.powerlines.size();
        node["changed_id"] = impact.switch_line.powerlines;
        res["change_line_status"] = node;
    }

    if (!impact.topology.bus_switch.empty())
    {
        res["change_bus_vect"] = bus_summary(impact.topology.bus_switch, false);
    }

    std::vector<PlacedElement> assigned = impact.topology.assigned_bus;
    assigned.insert(assigned.end(), impact.topology.disconnect_bus.begin(), impact.topology.disconnect_bus.end());
    if (!assigned.empty())
    {
        res["set_bus_vect"] = bus_summary(assigned, true);
    }

    const auto hazards = where(schema.n_line(), [&](size_t l) { return bool(state.hazards()[l]); });
    if (!hazards.empty())
    {
        res["hazards"] = hazards;
        res["nb_hazards"] = hazards.size();
    }

    const auto maintenance = where(schema.n_line(), [&](size_t l) { return bool(state.maintenance()[l]); });
    if (!maintenance.empty())
    {
        res["maintenance"] = maintenance;
        res["nb_maintenance"] = maintenance.size();
    }

    if (impact.redispatch.changed)
    {
        res["redispatch"] = state.redispatch();
    }

    if (impact.storage.changed)
    {
        res["storage_power"] = state.storage_power();
    }

    if (state.modified().shunt)
    {
        YAML::Node node;
        node["shunt_p"] = state.shunt_p();
        node["shunt_q"] = state.shunt_q();
        node["shunt_bus"] = state.shunt_bus();
        res["shunt"] = node;
    }
    return res;
}

// ============================================================================
// to_string
// ============================================================================

std::string to_string(const ActionState& state)
{
    const GridSchema& schema = state.schema();
    const ObjectImpact impact = impact_on_objects(state);
    std::vector<std::string> lines{"This action will:"};

    if (impact.injection.changed)
    {
        for (InjectionKey key : impact.injection.keys)
        {
            const auto& values = state.injection().at(key);
            std::string text = std::string("\t - Set ") + to_string(key) + " to [";
            for (size_t i = 0; i < values.size(); ++i)
            {
                text += (i == 0 ? "" : ", ") + format_mw(values[i]);
            }
            lines.push_back(text + "]");
        }
    }
    else
    {
        lines.push_back("\t - NOT change anything to the injections");
    }

    if (impact.redispatch.changed)
    {
        lines.push_back("\t - Modify the generators with redispatching in the following way:");
        for (const auto& [gen, amount] : impact.redispatch.generators)
        {
            lines.push_back("\t \t - Redispatch \"" + schema.names(ObjectKind::Generator)[gen] + "\" of " +
                            format_mw(amount) + " MW");
        }
    }
    else
    {
        lines.push_back("\t - NOT perform any redispatching action");
    }

    if (impact.storage.changed)
    {
        lines.push_back("\t - Modify the storage units in the following way:");
        for (const auto& [unit, amount] : impact.storage.setpoints)
        {
            if (amount == 0.0)
            {
                continue;
            }
            lines.push_back("\t \t - Ask unit \"" + schema.names(ObjectKind::Storage)[unit] + "\" to " +
                            (amount > 0.0 ? "absorb " : "produce ") + format_mw(std::fabs(amount)) +
                            " MW (setpoint: " + format_mw(amount) + " MW)");
        }
    }
    else
    {
        lines.push_back("\t - NOT modify any storage capacity");
    }

    if (impact.force_line.changed)
    {
        const auto& reco = impact.force_line.reconnections;
        const auto& disco = impact.force_line.disconnections;
        if (!reco.empty())
        {
            lines.push_back("\t - Force reconnection of " + std::to_string(reco.size()) + " powerlines (" +
                            join(reco) + ")");
        }
        if (!disco.empty())
        {
            lines.push_back("\t - Force disconnection of " + std::to_string(disco.size()) + " powerlines (" +
                            join(disco) + ")");
        }
    }
    else
    {
        lines.push_back("\t - NOT force any line status");
    }

    if (impact.switch_line.changed)
    {
        lines.push_back("\t - Switch status of " + std::to_string(impact.switch_line.powerlines.size()) +
                        " powerlines (" + join(impact.switch_line.powerlines) + ")");
    }
    else
    {
        lines.push_back("\t - NOT switch any line status");
    }

    if (!impact.topology.bus_switch.empty())
    {
        lines.push_back("\t - Change the bus of the following element(s):");
        for (const PlacedElement& e : impact.topology.bus_switch)
        {
            lines.push_back(std::string("\t \t - Switch bus of ") + to_string(e.kind) + " id " +
                            std::to_string(e.id) + " [on substation " + std::to_string(e.substation) + "]");
        }
    }
    else
    {
        lines.push_back("\t - NOT switch anything in the topology");
    }

    if (!impact.topology.assigned_bus.empty() || !impact.topology.disconnect_bus.empty())
    {
        if (!impact.topology.assigned_bus.empty())
        {
            lines.push_back("\t - Set the bus of the following element(s):");
        }
        for (const PlacedElement& e : impact.topology.assigned_bus)
        {
            lines.push_back("\t \t - Assign bus " + std::to_string(e.bus) + " to " + to_string(e.kind) + " id " +
                            std::to_string(e.id) + " [on substation " + std::to_string(e.substation) + "]");
        }
        if (!impact.topology.disconnect_bus.empty())
        {
            lines.push_back("\t - Disconnect the following element(s):");
        }
        for (const PlacedElement& e : impact.topology.disconnect_bus)
        {
            lines.push_back(std::string("\t \t - Disconnect ") + to_string(e.kind) + " id " + std::to_string(e.id) +
                            " [on substation " + std::to_string(e.substation) + "]");
        }
    }
    else
    {
        lines.push_back("\t - NOT force any particular bus configuration");
    }

    std::string result;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        result += (i == 0 ? "" : "\n") + lines[i];
    }
    return result;
}

} // namespace gridact
