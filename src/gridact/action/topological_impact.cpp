/**
 * @file topological_impact.cpp
 */
#include "gridact/action/topological_impact.hpp"
#include "gridact/action/action_state.hpp"

namespace gridact
{

std::vector<SubIdx> TopologicalImpact::involved_substations(const GridSchema& schema) const
{
    std::vector<bool> involved = subs_impacted;
    involved.resize(schema.n_sub(), false);
    const auto& or_sub = schema.to_subid(ElementKind::LineOr);
    const auto& ex_sub = schema.to_subid(ElementKind::LineEx);
    for (LineIdx l = 0; l < lines_impacted.size() && l < schema.n_line(); ++l)
    {
        if (lines_impacted[l])
        {
            involved[or_sub[l]] = true;
            involved[ex_sub[l]] = true;
        }
    }
    std::vector<SubIdx> result;
    for (SubIdx s = 0; s < involved.size(); ++s)
    {
        if (involved[s])
        {
            result.push_back(s);
        }
    }
    return result;
}

TopologicalImpact compute_topological_impact(const ActionState& state, const std::vector<bool>* known_line_status)
{
    const GridSchema& schema = state.schema();
    const auto& set_bus = state.set_bus();
    const auto& change_bus = state.change_bus();
    const auto& set_status = state.line_set_status();
    const auto& change_status = state.line_change_status();
    const auto& or_pos = schema.pos_topo_vect(ElementKind::LineOr);
    const auto& ex_pos = schema.pos_topo_vect(ElementKind::LineEx);

    TopologicalImpact impact;
    impact.lines_impacted.assign(schema.n_line(), false);
    impact.subs_impacted.assign(schema.n_sub(), false);

    std::vector<bool> effective(schema.dim_topo(), false);
    for (TopoIdx pos = 0; pos < schema.dim_topo(); ++pos)
    {
        effective[pos] = change_bus[pos] || set_bus[pos] != 0;
    }

    auto disconnected = [known_line_status](LineIdx l) {
        return known_line_status == nullptr || !(*known_line_status)[l];
    };

    for (LineIdx l = 0; l < schema.n_line(); ++l)
    {
        impact.lines_impacted[l] = change_status[l] || set_status[l] != 0;
        // Bus edits on a line whose status changes while disconnected are
        // part of the status change.
        if (impact.lines_impacted[l] && disconnected(l))
        {
            effective[or_pos[l]] = false;
            effective[ex_pos[l]] = false;
        }
    }

    if (known_line_status != nullptr)
    {
        for (LineIdx l = 0; l < schema.n_line(); ++l)
        {
            const bool connected = (*known_line_status)[l];
            const bool reconnects = !connected && (set_bus[or_pos[l]] > 0 || set_bus[ex_pos[l]] > 0);
            const bool disconnects = connected && (set_bus[or_pos[l]] < 0 || set_bus[ex_pos[l]] < 0);
            if (reconnects || disconnects)
            {
                impact.lines_impacted[l] = true;
                effective[or_pos[l]] = false;
                effective[ex_pos[l]] = false;
            }
        }
    }

    const auto& topo_to_sub = schema.topo_vect_to_sub();
    for (TopoIdx pos = 0; pos < schema.dim_topo(); ++pos)
    {
        if (effective[pos])
        {
            impact.subs_impacted[topo_to_sub[pos]] = true;
        }
    }
    return impact;
}

} // namespace gridact
