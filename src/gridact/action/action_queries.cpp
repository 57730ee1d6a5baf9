/**
 * @file action_queries.cpp
 */
#include "gridact/action/action_queries.hpp"
#include "gridact/action/action_state.hpp"

namespace gridact
{

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Override of one element, or NaN.
double injection_at(const ActionState& state, InjectionKey key, size_t id)
{
    auto it = state.injection().find(key);
    if (it == state.injection().end() || id >= it->second.size())
    {
        return kNaN;
    }
    return it->second[id];
}

// Whole override, or NaN everywhere.
std::vector<double> injection_of(const ActionState& state, InjectionKey key, size_t count)
{
    auto it = state.injection().find(key);
    if (it == state.injection().end())
    {
        return std::vector<double>(count, kNaN);
    }
    return it->second;
}

void check_id(size_t id, size_t count, const char* what)
{
    if (id >= count)
    {
        throw IllegalAction(IllegalActionCode::OutOfRange, std::string("There are only ") + std::to_string(count) +
                                                               " " + what + " on the grid, cannot inspect id " +
                                                               std::to_string(id));
    }
}

} // namespace

// ============================================================================
// effect_on
// ============================================================================

ElementEffect effect_on(const ActionState& state, const EffectSelector& selector)
{
    const int selected = int(selector.load_id.has_value()) + int(selector.gen_id.has_value()) +
                         int(selector.line_id.has_value()) + int(selector.storage_id.has_value()) +
                         int(selector.substation_id.has_value());
    if (selected == 0)
    {
        throw IllegalAction(IllegalActionCode::InvalidQuery,
                            "The effect of an action was queried without naming any element");
    }
    if (selected > 1)
    {
        throw IllegalAction(IllegalActionCode::InvalidQuery,
                            "The effect of an action can only be inspected on one single element");
    }

    const GridSchema& schema = state.schema();
    const auto& set_bus = state.set_bus();
    const auto& change_bus = state.change_bus();

    if (selector.load_id)
    {
        const LoadIdx id = *selector.load_id;
        check_id(id, schema.n_load(), "loads");
        const TopoIdx pos = schema.pos_topo_vect(ElementKind::Load)[id];
        return LoadEffect{injection_at(state, InjectionKey::LoadP, id), injection_at(state, InjectionKey::LoadQ, id),
                          set_bus[pos], change_bus[pos]};
    }
    if (selector.gen_id)
    {
        const GenIdx id = *selector.gen_id;
        check_id(id, schema.n_gen(), "generators");
        const TopoIdx pos = schema.pos_topo_vect(ElementKind::Generator)[id];
        return GeneratorEffect{injection_at(state, InjectionKey::ProdP, id),
                               injection_at(state, InjectionKey::ProdV, id), set_bus[pos], change_bus[pos],
                               state.redispatch()[id]};
    }
    if (selector.line_id)
    {
        const LineIdx id = *selector.line_id;
        check_id(id, schema.n_line(), "powerlines");
        const TopoIdx or_pos = schema.pos_topo_vect(ElementKind::LineOr)[id];
        const TopoIdx ex_pos = schema.pos_topo_vect(ElementKind::LineEx)[id];
        return LineEffect{set_bus[or_pos],
                          change_bus[or_pos],
                          set_bus[ex_pos],
                          change_bus[ex_pos],
                          state.line_set_status()[id],
                          state.line_change_status()[id],
                          state.hazards()[id],
                          state.maintenance()[id]};
    }
    if (selector.storage_id)
    {
        const StorageIdx id = *selector.storage_id;
        check_id(id, schema.n_storage(), "storage units");
        const TopoIdx pos = schema.pos_topo_vect(ElementKind::Storage)[id];
        return StorageEffect{state.storage_power()[id], set_bus[pos], change_bus[pos]};
    }

    const SubIdx sub = *selector.substation_id;
    check_id(sub, schema.n_sub(), "substations");
    return SubstationEffect{state.sub_set_bus(sub), state.sub_change_bus(sub)};
}

// ============================================================================
// Per-kind views
// ============================================================================

ActionTypes get_types(const ActionState& state)
{
    ActionTypes types;
    const auto& injection = state.injection();
    types.injection = injection.count(InjectionKey::LoadP) > 0 || injection.count(InjectionKey::ProdP) > 0;
    types.voltage = injection.count(InjectionKey::ProdV) > 0;
    if (state.schema().shunts_available())
    {
        auto finite = [](double v) { return std::isfinite(v); };
        types.voltage = types.voltage || std::any_of(state.shunt_p().begin(), state.shunt_p().end(), finite) ||
                        std::any_of(state.shunt_q().begin(), state.shunt_q().end(), finite) ||
                        std::any_of(state.shunt_bus().begin(), state.shunt_bus().end(), [](int b) { return b != 0; });
    }

    const TopologicalImpact& impact = state.topological_impact();
    types.topology = std::find(impact.subs_impacted.begin(), impact.subs_impacted.end(), true) !=
                     impact.subs_impacted.end();
    types.line = std::find(impact.lines_impacted.begin(), impact.lines_impacted.end(), true) !=
                 impact.lines_impacted.end();
    types.redispatching =
        std::any_of(state.redispatch().begin(), state.redispatch().end(), [](double v) { return v != 0.0; });
    types.storage = state.modified().storage;
    return types;
}

LoadModif get_load_modif(const ActionState& state)
{
    const size_t n = state.schema().n_load();
    return LoadModif{injection_of(state, InjectionKey::LoadP, n), injection_of(state, InjectionKey::LoadQ, n),
                     state.element_set_bus(ElementKind::Load), state.element_change_bus(ElementKind::Load)};
}

GeneratorModif get_gen_modif(const ActionState& state)
{
    const size_t n = state.schema().n_gen();
    return GeneratorModif{injection_of(state, InjectionKey::ProdP, n), injection_of(state, InjectionKey::ProdV, n),
                          state.element_set_bus(ElementKind::Generator),
                          state.element_change_bus(ElementKind::Generator)};
}

StorageModif get_storage_modif(const ActionState& state)
{
    return StorageModif{state.storage_power(), state.element_set_bus(ElementKind::Storage),
                        state.element_change_bus(ElementKind::Storage)};
}

LineModif get_line_modif(const ActionState& state)
{
    return LineModif{state.line_set_status(),
                     state.line_change_status(),
                     state.element_set_bus(ElementKind::LineOr),
                     state.element_set_bus(ElementKind::LineEx),
                     state.element_change_bus(ElementKind::LineOr),
                     state.element_change_bus(ElementKind::LineEx)};
}

} // namespace gridact
