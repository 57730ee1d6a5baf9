/**
 * @file ambiguity_checker.cpp
 */
#include "gridact/action/ambiguity_checker.hpp"

namespace gridact
{

namespace
{

void require_size(size_t actual, size_t expected, AmbiguityCode code, const std::string& what)
{
    if (actual != expected)
    {
        throw AmbiguousAction(code, "The action modifies " + std::to_string(actual) + " " + what + " while there are " +
                                        std::to_string(expected) + " on the grid");
    }
}

} // namespace

// ============================================================================
// Entry points
// ============================================================================

void AmbiguityChecker::check() const
{
    check_line_status_conflict();
    check_injection_lengths();
    check_vector_lengths();
    check_redispatch();
    check_storage();
    check_bus_range();
    check_set_change_conflict();
    check_line_ends();
    check_status_vs_bus();
    check_shunts();
}

std::optional<AmbiguousAction> AmbiguityChecker::first_violation() const
{
    try
    {
        check();
    }
    catch (const AmbiguousAction& violation)
    {
        return violation;
    }
    return std::nullopt;
}

// ============================================================================
// Individual checks
// ============================================================================

void AmbiguityChecker::check_line_status_conflict() const
{
    const auto& set = m_state.line_set_status();
    const auto& change = m_state.line_change_status();
    for (LineIdx l = 0; l < std::min(set.size(), change.size()); ++l)
    {
        if (change[l] && set[l] != 0)
        {
            throw AmbiguousAction(AmbiguityCode::InvalidLineStatus,
                                  "You asked to change the status of powerline " + std::to_string(l) +
                                      " and to set it at the same time");
        }
    }
}

void AmbiguityChecker::check_injection_lengths() const
{
    const GridSchema& schema = m_state.schema();
    for (const auto& [key, values] : m_state.injection())
    {
        const bool is_load = key == InjectionKey::LoadP || key == InjectionKey::LoadQ;
        if (is_load)
        {
            require_size(values.size(), schema.n_load(), AmbiguityCode::IncorrectNumberOfLoads,
                         std::string("loads (") + to_string(key) + ")");
        }
        else
        {
            require_size(values.size(), schema.n_gen(), AmbiguityCode::IncorrectNumberOfGenerators,
                         std::string("generators (") + to_string(key) + ")");
        }
    }
}

void AmbiguityChecker::check_vector_lengths() const
{
    const GridSchema& schema = m_state.schema();
    require_size(m_state.change_bus().size(), schema.dim_topo(), AmbiguityCode::IncorrectNumberOfElements,
                 "elements (change_bus)");
    require_size(m_state.set_bus().size(), schema.dim_topo(), AmbiguityCode::IncorrectNumberOfElements,
                 "elements (set_bus)");
    require_size(m_state.line_set_status().size(), schema.n_line(), AmbiguityCode::IncorrectNumberOfLines,
                 "lines (set_line_status)");
    require_size(m_state.line_change_status().size(), schema.n_line(), AmbiguityCode::IncorrectNumberOfLines,
                 "lines (change_line_status)");
    require_size(m_state.redispatch().size(), schema.n_gen(), AmbiguityCode::IncorrectNumberOfGenerators,
                 "generators (redispatch)");
}

void AmbiguityChecker::check_redispatch() const
{
    const GridSchema& schema = m_state.schema();
    const auto& redispatch = m_state.redispatch();
    const bool requested = std::any_of(redispatch.begin(), redispatch.end(), [](double v) { return v != 0.0; });
    if (!requested)
    {
        return;
    }

    const DispatchData* dispatch = schema.dispatch();
    if (dispatch == nullptr)
    {
        throw AmbiguousAction(AmbiguityCode::RedispatchingNotAvailable,
                              "Impossible to use a redispatching action in this grid: no dispatch data is available");
    }

    for (GenIdx g = 0; g < redispatch.size(); ++g)
    {
        if (redispatch[g] != 0.0 && !dispatch->gen_redispatchable[g])
        {
            throw AmbiguousAction(AmbiguityCode::InvalidRedispatching,
                                  "Trying to apply a redispatching action on the non redispatchable generator " +
                                      std::to_string(g));
        }
    }
    for (GenIdx g = 0; g < redispatch.size(); ++g)
    {
        if (redispatch[g] > dispatch->gen_max_ramp_up[g])
        {
            throw AmbiguousAction(AmbiguityCode::InvalidRedispatching,
                                  "Some redispatching amount are above the maximum ramp up (generator " +
                                      std::to_string(g) + ")");
        }
        if (-redispatch[g] > dispatch->gen_max_ramp_down[g])
        {
            throw AmbiguousAction(AmbiguityCode::InvalidRedispatching,
                                  "Some redispatching amount are below the maximum ramp down (generator " +
                                      std::to_string(g) + ")");
        }
    }

    auto prod_p = m_state.injection().find(InjectionKey::ProdP);
    if (prod_p == m_state.injection().end())
    {
        return;
    }
    for (GenIdx g = 0; g < redispatch.size(); ++g)
    {
        const double target = prod_p->second[g];
        if (!std::isfinite(target))
        {
            continue;
        }
        const double dispatched = target + redispatch[g];
        if (dispatched > dispatch->gen_pmax[g])
        {
            throw AmbiguousAction(AmbiguityCode::InvalidRedispatching,
                                  "Some redispatching amount, cumulated with the production setpoint, are above pmax "
                                  "for generator " +
                                      std::to_string(g));
        }
        if (dispatched < dispatch->gen_pmin[g])
        {
            throw AmbiguousAction(AmbiguityCode::InvalidRedispatching,
                                  "Some redispatching amount, cumulated with the production setpoint, are below pmin "
                                  "for generator " +
                                      std::to_string(g));
        }
    }
}

void AmbiguityChecker::check_storage() const
{
    const GridSchema& schema = m_state.schema();
    const auto& power = m_state.storage_power();
    if (!m_state.capabilities().supports(ActionAttribute::StoragePower))
    {
        // Without storage control, storage units keep their bus
        const auto& set_bus = m_state.set_bus();
        const auto& change_bus = m_state.change_bus();
        for (TopoIdx pos : schema.pos_topo_vect(ElementKind::Storage))
        {
            if (set_bus[pos] > 0)
            {
                throw AmbiguousAction(AmbiguityCode::InvalidStorage,
                                      "Attempt to modify bus (set) of a storage unit at position " +
                                          std::to_string(pos));
            }
            if (change_bus[pos])
            {
                throw AmbiguousAction(AmbiguityCode::InvalidStorage,
                                      "Attempt to modify bus (change) of a storage unit at position " +
                                          std::to_string(pos));
            }
        }
    }

    const bool requested = m_state.modified().storage ||
                           std::any_of(power.begin(), power.end(), [](double v) { return v != 0.0; });
    if (!requested)
    {
        return;
    }
    if (schema.n_storage() == 0)
    {
        throw AmbiguousAction(AmbiguityCode::InvalidStorage,
                              "Attempt to modify a storage unit while there is none on the grid");
    }
    if (power.size() != schema.n_storage())
    {
        throw AmbiguousAction(AmbiguityCode::InvalidStorage,
                              "The action modifies " + std::to_string(power.size()) + " storage units while there are " +
                                  std::to_string(schema.n_storage()) + " on the grid");
    }
    const StorageData& data = *schema.storage();
    for (StorageIdx i = 0; i < power.size(); ++i)
    {
        if (power[i] < -data.storage_max_p_prod[i])
        {
            throw AmbiguousAction(AmbiguityCode::InvalidStorage,
                                  "Storage unit " + std::to_string(i) + " is asked to produce more than its maximum (" +
                                      std::to_string(data.storage_max_p_prod[i]) + " MW)");
        }
        if (power[i] > data.storage_max_p_absorb[i])
        {
            throw AmbiguousAction(AmbiguityCode::InvalidStorage,
                                  "Storage unit " + std::to_string(i) + " is asked to absorb more than its maximum (" +
                                      std::to_string(data.storage_max_p_absorb[i]) + " MW)");
        }
    }
}

void AmbiguityChecker::check_bus_range() const
{
    const auto& set_bus = m_state.set_bus();
    for (TopoIdx pos = 0; pos < set_bus.size(); ++pos)
    {
        if (set_bus[pos] < kMinBusCode)
        {
            throw AmbiguousAction(AmbiguityCode::InvalidBusStatus,
                                  "Invalid set_bus: bus " + std::to_string(set_bus[pos]) + " at position " +
                                      std::to_string(pos) + " is below " + std::to_string(kMinBusCode));
        }
    }
    for (TopoIdx pos = 0; pos < set_bus.size(); ++pos)
    {
        if (set_bus[pos] > kMaxBusCode)
        {
            throw AmbiguousAction(AmbiguityCode::InvalidBusStatus,
                                  "Invalid set_bus: bus " + std::to_string(set_bus[pos]) + " at position " +
                                      std::to_string(pos) + " is above " + std::to_string(kMaxBusCode));
        }
    }
}

void AmbiguityChecker::check_set_change_conflict() const
{
    const auto& set_bus = m_state.set_bus();
    const auto& change_bus = m_state.change_bus();
    for (TopoIdx pos = 0; pos < set_bus.size(); ++pos)
    {
        if (set_bus[pos] != 0 && change_bus[pos])
        {
            throw AmbiguousAction(AmbiguityCode::InvalidBusStatus,
                                  "You asked to change the bus of an object at position " + std::to_string(pos) +
                                      " and to set it at the same time");
        }
    }
}

void AmbiguityChecker::check_line_ends() const
{
    const GridSchema& schema = m_state.schema();
    const auto& set_bus = m_state.set_bus();
    const auto& or_pos = schema.pos_topo_vect(ElementKind::LineOr);
    const auto& ex_pos = schema.pos_topo_vect(ElementKind::LineEx);
    for (LineIdx l = 0; l < schema.n_line(); ++l)
    {
        if (set_bus[or_pos[l]] == -1 && set_bus[ex_pos[l]] > 0)
        {
            throw AmbiguousAction(AmbiguityCode::InvalidLineStatus,
                                  "Powerline " + std::to_string(l) +
                                      " is disconnected at its origin but connected at its extremity");
        }
    }
    for (LineIdx l = 0; l < schema.n_line(); ++l)
    {
        if (set_bus[ex_pos[l]] == -1 && set_bus[or_pos[l]] > 0)
        {
            throw AmbiguousAction(AmbiguityCode::InvalidLineStatus,
                                  "Powerline " + std::to_string(l) +
                                      " is disconnected at its extremity but connected at its origin");
        }
    }
}

void AmbiguityChecker::check_status_vs_bus() const
{
    const GridSchema& schema = m_state.schema();
    const auto& set_bus = m_state.set_bus();
    const auto& change_bus = m_state.change_bus();
    const auto& set_status = m_state.line_set_status();
    const auto& or_pos = schema.pos_topo_vect(ElementKind::LineOr);
    const auto& ex_pos = schema.pos_topo_vect(ElementKind::LineEx);

    for (LineIdx l = 0; l < schema.n_line(); ++l)
    {
        const TopoIdx o = or_pos[l];
        const TopoIdx e = ex_pos[l];
        if (set_status[l] == -1)
        {
            if (change_bus[o] || change_bus[e])
            {
                throw AmbiguousAction(AmbiguityCode::InvalidLineStatus,
                                      "You ask to disconnect powerline " + std::to_string(l) +
                                          " but also to change its bus");
            }
            // Setting an end to -1 agrees with the disconnection
            if (set_bus[o] > 0 || set_bus[e] > 0)
            {
                throw AmbiguousAction(AmbiguityCode::InvalidLineStatus,
                                      "You ask to disconnect powerline " + std::to_string(l) +
                                          " but also to connect it to a certain bus");
            }
        }
        else if (set_status[l] == 1 && (change_bus[o] || change_bus[e]))
        {
            throw AmbiguousAction(AmbiguityCode::InvalidLineStatus,
                                  "You ask to reconnect powerline " + std::to_string(l) +
                                      " but also to change its bus; set the bus instead");
        }
    }
}

void AmbiguityChecker::check_shunts() const
{
    const GridSchema& schema = m_state.schema();
    const auto& p = m_state.shunt_p();
    const auto& q = m_state.shunt_q();
    const auto& bus = m_state.shunt_bus();

    if (!schema.shunts_available())
    {
        if (!p.empty() || !q.empty() || !bus.empty())
        {
            throw AmbiguousAction(AmbiguityCode::InvalidShunt,
                                  "The grid does not declare shunts but the action modifies some");
        }
        return;
    }

    require_size(p.size(), schema.n_shunt(), AmbiguityCode::IncorrectNumberOfShunts, "shunts (shunt_p)");
    require_size(q.size(), schema.n_shunt(), AmbiguityCode::IncorrectNumberOfShunts, "shunts (shunt_q)");
    require_size(bus.size(), schema.n_shunt(), AmbiguityCode::IncorrectNumberOfShunts, "shunts (shunt_bus)");
    for (ShuntIdx s = 0; s < bus.size(); ++s)
    {
        if (bus[s] < kMinBusCode || bus[s] > kMaxBusCode)
        {
            throw AmbiguousAction(AmbiguityCode::InvalidShunt, "Shunt " + std::to_string(s) + " is set to bus " +
                                                                   std::to_string(bus[s]) + " which does not exist");
        }
    }
}

} // namespace gridact
