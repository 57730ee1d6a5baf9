/**
 * @file action_state.cpp
 */
#include "gridact/action/action_state.hpp"
#include "gridact/action/input_decoder.hpp"

namespace gridact
{

namespace
{

// Doubles compared with NaN meaning "no modification".
bool same_overrides(const std::vector<double>& a, const std::vector<double>& b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i)
    {
        const bool a_finite = std::isfinite(a[i]);
        if (a_finite != std::isfinite(b[i]))
        {
            return false;
        }
        if (a_finite && a[i] != b[i])
        {
            return false;
        }
    }
    return true;
}

bool any_true(const std::vector<bool>& values) noexcept
{
    return std::find(values.begin(), values.end(), true) != values.end();
}

template <typename T>
bool any_nonzero(const std::vector<T>& values) noexcept
{
    return std::any_of(values.begin(), values.end(), [](T v) { return v != T{0}; });
}

bool any_finite(const std::vector<double>& values) noexcept
{
    return std::any_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

} // namespace

// ============================================================================
// Constructor
// ============================================================================

ActionState::ActionState(GridSchemaPtr schema, ActionProfile profile)
    : m_schema(std::move(schema))
{
    if (!m_schema)
    {
        throw IllegalAction(IllegalActionCode::InvalidQuery, "An action needs a grid schema");
    }
    m_capabilities = m_schema->capabilities(profile);
    reset();
}

void ActionState::reset()
{
    const GridSchema& s = *m_schema;
    m_set_bus.assign(s.dim_topo(), 0);
    m_change_bus.assign(s.dim_topo(), false);
    m_set_line_status.assign(s.n_line(), 0);
    m_change_line_status.assign(s.n_line(), false);
    m_injection.clear();
    m_redispatch.assign(s.n_gen(), 0.0);
    m_storage_power.assign(s.n_storage(), 0.0);
    m_hazards.assign(s.n_line(), false);
    m_maintenance.assign(s.n_line(), false);
    if (s.shunts_available())
    {
        m_shunt_p.assign(s.n_shunt(), std::numeric_limits<double>::quiet_NaN());
        m_shunt_q.assign(s.n_shunt(), std::numeric_limits<double>::quiet_NaN());
        m_shunt_bus.assign(s.n_shunt(), 0);
    }
    else
    {
        m_shunt_p.clear();
        m_shunt_q.clear();
        m_shunt_bus.clear();
    }
    m_modified = ModifiedFlags{};
    m_impact_cache.reset();
}

// ============================================================================
// Private helpers
// ============================================================================

void ActionState::require(ActionAttribute attribute) const
{
    if (!m_capabilities->supports(attribute))
    {
        throw IllegalAction(IllegalActionCode::UnsupportedAttribute,
                            std::string("Impossible to modify \"") + to_string(attribute) + "\" with a " +
                                to_string(profile()) + " action");
    }
}

void ActionState::touched() noexcept
{
    m_impact_cache.reset();
}

ElementDomain ActionState::element_domain(ElementKind kind) const
{
    ObjectKind names = ObjectKind::Load;
    switch (kind)
    {
    case ElementKind::Load:
        names = ObjectKind::Load;
        break;
    case ElementKind::Generator:
        names = ObjectKind::Generator;
        break;
    case ElementKind::LineOr:
    case ElementKind::LineEx:
        names = ObjectKind::Line;
        break;
    case ElementKind::Storage:
        names = ObjectKind::Storage;
        break;
    }
    return ElementDomain{to_string(kind), m_schema->element_count(kind), &m_schema->name_index(names),
                         &m_schema->pos_topo_vect(kind)};
}

ElementDomain ActionState::object_domain(ObjectKind kind) const
{
    return ElementDomain{to_string(kind), m_schema->object_count(kind), &m_schema->name_index(kind), nullptr};
}

void ActionState::force_disconnection(const std::vector<LineIdx>& lines)
{
    const auto& or_pos = m_schema->pos_topo_vect(ElementKind::LineOr);
    const auto& ex_pos = m_schema->pos_topo_vect(ElementKind::LineEx);
    for (LineIdx l : lines)
    {
        m_set_line_status[l] = -1;
        m_change_line_status[l] = false;
        m_set_bus[or_pos[l]] = 0;
        m_set_bus[ex_pos[l]] = 0;
        m_change_bus[or_pos[l]] = false;
        m_change_bus[ex_pos[l]] = false;
    }
    m_modified.set_status = true;
}

// ============================================================================
// Per-element views
// ============================================================================

std::vector<int> ActionState::element_set_bus(ElementKind kind) const
{
    const auto& positions = m_schema->pos_topo_vect(kind);
    std::vector<int> result(positions.size());
    for (size_t i = 0; i < positions.size(); ++i)
    {
        result[i] = m_set_bus[positions[i]];
    }
    return result;
}

std::vector<bool> ActionState::element_change_bus(ElementKind kind) const
{
    const auto& positions = m_schema->pos_topo_vect(kind);
    std::vector<bool> result(positions.size());
    for (size_t i = 0; i < positions.size(); ++i)
    {
        result[i] = m_change_bus[positions[i]];
    }
    return result;
}

std::vector<int> ActionState::sub_set_bus(SubIdx sub) const
{
    const TopoIdx start = m_schema->sub_start(sub);
    return std::vector<int>(m_set_bus.begin() + start, m_set_bus.begin() + start + m_schema->sub_info()[sub]);
}

std::vector<bool> ActionState::sub_change_bus(SubIdx sub) const
{
    const TopoIdx start = m_schema->sub_start(sub);
    return std::vector<bool>(m_change_bus.begin() + start,
                             m_change_bus.begin() + start + m_schema->sub_info()[sub]);
}

// ============================================================================
// Accessors
// ============================================================================

void ActionState::set_element_bus(ElementKind kind, const ValueInput<int>& input)
{
    require(ActionAttribute::SetBus);
    const ElementDomain domain = element_domain(kind);
    commit_on_success(m_set_bus, [&](std::vector<int>& working) { apply_values(input, domain, kBusDomain, working); });
    m_modified.set_bus = true;
    touched();
}

void ActionState::change_element_bus(ElementKind kind, const ToggleInput& input)
{
    require(ActionAttribute::ChangeBus);
    const ElementDomain domain = element_domain(kind);
    commit_on_success(m_change_bus, [&](std::vector<bool>& working) { apply_toggles(input, domain, working); });
    m_modified.change_bus = true;
    touched();
}

void ActionState::set_topology_bus(const ValueInput<int>& input)
{
    require(ActionAttribute::SetBus);
    const ElementDomain domain{"topology position", m_schema->dim_topo(), nullptr, nullptr};
    commit_on_success(m_set_bus, [&](std::vector<int>& working) { apply_values(input, domain, kBusDomain, working); });
    m_modified.set_bus = true;
    touched();
}

void ActionState::change_topology_bus(const ToggleInput& input)
{
    require(ActionAttribute::ChangeBus);
    const ElementDomain domain{"topology position", m_schema->dim_topo(), nullptr, nullptr};
    commit_on_success(m_change_bus, [&](std::vector<bool>& working) { apply_toggles(input, domain, working); });
    m_modified.change_bus = true;
    touched();
}

void ActionState::set_substation_bus(const SubstationInput<int>& input)
{
    require(ActionAttribute::SetBus);
    const ElementDomain subs = object_domain(ObjectKind::Substation);
    std::vector<TopoIdx> starts(m_schema->n_sub());
    for (SubIdx s = 0; s < starts.size(); ++s)
    {
        starts[s] = m_schema->sub_start(s);
    }
    commit_on_success(m_set_bus, [&](std::vector<int>& working) {
        apply_substation_values(input, subs, m_schema->sub_info(), starts, kBusDomain, working);
    });
    m_modified.set_bus = true;
    touched();
}

void ActionState::change_substation_bus(const SubstationInput<bool>& input)
{
    require(ActionAttribute::ChangeBus);
    const ElementDomain subs = object_domain(ObjectKind::Substation);
    std::vector<TopoIdx> starts(m_schema->n_sub());
    for (SubIdx s = 0; s < starts.size(); ++s)
    {
        starts[s] = m_schema->sub_start(s);
    }
    commit_on_success(m_change_bus, [&](std::vector<bool>& working) {
        apply_substation_toggles(input, subs, m_schema->sub_info(), starts, working);
    });
    m_modified.change_bus = true;
    touched();
}

void ActionState::set_line_status(const ValueInput<int>& input)
{
    require(ActionAttribute::SetLineStatus);
    const ElementDomain domain = object_domain(ObjectKind::Line);
    commit_on_success(m_set_line_status,
                      [&](std::vector<int>& working) { apply_values(input, domain, kLineStatusDomain, working); });
    m_modified.set_status = true;
    touched();
}

void ActionState::change_line_status(const ToggleInput& input)
{
    require(ActionAttribute::ChangeLineStatus);
    const ElementDomain domain = object_domain(ObjectKind::Line);
    commit_on_success(m_change_line_status,
                      [&](std::vector<bool>& working) { apply_toggles(input, domain, working); });
    m_modified.change_status = true;
    touched();
}

void ActionState::set_redispatch(const ValueInput<double>& input)
{
    require(ActionAttribute::Redispatch);
    const ElementDomain domain = object_domain(ObjectKind::Generator);
    commit_on_success(m_redispatch,
                      [&](std::vector<double>& working) { apply_values(input, domain, kPowerDomain, working); });
    m_modified.redispatch = true;
    touched();
}

void ActionState::set_storage_power(const ValueInput<double>& input)
{
    require(ActionAttribute::StoragePower);
    const ElementDomain domain = object_domain(ObjectKind::Storage);
    commit_on_success(m_storage_power,
                      [&](std::vector<double>& working) { apply_values(input, domain, kPowerDomain, working); });
    m_modified.storage = true;
    touched();
}

void ActionState::set_injection(InjectionKey key, std::vector<double> values)
{
    require(to_attribute(key));
    m_injection[key] = std::move(values);
    m_modified.injection = true;
    touched();
}

void ActionState::set_hazards(const ToggleInput& lines)
{
    require(ActionAttribute::Hazards);
    const auto ids = resolve_selection(lines, object_domain(ObjectKind::Line));
    for (LineIdx l : ids)
    {
        m_hazards[l] = true;
    }
    force_disconnection(ids);
    m_modified.hazards = true;
    touched();
}

void ActionState::set_maintenance(const ToggleInput& lines)
{
    require(ActionAttribute::Maintenance);
    const auto ids = resolve_selection(lines, object_domain(ObjectKind::Line));
    for (LineIdx l : ids)
    {
        m_maintenance[l] = true;
    }
    force_disconnection(ids);
    m_modified.maintenance = true;
    touched();
}

void ActionState::set_shunt_p(const ValueInput<double>& input)
{
    require(ActionAttribute::ShuntP);
    const ElementDomain domain = object_domain(ObjectKind::Shunt);
    commit_on_success(m_shunt_p,
                      [&](std::vector<double>& working) { apply_values(input, domain, kPowerDomain, working); });
    m_modified.shunt = true;
    touched();
}

void ActionState::set_shunt_q(const ValueInput<double>& input)
{
    require(ActionAttribute::ShuntQ);
    const ElementDomain domain = object_domain(ObjectKind::Shunt);
    commit_on_success(m_shunt_q,
                      [&](std::vector<double>& working) { apply_values(input, domain, kPowerDomain, working); });
    m_modified.shunt = true;
    touched();
}

void ActionState::set_shunt_bus(const ValueInput<int>& input)
{
    require(ActionAttribute::ShuntBus);
    const ElementDomain domain = object_domain(ObjectKind::Shunt);
    const ValueDomain<int> any_bus{std::numeric_limits<int>::min(), std::numeric_limits<int>::max()};
    commit_on_success(m_shunt_bus,
                      [&](std::vector<int>& working) { apply_values(input, domain, any_bus, working); });
    m_modified.shunt = true;
    touched();
}

// ============================================================================
// Whole-action queries
// ============================================================================

bool ActionState::is_do_nothing() const
{
    if (!m_injection.empty())
    {
        return false;
    }
    return !any_nonzero(m_set_bus) && !any_true(m_change_bus) && !any_nonzero(m_set_line_status) &&
           !any_true(m_change_line_status) && !any_nonzero(m_redispatch) && !any_nonzero(m_storage_power) &&
           !any_true(m_hazards) && !any_true(m_maintenance) && !any_finite(m_shunt_p) && !any_finite(m_shunt_q) &&
           !any_nonzero(m_shunt_bus);
}

bool ActionState::operator==(const ActionState& other) const
{
    if (profile() != other.profile() || !m_schema->same_grid(*other.m_schema))
    {
        return false;
    }
    if (m_injection.size() != other.m_injection.size())
    {
        return false;
    }
    for (const auto& [key, values] : m_injection)
    {
        auto it = other.m_injection.find(key);
        if (it == other.m_injection.end() || !same_overrides(values, it->second))
        {
            return false;
        }
    }
    return m_set_bus == other.m_set_bus && m_change_bus == other.m_change_bus &&
           m_set_line_status == other.m_set_line_status && m_change_line_status == other.m_change_line_status &&
           m_redispatch == other.m_redispatch && m_storage_power == other.m_storage_power &&
           m_hazards == other.m_hazards && m_maintenance == other.m_maintenance &&
           same_overrides(m_shunt_p, other.m_shunt_p) && same_overrides(m_shunt_q, other.m_shunt_q) &&
           m_shunt_bus == other.m_shunt_bus;
}

// ============================================================================
// Impact
// ============================================================================

const TopologicalImpact& ActionState::topological_impact() const
{
    if (!m_impact_cache)
    {
        m_impact_cache = compute_topological_impact(*this, nullptr);
    }
    return *m_impact_cache;
}

TopologicalImpact ActionState::topological_impact(const std::vector<bool>& known_line_status) const
{
    if (known_line_status.size() != m_schema->n_line())
    {
        throw IllegalAction(IllegalActionCode::InvalidQuery,
                            "The line status has " + std::to_string(known_line_status.size()) +
                                " entries but the grid has " + std::to_string(m_schema->n_line()) + " lines");
    }
    return compute_topological_impact(*this, &known_line_status);
}

} // namespace gridact
