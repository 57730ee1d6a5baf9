/**
 * @file grid_schema.cpp
 */
#include "gridact/schema/grid_schema.hpp"

#include <numeric>

namespace gridact
{

namespace
{

SchemaErrorCode count_error(ElementKind kind) noexcept
{
    switch (kind)
    {
    case ElementKind::Load:
        return SchemaErrorCode::IncorrectNumberOfLoads;
    case ElementKind::Generator:
        return SchemaErrorCode::IncorrectNumberOfGenerators;
    case ElementKind::LineOr:
    case ElementKind::LineEx:
        return SchemaErrorCode::IncorrectNumberOfLines;
    case ElementKind::Storage:
        return SchemaErrorCode::IncorrectNumberOfStorages;
    }
    return SchemaErrorCode::IncorrectNumberOfElements;
}

SchemaErrorCode position_error(ElementKind kind) noexcept
{
    switch (kind)
    {
    case ElementKind::Load:
        return SchemaErrorCode::IncorrectPositionOfLoads;
    case ElementKind::Generator:
        return SchemaErrorCode::IncorrectPositionOfGenerators;
    case ElementKind::LineOr:
    case ElementKind::LineEx:
        return SchemaErrorCode::IncorrectPositionOfLines;
    case ElementKind::Storage:
        return SchemaErrorCode::IncorrectPositionOfStorages;
    }
    return SchemaErrorCode::InvalidTopologyPositions;
}

const std::vector<SubIdx>& described_subids(const GridDescription& d, ElementKind kind) noexcept
{
    switch (kind)
    {
    case ElementKind::Load:
        return d.load_to_subid;
    case ElementKind::Generator:
        return d.gen_to_subid;
    case ElementKind::LineOr:
        return d.line_or_to_subid;
    case ElementKind::LineEx:
        return d.line_ex_to_subid;
    case ElementKind::Storage:
        break;
    }
    return d.storage_to_subid;
}

const std::vector<size_t>& described_sub_pos(const GridDescription& d, ElementKind kind) noexcept
{
    switch (kind)
    {
    case ElementKind::Load:
        return d.load_to_sub_pos;
    case ElementKind::Generator:
        return d.gen_to_sub_pos;
    case ElementKind::LineOr:
        return d.line_or_to_sub_pos;
    case ElementKind::LineEx:
        return d.line_ex_to_sub_pos;
    case ElementKind::Storage:
        break;
    }
    return d.storage_to_sub_pos;
}

void require_length(size_t actual, size_t expected, SchemaErrorCode code, const std::string& what)
{
    if (actual != expected)
    {
        throw SchemaError(code, what + " has " + std::to_string(actual) + " entries but " +
                                    std::to_string(expected) + " are expected");
    }
}

void require_finite(const std::vector<double>& values, SchemaErrorCode code, const std::string& what)
{
    for (size_t i = 0; i < values.size(); ++i)
    {
        if (!std::isfinite(values[i]))
        {
            throw SchemaError(code, what + "[" + std::to_string(i) + "] is not finite");
        }
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

GridSchema::GridSchema(GridDescription description)
    : m_env_name(description.env_name)
{
    check_counts(description);
    build_sub_info(description);
    assign_positions(description);
    check_positions();
    build_topology();
    assign_names(description);

    m_dispatch = std::move(description.dispatch);
    m_storage_data = std::move(description.storage);
    if (description.shunts)
    {
        m_shunts_available = true;
        m_shunt_to_subid = description.shunts->shunt_to_subid;
    }
    check_dispatch_data();
    check_storage_data();
    build_capabilities();
}

GridSchemaPtr GridSchema::create(GridDescription description)
{
    return std::make_shared<const GridSchema>(std::move(description));
}

void GridSchema::check_counts(const GridDescription& description) const
{
    if (description.n_sub == 0)
    {
        throw SchemaError(SchemaErrorCode::IncorrectNumberOfSubstation, "The grid must have at least one substation");
    }
    if (description.load_to_subid.empty())
    {
        throw SchemaError(SchemaErrorCode::IncorrectNumberOfLoads, "The grid must have at least one load");
    }
    if (description.gen_to_subid.empty())
    {
        throw SchemaError(SchemaErrorCode::IncorrectNumberOfGenerators, "The grid must have at least one generator");
    }
    if (description.line_or_to_subid.empty())
    {
        throw SchemaError(SchemaErrorCode::IncorrectNumberOfLines, "The grid must have at least one powerline");
    }
    require_length(description.line_ex_to_subid.size(), description.line_or_to_subid.size(),
                   SchemaErrorCode::IncorrectNumberOfLines, "line_ex_to_subid");

    for (ElementKind kind : kAllElementKinds)
    {
        const auto& subids = described_subids(description, kind);
        for (size_t i = 0; i < subids.size(); ++i)
        {
            if (subids[i] >= description.n_sub)
            {
                throw SchemaError(count_error(kind), std::string(to_string(kind)) + " " + std::to_string(i) +
                                                         " is connected to substation " + std::to_string(subids[i]) +
                                                         " but there are only " + std::to_string(description.n_sub) +
                                                         " substations");
            }
        }
    }

    if (description.shunts)
    {
        const auto& shunts = *description.shunts;
        for (size_t i = 0; i < shunts.shunt_to_subid.size(); ++i)
        {
            if (shunts.shunt_to_subid[i] >= description.n_sub)
            {
                throw SchemaError(SchemaErrorCode::IncorrectNumberOfShunts,
                                  "shunt " + std::to_string(i) + " is connected to substation " +
                                      std::to_string(shunts.shunt_to_subid[i]) + " which does not exist");
            }
        }
        if (!shunts.name_shunt.empty())
        {
            require_length(shunts.name_shunt.size(), shunts.shunt_to_subid.size(),
                           SchemaErrorCode::IncorrectNumberOfShunts, "name_shunt");
        }
    }

    auto check_names = [](const std::vector<std::string>& names, size_t count, SchemaErrorCode code,
                          const char* what) {
        if (!names.empty())
        {
            require_length(names.size(), count, code, what);
        }
    };
    check_names(description.name_load, description.load_to_subid.size(), SchemaErrorCode::IncorrectNumberOfLoads,
                "name_load");
    check_names(description.name_gen, description.gen_to_subid.size(), SchemaErrorCode::IncorrectNumberOfGenerators,
                "name_gen");
    check_names(description.name_line, description.line_or_to_subid.size(), SchemaErrorCode::IncorrectNumberOfLines,
                "name_line");
    check_names(description.name_sub, description.n_sub, SchemaErrorCode::IncorrectNumberOfSubstation, "name_sub");
    check_names(description.name_storage, description.storage_to_subid.size(),
                SchemaErrorCode::IncorrectNumberOfStorages, "name_storage");
}

void GridSchema::build_sub_info(const GridDescription& description)
{
    std::vector<size_t> counted(description.n_sub, 0);
    size_t total = 0;
    for (ElementKind kind : kAllElementKinds)
    {
        for (SubIdx sub : described_subids(description, kind))
        {
            ++counted[sub];
            ++total;
        }
    }

    if (description.sub_info.empty())
    {
        m_sub_info = counted;
    }
    else
    {
        require_length(description.sub_info.size(), description.n_sub, SchemaErrorCode::IncorrectNumberOfSubstation,
                       "sub_info");
        size_t declared = std::accumulate(description.sub_info.begin(), description.sub_info.end(), size_t{0});
        if (declared != total)
        {
            throw SchemaError(SchemaErrorCode::IncorrectNumberOfElements,
                              "sum(sub_info) is " + std::to_string(declared) + " but the grid has " +
                                  std::to_string(total) + " element endpoints");
        }
        for (SubIdx sub = 0; sub < description.n_sub; ++sub)
        {
            if (description.sub_info[sub] != counted[sub])
            {
                throw SchemaError(SchemaErrorCode::IncorrectNumberOfElements,
                                  "sub_info[" + std::to_string(sub) + "] is " +
                                      std::to_string(description.sub_info[sub]) + " but " +
                                      std::to_string(counted[sub]) + " elements are connected to it");
            }
        }
        m_sub_info = description.sub_info;
    }

    for (SubIdx sub = 0; sub < m_sub_info.size(); ++sub)
    {
        if (m_sub_info[sub] == 0)
        {
            throw SchemaError(SchemaErrorCode::EmptySubstation,
                              "Substation " + std::to_string(sub) + " has no element connected to it");
        }
    }

    m_dim_topo = total;
    m_sub_start.assign(m_sub_info.size(), 0);
    for (SubIdx sub = 1; sub < m_sub_info.size(); ++sub)
    {
        m_sub_start[sub] = m_sub_start[sub - 1] + m_sub_info[sub - 1];
    }
}

void GridSchema::assign_positions(const GridDescription& description)
{
    bool any_supplied = false;
    for (ElementKind kind : kAllElementKinds)
    {
        any_supplied = any_supplied || !described_sub_pos(description, kind).empty();
    }

    for (ElementKind kind : kAllElementKinds)
    {
        auto& entry = table(kind);
        entry.to_subid = described_subids(description, kind);
        if (any_supplied)
        {
            const auto& sub_pos = described_sub_pos(description, kind);
            if (sub_pos.size() != entry.to_subid.size())
            {
                throw SchemaError(position_error(kind),
                                  std::string("Local positions of ") + to_string(kind) +
                                      " elements are missing or incomplete; when one kind of element has "
                                      "explicit positions, all kinds must have them");
            }
            entry.to_sub_pos = sub_pos;
        }
    }

    if (any_supplied)
    {
        return;
    }

    std::vector<size_t> next(m_sub_info.size(), 0);
    for (ElementKind kind : kAllElementKinds)
    {
        auto& entry = table(kind);
        entry.to_sub_pos.resize(entry.to_subid.size());
        for (size_t i = 0; i < entry.to_subid.size(); ++i)
        {
            entry.to_sub_pos[i] = next[entry.to_subid[i]]++;
        }
    }
}

void GridSchema::check_positions() const
{
    std::vector<int> seen(m_dim_topo, -1);
    for (ElementKind kind : kAllElementKinds)
    {
        const auto& entry = table(kind);
        for (size_t i = 0; i < entry.to_subid.size(); ++i)
        {
            SubIdx sub = entry.to_subid[i];
            size_t pos = entry.to_sub_pos[i];
            if (pos >= m_sub_info[sub])
            {
                throw SchemaError(position_error(kind), std::string(to_string(kind)) + " " + std::to_string(i) +
                                                            " has local position " + std::to_string(pos) +
                                                            " but substation " + std::to_string(sub) + " has only " +
                                                            std::to_string(m_sub_info[sub]) + " elements");
            }
            TopoIdx slot = m_sub_start[sub] + pos;
            if (seen[slot] != -1)
            {
                throw SchemaError(SchemaErrorCode::InvalidTopologyPositions,
                                  "Topology position " + std::to_string(slot) + " is used by more than one element");
            }
            seen[slot] = 1;
        }
    }
}

void GridSchema::build_topology()
{
    m_topo_vect_to_sub.assign(m_dim_topo, 0);
    m_topo_vect_to_element.assign(m_dim_topo, {ElementKind::Load, 0});
    for (ElementKind kind : kAllElementKinds)
    {
        auto& entry = table(kind);
        entry.pos_topo_vect.resize(entry.to_subid.size());
        for (size_t i = 0; i < entry.to_subid.size(); ++i)
        {
            TopoIdx slot = m_sub_start[entry.to_subid[i]] + entry.to_sub_pos[i];
            entry.pos_topo_vect[i] = slot;
            m_topo_vect_to_sub[slot] = entry.to_subid[i];
            m_topo_vect_to_element[slot] = {kind, i};
        }
    }
}

void GridSchema::assign_names(GridDescription& description)
{
    auto defaulted = [](std::vector<std::string> names, size_t count, auto&& make) {
        if (names.empty())
        {
            names.reserve(count);
            for (size_t i = 0; i < count; ++i)
            {
                names.push_back(make(i));
            }
        }
        return names;
    };

    m_name_load = defaulted(std::move(description.name_load), n_load(), [this](size_t i) {
        return "load_" + std::to_string(m_load.to_subid[i]) + "_" + std::to_string(i);
    });
    m_name_gen = defaulted(std::move(description.name_gen), n_gen(), [this](size_t i) {
        return "gen_" + std::to_string(m_gen.to_subid[i]) + "_" + std::to_string(i);
    });
    m_name_line = defaulted(std::move(description.name_line), n_line(), [this](size_t i) {
        return std::to_string(m_line_or.to_subid[i]) + "_" + std::to_string(m_line_ex.to_subid[i]) + "_" +
               std::to_string(i);
    });
    m_name_sub = defaulted(std::move(description.name_sub), n_sub(),
                           [](size_t i) { return "sub_" + std::to_string(i); });
    m_name_storage = defaulted(std::move(description.name_storage), n_storage(), [this](size_t i) {
        return "storage_" + std::to_string(m_storage.to_subid[i]) + "_" + std::to_string(i);
    });
    if (description.shunts)
    {
        const auto& shunt_subs = description.shunts->shunt_to_subid;
        m_name_shunt = defaulted(std::move(description.shunts->name_shunt), shunt_subs.size(), [&](size_t i) {
            return "shunt_" + std::to_string(shunt_subs[i]) + "_" + std::to_string(i);
        });
    }

    // One index per ObjectKind, in enum order.
    m_name_index.clear();
    for (ObjectKind kind : {ObjectKind::Load, ObjectKind::Generator, ObjectKind::Line, ObjectKind::Storage,
                            ObjectKind::Substation, ObjectKind::Shunt})
    {
        std::unordered_map<std::string, size_t> index;
        const auto& table_names = names(kind);
        for (size_t i = 0; i < table_names.size(); ++i)
        {
            if (!index.emplace(table_names[i], i).second)
            {
                throw SchemaError(SchemaErrorCode::InvalidName, std::string("The ") + to_string(kind) + " name \"" +
                                                                    table_names[i] + "\" is used more than once");
            }
        }
        m_name_index.push_back(std::move(index));
    }
}

void GridSchema::check_dispatch_data() const
{
    if (!m_dispatch)
    {
        return;
    }
    const auto& d = *m_dispatch;
    const auto code = SchemaErrorCode::InvalidDispatchData;
    const size_t n = n_gen();
    require_length(d.gen_type.size(), n, code, "gen_type");
    require_length(d.gen_pmin.size(), n, code, "gen_pmin");
    require_length(d.gen_pmax.size(), n, code, "gen_pmax");
    require_length(d.gen_redispatchable.size(), n, code, "gen_redispatchable");
    require_length(d.gen_max_ramp_up.size(), n, code, "gen_max_ramp_up");
    require_length(d.gen_max_ramp_down.size(), n, code, "gen_max_ramp_down");
    require_length(d.gen_min_uptime.size(), n, code, "gen_min_uptime");
    require_length(d.gen_min_downtime.size(), n, code, "gen_min_downtime");
    require_length(d.gen_cost_per_MW.size(), n, code, "gen_cost_per_MW");
    require_length(d.gen_startup_cost.size(), n, code, "gen_startup_cost");
    require_length(d.gen_shutdown_cost.size(), n, code, "gen_shutdown_cost");
    require_finite(d.gen_pmin, code, "gen_pmin");
    require_finite(d.gen_pmax, code, "gen_pmax");
    require_finite(d.gen_max_ramp_up, code, "gen_max_ramp_up");
    require_finite(d.gen_max_ramp_down, code, "gen_max_ramp_down");

    for (GenIdx g = 0; g < n; ++g)
    {
        if (d.gen_pmin[g] > d.gen_pmax[g])
        {
            throw SchemaError(code, "gen_pmin[" + std::to_string(g) + "] is above gen_pmax[" + std::to_string(g) + "]");
        }
        if (d.gen_max_ramp_up[g] < 0.0 || d.gen_max_ramp_down[g] < 0.0)
        {
            throw SchemaError(code, "Ramps of generator " + std::to_string(g) + " must be non-negative");
        }
    }
}

void GridSchema::check_storage_data() const
{
    const size_t n = n_storage();
    if (!m_storage_data)
    {
        if (n > 0)
        {
            throw SchemaError(SchemaErrorCode::InvalidStorageData,
                              "The grid has " + std::to_string(n) + " storage units but no storage data");
        }
        return;
    }

    const auto& s = *m_storage_data;
    const auto code = SchemaErrorCode::InvalidStorageData;
    require_length(s.storage_type.size(), n, code, "storage_type");
    require_length(s.storage_Emax.size(), n, code, "storage_Emax");
    require_length(s.storage_Emin.size(), n, code, "storage_Emin");
    require_length(s.storage_max_p_prod.size(), n, code, "storage_max_p_prod");
    require_length(s.storage_max_p_absorb.size(), n, code, "storage_max_p_absorb");
    require_length(s.storage_marginal_cost.size(), n, code, "storage_marginal_cost");
    require_length(s.storage_loss.size(), n, code, "storage_loss");
    require_length(s.storage_charging_efficiency.size(), n, code, "storage_charging_efficiency");
    require_length(s.storage_discharging_efficiency.size(), n, code, "storage_discharging_efficiency");
    require_finite(s.storage_Emax, code, "storage_Emax");
    require_finite(s.storage_Emin, code, "storage_Emin");
    require_finite(s.storage_max_p_prod, code, "storage_max_p_prod");
    require_finite(s.storage_max_p_absorb, code, "storage_max_p_absorb");
    require_finite(s.storage_marginal_cost, code, "storage_marginal_cost");
    require_finite(s.storage_loss, code, "storage_loss");
    require_finite(s.storage_charging_efficiency, code, "storage_charging_efficiency");
    require_finite(s.storage_discharging_efficiency, code, "storage_discharging_efficiency");

    for (StorageIdx i = 0; i < n; ++i)
    {
        const std::string unit = "storage unit " + std::to_string(i);
        if (s.storage_Emin[i] < 0.0)
        {
            throw SchemaError(code, unit + " has a negative Emin");
        }
        if (s.storage_Emax[i] < s.storage_Emin[i])
        {
            throw SchemaError(code, unit + " has Emax below Emin");
        }
        if (s.storage_max_p_prod[i] < 0.0 || s.storage_max_p_absorb[i] < 0.0)
        {
            throw SchemaError(code, unit + " has a negative power limit");
        }
        if (s.storage_loss[i] < 0.0)
        {
            throw SchemaError(code, unit + " has a negative loss");
        }
        if (s.storage_loss[i] > s.storage_max_p_absorb[i])
        {
            throw SchemaError(code, unit + " loses more than it can absorb");
        }
        if (s.storage_charging_efficiency[i] < 0.0 || s.storage_charging_efficiency[i] > 1.0)
        {
            throw SchemaError(code, unit + " has a charging efficiency outside [0, 1]");
        }
        if (s.storage_discharging_efficiency[i] <= 0.0 || s.storage_discharging_efficiency[i] > 1.0)
        {
            throw SchemaError(code, unit + " has a discharging efficiency outside (0, 1]");
        }
    }
}

void GridSchema::build_capabilities()
{
    m_capabilities.clear();
    for (ActionProfile profile : kAllActionProfiles)
    {
        m_capabilities.push_back(std::make_shared<const ActionCapabilities>(profile, *this));
    }
}

// ============================================================================
// Query methods
// ============================================================================

const GridSchema::ElementTable& GridSchema::table(ElementKind kind) const noexcept
{
    switch (kind)
    {
    case ElementKind::Load:
        return m_load;
    case ElementKind::Generator:
        return m_gen;
    case ElementKind::LineOr:
        return m_line_or;
    case ElementKind::LineEx:
        return m_line_ex;
    case ElementKind::Storage:
        break;
    }
    return m_storage;
}

GridSchema::ElementTable& GridSchema::table(ElementKind kind) noexcept
{
    return const_cast<ElementTable&>(static_cast<const GridSchema*>(this)->table(kind));
}

size_t GridSchema::element_count(ElementKind kind) const noexcept
{
    return table(kind).to_subid.size();
}

size_t GridSchema::object_count(ObjectKind kind) const noexcept
{
    switch (kind)
    {
    case ObjectKind::Load:
        return n_load();
    case ObjectKind::Generator:
        return n_gen();
    case ObjectKind::Line:
        return n_line();
    case ObjectKind::Storage:
        return n_storage();
    case ObjectKind::Substation:
        return n_sub();
    case ObjectKind::Shunt:
        return n_shunt();
    }
    return 0;
}

const std::vector<SubIdx>& GridSchema::to_subid(ElementKind kind) const noexcept
{
    return table(kind).to_subid;
}

const std::vector<size_t>& GridSchema::to_sub_pos(ElementKind kind) const noexcept
{
    return table(kind).to_sub_pos;
}

const std::vector<TopoIdx>& GridSchema::pos_topo_vect(ElementKind kind) const noexcept
{
    return table(kind).pos_topo_vect;
}

TopoIdx GridSchema::sub_start(SubIdx sub) const
{
    if (sub >= n_sub())
    {
        throw SchemaError(SchemaErrorCode::OutOfRange, "Substation " + std::to_string(sub) +
                                                           " does not exist; there are " + std::to_string(n_sub()) +
                                                           " substations");
    }
    return m_sub_start[sub];
}

std::pair<SubIdx, TopoIdx> GridSchema::resolve(ElementKind kind, size_t id) const
{
    const auto& entry = table(kind);
    if (id >= entry.to_subid.size())
    {
        throw SchemaError(SchemaErrorCode::OutOfRange, std::string(to_string(kind)) + " " + std::to_string(id) +
                                                           " does not exist; there are " +
                                                           std::to_string(entry.to_subid.size()));
    }
    return {entry.to_subid[id], entry.pos_topo_vect[id]};
}

std::pair<ElementKind, size_t> GridSchema::element_at(TopoIdx pos) const
{
    if (pos >= m_dim_topo)
    {
        throw SchemaError(SchemaErrorCode::OutOfRange, "Topology position " + std::to_string(pos) +
                                                           " is outside [0, " + std::to_string(m_dim_topo) + ")");
    }
    return m_topo_vect_to_element[pos];
}

std::vector<ObjectTypeRow> GridSchema::elements_of_substation(SubIdx sub) const
{
    const TopoIdx start = sub_start(sub);
    std::vector<ObjectTypeRow> rows;
    rows.reserve(m_sub_info[sub]);
    for (TopoIdx pos = start; pos < start + m_sub_info[sub]; ++pos)
    {
        ObjectTypeRow row;
        row.fill(-1);
        row[static_cast<size_t>(ObjectColumn::Substation)] = static_cast<int>(sub);
        const auto& [kind, id] = m_topo_vect_to_element[pos];
        ObjectColumn column = ObjectColumn::Storage;
        switch (kind)
        {
        case ElementKind::Load:
            column = ObjectColumn::Load;
            break;
        case ElementKind::Generator:
            column = ObjectColumn::Generator;
            break;
        case ElementKind::LineOr:
            column = ObjectColumn::LineOr;
            break;
        case ElementKind::LineEx:
            column = ObjectColumn::LineEx;
            break;
        case ElementKind::Storage:
            column = ObjectColumn::Storage;
            break;
        }
        row[static_cast<size_t>(column)] = static_cast<int>(id);
        rows.push_back(row);
    }
    return rows;
}

std::vector<ObjectTypeRow> GridSchema::grid_objects_types() const
{
    std::vector<ObjectTypeRow> rows;
    rows.reserve(m_dim_topo);
    for (SubIdx sub = 0; sub < n_sub(); ++sub)
    {
        auto sub_rows = elements_of_substation(sub);
        rows.insert(rows.end(), sub_rows.begin(), sub_rows.end());
    }
    return rows;
}

SubstationObjects GridSchema::get_obj_connect_to(SubIdx sub) const
{
    const TopoIdx start = sub_start(sub);
    SubstationObjects result;
    result.nb_elements = m_sub_info[sub];
    for (TopoIdx pos = start; pos < start + m_sub_info[sub]; ++pos)
    {
        const auto& [kind, id] = m_topo_vect_to_element[pos];
        switch (kind)
        {
        case ElementKind::Load:
            result.loads_id.push_back(id);
            break;
        case ElementKind::Generator:
            result.generators_id.push_back(id);
            break;
        case ElementKind::LineOr:
            result.lines_or_id.push_back(id);
            break;
        case ElementKind::LineEx:
            result.lines_ex_id.push_back(id);
            break;
        case ElementKind::Storage:
            result.storages_id.push_back(id);
            break;
        }
    }
    for (auto* ids : {&result.loads_id, &result.generators_id, &result.lines_or_id, &result.lines_ex_id,
                      &result.storages_id})
    {
        std::sort(ids->begin(), ids->end());
    }
    return result;
}

std::vector<LineIdx> GridSchema::get_lines_id(SubIdx from_sub, SubIdx to_sub) const
{
    std::vector<LineIdx> result;
    for (LineIdx l = 0; l < n_line(); ++l)
    {
        if (m_line_or.to_subid[l] == from_sub && m_line_ex.to_subid[l] == to_sub)
        {
            result.push_back(l);
        }
    }
    if (result.empty())
    {
        throw SchemaError(SchemaErrorCode::NotFound, "No powerline connects substation " + std::to_string(from_sub) +
                                                         " (origin) to substation " + std::to_string(to_sub) +
                                                         " (extremity)");
    }
    return result;
}

std::vector<GenIdx> GridSchema::get_generators_id(SubIdx sub) const
{
    auto result = get_obj_connect_to(sub).generators_id;
    if (result.empty())
    {
        throw SchemaError(SchemaErrorCode::NotFound, "No generator is connected to substation " + std::to_string(sub));
    }
    return result;
}

std::vector<LoadIdx> GridSchema::get_loads_id(SubIdx sub) const
{
    auto result = get_obj_connect_to(sub).loads_id;
    if (result.empty())
    {
        throw SchemaError(SchemaErrorCode::NotFound, "No load is connected to substation " + std::to_string(sub));
    }
    return result;
}

std::vector<StorageIdx> GridSchema::get_storages_id(SubIdx sub) const
{
    auto result = get_obj_connect_to(sub).storages_id;
    if (result.empty())
    {
        throw SchemaError(SchemaErrorCode::NotFound,
                          "No storage unit is connected to substation " + std::to_string(sub));
    }
    return result;
}

const std::vector<std::string>& GridSchema::names(ObjectKind kind) const noexcept
{
    switch (kind)
    {
    case ObjectKind::Load:
        return m_name_load;
    case ObjectKind::Generator:
        return m_name_gen;
    case ObjectKind::Line:
        return m_name_line;
    case ObjectKind::Storage:
        return m_name_storage;
    case ObjectKind::Substation:
        return m_name_sub;
    case ObjectKind::Shunt:
        break;
    }
    return m_name_shunt;
}

std::optional<size_t> GridSchema::find_by_name(ObjectKind kind, const std::string& name) const
{
    const NameIndex& index = name_index(kind);
    auto it = index.find(name);
    if (it == index.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::shared_ptr<const ActionCapabilities> GridSchema::capabilities(ActionProfile profile) const
{
    return m_capabilities[static_cast<size_t>(profile)];
}

bool GridSchema::same_grid(const GridSchema& other) const
{
    if (this == &other)
    {
        return true;
    }
    if (m_sub_info != other.m_sub_info || m_shunt_to_subid != other.m_shunt_to_subid ||
        m_shunts_available != other.m_shunts_available)
    {
        return false;
    }
    for (ElementKind kind : kAllElementKinds)
    {
        if (table(kind).to_subid != other.table(kind).to_subid ||
            table(kind).to_sub_pos != other.table(kind).to_sub_pos)
        {
            return false;
        }
    }
    return m_name_load == other.m_name_load && m_name_gen == other.m_name_gen && m_name_line == other.m_name_line &&
           m_name_sub == other.m_name_sub && m_name_storage == other.m_name_storage &&
           m_name_shunt == other.m_name_shunt;
}

GridDescription GridSchema::description() const
{
    GridDescription d;
    d.env_name = m_env_name;
    d.n_sub = n_sub();
    d.sub_info = m_sub_info;
    d.load_to_subid = m_load.to_subid;
    d.gen_to_subid = m_gen.to_subid;
    d.line_or_to_subid = m_line_or.to_subid;
    d.line_ex_to_subid = m_line_ex.to_subid;
    d.storage_to_subid = m_storage.to_subid;
    d.load_to_sub_pos = m_load.to_sub_pos;
    d.gen_to_sub_pos = m_gen.to_sub_pos;
    d.line_or_to_sub_pos = m_line_or.to_sub_pos;
    d.line_ex_to_sub_pos = m_line_ex.to_sub_pos;
    d.storage_to_sub_pos = m_storage.to_sub_pos;
    d.name_load = m_name_load;
    d.name_gen = m_name_gen;
    d.name_line = m_name_line;
    d.name_sub = m_name_sub;
    d.name_storage = m_name_storage;
    d.dispatch = m_dispatch;
    d.storage = m_storage_data;
    if (m_shunts_available)
    {
        d.shunts = ShuntData{m_shunt_to_subid, m_name_shunt};
    }
    return d;
}

} // namespace gridact
