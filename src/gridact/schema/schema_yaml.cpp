/**
 * @file schema_yaml.cpp
 */
#include "gridact/schema/schema_yaml.hpp"
#include "gridact/common/gridact_exceptions.hpp"

#include <fstream>

#include <yaml-cpp/yaml.h>

namespace gridact
{

namespace
{

// ============================================================================
// Reading
// ============================================================================

template <typename T>
void read_vector(const YAML::Node& parent, const char* key, std::vector<T>& target)
{
    const YAML::Node node = parent[key];
    if (!node || node.IsNull())
    {
        return;
    }
    if (!node.IsSequence())
    {
        throw SchemaError(SchemaErrorCode::InvalidDocument,
                          std::string("Key \"") + key + "\" must be a sequence");
    }
    target.clear();
    target.reserve(node.size());
    for (const auto& item : node)
    {
        target.push_back(item.as<T>());
    }
}

void read_string(const YAML::Node& parent, const char* key, std::string& target)
{
    const YAML::Node node = parent[key];
    if (node && !node.IsNull())
    {
        target = node.as<std::string>();
    }
}

DispatchData read_dispatch(const YAML::Node& node)
{
    DispatchData data;
    read_vector(node, "gen_type", data.gen_type);
    read_vector(node, "gen_pmin", data.gen_pmin);
    read_vector(node, "gen_pmax", data.gen_pmax);
    read_vector(node, "gen_redispatchable", data.gen_redispatchable);
    read_vector(node, "gen_max_ramp_up", data.gen_max_ramp_up);
    read_vector(node, "gen_max_ramp_down", data.gen_max_ramp_down);
    read_vector(node, "gen_min_uptime", data.gen_min_uptime);
    read_vector(node, "gen_min_downtime", data.gen_min_downtime);
    read_vector(node, "gen_cost_per_MW", data.gen_cost_per_MW);
    read_vector(node, "gen_startup_cost", data.gen_startup_cost);
    read_vector(node, "gen_shutdown_cost", data.gen_shutdown_cost);
    return data;
}

StorageData read_storage(const YAML::Node& node)
{
    StorageData data;
    read_vector(node, "storage_type", data.storage_type);
    read_vector(node, "storage_Emax", data.storage_Emax);
    read_vector(node, "storage_Emin", data.storage_Emin);
    read_vector(node, "storage_max_p_prod", data.storage_max_p_prod);
    read_vector(node, "storage_max_p_absorb", data.storage_max_p_absorb);
    read_vector(node, "storage_marginal_cost", data.storage_marginal_cost);
    read_vector(node, "storage_loss", data.storage_loss);
    read_vector(node, "storage_charging_efficiency", data.storage_charging_efficiency);
    read_vector(node, "storage_discharging_efficiency", data.storage_discharging_efficiency);
    return data;
}

GridDescription read_description(const YAML::Node& doc)
{
    if (!doc.IsMap())
    {
        throw SchemaError(SchemaErrorCode::InvalidDocument, "A grid description must be a YAML mapping");
    }
    GridDescription d;
    read_string(doc, "env_name", d.env_name);
    if (!doc["n_sub"])
    {
        throw SchemaError(SchemaErrorCode::InvalidDocument, "Key \"n_sub\" is required");
    }
    d.n_sub = doc["n_sub"].as<size_t>();
    read_vector(doc, "sub_info", d.sub_info);

    read_vector(doc, "load_to_subid", d.load_to_subid);
    read_vector(doc, "gen_to_subid", d.gen_to_subid);
    read_vector(doc, "line_or_to_subid", d.line_or_to_subid);
    read_vector(doc, "line_ex_to_subid", d.line_ex_to_subid);
    read_vector(doc, "storage_to_subid", d.storage_to_subid);

    read_vector(doc, "load_to_sub_pos", d.load_to_sub_pos);
    read_vector(doc, "gen_to_sub_pos", d.gen_to_sub_pos);
    read_vector(doc, "line_or_to_sub_pos", d.line_or_to_sub_pos);
    read_vector(doc, "line_ex_to_sub_pos", d.line_ex_to_sub_pos);
    read_vector(doc, "storage_to_sub_pos", d.storage_to_sub_pos);

    read_vector(doc, "name_load", d.name_load);
    read_vector(doc, "name_gen", d.name_gen);
    read_vector(doc, "name_line", d.name_line);
    read_vector(doc, "name_sub", d.name_sub);
    read_vector(doc, "name_storage", d.name_storage);

    if (doc["dispatch"] && !doc["dispatch"].IsNull())
    {
        d.dispatch = read_dispatch(doc["dispatch"]);
    }
    if (doc["storage"] && !doc["storage"].IsNull())
    {
        d.storage = read_storage(doc["storage"]);
    }
    if (doc["shunts"] && !doc["shunts"].IsNull())
    {
        ShuntData shunts;
        read_vector(doc["shunts"], "shunt_to_subid", shunts.shunt_to_subid);
        read_vector(doc["shunts"], "name_shunt", shunts.name_shunt);
        d.shunts = std::move(shunts);
    }
    return d;
}

// ============================================================================
// Writing
// ============================================================================

template <typename T>
void write_vector(YAML::Node& parent, const char* key, const std::vector<T>& values, bool keep_empty = false)
{
    if (values.empty() && !keep_empty)
    {
        return;
    }
    YAML::Node node(YAML::NodeType::Sequence);
    for (size_t i = 0; i < values.size(); ++i)
    {
        node.push_back(static_cast<T>(values[i]));
    }
    node.SetStyle(YAML::EmitterStyle::Flow);
    parent[key] = node;
}

YAML::Node write_description(const GridDescription& d)
{
    YAML::Node doc(YAML::NodeType::Map);
    if (!d.env_name.empty())
    {
        doc["env_name"] = d.env_name;
    }
    doc["n_sub"] = d.n_sub;
    write_vector(doc, "sub_info", d.sub_info);

    // Element lists define the counts and are always written
    write_vector(doc, "load_to_subid", d.load_to_subid, true);
    write_vector(doc, "gen_to_subid", d.gen_to_subid, true);
    write_vector(doc, "line_or_to_subid", d.line_or_to_subid, true);
    write_vector(doc, "line_ex_to_subid", d.line_ex_to_subid, true);
    write_vector(doc, "storage_to_subid", d.storage_to_subid, true);

    write_vector(doc, "load_to_sub_pos", d.load_to_sub_pos);
    write_vector(doc, "gen_to_sub_pos", d.gen_to_sub_pos);
    write_vector(doc, "line_or_to_sub_pos", d.line_or_to_sub_pos);
    write_vector(doc, "line_ex_to_sub_pos", d.line_ex_to_sub_pos);
    write_vector(doc, "storage_to_sub_pos", d.storage_to_sub_pos);

    write_vector(doc, "name_load", d.name_load);
    write_vector(doc, "name_gen", d.name_gen);
    write_vector(doc, "name_line", d.name_line);
    write_vector(doc, "name_sub", d.name_sub);
    write_vector(doc, "name_storage", d.name_storage);

    if (d.dispatch)
    {
        const DispatchData& g = *d.dispatch;
        YAML::Node node(YAML::NodeType::Map);
        write_vector(node, "gen_type", g.gen_type);
        write_vector(node, "gen_pmin", g.gen_pmin);
        write_vector(node, "gen_pmax", g.gen_pmax);
        write_vector(node, "gen_redispatchable", g.gen_redispatchable);
        write_vector(node, "gen_max_ramp_up", g.gen_max_ramp_up);
        write_vector(node, "gen_max_ramp_down", g.gen_max_ramp_down);
        write_vector(node, "gen_min_uptime", g.gen_min_uptime);
        write_vector(node, "gen_min_downtime", g.gen_min_downtime);
        write_vector(node, "gen_cost_per_MW", g.gen_cost_per_MW);
        write_vector(node, "gen_startup_cost", g.gen_startup_cost);
        write_vector(node, "gen_shutdown_cost", g.gen_shutdown_cost);
        doc["dispatch"] = node;
    }
    if (d.storage)
    {
        const StorageData& s = *d.storage;
        YAML::Node node(YAML::NodeType::Map);
        write_vector(node, "storage_type", s.storage_type);
        write_vector(node, "storage_Emax", s.storage_Emax);
        write_vector(node, "storage_Emin", s.storage_Emin);
        write_vector(node, "storage_max_p_prod", s.storage_max_p_prod);
        write_vector(node, "storage_max_p_absorb", s.storage_max_p_absorb);
        write_vector(node, "storage_marginal_cost", s.storage_marginal_cost);
        write_vector(node, "storage_loss", s.storage_loss);
        write_vector(node, "storage_charging_efficiency", s.storage_charging_efficiency);
        write_vector(node, "storage_discharging_efficiency", s.storage_discharging_efficiency);
        doc["storage"] = node;
    }
    if (d.shunts)
    {
        YAML::Node node(YAML::NodeType::Map);
        write_vector(node, "shunt_to_subid", d.shunts->shunt_to_subid, true);
        write_vector(node, "name_shunt", d.shunts->name_shunt);
        doc["shunts"] = node;
    }
    return doc;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

GridDescription load_grid_description(const std::string& yaml_text)
{
    try
    {
        return read_description(YAML::Load(yaml_text));
    }
    catch (const YAML::Exception& e)
    {
        throw SchemaError(SchemaErrorCode::InvalidDocument, std::string("Invalid grid description: ") + e.what());
    }
}

GridDescription load_grid_description_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw SchemaError(SchemaErrorCode::InvalidDocument, "Cannot open grid description \"" + path + "\"");
    }
    std::ostringstream content;
    content << in.rdbuf();
    return load_grid_description(content.str());
}

std::string save_grid_description(const GridDescription& description)
{
    YAML::Emitter out;
    out << write_description(description);
    return std::string(out.c_str()) + "\n";
}

void save_grid_description_file(const GridDescription& description, const std::string& path)
{
    std::ofstream out(path);
    if (!out)
    {
        throw SchemaError(SchemaErrorCode::InvalidDocument, "Cannot write grid description \"" + path + "\"");
    }
    out << save_grid_description(description);
}

} // namespace gridact
