/**
 * @file action_document.cpp
 */
#include "gridact/action/action_document.hpp"
#include "gridact/action/action_state.hpp"

namespace gridact
{

namespace
{

[[noreturn]] void throw_malformed(const std::string& path, const std::string& expected)
{
    throw AmbiguousAction(AmbiguityCode::MalformedUpdate,
                          "Invalid value for \"" + path + "\": expected " + expected);
}

bool is_bool_scalar(const YAML::Node& node)
{
    bool value = false;
    return node.IsScalar() && YAML::convert<bool>::decode(node, value);
}

// ============================================================================
// Scalars
// ============================================================================

ElementRef read_ref(const YAML::Node& node, const std::string& path)
{
    if (!node.IsScalar())
    {
        throw_malformed(path, "an element id or name");
    }
    long long id = 0;
    if (YAML::convert<long long>::decode(node, id))
    {
        return ElementRef(id);
    }
    double number = 0.0;
    if (is_bool_scalar(node) || YAML::convert<double>::decode(node, number))
    {
        throw IllegalAction(IllegalActionCode::WrongInputShape,
                            "Invalid element reference \"" + node.Scalar() + "\" in \"" + path +
                                "\": ids must be integers or names");
    }
    return ElementRef(node.Scalar());
}

template <typename T>
T read_scalar(const YAML::Node& node, const std::string& path);

template <>
int read_scalar<int>(const YAML::Node& node, const std::string& path)
{
    int value = 0;
    if (!node.IsScalar() || !YAML::convert<int>::decode(node, value))
    {
        throw_malformed(path, "an integer");
    }
    return value;
}

template <>
double read_scalar<double>(const YAML::Node& node, const std::string& path)
{
    if (node.IsNull())
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
    double value = 0.0;
    if (!node.IsScalar() || !YAML::convert<double>::decode(node, value))
    {
        throw_malformed(path, "a number");
    }
    return value;
}

template <>
bool read_scalar<bool>(const YAML::Node& node, const std::string& path)
{
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value))
    {
        throw_malformed(path, "a boolean");
    }
    return value;
}

template <typename T>
std::vector<T> read_vector(const YAML::Node& node, const std::string& path)
{
    if (!node.IsSequence())
    {
        throw_malformed(path, "a sequence");
    }
    std::vector<T> values;
    values.reserve(node.size());
    for (size_t i = 0; i < node.size(); ++i)
    {
        values.push_back(read_scalar<T>(node[i], path + "[" + std::to_string(i) + "]"));
    }
    return values;
}

// ============================================================================
// Accessor inputs
// ============================================================================

bool is_pair_sequence(const YAML::Node& node)
{
    return node.IsSequence() && node.size() > 0 && node[0].IsSequence();
}

template <typename T>
ValueInput<T> read_value_input(const YAML::Node& node, const std::string& path)
{
    if (node.IsMap())
    {
        KeyedValues<T> keyed;
        for (const auto& entry : node)
        {
            keyed.emplace(read_ref(entry.first, path), read_scalar<T>(entry.second, path));
        }
        return keyed;
    }
    if (is_pair_sequence(node))
    {
        AssignList<T> pairs;
        for (const auto& item : node)
        {
            if (!item.IsSequence() || item.size() != 2)
            {
                throw_malformed(path, "a sequence of [id, value] pairs");
            }
            pairs.push_back(Assign<T>{read_ref(item[0], path), read_scalar<T>(item[1], path)});
        }
        return pairs;
    }
    return Dense<T>{read_vector<T>(node, path)};
}

ToggleInput read_toggle_input(const YAML::Node& node, const std::string& path)
{
    if (node.IsScalar())
    {
        return read_ref(node, path);
    }
    if (!node.IsSequence())
    {
        throw_malformed(path, "an id, a sequence of ids or a boolean mask");
    }
    if (node.size() > 0 && is_bool_scalar(node[0]))
    {
        return Dense<bool>{read_vector<bool>(node, path)};
    }
    IdList ids;
    for (const auto& item : node)
    {
        ids.push_back(read_ref(item, path));
    }
    return ids;
}

template <typename T>
SubstationInput<T> read_substation_input(const YAML::Node& node, const std::string& path)
{
    if (node.IsMap())
    {
        std::map<ElementRef, std::vector<T>> keyed;
        for (const auto& entry : node)
        {
            keyed.emplace(read_ref(entry.first, path), read_vector<T>(entry.second, path));
        }
        return keyed;
    }
    if (is_pair_sequence(node))
    {
        std::vector<SubstationAssign<T>> subs;
        for (const auto& item : node)
        {
            if (!item.IsSequence() || item.size() != 2)
            {
                throw_malformed(path, "a sequence of [substation, values] pairs");
            }
            subs.push_back(SubstationAssign<T>{read_ref(item[0], path), read_vector<T>(item[1], path)});
        }
        return subs;
    }
    return Dense<T>{read_vector<T>(node, path)};
}

// ============================================================================
// Top-level keys
// ============================================================================

const std::vector<std::string>& element_target_keys()
{
    static const std::vector<std::string> keys = {"loads_id",    "generators_id", "lines_or_id",
                                                  "lines_ex_id", "storages_id",   "substations_id"};
    return keys;
}

void collect_unknown(const YAML::Node& map, const std::string& parent, const std::vector<std::string>& known,
                     std::vector<std::string>& unknown)
{
    for (const auto& entry : map)
    {
        const std::string key = entry.first.as<std::string>();
        if (std::find(known.begin(), known.end(), key) == known.end())
        {
            unknown.push_back(parent.empty() ? key : parent + "." + key);
        }
    }
}

SetBusUpdate read_set_bus(const YAML::Node& node, std::vector<std::string>& unknown)
{
    if (!node.IsMap())
    {
        return read_value_input<int>(node, "set_bus");
    }
    collect_unknown(node, "set_bus", element_target_keys(), unknown);
    SetBusTargets targets;
    auto read = [&](const char* key, std::optional<ValueInput<int>>& target) {
        if (node[key])
        {
            target = read_value_input<int>(node[key], std::string("set_bus.") + key);
        }
    };
    read("loads_id", targets.loads_id);
    read("generators_id", targets.generators_id);
    read("lines_or_id", targets.lines_or_id);
    read("lines_ex_id", targets.lines_ex_id);
    read("storages_id", targets.storages_id);
    if (node["substations_id"])
    {
        targets.substations_id = read_substation_input<int>(node["substations_id"], "set_bus.substations_id");
    }
    return targets;
}

ChangeBusUpdate read_change_bus(const YAML::Node& node, std::vector<std::string>& unknown)
{
    if (!node.IsMap())
    {
        return read_toggle_input(node, "change_bus");
    }
    collect_unknown(node, "change_bus", element_target_keys(), unknown);
    ChangeBusTargets targets;
    auto read = [&](const char* key, std::optional<ToggleInput>& target) {
        if (node[key])
        {
            target = read_toggle_input(node[key], std::string("change_bus.") + key);
        }
    };
    read("loads_id", targets.loads_id);
    read("generators_id", targets.generators_id);
    read("lines_or_id", targets.lines_or_id);
    read("lines_ex_id", targets.lines_ex_id);
    read("storages_id", targets.storages_id);
    if (node["substations_id"])
    {
        targets.substations_id = read_substation_input<bool>(node["substations_id"], "change_bus.substations_id");
    }
    return targets;
}

std::map<InjectionKey, std::vector<double>> read_injection(const YAML::Node& node, std::vector<std::string>& unknown)
{
    if (!node.IsMap())
    {
        throw_malformed("injection", "a mapping of load_p, load_q, prod_p or prod_v");
    }
    std::map<InjectionKey, std::vector<double>> result;
    for (const auto& entry : node)
    {
        const std::string key = entry.first.as<std::string>();
        const auto parsed = parse_injection_key(key);
        if (!parsed)
        {
            unknown.push_back("injection." + key);
            continue;
        }
        result[*parsed] = read_vector<double>(entry.second, "injection." + key);
    }
    return result;
}

ShuntUpdate read_shunt(const YAML::Node& node, std::vector<std::string>& unknown)
{
    if (!node.IsMap())
    {
        throw_malformed("shunt", "a mapping of shunt_p, shunt_q or shunt_bus");
    }
    collect_unknown(node, "shunt", {"shunt_p", "shunt_q", "shunt_bus", "set_bus"}, unknown);
    ShuntUpdate shunt;
    if (node["shunt_p"])
    {
        shunt.shunt_p = read_value_input<double>(node["shunt_p"], "shunt.shunt_p");
    }
    if (node["shunt_q"])
    {
        shunt.shunt_q = read_value_input<double>(node["shunt_q"], "shunt.shunt_q");
    }
    // "set_bus" is accepted as an alias of "shunt_bus"
    if (node["shunt_bus"])
    {
        shunt.shunt_bus = read_value_input<int>(node["shunt_bus"], "shunt.shunt_bus");
    }
    else if (node["set_bus"])
    {
        shunt.shunt_bus = read_value_input<int>(node["set_bus"], "shunt.set_bus");
    }
    return shunt;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

ActionUpdate parse_action_update(const YAML::Node& document)
{
    ActionUpdate update;
    if (!document || document.IsNull())
    {
        return update;
    }
    if (!document.IsMap())
    {
        throw_malformed("<document>", "a mapping of update keys");
    }

    for (const auto& entry : document)
    {
        const std::string key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;
        if (value.IsNull())
        {
            // An explicit null leaves the attribute untouched
            continue;
        }
        if (key == "injection")
        {
            update.injection = read_injection(value, update.unknown_keys);
        }
        else if (key == "set_bus")
        {
            update.set_bus = read_set_bus(value, update.unknown_keys);
        }
        else if (key == "change_bus")
        {
            update.change_bus = read_change_bus(value, update.unknown_keys);
        }
        else if (key == "set_line_status")
        {
            update.set_line_status = read_value_input<int>(value, key);
        }
        else if (key == "change_line_status")
        {
            update.change_line_status = read_toggle_input(value, key);
        }
        else if (key == "redispatch")
        {
            update.redispatch = read_value_input<double>(value, key);
        }
        else if (key == "set_storage")
        {
            update.set_storage = read_value_input<double>(value, key);
        }
        else if (key == "hazards")
        {
            update.hazards = read_toggle_input(value, key);
        }
        else if (key == "maintenance")
        {
            update.maintenance = read_toggle_input(value, key);
        }
        else if (key == "shunt")
        {
            update.shunt = read_shunt(value, update.unknown_keys);
        }
        else
        {
            update.unknown_keys.push_back(key);
        }
    }
    return update;
}

ActionUpdate parse_action_update(const std::string& yaml_text)
{
    YAML::Node document;
    try
    {
        document = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& e)
    {
        throw AmbiguousAction(AmbiguityCode::MalformedUpdate, std::string("Invalid update document: ") + e.what());
    }
    return parse_action_update(document);
}

ActionDiagnostics update_from_yaml(ActionState& state, const std::string& yaml_text)
{
    return state.update(parse_action_update(yaml_text));
}

} // namespace gridact
