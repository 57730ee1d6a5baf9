/**
 * @file action_report.hpp
 * @brief Structured and human-readable summaries of an action.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"

#include <yaml-cpp/yaml.h>

namespace gridact
{

class ActionState;

/**
 * @brief An element located on the grid, with the bus an action gives it.
 */
struct PlacedElement
{
    ElementKind kind;
    size_t id;
    SubIdx substation;
    int bus;
};

/**
 * @brief Per-category breakdown of what an action touches.
 *
 * @details
 * Each category carries a `changed` flag and the affected elements.
 * `has_impact` is set when any category changed.
 */
struct ObjectImpact
{
    struct Injection
    {
        bool changed{false};
        std::vector<InjectionKey> keys;
    };

    struct ForceLine
    {
        bool changed{false};
        std::vector<LineIdx> reconnections;
        std::vector<LineIdx> disconnections;
    };

    struct SwitchLine
    {
        bool changed{false};
        std::vector<LineIdx> powerlines;
    };

    struct Topology
    {
        bool changed{false};
        std::vector<PlacedElement> bus_switch;
        std::vector<PlacedElement> assigned_bus;
        std::vector<PlacedElement> disconnect_bus;
    };

    struct Redispatch
    {
        bool changed{false};
        std::vector<std::pair<GenIdx, double>> generators;
    };

    struct Storage
    {
        bool changed{false};
        std::vector<std::pair<StorageIdx, double>> setpoints;
    };

    bool has_impact{false};
    Injection injection;
    ForceLine force_line;
    SwitchLine switch_line;
    Topology topology;
    Redispatch redispatch;
    Storage storage;
};

/**
 * @brief Break an action down by category.
 */
ObjectImpact impact_on_objects(const ActionState& state);

/**
 * @brief Sparse summary of the non-default content of an action.
 *
 * @details
 * Only the categories the action modifies appear, e.g.
 * @code{.yaml}
 * set_line_status: {nb_connected: 0, nb_disconnected: 1, connected_id: [], disconnected_id: [1]}
 * set_bus_vect: {nb_modif_objects: 1, nb_modif_subs: 1, modif_subs_id: [4], "4": {load: {"2": {type: load, new_bus: 2}}}}
 * @endcode
 */
YAML::Node as_dict(const ActionState& state);

/**
 * @brief Human-readable description, starting with "This action will:".
 */
std::string to_string(const ActionState& state);

} // namespace gridact
