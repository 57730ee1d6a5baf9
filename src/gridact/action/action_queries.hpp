/**
 * @file action_queries.hpp
 * @brief Per-element and per-kind views of the pending modifications.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"

namespace gridact
{

class ActionState;

// ============================================================================
// effect_on
// ============================================================================

/**
 * @brief Element whose effects are queried. Exactly one member must be set.
 */
struct EffectSelector
{
    std::optional<LoadIdx> load_id;
    std::optional<GenIdx> gen_id;
    std::optional<LineIdx> line_id;
    std::optional<StorageIdx> storage_id;
    std::optional<SubIdx> substation_id;
};

/// NaN means "no injection override".
struct LoadEffect
{
    double new_p;
    double new_q;
    int set_bus;
    bool change_bus;
};

struct GeneratorEffect
{
    double new_p;
    double new_v;
    int set_bus;
    bool change_bus;
    double redispatch;
};

struct LineEffect
{
    int set_bus_or;
    bool change_bus_or;
    int set_bus_ex;
    bool change_bus_ex;
    int set_line_status;
    bool change_line_status;
    bool hazard;
    bool maintenance;
};

struct StorageEffect
{
    double power;
    int set_bus;
    bool change_bus;
};

/// Local slots of the substation, in topology order.
struct SubstationEffect
{
    std::vector<int> set_bus;
    std::vector<bool> change_bus;
};

using ElementEffect = std::variant<LoadEffect, GeneratorEffect, LineEffect, StorageEffect, SubstationEffect>;

/**
 * @brief Pending modifications touching one element.
 * @throws IllegalAction (InvalidQuery) unless exactly one selector is set.
 * @throws IllegalAction (OutOfRange) if the id does not exist.
 */
ElementEffect effect_on(const ActionState& state, const EffectSelector& selector);

// ============================================================================
// Per-kind views
// ============================================================================

/**
 * @brief Which broad families of modification an action carries.
 *
 * @details
 * - `injection`: a `load_p` or `prod_p` override;
 * - `voltage`: a `prod_v` override or any shunt setpoint;
 * - `topology`: at least one impacted substation;
 * - `line`: at least one impacted line;
 * - `redispatching`: a non-zero redispatch;
 * - `storage`: storage setpoints were modified.
 */
struct ActionTypes
{
    bool injection{false};
    bool voltage{false};
    bool topology{false};
    bool line{false};
    bool redispatching{false};
    bool storage{false};
};

ActionTypes get_types(const ActionState& state);

/// Per-load modifications; NaN means no injection override.
struct LoadModif
{
    std::vector<double> p;
    std::vector<double> q;
    std::vector<int> set_bus;
    std::vector<bool> change_bus;
};

/// Per-generator modifications; NaN means no injection override.
struct GeneratorModif
{
    std::vector<double> p;
    std::vector<double> v;
    std::vector<int> set_bus;
    std::vector<bool> change_bus;
};

struct StorageModif
{
    std::vector<double> power;
    std::vector<int> set_bus;
    std::vector<bool> change_bus;
};

struct LineModif
{
    std::vector<int> set_status;
    std::vector<bool> change_status;
    std::vector<int> set_bus_or;
    std::vector<int> set_bus_ex;
    std::vector<bool> change_bus_or;
    std::vector<bool> change_bus_ex;
};

LoadModif get_load_modif(const ActionState& state);
GeneratorModif get_gen_modif(const ActionState& state);
StorageModif get_storage_modif(const ActionState& state);
LineModif get_line_modif(const ActionState& state);

} // namespace gridact
