/**
 * @file action_update.hpp
 * @brief Structured update documents applied by `ActionState::update()`.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"
#include "gridact/action/accessor_input.hpp"

namespace gridact
{

/**
 * @brief Bus assignments keyed by element kind.
 * @details At least one member must be set.
 */
struct SetBusTargets
{
    std::optional<ValueInput<int>> loads_id;
    std::optional<ValueInput<int>> generators_id;
    std::optional<ValueInput<int>> lines_or_id;
    std::optional<ValueInput<int>> lines_ex_id;
    std::optional<ValueInput<int>> storages_id;
    std::optional<SubstationInput<int>> substations_id;
};

/**
 * @brief Bus toggles keyed by element kind.
 * @details At least one member must be set.
 */
struct ChangeBusTargets
{
    std::optional<ToggleInput> loads_id;
    std::optional<ToggleInput> generators_id;
    std::optional<ToggleInput> lines_or_id;
    std::optional<ToggleInput> lines_ex_id;
    std::optional<ToggleInput> storages_id;
    std::optional<SubstationInput<bool>> substations_id;
};

/// Topology-indexed input, or inputs keyed by element kind.
using SetBusUpdate = std::variant<ValueInput<int>, SetBusTargets>;

/// Topology-indexed toggles, or toggles keyed by element kind.
using ChangeBusUpdate = std::variant<ToggleInput, ChangeBusTargets>;

/**
 * @brief Shunt setpoints.
 */
struct ShuntUpdate
{
    std::optional<ValueInput<double>> shunt_p;
    std::optional<ValueInput<double>> shunt_q;
    std::optional<ValueInput<int>> shunt_bus;
};

/**
 * @brief A dictionary-style update, one optional member per top-level key.
 *
 * @details
 * An absent member leaves the corresponding attribute untouched.
 * `unknown_keys` lists the keys a document reader could not map; they are
 * reported as warnings by `ActionState::update()` and otherwise ignored.
 */
struct ActionUpdate
{
    std::optional<std::map<InjectionKey, std::vector<double>>> injection;
    std::optional<SetBusUpdate> set_bus;
    std::optional<ChangeBusUpdate> change_bus;
    std::optional<ValueInput<int>> set_line_status;
    std::optional<ToggleInput> change_line_status;
    std::optional<ValueInput<double>> redispatch;
    std::optional<ValueInput<double>> set_storage;
    std::optional<ToggleInput> hazards;
    std::optional<ToggleInput> maintenance;
    std::optional<ShuntUpdate> shunt;

    std::vector<std::string> unknown_keys;
};

} // namespace gridact
