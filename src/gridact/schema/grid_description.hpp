/**
 * @file grid_description.hpp
 * @brief Construction parameters of a GridSchema.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"

namespace gridact
{

/**
 * @brief Static generator data needed for redispatching checks.
 *
 * @details
 * Every vector has one entry per generator. A grid without this data does
 * not support redispatching.
 */
struct DispatchData
{
    std::vector<std::string> gen_type;
    std::vector<double> gen_pmin;
    std::vector<double> gen_pmax;
    std::vector<bool> gen_redispatchable;
    std::vector<double> gen_max_ramp_up;
    std::vector<double> gen_max_ramp_down;
    std::vector<int> gen_min_uptime;
    std::vector<int> gen_min_downtime;
    std::vector<double> gen_cost_per_MW;
    std::vector<double> gen_startup_cost;
    std::vector<double> gen_shutdown_cost;
};

/**
 * @brief Static storage unit data, one entry per storage unit.
 *
 * @details
 * Powers follow the load convention: `max_p_absorb` bounds charging
 * (positive setpoints), `max_p_prod` bounds discharging (negative setpoints).
 */
struct StorageData
{
    std::vector<std::string> storage_type;
    std::vector<double> storage_Emax;
    std::vector<double> storage_Emin;
    std::vector<double> storage_max_p_prod;
    std::vector<double> storage_max_p_absorb;
    std::vector<double> storage_marginal_cost;
    std::vector<double> storage_loss;
    std::vector<double> storage_charging_efficiency;
    std::vector<double> storage_discharging_efficiency;
};

/**
 * @brief Shunt declaration.
 *
 * @details
 * Shunts do not occupy topology slots. Declaring them (even with zero
 * entries) enables the shunt attributes of Complete actions.
 */
struct ShuntData
{
    std::vector<SubIdx> shunt_to_subid;

    /// Optional; defaults to `shunt_{sub}_{id}`.
    std::vector<std::string> name_shunt;
};

/**
 * @brief Everything needed to build a GridSchema.
 *
 * @details
 * Element counts are the lengths of the `*_to_subid` vectors. Optional
 * vectors are left empty to request the default:
 * - `sub_info` is derived from substation membership.
 * - `*_to_sub_pos` are assigned sequentially per substation in the order
 *   load, generator, line origin, line extremity, storage. Supplying any of
 *   them requires supplying all of them.
 * - names default to `load_{sub}_{id}`, `gen_{sub}_{id}`,
 *   `{sub_or}_{sub_ex}_{id}`, `sub_{id}`, `storage_{sub}_{id}`.
 */
struct GridDescription
{
    /// Name of the grid, informational only.
    std::string env_name;

    /// Number of substations.
    size_t n_sub{0};

    /// Number of elements per substation; derived when empty.
    std::vector<size_t> sub_info;

    std::vector<SubIdx> load_to_subid;
    std::vector<SubIdx> gen_to_subid;
    std::vector<SubIdx> line_or_to_subid;
    std::vector<SubIdx> line_ex_to_subid;
    std::vector<SubIdx> storage_to_subid;

    std::vector<size_t> load_to_sub_pos;
    std::vector<size_t> gen_to_sub_pos;
    std::vector<size_t> line_or_to_sub_pos;
    std::vector<size_t> line_ex_to_sub_pos;
    std::vector<size_t> storage_to_sub_pos;

    std::vector<std::string> name_load;
    std::vector<std::string> name_gen;
    std::vector<std::string> name_line;
    std::vector<std::string> name_sub;
    std::vector<std::string> name_storage;

    std::optional<DispatchData> dispatch;
    std::optional<StorageData> storage;
    std::optional<ShuntData> shunts;
};

} // namespace gridact
