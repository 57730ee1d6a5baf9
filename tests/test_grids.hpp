/**
 * @file test_grids.hpp
 * @brief Grids shared by the test suites.
 */
#pragma once
#include "gridact/schema/grid_description.hpp"
#include "gridact/schema/grid_schema.hpp"

namespace gridact_tests
{

/**
 * @brief 14-substation reference grid: 20 lines, 11 loads, 6 generators.
 *
 * @details
 * Default local positions (load, generator, line origin, line extremity).
 * Line 1 joins substations 0 and 4. Substation 0 holds generator 5 at
 * topology position 0, line 0 origin at 1 and line 1 origin at 2.
 */
inline gridact::GridDescription case14_description()
{
    gridact::GridDescription d;
    d.env_name = "case14";
    d.n_sub = 14;
    d.load_to_subid = {1, 2, 3, 4, 5, 8, 9, 10, 11, 12, 13};
    d.gen_to_subid = {1, 2, 5, 7, 7, 0};
    d.line_or_to_subid = {0, 0, 1, 1, 1, 2, 3, 3, 3, 4, 5, 5, 5, 6, 6, 8, 8, 9, 11, 12};
    d.line_ex_to_subid = {1, 4, 2, 3, 4, 3, 4, 6, 8, 5, 10, 11, 12, 7, 8, 9, 13, 10, 12, 13};
    return d;
}

inline gridact::GridSchemaPtr case14()
{
    return gridact::GridSchema::create(case14_description());
}

/**
 * @brief Three-substation grid with dispatch data, two storage units and one shunt.
 *
 * @details
 * Topology layout (12 positions):
 * - sub 0: load 0 @0, gen 0 @1, line 0 origin @2, line 2 origin @3
 * - sub 1: gen 1 @4, line 1 origin @5, line 0 extremity @6, storage 0 @7
 * - sub 2: load 1 @8, line 1 extremity @9, line 2 extremity @10, storage 1 @11
 *
 * Generator 0 is redispatchable (ramps 10 MW, pmax 100); generator 1 is not.
 * Storage units produce up to 5 MW and absorb up to 10 MW.
 */
inline gridact::GridDescription small_description()
{
    gridact::GridDescription d;
    d.env_name = "small";
    d.n_sub = 3;
    d.load_to_subid = {0, 2};
    d.gen_to_subid = {0, 1};
    d.line_or_to_subid = {0, 1, 0};
    d.line_ex_to_subid = {1, 2, 2};
    d.storage_to_subid = {1, 2};

    gridact::DispatchData dispatch;
    dispatch.gen_type = {"thermal", "nuclear"};
    dispatch.gen_pmin = {0.0, 0.0};
    dispatch.gen_pmax = {100.0, 50.0};
    dispatch.gen_redispatchable = {true, false};
    dispatch.gen_max_ramp_up = {10.0, 5.0};
    dispatch.gen_max_ramp_down = {10.0, 5.0};
    dispatch.gen_min_uptime = {0, 0};
    dispatch.gen_min_downtime = {0, 0};
    dispatch.gen_cost_per_MW = {20.0, 10.0};
    dispatch.gen_startup_cost = {0.0, 0.0};
    dispatch.gen_shutdown_cost = {0.0, 0.0};
    d.dispatch = dispatch;

    gridact::StorageData storage;
    storage.storage_type = {"battery", "battery"};
    storage.storage_Emax = {20.0, 20.0};
    storage.storage_Emin = {0.0, 0.0};
    storage.storage_max_p_prod = {5.0, 5.0};
    storage.storage_max_p_absorb = {10.0, 10.0};
    storage.storage_marginal_cost = {0.0, 0.0};
    storage.storage_loss = {0.1, 0.1};
    storage.storage_charging_efficiency = {0.95, 0.95};
    storage.storage_discharging_efficiency = {0.95, 0.95};
    d.storage = storage;

    gridact::ShuntData shunts;
    shunts.shunt_to_subid = {2};
    d.shunts = shunts;
    return d;
}

inline gridact::GridSchemaPtr small_grid()
{
    return gridact::GridSchema::create(small_description());
}

} // namespace gridact_tests
