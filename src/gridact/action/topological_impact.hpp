/**
 * @file topological_impact.hpp
 * @brief Lines and substations syntactically affected by an action.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"

namespace gridact
{

class ActionState;
class GridSchema;

/**
 * @brief Result of the impact analysis of an action.
 *
 * @details
 * Impact is syntactic: it reports what the action asks for, not its net
 * effect. Disconnecting an already disconnected line still impacts it.
 */
struct TopologicalImpact
{
    /// One entry per line.
    std::vector<bool> lines_impacted;

    /// One entry per substation.
    std::vector<bool> subs_impacted;

    std::vector<LineIdx> impacted_lines() const
    {
        std::vector<LineIdx> result;
        for (LineIdx l = 0; l < lines_impacted.size(); ++l)
        {
            if (lines_impacted[l])
            {
                result.push_back(l);
            }
        }
        return result;
    }

    std::vector<SubIdx> impacted_substations() const
    {
        std::vector<SubIdx> result;
        for (SubIdx s = 0; s < subs_impacted.size(); ++s)
        {
            if (subs_impacted[s])
            {
                result.push_back(s);
            }
        }
        return result;
    }

    /**
     * @brief Substations owning an impacted position or an end of an
     *        impacted line, sorted.
     * @details `subs_impacted` leaves out the ends of lines whose only edit
     *          is their status; this view puts them back.
     */
    std::vector<SubIdx> involved_substations(const GridSchema& schema) const;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        return "Impact (lines=" + std::to_string(impacted_lines().size()) +
               ", substations=" + std::to_string(impacted_substations().size()) + ")";
    }
};

/**
 * @brief Compute the impact of an action.
 *
 * @details
 * - A line is impacted when its status is set or toggled.
 * - A topology position is impacted when its bus is set or toggled, except
 *   at both ends of an impacted line that is disconnected. When the line
 *   status is unknown every line counts as disconnected for this rule.
 * - With a known status, setting either end of a disconnected line to a
 *   positive bus (implicit reconnection), or of a connected line to `-1`
 *   (implicit disconnection), impacts the line instead of its substations.
 * - A substation is impacted when it owns an impacted topology position.
 *
 * @param known_line_status Current status per line (true = connected), or null.
 */
TopologicalImpact compute_topological_impact(const ActionState& state, const std::vector<bool>* known_line_status);

} // namespace gridact
