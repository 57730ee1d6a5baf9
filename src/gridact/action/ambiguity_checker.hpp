/**
 * @file ambiguity_checker.hpp
 * @brief Semantic validation of an action against its grid.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/gridact_exceptions.hpp"
#include "gridact/action/action_state.hpp"

namespace gridact
{

/**
 * @brief Finds the first semantic violation of an action.
 *
 * @details
 * Checks run in a fixed order, so the reported violation is deterministic:
 *  1. line status set and toggled on the same line (InvalidLineStatus);
 *  2. injection override lengths (IncorrectNumberOfLoads / Generators);
 *  3. bus, status and redispatch vector lengths;
 *  4. redispatch: availability, dispatchable targets, ramps, and
 *     `prod_p + redispatch` within `[pmin, pmax]` (InvalidRedispatching);
 *  5. storage: no storage bus edit without storage control, then units exist,
 *     length, `[-max_p_prod, max_p_absorb]` (InvalidStorage);
 *  6. bus codes below `-1`, then above `2` (InvalidBusStatus);
 *  7. bus set and toggled on the same position (InvalidBusStatus);
 *  8. one end of a line disconnected while the other is connected, origin
 *     case first (InvalidLineStatus);
 *  9. a disconnected line with a bus toggle or a positive bus, or a
 *     reconnected line with a bus toggle (InvalidLineStatus);
 * 10. shunts (InvalidShunt / IncorrectNumberOfShunts).
 *
 * The checker never repairs the action.
 *
 * @par Thread safety
 * - Stateless apart from the reference to the checked action.
 */
class AmbiguityChecker
{
public:
    explicit AmbiguityChecker(const ActionState& state)
        : m_state(state)
    {
    }

    /**
     * @brief Raise the first violation.
     * @throws AmbiguousAction describing the first violation.
     */
    void check() const;

    /**
     * @brief First violation, if any.
     */
    std::optional<AmbiguousAction> first_violation() const;

    /**
     * @brief Check whether the action has any violation.
     */
    bool is_ambiguous() const
    {
        return first_violation().has_value();
    }

private:
    void check_line_status_conflict() const;
    void check_injection_lengths() const;
    void check_vector_lengths() const;
    void check_redispatch() const;
    void check_storage() const;
    void check_bus_range() const;
    void check_set_change_conflict() const;
    void check_line_ends() const;
    void check_status_vs_bus() const;
    void check_shunts() const;

    const ActionState& m_state;
};

} // namespace gridact
