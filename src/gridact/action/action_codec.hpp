/**
 * @file action_codec.hpp
 * @brief Flat floating-point encoding of an action.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/action/action_state.hpp"

namespace gridact
{

/**
 * @brief Encodes actions as flat vectors and back.
 *
 * @details
 * The vector is the concatenation, in `ActionCapabilities::layout()` order,
 * of every attribute the action's profile carries, each cast to `double`:
 * booleans become `0`/`1`, bus and status codes their integer value. An
 * absent injection override is encoded as NaN entries, so that any
 * override with at least one finite entry survives a round trip.
 *
 * @par Thread safety
 * - Stateless.
 */
class ActionCodec
{
public:
    /**
     * @brief Encode an action.
     * @throws AmbiguousAction (IncorrectNumberOf...) if an injection or shunt
     *         vector does not match the grid.
     */
    static std::vector<double> to_vect(const ActionState& state);

    /**
     * @brief Replace the content of an action with a decoded vector.
     *
     * @details
     * Modified flags are re-derived from non-default content. When
     * `check_legit` is set the decoded action must also pass the ambiguity
     * checker. On any failure `state` is unchanged.
     *
     * @throws AmbiguousAction (IncorrectNumberOfElements) on a size mismatch,
     *         or the checker's violation.
     * @throws IllegalAction (ValueOutOfDomain) if an integer or boolean slot
     *         holds a non-integral value.
     */
    static void from_vect(ActionState& state, const std::vector<double>& vect, bool check_legit = true);

    /**
     * @brief Modified flags implied by the content of an action.
     */
    static ModifiedFlags derive_flags(const ActionState& state);
};

} // namespace gridact
