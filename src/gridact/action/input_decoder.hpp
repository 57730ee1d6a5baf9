/**
 * @file input_decoder.hpp
 * @brief Normalization of accessor inputs into action vectors.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"
#include "gridact/common/gridact_exceptions.hpp"
#include "gridact/action/accessor_input.hpp"
#include "gridact/action/input_decoder.fwd.hpp"

namespace gridact
{

/**
 * @brief Addressable elements of one accessor.
 *
 * @details
 * An accessor addresses `count` elements by id (and by name when `names` is
 * set). Element `i` lives at slot `positions[i]` of the target vector, or at
 * slot `i` when `positions` is null.
 */
struct ElementDomain
{
    /// Label used in error messages ("load", "powerline", ...).
    std::string label;

    size_t count{0};

    /// Name index; null when this accessor does not accept names.
    const NameIndex* names{nullptr};

    /// Slot of each element in the target vector; null for identity.
    const std::vector<TopoIdx>* positions{nullptr};

    size_t slot(size_t id) const noexcept
    {
        return positions ? (*positions)[id] : id;
    }
};

/**
 * @brief Accepted values of a value accessor.
 *
 * @details
 * Integral domains are bounded by `[min, max]`; a value outside raises
 * `IllegalAction(ValueOutOfDomain)`. Floating domains have no bound and skip
 * non-finite values (they mean "no modification").
 */
template <typename T>
struct ValueDomain
{
    T min;
    T max;
};

/// Bus codes `{-1, 0, 1, 2}`.
inline constexpr ValueDomain<int> kBusDomain{kMinBusCode, kMaxBusCode};

/// Line status codes `{-1, 0, 1}`.
inline constexpr ValueDomain<int> kLineStatusDomain{-1, 1};

/// Unbounded powers.
inline constexpr ValueDomain<double> kPowerDomain{-std::numeric_limits<double>::infinity(),
                                                  std::numeric_limits<double>::infinity()};

/**
 * @brief Resolve a reference to an element id of a domain.
 * @throws IllegalAction (OutOfRange, UnknownElementName, WrongInputShape).
 */
size_t resolve_element(const ElementDomain& domain, const ElementRef& ref);

/**
 * @brief Apply a value input onto a target vector.
 * @details May leave `target` partially written on failure; callers work on
 *          a copy (see `commit_on_success`).
 * @throws IllegalAction on any malformed input.
 */
template <typename T>
void apply_values(const ValueInput<T>& input, const ElementDomain& domain, const ValueDomain<T>& values,
                  std::vector<T>& target);

/**
 * @brief Toggle the elements designated by a toggle input.
 * @throws IllegalAction on any malformed input.
 */
void apply_toggles(const ToggleInput& input, const ElementDomain& domain, std::vector<bool>& target);

/**
 * @brief Ids designated by a toggle-shaped input, in input order.
 * @details A dense mask selects the ids where it is true.
 * @throws IllegalAction on any malformed input.
 */
std::vector<size_t> resolve_selection(const ToggleInput& input, const ElementDomain& domain);

/**
 * @brief Assign bus codes from a substation-level input.
 *
 * @param substations Domain addressing substations (count, names).
 * @param sub_info Number of elements per substation.
 * @param sub_start First topology slot of each substation.
 * @param values Accepted bus codes.
 * @param target Topology-sized vector.
 * @throws IllegalAction on any malformed input.
 */
void apply_substation_values(const SubstationInput<int>& input, const ElementDomain& substations,
                             const std::vector<size_t>& sub_info, const std::vector<TopoIdx>& sub_start,
                             const ValueDomain<int>& values, std::vector<int>& target);

/**
 * @brief Toggle the topology slots where a substation-level mask is true.
 * @throws IllegalAction on any malformed input.
 */
void apply_substation_toggles(const SubstationInput<bool>& input, const ElementDomain& substations,
                              const std::vector<size_t>& sub_info, const std::vector<TopoIdx>& sub_start,
                              std::vector<bool>& target);

/**
 * @brief Run a mutation on a working copy and commit it only on success.
 *
 * @details
 * If `mutate` throws, `live` is untouched and the exception propagates.
 */
template <typename T, typename Mutation>
void commit_on_success(std::vector<T>& live, Mutation&& mutate)
{
    std::vector<T> working = live;
    mutate(working);
    live.swap(working);
}

} // namespace gridact

#include "gridact/action/input_decoder.inline.hpp"
