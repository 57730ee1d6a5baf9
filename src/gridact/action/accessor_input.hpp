/**
 * @file accessor_input.hpp
 * @brief Tagged input shapes accepted by the action accessors.
 */
#pragma once
#include "gridact/common/common.hpp"

namespace gridact
{

/**
 * @brief Reference to a grid object, either by integer id or by name.
 *
 * @details
 * Any integer type converts implicitly. Booleans and floating-point values
 * are rejected at compile time: they are almost always a programming error
 * when an element id is expected.
 *
 * Negative ids are representable so that they can be reported as
 * out-of-range by the accessor instead of wrapping around.
 */
class ElementRef
{
public:
    template <typename T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    ElementRef(T id)
        : m_value(static_cast<long long>(id))
    {
    }

    ElementRef(std::string name)
        : m_value(std::move(name))
    {
    }

    ElementRef(const char* name)
        : m_value(std::string(name))
    {
    }

    ElementRef(bool) = delete;
    ElementRef(float) = delete;
    ElementRef(double) = delete;
    ElementRef(long double) = delete;

    bool is_name() const noexcept
    {
        return std::holds_alternative<std::string>(m_value);
    }

    /// @pre `!is_name()`
    long long id() const
    {
        return std::get<long long>(m_value);
    }

    /// @pre `is_name()`
    const std::string& name() const
    {
        return std::get<std::string>(m_value);
    }

    /**
     * @brief Id or quoted name, for error messages.
     */
    std::string describe() const
    {
        return is_name() ? "\"" + name() + "\"" : std::to_string(id());
    }

    friend bool operator<(const ElementRef& a, const ElementRef& b)
    {
        return a.m_value < b.m_value;
    }

    friend bool operator==(const ElementRef& a, const ElementRef& b)
    {
        return a.m_value == b.m_value;
    }

private:
    std::variant<long long, std::string> m_value;
};

/// A list of element references.
using IdList = std::vector<ElementRef>;

/// A set of element references.
using IdSet = std::set<ElementRef>;

/**
 * @brief A value carried by a keyed input.
 *
 * @details
 * Converts implicitly from `T`. A `bool` is rejected at compile time unless
 * `T` is itself `bool`: a boolean where a bus code, a status or a power is
 * expected is a programming error.
 */
template <typename T>
class ValueSlot
{
public:
    ValueSlot(T value)
        : m_value(value)
    {
    }

    template <typename U, std::enable_if_t<std::is_same_v<U, bool> && !std::is_same_v<T, bool>, int> = 0>
    ValueSlot(U) = delete;

    T get() const noexcept
    {
        return m_value;
    }

private:
    T m_value;
};

/**
 * @brief A single `(id, value)` pair.
 */
template <typename T>
struct Assign
{
    ElementRef id;
    ValueSlot<T> value;
};

/// A list of `(id, value)` pairs, applied in order.
template <typename T>
using AssignList = std::vector<Assign<T>>;

/**
 * @brief A dense vector with one value per addressable element.
 */
template <typename T>
struct Dense
{
    std::vector<T> values;
};

/// A mapping from id or name to value.
template <typename T>
using KeyedValues = std::map<ElementRef, ValueSlot<T>>;

/**
 * @brief Input of a value accessor (bus codes, line status, powers).
 */
template <typename T>
using ValueInput = std::variant<Assign<T>, AssignList<T>, Dense<T>, KeyedValues<T>>;

/**
 * @brief Input of a toggle accessor (change bus, change line status).
 *
 * @details
 * - a single reference toggles one element;
 * - a list or a set of references toggles each listed element;
 * - a dense boolean mask toggles the elements where it is true.
 */
using ToggleInput = std::variant<ElementRef, IdList, IdSet, Dense<bool>>;

/**
 * @brief Values for the local slots of one substation.
 * @details `values` has one entry per element of the substation.
 */
template <typename T>
struct SubstationAssign
{
    ElementRef sub;
    std::vector<T> values;
};

/**
 * @brief Input of a substation-level accessor.
 *
 * @details
 * Either the whole topology vector, one substation, a list of substations,
 * or a mapping from substation id or name to its local vector.
 */
template <typename T>
using SubstationInput = std::variant<Dense<T>, SubstationAssign<T>, std::vector<SubstationAssign<T>>,
                                     std::map<ElementRef, std::vector<T>>>;

} // namespace gridact
