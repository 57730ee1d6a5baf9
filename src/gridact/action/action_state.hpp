/**
 * @file action_state.hpp
 * @brief Mutable, topology-indexed action and its accessor layer.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/action_diagnostics.hpp"
#include "gridact/common/grid_enums.hpp"
#include "gridact/common/gridact_exceptions.hpp"
#include "gridact/action/accessor_input.hpp"
#include "gridact/action/input_decoder.fwd.hpp"
#include "gridact/action/topological_impact.hpp"
#include "gridact/schema/grid_schema.hpp"

namespace gridact
{

struct ActionUpdate;

/**
 * @brief Per-category "modified" flags.
 *
 * @details
 * A flag is raised by every successful mutation of its category, even when
 * the resulting values are the defaults (e.g. toggling the same element
 * twice). The flat decoder re-derives them from non-default content.
 */
struct ModifiedFlags
{
    bool injection{false};
    bool set_bus{false};
    bool change_bus{false};
    bool set_status{false};
    bool change_status{false};
    bool redispatch{false};
    bool storage{false};
    bool hazards{false};
    bool maintenance{false};
    bool shunt{false};
};

/**
 * @brief Sparse injection overrides.
 * @details A missing key means no override; a NaN entry means no override
 *          for that element.
 */
using InjectionOverrides = std::map<InjectionKey, std::vector<double>>;

/**
 * @brief A pending set of modifications to a grid, indexed by its schema.
 *
 * @details
 * An `ActionState` starts as "do nothing" and accumulates modifications
 * through its accessors:
 * - bus assignments (`set_bus`, values in `{-1,0,1,2}`) and bus toggles
 *   (`change_bus`), both indexed by topology position;
 * - line status assignments (`{-1,0,1}`) and toggles, indexed by line;
 * - injection overrides, redispatch and storage setpoints;
 * - hazards and maintenance (forced disconnections);
 * - shunt setpoints, when the grid declares shunts.
 *
 * Which of these an action may carry is fixed by its `ActionProfile`.
 *
 * @par Accessor contract
 * Every accessor validates its whole input on a working copy of the target
 * vector and swaps it in only on success. On failure it throws
 * `IllegalAction` and the action is observably unchanged. On success it
 * raises the category's modified flag and invalidates the cached impact.
 *
 * @par Composition
 * `combine()` (and `+=`, `+`) merges another action performed "after" this
 * one in the same step. It is not commutative; see `combine()`.
 *
 * @par Thread safety
 * - No internal synchronization; owned by one component at a time.
 * - The schema it references is immutable and may be shared.
 */
class ActionState
{
public:
    /**
     * @brief Create a "do nothing" action.
     * @throws IllegalAction (InvalidQuery) if `schema` is null.
     */
    explicit ActionState(GridSchemaPtr schema, ActionProfile profile = ActionProfile::Complete);

    // ------------------------------------------------------------------------
    // Schema and capabilities
    // ------------------------------------------------------------------------

    const GridSchema& schema() const noexcept
    {
        return *m_schema;
    }

    const GridSchemaPtr& schema_ptr() const noexcept
    {
        return m_schema;
    }

    const ActionCapabilities& capabilities() const noexcept
    {
        return *m_capabilities;
    }

    ActionProfile profile() const noexcept
    {
        return m_capabilities->profile();
    }

    // ------------------------------------------------------------------------
    // Raw views
    // ------------------------------------------------------------------------

    /// Bus assignment per topology position.
    const std::vector<int>& set_bus() const noexcept
    {
        return m_set_bus;
    }

    /// Bus toggle per topology position.
    const std::vector<bool>& change_bus() const noexcept
    {
        return m_change_bus;
    }

    const std::vector<int>& line_set_status() const noexcept
    {
        return m_set_line_status;
    }

    const std::vector<bool>& line_change_status() const noexcept
    {
        return m_change_line_status;
    }

    const InjectionOverrides& injection() const noexcept
    {
        return m_injection;
    }

    const std::vector<double>& redispatch() const noexcept
    {
        return m_redispatch;
    }

    /// Storage setpoints, load convention (positive charges).
    const std::vector<double>& storage_power() const noexcept
    {
        return m_storage_power;
    }

    const std::vector<bool>& hazards() const noexcept
    {
        return m_hazards;
    }

    const std::vector<bool>& maintenance() const noexcept
    {
        return m_maintenance;
    }

    /// Empty unless the grid declares shunts. NaN means no modification.
    const std::vector<double>& shunt_p() const noexcept
    {
        return m_shunt_p;
    }

    const std::vector<double>& shunt_q() const noexcept
    {
        return m_shunt_q;
    }

    /// Empty unless the grid declares shunts. 0 means no modification.
    const std::vector<int>& shunt_bus() const noexcept
    {
        return m_shunt_bus;
    }

    const ModifiedFlags& modified() const noexcept
    {
        return m_modified;
    }

    // ------------------------------------------------------------------------
    // Per-element views
    // ------------------------------------------------------------------------

    /**
     * @brief Bus assignments of every element of a kind, in element order.
     */
    std::vector<int> element_set_bus(ElementKind kind) const;

    /**
     * @brief Bus toggles of every element of a kind, in element order.
     */
    std::vector<bool> element_change_bus(ElementKind kind) const;

    /**
     * @brief Bus assignments of the local slots of one substation.
     * @throws SchemaError (OutOfRange) if `sub` is not a substation.
     */
    std::vector<int> sub_set_bus(SubIdx sub) const;

    /// @throws SchemaError (OutOfRange) if `sub` is not a substation.
    std::vector<bool> sub_change_bus(SubIdx sub) const;

    // ------------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------------

    /**
     * @brief Assign buses to elements of one kind.
     * @details Ids and names address elements of `kind`; values in `[-1, 2]`.
     * @throws IllegalAction on malformed input or unsupported attribute.
     */
    void set_element_bus(ElementKind kind, const ValueInput<int>& input);

    /**
     * @brief Toggle the bus of elements of one kind.
     * @throws IllegalAction on malformed input or unsupported attribute.
     */
    void change_element_bus(ElementKind kind, const ToggleInput& input);

    /**
     * @brief Assign buses by topology position.
     * @details Names are not accepted; a dense input covers `dim_topo` slots.
     */
    void set_topology_bus(const ValueInput<int>& input);

    /// Toggle buses by topology position.
    void change_topology_bus(const ToggleInput& input);

    /**
     * @brief Assign buses substation by substation.
     * @details A dense input is the whole topology vector; otherwise each
     *          substation receives one value per local slot.
     */
    void set_substation_bus(const SubstationInput<int>& input);

    /// Toggle buses substation by substation, where the local mask is true.
    void change_substation_bus(const SubstationInput<bool>& input);

    /**
     * @brief Assign line status (`-1` disconnect, `0` no-op, `1` reconnect).
     */
    void set_line_status(const ValueInput<int>& input);

    /// Toggle line status.
    void change_line_status(const ToggleInput& input);

    /**
     * @brief Assign redispatch requests (MW). Non-finite values are ignored.
     */
    void set_redispatch(const ValueInput<double>& input);

    /**
     * @brief Assign storage setpoints (MW). Non-finite values are ignored.
     */
    void set_storage_power(const ValueInput<double>& input);

    /**
     * @brief Override one injection quantity.
     * @details The vector is stored as given; its length is validated by
     *          the ambiguity checker.
     */
    void set_injection(InjectionKey key, std::vector<double> values);

    /**
     * @brief Mark lines as hit by a hazard.
     * @details Forces `set_line_status = -1` on those lines and clears every
     *          other pending edit of their status and of both their ends.
     */
    void set_hazards(const ToggleInput& lines);

    /// Mark lines as in maintenance; same forcing as `set_hazards()`.
    void set_maintenance(const ToggleInput& lines);

    /// Assign shunt active power setpoints. Non-finite values are ignored.
    void set_shunt_p(const ValueInput<double>& input);

    /// Assign shunt reactive power setpoints. Non-finite values are ignored.
    void set_shunt_q(const ValueInput<double>& input);

    /// Assign shunt buses; the bus range is validated by the ambiguity checker.
    void set_shunt_bus(const ValueInput<int>& input);

    // ------------------------------------------------------------------------
    // Whole-action operations
    // ------------------------------------------------------------------------

    /**
     * @brief Apply an update document in digest order.
     *
     * @details
     * Keys are digested in the order shunt, injection, redispatch,
     * set_storage, set_bus, change_bus, set_line_status, change_line_status,
     * then hazards and maintenance last so that forced disconnections win
     * over every other edit of the same line. A key the profile does not
     * authorize is dropped with a warning. The update is all-or-nothing.
     *
     * Keys the producer of the update could not map (`unknown_keys`) are
     * reported as warnings too.
     *
     * @return Warnings about dropped keys.
     * @throws IllegalAction or AmbiguousAction (MalformedUpdate) on malformed input.
     */
    ActionDiagnostics update(const ActionUpdate& update);

    /**
     * @brief Merge `other` into this action ("this, then other").
     *
     * @details
     * - injections: finite entries of `other` overwrite;
     * - redispatch, storage: finite entries of `other` accumulate;
     * - line status and buses: an incoming set clears a pending change and
     *   overwrites the pending set; an incoming change cancels a pending
     *   change, inverts a pending set (`-v` for status, `3 - v` for buses),
     *   or becomes a pending change;
     * - hazards, maintenance: union;
     * - shunts: finite (or non-zero bus) entries of `other` overwrite.
     *
     * Attributes this action's profile does not carry are dropped with a
     * warning when the merge would change them. The receiver keeps its
     * profile, so `a.combine(b)` and `b.combine(a)` generally differ.
     *
     * @pre Two busbars per substation.
     * @return Warnings about dropped modifications.
     * @throws IllegalAction (IncompatibleGrid) if the grids differ.
     */
    ActionDiagnostics combine(const ActionState& other);

    /// `combine()`, discarding the diagnostics.
    ActionState& operator+=(const ActionState& other);

    /**
     * @brief Reset to "do nothing", keeping grid and profile.
     */
    void reset();

    /**
     * @brief Check whether the action modifies nothing.
     */
    bool is_do_nothing() const;

    /**
     * @brief Content equality.
     * @details Same grid, same profile, identical pending modifications.
     *          Injection NaN masks must match and finite entries be equal.
     *          Modified flags are not compared.
     */
    bool operator==(const ActionState& other) const;

    bool operator!=(const ActionState& other) const
    {
        return !(*this == other);
    }

    // ------------------------------------------------------------------------
    // Impact
    // ------------------------------------------------------------------------

    /**
     * @brief Lines and substations syntactically affected, status unknown.
     * @details Cached until the next mutation.
     */
    const TopologicalImpact& topological_impact() const;

    /**
     * @brief Lines and substations syntactically affected, given the
     *        current status of every line (true = connected).
     * @throws IllegalAction (InvalidQuery) if the status has the wrong length.
     */
    TopologicalImpact topological_impact(const std::vector<bool>& known_line_status) const;

    // Allow the flat decoder to restore raw vectors
    friend class ActionCodec;

private:
    void require(ActionAttribute attribute) const;
    void touched() noexcept;
    ElementDomain element_domain(ElementKind kind) const;
    ElementDomain object_domain(ObjectKind kind) const;
    void force_disconnection(const std::vector<LineIdx>& lines);
    void apply_update(const ActionUpdate& update, ActionDiagnostics& diagnostics);

    GridSchemaPtr m_schema;
    std::shared_ptr<const ActionCapabilities> m_capabilities;

    std::vector<int> m_set_bus;
    std::vector<bool> m_change_bus;
    std::vector<int> m_set_line_status;
    std::vector<bool> m_change_line_status;
    InjectionOverrides m_injection;
    std::vector<double> m_redispatch;
    std::vector<double> m_storage_power;
    std::vector<bool> m_hazards;
    std::vector<bool> m_maintenance;
    std::vector<double> m_shunt_p;
    std::vector<double> m_shunt_q;
    std::vector<int> m_shunt_bus;

    ModifiedFlags m_modified;

    mutable std::optional<TopologicalImpact> m_impact_cache;
};

/**
 * @brief `a` followed by `b`, as a new action with `a`'s profile.
 */
ActionState operator+(const ActionState& a, const ActionState& b);

} // namespace gridact
