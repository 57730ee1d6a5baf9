/**
 * @file grid_enums.hpp
 * @brief Index aliases and enumerations shared by the schema and action layers.
 */
#pragma once
#include "gridact/common/common.hpp"

namespace gridact
{

/**
 * @brief Position of an element endpoint in the flat topology vector.
 * @details A value in `[0, dim_topo)`.
 */
using TopoIdx = size_t;

/**
 * @brief Substation index.
 * @details A value in `[0, n_sub)`.
 */
using SubIdx = size_t;

/// Powerline index, in `[0, n_line)`.
using LineIdx = size_t;

/// Load index, in `[0, n_load)`.
using LoadIdx = size_t;

/// Generator index, in `[0, n_gen)`.
using GenIdx = size_t;

/// Storage unit index, in `[0, n_storage)`.
using StorageIdx = size_t;

/// Shunt index, in `[0, n_shunt)`.
using ShuntIdx = size_t;

/// Element name to element id.
using NameIndex = std::unordered_map<std::string, size_t>;

/**
 * @brief Number of busbars available in every substation.
 *
 * @details
 * Bus codes are `-1` (disconnected), `0` (no modification), `1` and `2`.
 * Bus inversion during composition (`v' = 3 - v`) is only defined for two
 * busbars; grids with more busbars per substation are not supported.
 */
constexpr int kBusbarsPerSubstation = 2;

/// Lowest valid bus code (disconnection).
constexpr int kMinBusCode = -1;

/// Highest valid bus code.
constexpr int kMaxBusCode = kBusbarsPerSubstation;

/**
 * @brief Kind of element endpoint occupying a slot of the topology vector.
 */
enum class ElementKind
{
    Load,
    Generator,
    LineOr,   ///< Origin end of a powerline.
    LineEx,   ///< Extremity end of a powerline.
    Storage
};

/// All topology element kinds, in automatic substation-position order.
constexpr std::array<ElementKind, 5> kAllElementKinds = {
    ElementKind::Load,
    ElementKind::Generator,
    ElementKind::LineOr,
    ElementKind::LineEx,
    ElementKind::Storage,
};

/**
 * @brief Kind of named grid object.
 *
 * @details
 * Unlike `ElementKind`, a powerline is a single object here; it is the
 * granularity at which names are defined and at which `effect_on` answers.
 */
enum class ObjectKind
{
    Load,
    Generator,
    Line,
    Storage,
    Substation,
    Shunt
};

/**
 * @brief Columns of the uniform object-type matrix.
 *
 * @details
 * Each row of `GridSchema::grid_objects_types()` describes one topology slot;
 * the substation column is always filled and exactly one of the other columns
 * holds an element id, the rest being `-1`.
 */
enum class ObjectColumn : size_t
{
    Substation = 0,
    Load = 1,
    Generator = 2,
    LineOr = 3,
    LineEx = 4,
    Storage = 5
};

/// Number of columns of an object-type row.
constexpr size_t kObjectColumnCount = 6;

/// One row of the object-type matrix.
using ObjectTypeRow = std::array<int, kObjectColumnCount>;

/**
 * @brief Named attribute of an action, in flat-encoding order.
 */
enum class ActionAttribute
{
    ProdP,
    ProdV,
    LoadP,
    LoadQ,
    Redispatch,
    SetLineStatus,
    ChangeLineStatus,
    SetBus,
    ChangeBus,
    Hazards,
    Maintenance,
    StoragePower,
    ShuntP,
    ShuntQ,
    ShuntBus
};

/// All attributes in flat-encoding order.
constexpr std::array<ActionAttribute, 15> kAllActionAttributes = {
    ActionAttribute::ProdP,
    ActionAttribute::ProdV,
    ActionAttribute::LoadP,
    ActionAttribute::LoadQ,
    ActionAttribute::Redispatch,
    ActionAttribute::SetLineStatus,
    ActionAttribute::ChangeLineStatus,
    ActionAttribute::SetBus,
    ActionAttribute::ChangeBus,
    ActionAttribute::Hazards,
    ActionAttribute::Maintenance,
    ActionAttribute::StoragePower,
    ActionAttribute::ShuntP,
    ActionAttribute::ShuntQ,
    ActionAttribute::ShuntBus,
};

/**
 * @brief Restricted action family.
 *
 * @details
 * A profile fixes which attributes an action may carry. Composition between
 * actions of different profiles keeps the receiving action's profile.
 */
enum class ActionProfile
{
    Complete,
    Playable,
    Topology,
    TopologyAndDispatch,
    Dispatch,
    PowerlineSet,
    DoNothing
};

/// All profiles, in declaration order.
constexpr std::array<ActionProfile, 7> kAllActionProfiles = {
    ActionProfile::Complete,
    ActionProfile::Playable,
    ActionProfile::Topology,
    ActionProfile::TopologyAndDispatch,
    ActionProfile::Dispatch,
    ActionProfile::PowerlineSet,
    ActionProfile::DoNothing,
};

/**
 * @brief Injection quantity that an action may override.
 */
enum class InjectionKey
{
    LoadP,
    LoadQ,
    ProdP,
    ProdV
};

/// Attribute name used in update keys, summaries and YAML.
const char* to_string(ActionAttribute attribute) noexcept;

/// Profile name.
const char* to_string(ActionProfile profile) noexcept;

/// Injection key name (`load_p`, `load_q`, `prod_p`, `prod_v`).
const char* to_string(InjectionKey key) noexcept;

/// Human-readable element kind label (`load`, `generator`, ...).
const char* to_string(ElementKind kind) noexcept;

/// Human-readable object kind label.
const char* to_string(ObjectKind kind) noexcept;

/// Attribute carrying the given injection key.
ActionAttribute to_attribute(InjectionKey key) noexcept;

/// Parse an injection key name; empty if unknown.
std::optional<InjectionKey> parse_injection_key(const std::string& name);

} // namespace gridact
