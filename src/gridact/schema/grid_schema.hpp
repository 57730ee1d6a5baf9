/**
 * @file grid_schema.hpp
 * @brief Immutable element/topology index scheme of one grid.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"
#include "gridact/common/gridact_exceptions.hpp"
#include "gridact/schema/action_capabilities.hpp"
#include "gridact/schema/grid_description.hpp"

namespace gridact
{

class GridSchema;
using GridSchemaPtr = std::shared_ptr<const GridSchema>;

/**
 * @brief Ids of every element connected to one substation.
 */
struct SubstationObjects
{
    std::vector<LoadIdx> loads_id;
    std::vector<GenIdx> generators_id;
    std::vector<LineIdx> lines_or_id;
    std::vector<LineIdx> lines_ex_id;
    std::vector<StorageIdx> storages_id;
    size_t nb_elements{0};
};

/**
 * @brief Immutable description of a grid's elements and topology vector.
 *
 * @details
 * `GridSchema` maps every element endpoint (load, generator, both ends of a
 * line, storage unit) onto a substation, a local position within that
 * substation, and a unique slot of the flat topology vector:
 *
 *     pos_topo_vect = sum(sub_info[0..sub)) + sub_pos
 *
 * Construction validates the whole description and throws `SchemaError` on
 * the first violation:
 * - at least one substation, load, generator and line;
 * - every substation id within `[0, n_sub)`, every substation non-empty;
 * - `sum(sub_info) == dim_topo == 2*n_line + n_load + n_gen + n_storage`
 *   and per-substation counts matching `sub_info`;
 * - local positions within `[0, sub_info[sub])`;
 * - topology positions forming a bijection onto `[0, dim_topo)`;
 * - unique names per object kind;
 * - dispatch and storage static data in range.
 *
 * The schema also builds one `ActionCapabilities` per `ActionProfile`.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe.
 * - Share it through `GridSchemaPtr`.
 */
class GridSchema
{
public:
    /**
     * @brief Validate a description and build the schema.
     * @throws SchemaError if the description is inconsistent.
     */
    explicit GridSchema(GridDescription description);

    /**
     * @brief Build a shared schema.
     */
    static GridSchemaPtr create(GridDescription description);

    // Shared through GridSchemaPtr, never copied.
    GridSchema(const GridSchema&) = delete;
    GridSchema& operator=(const GridSchema&) = delete;

    // ------------------------------------------------------------------------
    // Counts
    // ------------------------------------------------------------------------

    size_t n_load() const noexcept
    {
        return m_load.to_subid.size();
    }
    size_t n_gen() const noexcept
    {
        return m_gen.to_subid.size();
    }
    size_t n_line() const noexcept
    {
        return m_line_or.to_subid.size();
    }
    size_t n_storage() const noexcept
    {
        return m_storage.to_subid.size();
    }
    size_t n_sub() const noexcept
    {
        return m_sub_info.size();
    }
    size_t n_shunt() const noexcept
    {
        return m_shunt_to_subid.size();
    }
    size_t dim_topo() const noexcept
    {
        return m_dim_topo;
    }

    /**
     * @brief Number of elements of a topology element kind.
     */
    size_t element_count(ElementKind kind) const noexcept;

    /**
     * @brief Number of objects of an object kind.
     */
    size_t object_count(ObjectKind kind) const noexcept;

    // ------------------------------------------------------------------------
    // Topology layout
    // ------------------------------------------------------------------------

    const std::vector<size_t>& sub_info() const noexcept
    {
        return m_sub_info;
    }

    /// Substation of each element of a kind.
    const std::vector<SubIdx>& to_subid(ElementKind kind) const noexcept;

    /// Local position of each element of a kind within its substation.
    const std::vector<size_t>& to_sub_pos(ElementKind kind) const noexcept;

    /// Topology slot of each element of a kind.
    const std::vector<TopoIdx>& pos_topo_vect(ElementKind kind) const noexcept;

    /// Substation owning each topology slot.
    const std::vector<SubIdx>& topo_vect_to_sub() const noexcept
    {
        return m_topo_vect_to_sub;
    }

    /**
     * @brief First topology slot of a substation.
     * @throws SchemaError (OutOfRange) if `sub` is not a substation.
     */
    TopoIdx sub_start(SubIdx sub) const;

    /**
     * @brief Resolve an element to its substation and topology slot.
     * @throws SchemaError (OutOfRange) if `id` is not in `[0, n_elements)`.
     */
    std::pair<SubIdx, TopoIdx> resolve(ElementKind kind, size_t id) const;

    /**
     * @brief Kind and id of the element occupying a topology slot.
     * @throws SchemaError (OutOfRange) if `pos` is not in `[0, dim_topo)`.
     */
    std::pair<ElementKind, size_t> element_at(TopoIdx pos) const;

    /**
     * @brief Object-type rows of the elements of one substation.
     * @details One row per element, in local position order.
     * @throws SchemaError (OutOfRange) if `sub` is not a substation.
     */
    std::vector<ObjectTypeRow> elements_of_substation(SubIdx sub) const;

    /**
     * @brief Object-type rows of the whole topology vector, in slot order.
     */
    std::vector<ObjectTypeRow> grid_objects_types() const;

    /**
     * @brief Ids of every element connected to a substation.
     * @throws SchemaError (OutOfRange) if `sub` is not a substation.
     */
    SubstationObjects get_obj_connect_to(SubIdx sub) const;

    /**
     * @brief Lines going from `from_sub` (origin) to `to_sub` (extremity).
     * @throws SchemaError (NotFound) if there is none.
     */
    std::vector<LineIdx> get_lines_id(SubIdx from_sub, SubIdx to_sub) const;

    /// @throws SchemaError (NotFound) if the substation has no generator.
    std::vector<GenIdx> get_generators_id(SubIdx sub) const;

    /// @throws SchemaError (NotFound) if the substation has no load.
    std::vector<LoadIdx> get_loads_id(SubIdx sub) const;

    /// @throws SchemaError (NotFound) if the substation has no storage unit.
    std::vector<StorageIdx> get_storages_id(SubIdx sub) const;

    // ------------------------------------------------------------------------
    // Names
    // ------------------------------------------------------------------------

    const std::string& env_name() const noexcept
    {
        return m_env_name;
    }

    /**
     * @brief Name table of an object kind.
     */
    const std::vector<std::string>& names(ObjectKind kind) const noexcept;

    /// Name-to-id index of an object kind.
    const NameIndex& name_index(ObjectKind kind) const noexcept
    {
        return m_name_index[static_cast<size_t>(kind)];
    }

    /**
     * @brief Find an object by name.
     * @return The object id, or empty if no object of that kind has the name.
     */
    std::optional<size_t> find_by_name(ObjectKind kind, const std::string& name) const;

    // ------------------------------------------------------------------------
    // Static data
    // ------------------------------------------------------------------------

    bool redispatching_available() const noexcept
    {
        return m_dispatch.has_value();
    }

    /// @return Dispatch data, or nullptr if redispatching is not available.
    const DispatchData* dispatch() const noexcept
    {
        return m_dispatch ? &*m_dispatch : nullptr;
    }

    /// @return Storage data, or nullptr if the grid has no storage unit.
    const StorageData* storage() const noexcept
    {
        return m_storage_data ? &*m_storage_data : nullptr;
    }

    bool shunts_available() const noexcept
    {
        return m_shunts_available;
    }

    const std::vector<SubIdx>& shunt_to_subid() const noexcept
    {
        return m_shunt_to_subid;
    }

    // ------------------------------------------------------------------------
    // Capabilities and identity
    // ------------------------------------------------------------------------

    /**
     * @brief Capability descriptor of a profile on this grid.
     */
    std::shared_ptr<const ActionCapabilities> capabilities(ActionProfile profile) const;

    /**
     * @brief Check whether two schemas describe the same grid layout.
     * @details Compares counts, substation membership, positions and names.
     */
    bool same_grid(const GridSchema& other) const;

    /**
     * @brief Reconstruct the fully-populated description of this grid.
     * @details All defaults are made explicit (sub_info, positions, names).
     */
    GridDescription description() const;

private:
    /// Per-kind topology tables.
    struct ElementTable
    {
        std::vector<SubIdx> to_subid;
        std::vector<size_t> to_sub_pos;
        std::vector<TopoIdx> pos_topo_vect;
    };

    const ElementTable& table(ElementKind kind) const noexcept;
    ElementTable& table(ElementKind kind) noexcept;

    void check_counts(const GridDescription& description) const;
    void build_sub_info(const GridDescription& description);
    void assign_positions(const GridDescription& description);
    void check_positions() const;
    void build_topology();
    void assign_names(GridDescription& description);
    void check_dispatch_data() const;
    void check_storage_data() const;
    void build_capabilities();

    std::string m_env_name;
    std::vector<size_t> m_sub_info;
    std::vector<TopoIdx> m_sub_start;
    size_t m_dim_topo{0};

    ElementTable m_load;
    ElementTable m_gen;
    ElementTable m_line_or;
    ElementTable m_line_ex;
    ElementTable m_storage;

    std::vector<SubIdx> m_topo_vect_to_sub;
    std::vector<std::pair<ElementKind, size_t>> m_topo_vect_to_element;

    std::vector<std::string> m_name_load;
    std::vector<std::string> m_name_gen;
    std::vector<std::string> m_name_line;
    std::vector<std::string> m_name_sub;
    std::vector<std::string> m_name_storage;
    std::vector<std::string> m_name_shunt;
    std::vector<NameIndex> m_name_index;

    std::optional<DispatchData> m_dispatch;
    std::optional<StorageData> m_storage_data;
    bool m_shunts_available{false};
    std::vector<SubIdx> m_shunt_to_subid;

    std::vector<std::shared_ptr<const ActionCapabilities>> m_capabilities;
};

} // namespace gridact
