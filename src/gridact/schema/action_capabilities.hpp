/**
 * @file action_capabilities.hpp
 * @brief Immutable descriptor of the attributes an action profile carries.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"

namespace gridact
{

class GridSchema;

/**
 * @brief One attribute's slice of the flat action vector.
 */
struct AttributeSlice
{
    ActionAttribute attribute;
    size_t offset;
    size_t length;
};

/**
 * @brief Capability descriptor of an action profile on a given grid.
 *
 * @details
 * Built once per profile when the GridSchema is constructed and shared by
 * every ActionState of that profile. It answers:
 * - which attributes the profile may modify (`supports()`),
 * - which top-level keys an update document may use (`authorizes()`),
 * - the flat-encoding layout (`attributes()`, `layout()`, `vector_size()`).
 *
 * Shunt attributes are only carried by Complete actions on grids that
 * declare shunts.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe.
 */
class ActionCapabilities
{
public:
    ActionCapabilities(ActionProfile profile, const GridSchema& schema);

    ActionProfile profile() const noexcept
    {
        return m_profile;
    }

    /**
     * @brief Check whether the profile carries an attribute.
     */
    bool supports(ActionAttribute attribute) const noexcept;

    /**
     * @brief Check whether any injection attribute is carried.
     */
    bool supports_injection() const noexcept;

    /**
     * @brief Check whether a top-level update key is authorized.
     * @details Keys are `injection`, `set_bus`, `change_bus`,
     *          `set_line_status`, `change_line_status`, `redispatch`,
     *          `set_storage`, `hazards`, `maintenance` and `shunt`.
     */
    bool authorizes(const std::string& update_key) const;

    /**
     * @brief Authorized top-level update keys, in digest order.
     */
    const std::vector<std::string>& authorized_keys() const noexcept
    {
        return m_authorized_keys;
    }

    /**
     * @brief Carried attributes, in flat-encoding order.
     */
    const std::vector<ActionAttribute>& attributes() const noexcept
    {
        return m_attributes;
    }

    /**
     * @brief Number of values an attribute occupies in the flat vector.
     * @return The schema dimension of the attribute, or 0 if not carried.
     */
    size_t attribute_size(ActionAttribute attribute) const noexcept;

    /**
     * @brief Offsets and lengths of every carried attribute.
     */
    const std::vector<AttributeSlice>& layout() const noexcept
    {
        return m_layout;
    }

    /**
     * @brief Total length of the flat vector.
     */
    size_t vector_size() const noexcept
    {
        return m_vector_size;
    }

    /**
     * @brief Attribute carried by an update key.
     * @return Empty if the key is not recognized at all.
     */
    static std::optional<ActionAttribute> attribute_of_update_key(const std::string& update_key);

    /**
     * @brief All recognized update keys, in digest order.
     */
    static const std::vector<std::string>& known_update_keys();

private:
    ActionProfile m_profile;
    std::vector<ActionAttribute> m_attributes;
    std::vector<AttributeSlice> m_layout;
    std::vector<std::string> m_authorized_keys;
    size_t m_vector_size{0};
    std::array<size_t, kAllActionAttributes.size()> m_sizes{};
};

} // namespace gridact
