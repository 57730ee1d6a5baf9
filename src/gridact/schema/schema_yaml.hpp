/**
 * @file schema_yaml.hpp
 * @brief YAML representation of a GridDescription.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/schema/grid_description.hpp"

namespace gridact
{

/**
 * @brief Parse a grid description from YAML text.
 *
 * @details
 * Keys mirror the members of `GridDescription`. Optional vectors may be
 * omitted. Static data lives under the `dispatch`, `storage` and `shunts`
 * mappings.
 *
 * @throws SchemaError (InvalidDocument) if the text is not valid YAML or a
 *         key has the wrong type. Structural checks are left to GridSchema.
 */
GridDescription load_grid_description(const std::string& yaml_text);

/**
 * @brief Read a grid description from a YAML file.
 * @throws SchemaError (InvalidDocument) if the file cannot be read or parsed.
 */
GridDescription load_grid_description_file(const std::string& path);

/**
 * @brief Render a grid description as YAML text.
 * @details Empty optional vectors are omitted.
 */
std::string save_grid_description(const GridDescription& description);

/**
 * @brief Write a grid description to a YAML file.
 * @throws SchemaError (InvalidDocument) if the file cannot be written.
 */
void save_grid_description_file(const GridDescription& description, const std::string& path);

} // namespace gridact
