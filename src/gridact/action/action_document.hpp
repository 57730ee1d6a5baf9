/**
 * @file action_document.hpp
 * @brief Reading update documents from YAML.
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/action_diagnostics.hpp"
#include "gridact/action/action_update.hpp"

#include <yaml-cpp/yaml.h>

namespace gridact
{

class ActionState;

/**
 * @brief Translate a YAML mapping into an ActionUpdate.
 *
 * @details
 * The document mirrors the dictionary interface:
 * @code{.yaml}
 * injection: {load_p: [1.0, .nan, 2.0]}
 * set_bus: {lines_or_id: [[3, 2]], substations_id: {sub_1: [1, 2, 2, 1]}}
 * change_line_status: [4, 7]
 * hazards: [true, false, false]
 * shunt: {shunt_q: [[0, -10.5]]}
 * @endcode
 *
 * Value attributes accept a dense sequence, a sequence of `[id, value]`
 * pairs or a mapping from id (or name) to value. Toggle attributes accept
 * a single reference, a sequence of references or a dense boolean mask.
 * Unrecognized keys are collected in `ActionUpdate::unknown_keys`; nested
 * ones are reported as `parent.child`.
 *
 * @throws AmbiguousAction (MalformedUpdate) if the document has the wrong
 *         structure.
 * @throws IllegalAction (WrongInputShape) if an id is a boolean or a
 *         floating-point literal.
 */
ActionUpdate parse_action_update(const YAML::Node& document);

/**
 * @brief Parse YAML text, then translate it as above.
 * @throws AmbiguousAction (MalformedUpdate) if the text is not valid YAML.
 */
ActionUpdate parse_action_update(const std::string& yaml_text);

/**
 * @brief Parse YAML text and apply it with `ActionState::update()`.
 * @return Warnings about unknown or dropped keys.
 */
ActionDiagnostics update_from_yaml(ActionState& state, const std::string& yaml_text);

} // namespace gridact
