/**
 * @file action_diagnostics.hpp
 */
#pragma once
#include "gridact/common/common.hpp"
#include "gridact/common/grid_enums.hpp"

namespace gridact
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    DroppedModification,  ///< A modification was cut because the receiver does not support it.
    UnknownUpdateKey      ///< An update document contained an unrecognized key.
};

/**
 * @brief A single diagnostic item.
 *
 * @details
 * `attribute` is set when the issue concerns one action attribute; `key`
 * holds the raw document key for update diagnostics.
 */
struct DiagnosticItem
{
    DiagnosticCategory category;
    std::string message;

    /// Attribute concerned by this issue (if applicable).
    std::optional<ActionAttribute> attribute;

    /// Raw update key concerned by this issue (if applicable).
    std::string key;
};

// ============================================================================
// ActionDiagnostics
// ============================================================================

/**
 * @brief Non-fatal issues collected while composing or updating an action.
 *
 * @details
 * The non-strict paths of the action model (composition of actions with
 * different profiles, dictionary updates with unknown keys) never throw for
 * these conditions. They degrade to a warning-and-drop and report what was
 * dropped here.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once returned, the data is immutable.
 * - Concurrent reads are safe.
 */
class ActionDiagnostics
{
public:
    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Check whether a warning of the given category was reported.
     */
    bool has_warning(DiagnosticCategory category) const noexcept
    {
        return std::any_of(m_warnings.begin(), m_warnings.end(), [category](const DiagnosticItem& item) {
            return item.category == category;
        });
    }

    /**
     * @brief Merge another diagnostics object into this one.
     */
    void merge(const ActionDiagnostics& other)
    {
        m_warnings.insert(m_warnings.end(), other.m_warnings.begin(), other.m_warnings.end());
    }

    // Allow ActionState to populate diagnostics
    friend class ActionState;

private:
    void add_warning(DiagnosticCategory category, std::string message,
                     std::optional<ActionAttribute> attribute = std::nullopt, std::string key = {})
    {
        m_warnings.push_back(DiagnosticItem{category, std::move(message), attribute, std::move(key)});
    }

    std::vector<DiagnosticItem> m_warnings;
};

} // namespace gridact
