/**
 * @file action_codec.cpp
 */
#include "gridact/action/action_codec.hpp"
#include "gridact/action/ambiguity_checker.hpp"

namespace gridact
{

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

template <typename T>
void append(std::vector<double>& out, const std::vector<T>& values)
{
    for (const auto& v : values)
    {
        out.push_back(static_cast<double>(v));
    }
}

void append_sized(std::vector<double>& out, const std::vector<double>& values, size_t expected, AmbiguityCode code,
                  ActionAttribute attribute)
{
    if (values.size() != expected)
    {
        throw AmbiguousAction(code, std::string("Cannot encode \"") + to_string(attribute) + "\": it has " +
                                        std::to_string(values.size()) + " entries instead of " +
                                        std::to_string(expected));
    }
    append(out, values);
}

int to_integer(double value, ActionAttribute attribute, size_t index)
{
    if (!std::isfinite(value) || std::floor(value) != value || std::fabs(value) > std::numeric_limits<int>::max())
    {
        throw IllegalAction(IllegalActionCode::ValueOutOfDomain,
                            std::string("Entry ") + std::to_string(index) + " of \"" + to_string(attribute) +
                                "\" must be an integer, got " + std::to_string(value));
    }
    return static_cast<int>(value);
}

bool to_flag(double value, ActionAttribute attribute, size_t index)
{
    if (value != 0.0 && value != 1.0)
    {
        throw IllegalAction(IllegalActionCode::ValueOutOfDomain,
                            std::string("Entry ") + std::to_string(index) + " of \"" + to_string(attribute) +
                                "\" must be 0 or 1, got " + std::to_string(value));
    }
    return value == 1.0;
}

template <typename T>
bool any_nonzero(const std::vector<T>& values) noexcept
{
    return std::any_of(values.begin(), values.end(), [](T v) { return v != T{0}; });
}

bool any_true(const std::vector<bool>& values) noexcept
{
    return std::find(values.begin(), values.end(), true) != values.end();
}

bool any_finite(const std::vector<double>& values) noexcept
{
    return std::any_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); });
}

bool any_setpoint(const std::vector<double>& values) noexcept
{
    return std::any_of(values.begin(), values.end(), [](double v) { return std::isfinite(v) && v != 0.0; });
}

} // namespace

// ============================================================================
// Encoding
// ============================================================================

std::vector<double> ActionCodec::to_vect(const ActionState& state)
{
    const ActionCapabilities& caps = state.capabilities();
    const GridSchema& schema = state.schema();
    std::vector<double> out;
    out.reserve(caps.vector_size());

    for (const AttributeSlice& slice : caps.layout())
    {
        switch (slice.attribute)
        {
        case ActionAttribute::ProdP:
        case ActionAttribute::ProdV:
        case ActionAttribute::LoadP:
        case ActionAttribute::LoadQ:
        {
            const InjectionKey key = slice.attribute == ActionAttribute::ProdP   ? InjectionKey::ProdP
                                     : slice.attribute == ActionAttribute::ProdV ? InjectionKey::ProdV
                                     : slice.attribute == ActionAttribute::LoadP ? InjectionKey::LoadP
                                                                                 : InjectionKey::LoadQ;
            const bool is_load = key == InjectionKey::LoadP || key == InjectionKey::LoadQ;
            auto it = state.injection().find(key);
            if (it == state.injection().end())
            {
                out.insert(out.end(), slice.length, kNaN);
            }
            else
            {
                append_sized(out, it->second, slice.length,
                             is_load ? AmbiguityCode::IncorrectNumberOfLoads
                                     : AmbiguityCode::IncorrectNumberOfGenerators,
                             slice.attribute);
            }
            break;
        }
        case ActionAttribute::Redispatch:
            append(out, state.redispatch());
            break;
        case ActionAttribute::SetLineStatus:
            append(out, state.line_set_status());
            break;
        case ActionAttribute::ChangeLineStatus:
            append(out, state.line_change_status());
            break;
        case ActionAttribute::SetBus:
            append(out, state.set_bus());
            break;
        case ActionAttribute::ChangeBus:
            append(out, state.change_bus());
            break;
        case ActionAttribute::Hazards:
            append(out, state.hazards());
            break;
        case ActionAttribute::Maintenance:
            append(out, state.maintenance());
            break;
        case ActionAttribute::StoragePower:
            append(out, state.storage_power());
            break;
        case ActionAttribute::ShuntP:
            append_sized(out, state.shunt_p(), schema.n_shunt(), AmbiguityCode::IncorrectNumberOfShunts,
                         slice.attribute);
            break;
        case ActionAttribute::ShuntQ:
            append_sized(out, state.shunt_q(), schema.n_shunt(), AmbiguityCode::IncorrectNumberOfShunts,
                         slice.attribute);
            break;
        case ActionAttribute::ShuntBus:
            if (state.shunt_bus().size() != schema.n_shunt())
            {
                throw AmbiguousAction(AmbiguityCode::IncorrectNumberOfShunts,
                                      "Cannot encode \"shunt_bus\": its size does not match the grid");
            }
            append(out, state.shunt_bus());
            break;
        }
    }
    return out;
}

// ============================================================================
// Decoding
// ============================================================================

void ActionCodec::from_vect(ActionState& state, const std::vector<double>& vect, bool check_legit)
{
    const ActionCapabilities& caps = state.capabilities();
    if (vect.size() != caps.vector_size())
    {
        throw AmbiguousAction(AmbiguityCode::IncorrectNumberOfElements,
                              "Impossible to decode a vector of size " + std::to_string(vect.size()) + ": a " +
                                  to_string(caps.profile()) + " action on this grid has size " +
                                  std::to_string(caps.vector_size()));
    }

    ActionState working(state.schema_ptr(), caps.profile());
    for (const AttributeSlice& slice : caps.layout())
    {
        const auto first = vect.begin() + static_cast<std::ptrdiff_t>(slice.offset);
        const std::vector<double> values(first, first + static_cast<std::ptrdiff_t>(slice.length));

        auto integers = [&](std::vector<int>& target) {
            for (size_t i = 0; i < values.size(); ++i)
            {
                target[i] = to_integer(values[i], slice.attribute, i);
            }
        };
        auto flags = [&](std::vector<bool>& target) {
            for (size_t i = 0; i < values.size(); ++i)
            {
                target[i] = to_flag(values[i], slice.attribute, i);
            }
        };

        switch (slice.attribute)
        {
        case ActionAttribute::ProdP:
        case ActionAttribute::ProdV:
        case ActionAttribute::LoadP:
        case ActionAttribute::LoadQ:
            if (any_finite(values))
            {
                const InjectionKey key = slice.attribute == ActionAttribute::ProdP   ? InjectionKey::ProdP
                                         : slice.attribute == ActionAttribute::ProdV ? InjectionKey::ProdV
                                         : slice.attribute == ActionAttribute::LoadP ? InjectionKey::LoadP
                                                                                     : InjectionKey::LoadQ;
                working.m_injection[key] = values;
            }
            break;
        case ActionAttribute::Redispatch:
            working.m_redispatch = values;
            break;
        case ActionAttribute::SetLineStatus:
            integers(working.m_set_line_status);
            break;
        case ActionAttribute::ChangeLineStatus:
            flags(working.m_change_line_status);
            break;
        case ActionAttribute::SetBus:
            integers(working.m_set_bus);
            break;
        case ActionAttribute::ChangeBus:
            flags(working.m_change_bus);
            break;
        case ActionAttribute::Hazards:
            flags(working.m_hazards);
            break;
        case ActionAttribute::Maintenance:
            flags(working.m_maintenance);
            break;
        case ActionAttribute::StoragePower:
            working.m_storage_power = values;
            break;
        case ActionAttribute::ShuntP:
            working.m_shunt_p = values;
            break;
        case ActionAttribute::ShuntQ:
            working.m_shunt_q = values;
            break;
        case ActionAttribute::ShuntBus:
            integers(working.m_shunt_bus);
            break;
        }
    }

    working.m_modified = derive_flags(working);
    if (check_legit)
    {
        AmbiguityChecker(working).check();
    }
    state = std::move(working);
}

ModifiedFlags ActionCodec::derive_flags(const ActionState& state)
{
    ModifiedFlags flags;
    flags.injection = !state.injection().empty();
    flags.set_bus = any_nonzero(state.set_bus());
    flags.change_bus = any_true(state.change_bus());
    flags.set_status = any_nonzero(state.line_set_status());
    flags.change_status = any_true(state.line_change_status());
    flags.redispatch = any_setpoint(state.redispatch());
    flags.storage = any_setpoint(state.storage_power());
    flags.hazards = any_true(state.hazards());
    flags.maintenance = any_true(state.maintenance());
    flags.shunt = any_finite(state.shunt_p()) || any_finite(state.shunt_q()) || any_nonzero(state.shunt_bus());
    return flags;
}

} // namespace gridact
