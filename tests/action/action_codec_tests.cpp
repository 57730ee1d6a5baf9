#include <gtest/gtest.h>
#include "gridact/action/action_codec.hpp"
#include "test_grids.hpp"

using namespace gridact;

namespace
{

size_t offset_of(const ActionState& action, ActionAttribute attribute)
{
    for (const AttributeSlice& slice : action.capabilities().layout())
    {
        if (slice.attribute == attribute)
        {
            return slice.offset;
        }
    }
    ADD_FAILURE() << "Attribute not in layout: " << to_string(attribute);
    return 0;
}

} // namespace

class ActionCodecTests : public ::testing::Test
{
protected:
    GridSchemaPtr schema = gridact_tests::case14();
    ActionState action{schema};
};

// =============================================================================
// Encoding
// =============================================================================

TEST_F(ActionCodecTests, DoNothing_EncodesNaNInjections)
{
    const std::vector<double> vect = ActionCodec::to_vect(action);
    ASSERT_EQ(vect.size(), action.capabilities().vector_size());
    EXPECT_EQ(vect.size(), 234u);
    for (size_t i = 0; i < 34; ++i)
    {
        EXPECT_TRUE(std::isnan(vect[i])) << "entry " << i;
    }
    for (size_t i = 34; i < vect.size(); ++i)
    {
        EXPECT_EQ(vect[i], 0.0) << "entry " << i;
    }
}

TEST_F(ActionCodecTests, Encode_PlacesValuesAtLayoutOffsets)
{
    action.set_line_status(Assign<int>{1, -1});
    action.change_element_bus(ElementKind::Load, ElementRef(0));
    const std::vector<double> vect = ActionCodec::to_vect(action);
    EXPECT_EQ(vect[offset_of(action, ActionAttribute::SetLineStatus) + 1], -1.0);
    EXPECT_EQ(vect[offset_of(action, ActionAttribute::ChangeBus) + 3], 1.0);
}

TEST_F(ActionCodecTests, Encode_WrongInjectionLength_Throws)
{
    action.set_injection(InjectionKey::LoadP, std::vector<double>(4, 1.0));
    try
    {
        ActionCodec::to_vect(action);
        FAIL() << "Expected an AmbiguousAction";
    }
    catch (const AmbiguousAction& e)
    {
        EXPECT_EQ(e.code(), AmbiguityCode::IncorrectNumberOfLoads);
    }
}

TEST(ActionCodecProfileTests, TopologyProfile_EncodesOnlyItsAttributes)
{
    ActionState action(gridact_tests::case14(), ActionProfile::Topology);
    action.set_element_bus(ElementKind::Generator, Assign<int>{0, 2});
    const std::vector<double> vect = ActionCodec::to_vect(action);
    ASSERT_EQ(vect.size(), 154u);
    EXPECT_EQ(vect[40 + 4], 2.0);
}

// =============================================================================
// Decoding
// =============================================================================

TEST_F(ActionCodecTests, RoundTrip_PreservesAction)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> prod_v(6, nan);
    prod_v[4] = 1.02;
    action.set_injection(InjectionKey::ProdV, prod_v);
    action.set_line_status(Assign<int>{7, -1});
    action.set_element_bus(ElementKind::Load, Assign<int>{5, 2});
    action.change_line_status(ElementRef(12));
    action.set_maintenance(ElementRef(19));

    ActionState decoded(schema);
    ActionCodec::from_vect(decoded, ActionCodec::to_vect(action));
    EXPECT_EQ(decoded, action);
    EXPECT_TRUE(decoded.modified().injection);
    EXPECT_TRUE(decoded.modified().set_status);
    EXPECT_TRUE(decoded.modified().maintenance);
    EXPECT_FALSE(decoded.modified().redispatch);
}

TEST_F(ActionCodecTests, RoundTrip_SmallGridWithShuntsAndStorage)
{
    ActionState small(gridact_tests::small_grid());
    small.set_storage_power(Assign<double>{0, 2.5});
    small.set_redispatch(Assign<double>{0, -3.0});
    small.set_shunt_q(Assign<double>{0, 12.0});
    small.set_shunt_bus(Assign<int>{0, 1});

    ActionState decoded(gridact_tests::small_grid());
    ActionCodec::from_vect(decoded, ActionCodec::to_vect(small));
    EXPECT_EQ(decoded, small);
    EXPECT_TRUE(decoded.modified().storage);
    EXPECT_TRUE(decoded.modified().shunt);
}

TEST_F(ActionCodecTests, Decode_AllNaNInjectionIsAbsent)
{
    ActionState decoded(schema);
    ActionCodec::from_vect(decoded, ActionCodec::to_vect(action));
    EXPECT_TRUE(decoded.injection().empty());
    EXPECT_TRUE(decoded.is_do_nothing());
    EXPECT_FALSE(decoded.modified().injection);
}

TEST_F(ActionCodecTests, Decode_SizeMismatch_Throws)
{
    try
    {
        ActionCodec::from_vect(action, std::vector<double>(233, 0.0));
        FAIL() << "Expected an AmbiguousAction";
    }
    catch (const AmbiguousAction& e)
    {
        EXPECT_EQ(e.code(), AmbiguityCode::IncorrectNumberOfElements);
    }
}

TEST_F(ActionCodecTests, Decode_NonIntegralBus_Throws)
{
    std::vector<double> vect = ActionCodec::to_vect(action);
    vect[offset_of(action, ActionAttribute::SetBus)] = 1.5;
    EXPECT_THROW(ActionCodec::from_vect(action, vect), IllegalAction);
    EXPECT_TRUE(action.is_do_nothing());
}

TEST_F(ActionCodecTests, Decode_NonBinaryFlag_Throws)
{
    std::vector<double> vect = ActionCodec::to_vect(action);
    vect[offset_of(action, ActionAttribute::Hazards)] = 2.0;
    EXPECT_THROW(ActionCodec::from_vect(action, vect), IllegalAction);
}

TEST_F(ActionCodecTests, Decode_AmbiguousContent_CheckedUnlessDisabled)
{
    std::vector<double> vect = ActionCodec::to_vect(action);
    vect[offset_of(action, ActionAttribute::SetBus)] = 3.0;
    try
    {
        ActionCodec::from_vect(action, vect);
        FAIL() << "Expected an AmbiguousAction";
    }
    catch (const AmbiguousAction& e)
    {
        EXPECT_EQ(e.code(), AmbiguityCode::InvalidBusStatus);
    }
    EXPECT_TRUE(action.is_do_nothing());

    ActionCodec::from_vect(action, vect, false);
    EXPECT_EQ(action.set_bus()[0], 3);
    EXPECT_TRUE(action.modified().set_bus);
}

TEST_F(ActionCodecTests, DeriveFlags_IgnoresCancelledToggles)
{
    action.change_line_status(IdList{6, 6});
    EXPECT_TRUE(action.modified().change_status);
    EXPECT_FALSE(ActionCodec::derive_flags(action).change_status);
}
