#include <gtest/gtest.h>
#include "gridact/action/input_decoder.hpp"

using namespace gridact;

// Literal-type ambiguities are compile-time errors.
static_assert(!std::is_constructible_v<ElementRef, bool>, "bool ids must be rejected");
static_assert(!std::is_constructible_v<ElementRef, double>, "floating ids must be rejected");
static_assert(!std::is_constructible_v<ElementRef, float>, "floating ids must be rejected");
static_assert(std::is_constructible_v<ElementRef, int>, "integer ids are accepted");
static_assert(std::is_constructible_v<ElementRef, unsigned long>, "integer ids are accepted");
static_assert(std::is_constructible_v<ElementRef, const char*>, "names are accepted");

namespace
{

IllegalActionCode illegal_code_of(const std::function<void()>& fn)
{
    try
    {
        fn();
    }
    catch (const IllegalAction& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "Expected an IllegalAction";
    return IllegalActionCode::InvalidQuery;
}

} // namespace

// =============================================================================
// Element resolution
// =============================================================================

class InputDecoderTests : public ::testing::Test
{
protected:
    NameIndex names{{"a", 0}, {"b", 1}, {"c", 2}};
    std::vector<TopoIdx> positions{5, 1, 3};
    ElementDomain domain{"widget", 3, &names, &positions};
    ElementDomain anonymous{"slot", 6, nullptr, nullptr};
};

TEST_F(InputDecoderTests, ResolveElement_ById)
{
    EXPECT_EQ(resolve_element(domain, ElementRef(2)), 2u);
}

TEST_F(InputDecoderTests, ResolveElement_ByName)
{
    EXPECT_EQ(resolve_element(domain, ElementRef("b")), 1u);
}

TEST_F(InputDecoderTests, ResolveElement_Errors)
{
    EXPECT_EQ(illegal_code_of([&] { resolve_element(domain, ElementRef(-1)); }), IllegalActionCode::OutOfRange);
    EXPECT_EQ(illegal_code_of([&] { resolve_element(domain, ElementRef(3)); }), IllegalActionCode::OutOfRange);
    EXPECT_EQ(illegal_code_of([&] { resolve_element(domain, ElementRef("zz")); }),
              IllegalActionCode::UnknownElementName);
    EXPECT_EQ(illegal_code_of([&] { resolve_element(anonymous, ElementRef("a")); }),
              IllegalActionCode::WrongInputShape);
}

// =============================================================================
// Value inputs
// =============================================================================

TEST_F(InputDecoderTests, ApplyValues_AllShapesAgree)
{
    const std::vector<ValueInput<int>> inputs = {
        Assign<int>{1, 2},
        AssignList<int>{Assign<int>{1, 2}},
        KeyedValues<int>{{ElementRef(1), 2}},
        KeyedValues<int>{{ElementRef("b"), 2}},
        Dense<int>{{0, 2, 0}},
    };
    for (const auto& input : inputs)
    {
        std::vector<int> target(6, 0);
        apply_values(input, domain, kBusDomain, target);
        EXPECT_EQ(target, std::vector<int>({0, 2, 0, 0, 0, 0}));
    }
}

TEST_F(InputDecoderTests, ApplyValues_DenseWrongSize_Throws)
{
    std::vector<int> target(6, 0);
    EXPECT_EQ(illegal_code_of([&] { apply_values<int>(Dense<int>{{1, 1}}, domain, kBusDomain, target); }),
              IllegalActionCode::WrongInputShape);
}

TEST_F(InputDecoderTests, ApplyValues_OutOfDomain_Throws)
{
    std::vector<int> target(6, 0);
    EXPECT_EQ(illegal_code_of([&] { apply_values<int>(Assign<int>{0, 3}, domain, kBusDomain, target); }),
              IllegalActionCode::ValueOutOfDomain);
    EXPECT_EQ(illegal_code_of([&] { apply_values<int>(Assign<int>{0, -2}, domain, kBusDomain, target); }),
              IllegalActionCode::ValueOutOfDomain);
}

TEST_F(InputDecoderTests, ApplyValues_NonFiniteFloatsSkipped)
{
    std::vector<double> target(3, 1.0);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const ElementDomain powers{"unit", 3, nullptr, nullptr};
    apply_values<double>(Dense<double>{{nan, 4.0, std::numeric_limits<double>::infinity()}}, powers, kPowerDomain,
                         target);
    EXPECT_EQ(target, std::vector<double>({1.0, 4.0, 1.0}));
}

// =============================================================================
// Toggles
// =============================================================================

TEST_F(InputDecoderTests, ApplyToggles_ShapesAgree)
{
    const std::vector<ToggleInput> inputs = {
        ElementRef(2),
        IdList{2},
        IdSet{ElementRef("c")},
        Dense<bool>{{false, false, true}},
    };
    for (const auto& input : inputs)
    {
        std::vector<bool> target(6, false);
        apply_toggles(input, domain, target);
        EXPECT_EQ(target, std::vector<bool>({false, false, false, true, false, false}));
    }
}

TEST_F(InputDecoderTests, ApplyToggles_RepeatedIdTogglesBack)
{
    std::vector<bool> target(6, false);
    apply_toggles(IdList{0, 0}, domain, target);
    EXPECT_EQ(target, std::vector<bool>(6, false));
}

TEST_F(InputDecoderTests, ApplyToggles_MaskWrongSize_Throws)
{
    std::vector<bool> target(6, false);
    EXPECT_EQ(illegal_code_of([&] { apply_toggles(Dense<bool>{{true}}, domain, target); }),
              IllegalActionCode::WrongInputShape);
}

// =============================================================================
// Substation inputs
// =============================================================================

TEST(SubstationInputTests, AllShapesAgree)
{
    NameIndex names{{"s0", 0}, {"s1", 1}};
    const ElementDomain subs{"substation", 2, &names, nullptr};
    const std::vector<size_t> sub_info{2, 3};
    const std::vector<TopoIdx> sub_start{0, 2};

    const std::vector<SubstationInput<int>> inputs = {
        SubstationAssign<int>{1, {1, 2, 1}},
        std::vector<SubstationAssign<int>>{SubstationAssign<int>{"s1", {1, 2, 1}}},
        std::map<ElementRef, std::vector<int>>{{ElementRef(1), {1, 2, 1}}},
        Dense<int>{{0, 0, 1, 2, 1}},
    };
    for (const auto& input : inputs)
    {
        std::vector<int> target(5, 0);
        apply_substation_values(input, subs, sub_info, sub_start, kBusDomain, target);
        EXPECT_EQ(target, std::vector<int>({0, 0, 1, 2, 1}));
    }
}

TEST(SubstationInputTests, LocalVectorWrongSize_Throws)
{
    const ElementDomain subs{"substation", 2, nullptr, nullptr};
    std::vector<bool> target(5, false);
    EXPECT_EQ(illegal_code_of([&] {
                  apply_substation_toggles(SubstationAssign<bool>{0, {true}}, subs, {2, 3}, {0, 2}, target);
              }),
              IllegalActionCode::WrongInputShape);
    EXPECT_EQ(target, std::vector<bool>(5, false));
}

TEST(CommitOnSuccessTests, FailureLeavesVectorUntouched)
{
    std::vector<int> live{1, 2, 3};
    EXPECT_THROW(commit_on_success(live,
                                   [](std::vector<int>& working) {
                                       working[0] = 9;
                                       throw IllegalAction(IllegalActionCode::OutOfRange, "boom");
                                   }),
                 IllegalAction);
    EXPECT_EQ(live, std::vector<int>({1, 2, 3}));

    commit_on_success(live, [](std::vector<int>& working) { working[0] = 9; });
    EXPECT_EQ(live, std::vector<int>({9, 2, 3}));
}
