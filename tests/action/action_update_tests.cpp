#include <gtest/gtest.h>
#include "gridact/action/action_document.hpp"
#include "gridact/action/action_state.hpp"
#include "gridact/action/action_update.hpp"
#include "test_grids.hpp"

using namespace gridact;

class ActionUpdateTests : public ::testing::Test
{
protected:
    GridSchemaPtr schema = gridact_tests::case14();
    ActionState action{schema};
};

// =============================================================================
// Structured updates
// =============================================================================

TEST_F(ActionUpdateTests, Empty_IsDoNothing)
{
    const ActionDiagnostics diagnostics = action.update(ActionUpdate{});
    EXPECT_FALSE(diagnostics.has_warnings());
    EXPECT_TRUE(action.is_do_nothing());
}

TEST_F(ActionUpdateTests, SetBus_DenseTopologyVector)
{
    std::vector<int> topo(57, 0);
    topo[10] = 2;
    ActionUpdate update;
    update.set_bus = SetBusUpdate(ValueInput<int>(Dense<int>{topo}));
    action.update(update);
    EXPECT_EQ(action.set_bus(), topo);
    EXPECT_TRUE(action.modified().set_bus);
}

TEST_F(ActionUpdateTests, SetBus_TargetsByKind)
{
    SetBusTargets targets;
    targets.generators_id = ValueInput<int>(Assign<int>{0, 2});
    targets.lines_ex_id = ValueInput<int>(KeyedValues<int>{{ElementRef(1), 1}});
    ActionUpdate update;
    update.set_bus = targets;
    action.update(update);
    EXPECT_EQ(action.set_bus()[4], 2);
    EXPECT_EQ(action.set_bus()[21], 1);
}

TEST_F(ActionUpdateTests, ChangeBus_SubstationTargets)
{
    ChangeBusTargets targets;
    targets.substations_id = SubstationInput<bool>(SubstationAssign<bool>{1, {true, false, false, false, false, true}});
    ActionUpdate update;
    update.change_bus = targets;
    action.update(update);
    EXPECT_EQ(action.sub_change_bus(1), std::vector<bool>({true, false, false, false, false, true}));
}

TEST_F(ActionUpdateTests, EmptyTargets_Throws)
{
    ActionUpdate update;
    update.change_bus = ChangeBusTargets{};
    try
    {
        action.update(update);
        FAIL() << "Expected an AmbiguousAction";
    }
    catch (const AmbiguousAction& e)
    {
        EXPECT_EQ(e.code(), AmbiguityCode::MalformedUpdate);
    }
}

TEST_F(ActionUpdateTests, Failure_LeavesActionUnchanged)
{
    ActionUpdate update;
    update.set_line_status = ValueInput<int>(Assign<int>{0, -1});
    update.change_line_status = ToggleInput(ElementRef(99));
    EXPECT_THROW(action.update(update), IllegalAction);
    EXPECT_TRUE(action.is_do_nothing());
    EXPECT_FALSE(action.modified().set_status);
}

TEST_F(ActionUpdateTests, Hazards_OverrideEarlierKeys)
{
    ActionUpdate update;
    update.set_line_status = ValueInput<int>(Assign<int>{2, 1});
    update.hazards = ToggleInput(ElementRef(2));
    action.update(update);
    EXPECT_EQ(action.line_set_status()[2], -1);
    EXPECT_TRUE(action.hazards()[2]);
}

TEST_F(ActionUpdateTests, UnknownKey_Warns)
{
    ActionUpdate update;
    update.unknown_keys = {"curtail"};
    update.set_line_status = ValueInput<int>(Assign<int>{0, 1});
    const ActionDiagnostics diagnostics = action.update(update);
    ASSERT_EQ(diagnostics.warnings().size(), 1u);
    EXPECT_EQ(diagnostics.warnings()[0].category, DiagnosticCategory::UnknownUpdateKey);
    EXPECT_EQ(diagnostics.warnings()[0].key, "curtail");
    EXPECT_EQ(action.line_set_status()[0], 1);
}

TEST(ActionUpdateProfileTests, UnauthorizedKey_Dropped)
{
    ActionState action(gridact_tests::small_grid(), ActionProfile::Topology);
    ActionUpdate update;
    update.redispatch = ValueInput<double>(Assign<double>{0, 1.0});
    update.change_line_status = ToggleInput(ElementRef(0));
    const ActionDiagnostics diagnostics = action.update(update);
    ASSERT_EQ(diagnostics.warnings().size(), 1u);
    EXPECT_EQ(diagnostics.warnings()[0].category, DiagnosticCategory::DroppedModification);
    EXPECT_EQ(diagnostics.warnings()[0].key, "redispatch");
    EXPECT_EQ(diagnostics.warnings()[0].attribute, ActionAttribute::Redispatch);
    EXPECT_EQ(action.redispatch(), std::vector<double>({0.0, 0.0}));
    EXPECT_TRUE(action.line_change_status()[0]);
}

TEST(ActionUpdateShuntTests, ShuntUpdate_AppliesEachField)
{
    ActionState action(gridact_tests::small_grid());
    ShuntUpdate shunt;
    shunt.shunt_p = ValueInput<double>(Dense<double>{{3.0}});
    shunt.shunt_bus = ValueInput<int>(Assign<int>{0, -1});
    ActionUpdate update;
    update.shunt = shunt;
    action.update(update);
    EXPECT_DOUBLE_EQ(action.shunt_p()[0], 3.0);
    EXPECT_TRUE(std::isnan(action.shunt_q()[0]));
    EXPECT_EQ(action.shunt_bus()[0], -1);
}

// =============================================================================
// YAML documents
// =============================================================================

TEST_F(ActionUpdateTests, Yaml_MixedKeys)
{
    const std::string text = R"(
set_line_status: [[1, -1]]
change_line_status: [3, "0_1_0"]
set_bus:
  loads_id: {load_1_0: 2}
  generators_id: [[5, 1]]
injection:
  load_p: [1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11]
)";
    const ActionDiagnostics diagnostics = update_from_yaml(action, text);
    EXPECT_FALSE(diagnostics.has_warnings());
    EXPECT_EQ(action.line_set_status()[1], -1);
    EXPECT_TRUE(action.line_change_status()[3]);
    EXPECT_TRUE(action.line_change_status()[0]);
    EXPECT_EQ(action.set_bus()[3], 2);
    EXPECT_EQ(action.set_bus()[0], 1);
    EXPECT_DOUBLE_EQ(action.injection().at(InjectionKey::LoadP)[10], 11.0);
}

TEST_F(ActionUpdateTests, Yaml_BooleanMaskToggle)
{
    const std::string text = "change_line_status: [false, true, false, false, false, false, false, false, false, "
                             "false, false, false, false, false, false, false, false, false, false, true]\n";
    update_from_yaml(action, text);
    EXPECT_TRUE(action.line_change_status()[1]);
    EXPECT_TRUE(action.line_change_status()[19]);
    EXPECT_FALSE(action.line_change_status()[0]);
}

TEST_F(ActionUpdateTests, Yaml_UnknownKeysWarned)
{
    const ActionDiagnostics diagnostics =
        update_from_yaml(action, "curtail: [1]\nset_bus:\n  loads_id: [[0, 1]]\n  buses: [1]\n");
    ASSERT_EQ(diagnostics.warnings().size(), 2u);
    EXPECT_EQ(diagnostics.warnings()[0].key, "curtail");
    EXPECT_EQ(diagnostics.warnings()[1].key, "set_bus.buses");
    EXPECT_EQ(action.set_bus()[3], 1);
}

TEST_F(ActionUpdateTests, Yaml_NullValueSkipped)
{
    update_from_yaml(action, "set_bus: ~\nhazards: 4\n");
    EXPECT_TRUE(action.hazards()[4]);
    EXPECT_FALSE(action.modified().set_bus);
}

TEST_F(ActionUpdateTests, Yaml_FloatIdRejected)
{
    try
    {
        update_from_yaml(action, "change_line_status: [1.5]\n");
        FAIL() << "Expected an IllegalAction";
    }
    catch (const IllegalAction& e)
    {
        EXPECT_EQ(e.code(), IllegalActionCode::WrongInputShape);
    }
}

TEST_F(ActionUpdateTests, Yaml_Malformed_Throws)
{
    try
    {
        update_from_yaml(action, "set_line_status: [1, 2\n");
        FAIL() << "Expected an AmbiguousAction";
    }
    catch (const AmbiguousAction& e)
    {
        EXPECT_EQ(e.code(), AmbiguityCode::MalformedUpdate);
    }
    EXPECT_THROW(update_from_yaml(action, "- 1\n- 2\n"), AmbiguousAction);
    EXPECT_TRUE(action.is_do_nothing());
}

TEST(ActionUpdateShuntTests, Yaml_ShuntAlias)
{
    ActionState action(gridact_tests::small_grid());
    update_from_yaml(action, "shunt:\n  shunt_q: [-4.5]\n  set_bus: [[0, 2]]\n");
    EXPECT_DOUBLE_EQ(action.shunt_q()[0], -4.5);
    EXPECT_EQ(action.shunt_bus()[0], 2);
}
