#include <gtest/gtest.h>
#include "gridact/action/action_report.hpp"
#include "gridact/action/action_state.hpp"
#include "test_grids.hpp"

using namespace gridact;

class ActionReportTests : public ::testing::Test
{
protected:
    GridSchemaPtr schema = gridact_tests::case14();
    ActionState action{schema};
};

// =============================================================================
// impact_on_objects
// =============================================================================

TEST_F(ActionReportTests, Impact_DoNothing)
{
    const ObjectImpact impact = impact_on_objects(action);
    EXPECT_FALSE(impact.has_impact);
    EXPECT_FALSE(impact.injection.changed);
    EXPECT_FALSE(impact.topology.changed);
}

TEST_F(ActionReportTests, Impact_LinesAndTopology)
{
    action.set_line_status(AssignList<int>{Assign<int>{1, -1}, Assign<int>{4, 1}});
    action.change_line_status(ElementRef(9));
    action.set_element_bus(ElementKind::Load, Assign<int>{0, 2});
    action.change_element_bus(ElementKind::Generator, ElementRef(5));

    const ObjectImpact impact = impact_on_objects(action);
    EXPECT_TRUE(impact.has_impact);
    EXPECT_EQ(impact.force_line.disconnections, std::vector<LineIdx>({1}));
    EXPECT_EQ(impact.force_line.reconnections, std::vector<LineIdx>({4}));
    EXPECT_EQ(impact.switch_line.powerlines, std::vector<LineIdx>({9}));

    ASSERT_EQ(impact.topology.assigned_bus.size(), 1u);
    EXPECT_EQ(impact.topology.assigned_bus[0].kind, ElementKind::Load);
    EXPECT_EQ(impact.topology.assigned_bus[0].id, 0u);
    EXPECT_EQ(impact.topology.assigned_bus[0].substation, 1u);
    EXPECT_EQ(impact.topology.assigned_bus[0].bus, 2);

    ASSERT_EQ(impact.topology.bus_switch.size(), 1u);
    EXPECT_EQ(impact.topology.bus_switch[0].kind, ElementKind::Generator);
    EXPECT_EQ(impact.topology.bus_switch[0].substation, 0u);
}

TEST(ActionReportDispatchTests, Impact_RedispatchAndStorage)
{
    ActionState action(gridact_tests::small_grid());
    action.set_redispatch(Assign<double>{0, -2.0});
    action.set_storage_power(Assign<double>{1, 1.5});
    const ObjectImpact impact = impact_on_objects(action);
    ASSERT_EQ(impact.redispatch.generators.size(), 1u);
    EXPECT_EQ(impact.redispatch.generators[0].first, 0u);
    EXPECT_DOUBLE_EQ(impact.redispatch.generators[0].second, -2.0);
    EXPECT_TRUE(impact.storage.changed);
    EXPECT_EQ(impact.storage.setpoints.size(), 2u);
}

// =============================================================================
// as_dict
// =============================================================================

TEST_F(ActionReportTests, AsDict_DoNothingIsEmpty)
{
    const YAML::Node dict = as_dict(action);
    EXPECT_TRUE(dict.IsMap());
    EXPECT_EQ(dict.size(), 0u);
}

TEST_F(ActionReportTests, AsDict_Keys)
{
    action.set_injection(InjectionKey::LoadP, std::vector<double>(11, 1.0));
    action.set_line_status(Assign<int>{1, -1});
    action.change_line_status(IdList{2, 3});
    action.set_element_bus(ElementKind::Load, Assign<int>{0, 2});
    action.set_hazards(ElementRef(7));

    const YAML::Node dict = as_dict(action);
    ASSERT_TRUE(dict["load_p"]);
    EXPECT_EQ(dict["load_p"].size(), 11u);

    // Line 7 is disconnected by the hazard as well.
    EXPECT_EQ(dict["set_line_status"]["nb_disconnected"].as<size_t>(), 2u);
    EXPECT_EQ(dict["set_line_status"]["nb_connected"].as<size_t>(), 0u);
    EXPECT_EQ(dict["change_line_status"]["nb_changed"].as<size_t>(), 2u);
    EXPECT_EQ(dict["change_line_status"]["changed_id"][1].as<size_t>(), 3u);

    const YAML::Node set_bus = dict["set_bus_vect"];
    ASSERT_TRUE(set_bus);
    EXPECT_EQ(set_bus["nb_modif_objects"].as<size_t>(), 1u);
    EXPECT_EQ(set_bus["modif_subs_id"][0].as<size_t>(), 1u);
    EXPECT_EQ(set_bus["1"]["load"]["0"]["new_bus"].as<int>(), 2);

    EXPECT_EQ(dict["nb_hazards"].as<size_t>(), 1u);
    EXPECT_FALSE(dict["change_bus_vect"]);
    EXPECT_FALSE(dict["redispatch"]);
}

TEST_F(ActionReportTests, AsDict_LoadAndGeneratorWithSameId)
{
    // Load 0 and generator 0 both sit on substation 1.
    action.set_element_bus(ElementKind::Load, Assign<int>{0, 2});
    action.set_element_bus(ElementKind::Generator, Assign<int>{0, 1});
    action.change_element_bus(ElementKind::Load, ElementRef(0));
    action.change_element_bus(ElementKind::Generator, ElementRef(0));

    const YAML::Node dict = as_dict(action);
    const YAML::Node set_bus = dict["set_bus_vect"];
    ASSERT_TRUE(set_bus);
    EXPECT_EQ(set_bus["nb_modif_objects"].as<size_t>(), 2u);
    EXPECT_EQ(set_bus["nb_modif_subs"].as<size_t>(), 1u);
    EXPECT_EQ(set_bus["1"]["load"]["0"]["new_bus"].as<int>(), 2);
    EXPECT_EQ(set_bus["1"]["generator"]["0"]["new_bus"].as<int>(), 1);
    EXPECT_EQ(set_bus["1"].size(), 2u);

    const YAML::Node change_bus = dict["change_bus_vect"];
    ASSERT_TRUE(change_bus);
    EXPECT_EQ(change_bus["nb_modif_objects"].as<size_t>(), 2u);
    EXPECT_EQ(change_bus["1"]["load"]["0"]["type"].as<std::string>(), "load");
    EXPECT_EQ(change_bus["1"]["generator"]["0"]["type"].as<std::string>(), "generator");
}

// =============================================================================
// to_string
// =============================================================================

TEST_F(ActionReportTests, ToString_DoNothing)
{
    const std::string text = to_string(action);
    EXPECT_EQ(text.rfind("This action will:", 0), 0u);
    EXPECT_NE(text.find("NOT change anything to the injections"), std::string::npos);
    EXPECT_NE(text.find("NOT force any line status"), std::string::npos);
    EXPECT_NE(text.find("NOT force any particular bus configuration"), std::string::npos);
}

TEST_F(ActionReportTests, ToString_DescribesModifications)
{
    action.set_line_status(Assign<int>{1, -1});
    action.change_element_bus(ElementKind::Generator, ElementRef(5));
    const std::string text = to_string(action);
    EXPECT_NE(text.find("Force disconnection of 1 powerlines ([1])"), std::string::npos);
    EXPECT_NE(text.find("Switch bus of generator id 5 [on substation 0]"), std::string::npos);
}

TEST(ActionReportDispatchTests, ToString_StorageAndRedispatch)
{
    ActionState action(gridact_tests::small_grid());
    action.set_redispatch(Assign<double>{0, 2.5});
    action.set_storage_power(Assign<double>{0, -1.0});
    const std::string text = to_string(action);
    EXPECT_NE(text.find("Redispatch \"gen_0_0\" of 2.50 MW"), std::string::npos);
    EXPECT_NE(text.find("Ask unit \"storage_1_0\" to produce 1.00 MW (setpoint: -1.00 MW)"), std::string::npos);
}
