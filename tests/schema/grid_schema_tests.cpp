#include <gtest/gtest.h>
#include "gridact/schema/grid_schema.hpp"
#include "test_grids.hpp"

using namespace gridact;
using gridact_tests::case14;
using gridact_tests::case14_description;
using gridact_tests::small_description;
using gridact_tests::small_grid;

namespace
{

template <typename Fn>
SchemaErrorCode schema_error_of(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const SchemaError& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "Expected a SchemaError";
    return SchemaErrorCode::OutOfRange;
}

} // namespace

// =============================================================================
// Counts and layout
// =============================================================================

class GridSchemaTests : public ::testing::Test
{
protected:
    GridSchemaPtr schema = case14();
};

TEST_F(GridSchemaTests, Counts_MatchDescription)
{
    EXPECT_EQ(schema->n_sub(), 14u);
    EXPECT_EQ(schema->n_line(), 20u);
    EXPECT_EQ(schema->n_load(), 11u);
    EXPECT_EQ(schema->n_gen(), 6u);
    EXPECT_EQ(schema->n_storage(), 0u);
    EXPECT_EQ(schema->n_shunt(), 0u);
    EXPECT_EQ(schema->dim_topo(), 57u);
}

TEST_F(GridSchemaTests, SubInfo_DerivedFromMembership)
{
    const std::vector<size_t> expected = {3, 6, 4, 6, 5, 6, 3, 3, 5, 3, 3, 3, 4, 3};
    EXPECT_EQ(schema->sub_info(), expected);
    EXPECT_EQ(schema->sub_start(0), 0u);
    EXPECT_EQ(schema->sub_start(1), 3u);
    EXPECT_EQ(schema->sub_start(13), 54u);
}

TEST_F(GridSchemaTests, DefaultPositions_FollowKindOrder)
{
    // Substation 0 holds generator 5 first, then the origins of lines 0 and 1
    EXPECT_EQ(schema->pos_topo_vect(ElementKind::Generator)[5], 0u);
    EXPECT_EQ(schema->pos_topo_vect(ElementKind::LineOr)[0], 1u);
    EXPECT_EQ(schema->pos_topo_vect(ElementKind::LineOr)[1], 2u);
    // Substation 1: load 0, generator 0, origins of lines 2..4, extremity of line 0
    EXPECT_EQ(schema->pos_topo_vect(ElementKind::Load)[0], 3u);
    EXPECT_EQ(schema->pos_topo_vect(ElementKind::Generator)[0], 4u);
    EXPECT_EQ(schema->pos_topo_vect(ElementKind::LineEx)[0], 8u);
}

TEST_F(GridSchemaTests, Resolve_ReturnsSubstationAndSlot)
{
    const auto [sub, pos] = schema->resolve(ElementKind::LineEx, 1);
    EXPECT_EQ(sub, 4u);
    EXPECT_EQ(pos, 21u);
}

TEST_F(GridSchemaTests, Resolve_OutOfRange_Throws)
{
    EXPECT_EQ(schema_error_of([&] { schema->resolve(ElementKind::Load, 11); }), SchemaErrorCode::OutOfRange);
    EXPECT_EQ(schema_error_of([&] { schema->sub_start(14); }), SchemaErrorCode::OutOfRange);
    EXPECT_EQ(schema_error_of([&] { schema->element_at(57); }), SchemaErrorCode::OutOfRange);
}

TEST_F(GridSchemaTests, ResolveAndSubstations_FormBijection)
{
    std::vector<int> hits(schema->dim_topo(), 0);
    for (SubIdx sub = 0; sub < schema->n_sub(); ++sub)
    {
        const auto rows = schema->elements_of_substation(sub);
        ASSERT_EQ(rows.size(), schema->sub_info()[sub]);
        for (size_t local = 0; local < rows.size(); ++local)
        {
            const TopoIdx pos = schema->sub_start(sub) + local;
            ++hits[pos];
            const auto [kind, id] = schema->element_at(pos);
            EXPECT_EQ(schema->resolve(kind, id).second, pos);
            EXPECT_EQ(schema->resolve(kind, id).first, sub);
        }
    }
    for (TopoIdx pos = 0; pos < hits.size(); ++pos)
    {
        EXPECT_EQ(hits[pos], 1) << "position " << pos;
    }
}

TEST_F(GridSchemaTests, GridObjectsTypes_OneRowPerSlot)
{
    const auto rows = schema->grid_objects_types();
    ASSERT_EQ(rows.size(), schema->dim_topo());
    const ObjectTypeRow first = {0, -1, 5, -1, -1, -1};
    EXPECT_EQ(rows[0], first);
    const ObjectTypeRow line_ex_0 = {1, -1, -1, -1, 0, -1};
    EXPECT_EQ(rows[8], line_ex_0);
}

TEST_F(GridSchemaTests, TopoVectToSub_MatchesSubStart)
{
    const auto& to_sub = schema->topo_vect_to_sub();
    ASSERT_EQ(to_sub.size(), schema->dim_topo());
    EXPECT_EQ(to_sub[2], 0u);
    EXPECT_EQ(to_sub[3], 1u);
    EXPECT_EQ(to_sub[56], 13u);
}

// =============================================================================
// Substation lookups
// =============================================================================

TEST_F(GridSchemaTests, GetObjConnectTo_ListsEveryKind)
{
    const SubstationObjects objects = schema->get_obj_connect_to(1);
    EXPECT_EQ(objects.nb_elements, 6u);
    EXPECT_EQ(objects.loads_id, std::vector<LoadIdx>({0}));
    EXPECT_EQ(objects.generators_id, std::vector<GenIdx>({0}));
    EXPECT_EQ(objects.lines_or_id, std::vector<LineIdx>({2, 3, 4}));
    EXPECT_EQ(objects.lines_ex_id, std::vector<LineIdx>({0}));
    EXPECT_TRUE(objects.storages_id.empty());
}

TEST_F(GridSchemaTests, GetLinesId_FindsDirectedLines)
{
    EXPECT_EQ(schema->get_lines_id(0, 4), std::vector<LineIdx>({1}));
    EXPECT_EQ(schema_error_of([&] { schema->get_lines_id(4, 0); }), SchemaErrorCode::NotFound);
}

TEST_F(GridSchemaTests, GetGeneratorsId_NotFound_Throws)
{
    EXPECT_EQ(schema->get_generators_id(7), std::vector<GenIdx>({3, 4}));
    EXPECT_EQ(schema_error_of([&] { schema->get_generators_id(3); }), SchemaErrorCode::NotFound);
    EXPECT_EQ(schema_error_of([&] { schema->get_loads_id(0); }), SchemaErrorCode::NotFound);
    EXPECT_EQ(schema_error_of([&] { schema->get_storages_id(0); }), SchemaErrorCode::NotFound);
}

// =============================================================================
// Names
// =============================================================================

TEST_F(GridSchemaTests, DefaultNames_FollowConvention)
{
    EXPECT_EQ(schema->names(ObjectKind::Load)[0], "load_1_0");
    EXPECT_EQ(schema->names(ObjectKind::Generator)[5], "gen_0_5");
    EXPECT_EQ(schema->names(ObjectKind::Line)[1], "0_4_1");
    EXPECT_EQ(schema->names(ObjectKind::Substation)[13], "sub_13");
}

TEST_F(GridSchemaTests, FindByName_ResolvesIds)
{
    EXPECT_EQ(schema->find_by_name(ObjectKind::Line, "0_4_1"), std::optional<size_t>(1));
    EXPECT_EQ(schema->find_by_name(ObjectKind::Line, "no_such_line"), std::nullopt);
}

TEST_F(GridSchemaTests, NameIndex_CoversEveryName)
{
    for (ObjectKind kind : {ObjectKind::Load, ObjectKind::Generator, ObjectKind::Line, ObjectKind::Substation})
    {
        const auto& names = schema->names(kind);
        const NameIndex& index = schema->name_index(kind);
        ASSERT_EQ(index.size(), names.size()) << to_string(kind);
        for (size_t i = 0; i < names.size(); ++i)
        {
            EXPECT_EQ(index.at(names[i]), i) << names[i];
        }
    }
    EXPECT_TRUE(schema->name_index(ObjectKind::Storage).empty());
}

TEST(GridSchemaNameTests, DuplicateName_Throws)
{
    GridDescription d = case14_description();
    d.name_sub = std::vector<std::string>(14, "same");
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::InvalidName);
}

// =============================================================================
// Validation
// =============================================================================

TEST(GridSchemaValidationTests, NoLoad_Throws)
{
    GridDescription d = case14_description();
    d.load_to_subid.clear();
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::IncorrectNumberOfLoads);
}

TEST(GridSchemaValidationTests, SubstationIdOutOfRange_Throws)
{
    GridDescription d = case14_description();
    d.gen_to_subid[0] = 14;
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::IncorrectNumberOfGenerators);
}

TEST(GridSchemaValidationTests, SubInfoMismatch_Throws)
{
    GridDescription d = case14_description();
    d.sub_info = {3, 6, 4, 6, 5, 6, 3, 3, 5, 3, 3, 3, 4, 4};
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::IncorrectNumberOfElements);
}

TEST(GridSchemaValidationTests, EmptySubstation_Throws)
{
    GridDescription d = case14_description();
    d.n_sub = 15;
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::EmptySubstation);
}

TEST(GridSchemaValidationTests, PartialPositions_Throws)
{
    GridDescription d = small_description();
    d.load_to_sub_pos = {0, 0};
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::IncorrectPositionOfGenerators);
}

TEST(GridSchemaValidationTests, DuplicatePositions_Throws)
{
    GridDescription d = small_description();
    d.load_to_sub_pos = {0, 0};
    d.gen_to_sub_pos = {0, 0};
    d.line_or_to_sub_pos = {2, 1, 3};
    d.line_ex_to_sub_pos = {2, 1, 2};
    d.storage_to_sub_pos = {3, 3};
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::InvalidTopologyPositions);
}

TEST(GridSchemaValidationTests, LocalPositionTooLarge_Throws)
{
    GridDescription d = small_description();
    d.load_to_sub_pos = {0, 4};
    d.gen_to_sub_pos = {1, 0};
    d.line_or_to_sub_pos = {2, 1, 3};
    d.line_ex_to_sub_pos = {2, 1, 2};
    d.storage_to_sub_pos = {3, 3};
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::IncorrectPositionOfLoads);
}

TEST(GridSchemaValidationTests, ExplicitPositions_AreHonored)
{
    GridDescription d = small_description();
    d.load_to_sub_pos = {3, 0};
    d.gen_to_sub_pos = {2, 0};
    d.line_or_to_sub_pos = {1, 1, 0};
    d.line_ex_to_sub_pos = {2, 1, 2};
    d.storage_to_sub_pos = {3, 3};
    GridSchema schema(d);
    EXPECT_EQ(schema.pos_topo_vect(ElementKind::Load)[0], 3u);
    EXPECT_EQ(schema.pos_topo_vect(ElementKind::LineOr)[2], 0u);
    EXPECT_EQ(schema.pos_topo_vect(ElementKind::Storage)[1], 11u);
}

TEST(GridSchemaValidationTests, MissingStorageData_Throws)
{
    GridDescription d = small_description();
    d.storage.reset();
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::InvalidStorageData);
}

TEST(GridSchemaValidationTests, StorageLossAboveAbsorb_Throws)
{
    GridDescription d = small_description();
    d.storage->storage_loss[1] = 11.0;
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::InvalidStorageData);
}

TEST(GridSchemaValidationTests, DispatchPminAbovePmax_Throws)
{
    GridDescription d = small_description();
    d.dispatch->gen_pmin[0] = 200.0;
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::InvalidDispatchData);
}

TEST(GridSchemaValidationTests, DispatchWrongLength_Throws)
{
    GridDescription d = small_description();
    d.dispatch->gen_max_ramp_up.pop_back();
    EXPECT_EQ(schema_error_of([&] { GridSchema schema(d); }), SchemaErrorCode::InvalidDispatchData);
}

// =============================================================================
// Static data and capabilities
// =============================================================================

TEST(GridSchemaStaticDataTests, SmallGrid_ExposesStaticData)
{
    auto schema = small_grid();
    EXPECT_TRUE(schema->redispatching_available());
    ASSERT_NE(schema->storage(), nullptr);
    EXPECT_DOUBLE_EQ(schema->storage()->storage_max_p_absorb[0], 10.0);
    EXPECT_TRUE(schema->shunts_available());
    EXPECT_EQ(schema->n_shunt(), 1u);
    EXPECT_EQ(schema->names(ObjectKind::Shunt)[0], "shunt_2_0");
    EXPECT_FALSE(case14()->redispatching_available());
}

TEST(GridSchemaStaticDataTests, SameGrid_ComparesStructure)
{
    auto a = case14();
    auto b = case14();
    EXPECT_TRUE(a->same_grid(*b));
    EXPECT_FALSE(a->same_grid(*small_grid()));
}

TEST(GridSchemaStaticDataTests, Description_RebuildsSameGrid)
{
    auto a = small_grid();
    GridSchema b(a->description());
    EXPECT_TRUE(a->same_grid(b));
}

TEST(ActionCapabilitiesTests, Complete_CarriesShuntsOnlyWithShunts)
{
    auto with = small_grid()->capabilities(ActionProfile::Complete);
    auto without = case14()->capabilities(ActionProfile::Complete);
    EXPECT_TRUE(with->supports(ActionAttribute::ShuntQ));
    EXPECT_FALSE(without->supports(ActionAttribute::ShuntQ));
    EXPECT_TRUE(with->authorizes("shunt"));
    EXPECT_FALSE(without->authorizes("shunt"));
}

TEST(ActionCapabilitiesTests, Topology_LayoutAndSize)
{
    auto schema = case14();
    auto caps = schema->capabilities(ActionProfile::Topology);
    ASSERT_EQ(caps->layout().size(), 4u);
    EXPECT_EQ(caps->layout()[0].attribute, ActionAttribute::SetLineStatus);
    EXPECT_EQ(caps->layout()[0].offset, 0u);
    EXPECT_EQ(caps->layout()[2].attribute, ActionAttribute::SetBus);
    EXPECT_EQ(caps->layout()[2].offset, 40u);
    EXPECT_EQ(caps->vector_size(), 20u + 20u + 57u + 57u);
    EXPECT_FALSE(caps->supports(ActionAttribute::Redispatch));
    EXPECT_FALSE(caps->authorizes("redispatch"));
    EXPECT_TRUE(caps->authorizes("set_bus"));
}

TEST(ActionCapabilitiesTests, DoNothing_IsEmpty)
{
    auto caps = case14()->capabilities(ActionProfile::DoNothing);
    EXPECT_TRUE(caps->attributes().empty());
    EXPECT_EQ(caps->vector_size(), 0u);
    EXPECT_TRUE(caps->authorized_keys().empty());
}

TEST(ActionCapabilitiesTests, UpdateKeys_MapToAttributes)
{
    EXPECT_EQ(ActionCapabilities::attribute_of_update_key("set_storage"),
              std::optional<ActionAttribute>(ActionAttribute::StoragePower));
    EXPECT_EQ(ActionCapabilities::attribute_of_update_key("bogus"), std::nullopt);
    EXPECT_EQ(ActionCapabilities::known_update_keys().size(), 10u);
}
