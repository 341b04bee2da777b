#include "StandardIncludes.h"

namespace Keystone::StateManager
{

TEST(ModelBuilderTests, Entity_returns_the_same_builder_for_a_name)
{
    ModelBuilder modelBuilder;
    EXPECT_EQ(&modelBuilder.Entity("Order"), &modelBuilder.Entity("Order"));
    EXPECT_NE(&modelBuilder.Entity("Order"), &modelBuilder.Entity("Customer"));
}

TEST(ModelBuilderTests, Properties_keep_declaration_order)
{
    ModelBuilder modelBuilder;
    auto& order = modelBuilder.Entity("Order");
    order.Property<std::string>("Zeta");
    order.Property<std::int32_t>("Alpha");
    order.Property<Bytes>("Mid");
    order.HasKey({ "Mid", "Zeta" });

    auto model = modelBuilder.FinalizeModel();
    auto entityType = model->FindEntityType("Order");

    const auto& properties = entityType->GetProperties();
    ASSERT_EQ(3u, properties.size());
    EXPECT_EQ("Zeta", properties[0]->Name());
    EXPECT_EQ("Alpha", properties[1]->Name());
    EXPECT_EQ("Mid", properties[2]->Name());

    const auto& keyProperties = entityType->FindPrimaryKey()->Properties();
    ASSERT_EQ(2u, keyProperties.size());
    EXPECT_EQ("Mid", keyProperties[0]->Name());
    EXPECT_EQ("Zeta", keyProperties[1]->Name());
}

TEST(ModelBuilderTests, Entity_type_without_key_is_keyless)
{
    ModelBuilder modelBuilder;
    modelBuilder.Entity("Log").Property<std::string>("Message");

    auto model = modelBuilder.FinalizeModel();
    EXPECT_EQ(nullptr, model->FindEntityType("Log")->FindPrimaryKey());
}

TEST(ModelBuilderTests, Nullability_follows_type_unless_required)
{
    ModelBuilder modelBuilder;
    auto& order = modelBuilder.Entity("Order");
    order.Property<std::int32_t>("Id");
    order.Property<std::optional<std::int32_t>>("Quantity");
    order.Property<std::optional<std::string>>("Note").IsRequired();

    auto model = modelBuilder.FinalizeModel();
    auto entityType = model->FindEntityType("Order");
    EXPECT_FALSE(entityType->FindProperty("Id")->IsNullable());
    EXPECT_TRUE(entityType->FindProperty("Quantity")->IsNullable());
    EXPECT_FALSE(entityType->FindProperty("Note")->IsNullable());
}

TEST(ModelBuilderTests, Duplicate_entity_type_name_fails)
{
    ModelBuilder modelBuilder;
    modelBuilder.AddEntity("Order");
    modelBuilder.AddEntity("Order");

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::DuplicateName),
        GetStateManagerErrorCode([&] { modelBuilder.FinalizeModel(); }));
}

TEST(ModelBuilderTests, Duplicate_property_name_fails)
{
    ModelBuilder modelBuilder;
    auto& order = modelBuilder.Entity("Order");
    order.Property<std::int32_t>("Id");
    order.Property<std::string>("Id");

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::DuplicateName),
        GetStateManagerErrorCode([&] { modelBuilder.FinalizeModel(); }));
}

TEST(ModelBuilderTests, Duplicate_key_property_fails)
{
    ModelBuilder modelBuilder;
    auto& order = modelBuilder.Entity("Order");
    order.Property<std::int32_t>("Id");
    order.HasKey({ "Id", "Id" });

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::DuplicateName),
        GetStateManagerErrorCode([&] { modelBuilder.FinalizeModel(); }));
}

TEST(ModelBuilderTests, Unknown_key_property_fails)
{
    ModelBuilder modelBuilder;
    auto& order = modelBuilder.Entity("Order");
    order.Property<std::int32_t>("Id");
    order.HasKey({ "OrderId" });

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::PropertyNotFound),
        GetStateManagerErrorCode([&] { modelBuilder.FinalizeModel(); }));
}

TEST(ModelBuilderTests, Converter_of_other_model_type_fails)
{
    ModelBuilder modelBuilder;
    modelBuilder.Entity("Order")
        .Property<std::int32_t>("Id")
        .HasConversion(MakeNonComparableToInt32Converter());

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::ConverterTypeMismatch),
        GetStateManagerErrorCode([&] { modelBuilder.FinalizeModel(); }));
}

TEST(ModelBuilderTests, Converter_of_unwrapped_type_is_accepted_for_nullable_property)
{
    ModelBuilder modelBuilder;
    modelBuilder.Entity("Order")
        .Property<std::optional<NonComparableKey>>("Key")
        .HasConversion(MakeNonComparableToInt32Converter());

    auto model = modelBuilder.FinalizeModel();
    EXPECT_NE(nullptr, model->FindEntityType("Order")->FindProperty("Key")->GetValueConverter());
}

TEST(ModelBuilderTests, Uncomparable_key_is_accepted_without_validation)
{
    ModelBuilder modelBuilder;
    auto& order = modelBuilder.Entity("Order");
    order.Property<NonComparableKey>("Key");
    order.HasKey({ "Key" });

    EXPECT_NO_THROW(modelBuilder.FinalizeModel());
}

TEST(ModelBuilderTests, Uncomparable_key_fails_with_key_comparer_validation)
{
    ModelBuilder modelBuilder;
    auto& order = modelBuilder.Entity("Order");
    order.Property<NonComparableKey>("Key");
    order.HasKey({ "Key" });

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::TypeNotComparable),
        GetStateManagerErrorCode([&] { modelBuilder.FinalizeModel({ .ValidateKeyComparers = true }); }));
}

TEST(ModelBuilderTests, Key_comparer_validation_caches_key_comparers)
{
    ModelBuilder modelBuilder;
    auto& order = modelBuilder.Entity("Order");
    order.Property<std::int32_t>("Id");
    order.Property<NonComparableKey>("Payload");
    order.HasKey({ "Id" });

    auto model = modelBuilder.FinalizeModel({ .ValidateKeyComparers = true });
    EXPECT_EQ(1u, model->GetCachedComparerCount());
}

}
