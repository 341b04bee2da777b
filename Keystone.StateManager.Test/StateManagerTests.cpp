#include "StandardIncludes.h"

namespace Keystone::StateManager
{

namespace
{
std::shared_ptr<const Model> MakeShopModel()
{
    ModelBuilder modelBuilder;

    auto& order = modelBuilder.Entity("Order");
    order.Property<std::int32_t>("Id");
    order.Property<std::string>("Name");
    order.Property<std::optional<double>>("Total");
    order.HasKey({ "Id" });

    auto& customer = modelBuilder.Entity("Customer");
    customer.Property<std::string>("Email");
    customer.HasKey({ "Email" });

    modelBuilder.Entity("AuditRecord").Property<NonComparableKey>("Payload");

    return modelBuilder.FinalizeModel();
}

const Property& GetProperty(
    const StateManager& stateManager,
    std::string_view entityTypeName,
    std::string_view propertyName)
{
    return *stateManager.GetModel().FindEntityType(entityTypeName)->FindProperty(propertyName);
}
}

TEST(StateManagerTests, StartTracking_adds_entries_in_order)
{
    StateManager stateManager(MakeShopModel());

    auto& order = stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first"), Value(std::optional<double>()) });
    auto& customer = stateManager.StartTracking("Customer", { Value("a@example.com") }, EntityState::Added);

    EXPECT_EQ(EntityState::Unchanged, order.GetEntityState());
    EXPECT_EQ(EntityState::Added, customer.GetEntityState());
    EXPECT_EQ((std::vector<InternalEntityEntry*> { &order, &customer }), stateManager.Entries());
    EXPECT_EQ("first", order.GetCurrentValue<std::string>(GetProperty(stateManager, "Order", "Name")));
    EXPECT_TRUE(order.GetCurrentValue(GetProperty(stateManager, "Order", "Total")).IsNull());
}

TEST(StateManagerTests, StartTracking_rejects_Detached_state)
{
    StateManager stateManager(MakeShopModel());

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::InvalidEntityState),
        GetStateManagerErrorCode([&] { stateManager.StartTracking("Customer", { Value("a@example.com") }, EntityState::Detached); }));
    EXPECT_TRUE(stateManager.Entries().empty());
}

TEST(StateManagerTests, StartTracking_rejects_unknown_entity_types)
{
    StateManager stateManager(MakeShopModel());
    auto otherModel = MakeShopModel();

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::EntityTypeNotFound),
        GetStateManagerErrorCode([&] { stateManager.StartTracking("Invoice", {}); }));
    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::EntityTypeNotFound),
        GetStateManagerErrorCode([&] { stateManager.StartTracking(*otherModel->FindEntityType("Customer"), { Value("a@example.com") }); }));
}

TEST(StateManagerTests, StartTracking_rejects_values_that_do_not_match_properties)
{
    StateManager stateManager(MakeShopModel());
    auto mismatch = make_error_code(StateManagerErrorCode::ValueTypeMismatch);

    EXPECT_EQ(
        mismatch,
        GetStateManagerErrorCode([&] { stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first") }); }));
    EXPECT_EQ(
        mismatch,
        GetStateManagerErrorCode([&] { stateManager.StartTracking("Order", { Value(std::int64_t(1)), Value("first"), Value() }); }));
    EXPECT_EQ(
        mismatch,
        GetStateManagerErrorCode([&] { stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value(), Value() }); }));
    EXPECT_TRUE(stateManager.Entries().empty());
}

TEST(StateManagerTests, StartTracking_accepts_unwrapped_values_for_nullable_properties)
{
    StateManager stateManager(MakeShopModel());

    auto& order = stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first"), Value(12.5) });

    EXPECT_EQ(12.5, order.GetCurrentValue<double>(GetProperty(stateManager, "Order", "Total")));
}

TEST(StateManagerTests, Entries_are_filtered_by_state)
{
    StateManager stateManager(MakeShopModel());
    auto& unchanged = stateManager.StartTracking("Customer", { Value("unchanged@example.com") });
    auto& added = stateManager.StartTracking("Customer", { Value("added@example.com") }, EntityState::Added);
    auto& modified = stateManager.StartTracking("Customer", { Value("modified@example.com") }, EntityState::Modified);
    auto& deleted = stateManager.StartTracking("Customer", { Value("deleted@example.com") }, EntityState::Deleted);
    auto& detached = stateManager.StartTracking("Customer", { Value("detached@example.com") });
    detached.SetEntityState(EntityState::Detached);

    EXPECT_EQ(0u, stateManager.GetCountForState());
    EXPECT_EQ(1u, stateManager.GetCountForState(true));
    EXPECT_EQ(2u, stateManager.GetCountForState(true, true));
    EXPECT_EQ(4u, stateManager.GetCountForState(true, true, true, true));

    EXPECT_EQ(
        (std::vector<InternalEntityEntry*> { &unchanged, &deleted }),
        stateManager.ToListForState(false, false, true, true));
    EXPECT_EQ(
        (std::vector<InternalEntityEntry*> { &unchanged, &added, &modified, &deleted }),
        stateManager.ToList());
    EXPECT_EQ(5u, stateManager.Entries().size());

    std::vector<InternalEntityEntry*> modifiedEntries;
    for (auto entry : stateManager.GetEntriesForState(false, true))
    {
        modifiedEntries.push_back(entry);
    }
    EXPECT_EQ((std::vector<InternalEntityEntry*> { &modified }), modifiedEntries);
}

TEST(StateManagerTests, StopTracking_detaches_the_entry)
{
    StateManager stateManager(MakeShopModel());
    auto& first = stateManager.StartTracking("Customer", { Value("first@example.com") });
    auto& second = stateManager.StartTracking("Customer", { Value("second@example.com") });

    auto detached = stateManager.StopTracking(first);

    ASSERT_NE(nullptr, detached);
    EXPECT_EQ(EntityState::Detached, detached->GetEntityState());
    EXPECT_EQ((std::vector<InternalEntityEntry*> { &second }), stateManager.Entries());
    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::InvalidEntityState),
        GetStateManagerErrorCode([&] { stateManager.StopTracking(*detached); }));
}

TEST(StateManagerTests, SetCurrentValue_marks_Unchanged_entries_Modified)
{
    StateManager stateManager(MakeShopModel());
    const auto& name = GetProperty(stateManager, "Order", "Name");
    auto& order = stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first"), Value() });

    order.SetCurrentValue(name, Value("first"));
    EXPECT_EQ(EntityState::Unchanged, order.GetEntityState());
    EXPECT_FALSE(order.IsModified(name));

    order.SetCurrentValue(name, Value("second"));
    EXPECT_EQ(EntityState::Modified, order.GetEntityState());
    EXPECT_TRUE(order.IsModified(name));
    EXPECT_EQ("first", order.GetOriginalValue(name).Get<std::string>());
    EXPECT_EQ("second", order.GetCurrentValue<std::string>(name));

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::ValueTypeMismatch),
        GetStateManagerErrorCode([&] { order.SetCurrentValue(name, Value(std::int32_t(2))); }));
    EXPECT_EQ("second", order.GetCurrentValue<std::string>(name));
}

TEST(StateManagerTests, SetCurrentValue_keeps_Added_entries_Added)
{
    StateManager stateManager(MakeShopModel());
    const auto& name = GetProperty(stateManager, "Order", "Name");
    auto& order = stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first"), Value() }, EntityState::Added);

    order.SetCurrentValue(name, Value("second"));

    EXPECT_EQ(EntityState::Added, order.GetEntityState());
    EXPECT_TRUE(order.IsModified(name));
}

TEST(StateManagerTests, Assigning_uncomparable_values_marks_the_property_modified)
{
    StateManager stateManager(MakeShopModel());
    const auto& payload = GetProperty(stateManager, "AuditRecord", "Payload");
    auto& record = stateManager.StartTracking("AuditRecord", { Value(NonComparableKey{ 1 }) });

    record.SetCurrentValue(payload, Value(NonComparableKey{ 1 }));

    EXPECT_TRUE(record.IsModified(payload));
    EXPECT_EQ(EntityState::Modified, record.GetEntityState());
}

TEST(StateManagerTests, AcceptChanges_moves_entries_to_their_final_state)
{
    StateManager stateManager(MakeShopModel());
    const auto& name = GetProperty(stateManager, "Order", "Name");
    auto& order = stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first"), Value() });
    auto& added = stateManager.StartTracking("Customer", { Value("added@example.com") }, EntityState::Added);
    auto& deleted = stateManager.StartTracking("Customer", { Value("deleted@example.com") }, EntityState::Deleted);

    order.SetCurrentValue(name, Value("second"));

    order.AcceptChanges();
    added.AcceptChanges();
    deleted.AcceptChanges();

    EXPECT_EQ(EntityState::Unchanged, order.GetEntityState());
    EXPECT_FALSE(order.IsModified(name));
    EXPECT_EQ("second", order.GetOriginalValue(name).Get<std::string>());
    EXPECT_EQ(EntityState::Unchanged, added.GetEntityState());
    EXPECT_EQ(EntityState::Detached, deleted.GetEntityState());
}

TEST(StateManagerTests, Short_debug_string_lists_entries_in_debug_order)
{
    StateManager stateManager(MakeShopModel());
    stateManager.StartTracking("Order", { Value(std::int32_t(2)), Value("second"), Value() });
    stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first"), Value() }, EntityState::Added);
    stateManager.StartTracking("Customer", { Value("a@example.com") }, EntityState::Deleted);
    stateManager.StartTracking("AuditRecord", { Value(NonComparableKey{ 1 }) });

    EXPECT_EQ(
        "AuditRecord (keyless) Unchanged\n"
        "Customer {Email: 'a@example.com'} Deleted\n"
        "Order {Id: 1} Added\n"
        "Order {Id: 2} Unchanged\n",
        stateManager.ToDebugString());
}

TEST(StateManagerTests, Long_debug_string_includes_properties)
{
    StateManager stateManager(MakeShopModel());
    const auto& name = GetProperty(stateManager, "Order", "Name");
    auto& order = stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first"), Value(12.5) });
    order.SetCurrentValue(name, Value("second"));

    EXPECT_EQ(
        "Order {Id: 1} Modified\n"
        "  Id: 1 PK\n"
        "  Name: 'second' Modified Originally 'first'\n"
        "  Total: 12.5\n",
        stateManager.ToDebugString(StateManagerDebugStringOptions::LongDefault));
}

TEST(StateManagerTests, Long_debug_string_omits_original_values_of_Added_entries)
{
    StateManager stateManager(MakeShopModel());
    const auto& name = GetProperty(stateManager, "Order", "Name");
    auto& order = stateManager.StartTracking("Order", { Value(std::int32_t(1)), Value("first"), Value() }, EntityState::Added);
    order.SetCurrentValue(name, Value("second"));

    EXPECT_EQ(
        "Order {Id: 1} Added\n"
        "  Id: 1 PK\n"
        "  Name: 'second'\n"
        "  Total: <null>",
        order.ToDebugString());
}

TEST(StateManagerTests, Debug_string_of_an_empty_state_manager_is_empty)
{
    StateManager stateManager(MakeShopModel());

    EXPECT_EQ("", stateManager.ToDebugString());
}

TEST(StateManagerTests, GetCurrentValueComparer_uses_the_model_cache)
{
    StateManager stateManager(MakeShopModel());
    const auto& id = GetProperty(stateManager, "Order", "Id");

    const auto& comparer = stateManager.GetCurrentValueComparer(id);

    EXPECT_EQ(&comparer, &stateManager.GetModel().GetCurrentValueComparer(id));
    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::TypeNotComparable),
        GetStateManagerErrorCode([&] { stateManager.GetCurrentValueComparer(GetProperty(stateManager, "AuditRecord", "Payload")); }));
}

}
