#include "StandardIncludes.h"
#include <atomic>
#include <thread>

namespace Keystone::StateManager
{

namespace
{
std::shared_ptr<const Model> MakeCatalogModel()
{
    ModelBuilder modelBuilder;

    auto& product = modelBuilder.Entity("Product");
    product.Property<std::int32_t>("Id");
    product.Property<std::string>("Name");
    product.Property<NonComparableKey>("Code");
    product.HasKey({ "Id" });

    auto& category = modelBuilder.Entity("Category");
    category.Property<std::string>("Name");
    category.HasKey({ "Name" });

    return modelBuilder.FinalizeModel();
}
}

TEST(ModelTests, GetEntityTypes_orders_by_name)
{
    auto model = MakeCatalogModel();
    auto entityTypes = model->GetEntityTypes();

    ASSERT_EQ(2u, entityTypes.size());
    EXPECT_EQ("Category", entityTypes[0]->Name());
    EXPECT_EQ("Product", entityTypes[1]->Name());
}

TEST(ModelTests, FindEntityType_and_FindProperty)
{
    auto model = MakeCatalogModel();

    auto product = model->FindEntityType("Product");
    ASSERT_NE(nullptr, product);
    EXPECT_EQ(model.get(), &product->GetModel());
    EXPECT_EQ(nullptr, model->FindEntityType("product"));

    auto name = product->FindProperty("Name");
    ASSERT_NE(nullptr, name);
    EXPECT_EQ(1u, name->Index());
    EXPECT_EQ(product, &name->DeclaringEntityType());
    EXPECT_EQ(ValueType::Of<std::string>(), name->Type());
    EXPECT_FALSE(name->IsPrimaryKey());
    EXPECT_EQ(nullptr, product->FindProperty("Missing"));

    ASSERT_NE(nullptr, product->FindPrimaryKey());
    ASSERT_EQ(1u, product->FindPrimaryKey()->Properties().size());
    EXPECT_EQ(product->FindProperty("Id"), product->FindPrimaryKey()->Properties()[0]);
    EXPECT_TRUE(product->FindProperty("Id")->IsPrimaryKey());
}

TEST(ModelTests, GetCurrentValueComparer_builds_each_comparer_once)
{
    auto model = MakeCatalogModel();
    auto product = model->FindEntityType("Product");
    const auto& id = *product->FindProperty("Id");
    const auto& name = *product->FindProperty("Name");

    EXPECT_EQ(0u, model->GetCachedComparerCount());

    auto& idComparer = model->GetCurrentValueComparer(id);
    EXPECT_EQ(&idComparer, &model->GetCurrentValueComparer(id));
    EXPECT_EQ(&id, &idComparer.GetProperty());
    EXPECT_EQ(1u, model->GetCachedComparerCount());

    auto& nameComparer = model->GetCurrentValueComparer(name);
    EXPECT_NE(&idComparer, &nameComparer);
    EXPECT_EQ(2u, model->GetCachedComparerCount());
}

TEST(ModelTests, GetCurrentValueComparer_does_not_cache_failures)
{
    auto model = MakeCatalogModel();
    const auto& code = *model->FindEntityType("Product")->FindProperty("Code");

    for (int attempt = 0; attempt < 2; ++attempt)
    {
        EXPECT_EQ(
            make_error_code(StateManagerErrorCode::TypeNotComparable),
            GetStateManagerErrorCode([&] { model->GetCurrentValueComparer(code); }));
    }
    EXPECT_EQ(0u, model->GetCachedComparerCount());
}

TEST(ModelTests, GetCurrentValueComparer_rejects_properties_of_other_models)
{
    auto model = MakeCatalogModel();
    auto otherModel = MakeCatalogModel();
    const auto& otherId = *otherModel->FindEntityType("Product")->FindProperty("Id");

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::PropertyNotFound),
        GetStateManagerErrorCode([&] { model->GetCurrentValueComparer(otherId); }));
}

TEST(ModelTests, Concurrent_first_access_shares_one_comparer)
{
    auto model = MakeCatalogModel();
    const auto& name = *model->FindEntityType("Product")->FindProperty("Name");

    std::atomic<bool> start = false;
    std::vector<const ICurrentValueComparer*> comparers(16);
    std::vector<std::thread> threads;

    for (size_t threadIndex = 0; threadIndex < comparers.size(); ++threadIndex)
    {
        threads.emplace_back([&, threadIndex]()
        {
            while (!start.load())
            {
                std::this_thread::yield();
            }
            comparers[threadIndex] = &model->GetCurrentValueComparer(name);
        });
    }

    start = true;
    for (auto& thread : threads)
    {
        thread.join();
    }

    for (auto comparer : comparers)
    {
        EXPECT_EQ(comparers[0], comparer);
    }
    EXPECT_EQ(CurrentValueComparerKind::Typed, comparers[0]->Kind());
    EXPECT_EQ(1u, model->GetCachedComparerCount());
}

TEST(ModelTests, StateManager_forwards_GetCurrentValueComparer_to_its_model)
{
    auto model = MakeCatalogModel();
    StateManager stateManager(model);
    const auto& id = *model->FindEntityType("Product")->FindProperty("Id");

    EXPECT_EQ(&model->GetCurrentValueComparer(id), &stateManager.GetCurrentValueComparer(id));
}

}
