#include "StandardIncludes.h"
#include "Keystone.System/load_once_map.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace Keystone
{

TEST(load_once_map_tests, get_or_load_invokes_factory_once_per_key)
{
    load_once_map<int, std::string> map;
    int factoryCalls = 0;
    auto factory = [&](int key)
    {
        ++factoryCalls;
        return std::to_string(key);
    };

    EXPECT_EQ("1", map.get_or_load(1, factory));
    EXPECT_EQ("1", map.get_or_load(1, factory));
    EXPECT_EQ("2", map.get_or_load(2, factory));
    EXPECT_EQ(2, factoryCalls);
    EXPECT_EQ(2u, map.size());
}

TEST(load_once_map_tests, get_or_load_returns_stable_reference)
{
    load_once_map<int, std::string> map;
    auto& first = map.get_or_load(1, [](int) { return std::string("one"); });

    for (int key = 2; key < 100; ++key)
    {
        map.get_or_load(key, [](int key) { return std::to_string(key); });
    }

    EXPECT_EQ(&first, &map.get_or_load(1, [](int) { return std::string("other"); }));
    EXPECT_EQ("one", first);
}

TEST(load_once_map_tests, find_returns_only_loaded_values)
{
    load_once_map<int, int> map;
    EXPECT_EQ(nullptr, map.find(1));

    map.get_or_load(1, [](int key) { return key * 10; });
    ASSERT_NE(nullptr, map.find(1));
    EXPECT_EQ(10, *map.find(1));
}

TEST(load_once_map_tests, failed_load_is_not_stored)
{
    load_once_map<int, int> map;

    EXPECT_THROW(
        map.get_or_load(1, [](int) -> int { throw std::runtime_error("failed"); }),
        std::runtime_error);
    EXPECT_EQ(nullptr, map.find(1));
    EXPECT_EQ(0u, map.size());

    EXPECT_EQ(5, map.get_or_load(1, [](int) { return 5; }));
}

TEST(load_once_map_tests, concurrent_get_or_load_loads_once)
{
    load_once_map<int, std::shared_ptr<int>> map;
    std::atomic<int> factoryCalls = 0;
    std::atomic<bool> start = false;
    std::vector<const std::shared_ptr<int>*> results(16);
    std::vector<std::thread> threads;

    for (size_t threadIndex = 0; threadIndex < results.size(); ++threadIndex)
    {
        threads.emplace_back([&, threadIndex]()
        {
            while (!start.load())
            {
                std::this_thread::yield();
            }

            results[threadIndex] = &map.get_or_load(7, [&](int key)
            {
                ++factoryCalls;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                return std::make_shared<int>(key);
            });
        });
    }

    start = true;
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(1, factoryCalls.load());
    for (auto result : results)
    {
        EXPECT_EQ(results[0], result);
        EXPECT_EQ(7, **result);
    }
}

}
