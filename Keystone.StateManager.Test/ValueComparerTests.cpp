#include "StandardIncludes.h"
#include <limits>

namespace Keystone::StateManager
{

TEST(DefaultValueComparerTests, Null_sorts_first)
{
    const auto& comparer = DefaultValueComparer::Instance();

    EXPECT_EQ(std::weak_ordering::equivalent, comparer(Value(), Value()));
    EXPECT_EQ(std::weak_ordering::less, comparer(Value(), Value(std::int32_t(0))));
    EXPECT_EQ(std::weak_ordering::greater, comparer(Value(std::int32_t(0)), Value()));
    EXPECT_EQ(std::weak_ordering::equivalent, comparer(Value(), Value(std::optional<std::int32_t>{})));
}

TEST(DefaultValueComparerTests, Compares_native_types)
{
    const auto& comparer = DefaultValueComparer::Instance();

    EXPECT_EQ(std::weak_ordering::less, comparer(Value(std::int32_t(1)), Value(std::int32_t(2))));
    EXPECT_EQ(std::weak_ordering::greater, comparer(Value(std::string("b")), Value(std::string("a"))));
    EXPECT_EQ(std::weak_ordering::equivalent, comparer(Value(Color::Red), Value(Color::Red)));
    EXPECT_EQ(std::weak_ordering::less, comparer(Value(std::int32_t(1)), Value(std::optional<std::int32_t>(2))));
}

TEST(DefaultValueComparerTests, Sorts_nan_first)
{
    const auto& comparer = DefaultValueComparer::Instance();
    auto nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_EQ(std::weak_ordering::less, comparer(Value(nan), Value(-1.0)));
    EXPECT_EQ(std::weak_ordering::equivalent, comparer(Value(nan), Value(nan)));
}

TEST(DefaultValueComparerTests, Uses_loose_comparison_of_either_value)
{
    const auto& comparer = DefaultValueComparer::Instance();

    EXPECT_EQ(std::weak_ordering::less, comparer(Value(LooselyComparableKey{ 1 }), Value(LooselyComparableKey{ 2 })));
    EXPECT_EQ(std::weak_ordering::greater, comparer(Value(LooselyComparableKey{ 2 }), Value(LooselyComparableKey{ 1 })));
}

TEST(DefaultValueComparerTests, Throws_ValueTypeMismatch_for_values_of_different_types)
{
    const auto& comparer = DefaultValueComparer::Instance();

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::ValueTypeMismatch),
        GetStateManagerErrorCode([&] { comparer(Value(std::int32_t(1)), Value(std::int64_t(1))); }));
}

TEST(DefaultValueComparerTests, Throws_ValueNotComparable_for_uncomparable_values)
{
    const auto& comparer = DefaultValueComparer::Instance();

    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::ValueNotComparable),
        GetStateManagerErrorCode([&] { comparer(Value(NonComparableKey{ 1 }), Value(NonComparableKey{ 2 })); }));
    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::ValueNotComparable),
        GetStateManagerErrorCode([&] { comparer(Value(Bytes{ 1 }), Value(Bytes{ 2 })); }));
}

TEST(StructuralValueComparerTests, Shorter_sequence_sorts_first_when_common_elements_are_equal)
{
    const auto& comparer = StructuralValueComparer::Instance();

    EXPECT_EQ(std::weak_ordering::less, comparer(Value(Bytes{ 1, 2 }), Value(Bytes{ 1, 2, 3 })));
    EXPECT_EQ(std::weak_ordering::greater, comparer(Value(Bytes{ 1, 2, 3 }), Value(Bytes{ 1, 2 })));
    EXPECT_EQ(std::weak_ordering::less, comparer(Value(Bytes{}), Value(Bytes{ 0 })));
}

TEST(StructuralValueComparerTests, First_unequal_element_decides_regardless_of_length)
{
    const auto& comparer = StructuralValueComparer::Instance();

    EXPECT_EQ(std::weak_ordering::greater, comparer(Value(Bytes{ 2 }), Value(Bytes{ 1, 9, 9 })));
    EXPECT_EQ(std::weak_ordering::less, comparer(Value(Bytes{ 1, 9, 9 }), Value(Bytes{ 2 })));
    EXPECT_EQ(std::weak_ordering::less, comparer(Value(Bytes{ 1, 2, 9 }), Value(Bytes{ 1, 3 })));
}

TEST(StructuralValueComparerTests, Equal_sequences_are_equivalent)
{
    const auto& comparer = StructuralValueComparer::Instance();

    EXPECT_EQ(std::weak_ordering::equivalent, comparer(Value(Bytes{ 1, 2, 3 }), Value(Bytes{ 1, 2, 3 })));
    EXPECT_EQ(std::weak_ordering::equivalent, comparer(Value(Bytes{}), Value(Bytes{})));
}

TEST(StructuralValueComparerTests, Null_sorts_first)
{
    const auto& comparer = StructuralValueComparer::Instance();

    EXPECT_EQ(std::weak_ordering::less, comparer(Value(), Value(Bytes{})));
    EXPECT_EQ(std::weak_ordering::greater, comparer(Value(Bytes{}), Value(std::optional<Bytes>{})));
}

TEST(StructuralValueComparerTests, Compares_sequences_of_any_ordered_element)
{
    const auto& comparer = StructuralValueComparer::Instance();

    EXPECT_EQ(
        std::weak_ordering::less,
        comparer(
            Value(std::vector<std::string>{ "a", "b" }),
            Value(std::vector<std::string>{ "a", "c" })));
}

TEST(StructuralValueComparerTests, Uses_structural_comparison_of_objects)
{
    const auto& comparer = StructuralValueComparer::Instance();

    EXPECT_EQ(
        std::weak_ordering::greater,
        comparer(
            Value(StructuralComparableKey{ { 2 } }),
            Value(StructuralComparableKey{ { 1, 9, 9 } })));
    EXPECT_EQ(
        std::weak_ordering::less,
        comparer(
            Value(StructuralComparableKey{ { 1, 2 } }),
            Value(StructuralComparableKey{ { 1, 2, 3 } })));
}

TEST(StructuralValueComparerTests, Falls_back_to_default_comparison)
{
    const auto& comparer = StructuralValueComparer::Instance();

    EXPECT_EQ(std::weak_ordering::less, comparer(Value(std::int32_t(1)), Value(std::int32_t(2))));
    EXPECT_EQ(
        make_error_code(StateManagerErrorCode::ValueNotComparable),
        GetStateManagerErrorCode([&] { comparer(Value(NonComparableKey{ 1 }), Value(NonComparableKey{ 2 })); }));
}

}
