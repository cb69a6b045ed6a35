/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file id_test.cpp
 * @brief Runtime tests for `Id<D>`: delegation of comparison, hashing and formatting.
 */

#include "stableid/core/domain.hpp"
#include "stableid/core/id.hpp"
#include "framework.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace {

struct Dog : stableid::IdDomain<Dog> {
    static constexpr std::string_view name = "Dog";
    using Backing = std::string;
    using Generator = void;
    using ConstRepr = void;
};

struct Order : stableid::IdDomain<Order> {
    static constexpr std::string_view name = "Order";
    using Backing = std::uint64_t;
    using Generator = void;
    using ConstRepr = void;
};

struct Handle : stableid::IdDomain<Handle> {
    static constexpr std::string_view name = "Handle";
    using Backing = std::unique_ptr<int>;
    using Generator = void;
    using ConstRepr = void;
};

} // namespace

/**
 * @brief Display form is `"<name> [<payload>]"`, debug form is `"Id<<name>>(<payload>)"`.
 */
void test_id_display_and_debug()
{
    auto dog = Dog::new_id("hans");

    std::ostringstream ss;
    ss << dog;
    ASSERT_EQ(ss.str(), std::string("Dog [hans]"));
    ASSERT_EQ(stableid::to_string(dog), std::string("Dog [hans]"));
    ASSERT_EQ(stableid::debug_string(dog), std::string("Id<Dog>(hans)"));

    ASSERT_EQ(stableid::to_string(Order::new_id(42u)), std::string("Order [42]"));
    ASSERT_EQ(stableid::debug_string(Order::new_id(42u)), std::string("Id<Order>(42)"));
}

/**
 * @brief Equality and ordering follow the backing values.
 */
void test_id_comparison_delegates()
{
    auto a = Order::new_id(1u);
    auto b = Order::new_id(2u);

    ASSERT_TRUE(a == Order::new_id(1u));
    ASSERT_TRUE(a != b);
    ASSERT_TRUE(a < b);
    ASSERT_TRUE(a <= b);
    ASSERT_TRUE(b > a);
    ASSERT_TRUE(b >= a);
    ASSERT_FALSE(b < a);

    std::vector<stableid::Id<Order>> ids{Order::new_id(3u), Order::new_id(1u), Order::new_id(2u)};
    std::sort(ids.begin(), ids.end());
    ASSERT_EQ(ids.front().backing(), static_cast<std::uint64_t>(1));
    ASSERT_EQ(ids.back().backing(), static_cast<std::uint64_t>(3));

    std::set<stableid::Id<Dog>> names{Dog::new_id("b"), Dog::new_id("a"), Dog::new_id("b")};
    ASSERT_EQ(names.size(), static_cast<std::size_t>(2));
}

/**
 * @brief `std::hash<Id<D>>` equals `std::hash<Backing>` of the payload.
 */
void test_id_hash_matches_backing()
{
    auto dog = Dog::new_id("hans");
    ASSERT_EQ(std::hash<stableid::Id<Dog>>{}(dog), std::hash<std::string>{}("hans"));

    std::unordered_set<stableid::Id<Dog>> seen;
    seen.insert(Dog::new_id("hans"));
    seen.insert(Dog::new_id("hans"));
    seen.insert(Dog::new_id("fido"));
    ASSERT_EQ(seen.size(), static_cast<std::size_t>(2));
    ASSERT_TRUE(seen.count(Dog::new_id("fido")) == 1);
}

/**
 * @brief Copies are independent values; `into_backing` returns or moves out the payload.
 */
void test_id_copy_and_into_backing()
{
    auto original = Dog::new_id("hans");
    auto copy = original;
    ASSERT_EQ(copy, original);

    copy = Dog::new_id("fido");
    ASSERT_EQ(original.backing(), std::string("hans"));

    std::string copied_out = original.into_backing();
    ASSERT_EQ(copied_out, std::string("hans"));
    ASSERT_EQ(original.backing(), std::string("hans"));

    std::string moved_out = std::move(original).into_backing();
    ASSERT_EQ(moved_out, std::string("hans"));
}

/**
 * @brief A move-only backing gives a move-only identifier.
 */
void test_id_move_only_backing()
{
    auto handle = Handle::new_id(std::make_unique<int>(7));
    ASSERT_EQ(*handle.backing(), 7);

    auto moved = std::move(handle);
    ASSERT_EQ(*moved.backing(), 7);

    std::unique_ptr<int> payload = std::move(moved).into_backing();
    ASSERT_EQ(*payload, 7);
}
