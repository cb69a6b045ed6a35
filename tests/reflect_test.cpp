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
 * @file reflect_test.cpp
 * @brief Tests for registering identifier types with the reflection registry.
 *
 * @details
 * Drives the type-erased operations the way an inspector would: through `void*`
 * and the registered path name only.
 */

#include "stableid/core/domain.hpp"
#include "stableid/core/generate.hpp"
#include "stableid/core/id.hpp"
#include "stableid/infra/logger.hpp"
#include "stableid/reflect/type_registry.hpp"
#include "stableid/tiny/tiny_id.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace {

struct Dog : stableid::IdDomain<Dog> {
    static constexpr std::string_view name = "Dog";
    using Backing = std::string;
    using Generator = stableid::NanoIdGen<>;
    using ConstRepr = std::string_view;
};

struct Frame : stableid::IdDomain<Frame> {
    static constexpr std::string_view name = "Frame";
    using Backing = std::uint64_t;
    using Generator = stableid::SequenceGen<>;
    using ConstRepr = void;
};

STABLEID_TINY_ID_DOMAIN_SIZED(Tag, "Tag", 8);

/// Serializable, but has no `operator<<`.
struct Rgb {
    std::uint32_t packed = 0;

    bool operator==(const Rgb& other) const
    {
        return packed == other.packed;
    }
};

struct Swatch : stableid::IdDomain<Swatch> {
    static constexpr std::string_view name = "Swatch";
    using Backing = Rgb;
    using Generator = void;
    using ConstRepr = void;
};

} // namespace

namespace stableid::serde {

template <>
struct JsonSerializer<Rgb> {
    static cJSON* to_json(const Rgb& value)
    {
        return JsonSerializer<std::uint32_t>::to_json(value.packed);
    }

    static std::optional<Rgb> from_json(const cJSON* node)
    {
        auto packed = JsonSerializer<std::uint32_t>::from_json(node);
        if (!packed) {
            return std::nullopt;
        }
        return Rgb{*packed};
    }
};

} // namespace stableid::serde

/**
 * @brief Registration describes `Id<D>` as an alias of its backing.
 */
void test_reflect_registration_metadata()
{
    stableid::reflect::TypeRegistry registry;
    registry.register_stable_id<Dog>();

    ASSERT_EQ(registry.size(), static_cast<std::size_t>(1));

    auto entry = registry.find<stableid::Id<Dog>>();
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->type_path, std::string("stableid::Id<Dog>"));
    ASSERT_EQ(entry->size, sizeof(stableid::Id<Dog>));
    ASSERT_EQ(entry->size, sizeof(std::string));
    ASSERT_FALSE(entry->backing_type_path.empty());

    auto by_path = registry.find("stableid::Id<Dog>");
    ASSERT_TRUE(by_path.has_value());
    ASSERT_EQ(by_path->type_path, entry->type_path);

    ASSERT_FALSE(registry.find<stableid::Id<Frame>>().has_value());
    ASSERT_FALSE(registry.find("stableid::Id<Cat>").has_value());
}

/**
 * @brief Type-erased serialization uses the payload's own JSON form.
 */
void test_reflect_serialize_roundtrip()
{
    stableid::reflect::TypeRegistry registry;
    registry.register_stable_id<Frame>();
    auto entry = registry.find("stableid::Id<Frame>");
    ASSERT_TRUE(entry.has_value());

    auto frame = Frame::new_id(std::uint64_t{12});
    ASSERT_EQ(entry->serialize(&frame), std::string("12"));

    auto target = Frame::new_id(std::uint64_t{0});
    ASSERT_TRUE(entry->deserialize("40", &target));
    ASSERT_EQ(target.backing(), static_cast<std::uint64_t>(40));

    ASSERT_FALSE(entry->deserialize("\"forty\"", &target));
    ASSERT_EQ(target.backing(), static_cast<std::uint64_t>(40));
}

/**
 * @brief The display widget shows and edits the payload as plain text.
 *
 * Scenarios verified:
 * - String backing: display and edit.
 * - TinyId backing: edit truncates to the capacity.
 * - Numeric backing: display only.
 * - Registered without a widget: neither.
 */
void test_reflect_display_widget()
{
    stableid::reflect::TypeRegistry registry;
    registry.register_stable_id<Dog>();
    registry.register_stable_id<Tag>();
    registry.register_stable_id<Frame>();

    auto dog_entry = registry.find<stableid::Id<Dog>>();
    auto dog = Dog::new_id("hans");
    ASSERT_TRUE(static_cast<bool>(dog_entry->display));
    ASSERT_EQ(dog_entry->display(&dog), std::string("hans"));
    ASSERT_TRUE(static_cast<bool>(dog_entry->edit));
    ASSERT_TRUE(dog_entry->edit(&dog, "fido"));
    ASSERT_EQ(dog, Dog::new_id("fido"));

    auto tag_entry = registry.find<stableid::Id<Tag>>();
    auto tag = Tag::new_id("red");
    ASSERT_TRUE(tag_entry->edit(&tag, "ultraviolet"));
    ASSERT_EQ(tag.backing().as_str(), std::string_view("ultravio"));

    auto frame_entry = registry.find<stableid::Id<Frame>>();
    auto frame = Frame::new_id(std::uint64_t{5});
    ASSERT_EQ(frame_entry->display(&frame), std::string("5"));
    ASSERT_FALSE(static_cast<bool>(frame_entry->edit));

    stableid::reflect::TypeRegistry bare;
    bare.register_stable_id<Dog>(false);
    auto bare_entry = bare.find<stableid::Id<Dog>>();
    ASSERT_FALSE(static_cast<bool>(bare_entry->display));
    ASSERT_FALSE(static_cast<bool>(bare_entry->edit));
    ASSERT_TRUE(static_cast<bool>(bare_entry->serialize));
}

/**
 * @brief Registering a domain again replaces its entry.
 */
void test_reflect_reregistration_replaces()
{
    stableid::reflect::TypeRegistry registry;
    registry.register_stable_id<Dog>(false);
    registry.register_stable_id<Dog>(true);

    ASSERT_EQ(registry.size(), static_cast<std::size_t>(1));
    ASSERT_TRUE(static_cast<bool>(registry.find<stableid::Id<Dog>>()->display));
}

/**
 * @brief A payload without `operator<<` registers for serialization, without a widget.
 */
void test_reflect_unprintable_backing()
{
    // Asking for a widget on such a payload is logged at WARN.
    const auto previous = stableid::infra::Logger::min_level();
    stableid::infra::Logger::set_min_level(stableid::infra::LogLevel::FATAL);

    stableid::reflect::TypeRegistry registry;
    registry.register_stable_id<Swatch>(false);
    auto bare = registry.find<stableid::Id<Swatch>>();
    ASSERT_TRUE(bare.has_value());
    ASSERT_FALSE(static_cast<bool>(bare->display));

    registry.register_stable_id<Swatch>();
    auto entry = registry.find<stableid::Id<Swatch>>();
    ASSERT_FALSE(static_cast<bool>(entry->display));
    ASSERT_FALSE(static_cast<bool>(entry->edit));

    auto swatch = Swatch::new_id(Rgb{0xFF8800});
    ASSERT_EQ(entry->serialize(&swatch), std::string("16746496"));

    auto target = Swatch::new_id(Rgb{});
    ASSERT_TRUE(entry->deserialize("255", &target));
    ASSERT_TRUE(target.backing() == Rgb{255});

    stableid::infra::Logger::set_min_level(previous);
}
