#include <gtest/gtest.h>
#include <kbmp/bitmap.hpp>
#include <tracking_allocator.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

namespace kbmp {
namespace {
TEST(Layout, SizedToArea) {
	auto const layout = make_layout(Rect2{.width = 4, .height = 3});
	ASSERT_TRUE(layout);
	EXPECT_EQ(layout->count, 12u);
	EXPECT_EQ(layout->bytes, 48u);
	EXPECT_EQ(layout->alignment, alignof(Pixel));
}

TEST(Layout, RejectsUnrepresentable) {
	EXPECT_FALSE(make_layout(Rect2{.width = -1, .height = 3}));
	EXPECT_FALSE(make_layout(Rect2{.width = 3, .height = -1}));
	auto const max = std::numeric_limits<std::int32_t>::max();
	EXPECT_FALSE(make_layout(Rect2{.width = max, .height = max}));
	auto const empty = make_layout(Rect2{});
	ASSERT_TRUE(empty);
	EXPECT_EQ(empty->count, 0u);
}

TEST(Lifetime, ZeroesAllocatorMemory) {
	auto allocator = test::TrackingAllocator{};
	auto bitmap = Bitmap::create(Rect2{.width = 9, .height = 9}, allocator);
	ASSERT_TRUE(bitmap);
	for (auto const byte : bitmap->bytes().bytes) { EXPECT_EQ(byte, std::byte{}); }
}

TEST(Lifetime, ReleasesExactlyOnceWithSameLayout) {
	auto allocator = test::TrackingAllocator{};
	static constexpr auto count_v = 32;
	for (auto i = 0; i < count_v; ++i) {
		auto bitmap = Bitmap::create(Rect2{.width = i + 1, .height = (i % 5) + 1}, allocator);
		ASSERT_TRUE(bitmap);
		bitmap->draw_point({0, 0}, white_v);
		EXPECT_EQ(allocator.live.size(), 1u);
	}
	EXPECT_EQ(allocator.allocations, count_v);
	EXPECT_EQ(allocator.deallocations, count_v);
	EXPECT_EQ(allocator.unknown_releases, 0);
	EXPECT_EQ(allocator.layout_mismatches, 0);
	EXPECT_TRUE(allocator.live.empty());
}

TEST(Lifetime, ManyLiveBitmaps) {
	auto allocator = test::TrackingAllocator{};
	{
		auto bitmaps = std::vector<Bitmap>{};
		for (auto i = 0; i < 10; ++i) {
			auto bitmap = Bitmap::create(Rect2{.width = 8, .height = i}, allocator);
			ASSERT_TRUE(bitmap);
			bitmaps.push_back(std::move(*bitmap));
		}
		EXPECT_EQ(allocator.live.size(), 10u);
	}
	EXPECT_EQ(allocator.deallocations, 10);
	EXPECT_EQ(allocator.unknown_releases, 0);
	EXPECT_EQ(allocator.layout_mismatches, 0);
}

TEST(Lifetime, MoveLeavesSingleOwner) {
	auto allocator = test::TrackingAllocator{};
	{
		auto source = Bitmap::create(Rect2{.width = 3, .height = 3}, allocator);
		ASSERT_TRUE(source);
		source->draw_point({1, 1}, red_v);

		auto target = std::move(*source);
		EXPECT_EQ(target.size(), (Rect2{.width = 3, .height = 3}));
		EXPECT_EQ(*target.pixel_at({1, 1}), red_v);

		// moved-from bitmap owns nothing
		EXPECT_EQ(source->size(), Rect2{});
		EXPECT_EQ(source->pixel_at({0, 0}), nullptr);
		EXPECT_FALSE(source->draw_point({0, 0}, white_v));
		EXPECT_TRUE(source->pixels().empty());
	}
	EXPECT_EQ(allocator.allocations, 1);
	EXPECT_EQ(allocator.deallocations, 1);
	EXPECT_EQ(allocator.unknown_releases, 0);
}

TEST(Lifetime, MoveAssignReleasesPrevious) {
	auto allocator = test::TrackingAllocator{};
	{
		auto first = Bitmap::create(Rect2{.width = 2, .height = 2}, allocator);
		auto second = Bitmap::create(Rect2{.width = 5, .height = 5}, allocator);
		ASSERT_TRUE(first && second);
		*first = std::move(*second);
		EXPECT_EQ(allocator.deallocations, 1);
		EXPECT_EQ(first->size(), (Rect2{.width = 5, .height = 5}));
	}
	EXPECT_EQ(allocator.allocations, 2);
	EXPECT_EQ(allocator.deallocations, 2);
	EXPECT_EQ(allocator.layout_mismatches, 0);
}

TEST(Lifetime, ReleasesOnException) {
	auto allocator = test::TrackingAllocator{};
	auto const scope = [&allocator] {
		auto bitmap = Bitmap::create(Rect2{.width = 4, .height = 4}, allocator);
		if (bitmap) { throw std::runtime_error{"unwind"}; }
	};
	EXPECT_THROW(scope(), std::runtime_error);
	EXPECT_EQ(allocator.allocations, 1);
	EXPECT_EQ(allocator.deallocations, 1);
}

TEST(Lifetime, AllocationFailure) {
	auto allocator = test::FailingAllocator{};
	auto const bitmap = Bitmap::create(Rect2{.width = 4, .height = 4}, allocator);
	ASSERT_FALSE(bitmap);
	EXPECT_EQ(bitmap.error(), RenderError::MemoryError);
	EXPECT_EQ(allocator.attempts, 1);
	EXPECT_EQ(allocator.deallocations, 0);
}

TEST(Lifetime, InvalidSizeDoesNotAllocate) {
	auto allocator = test::TrackingAllocator{};
	auto const bitmap = Bitmap::create(Rect2{.width = -4, .height = 4}, allocator);
	ASSERT_FALSE(bitmap);
	EXPECT_EQ(bitmap.error(), RenderError::MemoryError);
	EXPECT_EQ(allocator.allocations, 0);
}

TEST(Lifetime, ErrorNames) {
	EXPECT_EQ(to_str(RenderError::DrawOOB), "DrawOOB");
	EXPECT_EQ(to_str(RenderError::MemoryError), "MemoryError");
}
} // namespace
} // namespace kbmp
