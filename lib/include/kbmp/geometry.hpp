#pragma once
#include <glm/vec2.hpp>
#include <cstdint>

namespace kbmp {
using Point = glm::ivec2;

struct Rect2 {
	static constexpr auto from(glm::ivec2 const extent) -> Rect2 { return Rect2{.width = extent.x, .height = extent.y}; }

	[[nodiscard]] constexpr auto area() const -> std::int64_t { return std::int64_t(width) * std::int64_t(height); }
	[[nodiscard]] constexpr auto extent() const -> glm::ivec2 { return {width, height}; }

	auto operator==(Rect2 const&) const -> bool = default;

	std::int32_t width{};
	std::int32_t height{};
};
} // namespace kbmp
