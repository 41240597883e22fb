#pragma once
#include <kbmp/geometry.hpp>
#include <kbmp/pixel.hpp>
#include <cstddef>
#include <span>

namespace kbmp {
/// \brief Read-only view of a row-major, unpadded BGRX8888 pixel array.
struct BitmapBytes {
	static constexpr std::size_t channels_v{Pixel::size_v};

	std::span<std::byte const> bytes{};
	Rect2 size{};
};
} // namespace kbmp
