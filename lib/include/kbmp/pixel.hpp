#pragma once
#include <glm/vec3.hpp>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>

namespace kbmp {
using Rgb = glm::tvec3<std::uint8_t>;

/// \brief BGRX8888 pixel: blue, green, red, then one padding byte that is always zero.
class alignas(4) Pixel {
  public:
	static constexpr std::size_t size_v{4};
	static constexpr std::size_t blue_offset_v{0};
	static constexpr std::size_t green_offset_v{1};
	static constexpr std::size_t red_offset_v{2};
	static constexpr std::size_t pad_offset_v{3};

	static constexpr auto red(std::uint32_t const mask) -> std::uint8_t { return std::uint8_t((mask >> (2 * 8)) & 0xff); }
	static constexpr auto green(std::uint32_t const mask) -> std::uint8_t { return std::uint8_t((mask >> (1 * 8)) & 0xff); }
	static constexpr auto blue(std::uint32_t const mask) -> std::uint8_t { return std::uint8_t((mask >> (0 * 8)) & 0xff); }

	Pixel() = default;

	constexpr Pixel(std::uint8_t const r, std::uint8_t const g, std::uint8_t const b) : m_b(b), m_g(g), m_r(r) {}
	constexpr Pixel(Rgb const rgb) : Pixel(rgb.x, rgb.y, rgb.z) {}
	explicit constexpr Pixel(std::uint32_t const mask) : Pixel(red(mask), green(mask), blue(mask)) {}

	[[nodiscard]] constexpr auto r() const -> std::uint8_t { return m_r; }
	[[nodiscard]] constexpr auto g() const -> std::uint8_t { return m_g; }
	[[nodiscard]] constexpr auto b() const -> std::uint8_t { return m_b; }
	[[nodiscard]] constexpr auto pad() const -> std::uint8_t { return m_x; }

	[[nodiscard]] constexpr auto to_rgb() const -> Rgb { return {m_r, m_g, m_b}; }

	// Value of the four bytes read as a little-endian 32-bit word.
	[[nodiscard]] constexpr auto to_u32() const -> std::uint32_t {
		return (std::uint32_t(m_r) << (2 * 8)) | (std::uint32_t(m_g) << 8) | std::uint32_t(m_b);
	}

	auto operator==(Pixel const&) const -> bool = default;

  private:
	std::uint8_t m_b{};
	std::uint8_t m_g{};
	std::uint8_t m_r{};
	std::uint8_t m_x{};
};

static_assert(sizeof(Pixel) == Pixel::size_v);
static_assert(alignof(Pixel) == 4);

using PixelBytes = std::array<std::uint8_t, Pixel::size_v>;

[[nodiscard]] constexpr auto to_bytes(Pixel const pixel) -> PixelBytes { return std::bit_cast<PixelBytes>(pixel); }

static_assert(to_bytes(Pixel{1, 2, 3})[Pixel::red_offset_v] == 1);
static_assert(to_bytes(Pixel{1, 2, 3})[Pixel::green_offset_v] == 2);
static_assert(to_bytes(Pixel{1, 2, 3})[Pixel::blue_offset_v] == 3);
static_assert(to_bytes(Pixel{1, 2, 3})[Pixel::pad_offset_v] == 0);

constexpr auto black_v = Pixel{0x000000u};
constexpr auto white_v = Pixel{0xffffffu};
constexpr auto red_v = Pixel{0xff0000u};
constexpr auto green_v = Pixel{0x00ff00u};
constexpr auto blue_v = Pixel{0x0000ffu};
constexpr auto cyan_v = Pixel{0x00ffffu};
constexpr auto yellow_v = Pixel{0xffff00u};
constexpr auto magenta_v = Pixel{0xff00ffu};
} // namespace kbmp
