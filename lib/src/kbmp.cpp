#include <klib/assert.hpp>
#include <kbmp/is_positive.hpp>
#include <log.hpp>
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <format>
#include <limits>
#include <memory>
#include <new>
#include <utility>

// allocator

#include <kbmp/allocator.hpp>

namespace kbmp {
namespace {
class DefaultAllocator : public IAllocator {
  public:
	[[nodiscard]] auto allocate(Layout const& layout) -> void* final {
		return ::operator new(layout.bytes, std::align_val_t{layout.alignment}, std::nothrow);
	}

	void deallocate(void* ptr, Layout const& layout) noexcept final { ::operator delete(ptr, layout.bytes, std::align_val_t{layout.alignment}); }
};
} // namespace

auto make_layout(Rect2 const size) -> std::optional<Layout> {
	static constexpr auto max_count_v = std::uint64_t(std::numeric_limits<std::ptrdiff_t>::max()) / sizeof(Pixel);
	if (!is_non_negative(size.extent())) { return {}; }
	auto const area = size.area();
	if (std::uint64_t(area) > max_count_v) { return {}; }
	auto const count = std::size_t(area);
	return Layout{
		.count = count,
		.bytes = count * sizeof(Pixel),
		.alignment = alignof(Pixel),
	};
}

auto default_allocator() -> IAllocator& {
	static DefaultAllocator ret{};
	return ret;
}
} // namespace kbmp

// bitmap

#include <kbmp/bitmap.hpp>

namespace kbmp {
void Bitmap::Deleter::operator()(Storage const& storage) const noexcept { storage.allocator->deallocate(storage.pixels.data(), storage.layout); }

auto Bitmap::create(Rect2 const size, IAllocator& allocator) -> std::expected<Bitmap, RenderError> {
	auto const layout = make_layout(size);
	if (!layout) {
		log.error("Invalid Bitmap size: {}x{}", size.width, size.height);
		return std::unexpected{RenderError::MemoryError};
	}

	void* memory = allocator.allocate(*layout);
	if (memory == nullptr) {
		log.error("Failed to allocate Bitmap: {}x{} ({} bytes)", size.width, size.height, layout->bytes);
		return std::unexpected{RenderError::MemoryError};
	}

	// allocator memory is raw: start the lifetime of every Pixel as zero.
	auto* first = static_cast<Pixel*>(memory);
	std::uninitialized_value_construct_n(first, layout->count);

	auto ret = Bitmap{};
	ret.m_storage = Storage{
		.pixels = std::span{first, layout->count},
		.size = size,
		.layout = *layout,
		.allocator = &allocator,
	};
	log.debug("Bitmap created: {}x{} ({} bytes)", size.width, size.height, layout->bytes);
	return ret;
}

Bitmap::Bitmap(Rect2 const size) {
	auto result = create(size);
	if (!result) { throw Error{std::format("Failed to create Bitmap ({}x{}): {}", size.width, size.height, to_str(result.error()))}; }
	m_storage = std::move(result->m_storage);
}

auto Bitmap::index_of(Point const point) const -> std::optional<std::size_t> {
	auto const size = this->size();
	if (point.x < 0 || point.y < 0 || point.x >= size.width || point.y >= size.height) { return {}; }
	auto const index = (std::int64_t(point.y) * std::int64_t(size.width)) + std::int64_t(point.x);
	KLIB_ASSERT(index < size.area());
	return std::size_t(index);
}

auto Bitmap::pixel_at(Point const point) const -> Pixel const* {
	auto const index = index_of(point);
	auto const pixels = m_storage.get().pixels;
	if (!index || *index >= pixels.size()) { return nullptr; }
	return &pixels[*index];
}

auto Bitmap::pixel_at_mut(Point const point) -> MutResult {
	auto const index = index_of(point);
	if (!index) { return std::unexpected{RenderError::DrawOOB}; }
	auto const pixels = m_storage.get().pixels;
	if (*index >= pixels.size()) { return std::unexpected{RenderError::MemoryError}; }
	return std::ref(pixels[*index]);
}

auto Bitmap::draw_point(Point const point, Pixel const pixel) -> bool {
	auto result = pixel_at_mut(point);
	if (!result) { return false; }
	result->get() = pixel;
	return true;
}

auto Bitmap::draw_rect(Point const offset, Rect2 const rect, Pixel const pixel) -> std::size_t {
	if (!is_positive(rect.extent())) { return 0; }
	// every point outside [0, size) would clip, so only the overlap is visited.
	auto const size = this->size();
	auto const clamp = [](std::int64_t const begin, std::int64_t const end, std::int32_t const limit) {
		return std::pair{std::clamp(begin, std::int64_t{}, std::int64_t(limit)), std::clamp(end, std::int64_t{}, std::int64_t(limit))};
	};
	auto const [x_begin, x_end] = clamp(offset.x, std::int64_t(offset.x) + rect.width, size.width);
	auto const [y_begin, y_end] = clamp(offset.y, std::int64_t(offset.y) + rect.height, size.height);

	auto ret = std::size_t{};
	for (auto y = y_begin; y < y_end; ++y) {
		for (auto x = x_begin; x < x_end; ++x) {
			if (draw_point(Point{std::int32_t(x), std::int32_t(y)}, pixel)) { ++ret; }
		}
	}
	return ret;
}

void Bitmap::fill(Pixel const pixel) { std::ranges::fill(m_storage.get().pixels, pixel); }

auto Bitmap::bytes() const -> BitmapBytes {
	static_assert(sizeof(Pixel) == BitmapBytes::channels_v);
	return BitmapBytes{
		.bytes = std::as_bytes(pixels()),
		.size = size(),
	};
}

auto Bitmap::raw_data() const -> std::byte const* { return bytes().bytes.data(); }
} // namespace kbmp

// util

#include <kbmp/util.hpp>

namespace kbmp {
auto util::pixel_from_hex(std::string_view hex) -> std::optional<Pixel> {
	if (hex.size() != 7 || !hex.starts_with('#')) { return {}; }
	hex = hex.substr(1);
	auto const next = [&](std::uint8_t& out) {
		auto const [ptr, ec] = std::from_chars(hex.data(), hex.data() + 2, out, 16);
		hex = hex.substr(2);
		return ec == std::errc{} && ptr == hex.data();
	};
	auto rgb = Rgb{};
	if (!next(rgb.x) || !next(rgb.y) || !next(rgb.z)) { return {}; }
	return Pixel{rgb};
}

auto util::to_hex_string(Pixel const& pixel) -> std::string { return std::format("#{:02x}{:02x}{:02x}", pixel.r(), pixel.g(), pixel.b()); }
} // namespace kbmp
