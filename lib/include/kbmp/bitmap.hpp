#pragma once
#include <klib/unique.hpp>
#include <kbmp/allocator.hpp>
#include <kbmp/bitmap_bytes.hpp>
#include <kbmp/error.hpp>
#include <kbmp/geometry.hpp>
#include <kbmp/pixel.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>

namespace kbmp {
/// \brief Fixed size, zero initialized, exclusively owned BGRX8888 pixel buffer.
///
/// Pixels are stored row-major with no row padding: (x, y) lives at index y * width + x.
/// Accessors check bounds in every build configuration. Drawing operations clip:
/// out of range points are skipped without an error.
class Bitmap {
  public:
	using MutResult = std::expected<std::reference_wrapper<Pixel>, RenderError>;

	/// \brief Allocate a zero filled bitmap of size.
	/// \returns RenderError::MemoryError if size is negative, too large, or allocation fails.
	[[nodiscard]] static auto create(Rect2 size, IAllocator& allocator = default_allocator()) -> std::expected<Bitmap, RenderError>;

	/// \brief Allocate a zero filled bitmap of size.
	/// Throws Error on failure.
	explicit Bitmap(Rect2 size);

	[[nodiscard]] auto size() const -> Rect2 { return m_storage.get().size; }
	[[nodiscard]] auto layout() const -> Layout const& { return m_storage.get().layout; }
	[[nodiscard]] auto is_empty() const -> bool { return m_storage.get().pixels.empty(); }

	/// \returns nullptr if point is out of bounds.
	[[nodiscard]] auto pixel_at(Point point) const -> Pixel const*;
	/// \returns RenderError::DrawOOB if point is out of bounds.
	[[nodiscard]] auto pixel_at_mut(Point point) -> MutResult;

	/// \returns true if point was in bounds and written.
	auto draw_point(Point point, Pixel pixel) -> bool;
	/// \brief Fill [offset, offset + rect.extent()) with pixel.
	/// \returns Number of pixels written (rect.area() minus clipped points).
	auto draw_rect(Point offset, Rect2 rect, Pixel pixel) -> std::size_t;

	void fill(Pixel pixel);
	void clear() { fill(Pixel{}); }

	[[nodiscard]] auto pixels() const -> std::span<Pixel const> { return m_storage.get().pixels; }
	[[nodiscard]] auto bytes() const -> BitmapBytes;

	/// \brief Interop escape hatch: first of size().area() * 4 read-only bytes.
	/// Do not write through it, read past the end, or keep it beyond this Bitmap's lifetime.
	[[nodiscard]] auto raw_data() const -> std::byte const*;

  private:
	struct Storage {
		std::span<Pixel> pixels{};
		Rect2 size{};
		Layout layout{};
		IAllocator* allocator{};
	};
	struct Id {
		constexpr auto operator()(Storage const& a) const -> bool { return a.allocator == nullptr; }
	};
	struct Deleter {
		void operator()(Storage const& storage) const noexcept;
	};

	Bitmap() = default;

	[[nodiscard]] auto index_of(Point point) const -> std::optional<std::size_t>;

	klib::Unique<Storage, Deleter, Id> m_storage{};
};
} // namespace kbmp
