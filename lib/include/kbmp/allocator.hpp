#pragma once
#include <klib/polymorphic.hpp>
#include <kbmp/geometry.hpp>
#include <kbmp/pixel.hpp>
#include <cstddef>
#include <optional>

namespace kbmp {
/// \brief Size and alignment of a single Pixel array allocation.
struct Layout {
	std::size_t count{};
	std::size_t bytes{};
	std::size_t alignment{alignof(Pixel)};

	auto operator==(Layout const&) const -> bool = default;
};

/// \brief Compute the Layout of a Pixel array covering size.
/// \returns nullopt if a dimension is negative or the byte count is not representable.
[[nodiscard]] auto make_layout(Rect2 size) -> std::optional<Layout>;

class IAllocator : public klib::Polymorphic {
  public:
	/// \returns Storage for layout.bytes bytes aligned to layout.alignment, or nullptr.
	[[nodiscard]] virtual auto allocate(Layout const& layout) -> void* = 0;
	/// \brief Release storage returned by allocate(), passing the same layout.
	virtual void deallocate(void* ptr, Layout const& layout) noexcept = 0;
};

/// \brief Aligned sized operator new / operator delete.
[[nodiscard]] auto default_allocator() -> IAllocator&;
} // namespace kbmp
