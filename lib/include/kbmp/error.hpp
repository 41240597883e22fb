#pragma once
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace kbmp {
struct Error : std::runtime_error {
	using std::runtime_error::runtime_error;
};

enum class RenderError : std::int8_t {
	// attempted to draw out of bounds
	DrawOOB,
	MemoryError,
};

constexpr auto to_str(RenderError const error) -> std::string_view {
	switch (error) {
	case RenderError::DrawOOB: return "DrawOOB";
	case RenderError::MemoryError: return "MemoryError";
	default: return "Unknown";
	}
}
} // namespace kbmp
