#pragma once
#include <kbmp/pixel.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace kbmp::util {
/// \brief Parse "#rrggbb".
[[nodiscard]] auto pixel_from_hex(std::string_view hex) -> std::optional<Pixel>;
[[nodiscard]] auto to_hex_string(Pixel const& pixel) -> std::string;
} // namespace kbmp::util
