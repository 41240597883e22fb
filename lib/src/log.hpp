#pragma once
#include <klib/log.hpp>

namespace kbmp {
[[maybe_unused]] constexpr auto log = klib::TaggedLogger{"kbmp"};
} // namespace kbmp
