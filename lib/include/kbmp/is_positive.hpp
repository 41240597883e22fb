#pragma once
#include <glm/vec2.hpp>
#include <klib/concepts.hpp>

namespace kbmp {
template <klib::NumberT Type>
constexpr auto is_positive(Type const t) -> bool {
	return t > Type(0);
}

template <klib::NumberT Type>
constexpr auto is_positive(glm::tvec2<Type> const t) -> bool {
	return is_positive(t.x) && is_positive(t.y);
}

template <klib::NumberT Type>
constexpr auto is_non_negative(Type const t) -> bool {
	return t >= Type(0);
}

template <klib::NumberT Type>
constexpr auto is_non_negative(glm::tvec2<Type> const t) -> bool {
	return is_non_negative(t.x) && is_non_negative(t.y);
}
} // namespace kbmp
