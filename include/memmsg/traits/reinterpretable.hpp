#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <type_traits>

namespace memmsg::traits
{
/// @brief Necessary condition for any record whose bytes are reinterpreted: copying its object representation must
/// copy its value, and its layout must be the one the language guarantees for C structs.
template <typename T>
using is_safe_for_reinterpret_cast = std::conjunction<std::is_trivially_copyable<T>, std::is_standard_layout<T>>;

template <typename T>
constexpr bool is_safe_for_reinterpret_cast_v = is_safe_for_reinterpret_cast<T>::value;

template <typename T, typename... Candidates>
constexpr bool is_any_of_v = (std::is_same_v<T, Candidates> || ...);

#ifdef __SIZEOF_INT128__
__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;

template <typename T>
constexpr bool is_extended_fixed_width_integer_v = is_any_of_v<T, int128_t, uint128_t>;
#else
template <typename T>
constexpr bool is_extended_fixed_width_integer_v = false;
#endif

/// @brief True for the exact-width integers of <cstdint> (and the 128-bit compiler integers).
/// The <cstdint> names are aliases of fundamental types: whichever fundamental type the target picks for an alias is
/// accepted under that alias, the others are not. `char` and the character types are never aliases.
template <typename T>
constexpr bool is_fixed_width_integer_v =
	is_any_of_v<T, std::int8_t, std::int16_t, std::int32_t, std::int64_t, std::uint8_t, std::uint16_t,
		    std::uint32_t, std::uint64_t> ||
	is_extended_fixed_width_integer_v<T>;

/// @brief IEEE-754 binary floating point with a fixed size. `long double` is 64, 80 or 128 bits depending on the
/// target and is never portable.
template <typename T>
constexpr bool is_portable_floating_point_v = std::is_floating_point_v<T> && !std::is_same_v<T, long double> &&
					      std::numeric_limits<T>::is_iec559;

template <typename T>
struct is_std_array : std::false_type {};

template <typename T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

/// @brief Non-owning views: trivially copyable, but their bytes are an address and a length.
template <typename T>
struct is_view : std::false_type {};

template <typename T, std::size_t Extent>
struct is_view<std::span<T, Extent>> : std::true_type {};

template <typename Char, typename CharTraits>
struct is_view<std::basic_string_view<Char, CharTraits>> : std::true_type {};
} // namespace memmsg::traits
