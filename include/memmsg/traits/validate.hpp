#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <type_traits>

#include "memmsg/layout.hpp"
#include "memmsg/traits/reinterpretable.hpp"

namespace memmsg::traits
{
/// @brief Outcome of the layout validation of a type: either accepted, or the first rule it violates.
enum class Rule : uint8_t {
	accepted,
	/// Integer or floating point type whose width or signedness is chosen by the target.
	architecture_dependent_width,
	/// Record that does not attest an explicit layout (or cannot, not being standard-layout).
	implicit_layout,
	/// Record (or std::array) whose attested fields leave padding, are out of declaration order, or are incomplete.
	padded_layout,
	/// Pointers, references and member pointers: an address is meaningless in another process.
	address_bearing,
	/// Unions: which member is active is not part of the representation.
	union_layout,
	unsupported_type,
};

constexpr std::string_view to_string(Rule rule)
{
	switch (rule) {
	case Rule::accepted:
		return "accepted";
	case Rule::architecture_dependent_width:
		return "width is architecture dependent";
	case Rule::implicit_layout:
		return "record does not declare an explicit layout";
	case Rule::padded_layout:
		return "declared layout is not contiguous: padding, missing field or reordered fields";
	case Rule::address_bearing:
		return "pointers and references cannot be transferred";
	case Rule::union_layout:
		return "unions have no self-describing layout";
	case Rule::unsupported_type:
		return "unsupported type";
	}
	return "unknown rule";
}

inline std::ostream &operator<<(std::ostream &stream, Rule rule)
{
	return (stream << to_string(rule));
}

/// @brief Compile-time verdict: the rule applied, and the type that violated it. For an accepted type, the
/// offending type is the type itself.
template <Rule R, typename Offending>
struct Verdict {
	static constexpr Rule rule = R;
	using offending_type = Offending;
	using verdict = Verdict;
};

template <typename T>
struct validate;

namespace detail
{
template <typename Record, typename Fields>
struct first_rejected_field;

template <typename Record>
struct first_rejected_field<Record, type_list<>> : Verdict<Rule::accepted, Record> {};

// Depth-first, left to right: the remaining fields are only instantiated while every previous one is accepted.
template <typename Record, typename Field, typename... Rest>
struct first_rejected_field<Record, type_list<Field, Rest...>>
	: std::conditional_t<validate<Field>::rule == Rule::accepted, first_rejected_field<Record, type_list<Rest...>>,
			     typename validate<Field>::verdict> {};

template <typename T>
constexpr auto classify_record()
{
	using Layout = explicit_layout<T>;

	if constexpr (!std::is_trivially_copyable_v<T> || is_view<T>::value)
		return std::type_identity<Verdict<Rule::unsupported_type, T>>{};
	else if constexpr (!is_safe_for_reinterpret_cast_v<T> || !Layout::declared)
		return std::type_identity<Verdict<Rule::implicit_layout, T>>{};
	else if constexpr (!is_contiguous<Layout>())
		return std::type_identity<Verdict<Rule::padded_layout, T>>{};
	else
		return std::type_identity<typename first_rejected_field<T, typename Layout::field_types>::verdict>{};
}

template <typename T>
constexpr auto classify()
{
	if constexpr (std::is_reference_v<T> || std::is_pointer_v<T> || std::is_member_pointer_v<T>)
		return std::type_identity<Verdict<Rule::address_bearing, T>>{};
	else if constexpr (std::is_const_v<T>)
		return std::type_identity<typename validate<std::remove_const_t<T>>::verdict>{};
	else if constexpr (std::is_volatile_v<T>)
		return std::type_identity<Verdict<Rule::unsupported_type, T>>{};
	else if constexpr (std::is_same_v<T, bool>)
		return std::type_identity<Verdict<sizeof(bool) == 1 ? Rule::accepted : Rule::architecture_dependent_width, T>>{};
	// Not integral for the standard library in strict ISO mode.
	else if constexpr (is_extended_fixed_width_integer_v<T>)
		return std::type_identity<Verdict<Rule::accepted, T>>{};
	else if constexpr (std::is_integral_v<T>)
		return std::type_identity<
			Verdict<is_fixed_width_integer_v<T> ? Rule::accepted : Rule::architecture_dependent_width, T>>{};
	else if constexpr (std::is_floating_point_v<T>)
		return std::type_identity<
			Verdict<is_portable_floating_point_v<T> ? Rule::accepted : Rule::architecture_dependent_width, T>>{};
	else if constexpr (std::is_bounded_array_v<T>)
		return std::type_identity<typename validate<std::remove_extent_t<T>>::verdict>{};
	else if constexpr (is_std_array<T>::value) {
		using Element = typename T::value_type;
		if constexpr (sizeof(T) != std::tuple_size_v<T> * sizeof(Element))
			return std::type_identity<Verdict<Rule::padded_layout, T>>{};
		else
			return std::type_identity<typename validate<Element>::verdict>{};
	} else if constexpr (std::is_union_v<T>)
		return std::type_identity<Verdict<Rule::union_layout, T>>{};
	else if constexpr (std::is_class_v<T>)
		return classify_record<T>();
	else
		return std::type_identity<Verdict<Rule::unsupported_type, T>>{};
}
} // namespace detail

/// @brief Recursive layout validation of T, evaluated at compile time.
/// - rule: Rule::accepted iff T is transfer-safe, otherwise the first rule violated (depth-first).
/// - offending_type: the innermost type that violated the rule.
template <typename T>
struct validate : decltype(detail::classify<T>())::type {};

template <typename T>
constexpr bool is_transfer_safe_v = validate<T>::rule == Rule::accepted;
} // namespace memmsg::traits
