#pragma once

#include <array>
#include <cstddef>

namespace memmsg::traits
{
template <typename... Ts>
struct type_list {
	static constexpr std::size_t size = sizeof...(Ts);
};

/// @brief Opt-in attestation that a record has an explicit layout: its fields, listed in declaration order, are
/// placed one after the other with no padding between them or after the last one.
/// The primary template is the "not declared" case. Specializations are generated by MEMMSG_EXPLICIT_LAYOUT and
/// expose:
/// - record_type: the attested record,
/// - field_types: a type_list of the field types, in declaration order,
/// - offsets / sizes: the offset and size of every field, as measured by the compiler.
template <typename Record>
struct explicit_layout {
	static constexpr bool declared = false;
};

template <typename Record>
inline constexpr bool has_explicit_layout_v = explicit_layout<Record>::declared;

/// @brief Checks the attestation against the compiler's actual layout: the first field starts at offset 0, every
/// field starts where the previous one ends, and the last one ends exactly at sizeof(record).
/// Listing the fields out of declaration order, skipping one, or leaving alignment padding anywhere fails the check.
template <typename Layout>
constexpr bool is_contiguous()
{
	std::size_t expected_offset = 0;
	for (std::size_t i = 0; i < Layout::offsets.size(); ++i) {
		if (Layout::offsets[i] != expected_offset)
			return false;
		expected_offset += Layout::sizes[i];
	}
	return expected_offset == sizeof(typename Layout::record_type);
}
} // namespace memmsg::traits

#define MEMMSG_DETAIL_PARENS ()

#define MEMMSG_DETAIL_EXPAND(...) MEMMSG_DETAIL_EXPAND4(MEMMSG_DETAIL_EXPAND4(MEMMSG_DETAIL_EXPAND4(MEMMSG_DETAIL_EXPAND4(__VA_ARGS__))))
#define MEMMSG_DETAIL_EXPAND4(...) MEMMSG_DETAIL_EXPAND3(MEMMSG_DETAIL_EXPAND3(MEMMSG_DETAIL_EXPAND3(MEMMSG_DETAIL_EXPAND3(__VA_ARGS__))))
#define MEMMSG_DETAIL_EXPAND3(...) MEMMSG_DETAIL_EXPAND2(MEMMSG_DETAIL_EXPAND2(MEMMSG_DETAIL_EXPAND2(MEMMSG_DETAIL_EXPAND2(__VA_ARGS__))))
#define MEMMSG_DETAIL_EXPAND2(...) MEMMSG_DETAIL_EXPAND1(MEMMSG_DETAIL_EXPAND1(MEMMSG_DETAIL_EXPAND1(MEMMSG_DETAIL_EXPAND1(__VA_ARGS__))))
#define MEMMSG_DETAIL_EXPAND1(...) __VA_ARGS__

// Applies macro(record, field) to every field, separated by commas.
#define MEMMSG_DETAIL_FOR_EACH(macro, record, ...) \
	__VA_OPT__(MEMMSG_DETAIL_EXPAND(MEMMSG_DETAIL_FOR_EACH_STEP(macro, record, __VA_ARGS__)))
#define MEMMSG_DETAIL_FOR_EACH_STEP(macro, record, field, ...) \
	macro(record, field) __VA_OPT__(, MEMMSG_DETAIL_FOR_EACH_AGAIN MEMMSG_DETAIL_PARENS(macro, record, __VA_ARGS__))
#define MEMMSG_DETAIL_FOR_EACH_AGAIN() MEMMSG_DETAIL_FOR_EACH_STEP

#define MEMMSG_DETAIL_FIELD_TYPE(record, field) decltype(record::field)
#define MEMMSG_DETAIL_FIELD_OFFSET(record, field) offsetof(record, field)
#define MEMMSG_DETAIL_FIELD_SIZE(record, field) sizeof(decltype(record::field))

/// @brief Declares that `Record` has an explicit layout made of the given fields, in declaration order.
/// Must be used at global namespace scope, with `Record` qualified by its namespace.
/// @code
/// struct Position {
/// 	std::int32_t x;
/// 	std::int32_t y;
/// };
/// MEMMSG_EXPLICIT_LAYOUT(Position, x, y);
/// @endcode
#define MEMMSG_EXPLICIT_LAYOUT(Record, ...)                                                                   \
	namespace memmsg::traits                                                                              \
	{                                                                                                     \
	template <>                                                                                           \
	struct explicit_layout<Record> {                                                                      \
		static constexpr bool declared = true;                                                        \
		using record_type = Record;                                                                   \
		using field_types = type_list<MEMMSG_DETAIL_FOR_EACH(MEMMSG_DETAIL_FIELD_TYPE, Record, __VA_ARGS__)>; \
		static constexpr std::array<std::size_t, field_types::size> offsets{                         \
			MEMMSG_DETAIL_FOR_EACH(MEMMSG_DETAIL_FIELD_OFFSET, Record, __VA_ARGS__)               \
		};                                                                                            \
		static constexpr std::array<std::size_t, field_types::size> sizes{                           \
			MEMMSG_DETAIL_FOR_EACH(MEMMSG_DETAIL_FIELD_SIZE, Record, __VA_ARGS__)                 \
		};                                                                                            \
	};                                                                                                    \
	}                                                                                                     \
	static_assert(true, "")
