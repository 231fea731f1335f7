#pragma once

#include <array>
#include <cstddef>
#include <cstring>
#include <memory>
#include <new>
#include <span>

#include <tl/expected.hpp>

#include "memmsg/status.hpp"
#include "memmsg/traits/validate.hpp"

namespace memmsg
{
template <typename T>
concept TransferSafe = traits::is_transfer_safe_v<T>;

namespace detail
{
template <typename>
constexpr bool always_false_v = false;

// Offending is the innermost rejected type: the compiler prints it in the instantiation note under the message.
template <typename Offending, traits::Rule rule>
consteval void diagnose()
{
	if constexpr (rule == traits::Rule::architecture_dependent_width)
		static_assert(always_false_v<Offending>,
			      "memmsg: unsupported integer or floating point type: width is architecture dependent");
	else if constexpr (rule == traits::Rule::implicit_layout)
		static_assert(always_false_v<Offending>,
			      "memmsg: unsupported record: does not declare an explicit layout (MEMMSG_EXPLICIT_LAYOUT)");
	else if constexpr (rule == traits::Rule::padded_layout)
		static_assert(always_false_v<Offending>,
			      "memmsg: unsupported record: declared layout has padding, missing or reordered fields");
	else if constexpr (rule == traits::Rule::address_bearing)
		static_assert(always_false_v<Offending>, "memmsg: unsupported type: pointers and references");
	else if constexpr (rule == traits::Rule::union_layout)
		static_assert(always_false_v<Offending>, "memmsg: unsupported type: unions");
	else if constexpr (rule == traits::Rule::unsupported_type)
		static_assert(always_false_v<Offending>, "memmsg: unsupported type");
}
} // namespace detail

/// @brief Fails the build, naming the offending type and the violated rule, unless T is transfer-safe.
/// Every operation below calls it: a call site for an unsafe type does not compile.
template <typename T>
consteval void assert_transfer_safe()
{
	using verdict = traits::validate<T>;
	detail::diagnose<typename verdict::offending_type, verdict::rule>();
}

/// @brief Storage suitable for reinterpretation as a T: exactly sizeof(T) bytes, aligned for T.
/// Owned by the caller; typically the destination of a transport receive, then viewed with cast_from_bytes.
template <typename T>
struct AlignedBuffer {
	alignas(T) std::array<std::byte, sizeof(T)> storage{};

	inline std::span<std::byte, sizeof(T)> bytes()
	{
		return storage;
	}
	inline std::span<const std::byte, sizeof(T)> bytes() const
	{
		return storage;
	}
};

/// @brief Views a message as its bytes, without copying. The view aliases the message: writes through either one
/// are visible through the other. It is aligned at least as T, and valid as long as the message is.
template <typename T>
std::span<std::byte, sizeof(T)> cast_to_bytes(T &message)
{
	assert_transfer_safe<T>();
	return std::span<std::byte, sizeof(T)>(reinterpret_cast<std::byte *>(std::addressof(message)), sizeof(T));
}

/// @brief Read-only variant of cast_to_bytes.
template <typename T>
std::span<const std::byte, sizeof(T)> cast_to_bytes(const T &message)
{
	assert_transfer_safe<T>();
	return std::span<const std::byte, sizeof(T)>(reinterpret_cast<const std::byte *>(std::addressof(message)),
						     sizeof(T));
}

/// The view would outlive the temporary.
template <typename T>
void cast_to_bytes(const T &&) = delete;

/// @brief Views aligned storage as a message, without copying.
template <typename T>
T &cast_from_bytes(AlignedBuffer<T> &buffer)
{
	assert_transfer_safe<T>();
	return *std::launder(reinterpret_cast<T *>(buffer.storage.data()));
}

template <typename T>
const T &cast_from_bytes(const AlignedBuffer<T> &buffer)
{
	assert_transfer_safe<T>();
	return *std::launder(reinterpret_cast<const T *>(buffer.storage.data()));
}

template <typename T>
void cast_from_bytes(const AlignedBuffer<T> &&) = delete;

/// @brief Copies the bytes of a message to the start of a buffer. The buffer needs no particular alignment, and
/// bytes past sizeof(T) are left untouched.
/// @return InsufficientLength if the buffer is shorter than the message, in which case nothing is written.
template <typename T>
tl::expected<void, Error> write_into(const T &message, std::span<std::byte> buffer)
{
	assert_transfer_safe<T>();

	if (buffer.size() < sizeof(T))
		return tl::make_unexpected(Error::insufficient_length(sizeof(T), buffer.size()));

	std::memcpy(buffer.data(), std::addressof(message), sizeof(T));
	return {};
}

/// @brief Overwrites a message with the first sizeof(T) bytes of a buffer.
/// @return InsufficientLength if the buffer is shorter than the message, in which case the message is untouched.
template <typename T>
tl::expected<void, Error> read_from(std::span<const std::byte> buffer, T &message)
{
	assert_transfer_safe<T>();

	if (buffer.size() < sizeof(T))
		return tl::make_unexpected(Error::insufficient_length(sizeof(T), buffer.size()));

	std::memcpy(std::addressof(message), buffer.data(), sizeof(T));
	return {};
}
} // namespace memmsg
