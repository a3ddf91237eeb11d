#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

namespace recycling::core {

// Types the pool can hold. Values are stored behind an owning pointer, so
// they never move while pooled and need not be movable themselves.
template <typename T>
concept Poolable = std::is_object_v<T> && !std::is_array_v<T> && std::is_nothrow_destructible_v<T>;

// A value type that declares its own reset operation
template <typename T>
concept HasMemberReset = requires(T& value) {
    { value.reset() } -> std::same_as<void>;
};

template <typename T>
constexpr bool member_reset_is_noexcept() noexcept {
    if constexpr (HasMemberReset<T>) {
        return noexcept(std::declval<T&>().reset());
    } else {
        return true;
    }
}

/**
 * @brief Customization point for clearing a value before it re-enters the pool
 *
 * The primary template detects a `void reset()` member. Specialize it to add a
 * reset for a type you do not own, or to suppress one whose reset() means
 * something else (std::unique_ptr::reset() frees the pointee, for example):
 *
 * @code
 * template <>
 * struct recycling::core::ResetTraits<std::vector<char>> {
 *     static constexpr bool enabled = true;
 *     static void reset(std::vector<char>& buffer) noexcept { buffer.clear(); }
 * };
 * @endcode
 */
template <typename T>
struct ResetTraits {
    static constexpr bool enabled = HasMemberReset<T>;

    static void reset(T& value) noexcept(member_reset_is_noexcept<T>()) {
        if constexpr (enabled) {
            value.reset();
        }
    }
};

template <typename T>
inline constexpr bool is_resettable_v = ResetTraits<T>::enabled;

template <typename T>
inline constexpr bool is_nothrow_resettable_v = noexcept(ResetTraits<T>::reset(std::declval<T&>()));

}  // namespace recycling::core
