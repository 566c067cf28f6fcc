/**
 * @file Types.hpp
 * @brief Defines various type aliases for commonly used types.
 *
 * This header provides a collection of type aliases used throughout Shelter.
 * They are thin aliases over standard library types (and ankerl's dense map)
 * and are provided as convenient shorthand notations.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (UnorderedMap)
#include <array>                    // std::array (Array)
#include <cstdint>                  // std::{u,}int*_t
#include <expected>                 // std::expected
#include <functional>               // std::function (Fn)
#include <map>                      // std::map (Map)
#include <memory>                   // std::unique_ptr (UniquePointer)
#include <mutex>                    // std::mutex and std::lock_guard (Mutex, LockGuard)
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <utility>                  // std::pair (Pair)
#include <vector>                   // std::vector (Vec)

namespace shelter::utils {
  // Forward decl for Result and Err
  namespace error {
    struct ShelterError;
  } // namespace error

  namespace types {
    using u8    = std::uint8_t;   ///< 8-bit unsigned integer.
    using u16   = std::uint16_t;  ///< 16-bit unsigned integer.
    using u32   = std::uint32_t;  ///< 32-bit unsigned integer.
    using u64   = std::uint64_t;  ///< 64-bit unsigned integer.
    using i32   = std::int32_t;   ///< 32-bit signed integer.
    using i64   = std::int64_t;   ///< 64-bit signed integer.
    using usize = std::size_t;    ///< Unsigned size type (result of sizeof).
    using isize = std::ptrdiff_t; ///< Signed size type (result of pointer subtraction).

    /**
     * @brief Alias for std::string.
     *
     * Owning, mutable string.
     */
    using String = std::string;

    /**
     * @brief Alias for std::string_view.
     *
     * Non-owning view of a string.
     */
    using StringView = std::string_view;

    /**
     * @brief Alias for char.
     *
     * Single character type.
     */
    using CStr = char;

    /**
     * @brief Alias for const char*.
     *
     * Pointer to a null-terminated C-style string.
     */
    using PCStr = const char*;

    /**
     * @brief Alias for void.
     *
     * Represents a unit type.
     */
    using Unit = void;

    /**
     * @brief Alias for std::exception.
     *
     * Standard exception type.
     */
    using Exception = std::exception;

    using Mutex     = std::mutex;
    using LockGuard = std::lock_guard<Mutex>;

    /**
     * @brief Alias for std::optional<Tp>.
     *
     * Represents a value that may or may not be present.
     * @tparam Tp The type of the potential value.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    /**
     * @brief Alias for std::nullopt_t.
     *
     * Represents an empty optional value.
     */
    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Helper function to create an Option with a value.
     * @tparam Tp The type of the value.
     * @param value The value to wrap in an Option.
     * @return An Option containing the value.
     */
    template <typename Tp>
    constexpr auto Some(Tp&& value) -> Option<std::remove_cvref_t<Tp>> {
      return std::make_optional<std::remove_cvref_t<Tp>>(std::forward<Tp>(value));
    }

    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    template <typename T1, typename T2>
    using Pair = std::pair<T1, T2>;

    /**
     * @brief Alias for std::map<Key, Val> with a transparent comparator.
     *
     * Represents an ordered map (dictionary).
     * @tparam Key The key type.
     * @tparam Val The value type.
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief Alias for ankerl::unordered_dense::map<Key, Val>.
     *
     * High-performance unordered map using Robin Hood hashing.
     * @tparam Key The key type.
     * @tparam Val The value type.
     */
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    /**
     * @brief Alias for std::function<Tp>.
     *
     * Represents a callable object.
     * @tparam Tp The call signature.
     */
    template <typename Tp>
    using Fn = std::function<Tp>;

    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = Unit, typename Er = error::ShelterError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::ShelterError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace shelter::utils
