#ifndef LZJSON_INTERNAL_UTIL_HPP
#define LZJSON_INTERNAL_UTIL_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "config.hpp"

namespace lzjson {

namespace internal {
namespace util {}
}
namespace iutil = internal::util;

namespace internal {
namespace util {

template <bool test, typename T = int>
using enable_if_t = typename std::enable_if<test, T>::type;

template <typename A, typename B, typename T = int>
using enable_if_same_t = iutil::enable_if_t<std::is_same<A, B>::value, T>;

#ifdef __cpp_lib_remove_cvref
using std::remove_cvref_t;
#else
template <typename T>
using remove_cvref_t = typename std::remove_cv<
    typename std::remove_reference<T>::type>::type;
#endif

template <typename T>
using make_unsigned_t = typename std::make_unsigned<T>::type;

template <typename T>
using is_nb_signed_integral = std::integral_constant<bool,
    !std::is_same<T, bool>::value && std::is_integral<T>::value && std::is_signed<T>::value>;

template <typename T>
using is_nb_unsigned_integral = std::integral_constant<bool,
    !std::is_same<T, bool>::value && std::is_integral<T>::value && std::is_unsigned<T>::value>;


// Absolute value of a signed integral type. Converts to unsigned equivalent.
template <typename T>
constexpr make_unsigned_t<T> absu(T value) noexcept
{
    static_assert(
        std::numeric_limits<T>::max() + std::numeric_limits<T>::min() == 0 ||
        // can unsigned T store |signed min T|?
        std::numeric_limits<make_unsigned_t<T>>::digits > std::numeric_limits<T>::digits,
        "Platform not supported.");

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4146) 
#endif
    return value < 0 ? -static_cast<make_unsigned_t<T>>(value) : static_cast<make_unsigned_t<T>>(value);
#ifdef _MSC_VER
#pragma warning(pop)
#endif
}

// Negate an unsigned magnitude and convert to signed.
// Behavior is undefined if the result is below min() of T.
template <typename T>
inline T uneg(make_unsigned_t<T> uvalue) noexcept
{
    constexpr T ubound = std::numeric_limits<T>::max();
    LZJSON_ASSERT(uvalue <= absu(std::numeric_limits<T>::min()));

    return uvalue <= static_cast<make_unsigned_t<T>>(ubound) ? 
        static_cast<T>(-static_cast<T>(uvalue)) :
        static_cast<T>(-ubound - static_cast<T>(uvalue - static_cast<make_unsigned_t<T>>(ubound)));
}


template <typename CharT>
constexpr bool is_digit(CharT c) noexcept { return c >= 0x30 && c <= 0x39; }

template <typename CharT>
inline bool is_ws(CharT c) noexcept
{
    switch (c)
    {
        case 0x20: // space
        case 0x09: // horizontal tab
        case 0x0a: // line feed
        case 0x0d: // carriage return
            return true;
        default: 
            return false;
    }
}

// Value of a hex digit, or -1.
inline int hex_val(char c) noexcept
{
    if (c >= 0x30 && c <= 0x39) return c - 0x30;        // '0' to '9'
    if (c >= 0x41 && c <= 0x46) return c - 0x41 + 10;   // 'A' to 'F'
    if (c >= 0x61 && c <= 0x66) return c - 0x61 + 10;   // 'a' to 'f'
    return -1;
}

// Unescaped value of a single-character escape (the char after '\'),
// or 0 if c does not start one. 'u' is handled separately.
inline char unescape_ctrl(char c) noexcept
{
    switch (c)
    {
    case 0x22: return 0x22; // "
    case 0x5c: return 0x5c; // '\'
    case 0x2f: return 0x2f; // /
    case 0x62: return '\b';
    case 0x66: return '\f';
    case 0x6e: return '\n';
    case 0x72: return '\r';
    case 0x74: return '\t';
    default:   return 0;
    }
}

// Grow a capacity geometrically, clamped to [atleast, max_cap].
inline std::size_t recommend_growth(std::size_t cur, std::size_t atleast, std::size_t max_cap) noexcept
{
    std::size_t cap = cur > max_cap / 2 ? max_cap : cur * 2;
    if (cap < atleast) cap = atleast;
    return cap > max_cap ? max_cap : cap;
}

}}}

#endif
