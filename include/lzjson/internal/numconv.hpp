//
// Conversion of validated JSON number text to C++ arithmetic types.
// Input is always a complete token accepted by number_scanner.
//

#ifndef LZJSON_INTERNAL_NUMCONV_HPP
#define LZJSON_INTERNAL_NUMCONV_HPP

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <type_traits>
#include <system_error>

#include "config.hpp"
#include "util.hpp"
#include "../core.hpp"
#include "../number.hpp"

#if LZJSON_USE_FASTFLOAT
#include <fast_float/fast_float.h>
#else
#include <clocale>
#include <locale.h>
#endif

namespace lzjson {
namespace internal {

#if !LZJSON_USE_FASTFLOAT
namespace util {

#ifdef _MSC_VER
using locale_t = ::_locale_t;
#define LZJSON_NEW_CLOC ::_create_locale(LC_ALL, "C")
#else
using ::locale_t;
#define LZJSON_NEW_CLOC ::newlocale(LC_ALL_MASK, "C", 0)
#endif

LZJSON_NEVER_INLINE inline
iutil::locale_t c_loc() noexcept
{
    static iutil::locale_t res = LZJSON_NEW_CLOC;
    return res;
}

// C-locale string to fp conversion. T is float, double or long double.
template <typename T>
LZJSON_ALWAYS_INLINE T strtofp(const char* src, char** eptr) noexcept;

template <>
LZJSON_ALWAYS_INLINE float strtofp(const char* src, char** eptr) noexcept {
    return ::LZJSON_MSVC_OR_POSIX(strtof_l)(src, eptr, c_loc());
}
template <>
LZJSON_ALWAYS_INLINE double strtofp(const char* src, char** eptr) noexcept {
    return ::LZJSON_MSVC_OR_POSIX(strtod_l)(src, eptr, c_loc());
}
template <>
LZJSON_ALWAYS_INLINE long double strtofp(const char* src, char** eptr) noexcept {
    return ::LZJSON_MSVC_OR_POSIX(strtold_l)(src, eptr, c_loc());
}

}
#endif

#if LZJSON_USE_FASTFLOAT
// True if T is supported by fast_float.
template <typename T>
using is_ff_type = std::integral_constant<bool,
    std::is_same<T, float>::value || std::is_same<T, double>::value>;
#endif

class numconv
{
public:
    // True if [first, last) has neither fraction nor exponent.
    static inline bool is_integer_text(const char* first, const char* last) noexcept
    {
        for (; first != last; ++first)
        {
            if (*first == 0x2e || *first == 0x65 || *first == 0x45) // '.', 'e', 'E'
                return false;
        }
        return true;
    }

    template <typename UintT>
    static inline error to_uintg(const char* first, const char* last, UintT& out_value)
    {
        if (first == last || *first == 0x2d) // '-'
            return first == last ? ERROR_invalid_num : ERROR_out_of_range;

        constexpr UintT max = std::numeric_limits<UintT>::max();

        out_value = 0;
        for (; first != last; ++first)
        {
            UintT digit = static_cast<UintT>(*first - 0x30);
            if (out_value > (max - digit) / 10)
                return ERROR_out_of_range;
            out_value = static_cast<UintT>(10 * out_value + digit);
        }
        return ERROR_none;
    }

    template <typename IntT>
    static inline error to_intg(const char* first, const char* last, IntT& out_value)
    {
        using UintT = iutil::make_unsigned_t<IntT>;

        bool neg = first != last && *first == 0x2d; // '-'
        if (neg) ++first;

        UintT uvalue;
        error e = to_uintg(first, last, uvalue);
        if (e) return e;

        if (neg) {
            if (uvalue > iutil::absu(std::numeric_limits<IntT>::min()))
                return ERROR_out_of_range;
        }
        else if (uvalue > static_cast<UintT>(std::numeric_limits<IntT>::max()))
            return ERROR_out_of_range;

        out_value = neg ? iutil::uneg<IntT>(uvalue) : static_cast<IntT>(uvalue);
        return ERROR_none;
    }

#if LZJSON_USE_FASTFLOAT
    template <typename T, iutil::enable_if_t<is_ff_type<T>::value> = 0>
    static inline error to_fp(const char* first, const char* last, T& out_val)
    {
        auto res = fast_float::from_chars(first, last, out_val);
        if (res.ptr != last ||
            (res.ec != std::errc() && res.ec != std::errc::result_out_of_range))
            return ERROR_invalid_num;
        // out_val is infinity on overflow and zero on underflow,
        // whether or not ec says out of range
        if (std::isinf(out_val))
            return ERROR_out_of_range;
        return ERROR_none;
    }

    // long double goes through double
    template <typename T, iutil::enable_if_t<!is_ff_type<T>::value> = 0>
    static inline error to_fp(const char* first, const char* last, T& out_val)
    {
        double val;
        error e = to_fp(first, last, val);
        out_val = static_cast<T>(val);
        return e;
    }
#else
    template <typename T>
    static inline error to_fp(const char* first, const char* last, T& out_val)
    {
        // strtod needs a terminator
        std::string buf(first, last);
        char* eptr;
        int& Errno = errno;

        Errno = 0;
        out_val = iutil::strtofp<T>(buf.c_str(), &eptr);
        if (eptr != buf.c_str() + buf.size())
            return ERROR_invalid_num;
        if (Errno == ERANGE && std::isinf(out_val))
            return ERROR_out_of_range;
        return ERROR_none;
    }
#endif

    // Integral T: rejects fraction/exponent. Floating T: any number.
    template <typename T, iutil::enable_if_t<
        iutil::is_nb_signed_integral<T>::value> = 0>
    static inline error to(const char* first, const char* last, T& out_value)
    {
        if (!is_integer_text(first, last))
            return ERROR_not_integer;
        return to_intg(first, last, out_value);
    }

    template <typename T, iutil::enable_if_t<
        iutil::is_nb_unsigned_integral<T>::value> = 0>
    static inline error to(const char* first, const char* last, T& out_value)
    {
        if (!is_integer_text(first, last))
            return ERROR_not_integer;
        return to_uintg(first, last, out_value);
    }

    template <typename T, iutil::enable_if_t<
        std::is_floating_point<T>::value> = 0>
    static inline error to(const char* first, const char* last, T& out_value)
    {
        return to_fp(first, last, out_value);
    }

    // intmax if it fits, else uintmax if it fits, else double.
    static inline error to_number(const char* first, const char* last, number& out_value)
    {
        if (is_integer_text(first, last))
        {
            std::intmax_t i;
            if (to_intg(first, last, i) == ERROR_none) {
                out_value = i;
                return ERROR_none;
            }
            std::uintmax_t u;
            if (to_uintg(first, last, u) == ERROR_none) {
                out_value = u;
                return ERROR_none;
            }
        }

        double d;
        error e = to_fp(first, last, d);
        if (e) return e;
        out_value = d;
        return ERROR_none;
    }
};

}}

#endif
