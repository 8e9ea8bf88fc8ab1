#ifndef LZJSON_NUMBER_HPP
#define LZJSON_NUMBER_HPP

#include <cstdint>
#include <utility>
#include <string>
#include <stdexcept>

#include "internal/config.hpp"
#include "internal/util.hpp"

namespace lzjson {

// Materialized JSON number: the narrowest of intmax, uintmax and double
// that holds the text exactly (double for anything else).
class number final
{
public:
    enum type_t : int
    {
        TYPE_intmax,
        TYPE_uintmax,
        TYPE_double
    };

public:
    template <typename T,
        iutil::enable_if_t<iutil::is_nb_signed_integral<T>::value, int> = 0>
    number(T value) noexcept : m_intg(value), m_type(TYPE_intmax)
    {}

    template <typename T,
        iutil::enable_if_t<iutil::is_nb_unsigned_integral<T>::value, int> = 0>
    number(T value) noexcept : m_uintg(value), m_type(TYPE_uintmax)
    {}

    number(double value) noexcept : m_dbl(value), m_type(TYPE_double) {}

    number(void) noexcept : m_intg(0), m_type(TYPE_intmax) {}

    number(number&&) noexcept = default;
    number(const number&) noexcept = default;

    number& operator=(number&&) noexcept = default;
    number& operator=(const number&) noexcept = default;

    inline type_t type(void) const noexcept { return m_type; }

    inline bool is_integer(void) const noexcept { return m_type != TYPE_double; }

    // Get value.
    // Throws std::logic_error if active type is not T.
    template <typename T>
    inline T get(void) const;

    // Gets value if active type is T, else returns nullptr.
    template <typename T>
    inline const T* get_if(void) const noexcept;

    // Get active value, cast to T.
    template <typename T>
    inline T as(void) const noexcept;

    friend inline bool operator==(const number& a, const number& b) noexcept
    {
        if (a.m_type != b.m_type) return false;
        switch (a.m_type)
        {
        case TYPE_intmax: return a.m_intg == b.m_intg;
        case TYPE_uintmax: return a.m_uintg == b.m_uintg;
        default: return a.m_dbl == b.m_dbl;
        }
    }

    friend inline bool operator!=(const number& a, const number& b) noexcept { return !(a == b); }

private:
    union
    {
        double m_dbl;
        std::intmax_t m_intg;
        std::uintmax_t m_uintg;
    };
    type_t m_type;

    template <typename T>
    struct typehelper
    {
        static constexpr int typeidx = -1;
    };
};

template <> struct number::typehelper<double>
{
    static constexpr int typeidx = TYPE_double;

    static inline double get(const number& n) noexcept { return n.m_dbl; }
    static inline const double* cptr(const number& n) noexcept { return &n.m_dbl; }
};
template <> struct number::typehelper<std::intmax_t>
{
    static constexpr int typeidx = TYPE_intmax;

    static inline std::intmax_t get(const number& n) noexcept { return n.m_intg; }
    static inline const std::intmax_t* cptr(const number& n) noexcept { return &n.m_intg; }
};
template <> struct number::typehelper<std::uintmax_t>
{
    static constexpr int typeidx = TYPE_uintmax;

    static inline std::uintmax_t get(const number& n) noexcept { return n.m_uintg; }
    static inline const std::uintmax_t* cptr(const number& n) noexcept { return &n.m_uintg; }
};

template <typename T>
inline const T* number::get_if(void) const noexcept
{
    return typehelper<T>::typeidx == m_type ?
        typehelper<T>::cptr(*this) : nullptr;
}

template <typename T>
inline T number::get(void) const
{
    if (typehelper<T>::typeidx != m_type)
        throw std::logic_error(std::string(__func__) + ": Active type is not T.");

    return typehelper<T>::get(*this);
}

template <typename T>
inline T number::as(void) const noexcept
{
    switch (m_type)
    {
        case TYPE_intmax: return (T)m_intg;
        case TYPE_uintmax: return (T)m_uintg;
        default: return (T)m_dbl;
    }
}

}
#endif
