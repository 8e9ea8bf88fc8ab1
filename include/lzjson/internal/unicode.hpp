//
// https://en.wikipedia.org/wiki/UTF-8#Codepage_layout
// https://stackoverflow.com/questions/6240055/
//

#ifndef LZJSON_INTERNAL_UNICODE_HPP
#define LZJSON_INTERNAL_UNICODE_HPP

#include <cstdint>

#include "config.hpp"

namespace lzjson {
namespace internal {
namespace util {

using cp_t = std::uint_least32_t;

inline bool is_high_surrogate(cp_t c) noexcept
{
    return (c & 0xfc00u) == 0xd800u;
}
inline bool is_low_surrogate(cp_t c) noexcept
{
    return (c & 0xfc00u) == 0xdc00u;
}

inline cp_t combine_surrogates(cp_t high, cp_t low) noexcept
{
    return (((high & 0x03ffu) << 10) | (low & 0x03ffu)) + 0x10000u;
}

// Encode a code point as UTF-8 into out (at least 4 chars).
// Returns the number of chars written.
inline int utf8_encode(cp_t cp, char* out) noexcept
{
    using uchar = unsigned char;

    if (cp < 0x80u) {
        out[0] = (char)(uchar)cp;
        return 1;
    }
    else if (cp < 0x800u)
    {
        out[0] = (char)(uchar)(0xc0u | (cp >> 6));
        out[1] = (char)(uchar)(0x80u | (cp & 0x3fu));
        return 2;
    }
    else if (cp < 0x10000u)
    {
        out[0] = (char)(uchar)(0xe0u | (cp >> 12));
        out[1] = (char)(uchar)(0x80u | ((cp >> 6) & 0x3fu));
        out[2] = (char)(uchar)(0x80u | (cp & 0x3fu));
        return 3;
    }
    else
    {
        out[0] = (char)(uchar)(0xf0u | (cp >> 18));
        out[1] = (char)(uchar)(0x80u | ((cp >> 12) & 0x3fu));
        out[2] = (char)(uchar)(0x80u | ((cp >> 6) & 0x3fu));
        out[3] = (char)(uchar)(0x80u | (cp & 0x3fu));
        return 4;
    }
}

//
// Incremental UTF-8 validator, fed one byte at a time.
// Rejects overlong forms, surrogates and code points above U+10FFFF.
//
class utf8_validator
{
public:
    utf8_validator(void) noexcept :
        m_need(0), m_lo(0x80), m_hi(0xbf)
    {}

    // True if no multi-byte sequence is in progress.
    inline bool complete(void) const noexcept { return m_need == 0; }

    // Returns false if b cannot continue the current sequence.
    inline bool feed(unsigned char b) noexcept
    {
        if (m_need == 0)
        {
            if (b < 0x80) return true;

            m_lo = 0x80; m_hi = 0xbf;
            if (b >= 0xc2 && b <= 0xdf) m_need = 1;
            else if (b >= 0xe0 && b <= 0xef)
            {
                m_need = 2;
                if (b == 0xe0) m_lo = 0xa0;      // overlong
                else if (b == 0xed) m_hi = 0x9f; // surrogates
            }
            else if (b >= 0xf0 && b <= 0xf4)
            {
                m_need = 3;
                if (b == 0xf0) m_lo = 0x90;      // overlong
                else if (b == 0xf4) m_hi = 0x8f; // > U+10FFFF
            }
            else return false;
            return true;
        }

        if (b < m_lo || b > m_hi)
            return false;

        m_lo = 0x80; m_hi = 0xbf;
        --m_need;
        return true;
    }

private:
    int m_need;
    unsigned char m_lo;
    unsigned char m_hi;
};

}}}

#endif
