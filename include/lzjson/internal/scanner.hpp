//
// Lexical scanner.
//
// Each scanner recognizes one token kind from a window of buffered
// bytes. None of them assumes the token is fully buffered: reaching
// the end of the window returns SCAN_more, and the next call resumes
// at the same sub-state (e.g. halfway through a \uXXXX escape).
// Positions are indices into the window; the caller keeps them valid
// across refills.
//

#ifndef LZJSON_INTERNAL_SCANNER_HPP
#define LZJSON_INTERNAL_SCANNER_HPP

#include <cstddef>
#include <cstring>

#include "config.hpp"
#include "util.hpp"
#include "unicode.hpp"
#include "../core.hpp"

namespace lzjson {
namespace internal {

enum scan_status : unsigned
{
    SCAN_done,
    // window exhausted before the token ended
    SCAN_more,
    SCAN_error
};

// Output that discards everything.
struct null_output
{
    inline void put(char) noexcept {}
    inline void put_n(const char*, std::size_t) noexcept {}
};

// Output that only counts the bytes written.
class count_output
{
public:
    count_output(void) noexcept : m_count(0) {}

    inline void put(char) noexcept { ++m_count; }
    inline void put_n(const char*, std::size_t n) noexcept { m_count += n; }

    inline std::size_t count(void) const noexcept { return m_count; }

private:
    std::size_t m_count;
};

// Output appending to a std::string-like container.
template <typename String>
class string_output
{
public:
    explicit string_output(String& str) noexcept : m_str(&str) {}

    inline void put(char c) { m_str->push_back(c); }
    inline void put_n(const char* s, std::size_t n) { m_str->append(s, n); }

private:
    String* m_str;
};

// Returns the index of the first non-whitespace byte in [pos, end).
inline std::size_t skip_ws(const char* data, std::size_t pos, std::size_t end) noexcept
{
    while (pos < end && iutil::is_ws(data[pos]))
        ++pos;
    return pos;
}


//
// Scans a string body (the opening quote already consumed) up to and
// including the closing quote, validating escapes, control characters
// and UTF-8, and writing the unescaped bytes to an output.
//
class string_scanner
{
public:
    string_scanner(void) noexcept :
        m_state(STR_body), m_hex_left(0), m_unit(0), m_high(0), m_err(ERROR_none)
    {}

    // Error set by the last SCAN_error.
    inline error err(void) const noexcept { return m_err; }

    template <typename Output>
    scan_status scan(const char* data, std::size_t& pos, std::size_t end, Output& out)
    {
        while (pos < end)
        {
            const unsigned char b = static_cast<unsigned char>(data[pos]);

            switch (m_state)
            {
            case STR_body:
            {
                if (!m_utf8.complete() && b < 0x80)
                    return fail(ERROR_str_utf8);

                // copy runs of plain ASCII in one go
                std::size_t run = pos;
                while (run < end && is_plain(static_cast<unsigned char>(data[run])))
                    ++run;
                if (run != pos)
                {
                    out.put_n(data + pos, run - pos);
                    pos = run;
                    continue;
                }

                if (b == 0x22) { // '"'
                    ++pos;
                    return SCAN_done;
                }
                else if (b == 0x5c) // '\'
                    m_state = STR_escape;
                else if (b < 0x20)
                    return fail(ERROR_str_ctrl_char);
                else
                {
                    if (!m_utf8.feed(b))
                        return fail(ERROR_str_utf8);
                    out.put(static_cast<char>(b));
                }
                break;
            }
            case STR_escape:
                if (b == 0x75) { // 'u'
                    start_hex(STR_hex);
                }
                else
                {
                    char c = iutil::unescape_ctrl(static_cast<char>(b));
                    if (c == 0)
                        return fail(ERROR_str_escape);
                    out.put(c);
                    m_state = STR_body;
                }
                break;

            case STR_hex:
            case STR_low_hex:
            {
                int v = iutil::hex_val(static_cast<char>(b));
                if (v < 0)
                    return fail(ERROR_str_escape);

                m_unit = (m_unit << 4) | static_cast<iutil::cp_t>(v);
                if (--m_hex_left == 0)
                {
                    if (m_state == STR_hex)
                    {
                        if (iutil::is_high_surrogate(m_unit)) {
                            m_high = m_unit;
                            m_state = STR_low_backslash;
                        }
                        else if (iutil::is_low_surrogate(m_unit))
                            return fail(ERROR_str_surrogate);
                        else
                            emit(m_unit, out);
                    }
                    else
                    {
                        if (!iutil::is_low_surrogate(m_unit))
                            return fail(ERROR_str_surrogate);
                        emit(iutil::combine_surrogates(m_high, m_unit), out);
                    }
                }
                break;
            }
            case STR_low_backslash:
                if (b != 0x5c) // '\'
                    return fail(ERROR_str_surrogate);
                m_state = STR_low_u;
                break;

            case STR_low_u:
                if (b != 0x75) // 'u'
                    return fail(ERROR_str_surrogate);
                start_hex(STR_low_hex);
                break;
            }
            ++pos;
        }
        return SCAN_more;
    }

private:
    enum state_t : unsigned char
    {
        STR_body,
        STR_escape,
        STR_hex,
        STR_low_backslash,
        STR_low_u,
        STR_low_hex
    };

    static inline bool is_plain(unsigned char b) noexcept
    {
        return b >= 0x20 && b < 0x80 && b != 0x22 && b != 0x5c;
    }

    inline void start_hex(state_t state) noexcept
    {
        m_state = state;
        m_hex_left = 4;
        m_unit = 0;
    }

    template <typename Output>
    inline void emit(iutil::cp_t cp, Output& out)
    {
        char enc[4];
        out.put_n(enc, static_cast<std::size_t>(iutil::utf8_encode(cp, enc)));
        m_state = STR_body;
    }

    inline scan_status fail(error e) noexcept
    {
        m_err = e;
        return SCAN_error;
    }

private:
    state_t m_state;
    int m_hex_left;
    iutil::cp_t m_unit;
    iutil::cp_t m_high;
    iutil::utf8_validator m_utf8;
    error m_err;
};


//
// Scans a number: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
// The first byte past the number is not consumed.
//
class number_scanner
{
public:
    number_scanner(void) noexcept :
        m_state(NUM_start), m_integer(true), m_err(ERROR_none)
    {}

    inline error err(void) const noexcept { return m_err; }

    // True if the number has neither fraction nor exponent.
    inline bool is_integer(void) const noexcept { return m_integer; }

    // eof: no bytes follow the window.
    scan_status scan(const char* data, std::size_t& pos, std::size_t end, bool eof) noexcept
    {
        for (; pos < end; ++pos)
        {
            const char c = data[pos];
            const bool digit = iutil::is_digit(c);

            switch (m_state)
            {
            case NUM_start:
                if (c == 0x2d) m_state = NUM_minus; // '-'
                else if (c == 0x30) m_state = NUM_zero;
                else if (digit) m_state = NUM_int;
                else return fail(ERROR_invalid_num);
                break;
            case NUM_minus:
                if (c == 0x30) m_state = NUM_zero;
                else if (digit) m_state = NUM_int;
                else return fail(ERROR_invalid_num);
                break;
            case NUM_zero:
                if (digit) return fail(ERROR_invalid_num); // leading zero
                if (!fraction_or_exponent(c)) return SCAN_done;
                break;
            case NUM_int:
                if (!digit && !fraction_or_exponent(c)) return SCAN_done;
                break;
            case NUM_dot:
                if (!digit) return fail(ERROR_invalid_num);
                m_state = NUM_frac;
                break;
            case NUM_frac:
                if (!digit && !exponent(c)) return SCAN_done;
                break;
            case NUM_exp_start:
                if (c == 0x2b || c == 0x2d) m_state = NUM_exp_sign; // '+', '-'
                else if (digit) m_state = NUM_exp;
                else return fail(ERROR_invalid_num);
                break;
            case NUM_exp_sign:
                if (!digit) return fail(ERROR_invalid_num);
                m_state = NUM_exp;
                break;
            case NUM_exp:
                if (!digit) return SCAN_done;
                break;
            }
        }

        if (!eof)
            return SCAN_more;

        switch (m_state)
        {
        case NUM_zero:
        case NUM_int:
        case NUM_frac:
        case NUM_exp:
            return SCAN_done;
        default:
            return fail(ERROR_unexpected_eof);
        }
    }

private:
    enum state_t : unsigned char
    {
        NUM_start,
        NUM_minus,
        NUM_zero,
        NUM_int,
        NUM_dot,
        NUM_frac,
        NUM_exp_start,
        NUM_exp_sign,
        NUM_exp
    };

    inline bool exponent(char c) noexcept
    {
        if (c != 0x65 && c != 0x45) // 'e', 'E'
            return false;
        m_state = NUM_exp_start;
        m_integer = false;
        return true;
    }

    inline bool fraction_or_exponent(char c) noexcept
    {
        if (c == 0x2e) { // '.'
            m_state = NUM_dot;
            m_integer = false;
            return true;
        }
        return exponent(c);
    }

    inline scan_status fail(error e) noexcept
    {
        m_err = e;
        return SCAN_error;
    }

private:
    state_t m_state;
    bool m_integer;
    error m_err;
};


//
// Scans one of the literals true, false, null.
// The literal must be followed by whitespace, ',', ']', '}' or the
// end of input; the byte after it is checked but not consumed.
//
class literal_scanner
{
public:
    literal_scanner(const char* word, std::size_t len) noexcept :
        m_word(word), m_len(len), m_matched(0), m_err(ERROR_none)
    {}

    inline error err(void) const noexcept { return m_err; }

    scan_status scan(const char* data, std::size_t& pos, std::size_t end, bool eof) noexcept
    {
        while (m_matched < m_len)
        {
            if (pos == end)
            {
                if (!eof) return SCAN_more;
                m_err = ERROR_unexpected_eof;
                return SCAN_error;
            }
            if (data[pos] != m_word[m_matched])
            {
                m_err = ERROR_invalid_literal;
                return SCAN_error;
            }
            ++pos;
            ++m_matched;
        }

        if (pos == end)
            return eof ? SCAN_done : SCAN_more;
        if (!ends_literal(data[pos]))
        {
            m_err = ERROR_invalid_literal;
            return SCAN_error;
        }
        return SCAN_done;
    }

private:
    static inline bool ends_literal(char c) noexcept
    {
        // ',', ']', '}'
        return iutil::is_ws(c) || c == 0x2c || c == 0x5d || c == 0x7d;
    }

private:
    const char* m_word;
    std::size_t m_len;
    std::size_t m_matched;
    error m_err;
};

}}

#endif
