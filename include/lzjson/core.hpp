//
// Shared types: value kinds, errors and parser options.
//

#ifndef LZJSON_CORE_HPP
#define LZJSON_CORE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <stdexcept>

#include "internal/config.hpp"
#include "internal/util.hpp"

namespace lzjson {

enum value_kind : unsigned
{
    VALUE_null,
    VALUE_bool,
    VALUE_number,
    VALUE_string,
    VALUE_array,
    VALUE_object
};

inline const char* value_kind_name(value_kind kind)
{
    switch (kind)
    {
    case VALUE_null: return "null";
    case VALUE_bool: return "bool";
    case VALUE_number: return "number";
    case VALUE_string: return "string";
    case VALUE_array: return "array";
    case VALUE_object: return "object";
    default: return "Invalid VALUE";
    }
}

enum error_kind : unsigned
{
    ERRKIND_none,
    // Passed through from the byte source.
    ERRKIND_io,
    // Malformed token.
    ERRKIND_lexical,
    // Well-formed token in the wrong place, or a limit was hit.
    ERRKIND_structural,
    // A view was read after the parser moved past it.
    ERRKIND_view_expired,
    // A number cannot be represented by the requested type.
    ERRKIND_range
};

inline const char* error_kind_name(error_kind kind)
{
    switch (kind)
    {
    case ERRKIND_none: return "none";
    case ERRKIND_io: return "I/O";
    case ERRKIND_lexical: return "lexical";
    case ERRKIND_structural: return "structural";
    case ERRKIND_view_expired: return "view expired";
    case ERRKIND_range: return "range";
    default: return "Invalid ERRKIND";
    }
}

// always >= 0
enum error : int
{
    ERROR_none = 0,
    ERROR_io,
    // lexical
    ERROR_unexpected_byte,
    ERROR_unexpected_eof,
    ERROR_invalid_literal,
    ERROR_invalid_num,
    ERROR_str_escape,
    ERROR_str_surrogate,
    ERROR_str_ctrl_char,
    ERROR_str_utf8,
    // structural
    ERROR_unexpected_token,
    ERROR_eof_in_value,
    ERROR_token_item_sep,
    ERROR_token_key_sep,
    ERROR_expected_key,
    ERROR_trailing_comma,
    ERROR_trailing_data,
    ERROR_depth_exceeded,
    ERROR_token_too_large,
    // view
    ERROR_view_expired,
    // range
    ERROR_out_of_range,
    ERROR_not_integer
};

inline error_kind error_kind_of(error e)
{
    switch (e)
    {
    case ERROR_none:
        return ERRKIND_none;
    case ERROR_io:
        return ERRKIND_io;
    case ERROR_unexpected_byte:
    case ERROR_unexpected_eof:
    case ERROR_invalid_literal:
    case ERROR_invalid_num:
    case ERROR_str_escape:
    case ERROR_str_surrogate:
    case ERROR_str_ctrl_char:
    case ERROR_str_utf8:
        return ERRKIND_lexical;
    case ERROR_view_expired:
        return ERRKIND_view_expired;
    case ERROR_out_of_range:
    case ERROR_not_integer:
        return ERRKIND_range;
    default:
        return ERRKIND_structural;
    }
}

inline const char* error_msg(error e)
{
    switch (e)
    {
    case ERROR_none:             return "No error.";
    case ERROR_io:               return "I/O error.";
    case ERROR_unexpected_byte:  return "Unexpected byte.";
    case ERROR_unexpected_eof:   return "Unexpected end of input inside a token.";
    case ERROR_invalid_literal:  return "Invalid literal.";
    case ERROR_invalid_num:      return "Invalid number.";
    case ERROR_str_escape:       return "Invalid string escape.";
    case ERROR_str_surrogate:    return "Unpaired UTF-16 surrogate in string escape.";
    case ERROR_str_ctrl_char:    return "Unescaped control character in string.";
    case ERROR_str_utf8:         return "Malformed UTF-8 in string.";
    case ERROR_unexpected_token: return "Unexpected token.";
    case ERROR_eof_in_value:     return "Unexpected end of input.";
    case ERROR_token_item_sep:   return "Expected ','";
    case ERROR_token_key_sep:    return "Expected ':'";
    case ERROR_expected_key:     return "Expected object key.";
    case ERROR_trailing_comma:   return "Trailing comma.";
    case ERROR_trailing_data:    return "Document cannot have more than one root element.";
    case ERROR_depth_exceeded:   return "Maximum nesting depth exceeded.";
    case ERROR_token_too_large:  return "Token exceeds the maximum buffer capacity.";
    case ERROR_view_expired:     return "View read after the parser advanced past it.";
    case ERROR_out_of_range:     return "Out of range.";
    case ERROR_not_integer:      return "Number is not an integer.";
    default:                     return "Unknown error.";
    }
}

class parse_error : public std::runtime_error
{
public:
    parse_error(std::uint64_t offset, error e) :
        std::runtime_error(get_msg(offset, error_msg(e))),
        m_code(e), m_offset(offset)
    {}

    // detail is appended to the message of e.
    parse_error(std::uint64_t offset, error e, const std::string& detail) :
        std::runtime_error(get_msg(offset, std::string(error_msg(e)) + " " + detail)),
        m_code(e), m_offset(offset)
    {}

    inline error code(void) const noexcept { return m_code; }

    inline error_kind kind(void) const noexcept { return error_kind_of(m_code); }

    // Absolute byte offset into the input.
    inline std::uint64_t offset(void) const noexcept { return m_offset; }

private:
    static inline std::string get_msg(std::uint64_t off, const std::string& msg)
    {
        return "JSON parse error at offset " + std::to_string(off) + ": " + msg;
    }

private:
    error m_code;
    std::uint64_t m_offset;
};

// True if an error of this kind leaves the parser unusable.
// Every reported error does.
inline bool poisons(error_kind kind) noexcept
{
    return kind != ERRKIND_none;
}


// Parser options.
struct options
{
    // Maximum number of simultaneously open arrays/objects.
    std::size_t max_depth = LZJSON_DEFAULT_MAX_DEPTH;

    std::size_t initial_buffer_capacity = LZJSON_DEFAULT_BUFSIZE;

    // Largest token size. Numbers and literals may use one more byte
    // of buffer to find where they end.
    std::size_t max_buffer_capacity = LZJSON_DEFAULT_MAX_BUFSIZE;

    // Accept a stream of whitespace-separated top-level values.
    bool multiple_roots = false;

    // Throws std::invalid_argument if the options are unusable.
    inline void validate(void) const
    {
        if (max_depth == 0)
            throw std::invalid_argument("lzjson::options: max_depth is 0.");
        if (initial_buffer_capacity == 0 || max_buffer_capacity == 0)
            throw std::invalid_argument("lzjson::options: buffer capacity is 0.");
        if (initial_buffer_capacity > max_buffer_capacity)
            throw std::invalid_argument(
                "lzjson::options: initial_buffer_capacity exceeds max_buffer_capacity.");
    }
};

}

#endif
