//
// Values, lazy views and cursors handed out by basic_parser.
//
// Views (lazy_number, lazy_string) are cheap copyable handles that are
// valid until the parser advances. Cursors (array_cursor, object_cursor)
// are move-only and claim their container until destroyed.
//

#ifndef LZJSON_VIEWS_HPP
#define LZJSON_VIEWS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <ostream>
#include <utility>
#include <stdexcept>
#include <type_traits>

#include "core.hpp"
#include "number.hpp"
#include "internal/config.hpp"
#include "internal/util.hpp"
#include "internal/unicode.hpp"
#include "internal/context.hpp"
#include "internal/numconv.hpp"

namespace lzjson {

template <typename Source>
class basic_parser;

template <typename Source>
class basic_value;

namespace internal {

// Scalar whose bytes the parser is still holding.
enum pending_kind : unsigned char
{
    PENDING_none,
    PENDING_number,
    PENDING_string
};

// Feeds decoded UTF-8 to a callable taking char32_t.
// Input is well-formed (the scanner validated it).
template <typename Func>
class utf8_decoder
{
public:
    explicit utf8_decoder(Func& f) noexcept : m_f(&f), m_cp(0), m_need(0) {}

    inline void operator()(const char* s, std::size_t n)
    {
        for (std::size_t i = 0; i < n; ++i)
        {
            const unsigned char b = static_cast<unsigned char>(s[i]);
            if (m_need == 0)
            {
                if (b < 0x80) { (*m_f)(static_cast<char32_t>(b)); continue; }
                else if (b >= 0xf0) { m_cp = b & 0x07; m_need = 3; }
                else if (b >= 0xe0) { m_cp = b & 0x0f; m_need = 2; }
                else { m_cp = b & 0x1f; m_need = 1; }
            }
            else
            {
                m_cp = (m_cp << 6) | (b & 0x3f);
                if (--m_need == 0)
                    (*m_f)(static_cast<char32_t>(m_cp));
            }
        }
    }

private:
    Func* m_f;
    iutil::cp_t m_cp;
    int m_need;
};

}


// Decoded string that either points into the parser's buffer or owns
// its bytes. A borrowed string is valid until the parser advances or
// the string is read with read_into().
class cow_string
{
public:
    cow_string(const char* data, std::size_t size) noexcept :
        m_data(data), m_size(size), m_borrowed(true)
    {}

    explicit cow_string(std::string&& owned) noexcept :
        m_data(nullptr), m_size(owned.size()), m_borrowed(false), m_owned(std::move(owned))
    {}

    inline const char* data(void) const noexcept { return m_borrowed ? m_data : m_owned.data(); }

    inline std::size_t size(void) const noexcept { return m_size; }

    // True if no copy was made.
    inline bool borrowed(void) const noexcept { return m_borrowed; }

    inline std::string str(void) const { return std::string(data(), m_size); }

private:
    const char* m_data;
    std::size_t m_size;
    bool m_borrowed;
    std::string m_owned;
};


// Number whose text is still in the parser's buffer.
template <typename Source>
class lazy_number
{
public:
    using parser_type = basic_parser<Source>;

    // Convert to T (integral or floating-point).
    // Integral T: fails with ERROR_not_integer if the number has a
    // fraction or exponent, ERROR_out_of_range if it does not fit.
    // Floating T: fails with ERROR_out_of_range if the result is not finite.
    template <typename T>
    inline T read(void) const
    {
        static_assert(std::is_arithmetic<T>::value && !std::is_same<T, bool>::value,
            "T must be an integral or floating-point type.");

        return m_parser->guarded([&]() -> T {
            m_parser->check_view(m_gen, internal::PENDING_number);

            T value;
            error e = internal::numconv::to(m_parser->number_begin(), m_parser->number_end(), value);
            if (e) throw parse_error(m_parser->offset(), e);
            return value;
        });
    }

    // intmax_t if the number is an integer that fits, else uintmax_t if
    // it fits, else double.
    inline number read_number(void) const
    {
        return m_parser->guarded([&]() -> number {
            m_parser->check_view(m_gen, internal::PENDING_number);

            number value;
            error e = internal::numconv::to_number(m_parser->number_begin(), m_parser->number_end(), value);
            if (e) throw parse_error(m_parser->offset(), e);
            return value;
        });
    }

    // Number text exactly as it appears in the input.
    inline std::string raw(void) const
    {
        return m_parser->guarded([&]() -> std::string {
            m_parser->check_view(m_gen, internal::PENDING_number);
            return std::string(m_parser->number_begin(), m_parser->number_end());
        });
    }

    // True if the text has neither fraction nor exponent.
    inline bool is_integer(void) const
    {
        return m_parser->guarded([&]() -> bool {
            m_parser->check_view(m_gen, internal::PENDING_number);
            return internal::numconv::is_integer_text(m_parser->number_begin(), m_parser->number_end());
        });
    }

private:
    friend class basic_value<Source>;

    lazy_number(parser_type* parser, std::uint64_t gen) noexcept :
        m_parser(parser), m_gen(gen)
    {}

private:
    parser_type* m_parser;
    std::uint64_t m_gen;
};


// String whose body has not been read yet.
template <typename Source>
class lazy_string
{
public:
    using parser_type = basic_parser<Source>;

    // Decode the whole string. The raw string must fit in
    // options::max_buffer_capacity. Can be called again until
    // the parser advances, or until read_into() is called.
    inline std::string read_owned(void) const
    {
        return m_parser->guarded([&]() -> std::string {
            m_parser->check_view(m_gen, internal::PENDING_string);
            return m_parser->string_owned();
        });
    }

    // Decode the whole string, pointing into the parser's buffer when the
    // string has no escapes and copying otherwise. Same limits as read_owned().
    inline cow_string read_cow(void) const
    {
        return m_parser->guarded([&]() -> cow_string {
            m_parser->check_view(m_gen, internal::PENDING_string);
            return m_parser->string_cow();
        });
    }

    // Stream the decoded string in chunks to sink(const char*, std::size_t).
    // Uses constant memory. Single-pass: the view expires afterwards.
    template <typename Sink>
    inline void read_into(Sink&& sink) const
    {
        m_parser->guarded([&]() {
            m_parser->check_view(m_gen, internal::PENDING_string);
            m_parser->string_into(sink);
        });
    }

    // Stream the decoded string to os.
    inline void write_to(std::ostream& os) const
    {
        read_into([&os](const char* s, std::size_t n) {
            os.write(s, static_cast<std::streamsize>(n));
        });
    }

    // Call f(char32_t) once per decoded Unicode scalar value.
    // Single-pass like read_into().
    template <typename Func>
    inline void read_chars(Func&& f) const
    {
        internal::utf8_decoder<typename std::remove_reference<Func>::type> dec(f);
        read_into(dec);
    }

private:
    friend class basic_value<Source>;

    lazy_string(parser_type* parser, std::uint64_t gen) noexcept :
        m_parser(parser), m_gen(gen)
    {}

private:
    parser_type* m_parser;
    std::uint64_t m_gen;
};


template <typename Source>
class array_cursor;

template <typename Source>
class object_cursor;

// Value produced by the parser or a cursor.
// Scalars are read through views. Containers are entered with
// as_array()/as_object(); a container that is never entered is
// skipped the next time its parent advances.
template <typename Source>
class basic_value
{
public:
    using parser_type = basic_parser<Source>;

    basic_value(void) noexcept :
        m_parser(nullptr), m_gen(0), m_kind(VALUE_null), m_bool(false), m_depth(0), m_id(0)
    {}

    inline value_kind kind(void) const noexcept { return m_kind; }

    inline bool is_null(void) const noexcept { return m_kind == VALUE_null; }
    inline bool is_bool(void) const noexcept { return m_kind == VALUE_bool; }
    inline bool is_number(void) const noexcept { return m_kind == VALUE_number; }
    inline bool is_string(void) const noexcept { return m_kind == VALUE_string; }
    inline bool is_array(void) const noexcept { return m_kind == VALUE_array; }
    inline bool is_object(void) const noexcept { return m_kind == VALUE_object; }

    // Throws std::logic_error if not a bool.
    inline bool as_bool(void) const
    {
        expect(VALUE_bool);
        return m_bool;
    }

    // Throws std::logic_error if not a number.
    inline lazy_number<Source> as_number(void) const
    {
        expect(VALUE_number);
        return { m_parser, m_gen };
    }

    // Throws std::logic_error if not a string.
    inline lazy_string<Source> as_string(void) const
    {
        expect(VALUE_string);
        return { m_parser, m_gen };
    }

    // Open a cursor on the array.
    // Throws std::logic_error if this is not an array, if a cursor was
    // already opened on it, or if the parser already skipped it.
    inline array_cursor<Source> as_array(void) const
    {
        expect(VALUE_array);
        return { m_parser, claim() };
    }

    // As as_array(), for objects.
    inline object_cursor<Source> as_object(void) const
    {
        expect(VALUE_object);
        return { m_parser, claim() };
    }

private:
    friend class basic_parser<Source>;

    basic_value(parser_type* parser, std::uint64_t gen, value_kind kind) noexcept :
        m_parser(parser), m_gen(gen), m_kind(kind), m_bool(false), m_depth(0), m_id(0)
    {}

    inline void expect(value_kind kind) const
    {
        if (m_kind != kind)
            throw std::logic_error(std::string("lzjson: value is ") +
                value_kind_name(m_kind) + ", not " + value_kind_name(kind) + ".");
    }

    inline internal::frame_ref claim(void) const
    {
        internal::context_stack& ctx = m_parser->context();
        if (!ctx.contains(m_depth, m_id))
            throw std::logic_error("lzjson: container was already skipped.");

        internal::frame& f = ctx.at(m_depth);
        if (f.opened)
            throw std::logic_error("lzjson: container was already opened.");

        f.opened = true;
        f.held = true;
        return { ctx, m_depth, m_id };
    }

private:
    parser_type* m_parser;
    std::uint64_t m_gen;
    value_kind m_kind;
    bool m_bool;
    // container frame
    std::size_t m_depth;
    std::uint64_t m_id;
};


// Iterates the elements of an array.
template <typename Source>
class array_cursor
{
public:
    using parser_type = basic_parser<Source>;
    using value_type = basic_value<Source>;

    array_cursor(array_cursor&&) = default;
    array_cursor& operator=(array_cursor&&) = default;

    array_cursor(const array_cursor&) = delete;
    array_cursor& operator=(const array_cursor&) = delete;

    // Read the next element into out.
    // Returns false once the closing ']' has been consumed.
    // Throws std::logic_error if a cursor on a child is still alive,
    // or if an ancestor already skipped this array.
    inline bool next(value_type& out)
    {
        out = value_type();
        if (m_done) return false;

        if (!m_parser->pull(m_ref, nullptr, out))
            m_done = true;
        return !m_done;
    }

    // Consume the rest of the array now.
    inline void skip(void)
    {
        if (m_done) return;
        m_parser->skip_container(m_ref);
        m_done = true;
    }

    inline bool done(void) const noexcept { return m_done; }

    // Nesting depth of this array (1 for a top-level array).
    inline std::size_t depth(void) const noexcept { return m_ref.depth(); }

private:
    friend class basic_value<Source>;

    array_cursor(parser_type* parser, internal::frame_ref&& ref) noexcept :
        m_parser(parser), m_ref(std::move(ref)), m_done(false)
    {}

private:
    parser_type* m_parser;
    internal::frame_ref m_ref;
    bool m_done;
};


// Iterates the members of an object.
template <typename Source>
class object_cursor
{
public:
    using parser_type = basic_parser<Source>;
    using value_type = basic_value<Source>;

    object_cursor(object_cursor&&) = default;
    object_cursor& operator=(object_cursor&&) = default;

    object_cursor(const object_cursor&) = delete;
    object_cursor& operator=(const object_cursor&) = delete;

    // Read the next member into key and out.
    // Returns false once the closing '}' has been consumed.
    // Throws std::logic_error like array_cursor::next().
    inline bool next(std::string& key, value_type& out)
    {
        out = value_type();
        if (m_done) return false;

        if (!m_parser->pull(m_ref, &key, out))
            m_done = true;
        return !m_done;
    }

    // Consume the rest of the object now.
    inline void skip(void)
    {
        if (m_done) return;
        m_parser->skip_container(m_ref);
        m_done = true;
    }

    inline bool done(void) const noexcept { return m_done; }

    inline std::size_t depth(void) const noexcept { return m_ref.depth(); }

private:
    friend class basic_value<Source>;

    object_cursor(parser_type* parser, internal::frame_ref&& ref) noexcept :
        m_parser(parser), m_ref(std::move(ref)), m_done(false)
    {}

private:
    parser_type* m_parser;
    internal::frame_ref m_ref;
    bool m_done;
};

}

#endif
