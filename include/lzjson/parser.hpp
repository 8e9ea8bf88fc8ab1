#ifndef LZJSON_PARSER_HPP
#define LZJSON_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <stdexcept>

#include "internal/config.hpp"
#include "internal/util.hpp"
#include "internal/log.hpp"
#include "internal/buffers.hpp"
#include "internal/scanner.hpp"
#include "internal/context.hpp"

#include "core.hpp"
#include "concepts.hpp"
#include "views.hpp"

namespace lzjson {

//
// Streaming JSON parser over a byte source.
//
// next() yields top-level values; arrays and objects are walked with
// the cursors their values open. Memory use is bounded by the nesting
// depth and by the largest single token, not by the document size.
//
// Errors are reported as parse_error. Any parse_error poisons the
// parser: every later call rethrows the same error.
//
template <typename Source>
class basic_parser
{
    static_assert(is_byte_source<Source>::value, "Source is not a byte source.");

public:
    using source_type = Source;
    using value_type = basic_value<Source>;

public:
    // src must outlive the parser.
    // Throws std::invalid_argument if opts are invalid.
    explicit basic_parser(Source& src, const options& opts = options()) :
        m_opts(validated(opts)),
        m_buf(src, opts.initial_buffer_capacity, opts.max_buffer_capacity),
        m_ctx(opts.max_depth),
        m_gen(0),
        m_pending(internal::PENDING_none),
        m_pending_len(0),
        m_str_state(STRING_unread),
        m_root_seen(false)
    {}

    // views and cursors point into the parser
    basic_parser(const basic_parser&) = delete;
    basic_parser& operator=(const basic_parser&) = delete;

    // Read the next top-level value into out.
    // Returns false at the end of the stream.
    // Throws std::logic_error if a cursor on the previous value is still alive.
    inline bool next(value_type& out)
    {
        out = value_type();
        return guarded([&]() -> bool {
            return advance(0, nullptr, out);
        });
    }

    // Number of open containers.
    inline std::size_t depth(void) const noexcept { return m_ctx.depth(); }

    // Absolute offset of the first unconsumed byte.
    inline std::uint64_t offset(void) const noexcept { return m_buf.offset(); }

    // Current capacity of the refill buffer.
    inline std::size_t buffer_capacity(void) const noexcept { return m_buf.capacity(); }

    inline const options& opts(void) const noexcept { return m_opts; }

    // True once a parse_error was reported.
    inline bool poisoned(void) const noexcept { return static_cast<bool>(m_poison); }

private:
    friend class lazy_number<Source>;
    friend class lazy_string<Source>;
    friend class basic_value<Source>;
    friend class array_cursor<Source>;
    friend class object_cursor<Source>;

    enum step_result : unsigned char
    {
        STEP_end,
        STEP_null,
        STEP_true,
        STEP_false,
        STEP_number,
        STEP_string,
        STEP_array,
        STEP_object
    };

    enum string_state : unsigned char
    {
        // nothing scanned yet
        STRING_unread,
        // whole string in the window, m_pending_len bytes incl. quote
        STRING_buffered,
        // read_into() consumed part of it, m_sscan holds the position
        STRING_partial,
        // fully consumed
        STRING_streamed
    };

    static inline const options& validated(const options& opts)
    {
        opts.validate();
        return opts;
    }

    inline internal::context_stack& context(void) noexcept { return m_ctx; }

    [[noreturn]] static inline void fail(std::uint64_t offset, error e)
    {
        throw parse_error(offset, e);
    }

    // Runs f, poisoning the parser if f throws an error that poisons.
    template <typename Func>
    inline auto guarded(Func&& f) -> decltype(f())
    {
        if (m_poison)
            std::rethrow_exception(m_poison);

        try {
            return f();
        }
        catch (const parse_error& e) {
            if (poisons(e.kind()))
            {
                m_poison = std::current_exception();
                log::debug("lzjson: parser poisoned: {}", e.what());
            }
            throw;
        }
    }

    // Throws ERROR_view_expired if the view from generation gen is stale.
    inline void check_view(std::uint64_t gen, internal::pending_kind kind) const
    {
        if (gen != m_gen || m_pending != kind ||
            (kind == internal::PENDING_string &&
                m_str_state != STRING_unread && m_str_state != STRING_buffered))
            throw parse_error(offset(), ERROR_view_expired);
    }

    // Cursor entry points.

    inline bool pull(const internal::frame_ref& ref, std::string* key, value_type& out)
    {
        return guarded([&]() -> bool {
            check_cursor(ref);
            return advance(ref.depth(), key, out);
        });
    }

    inline void skip_container(const internal::frame_ref& ref)
    {
        guarded([&]() {
            check_cursor(ref);
            begin_advance(ref.depth());
            skip_to(ref.depth() - 1);
        });
    }

    inline void check_cursor(const internal::frame_ref& ref) const
    {
        if (!ref.live())
            throw std::logic_error("lzjson: cursor used after its container was skipped.");
    }

    // Invalidate views, finish the pending scalar and skip abandoned
    // containers deeper than d.
    inline void begin_advance(std::size_t d)
    {
        if (m_ctx.held_above(d))
            throw std::logic_error("lzjson: cannot advance while a nested cursor is alive.");

        ++m_gen;
        finish_pending();

        if (m_ctx.depth() > d)
        {
            log::debug("lzjson: skipping {} abandoned container(s) at offset {}",
                m_ctx.depth() - d, offset());
            skip_to(d);
        }
    }

    inline bool advance(std::size_t d, std::string* key, value_type& out)
    {
        begin_advance(d);

        step_result r = step(key, false);
        if (r == STEP_end)
            return false;

        out = make_value(r);
        return true;
    }

    inline value_type make_value(step_result r)
    {
        switch (r)
        {
        case STEP_null:
            return value_type(this, m_gen, VALUE_null);
        case STEP_true:
        case STEP_false:
        {
            value_type v(this, m_gen, VALUE_bool);
            v.m_bool = r == STEP_true;
            return v;
        }
        case STEP_number:
            return value_type(this, m_gen, VALUE_number);
        case STEP_string:
            return value_type(this, m_gen, VALUE_string);
        default:
        {
            value_type v(this, m_gen, r == STEP_array ? VALUE_array : VALUE_object);
            v.m_depth = m_ctx.depth();
            v.m_id = m_ctx.top().id;
            return v;
        }
        }
    }

    // Pop frames until the depth is target, discarding their contents.
    inline void skip_to(std::size_t target)
    {
        while (m_ctx.depth() > target)
            step(nullptr, true);
    }

    inline void finish_pending(void)
    {
        switch (m_pending)
        {
        case internal::PENDING_number:
            m_buf.advance(m_pending_len);
            break;

        case internal::PENDING_string:
            switch (m_str_state)
            {
            case STRING_unread:
                m_sscan = internal::string_scanner();
                // fallthrough
            case STRING_partial:
            {
                internal::null_output out;
                scan_string_consuming(out);
                break;
            }
            case STRING_buffered:
                m_buf.advance(m_pending_len);
                break;
            case STRING_streamed:
                break;
            }
            break;

        default:
            break;
        }
        m_pending = internal::PENDING_none;
    }


    // Scanning.

    // Skip whitespace and peek the next byte. False at end of input.
    inline bool next_token(char& c)
    {
        for (;;)
        {
            std::size_t pos = internal::skip_ws(m_buf.cur(), 0, m_buf.avail());
            m_buf.advance(pos);
            if (m_buf.avail() > 0)
            {
                c = *m_buf.cur();
                return true;
            }
            if (!m_buf.fill_more())
                return false;
        }
    }

    // Same, but end of input inside a container is an error.
    inline char expect_token(void)
    {
        char c;
        if (!next_token(c))
            fail(offset(), ERROR_eof_in_value);
        return c;
    }

    // Scan the rest of the string in m_sscan, consuming it as it goes.
    template <typename Output>
    inline void scan_string_consuming(Output& out)
    {
        for (;;)
        {
            std::size_t pos = 0;
            internal::scan_status st = m_sscan.scan(m_buf.cur(), pos, m_buf.avail(), out);
            if (st == internal::SCAN_error)
                fail(offset() + pos, m_sscan.err());

            m_buf.advance(pos);
            if (st == internal::SCAN_done)
                return;
            if (!m_buf.fill_more())
                fail(offset(), ERROR_unexpected_eof);
        }
    }

    // Scan a token starting at cur() without consuming it.
    // Returns its length.
    template <typename Scanner>
    inline std::size_t scan_buffered(Scanner& sc)
    {
        std::size_t pos = 0;
        for (;;)
        {
            internal::scan_status st = sc.scan(m_buf.cur(), pos, m_buf.avail(), m_buf.source_eof());
            if (st == internal::SCAN_error)
                fail(offset() + pos, sc.err());
            if (st == internal::SCAN_done)
                return pos;
            // at end of input the next scan() sees source_eof() and finishes
            const bool more = m_buf.fill_more(true);
            LZJSON_ASSERT(more || m_buf.source_eof());
            (void)more;
        }
    }

    // Returns the length of the string body incl. closing quote.
    template <typename Output>
    inline std::size_t scan_string_buffered(Output& out)
    {
        internal::string_scanner sc;
        std::size_t pos = 0;
        for (;;)
        {
            internal::scan_status st = sc.scan(m_buf.cur(), pos, m_buf.avail(), out);
            if (st == internal::SCAN_error)
                fail(offset() + pos, sc.err());
            if (st == internal::SCAN_done)
                return pos;
            if (!m_buf.fill_more())
                fail(offset() + pos, ERROR_unexpected_eof);
        }
    }


    // State machine.

    // Read the next member of the innermost container, or the next
    // top-level value. key receives object keys (may be null).
    // With skip set, scalars are consumed instead of left pending.
    inline step_result step(std::string* key, bool skip)
    {
        if (m_ctx.empty())
            return step_root();

        char c = expect_token();
        internal::frame& f = m_ctx.top();
        const char closer = f.type == internal::FRAME_array ? 0x5d : 0x7d; // ']', '}'

        if (f.has_children)
        {
            if (c == closer) {
                m_buf.advance(1);
                m_ctx.pop();
                return STEP_end;
            }
            if (c != 0x2c) // ','
                fail(offset(), ERROR_token_item_sep);

            m_buf.advance(1);
            c = expect_token();
            if (c == 0x5d || c == 0x7d)
                fail(offset(), ERROR_trailing_comma);
        }
        else if (c == closer)
        {
            m_buf.advance(1);
            m_ctx.pop();
            return STEP_end;
        }
        f.has_children = true;

        if (f.type == internal::FRAME_object)
        {
            read_key(c, key);
            c = expect_token();
            if (c != 0x3a) // ':'
                fail(offset(), ERROR_token_key_sep);
            m_buf.advance(1);
            c = expect_token();
        }

        return start_value(c, skip);
    }

    inline step_result step_root(void)
    {
        char c;
        if (!next_token(c))
            return STEP_end;

        if (m_root_seen && !m_opts.multiple_roots)
            fail(offset(), ERROR_trailing_data);
        m_root_seen = true;

        return start_value(c, false);
    }

    inline void read_key(char c, std::string* key)
    {
        if (c != 0x22) // '"'
            fail(offset(), ERROR_expected_key);
        m_buf.advance(1);

        m_sscan = internal::string_scanner();
        if (key)
        {
            key->clear();
            internal::string_output<std::string> out(*key);
            scan_string_consuming(out);
        }
        else
        {
            internal::null_output out;
            scan_string_consuming(out);
        }
    }

    inline step_result start_value(char c, bool skip)
    {
        switch (c)
        {
        case 0x5b: // '['
        case 0x7b: // '{'
            m_ctx.push(c == 0x5b ? internal::FRAME_array : internal::FRAME_object, offset());
            m_buf.advance(1);
            return c == 0x5b ? STEP_array : STEP_object;

        case 0x22: // '"'
            m_buf.advance(1);
            if (skip)
            {
                m_sscan = internal::string_scanner();
                internal::null_output out;
                scan_string_consuming(out);
            }
            else
            {
                m_pending = internal::PENDING_string;
                m_str_state = STRING_unread;
            }
            return STEP_string;

        case 0x74: // 't'
            read_literal("true", 4);
            return STEP_true;
        case 0x66: // 'f'
            read_literal("false", 5);
            return STEP_false;
        case 0x6e: // 'n'
            read_literal("null", 4);
            return STEP_null;

        case 0x5d: // ']'
        case 0x7d: // '}'
        case 0x2c: // ','
        case 0x3a: // ':'
            fail(offset(), ERROR_unexpected_token);

        default:
            if (c == 0x2d || iutil::is_digit(c)) // '-'
            {
                internal::number_scanner sc;
                std::size_t len = scan_buffered(sc);
                if (skip)
                    m_buf.advance(len);
                else
                {
                    m_pending = internal::PENDING_number;
                    m_pending_len = len;
                }
                return STEP_number;
            }
            if ((c >= 0x41 && c <= 0x5a) || (c >= 0x61 && c <= 0x7a)) // letters
                fail(offset(), ERROR_invalid_literal);
            fail(offset(), ERROR_unexpected_byte);
        }
    }

    inline void read_literal(const char* word, std::size_t len)
    {
        internal::literal_scanner sc(word, len);
        m_buf.advance(scan_buffered(sc));
    }


    // View support.

    inline const char* number_begin(void) const noexcept { return m_buf.slice(0, m_pending_len); }

    inline const char* number_end(void) const noexcept { return number_begin() + m_pending_len; }

    inline std::string string_owned(void)
    {
        std::string res;
        internal::string_output<std::string> out(res);
        m_pending_len = scan_string_buffered(out);
        m_str_state = STRING_buffered;
        return res;
    }

    // Escapes always decode to fewer bytes than they take in the input,
    // so a body whose decoded size is its raw size has none.
    inline cow_string string_cow(void)
    {
        internal::count_output out;
        m_pending_len = scan_string_buffered(out);
        m_str_state = STRING_buffered;

        const std::size_t raw_len = m_pending_len - 1; // closing quote
        if (out.count() == raw_len)
            return cow_string(m_buf.slice(0, raw_len), raw_len);
        return cow_string(string_owned());
    }

    // Decodes one window at a time into m_chunk, then hands it to sink,
    // so the scanner and buffer stay consistent if sink throws.
    template <typename Sink>
    inline void string_into(Sink& sink)
    {
        if (m_str_state == STRING_buffered)
        {
            m_chunk.clear();
            internal::string_output<std::string> out(m_chunk);
            scan_string_buffered(out);
            m_buf.advance(m_pending_len);
            m_str_state = STRING_streamed;
            if (!m_chunk.empty())
                sink(m_chunk.data(), m_chunk.size());
            return;
        }

        m_sscan = internal::string_scanner();
        m_str_state = STRING_partial;
        for (;;)
        {
            m_chunk.clear();
            internal::string_output<std::string> out(m_chunk);

            std::size_t pos = 0;
            internal::scan_status st = m_sscan.scan(m_buf.cur(), pos, m_buf.avail(), out);
            if (st == internal::SCAN_error)
                fail(offset() + pos, m_sscan.err());
            m_buf.advance(pos);
            if (st == internal::SCAN_done)
                m_str_state = STRING_streamed;

            if (!m_chunk.empty())
                sink(m_chunk.data(), m_chunk.size());

            if (st == internal::SCAN_done)
                return;
            if (!m_buf.fill_more())
                fail(offset(), ERROR_unexpected_eof);
        }
    }

private:
    options m_opts;
    internal::refill_buffer<Source> m_buf;
    internal::context_stack m_ctx;
    // bumped on every advance; views from older generations are stale
    std::uint64_t m_gen;
    internal::pending_kind m_pending;
    std::size_t m_pending_len;
    string_state m_str_state;
    internal::string_scanner m_sscan;
    std::string m_chunk;
    bool m_root_seen;
    std::exception_ptr m_poison;
};

}

#endif
