#ifndef LZJSON_INTERNAL_BUFFERS_HPP
#define LZJSON_INTERNAL_BUFFERS_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <algorithm>
#include <utility>
#include <exception>
#include <stdexcept>

#include "config.hpp"
#include "util.hpp"
#include "log.hpp"
#include "../core.hpp"
#include "../concepts.hpp"


namespace lzjson {
namespace internal {

// Dynamically-allocated resizable buffer of chars.
// Contents are left uninitialized.
class buffer
{
public:
    explicit buffer(std::size_t init_capacity) :
        m_size(init_capacity),
        m_bufp(new char[init_capacity])
    {}

    buffer(buffer&&) = default;
    buffer& operator=(buffer&&) = default;

    buffer(const buffer&) = delete;
    buffer& operator=(const buffer&) = delete;

    inline std::size_t capacity(void) const noexcept { return m_size; }

    // Reallocate to new_cap, keeping the first len chars.
    inline void grow_and_copy(std::size_t new_cap, std::size_t len)
    {
        LZJSON_ASSERT(new_cap > m_size && len <= m_size);

        std::unique_ptr<char[]> bufp(new char[new_cap]);
        if (len > 0)
            std::memcpy(bufp.get(), m_bufp.get(), len);

        m_bufp = std::move(bufp);
        m_size = new_cap;
    }

    inline char* pbegin(void) noexcept { return m_bufp.get(); }
    inline char* pend(void) noexcept { return m_bufp.get() + m_size; }

    inline const char* pbegin(void) const noexcept { return m_bufp.get(); }
    inline const char* pend(void) const noexcept { return m_bufp.get() + m_size; }

private:
    std::size_t m_size;
    std::unique_ptr<char[]> m_bufp;
};


//
// Pull buffer over a byte source.
//
// Layout: [0, consumed) is dead, [consumed, filled) is the unconsumed
// window, [filled, capacity) is free. All positions handed out by this
// class are relative to the window start, so they survive compaction
// and reallocation; pointers do not.
//
// The buffer only grows when the window already spans the whole
// capacity and more bytes are requested, i.e. when a single token
// does not fit. It never grows past max_capacity, except by the one
// lookahead byte a number or literal needs to find its end.
//
template <typename Source>
class refill_buffer
{
    static_assert(is_byte_source<Source>::value, "Source is not a byte source.");

public:
    refill_buffer(Source& src, std::size_t init_capacity, std::size_t max_capacity) :
        m_src(&src),
        m_buf(init_capacity),
        m_max_capacity(max_capacity),
        m_consumed(0),
        m_filled(0),
        m_base(0),
        m_eof(false)
    {
        LZJSON_ASSERT(init_capacity > 0 && init_capacity <= max_capacity);
    }

    refill_buffer(refill_buffer&&) = default;
    refill_buffer& operator=(refill_buffer&&) = default;

    // Number of unconsumed bytes.
    inline std::size_t avail(void) const noexcept { return m_filled - m_consumed; }

    // Pointer to the first unconsumed byte.
    // Invalidated by fill_more(), ensure() and advance().
    inline const char* cur(void) const noexcept { return m_buf.pbegin() + m_consumed; }

    // Read-only view of unconsumed bytes [start, end), relative to cur().
    inline const char* slice(std::size_t start, std::size_t end) const noexcept
    {
        LZJSON_ASSERT(start <= end && end <= avail());
        (void)end;
        return cur() + start;
    }

    // Mark the next n unconsumed bytes as consumed.
    inline void advance(std::size_t n) noexcept
    {
        LZJSON_ASSERT(n <= avail());
        m_consumed += n;
    }

    // Absolute input offset of cur().
    inline std::uint64_t offset(void) const noexcept { return m_base + m_consumed; }

    inline std::size_t capacity(void) const noexcept { return m_buf.capacity(); }

    inline std::size_t max_capacity(void) const noexcept { return m_max_capacity; }

    // True once the source reported end of input.
    inline bool source_eof(void) const noexcept { return m_eof; }

    // Guarantee at least n unconsumed bytes.
    // Returns false if the input ends first.
    inline bool ensure(std::size_t n)
    {
        while (avail() < n)
        {
            if (!fill_more())
                return false;
        }
        return true;
    }

    // Pull at least one more byte from the source into the window.
    // Returns false at end of input.
    // Throws parse_error on I/O failure or if the window cannot grow.
    // With lookahead set, the window may hold max_capacity + 1 bytes:
    // a token of exactly max_capacity bytes plus the byte that ends it.
    inline bool fill_more(bool lookahead = false)
    {
        if (m_eof) return false;

        make_room(lookahead ? m_max_capacity + 1 : m_max_capacity);

        std::size_t nread = read_source(m_buf.pbegin() + m_filled, capacity() - m_filled);
        if (nread == 0)
        {
            m_eof = true;
            return false;
        }

        LZJSON_ASSERT(nread <= capacity() - m_filled);
        m_filled += nread;
        return true;
    }

private:
    inline void compact(void) noexcept
    {
        std::size_t n = avail();
        if (n > 0)
            std::memmove(m_buf.pbegin(), m_buf.pbegin() + m_consumed, n);

        m_base += m_consumed;
        m_consumed = 0;
        m_filled = n;
    }

    // Ensure [filled, capacity) is non-empty without letting
    // the window reach more than limit bytes.
    inline void make_room(std::size_t limit)
    {
        std::size_t free_tail = capacity() - m_filled;

        // drop consumed bytes once they outweigh free space
        if (m_consumed > 0 && (free_tail == 0 || m_consumed >= free_tail))
            compact();

        // one token does not fit
        if (avail() >= limit)
            throw parse_error(offset(), ERROR_token_too_large,
                "(limit " + std::to_string(m_max_capacity) + " bytes)");

        if (m_filled < capacity())
            return;

        std::size_t old_cap = capacity();
        std::size_t new_cap = old_cap < m_max_capacity ?
            iutil::recommend_growth(old_cap, old_cap + 1, m_max_capacity) : limit;
        m_buf.grow_and_copy(new_cap, m_filled);

        log::debug("lzjson: refill buffer grown from {} to {} bytes", old_cap, new_cap);
    }

    inline std::size_t read_source(char* dst, std::size_t count)
    {
        try {
            return m_src->read(dst, count);
        }
        catch (const std::exception& e) {
            std::throw_with_nested(parse_error(offset() + avail(), ERROR_io, e.what()));
        }
    }

private:
    Source* m_src;
    buffer m_buf;
    std::size_t m_max_capacity;
    std::size_t m_consumed;
    std::size_t m_filled;
    // absolute offset of m_buf[0]
    std::uint64_t m_base;
    bool m_eof;
};

}}

#endif
