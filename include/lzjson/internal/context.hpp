#ifndef LZJSON_INTERNAL_CONTEXT_HPP
#define LZJSON_INTERNAL_CONTEXT_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>

#include "config.hpp"
#include "../core.hpp"


namespace lzjson {
namespace internal {

enum frame_type : unsigned char
{
    FRAME_array,
    FRAME_object
};

// One open container.
struct frame
{
    frame_type type;
    // true once a member (or the close token) has been read
    bool has_children;
    // a live cursor iterates this frame
    bool held;
    // a cursor was opened on this frame at some point
    bool opened;
    // distinguishes frames that reuse the same depth
    std::uint64_t id;
};

//
// Explicit stack of open containers, outermost first.
// Depth 0 is the top level; the frame at depth d is at(d).
//
class context_stack
{
public:
    explicit context_stack(std::size_t max_depth) :
        m_max_depth(max_depth), m_next_id(1)
    {}

    context_stack(const context_stack&) = delete;
    context_stack& operator=(const context_stack&) = delete;

    inline std::size_t depth(void) const noexcept { return m_frames.size(); }

    inline bool empty(void) const noexcept { return m_frames.empty(); }

    inline std::size_t max_depth(void) const noexcept { return m_max_depth; }

    inline frame& top(void) noexcept
    {
        LZJSON_ASSERT(!empty());
        return m_frames.back();
    }

    // 1 <= d <= depth()
    inline frame& at(std::size_t d) noexcept
    {
        LZJSON_ASSERT(d >= 1 && d <= depth());
        return m_frames[d - 1];
    }

    // Open a container. Throws parse_error at offset if the stack is full.
    // Returns the new frame's id.
    inline std::uint64_t push(frame_type type, std::uint64_t offset)
    {
        if (depth() >= m_max_depth)
            throw parse_error(offset, ERROR_depth_exceeded,
                "(limit " + std::to_string(m_max_depth) + ")");

        m_frames.push_back({ type, false, false, false, m_next_id });
        return m_next_id++;
    }

    inline void pop(void) noexcept
    {
        LZJSON_ASSERT(!empty());
        m_frames.pop_back();
    }

    // True if the frame identified by (d, id) is still open.
    inline bool contains(std::size_t d, std::uint64_t id) const noexcept
    {
        return d >= 1 && d <= depth() && m_frames[d - 1].id == id;
    }

    // True if any frame deeper than d has a live cursor.
    inline bool held_above(std::size_t d) const noexcept
    {
        for (std::size_t i = d; i < m_frames.size(); ++i)
        {
            if (m_frames[i].held)
                return true;
        }
        return false;
    }

    inline void release(std::size_t d, std::uint64_t id) noexcept
    {
        if (contains(d, id))
            m_frames[d - 1].held = false;
    }

private:
    std::vector<frame> m_frames;
    std::size_t m_max_depth;
    std::uint64_t m_next_id;
};


// Move-only claim on a frame, released on destruction.
class frame_ref
{
public:
    frame_ref(void) noexcept :
        m_ctx(nullptr), m_depth(0), m_id(0)
    {}

    frame_ref(context_stack& ctx, std::size_t d, std::uint64_t id) noexcept :
        m_ctx(&ctx), m_depth(d), m_id(id)
    {}

    frame_ref(frame_ref&& rhs) noexcept :
        m_ctx(rhs.m_ctx), m_depth(rhs.m_depth), m_id(rhs.m_id)
    {
        rhs.m_ctx = nullptr;
    }

    frame_ref& operator=(frame_ref&& rhs) noexcept
    {
        if (this != &rhs)
        {
            reset();
            m_ctx = rhs.m_ctx;
            m_depth = rhs.m_depth;
            m_id = rhs.m_id;
            rhs.m_ctx = nullptr;
        }
        return *this;
    }

    frame_ref(const frame_ref&) = delete;
    frame_ref& operator=(const frame_ref&) = delete;

    ~frame_ref(void) noexcept { reset(); }

    inline void reset(void) noexcept
    {
        if (m_ctx)
        {
            m_ctx->release(m_depth, m_id);
            m_ctx = nullptr;
        }
    }

    inline std::size_t depth(void) const noexcept { return m_depth; }

    inline std::uint64_t id(void) const noexcept { return m_id; }

    // True if the frame has not been popped.
    inline bool live(void) const noexcept { return m_ctx && m_ctx->contains(m_depth, m_id); }

private:
    context_stack* m_ctx;
    std::size_t m_depth;
    std::uint64_t m_id;
};

}}

#endif
