#ifndef LZJSON_IO_MEM_HPP
#define LZJSON_IO_MEM_HPP

#include <cstddef>
#include <cstring>
#include <string>
#include <algorithm>
#include <stdexcept>

#include "internal/config.hpp"

namespace lzjson {

//
// Input memory.
// ------------------------
// Implements the byte source concept over a region the caller keeps
// alive for the lifetime of this object.
// ------------------------
//
class in_mem
{
public:
    in_mem(const char* src, std::size_t size) :
        m_cur(src), m_end(src ? src + size : src)
    {
        if (!src && size > 0)
            throw std::invalid_argument(
                LZJSON_STRFY(lzjson::in_mem) ": src is null.");
    }

    explicit in_mem(const std::string& src) :
        in_mem(src.data(), src.size())
    {}

    in_mem(in_mem&&) = default;
    in_mem(const in_mem&) = delete;

    in_mem& operator=(in_mem&&) = default;
    in_mem& operator=(const in_mem&) = delete;

    inline std::size_t read(char* dst, std::size_t count) noexcept
    {
        std::size_t n = std::min(count, remaining());
        if (n > 0)
            std::memcpy(dst, m_cur, n);
        m_cur += n;
        return n;
    }

    // Bytes not yet handed out.
    inline std::size_t remaining(void) const noexcept
    {
        return static_cast<std::size_t>(m_end - m_cur);
    }

private:
    const char* m_cur;
    const char* m_end;
};

}

#endif
