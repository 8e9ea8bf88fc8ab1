#ifndef LZJSON_IO_FD_HPP
#define LZJSON_IO_FD_HPP

#include <cerrno>
#include <cstddef>
#include <system_error>

#include <unistd.h>

namespace lzjson {

// Reads from a POSIX file descriptor (file, pipe, socket).
// Does not own the descriptor.
class in_fd
{
public:
    explicit in_fd(int fd) noexcept : m_fd(fd) {}

    in_fd(in_fd&&) = default;
    in_fd& operator=(in_fd&&) = default;

    inline int fd(void) const noexcept { return m_fd; }

    // Throws std::system_error on failure.
    inline std::size_t read(char* dst, std::size_t count)
    {
        for (;;)
        {
            ::ssize_t n = ::read(m_fd, dst, count);
            if (n >= 0)
                return static_cast<std::size_t>(n);
            if (errno != EINTR)
                throw std::system_error(errno, std::generic_category(), "read");
        }
    }

private:
    int m_fd;
};

}

#endif
