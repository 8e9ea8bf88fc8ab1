#ifndef LZJSON_IO_FILE_HPP
#define LZJSON_IO_FILE_HPP

#include <cstddef>
#include <cstdio>
#include <string>
#include <utility>
#include <stdexcept>

#include "internal/config.hpp"

namespace lzjson {

//
// Input file, opened by path in binary mode.
// ------------------------
// The C library buffer is disabled: the parser already
// reads straight into its own refill buffer.
// ------------------------
//
class in_file
{
public:
    explicit in_file(const char filepath[]) :
        m_fptr(open(filepath)), m_path(filepath)
    {
        if (!m_fptr)
            throw std::runtime_error("Could not open file " + m_path + ".");
        std::setvbuf(m_fptr, nullptr, _IONBF, 0);
    }

    explicit in_file(const std::string& filepath) :
        in_file(filepath.c_str())
    {}

    in_file(in_file&& rhs) noexcept :
        m_fptr(rhs.m_fptr), m_path(std::move(rhs.m_path))
    {
        rhs.m_fptr = nullptr;
    }

    in_file& operator=(in_file&& rhs) noexcept
    {
        if (this != &rhs)
        {
            if (m_fptr) std::fclose(m_fptr);
            m_fptr = rhs.m_fptr;
            m_path = std::move(rhs.m_path);
            rhs.m_fptr = nullptr;
        }
        return *this;
    }

    in_file(const in_file&) = delete;
    in_file& operator=(const in_file&) = delete;

    // Errors on close are ignored here, call close() to see them.
    ~in_file(void) noexcept { if (m_fptr) std::fclose(m_fptr); }

    // Throws std::runtime_error on a read error or if the file was closed.
    inline std::size_t read(char* dst, std::size_t count)
    {
        if (!m_fptr)
            throw std::runtime_error("File " + m_path + " is closed.");

        std::size_t n = std::fread(dst, 1, count, m_fptr);
        if (n < count && std::ferror(m_fptr))
            throw std::runtime_error("Could not read file " + m_path + ".");
        return n;
    }

    inline const std::string& path(void) const noexcept { return m_path; }

    // Close file. Throws on failure.
    // Whether or not the operation succeeds,
    // the file will no longer be usable.
    inline void close(void)
    {
        if (!m_fptr)
            return;
        int ret = std::fclose(m_fptr);
        m_fptr = nullptr;
        if (ret != 0)
            throw std::runtime_error("Could not close file " + m_path + ".");
    }

private:
    static inline std::FILE* open(const char filepath[])
    {
        LZJSON_ASSERT(filepath);
#ifdef _MSC_VER
        std::FILE* fptr;
        if (::fopen_s(&fptr, filepath, "rb") != 0)
            fptr = nullptr;
        return fptr;
#else
        return std::fopen(filepath, "rb");
#endif
    }

private:
    std::FILE* m_fptr;
    std::string m_path;
};

}

#endif
