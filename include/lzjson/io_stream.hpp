#ifndef LZJSON_IO_STREAM_HPP
#define LZJSON_IO_STREAM_HPP

#include <cstddef>
#include <istream>
#include <stdexcept>

namespace lzjson {

// Adapts a std::istream to the byte source concept.
// The stream must outlive this object.
class in_stream
{
public:
    explicit in_stream(std::istream& stream) :
        m_stream(&stream)
    {}

    in_stream(in_stream&&) = default;
    in_stream& operator=(in_stream&&) = default;

    // Returns what the stream has buffered, blocking only when
    // nothing is. Throws std::runtime_error if the stream goes bad.
    inline std::size_t read(char* dst, std::size_t count)
    {
        if (m_stream->eof())
            return 0;

        std::streamsize n = m_stream->readsome(dst, static_cast<std::streamsize>(count));
        check();
        if (n > 0)
            return static_cast<std::size_t>(n);
        if (m_stream->eof())
            return 0;

        // short read sets failbit together with eofbit
        m_stream->read(dst, 1);
        check();
        if (m_stream->gcount() == 0)
            return 0;

        n = 1;
        if (count > 1)
        {
            n += m_stream->readsome(dst + 1, static_cast<std::streamsize>(count - 1));
            check();
        }
        return static_cast<std::size_t>(n);
    }

private:
    inline void check(void) const
    {
        if (m_stream->bad())
            throw std::runtime_error("Stream read failed.");
    }

private:
    std::istream* m_stream;
};

}

#endif
