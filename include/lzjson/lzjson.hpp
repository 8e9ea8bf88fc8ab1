//
// Umbrella header.
//

#ifndef LZJSON_LZJSON_HPP
#define LZJSON_LZJSON_HPP

#include "core.hpp"
#include "concepts.hpp"
#include "number.hpp"
#include "views.hpp"
#include "parser.hpp"

#include "io_mem.hpp"
#include "io_file.hpp"
#include "io_stream.hpp"
#ifndef _WIN32
#include "io_fd.hpp"
#endif

namespace lzjson {

using mem_parser = basic_parser<in_mem>;
using file_parser = basic_parser<in_file>;
using stream_parser = basic_parser<in_stream>;
#ifndef _WIN32
using fd_parser = basic_parser<in_fd>;
#endif

}

#endif
