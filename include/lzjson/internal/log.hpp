#ifndef LZJSON_INTERNAL_LOG_HPP
#define LZJSON_INTERNAL_LOG_HPP

// Library diagnostics go through spdlog's default logger, at debug/trace
// level only. Set the level with spdlog::set_level().
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

namespace lzjson {
namespace log = spdlog;
}

#endif
