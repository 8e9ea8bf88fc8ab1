//
// Defines the byte source concept and a trait to detect it.
//

#ifndef LZJSON_CONCEPTS_HPP
#define LZJSON_CONCEPTS_HPP

#include <cstddef>
#include <type_traits>
#include <utility>

#include "internal/util.hpp"

namespace lzjson {

namespace internal {
template <typename, typename = void>
struct is_byte_source_impl : std::false_type {};

template <typename T>
struct is_byte_source_impl<T, iutil::enable_if_same_t<
    decltype(std::declval<T&>().read(std::declval<char*>(), std::declval<std::size_t>())),
    std::size_t, void>> : std::true_type
{};
}

//
// true if T implements:
//
// - std::size_t read(char* dst, std::size_t count);
//   Read at most count (> 0) bytes into dst, blocking if necessary.
//   Returns the number of bytes read. 0 means end of input;
//   read() is not called again after it returns 0.
//   Throws (anything derived from std::exception) on I/O failure.
//
template <typename T>
using is_byte_source = internal::is_byte_source_impl<iutil::remove_cvref_t<T>>;

}

#endif
