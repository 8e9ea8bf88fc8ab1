// Config macros and platform support.

#ifndef LZJSON_CONFIG_HPP
#define LZJSON_CONFIG_HPP

// Default maximum nesting depth (number of open arrays/objects).
#ifndef LZJSON_DEFAULT_MAX_DEPTH
#define LZJSON_DEFAULT_MAX_DEPTH 512
#endif

// Default initial capacity of the refill buffer.
#ifndef LZJSON_DEFAULT_BUFSIZE
#define LZJSON_DEFAULT_BUFSIZE 4096
#endif

// Default upper bound on the refill buffer. A single token (e.g. a long
// string read with read_owned()) may grow the buffer up to this size.
#ifndef LZJSON_DEFAULT_MAX_BUFSIZE
#define LZJSON_DEFAULT_MAX_BUFSIZE (16u * 1024u * 1024u)
#endif



#include <cstddef>
#include <cassert>
#include <cfloat>

#define LZJSON_STRFY(...) #__VA_ARGS__
#define LZJSON_XSTRFY(x) LZJSON_STRFY(x)

#define LZJSON_SRCLOC __FILE__ ":" LZJSON_XSTRFY(__LINE__)

#ifdef __has_attribute
#define LZJSON_HAS_ATTRIBUTE(x) __has_attribute(x)
#else
#define LZJSON_HAS_ATTRIBUTE(x) 0
#endif

#ifdef _MSC_VER
#define LZJSON_ALWAYS_INLINE __forceinline
#elif LZJSON_HAS_ATTRIBUTE(always_inline)
#define LZJSON_ALWAYS_INLINE __attribute__((always_inline)) inline
#else
#define LZJSON_ALWAYS_INLINE inline
#endif

#ifdef _MSC_VER
#define LZJSON_NEVER_INLINE __declspec(noinline)
#elif LZJSON_HAS_ATTRIBUTE(noinline)
#define LZJSON_NEVER_INLINE __attribute__((noinline))
#else
#define LZJSON_NEVER_INLINE
#endif

// fast_float handles IEEE-754 binary32/binary64 only.
#ifndef LZJSON_USE_FASTFLOAT
#if FLT_MANT_DIG == 24 && FLT_MIN_EXP == -125 && FLT_MAX_EXP == 128 && \
    DBL_MANT_DIG == 53 && DBL_MIN_EXP == -1021 && DBL_MAX_EXP == 1024
#define LZJSON_USE_FASTFLOAT 1
#else
#define LZJSON_USE_FASTFLOAT 0
#endif
#endif

// MSVC prefixes POSIX functions with an underscore
#ifdef _MSC_VER
#define LZJSON_MSVC_OR_POSIX(x) _##x
#else
#define LZJSON_MSVC_OR_POSIX(x) x
#endif


// Enable runtime asserts in library code.
// 
// By default this is tied to NDEBUG, but you can change
// this by defining the macro yourself.
// 
// You can also provide a custom assert by defining LZJSON_ASSERT().
// 
#ifndef LZJSON_USE_ASSERTS
#ifdef NDEBUG
#define LZJSON_USE_ASSERTS 0
#else
#define LZJSON_USE_ASSERTS 1
#endif
#endif

#if !defined(LZJSON_ASSERT) && LZJSON_USE_ASSERTS
#ifdef NDEBUG
#include <cstdio>
#include <exception>

namespace lzjson {
namespace internal {
LZJSON_NEVER_INLINE inline 
void assert_fail(const char* src_loc, const char* msg)
{
    std::fprintf(stderr, "\n%s: Assertion '%s' failed.", src_loc, msg);
    std::terminate();
}
}}
#define LZJSON_ASSERT(cond) \
(void)( \
    (!!(cond)) || \
    (::lzjson::internal::assert_fail(LZJSON_SRCLOC, #cond), 0) \
)
#else
#define LZJSON_ASSERT(cond) assert(cond)
#endif
#elif !defined(LZJSON_ASSERT)
#define LZJSON_ASSERT(cond)
#endif

#endif
