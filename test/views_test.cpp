#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "lzjson/lzjson.hpp"
#include "test_util.hpp"

namespace lzjson {

using value = basic_value<in_mem>;

namespace {

template <typename T>
T read_as(const std::string& json)
{
    in_mem src(json);
    mem_parser p(src);
    value v;
    EXPECT_TRUE(p.next(v));
    return v.as_number().read<T>();
}

template <typename T>
error read_error(const std::string& json)
{
    in_mem src(json);
    mem_parser p(src);
    value v;
    EXPECT_TRUE(p.next(v));
    try {
        v.as_number().read<T>();
    }
    catch (const parse_error& e) {
        EXPECT_EQ(e.kind(), ERRKIND_range) << json;
        EXPECT_TRUE(p.poisoned());
        return e.code();
    }
    return ERROR_none;
}

number read_number(const std::string& json)
{
    in_mem src(json);
    mem_parser p(src);
    value v;
    EXPECT_TRUE(p.next(v));
    return v.as_number().read_number();
}

options small_buffer(std::size_t init, std::size_t max)
{
    options opts;
    opts.initial_buffer_capacity = init;
    opts.max_buffer_capacity = max;
    return opts;
}

}  // namespace

TEST(NumberView, ReadsIntegers)
{
    EXPECT_EQ(read_as<int>("0"), 0);
    EXPECT_EQ(read_as<int>("-0"), 0);
    EXPECT_EQ(read_as<std::int8_t>("127"), 127);
    EXPECT_EQ(read_as<std::int8_t>("-128"), -128);
    EXPECT_EQ(read_as<std::uint8_t>("255"), 255);
    EXPECT_EQ(read_as<std::int64_t>("9223372036854775807"), std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(read_as<std::int64_t>("-9223372036854775808"), std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(read_as<std::uint64_t>("18446744073709551615"), std::numeric_limits<std::uint64_t>::max());
}

TEST(NumberView, IntegerOverflowIsRangeError)
{
    EXPECT_EQ(read_error<std::int8_t>("128"), ERROR_out_of_range);
    EXPECT_EQ(read_error<std::int8_t>("-129"), ERROR_out_of_range);
    EXPECT_EQ(read_error<std::uint8_t>("256"), ERROR_out_of_range);
    EXPECT_EQ(read_error<unsigned>("-1"), ERROR_out_of_range);
    EXPECT_EQ(read_error<std::int64_t>("9223372036854775808"), ERROR_out_of_range);
    EXPECT_EQ(read_error<std::uint64_t>("18446744073709551616"), ERROR_out_of_range);
    EXPECT_EQ(read_error<std::uint64_t>("100000000000000000000"), ERROR_out_of_range);
}

TEST(NumberView, FractionIsNotAnInteger)
{
    EXPECT_EQ(read_error<int>("1.0"), ERROR_not_integer);
    EXPECT_EQ(read_error<int>("1e2"), ERROR_not_integer);
    EXPECT_EQ(read_error<unsigned long>("-0.5"), ERROR_not_integer);
}

TEST(NumberView, ReadsFloatingPoint)
{
    EXPECT_DOUBLE_EQ(read_as<double>("3.5"), 3.5);
    EXPECT_DOUBLE_EQ(read_as<double>("2.5e-3"), 0.0025);
    EXPECT_DOUBLE_EQ(read_as<double>("42"), 42.0);
    EXPECT_DOUBLE_EQ(read_as<double>("1E2"), 100.0);
    EXPECT_DOUBLE_EQ(read_as<double>("1.7976931348623157e308"), std::numeric_limits<double>::max());
    EXPECT_FLOAT_EQ(read_as<float>("0.1"), 0.1f);
    EXPECT_EQ(read_as<long double>("1.5"), 1.5L);

    double negzero = read_as<double>("-0.0");
    EXPECT_EQ(negzero, 0.0);
    EXPECT_TRUE(std::signbit(negzero));
}

TEST(NumberView, NonFiniteIsRangeError)
{
    EXPECT_EQ(read_error<double>("1e309"), ERROR_out_of_range);
    EXPECT_EQ(read_error<double>("-1e400"), ERROR_out_of_range);
    EXPECT_EQ(read_error<float>("3.5e38"), ERROR_out_of_range);
}

TEST(NumberView, UnderflowReadsAsZero)
{
    EXPECT_EQ(read_as<double>("1e-400"), 0.0);
    EXPECT_EQ(read_as<float>("1e-50"), 0.0f);

    double negzero = read_as<double>("-1e-400");
    EXPECT_EQ(negzero, 0.0);
    EXPECT_TRUE(std::signbit(negzero));

    // subnormals are not rounded away
    EXPECT_GT(read_as<double>("5e-324"), 0.0);
}

TEST(NumberView, ReadsGenericNumber)
{
    number a = read_number("42");
    EXPECT_EQ(a.type(), number::TYPE_intmax);
    EXPECT_EQ(a.get<std::intmax_t>(), 42);

    number b = read_number("-9223372036854775808");
    EXPECT_EQ(b.type(), number::TYPE_intmax);
    EXPECT_EQ(b.get<std::intmax_t>(), std::numeric_limits<std::intmax_t>::min());

    number c = read_number("18446744073709551615");
    EXPECT_EQ(c.type(), number::TYPE_uintmax);
    EXPECT_EQ(c.get<std::uintmax_t>(), std::numeric_limits<std::uintmax_t>::max());

    number d = read_number("18446744073709551616");
    EXPECT_EQ(d.type(), number::TYPE_double);
    EXPECT_DOUBLE_EQ(d.get<double>(), 18446744073709551616.0);

    number e = read_number("1e2");
    EXPECT_EQ(e.type(), number::TYPE_double);
    EXPECT_FALSE(e.is_integer());
    EXPECT_EQ(e.as<int>(), 100);
    EXPECT_EQ(e.get_if<std::intmax_t>(), nullptr);
    ASSERT_NE(e.get_if<double>(), nullptr);
    EXPECT_THROW(e.get<std::uintmax_t>(), std::logic_error);
}

TEST(NumberView, RawTextAndIntegerness)
{
    std::string json = "[-12.50e+01, 123456789012345678901234567890]";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    EXPECT_EQ(v.as_number().raw(), "-12.50e+01");
    EXPECT_FALSE(v.as_number().is_integer());

    ASSERT_TRUE(arr.next(v));
    EXPECT_EQ(v.as_number().raw(), "123456789012345678901234567890");
    EXPECT_TRUE(v.as_number().is_integer());
    EXPECT_EQ(v.as_number().read_number().type(), number::TYPE_double);
}

TEST(NumberView, RangeErrorPoisons)
{
    std::string json = "[1000, 2]";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    parse_error e = test::catch_parse_error([&] { v.as_number().read<signed char>(); });
    EXPECT_EQ(e.code(), ERROR_out_of_range);
    EXPECT_EQ(e.kind(), ERRKIND_range);
    EXPECT_TRUE(p.poisoned());

    // the same error comes back from every later call
    for (int i = 0; i < 2; ++i)
    {
        parse_error again = test::catch_parse_error([&] { arr.next(v); });
        EXPECT_EQ(again.code(), ERROR_out_of_range);
        EXPECT_STREQ(again.what(), e.what());
    }
    parse_error read_again = test::catch_parse_error([&] { p.next(root); });
    EXPECT_EQ(read_again.code(), ERROR_out_of_range);
}

TEST(Views, ExpireWhenParserAdvances)
{
    std::string json = R"([1,"two",3])";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    lazy_number<in_mem> num = v.as_number();
    ASSERT_TRUE(arr.next(v));
    lazy_string<in_mem> str = v.as_string();
    EXPECT_EQ(str.read_owned(), "two");

    parse_error e = test::catch_parse_error([&] { num.read<int>(); });
    EXPECT_EQ(e.code(), ERROR_view_expired);
    EXPECT_EQ(e.kind(), ERRKIND_view_expired);
    EXPECT_TRUE(p.poisoned());

    // the current view and the parser now report the same error
    parse_error e2 = test::catch_parse_error([&] { str.read_owned(); });
    parse_error e3 = test::catch_parse_error([&] { arr.next(v); });
    EXPECT_EQ(e2.code(), ERROR_view_expired);
    EXPECT_EQ(e3.code(), ERROR_view_expired);
    EXPECT_EQ(e3.offset(), e.offset());
}

TEST(Views, StringExpiresAfterAdvance)
{
    std::string json = R"(["two",3])";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    lazy_string<in_mem> str = v.as_string();
    ASSERT_TRUE(arr.next(v));
    EXPECT_FALSE(p.poisoned());

    parse_error e = test::catch_parse_error([&] { str.read_owned(); });
    EXPECT_EQ(e.code(), ERROR_view_expired);
    EXPECT_TRUE(p.poisoned());
}

TEST(StringView, ReadOwnedIsIdempotent)
{
    std::string json = R"(["abc\n",1])";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    auto s = v.as_string();
    EXPECT_EQ(s.read_owned(), "abc\n");
    EXPECT_EQ(s.read_owned(), "abc\n");

    ASSERT_TRUE(arr.next(v));
    EXPECT_EQ(v.as_number().read<int>(), 1);
}

TEST(StringView, ReadIntoStreamsWithSmallBuffer)
{
    std::string body;
    for (int i = 0; i < 1000; ++i)
        body += static_cast<char>('a' + i % 26);
    std::string json = "[\"" + body + "\",true]";

    in_mem src(json);
    mem_parser p(src, small_buffer(16, 16));
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    std::string got;
    int chunks = 0;
    v.as_string().read_into([&](const char* s, std::size_t n) {
        got.append(s, n);
        ++chunks;
    });
    EXPECT_EQ(got, body);
    EXPECT_GT(chunks, 1);
    EXPECT_EQ(p.buffer_capacity(), 16U);

    ASSERT_TRUE(arr.next(v));
    EXPECT_TRUE(v.as_bool());
}

TEST(StringView, ReadIntoIsSinglePass)
{
    std::string json = R"(["abc",true])";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    std::string got;
    v.as_string().read_into([&](const char* s, std::size_t n) { got.append(s, n); });
    EXPECT_EQ(got, "abc");

    parse_error e = test::catch_parse_error([&] { v.as_string().read_owned(); });
    EXPECT_EQ(e.code(), ERROR_view_expired);
    EXPECT_TRUE(p.poisoned());
    EXPECT_THROW(arr.next(v), parse_error);
}

TEST(StringView, ReadIntoAfterReadOwned)
{
    std::string json = R"("x\ty")";
    in_mem src(json);
    mem_parser p(src);
    value v;
    ASSERT_TRUE(p.next(v));

    auto s = v.as_string();
    EXPECT_EQ(s.read_owned(), "x\ty");
    std::string got;
    s.read_into([&](const char* d, std::size_t n) { got.append(d, n); });
    EXPECT_EQ(got, "x\ty");
    EXPECT_THROW(s.read_owned(), parse_error);
}

TEST(StringView, ReadOwnedGrowsBuffer)
{
    std::string body(100, 'q');
    std::string json = "\"" + body + "\"";
    in_mem src(json);
    mem_parser p(src, small_buffer(16, 1024));
    value v;
    ASSERT_TRUE(p.next(v));
    EXPECT_EQ(v.as_string().read_owned(), body);
    EXPECT_GE(p.buffer_capacity(), 101U);
    EXPECT_LE(p.buffer_capacity(), 1024U);
}

TEST(StringView, ReadOwnedBeyondMaxCapacity)
{
    std::string json = "[\"" + std::string(100, 'q') + "\"]";
    in_mem src(json);
    mem_parser p(src, small_buffer(16, 32));
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();
    value v;
    ASSERT_TRUE(arr.next(v));

    parse_error e = test::catch_parse_error([&] { v.as_string().read_owned(); });
    EXPECT_EQ(e.code(), ERROR_token_too_large);
    EXPECT_TRUE(p.poisoned());
}

TEST(StringView, LongStringsSkipInConstantMemory)
{
    std::string json = "[\"" + std::string(10000, 'q') + "\",7]";
    in_mem src(json);
    mem_parser p(src, small_buffer(16, 16));
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();
    value v;
    ASSERT_TRUE(arr.next(v));
    ASSERT_TRUE(arr.next(v));
    EXPECT_EQ(v.as_number().read<int>(), 7);
    EXPECT_EQ(p.buffer_capacity(), 16U);
}

TEST(StringView, ReadCowBorrowsWithoutEscapes)
{
    std::string json = "[\"plain\",\"caf\xc3\xa9\",\"\",\"tab\\there\"]";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();
    value v;

    ASSERT_TRUE(arr.next(v));
    cow_string plain = v.as_string().read_cow();
    EXPECT_TRUE(plain.borrowed());
    EXPECT_EQ(plain.str(), "plain");
    // the same view can still be read
    EXPECT_EQ(v.as_string().read_owned(), "plain");

    ASSERT_TRUE(arr.next(v));
    cow_string utf8 = v.as_string().read_cow();
    EXPECT_TRUE(utf8.borrowed());
    EXPECT_EQ(utf8.str(), "caf\xc3\xa9");

    ASSERT_TRUE(arr.next(v));
    cow_string empty = v.as_string().read_cow();
    EXPECT_TRUE(empty.borrowed());
    EXPECT_EQ(empty.size(), 0U);

    ASSERT_TRUE(arr.next(v));
    cow_string escaped = v.as_string().read_cow();
    EXPECT_FALSE(escaped.borrowed());
    EXPECT_EQ(escaped.str(), "tab\there");

    EXPECT_FALSE(arr.next(v));
    // owned copies outlive the parser position
    EXPECT_EQ(escaped.str(), "tab\there");
}

TEST(StringView, ReadCowOfUnicodeEscape)
{
    std::string json = R"("x\u00e9")";
    in_mem src(json);
    mem_parser p(src);
    value v;
    ASSERT_TRUE(p.next(v));
    cow_string s = v.as_string().read_cow();
    EXPECT_FALSE(s.borrowed());
    EXPECT_EQ(s.str(), "x\xc3\xa9");
}

TEST(StringView, ReadCowAcrossRefills)
{
    std::string body(100, 'k');
    std::string json = "[\"" + body + "\",1]";
    test::chunked_source src(json, 3);
    options opts;
    opts.initial_buffer_capacity = 8;
    basic_parser<test::chunked_source> p(src, opts);
    basic_value<test::chunked_source> root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    basic_value<test::chunked_source> v;
    ASSERT_TRUE(arr.next(v));
    cow_string s = v.as_string().read_cow();
    EXPECT_TRUE(s.borrowed());
    EXPECT_EQ(s.str(), body);

    ASSERT_TRUE(arr.next(v));
    EXPECT_EQ(v.as_number().read<int>(), 1);
}

TEST(StringView, ReadCowExpires)
{
    std::string json = R"(["a","b"])";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();
    value v;
    ASSERT_TRUE(arr.next(v));
    lazy_string<in_mem> first = v.as_string();
    ASSERT_TRUE(arr.next(v));

    parse_error e = test::catch_parse_error([&] { first.read_cow(); });
    EXPECT_EQ(e.code(), ERROR_view_expired);
}

TEST(StringView, ReadChars)
{
    std::string json = "\"a\\u00e9\\ud83d\\ude00\xe2\x82\xac\"";
    in_mem src(json);
    mem_parser p(src);
    value v;
    ASSERT_TRUE(p.next(v));

    std::vector<char32_t> cps;
    v.as_string().read_chars([&](char32_t c) { cps.push_back(c); });
    EXPECT_EQ(cps, (std::vector<char32_t>{ U'a', 0xe9, 0x1f600, 0x20ac }));
}

TEST(StringView, WriteToStream)
{
    std::string json = R"("line\nnext")";
    in_mem src(json);
    mem_parser p(src);
    value v;
    ASSERT_TRUE(p.next(v));

    std::ostringstream oss;
    v.as_string().write_to(oss);
    EXPECT_EQ(oss.str(), "line\nnext");
}

TEST(StringView, ThrowingSinkLeavesParserUsable)
{
    std::string json = "[\"" + std::string(200, 'w') + "\",{\"k\":5}]";
    in_mem src(json);
    mem_parser p(src, small_buffer(16, 16));
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    EXPECT_THROW(v.as_string().read_into([](const char*, std::size_t) {
        throw std::runtime_error("sink full");
    }), std::runtime_error);
    EXPECT_FALSE(p.poisoned());

    ASSERT_TRUE(arr.next(v));
    auto obj = v.as_object();
    std::string key;
    value member;
    ASSERT_TRUE(obj.next(key, member));
    EXPECT_EQ(key, "k");
    EXPECT_EQ(member.as_number().read<int>(), 5);
}

TEST(StringView, MalformedStringPoisonsOnRead)
{
    std::string json = R"(["ab\x"])";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();
    value v;
    ASSERT_TRUE(arr.next(v));

    parse_error e = test::catch_parse_error([&] { v.as_string().read_owned(); });
    EXPECT_EQ(e.code(), ERROR_str_escape);
    EXPECT_EQ(e.kind(), ERRKIND_lexical);
    EXPECT_EQ(e.offset(), 5U);
    EXPECT_TRUE(p.poisoned());
}

TEST(StringView, MalformedStringDetectedWhenSkipped)
{
    std::string json = R"(["\x",1])";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();
    value v;
    ASSERT_TRUE(arr.next(v));

    parse_error e = test::catch_parse_error([&] { arr.next(v); });
    EXPECT_EQ(e.code(), ERROR_str_escape);
    EXPECT_EQ(e.offset(), 3U);
}

}  // namespace lzjson
