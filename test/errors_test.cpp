#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>

#include "lzjson/lzjson.hpp"
#include "test_util.hpp"

namespace lzjson {

using value = basic_value<in_mem>;

namespace {

struct bad_doc
{
    const char* json;
    error code;
    std::uint64_t offset;
};

const bad_doc kBadDocs[] = {
    // structural
    { "{\"a\":", ERROR_eof_in_value, 5 },
    { "{\"a\":1", ERROR_eof_in_value, 6 },
    { "[", ERROR_eof_in_value, 1 },
    { "[[1]", ERROR_eof_in_value, 4 },
    { "[1,]", ERROR_trailing_comma, 3 },
    { "{\"a\":1,}", ERROR_trailing_comma, 7 },
    { "[1 2]", ERROR_token_item_sep, 3 },
    { "[1}", ERROR_token_item_sep, 2 },
    { "{\"a\":1]", ERROR_token_item_sep, 6 },
    { "{\"a\" 1}", ERROR_token_key_sep, 5 },
    { "{a:1}", ERROR_expected_key, 1 },
    { "{,}", ERROR_expected_key, 1 },
    { "{1:2}", ERROR_expected_key, 1 },
    { "[,1]", ERROR_unexpected_token, 1 },
    { ":", ERROR_unexpected_token, 0 },
    { "]", ERROR_unexpected_token, 0 },
    { "{\"a\":}", ERROR_unexpected_token, 5 },
    { "[1]x", ERROR_trailing_data, 3 },
    { "{} {}", ERROR_trailing_data, 3 },
    // lexical
    { "trxu", ERROR_invalid_literal, 2 },
    { "potato", ERROR_invalid_literal, 0 },
    { "[True]", ERROR_invalid_literal, 1 },
    { "[nullx]", ERROR_invalid_literal, 5 },
    { "truex", ERROR_invalid_literal, 4 },
    { "[true1]", ERROR_invalid_literal, 5 },
    { "{\"a\":falsey}", ERROR_invalid_literal, 10 },
    { "null\"s\"", ERROR_invalid_literal, 4 },
    { "nul", ERROR_unexpected_eof, 3 },
    { "[nul", ERROR_unexpected_eof, 4 },
    { "01", ERROR_invalid_num, 1 },
    { "-", ERROR_unexpected_eof, 1 },
    { "[1.]", ERROR_invalid_num, 3 },
    { "[+1]", ERROR_unexpected_byte, 1 },
    { "@", ERROR_unexpected_byte, 0 },
    { "[1,#]", ERROR_unexpected_byte, 3 },
    { "\"abc", ERROR_unexpected_eof, 4 },
    { "{\"ab", ERROR_unexpected_eof, 4 },
    { "[\"a\\qb\"]", ERROR_str_escape, 4 },
    { "{\"k\\ud800\":1}", ERROR_str_surrogate, 9 },
    { "[\"a\tb\"]", ERROR_str_ctrl_char, 3 },
    { "[\"\xc3\x28\"]", ERROR_str_utf8, 3 },
};

}  // namespace

TEST(Errors, ReportsCodeKindAndOffset)
{
    for (const bad_doc& doc : kBadDocs)
    {
        parse_error e = test::catch_parse_error([&] { test::dump(doc.json); });
        EXPECT_EQ(e.code(), doc.code) << doc.json << ": " << e.what();
        EXPECT_EQ(e.offset(), doc.offset) << doc.json << ": " << e.what();
        EXPECT_EQ(e.kind(), error_kind_of(doc.code));
    }
}

TEST(Errors, SameErrorsWhenFedBytewise)
{
    for (const bad_doc& doc : kBadDocs)
    {
        test::chunked_source src(doc.json, 1);
        options opts;
        opts.initial_buffer_capacity = 1;
        parse_error e = test::catch_parse_error([&] { test::dump(src, opts); });
        EXPECT_EQ(e.code(), doc.code) << doc.json;
        EXPECT_EQ(e.offset(), doc.offset) << doc.json;
    }
}

TEST(Errors, TruncatedObjectIsStructural)
{
    std::string json = "{\"a\":";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto obj = root.as_object();
    std::string key;
    value v;

    parse_error e = test::catch_parse_error([&] { obj.next(key, v); });
    EXPECT_EQ(e.code(), ERROR_eof_in_value);
    EXPECT_EQ(e.kind(), ERRKIND_structural);
    EXPECT_EQ(e.offset(), 5U);
    EXPECT_EQ(std::string(e.what()), "JSON parse error at offset 5: Unexpected end of input.");
}

TEST(Errors, PoisonedParserRethrowsSameError)
{
    std::string json = "[1,2,@,3]";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    value v;
    ASSERT_TRUE(arr.next(v));
    lazy_number<in_mem> first = v.as_number();
    ASSERT_TRUE(arr.next(v));
    lazy_number<in_mem> second = v.as_number();

    parse_error e1 = test::catch_parse_error([&] { arr.next(v); });
    EXPECT_EQ(e1.code(), ERROR_unexpected_byte);
    EXPECT_EQ(e1.offset(), 5U);
    EXPECT_TRUE(p.poisoned());

    parse_error e2 = test::catch_parse_error([&] { arr.next(v); });
    parse_error e3 = test::catch_parse_error([&] { p.next(v); });
    parse_error e4 = test::catch_parse_error([&] { arr.skip(); });
    parse_error e5 = test::catch_parse_error([&] { second.read<int>(); });
    parse_error e6 = test::catch_parse_error([&] { first.raw(); });

    for (const parse_error& e : { e2, e3, e4, e5, e6 })
    {
        EXPECT_EQ(e.code(), e1.code());
        EXPECT_EQ(e.offset(), e1.offset());
        EXPECT_STREQ(e.what(), e1.what());
    }
}

TEST(Errors, IoErrorsAreWrappedAndPoison)
{
    test::failing_source src("[1,2");
    basic_parser<test::failing_source> p(src);
    basic_value<test::failing_source> root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();

    basic_value<test::failing_source> v;
    ASSERT_TRUE(arr.next(v));
    EXPECT_EQ(v.as_number().read<int>(), 1);

    for (int attempt = 0; attempt < 2; ++attempt)
    {
        try {
            arr.next(v);
            FAIL() << "expected an I/O error";
        }
        catch (const parse_error& e) {
            EXPECT_EQ(e.code(), ERROR_io);
            EXPECT_EQ(e.kind(), ERRKIND_io);
            EXPECT_EQ(e.offset(), 4U);
            EXPECT_STREQ(e.what(), "JSON parse error at offset 4: I/O error. connection reset");
            EXPECT_THROW(std::rethrow_if_nested(e), std::runtime_error);
        }
    }
    EXPECT_TRUE(p.poisoned());
}

TEST(Errors, LogicErrorsDoNotPoison)
{
    std::string json = "[[1],2]";
    in_mem src(json);
    mem_parser p(src);
    value root;
    ASSERT_TRUE(p.next(root));
    auto arr = root.as_array();
    value v;
    ASSERT_TRUE(arr.next(v));
    {
        auto inner = v.as_array();
        value w;
        EXPECT_THROW(arr.next(w), std::logic_error);
    }
    EXPECT_FALSE(p.poisoned());
    ASSERT_TRUE(arr.next(v));
    EXPECT_EQ(v.as_number().read<int>(), 2);
}

TEST(Errors, ErrorTables)
{
    for (int i = ERROR_none; i <= ERROR_not_integer; ++i)
    {
        error e = static_cast<error>(i);
        EXPECT_STRNE(error_msg(e), "Unknown error.");
    }
    EXPECT_EQ(error_kind_of(ERROR_io), ERRKIND_io);
    EXPECT_EQ(error_kind_of(ERROR_str_utf8), ERRKIND_lexical);
    EXPECT_EQ(error_kind_of(ERROR_depth_exceeded), ERRKIND_structural);
    EXPECT_EQ(error_kind_of(ERROR_token_too_large), ERRKIND_structural);
    EXPECT_EQ(error_kind_of(ERROR_view_expired), ERRKIND_view_expired);
    EXPECT_EQ(error_kind_of(ERROR_not_integer), ERRKIND_range);

    EXPECT_TRUE(poisons(ERRKIND_io));
    EXPECT_TRUE(poisons(ERRKIND_lexical));
    EXPECT_TRUE(poisons(ERRKIND_structural));
    EXPECT_TRUE(poisons(ERRKIND_range));
    EXPECT_TRUE(poisons(ERRKIND_view_expired));
    EXPECT_FALSE(poisons(ERRKIND_none));
}

}  // namespace lzjson
