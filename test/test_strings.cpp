#include "test_common.hpp"

#include <string>

using namespace relaxjson;

static void test_escape_sequences() {
  auto r = parse(R"("a\\b\/c\b\f\n\r\t\"")");
  RELAXJSON_CHECK(r.lints.empty());
  RELAXJSON_CHECK(r.val.as_string() == std::string("a\\b/c\b\f\n\r\t\""));
}

static void test_unicode_escapes_and_surrogates() {
  {
    auto r = parse(R"("\u00e9\u4F60")");
    RELAXJSON_CHECK(r.val.as_string() == "\xC3\xA9\xE4\xBD\xA0");
  }
  {
    auto r = parse(R"("\uD83D\uDE03")");
    RELAXJSON_CHECK(r.val.as_string() == "\xF0\x9F\x98\x83");
  }
  {
    // raw UTF-8 passes through unchanged
    auto r = parse("\"caf\xC3\xA9 \xF0\x9F\x98\x83\"");
    RELAXJSON_CHECK(r.val.as_string() == "caf\xC3\xA9 \xF0\x9F\x98\x83");
  }
  {
    // a lone surrogate cannot be written as UTF-8
    auto r = parse(R"("\uD800x")");
    RELAXJSON_CHECK(r.val.as_string() == "\xEF\xBF\xBDx");
  }
}

static void test_invalid_string_escapes() {
  const auto opt = relaxjson_test::lenient(logger_level::json5);
  {
    auto r = parse(R"("\u12")", opt);
    RELAXJSON_CHECK(r.fatal);
    relaxjson_test::check_lint(r.lints.back(), severity::fatal, "Could not find valid hexadecimal of length 4");
  }
  {
    auto r = parse(R"("\u00zz")", opt);
    RELAXJSON_CHECK(r.fatal);
  }
  {
    auto r = parse(R"("\x4")", opt);
    RELAXJSON_CHECK(r.fatal);
    relaxjson_test::check_lint(r.lints.back(), severity::fatal, "Could not find valid hexadecimal of length 2");
  }
  {
    auto e = RELAXJSON_EXPECT_PARSE_ERROR(parse(R"("\u12")"));
    RELAXJSON_CHECK(e.message().find("hexadecimal") != std::string::npos);
  }
}

static void test_control_characters() {
  {
    // OK tier: tolerated at the default threshold
    auto r = parse("\"a\tb\"");
    RELAXJSON_CHECK(r.lints.empty());
    RELAXJSON_CHECK(r.state == severity::ok);
    RELAXJSON_CHECK(r.val.as_string() == "a\tb");
  }
  {
    auto r = parse("\"a\tb\"", relaxjson_test::lenient(logger_level::strict));
    RELAXJSON_CHECK(r.lints.size() == 1);
    relaxjson_test::check_lint(r.lints[0], severity::ok, "Control characters");
    RELAXJSON_CHECK(r.lints[0].cur_char == u'\t');
    RELAXJSON_CHECK(r.lints[0].pos == 2);
  }
  {
    auto r = parse("\"a\nb\"", relaxjson_test::lenient(logger_level::json5));
    RELAXJSON_CHECK(r.lints.size() == 1);
    relaxjson_test::check_lint(r.lints[0], severity::bad, "String literal contains newline");
    RELAXJSON_CHECK(r.val.as_string() == "a\nb");
  }
  {
    std::u16string s = u"\"a";
    s.push_back(u'\0');
    s += u"b\"";
    auto r = parse(std::u16string_view(s), relaxjson_test::lenient(logger_level::json5));
    RELAXJSON_CHECK(r.fatal);
    relaxjson_test::check_lint(r.lints.back(), severity::fatal, "null character");
    RELAXJSON_CHECK(r.lints.back().cur_char == u'\0');
  }
  {
    // decoded escapes follow the same policy
    auto r = parse(R"("\u0000")", relaxjson_test::lenient(logger_level::json5));
    RELAXJSON_CHECK(r.fatal);
  }
  {
    auto r = parse(R"("\u000a")", relaxjson_test::lenient(logger_level::json5));
    RELAXJSON_CHECK(!r.fatal);
    RELAXJSON_CHECK(r.state == severity::bad);
    RELAXJSON_CHECK(r.val.as_string() == "\n");
  }
}

static void test_json5_strings() {
  const auto opt = relaxjson_test::lenient(logger_level::json5);
  {
    auto r = parse("'single \"quoted\"'", opt);
    RELAXJSON_CHECK(r.lints.empty());
    RELAXJSON_CHECK(r.state == severity::json5);
    RELAXJSON_CHECK(r.val.as_string() == "single \"quoted\"");
  }
  {
    auto r = parse(R"('it\'s')", opt);
    RELAXJSON_CHECK(r.val.as_string() == "it's");
  }
  {
    auto r = parse(R"("\x41\x42")", opt);
    RELAXJSON_CHECK(r.val.as_string() == "AB");
    RELAXJSON_CHECK(r.state == severity::json5);
  }
  {
    auto r = parse(R"("\v")", opt);
    RELAXJSON_CHECK(r.val.as_string() == "\v");
  }
  {
    // any other escaped character is taken literally
    auto r = parse(R"("\q\'")", relaxjson_test::lenient(logger_level::jsonc));
    RELAXJSON_CHECK(r.val.as_string() == "q'");
    RELAXJSON_CHECK(r.lints.size() == 2);
    relaxjson_test::check_lint(r.lints[0], severity::json5, "Escaped char 'q' is only valid in JSON5");
    relaxjson_test::check_lint(r.lints[1], severity::json5, "Escaped char ''' is only valid in JSON5");
  }
  {
    auto r = parse("\"line\\\ncontinued\\\r\nhere\"", opt);
    RELAXJSON_CHECK(r.val.as_string() == "linecontinuedhere");
  }
  {
    auto r = parse("'abc'", relaxjson_test::lenient(logger_level::jsonc));
    RELAXJSON_CHECK(r.lints.size() == 1);
    relaxjson_test::check_lint(r.lints[0], severity::json5, "Singlequoted strings are only allowed in JSON5");
    RELAXJSON_CHECK(r.lints[0].pos == 1);
    RELAXJSON_CHECK(r.val.as_string() == "abc");
  }
  {
    RELAXJSON_EXPECT_PARSE_ERROR(parse("'abc'"));
    RELAXJSON_EXPECT_PARSE_ERROR(parse(R"("\x41")"));
  }
}

static void test_unterminated_string() {
  auto r = parse("[\"abc", relaxjson_test::lenient(logger_level::json5));
  RELAXJSON_CHECK(!r.fatal);
  RELAXJSON_CHECK(r.lints.size() == 2);
  relaxjson_test::check_lint(r.lints[0], severity::bad, "Unterminated string literal starting at position 1");
  relaxjson_test::check_lint(r.lints[1], severity::bad, "Unterminated array");
  RELAXJSON_CHECK(r.val.as_array().size() == 1);
  RELAXJSON_CHECK(r.val.as_array()[0].as_string() == "abc");
}

static void test_dump_escapes_and_roundtrip() {
  const value v(std::string("q\"b\\s\n\x01 caf\xC3\xA9"));
  const std::string out = dump(v);
  RELAXJSON_CHECK(out == "\"q\\\"b\\\\s\\n\\u0001 caf\xC3\xA9\"");
  auto r = parse(out);
  RELAXJSON_CHECK(r.lints.empty());
  RELAXJSON_CHECK(r.val == v);
}

void test_strings() {
  test_escape_sequences();
  test_unicode_escapes_and_surrogates();
  test_invalid_string_escapes();
  test_control_characters();
  test_json5_strings();
  test_unterminated_string();
  test_dump_escapes_and_roundtrip();
}
