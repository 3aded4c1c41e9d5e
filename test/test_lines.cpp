#include "test_common.hpp"

#include <string>

using namespace relaxjson;

static void test_one_document_per_line() {
  const auto opt = relaxjson_test::lenient(logger_level::json5);
  {
    auto r = parse_lines("{}\n{}\n", opt);
    RELAXJSON_CHECK(r.lints.empty());
    RELAXJSON_CHECK(!r.fatal);
    const auto& a = r.val.as_array();
    RELAXJSON_CHECK(a.size() == 2);
    RELAXJSON_CHECK(a[0].is_object() && a[0].as_object().empty());
    RELAXJSON_CHECK(a[1].is_object() && a[1].as_object().empty());
  }
  {
    // last line need not end in a newline
    auto r = parse_lines("1\n\"two\"\n[3]", opt);
    RELAXJSON_CHECK(r.lints.empty());
    const auto& a = r.val.as_array();
    RELAXJSON_CHECK(a.size() == 3);
    RELAXJSON_CHECK(a[0].as_int() == 1);
    RELAXJSON_CHECK(a[1].as_string() == "two");
    RELAXJSON_CHECK(a[2].as_array()[0].as_int() == 3);
  }
  {
    auto r = parse_lines(u"{\"a\": 1}\r\n{\"a\": 2}\r\n", opt);
    RELAXJSON_CHECK(r.lints.empty());
    RELAXJSON_CHECK(r.val.as_array().size() == 2);
    RELAXJSON_CHECK(r.val.as_array()[1].find("a")->as_int() == 2);
  }
  {
    auto r = parse_lines("1 // one\n2 // two\n", opt);
    RELAXJSON_CHECK(r.lints.empty());
    RELAXJSON_CHECK(r.val.as_array().size() == 2);
  }
}

static void test_line_violations() {
  const auto opt = relaxjson_test::lenient(logger_level::json5);
  {
    auto r = parse_lines("{}\n{} {}\n", opt);
    RELAXJSON_CHECK(r.fatal);
    RELAXJSON_CHECK(r.lints.size() == 1);
    relaxjson_test::check_lint(r.lints[0], severity::fatal,
                               "JSON Lines document does not contain exactly one JSON document per line");
    RELAXJSON_CHECK(r.val.as_array().size() == 2);
  }
  {
    auto r = parse_lines("[1,\n2]\n3\n", opt);
    RELAXJSON_CHECK(r.fatal);
  }
  {
    // a line may not be empty
    auto r = parse_lines("1\n\n2\n", opt);
    RELAXJSON_CHECK(r.fatal);
  }
  {
    RELAXJSON_EXPECT_PARSE_ERROR(parse_lines("{}\n{} {}\n"));
  }
}

static void test_lints_inside_lines() {
  const auto opt = relaxjson_test::lenient(logger_level::json5);
  {
    auto r = parse_lines("[1 2]\n{\"a\":1}\n", opt);
    RELAXJSON_CHECK(!r.fatal);
    RELAXJSON_CHECK(r.lints.size() == 1);
    relaxjson_test::check_lint(r.lints[0], severity::bad, "No comma between array members");
    RELAXJSON_CHECK(r.val.as_array().size() == 2);
  }
  {
    auto r = parse_lines("", opt);
    RELAXJSON_CHECK(r.fatal);
    relaxjson_test::check_lint(r.lints[0], severity::fatal, "No input");
  }
  {
    auto r = parse_lines("\n\n", opt);
    RELAXJSON_CHECK(r.fatal);
    relaxjson_test::check_lint(r.lints[0], severity::fatal, "Json string is only whitespace and maybe comments");
  }
  {
    // the session is reset between calls
    parser p(opt);
    (void)p.parse_lines(std::string_view("1\n2 3\n"));
    RELAXJSON_CHECK(p.fatal());
    const value v = p.parse_lines(std::string_view("1\n2\n"));
    RELAXJSON_CHECK(!p.fatal());
    RELAXJSON_CHECK(p.lints().empty());
    RELAXJSON_CHECK(v.as_array().size() == 2);
  }
}

void test_lines() {
  test_one_document_per_line();
  test_line_violations();
  test_lints_inside_lines();
}
