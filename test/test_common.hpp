#pragma once

#include <relaxjson/relaxjson.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

namespace relaxjson_test {

[[noreturn]] inline void fail(const char* expr, const char* file, int line, const char* msg = nullptr) {
  std::cerr << "TEST FAILED: " << (expr ? expr : "") << "\n  at " << file << ":" << line;
  if (msg && *msg) std::cerr << "\n  " << msg;
  std::cerr << "\n";
  std::abort();
}

inline void check(bool ok, const char* expr, const char* file, int line) {
  if (!ok) fail(expr, file, line);
}

template <class Fn>
inline void expect_throw(Fn&& fn, const char* expr, const char* file, int line) {
  try {
    fn();
  } catch (...) {
    return;
  }
  fail(expr, file, line, "expected exception, got none");
}

// Runs fn and returns the parse_error it raised; fails the test if it raised nothing.
template <class Fn>
inline relaxjson::parse_error expect_parse_error(Fn&& fn, const char* expr, const char* file, int line) {
  try {
    fn();
  } catch (const relaxjson::parse_error& e) {
    return e;
  }
  fail(expr, file, line, "expected relaxjson::parse_error, got none");
}

inline bool nearly_equal(double a, double b, double abs_eps = 1e-12, double rel_eps = 1e-12) {
  const double diff = std::fabs(a - b);
  if (diff <= abs_eps) return true;
  const double aa = std::fabs(a);
  const double bb = std::fabs(b);
  const double m = (aa > bb) ? aa : bb;
  return diff <= rel_eps * m;
}

// Collect-everything configuration at the given threshold.
inline relaxjson::parse_options lenient(relaxjson::logger_level level) {
  relaxjson::parse_options opt;
  opt.level = level;
  opt.throw_if_logged = false;
  opt.throw_if_fatal = false;
  return opt;
}

inline relaxjson::parse_options raising(relaxjson::logger_level level) {
  relaxjson::parse_options opt;
  opt.level = level;
  opt.throw_if_logged = true;
  opt.throw_if_fatal = true;
  return opt;
}

} // namespace relaxjson_test

#define RELAXJSON_CHECK(expr) ::relaxjson_test::check(!!(expr), #expr, __FILE__, __LINE__)
#define RELAXJSON_EXPECT_THROW(expr) ::relaxjson_test::expect_throw([&] { (void)(expr); }, #expr, __FILE__, __LINE__)
#define RELAXJSON_EXPECT_PARSE_ERROR(expr) \
  ::relaxjson_test::expect_parse_error([&] { (void)(expr); }, #expr, __FILE__, __LINE__)

namespace relaxjson_test {

inline void check_lint(const relaxjson::lint& l, relaxjson::severity sev, std::string_view message_part) {
  ::relaxjson_test::check(l.sev == sev, "l.sev == sev", __FILE__, __LINE__);
  ::relaxjson_test::check(l.message.find(message_part) != std::string::npos, "l.message contains message_part",
                          __FILE__, __LINE__);
}

} // namespace relaxjson_test
