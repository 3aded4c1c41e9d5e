#pragma once

// relaxjson: a small, header-only C++17 tolerant JSON parser and linter.
// Goals: read anything from strict JSON up to JSON5, classify every deviation,
// and keep going when the caller asks for a lint report instead of an error.

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <unicode/uchar.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

namespace relaxjson {

// Config: floating-point parsing backend.
// Override by defining RELAXJSON_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef RELAXJSON_USE_FROM_CHARS_DOUBLE
  #define RELAXJSON_USE_FROM_CHARS_DOUBLE 0
#endif

// Need to bound nesting: a stack overflow cannot be recovered from.
constexpr int max_recursion_depth = 512;

// How far a document strays from canonical JSON.
// strict..json5 are tolerance tiers; bad and fatal are always logged.
enum class severity { strict, ok, nan_inf, jsonc, json5, bad, fatal };

// Deviations above this level are reported.
enum class logger_level { strict, ok, nan_inf, jsonc, json5 };

inline const char* to_string(severity s) noexcept {
  switch (s) {
    case severity::strict: return "STRICT";
    case severity::ok: return "OK";
    case severity::nan_inf: return "NAN_INF";
    case severity::jsonc: return "JSONC";
    case severity::json5: return "JSON5";
    case severity::bad: return "BAD";
    case severity::fatal: return "FATAL";
  }
  return "FATAL";
}

inline const char* to_string(logger_level l) noexcept {
  return to_string(static_cast<severity>(static_cast<int>(l)));
}

namespace detail {

constexpr char32_t replacement_char = 0xFFFD;

inline bool is_digit(char16_t c) noexcept { return c >= u'0' && c <= u'9'; }

inline int hex_val(char16_t c) noexcept {
  if (c >= u'0' && c <= u'9') return static_cast<int>(c - u'0');
  if (c >= u'a' && c <= u'f') return 10 + static_cast<int>(c - u'a');
  if (c >= u'A' && c <= u'F') return 10 + static_cast<int>(c - u'A');
  return -1;
}

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

// Lone surrogates are written as U+FFFD.
inline std::string utf16_to_utf8(std::u16string_view s) {
  std::string out;
  out.reserve(s.size());
  const std::size_t n = s.size();
  for (std::size_t i = 0; i < n; ++i) {
    const char16_t c = s[i];
    if (c < 0x80) {
      out.push_back(static_cast<char>(c));
      continue;
    }
    if (U16_IS_LEAD(c) && i + 1 < n && U16_IS_TRAIL(s[i + 1])) {
      append_utf8(out, static_cast<std::uint32_t>(U16_GET_SUPPLEMENTARY(c, s[i + 1])));
      ++i;
      continue;
    }
    append_utf8(out, U16_IS_SURROGATE(c) ? replacement_char : static_cast<std::uint32_t>(c));
  }
  return out;
}

// Invalid UTF-8 sequences are decoded as U+FFFD.
inline std::u16string utf8_to_utf16(std::string_view s) {
  if (s.size() > static_cast<std::size_t>((std::numeric_limits<std::int32_t>::max)())) {
    throw std::length_error("relaxjson: input too large");
  }
  const auto* p = reinterpret_cast<const std::uint8_t*>(s.data());
  const auto n = static_cast<std::int32_t>(s.size());
  std::u16string out;
  out.reserve(s.size());
  std::int32_t i = 0;
  while (i < n) {
    UChar32 cp = 0;
    U8_NEXT(p, i, n, cp);
    if (cp < 0) cp = static_cast<UChar32>(replacement_char);
    if (cp <= 0xFFFF) {
      out.push_back(static_cast<char16_t>(cp));
    } else {
      out.push_back(static_cast<char16_t>(U16_LEAD(cp)));
      out.push_back(static_cast<char16_t>(U16_TRAIL(cp)));
    }
  }
  return out;
}

// Number of bytes beyond the first that c takes up in UTF-8.
// Each half of a surrogate pair counts 1, for 4 bytes in total.
inline int extra_utf8_bytes(char16_t c) noexcept {
  if (c < 0x80) return 0;
  if (c < 0x800) return 1;
  if (c >= 0xD800 && c <= 0xDFFF) return 1;
  return 2;
}

inline std::size_t extra_utf8_bytes_between(std::u16string_view s, std::size_t start, std::size_t end) noexcept {
  std::size_t count = 0;
  for (std::size_t i = start; i < end && i < s.size(); ++i) {
    count += static_cast<std::size_t>(extra_utf8_bytes(s[i]));
  }
  return count;
}

// Whitespace accepted only under JSON5: line/paragraph separators, the BOM,
// and the Unicode space separators other than ' '.
inline bool is_json5_space(char16_t c) noexcept {
  switch (c) {
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
    case 0xFEFF:
      return true;
    default:
      return c >= 0x2000 && c <= 0x200A;
  }
}

inline bool is_key_start(UChar32 cp) noexcept {
  if (cp == '_' || cp == '$') return true;
  const std::uint32_t mask = U_GC_LU_MASK | U_GC_LL_MASK | U_GC_LT_MASK | U_GC_LM_MASK | U_GC_LO_MASK | U_GC_NL_MASK;
  return (U_GET_GC_MASK(cp) & mask) != 0;
}

inline bool is_key_part(UChar32 cp) noexcept {
  if (is_key_start(cp) || cp == 0x200C || cp == 0x200D) return true;
  const std::uint32_t mask = U_GC_MN_MASK | U_GC_MC_MASK | U_GC_ND_MASK | U_GC_PC_MASK;
  return (U_GET_GC_MASK(cp) & mask) != 0;
}

inline bool parse_double(std::string_view token, double& out) {
  if (token.empty()) return false;
#if defined(RELAXJSON_USE_FROM_CHARS_DOUBLE) && RELAXJSON_USE_FROM_CHARS_DOUBLE
#if defined(__cpp_lib_to_chars)
  {
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (*first == '+') ++first;
    auto r = std::from_chars(first, last, out, std::chars_format::general);
    return r.ec == std::errc{} && r.ptr == last;
  }
#endif
#endif

  // Token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  char buf[kStackCap];
  std::string big;
  const char* cstr = buf;
  if (token.size() < kStackCap) {
    std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
  } else {
    big.assign(token.data(), token.size());
    cstr = big.c_str();
  }
  char* end = nullptr;
  out = std::strtod(cstr, &end);
  return end == cstr + token.size();
}

inline bool parse_int64(std::string_view token, std::int64_t& out) noexcept {
  if (!token.empty() && token.front() == '+') token.remove_prefix(1);
  if (token.empty()) return false;
  const char* last = token.data() + token.size();
  auto r = std::from_chars(token.data(), last, out);
  return r.ec == std::errc{} && r.ptr == last;
}

} // namespace detail

// A character wrapped in single quotes, with the invisible ones spelled out.
inline std::string char_display(char16_t c) {
  switch (c) {
    case u'\0': return "'\\x00'";
    case u'\t': return "'\\t'";
    case u'\r': return "'\\r'";
    case u'\n': return "'\\n'";
    case u'\'': return "'\\''";
    default: break;
  }
  std::string out(1, '\'');
  detail::append_utf8(out, U16_IS_SURROGATE(c) ? detail::replacement_char : static_cast<std::uint32_t>(c));
  out.push_back('\'');
  return out;
}

// A deviation recorded instead of raised.
struct lint {
  std::string message;
  std::size_t pos{0}; // UTF-8 byte offset
  char16_t cur_char{0};
  severity sev{severity::strict};

  std::string to_string() const {
    return "Syntax error (severity = " + std::string(relaxjson::to_string(sev)) + ") at position " +
           std::to_string(pos) + " (char " + char_display(cur_char) + "): " + message;
  }
};

class parse_error : public std::runtime_error {
public:
  parse_error(std::string message, char16_t cur_char, std::size_t pos)
      : std::runtime_error(message + " at position " + std::to_string(pos) + " (char " + char_display(cur_char) + ")"),
        message_(std::move(message)),
        cur_char_(cur_char),
        pos_(pos) {}

  const std::string& message() const noexcept { return message_; }
  char16_t cur_char() const noexcept { return cur_char_; }
  std::size_t pos() const noexcept { return pos_; }

private:
  std::string message_;
  char16_t cur_char_;
  std::size_t pos_;
};

struct date {
  int year{1};
  int month{1};
  int day{1};

  std::string to_string() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
  }

  friend bool operator==(const date& a, const date& b) noexcept {
    return a.year == b.year && a.month == b.month && a.day == b.day;
  }
  friend bool operator!=(const date& a, const date& b) noexcept { return !(a == b); }
};

struct datetime {
  int year{1};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};
  int millisecond{0};

  std::string to_string() const {
    char buf[48];
    if (millisecond != 0) {
      std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d", year, month, day, hour, minute, second,
                    millisecond);
    } else {
      std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", year, month, day, hour, minute, second);
    }
    return buf;
  }

  friend bool operator==(const datetime& a, const datetime& b) noexcept {
    return a.year == b.year && a.month == b.month && a.day == b.day && a.hour == b.hour && a.minute == b.minute &&
           a.second == b.second && a.millisecond == b.millisecond;
  }
  friend bool operator!=(const datetime& a, const datetime& b) noexcept { return !(a == b); }
};

namespace detail {

inline bool read_digits(std::string_view s, std::size_t at, std::size_t count, int& out) noexcept {
  if (at + count > s.size()) return false;
  int v = 0;
  for (std::size_t k = at; k < at + count; ++k) {
    const char c = s[k];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

inline bool is_leap_year(int y) noexcept { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline int days_in_month(int y, int m) noexcept {
  static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap_year(y)) return 29;
  return days[m - 1];
}

// yyyy-MM-dd, optionally followed by [T ]hh:mm:ss, optional .s{1,3}, optional Z.
// Returns 0 for no match, 1 for a date, 2 for a datetime.
inline int match_date_or_datetime(std::string_view s, datetime& out) noexcept {
  const std::size_t len = s.size();
  if (len != 10 && (len < 19 || len > 23)) return 0;
  datetime dt;
  if (!read_digits(s, 0, 4, dt.year) || s[4] != '-' || !read_digits(s, 5, 2, dt.month) || s[7] != '-' ||
      !read_digits(s, 8, 2, dt.day)) {
    return 0;
  }
  if (dt.year < 1 || dt.month < 1 || dt.month > 12 || dt.day < 1 || dt.day > days_in_month(dt.year, dt.month)) {
    return 0;
  }
  if (len == 10) {
    out = dt;
    return 1;
  }

  if (s[10] != 'T' && s[10] != ' ') return 0;
  if (!read_digits(s, 11, 2, dt.hour) || s[13] != ':' || !read_digits(s, 14, 2, dt.minute) || s[16] != ':' ||
      !read_digits(s, 17, 2, dt.second)) {
    return 0;
  }
  if (dt.hour > 23 || dt.minute > 59 || dt.second > 59) return 0;

  std::size_t i = 19;
  if (i < len && s[i] == '.') {
    ++i;
    int scale = 100;
    std::size_t ndigits = 0;
    while (i < len && s[i] >= '0' && s[i] <= '9' && ndigits < 3) {
      dt.millisecond += (s[i] - '0') * scale;
      scale /= 10;
      ++ndigits;
      ++i;
    }
    if (ndigits == 0) return 0;
  }
  if (i < len && s[i] == 'Z') ++i;
  if (i != len) return 0;
  out = dt;
  return 2;
}

} // namespace detail

class parser;

class value {
public:
  using array = std::vector<value>;
  using object = std::vector<std::pair<std::string, value>>;

  enum class kind { null, boolean, integer, floating, string, date, datetime, array, object };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}

  static value integer(std::int64_t i) {
    value v;
    v.data_ = i;
    return v;
  }

  static value number(double d) {
    value v;
    v.data_ = d;
    return v;
  }

  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(relaxjson::date d) : data_(d) {}
  value(relaxjson::datetime dt) : data_(dt) {}
  value(array a) : data_(std::move(a)) {}
  value(object o) : data_(std::move(o)) {}

  kind type() const noexcept { return static_cast<kind>(data_.index()); }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_int() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
  bool is_double() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_number() const noexcept { return is_int() || is_double(); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_date() const noexcept { return std::holds_alternative<relaxjson::date>(data_); }
  bool is_datetime() const noexcept { return std::holds_alternative<relaxjson::datetime>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }

  bool as_bool() const {
    if (!is_bool()) throw std::runtime_error("relaxjson: value is not a boolean");
    return std::get<bool>(data_);
  }

  std::int64_t as_int() const {
    if (!is_int()) throw std::runtime_error("relaxjson: number is not int");
    return std::get<std::int64_t>(data_);
  }

  double as_double() const {
    if (is_int()) return static_cast<double>(std::get<std::int64_t>(data_));
    if (!is_double()) throw std::runtime_error("relaxjson: value is not a number");
    return std::get<double>(data_);
  }

  const std::string& as_string() const {
    if (!is_string()) throw std::runtime_error("relaxjson: value is not a string");
    return std::get<std::string>(data_);
  }

  const relaxjson::date& as_date() const {
    if (!is_date()) throw std::runtime_error("relaxjson: value is not a date");
    return std::get<relaxjson::date>(data_);
  }

  const relaxjson::datetime& as_datetime() const {
    if (!is_datetime()) throw std::runtime_error("relaxjson: value is not a datetime");
    return std::get<relaxjson::datetime>(data_);
  }

  const array& as_array() const {
    if (!is_array()) throw std::runtime_error("relaxjson: value is not an array");
    return std::get<array>(data_);
  }

  const object& as_object() const {
    if (!is_object()) throw std::runtime_error("relaxjson: value is not an object");
    return std::get<object>(data_);
  }

  const value* find(std::string_view key) const noexcept {
    if (!is_object()) return nullptr;
    for (const auto& kv : std::get<object>(data_)) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  // UTF-8 byte offset of the first character of this node in the parsed text.
  std::size_t pos() const noexcept { return pos_; }

  friend bool operator==(const value& a, const value& b);
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index order matches `kind`
  std::variant<std::monostate, bool, std::int64_t, double, std::string, relaxjson::date, relaxjson::datetime, array,
               object>
      data_;
  std::size_t pos_{0};

  friend class parser;
};

inline bool operator==(const value& a, const value& b) {
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case value::kind::null: return true;
    case value::kind::boolean: return a.as_bool() == b.as_bool();
    case value::kind::integer: return a.as_int() == b.as_int();
    case value::kind::floating: {
      const double da = a.as_double();
      const double db = b.as_double();
      if (std::isnan(da) || std::isnan(db)) return std::isnan(da) && std::isnan(db);
      return da == db;
    }
    case value::kind::string: return a.as_string() == b.as_string();
    case value::kind::date: return a.as_date() == b.as_date();
    case value::kind::datetime: return a.as_datetime() == b.as_datetime();
    case value::kind::array: {
      const auto& aa = a.as_array();
      const auto& ab = b.as_array();
      if (aa.size() != ab.size()) return false;
      for (std::size_t i = 0; i < aa.size(); ++i) {
        if (aa[i] != ab[i]) return false;
      }
      return true;
    }
    case value::kind::object: {
      // key order does not matter
      const auto& oa = a.as_object();
      if (oa.size() != b.as_object().size()) return false;
      for (const auto& kv : oa) {
        const value* other = b.find(kv.first);
        if (other == nullptr || kv.second != *other) return false;
      }
      return true;
    }
  }
  return false;
}

struct parse_options {
  logger_level level{logger_level::nan_inf};
  // Raise on any deviation above `level` instead of logging it.
  bool throw_if_logged{true};
  // Raise on fatal deviations even when `throw_if_logged` is false.
  bool throw_if_fatal{true};
  // Retag "yyyy-MM-dd" and "yyyy-MM-dd hh:mm:ss.sss" strings as dates.
  bool parse_datetimes{false};
};

// User-facing parser settings.
struct parser_settings {
  bool allow_nan_inf{true};
  bool allow_comments{false};
  bool allow_singlequoted_str{false};
  bool allow_datetimes{false};
  bool linting{false};
};

inline parse_options make_options(const parser_settings& s) noexcept {
  parse_options opt;
  if (s.allow_singlequoted_str) opt.level = logger_level::json5;
  else if (s.allow_comments) opt.level = logger_level::jsonc;
  else if (s.allow_nan_inf) opt.level = logger_level::nan_inf;
  else opt.level = logger_level::strict;
  opt.throw_if_logged = !s.linting;
  opt.throw_if_fatal = !s.linting;
  opt.parse_datetimes = s.allow_datetimes;
  return opt;
}

// One parse session. Not shareable between threads; use copy() to get an
// independent session with the same options.
class parser {
public:
  explicit parser(parse_options opt = {}) : opt_(opt) {}

  parser copy() const { return parser(opt_); }

  const parse_options& options() const noexcept { return opt_; }
  const std::vector<lint>& lints() const noexcept { return lint_; }
  severity state() const noexcept { return state_; }
  bool fatal() const noexcept { return state_ == severity::fatal; }
  bool has_logged() const noexcept { return static_cast<int>(state_) > static_cast<int>(opt_.level); }
  bool exited_early() const noexcept { return fatal() || (opt_.throw_if_logged && has_logged()); }

  // The last deviation logged, if the session ended fatally.
  std::optional<lint> fatal_error() const {
    if (fatal() && !lint_.empty()) return lint_.back();
    return std::nullopt;
  }

  // Cursor in UTF-16 code units.
  std::size_t position() const noexcept { return ii_; }
  std::size_t utf8_pos() const noexcept { return ii_ + utf8_extra_bytes_; }

  void reset() noexcept {
    lint_.clear();
    state_ = severity::strict;
    utf8_extra_bytes_ = 0;
    ii_ = 0;
  }

  value parse(std::u16string_view inp) {
    reset();
    inp_ = inp;
    const std::size_t n = inp_.size();
    if (n == 0) {
      handle_error("No input", 0, severity::fatal);
      return value();
    }
    if (!consume_insignificant_chars()) return value();
    if (ii_ >= n) {
      handle_error("Json string is only whitespace and maybe comments", n - 1, severity::fatal);
      return value();
    }
    value json = parse_something(0);
    if (fatal()) return json;
    if (!consume_insignificant_chars()) return json;
    if (ii_ < n) {
      const std::size_t width = (U16_IS_LEAD(inp_[ii_]) && ii_ + 1 < n && U16_IS_TRAIL(inp_[ii_ + 1])) ? 2 : 1;
      const std::string got = detail::utf16_to_utf8(inp_.substr(ii_, width));
      handle_error("At end of valid JSON document, got " + got + " instead of EOF", ii_, severity::bad);
    }
    return json;
  }

  value parse(std::string_view utf8) {
    const std::u16string text = detail::utf8_to_utf16(utf8);
    return parse(std::u16string_view(text));
  }

  // JSON Lines: one document per '\n'-delimited line, collected into an array.
  value parse_lines(std::u16string_view inp) {
    reset();
    inp_ = inp;
    const std::size_t n = inp_.size();
    if (n == 0) {
      handle_error("No input", 0, severity::fatal);
      return value();
    }
    if (!consume_insignificant_chars()) return value();
    if (ii_ >= n) {
      handle_error("Json string is only whitespace and maybe comments", n - 1, severity::fatal);
      return value();
    }

    value::array children;
    std::size_t last_ii = 0;
    std::size_t line_num = 0;
    while (ii_ < n) {
      value json = parse_something(0);
      const bool clean = consume_insignificant_chars();
      children.emplace_back(std::move(json));
      if (fatal() || !clean) return value(std::move(children));

      for (; last_ii < ii_ && last_ii < n; ++last_ii) {
        if (inp_[last_ii] == u'\n') ++line_num;
      }
      // the document must have been alone on its line
      const std::size_t count = children.size();
      if (!(line_num == count || (ii_ >= n && line_num == count - 1))) {
        handle_error("JSON Lines document does not contain exactly one JSON document per line", std::min(ii_, n - 1),
                     severity::fatal);
        return value(std::move(children));
      }
    }
    return value(std::move(children));
  }

  value parse_lines(std::string_view utf8) {
    const std::u16string text = detail::utf8_to_utf16(utf8);
    return parse_lines(std::u16string_view(text));
  }

private:
  std::u16string_view inp_;
  std::size_t ii_{0};
  std::size_t utf8_extra_bytes_{0};
  severity state_{severity::strict};
  std::vector<lint> lint_;
  parse_options opt_;

  static value at(value v, std::size_t pos) noexcept {
    v.pos_ = pos;
    return v;
  }

  std::size_t last_index() const noexcept { return inp_.empty() ? 0 : inp_.size() - 1; }

  bool matches(std::size_t at, std::u16string_view lit) const noexcept {
    return at <= inp_.size() && inp_.size() - at >= lit.size() && inp_.substr(at, lit.size()) == lit;
  }

  std::string narrow(std::size_t begin, std::size_t end) const {
    std::string out;
    out.reserve(end - begin);
    for (std::size_t k = begin; k < end; ++k) out.push_back(static_cast<char>(inp_[k]));
    return out;
  }

  // Byte offset of code unit `pos`. utf8_extra_bytes_ covers exactly [0, ii_),
  // so only the units between the cursor and `pos` need counting.
  std::size_t utf8_offset(std::size_t pos) const noexcept {
    pos = std::min(pos, inp_.size());
    if (pos >= ii_) return pos + utf8_extra_bytes_ + detail::extra_utf8_bytes_between(inp_, ii_, pos);
    return pos + utf8_extra_bytes_ - detail::extra_utf8_bytes_between(inp_, pos, ii_);
  }

  // Every deviation goes through here. Raises the worst-severity register;
  // if sev is above the threshold, either raises a parse_error or appends a lint.
  // Returns whether the session is now fatal.
  bool handle_error(std::string message, std::size_t pos, severity sev) {
    if (state_ < sev) state_ = sev;
    const bool is_fatal = fatal();
    if (static_cast<int>(sev) > static_cast<int>(opt_.level)) {
      const char16_t c = pos >= inp_.size() ? u'\0' : inp_[pos];
      const std::size_t utf8_at = utf8_offset(pos);
      if (opt_.throw_if_logged || (sev == severity::fatal && opt_.throw_if_fatal)) {
        throw parse_error(std::move(message), c, utf8_at);
      }
      lint_.push_back(lint{std::move(message), utf8_at, c, sev});
    }
    return is_fatal;
  }

  void consume_line() noexcept {
    const std::size_t n = inp_.size();
    while (ii_ < n && inp_[ii_] != u'\n') {
      utf8_extra_bytes_ += static_cast<std::size_t>(detail::extra_utf8_bytes(inp_[ii_]));
      ++ii_;
    }
    if (ii_ < n) ++ii_;
  }

  // Skips whitespace and comments. Returns false if parsing must stop.
  bool consume_insignificant_chars() {
    const std::size_t n = inp_.size();
    while (ii_ < n) {
      const char16_t c = inp_[ii_];
      switch (c) {
        case u' ':
        case u'\t':
        case u'\r':
        case u'\n':
          ++ii_;
          break;
        case u'/': {
          ++ii_;
          if (ii_ == n) {
            handle_error("Expected JavaScript comment after '/'", n - 1, severity::fatal);
            return false;
          }
          handle_error("JavaScript comments are not part of the original JSON specification", ii_, severity::jsonc);
          const char16_t next = inp_[ii_];
          if (next == u'/') {
            consume_line();
          } else if (next == u'*') {
            ++ii_;
            bool comment_ended = false;
            while (ii_ + 1 < n) {
              const char16_t cc = inp_[ii_];
              if (cc == u'*' && inp_[ii_ + 1] == u'/') {
                ii_ += 2;
                comment_ended = true;
                break;
              }
              utf8_extra_bytes_ += static_cast<std::size_t>(detail::extra_utf8_bytes(cc));
              ++ii_;
            }
            if (!comment_ended) {
              if (ii_ < n) {
                utf8_extra_bytes_ += static_cast<std::size_t>(detail::extra_utf8_bytes(inp_[ii_]));
                ii_ = n;
              }
              handle_error("Unterminated multi-line comment", n - 1, severity::bad);
              return false;
            }
          } else {
            handle_error("Expected JavaScript comment after '/'", ii_, severity::fatal);
            return false;
          }
          break;
        }
        case u'#':
          handle_error("Python-style '#' comments are not part of any well-accepted JSON specification", ii_,
                       severity::bad);
          consume_line();
          break;
        default:
          if (!detail::is_json5_space(c)) return true;
          handle_error("Whitespace characters other than ' ', '\\t', '\\r', and '\\n' are only allowed in JSON5", ii_,
                       severity::json5);
          utf8_extra_bytes_ += static_cast<std::size_t>(detail::extra_utf8_bytes(c));
          ++ii_;
          break;
      }
    }
    return true;
  }

  // Reads `length` hex digits at the cursor. Returns -1 (after a fatal report) on failure.
  int parse_hex_char(std::size_t length) {
    if (ii_ + length > inp_.size()) {
      handle_error("Could not find valid hexadecimal of length " + std::to_string(length), ii_, severity::fatal);
      return -1;
    }
    int charval = 0;
    for (std::size_t k = 0; k < length; ++k) {
      const int h = detail::hex_val(inp_[ii_ + k]);
      if (h < 0) {
        handle_error("Could not find valid hexadecimal of length " + std::to_string(length), ii_ + k,
                     severity::fatal);
        return -1;
      }
      charval = (charval << 4) | h;
    }
    ii_ += length;
    return charval;
  }

  // Control characters (< 0x20) in strings and keys. Returns whether the session is fatal.
  bool handle_char_errors(int c, std::size_t pos, bool is_key) {
    if (c >= 0x20) return false;
    if (c == '\n') {
      return handle_error(is_key ? "Object key contains newline" : "String literal contains newline", pos,
                          severity::bad);
    }
    if (c == 0) {
      return handle_error("'\\x00' is the null character, which is illegal in relaxjson", pos, severity::fatal);
    }
    return handle_error(
        "Control characters (ASCII code less than 0x20) are disallowed inside strings under the strict JSON specification",
        pos, severity::ok);
  }

  // Body of a quoted string or key; the opening quote is already consumed.
  // Returns false if the literal was abandoned on a fatal error.
  bool consume_quoted(char16_t quote, bool is_key, std::size_t start_utf8_pos, std::u16string& sb) {
    const std::size_t n = inp_.size();
    while (true) {
      if (ii_ >= n) {
        if (is_key) {
          handle_error("Unterminated object key", last_index(), severity::fatal);
          return false;
        }
        handle_error("Unterminated string literal starting at position " + std::to_string(start_utf8_pos),
                     last_index(), severity::bad);
        return true;
      }
      const char16_t c = inp_[ii_];
      if (c == quote) {
        ++ii_;
        return true;
      }
      if (c != u'\\') {
        if (c < 0x20 && handle_char_errors(c, ii_, is_key)) return false;
        utf8_extra_bytes_ += static_cast<std::size_t>(detail::extra_utf8_bytes(c));
        sb.push_back(c);
        ++ii_;
        continue;
      }

      const std::size_t esc_at = ii_;
      if (ii_ + 1 >= n) {
        ++ii_;
        continue;
      }
      const char16_t next = inp_[ii_ + 1];
      if (next == quote) {
        sb.push_back(quote);
        ii_ += 2;
        continue;
      }
      switch (next) {
        case u'\\': sb.push_back(u'\\'); ii_ += 2; continue;
        case u'/': sb.push_back(u'/'); ii_ += 2; continue;
        case u'b': sb.push_back(u'\b'); ii_ += 2; continue;
        case u'f': sb.push_back(u'\f'); ii_ += 2; continue;
        case u'n': sb.push_back(u'\n'); ii_ += 2; continue;
        case u'r': sb.push_back(u'\r'); ii_ += 2; continue;
        case u't': sb.push_back(u'\t'); ii_ += 2; continue;
        case u'u': {
          ii_ += 2;
          const int cp = parse_hex_char(4);
          if (cp < 0 || handle_char_errors(cp, esc_at, is_key)) return false;
          sb.push_back(static_cast<char16_t>(cp));
          continue;
        }
        case u'x': {
          ii_ += 2;
          const int cp = parse_hex_char(2);
          if (cp < 0 || handle_char_errors(cp, esc_at, is_key)) return false;
          handle_error("\\x escapes are only allowed in JSON5", esc_at, severity::json5);
          sb.push_back(static_cast<char16_t>(cp));
          continue;
        }
        case u'\n':
        case u'\r':
          handle_error("Escaped newline characters are only allowed in JSON5", ii_ + 1, severity::json5);
          ii_ += 2;
          if (next == u'\r' && ii_ < n && inp_[ii_] == u'\n') ++ii_;
          continue;
        case u'v':
          handle_error("Escaped char 'v' is only valid in JSON5", ii_ + 1, severity::json5);
          sb.push_back(u'\x0b');
          ii_ += 2;
          continue;
        default: {
          // JSON5 takes any other escaped character literally; it is consumed on the next pass.
          std::string shown;
          detail::append_utf8(shown, U16_IS_SURROGATE(next) ? detail::replacement_char : next);
          handle_error("Escaped char '" + shown + "' is only valid in JSON5", ii_ + 1, severity::json5);
          ++ii_;
          continue;
        }
      }
    }
  }

  value parse_string() {
    const std::size_t start_utf8_pos = utf8_pos();
    const char16_t quote = inp_[ii_++];
    if (quote == u'\'' && handle_error("Singlequoted strings are only allowed in JSON5", ii_, severity::json5)) {
      return at(value(std::string()), utf8_pos());
    }
    std::u16string sb;
    // An abandoned literal keeps what was read so far; the caller stops on fatal().
    const bool complete = consume_quoted(quote, /*is_key=*/false, start_utf8_pos, sb);
    std::string s = detail::utf16_to_utf8(sb);
    if (complete && opt_.parse_datetimes) return try_parse_date_or_datetime(std::move(s), start_utf8_pos);
    return at(value(std::move(s)), start_utf8_pos);
  }

  // Never reports: anything that is not a valid date stays a string.
  static value try_parse_date_or_datetime(std::string s, std::size_t start_utf8_pos) {
    datetime dt;
    switch (detail::match_date_or_datetime(s, dt)) {
      case 1: return at(value(date{dt.year, dt.month, dt.day}), start_utf8_pos);
      case 2: return at(value(dt), start_utf8_pos);
      default: return at(value(std::move(s)), start_utf8_pos);
    }
  }

  std::optional<std::string> parse_key() {
    const char16_t quote = inp_[ii_];
    if (quote == u'\'' && handle_error("Singlequoted strings are only allowed in JSON5", ii_, severity::json5)) {
      return std::nullopt;
    }
    if (quote != u'\'' && quote != u'"') return parse_unquoted_key();
    const std::size_t start_utf8_pos = utf8_pos();
    ++ii_;
    std::u16string sb;
    if (!consume_quoted(quote, /*is_key=*/true, start_utf8_pos, sb)) return std::nullopt;
    return detail::utf16_to_utf8(sb);
  }

  // ID_Start ID_Continue*, where either may also be a \uXXXX escape.
  std::optional<std::string> parse_unquoted_key() {
    const std::size_t n = inp_.size();
    const std::size_t start = ii_;
    std::size_t j = ii_;
    std::u16string sb;
    std::vector<std::pair<int, std::size_t>> escapes;
    while (j < n) {
      const char16_t c = inp_[j];
      if (c == u'\\') {
        if (j + 6 > n || inp_[j + 1] != u'u') break;
        int cp = 0;
        bool ok = true;
        for (std::size_t k = j + 2; k < j + 6; ++k) {
          const int h = detail::hex_val(inp_[k]);
          if (h < 0) {
            ok = false;
            break;
          }
          cp = (cp << 4) | h;
        }
        if (!ok) break;
        escapes.emplace_back(cp, j);
        sb.push_back(static_cast<char16_t>(cp));
        j += 6;
        continue;
      }
      UChar32 cp = c;
      std::size_t width = 1;
      if (U16_IS_LEAD(c) && j + 1 < n && U16_IS_TRAIL(inp_[j + 1])) {
        cp = U16_GET_SUPPLEMENTARY(c, inp_[j + 1]);
        width = 2;
      }
      const bool accepted = (j == start) ? detail::is_key_start(cp) : detail::is_key_part(cp);
      if (!accepted) break;
      sb.append(inp_.data() + j, width);
      j += width;
    }
    if (j == start) {
      handle_error("No valid unquoted key beginning at " + std::to_string(utf8_pos()), ii_, severity::fatal);
      return std::nullopt;
    }
    handle_error("Unquoted keys are only supported in JSON5", ii_, severity::json5);
    for (const auto& e : escapes) {
      if (handle_char_errors(e.first, e.second, /*is_key=*/true)) return std::nullopt;
    }
    utf8_extra_bytes_ += detail::extra_utf8_bytes_between(inp_, ii_, j);
    ii_ = j;
    return detail::utf16_to_utf8(sb);
  }

  // The denominator of a fraction must also be a number (no NaN or Infinity).
  bool starts_denominator(std::size_t k) const noexcept {
    if (k >= inp_.size()) return false;
    const char16_t c = inp_[k];
    return detail::is_digit(c) || c == u'-' || c == u'.' || c == u'+';
  }

  // Numbers, NaN/Infinity and their Python spellings, null, and None.
  // With allow_fraction unset a '/' ends the token.
  value parse_number(bool allow_fraction = true) {
    const std::size_t n = inp_.size();
    // bit 0: integer part, bit 1: decimal point, bit 2: exponent
    int parsed = 1;
    const std::size_t start = ii_;
    const std::size_t start_utf8_pos = utf8_pos();
    char16_t c = inp_[ii_];
    bool negative = false;
    if (!detail::is_digit(c)) {
      if (c == u'n') {
        if (matches(ii_, u"null")) {
          ii_ += 4;
          return at(value(), start_utf8_pos);
        }
        if (matches(ii_, u"nan")) {
          handle_error("nan is not a valid representation of Not a Number in JSON", ii_, severity::bad);
          ii_ += 3;
          return at(value::number(std::numeric_limits<double>::quiet_NaN()), start_utf8_pos);
        }
        handle_error("Expected literal starting with 'n' to be null or nan", ii_ + 1, severity::fatal);
        return at(value(), start_utf8_pos);
      }
      if (c == u'-' || c == u'+') {
        if (c == u'+') {
          handle_error("Leading + signs in numbers are not allowed except in JSON5", ii_, severity::json5);
        } else {
          negative = true;
        }
        ++ii_;
        if (ii_ >= n) {
          handle_error("Number sign with no digits following", n - 1, severity::fatal);
          return at(value(), start_utf8_pos);
        }
        c = inp_[ii_];
      }
      if (c == u'I') {
        if (matches(ii_, u"Infinity")) {
          handle_error("Infinity is not part of the original JSON specification", ii_, severity::nan_inf);
          ii_ += 8;
          const double inf = std::numeric_limits<double>::infinity();
          return at(value::number(negative ? -inf : inf), start_utf8_pos);
        }
        handle_error("Expected literal starting with 'I' to be Infinity", ii_ + 1, severity::fatal);
        return at(value(), start_utf8_pos);
      }
      if (c == u'N') {
        if (matches(ii_, u"NaN")) {
          handle_error("NaN is not part of the original JSON specification", ii_, severity::nan_inf);
          ii_ += 3;
          return at(value::number(std::numeric_limits<double>::quiet_NaN()), start_utf8_pos);
        }
        if (matches(ii_, u"None")) {
          ii_ += 4;
          handle_error("None is not an accepted part of any JSON specification", ii_, severity::bad);
          return at(value(), start_utf8_pos);
        }
        handle_error("Expected literal starting with 'N' to be NaN or None", ii_ + 1, severity::fatal);
        return at(value(), start_utf8_pos);
      }
      if (c == u'i') {
        if (matches(ii_, u"inf")) {
          handle_error("inf is not the correct representation of Infinity in JSON", ii_, severity::bad);
          ii_ += 3;
          const double inf = std::numeric_limits<double>::infinity();
          return at(value::number(negative ? -inf : inf), start_utf8_pos);
        }
        handle_error("Expected literal starting with 'i' to be inf", ii_, severity::fatal);
        return at(value(), start_utf8_pos);
      }
    }

    // A sign before 0x applies to the hex value.
    if (c == u'0' && ii_ + 1 < n && inp_[ii_ + 1] == u'x') return parse_hex_number(negative, start_utf8_pos);

    const std::size_t digits_start = ii_;
    while (ii_ < n) {
      c = inp_[ii_];
      if (detail::is_digit(c)) {
        ++ii_;
      } else if (c == u'.') {
        if (parsed != 1) {
          handle_error("Number with a decimal point in the wrong place", ii_, severity::fatal);
          break;
        }
        if (ii_ == digits_start &&
            handle_error("Numbers with a leading decimal point are only part of JSON5", ii_, severity::json5)) {
          return at(value(), start_utf8_pos);
        }
        parsed = 3;
        ++ii_;
      } else if (c == u'e' || c == u'E') {
        if ((parsed & 4) != 0) break;
        parsed += 4;
        ++ii_;
        if (ii_ < n && (inp_[ii_] == u'+' || inp_[ii_] == u'-')) ++ii_;
        if (ii_ >= n || !detail::is_digit(inp_[ii_])) {
          handle_error("Scientific notation 'e' with no number following", std::min(ii_, n - 1), severity::fatal);
          return at(value(), start_utf8_pos);
        }
      } else if (allow_fraction && c == u'/' && starts_denominator(ii_ + 1)) {
        // a/b/c reads as a/(b/c); the terms are collected, then folded from the right
        std::vector<double> terms{to_double(start, ii_)};
        std::size_t term_start = start;
        do {
          handle_error("Fractions of the form 1/3 are not part of any JSON specification", term_start, severity::bad);
          term_start = ++ii_;
          const value term = parse_number(/*allow_fraction=*/false);
          if (fatal()) return at(value::number(terms.front()), start_utf8_pos);
          terms.push_back(term.is_number() ? term.as_double() : std::numeric_limits<double>::quiet_NaN());
        } while (ii_ < n && inp_[ii_] == u'/' && starts_denominator(ii_ + 1));
        double d = terms.back();
        for (std::size_t k = terms.size() - 1; k-- > 0;) d = terms[k] / d;
        return at(value::number(d), start_utf8_pos);
      } else {
        break;
      }
    }

    if (parsed == 1) {
      // out-of-range integers fall back to double
      std::int64_t iv = 0;
      if (detail::parse_int64(narrow(start, ii_), iv)) return at(value::integer(iv), start_utf8_pos);
    }
    return at(value::number(to_double(start, ii_)), start_utf8_pos);
  }

  value parse_hex_number(bool negative, std::size_t start_utf8_pos) {
    const std::size_t n = inp_.size();
    handle_error("Hexadecimal numbers are only part of JSON5", ii_, severity::json5);
    ii_ += 2;
    const std::size_t hex_start = ii_;
    std::uint64_t acc = 0;
    double dacc = 0.0;
    bool overflow = false;
    while (ii_ < n) {
      const int h = detail::hex_val(inp_[ii_]);
      if (h < 0) break;
      if (!overflow && acc > ((std::numeric_limits<std::uint64_t>::max)() >> 4)) overflow = true;
      acc = (acc << 4) | static_cast<std::uint64_t>(h);
      dacc = dacc * 16.0 + h;
      ++ii_;
    }
    if (ii_ == hex_start) {
      handle_error("Could not find valid hexadecimal after '0x'", std::min(ii_, n - 1), severity::fatal);
      return at(value(), start_utf8_pos);
    }
    const std::uint64_t limit = static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)());
    if (!overflow && acc <= limit) {
      const auto v = static_cast<std::int64_t>(acc);
      return at(value::integer(negative ? -v : v), start_utf8_pos);
    }
    if (!overflow && negative && acc == limit + 1) {
      return at(value::integer((std::numeric_limits<std::int64_t>::min)()), start_utf8_pos);
    }
    return at(value::number(negative ? -dacc : dacc), start_utf8_pos);
  }

  double to_double(std::size_t begin, std::size_t end) {
    const std::string numstr = narrow(begin, end);
    double num = 0.0;
    if (!detail::parse_double(numstr, num)) {
      handle_error("Number " + numstr + " had bad format", begin, severity::bad);
      num = std::numeric_limits<double>::quiet_NaN();
    }
    return num;
  }

  value parse_array(int recursion_depth) {
    const std::size_t n = inp_.size();
    const std::size_t start_utf8_pos = utf8_pos();
    value::array children;
    auto result = [&]() { return at(value(std::move(children)), start_utf8_pos); };
    bool already_seen_comma = false;
    ++ii_;
    if (recursion_depth == max_recursion_depth) {
      handle_error("Maximum recursion depth (" + std::to_string(max_recursion_depth) + ") reached", ii_,
                   severity::fatal);
      return result();
    }
    while (ii_ < n) {
      if (!consume_insignificant_chars()) return result();
      if (ii_ >= n) break;
      const char16_t c = inp_[ii_];
      if (c == u',') {
        if (already_seen_comma &&
            handle_error("Two consecutive commas after element " +
                             std::to_string(static_cast<long long>(children.size()) - 1) + " of array",
                         ii_, severity::bad)) {
          return result();
        }
        already_seen_comma = true;
        if (children.empty() && handle_error("Comma before first value in array", ii_, severity::bad)) {
          return result();
        }
        ++ii_;
        continue;
      }
      if (c == u']' || c == u'}') {
        if (c == u'}') handle_error("Tried to terminate an array with '}'", ii_, severity::bad);
        if (already_seen_comma) handle_error("Comma after last element of array", ii_, severity::json5);
        ++ii_;
        return result();
      }
      if (!children.empty() && !already_seen_comma &&
          handle_error("No comma between array members", ii_, severity::bad)) {
        return result();
      }
      already_seen_comma = false;
      children.emplace_back(parse_something(recursion_depth));
      if (fatal()) return result();
    }
    handle_error("Unterminated array", last_index(), severity::bad);
    return result();
  }

  value parse_object(int recursion_depth) {
    const std::size_t n = inp_.size();
    const std::size_t start_utf8_pos = utf8_pos();
    value::object children;
    std::unordered_map<std::string, std::size_t> index;
    auto result = [&]() { return at(value(std::move(children)), start_utf8_pos); };
    bool already_seen_comma = false;
    ++ii_;
    if (recursion_depth == max_recursion_depth) {
      handle_error("Maximum recursion depth (" + std::to_string(max_recursion_depth) + ") reached", ii_,
                   severity::fatal);
      return result();
    }
    while (ii_ < n) {
      if (!consume_insignificant_chars()) return result();
      if (ii_ >= n) break;
      const char16_t c = inp_[ii_];
      if (c == u',') {
        if (already_seen_comma &&
            handle_error("Two consecutive commas after key-value pair " +
                             std::to_string(static_cast<long long>(children.size()) - 1) + " of object",
                         ii_, severity::bad)) {
          return result();
        }
        already_seen_comma = true;
        if (children.empty() && handle_error("Comma before first value in object", ii_, severity::bad)) {
          return result();
        }
        ++ii_;
        continue;
      }
      if (c == u'}' || c == u']') {
        if (c == u']') handle_error("Tried to terminate object with ']'", ii_, severity::bad);
        if (already_seen_comma) handle_error("Comma after last key-value pair of object", ii_, severity::json5);
        ++ii_;
        return result();
      }

      const std::size_t child_count = children.size();
      if (child_count > 0 && !already_seen_comma &&
          handle_error("No comma after key-value pair " + std::to_string(child_count - 1) + " in object", ii_,
                       severity::bad)) {
        return result();
      }
      std::optional<std::string> key = parse_key();
      if (fatal() || !key) return result();
      if (ii_ >= n) break;
      if (inp_[ii_] == u':') {
        ++ii_;
      } else {
        // one retry after skipping whitespace and comments
        if (!consume_insignificant_chars()) return result();
        if (ii_ >= n) break;
        if (inp_[ii_] == u':') {
          ++ii_;
        } else {
          handle_error("No ':' between key " + std::to_string(child_count) + " and value " +
                           std::to_string(child_count) + " of object",
                       ii_, severity::bad);
        }
      }
      if (!consume_insignificant_chars()) return result();
      if (ii_ >= n) break;

      value val = parse_something(recursion_depth);
      const auto it = index.find(*key);
      const bool duplicate = it != index.end();
      if (duplicate) {
        children[it->second].second = std::move(val);
      } else {
        index.emplace(*key, children.size());
        children.emplace_back(*key, std::move(val));
      }
      if (fatal()) return result();
      if (duplicate) handle_error("Object has multiple of key \"" + *key + "\"", ii_, severity::bad);
      already_seen_comma = false;
    }
    handle_error("Unterminated object", last_index(), severity::bad);
    return result();
  }

  value parse_literal(std::u16string_view lit, value v, std::size_t start_utf8_pos) {
    ii_ += lit.size();
    return at(std::move(v), start_utf8_pos);
  }

  // Any value: scalar, array, or object.
  value parse_something(int recursion_depth) {
    const std::size_t n = inp_.size();
    const std::size_t start_utf8_pos = utf8_pos();
    if (ii_ >= n) {
      handle_error("Unexpected end of file", last_index(), severity::fatal);
      return at(value(), start_utf8_pos);
    }
    const char16_t c = inp_[ii_];
    if (c == u'"' || c == u'\'') return parse_string();
    if (detail::is_digit(c) || c == u'-' || c == u'+' || c == u'n' || c == u'I' || c == u'N' || c == u'.' ||
        c == u'i') {
      return parse_number();
    }
    if (c == u'[') return parse_array(recursion_depth + 1);
    if (c == u'{') return parse_object(recursion_depth + 1);
    if (ii_ + 4 > n) {
      handle_error("No valid literal possible", ii_, severity::fatal);
      return at(value(), start_utf8_pos);
    }
    switch (c) {
      case u't':
        if (matches(ii_, u"true")) return parse_literal(u"true", value(true), start_utf8_pos);
        handle_error("Expected literal starting with 't' to be true", ii_ + 1, severity::fatal);
        return at(value(), start_utf8_pos);
      case u'f':
        if (matches(ii_, u"false")) return parse_literal(u"false", value(false), start_utf8_pos);
        handle_error("Expected literal starting with 'f' to be false", ii_ + 1, severity::fatal);
        return at(value(), start_utf8_pos);
      case u'T':
        // Python
        if (matches(ii_, u"True")) {
          handle_error("True is not an accepted part of any JSON specification", ii_, severity::bad);
          return parse_literal(u"True", value(true), start_utf8_pos);
        }
        handle_error("Expected literal starting with 'T' to be True", ii_ + 1, severity::fatal);
        return at(value(), start_utf8_pos);
      case u'F':
        if (matches(ii_, u"False")) {
          handle_error("False is not an accepted part of any JSON specification", ii_, severity::bad);
          return parse_literal(u"False", value(false), start_utf8_pos);
        }
        handle_error("Expected literal starting with 'F' to be False", ii_ + 1, severity::fatal);
        return at(value(), start_utf8_pos);
      case u'u':
        // JavaScript undefined, read as null
        if (matches(ii_, u"undefined")) {
          handle_error("undefined is not part of any JSON specification", ii_, severity::bad);
          return parse_literal(u"undefined", value(), start_utf8_pos);
        }
        handle_error("Expected literal starting with 'u' to be undefined", ii_ + 1, severity::fatal);
        return at(value(), start_utf8_pos);
      default:
        handle_error("Badly located character", ii_, severity::fatal);
        return at(value(), start_utf8_pos);
    }
  }
};

struct parse_result {
  value val;
  std::vector<lint> lints;
  severity state{severity::strict};
  bool fatal{false};
};

namespace detail {

inline parse_result collect(parser& p, value v) {
  parse_result r;
  r.val = std::move(v);
  r.lints = p.lints();
  r.state = p.state();
  r.fatal = p.fatal();
  return r;
}

} // namespace detail

// May throw parse_error, depending on opt.
inline parse_result parse(std::u16string_view json, parse_options opt = {}) {
  parser p(opt);
  value v = p.parse(json);
  return detail::collect(p, std::move(v));
}

inline parse_result parse(std::string_view json, parse_options opt = {}) {
  parser p(opt);
  value v = p.parse(json);
  return detail::collect(p, std::move(v));
}

inline parse_result parse_lines(std::u16string_view json, parse_options opt = {}) {
  parser p(opt);
  value v = p.parse_lines(json);
  return detail::collect(p, std::move(v));
}

inline parse_result parse_lines(std::string_view json, parse_options opt = {}) {
  parser p(opt);
  value v = p.parse_lines(json);
  return detail::collect(p, std::move(v));
}

// Throws parse_error on the first deviation above `level`.
inline value parse_or_throw(std::string_view json, logger_level level = logger_level::strict) {
  parse_options opt;
  opt.level = level;
  opt.throw_if_logged = true;
  opt.throw_if_fatal = true;
  parser p(opt);
  return p.parse(json);
}

namespace detail {

inline std::size_t find_first_escape(std::string_view s) noexcept {
  for (std::size_t i = 0; i < s.size(); ++i) {
    const unsigned char uc = static_cast<unsigned char>(s[i]);
    if (s[i] == '"' || s[i] == '\\' || uc <= 0x1F) return i;
  }
  return s.size();
}

inline void dump_escaped(std::string& out, std::string_view s) {
  static constexpr char hex[] = "0123456789ABCDEF";

  const char* data = s.data();
  const std::size_t n = s.size();
  const std::size_t first = find_first_escape(s);

  out.push_back('"');
  if (first == n) {
    out.append(data, n);
    out.push_back('"');
    return;
  }

  if (first > 0) out.append(data, first);

  std::size_t chunk_begin = first;
  for (std::size_t i = first; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(data[i]);
    const char c = data[i];

    const char* esc = nullptr;
    switch (c) {
      case '"': esc = "\\\""; break;
      case '\\': esc = "\\\\"; break;
      case '\b': esc = "\\b"; break;
      case '\f': esc = "\\f"; break;
      case '\n': esc = "\\n"; break;
      case '\r': esc = "\\r"; break;
      case '\t': esc = "\\t"; break;
      default: break;
    }

    if (esc != nullptr) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append(esc, 2);
      chunk_begin = i + 1;
      continue;
    }

    if (uc <= 0x1F) {
      if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
      out.append("\\u00", 4);
      out.push_back(hex[(uc >> 4) & 0xF]);
      out.push_back(hex[uc & 0xF]);
      chunk_begin = i + 1;
    }
  }

  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
  out.push_back('"');
}

inline void dump_int64(std::string& out, std::int64_t v) {
  char buf[32];
  auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc{}) {
    throw std::runtime_error("relaxjson: failed to format integer");
  }
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

// Always leaves a '.' or exponent so the token reads back as a float.
inline void dump_double(std::string& out, double d) {
  if (std::isnan(d)) {
    out.append("NaN", 3);
    return;
  }
  if (std::isinf(d)) {
    if (d < 0) out.append("-Infinity", 9);
    else out.append("Infinity", 8);
    return;
  }
  char buf[64];
  auto r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::general);
  if (r.ec != std::errc{}) {
    r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::general,
                      std::numeric_limits<double>::max_digits10);
  }
  if (r.ec != std::errc{}) throw std::runtime_error("relaxjson: failed to format double");
  const std::string_view token(buf, static_cast<std::size_t>(r.ptr - buf));
  out.append(token.data(), token.size());
  if (token.find_first_of(".eE") == std::string_view::npos) out.append(".0", 2);
}

inline void dump_indent(std::string& out, int indent) {
  for (int i = 0; i < indent; ++i) out.push_back(' ');
}

inline void dump_scalar(std::string& out, const value& v) {
  switch (v.type()) {
    case value::kind::null: out.append("null", 4); return;
    case value::kind::boolean:
      if (v.as_bool()) out.append("true", 4);
      else out.append("false", 5);
      return;
    case value::kind::integer: dump_int64(out, v.as_int()); return;
    case value::kind::floating: dump_double(out, v.as_double()); return;
    case value::kind::string: dump_escaped(out, v.as_string()); return;
    case value::kind::date: dump_escaped(out, v.as_date().to_string()); return;
    case value::kind::datetime: dump_escaped(out, v.as_datetime().to_string()); return;
    case value::kind::array:
    case value::kind::object: break;
  }
  throw std::runtime_error("relaxjson: not a scalar");
}

inline void dump_to_pretty(std::string& out, const value& v, int indent) {
  switch (v.type()) {
    case value::kind::array: {
      const auto& a = v.as_array();
      out.push_back('[');
      if (!a.empty()) out.push_back('\n');
      for (std::size_t idx = 0; idx < a.size(); ++idx) {
        dump_indent(out, indent + 2);
        dump_to_pretty(out, a[idx], indent + 2);
        if (idx + 1 != a.size()) out.push_back(',');
        out.push_back('\n');
      }
      if (!a.empty()) dump_indent(out, indent);
      out.push_back(']');
      return;
    }
    case value::kind::object: {
      const auto& o = v.as_object();
      out.push_back('{');
      if (!o.empty()) out.push_back('\n');
      for (std::size_t idx = 0; idx < o.size(); ++idx) {
        dump_indent(out, indent + 2);
        dump_escaped(out, o[idx].first);
        out.append(": ", 2);
        dump_to_pretty(out, o[idx].second, indent + 2);
        if (idx + 1 != o.size()) out.push_back(',');
        out.push_back('\n');
      }
      if (!o.empty()) dump_indent(out, indent);
      out.push_back('}');
      return;
    }
    default:
      dump_scalar(out, v);
      return;
  }
}

inline void dump_compact_iter(std::string& out, const value& root) {
  struct frame {
    const value* v{nullptr};
    std::size_t idx{0};
  };
  std::vector<frame> stack;
  stack.push_back(frame{&root, 0});

  while (!stack.empty()) {
    frame& f = stack.back();
    const value& cur = *f.v;

    switch (cur.type()) {
      case value::kind::array: {
        const auto& a = cur.as_array();
        if (f.idx == 0) out.push_back('[');
        if (f.idx == a.size()) {
          out.push_back(']');
          stack.pop_back();
          break;
        }
        if (f.idx > 0) out.push_back(',');
        const value* child = &a[f.idx++];
        stack.push_back(frame{child, 0});
        break;
      }
      case value::kind::object: {
        const auto& o = cur.as_object();
        if (f.idx == 0) out.push_back('{');
        if (f.idx == o.size()) {
          out.push_back('}');
          stack.pop_back();
          break;
        }
        if (f.idx > 0) out.push_back(',');
        const auto& kv = o[f.idx++];
        dump_escaped(out, kv.first);
        out.push_back(':');
        stack.push_back(frame{&kv.second, 0});
        break;
      }
      default:
        dump_scalar(out, cur);
        stack.pop_back();
        break;
    }
  }
}

} // namespace detail

inline void dump_to(std::string& out, const value& v, bool pretty = false, int indent = 0) {
  if (pretty) detail::dump_to_pretty(out, v, indent);
  else detail::dump_compact_iter(out, v);
}

inline std::string dump(const value& v, bool pretty = false) {
  std::string out;
  dump_to(out, v, pretty, 0);
  return out;
}

} // namespace relaxjson
