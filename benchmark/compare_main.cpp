#include <relaxjson/relaxjson.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>
#include <nlohmann/json.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

// Throughput of relaxjson per dialect and per reporting policy, next to the
// parsers that accept the same input. Rates are source bytes per second.

namespace {

using clock_type = std::chrono::steady_clock;
using relaxjson::logger_level;

template <class T>
inline void sink(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

enum class dialect { strict, jsonc, json5 };

// Records shaped like a config dump. jsonc adds comments, json5 adds unquoted
// keys, single quotes, hex, NaN and trailing commas on top of that.
std::string make_records(std::size_t n, dialect d) {
  const bool commented = d != dialect::strict;
  const bool json5 = d == dialect::json5;
  std::string s = "[\n";
  for (std::size_t i = 0; i < n; ++i) {
    if (commented && i % 4 == 0) s += "  // record " + std::to_string(i) + "\n";
    s += json5 ? "  {id: " : "  {\"id\": ";
    if (json5 && i % 3 == 0) {
      char hex[24];
      std::snprintf(hex, sizeof hex, "0x%zx", i);
      s += hex;
    } else {
      s += std::to_string(i);
    }
    s += json5 ? ", name: 'item " : ", \"name\": \"item ";
    s += std::to_string(i * 7919 % 10007);
    s += json5 ? "'" : "\"";
    s += ", \"ratio\": ";
    s += (json5 && i % 5 == 0) ? std::string("NaN") : std::to_string(i % 100) + ".25";
    s += ", \"tags\": [\"a\", \"b\\u00e9\", \"\\n\"";
    s += json5 ? ",]" : "]";
    if (commented && i % 2 == 1) s += ", /* flag */ \"ok\": true";
    else s += ", \"ok\": false";
    s += json5 ? ",}" : "}";
    if (i + 1 < n) s += ",";
    s += "\n";
  }
  s += "]\n";
  return s;
}

std::string make_lines(std::size_t n) {
  std::string s;
  for (std::size_t i = 0; i < n; ++i) {
    s += "{\"id\":" + std::to_string(i) + ",\"level\":\"" + (i % 7 == 0 ? "warn" : "info") +
         "\",\"msg\":\"request " + std::to_string(i * 31 % 977) + " done\",\"ms\":" + std::to_string(i % 250) +
         ".5}\n";
  }
  return s;
}

relaxjson::parse_options lint_at(logger_level level) {
  relaxjson::parse_options opt;
  opt.level = level;
  opt.throw_if_logged = false;
  opt.throw_if_fatal = false;
  return opt;
}

relaxjson::parse_options raise_at(logger_level level) {
  relaxjson::parse_options opt;
  opt.level = level;
  return opt;
}

std::size_t lint_count(std::string_view text, logger_level level) {
  relaxjson::parser p(lint_at(level));
  (void)p.parse(text);
  return p.lints().size();
}

struct bench_case {
  std::string name;
  std::function<void(std::string_view)> run;
};

bench_case relaxjson_case(std::string name, relaxjson::parse_options opt, bool lines = false) {
  return {std::move(name), [opt, lines](std::string_view text) {
            relaxjson::parser p(opt);
            const relaxjson::value v = lines ? p.parse_lines(text) : p.parse(text);
            sink(v.type());
            sink(p.lints().size());
          }};
}

bench_case nlohmann_case(std::string name, bool ignore_comments) {
  return {std::move(name), [ignore_comments](std::string_view text) {
            const auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false, ignore_comments);
            sink(j.is_discarded());
          }};
}

bench_case nlohmann_lines_case() {
  return {"nlohmann, line by line", [](std::string_view text) {
            std::size_t docs = 0;
            while (!text.empty()) {
              const std::size_t eol = text.find('\n');
              const std::string_view line = text.substr(0, eol);
              if (!line.empty()) {
                const auto j = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
                if (!j.is_discarded()) ++docs;
              }
              if (eol == std::string_view::npos) break;
              text.remove_prefix(eol + 1);
            }
            sink(docs);
          }};
}

bench_case jsoncpp_case(std::string name, bool comments) {
  Json::CharReaderBuilder builder;
  if (comments) {
    builder["allowComments"] = true;
  } else {
    Json::CharReaderBuilder::strictMode(&builder.settings_);
  }
  builder["collectComments"] = false;
  std::shared_ptr<Json::CharReader> reader(builder.newCharReader());
  return {std::move(name), [reader](std::string_view text) {
            Json::Value root;
            std::string errs;
            sink(reader->parse(text.data(), text.data() + text.size(), &root, &errs));
          }};
}

template <unsigned Flags>
bench_case rapidjson_case(std::string name) {
  return {std::move(name), [](std::string_view text) {
            rapidjson::Document d;
            d.Parse<Flags>(text.data(), text.size());
            sink(d.HasParseError());
          }};
}

bench_case relaxjson_dump_case(std::string_view source, bool pretty) {
  auto root = std::make_shared<const relaxjson::value>(relaxjson::parse(source).val);
  return {pretty ? "relaxjson dump (pretty)" : "relaxjson dump", [root, pretty](std::string_view) {
            sink(relaxjson::dump(*root, pretty).size());
          }};
}

bench_case nlohmann_dump_case(std::string_view source) {
  auto root = std::make_shared<const nlohmann::json>(nlohmann::json::parse(source.begin(), source.end()));
  return {"nlohmann dump", [root](std::string_view) { sink(root->dump().size()); }};
}

bench_case jsoncpp_dump_case(std::string_view source) {
  auto root = std::make_shared<Json::Value>();
  Json::CharReaderBuilder builder;
  std::string errs;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  if (!reader->parse(source.data(), source.data() + source.size(), root.get(), &errs)) {
    std::cerr << "jsoncpp rejected the dump source: " << errs << "\n";
  }
  auto writer = std::make_shared<Json::StreamWriterBuilder>();
  (*writer)["indentation"] = "";
  (*writer)["emitUTF8"] = true;
  return {"jsoncpp dump", [root, writer](std::string_view) { sink(Json::writeString(*writer, *root).size()); }};
}

bench_case rapidjson_dump_case(std::string_view source) {
  auto doc = std::make_shared<rapidjson::Document>();
  doc->Parse(source.data(), source.size());
  return {"rapidjson dump", [doc](std::string_view) {
            rapidjson::StringBuffer sb;
            rapidjson::Writer<rapidjson::StringBuffer> w(sb);
            doc->Accept(w);
            sink(sb.GetSize());
          }};
}

double median_mibps(const bench_case& c, std::string_view input, std::size_t iters, std::size_t runs) {
  std::vector<double> rates;
  const double mib = static_cast<double>(input.size() * iters) / (1024.0 * 1024.0);
  for (std::size_t r = 0; r < runs; ++r) {
    const auto t0 = clock_type::now();
    for (std::size_t i = 0; i < iters; ++i) c.run(input);
    const std::chrono::duration<double> elapsed = clock_type::now() - t0;
    rates.push_back(elapsed.count() > 0.0 ? mib / elapsed.count() : 0.0);
  }
  std::nth_element(rates.begin(), rates.begin() + rates.size() / 2, rates.end());
  return rates[rates.size() / 2];
}

void run_section(const char* title, std::string_view input, const std::vector<bench_case>& cases,
                 std::size_t iters, std::size_t runs) {
  std::cout << "\n== " << title << " (" << input.size() << " bytes) ==\n";
  for (const auto& c : cases) {
    c.run(input);
    std::cout << "  " << std::left << std::setw(34) << c.name << std::right << std::setw(10) << std::fixed
              << std::setprecision(1) << median_mibps(c, input, iters, runs) << " MiB/s\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  std::size_t records = 2000;
  std::size_t iters = 50;
  std::size_t runs = 5;
  if (argc >= 2) records = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = std::max<std::size_t>(1, static_cast<std::size_t>(std::stoull(argv[2])));
  if (argc >= 4) runs = std::max<std::size_t>(1, static_cast<std::size_t>(std::stoull(argv[3])));

  const std::string strict_doc = make_records(records, dialect::strict);
  const std::string jsonc_doc = make_records(records, dialect::jsonc);
  const std::string json5_doc = make_records(records, dialect::json5);
  const std::string lines_doc = make_lines(records);

  // each payload must be clean at its own tier, or the timings compare different work
  if (lint_count(strict_doc, logger_level::strict) != 0 || lint_count(jsonc_doc, logger_level::jsonc) != 0 ||
      lint_count(json5_doc, logger_level::json5) != 0) {
    std::cerr << "payload generator produced input outside its dialect\n";
    return 1;
  }
  std::cout << "lints at STRICT: jsonc payload " << lint_count(jsonc_doc, logger_level::strict)
            << ", json5 payload " << lint_count(json5_doc, logger_level::strict) << "\n";

  run_section("Strict JSON", strict_doc,
              {relaxjson_case("relaxjson raise at STRICT", raise_at(logger_level::strict)),
               relaxjson_case("relaxjson lint at STRICT", lint_at(logger_level::strict)),
               nlohmann_case("nlohmann", false),
               jsoncpp_case("jsoncpp (strictMode)", false),
               rapidjson_case<rapidjson::kParseDefaultFlags>("rapidjson")},
              iters, runs);

  run_section("JSONC", jsonc_doc,
              {relaxjson_case("relaxjson lint at JSONC", lint_at(logger_level::jsonc)),
               relaxjson_case("relaxjson lint at STRICT", lint_at(logger_level::strict)),
               nlohmann_case("nlohmann (ignore_comments)", true),
               jsoncpp_case("jsoncpp (allowComments)", true),
               rapidjson_case<rapidjson::kParseCommentsFlag>("rapidjson (kParseCommentsFlag)")},
              iters, runs);

  // no other parser here reads unquoted keys and hex together
  run_section("JSON5", json5_doc,
              {relaxjson_case("relaxjson lint at JSON5", lint_at(logger_level::json5)),
               relaxjson_case("relaxjson lint at STRICT", lint_at(logger_level::strict))},
              iters, runs);

  run_section("JSON Lines", lines_doc,
              {relaxjson_case("relaxjson parse_lines", lint_at(logger_level::strict), /*lines=*/true),
               nlohmann_lines_case()},
              iters, runs);

  run_section("Dump", strict_doc,
              {relaxjson_dump_case(strict_doc, false), relaxjson_dump_case(strict_doc, true),
               nlohmann_dump_case(strict_doc), jsoncpp_dump_case(strict_doc), rapidjson_dump_case(strict_doc)},
              iters, runs);
  return 0;
}
