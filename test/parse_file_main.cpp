#include <relaxjson/relaxjson.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace {

struct lint_config {
  relaxjson::parse_options opt;
  bool lines{false};
};

bool read_file(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

bool parse_level(std::string_view name, relaxjson::logger_level& out) {
  using relaxjson::logger_level;
  if (name == "strict") out = logger_level::strict;
  else if (name == "ok") out = logger_level::ok;
  else if (name == "nan_inf") out = logger_level::nan_inf;
  else if (name == "jsonc") out = logger_level::jsonc;
  else if (name == "json5") out = logger_level::json5;
  else return false;
  return true;
}

// 0: clean, 1: lints or parse failure, 2: I/O failure.
int lint_one(const char* path, const lint_config& cfg, bool verbose) {
  std::string s;
  if (!read_file(path, s)) return 2;

  relaxjson::parser p(cfg.opt);
  try {
    if (cfg.lines) (void)p.parse_lines(std::string_view{s.data(), s.size()});
    else (void)p.parse(std::string_view{s.data(), s.size()});
  } catch (const relaxjson::parse_error& e) {
    if (verbose) std::cout << path << ": " << e.what() << "\n";
    return 1;
  }

  if (verbose) {
    for (const auto& l : p.lints()) std::cout << path << ": " << l.to_string() << "\n";
  }
  return p.lints().empty() ? 0 : 1;
}

void usage() {
  std::cerr << "usage: relaxjson_lint [--lines] [--level strict|ok|nan_inf|jsonc|json5] [--raise] [--dates] <file>\n";
  std::cerr << "       relaxjson_lint [options] --list <paths.txt>\n";
}

} // namespace

int main(int argc, char** argv) {
  lint_config cfg;
  cfg.opt.level = relaxjson::logger_level::strict;
  cfg.opt.throw_if_logged = false;
  cfg.opt.throw_if_fatal = false;

  const char* list_path = nullptr;
  const char* path = nullptr;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--lines") {
      cfg.lines = true;
    } else if (arg == "--raise") {
      cfg.opt.throw_if_logged = true;
      cfg.opt.throw_if_fatal = true;
    } else if (arg == "--dates") {
      cfg.opt.parse_datetimes = true;
    } else if (arg == "--level" && i + 1 < argc) {
      if (!parse_level(argv[++i], cfg.opt.level)) {
        std::cerr << "unknown level: " << argv[i] << "\n";
        usage();
        return 2;
      }
    } else if (arg == "--list" && i + 1 < argc) {
      list_path = argv[++i];
    } else if (path == nullptr && !arg.empty() && arg.front() != '-') {
      path = argv[i];
    } else {
      usage();
      return 2;
    }
  }

  if (list_path != nullptr) {
    if (path != nullptr) {
      usage();
      return 2;
    }
    std::ifstream in(list_path);
    if (!in) {
      std::cerr << "failed to read list file: " << list_path << "\n";
      return 2;
    }

    bool any_fail = false;
    bool any_io_fail = false;
    std::string line;
    while (std::getline(in, line)) {
      if (line.empty()) continue;
      const int rc = lint_one(line.c_str(), cfg, /*verbose=*/false);
      if (rc == 0) {
        std::cout << line << "\tOK\n";
      } else {
        std::cout << line << "\tFAIL\n";
        any_fail = true;
        if (rc == 2) any_io_fail = true;
      }
    }
    return any_io_fail ? 2 : (any_fail ? 1 : 0);
  }

  if (path == nullptr) {
    usage();
    return 2;
  }

  const int rc = lint_one(path, cfg, /*verbose=*/true);
  if (rc == 2) std::cerr << "failed to read file: " << path << "\n";
  return rc;
}
