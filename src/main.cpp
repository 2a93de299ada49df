#include <stylebind/core/config.h>
#include <stylebind/core/diagnostics.h>
#include <stylebind/runner/runner.h>

#include <charconv>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

namespace config = stylebind::core::config;

void print_usage(std::ostream& stream) {
  stream << "usage: " << config::kProgramName << " <glob> [options]\n"
         << "\n"
         << "options:\n"
         << "  --outDir <dir>                   output directory, mirroring paths from --cwd\n"
         << "  --localsConvention <style>       camelCase | camelCaseOnly | dashes | dashesOnly\n"
         << "  --declarationMap                 also write .d.ts.map files\n"
         << "  --arbitraryExtensions            write x.d.css.ts instead of x.css.d.ts\n"
         << "  --sassLoadPaths <dir>...         sass --load-path directories\n"
         << "  --lessIncludePaths <dir>...      lessc --include-path directories\n"
         << "  --webpackResolveAlias <n=path>   resolve.alias entries, repeatable\n"
         << "  --cache / --no-cache             skip unchanged files (default on)\n"
         << "  --cacheStrategy <strategy>       content | metadata (default content)\n"
         << "  --silent                         only report errors\n"
         << "  --cwd <dir>                      working directory\n"
         << "  --jobs <n>                       number of worker threads\n"
         << "  --logLevel <level>               debug | info | warning | error\n"
         << "  -h, --help                       show this help\n"
         << "  -V, --version                    show the version\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool parse_positive_int(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }

  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }

  value = parsed;
  return true;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

// "--flag=value" or "--flag value". Advances index past a consumed value.
bool take_value(int argc, char** argv, int& index, std::string_view flag, std::string& value) {
  const std::string_view argument(argv[index]);
  if (argument.size() > flag.size() && argument[flag.size()] == '=') {
    value = std::string(argument.substr(flag.size() + 1));
    return true;
  }
  if (index + 1 >= argc) {
    return false;
  }
  value = argv[++index];
  return true;
}

bool matches_flag(std::string_view argument, std::string_view flag) {
  return argument == flag ||
         (starts_with(argument, flag) && argument.size() > flag.size() && argument[flag.size()] == '=');
}

// Consumes following arguments up to the next flag.
void take_list(int argc, char** argv, int& index, std::string_view flag, std::vector<std::string>& out) {
  const std::string_view argument(argv[index]);
  if (argument.size() > flag.size() && argument[flag.size()] == '=') {
    out.emplace_back(argument.substr(flag.size() + 1));
    return;
  }
  while (index + 1 < argc && !starts_with(argv[index + 1], "-")) {
    out.emplace_back(argv[++index]);
  }
}

int fail_usage(const std::string& message) {
  std::cerr << message << "\n";
  print_usage(std::cerr);
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  // A compiler that exits early must not take us down while we feed its stdin.
  std::signal(SIGPIPE, SIG_IGN);

  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << config::kProgramName << " " << config::kVersion << "\n";
    return 0;
  }
  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  stylebind::runner::RunnerOptions options;
  stylebind::core::Severity log_level = stylebind::core::Severity::Info;
  std::vector<std::string> positional_args;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    std::string value;

    if (is_help_flag(argument)) {
      print_usage(std::cout);
      return 0;
    }
    if (is_version_flag(argument)) {
      std::cout << config::kProgramName << " " << config::kVersion << "\n";
      return 0;
    }

    if (matches_flag(argument, "--outDir")) {
      if (!take_value(argc, argv, index, "--outDir", value)) return fail_usage("Missing value for --outDir");
      options.out_dir = value;
    } else if (matches_flag(argument, "--localsConvention")) {
      if (!take_value(argc, argv, index, "--localsConvention", value)) {
        return fail_usage("Missing value for --localsConvention");
      }
      auto convention = stylebind::emit::parse_locals_convention(value);
      if (!convention) return fail_usage("Invalid --localsConvention: '" + value + "'");
      options.locals_convention = *convention;
    } else if (argument == "--declarationMap") {
      options.declaration_map = true;
    } else if (argument == "--arbitraryExtensions") {
      options.arbitrary_extensions = true;
    } else if (matches_flag(argument, "--sassLoadPaths")) {
      take_list(argc, argv, index, "--sassLoadPaths", options.sass_load_paths);
    } else if (matches_flag(argument, "--lessIncludePaths")) {
      take_list(argc, argv, index, "--lessIncludePaths", options.less_include_paths);
    } else if (matches_flag(argument, "--webpackResolveAlias")) {
      if (!take_value(argc, argv, index, "--webpackResolveAlias", value)) {
        return fail_usage("Missing value for --webpackResolveAlias");
      }
      const std::size_t separator = value.find('=');
      if (separator == std::string::npos || separator == 0 || separator + 1 >= value.size()) {
        return fail_usage("Invalid --webpackResolveAlias: '" + value + "' (expected name=path)");
      }
      options.aliases.emplace_back(value.substr(0, separator), value.substr(separator + 1));
    } else if (argument == "--cache") {
      options.cache = true;
    } else if (argument == "--no-cache") {
      options.cache = false;
    } else if (matches_flag(argument, "--cacheStrategy")) {
      if (!take_value(argc, argv, index, "--cacheStrategy", value)) {
        return fail_usage("Missing value for --cacheStrategy");
      }
      auto strategy = stylebind::runner::parse_cache_strategy(value);
      if (!strategy) return fail_usage("Invalid --cacheStrategy: '" + value + "'");
      options.cache_strategy = *strategy;
    } else if (argument == "--silent") {
      options.silent = true;
    } else if (matches_flag(argument, "--cwd")) {
      if (!take_value(argc, argv, index, "--cwd", value)) return fail_usage("Missing value for --cwd");
      options.cwd = value;
    } else if (matches_flag(argument, "--jobs")) {
      int jobs = 0;
      if (!take_value(argc, argv, index, "--jobs", value) || !parse_positive_int(value, jobs)) {
        return fail_usage("Invalid --jobs: expected a positive integer");
      }
      options.jobs = static_cast<std::size_t>(jobs);
    } else if (matches_flag(argument, "--logLevel")) {
      if (!take_value(argc, argv, index, "--logLevel", value)) return fail_usage("Missing value for --logLevel");
      auto severity = stylebind::core::parse_severity(value);
      if (!severity) return fail_usage("Invalid --logLevel: '" + value + "'");
      log_level = *severity;
    } else if (starts_with(argument, "-")) {
      return fail_usage("Unknown option: '" + std::string(argument) + "'");
    } else {
      positional_args.emplace_back(argument);
    }
  }

  if (positional_args.size() != 1) {
    print_usage(std::cerr);
    return 1;
  }
  options.pattern = positional_args[0];

  stylebind::core::DiagnosticEmitter diagnostics;
  diagnostics.set_min_severity(log_level);
  diagnostics.add_observer([](const stylebind::core::DiagnosticEvent& event) {
    switch (event.severity) {
      case stylebind::core::Severity::Info:
        std::cout << event.message << "\n";
        break;
      case stylebind::core::Severity::Debug:
        std::cout << stylebind::core::format_diagnostic(event) << "\n";
        break;
      case stylebind::core::Severity::Warning:
      case stylebind::core::Severity::Error:
        std::cerr << stylebind::core::format_diagnostic(event) << "\n";
        break;
    }
  });

  stylebind::runner::Runner runner(diagnostics);
  try {
    const stylebind::runner::RunSummary summary = runner.run(options);
    return summary.failed > 0 ? 1 : 0;
  } catch (const std::exception& e) {
    std::cerr << config::kProgramName << ": " << e.what() << "\n";
    return 1;
  }
}
