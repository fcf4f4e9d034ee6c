#include "app/Config.hpp"
#include "app/SecurityValidator.hpp"
#include "model/Summary.hpp"
#include "util/Files.hpp"

#include <cstdio>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

static constexpr int kExitUsage = 64;

static void print_usage(std::ostream& os) {
  os << "Usage: vigil [--workspace DIR] [--config FILE] [--input FILE|-] [--sanitize] [--verbose] OUTPUT_DIR\n";
  os << "Exit: 0 secure, 1 low/medium risk, 2 high risk/critical, 64 usage error.\n";
}

static std::optional<std::string> read_input(const std::string& source) {
  if (source.empty()) return std::string();
  if (source == "-") {
    std::string s((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    return s;
  }
  std::string err;
  auto s = vigil::util::read_file_string(source, &err);
  if (!s) std::fprintf(stderr, "vigil: cannot read input %s: %s\n", source.c_str(), err.c_str());
  return s;
}

static int exit_code_for(vigil::model::Status status) {
  switch (status) {
    case vigil::model::Status::Critical:
    case vigil::model::Status::HighRisk:   return 2;
    case vigil::model::Status::MediumRisk:
    case vigil::model::Status::LowRisk:    return 1;
    case vigil::model::Status::Secure:     return 0;
  }
  return 2;
}

int main(int argc, char** argv) {
  std::string workspace;
  std::string config_path;
  std::string input_source;
  std::string output_dir;
  bool sanitize_only = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--workspace" && i + 1 < argc) workspace = argv[++i];
    else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
    else if (a == "--input" && i + 1 < argc) input_source = argv[++i];
    else if (a == "--sanitize") sanitize_only = true;
    else if (a == "--verbose" || a == "-v") verbose = true;
    else if (a == "-h" || a == "--help") {
      print_usage(std::cout);
      return 0;
    }
    else if (!a.empty() && a[0] == '-' && a != "-") {
      std::fprintf(stderr, "vigil: unknown option %s\n", a.c_str());
      print_usage(std::cerr);
      return kExitUsage;
    }
    else if (output_dir.empty()) output_dir = a;
    else {
      std::fprintf(stderr, "vigil: unexpected argument %s\n", a.c_str());
      print_usage(std::cerr);
      return kExitUsage;
    }
  }

  auto cfg = config_path.empty() ? vigil::app::load_config() : vigil::app::load_config(config_path);
  if (!workspace.empty()) cfg.workspace_root = workspace;
  if (verbose) cfg.log.verbose = true;

  auto input = read_input(input_source);
  if (!input) return kExitUsage;

  vigil::app::SecurityValidator validator(cfg);

  if (sanitize_only) {
    std::cout << validator.sanitizer().sanitize(*input) << "\n";
    return 0;
  }

  if (output_dir.empty()) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  const auto summary = validator.validate_execution(*input, output_dir);
  for (const auto& f : summary.findings) {
    std::cout << vigil::app::format_finding_line(f) << "\n";
  }
  std::cout << vigil::model::status_name(summary.status) << ": " << summary.message << "\n";
  return exit_code_for(summary.status);
}
