#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#if XPCS_HAS_OPENMP
#include <omp.h>
#endif

#include "xpcs/app/Runner.hpp"
#include "xpcs/config/IniConfig.hpp"

namespace fs = std::filesystem;

namespace {

struct Cli {
  fs::path config;
  int threads = 0; // 0 = OpenMP default
  bool validate_config = false;
};

void print_usage(const char* argv0) {
  std::cerr
      << "Usage: " << argv0 << " --config <path> [--threads N] [--validate-config]\n"
      << "       " << argv0 << " --version\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli cli;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (a == "--version") {
      std::cout << XPCS_VERSION_STR << "\n";
      std::exit(0);
    } else if (a == "--config") {
      if (i + 1 >= argc) throw std::runtime_error("--config requires a value");
      cli.config = fs::path(argv[++i]);
    } else if (a == "--threads") {
      if (i + 1 >= argc) throw std::runtime_error("--threads requires a value");
      cli.threads = std::stoi(argv[++i]);
      if (cli.threads < 0) throw std::runtime_error("--threads must be >= 0");
    } else if (a == "--validate-config") {
      cli.validate_config = true;
    } else {
      throw std::runtime_error("unknown argument: " + a);
    }
  }
  if (cli.config.empty()) throw std::runtime_error("--config is required");
  return cli;
}

} // namespace

int main(int argc, char** argv) {
  try {
    const Cli cli = parse_cli(argc, argv);

#if XPCS_HAS_OPENMP
    if (cli.threads > 0) omp_set_num_threads(cli.threads);
#endif

    xpcs::IniConfig cfg(cli.config);
    xpcs::Runner runner(cfg);
    return cli.validate_config ? runner.validate_config() : runner.run();

  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
