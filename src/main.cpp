/* @file main.cpp
 * @brief deskctl entry point: command line, configuration, coordinator lifecycle
 *
 * © 2025 deskctl contributors — MIT-licensed.
 */

// STL headers
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

// Linux headers
#include <getopt.h>

// deskctl headers
#include "core/ConfigLoader.hpp"
#include "core/SystemCoordinator.hpp"

using namespace deskctl;

namespace {

  struct CliOptions {
    std::string configPath;
    std::string host;
    long port{ -1 };
    bool verbose{ false };
  };

  void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  -c, --config <file>   JSON configuration file\n"
              << "  -H, --host <addr>     listen address (default 0.0.0.0)\n"
              << "  -p, --port <n>        listen port (default 9001)\n"
              << "  -v, --verbose         debug logging\n"
              << "  -h, --help            show this help\n";
  }

  // 0 = continue, otherwise the process exit code
  int parseArgs(int argc, char** argv, CliOptions& opts) {
    static const option longOpts[] = {
      { "config", required_argument, nullptr, 'c' }, { "host", required_argument, nullptr, 'H' },
      { "port", required_argument, nullptr, 'p' },   { "verbose", no_argument, nullptr, 'v' },
      { "help", no_argument, nullptr, 'h' },         { nullptr, 0, nullptr, 0 },
    };

    int c;
    while ((c = getopt_long(argc, argv, "c:H:p:vh", longOpts, nullptr)) != -1) {
      switch (c) {
      case 'c':
        opts.configPath = optarg;
        break;
      case 'H':
        opts.host = optarg;
        break;
      case 'p': {
        char* end = nullptr;
        opts.port = std::strtol(optarg, &end, 10);
        if (!end || *end != '\0' || opts.port < 1 || opts.port > 65535) {
          std::cerr << "invalid port: " << optarg << "\n";
          return 2;
        }
        break;
      }
      case 'v':
        opts.verbose = true;
        break;
      case 'h':
        printUsage(argv[0]);
        return -1;
      default:
        printUsage(argv[0]);
        return 2;
      }
    }
    if (optind < argc) {
      std::cerr << "unexpected argument: " << argv[optind] << "\n";
      printUsage(argv[0]);
      return 2;
    }
    return 0;
  }

} // namespace

int main(int argc, char** argv) {
  CliOptions opts;
  if (int rc = parseArgs(argc, argv, opts); rc != 0)
    return rc < 0 ? EXIT_SUCCESS : rc;

  // a client hanging up mid-reply must not kill the daemon
  std::signal(SIGPIPE, SIG_IGN);

  core::Settings settings;
  try {
    settings = core::ConfigLoader(opts.configPath).resolve(core::processEnvironment());
  } catch (const std::exception& e) {
    std::cerr << "deskctl: configuration error: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
  if (!opts.host.empty())
    settings.server.host = opts.host;
  if (opts.port > 0)
    settings.server.port = static_cast<std::uint16_t>(opts.port);
  if (opts.verbose)
    settings.logging.verbose = true;

  try {
    core::SystemCoordinator coordinator(std::move(settings));
    coordinator.initialize();
    coordinator.run();
  } catch (const std::exception& e) {
    std::cerr << "deskctl: fatal: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
