#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "repo/repository.hpp"
#include <iostream>
#include <string>
#include <vector>

struct ProgramOptions {
  std::vector<std::string> files;
  std::string log_file;
  pmtorrent::logging::severity_level level{pmtorrent::logging::severity_level::info};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-f <file>]... [-l <log file>] [-v <level>]\n"
        << "Optional arguments:\n"
        << "  -f, --file       File to publish (repeatable)\n"
        << "  -l, --log        Log file (console when omitted)\n"
        << "  -v, --verbosity  trace, debug, info, warning, error or fatal\n"
        << "Example: " << program_name << " -f image.png -l pmtorrent.log\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Missing value for argument: " << argv[argc - 1] << '\n';
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flag == "-f" || flag == "--file") {
      options.files.push_back(value);
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--verbosity") {
      if (!pmtorrent::logging::parse_severity(value, options.level)) {
        std::cerr << "Error: Invalid verbosity: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
    } else {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    pmtorrent::logging::init_logging(options.log_file, options.level);

    // Populate fully before the repository is handed to readers
    pmtorrent::repo::Repository repository;
    for (const auto& path : options.files) {
      std::string hash = repository.add_from_path(path);
      std::cout << "Published " << path << " as " << hash << '\n';
    }
    PMTORRENT_LOG_INFO << "Main: Serving " << repository.size() << " files";

    pmtorrent::cli::CLI cli(repository);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start pmtorrent: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
