#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include "repo/repository.hpp"

namespace pmtorrent {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(repo::Repository& repository, std::istream& in = std::cin, std::ostream& out = std::cout);


  // ---- STARTUP ----
  void run();

private:
  // ---- PARAMETERS ----
  repo::Repository& repository_;
  std::istream& in_;
  std::ostream& out_;
  bool running_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, std::istringstream& args);
  void handle_list_command();
  void handle_add_command(const std::string& path);
  void handle_piece_command(const std::string& hash, const std::string& index);
  void handle_verify_command(const std::string& hash, const std::string& index);
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace pmtorrent
