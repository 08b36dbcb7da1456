#include "cli/cli.hpp"
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace pmtorrent {
namespace cli {

namespace {

// Parses a non-negative decimal piece index
bool parse_index(const std::string& text, std::size_t& out) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    out = static_cast<std::size_t>(std::stoull(text));
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(repo::Repository& repository, std::istream& in, std::ostream& out)
  : repository_(repository)
  , in_(in)
  , out_(out)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "pmtorrent> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;

    if (command == "quit") {
      running_ = false;
      continue;
    }

    if (!command.empty()) {
      process_command(command, iss);
    }

    if (running_) {
      out_ << "pmtorrent> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, std::istringstream& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command;

  std::string first, second;
  args >> first >> second;

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "ls") {
    handle_list_command();
  }
  else if (command == "add" && !first.empty()) {
    handle_add_command(first);
  }
  else if (command == "piece" && !second.empty()) {
    handle_piece_command(first, second);
  }
  else if (command == "verify" && !second.empty()) {
    handle_verify_command(first, second);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_list_command() {
  auto files = repository_.list();
  if (files.empty()) {
    out_ << "No files published" << std::endl;
    return;
  }
  for (const auto& f : files) {
    out_ << f.hash << "  " << f.pieces << " pieces" << std::endl;
  }
}

void CLI::handle_add_command(const std::string& path) {
  try {
    std::string hash = repository_.add_from_path(path);
    out_ << "Added " << path << " as " << hash << std::endl;
  } catch (const repo::RepoError& e) {
    log_and_display_error("Error adding file", e.what());
  }
}

void CLI::handle_piece_command(const std::string& hash, const std::string& index) {
  std::size_t idx = 0;
  if (!parse_index(index, idx)) {
    out_ << "Invalid piece index: " << index << std::endl;
    return;
  }

  try {
    file::Piece piece = repository_.get_piece(hash, idx);
    out_ << "Piece " << piece.content.leaf_idx() << ": " << piece.content.size() << " bytes" << std::endl;
    for (const auto& h : piece.proof) {
      out_ << "  " << h << std::endl;
    }
  } catch (const repo::RepoError& e) {
    log_and_display_error("Error fetching piece", e.what());
  }
}

void CLI::handle_verify_command(const std::string& hash, const std::string& index) {
  std::size_t idx = 0;
  if (!parse_index(index, idx)) {
    out_ << "Invalid piece index: " << index << std::endl;
    return;
  }

  try {
    file::Piece piece = repository_.get_piece(hash, idx);
    const file::File* file = repository_.find(hash);

    // The requested hash is the root a remote verifier would trust
    file::Hash trusted = file::Hash::from_hex(hash);
    bool ok = file::verify_piece(trusted, piece, file->size());
    out_ << (ok ? "OK" : "MISMATCH") << std::endl;
  } catch (const repo::RepoError& e) {
    log_and_display_error("Error verifying piece", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                Display this help message" << std::endl;
  out_ << "  ls                  List published files and their piece counts" << std::endl;
  out_ << "  add <path>          Publish the file at <path>" << std::endl;
  out_ << "  piece <hash> <idx>  Show piece <idx> of file <hash> and its proof" << std::endl;
  out_ << "  verify <hash> <idx> Check piece <idx> against root <hash>" << std::endl;
  out_ << "  quit                Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace pmtorrent
