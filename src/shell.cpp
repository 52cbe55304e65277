#include "shell.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <set>
#include <sstream>
#include <vector>

#include "app.hpp"
#include "command_dispatcher.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "file_listing.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transfer_service.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int kInputPollMs = 200;

// Accepted while any transfer is running.
const std::set<std::string> kControlCommands = {
  "STATUS", "PAUSE", "RESUME", "CANCEL", "MSG", "INFO", "HELP", "QUIT", "EXIT"
};

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for(const auto& line : lines) {
    if(!out.empty()) out.push_back('\n');
    out += line;
  }
  return out;
}

} // namespace

CommandShell::CommandShell(std::shared_ptr<App> app, int input_fd)
  : app_(std::move(app)),
    logger_(app_->logger()->child("shell")),
    input_fd_(input_fd) {}

CommandShell::~CommandShell() {
  stop();
}

void CommandShell::start() {
  if(running_.exchange(true)) return;
  cli_thread_ = std::thread([this](){ run_loop(); });
}

void CommandShell::stop() {
  running_ = false;
  if(cli_thread_.joinable()) {
    if(cli_thread_.get_id() == std::this_thread::get_id()) {
      cli_thread_.detach();
    } else {
      cli_thread_.join();
    }
  }
}

void CommandShell::set_prompt_handler(PromptHandler handler) {
  std::lock_guard lg(m_);
  prompt_handler_ = std::move(handler);
}

void CommandShell::set_quit_handler(QuitHandler handler) {
  std::lock_guard lg(m_);
  quit_handler_ = std::move(handler);
}

std::string CommandShell::local_cwd() const {
  std::lock_guard lg(m_);
  return cwd_;
}

void CommandShell::run_loop() {
  while(running_) {
    show_prompt();
    auto input = read_command_line();
    if(!input) break;
    if(trim_copy(*input).empty()) continue;
    execute(*input);
  }
}

void CommandShell::show_prompt() {
  PromptHandler handler;
  {
    std::lock_guard lg(m_);
    handler = prompt_handler_;
  }
  if(handler) handler("> ");
}

std::optional<std::string> CommandShell::read_command_line() {
  while(running_) {
    auto newline = pending_input_.find('\n');
    if(newline != std::string::npos) {
      auto line = pending_input_.substr(0, newline);
      pending_input_.erase(0, newline + 1);
      if(!line.empty() && line.back() == '\r') line.pop_back();
      return line;
    }

    pollfd pfd{input_fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, kInputPollMs);
    if(ready < 0) {
      if(errno == EINTR) continue;
      logger_->error("Unable to read commands: {}", std::strerror(errno));
      return std::nullopt;
    }
    if(ready == 0) continue;

    char buffer[1024];
    auto n = ::read(input_fd_, buffer, sizeof(buffer));
    if(n < 0) {
      if(errno == EINTR || errno == EAGAIN) continue;
      logger_->error("Unable to read commands: {}", std::strerror(errno));
      return std::nullopt;
    }
    if(n == 0) {
      logger_->debug("Command input closed");
      if(pending_input_.empty()) return std::nullopt;
      std::string line;
      line.swap(pending_input_);
      return line;
    }
    pending_input_.append(buffer, static_cast<std::size_t>(n));
  }
  return std::nullopt;
}

bool CommandShell::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if(cmd.empty()) return true;
  cmd = to_upper(cmd);
  std::string args;
  std::getline(iss, args);
  args = trim_copy(args);

  if(app_->is_any_transfer_active() && kControlCommands.count(cmd) == 0) {
    logger_->print_err("A transfer is in progress. Available now: STATUS, PAUSE, RESUME, CANCEL, MSG, INFO, HELP, QUIT");
    return false;
  }

  try {
    if(cmd == "LS" || cmd == "LIST") {
      list_local(args);
    } else if(cmd == "CD") {
      change_local_dir(args);
    } else if(cmd == "LSR" || cmd == "LISTREMOTE") {
      logger_->print("{}", execute_remote(args.empty() ? "LS" : "LS " + args));
    } else if(cmd == "CDR") {
      if(args.empty()) throw ShareError(ErrorKind::ProtocolError, "CDR requires a directory path");
      logger_->print("{}", execute_remote("CDR " + args));
    } else if(cmd == "GET") {
      if(args.empty()) throw ShareError(ErrorKind::ProtocolError, "GET requires a file path");
      logger_->print("{}", execute_remote("GET " + args));
    } else if(cmd == "PUT") {
      put(args);
    } else if(cmd == "GETDIR") {
      logger_->print("{}", execute_remote(args.empty() ? "GETDIR" : "GETDIR " + args));
    } else if(cmd == "PUTDIR") {
      put_dir(args);
    } else if(cmd == "GETM") {
      if(args.empty()) throw ShareError(ErrorKind::ProtocolError, "GETM requires a file pattern");
      logger_->print("{}", execute_remote("GETM " + args));
    } else if(cmd == "PUTM") {
      put_multiple(args);
    } else if(cmd == "STATUS") {
      status();
    } else if(cmd == "MSG") {
      send_chat(args);
    } else if(cmd == "PAUSE" || cmd == "RESUME" || cmd == "CANCEL") {
      control(cmd, args);
    } else if(cmd == "INFO") {
      info();
    } else if(cmd == "HELP" || cmd == "?") {
      print_help();
    } else if(cmd == "QUIT" || cmd == "EXIT") {
      quit();
    } else {
      logger_->print_err("Unknown command: {}. Type HELP for a list of commands.", cmd);
      return false;
    }
  } catch(const ShareError& e) {
    logger_->print_err("Error: {}", e.what());
    return false;
  } catch(const std::exception& e) {
    logger_->error("{} failed: {}", cmd, e.what());
    return false;
  }
  return true;
}

std::shared_ptr<Connection> CommandShell::require_connection() const {
  auto connection = app_->first_connection();
  if(!connection || !connection->is_open()) {
    throw ShareError(ErrorKind::IOError, "Not connected to a peer");
  }
  return connection;
}

std::string CommandShell::execute_remote(const std::string& command) {
  auto connection = require_connection();
  auto reply = connection->request(make_message(MessageType::Command, command));
  if(reply.type == MessageType::Error) {
    throw ShareError(ErrorKind::ProtocolError, reply.data);
  }
  return reply.data;
}

void CommandShell::list_local(const std::string& args) {
  const auto& root = app_->config().folder;
  auto rel = combine_path(local_cwd(), args);
  auto entries = list_directory(root, rel, false, app_->ignore());
  logger_->print("Contents of /{}:\n{}", rel, entries.empty() ? "(empty)" : join_lines(entries));
}

void CommandShell::change_local_dir(const std::string& args) {
  if(args.empty()) throw ShareError(ErrorKind::ProtocolError, "CD requires a directory path");
  auto rel = combine_path(local_cwd(), args);
  auto local = resolve_in_root(app_->config().folder, rel);
  std::error_code ec;
  if(!fs::is_directory(local, ec)) {
    throw ShareError(ErrorKind::NotFound, "Directory not found: " + args);
  }
  {
    std::lock_guard lg(m_);
    cwd_ = rel;
  }
  logger_->print("Changed to /{}", rel);
}

void CommandShell::put(const std::string& args) {
  if(args.empty()) throw ShareError(ErrorKind::ProtocolError, "PUT requires a file path");
  auto connection = require_connection();
  auto rel = combine_path(local_cwd(), args);
  auto local = resolve_in_root(app_->config().folder, rel);
  std::error_code ec;
  if(!fs::is_regular_file(local, ec)) {
    throw ShareError(ErrorKind::NotFound, "File not found: " + args);
  }
  if(!app_->can_start_transfer()) {
    throw ShareError(ErrorKind::TooManyTransfers,
                     "Too many active transfers, please wait for current transfers to complete");
  }
  logger_->print("{}", execute_remote("PUT " + rel));
  auto transfer = app_->transfers().start_send(connection, rel);
  app_->transfers().spawn_send(connection, transfer);
}

void CommandShell::put_dir(const std::string& args) {
  auto connection = require_connection();
  auto rel = combine_path(local_cwd(), args);
  auto files = list_files_recursive(app_->config().folder, rel, app_->ignore());
  if(files.empty()) {
    throw ShareError(ErrorKind::NotFound, "Directory /" + rel + " has no files to transfer");
  }
  logger_->print("{}", execute_remote(rel.empty() ? "PUTDIR ." : "PUTDIR " + rel));
  logger_->print("Uploading {} files", files.size());
  app_->transfers().start_batch(connection, std::move(files));
}

void CommandShell::put_multiple(const std::string& args) {
  if(args.empty()) throw ShareError(ErrorKind::ProtocolError, "PUTM requires a file pattern");
  auto connection = require_connection();
  const auto& root = app_->config().folder;
  auto ignore = app_->ignore();
  std::vector<std::string> files;
  std::set<std::string> seen;
  for(const auto& pattern : split_whitespace(args)) {
    for(auto& file : find_matching_files(root, combine_path(local_cwd(), pattern), ignore)) {
      if(seen.insert(file).second) files.push_back(std::move(file));
    }
  }
  if(files.empty()) throw ShareError(ErrorKind::NotFound, "No files match the pattern");
  logger_->print("{}", execute_remote("PUTM " + args));
  logger_->print("Uploading {} files", files.size());
  app_->transfers().start_batch(connection, std::move(files));
}

void CommandShell::status() {
  logger_->print("Local: {}", format_transfer_status(*app_));
  auto connection = app_->first_connection();
  if(!connection) return;
  logger_->print("Remote: {}", execute_remote("STATUS"));
}

void CommandShell::send_chat(const std::string& args) {
  if(args.empty()) throw ShareError(ErrorKind::ProtocolError, "MSG requires a message");
  auto connection = require_connection();
  if(!connection->send(make_message(MessageType::Chat, args))) {
    throw ShareError(ErrorKind::IOError, "Failed to send message");
  }
  logger_->print("[you] {}", args);
}

void CommandShell::control(const std::string& name, const std::string& args) {
  int id = 0;
  try {
    std::size_t consumed = 0;
    id = std::stoi(args, &consumed);
    if(consumed != args.size()) throw std::invalid_argument(args);
  } catch(const std::logic_error&) {
    throw ShareError(ErrorKind::ProtocolError, name + " requires a transfer id (see STATUS)");
  }

  auto& transfers = app_->transfers();
  bool done = false;
  if(name == "PAUSE") {
    done = transfers.pause(id);
  } else if(name == "RESUME") {
    done = transfers.resume(id);
  } else {
    done = transfers.cancel(id);
  }
  if(!done) {
    auto transfer = app_->transfer(id);
    if(!transfer) throw ShareError(ErrorKind::NotFound, fmt::format("No transfer with id {}", id));
    throw ShareError(ErrorKind::ProtocolError,
                     fmt::format("Cannot {} transfer {} while it is {}", name, id, to_string(transfer->status())));
  }
}

void CommandShell::info() {
  logger_->print("{}", format_node_info(*app_));
  auto connection = app_->first_connection();
  if(connection) {
    logger_->print("Connected to: {} ({})", connection->remote_name(), connection->id());
  } else {
    logger_->print("Not connected");
  }
}

void CommandShell::print_help() {
  logger_->print(
    "Available Commands:\n"
    "  Local Commands:\n"
    "    LS, LIST [path]         List files in the local directory\n"
    "    CD <path>               Change the local directory\n"
    "    INFO                    Show information about this node\n"
    "    HELP                    Show this help message\n"
    "    QUIT, EXIT              Exit the application\n"
    "\n"
    "  Remote Commands:\n"
    "    LSR, LISTREMOTE [path]  List files in the remote directory\n"
    "    CDR <path>              Change the remote directory\n"
    "    GET <file>              Download a file from the peer\n"
    "    PUT <file>              Upload a file to the peer\n"
    "    GETDIR [dir]            Download a directory (current remote dir if omitted)\n"
    "    PUTDIR [dir]            Upload a directory (current local dir if omitted)\n"
    "    GETM <pattern...>       Download files matching patterns or names\n"
    "    PUTM <pattern...>       Upload files matching patterns\n"
    "    STATUS                  Show local and remote transfers\n"
    "    MSG <message>           Send a message to the peer\n"
    "\n"
    "  Transfer Control:\n"
    "    PAUSE <id>              Pause a transfer\n"
    "    RESUME <id>             Resume a paused transfer\n"
    "    CANCEL <id>             Cancel a transfer");
}

void CommandShell::quit() {
  logger_->print("Shutting down gracefully...");
  running_ = false;
  QuitHandler handler;
  {
    std::lock_guard lg(m_);
    handler = quit_handler_;
  }
  if(handler) handler();
}
