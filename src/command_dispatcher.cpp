#include "command_dispatcher.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <vector>

#include "app.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "file_listing.hpp"
#include "file_transfer.hpp"
#include "log.hpp"
#include "transfer_service.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for(std::size_t i = 0; i < lines.size(); ++i) {
    if(i > 0) out.push_back('\n');
    out += lines[i];
  }
  return out;
}

std::string display_path(const std::string& relative) {
  return "/" + relative;
}

std::string require_argument(const std::string& args, const char* usage) {
  auto value = trim_copy(args);
  if(value.empty()) throw ShareError(ErrorKind::ProtocolError, usage);
  return value;
}

bool has_glob(const std::string& value) {
  return value.find_first_of("*?[") != std::string::npos;
}

} // namespace

std::string format_transfer_status(App& app) {
  auto transfers = app.list_transfers();
  if(transfers.empty()) return "No active transfers";
  std::string text = fmt::format("Active transfers: {}", transfers.size());
  for(const auto& t : transfers) {
    text += fmt::format("\n[{}] {} {}: {:.1f}% complete ({:.2f} KB/s)", t.id, to_string(t.direction),
                        t.path, t.percent(), t.speed_kbps);
    if(t.status != TransferStatus::InProgress) text += fmt::format(" [{}]", to_string(t.status));
  }
  return text;
}

std::string format_node_info(const App& app) {
  const auto& config = app.config();
  std::string text;
  text += fmt::format("Node: {}\n", config.name);
  text += fmt::format("Folder: {}\n", config.folder.string());
  text += fmt::format("Read-only: {}\n", config.read_only);
  text += fmt::format("Write-only: {}\n", config.write_only);
  if(config.max_size_mb > 0) {
    text += fmt::format("Max file size: {} MB\n", config.max_size_mb);
  } else {
    text += "Max file size: Unlimited\n";
  }
  text += fmt::format("Verify transfers: {}\n", config.verify);
  text += fmt::format("Max concurrent transfers: {}", config.max_transfers);
  return text;
}

CommandDispatcher::CommandDispatcher(App& app)
  : app_(app),
    logger_(app.logger()->child("commands")) {
  handlers_["LS"] = [this](const auto& c, const auto& a){ return list(c, a, false); };
  handlers_["LIST"] = handlers_["LS"];
  handlers_["LSR"] = [this](const auto& c, const auto& a){ return list(c, a, true); };
  handlers_["CDR"] = [this](const auto& c, const auto& a){ return change_dir(c, a); };
  handlers_["GET"] = [this](const auto& c, const auto& a){ return get(c, a); };
  handlers_["PUT"] = [this](const auto& c, const auto& a){ return put(c, a); };
  handlers_["GETDIR"] = [this](const auto& c, const auto& a){ return get_dir(c, a); };
  handlers_["PUTDIR"] = [this](const auto& c, const auto& a){ return put_dir(c, a); };
  handlers_["GETM"] = [this](const auto& c, const auto& a){ return get_multiple(c, a); };
  handlers_["PUTM"] = [this](const auto& c, const auto& a){ return put_multiple(c, a); };
  handlers_["STATUS"] = [this](const auto&, const auto&){ return status(); };
  handlers_["INFO"] = [this](const auto&, const auto&){ return info(); };
  handlers_["PAUSE"] = [this](const auto& c, const auto& a){
    return app_.transfers().apply_remote_control(c->id(), TransferService::Control::Pause,
                                                 require_argument(a, "PAUSE requires a file path"));
  };
  handlers_["RESUME"] = [this](const auto& c, const auto& a){
    return app_.transfers().apply_remote_control(c->id(), TransferService::Control::Resume,
                                                 require_argument(a, "RESUME requires a file path"));
  };
  handlers_["CANCEL"] = [this](const auto& c, const auto& a){
    return app_.transfers().apply_remote_control(c->id(), TransferService::Control::Cancel,
                                                 require_argument(a, "CANCEL requires a file path"));
  };
}

Message CommandDispatcher::handle(const std::shared_ptr<Connection>& connection, const Message& command) {
  auto line = trim_copy(command.data);
  if(line.empty()) throw ShareError(ErrorKind::ProtocolError, "Invalid command format");

  auto space = line.find_first_of(" \t");
  auto name = to_upper(line.substr(0, space));
  auto args = space == std::string::npos ? std::string() : trim_copy(line.substr(space + 1));

  auto it = handlers_.find(name);
  if(it == handlers_.end()) {
    logger_->warn("Unknown command from {}: {}", connection->id(), name);
    throw ShareError(ErrorKind::ProtocolError, "Unknown command: " + name);
  }
  logger_->info("{} requested {}{}{}", connection->id(), name, args.empty() ? "" : " ", args);
  return make_message(MessageType::CommandResult, it->second(connection, args));
}

std::string CommandDispatcher::list(const std::shared_ptr<Connection>& connection,
                                    const std::string& args, bool recursive) {
  auto rel = combine_path(connection->remote_cwd(), args);
  auto entries = list_directory(app_.config().folder, rel, recursive, app_.ignore());
  if(entries.empty()) return fmt::format("Contents of {}:\n(empty)", display_path(rel));
  return fmt::format("Contents of {}:\n{}", display_path(rel), join_lines(entries));
}

std::string CommandDispatcher::change_dir(const std::shared_ptr<Connection>& connection,
                                          const std::string& args) {
  auto target = require_argument(args, "CDR requires a directory path");
  auto rel = combine_path(connection->remote_cwd(), target);
  auto local = resolve_in_root(app_.config().folder, rel);
  std::error_code ec;
  auto status = fs::status(local, ec);
  if(ec || !fs::exists(status)) {
    throw ShareError(ErrorKind::NotFound, "Directory not found: " + target);
  }
  if(!fs::is_directory(status)) {
    throw ShareError(ErrorKind::ProtocolError, "Not a directory: " + target);
  }
  connection->set_remote_cwd(rel);
  return "Changed to " + display_path(rel);
}

std::string CommandDispatcher::get(const std::shared_ptr<Connection>& connection, const std::string& args) {
  auto file = require_argument(args, "GET requires a file path");
  auto rel = combine_path(connection->remote_cwd(), file);
  auto transfer = app_.transfers().start_send(connection, rel);
  app_.transfers().spawn_send(connection, transfer);
  return "Starting file transfer: " + transfer->path();
}

std::string CommandDispatcher::put(const std::shared_ptr<Connection>&, const std::string& args) {
  auto file = require_argument(args, "PUT requires a file path");
  require_receive_allowed();
  if(!is_valid_relative_path(file)) {
    throw ShareError(ErrorKind::AccessDenied, "Access denied: path is outside the shared folder");
  }
  if(!app_.can_start_transfer()) {
    throw ShareError(ErrorKind::TooManyTransfers,
                     "Too many active transfers, please wait for current transfers to complete");
  }
  return "Ready to receive file";
}

std::string CommandDispatcher::get_dir(const std::shared_ptr<Connection>& connection,
                                       const std::string& args) {
  require_send_allowed();
  auto rel = combine_path(connection->remote_cwd(), args);
  auto local = resolve_in_root(app_.config().folder, rel);
  std::error_code ec;
  auto status = fs::status(local, ec);
  if(ec || !fs::exists(status)) {
    throw ShareError(ErrorKind::NotFound, "Directory not found: " + display_path(rel));
  }
  if(!fs::is_directory(status)) {
    throw ShareError(ErrorKind::ProtocolError, "GETDIR can only transfer directories, use GET for files");
  }
  auto files = list_files_recursive(app_.config().folder, rel, app_.ignore());
  if(files.empty()) return "Directory " + display_path(rel) + " has no files to transfer";
  app_.transfers().start_batch(connection, files);
  return fmt::format("Starting directory transfer: {} files\n{}", files.size(), join_lines(files));
}

std::string CommandDispatcher::put_dir(const std::shared_ptr<Connection>& connection,
                                       const std::string& args) {
  auto dir = require_argument(args, "PUTDIR requires a directory path");
  require_receive_allowed();
  if(!is_valid_relative_path(dir)) {
    throw ShareError(ErrorKind::AccessDenied, "Access denied: path is outside the shared folder");
  }
  // incoming wire paths are root-relative, so the directory is created there
  auto local = resolve_in_root(app_.config().folder, normalize_relative_path(dir));
  std::error_code ec;
  fs::create_directories(local, ec);
  if(ec) {
    throw ShareError(ErrorKind::IOError, "Failed to create directory: " + ec.message());
  }
  logger_->debug("Prepared {} for {}", local.string(), connection->id());
  return "Ready to receive directory files";
}

std::string CommandDispatcher::get_multiple(const std::shared_ptr<Connection>& connection,
                                            const std::string& args) {
  auto names = split_whitespace(args);
  if(names.empty()) throw ShareError(ErrorKind::ProtocolError, "GETM requires at least one file");
  require_send_allowed();

  const auto& root = app_.config().folder;
  auto ignore = app_.ignore();
  auto cwd = connection->remote_cwd();
  std::vector<std::string> files;
  std::set<std::string> seen;
  for(const auto& name : names) {
    auto rel = combine_path(cwd, name);
    std::vector<std::string> candidates;
    if(has_glob(name)) {
      candidates = find_matching_files(root, rel, ignore);
    } else {
      std::error_code ec;
      if(is_valid_relative_path(rel) && fs::is_regular_file(resolve_in_root(root, rel), ec) &&
         !ignore.should_ignore(rel)) {
        candidates.push_back(rel);
      }
    }
    for(auto& file : candidates) {
      if(seen.insert(file).second) files.push_back(std::move(file));
    }
  }
  if(files.empty()) {
    throw ShareError(ErrorKind::NotFound, "No files match the specified patterns or names");
  }
  app_.transfers().start_batch(connection, files);
  return fmt::format("Starting transfer of {} files\n{}", files.size(), join_lines(files));
}

std::string CommandDispatcher::put_multiple(const std::shared_ptr<Connection>&, const std::string& args) {
  require_argument(args, "PUTM requires a file pattern");
  require_receive_allowed();
  return "Ready to receive multiple files";
}

std::string CommandDispatcher::status() const {
  return format_transfer_status(app_);
}

std::string CommandDispatcher::info() const {
  return format_node_info(app_);
}

void CommandDispatcher::require_receive_allowed() const {
  if(app_.config().write_only) {
    throw ShareError(ErrorKind::AccessDenied, "This node is in write-only mode and cannot receive files");
  }
}

void CommandDispatcher::require_send_allowed() const {
  if(app_.config().read_only) {
    throw ShareError(ErrorKind::AccessDenied, "This node is in read-only mode and cannot send files");
  }
}
