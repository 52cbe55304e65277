#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "protocol.hpp"

class App;
class Connection;
class Logger;

// Serves COMMAND messages from the peer. Paths are taken relative to the
// connection's remote working directory (see CDR).
class CommandDispatcher {
public:
  explicit CommandDispatcher(App& app);

  // Returns the COMMANDRESULT. Failures are thrown as ShareError and reach
  // the peer as ERROR.
  Message handle(const std::shared_ptr<Connection>& connection, const Message& command);

private:
  using Handler = std::function<std::string(const std::shared_ptr<Connection>&, const std::string&)>;

  std::string list(const std::shared_ptr<Connection>& connection, const std::string& args, bool recursive);
  std::string change_dir(const std::shared_ptr<Connection>& connection, const std::string& args);
  std::string get(const std::shared_ptr<Connection>& connection, const std::string& args);
  std::string put(const std::shared_ptr<Connection>& connection, const std::string& args);
  std::string get_dir(const std::shared_ptr<Connection>& connection, const std::string& args);
  std::string put_dir(const std::shared_ptr<Connection>& connection, const std::string& args);
  std::string get_multiple(const std::shared_ptr<Connection>& connection, const std::string& args);
  std::string put_multiple(const std::shared_ptr<Connection>& connection, const std::string& args);
  std::string status() const;
  std::string info() const;

  void require_receive_allowed() const;
  void require_send_allowed() const;

  App& app_;
  std::shared_ptr<Logger> logger_;
  std::map<std::string, Handler> handlers_;
};

// Multi-line STATUS text for the transfers currently registered.
std::string format_transfer_status(App& app);
// Multi-line INFO text describing the node configuration.
std::string format_node_info(const App& app);
