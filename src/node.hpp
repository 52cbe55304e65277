#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config.hpp"

class App;
class CommandShell;
class Console;
class Logger;

// One lanshare process: the io_context thread, the listener, the optional
// dial to a target, the shell and the console.
class Node {
public:
  struct Options {
    bool start_shell = false;
    bool use_console = false;
    // Stop the io_context once the session ends (client lost its server or
    // QUIT). Tests keep the node alive and inspect it instead.
    bool exit_on_session_end = true;
  };

  Node(Config config, Options options);
  ~Node();

  // Binds the listener and dials the target. Throws on bind failure.
  void start();
  // Runs the io_context on the calling thread until the session ends.
  void run();
  void start_background();
  void stop();

  // Runs one shell command. False when it failed or was refused.
  bool execute_command(const std::string& line);

  std::shared_ptr<App> app() const { return app_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  CommandShell* shell() const { return shell_.get(); }
  uint16_t listen_port() const { return listen_port_; }
  std::size_t connection_count() const;
  bool session_over() const { return session_over_.load(); }
  // 1 when a client lost its server or could not reach it, 0 otherwise.
  int exit_code() const;

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void dial(const std::string& target);
  void on_session_end();
  void request_quit();

  Config config_;
  Options options_;
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<tcp::resolver> resolver_;
  std::unique_ptr<asio::steady_timer> grace_timer_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<App> app_;
  std::unique_ptr<Console> console_;
  std::unique_ptr<CommandShell> shell_;
  std::atomic<bool> started_{false};
  std::atomic<bool> session_over_{false};
  std::atomic<bool> quit_requested_{false};
  uint16_t listen_port_ = 0;
};
