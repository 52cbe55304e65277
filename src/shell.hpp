#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

class App;
class Connection;
class Logger;

// Interactive command loop. start() reads lines from the input descriptor on
// its own thread; execute() runs one command and is what tests drive.
class CommandShell {
public:
  using PromptHandler = std::function<void(const std::string&)>;
  using QuitHandler = std::function<void()>;

  explicit CommandShell(std::shared_ptr<App> app, int input_fd = 0);
  ~CommandShell();

  void start();
  void stop();

  void set_prompt_handler(PromptHandler handler);
  void set_quit_handler(QuitHandler handler);

  // Returns false when the command failed or was refused.
  bool execute(const std::string& line);

  std::string local_cwd() const;

private:
  void run_loop();
  std::optional<std::string> read_command_line();
  void show_prompt();

  std::shared_ptr<Connection> require_connection() const;
  // Sends a COMMAND and returns the COMMANDRESULT text. An ERROR reply is
  // thrown as ShareError(ProtocolError) carrying the peer's text.
  std::string execute_remote(const std::string& command);

  void list_local(const std::string& args);
  void change_local_dir(const std::string& args);
  void put(const std::string& args);
  void put_dir(const std::string& args);
  void put_multiple(const std::string& args);
  void status();
  void send_chat(const std::string& args);
  void control(const std::string& name, const std::string& args);
  void info();
  void print_help();
  void quit();

  std::shared_ptr<App> app_;
  std::shared_ptr<Logger> logger_;
  const int input_fd_;
  std::atomic<bool> running_{false};
  std::thread cli_thread_;
  std::string pending_input_;

  mutable std::mutex m_;
  std::string cwd_;
  PromptHandler prompt_handler_;
  QuitHandler quit_handler_;
};
