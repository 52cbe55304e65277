#include "node.hpp"

#include <unistd.h>

#include <stdexcept>

#include "app.hpp"
#include "connection.hpp"
#include "console.hpp"
#include "log.hpp"
#include "shell.hpp"

namespace {

constexpr std::chrono::seconds kWorkerDrainTimeout{3};
constexpr uint16_t kDefaultPort = 8080;

bool split_target(const std::string& target, std::string& host, std::string& port) {
  auto colon = target.find_last_of(':');
  if(colon == std::string::npos) {
    host = target;
    port = std::to_string(kDefaultPort);
  } else {
    host = target.substr(0, colon);
    port = target.substr(colon + 1);
  }
  if(!host.empty() && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  return !host.empty() && !port.empty();
}

} // namespace

Node::Node(Config config, Options options)
  : config_(std::move(config)),
    options_(options),
    work_(asio::make_work_guard(io_)),
    logger_(std::make_shared<Logger>("node")) {
  app_ = App::create(config_, logger_);
  if(options_.use_console) {
    console_ = std::make_unique<Console>(std::cout, ::isatty(STDOUT_FILENO) != 0);
  }
  shell_ = std::make_unique<CommandShell>(app_, STDIN_FILENO);
}

Node::~Node() {
  stop();
}

void Node::start() {
  if(started_.exchange(true)) return;

  if(console_) {
    console_->attach(logger_);
    console_->start();
    app_->set_progress_listener([console = console_.get()](const FileTransfer::Snapshot& snapshot){
      console->show_progress(snapshot);
    });
    shell_->set_prompt_handler([console = console_.get()](const std::string& prompt){
      console->show_prompt(prompt);
    });
  }
  app_->set_session_end_handler([this](){ on_session_end(); });
  shell_->set_quit_handler([this](){ request_quit(); });

  logger_->info("Sharing {} as {}", config_.folder.string(), config_.name);
  if(config_.read_only) logger_->info("Read-only mode: this node will not send files");
  if(config_.write_only) logger_->info("Write-only mode: this node will not receive files");

  if(!config_.target.empty()) {
    dial(config_.target);
  } else {
    asio::ip::address listen_address;
    try {
      listen_address = asio::ip::make_address(config_.listen_ip);
    } catch(const std::exception& e) {
      logger_->error("Invalid listen_ip '{}': {}", config_.listen_ip, e.what());
      throw;
    }
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(listen_address, config_.listen_port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    listen_port_ = acceptor_->local_endpoint().port();
    logger_->info("Listening on {}:{}", config_.listen_ip, listen_port_);
    logger_->print("Waiting for connections...");
    start_accept();
  }

  if(options_.start_shell) shell_->start();
}

void Node::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) logger_->error("Accept error: {}", ec.message());
        if(!acceptor_ || !acceptor_->is_open()) return;
      } else if(app_->shutting_down()) {
        std::error_code ignored;
        socket.close(ignored);
      } else {
        std::error_code remote_ec;
        auto remote = socket.remote_endpoint(remote_ec);
        if(!remote_ec) {
          logger_->info("New connection from {}:{}", remote.address().to_string(), remote.port());
        }
        Connection::create(io_, std::move(socket), app_, Connection::Role::Server)->start();
      }
      if(started_) start_accept();
    });
}

void Node::dial(const std::string& target) {
  std::string host;
  std::string port;
  if(!split_target(target, host, port)) {
    logger_->error("Target must be host:port (got '{}')", target);
    app_->end_session();
    return;
  }
  logger_->info("Connecting to {}:{}", host, port);
  resolver_ = std::make_unique<tcp::resolver>(io_);
  resolver_->async_resolve(host, port,
    [this, target](std::error_code ec, tcp::resolver::results_type results){
      if(ec) {
        logger_->error("Failed to resolve {}: {}", target, ec.message());
        app_->end_session();
        return;
      }
      auto socket = std::make_shared<tcp::socket>(io_);
      asio::async_connect(*socket, results,
        [this, socket, target](std::error_code ec, const tcp::endpoint&){
          if(ec) {
            logger_->error("Failed to connect to {}: {}", target, ec.message());
            app_->end_session();
            return;
          }
          logger_->info("Connected to {}", target);
          Connection::create(io_, std::move(*socket), app_, Connection::Role::Client)->start();
        });
    });
}

void Node::on_session_end() {
  if(session_over_.exchange(true)) return;
  if(!quit_requested_) logger_->print_err("Session ended. Shutting down...");
  if(!options_.exit_on_session_end) return;
  asio::post(io_, [this](){
    grace_timer_ = std::make_unique<asio::steady_timer>(io_, config_.timing.close_grace);
    grace_timer_->async_wait([this](const std::error_code& ec){
      if(ec) return;
      io_.stop();
    });
  });
}

void Node::request_quit() {
  quit_requested_ = true;
  app_->shutdown();
  app_->end_session();
}

void Node::run() {
  if(!started_) start();
  io_.run();
}

void Node::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void Node::stop() {
  if(!started_.exchange(false)) return;

  shell_->stop();

  if(acceptor_) {
    auto acceptor = acceptor_.get();
    asio::post(io_, [acceptor](){
      std::error_code ec;
      acceptor->close(ec);
    });
  }

  app_->shutdown();
  if(!app_->wait_for_workers(kWorkerDrainTimeout)) {
    logger_->warn("Some connection or transfer threads did not finish in time");
  }

  work_.reset();
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
  // run the handlers posted while shutting down so nothing holds a timer
  io_.poll();
  acceptor_.reset();
  resolver_.reset();
  grace_timer_.reset();

  app_->set_progress_listener(nullptr);
  if(console_) {
    console_->detach();
    console_->stop();
  }
}

bool Node::execute_command(const std::string& line) {
  return shell_->execute(line);
}

std::size_t Node::connection_count() const {
  return app_->connection_count();
}

int Node::exit_code() const {
  if(quit_requested_) return 0;
  return session_over_ ? 1 : 0;
}
