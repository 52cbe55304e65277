#include "app.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "file_transfer.hpp"
#include "log.hpp"
#include "node.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "transfer_service.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;
namespace fs = std::filesystem;

struct RunnerConfig {
  fs::path root;
  fs::path server_root;
  fs::path client_root;
};

RunnerConfig prepare_workspace(const std::string& name) {
  RunnerConfig cfg;
  cfg.root = lanshare::test::make_workspace("node_" + name);
  cfg.server_root = cfg.root / "server";
  cfg.client_root = cfg.root / "client";
  std::error_code ec;
  fs::create_directories(cfg.server_root, ec);
  fs::create_directories(cfg.client_root, ec);
  return cfg;
}

struct TestContext {
  lanshare::test::LogCapture& logs;
  bool verbose = false;
  std::vector<std::string> failures;

  bool check(bool condition, const std::string& what) {
    if(!condition) failures.push_back(what);
    return condition;
  }
};

Node::Options headless() {
  Node::Options options;
  options.start_shell = false;
  options.use_console = false;
  options.exit_on_session_end = false;
  return options;
}

// Records every transfer that left the registry.
class FinishedTransfers {
public:
  explicit FinishedTransfers(const std::shared_ptr<App>& app)
    : app_(app) {
    handle_ = app->add_transfer_listener([this](const FileTransfer::Snapshot& snapshot){
      std::lock_guard<std::mutex> lock(mutex_);
      finished_.push_back(snapshot);
    });
  }

  ~FinishedTransfers() {
    app_->remove_transfer_listener(handle_);
  }

  std::optional<FileTransfer::Snapshot> find(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& snapshot : finished_) {
      if(snapshot.path == path) return snapshot;
    }
    return std::nullopt;
  }

  bool wait_for(const std::string& path, TransferStatus status, std::chrono::milliseconds timeout) const {
    return lanshare::test::wait_for_condition([&]{
      auto snapshot = find(path);
      return snapshot && snapshot->status == status;
    }, timeout);
  }

private:
  std::shared_ptr<App> app_;
  std::size_t handle_ = 0;
  mutable std::mutex mutex_;
  std::vector<FileTransfer::Snapshot> finished_;
};

// A server node plus a client node dialing it over loopback.
struct Pair {
  std::unique_ptr<Node> server;
  std::unique_ptr<Node> client;

  bool connect(TestContext& ctx, const Config& server_config, Config client_config) {
    server = std::make_unique<Node>(server_config, headless());
    ctx.logs.attach(*server, "server");
    server->start_background();
    client_config.target = "127.0.0.1:" + std::to_string(server->listen_port());
    client = std::make_unique<Node>(client_config, headless());
    ctx.logs.attach(*client, "client");
    client->start_background();
    return lanshare::test::wait_for_condition([&]{
      return server->connection_count() == 1 && client->connection_count() == 1;
    }, 5s);
  }

  void stop() {
    if(client) client->stop();
    if(server) server->stop();
  }
};

std::optional<FileTransfer::Snapshot> first_transfer(const std::shared_ptr<App>& app,
                                                     TransferDirection direction) {
  for(const auto& snapshot : app->list_transfers()) {
    if(snapshot.direction == direction) return snapshot;
  }
  return std::nullopt;
}

// Speaks the wire protocol by hand against a node.
class RawPeer {
public:
  RawPeer() : socket_(io_) {}

  // TCP connect and read the node's HANDSHAKE without answering it.
  bool open(uint16_t port) {
    std::error_code ec;
    socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
    if(ec) return false;
    auto hello = read_message(2s);
    return hello && hello->type == MessageType::Handshake;
  }

  bool connect(uint16_t port) {
    return open(port) && write(make_message(MessageType::Handshake, "raw-peer"));
  }

  bool write(const Message& msg) {
    std::error_code ec;
    asio::write(socket_, asio::buffer(encode(msg)), ec);
    return !ec;
  }

  std::optional<Message> read_message(std::chrono::milliseconds timeout) {
    std::error_code result = asio::error::would_block;
    asio::async_read_until(socket_, buffer_, '\n',
      [&result](const std::error_code& ec, std::size_t){ result = ec; });
    io_.restart();
    io_.run_for(timeout);
    if(result == asio::error::would_block) {
      std::error_code ignored;
      socket_.cancel(ignored);
      io_.restart();
      io_.run();
      last_error_ = asio::error::would_block;
      return std::nullopt;
    }
    last_error_ = result;
    if(result) return std::nullopt;
    std::istream is(&buffer_);
    std::string line;
    std::getline(is, line);
    return decode(line);
  }

  // Skips keep-alive traffic and anything not matching.
  std::optional<Message> read_until(std::function<bool(const Message&)> match,
                                    std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(std::chrono::steady_clock::now() < deadline) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      auto msg = read_message(left);
      if(!msg) return std::nullopt;
      if(match(*msg)) return msg;
    }
    return std::nullopt;
  }

  // True once the node hung up; anything it sends first is skipped.
  bool wait_closed(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(std::chrono::steady_clock::now() < deadline) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if(!read_message(left)) return last_error_ && last_error_ != asio::error::would_block;
    }
    return false;
  }

  void close() {
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

private:
  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  asio::streambuf buffer_;
  std::error_code last_error_;
};

bool test_get_file(TestContext& ctx) {
  auto cfg = prepare_workspace("get");
  auto payload = lanshare::test::random_bytes(10000, 3);
  lanshare::test::write_file(cfg.server_root / "data.bin", payload);

  Pair pair;
  bool ok = ctx.check(pair.connect(ctx, lanshare::test::fast_config(cfg.server_root, "server"),
                                   lanshare::test::fast_config(cfg.client_root, "client")),
                      "nodes connected");
  if(ok) {
    FinishedTransfers sent(pair.server->app());
    FinishedTransfers received(pair.client->app());
    ctx.check(pair.client->execute_command("GET data.bin"), "GET accepted");
    ctx.check(received.wait_for("data.bin", TransferStatus::Complete, 5s), "receiver complete");
    ctx.check(sent.wait_for("data.bin", TransferStatus::Complete, 5s), "sender complete");
    ctx.check(lanshare::test::read_file(cfg.client_root / "data.bin") == payload, "bytes match");
    ctx.check(sha256_file(cfg.client_root / "data.bin") == sha256_file(cfg.server_root / "data.bin"),
              "checksums match");
    ctx.check(ctx.logs.wait_for_substring("File received successfully: data.bin", 2s), "receiver reported");

    // a second copy of the same file gets a numbered name
    ctx.check(pair.client->execute_command("GET /data.bin"), "second GET accepted");
    ctx.check(lanshare::test::wait_for_condition([&]{
      return fs::exists(cfg.client_root / "data (1).bin") && !pair.client->app()->is_any_transfer_active();
    }, 5s), "duplicate saved under a unique name");
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_size_limit(TestContext& ctx) {
  auto cfg = prepare_workspace("size");
  lanshare::test::write_file(cfg.server_root / "big.bin", lanshare::test::random_bytes(2 * 1024 * 1024 + 10));
  auto server_config = lanshare::test::fast_config(cfg.server_root, "server");
  server_config.max_size_mb = 1;

  Pair pair;
  if(ctx.check(pair.connect(ctx, server_config, lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    ctx.check(!pair.client->execute_command("GET big.bin"), "GET refused");
    ctx.check(ctx.logs.contains("File size exceeds maximum allowed size of 1 MB"), "size error reported");
    ctx.check(!fs::exists(cfg.client_root / "big.bin"), "nothing written");
    ctx.check(pair.server->app()->list_transfers().empty(), "nothing registered");

    ctx.check(!pair.client->execute_command("GET missing.bin"), "missing file refused");
    ctx.check(ctx.logs.contains("File not found: missing.bin"), "not found reported");
    ctx.check(!pair.client->execute_command("GET ../escape.bin"), "escape refused");
    ctx.check(ctx.logs.contains("Access denied"), "access denied reported");
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_put_and_remote_commands(TestContext& ctx) {
  auto cfg = prepare_workspace("put");
  auto payload = lanshare::test::random_bytes(50000, 5);
  lanshare::test::write_file(cfg.client_root / "up.bin", payload);
  lanshare::test::write_file(cfg.server_root / "docs" / "readme.txt", "hello");

  Pair pair;
  if(ctx.check(pair.connect(ctx, lanshare::test::fast_config(cfg.server_root, "server"),
                            lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    FinishedTransfers received(pair.server->app());
    ctx.check(pair.client->execute_command("PUT up.bin"), "PUT accepted");
    ctx.check(received.wait_for("up.bin", TransferStatus::Complete, 5s), "server received");
    ctx.check(lanshare::test::wait_for_condition([&]{
      return !pair.client->app()->is_any_transfer_active();
    }, 5s), "sender finished");
    ctx.check(lanshare::test::read_file(cfg.server_root / "up.bin") == payload, "uploaded bytes match");

    ctx.check(pair.client->execute_command("LSR"), "remote listing");
    ctx.check(ctx.logs.wait_for_substring("docs/", 2s), "listing shows directory");
    ctx.check(pair.client->execute_command("CDR docs"), "remote cd");
    ctx.check(ctx.logs.contains("Changed to /docs"), "cd confirmed");
    ctx.check(pair.client->execute_command("LSR"), "listing in subdirectory");
    ctx.check(ctx.logs.wait_for_substring("readme.txt", 2s), "subdirectory listed");
    ctx.check(!pair.client->execute_command("CDR nowhere"), "bad cd refused");

    ctx.check(pair.client->execute_command("MSG hello there"), "chat sent");
    ctx.check(ctx.logs.wait_for_substring("[MESSAGE FROM client] hello there", 2s), "chat delivered");

    ctx.check(pair.client->execute_command("INFO"), "info");
    ctx.check(ctx.logs.wait_for_substring("Connected to: server", 2s), "peer shown in info");
    ctx.check(!pair.client->execute_command("FROB"), "unknown command refused");
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_get_directory(TestContext& ctx) {
  auto cfg = prepare_workspace("getdir");
  lanshare::test::write_file(cfg.server_root / "photos" / "a.jpg", lanshare::test::random_bytes(3000, 1));
  lanshare::test::write_file(cfg.server_root / "photos" / "b.jpg", lanshare::test::random_bytes(4000, 2));
  lanshare::test::write_file(cfg.server_root / "photos" / "raw" / "c.raw", lanshare::test::random_bytes(5000, 3));
  lanshare::test::write_file(cfg.server_root / "photos" / "skip.tmp", "tmp");
  lanshare::test::write_file(cfg.server_root / ".fshignore", "*.tmp\n");

  auto server_config = lanshare::test::fast_config(cfg.server_root, "server");
  server_config.max_transfers = 1;
  Pair pair;
  if(ctx.check(pair.connect(ctx, server_config, lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    ctx.check(pair.client->execute_command("GETDIR photos"), "GETDIR accepted");
    ctx.check(ctx.logs.wait_for_substring("Batch finished: 3 of 3 files sent", 10s), "batch finished");
    for(const auto* rel : {"photos/a.jpg", "photos/b.jpg", "photos/raw/c.raw"}) {
      ctx.check(lanshare::test::wait_for_condition([&]{
        return fs::exists(cfg.client_root / rel) &&
               lanshare::test::read_file(cfg.client_root / rel) == lanshare::test::read_file(cfg.server_root / rel);
      }, 5s), std::string("copied ") + rel);
    }
    ctx.check(!fs::exists(cfg.client_root / "photos" / "skip.tmp"), "ignored file not sent");
    ctx.check(!pair.client->execute_command("GETM photos/*.png"), "no match refused");
    ctx.check(ctx.logs.contains("No files match"), "no match reported");
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_pause_resume(TestContext& ctx) {
  auto cfg = prepare_workspace("pause");
  auto payload = lanshare::test::random_bytes(200000, 9);
  lanshare::test::write_file(cfg.server_root / "movie.bin", payload);

  Pair pair;
  if(ctx.check(pair.connect(ctx, lanshare::test::fast_config(cfg.server_root, "server"),
                            lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    auto server_app = pair.server->app();
    auto client_app = pair.client->app();
    FinishedTransfers received(client_app);
    auto connection = server_app->first_connection();
    auto transfer = server_app->transfers().start_send(connection, "movie.bin");
    ctx.check(server_app->transfers().pause(transfer->id(), false), "paused before streaming");
    server_app->transfers().spawn_send(connection, transfer);

    ctx.check(lanshare::test::wait_for_condition([&]{
      return first_transfer(client_app, TransferDirection::Receive).has_value();
    }, 3s), "receiver registered the transfer");
    std::this_thread::sleep_for(200ms);
    auto incoming = first_transfer(client_app, TransferDirection::Receive);
    ctx.check(incoming && incoming->bytes == 0, "no data while paused");

    ctx.check(!pair.client->execute_command("LS"), "shell limited during a transfer");
    ctx.check(ctx.logs.contains("A transfer is in progress"), "limit reported");
    ctx.check(pair.client->execute_command("STATUS"), "status allowed during a transfer");

    // the peer is already paused, so this only reports
    if(incoming) {
      ctx.check(pair.client->execute_command("PAUSE " + std::to_string(incoming->id)), "local pause");
      ctx.check(ctx.logs.wait_for_substring("Transfer of movie.bin is already paused", 2s),
                "peer reported it was already paused");
      ctx.check(pair.client->execute_command("RESUME " + std::to_string(incoming->id)), "local resume");
    }
    ctx.check(lanshare::test::wait_for_condition([&]{
      return transfer->status() == TransferStatus::InProgress || transfer->terminal();
    }, 3s), "sender resumed by the peer");
    ctx.check(received.wait_for("movie.bin", TransferStatus::Complete, 5s), "transfer completed");
    ctx.check(lanshare::test::read_file(cfg.client_root / "movie.bin") == payload, "bytes match");
    ctx.check(!pair.client->execute_command("PAUSE 999"), "unknown id refused");
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_cancel(TestContext& ctx) {
  auto cfg = prepare_workspace("cancel");
  lanshare::test::write_file(cfg.server_root / "huge.bin", lanshare::test::random_bytes(300000, 4));

  Pair pair;
  if(ctx.check(pair.connect(ctx, lanshare::test::fast_config(cfg.server_root, "server"),
                            lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    auto server_app = pair.server->app();
    auto client_app = pair.client->app();
    FinishedTransfers sent(server_app);
    FinishedTransfers received(client_app);
    auto connection = server_app->first_connection();
    auto transfer = server_app->transfers().start_send(connection, "huge.bin");
    server_app->transfers().pause(transfer->id(), false);
    server_app->transfers().spawn_send(connection, transfer);

    ctx.check(lanshare::test::wait_for_condition([&]{
      return first_transfer(client_app, TransferDirection::Receive).has_value();
    }, 3s), "receiver registered the transfer");
    auto incoming = first_transfer(client_app, TransferDirection::Receive);
    if(incoming) {
      ctx.check(pair.client->execute_command("CANCEL " + std::to_string(incoming->id)), "cancel accepted");
    }
    ctx.check(received.wait_for("huge.bin", TransferStatus::Failed, 3s), "receiver cancelled");
    ctx.check(sent.wait_for("huge.bin", TransferStatus::Failed, 3s), "sender cancelled by the peer");
    ctx.check(!fs::exists(cfg.client_root / "huge.bin"), "partial file removed");
    ctx.check(!client_app->is_any_transfer_active() && !server_app->is_any_transfer_active(),
              "registries drained");
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_mid_stream_pause(TestContext& ctx) {
  auto cfg = prepare_workspace("midstream");
  auto payload = lanshare::test::random_bytes(2 * 1024 * 1024, 11);
  lanshare::test::write_file(cfg.server_root / "stream.bin", payload);

  Pair pair;
  if(ctx.check(pair.connect(ctx, lanshare::test::fast_config(cfg.server_root, "server"),
                            lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    auto server_app = pair.server->app();
    auto client_app = pair.client->app();
    FinishedTransfers sent(server_app);
    FinishedTransfers received(client_app);

    // pause the sender at its first progress report after data moved
    std::atomic<bool> paused_once{false};
    App* sender = server_app.get();
    server_app->set_progress_listener([sender, &paused_once](const FileTransfer::Snapshot& snapshot){
      if(snapshot.direction != TransferDirection::Send || snapshot.bytes == 0) return;
      if(paused_once.exchange(true)) return;
      sender->transfers().pause(snapshot.id, true);
    });
    std::mutex seen_mutex;
    std::vector<uint64_t> seen;
    client_app->set_progress_listener([&](const FileTransfer::Snapshot& snapshot){
      std::lock_guard<std::mutex> lock(seen_mutex);
      seen.push_back(snapshot.bytes);
    });

    auto connection = server_app->first_connection();
    auto transfer = server_app->transfers().start_send(connection, "stream.bin");
    server_app->transfers().spawn_send(connection, transfer);

    ctx.check(lanshare::test::wait_for_condition([&]{
      auto incoming = first_transfer(client_app, TransferDirection::Receive);
      return transfer->status() == TransferStatus::Paused &&
             incoming && incoming->status == TransferStatus::Paused;
    }, 3s), "both sides paused mid-stream");
    std::this_thread::sleep_for(300ms);
    auto before = first_transfer(client_app, TransferDirection::Receive);
    auto sent_before = transfer->bytes_transferred();
    std::this_thread::sleep_for(200ms);
    auto after = first_transfer(client_app, TransferDirection::Receive);
    ctx.check(sent_before > 0 && sent_before < payload.size(), "paused between first and last byte");
    ctx.check(transfer->bytes_transferred() == sent_before, "sender idle while paused");
    ctx.check(before && after && before->bytes == after->bytes, "receiver idle while paused");
    ctx.check(before && before->bytes == sent_before, "receiver holds every chunk sent so far");

    if(after) {
      ctx.check(pair.client->execute_command("RESUME " + std::to_string(after->id)), "resume from the receiver");
    }
    ctx.check(received.wait_for("stream.bin", TransferStatus::Complete, 10s), "receiver complete");
    ctx.check(sent.wait_for("stream.bin", TransferStatus::Complete, 5s), "sender complete");
    auto final_sent = sent.find("stream.bin");
    ctx.check(final_sent && final_sent->bytes == payload.size(), "sender counted each byte once");
    ctx.check(lanshare::test::read_file(cfg.client_root / "stream.bin") == payload, "bytes match");
    {
      std::lock_guard<std::mutex> lock(seen_mutex);
      ctx.check(std::is_sorted(seen.begin(), seen.end()), "receiver progress never went back");
    }
    server_app->set_progress_listener(nullptr);
    client_app->set_progress_listener(nullptr);
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_send_abort(TestContext& ctx) {
  auto cfg = prepare_workspace("abort");
  lanshare::test::write_file(cfg.server_root / "early.bin", lanshare::test::random_bytes(100000, 6));
  lanshare::test::write_file(cfg.server_root / "shrink.bin", lanshare::test::random_bytes(100000, 8));

  Pair pair;
  if(ctx.check(pair.connect(ctx, lanshare::test::fast_config(cfg.server_root, "server"),
                            lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    auto server_app = pair.server->app();
    auto client_app = pair.client->app();
    FinishedTransfers sent(server_app);
    FinishedTransfers received(client_app);
    auto connection = server_app->first_connection();

    // cancelled before FILESTART went out: the receiver never opens a file
    auto early = server_app->transfers().start_send(connection, "early.bin");
    ctx.check(server_app->transfers().cancel(early->id(), true), "cancelled before streaming");
    server_app->transfers().spawn_send(connection, early);
    ctx.check(sent.wait_for("early.bin", TransferStatus::Failed, 3s), "sender finished the cancelled transfer");
    std::this_thread::sleep_for(200ms);
    ctx.check(!first_transfer(client_app, TransferDirection::Receive).has_value(), "receiver never registered it");
    ctx.check(!fs::exists(cfg.client_root / "early.bin"), "no file on the receiver");
    ctx.check(!ctx.logs.contains("No active transfer for early.bin"), "no stray CANCEL sent");

    // the source shrinks after FILESTART: the receiver is told to drop its copy
    auto shrink = server_app->transfers().start_send(connection, "shrink.bin");
    server_app->transfers().pause(shrink->id(), false);
    server_app->transfers().spawn_send(connection, shrink);
    ctx.check(lanshare::test::wait_for_condition([&]{
      return first_transfer(client_app, TransferDirection::Receive).has_value();
    }, 3s), "receiver registered the transfer");
    lanshare::test::write_file(cfg.server_root / "shrink.bin", "tiny");
    server_app->transfers().resume(shrink->id(), false);

    ctx.check(sent.wait_for("shrink.bin", TransferStatus::Failed, 3s), "sender failed");
    auto outcome = sent.find("shrink.bin");
    ctx.check(outcome && outcome->failure.find("changed while sending") != std::string::npos, "failure reason kept");
    ctx.check(received.wait_for("shrink.bin", TransferStatus::Failed, 3s), "receiver dropped the transfer");
    ctx.check(!fs::exists(cfg.client_root / "shrink.bin"), "partial file removed");
    ctx.check(!client_app->is_any_transfer_active(), "receiver registry drained");
    ctx.check(pair.client->execute_command("LSR"), "receiver shell usable again");
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_transfer_limit(TestContext& ctx) {
  auto cfg = prepare_workspace("limit");
  lanshare::test::write_file(cfg.server_root / "one.bin", "1111");
  lanshare::test::write_file(cfg.server_root / "two.bin", "2222");
  auto server_config = lanshare::test::fast_config(cfg.server_root, "server");
  server_config.max_transfers = 1;

  Pair pair;
  if(ctx.check(pair.connect(ctx, server_config, lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    auto server_app = pair.server->app();
    auto connection = server_app->first_connection();
    auto first = server_app->transfers().start_send(connection, "one.bin");
    bool refused = false;
    try {
      server_app->transfers().start_send(connection, "two.bin");
    } catch(const ShareError& e) {
      refused = e.kind() == ErrorKind::TooManyTransfers;
    }
    ctx.check(refused, "second transfer refused");
    ctx.check(server_app->list_transfers().size() == 1, "refused transfer not registered");

    // the slot frees up once the first transfer ends
    server_app->transfers().spawn_send(connection, first);
    ctx.check(lanshare::test::wait_for_condition([&]{ return server_app->can_start_transfer(); }, 5s),
              "slot released");
    ctx.check(lanshare::test::wait_for_condition([&]{
      return fs::exists(cfg.client_root / "one.bin") && !pair.client->app()->is_any_transfer_active();
    }, 5s), "first file delivered");
    ctx.check(pair.client->execute_command("GET two.bin"), "second file accepted afterwards");
  }
  pair.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_request_timeout(TestContext& ctx) {
  auto cfg = prepare_workspace("timeout");
  Node server(lanshare::test::fast_config(cfg.server_root, "server"), headless());
  ctx.logs.attach(server, "server");
  server.start_background();

  RawPeer peer;
  if(ctx.check(peer.connect(server.listen_port()), "raw peer connected")) {
    std::shared_ptr<Connection> connection;
    ctx.check(lanshare::test::wait_for_condition([&]{
      connection = server.app()->first_connection();
      return connection != nullptr;
    }, 3s), "connection registered");
    if(connection) {
      bool timed_out = false;
      try {
        connection->request(make_message(MessageType::Command, "LS"), 300ms);
      } catch(const ShareError& e) {
        timed_out = e.kind() == ErrorKind::Timeout;
      }
      ctx.check(timed_out, "silent peer times out");
      ctx.check(lanshare::test::wait_for_condition([&]{
        return connection->pending_ack_count() == 0 && connection->pending_request_count() == 0;
      }, 2s), "nothing left pending");

      // the command went out again with the same id before giving up
      auto retry = peer.read_until([](const Message& m){ return m.type == MessageType::Command && m.retry_count > 0; }, 1s);
      ctx.check(retry.has_value(), "command retried");

      // answers to our own COMMAND come back with its id
      ctx.check(peer.write(make_message(MessageType::Command, "INFO", "cmd-raw-1")), "raw command sent");
      auto result = peer.read_until([](const Message& m){
        return m.id == "cmd-raw-1" && m.type == MessageType::CommandResult;
      }, 2s);
      ctx.check(result && result->data.find("Node: server") != std::string::npos, "command answered");
    }
  }
  peer.close();
  server.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_keep_alive(TestContext& ctx) {
  auto cfg = prepare_workspace("keepalive");
  auto config = lanshare::test::fast_config(cfg.server_root, "server");
  config.timing.idle_before_ping = 150ms;
  config.timing.ping_expiry = 1500ms;
  Node server(config, headless());
  ctx.logs.attach(server, "server");
  server.start_background();

  auto is_ping = [](const Message& m){ return m.type == MessageType::Ping; };
  RawPeer peer;
  if(ctx.check(peer.connect(server.listen_port()), "raw peer connected")) {
    auto first = peer.read_until(is_ping, 2s);
    ctx.check(first && !first->id.empty(), "idle connection pinged");
    if(first) {
      ctx.check(peer.write(make_message(MessageType::Pong, "", first->id)), "pong sent");
      auto answered_at = std::chrono::steady_clock::now();
      auto second = peer.read_until(is_ping, 2s);
      auto gap = std::chrono::steady_clock::now() - answered_at;
      ctx.check(second && second->id != first->id, "new PING after the next idle period");
      // an unanswered PING would hold the next one back until it expired
      ctx.check(gap < 800ms, "pong cleared the outstanding PING");

      ctx.check(ctx.logs.wait_for_substring("No PONG from", 3s), "missing pong reported");
      ctx.check(server.connection_count() == 1, "connection kept after a missed pong");
      auto third = peer.read_until(is_ping, 2s);
      ctx.check(third && second && third->id != second->id, "pinging continues");
    }
  }
  peer.close();
  server.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_handshake_failures(TestContext& ctx) {
  auto cfg = prepare_workspace("handshake");
  auto config = lanshare::test::fast_config(cfg.server_root, "server");
  config.timing.handshake = 300ms;
  Node server(config, headless());
  ctx.logs.attach(server, "server");
  server.start_background();

  RawPeer wrong;
  if(ctx.check(wrong.open(server.listen_port()), "first peer connected")) {
    wrong.write(make_message(MessageType::Command, "LS", "cmd-early"));
    auto refusal = wrong.read_until([](const Message& m){ return m.type == MessageType::Error; }, 2s);
    ctx.check(refusal && refusal->data.find("Expected HANDSHAKE") != std::string::npos, "wrong first message refused");
    ctx.check(wrong.wait_closed(2s), "connection dropped");
    ctx.check(ctx.logs.wait_for_substring("Expected HANDSHAKE, got COMMAND", 2s), "handshake failure logged");
  }
  wrong.close();

  RawPeer silent;
  if(ctx.check(silent.open(server.listen_port()), "second peer connected")) {
    ctx.check(silent.wait_closed(2s), "silent peer dropped by the watchdog");
    ctx.check(ctx.logs.wait_for_substring("No HANDSHAKE received in time", 2s), "timeout logged");
  }
  silent.close();
  ctx.check(server.connection_count() == 0, "failed peers never registered");

  RawPeer good;
  ctx.check(good.connect(server.listen_port()), "proper peer accepted afterwards");
  ctx.check(lanshare::test::wait_for_condition([&]{ return server.connection_count() == 1; }, 2s),
            "proper peer registered");
  good.close();
  server.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_bad_checksum(TestContext& ctx) {
  auto cfg = prepare_workspace("checksum");
  Node server(lanshare::test::fast_config(cfg.server_root, "server"), headless());
  ctx.logs.attach(server, "server");
  FinishedTransfers finished(server.app());
  server.start_background();

  auto is_error = [](const Message& m){ return m.type == MessageType::Error; };
  RawPeer peer;
  if(ctx.check(peer.connect(server.listen_port()), "raw peer connected")) {
    peer.write(make_binary_message(MessageType::FileData, "orphan"));
    auto orphan = peer.read_until(is_error, 2s);
    ctx.check(orphan && orphan->data.find("No active file transfer") != std::string::npos, "orphan data refused");

    Message start = make_message(MessageType::FileStart, FileStartInfo{"bad.bin", 5, ""}.to_data(), "fs-1");
    peer.write(start);
    auto ack = peer.read_until([](const Message& m){ return m.id == "fs-1"; }, 2s);
    ctx.check(ack && ack->type == MessageType::Ack, "FILESTART acknowledged");

    peer.write(make_binary_message(MessageType::FileData, "hello"));
    Message end = make_message(MessageType::FileEnd, FileEndInfo{"bad.bin", sha256_hex("other")}.to_data(), "fe-1");
    peer.write(end);
    auto verdict = peer.read_until([](const Message& m){ return m.id == "fe-1"; }, 2s);
    ctx.check(verdict && verdict->type == MessageType::Error &&
              verdict->data.find("Checksum verification failed") != std::string::npos,
              "checksum mismatch reported");
    ctx.check(finished.wait_for("bad.bin", TransferStatus::Failed, 2s), "transfer failed");
    ctx.check(!fs::exists(cfg.server_root / "bad.bin"), "corrupt file removed");

    // data after the transfer ended is dropped without a reply
    peer.write(make_binary_message(MessageType::FileData, "late"));
    auto late = peer.read_until(is_error, 300ms);
    ctx.check(!late.has_value(), "late data ignored");

    // a resent FILEEND gets the same answer again
    Message again = end;
    again.retry_count = 1;
    peer.write(again);
    auto replay = peer.read_until([](const Message& m){ return m.id == "fe-1"; }, 2s);
    ctx.check(replay && replay->type == MessageType::Error, "duplicate answered from cache");

    Message good = make_message(MessageType::FileStart,
                                FileStartInfo{"good.bin", 4, sha256_hex("good")}.to_data(), "fs-2");
    peer.write(good);
    peer.read_until([](const Message& m){ return m.id == "fs-2"; }, 2s);
    peer.write(make_binary_message(MessageType::FileData, "good"));
    peer.write(make_message(MessageType::FileEnd, "good.bin", "fe-2"));
    auto done = peer.read_until([](const Message& m){ return m.id == "fe-2"; }, 2s);
    ctx.check(done && done->type == MessageType::Ack, "good file acknowledged");
    auto path_ack = peer.read_until([](const Message& m){
      return m.type == MessageType::Ack && m.data == "good.bin";
    }, 2s);
    ctx.check(path_ack.has_value(), "completion ACK carries the path");
    ctx.check(lanshare::test::read_file(cfg.server_root / "good.bin") == "good", "good file written");
  }
  peer.close();
  server.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

bool test_client_session_end(TestContext& ctx) {
  auto cfg = prepare_workspace("session");
  Pair pair;
  if(ctx.check(pair.connect(ctx, lanshare::test::fast_config(cfg.server_root, "server"),
                            lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected")) {
    ctx.check(!pair.client->session_over(), "session running");
    pair.server->stop();
    ctx.check(lanshare::test::wait_for_condition([&]{ return pair.client->session_over(); }, 3s),
              "client noticed the server left");
    ctx.check(pair.client->exit_code() == 1, "lost server exits with failure");
    ctx.check(!pair.client->execute_command("LSR"), "remote commands need a peer");
  }
  pair.stop();

  // QUIT is a clean exit
  Pair second;
  if(ctx.check(second.connect(ctx, lanshare::test::fast_config(cfg.server_root, "server"),
                              lanshare::test::fast_config(cfg.client_root, "client")),
               "nodes connected again")) {
    ctx.check(second.client->execute_command("QUIT"), "quit accepted");
    ctx.check(lanshare::test::wait_for_condition([&]{ return second.client->session_over(); }, 3s),
              "session ended");
    ctx.check(second.client->exit_code() == 0, "quit exits cleanly");
  }
  second.stop();
  lanshare::test::remove_workspace(cfg.root);
  return ctx.failures.empty();
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("LANSHARE_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("LANSHARE_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  lanshare::test::LogCapture logs;
  std::vector<TestCase> tests = {
    {"get_file", test_get_file},
    {"size_limit", test_size_limit},
    {"put_and_remote_commands", test_put_and_remote_commands},
    {"get_directory", test_get_directory},
    {"pause_resume", test_pause_resume},
    {"cancel", test_cancel},
    {"mid_stream_pause", test_mid_stream_pause},
    {"send_abort", test_send_abort},
    {"transfer_limit", test_transfer_limit},
    {"request_timeout", test_request_timeout},
    {"keep_alive", test_keep_alive},
    {"handshake_failures", test_handshake_failures},
    {"bad_checksum", test_bad_checksum},
    {"client_session_end", test_client_session_end}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " node tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    TestContext ctx{logs, verbose, {}};
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& what : ctx.failures) {
        std::cout << "    check failed: " << what << "\n";
      }
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " node tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
