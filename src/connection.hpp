#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "pending_request.hpp"
#include "protocol.hpp"
#include "retry_queue.hpp"

class App;
class Logger;

// One TCP peer. A dedicated reader thread performs the handshake and then
// reads one JSON line at a time; writers from any thread serialize on the
// write mutex. Retry and keep-alive bookkeeping runs on the io_context.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    enum class Role { Server, Client };

    static std::shared_ptr<Connection> create(asio::io_context& io,
                                              asio::ip::tcp::socket sock,
                                              std::shared_ptr<App> app,
                                              Role role);

    ~Connection();

    void start(); // spawns the reader thread

    const std::string& id() const { return id_; }
    Role role() const { return role_; }
    bool is_open() const { return !closing_.load(); }
    std::string remote_name() const;

    // Best effort. Assigns an id to ACK-requiring messages and queues them for
    // retry. False if the connection is (or just got) closed.
    bool send(Message msg);

    // Sends and blocks for the first reply carrying the message id (ACK or
    // ERROR). Throws ShareError(Timeout | IOError).
    Message send_reliable(Message msg);
    Message send_reliable(Message msg, std::chrono::milliseconds timeout);

    // COMMAND round trip; returns the COMMANDRESULT or ERROR.
    Message request(Message msg);
    Message request(Message msg, std::chrono::milliseconds timeout);

    // Answers `request` with its id and remembers the answer for duplicates.
    void reply(const Message& request, Message response);

    // `times` copies, `gap` apart, the first one immediately.
    void send_repeated(Message msg, int times, std::chrono::milliseconds gap);

    std::string remote_cwd() const;
    void set_remote_cwd(std::string cwd);

    std::size_t pending_ack_count() const { return retry_size_.load(); }
    std::size_t pending_request_count() const;

    void close();

private:
    Connection(asio::io_context& io, asio::ip::tcp::socket sock, std::shared_ptr<App> app, Role role);

    void reader_loop();
    void handshake(asio::streambuf& buffer);
    bool read_line(asio::streambuf& buffer, std::string& line, std::error_code& ec);
    void handle_line(const std::string& line);
    void dispatch(const Message& msg);
    bool deliver_to_pending(const Message& msg);

    bool write_line(const std::string& line);
    void track_retry(const Message& msg);
    void forget_retry(const std::string& id);

    std::future<Message> register_pending(const std::string& id, PendingRequest request,
                                          std::shared_ptr<std::promise<Message>> reply);
    void unregister_pending(const std::string& id);
    Message await_reply(std::future<Message>& future, const Message& sent,
                        std::chrono::milliseconds timeout);

    // Returns true when the message was handled before; the stored reply is
    // sent again.
    bool replay_duplicate(const Message& msg);
    void mark_seen(const Message& msg);
    void remember_reply(const Message& request, const Message& response);

    void schedule_sweep();
    void sweep();
    void check_liveness(std::chrono::steady_clock::time_point now);
    void schedule_repeat(std::shared_ptr<asio::steady_timer> timer, Message msg,
                         int remaining, std::chrono::milliseconds gap);

    asio::io_context& io_;
    asio::ip::tcp::socket socket_;
    std::shared_ptr<App> app_;
    std::shared_ptr<Logger> logger_;
    const Role role_;
    const std::string id_;

    std::atomic<bool> closing_{false};
    std::atomic<bool> handshake_done_{false};
    std::atomic<bool> handshake_timed_out_{false};
    std::atomic<int64_t> last_received_ms_{0};

    std::mutex write_mutex_;

    mutable std::mutex pending_m_;
    std::unordered_map<std::string, PendingRequest> pending_;

    // io_context thread only
    RetryQueue retry_;
    asio::steady_timer sweep_timer_;
    std::string ping_id_;
    std::atomic<std::size_t> retry_size_{0};

    std::mutex seen_m_;
    std::deque<std::string> seen_order_;
    std::unordered_map<std::string, std::optional<Message>> seen_;

    mutable std::mutex info_m_;
    std::string remote_name_;
    std::string remote_cwd_;
};
