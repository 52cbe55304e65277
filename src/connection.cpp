#include "connection.hpp"

#include <istream>
#include <thread>
#include <vector>

#include "app.hpp"
#include "command_dispatcher.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "transfer_service.hpp"

namespace {

// Largest line accepted from a peer. A 256 KiB chunk is ~350 KB once base64'd.
constexpr std::size_t kMaxLineBytes = 4 * 1024 * 1024;
constexpr std::size_t kSeenCapacity = 256;

std::string endpoint_id(asio::ip::tcp::socket& sock) {
    static std::atomic<uint64_t> unnamed{1};
    std::error_code ec;
    auto ep = sock.remote_endpoint(ec);
    if(ec) return "peer-" + std::to_string(unnamed.fetch_add(1));
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

int64_t steady_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

std::string seen_key(const Message& msg) {
    return std::string(to_string(msg.type)) + ":" + msg.id;
}

} // namespace

std::shared_ptr<Connection> Connection::create(asio::io_context& io,
                                               asio::ip::tcp::socket sock,
                                               std::shared_ptr<App> app,
                                               Role role)
{
    return std::shared_ptr<Connection>(new Connection(io, std::move(sock), std::move(app), role));
}

Connection::Connection(asio::io_context& io, asio::ip::tcp::socket sock, std::shared_ptr<App> app, Role role)
: io_(io),
  socket_(std::move(sock)),
  app_(std::move(app)),
  role_(role),
  id_(endpoint_id(socket_)),
  retry_(app_->config().timing.retry_initial, app_->config().timing.max_retries),
  sweep_timer_(io)
{
    logger_ = app_->logger()->child("conn-" + id_);
}

Connection::~Connection() = default;

void Connection::start(){
    auto self = shared_from_this();
    auto worker = app_->track_worker();
    std::thread([self, worker](){
        self->reader_loop();
    }).detach();
}

std::string Connection::remote_name() const {
    std::lock_guard lg(info_m_);
    return remote_name_;
}

std::string Connection::remote_cwd() const {
    std::lock_guard lg(info_m_);
    return remote_cwd_;
}

void Connection::set_remote_cwd(std::string cwd) {
    std::lock_guard lg(info_m_);
    remote_cwd_ = std::move(cwd);
}

std::size_t Connection::pending_request_count() const {
    std::lock_guard lg(pending_m_);
    return pending_.size();
}

void Connection::reader_loop(){
    asio::streambuf buffer(kMaxLineBytes);
    try {
        handshake(buffer);
    } catch(const std::exception& e) {
        logger_->error("Handshake with {} failed: {}", id_, e.what());
        close();
        std::lock_guard lg(write_mutex_);
        std::error_code ignored;
        socket_.close(ignored);
        return;
    }

    while(!closing_.load()) {
        std::string line;
        std::error_code ec;
        if(!read_line(buffer, line, ec)) {
            if(!closing_.load()) {
                if(ec == asio::error::eof) {
                    logger_->info("Peer {} closed the connection", id_);
                } else {
                    logger_->warn("Connection read error: {}", ec.message());
                }
            }
            break;
        }
        if(line.empty()) continue;
        last_received_ms_.store(steady_millis());
        handle_line(line);
    }

    close();
    std::lock_guard lg(write_mutex_);
    std::error_code ignored;
    socket_.close(ignored);
}

bool Connection::read_line(asio::streambuf& buffer, std::string& line, std::error_code& ec){
    asio::read_until(socket_, buffer, '\n', ec);
    if(ec) return false;
    std::istream is(&buffer);
    std::getline(is, line);
    if(!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

void Connection::handshake(asio::streambuf& buffer){
    const auto& config = app_->config();
    if(!send(make_message(MessageType::Handshake, config.name))) {
        throw ShareError(ErrorKind::IOError, "Unable to send HANDSHAKE");
    }

    auto self = shared_from_this();
    auto watchdog = std::make_shared<asio::steady_timer>(io_, config.timing.handshake);
    watchdog->async_wait([self](const std::error_code& ec){
        if(ec || self->handshake_done_.load()) return;
        self->handshake_timed_out_.store(true);
        std::error_code ignored;
        self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    });

    std::string line;
    std::error_code ec;
    bool got_line = read_line(buffer, line, ec);
    handshake_done_.store(true);
    asio::post(io_, [watchdog](){ watchdog->cancel(); });

    if(handshake_timed_out_.load()) {
        throw ShareError(ErrorKind::Timeout, "No HANDSHAKE received in time");
    }
    if(!got_line) {
        throw ShareError(ErrorKind::IOError, "Connection closed during handshake: " + ec.message());
    }
    Message msg = decode(line);
    if(msg.type != MessageType::Handshake) {
        send(make_error("Expected HANDSHAKE", msg.id));
        throw ShareError(ErrorKind::ProtocolError,
                         std::string("Expected HANDSHAKE, got ") + to_string(msg.type));
    }

    {
        std::lock_guard lg(info_m_);
        remote_name_ = msg.data;
    }
    last_received_ms_.store(steady_millis());
    app_->add_connection(self);
    logger_->info("Connected to {} ({})", msg.data, id_);
    asio::post(io_, [self](){ self->schedule_sweep(); });
}

void Connection::handle_line(const std::string& line){
    Message msg;
    try {
        msg = decode(line);
    } catch(const ShareError& e) {
        logger_->warn("Failed to decode message: {}", e.what());
        send(make_error(std::string("Malformed message: ") + e.what(), peek_message_id(line)));
        return;
    }

    try {
        if(requires_ack(msg.type) && !msg.id.empty()) {
            if(replay_duplicate(msg)) return;
            mark_seen(msg);
            // FILESTART/FILEEND are answered by the transfer service itself
            if(msg.type != MessageType::FileStart && msg.type != MessageType::FileEnd) {
                reply(msg, make_ack(msg.id));
            }
        }

        if(!msg.id.empty() &&
           (msg.type == MessageType::Ack || msg.type == MessageType::Error ||
            msg.type == MessageType::CommandResult)) {
            forget_retry(msg.id);
        }

        if(msg.type == MessageType::Ping) {
            send(make_message(MessageType::Pong, "", msg.id));
            return;
        }

        if(deliver_to_pending(msg)) return;
        dispatch(msg);
    } catch(const std::exception& e) {
        logger_->error("Failed to handle {} message: {}", to_string(msg.type), e.what());
    }
}

void Connection::dispatch(const Message& msg){
    auto self = shared_from_this();
    switch(msg.type) {
        case MessageType::Command: {
            Message response;
            try {
                response = app_->commands().handle(self, msg);
            } catch(const ShareError& e) {
                response = make_error(e.what());
            } catch(const std::exception& e) {
                response = make_error(std::string("Command failed: ") + e.what());
            }
            reply(msg, std::move(response));
            break;
        }
        case MessageType::FileStart:
            app_->transfers().on_file_start(self, msg);
            break;
        case MessageType::FileData:
            app_->transfers().on_file_data(self, msg);
            break;
        case MessageType::FileEnd:
            app_->transfers().on_file_end(self, msg);
            break;
        case MessageType::Progress:
            app_->transfers().on_progress(self, msg);
            break;
        case MessageType::Ack:
            app_->transfers().on_ack(self, msg);
            break;
        case MessageType::Error:
            logger_->print_err("[ERROR] {}", msg.data);
            break;
        case MessageType::Chat:
            logger_->print("[MESSAGE FROM {}] {}", remote_name(), msg.data);
            break;
        case MessageType::CommandResult:
            logger_->print("{}", msg.data);
            break;
        case MessageType::Handshake:
            logger_->warn("Unexpected HANDSHAKE from {}", id_);
            send(make_error("Unexpected HANDSHAKE after connection setup", msg.id));
            break;
        case MessageType::Ping:
        case MessageType::Pong:
            break;
    }
}

bool Connection::deliver_to_pending(const Message& msg){
    if(msg.id.empty()) return false;
    std::shared_ptr<std::promise<Message>> target;
    bool consumed = false;
    std::optional<std::chrono::steady_clock::time_point> ping_sent;
    {
        std::lock_guard lg(pending_m_);
        auto it = pending_.find(msg.id);
        if(it == pending_.end()) return false;
        PendingRequest slot = it->second;
        std::visit(overloaded{
            [&](const AckWait& wait){
                target = wait.reply;
                consumed = true;
            },
            [&](const CommandReply& wait){
                // the auto-ACK of the COMMAND itself
                consumed = true;
                if(msg.type != MessageType::Ack) target = wait.reply;
            },
            [&](const PingWait& wait){
                if(msg.type != MessageType::Pong) return;
                consumed = true;
                ping_sent = wait.sent_at;
            }
        }, slot);
        if(target || ping_sent) pending_.erase(it);
    }
    if(target) target->set_value(msg);
    if(ping_sent) {
        auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - *ping_sent);
        logger_->debug("PONG from {} after {} ms", id_, rtt.count());
    }
    return consumed;
}

bool Connection::send(Message msg){
    if(requires_ack(msg.type) && msg.id.empty()) {
        msg.id = new_message_id("msg");
    }
    if(msg.timestamp == 0) msg.timestamp = unix_millis_now();

    std::string line;
    try {
        line = encode(msg);
    } catch(const ShareError& e) {
        logger_->error("Dropping {} message: {}", to_string(msg.type), e.what());
        return false;
    }

    const bool tracked = requires_ack(msg.type);
    // queued before the write so an immediate ACK always finds the entry
    if(tracked) track_retry(msg);
    if(!write_line(line)) {
        if(tracked) forget_retry(msg.id);
        return false;
    }
    return true;
}

bool Connection::write_line(const std::string& line){
    std::error_code ec;
    {
        std::lock_guard lg(write_mutex_);
        if(closing_.load()) return false;
        asio::write(socket_, asio::buffer(line), ec);
    }
    if(ec) {
        if(!closing_.load()) logger_->warn("Connection write error: {}", ec.message());
        close();
        return false;
    }
    return true;
}

void Connection::track_retry(const Message& msg){
    auto self = shared_from_this();
    asio::post(io_, [self, msg](){
        self->retry_.add(msg);
        self->retry_size_.store(self->retry_.size());
    });
}

void Connection::forget_retry(const std::string& id){
    auto self = shared_from_this();
    asio::post(io_, [self, id](){
        self->retry_.remove(id);
        self->retry_size_.store(self->retry_.size());
    });
}

std::future<Message> Connection::register_pending(const std::string& id, PendingRequest request,
                                                  std::shared_ptr<std::promise<Message>> reply){
    std::lock_guard lg(pending_m_);
    if(closing_.load()) {
        throw ShareError(ErrorKind::IOError, "Connection to " + id_ + " is closed");
    }
    pending_[id] = std::move(request);
    return reply ? reply->get_future() : std::future<Message>();
}

void Connection::unregister_pending(const std::string& id){
    std::lock_guard lg(pending_m_);
    pending_.erase(id);
}

Message Connection::await_reply(std::future<Message>& future, const Message& sent,
                                std::chrono::milliseconds timeout){
    if(future.wait_for(timeout) != std::future_status::ready) {
        unregister_pending(sent.id);
        forget_retry(sent.id);
        throw ShareError(ErrorKind::Timeout,
                         fmt::format("Timed out waiting for reply to {} {}", to_string(sent.type), sent.id));
    }
    return future.get();
}

Message Connection::send_reliable(Message msg){
    return send_reliable(std::move(msg), app_->config().timing.reply);
}

Message Connection::send_reliable(Message msg, std::chrono::milliseconds timeout){
    if(msg.id.empty()) msg.id = new_message_id("msg");
    auto reply = std::make_shared<std::promise<Message>>();
    auto future = register_pending(msg.id, AckWait{reply}, reply);
    if(!send(msg)) {
        unregister_pending(msg.id);
        throw ShareError(ErrorKind::IOError,
                         fmt::format("Failed to send {} to {}", to_string(msg.type), id_));
    }
    return await_reply(future, msg, timeout);
}

Message Connection::request(Message msg){
    return request(std::move(msg), app_->config().timing.command);
}

Message Connection::request(Message msg, std::chrono::milliseconds timeout){
    if(msg.id.empty()) msg.id = new_message_id("cmd");
    auto reply = std::make_shared<std::promise<Message>>();
    auto future = register_pending(msg.id, CommandReply{reply}, reply);
    if(!send(msg)) {
        unregister_pending(msg.id);
        throw ShareError(ErrorKind::IOError,
                         fmt::format("Failed to send {} to {}", to_string(msg.type), id_));
    }
    return await_reply(future, msg, timeout);
}

void Connection::reply(const Message& request, Message response){
    response.id = request.id;
    if(requires_ack(request.type) && !request.id.empty()) {
        remember_reply(request, response);
    }
    send(std::move(response));
}

bool Connection::replay_duplicate(const Message& msg){
    std::optional<Message> cached;
    {
        std::lock_guard lg(seen_m_);
        auto it = seen_.find(seen_key(msg));
        if(it == seen_.end()) return false;
        cached = it->second;
    }
    logger_->debug("Duplicate {} {} (retry {})", to_string(msg.type), msg.id, msg.retry_count);
    if(cached) send(*cached);
    return true;
}

void Connection::mark_seen(const Message& msg){
    std::lock_guard lg(seen_m_);
    auto key = seen_key(msg);
    if(seen_.count(key)) return;
    seen_.emplace(key, std::nullopt);
    seen_order_.push_back(key);
    while(seen_order_.size() > kSeenCapacity) {
        seen_.erase(seen_order_.front());
        seen_order_.pop_front();
    }
}

void Connection::remember_reply(const Message& request, const Message& response){
    std::lock_guard lg(seen_m_);
    auto it = seen_.find(seen_key(request));
    if(it != seen_.end()) it->second = response;
}

void Connection::send_repeated(Message msg, int times, std::chrono::milliseconds gap){
    if(times <= 0) return;
    send(msg);
    if(times > 1) {
        schedule_repeat(std::make_shared<asio::steady_timer>(io_), std::move(msg), times - 1, gap);
    }
}

void Connection::schedule_repeat(std::shared_ptr<asio::steady_timer> timer, Message msg,
                                 int remaining, std::chrono::milliseconds gap){
    auto self = shared_from_this();
    timer->expires_after(gap);
    timer->async_wait([self, timer, msg, remaining, gap](const std::error_code& ec){
        if(ec || self->closing_.load()) return;
        self->send(msg);
        if(remaining > 1) self->schedule_repeat(timer, msg, remaining - 1, gap);
    });
}

void Connection::schedule_sweep(){
    if(closing_.load()) return;
    auto self = shared_from_this();
    sweep_timer_.expires_after(app_->config().timing.sweep);
    sweep_timer_.async_wait([self](const std::error_code& ec){
        if(ec || self->closing_.load()) return;
        self->sweep();
        self->schedule_sweep();
    });
}

void Connection::sweep(){
    auto now = std::chrono::steady_clock::now();
    auto due = retry_.poll(now);
    retry_size_.store(retry_.size());

    for(const auto& failed : due.exhausted) {
        logger_->warn("Message {} ({}) failed after {} retries",
                      failed.id, to_string(failed.type), app_->config().timing.max_retries);
    }
    for(const auto& msg : due.resend) {
        logger_->debug("Retrying {} {} (attempt {})", to_string(msg.type), msg.id, msg.retry_count);
        try {
            if(!write_line(encode(msg))) return;
        } catch(const ShareError& e) {
            logger_->error("Unable to resend {}: {}", msg.id, e.what());
        }
    }
    check_liveness(now);
}

void Connection::check_liveness(std::chrono::steady_clock::time_point now){
    const auto& timing = app_->config().timing;
    if(!ping_id_.empty()) {
        std::optional<std::chrono::steady_clock::time_point> sent_at;
        {
            std::lock_guard lg(pending_m_);
            auto it = pending_.find(ping_id_);
            if(it != pending_.end()) {
                if(auto* wait = std::get_if<PingWait>(&it->second)) sent_at = wait->sent_at;
            }
        }
        if(!sent_at) {
            ping_id_.clear(); // answered
        } else if(now - *sent_at >= timing.ping_expiry) {
            logger_->warn("No PONG from {} within {} s", id_,
                          std::chrono::duration_cast<std::chrono::seconds>(timing.ping_expiry).count());
            unregister_pending(ping_id_);
            ping_id_.clear();
        }
        return;
    }

    auto idle = std::chrono::milliseconds(steady_millis() - last_received_ms_.load());
    if(idle < timing.idle_before_ping) return;
    auto id = new_message_id("ping");
    try {
        register_pending(id, PingWait{now}, nullptr);
    } catch(const ShareError&) {
        return; // closing
    }
    ping_id_ = id;
    logger_->debug("Idle for {} ms, sending PING {}", idle.count(), id);
    send(make_message(MessageType::Ping, "", id));
}

void Connection::close(){
    bool expected = false;
    if(!closing_.compare_exchange_strong(expected, true)) return;

    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);

    std::unordered_map<std::string, PendingRequest> orphaned;
    {
        std::lock_guard lg(pending_m_);
        orphaned.swap(pending_);
    }
    for(auto& entry : orphaned) {
        std::visit(overloaded{
            [&](AckWait& wait){
                wait.reply->set_exception(std::make_exception_ptr(
                    ShareError(ErrorKind::IOError, "Connection to " + id_ + " closed")));
            },
            [&](CommandReply& wait){
                wait.reply->set_exception(std::make_exception_ptr(
                    ShareError(ErrorKind::IOError, "Connection to " + id_ + " closed")));
            },
            [](PingWait&){}
        }, entry.second);
    }

    auto self = shared_from_this();
    asio::post(io_, [self](){
        self->sweep_timer_.cancel();
        self->retry_.clear();
        self->retry_size_.store(0);
    });

    app_->remove_connection(id_);
    app_->transfers().on_connection_closed(id_);

    if(role_ == Role::Client) {
        if(!app_->shutting_down()) logger_->warn("Lost connection to server");
        app_->end_session();
    } else if(!app_->shutting_down()) {
        logger_->print("Client disconnected. Waiting for new connections...");
    }
}
