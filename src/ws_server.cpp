#include "ws_server.h"
#include "logger.h"
#include <libwebsockets.h>
#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace holo_oracle {

namespace {

/// State shared between the service thread and one connection's worker
struct Connection {
    lws* wsi = nullptr;
    std::string id;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbound;
    std::deque<std::string> outbound;
    bool closed = false;
    Session* session = nullptr;  ///< Live while the worker runs; guarded by mutex

    std::atomic<bool> done{false};
    std::thread worker;

    // Service-thread only
    std::string fragment;
    bool oversize = false;
};

} // namespace

class WebSocketServer::Impl {
public:
    Impl(const Config& config, const SessionServices& services, DetectorFactory make_detector)
        : config_(config)
        , services_(services)
        , make_detector_(std::move(make_detector))
    {
        protocols_[0] = {};
        protocols_[0].name = "oracle-voice";
        protocols_[0].callback = &Impl::callback;
        protocols_[0].per_session_data_size = 0;
        protocols_[0].rx_buffer_size = 64 * 1024;
        protocols_[1] = {};
    }

    ~Impl() {
        shutdown_connections();
        if (context_) {
            lws_context_destroy(context_);
            context_ = nullptr;
        }
    }

    VoidResult start() {
        lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

        struct lws_context_creation_info info;
        std::memset(&info, 0, sizeof info);
        info.port = config_.server.port;
        // iface takes an interface name or a literal address
        if (config_.server.host == "localhost") {
            iface_ = "127.0.0.1";
        } else if (config_.server.host != "0.0.0.0") {
            iface_ = config_.server.host;
        }
        info.iface = iface_.empty() ? nullptr : iface_.c_str();
        info.protocols = protocols_;
        info.gid = -1;
        info.uid = -1;
        info.user = this;

        context_ = lws_create_context(&info);
        if (!context_) {
            return VoidResult::failure("Failed to create websocket context on " +
                                       config_.server.host + ":" + std::to_string(config_.server.port));
        }

        LOG_WS("Voice server listening on ws://" + config_.server.host + ":" +
               std::to_string(config_.server.port) + " (protocol oracle-voice)");
        return VoidResult::ok_result();
    }

    int run() {
        if (!context_) {
            LOG_ERROR("[WS] run() called before start()");
            return 1;
        }

        while (!stop_requested_) {
            if (lws_service(context_, 0) < 0) {
                LOG_ERROR("[WS] Service loop failed");
                break;
            }
            reap_finished_workers();
        }

        LOG_WS("Stopping, closing " + std::to_string(connections_.size()) + " connections");
        shutdown_connections();
        return 0;
    }

    void stop() {
        stop_requested_ = true;
        if (context_) {
            lws_cancel_service(context_);
        }
    }

    size_t connection_count() const {
        return open_count_;
    }

private:
    static int callback(struct lws* wsi, enum lws_callback_reasons reason,
                        void* user, void* in, size_t len) {
        (void)user;
        auto* self = static_cast<Impl*>(lws_context_user(lws_get_context(wsi)));
        if (!self) return 0;

        switch (reason) {
            case LWS_CALLBACK_ESTABLISHED:
                self->on_open(wsi);
                break;
            case LWS_CALLBACK_RECEIVE:
                self->on_receive(wsi, in, len);
                break;
            case LWS_CALLBACK_SERVER_WRITEABLE:
                return self->on_writeable(wsi);
            case LWS_CALLBACK_CLOSED:
                self->on_close(wsi);
                break;
            case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
                self->request_pending_writes();
                break;
            default:
                break;
        }
        return 0;
    }

    void on_open(lws* wsi) {
        auto conn = std::make_shared<Connection>();
        conn->wsi = wsi;
        conn->id = "client_" + std::to_string(next_client_++) + "_" + std::to_string(now_ms());
        connections_[wsi] = conn;
        open_count_ = connections_.size();

        LOG_WS("Client connected: " + conn->id);

        lws_context* ctx = context_;
        conn->worker = std::thread([this, conn, ctx]() { worker_loop(conn, ctx); });
    }

    void worker_loop(std::shared_ptr<Connection> conn, lws_context* ctx) {
        {
            std::weak_ptr<Connection> weak = conn;
            MessageSink sink = [weak, ctx](const std::string& message) {
                auto c = weak.lock();
                if (!c) return;
                {
                    std::lock_guard<std::mutex> lock(c->mutex);
                    if (c->closed) return;
                    c->outbound.push_back(message);
                }
                lws_cancel_service(ctx);
            };

            Session session(conn->id, services_, make_detector_, sink);
            {
                std::lock_guard<std::mutex> lock(conn->mutex);
                conn->session = &session;
                if (conn->closed) session.cancel();
            }
            session.send_welcome();

            while (true) {
                std::string message;
                {
                    std::unique_lock<std::mutex> lock(conn->mutex);
                    conn->cv.wait(lock, [&]() { return conn->closed || !conn->inbound.empty(); });
                    if (conn->closed) break;
                    message = std::move(conn->inbound.front());
                    conn->inbound.pop_front();
                }
                session.handle_message(message);
            }

            std::lock_guard<std::mutex> lock(conn->mutex);
            conn->session = nullptr;
        }
        conn->done = true;
        lws_cancel_service(ctx);
    }

    void on_receive(lws* wsi, void* in, size_t len) {
        auto it = connections_.find(wsi);
        if (it == connections_.end()) return;
        Connection& conn = *it->second;

        if (lws_frame_is_binary(wsi)) {
            LOG_WARN("[WS] Ignoring binary frame from " + conn.id);
            return;
        }

        if (!conn.oversize) {
            if (conn.fragment.size() + len > config_.server.max_message_bytes) {
                LOG_WARN("[WS] Message from " + conn.id + " exceeds " +
                         std::to_string(config_.server.max_message_bytes) + " bytes, dropped");
                conn.oversize = true;
                conn.fragment.clear();
            } else {
                conn.fragment.append(static_cast<const char*>(in), len);
            }
        }

        if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
            if (!conn.oversize) {
                std::lock_guard<std::mutex> lock(conn.mutex);
                conn.inbound.push_back(std::move(conn.fragment));
                conn.cv.notify_one();
            }
            conn.fragment.clear();
            conn.oversize = false;
        }
    }

    int on_writeable(lws* wsi) {
        auto it = connections_.find(wsi);
        if (it == connections_.end()) return 0;
        Connection& conn = *it->second;

        std::string message;
        bool more = false;
        {
            std::lock_guard<std::mutex> lock(conn.mutex);
            if (conn.outbound.empty()) return 0;
            message = std::move(conn.outbound.front());
            conn.outbound.pop_front();
            more = !conn.outbound.empty();
        }

        // lws needs LWS_PRE bytes of headroom in front of the payload
        std::vector<unsigned char> buf(LWS_PRE + message.size());
        std::memcpy(buf.data() + LWS_PRE, message.data(), message.size());
        int written = lws_write(wsi, buf.data() + LWS_PRE, message.size(), LWS_WRITE_TEXT);
        if (written < static_cast<int>(message.size())) {
            LOG_ERROR("[WS] Write to " + conn.id + " failed, closing");
            return -1;
        }

        if (more) {
            lws_callback_on_writable(wsi);
        }
        return 0;
    }

    void on_close(lws* wsi) {
        auto it = connections_.find(wsi);
        if (it == connections_.end()) return;

        auto conn = it->second;
        connections_.erase(it);
        open_count_ = connections_.size();

        {
            std::lock_guard<std::mutex> lock(conn->mutex);
            conn->closed = true;
            if (conn->session) conn->session->cancel();
            conn->inbound.clear();
            conn->outbound.clear();
            conn->wsi = nullptr;
        }
        conn->cv.notify_one();

        LOG_WS("Client disconnected: " + conn->id);
        retired_.push_back(std::move(conn));
    }

    void request_pending_writes() {
        for (auto& entry : connections_) {
            bool pending;
            {
                std::lock_guard<std::mutex> lock(entry.second->mutex);
                pending = !entry.second->outbound.empty();
            }
            if (pending) {
                lws_callback_on_writable(entry.first);
            }
        }
    }

    void reap_finished_workers() {
        for (auto it = retired_.begin(); it != retired_.end();) {
            if ((*it)->done) {
                if ((*it)->worker.joinable()) (*it)->worker.join();
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }

    void shutdown_connections() {
        for (auto& entry : connections_) {
            auto& conn = entry.second;
            {
                std::lock_guard<std::mutex> lock(conn->mutex);
                conn->closed = true;
                conn->inbound.clear();
            }
            conn->cv.notify_one();
            retired_.push_back(conn);
        }
        connections_.clear();
        open_count_ = 0;

        for (auto& conn : retired_) {
            if (conn->worker.joinable()) conn->worker.join();
        }
        retired_.clear();
    }

    const Config& config_;
    const SessionServices& services_;
    DetectorFactory make_detector_;

    struct lws_protocols protocols_[2];
    lws_context* context_ = nullptr;
    std::string iface_;

    std::unordered_map<lws*, std::shared_ptr<Connection>> connections_;
    std::vector<std::shared_ptr<Connection>> retired_;
    std::atomic<size_t> open_count_{0};
    std::atomic<bool> stop_requested_{false};
    uint64_t next_client_ = 0;
};

WebSocketServer::WebSocketServer(const Config& config,
                                 const SessionServices& services,
                                 DetectorFactory make_detector)
    : pimpl_(std::make_unique<Impl>(config, services, std::move(make_detector))) {}

WebSocketServer::~WebSocketServer() = default;

VoidResult WebSocketServer::start() {
    return pimpl_->start();
}

int WebSocketServer::run() {
    return pimpl_->run();
}

void WebSocketServer::stop() {
    pimpl_->stop();
}

size_t WebSocketServer::connection_count() const {
    return pimpl_->connection_count();
}

} // namespace holo_oracle
