#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

struct lws;
struct lws_context;

namespace autotrade {
namespace feed {

/**
 * WsTransport - one WebSocket connection, driven by the feed worker.
 *
 * open(), poll() and close() are called only from the feed worker thread.
 * send() may be called from any thread.
 */
class WsTransport {
public:
    using MessageHandler = std::function<void(const std::string&)>;

    virtual ~WsTransport() = default;

    /**
     * Connect and block until the handshake completes or fails.
     * @return false with `error` filled on failure
     */
    virtual bool open(const std::string& url, std::string& error) = 0;

    /// Queue a text frame. Returns false if not connected.
    virtual bool send(const std::string& message) = 0;

    /**
     * Service I/O for up to timeout_ms, delivering complete inbound messages.
     * @return false once the connection is closed
     */
    virtual bool poll(int timeout_ms, const MessageHandler& on_message) = 0;

    virtual void close() = 0;
};

/**
 * libwebsockets client transport.
 *
 * A fresh lws context is created per open(). Outbound frames are queued and
 * written from LWS_CALLBACK_CLIENT_WRITEABLE; fragmented inbound frames are
 * reassembled before delivery. Ping/pong is handled by the library.
 */
class LwsTransport : public WsTransport {
public:
    LwsTransport() = default;
    ~LwsTransport() override;

    // Non-copyable
    LwsTransport(const LwsTransport&) = delete;
    LwsTransport& operator=(const LwsTransport&) = delete;

    bool open(const std::string& url, std::string& error) override;
    bool send(const std::string& message) override;
    bool poll(int timeout_ms, const MessageHandler& on_message) override;
    void close() override;

    // Called from the lws protocol callback on the service thread
    int handle_event(struct lws* wsi, int reason, void* in, size_t len);

private:
    struct lws_context* context_ = nullptr;
    struct lws* wsi_ = nullptr;

    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
    std::string connect_error_;

    std::mutex ctx_mutex_; // guards context_ against send() during close()
    std::mutex tx_mutex_;
    std::deque<std::string> tx_queue_;

    std::string rx_buffer_; // partial frame being assembled
    std::deque<std::string> rx_queue_;
};

}  // namespace feed
}  // namespace autotrade
