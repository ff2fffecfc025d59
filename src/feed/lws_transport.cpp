#include "../../include/autotrade/feed/ws_transport.hpp"

#include <chrono>
#include <cstring>
#include <libwebsockets.h>
#include <vector>

namespace autotrade::feed {

namespace {

constexpr int CONNECT_TIMEOUT_MS = 10000;

struct ParsedUrl {
    bool ssl = true;
    std::string host;
    int port = 443;
    std::string path = "/";
};

bool parse_ws_url(const std::string& url, ParsedUrl& out) {
    std::string rest;
    if (url.rfind("wss://", 0) == 0) {
        out.ssl = true;
        out.port = 443;
        rest = url.substr(6);
    } else if (url.rfind("ws://", 0) == 0) {
        out.ssl = false;
        out.port = 80;
        rest = url.substr(5);
    } else {
        return false;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.path = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.find(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        try {
            out.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            return false;
        }
    } else {
        out.host = authority;
    }
    return !out.host.empty();
}

int protocol_callback(struct lws* wsi, enum lws_callback_reasons reason, void* /*user*/, void* in, size_t len) {
    struct lws_context* ctx = lws_get_context(wsi);
    auto* self = ctx ? static_cast<LwsTransport*>(lws_context_user(ctx)) : nullptr;
    if (!self)
        return 0;
    return self->handle_event(wsi, static_cast<int>(reason), in, len);
}

const struct lws_protocols protocols[] = {
    {"autotrade-feed", protocol_callback, 0, 65536, 0, nullptr, 0},
    LWS_PROTOCOL_LIST_TERM,
};

} // namespace

LwsTransport::~LwsTransport() {
    close();
}

int LwsTransport::handle_event(struct lws* wsi, int reason, void* in, size_t len) {
    switch (static_cast<enum lws_callback_reasons>(reason)) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        connected_ = true;
        break;

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        connect_error_ = in ? std::string(static_cast<char*>(in), len) : "Connection error";
        connected_ = false;
        closed_ = true;
        wsi_ = nullptr;
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE:
        if (in && len > 0) {
            rx_buffer_.append(static_cast<char*>(in), len);
        }
        if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
            rx_queue_.push_back(std::move(rx_buffer_));
            rx_buffer_.clear();
        }
        break;

    case LWS_CALLBACK_CLIENT_WRITEABLE: {
        std::string msg;
        bool more = false;
        {
            std::lock_guard<std::mutex> lock(tx_mutex_);
            if (tx_queue_.empty())
                break;
            msg = std::move(tx_queue_.front());
            tx_queue_.pop_front();
            more = !tx_queue_.empty();
        }
        std::vector<unsigned char> buf(LWS_PRE + msg.size());
        std::memcpy(buf.data() + LWS_PRE, msg.data(), msg.size());
        if (lws_write(wsi, buf.data() + LWS_PRE, msg.size(), LWS_WRITE_TEXT) < static_cast<int>(msg.size())) {
            return -1; // close the connection
        }
        if (more) {
            lws_callback_on_writable(wsi);
        }
        break;
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        // Woken by send() from another thread
        bool pending = false;
        {
            std::lock_guard<std::mutex> lock(tx_mutex_);
            pending = !tx_queue_.empty();
        }
        if (pending && wsi_ && connected_) {
            lws_callback_on_writable(wsi_);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
    case LWS_CALLBACK_CLOSED:
        connected_ = false;
        closed_ = true;
        wsi_ = nullptr;
        break;

    default:
        break;
    }
    return 0;
}

bool LwsTransport::open(const std::string& url, std::string& error) {
    close();

    ParsedUrl parsed;
    if (!parse_ws_url(url, parsed)) {
        error = "Invalid WebSocket URL: " + url;
        return false;
    }

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = this;

    {
        std::lock_guard<std::mutex> lock(ctx_mutex_);
        context_ = lws_create_context(&info);
    }
    if (!context_) {
        error = "Failed to create WebSocket context";
        return false;
    }

    connected_ = false;
    closed_ = false;
    connect_error_.clear();

    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));
    ccinfo.context = context_;
    ccinfo.address = parsed.host.c_str();
    ccinfo.port = parsed.port;
    ccinfo.path = parsed.path.c_str();
    ccinfo.host = parsed.host.c_str();
    ccinfo.origin = parsed.host.c_str();
    ccinfo.protocol = protocols[0].name;
    ccinfo.ssl_connection = parsed.ssl ? LCCSCF_USE_SSL : 0;
    ccinfo.pwsi = &wsi_;

    if (!lws_client_connect_via_info(&ccinfo)) {
        error = "Failed to connect to " + url;
        close();
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(CONNECT_TIMEOUT_MS);
    while (!connected_ && !closed_ && std::chrono::steady_clock::now() < deadline) {
        lws_service(context_, 50);
    }

    if (!connected_) {
        error = connect_error_.empty() ? "Handshake timed out: " + url : connect_error_;
        close();
        return false;
    }
    return true;
}

bool LwsTransport::send(const std::string& message) {
    std::lock_guard<std::mutex> ctx_lock(ctx_mutex_);
    if (!context_ || !connected_)
        return false;
    {
        std::lock_guard<std::mutex> lock(tx_mutex_);
        tx_queue_.push_back(message);
    }
    lws_cancel_service(context_);
    return true;
}

bool LwsTransport::poll(int timeout_ms, const MessageHandler& on_message) {
    if (!context_)
        return false;

    lws_service(context_, timeout_ms);

    while (!rx_queue_.empty()) {
        std::string msg = std::move(rx_queue_.front());
        rx_queue_.pop_front();
        on_message(msg);
    }
    return connected_ && !closed_;
}

void LwsTransport::close() {
    std::lock_guard<std::mutex> ctx_lock(ctx_mutex_);
    connected_ = false;
    if (context_) {
        lws_context_destroy(context_);
        context_ = nullptr;
    }
    wsi_ = nullptr;
    rx_buffer_.clear();
    rx_queue_.clear();
    std::lock_guard<std::mutex> lock(tx_mutex_);
    tx_queue_.clear();
}

} // namespace autotrade::feed
