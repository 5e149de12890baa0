//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketTransport.cpp
// Purpose: WebSocket client/server transport using Boost.Beast (coroutine reader, queued writer)
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <random>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcphub/WebSocketTransport.hpp"

namespace mcphub {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

// Accepts ws://host[:port][/path] and wss://host[:port][/path].
std::optional<UrlParts> parseWsUrl(const std::string& url) {
    UrlParts parts;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "ws" && parts.scheme != "wss") {
        return std::nullopt;
    }
    std::size_t pos = schemeEnd + 3;
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }
    std::size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = parts.scheme == "wss" ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    if (parts.host.empty() || parts.port.empty()) {
        return std::nullopt;
    }
    return parts;
}

std::string makeSessionId() {
    std::random_device rd; std::mt19937 gen(rd()); std::uniform_int_distribution<> dis(1000, 9999);
    return "ws-" + std::to_string(dis(gen));
}

} // namespace

class WebSocketTransport::Impl {
public:
    using PlainWs = websocket::stream<beast::tcp_stream>;
    using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    struct WriteItem {
        std::string frame;
        std::promise<void> done;
    };

    WebSocketTransport::Options opts;
    std::string sessionId;
    bool serverSide{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::unique_ptr<ssl::context> sslCtx; // present for wss://
    std::unique_ptr<PlainWs> plain;
    std::unique_ptr<TlsWs> tls;

    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> started{false};

    // Inbound frames, filled by the reader coroutine
    std::mutex inboxMutex;
    std::condition_variable inboxCv;
    std::deque<std::string> inbox;
    bool peerClosed{false};

    // Outbound frames; writes are chained on the io thread
    std::mutex writeMutex;
    std::deque<std::shared_ptr<WriteItem>> writeQueue;
    bool writing{false};

    explicit Impl(const WebSocketTransport::Options& o) : opts(o), sessionId(makeSessionId()) {}

    ~Impl() {
        stopIoThread();
    }

    template <class F>
    void withStream(F&& f) {
        if (tls) {
            f(*tls);
        } else if (plain) {
            f(*plain);
        }
    }

    bool streamOpen() const {
        return (tls && tls->is_open()) || (plain && plain->is_open());
    }

    void startIoThread() {
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("WebSocketTransport: io loop terminated: {}", e.what());
            }
        });
    }

    void stopIoThread() {
        if (workGuard) {
            workGuard.reset();
        }
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void markPeerClosed() {
        connected = false;
        {
            std::lock_guard<std::mutex> lk(inboxMutex);
            peerClosed = true;
        }
        inboxCv.notify_all();
    }

    void failPendingWrites(const std::string& why) {
        std::deque<std::shared_ptr<WriteItem>> pending;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            pending.swap(writeQueue);
            writing = false;
        }
        for (auto& item : pending) {
            item->done.set_exception(std::make_exception_ptr(
                errors::McpException(JSONRPCErrorCodes::TransportClosed, why)));
        }
    }

    ///////////////////////////////////////////// Reading /////////////////////////////////////////////
    template <class WS>
    net::awaitable<void> readLoop(WS& ws) {
        beast::flat_buffer buffer;
        for (;;) {
            boost::system::error_code ec;
            co_await ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (ec == websocket::error::closed) {
                    LOG_INFO("WebSocketTransport: peer closed ({})", sessionId);
                } else if (!closing) {
                    LOG_WARN("WebSocketTransport: read failed ({}): {}", sessionId, ec.message());
                }
                break;
            }
            std::string frame = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            LOG_DEBUG("WebSocketTransport recv: {}", frame);
            {
                std::lock_guard<std::mutex> lk(inboxMutex);
                inbox.push_back(std::move(frame));
            }
            inboxCv.notify_one();
        }
        markPeerClosed();
    }

    ///////////////////////////////////////////// Connecting /////////////////////////////////////////////
    template <class WS>
    net::awaitable<void> websocketHandshake(WS& ws, const UrlParts& u) {
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "mcphub");
        }));
        ws.read_message_max(opts.maxMessageSize);
        co_await ws.async_handshake(u.host + ":" + u.port, u.path, net::use_awaitable);
        ws.text(true);
    }

    net::awaitable<void> coConnect(UrlParts u, std::shared_ptr<std::promise<void>> ready) {
        try {
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);
            if (u.scheme == "wss") {
                tls = std::make_unique<TlsWs>(ioc, *sslCtx);
                if (!::SSL_set_tlsext_host_name(tls->next_layer().native_handle(), u.host.c_str())) {
                    LOG_WARN("WebSocketTransport: failed to set SNI hostname {}", u.host);
                }
                if (opts.verifyPeer) {
                    (void)::SSL_set1_host(tls->next_layer().native_handle(), u.host.c_str());
                }
                beast::get_lowest_layer(*tls).expires_after(opts.connectTimeout);
                co_await beast::get_lowest_layer(*tls).async_connect(results, net::use_awaitable);
                co_await tls->next_layer().async_handshake(ssl::stream_base::client, net::use_awaitable);
                co_await websocketHandshake(*tls, u);
            } else {
                plain = std::make_unique<PlainWs>(ioc);
                beast::get_lowest_layer(*plain).expires_after(opts.connectTimeout);
                co_await beast::get_lowest_layer(*plain).async_connect(results, net::use_awaitable);
                co_await websocketHandshake(*plain, u);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketTransport: connect to {} failed: {}", opts.url, e.what());
            ready->set_exception(std::make_exception_ptr(errors::McpException(
                JSONRPCErrorCodes::ConnectFailed, "WebSocket connect to " + opts.url + " failed: " + e.what())));
            markPeerClosed();
            co_return;
        }
        connected = true;
        LOG_INFO("WebSocketTransport: connected to {} ({})", opts.url, sessionId);
        ready->set_value();
        if (tls) {
            co_await readLoop(*tls);
        } else {
            co_await readLoop(*plain);
        }
    }

    ///////////////////////////////////////////// Writing /////////////////////////////////////////////
    // Runs on the io thread; one async_write in flight at a time.
    void writeNext() {
        std::shared_ptr<WriteItem> item;
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (writeQueue.empty()) {
                writing = false;
                return;
            }
            item = writeQueue.front();
        }
        if (!streamOpen()) {
            onWriteDone(item, websocket::error::closed);
            return;
        }
        withStream([this, item](auto& ws) {
            ws.async_write(net::buffer(item->frame), [this, item](beast::error_code ec, std::size_t) {
                onWriteDone(item, ec);
            });
        });
    }

    void onWriteDone(const std::shared_ptr<WriteItem>& item, beast::error_code ec) {
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (!writeQueue.empty() && writeQueue.front() == item) {
                writeQueue.pop_front();
            }
        }
        if (ec) {
            LOG_WARN("WebSocketTransport: write failed ({}): {}", sessionId, ec.message());
            item->done.set_exception(std::make_exception_ptr(errors::McpException(
                JSONRPCErrorCodes::TransportClosed, "WebSocket write failed: " + ec.message())));
        } else {
            item->done.set_value();
        }
        writeNext();
    }
};

WebSocketTransport::WebSocketTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

WebSocketTransport::WebSocketTransport(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

WebSocketTransport::~WebSocketTransport() {
    try {
        Close().get();
    } catch (const std::exception& e) {
        LOG_WARN("WebSocketTransport: close during destruction failed: {}", e.what());
    }
}

std::future<void> WebSocketTransport::Start() {
    FUNC_SCOPE();
    auto ready = std::make_shared<std::promise<void>>();
    auto fut = ready->get_future();
    if (pImpl->started.exchange(true)) {
        ready->set_exception(std::make_exception_ptr(
            errors::McpException(JSONRPCErrorCodes::ConnectFailed, "WebSocketTransport: already started")));
        return fut;
    }

    if (pImpl->serverSide) {
        pImpl->connected = true;
        pImpl->startIoThread();
        net::co_spawn(pImpl->ioc, pImpl->readLoop(*pImpl->plain), net::detached);
        LOG_INFO("WebSocketTransport: serving accepted client ({})", pImpl->sessionId);
        ready->set_value();
        return fut;
    }

    auto parts = parseWsUrl(pImpl->opts.url);
    if (!parts.has_value()) {
        ready->set_exception(std::make_exception_ptr(errors::McpException(
            JSONRPCErrorCodes::ConnectFailed, "WebSocketTransport: invalid url '" + pImpl->opts.url + "'")));
        return fut;
    }
    if (parts->scheme == "wss") {
        try {
            pImpl->sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(pImpl->sslCtx->native_handle(), TLS1_2_VERSION);
            if (!pImpl->opts.caFile.empty()) {
                pImpl->sslCtx->load_verify_file(pImpl->opts.caFile);
            } else {
                pImpl->sslCtx->set_default_verify_paths();
            }
            pImpl->sslCtx->set_verify_mode(pImpl->opts.verifyPeer ? ssl::verify_peer : ssl::verify_none);
        } catch (const boost::system::system_error& e) {
            ready->set_exception(std::make_exception_ptr(errors::McpException(
                JSONRPCErrorCodes::ConnectFailed, std::string("WebSocketTransport: TLS setup failed: ") + e.what())));
            return fut;
        }
    }

    pImpl->startIoThread();
    net::co_spawn(pImpl->ioc, pImpl->coConnect(parts.value(), ready), net::detached);
    return fut;
}

std::future<void> WebSocketTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->closing.exchange(true)) {
        done.set_value();
        return fut;
    }
    pImpl->connected = false;

    if (pImpl->ioThread.joinable()) {
        std::promise<void> closed;
        auto closedFut = closed.get_future();
        net::post(pImpl->ioc, [this, &closed]() {
            if (!pImpl->streamOpen()) {
                closed.set_value();
                return;
            }
            pImpl->withStream([&closed](auto& ws) {
                ws.async_close(websocket::close_code::normal, [&closed](beast::error_code ec) {
                    if (ec) {
                        LOG_DEBUG("WebSocketTransport: close handshake: {}", ec.message());
                    }
                    closed.set_value();
                });
            });
        });
        if (closedFut.wait_for(pImpl->opts.closeTimeout) != std::future_status::ready) {
            LOG_WARN("WebSocketTransport: close handshake timed out ({})", pImpl->sessionId);
        }
        pImpl->stopIoThread();
    }

    pImpl->failPendingWrites("WebSocketTransport: transport closed");
    pImpl->markPeerClosed();
    LOG_INFO("WebSocketTransport: closed ({})", pImpl->sessionId);
    done.set_value();
    return fut;
}

bool WebSocketTransport::IsConnected() const {
    return pImpl->connected;
}

std::string WebSocketTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void WebSocketTransport::Send(const Envelope& envelope) {
    FUNC_SCOPE();
    auto item = std::make_shared<Impl::WriteItem>();
    item->frame = envelope.Encode();
    auto fut = item->done.get_future();
    bool kick = false;
    {
        std::lock_guard<std::mutex> lk(pImpl->writeMutex);
        if (pImpl->closing || !pImpl->connected) {
            throw errors::McpException(JSONRPCErrorCodes::TransportClosed, "WebSocketTransport: transport closed");
        }
        pImpl->writeQueue.push_back(item);
        if (!pImpl->writing) {
            pImpl->writing = true;
            kick = true;
        }
    }
    LOG_DEBUG("WebSocketTransport send: {}", item->frame);
    if (kick) {
        net::post(pImpl->ioc, [impl = pImpl.get()]() { impl->writeNext(); });
    }
    fut.get();
}

std::optional<DecodeResult> WebSocketTransport::Receive() {
    FUNC_SCOPE();
    std::string frame;
    {
        std::unique_lock<std::mutex> lk(pImpl->inboxMutex);
        pImpl->inboxCv.wait(lk, [this]() {
            return pImpl->closing || !pImpl->inbox.empty() || pImpl->peerClosed;
        });
        if (pImpl->closing || pImpl->inbox.empty()) {
            return std::nullopt;
        }
        frame = std::move(pImpl->inbox.front());
        pImpl->inbox.pop_front();
    }
    return Envelope::Decode(frame);
}

///////////////////////////////////////////// Acceptor /////////////////////////////////////////////

class WebSocketAcceptor::Impl {
public:
    net::io_context ioc;
    tcp::acceptor acceptor{ioc};
};

WebSocketAcceptor::WebSocketAcceptor(const std::string& host, unsigned short port)
    : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    try {
        tcp::endpoint ep(net::ip::make_address(host), port);
        pImpl->acceptor.open(ep.protocol());
        pImpl->acceptor.set_option(net::socket_base::reuse_address(true));
        pImpl->acceptor.bind(ep);
        pImpl->acceptor.listen();
    } catch (const boost::system::system_error& e) {
        throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                   "WebSocketAcceptor: cannot listen on " + host + ":" + std::to_string(port) +
                                   ": " + e.what());
    }
    LOG_INFO("WebSocketAcceptor: listening on {}:{}", host, GetPort());
}

WebSocketAcceptor::~WebSocketAcceptor() {
    Close();
}

unsigned short WebSocketAcceptor::GetPort() const {
    boost::system::error_code ec;
    auto ep = pImpl->acceptor.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

std::unique_ptr<ITransport> WebSocketAcceptor::Accept() {
    FUNC_SCOPE();
    auto impl = std::make_unique<WebSocketTransport::Impl>(WebSocketTransport::Options{});
    impl->serverSide = true;
    try {
        tcp::socket socket = pImpl->acceptor.accept(impl->ioc);
        impl->plain = std::make_unique<WebSocketTransport::Impl::PlainWs>(std::move(socket));
        impl->plain->set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        impl->plain->read_message_max(impl->opts.maxMessageSize);
        impl->plain->accept();
        impl->plain->text(true);
    } catch (const boost::system::system_error& e) {
        throw errors::McpException(JSONRPCErrorCodes::ConnectFailed,
                                   std::string("WebSocketAcceptor: accept failed: ") + e.what());
    }
    LOG_INFO("WebSocketAcceptor: accepted client ({})", impl->sessionId);
    return std::unique_ptr<ITransport>(new WebSocketTransport(std::move(impl)));
}

void WebSocketAcceptor::Close() {
    boost::system::error_code ec;
    if (pImpl->acceptor.is_open()) {
        pImpl->acceptor.close(ec);
        if (ec) {
            LOG_DEBUG("WebSocketAcceptor: close: {}", ec.message());
        }
    }
}

} // namespace mcphub
