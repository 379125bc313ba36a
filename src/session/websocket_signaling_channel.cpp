#include <carlink/session/websocket_signaling_channel.hpp>
#include <carlink/core/logger.hpp>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <atomic>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

namespace carlink::session {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using core::Logger;

std::chrono::milliseconds RelayRetryPolicy::delayFor(int attempt) const {
    auto delay = base_delay;
    for (int i = 1; i < attempt && delay < cap_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, cap_delay);
}

class WebSocketSignalingChannel::Impl {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    Impl(std::string host, std::string port, std::string path, RelayRetryPolicy retry)
        : host_(std::move(host))
        , port_(std::move(port))
        , path_(std::move(path))
        , retry_(retry)
        , strand_(asio::make_strand(ioc_))
        , resolver_(strand_)
        , retry_timer_(strand_) {}

    ~Impl() {
        close();
    }

    core::Result<void> connect() {
        if (started_.exchange(true)) {
            return {};
        }
        closing_ = false;

        first_result_.emplace();
        auto first = first_result_->get_future();

        work_.emplace(asio::make_work_guard(ioc_));
        io_thread_ = std::thread([this]() {
            ioc_.run();
        });
        asio::post(strand_, [this]() {
            startConnect();
        });

        auto ec = first.get();
        if (ec) {
            stopIo();
            ioc_.restart();
            started_ = false;
            return {core::ErrorCode::ConnectionFailed,
                Logger::format("Failed to connect to {}: {}", url(), ec.message())};
        }
        return {};
    }

    void emit(const relay::WireMessage& message) {
        if (!connected_) {
            Logger::warn("Signaling channel: emit {} while disconnected", message.event);
            return;
        }

        asio::post(strand_, [this, text = message.toJson()]() {
            auto link = link_;
            if (!connected_ || !link) {
                Logger::debug("Signaling channel: dropping frame, connection lost");
                return;
            }
            bool writing = !link->write_queue.empty();
            link->write_queue.push_back(text);
            if (!writing) doWrite(link, generation_);
        });
    }

    void setEventHandler(EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void setLinkHandler(LinkHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        link_handler_ = std::move(handler);
    }

    bool isConnected() const {
        return connected_;
    }

    void close() {
        if (closing_.exchange(true) || !started_) {
            joinIo();
            return;
        }

        asio::post(strand_, [this]() {
            retry_timer_.cancel();
            resolver_.cancel();

            if (auto link = link_) {
                if (connected_.exchange(false)) {
                    link->ws.async_close(websocket::close_code::normal,
                        asio::bind_executor(strand_, [link](beast::error_code ec) {
                            if (ec) {
                                Logger::debug("Signaling channel close: {}", ec.message());
                            }
                        }));
                } else {
                    beast::get_lowest_layer(link->ws).cancel();
                }
            }
            work_.reset();
        });
        joinIo();
        Logger::info("Signaling channel to {} closed", url());
    }

private:
    // Satu koneksi WebSocket; koneksi baru dibuat untuk setiap percobaan.
    // Handler async memegang shared_ptr sehingga koneksi lama hidup sampai
    // operasinya selesai.
    struct Link {
        explicit Link(const Strand& strand) : ws(strand) {}

        websocket::stream<beast::tcp_stream> ws;
        beast::flat_buffer buffer;
        std::deque<std::string> write_queue;
    };

    std::string url() const {
        return "ws://" + host_ + ":" + port_ + path_;
    }

    void startConnect() {
        if (closing_) return;

        auto link = std::make_shared<Link>(strand_);
        link_ = link;
        auto generation = ++generation_;

        resolver_.async_resolve(host_, port_, asio::bind_executor(strand_,
            [this, link, generation](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) return onConnectFailed(ec);

                beast::get_lowest_layer(link->ws).expires_after(std::chrono::seconds(10));
                beast::get_lowest_layer(link->ws).async_connect(results, asio::bind_executor(strand_,
                    [this, link, generation](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                        if (ec) return onConnectFailed(ec);

                        beast::get_lowest_layer(link->ws).expires_never();
                        link->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
                        link->ws.async_handshake(host_ + ":" + port_, path_, asio::bind_executor(strand_,
                            [this, link, generation](beast::error_code ec) {
                                if (ec) return onConnectFailed(ec);
                                onConnected(link, generation);
                            }));
                    }));
            }));
    }

    void onConnected(const std::shared_ptr<Link>& link, uint64_t generation) {
        if (closing_ || generation != generation_) {
            beast::get_lowest_layer(link->ws).cancel();
            return;
        }

        connected_ = true;
        if (attempt_ > 0) {
            Logger::info("Signaling channel reconnected to {} after {} attempt(s)", url(), attempt_);
        } else {
            Logger::info("Signaling channel connected to {}", url());
        }
        attempt_ = 0;

        doRead(link, generation);

        if (first_result_) {
            auto first = std::move(*first_result_);
            first_result_.reset();
            first.set_value(beast::error_code());
        }
        notifyLink(true);
    }

    void onConnectFailed(beast::error_code ec) {
        if (first_result_) {
            auto first = std::move(*first_result_);
            first_result_.reset();
            first.set_value(ec ? ec : beast::error_code(asio::error::not_connected));
            return;
        }
        if (closing_) return;

        Logger::warn("Signaling channel: connecting to {} failed: {}", url(), ec.message());
        scheduleReconnect();
    }

    void scheduleReconnect() {
        ++attempt_;
        auto delay = retry_.delayFor(attempt_);
        Logger::info("Signaling channel: reconnecting to {} in {} ms (attempt {})", url(), delay.count(), attempt_);

        retry_timer_.expires_after(delay);
        retry_timer_.async_wait(asio::bind_executor(strand_, [this](beast::error_code ec) {
            if (ec || closing_) return;
            startConnect();
        }));
    }

    void doRead(const std::shared_ptr<Link>& link, uint64_t generation) {
        link->ws.async_read(link->buffer, asio::bind_executor(strand_,
            [this, link, generation](beast::error_code ec, std::size_t) {
                if (ec) return onLinkError(ec, generation);
                if (generation != generation_) return;

                std::string text = beast::buffers_to_string(link->buffer.data());
                link->buffer.consume(link->buffer.size());
                dispatch(text);

                doRead(link, generation);
            }));
    }

    void doWrite(const std::shared_ptr<Link>& link, uint64_t generation) {
        link->ws.text(true);
        link->ws.async_write(asio::buffer(link->write_queue.front()), asio::bind_executor(strand_,
            [this, link, generation](beast::error_code ec, std::size_t) {
                if (ec) return onLinkError(ec, generation);

                link->write_queue.pop_front();
                if (!link->write_queue.empty()) doWrite(link, generation);
            }));
    }

    // Read/write gagal: relay hilang atau close() sedang berjalan
    void onLinkError(beast::error_code ec, uint64_t generation) {
        if (generation != generation_) return;
        if (!connected_.exchange(false)) return;

        if (closing_) {
            Logger::debug("Signaling channel: {} during close", ec.message());
            return;
        }

        Logger::warn("Signaling channel: connection to {} lost: {}", url(), ec.message());
        notifyLink(false);
        scheduleReconnect();
    }

    void dispatch(const std::string& text) {
        auto message = relay::WireMessage::fromJson(text);
        if (message.is_error()) {
            Logger::warn("Signaling channel: dropping malformed frame: {}", message.error().what());
            return;
        }

        EventHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(message.value());
        }
    }

    void notifyLink(bool connected) {
        LinkHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = link_handler_;
        }
        if (handler) {
            handler(connected);
        }
    }

    void stopIo() {
        asio::post(strand_, [this]() {
            work_.reset();
        });
        joinIo();
    }

    void joinIo() {
        if (io_thread_.joinable() && io_thread_.get_id() != std::this_thread::get_id()) {
            io_thread_.join();
        }
    }

    std::string host_;
    std::string port_;
    std::string path_;
    RelayRetryPolicy retry_;

    asio::io_context ioc_;
    Strand strand_;
    tcp::resolver resolver_;
    asio::steady_timer retry_timer_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    // Hanya diakses dari strand
    std::shared_ptr<Link> link_;
    uint64_t generation_ = 0;
    int attempt_ = 0;
    std::optional<std::promise<beast::error_code>> first_result_;

    std::atomic<bool> started_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};

    std::mutex mutex_;
    EventHandler handler_;
    LinkHandler link_handler_;
};

WebSocketSignalingChannel::WebSocketSignalingChannel(std::string host, std::string port, std::string path,
                                                     RelayRetryPolicy retry)
    : impl_(std::make_unique<Impl>(std::move(host), std::move(port), std::move(path), retry)) {}

WebSocketSignalingChannel::~WebSocketSignalingChannel() = default;

core::Result<void> WebSocketSignalingChannel::connect() {
    return impl_->connect();
}

void WebSocketSignalingChannel::emit(const relay::WireMessage& message) {
    impl_->emit(message);
}

void WebSocketSignalingChannel::setEventHandler(EventHandler handler) {
    impl_->setEventHandler(std::move(handler));
}

void WebSocketSignalingChannel::setLinkHandler(LinkHandler handler) {
    impl_->setLinkHandler(std::move(handler));
}

bool WebSocketSignalingChannel::isConnected() const {
    return impl_->isConnected();
}

void WebSocketSignalingChannel::close() {
    impl_->close();
}

} // namespace carlink::session
