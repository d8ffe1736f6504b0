#include "pool_update_subscriber.hpp"
#include "codec.hpp"
#include "util.hpp"
#include <sw/redis++/redis++.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

class PoolUpdateSubscriber::Impl {
public:
    explicit Impl(const Config& config) : config_(config), running_(false) {
        connection_opts_.host = config_.redis_host;
        connection_opts_.port = config_.redis_port;
        if (!config_.redis_password.empty()) {
            connection_opts_.password = config_.redis_password;
        }
        // consume() wakes up at least once a second so stop() is honoured
        connection_opts_.socket_timeout = std::chrono::milliseconds(1000);

        try {
            redis_ = std::make_unique<sw::redis::Redis>(connection_opts_);
            spdlog::info("Connected to Redis at {}:{}", config_.redis_host, config_.redis_port);
        } catch (const std::exception& e) {
            spdlog::error("Failed to connect to Redis: {}", e.what());
            redis_ = nullptr;
        }
    }

    ~Impl() {
        stop();
    }

    void start(Handler handler) {
        if (consumer_thread_.joinable()) {
            spdlog::warn("Pool update subscriber already running");
            return;
        }

        running_ = true;
        consumer_thread_ = std::thread([this, handler = std::move(handler)]() {
            consume_loop(handler);
        });
    }

    void stop() {
        running_ = false;
        if (consumer_thread_.joinable()) {
            consumer_thread_.join();
        }
    }

    bool check_health() {
        if (!redis_) {
            return false;
        }

        try {
            redis_->ping();
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Redis health check failed: {}", e.what());
            return false;
        }
    }

private:
    void consume_loop(const Handler& handler) {
        spdlog::info("Starting pool update subscriber on {}", config_.pool_update_channel);
        int backoff_ms = 1000;

        while (running_) {
            try {
                sw::redis::Redis redis(connection_opts_);
                auto subscriber = redis.subscriber();

                subscriber.on_message([&handler](std::string channel, std::string payload) {
                    auto message = codec::parse_pool_update_message(payload);
                    if (!message) {
                        spdlog::warn("Dropping malformed message on {} ({} bytes)", channel, payload.size());
                        return;
                    }
                    try {
                        handler(*message);
                    } catch (const std::exception& e) {
                        spdlog::error("Failed to apply pool update for {}: {}", message->chain, e.what());
                    }
                });
                subscriber.subscribe(config_.pool_update_channel);
                backoff_ms = 1000;

                while (running_) {
                    try {
                        subscriber.consume();
                    } catch (const sw::redis::TimeoutError&) {
                        continue;
                    }
                }
            } catch (const std::exception& e) {
                auto delay_ms = static_cast<int>(util::random_jitter(backoff_ms));
                spdlog::error("Error in pool update subscriber: {} (reconnecting in {} ms)", e.what(), delay_ms);
                sleep_while_running(std::chrono::milliseconds(delay_ms));
                backoff_ms = std::min(backoff_ms * 2, 30000);
            }
        }

        spdlog::info("Pool update subscriber stopped");
    }

    void sleep_while_running(std::chrono::milliseconds duration) {
        auto wake_up_time = std::chrono::steady_clock::now() + duration;
        while (running_ && std::chrono::steady_clock::now() < wake_up_time) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    const Config& config_;
    sw::redis::ConnectionOptions connection_opts_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
};

// --- PIMPL forward declarations ---
PoolUpdateSubscriber::PoolUpdateSubscriber(const Config& config) : pImpl_(std::make_unique<Impl>(config)) {}
PoolUpdateSubscriber::~PoolUpdateSubscriber() = default;
void PoolUpdateSubscriber::start(Handler handler) { pImpl_->start(std::move(handler)); }
void PoolUpdateSubscriber::stop() { pImpl_->stop(); }
bool PoolUpdateSubscriber::check_health() { return pImpl_->check_health(); }
