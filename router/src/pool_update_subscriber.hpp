#pragma once

#include "config.hpp"
#include "types.hpp"
#include <functional>
#include <memory>

// Listens on the pool update pub/sub channel and hands every well-formed
// message to the handler, in arrival order, from one consumer thread.
class PoolUpdateSubscriber {
public:
    using Handler = std::function<void(const PoolUpdateMessage&)>;

    explicit PoolUpdateSubscriber(const Config& config);
    ~PoolUpdateSubscriber();

    void start(Handler handler);
    void stop();

    // Check Redis connection health
    bool check_health();

    PoolUpdateSubscriber(const PoolUpdateSubscriber&) = delete;
    PoolUpdateSubscriber& operator=(const PoolUpdateSubscriber&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
