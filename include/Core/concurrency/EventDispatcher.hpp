#pragma once
#include <utility>  // boost/asio 1.74 uses std::exchange without including it
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <thread>

namespace CONCURRENCY {
namespace asio = boost::asio;

// Fixed pool of threads draining one io_context.
class EventDispatcher {
public:
    explicit EventDispatcher(size_t threads = std::thread::hardware_concurrency());
    ~EventDispatcher();

    // Post immediate task; false once the pool no longer accepts work
    bool dispatch(std::function<void()> f);

    // Control lifecycle
    void start();
    // Drops queued tasks.
    void stop();
    // Runs every queued task to completion, then joins. New tasks are refused.
    void shutdown();

    [[nodiscard]] size_t threadCount() const noexcept;

    // non-copyable
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace CONCURRENCY
