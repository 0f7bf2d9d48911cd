#include "Core/concurrency/EventDispatcher.hpp"
#include "Utils/Logger.hpp"
#include <atomic>
#include <mutex>
#include <vector>

namespace CONCURRENCY {

struct EventDispatcher::Impl {
    asio::io_context io_ctx;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard;
    std::vector<std::thread> threads;
    size_t thread_count{1};
    std::atomic<bool> running{false};
    // guards accepting against posts racing a shutdown
    std::mutex post_mutex;
    bool accepting{true};

    explicit Impl(size_t threads_count)
        : io_ctx(), thread_count(threads_count)
    {}

    bool post(std::function<void()> f) {
        std::scoped_lock lock(post_mutex);
        if (!accepting) return false;
        asio::post(io_ctx, std::move(f));
        return true;
    }

    void run_threads() {
        {
            std::scoped_lock lock(post_mutex);
            accepting = true;
        }
        if (running.exchange(true)) return;
        io_ctx.restart();
        work_guard = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            asio::make_work_guard(io_ctx));
        for (size_t i = 0; i < thread_count; ++i) {
            threads.emplace_back([this]() {
                // a throwing task unwinds run(); log it and keep the thread serving
                for (;;) {
                    try {
                        io_ctx.run();
                        return;
                    } catch (const std::exception& e) {
                        BoostLogger::Error("EventDispatcher: task failed: {}", e.what());
                    } catch (...) {
                        BoostLogger::Error("EventDispatcher: task failed with a non-standard exception");
                    }
                }
            });
        }
    }

    // Refuses new tasks, lets queued ones finish, then joins.
    void drain_threads() {
        {
            std::scoped_lock lock(post_mutex);
            accepting = false;
        }
        if (!running.exchange(false)) return;
        work_guard.reset();
        for (auto &t : threads) {
            if (t.joinable()) t.join();
        }
        threads.clear();
    }

    void stop_threads() {
        {
            std::scoped_lock lock(post_mutex);
            accepting = false;
        }
        if (!running.exchange(false)) return;
        work_guard.reset();
        io_ctx.stop();
        for (auto &t : threads) {
            if (t.joinable()) t.join();
        }
        threads.clear();
    }
};

EventDispatcher::EventDispatcher(size_t threads)
    : impl_(std::make_unique<Impl>(threads == 0 ? 1 : threads))
{
    impl_->run_threads();
}

EventDispatcher::~EventDispatcher() {
    stop();
}

bool EventDispatcher::dispatch(std::function<void()> f) {
    if (!f) return false;
    return impl_->post(std::move(f));
}

void EventDispatcher::start() {
    impl_->run_threads();
}

void EventDispatcher::stop() {
    impl_->stop_threads();
}

void EventDispatcher::shutdown() {
    impl_->drain_threads();
}

size_t EventDispatcher::threadCount() const noexcept {
    return impl_->thread_count;
}

} // namespace CONCURRENCY
