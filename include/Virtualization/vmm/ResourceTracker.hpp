#pragma once
#include <cstddef>
#include <memory>
#include <vector>
#include "Core/interfaces/IReleasable.hpp"

/**
 * @brief Per-request registry of native handles awaiting release
 *
 * Handles are released exactly once, in registration order, when drain()
 * runs. One tracker belongs to one request and is not shared across threads.
 */
class ResourceTracker {
public:
    struct Stats {
        std::size_t registered{0};
        std::size_t released{0}; ///< handles drained, failed ones included
        std::size_t failed{0};   ///< releases the library reported as failed
    };

    ResourceTracker() = default;
    ~ResourceTracker();

    ResourceTracker(const ResourceTracker&) = delete;
    ResourceTracker& operator=(const ResourceTracker&) = delete;

    /**
     * @brief Adds a handle to the in-flight list
     *
     * @return false when the same handle is already tracked
     * @throws std::logic_error if the tracker has already drained
     */
    bool track(std::shared_ptr<IReleasable> handle);

    /**
     * @brief Releases every tracked handle once
     *
     * A failed release is logged and counted; the remaining handles are still
     * released. Calling drain() again returns the first drain's statistics.
     */
    Stats drain() noexcept;

    [[nodiscard]] bool isDrained() const noexcept;
    [[nodiscard]] std::size_t pending() const noexcept;
    [[nodiscard]] const Stats& stats() const noexcept;

private:
    std::vector<std::shared_ptr<IReleasable>> inFlight;
    Stats counters;
    bool drained{false};
};
