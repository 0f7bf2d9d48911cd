#include "Virtualization/vmm/ResourceTracker.hpp"
#include "Utils/Logger.hpp"
#include <algorithm>
#include <stdexcept>

ResourceTracker::~ResourceTracker() {
    drain();
}

bool ResourceTracker::track(std::shared_ptr<IReleasable> handle) {
    if (drained) {
        throw std::logic_error("ResourceTracker: track() called after drain()");
    }
    if (!handle) {
        throw std::invalid_argument("ResourceTracker: null handle");
    }
    if (std::ranges::find(inFlight, handle) != inFlight.end()) {
        return false;
    }
    inFlight.push_back(std::move(handle));
    ++counters.registered;
    return true;
}

ResourceTracker::Stats ResourceTracker::drain() noexcept {
    if (drained) return counters;
    drained = true;

    for (auto& handle : inFlight) {
        ++counters.released;
        if (handle->release()) {
            BoostLogger::Debug("Freeing: {}", handle->describe());
        } else {
            ++counters.failed;
            BoostLogger::Warn("Failed to release {}", handle->describe());
        }
    }
    inFlight.clear();
    return counters;
}

bool ResourceTracker::isDrained() const noexcept { return drained; }
std::size_t ResourceTracker::pending() const noexcept { return inFlight.size(); }
const ResourceTracker::Stats& ResourceTracker::stats() const noexcept { return counters; }
