#include "Virtualization/vmm/RequestScope.hpp"
#include <utility>

RequestScope::RequestScope(std::string uri, DrainObserver observer)
    : connection(std::move(uri)), onDrained(std::move(observer)) {
    connection.acquire();
}

RequestScope::~RequestScope() {
    finish();
}

void RequestScope::finish() noexcept {
    if (finished) return;
    finished = true;
    auto stats = resources.drain();
    connection.release();
    if (onDrained) onDrained(stats);
}
