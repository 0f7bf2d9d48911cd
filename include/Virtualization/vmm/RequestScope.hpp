#pragma once
#include <functional>
#include <string>
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/vmm/ResourceTracker.hpp"

/**
 * @brief Everything a single request owns on the hypervisor side
 *
 * The constructor opens the connection. finish(), which the destructor also
 * runs, drains the tracker before closing the connection so that every
 * domain handle is freed while its session is still open.
 */
class RequestScope {
public:
    using DrainObserver = std::function<void(const ResourceTracker::Stats&)>;

    /**
     * @throws ConnectionError when the hypervisor cannot be reached
     */
    explicit RequestScope(std::string uri, DrainObserver observer = nullptr);
    ~RequestScope();

    RequestScope(const RequestScope&) = delete;
    RequestScope& operator=(const RequestScope&) = delete;

    void finish() noexcept;

    [[nodiscard]] HypervisorConnector& connector() noexcept { return connection; }
    [[nodiscard]] ResourceTracker& tracker() noexcept { return resources; }

private:
    HypervisorConnector connection;
    ResourceTracker resources;
    DrainObserver onDrained;
    bool finished{false};
};
