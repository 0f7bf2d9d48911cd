#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <json/json.h>
#include "Virtualization/vmm/DomainAction.hpp"
#include "Virtualization/vmm/RequestScope.hpp"
#include "Virtualization/Utils/VmException.hpp"

struct ApiResponse {
    int status{200};
    Json::Value body;
};

/**
 * @brief Domain endpoints, independent of the HTTP framework
 *
 * Each call opens its own RequestScope, so every connection and domain handle
 * lives exactly as long as one request. Domain errors never escape: they are
 * turned into an {"error": ...} body with 404 for unknown domains and 500 for
 * everything else.
 */
class DomainHandlers {
public:
    // Totals across all requests served by this instance.
    struct Stats {
        std::uint64_t requests{0};
        std::uint64_t handlesRegistered{0};
        std::uint64_t handlesReleased{0};
        std::uint64_t releaseFailures{0};
    };

    explicit DomainHandlers(std::string hypervisorUri);

    DomainHandlers(const DomainHandlers&) = delete;
    DomainHandlers& operator=(const DomainHandlers&) = delete;

    [[nodiscard]] ApiResponse list();
    [[nodiscard]] ApiResponse get(std::string_view name);
    [[nodiscard]] ApiResponse performAction(std::string_view name, DomainAction action);
    // Unknown action names yield 404 without touching the hypervisor.
    [[nodiscard]] ApiResponse performAction(std::string_view name, std::string_view actionName);

    [[nodiscard]] Stats stats() const noexcept;
    [[nodiscard]] const std::string& getHypervisorUri() const noexcept { return hypervisorUri; }

    [[nodiscard]] static int httpStatusFor(VmErrorKind kind) noexcept;

protected:
    using ScopedWork = std::function<ApiResponse(RequestScope&)>;

    // Runs work inside a fresh RequestScope; exceptions become error responses
    // after the scope has drained its handles and closed its connection.
    ApiResponse withRequestScope(std::string_view operation, const ScopedWork& work);

private:
    std::string hypervisorUri;

    std::atomic<std::uint64_t> requests{0};
    std::atomic<std::uint64_t> handlesRegistered{0};
    std::atomic<std::uint64_t> handlesReleased{0};
    std::atomic<std::uint64_t> releaseFailures{0};

    void recordDrain(const ResourceTracker::Stats& stats) noexcept;
    static ApiResponse errorResponse(VmErrorKind kind, const std::string& message);
};
