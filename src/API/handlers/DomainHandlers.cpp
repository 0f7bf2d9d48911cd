#include "API/handlers/DomainHandlers.hpp"
#include "API/serializers/DomainJson.hpp"
#include "Virtualization/builder/DomainDescriptorBuilder.hpp"
#include "Virtualization/vmm/ActionDispatcher.hpp"
#include "Virtualization/vmm/DomainLookup.hpp"
#include "Utils/Logger.hpp"
#include <utility>
#include <vector>

DomainHandlers::DomainHandlers(std::string hypervisorUri)
    : hypervisorUri(std::move(hypervisorUri)) {}

ApiResponse DomainHandlers::withRequestScope(std::string_view operation, const ScopedWork& work) {
    ++requests;
    try {
        RequestScope scope(hypervisorUri, [this](const ResourceTracker::Stats& s) { recordDrain(s); });
        ApiResponse response = work(scope);
        // body is complete; release handles and connection before replying
        scope.finish();
        return response;
    } catch (const VmException& e) {
        if (e.kind() == VmErrorKind::NotFound) {
            BoostLogger::Debug("{}: {}", operation, e.what());
        } else {
            BoostLogger::Error("{} failed [{}]: {}", operation, toString(e.kind()), e.what());
        }
        return errorResponse(e.kind(), e.what());
    } catch (const std::exception& e) {
        BoostLogger::Error("{} failed unexpectedly: {}", operation, e.what());
        return errorResponse(VmErrorKind::Internal, e.what());
    }
}

ApiResponse DomainHandlers::list() {
    return withRequestScope("list domains", [](RequestScope& scope) {
        DomainLookup lookup(scope.connector());
        auto handles = lookup.enumerate();
        for (const auto& handle : handles) scope.tracker().track(handle);

        DomainDescriptorBuilder builder(scope.tracker());
        std::vector<DomainDescriptor> descs;
        descs.reserve(handles.size());
        for (const auto& handle : handles) descs.push_back(builder.build(handle));
        return ApiResponse{200, toJson(descs)};
    });
}

ApiResponse DomainHandlers::get(std::string_view name) {
    return withRequestScope("get domain", [name](RequestScope& scope) {
        DomainLookup lookup(scope.connector());
        auto handle = lookup.resolve(name);
        DomainDescriptorBuilder builder(scope.tracker());
        return ApiResponse{200, toJson(builder.build(handle))};
    });
}

ApiResponse DomainHandlers::performAction(std::string_view name, DomainAction action) {
    return withRequestScope(toString(action), [name, action](RequestScope& scope) {
        DomainLookup lookup(scope.connector());
        auto handle = lookup.resolve(name);
        scope.tracker().track(handle);

        DomainDescriptorBuilder builder(scope.tracker());
        ActionDispatcher dispatcher(builder);
        auto outcome = dispatcher.dispatch(handle, action);
        if (outcome.isErr()) {
            const auto& err = outcome.error();
            return errorResponse(err.kind, err.message);
        }
        return ApiResponse{200, toJson(outcome.value())};
    });
}

ApiResponse DomainHandlers::performAction(std::string_view name, std::string_view actionName) {
    auto action = parseDomainAction(actionName);
    if (!action) {
        return errorResponse(VmErrorKind::NotFound, "unknown action: " + std::string(actionName));
    }
    return performAction(name, *action);
}

DomainHandlers::Stats DomainHandlers::stats() const noexcept {
    return Stats{requests.load(), handlesRegistered.load(), handlesReleased.load(), releaseFailures.load()};
}

int DomainHandlers::httpStatusFor(VmErrorKind kind) noexcept {
    switch (kind) {
        case VmErrorKind::NotFound:
            return 404;
        case VmErrorKind::Connection:
        case VmErrorKind::Lookup:
        case VmErrorKind::Descriptor:
        case VmErrorKind::StateMapping:
        case VmErrorKind::Action:
        case VmErrorKind::Internal:
            return 500;
    }
    return 500;
}

void DomainHandlers::recordDrain(const ResourceTracker::Stats& stats) noexcept {
    handlesRegistered += stats.registered;
    handlesReleased += stats.released;
    releaseFailures += stats.failed;
    if (stats.registered != stats.released) {
        BoostLogger::Error("Handle leak: {} registered, {} released", stats.registered, stats.released);
    }
}

ApiResponse DomainHandlers::errorResponse(VmErrorKind kind, const std::string& message) {
    return ApiResponse{httpStatusFor(kind), errorBody(message)};
}
