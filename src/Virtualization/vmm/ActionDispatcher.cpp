#include "Virtualization/vmm/ActionDispatcher.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Utils/Logger.hpp"
#include <stdexcept>
#include <string>

std::optional<DomainAction> parseDomainAction(std::string_view name) noexcept {
    if (name == "create") return DomainAction::Create;
    if (name == "destroy") return DomainAction::Destroy;
    if (name == "reboot") return DomainAction::Reboot;
    if (name == "resume") return DomainAction::Resume;
    if (name == "suspend") return DomainAction::Suspend;
    if (name == "shutdown") return DomainAction::Shutdown;
    return std::nullopt;
}

std::string_view toString(DomainAction action) noexcept {
    switch (action) {
        case DomainAction::Create:   return "create";
        case DomainAction::Destroy:  return "destroy";
        case DomainAction::Reboot:   return "reboot";
        case DomainAction::Resume:   return "resume";
        case DomainAction::Suspend:  return "suspend";
        case DomainAction::Shutdown: return "shutdown";
    }
    return "unknown";
}

ActionDispatcher::ActionDispatcher(DomainDescriptorBuilder& builder)
    : builder(builder) {}

ActionOutcome ActionDispatcher::dispatch(const std::shared_ptr<DomainHandle>& handle, DomainAction action) {
    if (!handle || !handle->getRawHandle()) {
        return ActionOutcome{VmError{VmErrorKind::Internal, "domain handle is not available"}};
    }

    try {
        invoke(handle->getRawHandle(), action);
        BoostLogger::Info("Action {} on domain {} accepted", toString(action), handle->getName());
        return ActionOutcome{builder.build(handle)};
    } catch (const ActionError& e) {
        BoostLogger::Warn("Action {} on domain {} rejected: {}", toString(action), handle->getName(), e.what());
        return ActionOutcome{e.toError()};
    } catch (const VmException& e) {
        BoostLogger::Error("Action {} on domain {}: rebuilding descriptor failed: {}",
                           toString(action), handle->getName(), e.what());
        return ActionOutcome{e.toError()};
    }
}

void ActionDispatcher::invoke(virDomainPtr domain, DomainAction action) {
    int rc = -1;
    switch (action) {
        case DomainAction::Create:   rc = virDomainCreate(domain); break;
        case DomainAction::Destroy:  rc = virDomainDestroy(domain); break;
        case DomainAction::Reboot:   rc = virDomainReboot(domain, 0); break;
        case DomainAction::Resume:   rc = virDomainResume(domain); break;
        case DomainAction::Suspend:  rc = virDomainSuspend(domain); break;
        case DomainAction::Shutdown: rc = virDomainShutdown(domain); break;
    }
    if (rc < 0) {
        throw ActionError(LibvirtError::last().message);
    }
}
