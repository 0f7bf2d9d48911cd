#pragma once
#include <memory>
#include "Utils/Result.hpp"
#include "Virtualization/builder/DomainDescriptorBuilder.hpp"
#include "Virtualization/vm/DomainHandle.hpp"
#include "Virtualization/vmm/DomainAction.hpp"
#include "Virtualization/Utils/VmException.hpp"

using ActionOutcome = Result<DomainDescriptor, VmError>;

/**
 * @brief Forwards lifecycle actions to libvirt
 *
 * Transition legality is left to the hypervisor: a rejected action comes back
 * as an Action error carrying libvirt's message unchanged. On success the
 * domain is re-read so the caller sees the post-action state.
 */
class ActionDispatcher {
public:
    explicit ActionDispatcher(DomainDescriptorBuilder& builder);

    [[nodiscard]] ActionOutcome dispatch(const std::shared_ptr<DomainHandle>& handle, DomainAction action);

private:
    DomainDescriptorBuilder& builder;

    // Throws ActionError when libvirt rejects the call.
    static void invoke(virDomainPtr domain, DomainAction action);
};
