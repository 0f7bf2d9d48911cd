#pragma once
#include <memory>
#include <string_view>
#include <vector>
#include "Virtualization/vm/DomainHandle.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

class DomainLookup {
public:
    explicit DomainLookup(HypervisorConnector& connector);

    // Throws NotFoundError when libvirt reports VIR_ERR_NO_DOMAIN, LookupError otherwise.
    [[nodiscard]] std::shared_ptr<DomainHandle> resolve(std::string_view name);

    // Active and inactive domains, in the order libvirt returns them.
    [[nodiscard]] std::vector<std::shared_ptr<DomainHandle>> enumerate();

private:
    HypervisorConnector& connector;
};
