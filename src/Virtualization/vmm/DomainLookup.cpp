#include "Virtualization/vmm/DomainLookup.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <cstdlib>
#include <string>

DomainLookup::DomainLookup(HypervisorConnector& connector)
    : connector(connector) {}

std::shared_ptr<DomainHandle> DomainLookup::resolve(std::string_view name) {
    if (!connector.isConnected()) {
        throw LookupError("Not connected to hypervisor");
    }

    const std::string domainName(name);
    virDomainPtr domain = virDomainLookupByName(connector.getRawHandle(), domainName.c_str());
    if (!domain) {
        auto err = LibvirtError::last();
        if (err.isNoDomain()) {
            BoostLogger::Debug("Domain not found: {}", domainName);
            throw NotFoundError(err.message);
        }
        throw LookupError(err.message);
    }
    return std::make_shared<DomainHandle>(domain);
}

std::vector<std::shared_ptr<DomainHandle>> DomainLookup::enumerate() {
    if (!connector.isConnected()) {
        throw LookupError("Not connected to hypervisor");
    }

    virDomainPtr* domains = nullptr;
    int count = virConnectListAllDomains(connector.getRawHandle(), &domains, 0);
    if (count < 0) {
        throw LookupError("Failed to list domains: " + LibvirtError::last().message);
    }

    // wrap every pointer before anything can throw, so none is leaked
    std::vector<std::shared_ptr<DomainHandle>> handles;
    handles.reserve(static_cast<size_t>(count));
    std::vector<virDomainPtr> raw(domains, domains + count);
    std::free(domains);

    for (virDomainPtr dom : raw) {
        try {
            handles.push_back(std::make_shared<DomainHandle>(dom));
        } catch (...) {
            for (auto it = raw.begin() + static_cast<std::ptrdiff_t>(handles.size()); it != raw.end(); ++it) {
                virDomainFree(*it);
            }
            throw;
        }
    }
    return handles;
}
