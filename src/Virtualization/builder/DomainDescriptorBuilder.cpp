#include "Virtualization/builder/DomainDescriptorBuilder.hpp"
#include "Virtualization/vm/DomainStateTable.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <cstdlib>

DomainDescriptorBuilder::DomainDescriptorBuilder(ResourceTracker& tracker)
    : tracker(tracker) {}

DomainDescriptor DomainDescriptorBuilder::build(const std::shared_ptr<DomainHandle>& handle) {
    tracker.track(handle);

    virDomainPtr domain = handle->getRawHandle();
    if (!domain) {
        throw DescriptorError("fetch descriptor markup: handle for " + handle->getName() + " already released");
    }

    DomainDescriptor desc = parser.parse(fetchMarkup(domain));
    desc.state = DomainStateTable::instance().fromCode(fetchRunState(domain));
    BoostLogger::Debug("Descriptor built: {} ({})", desc.name, DomainStateTable::instance().label(desc.state));
    return desc;
}

std::string DomainDescriptorBuilder::fetchMarkup(virDomainPtr domain) {
    char* xml = virDomainGetXMLDesc(domain, 0);
    if (!xml) {
        throw DescriptorError("fetch descriptor markup: " + LibvirtError::last().message);
    }
    std::string markup(xml);
    std::free(xml);
    return markup;
}

int DomainDescriptorBuilder::fetchRunState(virDomainPtr domain) {
    int state = 0;
    int reason = 0;
    if (virDomainGetState(domain, &state, &reason, 0) < 0) {
        throw DescriptorError("fetch run state: " + LibvirtError::last().message);
    }
    return state;
}
