#pragma once

#include <memory>
#include <string>
#include "Virtualization/builder/DomainXmlParser.hpp"
#include "Virtualization/vm/DomainHandle.hpp"
#include "Virtualization/vm/DomainDescriptor.hpp"
#include "Virtualization/vmm/ResourceTracker.hpp"

/**
 * @brief Turns a live domain handle into a DomainDescriptor snapshot
 *
 * Every handle passed to build() is registered with the request's
 * ResourceTracker first, so it is released at request end whether or not the
 * build succeeds. Hypervisor calls are issued once; nothing is retried.
 */
class DomainDescriptorBuilder {
public:
    explicit DomainDescriptorBuilder(ResourceTracker& tracker);

    /**
     * @brief Fetches markup and run state and assembles the snapshot
     *
     * @throws DescriptorError if the markup or run state cannot be fetched,
     *         or the markup does not parse
     * @throws StateMappingError if the run state code is not a known state
     */
    [[nodiscard]] DomainDescriptor build(const std::shared_ptr<DomainHandle>& handle);

private:
    ResourceTracker& tracker;
    DomainXmlParser parser;

    [[nodiscard]] static std::string fetchMarkup(virDomainPtr domain);
    [[nodiscard]] static int fetchRunState(virDomainPtr domain);
};
