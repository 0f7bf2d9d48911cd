#include "Virtualization/vm/DomainHandle.hpp"
#include "Utils/Logger.hpp"
#include <stdexcept>
#include <utility>

DomainHandle::DomainHandle(virDomainPtr dom) : domain(dom) {
    if (!domain) throw std::invalid_argument("DomainHandle: null domain");
    const char* domName = virDomainGetName(domain);
    name = domName ? domName : "<unnamed>";
}

DomainHandle::~DomainHandle() {
    release();
}

bool DomainHandle::release() noexcept {
    // cleared before the free so a second call can never reach virDomainFree
    virDomainPtr dom = std::exchange(domain, nullptr);
    if (!dom) return true;
    return virDomainFree(dom) == 0;
}

std::string DomainHandle::describe() const {
    return "domain '" + name + "'";
}

virDomainPtr DomainHandle::getRawHandle() const noexcept { return domain; }
const std::string& DomainHandle::getName() const noexcept { return name; }
bool DomainHandle::isReleased() const noexcept { return domain == nullptr; }
