#include "Virtualization/Utils/LibvirtError.hpp"
#include "Utils/Logger.hpp"
#include <libvirt/libvirt.h>

namespace {

void logLibvirtError(void* /*userData*/, virErrorPtr error) {
    if (!error) return;
    BoostLogger::Debug("libvirt [{}]: {}", static_cast<int>(error->code),
                       error->message ? error->message : "unknown");
}

} // namespace

LibvirtError LibvirtError::last() {
    virErrorPtr err = virGetLastError();
    if (!err) return LibvirtError{VIR_ERR_INTERNAL_ERROR, "unknown libvirt error"};
    LibvirtError result{err->code, err->message ? err->message : "unknown libvirt error"};
    virResetLastError();
    return result;
}

void installLibvirtErrorLogger() {
    virSetErrorFunc(nullptr, logLibvirtError);
}
