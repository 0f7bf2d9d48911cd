#pragma once
#include <string>
#include <libvirt/virterror.h>

// Snapshot of the calling thread's last libvirt error.
struct LibvirtError {
    int code{VIR_ERR_OK};
    std::string message;

    // Reads and resets virGetLastError(); "unknown" when nothing was reported.
    [[nodiscard]] static LibvirtError last();

    [[nodiscard]] bool isNoDomain() const noexcept { return code == VIR_ERR_NO_DOMAIN; }
};

// Routes libvirt's global error callback into BoostLogger instead of stderr.
void installLibvirtErrorLogger();
