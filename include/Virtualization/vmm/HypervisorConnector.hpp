#pragma once

#include <libvirt/libvirt.h>
#include <string>

// One libvirt management session, owned by exactly one request.
class HypervisorConnector {
public:
    explicit HypervisorConnector(std::string uri = "qemu:///system");
    ~HypervisorConnector();

    HypervisorConnector(const HypervisorConnector&) = delete;
    HypervisorConnector& operator=(const HypervisorConnector&) = delete;

    // Opens the session; throws ConnectionError when libvirt refuses it.
    void acquire();
    // Safe to call any number of times.
    void release() noexcept;

    [[nodiscard]] virConnectPtr getRawHandle() const noexcept;
    [[nodiscard]] bool isConnected() const noexcept;
    [[nodiscard]] const std::string& getUri() const noexcept;

private:
    std::string uri;
    virConnectPtr conn{nullptr};
};
