#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/Logger.hpp"
#include <utility>

HypervisorConnector::HypervisorConnector(std::string uri)
    : uri(std::move(uri)) {}

HypervisorConnector::~HypervisorConnector() {
    release();
}

void HypervisorConnector::acquire() {
    if (conn) return;
    conn = virConnectOpen(uri.c_str());
    if (!conn) {
        auto err = LibvirtError::last();
        BoostLogger::Error("libvirt: connect to {} failed: {}", uri, err.message);
        throw ConnectionError("libvirt: connect failed: " + err.message);
    }
    BoostLogger::Debug("libvirt: connected to {}", uri);
}

void HypervisorConnector::release() noexcept {
    virConnectPtr c = std::exchange(conn, nullptr);
    if (!c) return;
    // a positive result only means libvirt still holds references of its own
    if (virConnectClose(c) < 0) {
        BoostLogger::Warn("libvirt: closing connection to {} failed", uri);
    }
}

virConnectPtr HypervisorConnector::getRawHandle() const noexcept {
    return conn;
}

bool HypervisorConnector::isConnected() const noexcept {
    return conn != nullptr;
}

const std::string& HypervisorConnector::getUri() const noexcept {
    return uri;
}
