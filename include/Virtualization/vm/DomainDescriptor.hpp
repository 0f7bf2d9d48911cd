#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class DomainState {
    NoState,
    Running,
    Blocked,
    Paused,
    Shutdown,
    Shutoff,
    Crashed,
    Suspended
};

struct DiskDriver {
    std::string name;
    std::string type;
    bool operator==(const DiskDriver&) const = default;
};

struct DiskSource {
    std::string file;   // set for file backed disks
    std::string device; // set for block devices
    bool operator==(const DiskSource&) const = default;
};

struct DiskTarget {
    std::string dev;
    std::string bus;
    bool operator==(const DiskTarget&) const = default;
};

struct Disk {
    std::string type;
    std::string device;
    DiskDriver driver;
    DiskSource source;
    DiskTarget target;
    bool operator==(const Disk&) const = default;
};

struct InterfaceSource {
    std::string network;
    std::string bridge;
    bool operator==(const InterfaceSource&) const = default;
};

struct FilterRefParameter {
    std::string name;
    std::string value;
    bool operator==(const FilterRefParameter&) const = default;
};

struct FilterRef {
    std::string filter;
    std::vector<FilterRefParameter> parameters;
    bool operator==(const FilterRef&) const = default;
};

struct NetworkInterface {
    std::string type;
    InterfaceSource source;
    std::string macAddress;
    std::string modelType;
    FilterRef filterRef;
    bool operator==(const NetworkInterface&) const = default;
};

struct DomainDevices {
    std::vector<Disk> disks;
    std::vector<NetworkInterface> interfaces;
    bool operator==(const DomainDevices&) const = default;
};

struct OsType {
    std::string type;
    std::string arch;
    std::string machine;
    bool operator==(const OsType&) const = default;
};

struct DomainOs {
    OsType type;
    std::string bootDev;
    bool operator==(const DomainOs&) const = default;
};

/**
 * @brief Point-in-time snapshot of one domain
 *
 * Built fresh for every request from the hypervisor's descriptor markup and
 * run state. It is never updated after construction; a later change on the
 * hypervisor side simply makes it stale.
 */
struct DomainDescriptor {
    std::string type;
    std::string uuid;
    std::string name;
    std::uint64_t memory{0};
    unsigned int vcpu{0};
    DomainDevices devices;
    DomainOs os;
    DomainState state{DomainState::NoState};

    bool operator==(const DomainDescriptor&) const = default;
};
