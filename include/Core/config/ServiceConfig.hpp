#ifndef SERVICECONFIG_H
#define SERVICECONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>
#include "Utils/Logger.hpp"

struct ServiceConfig {
    // hypervisor
    std::string hypervisorUri{"qemu:///system"};

    // HTTP listener
    std::string listenAddress{"0.0.0.0"};
    std::uint16_t port{8080};
    std::size_t ioThreads{1};

    // threads running blocking libvirt calls, one request at a time each
    std::size_t workerThreads{4};

    BoostLogger::Config logging;

    // Keys missing from the document keep their defaults.
    // Throws std::runtime_error on malformed JSON or mistyped values.
    static ServiceConfig fromJson(const std::string& json);
    static ServiceConfig fromFile(const std::string& path);

    bool validate() const;
};

#endif // SERVICECONFIG_H
