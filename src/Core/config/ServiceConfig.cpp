#include "Core/config/ServiceConfig.hpp"
#include <json/json.h>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

std::string readString(const Json::Value& obj, const char* key, const std::string& fallback) {
    if (!obj.isMember(key)) return fallback;
    const Json::Value& v = obj[key];
    if (!v.isString()) throw std::runtime_error(std::string("config: '") + key + "' must be a string");
    return v.asString();
}

std::uint64_t readUnsigned(const Json::Value& obj, const char* key, std::uint64_t fallback) {
    if (!obj.isMember(key)) return fallback;
    const Json::Value& v = obj[key];
    if (!v.isUInt64()) throw std::runtime_error(std::string("config: '") + key + "' must be a non-negative integer");
    return v.asUInt64();
}

bool readBool(const Json::Value& obj, const char* key, bool fallback) {
    if (!obj.isMember(key)) return fallback;
    const Json::Value& v = obj[key];
    if (!v.isBool()) throw std::runtime_error(std::string("config: '") + key + "' must be a boolean");
    return v.asBool();
}

} // namespace

ServiceConfig ServiceConfig::fromJson(const std::string& json) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
        throw std::runtime_error("config: invalid JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("config: top level value must be an object");
    }

    ServiceConfig cfg;
    cfg.hypervisorUri = readString(root, "hypervisor_uri", cfg.hypervisorUri);
    cfg.listenAddress = readString(root, "listen_address", cfg.listenAddress);

    auto port = readUnsigned(root, "port", cfg.port);
    if (port > std::numeric_limits<std::uint16_t>::max()) {
        throw std::runtime_error("config: 'port' out of range");
    }
    cfg.port = static_cast<std::uint16_t>(port);
    cfg.ioThreads = static_cast<std::size_t>(readUnsigned(root, "io_threads", cfg.ioThreads));
    cfg.workerThreads = static_cast<std::size_t>(readUnsigned(root, "worker_threads", cfg.workerThreads));

    if (root.isMember("log")) {
        const Json::Value& log = root["log"];
        if (!log.isObject()) throw std::runtime_error("config: 'log' must be an object");
        auto& l = cfg.logging;
        l.name = readString(log, "name", l.name);
        l.file_path = readString(log, "file", l.file_path);
        if (log.isMember("console_level")) {
            l.console_level = BoostLogger::LevelFromString(readString(log, "console_level", "info"));
        }
        if (log.isMember("file_level")) {
            l.file_level = BoostLogger::LevelFromString(readString(log, "file_level", "trace"));
        }
        l.rotation_size = static_cast<std::size_t>(readUnsigned(log, "rotation_size", l.rotation_size));
        l.max_files = static_cast<int>(readUnsigned(log, "max_files", static_cast<std::uint64_t>(l.max_files)));
        l.enable_console = readBool(log, "console", l.enable_console);
        l.enable_file = readBool(log, "file_enabled", l.enable_file);
    }
    return cfg;
}

ServiceConfig ServiceConfig::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("config: cannot open " + path);
    }
    std::ostringstream content;
    content << in.rdbuf();
    return fromJson(content.str());
}

bool ServiceConfig::validate() const {
    if (hypervisorUri.empty()) return false;
    if (listenAddress.empty()) return false;
    if (port == 0) return false;
    if (ioThreads == 0 || workerThreads == 0) return false;
    return true;
}
