#include "API/serializers/DomainJson.hpp"
#include "Virtualization/vm/DomainStateTable.hpp"

namespace {

void setIfPresent(Json::Value& obj, const char* key, const std::string& value) {
    if (!value.empty()) obj[key] = value;
}

Json::Value diskJson(const Disk& disk) {
    Json::Value out(Json::objectValue);
    out["type"] = disk.type;
    out["device"] = disk.device;

    Json::Value driver(Json::objectValue);
    driver["name"] = disk.driver.name;
    driver["type"] = disk.driver.type;
    out["driver"] = driver;

    Json::Value source(Json::objectValue);
    setIfPresent(source, "file", disk.source.file);
    setIfPresent(source, "device", disk.source.device);
    out["source"] = source;

    Json::Value target(Json::objectValue);
    target["dev"] = disk.target.dev;
    target["bus"] = disk.target.bus;
    out["target"] = target;
    return out;
}

Json::Value interfaceJson(const NetworkInterface& iface) {
    Json::Value out(Json::objectValue);
    out["type"] = iface.type;

    Json::Value source(Json::objectValue);
    setIfPresent(source, "network", iface.source.network);
    setIfPresent(source, "bridge", iface.source.bridge);
    out["source"] = source;

    Json::Value mac(Json::objectValue);
    mac["address"] = iface.macAddress;
    out["mac"] = mac;

    Json::Value model(Json::objectValue);
    setIfPresent(model, "type", iface.modelType);
    out["model"] = model;

    Json::Value filterref(Json::objectValue);
    filterref["filter"] = iface.filterRef.filter;
    Json::Value params(Json::arrayValue);
    for (const auto& param : iface.filterRef.parameters) {
        Json::Value p(Json::objectValue);
        p["name"] = param.name;
        p["value"] = param.value;
        params.append(p);
    }
    filterref["parameters"] = params;
    out["filterref"] = filterref;
    return out;
}

} // namespace

Json::Value toJson(const DomainDescriptor& desc) {
    Json::Value out(Json::objectValue);
    out["type"] = desc.type;
    out["uuid"] = desc.uuid;
    out["name"] = desc.name;
    out["memory"] = Json::UInt64(desc.memory);
    out["vpcu"] = Json::UInt(desc.vcpu);

    Json::Value disks(Json::arrayValue);
    for (const auto& disk : desc.devices.disks) disks.append(diskJson(disk));
    Json::Value interfaces(Json::arrayValue);
    for (const auto& iface : desc.devices.interfaces) interfaces.append(interfaceJson(iface));
    Json::Value devices(Json::objectValue);
    devices["disks"] = disks;
    devices["interfaces"] = interfaces;
    out["devices"] = devices;

    Json::Value osType(Json::objectValue);
    osType["type"] = desc.os.type.type;
    setIfPresent(osType, "arch", desc.os.type.arch);
    setIfPresent(osType, "machine", desc.os.type.machine);
    Json::Value boot(Json::objectValue);
    setIfPresent(boot, "dev", desc.os.bootDev);
    Json::Value os(Json::objectValue);
    os["type"] = osType;
    os["boot"] = boot;
    out["os"] = os;

    out["state"] = std::string(DomainStateTable::instance().label(desc.state));
    return out;
}

Json::Value toJson(const std::vector<DomainDescriptor>& descs) {
    Json::Value out(Json::arrayValue);
    for (const auto& desc : descs) out.append(toJson(desc));
    return out;
}

Json::Value errorBody(const std::string& message) {
    Json::Value out(Json::objectValue);
    out["error"] = message;
    return out;
}
