#include "Virtualization/builder/DomainXmlParser.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <charconv>
#include <limits>
#include <string>

namespace {

std::string attr(const pugi::xml_node& node, const char* name) {
    return node.attribute(name).value();
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

DomainDescriptor DomainXmlParser::parse(std::string_view xml) const {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        throw DescriptorError(std::string("parse descriptor markup: ") + result.description());
    }

    pugi::xml_node root = doc.child("domain");
    if (!root) {
        throw DescriptorError("parse descriptor markup: missing <domain> element");
    }

    DomainDescriptor desc;
    desc.type = attr(root, "type");
    desc.uuid = std::string(trim(root.child_value("uuid")));
    desc.name = std::string(trim(root.child_value("name")));
    desc.memory = readUnsigned(root.child("memory"), "memory");
    const std::uint64_t vcpu = readUnsigned(root.child("vcpu"), "vcpu");
    if (vcpu > std::numeric_limits<unsigned int>::max()) {
        throw DescriptorError("parse descriptor markup: invalid <vcpu> value '" + std::to_string(vcpu) + "'");
    }
    desc.vcpu = static_cast<unsigned int>(vcpu);
    readDevices(root.child("devices"), desc.devices);
    desc.os = readOs(root.child("os"));
    return desc;
}

void DomainXmlParser::readDevices(const pugi::xml_node& devices, DomainDevices& out) {
    if (!devices) return;
    for (pugi::xml_node disk : devices.children("disk")) {
        out.disks.push_back(readDisk(disk));
    }
    for (pugi::xml_node iface : devices.children("interface")) {
        out.interfaces.push_back(readInterface(iface));
    }
}

Disk DomainXmlParser::readDisk(const pugi::xml_node& disk) {
    Disk d;
    d.type = attr(disk, "type");
    d.device = attr(disk, "device");

    auto driver = disk.child("driver");
    d.driver.name = attr(driver, "name");
    d.driver.type = attr(driver, "type");

    auto source = disk.child("source");
    d.source.file = attr(source, "file");
    d.source.device = attr(source, "dev");

    auto target = disk.child("target");
    d.target.dev = attr(target, "dev");
    d.target.bus = attr(target, "bus");
    return d;
}

NetworkInterface DomainXmlParser::readInterface(const pugi::xml_node& iface) {
    NetworkInterface n;
    n.type = attr(iface, "type");

    auto source = iface.child("source");
    n.source.network = attr(source, "network");
    n.source.bridge = attr(source, "bridge");

    n.macAddress = attr(iface.child("mac"), "address");
    n.modelType = attr(iface.child("model"), "type");

    auto filterref = iface.child("filterref");
    n.filterRef.filter = attr(filterref, "filter");
    for (pugi::xml_node param : filterref.children("parameter")) {
        n.filterRef.parameters.push_back({attr(param, "name"), attr(param, "value")});
    }
    return n;
}

DomainOs DomainXmlParser::readOs(const pugi::xml_node& os) {
    DomainOs out;
    if (!os) return out;
    auto type = os.child("type");
    out.type.type = std::string(trim(type.child_value()));
    out.type.arch = attr(type, "arch");
    out.type.machine = attr(type, "machine");
    // repeated <boot> elements overwrite each other, so the last dev wins
    for (pugi::xml_node boot : os.children("boot")) {
        if (auto dev = boot.attribute("dev")) out.bootDev = dev.value();
    }
    return out;
}

std::uint64_t DomainXmlParser::readUnsigned(const pugi::xml_node& node, const char* field) {
    if (!node) return 0;
    std::string_view text = trim(node.child_value());
    if (text.empty()) return 0;

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw DescriptorError(std::string("parse descriptor markup: invalid <") + field + "> value '" +
                              std::string(text) + "'");
    }
    return value;
}
