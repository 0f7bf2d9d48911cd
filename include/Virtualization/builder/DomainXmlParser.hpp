#pragma once

#include <pugixml.hpp>
#include <cstdint>
#include <string_view>
#include "Virtualization/vm/DomainDescriptor.hpp"

/**
 * @brief Reads libvirt domain XML into a DomainDescriptor
 *
 * Only the fields the HTTP API exposes are extracted; everything else in the
 * markup is ignored. The state field is left at NoState, run state is not
 * part of the markup.
 *
 * Parsing is a pure function of the input: the same markup always yields an
 * equal descriptor.
 */
class DomainXmlParser {
public:
    DomainXmlParser() = default;

    /**
     * @brief Parses a complete <domain> document
     *
     * @param xml Markup as returned by virDomainGetXMLDesc
     * @return DomainDescriptor with every exposed field populated
     *
     * @throws DescriptorError on malformed markup, a root element other than
     *         <domain>, or non numeric memory/vcpu values
     */
    [[nodiscard]] DomainDescriptor parse(std::string_view xml) const;

private:
    static void readDevices(const pugi::xml_node& devices, DomainDevices& out);
    static Disk readDisk(const pugi::xml_node& disk);
    static NetworkInterface readInterface(const pugi::xml_node& iface);
    static DomainOs readOs(const pugi::xml_node& os);
    static std::uint64_t readUnsigned(const pugi::xml_node& node, const char* field);
};
