#pragma once
#include <json/json.h>
#include <string>
#include <vector>
#include "Virtualization/vm/DomainDescriptor.hpp"
#include "Virtualization/Utils/VmException.hpp"

// Wire shape of a descriptor. Empty optional attributes are left out, and the
// vcpu count is published under "vpcu", which existing clients depend on.
[[nodiscard]] Json::Value toJson(const DomainDescriptor& desc);
[[nodiscard]] Json::Value toJson(const std::vector<DomainDescriptor>& descs);

// {"error": "<message>"}
[[nodiscard]] Json::Value errorBody(const std::string& message);
