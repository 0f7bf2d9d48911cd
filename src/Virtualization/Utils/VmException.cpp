#include "Virtualization/Utils/VmException.hpp"

std::string_view toString(VmErrorKind kind) noexcept {
    switch (kind) {
        case VmErrorKind::Connection:   return "connection";
        case VmErrorKind::NotFound:     return "not_found";
        case VmErrorKind::Lookup:       return "lookup";
        case VmErrorKind::Descriptor:   return "descriptor";
        case VmErrorKind::StateMapping: return "state_mapping";
        case VmErrorKind::Action:       return "action";
        case VmErrorKind::Internal:     return "internal";
    }
    return "internal";
}
