#include "Virtualization/vm/DomainStateTable.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <libvirt/libvirt.h>
#include <string>

DomainStateTable::DomainStateTable()
    : table{{
          {VIR_DOMAIN_NOSTATE,     DomainState::NoState,   "nostate"},
          {VIR_DOMAIN_RUNNING,     DomainState::Running,   "running"},
          {VIR_DOMAIN_BLOCKED,     DomainState::Blocked,   "blocked"},
          {VIR_DOMAIN_PAUSED,      DomainState::Paused,    "paused"},
          {VIR_DOMAIN_SHUTDOWN,    DomainState::Shutdown,  "shutdown"},
          {VIR_DOMAIN_SHUTOFF,     DomainState::Shutoff,   "shutoff"},
          {VIR_DOMAIN_CRASHED,     DomainState::Crashed,   "crashed"},
          {VIR_DOMAIN_PMSUSPENDED, DomainState::Suspended, "suspended"},
      }} {}

const DomainStateTable& DomainStateTable::instance() {
    static const DomainStateTable states;
    return states;
}

DomainState DomainStateTable::fromCode(int code) const {
    for (const auto& entry : table) {
        if (entry.code == code) return entry.state;
    }
    throw StateMappingError("unmapped domain state code: " + std::to_string(code));
}

std::string_view DomainStateTable::label(DomainState state) const noexcept {
    for (const auto& entry : table) {
        if (entry.state == state) return entry.label;
    }
    return "nostate";
}
