// VirtGate Unit Tests - run-state code mapping
// Tests: fromCode, label, instance

#include <gtest/gtest.h>
#include <set>
#include "TestSupport.hpp"
#include "Virtualization/vm/DomainStateTable.hpp"
#include "Virtualization/Utils/VmException.hpp"

// ============================================================
// Totality over libvirt codes 0-7
// ============================================================

TEST(DomainStateTableTest, MapsEveryLibvirtCode) {
    const auto& table = DomainStateTable::instance();
    EXPECT_EQ(table.fromCode(VIR_DOMAIN_NOSTATE), DomainState::NoState);
    EXPECT_EQ(table.fromCode(VIR_DOMAIN_RUNNING), DomainState::Running);
    EXPECT_EQ(table.fromCode(VIR_DOMAIN_BLOCKED), DomainState::Blocked);
    EXPECT_EQ(table.fromCode(VIR_DOMAIN_PAUSED), DomainState::Paused);
    EXPECT_EQ(table.fromCode(VIR_DOMAIN_SHUTDOWN), DomainState::Shutdown);
    EXPECT_EQ(table.fromCode(VIR_DOMAIN_SHUTOFF), DomainState::Shutoff);
    EXPECT_EQ(table.fromCode(VIR_DOMAIN_CRASHED), DomainState::Crashed);
    EXPECT_EQ(table.fromCode(VIR_DOMAIN_PMSUSPENDED), DomainState::Suspended);
}

TEST(DomainStateTableTest, CodesZeroThroughSevenAllMap) {
    const auto& table = DomainStateTable::instance();
    std::set<DomainState> seen;
    for (int code = 0; code <= 7; ++code) {
        EXPECT_NO_THROW(seen.insert(table.fromCode(code))) << "code " << code;
    }
    EXPECT_EQ(seen.size(), DomainStateTable::kStateCount);
}

TEST(DomainStateTableTest, Labels) {
    const auto& table = DomainStateTable::instance();
    EXPECT_EQ(table.label(DomainState::NoState), "nostate");
    EXPECT_EQ(table.label(DomainState::Running), "running");
    EXPECT_EQ(table.label(DomainState::Blocked), "blocked");
    EXPECT_EQ(table.label(DomainState::Paused), "paused");
    EXPECT_EQ(table.label(DomainState::Shutdown), "shutdown");
    EXPECT_EQ(table.label(DomainState::Shutoff), "shutoff");
    EXPECT_EQ(table.label(DomainState::Crashed), "crashed");
    EXPECT_EQ(table.label(DomainState::Suspended), "suspended");
}

// ============================================================
// Unknown codes are rejected, never defaulted
// ============================================================

TEST(DomainStateTableTest, RejectsCodesOutsideTable) {
    const auto& table = DomainStateTable::instance();
    for (int code : {-1, 8, 9, 42, 1000}) {
        EXPECT_THROW((void)table.fromCode(code), StateMappingError) << "code " << code;
    }
}

TEST(DomainStateTableTest, RejectionCarriesStateMappingKind) {
    try {
        (void)DomainStateTable::instance().fromCode(8);
        FAIL() << "expected StateMappingError";
    } catch (const VmException& e) {
        EXPECT_EQ(e.kind(), VmErrorKind::StateMapping);
        EXPECT_NE(std::string(e.what()).find("8"), std::string::npos);
    }
}

TEST(DomainStateTableTest, SingleInstance) {
    EXPECT_EQ(&DomainStateTable::instance(), &DomainStateTable::instance());
}
