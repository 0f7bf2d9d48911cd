#pragma once
#include <array>
#include <string_view>
#include "Virtualization/vm/DomainDescriptor.hpp"

/**
 * @brief Immutable mapping between libvirt run-state codes and DomainState
 *
 * Built once on first use (main() touches it at startup) and read-only
 * afterwards, so concurrent lookups need no locking.
 */
class DomainStateTable {
public:
    struct Entry {
        int code;
        DomainState state;
        std::string_view label;
    };

    static constexpr std::size_t kStateCount = 8;

    [[nodiscard]] static const DomainStateTable& instance();

    // Throws StateMappingError for codes outside the table.
    [[nodiscard]] DomainState fromCode(int code) const;
    [[nodiscard]] std::string_view label(DomainState state) const noexcept;
    [[nodiscard]] const std::array<Entry, kStateCount>& entries() const noexcept { return table; }

    DomainStateTable(const DomainStateTable&) = delete;
    DomainStateTable& operator=(const DomainStateTable&) = delete;

private:
    DomainStateTable();

    const std::array<Entry, kStateCount> table;
};
