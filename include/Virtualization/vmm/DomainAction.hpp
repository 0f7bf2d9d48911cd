#pragma once
#include <optional>
#include <string_view>

// Lifecycle transitions exposed over HTTP; each maps to one libvirt call.
enum class DomainAction {
    Create,
    Destroy,
    Reboot,
    Resume,
    Suspend,
    Shutdown
};

[[nodiscard]] std::optional<DomainAction> parseDomainAction(std::string_view name) noexcept;
[[nodiscard]] std::string_view toString(DomainAction action) noexcept;
