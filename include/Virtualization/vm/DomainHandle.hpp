#pragma once
#include <string>
#include <libvirt/libvirt.h>
#include "Core/interfaces/IReleasable.hpp"

// Owns one virDomainPtr until release().
class DomainHandle : public IReleasable {
public:
    // Takes ownership of dom, which must not be null.
    explicit DomainHandle(virDomainPtr dom);
    ~DomainHandle() override;

    DomainHandle(const DomainHandle&) = delete;
    DomainHandle& operator=(const DomainHandle&) = delete;

    bool release() noexcept override;
    [[nodiscard]] std::string describe() const override;

    // Null once released.
    [[nodiscard]] virDomainPtr getRawHandle() const noexcept;
    [[nodiscard]] const std::string& getName() const noexcept;
    [[nodiscard]] bool isReleased() const noexcept;

private:
    virDomainPtr domain{nullptr};
    std::string name;
};
