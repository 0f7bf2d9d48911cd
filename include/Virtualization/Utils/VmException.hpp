#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

enum class VmErrorKind {
    Connection,
    NotFound,
    Lookup,
    Descriptor,
    StateMapping,
    Action,
    Internal
};

[[nodiscard]] std::string_view toString(VmErrorKind kind) noexcept;

// Value form of a failure, carried inside Result<T, VmError>.
struct VmError {
    VmErrorKind kind{VmErrorKind::Internal};
    std::string message;
};

class VmException : public std::runtime_error {
public:
    VmException(VmErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] VmErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] VmError toError() const { return VmError{kind_, what()}; }

private:
    VmErrorKind kind_;
};

// virConnectOpen failed or the session was rejected.
class ConnectionError : public VmException {
public:
    explicit ConnectionError(const std::string& msg) : VmException(VmErrorKind::Connection, msg) {}
};

// libvirt reported VIR_ERR_NO_DOMAIN for a lookup.
class NotFoundError : public VmException {
public:
    explicit NotFoundError(const std::string& msg) : VmException(VmErrorKind::NotFound, msg) {}
};

class LookupError : public VmException {
public:
    explicit LookupError(const std::string& msg) : VmException(VmErrorKind::Lookup, msg) {}
};

class DescriptorError : public VmException {
public:
    explicit DescriptorError(const std::string& msg) : VmException(VmErrorKind::Descriptor, msg) {}
};

class StateMappingError : public VmException {
public:
    explicit StateMappingError(const std::string& msg) : VmException(VmErrorKind::StateMapping, msg) {}
};

class ActionError : public VmException {
public:
    explicit ActionError(const std::string& msg) : VmException(VmErrorKind::Action, msg) {}
};
