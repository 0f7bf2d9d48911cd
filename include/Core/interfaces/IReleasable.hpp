#pragma once

#include <string>

/**
 * @brief A native resource that must be given back explicitly
 *
 * Implementations make release() idempotent: the first call frees the
 * underlying resource, every later call is a no-op that reports success.
 */
class IReleasable {
public:
    virtual ~IReleasable() = default;

    /**
     * @brief Frees the underlying resource
     * @return false if the owning library reported a failure while freeing
     */
    virtual bool release() noexcept = 0;

    /**
     * @brief Human readable label used in log lines
     */
    [[nodiscard]] virtual std::string describe() const = 0;
};
