#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace graphroute {

/**
 * @brief Error categories for the routing layer
 */
enum class ErrorCategory {
    NONE,
    DISCOVERY_ERROR,
    NO_AVAILABLE_ROLE,
    RESULT_MISMATCH
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Base of every error raised by the routing layer itself
 *
 * Errors thrown by the underlying session/client are not wrapped in this.
 */
class RoutingError : public std::runtime_error {
public:
    RoutingError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Topology discovery failed (transport error or malformed response)
 */
class RoutingDiscoveryError : public RoutingError {
public:
    explicit RoutingDiscoveryError(const std::string& message)
        : RoutingError(ErrorCategory::DISCOVERY_ERROR, message) {}
};

/**
 * @brief The last discovery returned no server for the requested role
 */
class NoAvailableRoleError : public RoutingError {
public:
    NoAvailableRoleError(std::string role, const std::string& message)
        : RoutingError(ErrorCategory::NO_AVAILABLE_ROLE, message), role_(std::move(role)) {}

    [[nodiscard]] const std::string& role() const noexcept { return role_; }

private:
    std::string role_;
};

} // namespace graphroute
