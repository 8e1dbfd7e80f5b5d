#pragma once

/**
 * @file status.hpp
 * @brief Task outcome type
 */

#include <ostream>
#include <string>
#include <utility>

namespace handoff {

/**
 * @brief Outcome of a single task execution
 *
 * Either success or a failure carrying a descriptive message.
 * A default-constructed Status is a success.
 */
class Status {
public:
    Status() = default;

    static Status ok() {
        return Status{};
    }

    static Status failure(std::string message) {
        Status status;
        status.ok_ = false;
        status.message_ = std::move(message);
        return status;
    }

    [[nodiscard]] bool is_ok() const noexcept { return ok_; }
    [[nodiscard]] bool failed() const noexcept { return !ok_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    explicit operator bool() const noexcept { return ok_; }

    friend bool operator==(const Status& lhs, const Status& rhs) {
        return lhs.ok_ == rhs.ok_ && lhs.message_ == rhs.message_;
    }

    friend bool operator!=(const Status& lhs, const Status& rhs) {
        return !(lhs == rhs);
    }

    friend std::ostream& operator<<(std::ostream& os, const Status& status) {
        if (status.ok_) {
            return os << "OK";
        }
        return os << "FAILED: " << status.message_;
    }

private:
    bool ok_{true};
    std::string message_;
};

} // namespace handoff
