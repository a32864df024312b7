#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace flitify {

/// A required payload field is missing. Terminates the session.
class MalformedActionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised by a system agent when the requested path does not exist.
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class UnsupportedPlatformError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * The controller ended the session with a kick.
 * Not a failure: derives from std::exception only, so handlers catching
 * std::runtime_error never see it.
 */
class SessionKicked : public std::exception {
public:
    explicit SessionKicked(std::string reason)
        : reason_(std::move(reason)),
          what_("kicked by controller: " + reason_) {}

    const std::string& reason() const noexcept { return reason_; }
    const char* what() const noexcept override { return what_.c_str(); }

private:
    std::string reason_;
    std::string what_;
};

} // namespace flitify
