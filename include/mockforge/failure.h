#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace mockforge {

// Thrown by the default fail handler when a verification does not hold.
class VerificationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

using FailHandler = std::function<void(const std::string &message)>;

// Install the process-wide fail handler and return the previous one.
// Passing an empty handler restores the default, which throws VerificationError.
FailHandler set_fail_handler(FailHandler handler);

// Report a failure through the process-wide handler.
void fail(const std::string &message);

namespace detail {

// Monotonic ordinal shared by every mock in the process; used for in-order verification.
std::uint64_t next_invocation_ordinal();

} // namespace detail

} // namespace mockforge
