#include "mockforge/failure.h"

#include <atomic>
#include <mutex>
#include <utility>

namespace mockforge {
namespace {

std::mutex &handler_mutex() {
    static std::mutex mu;
    return mu;
}

FailHandler &handler_slot() {
    static FailHandler handler;
    return handler;
}

std::atomic<std::uint64_t> g_invocation_ordinal{0};

} // namespace

FailHandler set_fail_handler(FailHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex());
    FailHandler                 previous = std::move(handler_slot());
    handler_slot()                       = std::move(handler);
    return previous;
}

void fail(const std::string &message) {
    FailHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex());
        handler = handler_slot();
    }
    if (handler) {
        handler(message);
        return;
    }
    throw VerificationError(message);
}

namespace detail {

std::uint64_t next_invocation_ordinal() { return g_invocation_ordinal.fetch_add(1, std::memory_order_relaxed) + 1; }

} // namespace detail

} // namespace mockforge
