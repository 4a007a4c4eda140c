#include "utilities/request_context.h"
#include "utilities/verify_error.h"

namespace ctverify {

RequestContext::RequestContext()
    : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

RequestContext RequestContext::withTimeout(std::chrono::milliseconds timeout) {
    RequestContext ctx;
    ctx.deadline_ = Clock::now() + timeout;
    return ctx;
}

RequestContext RequestContext::background() { return RequestContext(); }

void RequestContext::cancel() const noexcept { cancelled_->store(true); }

bool RequestContext::isCancelled() const noexcept { return cancelled_->load(); }

bool RequestContext::isExpired() const noexcept {
    return deadline_ && Clock::now() >= *deadline_;
}

std::chrono::milliseconds
RequestContext::remaining(std::chrono::milliseconds fallback) const {
    if (!deadline_)
        return fallback;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline_ - Clock::now());
    if (left.count() <= 0)
        return std::chrono::milliseconds(0);
    return left < fallback ? left : fallback;
}

void RequestContext::throwIfDone(const std::string &operation) const {
    if (isCancelled())
        throw VerifyError(ErrorKind::Transport, "", operation, "cancelled");
    if (isExpired())
        throw VerifyError(ErrorKind::Transport, "", operation,
                          "deadline exceeded");
}

} // namespace ctverify
