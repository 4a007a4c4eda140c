#pragma once
#ifndef CTVERIFY_REQUEST_CONTEXT_H
#define CTVERIFY_REQUEST_CONTEXT_H

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ctverify {

/**
 * @brief Deadline and cancellation signal supplied by the caller of a
 * transport operation.
 *
 * Copies share the same cancellation flag, so a context handed to a worker
 * thread can be cancelled from the thread that created it.
 */
class RequestContext {
public:
    using Clock = std::chrono::steady_clock;

    RequestContext();

    /** Context that expires @p timeout from now. */
    static RequestContext withTimeout(std::chrono::milliseconds timeout);

    /** Context without deadline that is never cancelled unless asked to. */
    static RequestContext background();

    void cancel() const noexcept;
    bool isCancelled() const noexcept;
    bool isExpired() const noexcept;

    /** True if the operation should stop (cancelled or past deadline). */
    bool done() const noexcept { return isCancelled() || isExpired(); }

    const std::optional<Clock::time_point> &deadline() const noexcept {
        return deadline_;
    }

    /**
     * @brief Time left before the deadline, capped at @p fallback.
     *
     * Returns @p fallback when no deadline is set and zero once expired.
     */
    std::chrono::milliseconds remaining(std::chrono::milliseconds fallback) const;

    /**
     * @brief Throw a Transport VerifyError if the context is done.
     * @param operation Name of the operation being attempted.
     */
    void throwIfDone(const std::string &operation) const;

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace ctverify

#endif // CTVERIFY_REQUEST_CONTEXT_H
