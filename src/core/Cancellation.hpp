#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

namespace image_mcp {

/**
 * @brief Thrown by a handler that observed a cancellation request
 */
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
};

/**
 * @brief Read-only view of a cancellation flag
 *
 * Tokens are cheap to copy; all copies observe the same source.
 * A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const;

    /**
     * @brief Throw OperationCancelled if cancellation was requested
     */
    void throw_if_cancelled() const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag);

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/**
 * @brief Owner side of a cancellation flag
 *
 * cancel() only stores to an atomic, so it may be called from a signal handler.
 */
class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const;
    void cancel() noexcept;
    bool is_cancelled() const;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace image_mcp
