#include "Cancellation.hpp"

namespace image_mcp {

CancellationToken::CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
    : flag_(std::move(flag)) {}

bool CancellationToken::is_cancelled() const {
    return flag_ && flag_->load(std::memory_order_acquire);
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw OperationCancelled();
    }
}

CancellationSource::CancellationSource()
    : flag_(std::make_shared<std::atomic<bool>>(false)) {}

CancellationToken CancellationSource::token() const {
    return CancellationToken(flag_);
}

void CancellationSource::cancel() noexcept {
    flag_->store(true, std::memory_order_release);
}

bool CancellationSource::is_cancelled() const {
    return flag_->load(std::memory_order_acquire);
}

} // namespace image_mcp
