#pragma once

#include <atomic>
#include <memory>

namespace FCBForge {

/**
 * @brief Cooperative cancellation flag shared between a caller and its tasks
 *
 * Copies share the same flag. Work already started is never interrupted;
 * tasks check isCancelled() before they begin.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool isCancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace FCBForge
