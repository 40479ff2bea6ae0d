#pragma once

#include <atomic>
#include <memory>

namespace clipstash {

/**
 * Cooperative cancellation flag shared between a caller and the
 * operations it started. A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    static CancellationToken create() {
        CancellationToken token;
        token.flag_ = std::make_shared<std::atomic<bool>>(false);
        return token;
    }

    void cancel() const {
        if (flag_) flag_->store(true);
    }

    bool is_cancelled() const {
        return flag_ && flag_->load();
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace clipstash
