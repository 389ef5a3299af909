#pragma once

#include <atomic>
#include <memory>

namespace glyphnet {

// Copies share one flag; any copy may request cancellation.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void request() const { flag_->store(true, std::memory_order_release); }
    bool requested() const { return flag_->load(std::memory_order_acquire); }
    void reset() const { flag_->store(false, std::memory_order_release); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}
