#pragma once

#include <atomic>

namespace VGR::Apps::VinylGroove {
    class CancellationToken {
    public:
        void RequestCancel() { _cancelled.store(true, std::memory_order_release); }
        void Reset() { _cancelled.store(false, std::memory_order_release); }
        bool IsCancellationRequested() const { return _cancelled.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> _cancelled { false };
    };
} // namespace VGR::Apps::VinylGroove
