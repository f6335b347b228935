#include "Apps/VinylGroove/EncodeJob.hpp"

#include <exception>
#include <utility>

namespace VGR::Apps::VinylGroove {
    std::shared_ptr<EncodeJob> EncodeJob::Start(Work work, ProgressCallback onProgress) {
        std::shared_ptr<EncodeJob> job(new EncodeJob());
        std::promise<EncodeOutcome> promise;
        job->_result = promise.get_future().share();
        job->_running.store(true, std::memory_order_release);
        job->_worker = std::thread(&EncodeJob::Run, job.get(), std::move(work), std::move(onProgress), std::move(promise));
        return job;
    }

    EncodeJob::~EncodeJob() {
        Cancel();
        Join();
    }

    void EncodeJob::Run(Work work, ProgressCallback onProgress, std::promise<EncodeOutcome> promise) {
        auto const report = [this, &onProgress](std::size_t sent, std::size_t total) {
            _totalFrames.store(total, std::memory_order_release);
            _framesSent.store(sent, std::memory_order_release);
            if (onProgress) onProgress(sent, total);
        };

        auto               outcome = EncodeOutcome::Cancelled;
        std::exception_ptr error;
        try {
            outcome = work(report, _cancel);
        } catch (...) {
            error = std::current_exception();
        }

        // Cleared before the result is published so a ready result implies !IsRunning().
        _running.store(false, std::memory_order_release);
        if (error) {
            promise.set_exception(error);
        } else {
            promise.set_value(outcome);
        }
    }

    void EncodeJob::Join() {
        if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id()) {
            _worker.join();
        }
    }

    void EncodeJob::Cancel() {
        _cancel.RequestCancel();
    }

    bool EncodeJob::CancelRequested() const {
        return _cancel.IsCancellationRequested();
    }

    bool EncodeJob::IsRunning() const {
        return _running.load(std::memory_order_acquire);
    }

    std::size_t EncodeJob::FramesSent() const {
        return _framesSent.load(std::memory_order_acquire);
    }

    std::size_t EncodeJob::TotalFrames() const {
        return _totalFrames.load(std::memory_order_acquire);
    }

    bool EncodeJob::WaitFor(std::chrono::milliseconds timeout) const {
        return _result.wait_for(timeout) == std::future_status::ready;
    }

    EncodeOutcome EncodeJob::Wait() {
        _result.wait();
        Join();
        return _result.get();
    }
} // namespace VGR::Apps::VinylGroove
