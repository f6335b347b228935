#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <thread>

#include "Apps/VinylGroove/CancellationToken.hpp"
#include "Apps/VinylGroove/VideoStreamEncoder.hpp"

namespace VGR::Apps::VinylGroove {
    // One background encode. Progress counters and the cancel flag are the only
    // state shared with the caller's thread.
    class EncodeJob {
    public:
        using Work = std::function<EncodeOutcome(ProgressCallback const &, CancellationToken const &)>;

        // onProgress runs on the worker thread after the counters are updated.
        static std::shared_ptr<EncodeJob> Start(Work work, ProgressCallback onProgress = {});

        ~EncodeJob();

        EncodeJob(EncodeJob const &)             = delete;
        EncodeJob & operator=(EncodeJob const &) = delete;

        void Cancel();
        bool CancelRequested() const;
        bool IsRunning() const;

        std::size_t FramesSent() const;
        std::size_t TotalFrames() const;

        // True once the worker has finished, waiting at most timeout.
        bool WaitFor(std::chrono::milliseconds timeout) const;

        // Joins the worker; rethrows whatever the encode threw.
        EncodeOutcome Wait();

    private:
        EncodeJob() = default;
        void Run(Work work, ProgressCallback onProgress, std::promise<EncodeOutcome> promise);
        void Join();

        CancellationToken                 _cancel;
        std::atomic<std::size_t>          _framesSent { 0 };
        std::atomic<std::size_t>          _totalFrames { 0 };
        std::atomic<bool>                 _running { false };
        std::shared_future<EncodeOutcome> _result;
        std::thread                       _worker;
    };
} // namespace VGR::Apps::VinylGroove
