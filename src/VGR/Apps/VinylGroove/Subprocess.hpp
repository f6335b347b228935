#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <sys/types.h>

namespace VGR::Apps::VinylGroove {
    // A child process started with fork/execvp in a process group of its own.
    // A child that is still running when the object dies is terminated and reaped.
    class Subprocess {
    public:
        struct Options {
            bool PipeStdin     = false;
            bool CaptureStderr = false;
        };

        // @throw std::system_error when the pipes cannot be created or the program cannot be executed.
        Subprocess(std::vector<std::string> args, Options options);
        ~Subprocess();

        Subprocess(Subprocess const &)             = delete;
        Subprocess & operator=(Subprocess const &) = delete;

        pid_t Pid() const;
        bool  Running() const;

        // Writes everything or returns false when the child closed its end (EPIPE).
        // @throw std::system_error for other write failures.
        bool Write(std::span<std::uint8_t const> bytes);
        void CloseInput();

        // Drains the captured stderr until the child closes it.
        std::string ReadStderr();

        // Exit status, or 128 + signal number when the child was killed.
        int Wait();

        // SIGTERM, then SIGKILL once the grace period runs out; always reaps.
        void Terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000)) noexcept;

    private:
        static int DecodeStatus(int status);
        void       CloseFd(int & fd) noexcept;

        std::vector<std::string> _args;
        pid_t                    _pid      = -1;
        int                      _stdinFd  = -1;
        int                      _stderrFd = -1;
        bool                     _reaped   = false;
        int                      _exitCode = -1;
    };
} // namespace VGR::Apps::VinylGroove
