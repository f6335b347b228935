#include "Apps/VinylGroove/Subprocess.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace VGR::Apps::VinylGroove {
    namespace {
        constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

        std::system_error LastError(char const * what) {
            return std::system_error(errno, std::generic_category(), what);
        }

        void IgnoreSigpipe() {
            static std::once_flag flag;
            std::call_once(flag, [] {
                std::signal(SIGPIPE, SIG_IGN);
            });
        }

        void MakePipe(std::array<int, 2> & fds) {
            if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
                throw LastError("pipe2");
            }
        }

        void CloseBoth(std::array<int, 2> & fds) {
            for (auto & fd : fds) {
                if (fd >= 0) {
                    ::close(fd);
                    fd = -1;
                }
            }
        }
    }

    Subprocess::Subprocess(std::vector<std::string> args, Options options):
        _args(std::move(args)) {
        if (_args.empty()) {
            throw std::system_error(std::make_error_code(std::errc::invalid_argument), "empty command line");
        }
        if (options.PipeStdin) {
            IgnoreSigpipe();
        }

        std::vector<char *> argv;
        argv.reserve(_args.size() + 1);
        for (auto & arg : _args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        std::array<int, 2> stdinPipe { -1, -1 };
        std::array<int, 2> stderrPipe { -1, -1 };
        std::array<int, 2> execPipe { -1, -1 };
        int devNull = -1;
        try {
            if (options.PipeStdin) MakePipe(stdinPipe);
            if (options.CaptureStderr) MakePipe(stderrPipe);
            MakePipe(execPipe);
            devNull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
            if (devNull < 0) {
                throw LastError("open /dev/null");
            }
        } catch (...) {
            CloseBoth(stdinPipe);
            CloseBoth(stderrPipe);
            CloseBoth(execPipe);
            throw;
        }

        _pid = ::fork();
        if (_pid < 0) {
            auto error = LastError("fork");
            CloseBoth(stdinPipe);
            CloseBoth(stderrPipe);
            CloseBoth(execPipe);
            ::close(devNull);
            throw error;
        }

        if (_pid == 0) {
            ::dup2(options.PipeStdin ? stdinPipe[0] : devNull, STDIN_FILENO);
            ::dup2(devNull, STDOUT_FILENO);
            if (options.CaptureStderr) {
                ::dup2(stderrPipe[1], STDERR_FILENO);
            }
            ::signal(SIGPIPE, SIG_DFL);
            // A terminal Ctrl-C goes to the foreground group; the child must not
            // see it, cancellation is delivered through Terminate().
            if (::setpgid(0, 0) == 0) {
                ::execvp(argv[0], argv.data());
            }
            int const code = errno;
            [[maybe_unused]] auto const written = ::write(execPipe[1], &code, sizeof(code));
            ::_exit(127);
        }

        // Same call from this side closes the window before the child runs.
        // EACCES means the child already exec'd, after setting its own group;
        // ESRCH means it has already exited and been reaped.
        int groupErrno = 0;
        if (::setpgid(_pid, _pid) != 0 && errno != EACCES && errno != ESRCH) {
            groupErrno = errno;
        }

        ::close(devNull);
        ::close(execPipe[1]);
        execPipe[1] = -1;
        if (options.PipeStdin) {
            ::close(stdinPipe[0]);
            _stdinFd = stdinPipe[1];
        }
        if (options.CaptureStderr) {
            ::close(stderrPipe[1]);
            _stderrFd = stderrPipe[0];
        }

        // The exec pipe closes on a successful exec; a payload means execvp failed.
        int     childErrno = 0;
        ssize_t got        = 0;
        do {
            got = ::read(execPipe[0], &childErrno, sizeof(childErrno));
        } while (got < 0 && errno == EINTR);
        ::close(execPipe[0]);
        if (got == static_cast<ssize_t>(sizeof(childErrno))) {
            Wait();
            CloseFd(_stdinFd);
            CloseFd(_stderrFd);
            throw std::system_error(childErrno, std::generic_category(), "execvp " + _args.front());
        }
        if (groupErrno != 0 && ::getpgid(_pid) != _pid) {
            Terminate();
            CloseFd(_stdinFd);
            CloseFd(_stderrFd);
            throw std::system_error(groupErrno, std::generic_category(), "setpgid");
        }
    }

    Subprocess::~Subprocess() {
        CloseFd(_stdinFd);
        if (Running()) {
            Terminate();
        }
        CloseFd(_stderrFd);
    }

    pid_t Subprocess::Pid() const {
        return _pid;
    }

    bool Subprocess::Running() const {
        return _pid > 0 && ! _reaped;
    }

    void Subprocess::CloseFd(int & fd) noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    bool Subprocess::Write(std::span<std::uint8_t const> bytes) {
        if (_stdinFd < 0) {
            return false;
        }
        auto const * data = bytes.data();
        std::size_t  left = bytes.size();
        while (left > 0) {
            ssize_t const written = ::write(_stdinFd, data, left);
            if (written < 0) {
                if (errno == EINTR) continue;
                if (errno == EPIPE) return false;
                throw LastError("write");
            }
            data += written;
            left -= static_cast<std::size_t>(written);
        }
        return true;
    }

    void Subprocess::CloseInput() {
        CloseFd(_stdinFd);
    }

    std::string Subprocess::ReadStderr() {
        std::string output;
        if (_stderrFd < 0) {
            return output;
        }
        std::array<char, 4096> buffer;
        while (true) {
            ssize_t const got = ::read(_stderrFd, buffer.data(), buffer.size());
            if (got < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (got == 0) break;
            output.append(buffer.data(), static_cast<std::size_t>(got));
        }
        CloseFd(_stderrFd);
        return output;
    }

    int Subprocess::DecodeStatus(int status) {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

    int Subprocess::Wait() {
        if (! Running()) {
            return _exitCode;
        }
        int status = 0;
        pid_t result = 0;
        do {
            result = ::waitpid(_pid, &status, 0);
        } while (result < 0 && errno == EINTR);
        if (result < 0) {
            throw LastError("waitpid");
        }
        _reaped   = true;
        _exitCode = DecodeStatus(status);
        return _exitCode;
    }

    void Subprocess::Terminate(std::chrono::milliseconds grace) noexcept {
        if (! Running()) {
            return;
        }
        CloseFd(_stdinFd);
        ::kill(_pid, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + grace;
        int status = 0;
        while (true) {
            pid_t const result = ::waitpid(_pid, &status, WNOHANG);
            if (result == _pid) {
                _reaped   = true;
                _exitCode = DecodeStatus(status);
                return;
            }
            if (result < 0 && errno != EINTR) {
                _reaped = true;
                return;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(kReapPollInterval);
        }

        ::kill(_pid, SIGKILL);
        pid_t result = 0;
        do {
            result = ::waitpid(_pid, &status, 0);
        } while (result < 0 && errno == EINTR);
        _reaped   = true;
        _exitCode = result == _pid ? DecodeStatus(status) : -1;
    }
} // namespace VGR::Apps::VinylGroove
