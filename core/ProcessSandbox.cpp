/*
 * ProcessSandbox.cpp
 *
 *  Out-of-process executor. Every request forks a fresh autopo_sandbox
 *  helper that talks JSON over a socket pair bound to its stdin/stdout.
 */

#include "../headers/autopo_internal.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace autopo
{
    namespace {
        struct ScopedFd
        {
            int fd;
            explicit ScopedFd(int fd = -1) : fd(fd) {}
            ~ScopedFd() { reset(); }
            ScopedFd(const ScopedFd&) = delete;
            ScopedFd& operator=(const ScopedFd&) = delete;

            void reset()
            {
                if (fd >= 0) ::close(fd);
                fd = -1;
            }
        };

        /** Kills and reaps the helper unless it was already waited for. */
        struct ChildProcess
        {
            pid_t pid;
            bool reaped;
            int status;

            explicit ChildProcess(pid_t pid) : pid(pid), reaped(false), status(0) {}
            ~ChildProcess()
            {
                if (!reaped)
                {
                    ::kill(pid, SIGKILL);
                    wait();
                }
            }
            ChildProcess(const ChildProcess&) = delete;
            ChildProcess& operator=(const ChildProcess&) = delete;

            void wait()
            {
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                reaped = true;
            }

            std::string describeExit() const
            {
                if (WIFSIGNALED(status))
                {
                    const int sig = WTERMSIG(status);
                    if (sig == SIGXCPU)
                        return "helper exceeded its cpu limit";
                    return "helper killed by signal " + std::to_string(sig);
                }
                if (WIFEXITED(status))
                {
                    if (WEXITSTATUS(status) == 127)
                        return "cannot execute helper";
                    return "helper exited with status " + std::to_string(WEXITSTATUS(status));
                }
                return "helper ended abnormally";
            }
        };

        void setLimit(int resource, rlim_t value)
        {
            struct rlimit limit;
            limit.rlim_cur = value;
            limit.rlim_max = value;
            ::setrlimit(resource, &limit);
        }

        long remainingMs(std::chrono::steady_clock::time_point deadline)
        {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            return left > 0 ? left : 0;
        }
    }

    ProcessSandbox::ProcessSandbox(std::string helperPath, SandboxLimits limits) :
        helperPath(std::move(helperPath)), limits(limits)
    {
        if (this->helperPath.empty())
            throw std::invalid_argument("ProcessSandbox needs a helper path");
    }

    ExecutionResult ProcessSandbox::execute(const ExecutionRequest& request)
    {
        const std::string payload = encodeExecutionRequest(request, limits.stepLimit);
        const auto deadline = std::chrono::steady_clock::now() + limits.timeout;

        int sockets[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sockets) != 0)
            throw TransportError("sandbox", std::string("socketpair failed: ") + std::strerror(errno));
        ScopedFd parentEnd(sockets[0]);
        ScopedFd childEnd(sockets[1]);

        // Everything the child needs is prepared before fork.
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(helperPath.c_str()));
        argv.push_back(nullptr);
        char* envp[] = {nullptr};
        struct rlimit openFiles;
        const int maxFd = ::getrlimit(RLIMIT_NOFILE, &openFiles) == 0 && openFiles.rlim_cur < 65536
                              ? static_cast<int>(openFiles.rlim_cur) : 65536;
        const rlim_t memoryBytes = static_cast<rlim_t>(limits.memoryMb) * 1024ULL * 1024ULL;
        const rlim_t cpuSeconds = static_cast<rlim_t>(limits.cpuSeconds);

        const pid_t pid = ::fork();
        if (pid < 0)
            throw TransportError("sandbox", std::string("fork failed: ") + std::strerror(errno));

        if (pid == 0)
        {
            ::dup2(childEnd.fd, STDIN_FILENO);
            ::dup2(childEnd.fd, STDOUT_FILENO);
            const int devNull = ::open("/dev/null", O_WRONLY);
            if (devNull >= 0)
                ::dup2(devNull, STDERR_FILENO);
#ifdef SYS_close_range
            if (::syscall(SYS_close_range, STDERR_FILENO + 1, ~0U, 0) != 0)
#endif
            {
                for (int fd = STDERR_FILENO + 1; fd < maxFd; ++fd)
                    ::close(fd);
            }

            ::prctl(PR_SET_PDEATHSIG, SIGKILL);
            ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            if (memoryBytes > 0) setLimit(RLIMIT_AS, memoryBytes);
            if (cpuSeconds > 0) setLimit(RLIMIT_CPU, cpuSeconds);
            setLimit(RLIMIT_FSIZE, 0);
            setLimit(RLIMIT_CORE, 0);
            setLimit(RLIMIT_NOFILE, 16);
            if (::chdir("/") != 0)
                ::_exit(127);

            ::execve(argv[0], argv.data(), envp);
            ::_exit(127);
        }

        ChildProcess child(pid);
        childEnd.reset();
        if (diagEnabled())
            fprintf(stderr, "DEBUG: [SANDBOX] started helper pid %d for '%s'\n", pid, request.methodName.c_str());

        // Send the request, then half-close so the helper sees end of input.
        size_t sent = 0;
        bool sendFailed = false;
        while (sent < payload.size())
        {
            struct pollfd writable = {parentEnd.fd, POLLOUT, 0};
            const int ready = ::poll(&writable, 1, static_cast<int>(remainingMs(deadline)));
            if (ready < 0 && errno == EINTR) continue;
            if (ready == 0)
                throw TransportError("sandbox", "timed out after " + std::to_string(limits.timeout.count()) + " ms sending the request");
            const ssize_t n = ::send(parentEnd.fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR || errno == EAGAIN) continue;
                sendFailed = true;
                break;
            }
            sent += static_cast<size_t>(n);
        }
        ::shutdown(parentEnd.fd, SHUT_WR);

        std::string response;
        char buffer[65536];
        while (!sendFailed)
        {
            const long left = remainingMs(deadline);
            if (left == 0)
            {
                fprintf(stderr, "ERROR: [SANDBOX] '%s' timed out after %lld ms, killing pid %d\n",
                        request.methodName.c_str(), static_cast<long long>(limits.timeout.count()), pid);
                throw TransportError("sandbox", "timed out after " + std::to_string(limits.timeout.count()) + " ms");
            }
            struct pollfd readable = {parentEnd.fd, POLLIN, 0};
            const int ready = ::poll(&readable, 1, static_cast<int>(left));
            if (ready < 0)
            {
                if (errno == EINTR) continue;
                throw TransportError("sandbox", std::string("poll failed: ") + std::strerror(errno));
            }
            if (ready == 0)
                continue;
            const ssize_t n = ::recv(parentEnd.fd, buffer, sizeof(buffer), 0);
            if (n < 0)
            {
                if (errno == EINTR || errno == EAGAIN) continue;
                break;
            }
            if (n == 0)
                break;
            response.append(buffer, static_cast<size_t>(n));
        }

        child.wait();
        const bool cleanExit = WIFEXITED(child.status) && WEXITSTATUS(child.status) == 0;
        if (!cleanExit || sendFailed || response.empty())
        {
            const std::string reason = child.describeExit();
            fprintf(stderr, "ERROR: [SANDBOX] '%s': %s\n", request.methodName.c_str(), reason.c_str());
            throw TransportError("sandbox", reason);
        }

        try
        {
            ExecutionResult result = decodeExecutionResult(response);
            if (diagEnabled())
                fprintf(stderr, "DEBUG: [SANDBOX] pid %d done (state_changed=%d, error=%s)\n",
                        pid, result.stateChanged ? 1 : 0, result.error ? result.error->c_str() : "none");
            return result;
        }
        catch (const std::invalid_argument& e)
        {
            throw TransportError("sandbox", std::string("malformed response: ") + e.what());
        }
    }

    /**
     * @brief Round trip of a trivial body through a real helper.
     */
    bool ProcessSandbox::ping()
    {
        ExecutionRequest request;
        request.body = "def ping(self) { return true; }";
        request.methodName = "ping";
        try
        {
            const ExecutionResult result = execute(request);
            return result.succeeded() && result.output == Value(true);
        }
        catch (const TransportError& e)
        {
            fprintf(stderr, "ERROR: [SANDBOX] ping failed: %s\n", e.what());
            return false;
        }
    }
}
