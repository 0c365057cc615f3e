/**
 * Child-process execution with bounded runtime
 */

#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hotspotd
{
    namespace infrastructure
    {

        namespace
        {
            constexpr auto KILL_GRACE = std::chrono::milliseconds(300);

            void close_fd(int &fd)
            {
                if (fd >= 0)
                {
                    close(fd);
                    fd = -1;
                }
            }

            // Reads whatever is available without blocking; returns false on EOF
            bool drain(int fd, std::string &sink)
            {
                char buffer[4096];
                while (true)
                {
                    ssize_t n = read(fd, buffer, sizeof(buffer));
                    if (n > 0)
                    {
                        sink.append(buffer, static_cast<size_t>(n));
                        continue;
                    }
                    if (n == 0)
                    {
                        return false;
                    }
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    return errno == EAGAIN || errno == EWOULDBLOCK;
                }
            }

            int decode_status(int status)
            {
                if (WIFEXITED(status))
                {
                    return WEXITSTATUS(status);
                }
                if (WIFSIGNALED(status))
                {
                    return 128 + WTERMSIG(status);
                }
                return -1;
            }
        }

        std::string join_command(const std::vector<std::string> &args)
        {
            std::ostringstream cmd;
            for (size_t i = 0; i < args.size(); ++i)
            {
                if (i > 0)
                    cmd << " ";
                cmd << args[i];
            }
            return cmd.str();
        }

        SystemCommandRunner::SystemCommandRunner()
            : logger_(core::get_logger("CommandRunner"))
        {
        }

        CommandResult SystemCommandRunner::run(const std::vector<std::string> &args,
                                               std::chrono::milliseconds timeout)
        {
            CommandResult result;
            if (args.empty())
            {
                return result;
            }

            int out_pipe[2] = {-1, -1};
            int err_pipe[2] = {-1, -1};
            int exec_pipe[2] = {-1, -1};
            if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0)
            {
                logger_->error("Failed to create pipes", core::LogContext().add("error", std::strerror(errno)));
                for (int *fds : {out_pipe, err_pipe, exec_pipe})
                {
                    close_fd(fds[0]);
                    close_fd(fds[1]);
                }
                return result;
            }

            std::vector<char *> argv;
            argv.reserve(args.size() + 1);
            for (const auto &arg : args)
            {
                argv.push_back(const_cast<char *>(arg.c_str()));
            }
            argv.push_back(nullptr);

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                dup2(out_pipe[1], STDOUT_FILENO);
                dup2(err_pipe[1], STDERR_FILENO);
                close(out_pipe[0]);
                close(out_pipe[1]);
                close(err_pipe[0]);
                close(err_pipe[1]);
                close(exec_pipe[0]);

                int devnull = open("/dev/null", O_RDONLY);
                if (devnull >= 0)
                {
                    dup2(devnull, STDIN_FILENO);
                    close(devnull);
                }

                // The parent may hold termination signals blocked; daemons must not inherit that
                sigset_t empty_mask;
                sigemptyset(&empty_mask);
                sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

                setenv("LC_ALL", "C", 1);
                execvp(argv[0], argv.data());

                int exec_errno = errno;
                ssize_t ignored = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
                (void)ignored;
                _exit(127);
            }

            close_fd(out_pipe[1]);
            close_fd(err_pipe[1]);
            close_fd(exec_pipe[1]);

            if (pid < 0)
            {
                logger_->error("Failed to fork", core::LogContext().add("command", args[0]).add("error", std::strerror(errno)));
                close_fd(out_pipe[0]);
                close_fd(err_pipe[0]);
                close_fd(exec_pipe[0]);
                return result;
            }

            // execvp succeeded iff the close-on-exec pipe closes without data
            int exec_errno = 0;
            ssize_t n;
            do
            {
                n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
            } while (n < 0 && errno == EINTR);
            close_fd(exec_pipe[0]);

            if (n > 0)
            {
                int status = 0;
                waitpid(pid, &status, 0);
                close_fd(out_pipe[0]);
                close_fd(err_pipe[0]);
                logger_->debug("Command not executable",
                               core::LogContext().add("command", args[0]).add("error", std::strerror(exec_errno)));
                return result;
            }
            result.launched = true;

            fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
            fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

            auto deadline = std::chrono::steady_clock::now() + timeout;
            int status = 0;
            bool exited = false;

            while (true)
            {
                pid_t waited = waitpid(pid, &status, WNOHANG);
                if (waited == pid)
                {
                    exited = true;
                }

                std::vector<pollfd> fds;
                if (out_pipe[0] >= 0)
                    fds.push_back({out_pipe[0], POLLIN, 0});
                if (err_pipe[0] >= 0)
                    fds.push_back({err_pipe[0], POLLIN, 0});

                if (fds.empty())
                {
                    if (exited)
                        break;
                }

                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0 && !exited)
                {
                    break;
                }

                // Daemonizing tools may leave the pipes open in a grandchild, so
                // once the direct child has exited only what is buffered is read.
                int wait_ms = exited ? 0 : static_cast<int>(std::min<long long>(remaining.count(), 50LL));
                if (!fds.empty())
                {
                    poll(fds.data(), fds.size(), wait_ms);
                }
                else
                {
                    usleep(static_cast<useconds_t>(wait_ms) * 1000);
                }

                if (out_pipe[0] >= 0 && !drain(out_pipe[0], result.output))
                    close_fd(out_pipe[0]);
                if (err_pipe[0] >= 0 && !drain(err_pipe[0], result.error))
                    close_fd(err_pipe[0]);

                if (exited)
                {
                    break;
                }
            }

            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);

            if (!exited)
            {
                result.timed_out = true;
                kill(pid, SIGTERM);
                auto grace_end = std::chrono::steady_clock::now() + KILL_GRACE;
                while (waitpid(pid, &status, WNOHANG) == 0)
                {
                    if (std::chrono::steady_clock::now() >= grace_end)
                    {
                        kill(pid, SIGKILL);
                        waitpid(pid, &status, 0);
                        break;
                    }
                    usleep(20 * 1000);
                }
                logger_->warning("Command timed out",
                                 core::LogContext()
                                     .add("command", join_command(args))
                                     .add("timeout_ms", timeout.count()));
                return result;
            }

            result.exit_code = decode_status(status);
            return result;
        }

        bool SystemCommandRunner::tool_available(const std::string &tool)
        {
            const char *path_env = std::getenv("PATH");
            std::string path = path_env ? path_env : "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

            std::istringstream stream(path);
            std::string dir;
            while (std::getline(stream, dir, ':'))
            {
                if (dir.empty())
                {
                    continue;
                }
                std::filesystem::path candidate = std::filesystem::path(dir) / tool;
                if (access(candidate.c_str(), X_OK) == 0)
                {
                    return true;
                }
            }
            return false;
        }

    } // namespace infrastructure
} // namespace hotspotd
