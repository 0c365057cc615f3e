#include "infrastructure/process_control.hpp"

#include <cctype>
#include <cerrno>
#include <fstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hotspotd
{
    namespace infrastructure
    {

        std::optional<pid_t> read_pid_file(const std::string &path)
        {
            std::ifstream stream(path);
            if (!stream)
            {
                return std::nullopt;
            }

            std::string line;
            if (!std::getline(stream, line))
            {
                return std::nullopt;
            }

            try
            {
                size_t consumed = 0;
                long value = std::stol(line, &consumed);
                while (consumed < line.size() && std::isspace(static_cast<unsigned char>(line[consumed])))
                {
                    ++consumed;
                }
                if (consumed != line.size() || value <= 0)
                {
                    return std::nullopt;
                }
                return static_cast<pid_t>(value);
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }

        bool write_pid_file(const std::string &path, pid_t pid)
        {
            std::ofstream stream(path, std::ios::trunc);
            if (!stream)
            {
                return false;
            }
            stream << pid << "\n";
            return static_cast<bool>(stream);
        }

        bool process_alive(pid_t pid)
        {
            if (pid <= 0)
            {
                return false;
            }

            // Only succeeds for our own exited children
            int status = 0;
            if (waitpid(pid, &status, WNOHANG) == pid)
            {
                return false;
            }

            if (kill(pid, 0) == 0)
            {
                return true;
            }
            return errno == EPERM;
        }

        bool terminate_process(pid_t pid, std::chrono::milliseconds grace, std::chrono::milliseconds poll)
        {
            if (!process_alive(pid))
            {
                return true;
            }

            if (kill(pid, SIGTERM) != 0 && errno == ESRCH)
            {
                return true;
            }

            auto deadline = std::chrono::steady_clock::now() + grace;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (!process_alive(pid))
                {
                    return true;
                }
                std::this_thread::sleep_for(poll);
            }

            if (kill(pid, SIGKILL) != 0 && errno == ESRCH)
            {
                return true;
            }
            for (int i = 0; i < 10; ++i)
            {
                if (!process_alive(pid))
                {
                    return true;
                }
                std::this_thread::sleep_for(poll);
            }
            return !process_alive(pid);
        }

    } // namespace infrastructure
} // namespace hotspotd
