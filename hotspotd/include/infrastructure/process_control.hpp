#ifndef HOTSPOTD_INFRASTRUCTURE_PROCESS_CONTROL_HPP
#define HOTSPOTD_INFRASTRUCTURE_PROCESS_CONTROL_HPP

#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>

namespace hotspotd
{
    namespace infrastructure
    {

        // First line of a PID file as a positive PID; nullopt if missing or garbage
        std::optional<pid_t> read_pid_file(const std::string &path);

        bool write_pid_file(const std::string &path, pid_t pid);

        // kill(pid, 0) liveness; zombies of our own children are reaped first
        bool process_alive(pid_t pid);

        /**
         * SIGTERM, poll liveness every `poll` for up to `grace`, then SIGKILL.
         * Returns true once the process is gone.
         */
        bool terminate_process(pid_t pid,
                               std::chrono::milliseconds grace,
                               std::chrono::milliseconds poll = std::chrono::milliseconds(100));

    } // namespace infrastructure
} // namespace hotspotd

#endif // HOTSPOTD_INFRASTRUCTURE_PROCESS_CONTROL_HPP
