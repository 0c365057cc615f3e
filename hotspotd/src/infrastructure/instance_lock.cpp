#include "infrastructure/instance_lock.hpp"
#include "infrastructure/process_control.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <unistd.h>

namespace hotspotd
{
    namespace infrastructure
    {

        InstanceLock::InstanceLock(const std::string &pid_file, std::chrono::milliseconds terminate_grace)
            : pid_file_(pid_file), terminate_grace_(terminate_grace),
              logger_(core::get_logger("InstanceLock"))
        {
        }

        InstanceLock::~InstanceLock()
        {
            if (held_)
            {
                release();
            }
        }

        std::optional<pid_t> InstanceLock::find_conflicting() const
        {
            auto pid = read_pid_file(pid_file_);
            if (!pid || *pid == getpid())
            {
                return std::nullopt;
            }
            if (!process_alive(*pid))
            {
                return std::nullopt;
            }
            return pid;
        }

        bool InstanceLock::acquire()
        {
            if (auto other = find_conflicting())
            {
                logger_->warning("Terminating running instance", core::LogContext().add("pid", *other));
                if (!terminate_process(*other, terminate_grace_))
                {
                    logger_->error("Running instance did not exit", core::LogContext().add("pid", *other));
                    return false;
                }
            }

            std::error_code ec;
            auto parent = std::filesystem::path(pid_file_).parent_path();
            if (!parent.empty())
            {
                std::filesystem::create_directories(parent, ec);
                if (ec)
                {
                    logger_->warning("Cannot create PID file directory",
                                     core::LogContext().add("dir", parent.string()).add("error", ec.message()));
                }
            }

            if (!write_pid_file(pid_file_, getpid()))
            {
                logger_->error("Cannot write PID file", core::LogContext().add("file", pid_file_));
                return false;
            }

            held_ = true;
            logger_->debug("Instance marker acquired",
                           core::LogContext().add("file", pid_file_).add("pid", getpid()));
            return true;
        }

        void InstanceLock::release()
        {
            held_ = false;

            auto pid = read_pid_file(pid_file_);
            if (!pid || *pid != getpid())
            {
                return;
            }

            remove_marker();
        }

        void InstanceLock::remove_marker()
        {
            std::error_code ec;
            std::filesystem::remove(pid_file_, ec);
            if (ec)
            {
                logger_->warning("Failed to remove PID file",
                                 core::LogContext().add("file", pid_file_).add("error", ec.message()));
            }
        }

        bool InstanceLock::stop_running_instance()
        {
            auto pid = find_conflicting();
            if (!pid)
            {
                logger_->info("No running instance recorded", core::LogContext().add("file", pid_file_));
                remove_marker();
                return true;
            }

            logger_->info("Stopping running instance", core::LogContext().add("pid", *pid));
            if (!terminate_process(*pid, terminate_grace_, std::chrono::milliseconds(500)))
            {
                logger_->error("Instance did not stop", core::LogContext().add("pid", *pid));
                return false;
            }
            remove_marker();
            return true;
        }

    } // namespace infrastructure
} // namespace hotspotd
