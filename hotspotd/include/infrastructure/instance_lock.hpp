#ifndef HOTSPOTD_INFRASTRUCTURE_INSTANCE_LOCK_HPP
#define HOTSPOTD_INFRASTRUCTURE_INSTANCE_LOCK_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>

namespace hotspotd
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {

        /**
         * Advisory single-instance marker backed by a PID file.
         *
         * A conflicting live instance is terminated on acquire rather than
         * reported. release() only removes a marker that still names us.
         */
        class InstanceLock
        {
        public:
            explicit InstanceLock(const std::string &pid_file,
                                  std::chrono::milliseconds terminate_grace = std::chrono::seconds(5));
            ~InstanceLock();

            InstanceLock(const InstanceLock &) = delete;
            InstanceLock &operator=(const InstanceLock &) = delete;

            // PID in the marker if it is alive and not this process
            std::optional<pid_t> find_conflicting() const;

            bool acquire();
            void release();

            // Terminate whatever instance the marker names and remove the marker (used by --stop)
            bool stop_running_instance();

            bool held() const { return held_; }
            const std::string &path() const { return pid_file_; }

        private:
            void remove_marker();

            std::string pid_file_;
            std::chrono::milliseconds terminate_grace_;
            bool held_ = false;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace hotspotd

#endif // HOTSPOTD_INFRASTRUCTURE_INSTANCE_LOCK_HPP
