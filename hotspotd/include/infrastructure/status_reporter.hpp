#ifndef HOTSPOTD_INFRASTRUCTURE_STATUS_REPORTER_HPP
#define HOTSPOTD_INFRASTRUCTURE_STATUS_REPORTER_HPP

#include <memory>
#include <string>

namespace hotspotd
{
    namespace core
    {
        class Logger;
    }

    namespace infrastructure
    {

        /**
         * Publishes the hotspot state as a small JSON document for desktop
         * front ends:
         *   {"timestamp": <epoch s>, "status": "...", "message": "...", "is_error": bool}
         * The file is replaced atomically on every write.
         */
        class StatusReporter
        {
        public:
            explicit StatusReporter(const std::string &status_file);

            bool write(const std::string &status, const std::string &message, bool is_error = false);

            bool active(const std::string &message) { return write("active", message, false); }
            bool error(const std::string &message) { return write("error", message, true); }
            bool stopped(const std::string &message) { return write("stopped", message, false); }

            const std::string &path() const { return status_file_; }

        private:
            std::string status_file_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace hotspotd

#endif // HOTSPOTD_INFRASTRUCTURE_STATUS_REPORTER_HPP
