#include "infrastructure/status_reporter.hpp"
#include "core/logger.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace hotspotd
{
    namespace infrastructure
    {

        StatusReporter::StatusReporter(const std::string &status_file)
            : status_file_(status_file), logger_(core::get_logger("StatusReporter"))
        {
        }

        bool StatusReporter::write(const std::string &status, const std::string &message, bool is_error)
        {
            auto now = std::chrono::system_clock::now();
            nlohmann::json document = {
                {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count()},
                {"status", status},
                {"message", message},
                {"is_error", is_error}};

            const std::string temp_file = status_file_ + ".tmp." + std::to_string(getpid());
            try
            {
                auto parent = std::filesystem::path(status_file_).parent_path();
                if (!parent.empty())
                {
                    std::filesystem::create_directories(parent);
                }

                {
                    std::ofstream stream(temp_file, std::ios::trunc);
                    if (!stream)
                    {
                        logger_->warning("Cannot open status file", core::LogContext().add("file", temp_file));
                        return false;
                    }
                    stream << document.dump(2) << "\n";
                    if (!stream)
                    {
                        logger_->warning("Failed writing status file", core::LogContext().add("file", temp_file));
                        std::remove(temp_file.c_str());
                        return false;
                    }
                }

                std::filesystem::rename(temp_file, status_file_);
            }
            catch (const std::exception &e)
            {
                logger_->warning("Failed to publish status",
                                 core::LogContext().add("file", status_file_).add("error", e.what()));
                std::remove(temp_file.c_str());
                return false;
            }

            logger_->debug("Status published", core::LogContext().add("status", status));
            return true;
        }

    } // namespace infrastructure
} // namespace hotspotd
