#ifndef HOTSPOTD_TESTS_SUPPORT_FAKE_COMMAND_RUNNER_HPP
#define HOTSPOTD_TESTS_SUPPORT_FAKE_COMMAND_RUNNER_HPP

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "infrastructure/command_runner.hpp"

namespace hotspotd
{
    namespace test_support
    {

        /**
         * Scripted stand-in for the external tools.
         *
         * Responses are keyed by an argument-vector prefix; the most recently
         * registered matching prefix wins. Anything unscripted succeeds with
         * empty output. Every command is recorded in issue order.
         */
        class FakeCommandRunner : public infrastructure::CommandRunner
        {
        public:
            using Args = std::vector<std::string>;
            using Handler = std::function<infrastructure::CommandResult(const Args &)>;

            infrastructure::CommandResult run(const Args &args, std::chrono::milliseconds) override
            {
                calls_.push_back(args);
                for (auto it = rules_.rbegin(); it != rules_.rend(); ++it)
                {
                    if (starts_with(args, it->first))
                    {
                        return it->second(args);
                    }
                }
                return ok("");
            }

            bool tool_available(const std::string &tool) override
            {
                auto it = tools_.find(tool);
                return it != tools_.end() ? it->second : tools_default_;
            }

            void on(const Args &prefix, Handler handler) { rules_.emplace_back(prefix, std::move(handler)); }

            void on_output(const Args &prefix, const std::string &output)
            {
                on(prefix, [output](const Args &)
                   { return ok(output); });
            }

            void on_failure(const Args &prefix, int exit_code = 1, const std::string &error = "")
            {
                on(prefix, [exit_code, error](const Args &)
                   {
                       infrastructure::CommandResult result;
                       result.launched = true;
                       result.exit_code = exit_code;
                       result.error = error;
                       return result; });
            }

            // Tool not installed: execvp fails
            void on_missing(const Args &prefix)
            {
                on(prefix, [](const Args &)
                   { return infrastructure::CommandResult{}; });
            }

            void set_tool(const std::string &tool, bool available) { tools_[tool] = available; }
            void set_all_tools_available(bool available) { tools_default_ = available; }

            const std::vector<Args> &calls() const { return calls_; }
            void clear_calls() { calls_.clear(); }

            int count(const Args &prefix) const
            {
                return static_cast<int>(std::count_if(calls_.begin(), calls_.end(), [&](const Args &call)
                                                      { return starts_with(call, prefix); }));
            }

            bool called(const Args &prefix) const { return count(prefix) > 0; }

            // Calls matching `prefix` that mention `word` anywhere after it
            bool called_with(const Args &prefix, const std::string &word) const
            {
                return std::any_of(calls_.begin(), calls_.end(), [&](const Args &call)
                                   { return starts_with(call, prefix) &&
                                            std::find(call.begin(), call.end(), word) != call.end(); });
            }

            static infrastructure::CommandResult ok(const std::string &output)
            {
                infrastructure::CommandResult result;
                result.launched = true;
                result.exit_code = 0;
                result.output = output;
                return result;
            }

            static bool starts_with(const Args &args, const Args &prefix)
            {
                return args.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), args.begin());
            }

        private:
            std::vector<std::pair<Args, Handler>> rules_;
            std::map<std::string, bool> tools_;
            bool tools_default_ = true;
            std::vector<Args> calls_;
        };

    } // namespace test_support
} // namespace hotspotd

#endif // HOTSPOTD_TESTS_SUPPORT_FAKE_COMMAND_RUNNER_HPP
