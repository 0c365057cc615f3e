#include "infrastructure/cancellation.hpp"

#include <cerrno>
#include <ctime>
#include <system_error>

namespace hotspotd
{
    namespace infrastructure
    {

        SignalCancellationToken::SignalCancellationToken(std::initializer_list<int> signals)
        {
            sigemptyset(&signals_);
            for (int signal_number : signals)
            {
                sigaddset(&signals_, signal_number);
            }
            if (sigprocmask(SIG_BLOCK, &signals_, &previous_mask_) != 0)
            {
                throw std::system_error(errno, std::generic_category(), "sigprocmask");
            }
        }

        SignalCancellationToken::~SignalCancellationToken()
        {
            sigprocmask(SIG_SETMASK, &previous_mask_, nullptr);
        }

        bool SignalCancellationToken::wait_for(std::chrono::milliseconds timeout)
        {
            if (cancelled())
            {
                return true;
            }

            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (true)
            {
                auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0)
                {
                    return false;
                }

                timespec wait_time{};
                wait_time.tv_sec = static_cast<time_t>(remaining.count() / 1000000000LL);
                wait_time.tv_nsec = static_cast<long>(remaining.count() % 1000000000LL);

                int signal_number = sigtimedwait(&signals_, nullptr, &wait_time);
                if (signal_number > 0)
                {
                    received_signal_ = signal_number;
                    return true;
                }
                if (errno == EAGAIN)
                {
                    return false;
                }
                // EINTR from an unrelated signal: keep waiting out the remainder
            }
        }

    } // namespace infrastructure
} // namespace hotspotd
