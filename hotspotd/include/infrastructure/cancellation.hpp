#ifndef HOTSPOTD_INFRASTRUCTURE_CANCELLATION_HPP
#define HOTSPOTD_INFRASTRUCTURE_CANCELLATION_HPP

#include <chrono>
#include <initializer_list>
#include <signal.h>

namespace hotspotd
{
    namespace infrastructure
    {

        /**
         * Stop request observed by the monitor loop between iterations
         */
        class CancellationToken
        {
        public:
            virtual ~CancellationToken() = default;

            // Sleeps up to `timeout`; returns true as soon as cancellation is requested
            virtual bool wait_for(std::chrono::milliseconds timeout) = 0;

            virtual bool cancelled() const = 0;
        };

        /**
         * Blocks the given signals for the process and consumes them with
         * sigtimedwait(), so a termination request interrupts the sleep
         * instead of running code in a signal handler. The previous mask is
         * restored on destruction.
         */
        class SignalCancellationToken : public CancellationToken
        {
        public:
            SignalCancellationToken(std::initializer_list<int> signals = {SIGINT, SIGTERM, SIGQUIT});
            ~SignalCancellationToken() override;

            SignalCancellationToken(const SignalCancellationToken &) = delete;
            SignalCancellationToken &operator=(const SignalCancellationToken &) = delete;

            bool wait_for(std::chrono::milliseconds timeout) override;
            bool cancelled() const override { return received_signal_ != 0; }

            int received_signal() const { return received_signal_; }

        private:
            sigset_t signals_;
            sigset_t previous_mask_;
            int received_signal_ = 0;
        };

    } // namespace infrastructure
} // namespace hotspotd

#endif // HOTSPOTD_INFRASTRUCTURE_CANCELLATION_HPP
