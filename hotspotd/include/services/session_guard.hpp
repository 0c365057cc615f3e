#ifndef HOTSPOTD_SERVICES_SESSION_GUARD_HPP
#define HOTSPOTD_SERVICES_SESSION_GUARD_HPP

#include "core/models.hpp"
#include "infrastructure/instance_lock.hpp"
#include "services/mode_orchestrator.hpp"

namespace hotspotd
{
    namespace services
    {

        /**
         * Scope of an active session. Whatever way the scope is left, the
         * session's side effects are reversed and the instance marker released.
         */
        class SessionGuard
        {
        public:
            SessionGuard(ModeOrchestrator &orchestrator,
                         infrastructure::InstanceLock &lock,
                         core::RuntimeSession &session)
                : orchestrator_(orchestrator), lock_(lock), session_(session)
            {
            }

            ~SessionGuard() { close(); }

            SessionGuard(const SessionGuard &) = delete;
            SessionGuard &operator=(const SessionGuard &) = delete;

            void close()
            {
                if (closed_)
                {
                    return;
                }
                closed_ = true;
                orchestrator_.teardown(session_);
                lock_.release();
            }

        private:
            ModeOrchestrator &orchestrator_;
            infrastructure::InstanceLock &lock_;
            core::RuntimeSession &session_;
            bool closed_ = false;
        };

    } // namespace services
} // namespace hotspotd

#endif // HOTSPOTD_SERVICES_SESSION_GUARD_HPP
