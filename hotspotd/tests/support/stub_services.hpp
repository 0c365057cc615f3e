#ifndef HOTSPOTD_TESTS_SUPPORT_STUB_SERVICES_HPP
#define HOTSPOTD_TESTS_SUPPORT_STUB_SERVICES_HPP

#include <optional>
#include <string>
#include <vector>
#include "services/capability_probe.hpp"
#include "services/interface_inventory.hpp"
#include "services/upstream_resolver.hpp"

namespace hotspotd
{
    namespace test_support
    {

        // Upstream answer fixed by the test
        class StubResolver : public services::UpstreamResolver
        {
        public:
            explicit StubResolver(infrastructure::CommandRunner &runner)
                : services::UpstreamResolver(runner, std::chrono::milliseconds(1))
            {
            }

            std::optional<std::string> resolve_upstream(bool exclude_vpn) override
            {
                ++calls;
                last_exclude_vpn = exclude_vpn;
                return upstream;
            }

            std::optional<std::string> upstream;
            int calls = 0;
            bool last_exclude_vpn = false;
        };

        // Inventory snapshot fixed by the test
        class StubInventory : public services::InterfaceInventory
        {
        public:
            StubInventory(infrastructure::CommandRunner &runner,
                          services::CapabilityProbe &probe,
                          services::UpstreamResolver &resolver)
                : services::InterfaceInventory(runner, probe, resolver, std::chrono::milliseconds(1))
            {
            }

            std::vector<core::Interface> list_interfaces(bool) override
            {
                ++calls;
                return interfaces;
            }

            std::vector<core::Interface> interfaces;
            int calls = 0;
        };

    } // namespace test_support
} // namespace hotspotd

#endif // HOTSPOTD_TESTS_SUPPORT_STUB_SERVICES_HPP
