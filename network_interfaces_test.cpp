#include "mediavisor_errors.hpp"
#include "mediavisor_test.hpp"
#include "network_interfaces.hpp"

#include <net/if.h>

TEST(network_interfaces_suite, unknown_interface_is_lookup_error) {
    mediavisor_test_throws(interface_lookup_error, discover_up_interfaces("impossible_interface_name"));
}

TEST(network_interfaces_suite, discovered_interfaces_are_up) {
    interface_set found;
    try {
        found = discover_up_interfaces("");
    } catch (interface_lookup_error const &e) {
        // containers without capture permission cannot enumerate
        mediavisor_event_log("network_interfaces_test_skipped", e.what());
        return;
    }
    std::cout << "discovered " << found << std::endl;
    for (auto const &ni : found) {
        mediavisor_test_check(ni.interface_flags & IFF_UP, !=, 0u, ni);
        mediavisor_test_check(ni.interface_mtu, >, 0, ni);
        mediavisor_test_check(ni.interface_name.empty(), ==, false);
    }
}
