#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <vector>

struct network_interface {
    std::string interface_name;
    unsigned interface_flags = 0; // IFF_*
    int interface_mtu = 0;

    bool operator==(network_interface const &) const = default;
};

// interfaces that were up with a positive MTU at one moment; compared by size only
using interface_set = std::vector<network_interface>;
using interface_discovery = std::function<interface_set()>;

// Enumerates with pcap_findalldevs, keeping devices that are up with MTU > 0. A
// non-empty name_filter that matches no device throws interface_lookup_error, as does
// any failure to enumerate.
interface_set discover_up_interfaces(std::string const &name_filter);

std::ostream &operator<<(std::ostream &os, network_interface const &ni);
