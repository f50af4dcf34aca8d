#include "network_interfaces.hpp"

#include "call_errno.hpp"
#include "mediavisor_errors.hpp"
#include "str.hpp"

#include <net/if.h>
#include <pcap/pcap.h>
#include <sys/ioctl.h>
#include <sys/socket.h>

#include <cstring>
#include <optional>

namespace {
// nullopt for pcap pseudo-devices that have no kernel interface behind them
std::optional<network_interface> query_interface(int query_socket, std::string const &name) {
    if (name.size() >= IFNAMSIZ) { return std::nullopt; }
    ifreq request;
    std::memset(&request, 0, sizeof(request));
    std::memcpy(request.ifr_name, name.data(), name.size());

    network_interface ret{.interface_name = name};
    if (ioctl(query_socket, SIOCGIFFLAGS, &request) == -1) {
        if (errno == ENODEV || errno == ENXIO) { return std::nullopt; }
        throw errno_exception(errno, "ioctl SIOCGIFFLAGS");
    }
    ret.interface_flags = static_cast<unsigned short>(request.ifr_flags);
    if (ioctl(query_socket, SIOCGIFMTU, &request) == -1) {
        if (errno == ENODEV || errno == ENXIO) { return std::nullopt; }
        throw errno_exception(errno, "ioctl SIOCGIFMTU");
    }
    ret.interface_mtu = request.ifr_mtu;
    return ret;
}
} // namespace

interface_set discover_up_interfaces(std::string const &name_filter) {
    add_thread_context _("discover_up_interfaces", name_filter.empty() ? "*" : name_filter);
    char errbuf[PCAP_ERRBUF_SIZE];
    pcap_if_t *alldevsp;

    if (pcap_findalldevs(&alldevsp, errbuf)) { throw interface_lookup_error(str("pcap_findalldevs failed ", errbuf)); }
    auto alldevsp_holder = make_unique_ptr_closer(alldevsp, [](pcap_if_t *handle) {
        if (handle) { pcap_freealldevs(handle); }
    });

    interface_set ret;
    bool filter_found = false;
    try {
        unique_fd query_socket{CALL_ERRNO_MINUS_1(socket, AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0)};
        for (auto dev_iter = alldevsp_holder.get(); dev_iter; dev_iter = dev_iter->next) {
            if (!dev_iter->name) { continue; }
            std::string name = dev_iter->name;
            if (!name_filter.empty() && name != name_filter) { continue; }
            filter_found = true;

            auto queried = query_interface(query_socket.get(), name);
            if (!queried) { continue; }
            if (!(queried->interface_flags & IFF_UP) || queried->interface_mtu <= 0) { continue; }
            ret.push_back(std::move(*queried));
        }
    } catch (errno_exception const &e) {
        throw interface_lookup_error(e.what());
    }
    if (!name_filter.empty() && !filter_found) { throw interface_lookup_error(str("no such network interface ", name_filter)); }
    return ret;
}

std::ostream &operator<<(std::ostream &os, network_interface const &ni) {
    return os << ni.interface_name << "(mtu " << ni.interface_mtu << ")";
}
