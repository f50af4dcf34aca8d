#pragma once

#include <sys/socket.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

struct ip_network {
    int network_family = AF_INET; // AF_INET or AF_INET6
    std::array<uint8_t, 16> network_address = {};
    int network_prefix_length = 0;

    // IPv4 mapped IPv6 addresses are matched against IPv4 networks
    [[nodiscard]] bool contains(sockaddr const *addr) const;
};

std::ostream &operator<<(std::ostream &os, ip_network const &net);

// "10.0.0.0/8", "fe80::/10", or a bare address which becomes a /32 or /128
std::optional<ip_network> parse_ip_network(std::string_view text);

// comma separated; empty text allows everything, unparseable elements are logged and skipped
std::vector<ip_network> parse_allowed_ip_nets(std::string_view text);

struct supervisor_config {
    std::filesystem::path root_path;
    std::string interface_name; // empty for all interfaces
    std::string http_address;   // host:port, empty host for any
    std::string friendly_name;
    std::filesystem::path probe_cache_path;
    int64_t probe_cache_capacity = int64_t(64) << 20;
    std::chrono::duration<double> notify_interval = std::chrono::seconds(30);
    std::vector<ip_network> allowed_ip_nets;
    bool no_probe = false;
};

supervisor_config supervisor_config_from_env();

// Overlays the fields present in a JSON object file onto base. Throws config_error,
// in which case the caller keeps using base.
supervisor_config supervisor_config_load_json(std::filesystem::path const &path, supervisor_config base);

std::ostream &operator<<(std::ostream &os, supervisor_config const &config);
