#include "supervisor_config.hpp"

#include "cache_persistence.hpp"
#include "env.hpp"
#include "json_codec.hpp"
#include "mediavisor_errors.hpp"
#include "mediavisor_event.hpp"
#include "str.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>

#include <charconv>
#include <cmath>
#include <cstring>

namespace {
std::string default_friendly_name() {
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) == -1) {
        mediavisor_event_log("supervisor_config_hostname_failed", std::strerror(errno));
        return "mediavisor";
    }
    return str("mediavisor on ", hostname);
}

std::filesystem::path default_probe_cache_path() {
    auto home = env("HOME", "");
    if (home.empty()) {
        mediavisor_event_log("supervisor_config_no_home", "probe cache will not be persisted");
        return {};
    }
    return std::filesystem::path(home) / ".dms-ffprobe-cache";
}

bool prefix_matches(uint8_t const *a, uint8_t const *b, int prefix_length) {
    auto whole = prefix_length / 8;
    if (std::memcmp(a, b, whole)) { return false; }
    auto bits = prefix_length % 8;
    if (!bits) { return true; }
    uint8_t mask = 0xff << (8 - bits);
    return (a[whole] & mask) == (b[whole] & mask);
}

template<typename T>
T json_field(Json::Value const &object, char const *name, T const &current, bool (Json::Value::*is_type)() const, T (Json::Value::*as_type)() const) {
    if (!object.isMember(name)) { return current; }
    auto const &v = object[name];
    if (!(v.*is_type)()) { throw config_error(str("config field ", name, " has the wrong type")); }
    return (v.*as_type)();
}
} // namespace

bool ip_network::contains(sockaddr const *addr) const {
    uint8_t const *bytes = nullptr;
    int family = addr->sa_family;
    if (family == AF_INET) {
        bytes = reinterpret_cast<uint8_t const *>(&reinterpret_cast<sockaddr_in const *>(addr)->sin_addr);
    } else if (family == AF_INET6) {
        auto const &a6 = reinterpret_cast<sockaddr_in6 const *>(addr)->sin6_addr;
        bytes = a6.s6_addr;
        if (IN6_IS_ADDR_V4MAPPED(&a6)) {
            family = AF_INET;
            bytes += 12;
        }
    } else {
        return false;
    }
    if (family != network_family) { return false; }
    return prefix_matches(bytes, network_address.data(), network_prefix_length);
}

std::ostream &operator<<(std::ostream &os, ip_network const &net) {
    char buffer[INET6_ADDRSTRLEN] = {};
    if (!inet_ntop(net.network_family, net.network_address.data(), buffer, sizeof(buffer))) { return os << "invalid_ip_network"; }
    return os << buffer << "/" << net.network_prefix_length;
}

std::optional<ip_network> parse_ip_network(std::string_view text) {
    auto slash = text.find('/');
    std::string address(text.substr(0, slash));
    ip_network ret;
    int max_prefix;
    if (inet_pton(AF_INET, address.c_str(), ret.network_address.data()) == 1) {
        ret.network_family = AF_INET;
        max_prefix = 32;
    } else if (inet_pton(AF_INET6, address.c_str(), ret.network_address.data()) == 1) {
        ret.network_family = AF_INET6;
        max_prefix = 128;
    } else {
        return std::nullopt;
    }
    ret.network_prefix_length = max_prefix;
    if (slash != std::string_view::npos) {
        auto prefix = text.substr(slash + 1);
        auto [end, ec] = std::from_chars(prefix.data(), prefix.data() + prefix.size(), ret.network_prefix_length);
        if (ec != std::errc() || end != prefix.data() + prefix.size() || prefix.empty() || ret.network_prefix_length < 0 ||
            ret.network_prefix_length > max_prefix) {
            return std::nullopt;
        }
    }
    return ret;
}

std::vector<ip_network> parse_allowed_ip_nets(std::string_view text) {
    std::vector<ip_network> ret;
    if (str_trim(text).empty()) {
        ret.push_back(*parse_ip_network("0.0.0.0/0"));
        ret.push_back(*parse_ip_network("::/0"));
        return ret;
    }
    for (auto element : str_split(text, ',')) {
        element = str_trim(element);
        if (auto net = parse_ip_network(element)) {
            ret.push_back(*net);
        } else {
            mediavisor_event_log("supervisor_config_bad_ip_network", str("unable to parse expression ", std::string(element)));
        }
    }
    return ret;
}

supervisor_config supervisor_config_from_env() {
    supervisor_config config;
    config.root_path = std::filesystem::absolute(env("mediavisor_root_path", "."));
    config.interface_name = env("mediavisor_interface_name", "");
    config.http_address = env("mediavisor_http_address", ":1338");
    config.friendly_name = env("mediavisor_friendly_name", "");
    if (config.friendly_name.empty()) { config.friendly_name = default_friendly_name(); }
    config.probe_cache_path = env("mediavisor_probe_cache_path", "");
    if (config.probe_cache_path.empty()) { config.probe_cache_path = default_probe_cache_path(); }
    config.probe_cache_capacity = env("mediavisor_probe_cache_capacity", config.probe_cache_capacity);
    auto notify_interval = env("mediavisor_notify_interval_seconds", config.notify_interval.count());
    if (std::isfinite(notify_interval) && notify_interval > 0) {
        config.notify_interval = std::chrono::duration<double>(notify_interval);
    } else {
        mediavisor_event_log("supervisor_config_bad_notify_interval", str("keeping ", config.notify_interval.count(), "s instead of ", notify_interval));
    }
    config.allowed_ip_nets = parse_allowed_ip_nets(env("mediavisor_allowed_ips", ""));
    config.no_probe = env("mediavisor_no_probe", false);
    return config;
}

supervisor_config supervisor_config_load_json(std::filesystem::path const &path, supervisor_config base) {
    Json::Value root;
    try {
        auto contents = cache_persistence_read_file(path);
        if (!contents) { throw config_error(str("config error (config file: ", path, "): no such file")); }
        root = json_parse(*contents);
    } catch (config_error const &) {
        throw;
    } catch (std::exception const &e) {
        throw config_error(str("config error (config file: ", path, "): ", e.what()));
    }
    if (!root.isObject()) { throw config_error(str("config error (config file: ", path, "): not a JSON object")); }

    auto config = base;
    config.root_path = json_field(root, "Path", config.root_path.string(), &Json::Value::isString, &Json::Value::asString);
    config.root_path = std::filesystem::absolute(config.root_path);
    config.interface_name = json_field(root, "IfName", config.interface_name, &Json::Value::isString, &Json::Value::asString);
    config.http_address = json_field(root, "Http", config.http_address, &Json::Value::isString, &Json::Value::asString);
    config.friendly_name = json_field(root, "FriendlyName", config.friendly_name, &Json::Value::isString, &Json::Value::asString);
    config.probe_cache_path = json_field(root, "FFprobeCachePath", config.probe_cache_path.string(), &Json::Value::isString, &Json::Value::asString);
    config.no_probe = json_field(root, "NoProbe", config.no_probe, &Json::Value::isBool, &Json::Value::asBool);
    config.notify_interval = std::chrono::duration<double>(
            json_field(root, "NotifyInterval", config.notify_interval.count(), &Json::Value::isNumeric, &Json::Value::asDouble));
    if (!std::isfinite(config.notify_interval.count()) || config.notify_interval.count() <= 0) {
        throw config_error(str("config error (config file: ", path, "): NotifyInterval must be positive"));
    }
    if (root.isMember("AllowedIps")) {
        if (!root["AllowedIps"].isString()) { throw config_error("config field AllowedIps has the wrong type"); }
        config.allowed_ip_nets = parse_allowed_ip_nets(root["AllowedIps"].asString());
    }
    return config;
}

std::ostream &operator<<(std::ostream &os, supervisor_config const &config) {
    return os << "root_path=" << config.root_path << " interface_name=" << config.interface_name << " http_address=" << config.http_address
              << " friendly_name=" << config.friendly_name << " probe_cache_path=" << config.probe_cache_path
              << " probe_cache_capacity=" << config.probe_cache_capacity << " notify_interval=" << config.notify_interval.count()
              << " allowed_ip_nets=" << config.allowed_ip_nets << " no_probe=" << config.no_probe;
}
