#include "status_http_instance.hpp"

#include "json_codec.hpp"
#include "mediavisor_errors.hpp"
#include "mediavisor_event.hpp"
#include "str.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <chrono>
#include <cstring>
#include <filesystem>

namespace {
std::string http_response(int status, std::string_view reason, std::string_view body) {
    return str("HTTP/1.1 ", status, " ", reason, "\r\nContent-Type: application/json\r\nContent-Length: ", body.size(),
               "\r\nConnection: close\r\n\r\n", body);
}

std::string http_error(int status, std::string_view reason, std::string_view message) {
    Json::Value body(Json::objectValue);
    body["error"] = std::string(message);
    return http_response(status, reason, json_compact(body) + "\n");
}

void send_fully(int fd, std::string_view data) {
    while (!data.empty()) {
        auto sent = CALL_ERRNO_MINUS_1_RETRY_EINTR(send, fd, data.data(), data.size(), MSG_NOSIGNAL);
        data.remove_prefix(sent);
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
} // namespace

std::optional<std::string> percent_decode(std::string_view s) {
    std::string ret;
    ret.reserve(s.size());
    for (size_t n = 0; s.size() > n; ++n) {
        if (s[n] != '%') {
            ret += s[n];
            continue;
        }
        if (n + 2 >= s.size()) { return std::nullopt; }
        auto hi = hex_value(s[n + 1]);
        auto lo = hex_value(s[n + 2]);
        if (hi < 0 || lo < 0) { return std::nullopt; }
        ret += static_cast<char>(hi * 16 + lo);
        n += 2;
    }
    return ret;
}

void status_http_instance::instance_init() {
    std::error_code ec;
    if (!std::filesystem::is_directory(status_config.instance_config.root_path, ec)) {
        throw server_init_error(str("root path ", status_config.instance_config.root_path, " is not a directory"));
    }
    if (status_config.instance_listener_fd < 0) { throw server_init_error("status_http_instance has no listener"); }
    mediavisor_event_log("status_http_instance_init", str("interfaces ", status_config.instance_interfaces));
}

void status_http_instance::instance_run() {
    add_thread_context _("status_http_instance", status_config.instance_config.friendly_name);
    for (;;) {
        sockaddr_storage peer = {};
        socklen_t peer_len = sizeof(peer);
        auto fd = accept4(status_config.instance_listener_fd, reinterpret_cast<sockaddr *>(&peer), &peer_len, SOCK_CLOEXEC);
        if (fd == -1) {
            if (status_closing) { return; }
            if (errno == EINTR || errno == ECONNABORTED) { continue; }
            throw errno_exception(errno, "accept4");
        }
        unique_fd connection{fd};
        if (!status_track_connection(connection.get())) { return; }
        auto forget_connection = make_unique_ptr_closer(this, [](status_http_instance *instance) { instance->status_track_connection(-1); });

        bool allowed = false;
        for (auto const &net : status_config.instance_config.allowed_ip_nets) {
            if (net.contains(reinterpret_cast<sockaddr *>(&peer))) {
                allowed = true;
                break;
            }
        }
        try {
            if (!allowed) {
                send_fully(connection.get(), http_error(403, "Forbidden", "client address not allowed"));
                continue;
            }
            status_serve_connection(connection.get());
        } catch (std::exception const &e) {
            // one bad client does not take the component down
            mediavisor_event_log("status_http_instance_connection_failed", e.what());
        }
    }
}

bool status_http_instance::status_track_connection(int connection_fd) {
    std::lock_guard _{status_connection_mutex};
    if (connection_fd != -1 && status_closing) { return false; }
    status_connection_fd = connection_fd;
    return true;
}

void status_http_instance::status_serve_connection(int connection_fd) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(status_request_timeout);
    std::string request;
    char buffer[4096];
    while (request.find("\r\n\r\n") == std::string::npos && request.size() < 16 * 1024) {
        if (status_closing) { return; }
        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) { throw errno_exception(ETIMEDOUT, "recv request"); }
        timeval timeout{.tv_sec = remaining / 1000000, .tv_usec = remaining % 1000000};
        CALL_ERRNO_MINUS_1(setsockopt, connection_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        auto got = CALL_ERRNO_MINUS_1_RETRY_EINTR(recv, connection_fd, buffer, sizeof(buffer), 0);
        if (!got) { break; }
        request.append(buffer, got);
    }
    if (status_closing) { return; }

    auto request_line = std::string_view(request).substr(0, request.find("\r\n"));
    auto parts = str_split(request_line, ' ');
    if (parts.size() != 3) {
        send_fully(connection_fd, http_error(400, "Bad Request", "malformed request line"));
        return;
    }
    send_fully(connection_fd, status_respond(parts[0], parts[1]));
}

std::string status_http_instance::status_respond(std::string_view method, std::string_view target) {
    if (method != "GET") { return http_error(405, "Method Not Allowed", "only GET is served"); }
    target = target.substr(0, target.find('?'));

    if (target == "/") {
        Json::Value body(Json::objectValue);
        body["friendly_name"] = status_config.instance_config.friendly_name;
        body["interfaces"] = Json::Value(Json::arrayValue);
        for (auto const &ni : status_config.instance_interfaces) { body["interfaces"].append(ni.interface_name); }
        body["probe_cache_entries"] = Json::UInt64(status_config.instance_cache.cache_count());
        body["probe_cache_bytes"] = Json::Int64(status_config.instance_cache.cache_total_size());
        return http_response(200, "OK", json_compact(body) + "\n");
    }

    constexpr std::string_view probe_prefix = "/probe/";
    if (target.substr(0, probe_prefix.size()) == probe_prefix) {
        auto relative = percent_decode(target.substr(probe_prefix.size()));
        if (!relative) { return http_error(400, "Bad Request", "malformed escape in path"); }
        for (auto segment : str_split(*relative, '/')) {
            if (segment == "..") { return http_error(403, "Forbidden", "path leaves the root"); }
        }
        if (!status_config.instance_prober) { return http_error(404, "Not Found", "probing is disabled"); }
        auto path = status_config.instance_config.root_path / std::filesystem::path(*relative).relative_path();
        try {
            auto result = probe_cached(status_config.instance_cache, *status_config.instance_prober, path);
            return http_response(200, "OK", json_compact(result.probe_json) + "\n");
        } catch (std::exception const &e) {
            mediavisor_event_log("status_http_instance_probe_failed", e.what());
            return http_error(404, "Not Found", e.what());
        }
    }
    return http_error(404, "Not Found", "no such page");
}

void status_http_instance::instance_close() {
    if (status_closing.exchange(true)) { return; }
    // wakes accept4 with EINVAL; the fd itself belongs to the supervisor's bound_listener
    if (shutdown(status_config.instance_listener_fd, SHUT_RDWR) == -1 && errno != ENOTCONN && errno != EBADF) {
        throw errno_exception(errno, "shutdown");
    }
    {
        // a client in the middle of a request sees its connection end
        std::lock_guard _{status_connection_mutex};
        if (status_connection_fd != -1 && shutdown(status_connection_fd, SHUT_RDWR) == -1 && errno != ENOTCONN) {
            mediavisor_event_log("status_http_instance_connection_shutdown_failed", std::strerror(errno));
        }
    }
    mediavisor_event_log("status_http_instance_closed", status_config.instance_config.friendly_name);
}

serving_instance_factory status_http_instance_factory() {
    return [](serving_instance_config const &config) -> std::unique_ptr<serving_instance> {
        return std::make_unique<status_http_instance>(config);
    };
}
