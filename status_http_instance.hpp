#pragma once

#include "serving_instance.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Minimal HTTP serving component: a JSON status page and memoized probes of files
// under the root path. One connection at a time.
class status_http_instance : public serving_instance {
  public:
    // request_timeout bounds reading one whole request, however slowly the client sends it
    explicit status_http_instance(serving_instance_config const &config, std::chrono::duration<double> request_timeout = std::chrono::seconds(5))
        : status_config(config), status_request_timeout(request_timeout) {}

    void instance_init() override;
    void instance_run() override;
    void instance_close() override;

    // exposed for tests: full response for one request target
    std::string status_respond(std::string_view method, std::string_view target);

  private:
    void status_serve_connection(int connection_fd);
    // false when closing already started; -1 forgets the current connection
    bool status_track_connection(int connection_fd);

    serving_instance_config status_config;
    std::chrono::duration<double> status_request_timeout;
    std::atomic<bool> status_closing = false;
    std::mutex status_connection_mutex;
    int status_connection_fd = -1;
};

serving_instance_factory status_http_instance_factory();

// nullopt on a malformed escape
std::optional<std::string> percent_decode(std::string_view s);
