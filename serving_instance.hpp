#pragma once

#include "call_errno.hpp"
#include "network_interfaces.hpp"
#include "probe_cache.hpp"
#include "supervisor_config.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

// TCP listener for the configured bind address, closed on destruction
struct bound_listener {
    unique_fd listener_fd;

    // throws server_init_error
    explicit bound_listener(std::string const &address);

    [[nodiscard]] uint16_t listener_port() const;
};

struct serving_instance_config {
    int instance_listener_fd;
    interface_set instance_interfaces;
    supervisor_config const &instance_config;
    probe_result_cache &instance_cache;
    prober *instance_prober; // null when probing is disabled
};

// The media serving component, seen from the supervisor. Lifecycle is
// construct, instance_init, instance_run on its own thread, instance_close.
class serving_instance {
  public:
    virtual ~serving_instance() = default;

    virtual void instance_init() = 0;
    // blocks until closed; throws on a fatal condition
    virtual void instance_run() = 0;
    // called at most once, also after a failed init or run
    virtual void instance_close() = 0;
};

using serving_instance_factory = std::function<std::unique_ptr<serving_instance>(serving_instance_config const &)>;
