#include "env.hpp"
#include "mediavisor_errors.hpp"
#include "mediavisor_event.hpp"
#include "network_interfaces.hpp"
#include "probe_cache.hpp"
#include "server_supervisor.hpp"
#include "status_http_instance.hpp"
#include "str.hpp"
#include "supervisor_config.hpp"

#include <csignal>
#include <iostream>

volatile std::sig_atomic_t global_exit_value;

void signal_callback_handler(int signum) { global_exit_value = signum; }

namespace {
supervisor_config main_config() {
    auto config = supervisor_config_from_env();
    auto config_filename = env("mediavisor_config_filename", "");
    if (!config_filename.empty()) {
        try {
            config = supervisor_config_load_json(config_filename, config);
        } catch (config_error const &e) {
            mediavisor_event_log("mediavisor_config_error", e.what());
        }
    }
    return config;
}
} // namespace

int main_actions() {
    CALL_ERRNO_BAD_VALUE(signal, SIG_ERR, SIGINT, signal_callback_handler);
    CALL_ERRNO_BAD_VALUE(signal, SIG_ERR, SIGTERM, signal_callback_handler);

    supervisor_config const config = main_config();
    mediavisor_event_log("mediavisor_config", str(config));
    mediavisor_event_log("mediavisor_allowed_ip_nets", str(config.allowed_ip_nets));
    mediavisor_event_log("mediavisor_serving_folder", config.root_path.string());

    ffprobe_prober probe_with;
    server_supervisor supervisor(config, status_http_instance_factory(), &probe_with);
    supervisor.load_cache();

    auto discover = [name = config.interface_name] { return discover_up_interfaces(name); };
    supervisor.start(discover());
    supervisor.launch();
    supervisor.start_monitor(discover);

    while (!global_exit_value) {
        if (supervisor.wait_for_quit_for(std::chrono::seconds(1))) { break; }
    }
    mediavisor_event_log("mediavisor_stop", str("global_exit_value ", global_exit_value));
    supervisor.stop();
    supervisor.rethrow_fatal();
    return 0;
}

int main() {
    int exit_value = 7;
    mediavisor_event_log("mediavisor_init");
    try {
        exit_value = main_actions();
    } catch (const std::exception &e) {
        mediavisor_event_log("mediavisor_exception", e.what());
        exit_value = 11;
    }
    mediavisor_event_log("mediavisor_exit", str("exit_value ", exit_value));
    return exit_value;
}
