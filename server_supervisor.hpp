#pragma once

#include "interface_monitor.hpp"
#include "network_interfaces.hpp"
#include "probe_cache.hpp"
#include "serving_instance.hpp"
#include "supervisor_config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <ostream>

enum class instance_state { absent, starting, running, closing };

std::ostream &operator<<(std::ostream &os, instance_state state);

class supervisor_run_loop;

// Owns the probe cache and the one current serving instance. start, replace and stop
// are serialized against each other; the cache is only touched by load_cache and stop.
class server_supervisor {
  public:
    server_supervisor(supervisor_config const &config, serving_instance_factory factory, prober *probe_with);
    ~server_supervisor();

    server_supervisor(server_supervisor const &) = delete;
    server_supervisor &operator=(server_supervisor const &) = delete;

    // a missing file is fine, a broken one is logged and the cache stays as it was
    void load_cache();
    // starts the top-level loop that runs until quit is signalled
    void launch();
    // throws server_init_error, which is fatal
    void start(interface_set interfaces);
    // closes the current instance, logging close errors, then starts a new one
    void replace(interface_set interfaces);
    void start_monitor(interface_discovery discover);
    // idempotent; nothing started by this supervisor is still running when it returns
    void stop();

    // first failure wins; signals quit
    void report_fatal(std::exception_ptr failure);
    // true once quit was signalled
    bool wait_for_quit_for(std::chrono::duration<double> duration);
    // waits for quit then rethrows the fatal failure, if any
    void wait_for_quit();
    void rethrow_fatal();

    [[nodiscard]] interface_set bound_interfaces() const;
    [[nodiscard]] instance_state current_state() const;
    [[nodiscard]] uint64_t instances_started() const;
    [[nodiscard]] probe_result_cache &cache() { return supervisor_cache; }

  private:
    struct supervised_instance;
    friend class supervisor_run_loop;

    void start_locked(interface_set interfaces);
    void close_current_locked();
    void signal_quit();
    void wait_quit_signal();

    supervisor_config const supervisor_settings;
    serving_instance_factory supervisor_factory;
    prober *supervisor_prober;
    probe_result_cache supervisor_cache;

    std::mutex supervisor_replace_mutex;
    mutable std::mutex supervisor_state_mutex;
    std::unique_ptr<supervised_instance> supervisor_current;
    instance_state supervisor_state = instance_state::absent;
    uint64_t supervisor_started_count = 0;

    std::mutex supervisor_quit_mutex;
    std::condition_variable supervisor_quit_condition;
    bool supervisor_quit = false;
    std::exception_ptr supervisor_fatal;

    std::unique_ptr<supervisor_run_loop> supervisor_loop;
    std::unique_ptr<interface_monitor> supervisor_monitor;
    std::atomic<bool> supervisor_stopped = false;
};
