#include "server_supervisor.hpp"

#include "cache_persistence.hpp"
#include "loop_thread.hpp"
#include "mediavisor_errors.hpp"
#include "mediavisor_event.hpp"
#include "str.hpp"

#include <stdexcept>

namespace {
std::string describe_exception(std::exception_ptr failure) {
    try {
        std::rethrow_exception(failure);
    } catch (std::exception const &e) {
        return e.what();
    } catch (...) {
        // still held in the exception_ptr, only the description is unknown
        return "unknown exception";
    }
}

void close_instance_logged(serving_instance &instance) {
    try {
        instance.instance_close();
    } catch (std::exception const &e) {
        mediavisor_event_log("supervisor_instance_close_failed", e.what());
    }
}

// runs instance_run once on its own thread
class serving_instance_runner : public loop_thread {
  public:
    serving_instance_runner(server_supervisor &supervisor, serving_instance &instance) : runner_supervisor(supervisor), runner_instance(instance) {
        loop_spawn();
    }
    ~serving_instance_runner() override { loop_stop_join(); }

    std::atomic<bool> runner_closing = false;

  protected:
    bool loop_run_once() override {
        runner_instance.instance_run();
        if (!runner_closing) { mediavisor_event_log("supervisor_instance_run_returned"); }
        return true;
    }

    void loop_failed(std::exception_ptr failure) override {
        if (runner_closing) {
            mediavisor_event_log("supervisor_instance_run_failed_while_closing", describe_exception(failure));
            return;
        }
        runner_supervisor.report_fatal(std::make_exception_ptr(server_runtime_error(str("serving instance run failed: ", describe_exception(failure)))));
    }

  private:
    server_supervisor &runner_supervisor;
    serving_instance &runner_instance;
};
} // namespace

class supervisor_run_loop : public loop_thread {
  public:
    explicit supervisor_run_loop(server_supervisor &supervisor) : loop_supervisor(supervisor) { loop_spawn(); }
    ~supervisor_run_loop() override { loop_stop_join(); }

  protected:
    void loop_started() override { mediavisor_event_log("supervisor_starting"); }
    bool loop_run_once() override {
        loop_supervisor.wait_quit_signal();
        return true;
    }
    void loop_stopped() override { mediavisor_event_log("supervisor_quit_received"); }

  private:
    server_supervisor &loop_supervisor;
};

struct server_supervisor::supervised_instance {
    // destroyed bottom up: the run thread is joined before the instance goes, the listener last
    std::unique_ptr<bound_listener> instance_listener;
    interface_set instance_interfaces;
    std::unique_ptr<serving_instance> instance;
    std::unique_ptr<serving_instance_runner> instance_runner;
};

std::ostream &operator<<(std::ostream &os, instance_state state) {
    switch (state) {
    case instance_state::absent: return os << "absent";
    case instance_state::starting: return os << "starting";
    case instance_state::running: return os << "running";
    case instance_state::closing: return os << "closing";
    }
    return os << "instance_state(" << static_cast<int>(state) << ")";
}

server_supervisor::server_supervisor(supervisor_config const &config, serving_instance_factory factory, prober *probe_with)
    : supervisor_settings(config), supervisor_factory(std::move(factory)), supervisor_prober(probe_with),
      supervisor_cache(std::make_unique<random_replacement_store<probe_cache_key, probe_result>>(config.probe_cache_capacity)) {
    if (!supervisor_factory) { throw std::invalid_argument("server_supervisor needs a serving_instance_factory"); }
}

server_supervisor::~server_supervisor() { stop(); }

void server_supervisor::load_cache() {
    if (supervisor_settings.probe_cache_path.empty()) { return; }
    try {
        cache_persistence_load(supervisor_settings.probe_cache_path, supervisor_cache);
    } catch (cache_load_error const &e) {
        mediavisor_event_log("supervisor_cache_load_failed", e.what());
    }
}

void server_supervisor::launch() {
    std::lock_guard _{supervisor_replace_mutex};
    if (supervisor_loop) { return; }
    supervisor_loop = std::make_unique<supervisor_run_loop>(*this);
}

void server_supervisor::start(interface_set interfaces) {
    std::lock_guard _{supervisor_replace_mutex};
    start_locked(std::move(interfaces));
}

void server_supervisor::replace(interface_set interfaces) {
    std::lock_guard _{supervisor_replace_mutex};
    if (supervisor_stopped) {
        mediavisor_event_log("supervisor_replace_after_stop", str("ignored ", interfaces));
        return;
    }
    close_current_locked();
    start_locked(std::move(interfaces));
}

void server_supervisor::start_monitor(interface_discovery discover) {
    std::lock_guard _{supervisor_replace_mutex};
    if (supervisor_stopped) { throw std::logic_error("server_supervisor::start_monitor after stop"); }
    if (supervisor_monitor) { throw std::logic_error("server_supervisor::start_monitor called twice"); }
    supervisor_monitor = std::make_unique<interface_monitor>(*this, std::move(discover), supervisor_settings.notify_interval);
}

void server_supervisor::start_locked(interface_set interfaces) {
    {
        std::lock_guard _{supervisor_state_mutex};
        if (supervisor_current) { throw std::logic_error("server_supervisor::start with an instance already current"); }
        supervisor_state = instance_state::starting;
    }
    auto next = std::make_unique<supervised_instance>();
    next->instance_interfaces = std::move(interfaces);
    auto abandon = [&] {
        if (next->instance) { close_instance_logged(*next->instance); }
        std::lock_guard _{supervisor_state_mutex};
        supervisor_state = instance_state::absent;
    };
    try {
        next->instance_listener = std::make_unique<bound_listener>(supervisor_settings.http_address);
        next->instance = supervisor_factory(serving_instance_config{
                .instance_listener_fd = next->instance_listener->listener_fd.get(),
                .instance_interfaces = next->instance_interfaces,
                .instance_config = supervisor_settings,
                .instance_cache = supervisor_cache,
                .instance_prober = supervisor_settings.no_probe ? nullptr : supervisor_prober,
        });
        if (!next->instance) { throw server_init_error("serving_instance_factory returned no instance"); }
        next->instance->instance_init();
        next->instance_runner = std::make_unique<serving_instance_runner>(*this, *next->instance);
    } catch (server_init_error const &) {
        abandon();
        throw;
    } catch (std::exception const &e) {
        abandon();
        throw server_init_error(str("error initing serving instance: ", e.what()));
    }

    auto bound = next->instance_interfaces;
    {
        std::lock_guard _{supervisor_state_mutex};
        supervisor_current = std::move(next);
        supervisor_state = instance_state::running;
        ++supervisor_started_count;
    }
    mediavisor_event_log("supervisor_instance_started", str("interfaces ", bound, " address ", supervisor_settings.http_address));
}

void server_supervisor::close_current_locked() {
    supervised_instance *current;
    {
        std::lock_guard _{supervisor_state_mutex};
        if (!supervisor_current) { return; }
        supervisor_state = instance_state::closing;
        current = supervisor_current.get();
    }
    current->instance_runner->runner_closing = true;
    close_instance_logged(*current->instance);
    current->instance_runner.reset();

    std::unique_ptr<supervised_instance> closed;
    {
        std::lock_guard _{supervisor_state_mutex};
        closed = std::move(supervisor_current);
        supervisor_state = instance_state::absent;
    }
    closed.reset();
    mediavisor_event_log("supervisor_instance_closed");
}

void server_supervisor::stop() {
    if (supervisor_stopped.exchange(true)) { return; }
    mediavisor_event_log("supervisor_stopping");

    // joined first: it may be in the middle of a replace
    supervisor_monitor.reset();
    {
        std::lock_guard _{supervisor_replace_mutex};
        close_current_locked();
    }
    if (supervisor_settings.probe_cache_path.empty()) {
        mediavisor_event_log("supervisor_cache_not_saved", "no probe cache path");
    } else {
        try {
            cache_persistence_save(supervisor_settings.probe_cache_path, supervisor_cache);
        } catch (std::exception const &e) {
            mediavisor_event_log("supervisor_cache_save_failed", e.what());
        }
    }
    signal_quit();
    supervisor_loop.reset();
    mediavisor_event_log("supervisor_stopped");
}

void server_supervisor::report_fatal(std::exception_ptr failure) {
    mediavisor_event_log("supervisor_fatal", describe_exception(failure));
    {
        std::lock_guard _{supervisor_quit_mutex};
        if (!supervisor_fatal) { supervisor_fatal = failure; }
        supervisor_quit = true;
    }
    supervisor_quit_condition.notify_all();
}

void server_supervisor::signal_quit() {
    {
        std::lock_guard _{supervisor_quit_mutex};
        supervisor_quit = true;
    }
    supervisor_quit_condition.notify_all();
}

void server_supervisor::wait_quit_signal() {
    std::unique_lock lock{supervisor_quit_mutex};
    supervisor_quit_condition.wait(lock, [&] { return supervisor_quit; });
}

bool server_supervisor::wait_for_quit_for(std::chrono::duration<double> duration) {
    std::unique_lock lock{supervisor_quit_mutex};
    return supervisor_quit_condition.wait_for(lock, duration, [&] { return supervisor_quit; });
}

void server_supervisor::wait_for_quit() {
    wait_quit_signal();
    rethrow_fatal();
}

void server_supervisor::rethrow_fatal() {
    std::exception_ptr fatal;
    {
        std::lock_guard _{supervisor_quit_mutex};
        fatal = supervisor_fatal;
    }
    if (fatal) { std::rethrow_exception(fatal); }
}

interface_set server_supervisor::bound_interfaces() const {
    std::lock_guard _{supervisor_state_mutex};
    if (!supervisor_current) { return {}; }
    return supervisor_current->instance_interfaces;
}

instance_state server_supervisor::current_state() const {
    std::lock_guard _{supervisor_state_mutex};
    return supervisor_state;
}

uint64_t server_supervisor::instances_started() const {
    std::lock_guard _{supervisor_state_mutex};
    return supervisor_started_count;
}
