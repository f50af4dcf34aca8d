#include "interface_monitor.hpp"

#include "mediavisor_event.hpp"
#include "server_supervisor.hpp"
#include "str.hpp"

interface_monitor::interface_monitor(server_supervisor &supervisor, interface_discovery discover, std::chrono::duration<double> interval)
    : monitor_supervisor(supervisor), monitor_discover(std::move(discover)), monitor_interval(interval) {
    loop_spawn();
}

interface_monitor::~interface_monitor() { loop_stop_join(); }

bool interface_monitor::loop_run_once() {
    if (loop_sleep_for(monitor_interval)) { return true; }
    monitor_check_once();
    return false;
}

bool interface_monitor::monitor_check_once() {
    add_thread_context _("interface_monitor", "check");
    auto available = monitor_discover();
    auto bound = monitor_supervisor.bound_interfaces();
    if (available.size() <= bound.size()) { return false; }

    mediavisor_event_log("interface_monitor_replace", str("bound ", bound, " available ", available));
    monitor_supervisor.replace(std::move(available));
    ++monitor_replace_count;
    return true;
}

void interface_monitor::loop_failed(std::exception_ptr failure) { monitor_supervisor.report_fatal(failure); }
