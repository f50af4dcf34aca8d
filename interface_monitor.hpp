#pragma once

#include "loop_thread.hpp"
#include "network_interfaces.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>

class server_supervisor;

// Polls interfaces and asks the supervisor to replace the running instance when more
// are available than the instance is bound to. Fewer never triggers a replace, so a
// flapping interface does not bounce the server. Discovery or replace failures are
// fatal and go to server_supervisor::report_fatal.
class interface_monitor : public loop_thread {
  public:
    interface_monitor(server_supervisor &supervisor, interface_discovery discover, std::chrono::duration<double> interval);
    ~interface_monitor() override;

    // one poll without the sleep; true when the instance was replaced
    bool monitor_check_once();
    [[nodiscard]] uint64_t monitor_replacements() const { return monitor_replace_count.load(); }

  protected:
    bool loop_run_once() override;
    void loop_failed(std::exception_ptr failure) override;

  private:
    server_supervisor &monitor_supervisor;
    interface_discovery monitor_discover;
    std::chrono::duration<double> monitor_interval;
    std::atomic<uint64_t> monitor_replace_count = 0;
};
