#pragma once

#include "mediavisor_test.hpp"
#include "server_supervisor.hpp"
#include "str.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

// Records what the supervisor does to its instances; shared by every fake_instance it creates.
struct fake_world {
    std::mutex fake_mutex;
    std::vector<std::string> fake_calls;
    std::atomic<int> fake_open = 0; // initialized and not yet closed
    std::atomic<int> fake_open_max = 0;
    std::atomic<bool> fake_fail_init = false;
    std::atomic<bool> fake_fail_run = false;
    std::atomic<bool> fake_fail_close = false;

    void record(std::string const &call) {
        std::lock_guard _{fake_mutex};
        fake_calls.push_back(call);
    }

    size_t calls(std::string const &call) {
        std::lock_guard _{fake_mutex};
        return std::count(fake_calls.begin(), fake_calls.end(), call);
    }
};

class fake_instance : public serving_instance {
  public:
    fake_instance(fake_world &world, serving_instance_config const &config) : fake(world), fake_interface_count(config.instance_interfaces.size()) {}

    void instance_init() override {
        fake.record("init");
        if (fake.fake_fail_init) { throw std::runtime_error("fake init failure"); }
        fake_initialized = true;
        fake.record(str("interfaces ", fake_interface_count));
        int open = ++fake.fake_open;
        int seen = fake.fake_open_max;
        while (open > seen && !fake.fake_open_max.compare_exchange_weak(seen, open)) {}
    }

    void instance_run() override {
        fake.record("run");
        if (fake.fake_fail_run) { throw std::runtime_error("fake run failure"); }
        std::unique_lock lock{fake_mutex};
        fake_condition.wait(lock, [&] { return fake_closed; });
    }

    void instance_close() override {
        fake.record("close");
        {
            std::lock_guard _{fake_mutex};
            fake_closed = true;
        }
        fake_condition.notify_all();
        if (fake_initialized) { --fake.fake_open; }
        if (fake.fake_fail_close) { throw std::runtime_error("fake close failure"); }
    }

  private:
    fake_world &fake;
    size_t fake_interface_count;
    bool fake_initialized = false;
    std::mutex fake_mutex;
    std::condition_variable fake_condition;
    bool fake_closed = false;
};

inline serving_instance_factory fake_factory(fake_world &world) {
    return [&world](serving_instance_config const &config) -> std::unique_ptr<serving_instance> {
        return std::make_unique<fake_instance>(world, config);
    };
}

inline supervisor_config fake_config(tmpdir const &dir) {
    supervisor_config config;
    config.root_path = dir.tmpdir_name;
    config.http_address = "127.0.0.1:0";
    config.friendly_name = "mediavisor test";
    config.probe_cache_path = dir.path("probe-cache");
    config.probe_cache_capacity = 1 << 20;
    config.notify_interval = std::chrono::milliseconds(10);
    config.allowed_ip_nets = parse_allowed_ip_nets("");
    return config;
}

inline interface_set fake_interfaces(int count) {
    interface_set ret;
    for (int n = 0; count > n; ++n) { ret.push_back(network_interface{.interface_name = str("fake", n), .interface_flags = 1, .interface_mtu = 1500}); }
    return ret;
}
