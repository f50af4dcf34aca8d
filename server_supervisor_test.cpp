#include "cache_persistence.hpp"
#include "fake_serving_instance.hpp"
#include "mediavisor_test.hpp"
#include "server_supervisor.hpp"

#include <fstream>
#include <thread>

TEST(server_supervisor_suite, start_then_stop) {
    tmpdir dir;
    fake_world world;
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);
    mediavisor_test_check(supervisor.current_state(), ==, instance_state::absent);

    supervisor.start(fake_interfaces(1));
    mediavisor_test_check(supervisor.current_state(), ==, instance_state::running);
    mediavisor_test_check(supervisor.bound_interfaces().size(), ==, 1u);
    mediavisor_test_check(supervisor.instances_started(), ==, 1u);
    mediavisor_test_check(mediavisor_test_wait_until([&] { return world.calls("run") == 1; }), ==, true);

    supervisor.stop();
    mediavisor_test_check(supervisor.current_state(), ==, instance_state::absent);
    mediavisor_test_check(world.calls("close"), ==, 1u);
    mediavisor_test_check(world.fake_open.load(), ==, 0);
    mediavisor_test_check(std::filesystem::exists(dir.path("probe-cache")), ==, true);
}

TEST(server_supervisor_suite, replace_closes_before_starting) {
    tmpdir dir;
    fake_world world;
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);
    supervisor.start(fake_interfaces(1));
    supervisor.replace(fake_interfaces(2));

    mediavisor_test_check(world.calls("init"), ==, 2u);
    mediavisor_test_check(world.calls("close"), ==, 1u);
    mediavisor_test_check(world.calls("interfaces 2"), ==, 1u);
    mediavisor_test_check(world.fake_open_max.load(), ==, 1);
    mediavisor_test_check(supervisor.bound_interfaces(), ==, fake_interfaces(2));
    mediavisor_test_check(supervisor.current_state(), ==, instance_state::running);
}

TEST(server_supervisor_suite, init_failure_leaves_no_instance) {
    tmpdir dir;
    fake_world world;
    world.fake_fail_init = true;
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);

    mediavisor_test_throws(server_init_error, supervisor.start(fake_interfaces(1)));
    mediavisor_test_check(supervisor.current_state(), ==, instance_state::absent);
    mediavisor_test_check(supervisor.bound_interfaces().size(), ==, 0u);
    mediavisor_test_check(supervisor.instances_started(), ==, 0u);
    // the half made instance is still closed
    mediavisor_test_check(world.calls("close"), ==, 1u);
    mediavisor_test_check(world.calls("run"), ==, 0u);
}

TEST(server_supervisor_suite, unusable_bind_address_is_init_error) {
    tmpdir dir;
    fake_world world;
    auto config = fake_config(dir);
    config.http_address = "127.0.0.1";
    server_supervisor supervisor(config, fake_factory(world), nullptr);

    mediavisor_test_throws(server_init_error, supervisor.start(fake_interfaces(1)));
    mediavisor_test_check(world.calls("init"), ==, 0u);
    mediavisor_test_check(supervisor.current_state(), ==, instance_state::absent);
}

TEST(server_supervisor_suite, run_failure_is_fatal) {
    tmpdir dir;
    fake_world world;
    world.fake_fail_run = true;
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);
    supervisor.launch();
    supervisor.start(fake_interfaces(1));

    mediavisor_test_throws(server_runtime_error, supervisor.wait_for_quit());
    supervisor.stop();
    mediavisor_test_check(world.calls("close"), ==, 1u);
}

TEST(server_supervisor_suite, stop_saves_cache_when_close_fails) {
    tmpdir dir;
    fake_world world;
    world.fake_fail_close = true;
    auto since = now_unixtime();
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);
    supervisor.launch();
    supervisor.start(fake_interfaces(1));
    Json::Value probed(Json::objectValue);
    probed["format"]["format_name"] = "matroska,webm";
    supervisor.cache().cache_set({"/media/a.mkv", 5}, probe_result{probed});

    supervisor.stop();
    mediavisor_test_check(mediavisor_test_logged("supervisor_instance_close_failed", since), ==, 1u);

    probe_result_cache reloaded(std::make_unique<random_replacement_store<probe_cache_key, probe_result>>(1 << 20));
    mediavisor_test_check(cache_persistence_load(dir.path("probe-cache"), reloaded), ==, 1u);
    mediavisor_test_check(reloaded.cache_get({"/media/a.mkv", 5}).has_value(), ==, true);
}

TEST(server_supervisor_suite, stop_is_idempotent_and_joins_the_run_loop) {
    tmpdir dir;
    fake_world world;
    auto since = now_unixtime();
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);
    supervisor.launch();
    supervisor.start(fake_interfaces(1));
    mediavisor_test_check(supervisor.wait_for_quit_for(std::chrono::milliseconds(1)), ==, false);

    supervisor.stop();
    // the run loop logs this as it exits, and stop joins it
    mediavisor_test_check(mediavisor_test_logged("supervisor_quit_received", since), ==, 1u);
    mediavisor_test_check(supervisor.wait_for_quit_for(std::chrono::milliseconds(0)), ==, true);

    supervisor.stop();
    mediavisor_test_check(mediavisor_test_logged("supervisor_stopped", since), ==, 1u);
    mediavisor_test_check(world.calls("close"), ==, 1u);
    supervisor.rethrow_fatal();
}

TEST(server_supervisor_suite, replace_after_stop_is_ignored) {
    tmpdir dir;
    fake_world world;
    auto since = now_unixtime();
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);
    supervisor.start(fake_interfaces(1));
    supervisor.stop();

    supervisor.replace(fake_interfaces(3));
    mediavisor_test_check(supervisor.instances_started(), ==, 1u);
    mediavisor_test_check(supervisor.current_state(), ==, instance_state::absent);
    mediavisor_test_check(mediavisor_test_logged("supervisor_replace_after_stop", since), ==, 1u);
}

TEST(server_supervisor_suite, concurrent_replaces_are_serialized) {
    tmpdir dir;
    fake_world world;
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);
    supervisor.start(fake_interfaces(1));

    std::vector<std::thread> threads;
    for (int t = 0; 4 > t; ++t) {
        threads.emplace_back([&supervisor, t] {
            for (int n = 0; 5 > n; ++n) { supervisor.replace(fake_interfaces(2 + t)); }
        });
    }
    for (auto &t : threads) { t.join(); }

    mediavisor_test_check(supervisor.instances_started(), ==, 21u);
    mediavisor_test_check(world.calls("close"), ==, 20u);
    mediavisor_test_check(world.fake_open_max.load(), ==, 1);
    mediavisor_test_check(world.fake_open.load(), ==, 1);
    mediavisor_test_check(supervisor.current_state(), ==, instance_state::running);
}

TEST(server_supervisor_suite, broken_cache_file_is_logged) {
    tmpdir dir;
    fake_world world;
    {
        std::ofstream o{dir.path("probe-cache")};
        o << "{ not a snapshot";
    }
    auto since = now_unixtime();
    server_supervisor supervisor(fake_config(dir), fake_factory(world), nullptr);
    supervisor.load_cache();
    mediavisor_test_check(mediavisor_test_logged("supervisor_cache_load_failed", since), ==, 1u);
    mediavisor_test_check(supervisor.cache().cache_count(), ==, 0u);
}

TEST(server_supervisor_suite, probing_disabled_hides_prober) {
    tmpdir dir;
    struct never_prober : prober {
        probe_result probe(std::filesystem::path const &) override { throw probe_error("never"); }
    } never;
    auto config = fake_config(dir);
    config.no_probe = true;
    prober *seen = &never;
    server_supervisor supervisor(
            config,
            [&seen](serving_instance_config const &instance_config) -> std::unique_ptr<serving_instance> {
                seen = instance_config.instance_prober;
                throw server_init_error("only looking at the config");
            },
            &never);
    mediavisor_test_throws(server_init_error, supervisor.start(fake_interfaces(1)));
    mediavisor_test_check(seen == nullptr, ==, true);
}
