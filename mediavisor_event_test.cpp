#include "mediavisor_event.hpp"
#include "json_codec.hpp"
#include "mediavisor_test.hpp"

#include <fstream>

TEST(mediavisor_event_suite, event_log_test) {
    auto since = now_unixtime();
    {
        add_thread_context _("mediavisor_event_test", "context value");
        mediavisor_event_log("test_event_name", "test_event_message");
    }

    uint64_t count = 0;
    for (auto const &event : mediavisor_event_log_recent()) {
        if (event.event_name == "test_event_name" && event.event_message == "test_event_message" && event.event_unixtime >= since) { ++count; }
    }
    mediavisor_test_check(count, ==, 1u);
    mediavisor_test_check(thread_context.count("mediavisor_event_test"), ==, 0u);
}

TEST(mediavisor_event_suite, event_log_file_gets_json_lines) {
    tmpdir dir;
    auto path = dir.path("events.jsonl");
    setenv("mediavisor_event_log_filename", path.c_str(), 1);
    mediavisor_event_log_reload_settings();
    mediavisor_event_log("test_event_to_file", "quote \" and newline \n");
    unsetenv("mediavisor_event_log_filename");
    // closes the file again
    mediavisor_event_log_reload_settings();
    mediavisor_event_log("test_event_not_to_file");

    std::ifstream i{path};
    std::string line;
    std::vector<Json::Value> lines;
    while (std::getline(i, line)) { lines.push_back(json_parse(line)); }
    mediavisor_test_check(lines.size(), ==, 1u);
    if (!lines.empty()) {
        mediavisor_test_check(lines[0]["event_name"].asString(), ==, "test_event_to_file");
        mediavisor_test_check(lines[0]["event_message"].asString(), ==, "quote \" and newline \n");
        mediavisor_test_check(lines[0]["event_unixtime"].isNumeric(), ==, true);
    }
}

TEST(mediavisor_event_suite, recent_events_are_bounded) {
    setenv("mediavisor_event_log_recent_max", "5", 1);
    mediavisor_event_log_reload_settings();
    for (int n = 0; 20 > n; ++n) { mediavisor_event_log("test_event_flood", str(n)); }
    auto recent = mediavisor_event_log_recent();
    unsetenv("mediavisor_event_log_recent_max");
    mediavisor_event_log_reload_settings();
    mediavisor_test_check(recent.size(), ==, 5u);
    mediavisor_test_check(recent.back().event_message, ==, "19");
}

TEST(mediavisor_event_suite, negative_recent_max_keeps_nothing) {
    setenv("mediavisor_event_log_recent_max", "-1", 1);
    mediavisor_event_log_reload_settings();
    mediavisor_event_log("test_event_unkept");
    mediavisor_event_log("test_event_unkept");
    auto recent = mediavisor_event_log_recent();
    unsetenv("mediavisor_event_log_recent_max");
    mediavisor_event_log_reload_settings();
    mediavisor_test_check(recent.size(), ==, 0u);

    mediavisor_event_log("test_event_kept_again");
    mediavisor_test_check(mediavisor_event_log_recent().size(), ==, 1u);
}

TEST(mediavisor_event_suite, env_rejects_trailing_garbage) {
    setenv("mediavisor_test_env_value", "12abc", 1);
    mediavisor_test_check(env("mediavisor_test_env_value", 7), ==, 7);
    setenv("mediavisor_test_env_value", " 12 ", 1);
    mediavisor_test_check(env("mediavisor_test_env_value", 7), ==, 12);
    setenv("mediavisor_test_env_value", "yes", 1);
    mediavisor_test_check(env("mediavisor_test_env_value", false), ==, true);
    setenv("mediavisor_test_env_value", "perhaps", 1);
    mediavisor_test_check(env("mediavisor_test_env_value", true), ==, true);
    unsetenv("mediavisor_test_env_value");
    mediavisor_test_check(env("mediavisor_test_env_value", "fallback"), ==, "fallback");
}

TEST(mediavisor_event_suite, settings_change_only_on_reload) {
    setenv("mediavisor_event_log_recent_max", "1", 1);
    for (int n = 0; 3 > n; ++n) { mediavisor_event_log("test_event_before_reload", str(n)); }
    unsetenv("mediavisor_event_log_recent_max");
    mediavisor_test_check(mediavisor_event_log_recent().size(), >=, 3u);
}
