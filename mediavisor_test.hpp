#pragma once

#include "call_errno.hpp"
#include "env.hpp"
#include "mediavisor_event.hpp"
#include "str.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

std::vector<std::pair<std::string, std::function<void()>>> &mediavisor_tests();
extern std::vector<std::string> mediavisor_test_failures;

template <typename... arg_types> inline void mediavisor_test_fail(arg_types &&...args) {
    auto s = str(args...);
    std::cout << "mediavisor_test_fail " << s << std::endl;
    mediavisor_test_failures.push_back(std::string{s});

    auto mediavisor_failures_max = env("mediavisor_test_failures_max", 10);
    if (std::cmp_greater_equal(mediavisor_test_failures.size(), mediavisor_failures_max)) {
        throw std::runtime_error(str("Too many test failures: ", mediavisor_test_failures.size(), " last was ", s));
    }
}

#define mediavisor_test_check(a, cmp, b, ...)                                                                                                                  \
    do {                                                                                                                                                       \
        auto lhs = a;                                                                                                                                          \
        auto rhs = b;                                                                                                                                          \
        if (!(lhs cmp rhs)) {                                                                                                                                  \
            mediavisor_test_fail(__FILE__, ":", __LINE__, " ", #a, "=", lhs, " ", #cmp, " ", #b, "=", rhs __VA_OPT__(, " ", ) __VA_ARGS__);                   \
        }                                                                                                                                                      \
    } while (0)

#define mediavisor_test_throws(exception_type, ...)                                                                                                            \
    do {                                                                                                                                                       \
        bool caught = false;                                                                                                                                   \
        try {                                                                                                                                                  \
            __VA_ARGS__;                                                                                                                                       \
        } catch (exception_type const &) { caught = true; }                                                                                                  \
        if (!caught) { mediavisor_test_fail(__FILE__, ":", __LINE__, " expected ", #exception_type, " from ", #__VA_ARGS__); }                             \
    } while (0)

#define TEST(suite_name, test_name)                                                                                                                            \
    void suite_name##_##test_name();                                                                                                                           \
    namespace {                                                                                                                                                \
    auto mediavisor_test_register_##suite_name##_##test_name = mediavisor_tests().emplace_back(#suite_name "_" #test_name, suite_name##_##test_name);          \
    }                                                                                                                                                          \
    void suite_name##_##test_name()

struct tmpdir {
    std::string tmpdir_name;

    inline tmpdir() {
        tmpdir_name = std::filesystem::temp_directory_path().string() + "/mediavisor_test.XXXXXX";
        CALL_ERRNO_BAD_VALUE(mkdtemp, nullptr, tmpdir_name.data()); // can modify since C++11
    }

    inline ~tmpdir() {
        auto removed_count = std::filesystem::remove_all(tmpdir_name);
        std::cout << "tmpdir cleaned " << tmpdir_name << " " << removed_count << std::endl;
    }

    [[nodiscard]] std::filesystem::path path(std::string const &name) const { return std::filesystem::path(tmpdir_name) / name; }
};

template <typename predicate_type> inline bool mediavisor_test_wait_until(predicate_type &&predicate, double seconds = 10) {
    auto deadline = now_unixtime() + seconds;
    while (!predicate()) {
        if (now_unixtime() > deadline) { return false; }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// events logged since since_unixtime with this name
inline size_t mediavisor_test_logged(std::string_view event_name, double since_unixtime) {
    size_t count = 0;
    for (auto const &e : mediavisor_event_log_recent()) {
        if (e.event_name == event_name && e.event_unixtime >= since_unixtime) { ++count; }
    }
    return count;
}
