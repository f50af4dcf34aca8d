#include "mediavisor_event.hpp"

#include "env.hpp"
#include "json_codec.hpp"
#include "thread_context.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>
#include <utility>

thread_local std::unordered_map<std::string_view, std::string> thread_context;

namespace {
struct mediavisor_event_store {
    std::mutex event_mutex;
    std::deque<mediavisor_event> event_recent;
    size_t event_recent_max = 1024;
    std::ofstream event_file;
    std::string event_file_name;

    mediavisor_event_store() { load_settings(); }

    // caller holds event_mutex, except during construction
    void load_settings() {
        event_recent_max = static_cast<size_t>(std::max<int64_t>(0, env("mediavisor_event_log_recent_max", int64_t(1024))));
        auto filename = env("mediavisor_event_log_filename", "");
        if (filename == event_file_name) { return; }
        event_file.close();
        event_file_name = filename;
        if (!filename.empty()) {
            event_file.open(filename, std::ios::out | std::ios::app);
            if (!event_file) { std::cerr << "mediavisor_event_log cannot open " << filename << std::endl; }
        }
    }

    void trim_recent() {
        while (!event_recent.empty() && event_recent.size() > event_recent_max) { event_recent.pop_front(); }
    }
};

mediavisor_event_store &event_store() {
    static mediavisor_event_store store;
    return store;
}

std::string event_line(mediavisor_event const &event) {
    Json::Value line(Json::objectValue);
    line["event_unixtime"] = event.event_unixtime;
    line["event_name"] = event.event_name;
    line["event_message"] = event.event_message;
    line["event_compilation_timestamp"] = __DATE__ " " __TIME__;
    for (auto const &[k, v] : thread_context) { line["event_thread_context"][std::string(k)] = v; }
    return json_compact(line);
}
} // namespace

void mediavisor_event_log(std::string_view event_name, std::string_view event_message) {
    mediavisor_event event{
            .event_unixtime = now_unixtime(),
            .event_name = std::string(event_name),
            .event_message = std::string(event_message),
    };
    auto line = event_line(event);

    auto &store = event_store();
    std::lock_guard _{store.event_mutex};
    std::cout << line << std::endl;

    if (store.event_file.is_open()) { store.event_file << line << std::endl; }

    store.event_recent.push_back(std::move(event));
    store.trim_recent();
}

void mediavisor_event_log_reload_settings() {
    auto &store = event_store();
    std::lock_guard _{store.event_mutex};
    store.load_settings();
    store.trim_recent();
}

std::vector<mediavisor_event> mediavisor_event_log_recent() {
    auto &store = event_store();
    std::lock_guard _{store.event_mutex};
    return {store.event_recent.begin(), store.event_recent.end()};
}
