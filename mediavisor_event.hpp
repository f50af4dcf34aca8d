#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

inline double now_unixtime() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count() / 1e9;
}

struct mediavisor_event {
    double event_unixtime;
    std::string event_name;
    std::string event_message;
};

// One JSON object per line on stdout, also appended to $mediavisor_event_log_filename when set.
// The environment is read on first use and by mediavisor_event_log_reload_settings.
void mediavisor_event_log(std::string_view event_name, std::string_view event_message = "");
void mediavisor_event_log_reload_settings();
std::vector<mediavisor_event> mediavisor_event_log_recent();
