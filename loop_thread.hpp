#pragma once

#include "mediavisor_event.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <mutex>
#include <thread>

class loop_thread {
  protected:
    virtual bool loop_run_once() = 0; // return true to stop
    inline virtual void loop_started() {}
    inline virtual void loop_stopped() {}

    // called on the loop thread with whatever escaped loop_started or loop_run_once; the loop is stopped already
    inline virtual void loop_failed(std::exception_ptr failure) {
        try {
            std::rethrow_exception(failure);
        } catch (std::exception const &e) {
            mediavisor_event_log("loop_thread_failed", e.what());
        }
    }

    inline void loop_spawn() {
        loop_std_thread = std::thread([&] {
            std::exception_ptr failure;
            try {
                loop_started();
                while (!loop_is_stopping()) {
                    if (loop_run_once()) { loop_stop(); }
                    loop_count++;
                }
            } catch (...) {
                failure = std::current_exception();
                loop_stop();
            }
            if (failure) { loop_failed(failure); }

            try {
                loop_stopped();
            } catch (...) {
                loop_mark_finished();
                throw;
            }
            loop_mark_finished();
        });
    }

    // returns true when the loop was asked to stop before the duration passed
    inline bool loop_sleep_for(std::chrono::duration<double> duration) {
        std::unique_lock lock{loop_mutex};
        return loop_condition.wait_for(lock, duration, [&] { return loop_should_stop.load(); });
    }

    loop_thread() = default;

  public:
    loop_thread(loop_thread const &) = delete;
    loop_thread &operator=(loop_thread const &) = delete;

    inline virtual ~loop_thread() { loop_stop_join(); }

    inline void loop_stop() {
        {
            std::lock_guard _{loop_mutex};
            loop_should_stop.store(true);
        }
        loop_condition.notify_all();
    }
    [[nodiscard]] inline bool loop_is_stopping() const { return loop_should_stop.load(); }
    [[nodiscard]] inline bool loop_has_finished() const { return loop_finished.load(); }
    [[nodiscard]] inline uint64_t loop_iterations() const { return loop_count.load(); }

    inline bool loop_wait_finished_for(std::chrono::duration<double> duration) {
        std::unique_lock lock{loop_mutex};
        return loop_condition.wait_for(lock, duration, [&] { return loop_finished.load(); });
    }

  protected:
    // derived classes call this from their destructor so the thread never sees a half destroyed object
    void loop_stop_join() {
        loop_stop();
        if (loop_std_thread.joinable()) { loop_std_thread.join(); }
    }

  private:
    inline void loop_mark_finished() {
        {
            std::lock_guard _{loop_mutex};
            loop_finished.store(true);
        }
        loop_condition.notify_all();
    }

    std::mutex loop_mutex;
    std::condition_variable loop_condition;
    std::atomic<bool> loop_finished = false;
    std::atomic<bool> loop_should_stop = false;
    std::atomic<uint64_t> loop_count = 0;
    std::thread loop_std_thread;
};
