#pragma once

#include "thread_context.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>

struct errno_exception : public std::exception {
    errno_exception(int err, const std::string &syscall) : caught_errno(err) {
        std::ostringstream oss;
        oss << syscall << " " << std::strerror(err);
        thread_context_describe(oss);
        message = oss.str();
    }

    int caught_errno;
    std::string message;

    [[nodiscard]] const char *what() const noexcept override { return message.c_str(); }
};

#define CALL_ERRNO_BAD_VALUE(name, bad_value, ...) call_errno_bad_value([&] { return name(__VA_ARGS__); }, #name, bad_value)
#define CALL_ERRNO_MINUS_1(name, ...) CALL_ERRNO_BAD_VALUE(name, -1, __VA_ARGS__)
#define CALL_ERRNO_MINUS_1_RETRY_EINTR(name, ...) call_errno_retry_eintr([&] { return name(__VA_ARGS__); }, #name)
// for the posix_spawn and pthread families, which return the error number instead of setting errno
#define CALL_ERRNO_RETURNED(name, ...) call_errno_returned([&] { return name(__VA_ARGS__); }, #name)

template <typename Function> inline auto call_errno_bad_value(Function const &f, char const *name, decltype(f()) bad_value) -> decltype(f()) {
    auto ret = f();
    if (ret == bad_value) { throw errno_exception(errno, name); }
    return ret;
}

template <typename Function> inline auto call_errno_retry_eintr(Function const &f, char const *name) -> decltype(f()) {
    for (;;) {
        auto ret = f();
        if (ret != -1) { return ret; }
        if (errno != EINTR) { throw errno_exception(errno, name); }
    }
}

template <typename Function> inline void call_errno_returned(Function const &f, char const *name) {
    if (auto err = f()) { throw errno_exception(err, name); }
}

template<typename T, typename Deleter>
inline std::unique_ptr<T, Deleter> make_unique_ptr_closer(T *type, Deleter deleter) {
    return std::unique_ptr<T, Deleter>(type, deleter);
}

// owns a file descriptor, -1 when empty
struct unique_fd {
    int fd_number = -1;

    unique_fd() = default;
    explicit unique_fd(int fd) : fd_number(fd) {}
    unique_fd(unique_fd &&other) noexcept : fd_number(other.release()) {}
    unique_fd &operator=(unique_fd &&other) noexcept {
        if (this != &other) { reset(other.release()); }
        return *this;
    }
    unique_fd(unique_fd const &) = delete;
    unique_fd &operator=(unique_fd const &) = delete;
    ~unique_fd() { reset(); }

    [[nodiscard]] int get() const { return fd_number; }
    [[nodiscard]] explicit operator bool() const { return fd_number != -1; }

    int release() {
        auto ret = fd_number;
        fd_number = -1;
        return ret;
    }

    void reset(int fd = -1) {
        if (fd_number != -1) { ::close(fd_number); }
        fd_number = fd;
    }

    // close reporting failure, for files whose contents matter
    void close_checked(char const *what) {
        auto fd = release();
        if (fd != -1 && ::close(fd) == -1) { throw errno_exception(errno, what); }
    }
};
