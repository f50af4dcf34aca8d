#include "probe_cache.hpp"

#include "call_errno.hpp"
#include "mediavisor_errors.hpp"
#include "str.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <vector>

extern char **environ;

Json::Value json_codec<probe_cache_key>::to_json(probe_cache_key const &k) {
    Json::Value ret(Json::objectValue);
    ret["Path"] = k.probe_path;
    ret["ModTime"] = k.probe_mod_unixtime;
    return ret;
}

probe_cache_key json_codec<probe_cache_key>::from_json(Json::Value const &v) {
    if (!v.isObject() || !v["Path"].isString() || !v["ModTime"].isNumeric()) {
        throw json_decode_error(str("probe cache key needs string Path and numeric ModTime, got ", json_compact(v)));
    }
    return probe_cache_key{
            .probe_path = v["Path"].asString(),
            .probe_mod_unixtime = v["ModTime"].asDouble(),
    };
}

probe_cache_key probe_cache_key_for_path(std::filesystem::path const &path) {
    struct stat st;
    CALL_ERRNO_MINUS_1(stat, path.c_str(), &st);
    return probe_cache_key{
            .probe_path = path.string(),
            .probe_mod_unixtime = st.st_mtim.tv_sec + st.st_mtim.tv_nsec / 1e9,
    };
}

probe_result probe_cached(probe_result_cache &cache, prober &probe_with, std::filesystem::path const &path) {
    auto key = probe_cache_key_for_path(path);
    if (auto hit = cache.cache_get(key)) { return *hit; }
    auto result = probe_with.probe(path);
    cache.cache_set(key, result);
    return result;
}

namespace {
// the child's whole stdout, or probe_error once the deadline passes; the child is killed then
std::string read_child_output(int fd, pid_t pid, std::chrono::steady_clock::time_point deadline) {
    std::string output;
    char buffer[16 * 1024];
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        pollfd readable{.fd = fd, .events = POLLIN, .revents = 0};
        auto ready = remaining > 0 ? poll(&readable, 1, static_cast<int>(std::min<int64_t>(remaining, 60000))) : 0;
        if (ready == -1) {
            if (errno == EINTR) { continue; }
            throw errno_exception(errno, "poll");
        }
        if (ready == 0) {
            if (remaining > 60000) { continue; }
            if (kill(pid, SIGKILL) == -1 && errno != ESRCH) { throw errno_exception(errno, "kill ffprobe"); }
            throw probe_error("ffprobe timed out");
        }
        auto got = CALL_ERRNO_MINUS_1_RETRY_EINTR(read, fd, buffer, sizeof(buffer));
        if (got == 0) { return output; }
        output.append(buffer, got);
    }
}
} // namespace

probe_result ffprobe_prober::probe(std::filesystem::path const &path) {
    add_thread_context _("ffprobe_path", path.string());

    int pipe_fds[2];
    CALL_ERRNO_MINUS_1(pipe2, pipe_fds, O_CLOEXEC);
    unique_fd read_end{pipe_fds[0]};
    unique_fd write_end{pipe_fds[1]};

    std::vector<std::string> args{ffprobe_executable, "-loglevel", "error", "-show_format", "-show_streams", "-of", "json", path.string()};
    std::vector<char *> argv;
    for (auto &a : args) { argv.push_back(a.data()); }
    argv.push_back(nullptr);

    pid_t pid;
    try {
        posix_spawn_file_actions_t actions;
        CALL_ERRNO_RETURNED(posix_spawn_file_actions_init, &actions);
        auto actions_holder = make_unique_ptr_closer(&actions, [](posix_spawn_file_actions_t *a) { posix_spawn_file_actions_destroy(a); });
        CALL_ERRNO_RETURNED(posix_spawn_file_actions_adddup2, &actions, write_end.get(), STDOUT_FILENO);
        CALL_ERRNO_RETURNED(posix_spawn_file_actions_addopen, &actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
        CALL_ERRNO_RETURNED(posix_spawnp, &pid, ffprobe_executable.c_str(), &actions, nullptr, argv.data(), environ);
    } catch (errno_exception const &e) {
        throw probe_error(e.what());
    }
    write_end.reset();

    std::string output;
    std::exception_ptr read_failure;
    try {
        output = read_child_output(read_end.get(), pid, std::chrono::steady_clock::now() + ffprobe_timeout);
    } catch (std::exception const &) {
        // reaped below before the failure is rethrown
        read_failure = std::current_exception();
    }
    read_end.reset();

    int status = 0;
    CALL_ERRNO_MINUS_1_RETRY_EINTR(waitpid, pid, &status, 0);
    if (read_failure) {
        try {
            std::rethrow_exception(read_failure);
        } catch (probe_error const &) {
            throw;
        } catch (std::exception const &e) {
            throw probe_error(str("reading ffprobe output for ", path, ": ", e.what()));
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) { throw probe_error(str("ffprobe failed on ", path, " with status ", status)); }

    try {
        return probe_result{json_parse(output)};
    } catch (json_decode_error const &e) {
        throw probe_error(str("ffprobe output for ", path, ": ", e.what()));
    }
}
