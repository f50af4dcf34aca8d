#include "cache_persistence.hpp"

#include "call_errno.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstring>

std::optional<std::string> cache_persistence_read_file(std::filesystem::path const &path) {
    add_thread_context _("cache_persistence_path", path.string());
    try {
        unique_fd fd{open(path.c_str(), O_RDONLY | O_CLOEXEC)};
        if (!fd) {
            if (errno == ENOENT) { return std::nullopt; }
            throw errno_exception(errno, "open");
        }
        std::string contents;
        char buffer[64 * 1024];
        for (;;) {
            auto got = CALL_ERRNO_MINUS_1_RETRY_EINTR(read, fd.get(), buffer, sizeof(buffer));
            if (!got) { break; }
            contents.append(buffer, got);
        }
        return contents;
    } catch (errno_exception const &e) {
        throw cache_load_error(str("cache_persistence_read_file ", path, ": ", e.what()));
    }
}

namespace {
void write_fully(int fd, std::string_view contents) {
    while (!contents.empty()) {
        auto wrote = CALL_ERRNO_MINUS_1_RETRY_EINTR(write, fd, contents.data(), contents.size());
        contents.remove_prefix(wrote);
    }
}
} // namespace

void cache_persistence_rename_over(std::filesystem::path const &from, std::filesystem::path const &to, rename_function const &rename_call) {
    if (rename_call(from.c_str(), to.c_str()) == 0) { return; }
    auto first_errno = errno;
    // some file systems refuse to replace an existing destination; anything else leaves it alone
    if (first_errno != EEXIST && first_errno != ENOTEMPTY && first_errno != EISDIR && first_errno != EPERM) { throw errno_exception(first_errno, "rename"); }
    if (unlink(to.c_str()) == -1 && errno != ENOENT) { throw errno_exception(first_errno, "rename"); }
    CALL_ERRNO_MINUS_1(rename_call, from.c_str(), to.c_str());
}

void cache_persistence_write_atomically(std::filesystem::path const &path, std::function<std::string()> const &produce_contents,
                                        rename_function const &rename_call) {
    add_thread_context _("cache_persistence_path", path.string());
    auto dir = path.parent_path();
    if (dir.empty()) { dir = "."; }
    auto tmp_name = (dir / path.filename()).string() + ".XXXXXX";

    unique_fd fd;
    try {
        fd.reset(CALL_ERRNO_MINUS_1(mkstemp, tmp_name.data())); // can modify since C++11
    } catch (errno_exception const &e) {
        throw cache_persist_error(str("cache_persistence_write_atomically ", path, ": ", e.what()));
    }

    try {
        write_fully(fd.get(), produce_contents());
        CALL_ERRNO_MINUS_1(fchmod, fd.get(), 0644);
        CALL_ERRNO_MINUS_1(fsync, fd.get());
        fd.close_checked("close");
        cache_persistence_rename_over(tmp_name, path, rename_call);
    } catch (std::exception const &e) {
        fd.reset();
        if (unlink(tmp_name.c_str()) == -1 && errno != ENOENT) {
            mediavisor_event_log("cache_persistence_tmp_unlink_failed", str(tmp_name, ": ", std::strerror(errno)));
        }
        throw cache_persist_error(str("cache_persistence_write_atomically ", path, ": ", e.what()));
    }
}
