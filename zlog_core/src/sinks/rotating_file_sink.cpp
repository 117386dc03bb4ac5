#include "zlog/sinks/rotating_file_sink.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <utility>

#include "zlog/errors.hpp"
#include "zlog/formatters/pattern_formatter.hpp"
#include "zlog/sinks/file_lock.hpp"

namespace zlog {

namespace {

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

// 按 schedule 校验后缀形状，例如 Midnight: "dddd-dd-dd"
bool matches_period_shape(std::string_view s, RotateWhen when) {
    std::string_view shape;
    switch (when) {
        case RotateWhen::Minutely: shape = "dddd-dd-dd_dd-dd"; break;
        case RotateWhen::Hourly:   shape = "dddd-dd-dd_dd"; break;
        case RotateWhen::Midnight: shape = "dddd-dd-dd"; break;
    }
    if (s.size() != shape.size()) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (shape[i] == 'd') {
            if (s[i] < '0' || s[i] > '9') return false;
        } else if (s[i] != shape[i]) {
            return false;
        }
    }
    return true;
}

struct BackupName {
    std::string period;      // "2026-02-16"
    unsigned long counter;   // 同名冲突时的 ".N"，否则 0
    std::string full_path;
};

bool parse_backup_suffix(std::string_view suffix, RotateWhen when, BackupName& out) {
    size_t dot = suffix.find('.');
    std::string_view period = suffix.substr(0, dot);
    if (!matches_period_shape(period, when)) return false;

    out.period = std::string(period);
    out.counter = 0;
    if (dot != std::string_view::npos) {
        std::string_view counter = suffix.substr(dot + 1);
        if (!all_digits(counter)) return false;
        out.counter = std::strtoul(std::string(counter).c_str(), nullptr, 10);
    }
    return true;
}

std::pair<std::string, std::string> split_path(const std::string& path) {
    size_t slash = path.rfind('/');
    if (slash == std::string::npos) {
        return {".", path};
    }
    if (slash == 0) {
        return {"/", path.substr(1)};
    }
    return {path.substr(0, slash), path.substr(slash + 1)};
}

bool path_exists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

void RotatingFileSink::mkdir_recursive(const std::string& path) {
    std::string tmp;
    for (size_t i = 0; i < path.size(); ++i) {
        tmp += path[i];
        if ((path[i] == '/' && i > 0) || i == path.size() - 1) {
            if (::mkdir(tmp.c_str(), ZLOG_DIR_MODE) != 0 && errno != EEXIST) {
                int err = errno;
                throw IoError("RotatingFileSink: failed to create directory '" + tmp + "'", err);
            }
        }
    }
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        int err = errno;
        throw IoError("RotatingFileSink: cannot stat directory '" + path + "'", err);
    }
    if (!S_ISDIR(st.st_mode)) {
        throw IoError("RotatingFileSink: '" + path + "' is not a directory", ENOTDIR);
    }
}

RotatingFileSink::RotatingFileSink(const std::string& path, RotatingFileOptions options)
    : path_(path)
    , options_(std::move(options))
    , fd_(-1)
    , closed_(false)
    , current_period_(0)
    , next_rotation_attempt_ns_(0)
{
    if (path_.empty()) {
        throw IoError("RotatingFileSink: empty file path", EINVAL);
    }
    mkdir_recursive(split_path(path_).first);
    open_file();
    current_period_ = period_of_open_file(
        period_index(now(), options_.when, options_.utc_offset_seconds));
}

RotatingFileSink::~RotatingFileSink() {
    Close();
}

uint64_t RotatingFileSink::now() const {
    return options_.clock ? options_.clock() : wall_clock_now_ns();
}

void RotatingFileSink::open_file() {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, ZLOG_FILE_MODE);
    if (fd_ < 0) {
        int err = errno;
        throw IoError("RotatingFileSink: failed to open '" + path_ + "'", err);
    }
}

void RotatingFileSink::close_file() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool RotatingFileSink::open_file_is_current() const {
    struct stat fd_st{};
    struct stat path_st{};
    if (fd_ < 0 || ::fstat(fd_, &fd_st) != 0) return false;
    if (::stat(path_.c_str(), &path_st) != 0) return false;
    return fd_st.st_dev == path_st.st_dev && fd_st.st_ino == path_st.st_ino;
}

// 空文件属于当前周期；非空文件取 mtime 所在周期，且不晚于当前周期
int64_t RotatingFileSink::period_of_open_file(int64_t now_period) const {
    struct stat st{};
    if (fd_ < 0 || ::fstat(fd_, &st) != 0 || st.st_size == 0) {
        return now_period;
    }
    uint64_t mtime_ns = static_cast<uint64_t>(st.st_mtime) * 1'000'000'000ULL;
    int64_t file_period = period_index(mtime_ns, options_.when, options_.utc_offset_seconds);
    return std::min(file_period, now_period);
}

std::string RotatingFileSink::BackupPath(int64_t period) const {
    char suffix[32];
    size_t n = format_period_suffix(period, options_.when, suffix, sizeof(suffix));
    return path_ + "." + std::string(suffix, n);
}

int64_t RotatingFileSink::CurrentPeriod() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_period_;
}

void RotatingFileSink::SetWarningHandler(WarningHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    warning_handler_ = std::move(handler);
}

void RotatingFileSink::warn(const std::string& message) {
    if (warning_handler_) {
        warning_handler_(message);
        return;
    }
    std::fprintf(stderr, "RotatingFileSink: %s\n", message.c_str());
}

void RotatingFileSink::Write(const LogEntry& entry) {
    if (!ShouldLog(entry.level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!formatter_) {
        formatter_ = std::make_unique<PatternFormatter>(kDefaultPattern, false);
    }

    size_t len = DoFormat(entry);
    if (len == 0) {
        return;
    }
    append_locked(format_buf_.data(), len);
}

void RotatingFileSink::Append(std::string_view line) {
    std::lock_guard<std::mutex> lock(mutex_);
    format_buf_.assign(line.data(), line.size());
    format_buf_ += '\n';
    append_locked(format_buf_.data(), format_buf_.size());
}

void RotatingFileSink::append_locked(const char* data, size_t len) {
    if (closed_) {
        throw IoError("RotatingFileSink: '" + path_ + "' is closed", EBADF);
    }
    if (fd_ < 0) {
        // 上一次轮转后重新打开失败，这里再试一次
        open_file();
    }

    const uint64_t now_ns = now();
    const int64_t now_period = period_index(now_ns, options_.when, options_.utc_offset_seconds);

    // 每行写入前确认 fd 仍指向 path_：其他进程可能已把它改名为备份（或被外部删除），
    // 而本进程的周期尚未到期，不会进入加锁的轮转路径
    if (!open_file_is_current()) {
        close_file();
        open_file();
        current_period_ = period_of_open_file(now_period);
    }

    std::exception_ptr rotate_error = maybe_rotate(now_ns, now_period);

    size_t off = 0;
    while (off < len) {
        ssize_t written = ::write(fd_, data + off, len - off);
        if (written < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            throw IoError("RotatingFileSink: write to '" + path_ + "' failed", err);
        }
        off += static_cast<size_t>(written);
    }

    // 轮转失败时这一行已写入旧文件，再把错误交给调用方
    if (rotate_error) {
        std::rethrow_exception(rotate_error);
    }
}

std::exception_ptr RotatingFileSink::maybe_rotate(uint64_t now_ns, int64_t now_period) {
    if (now_period <= current_period_) {
        return nullptr;
    }
    if (now_ns < next_rotation_attempt_ns_) {
        return nullptr;
    }

    const uint64_t backoff_ns =
        static_cast<uint64_t>(options_.lock_timeout.count()) * 1'000'000ULL;
    try {
        FileLock lock(LockPath(), options_.lock_timeout);

        // 其他进程已完成轮转（或文件被外部删除）：切换到新的活动文件
        if (!open_file_is_current()) {
            close_file();
            open_file();
            current_period_ = period_of_open_file(now_period);
        }

        if (current_period_ < now_period) {
            rotate(now_period);
        }
        next_rotation_attempt_ns_ = 0;
    } catch (const LockTimeoutError& e) {
        next_rotation_attempt_ns_ = now_ns + backoff_ns;
        warn(std::string(e.what()) + "; rotation skipped, still appending to '" + path_ + "'");
    } catch (const IoError&) {
        if (fd_ < 0) {
            throw;
        }
        // 旧文件仍可写：退避一段时间后再尝试轮转
        next_rotation_attempt_ns_ = now_ns + backoff_ns;
        return std::current_exception();
    }
    return nullptr;
}

void RotatingFileSink::rotate(int64_t now_period) {
    std::string backup = BackupPath(current_period_);
    // 同名备份已存在时追加序号，不覆盖已有数据
    if (path_exists(backup)) {
        for (unsigned long n = 1;; ++n) {
            std::string candidate = backup + "." + std::to_string(n);
            if (!path_exists(candidate)) {
                backup = std::move(candidate);
                break;
            }
        }
    }

    // 改名时 fd 保持打开，失败则继续写旧文件
    if (::rename(path_.c_str(), backup.c_str()) != 0 && errno != ENOENT) {
        int err = errno;
        throw IoError("RotatingFileSink: failed to rename '" + path_ + "' to '" + backup + "'",
                      err);
    }

    close_file();
    current_period_ = now_period;
    open_file();
    prune_backups();
}

std::vector<std::string> RotatingFileSink::ListBackups() const {
    auto [dir_path, base_name] = split_path(path_);
    std::string prefix = base_name + ".";

    std::vector<BackupName> found;
    DIR* dir = ::opendir(dir_path.c_str());
    if (!dir) return {};

    struct dirent* ent;
    while ((ent = ::readdir(dir)) != nullptr) {
        std::string_view name(ent->d_name);
        if (name.size() <= prefix.size()) continue;
        if (name.compare(0, prefix.size(), prefix) != 0) continue;

        BackupName backup;
        if (!parse_backup_suffix(name.substr(prefix.size()), options_.when, backup)) continue;
        backup.full_path = dir_path == "/" ? "/" + std::string(name)
                                           : dir_path + "/" + std::string(name);
        found.push_back(std::move(backup));
    }
    ::closedir(dir);

    std::sort(found.begin(), found.end(), [](const BackupName& a, const BackupName& b) {
        if (a.period != b.period) return a.period < b.period;
        return a.counter < b.counter;
    });

    std::vector<std::string> result;
    result.reserve(found.size());
    for (auto& b : found) {
        result.push_back(std::move(b.full_path));
    }
    return result;
}

void RotatingFileSink::prune_backups() {
    if (options_.backup_count == 0) {
        return;
    }
    std::vector<std::string> backups = ListBackups();
    if (backups.size() <= options_.backup_count) {
        return;
    }
    size_t excess = backups.size() - options_.backup_count;
    for (size_t i = 0; i < excess; ++i) {
        if (::unlink(backups[i].c_str()) != 0 && errno != ENOENT) {
            int err = errno;
            warn("failed to remove old backup '" + backups[i] + "': " +
                 std::generic_category().message(err));
        }
    }
}

void RotatingFileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
#if defined(ZLOG_PLATFORM_LINUX)
        ::fdatasync(fd_);
#else
        ::fsync(fd_);
#endif
    }
}

void RotatingFileSink::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd_ >= 0) {
        ::fsync(fd_);
        close_file();
    }
    closed_ = true;
}

} // namespace zlog
