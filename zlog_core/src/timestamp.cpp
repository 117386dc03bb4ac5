#include "zlog/timestamp.hpp"

#include <cstdio>
#include <ctime>
#include <time.h>

namespace zlog {

uint64_t wall_clock_now_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL
         + static_cast<uint64_t>(ts.tv_nsec);
}

namespace {

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

int64_t local_seconds(uint64_t wall_ns, int32_t utc_offset_seconds) {
    return static_cast<int64_t>(wall_ns / 1'000'000'000ULL) + utc_offset_seconds;
}

// 已加上偏移的秒数按 UTC 拆分，结果即目标时区的日历字段
LocalTime decompose_local_seconds(int64_t local_sec, uint32_t us) {
    time_t sec = static_cast<time_t>(local_sec);
    struct tm tm_val{};
    gmtime_r(&sec, &tm_val);

    LocalTime t{};
    t.year        = tm_val.tm_year + 1900;
    t.month       = tm_val.tm_mon + 1;
    t.day         = tm_val.tm_mday;
    t.hour        = tm_val.tm_hour;
    t.minute      = tm_val.tm_min;
    t.second      = tm_val.tm_sec;
    t.microsecond = us;
    t.weekday     = tm_val.tm_wday;
    t.yday        = tm_val.tm_yday;
    return t;
}

size_t clamp_written(int n, size_t buf_size) {
    if (n <= 0) return 0;
    return (static_cast<size_t>(n) < buf_size) ? static_cast<size_t>(n) : (buf_size - 1);
}

} // namespace

LocalTime to_local_time(uint64_t wall_ns, int32_t utc_offset_seconds) {
    uint32_t us = static_cast<uint32_t>((wall_ns % 1'000'000'000ULL) / 1'000ULL);
    return decompose_local_seconds(local_seconds(wall_ns, utc_offset_seconds), us);
}

size_t format_timestamp(const LocalTime& t, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    int n = snprintf(buf, buf_size, "%04d-%02d-%02d %02d:%02d:%02d",
                     t.year, t.month, t.day, t.hour, t.minute, t.second);
    return clamp_written(n, buf_size);
}

size_t format_date(const LocalTime& t, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    int n = snprintf(buf, buf_size, "%04d-%02d-%02d", t.year, t.month, t.day);
    return clamp_written(n, buf_size);
}

size_t format_time(const LocalTime& t, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    int n = snprintf(buf, buf_size, "%02d:%02d:%02d", t.hour, t.minute, t.second);
    return clamp_written(n, buf_size);
}

int64_t period_seconds(RotateWhen when) {
    switch (when) {
        case RotateWhen::Minutely: return 60;
        case RotateWhen::Hourly:   return 3600;
        case RotateWhen::Midnight: return 86400;
    }
    return 86400;
}

int64_t period_index(uint64_t wall_ns, RotateWhen when, int32_t utc_offset_seconds) {
    return floor_div(local_seconds(wall_ns, utc_offset_seconds), period_seconds(when));
}

size_t format_period_suffix(int64_t period, RotateWhen when, char* buf, size_t buf_size) {
    if (buf_size == 0) return 0;
    LocalTime t = decompose_local_seconds(period * period_seconds(when), 0);
    int n = 0;
    switch (when) {
        case RotateWhen::Minutely:
            n = snprintf(buf, buf_size, "%04d-%02d-%02d_%02d-%02d",
                         t.year, t.month, t.day, t.hour, t.minute);
            break;
        case RotateWhen::Hourly:
            n = snprintf(buf, buf_size, "%04d-%02d-%02d_%02d",
                         t.year, t.month, t.day, t.hour);
            break;
        case RotateWhen::Midnight:
            n = snprintf(buf, buf_size, "%04d-%02d-%02d", t.year, t.month, t.day);
            break;
    }
    return clamp_written(n, buf_size);
}

} // namespace zlog
