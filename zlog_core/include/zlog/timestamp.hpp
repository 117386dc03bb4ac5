#pragma once
#include <cstddef>
#include <cstdint>

#include "platform.hpp"

namespace zlog
{

// 固定时区偏移下的日历字段，与宿主机 TZ 设置无关
struct LocalTime
{
  int year;
  int month;   // 1-12
  int day;     // 1-31
  int hour;
  int minute;
  int second;
  uint32_t microsecond;
  int weekday;  // 0 = Sunday
  int yday;     // 0-365
};

enum class RotateWhen : uint8_t
{
  Minutely,
  Hourly,
  Midnight
};

constexpr int32_t kDefaultUtcOffsetSeconds = ZLOG_UTC_OFFSET_SECONDS;

uint64_t wall_clock_now_ns();

LocalTime to_local_time(uint64_t wall_ns, int32_t utc_offset_seconds = kDefaultUtcOffsetSeconds);

// "YYYY-MM-DD HH:MM:SS"
size_t format_timestamp(const LocalTime& t, char* buf, size_t buf_size);
// "YYYY-MM-DD"
size_t format_date(const LocalTime& t, char* buf, size_t buf_size);
// "HH:MM:SS"
size_t format_time(const LocalTime& t, char* buf, size_t buf_size);

int64_t period_seconds(RotateWhen when);

// 轮转周期编号：偏移后的本地时间按周期长度向下取整
int64_t period_index(uint64_t wall_ns, RotateWhen when,
                     int32_t utc_offset_seconds = kDefaultUtcOffsetSeconds);

// 备份文件后缀: Midnight -> "YYYY-MM-DD", Hourly -> "YYYY-MM-DD_HH",
// Minutely -> "YYYY-MM-DD_HH-MM"
size_t format_period_suffix(int64_t period, RotateWhen when, char* buf, size_t buf_size);

}  // namespace zlog
