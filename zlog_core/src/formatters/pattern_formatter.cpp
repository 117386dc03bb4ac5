#include "zlog/formatters/pattern_formatter.hpp"

#include <cstdio>

#include "zlog/log_level.hpp"
#include "zlog/path_normalizer.hpp"
#include "zlog/process_info.hpp"

namespace zlog {

namespace {

const char* color_for_level(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "\033[35m";
        case LogLevel::Info:     return "\033[32m";
        case LogLevel::Warning:  return "\033[33m";
        case LogLevel::Error:    return "\033[31m";
        case LogLevel::Critical: return "\033[1;31m";
    }
    return "";
}

constexpr const char* kColorReset = "\033[0m";

const char* file_name_of(const char* path) {
    const char* name = path;
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/' || *p == '\\') name = p + 1;
    }
    return name;
}

} // namespace

PatternFormatter::PatternFormatter(std::string_view pattern, bool enable_color)
    : pattern_(pattern)
    , enable_color_(enable_color)
    , hostname_(hostname())
    , clock_([](uint64_t wall_ns) { return to_local_time(wall_ns); })
    , path_rewriter_([](std::string_view path) { return relativize(path); }) {
    compile_pattern();
}

void PatternFormatter::compile_pattern() {
    ops_.clear();
    size_t i = 0;
    std::string literal_buf;

    auto flush_literal = [&]() {
        if (!literal_buf.empty()) {
            ops_.push_back({OpType::Literal, std::move(literal_buf)});
            literal_buf.clear();
        }
    };

    while (i < pattern_.size()) {
        if (pattern_[i] == '%' && i + 1 < pattern_.size()) {
            char c = pattern_[i + 1];
            OpType op = OpType::Literal;
            bool is_op = true;

            switch (c) {
                case 'H': op = OpType::Hostname; break;
                case 'D': op = OpType::Date; break;
                case 'T': op = OpType::Time; break;
                case 'e': op = OpType::Microseconds; break;
                case 'L': op = OpType::Level; break;
                case 'F': op = OpType::FilePath; break;
                case 'f': op = OpType::FileName; break;
                case '#': op = OpType::Line; break;
                case 'n': op = OpType::FuncName; break;
                case 'P': op = OpType::ProcessId; break;
                case 'm': op = OpType::Message; break;
                case 'C': op = OpType::ColorStart; break;
                case 'R': op = OpType::ColorReset; break;
                case '%': literal_buf += '%'; is_op = false; break;
                default:
                    literal_buf += '%';
                    literal_buf += c;
                    is_op = false;
                    break;
            }

            if (is_op) {
                flush_literal();
                ops_.push_back({op, {}});
            }
            i += 2;
        } else {
            literal_buf += pattern_[i];
            ++i;
        }
    }
    flush_literal();
}

void PatternFormatter::Format(const LogEntry& entry, std::string& out) {
    out.clear();
    char tmp[64];

    // 时间字段只计算一次，%D %T %e 共用
    bool have_time = false;
    LocalTime local{};
    auto local_time = [&]() -> const LocalTime& {
        if (!have_time) {
            local = clock_(entry.wall_clock_ns);
            have_time = true;
        }
        return local;
    };

    for (const auto& op : ops_) {
        switch (op.type) {
            case OpType::Literal:
                out += op.literal;
                break;

            case OpType::Hostname:
                out += hostname_;
                break;

            case OpType::Date: {
                size_t n = format_date(local_time(), tmp, sizeof(tmp));
                out.append(tmp, n);
                break;
            }

            case OpType::Time: {
                size_t n = format_time(local_time(), tmp, sizeof(tmp));
                out.append(tmp, n);
                break;
            }

            case OpType::Microseconds: {
                int n = std::snprintf(tmp, sizeof(tmp), ".%06u", local_time().microsecond);
                if (n > 0) out.append(tmp, static_cast<size_t>(n));
                break;
            }

            case OpType::Level:
                out += to_string(entry.level);
                break;

            case OpType::FilePath:
                if (entry.file_path) {
                    out += path_rewriter_ ? path_rewriter_(entry.file_path)
                                          : std::string(entry.file_path);
                }
                break;

            case OpType::FileName:
                if (entry.file_path) out += file_name_of(entry.file_path);
                break;

            case OpType::Line: {
                int n = std::snprintf(tmp, sizeof(tmp), "%u", entry.line);
                if (n > 0) out.append(tmp, static_cast<size_t>(n));
                break;
            }

            case OpType::FuncName:
                if (entry.function_name) out += entry.function_name;
                break;

            case OpType::ProcessId: {
                int n = std::snprintf(tmp, sizeof(tmp), "%u", process_id());
                if (n > 0) out.append(tmp, static_cast<size_t>(n));
                break;
            }

            case OpType::Message:
                out += entry.msg;
                break;

            case OpType::ColorStart:
                if (enable_color_) out += color_for_level(entry.level);
                break;

            case OpType::ColorReset:
                if (enable_color_) out += kColorReset;
                break;
        }
    }
}

} // namespace zlog
