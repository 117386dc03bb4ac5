#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../timestamp.hpp"
#include "formatter_interface.hpp"

namespace zlog
{

// <hostname> - YYYY-MM-DD HH:MM:SS - <relpath>[line:<N>] - <LEVEL>: <message>
inline constexpr std::string_view kDefaultPattern = "%H - %D %T - %F[line:%#] - %L: %C%m%R";

class PatternFormatter : public IFormatter
{
 public:
  using Clock = std::function<LocalTime(uint64_t wall_ns)>;
  using PathRewriter = std::function<std::string(std::string_view path)>;

  // Tokens:
  //   %H hostname    %D date        %T time          %e microseconds
  //   %L level       %F source path (rewritten)      %f file name
  //   %# line        %n function    %P process id    %m message
  //   %C color start %R color reset %% literal '%'
  explicit PatternFormatter(std::string_view pattern = kDefaultPattern, bool enable_color = true);

  void Format(const LogEntry& entry, std::string& out) override;

  void SetHostname(std::string hostname) { hostname_ = std::move(hostname); }
  // 默认固定 UTC+8，见 to_local_time
  void SetClock(Clock clock) { clock_ = std::move(clock); }
  // 默认相对当前工作目录，见 relativize
  void SetPathRewriter(PathRewriter rewriter) { path_rewriter_ = std::move(rewriter); }

  bool ColorEnabled() const { return enable_color_; }

 private:
  std::string pattern_;
  bool enable_color_;
  std::string hostname_;
  Clock clock_;
  PathRewriter path_rewriter_;

  enum class OpType : uint8_t
  {
    Literal,
    Hostname,
    Date,
    Time,
    Microseconds,
    Level,
    FilePath,
    FileName,
    Line,
    FuncName,
    ProcessId,
    Message,
    ColorStart,
    ColorReset
  };

  struct FormatOp
  {
    OpType type;
    std::string literal;
  };

  std::vector<FormatOp> ops_;
  void compile_pattern();
};

}  // namespace zlog
