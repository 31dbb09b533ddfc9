#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "formatter_interface.hpp"

namespace rlog
{

// Pattern tokens:
//   %I  ISO-8601 UTC with milliseconds   %Z  ISO-8601 UTC, whole seconds
//   %L  level name                       %l  level letter
//   %C  level color start                %R  color reset
//   %M  "(module) " when a module is set %m  message
//   %%  literal percent
class PatternFormatter : public IFormatter
{
 public:
  static constexpr std::string_view kConsolePattern = "(%I) %C[%L]%R %M%m";
  static constexpr std::string_view kConsolePatternNoTime = "%C[%L]%R %M%m";
  static constexpr std::string_view kFilePattern = "[%l:%Z] %M%m";

  explicit PatternFormatter(std::string_view pattern = kConsolePattern,
                            bool enable_color = false);

  void Format(const LogRecord& record, std::string& out) override;

 private:
  std::string pattern_;
  bool enable_color_;

  enum class OpType : uint8_t
  {
    Literal,
    IsoMillis,
    IsoSeconds,
    LevelFull,
    LevelShort,
    Module,
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
  void CompilePattern();
};

}  // namespace rlog
