#include "rlog/formatters/pattern_formatter.hpp"

#include "rlog/log_level.hpp"
#include "rlog/timestamp.hpp"

namespace rlog
{

PatternFormatter::PatternFormatter(std::string_view pattern, bool enable_color)
    : pattern_(pattern), enable_color_(enable_color)
{
  CompilePattern();
}

void PatternFormatter::CompilePattern()
{
  ops_.clear();
  size_t i = 0;
  std::string literal_buf;

  auto flush_literal = [&]()
  {
    if (!literal_buf.empty())
    {
      ops_.push_back({OpType::Literal, std::move(literal_buf)});
      literal_buf.clear();
    }
  };

  while (i < pattern_.size())
  {
    if (pattern_[i] == '%' && i + 1 < pattern_.size())
    {
      char c = pattern_[i + 1];
      OpType op = OpType::Literal;
      bool is_op = true;

      switch (c)
      {
        case 'I':
          op = OpType::IsoMillis;
          break;
        case 'Z':
          op = OpType::IsoSeconds;
          break;
        case 'L':
          op = OpType::LevelFull;
          break;
        case 'l':
          op = OpType::LevelShort;
          break;
        case 'M':
          op = OpType::Module;
          break;
        case 'm':
          op = OpType::Message;
          break;
        case 'C':
          op = OpType::ColorStart;
          break;
        case 'R':
          op = OpType::ColorReset;
          break;
        case '%':
          literal_buf += '%';
          is_op = false;
          break;
        default:
          literal_buf += '%';
          literal_buf += c;
          is_op = false;
          break;
      }

      if (is_op)
      {
        flush_literal();
        ops_.push_back({op, {}});
      }
      i += 2;
    }
    else
    {
      literal_buf += pattern_[i];
      ++i;
    }
  }
  flush_literal();
}

void PatternFormatter::Format(const LogRecord& record, std::string& out)
{
  char tmp[64];

  for (const auto& op : ops_)
  {
    switch (op.type)
    {
      case OpType::Literal:
        out += op.literal;
        break;

      case OpType::IsoMillis:
        out.append(tmp, format_iso8601_ms(record.wall_clock_ns, tmp, sizeof(tmp)));
        break;

      case OpType::IsoSeconds:
        out.append(tmp, format_iso8601(record.wall_clock_ns, tmp, sizeof(tmp)));
        break;

      case OpType::LevelFull:
        out += ToString(record.level);
        break;

      case OpType::LevelShort:
        out += ToShortChar(record.level);
        break;

      case OpType::Module:
        if (!record.module.empty())
        {
          out += '(';
          out += record.module;
          out += ") ";
        }
        break;

      case OpType::Message:
        out += record.message;
        break;

      case OpType::ColorStart:
        if (enable_color_)
        {
          out += "\033[";
          out += ToColorCode(record.level);
          out += 'm';
        }
        break;

      case OpType::ColorReset:
        if (enable_color_)
        {
          out += "\033[m";
        }
        break;
    }
  }
}

}  // namespace rlog
