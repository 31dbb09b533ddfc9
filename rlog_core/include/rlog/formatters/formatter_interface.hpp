#pragma once
#include <string>

#include "../log_record.hpp"

namespace rlog
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;
  // Appends the rendered record to `out`.
  virtual void Format(const LogRecord& record, std::string& out) = 0;
};

}  // namespace rlog
