#include "rlog/log_context.hpp"

#include "rlog/logger.hpp"

namespace rlog
{

LoggerContext::LoggerContext(Logger& logger, std::string module)
    : logger_(&logger), module_(std::move(module))
{
}

void LoggerContext::Open() { logger_->Open(); }

void LoggerContext::Close() { logger_->Close(); }

void LoggerContext::SetFile(const std::string& path) { logger_->SetFile(path); }

void LoggerContext::SetLevel(std::string_view name) { logger_->SetLevel(name); }

void LoggerContext::Error(const ErrorPayload& err) { Log(LogLevel::Error, err); }
void LoggerContext::Warning(const ErrorPayload& err) { Log(LogLevel::Warning, err); }
void LoggerContext::Info(const ErrorPayload& err) { Log(LogLevel::Info, err); }
void LoggerContext::Debug(const ErrorPayload& err) { Log(LogLevel::Debug, err); }
void LoggerContext::Spam(const ErrorPayload& err) { Log(LogLevel::Spam, err); }

void LoggerContext::Error(const std::exception& e) { Error(ErrorPayload::FromException(e)); }
void LoggerContext::Warning(const std::exception& e)
{
  Warning(ErrorPayload::FromException(e));
}
void LoggerContext::Info(const std::exception& e) { Info(ErrorPayload::FromException(e)); }
void LoggerContext::Debug(const std::exception& e) { Debug(ErrorPayload::FromException(e)); }
void LoggerContext::Spam(const std::exception& e) { Spam(ErrorPayload::FromException(e)); }

void LoggerContext::Log(LogLevel level, const LogPayload& payload)
{
  logger_->Log(level, module_, payload);
}

LoggerContext LoggerContext::Context(std::string module) const
{
  return LoggerContext(*logger_, std::move(module));
}

MemoryUsage LoggerContext::GetMemoryUsage() const { return logger_->GetMemoryUsage(); }

void LoggerContext::Memory() { logger_->Memory(module_); }

}  // namespace rlog
