#include <rlog/errors.hpp>
#include <rlog/log_context.hpp>
#include <rlog/logger.hpp>
#include <rlog/sinks/callback_sink.hpp>

#include <cstdio>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Usage: rlog_basic_example --level=debug --filename=/tmp/rlog_example.log
//                           --maxFileSize=4096 --maxFiles=3 --colors=true
static std::map<std::string, std::string> ParseArgs(int argc, char** argv)
{
  std::map<std::string, std::string> values;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0)
    {
      std::fprintf(stderr, "ignoring argument '%s'\n", arg.c_str());
      continue;
    }
    arg.erase(0, 2);
    size_t eq = arg.find('=');
    if (eq == std::string::npos)
    {
      values[arg] = "true";
    }
    else
    {
      values[arg.substr(0, eq)] = arg.substr(eq + 1);
    }
  }
  return values;
}

int main(int argc, char** argv)
{
  std::map<std::string, std::string> args = ParseArgs(argc, argv);
  if (args.find("level") == args.end()) args["level"] = "debug";
  if (args.find("filename") == args.end()) args["filename"] = "/tmp/rlog_example.log";
  if (args.find("maxFileSize") == args.end()) args["maxFileSize"] = "4096";
  if (args.find("maxFiles") == args.end()) args["maxFiles"] = "3";

  rlog::LoggerOptions options;
  try
  {
    options = rlog::LoggerOptions::Parse(args);
  }
  catch (const rlog::InvalidConfigurationError& e)
  {
    std::fprintf(stderr, "bad option: %s\n", e.what());
    return 2;
  }

  rlog::Logger logger(options);

  // Callback sink (custom processing)
  logger.AddSink(std::make_unique<rlog::CallbackSink>(
      [](const rlog::LogRecord& record)
      {
        if (record.level == rlog::LogLevel::Error)
        {
          std::fprintf(stderr, "[ALERT] %.*s\n", static_cast<int>(record.message.size()),
                       record.message.data());
        }
      }));

  try
  {
    logger.Open();
  }
  catch (const rlog::StreamOpenError& e)
  {
    std::fprintf(stderr, "cannot open log file: %s\n", e.what());
    return 1;
  }

  // --- Basic logging ---

  logger.Info("rlog example (git {}, {})", RLOG_GIT_HASH, RLOG_BUILD_TYPE);
  logger.Spam("spam is hidden unless --level=spam");
  logger.Debug("debug value: {}", 42);
  logger.Warning("disk usage at {}%", 85);
  logger.Error("connection failed: {}", "timeout");

  // --- Contexts ---

  rlog::LoggerContext& net = logger.Context("net");
  rlog::LoggerContext& chain = logger.Context("chain");
  net.Info("listening on port {}", 8333);
  chain.Debug("height={} hash={}", 600000,
              "00000000000000000007316856900e76b4f7a9139cfbfba89842c8d196cd5f91");

  try
  {
    throw std::runtime_error("Error: peer sent invalid header");
  }
  catch (const std::exception& e)
  {
    net.Warning(e);
    net.Error(e);
  }

  net.Error(rlog::ErrorPayload{"TypeError", "expected a buffer",
                               "    at Parser.feed\n    at Peer.onData"});

  // --- Multi-threaded logging; enough output to rotate a few times ---

  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t)
  {
    workers.emplace_back(
        [&logger, t]
        {
          rlog::LoggerContext ctx =
              logger.Context("workers").Context("worker-" + std::to_string(t));
          for (int i = 0; i < 25; ++i)
          {
            ctx.Info("processing item {}", i);
          }
        });
  }
  for (auto& w : workers)
  {
    w.join();
  }

  // --- Explicit rotation ---

  try
  {
    if (auto archive = logger.Rotate().get())
    {
      logger.Info("rotated to {}", *archive);
    }
  }
  catch (const rlog::LogError& e)
  {
    logger.Warning("rotation failed: {}", e.what());
  }

  // --- Memory usage ---

  logger.Memory();
  chain.Memory();

  logger.Flush();
  std::printf("rotations: %llu, dropped lines: %llu\n",
              static_cast<unsigned long long>(logger.FileSink().RotationCount()),
              static_cast<unsigned long long>(logger.DropCount()));

  try
  {
    logger.Close();
  }
  catch (const rlog::StreamCloseError& e)
  {
    std::fprintf(stderr, "%s\n", e.what());
    return 1;
  }
  return 0;
}
