#include "../include/rlog/logger.hpp"
#include "../include/rlog/errors.hpp"
#include "../include/rlog/sinks/callback_sink.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

struct Captured {
    rlog::LogLevel level;
    std::string module;
    std::string message;
};

class LoggerIntegrationTest : public ::testing::Test {
protected:
    rlog_test::TempDir dir_;
    FILE* out_ = nullptr;
    FILE* err_ = nullptr;
    std::mutex captured_mutex_;
    std::vector<Captured> captured_;

    void SetUp() override {
        ASSERT_TRUE(dir_.Valid());
        out_ = std::tmpfile();
        err_ = std::tmpfile();
        ASSERT_NE(out_, nullptr);
        ASSERT_NE(err_, nullptr);
    }

    void TearDown() override {
        std::fclose(out_);
        std::fclose(err_);
    }

    rlog::LoggerRuntime Runtime() {
        rlog::LoggerRuntime runtime;
        runtime.retry_delay = 20ms;
        runtime.console_out = out_;
        runtime.console_err = err_;
        return runtime;
    }

    std::unique_ptr<rlog::Logger> MakeLogger(rlog::LoggerOptions options = {}) {
        auto logger = std::make_unique<rlog::Logger>(options, Runtime());
        logger->AddSink(std::make_unique<rlog::CallbackSink>(
            [this](const rlog::LogRecord& r) {
                std::lock_guard<std::mutex> lock(captured_mutex_);
                captured_.push_back({r.level, std::string(r.module), std::string(r.message)});
            }));
        return logger;
    }

    static std::string Contents(FILE* f) {
        std::fflush(f);
        std::rewind(f);
        std::string result;
        char buf[256];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
            result.append(buf, n);
        }
        return result;
    }

    rlog::LoggerOptions Options(const std::string& level, bool with_file = false) {
        rlog::LoggerOptions opts;
        opts.level = level;
        opts.colors = false;
        opts.timestamps = false;
        if (with_file) {
            opts.filename = dir_.File("debug.log");
        }
        return opts;
    }
};

TEST_F(LoggerIntegrationTest, DefaultLevelIsNone) {
    auto logger = MakeLogger();
    EXPECT_EQ(logger->Level(), rlog::LogLevel::None);
    logger->Open();
    logger->Error("nothing {}", 1);
    EXPECT_TRUE(captured_.empty());
}

TEST_F(LoggerIntegrationTest, LogInfoBasic) {
    auto logger = MakeLogger(Options("info"));
    logger->Open();
    logger->Info("hello {}", "world");

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "hello world");
    EXPECT_EQ(captured_[0].level, rlog::LogLevel::Info);
    EXPECT_TRUE(captured_[0].module.empty());
}

TEST_F(LoggerIntegrationTest, LogLevelFiltering) {
    auto logger = MakeLogger(Options("spam", true));
    logger->Open();
    logger->SetLevel("warning");

    logger->Spam("too chatty");
    logger->Debug("too chatty");
    logger->Info("too chatty");
    logger->Flush();
    EXPECT_TRUE(captured_.empty());
    EXPECT_EQ(rlog_test::FileSize(dir_.File("debug.log")), 0u);
    EXPECT_EQ(Contents(out_), "");

    logger->Warning("should appear");
    logger->Error("also appears");
    EXPECT_EQ(captured_.size(), 2u);
}

TEST_F(LoggerIntegrationTest, AllLevelsWhenSpam) {
    auto logger = MakeLogger(Options("spam"));
    logger->Open();
    logger->Error("e");
    logger->Warning("w");
    logger->Info("i");
    logger->Debug("d");
    logger->Spam("s");

    ASSERT_EQ(captured_.size(), 5u);
    EXPECT_EQ(captured_[0].level, rlog::LogLevel::Error);
    EXPECT_EQ(captured_[4].level, rlog::LogLevel::Spam);
}

TEST_F(LoggerIntegrationTest, NothingBeforeOpenOrAfterClose) {
    auto logger = MakeLogger(Options("spam", true));
    logger->Info("before open");
    EXPECT_FALSE(logger->IsOpen());

    logger->Open();
    EXPECT_TRUE(logger->IsOpen());
    logger->Info("while open");
    logger->Close();
    EXPECT_FALSE(logger->IsOpen());

    logger->Info("after close");
    logger->Error(rlog::ErrorPayload{"Error", "after close", ""});
    logger->Memory();

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "while open");
    EXPECT_EQ(rlog_test::ReadFile(dir_.File("debug.log")).find("after close"),
              std::string::npos);
}

TEST_F(LoggerIntegrationTest, FileLineFormat) {
    auto logger = MakeLogger(Options("info", true));
    logger->Open();
    logger->Context("net").Info("peer {} connected", 7);
    logger->Close();

    std::string content = rlog_test::ReadFile(dir_.File("debug.log"));
    std::regex pattern(R"(\[I:\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z\] \(net\) peer 7 connected\n)");
    EXPECT_TRUE(std::regex_match(content, pattern)) << "Actual: " << content;
}

TEST_F(LoggerIntegrationTest, ConsoleSplitsErrorToStderr) {
    auto logger = MakeLogger(Options("info"));
    logger->Open();
    logger->Info("all good");
    logger->Context("db").Error("disk {}", "full");
    logger->Flush();

    EXPECT_EQ(Contents(out_), "[info] all good\n");
    EXPECT_EQ(Contents(err_), "[error] (db) disk full\n");
}

TEST_F(LoggerIntegrationTest, ConsoleTimestamps) {
    rlog::LoggerOptions opts = Options("info");
    opts.timestamps = true;
    auto logger = MakeLogger(opts);
    logger->Open();
    logger->Info("tick");
    logger->Flush();

    std::regex pattern(R"(\(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z\) \[info\] tick\n)");
    std::string out = Contents(out_);
    EXPECT_TRUE(std::regex_match(out, pattern)) << "Actual: " << out;
}

TEST_F(LoggerIntegrationTest, ConsoleDisabled) {
    rlog::LoggerOptions opts = Options("info", true);
    opts.console = false;
    auto logger = MakeLogger(opts);
    logger->Open();
    logger->Info("file only");
    logger->Close();

    EXPECT_EQ(Contents(out_), "");
    EXPECT_NE(rlog_test::ReadFile(dir_.File("debug.log")).find("file only"),
              std::string::npos);
}

TEST_F(LoggerIntegrationTest, ErrorPayloadRendering) {
    auto logger = MakeLogger(Options("spam"));
    logger->Open();

    rlog::ErrorPayload err{"Error", "Error: socket hang up", "  at connect()"};
    logger->Error(err);
    logger->Warning(err);
    logger->Info(err);
    logger->Debug(std::runtime_error("bad header"));

    ASSERT_EQ(captured_.size(), 4u);
    EXPECT_EQ(captured_[0].message, "socket hang up\n  at connect()");
    EXPECT_EQ(captured_[1].message, "Error: socket hang up\n  at connect()");
    EXPECT_EQ(captured_[2].message, "Error: socket hang up");
    EXPECT_EQ(captured_[3].message, "Error: bad header");
}

TEST_F(LoggerIntegrationTest, LogWithArgsPayload) {
    auto logger = MakeLogger(Options("info"));
    logger->Open();
    logger->Log(rlog::LogLevel::Info, "rpc", rlog::ArgsPayload{"pre-rendered"});
    logger->Log(rlog::LogLevel::Debug, "rpc", rlog::ArgsPayload{"filtered"});

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].module, "rpc");
    EXPECT_EQ(captured_[0].message, "pre-rendered");
}

TEST_F(LoggerIntegrationTest, ContextsAreCached) {
    auto logger = MakeLogger();
    rlog::LoggerContext& a = logger->Context("net");
    rlog::LoggerContext& b = logger->Context("net");
    rlog::LoggerContext& c = logger->Context("chain");
    EXPECT_EQ(&a, &b);
    EXPECT_NE(&a, &c);
    EXPECT_EQ(a.Module(), "net");
    EXPECT_EQ(&a.GetLogger(), logger.get());
}

TEST_F(LoggerIntegrationTest, SetAppliesOptions) {
    auto logger = MakeLogger();
    logger->Set(rlog::LoggerOptions::Parse({{"level", "debug"},
                                            {"filename", dir_.File("node.log")},
                                            {"maxFileSize", "4096"},
                                            {"maxFiles", "3"}}));
    EXPECT_EQ(logger->Level(), rlog::LogLevel::Debug);
    EXPECT_EQ(logger->FileSink().Path(), dir_.File("node.log"));
    EXPECT_EQ(logger->FileSink().MaxFileSize(), 4096u);
    EXPECT_EQ(logger->FileSink().MaxFiles(), 3u);
}

TEST_F(LoggerIntegrationTest, SetLevelByString) {
    auto logger = MakeLogger();
    logger->Set("error");
    EXPECT_EQ(logger->Level(), rlog::LogLevel::Error);
    logger->SetLevel(rlog::LogLevel::Spam);
    EXPECT_TRUE(logger->Enabled(rlog::LogLevel::Spam));
    EXPECT_THROW(logger->SetLevel("shout"), rlog::InvalidConfigurationError);
    EXPECT_EQ(logger->Level(), rlog::LogLevel::Spam);
}

TEST_F(LoggerIntegrationTest, BadLevelAppliesNothing) {
    auto logger = MakeLogger();
    rlog::LoggerOptions opts;
    opts.level = "shout";
    opts.filename = dir_.File("node.log");
    EXPECT_THROW(logger->Set(opts), rlog::InvalidConfigurationError);
    EXPECT_EQ(logger->FileSink().Path(), "");
    EXPECT_EQ(logger->Level(), rlog::LogLevel::None);
}

TEST_F(LoggerIntegrationTest, SetFileAfterOpenThrows) {
    auto logger = MakeLogger(Options("info", true));
    logger->Open();
    EXPECT_THROW(logger->SetFile(dir_.File("other.log")), rlog::InvalidStateError);
    rlog::LoggerOptions opts;
    opts.filename = dir_.File("other.log");
    EXPECT_THROW(logger->Set(opts), rlog::InvalidStateError);

    logger->Close();
    EXPECT_NO_THROW(logger->SetFile(dir_.File("other.log")));
}

TEST_F(LoggerIntegrationTest, OpenFailurePropagates) {
    auto logger = MakeLogger();
    logger->SetFile(dir_.File("missing/debug.log"));
    EXPECT_THROW(logger->Open(), rlog::StreamOpenError);
    EXPECT_FALSE(logger->IsOpen());
}

TEST_F(LoggerIntegrationTest, RotateThroughLogger) {
    auto logger = MakeLogger(Options("info", true));
    logger->Open();
    logger->Info("first file");

    auto archive = logger->Rotate().get();
    ASSERT_TRUE(archive.has_value());
    logger->Info("second file");
    logger->Close();

    EXPECT_NE(rlog_test::ReadFile(*archive).find("first file"), std::string::npos);
    std::string current = rlog_test::ReadFile(dir_.File("debug.log"));
    EXPECT_NE(current.find("second file"), std::string::npos);
    EXPECT_EQ(current.find("first file"), std::string::npos);
}

TEST_F(LoggerIntegrationTest, SizeTriggeredRotationKeepsEveryLine) {
    rlog::LoggerOptions opts = Options("info", true);
    opts.max_file_size = 256;
    opts.max_files = 100;
    auto logger = MakeLogger(opts);
    logger->Open();
    for (int i = 0; i < 50; ++i) {
        logger->Info("line {:03}", i);
    }
    logger->Flush();

    EXPECT_GT(logger->FileSink().RotationCount(), 0u);
    size_t total = 0;
    for (const auto& name : rlog_test::ListDir(dir_.Path())) {
        total += rlog_test::CountLines(rlog_test::ReadFile(dir_.File(name)));
    }
    EXPECT_EQ(total, 50u);
    EXPECT_EQ(logger->DropCount(), 0u);
}

TEST_F(LoggerIntegrationTest, MemoryLogsAtDebug) {
    auto logger = MakeLogger(Options("debug"));
    logger->Open();
    logger->Memory("mem");

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, rlog::LogLevel::Debug);
    EXPECT_EQ(captured_[0].module, "mem");
    std::regex pattern(R"(Memory: rss=\d+mb, heap=\d+/\d+mb mapped=\d+mb)");
    EXPECT_TRUE(std::regex_match(captured_[0].message, pattern)) << captured_[0].message;

    logger->SetLevel("info");
    logger->Memory();
    EXPECT_EQ(captured_.size(), 1u);
}

TEST_F(LoggerIntegrationTest, MemoryUsageSample) {
    auto logger = MakeLogger();
    rlog::MemoryUsage mem = logger->GetMemoryUsage();
#if defined(RLOG_PLATFORM_LINUX)
    EXPECT_GT(mem.total, 0u);
#endif
    EXPECT_LE(mem.heap, mem.heap_total + 1);
}

TEST_F(LoggerIntegrationTest, MacrosForwardToLoggerAndContext) {
    auto logger = MakeLogger(Options("info"));
    logger->Open();
    RLOG_INFO(*logger, "macro {}", 1);
    RLOG_WARNING(logger->Context("m"), "macro {}", 2);
    RLOG_ERROR(*logger, std::runtime_error("macro 3"));

    ASSERT_EQ(captured_.size(), 3u);
    EXPECT_EQ(captured_[0].message, "macro 1");
    EXPECT_EQ(captured_[1].module, "m");
    EXPECT_EQ(captured_[2].message, "macro 3");
}

TEST_F(LoggerIntegrationTest, StreamErrorNeverReachesCaller) {
    auto fs = std::make_shared<rlog_test::FaultyFileSystem>();
    rlog::LoggerRuntime runtime = Runtime();
    runtime.file_system = fs;
    rlog::Logger logger(Options("info", true), runtime);
    logger.Open();

    fs->write_errno = EIO;
    EXPECT_NO_THROW(logger.Info("lost"));
    EXPECT_TRUE(logger.FileSink().RetryPending());

    fs->write_errno = 0;
    ASSERT_TRUE(rlog_test::WaitFor([&] { return logger.FileSink().HasHandle(); }));
    logger.Info("recovered");
    logger.Close();

    std::string content = rlog_test::ReadFile(dir_.File("debug.log"));
    EXPECT_EQ(content.find("lost"), std::string::npos);
    EXPECT_NE(content.find("recovered"), std::string::npos);
    EXPECT_NE(Contents(out_).find("lost"), std::string::npos);
}

TEST_F(LoggerIntegrationTest, DestructorClosesFile) {
    {
        auto logger = MakeLogger(Options("info", true));
        logger->Open();
        logger->Info("before destruct");
    }
    EXPECT_NE(rlog_test::ReadFile(dir_.File("debug.log")).find("before destruct"),
              std::string::npos);
}
