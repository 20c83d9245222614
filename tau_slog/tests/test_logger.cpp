#include "../include/tau_slog/slog.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <cmath>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace slog = tau::slog;

using slog::Entry;
using slog::Logger;
using slog::MemorySink;

namespace {

constexpr const char* kDefaultMessage   = "hello";
constexpr const char* kFormattedMessage = "works: %d";
constexpr const char* kFormattedResult  = "works: 42";

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

class CountingResolver : public slog::ILocationResolver {
public:
    explicit CountingResolver(std::atomic<int>* calls) : calls_(calls) {}

    slog::SourceLocation Resolve(std::uintptr_t) override {
        int n = ++*calls_;
        return slog::SourceLocation{"caller.cpp", static_cast<uint32_t>(100 + n), "Caller"};
    }

private:
    std::atomic<int>* calls_;
};

class ThrowingSink : public slog::ILogSink {
public:
    void Write(std::string_view) override { throw std::runtime_error("disk full"); }
    void Flush() override {}
};

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        slog::SourceLocationCache::Instance().SetResolver(std::make_unique<CountingResolver>(&resolves_));
        slog::SetOutput(default_sink_);
        slog::SetIncludeSources(true);
    }

    void TearDown() override {
        slog::SetOutput(std::make_shared<slog::ConsoleSink>());
        slog::SetErrorOutput(std::make_shared<slog::ConsoleSink>(slog::ConsoleSink::Stream::Stderr));
        slog::SetProject("");
        slog::SourceLocationCache::Instance().SetResolver(nullptr);
    }

    void ExpectSeverity(MemorySink& sink, const std::string& level, const std::function<void()>& emit) {
        sink.Clear();
        emit();
        ASSERT_EQ(sink.Size(), 1u) << "severity " << level;
        EXPECT_TRUE(contains(sink.At(0), "\"severity\":\"" + level + "\"")) << sink.At(0);
    }

    std::atomic<int> resolves_{0};
    std::shared_ptr<MemorySink> sink_         = std::make_shared<MemorySink>(8192);
    std::shared_ptr<MemorySink> default_sink_ = std::make_shared<MemorySink>(256);
    Logger logger_{sink_};
};

TEST_F(LoggerTest, Severities) {
    Entry entry = logger_.NewEntry();
    MemorySink& l = *sink_;
    MemorySink& d = *default_sink_;

    ExpectSeverity(d, "DEBUG", [] { slog::Debug(kDefaultMessage); });
    ExpectSeverity(d, "DEBUG", [] { slog::Debugf(kDefaultMessage); });
    ExpectSeverity(l, "DEBUG", [&] { logger_.Debug(kDefaultMessage); });
    ExpectSeverity(l, "DEBUG", [&] { logger_.Debugf(kDefaultMessage); });
    ExpectSeverity(l, "DEBUG", [&] { entry.Debug(kDefaultMessage); });
    ExpectSeverity(l, "DEBUG", [&] { entry.Debugf(kDefaultMessage); });

    ExpectSeverity(d, "INFO", [] { slog::Info(kDefaultMessage); });
    ExpectSeverity(d, "INFO", [] { slog::Infof(kDefaultMessage); });
    ExpectSeverity(l, "INFO", [&] { logger_.Info(kDefaultMessage); });
    ExpectSeverity(l, "INFO", [&] { logger_.Infof(kDefaultMessage); });
    ExpectSeverity(l, "INFO", [&] { entry.Info(kDefaultMessage); });
    ExpectSeverity(l, "INFO", [&] { entry.Infof(kDefaultMessage); });

    ExpectSeverity(d, "NOTICE", [] { slog::Notice(kDefaultMessage); });
    ExpectSeverity(d, "NOTICE", [] { slog::Noticef(kDefaultMessage); });
    ExpectSeverity(l, "NOTICE", [&] { logger_.Notice(kDefaultMessage); });
    ExpectSeverity(l, "NOTICE", [&] { logger_.Noticef(kDefaultMessage); });
    ExpectSeverity(l, "NOTICE", [&] { entry.Notice(kDefaultMessage); });
    ExpectSeverity(l, "NOTICE", [&] { entry.Noticef(kDefaultMessage); });

    ExpectSeverity(d, "WARNING", [] { slog::Warn(kDefaultMessage); });
    ExpectSeverity(d, "WARNING", [] { slog::Warnf(kDefaultMessage); });
    ExpectSeverity(l, "WARNING", [&] { logger_.Warn(kDefaultMessage); });
    ExpectSeverity(l, "WARNING", [&] { logger_.Warnf(kDefaultMessage); });
    ExpectSeverity(l, "WARNING", [&] { entry.Warn(kDefaultMessage); });
    ExpectSeverity(l, "WARNING", [&] { entry.Warnf(kDefaultMessage); });

    ExpectSeverity(d, "ERROR", [] { slog::Error(kDefaultMessage); });
    ExpectSeverity(d, "ERROR", [] { slog::Errorf(kDefaultMessage); });
    ExpectSeverity(l, "ERROR", [&] { logger_.Error(kDefaultMessage); });
    ExpectSeverity(l, "ERROR", [&] { logger_.Errorf(kDefaultMessage); });
    ExpectSeverity(l, "ERROR", [&] { entry.Error(kDefaultMessage); });
    ExpectSeverity(l, "ERROR", [&] { entry.Errorf(kDefaultMessage); });

    ExpectSeverity(d, "CRITICAL", [] { slog::Critical(kDefaultMessage); });
    ExpectSeverity(d, "CRITICAL", [] { slog::Criticalf(kDefaultMessage); });
    ExpectSeverity(l, "CRITICAL", [&] { logger_.Critical(kDefaultMessage); });
    ExpectSeverity(l, "CRITICAL", [&] { logger_.Criticalf(kDefaultMessage); });
    ExpectSeverity(l, "CRITICAL", [&] { entry.Critical(kDefaultMessage); });
    ExpectSeverity(l, "CRITICAL", [&] { entry.Criticalf(kDefaultMessage); });

    ExpectSeverity(d, "ALERT", [] { slog::Alert(kDefaultMessage); });
    ExpectSeverity(d, "ALERT", [] { slog::Alertf(kDefaultMessage); });
    ExpectSeverity(l, "ALERT", [&] { logger_.Alert(kDefaultMessage); });
    ExpectSeverity(l, "ALERT", [&] { logger_.Alertf(kDefaultMessage); });
    ExpectSeverity(l, "ALERT", [&] { entry.Alert(kDefaultMessage); });
    ExpectSeverity(l, "ALERT", [&] { entry.Alertf(kDefaultMessage); });

    ExpectSeverity(d, "EMERGENCY", [] { slog::Emergency(kDefaultMessage); });
    ExpectSeverity(d, "EMERGENCY", [] { slog::Emergencyf(kDefaultMessage); });
    ExpectSeverity(l, "EMERGENCY", [&] { logger_.Emergency(kDefaultMessage); });
    ExpectSeverity(l, "EMERGENCY", [&] { logger_.Emergencyf(kDefaultMessage); });
    ExpectSeverity(l, "EMERGENCY", [&] { entry.Emergency(kDefaultMessage); });
    ExpectSeverity(l, "EMERGENCY", [&] { entry.Emergencyf(kDefaultMessage); });
}

TEST_F(LoggerTest, OneLinePerEmission) {
    logger_.Info("one");
    logger_.Info("two");
    ASSERT_EQ(sink_->Size(), 2u);
    for (const auto& line : sink_->Lines()) {
        EXPECT_EQ(line.front(), '{');
        EXPECT_EQ(line.substr(line.size() - 2), "}\n");
        EXPECT_EQ(line.find('\n'), line.size() - 1);
    }
}

TEST_F(LoggerTest, FormattedMessages) {
    logger_.Infof(kFormattedMessage, 42);
    logger_.Info("a", 1, 2, "b");
    EXPECT_TRUE(contains(sink_->At(0), std::string("\"message\":\"") + kFormattedResult + "\""));
    EXPECT_TRUE(contains(sink_->At(1), "\"message\":\"a1 2b\""));
}

TEST_F(LoggerTest, MalformedFormatStillLogs) {
    logger_.Infof("%d");
    ASSERT_EQ(sink_->Size(), 1u);
    EXPECT_TRUE(contains(sink_->At(0), "%!("));
}

TEST_F(LoggerTest, DetailExampleScenario) {
    logger_.WithDetail("key", "value").Info("hello");
    logger_.Info("hello2");

    ASSERT_EQ(sink_->Size(), 2u);
    const std::string first = sink_->At(0);
    EXPECT_TRUE(contains(first, "\"message\":\"hello\""));
    EXPECT_TRUE(contains(first, "\"severity\":\"INFO\""));
    EXPECT_TRUE(contains(first, "\"details\":{\"key\":\"value\"}"));
    EXPECT_FALSE(contains(sink_->At(1), "\"details\""));
}

TEST_F(LoggerTest, ErrorLevelsCaptureStack) {
    logger_.Error("boom");
    logger_.Warn("no stack");
    logger_.WithError(std::runtime_error("cause")).Critical("critical");

    EXPECT_TRUE(contains(sink_->At(0), "\"exception\":\"boom:\\n\\n"));
    EXPECT_TRUE(contains(sink_->At(0), "(...)\\n\\t"));
    EXPECT_FALSE(contains(sink_->At(1), "\"exception\""));
    EXPECT_TRUE(contains(sink_->At(2), "\"error\":\"cause\""));
    EXPECT_TRUE(contains(sink_->At(2), "\"exception\":\"cause:\\n\\n"));
}

TEST_F(LoggerTest, SourceLocationIncludedByDefault) {
    EXPECT_TRUE(logger_.IncludeSources());
    logger_.Info("located");
    EXPECT_TRUE(contains(sink_->At(0), "\"logging.googleapis.com/sourceLocation\":{\"file\":\"caller.cpp\",\"line\":\"101\",\"function\":\"Caller\"}"));
}

TEST_F(LoggerTest, SourceLocationCanBeDisabled) {
    logger_.SetIncludeSources(false);
    EXPECT_FALSE(logger_.IncludeSources());
    logger_.Info("unlocated");
    EXPECT_FALSE(contains(sink_->At(0), "sourceLocation"));
    EXPECT_EQ(resolves_.load(), 0);
}

TEST_F(LoggerTest, RepeatedCallSiteIsCached) {
    auto& cache = slog::SourceLocationCache::Instance();
    const uint64_t misses = cache.Misses();
    for (int i = 0; i < 3; ++i) {
        logger_.Info("loop");
    }
    EXPECT_EQ(resolves_.load(), 1);
    EXPECT_EQ(cache.Misses(), misses + 1);

    ASSERT_EQ(sink_->Size(), 3u);
    const std::string key = "\"logging.googleapis.com/sourceLocation\":";
    auto location_of = [&](const std::string& line) {
        auto pos = line.find(key);
        return line.substr(pos, line.find('}', pos) - pos);
    };
    EXPECT_EQ(location_of(sink_->At(0)), location_of(sink_->At(2)));

    logger_.Info("another call site");
    EXPECT_EQ(resolves_.load(), 2);
}

TEST_F(LoggerTest, ConcurrentWritersProduceWholeLines) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 200;
    Entry shared = logger_.WithLabels({{"shared", "yes"}});

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            Entry mine = shared.WithDetail("thread", t);
            for (int i = 0; i < kPerThread; ++i) {
                if (i % 2 == 0) {
                    mine.Infof("thread %d line %d", t, i);
                } else {
                    shared.WithDetail("i", i).Warn("shared ", i);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto lines = sink_->Lines();
    ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kPerThread));
    for (const auto& line : lines) {
        ASSERT_GE(line.size(), 2u);
        EXPECT_EQ(line.rfind("{\"message\":", 0), 0u) << line;
        EXPECT_EQ(line.substr(line.size() - 2), "}\n") << line;
        EXPECT_EQ(line.find('\n'), line.size() - 1) << line;
        EXPECT_TRUE(contains(line, "\"shared\":\"yes\""));
    }
}

TEST_F(LoggerTest, SerializationFailureIsReported) {
    auto errors = std::make_shared<MemorySink>(16);
    logger_.SetErrorOutput(errors);

    EXPECT_NO_THROW(logger_.WithDetail("bad", std::nan("")).Info("unserializable"));
    EXPECT_EQ(sink_->Size(), 0u);
    ASSERT_EQ(errors->Size(), 1u);
    EXPECT_EQ(errors->At(0).rfind("could not marshal log: ", 0), 0u);

    logger_.Info("still works");
    EXPECT_EQ(sink_->Size(), 1u);
}

TEST_F(LoggerTest, SinkFailureIsReported) {
    auto errors = std::make_shared<MemorySink>(16);
    logger_.SetErrorOutput(errors);
    logger_.SetOutput(std::make_shared<ThrowingSink>());

    EXPECT_NO_THROW(logger_.Info("dropped"));
    ASSERT_EQ(errors->Size(), 1u);
    EXPECT_TRUE(contains(errors->At(0), "disk full"));
}

TEST_F(LoggerTest, NonStandardSinkExceptionIsReported) {
    auto errors = std::make_shared<MemorySink>(16);
    logger_.SetErrorOutput(errors);
    logger_.SetOutput(std::make_shared<slog::CallbackSink>([](std::string_view) { throw 42; }));

    EXPECT_NO_THROW(logger_.Info("x"));
    ASSERT_EQ(errors->Size(), 1u);
    EXPECT_EQ(errors->At(0), "could not marshal log: unknown sink error\n");
}

TEST_F(LoggerTest, FailingErrorOutputDoesNotThrow) {
    auto throwing = std::make_shared<slog::CallbackSink>([](std::string_view) { throw 42; });
    logger_.SetOutput(throwing);
    logger_.SetErrorOutput(throwing);

    EXPECT_NO_THROW(logger_.Info("x"));
    EXPECT_NO_THROW(logger_.WithDetail("bad", std::nan("")).Info("y"));
}

TEST_F(LoggerTest, NullOutputDiscards) {
    logger_.SetOutput(nullptr);
    EXPECT_NO_THROW(logger_.Info("nowhere"));
    logger_.SetOutput(sink_);
    logger_.Info("somewhere");
    EXPECT_EQ(sink_->Size(), 1u);
}

TEST_F(LoggerTest, SetOutputSwitchesDestination) {
    auto other = std::make_shared<MemorySink>(16);
    logger_.Info("first");
    logger_.SetOutput(other);
    logger_.Info("second");
    EXPECT_EQ(sink_->Size(), 1u);
    EXPECT_EQ(other->Size(), 1u);
    EXPECT_TRUE(contains(other->At(0), "second"));
}

TEST_F(LoggerTest, ProjectSetter) {
    EXPECT_TRUE(logger_.Project().empty());
    logger_.SetProject("my-project");
    EXPECT_EQ(logger_.Project(), "my-project");
}

TEST_F(LoggerTest, PackageLevelChainsUseDefault) {
    slog::SetProject("default-proj");
    slog::WithLabels({{"pkg", "1"}}).Info("labels");
    slog::WithDetail("pkg", 2).Info("detail");
    slog::WithDetails({{"pkg", 3}}).Info("details");
    slog::WithError(std::runtime_error("pkg error")).Info("error");
    slog::WithSpan(slog::SpanContext{"4bf92f3577b34da6a3ce929d0e0e4736", "00f067aa0ba902b7", false}).Info("span");
    slog::WithStack().Info("stack");
    Entry op = slog::StartOperation("pkg-op", "pkg");
    op.EndOperation();
    slog::WithOperation("pkg-op2", "pkg").Info("op");
    slog::NewEntry().Info("new entry");

    auto lines = default_sink_->Lines();
    ASSERT_EQ(lines.size(), 10u);
    EXPECT_TRUE(contains(lines[0], "/labels\":{\"pkg\":\"1\"}"));
    EXPECT_TRUE(contains(lines[1], "\"details\":{\"pkg\":2}"));
    EXPECT_TRUE(contains(lines[2], "\"details\":{\"pkg\":3}"));
    EXPECT_TRUE(contains(lines[3], "\"error\":\"pkg error\""));
    EXPECT_TRUE(contains(lines[4], "projects/default-proj/traces/4bf92f3577b34da6a3ce929d0e0e4736"));
    EXPECT_TRUE(contains(lines[5], "\"exception\":\"stack:"));
    EXPECT_TRUE(contains(lines[6], "\"first\":true"));
    EXPECT_TRUE(contains(lines[7], "\"last\":true"));
    EXPECT_TRUE(contains(lines[8], "\"id\":\"pkg-op2\""));
    EXPECT_FALSE(contains(lines[9], "operation"));
    EXPECT_EQ(sink_->Size(), 0u);
}

TEST_F(LoggerTest, DefaultIsSingleton) {
    EXPECT_EQ(&Logger::Default(), &Logger::Default());
    EXPECT_EQ(&slog::NewEntry().Owner(), &Logger::Default());
}
