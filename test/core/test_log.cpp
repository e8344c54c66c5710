#include <catch2/catch_test_macros.hpp>

#include <tabedit/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace tabedit;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: level, component and message on one line", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(oss);
    sink.Write(LogLevel::Info, "session", "Rename Sales/M1 to Base");

    auto line = oss.str();
    CHECK(line.find(" INFO  session: Rename Sales/M1 to Base\n") != std::string::npos);
    CHECK(line.back() == '\n');
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "session", "started");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"session\"") != std::string::npos);
    CHECK(line.find("\"message\":\"started\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    // Must end with newline
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second");

    auto output = oss.str();
    // Count newlines — should be exactly 2
    auto count = std::count(output.begin(), output.end(), '\n');
    CHECK(count == 2);
}

TEST_CASE("JsonSink: all log levels produce correct names", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "x", "d");
    sink.Write(LogLevel::Info, "x", "i");
    sink.Write(LogLevel::Warn, "x", "w");
    sink.Write(LogLevel::Error, "x", "e");

    auto output = oss.str();
    CHECK(output.find("\"level\":\"DEBUG\"") != std::string::npos);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(output.find("\"level\":\"ERROR\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);

    auto parsed = nlohmann::json::parse(output);
    CHECK(parsed["message"] == "line1\nline2\ttab \"quoted\" back\\slash");
    CHECK(parsed["component"] == "esc");
}

// ===========================================================================
// Logger: level filtering
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: Debug level passes all messages", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    CHECK(sink_ptr->messages.size() == 4);
}

TEST_CASE("Logger: Error level only passes errors", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Info("c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "now passes");
}

// ===========================================================================
// Logger: message content
// ===========================================================================

TEST_CASE("Logger: preserves component and message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Info("fixup", "rewrote 2 expressions");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "fixup");
    CHECK(sink_ptr->messages[0].message == "rewrote 2 expressions");
    CHECK(sink_ptr->messages[0].level == LogLevel::Info);
}

// ===========================================================================
// Logger: thread safety
// ===========================================================================

TEST_CASE("Logger: concurrent logging does not crash", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t),
                            "msg-" + std::to_string(i));
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// FileSink
// ===========================================================================

TEST_CASE("FileSink: appends JSON lines to the file", "[log]") {
    auto path = std::filesystem::temp_directory_path() / "tabedit_test_log.jsonl";
    std::filesystem::remove(path);
    {
        FileSink sink(path.string());
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "loader", "loaded 3 tables");
        sink.Write(LogLevel::Warn, "index", "unterminated string");
    }
    std::ifstream in(path);
    std::string first, second;
    std::getline(in, first);
    std::getline(in, second);
    CHECK(first.find("\"component\":\"loader\"") != std::string::npos);
    CHECK(second.find("\"level\":\"WARN\"") != std::string::npos);
    std::filesystem::remove(path);
}

TEST_CASE("FileSink: unopenable path is silently ignored", "[log]") {
    FileSink sink("/nonexistent-dir/tabedit.log");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Error, "x", "dropped");
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: LogInfo reaches the installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("g", "filtered");
    LogInfo("g", "kept");
    LogError("g", "kept too");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].message == "kept");
    CHECK(GlobalLogger().Level() == LogLevel::Info);

    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
