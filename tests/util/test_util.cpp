// KEYSEAL - Util Module Tests
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include <gtest/gtest.h>

#include <keyseal/util/logging.h>
#include <keyseal/util/fs.h>
#include <keyseal/util/threadpool.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <future>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace keyseal {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> Capture(LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { captured_.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }

    std::vector<LogEntry> captured_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Info"), LogLevel::Info);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("ERROR"), LogLevel::Error);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("invalid"), LogLevel::Info); // Default
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, LoggerAddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, LoggerWillLog) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Info);

    EXPECT_FALSE(logger.WillLog(LogLevel::Debug, LogCategory::KEYSTORE));
    EXPECT_TRUE(logger.WillLog(LogLevel::Info, LogCategory::KEYSTORE));
    EXPECT_TRUE(logger.WillLog(LogLevel::Error, LogCategory::KEYSTORE));
    EXPECT_FALSE(logger.WillLog(LogLevel::Off, LogCategory::KEYSTORE));
}

TEST_F(LoggingTest, LoggerCategoryFiltering) {
    auto& logger = Logger::Instance();

    logger.DisableAllCategories();
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::KDF));

    logger.EnableCategory(LogCategory::KDF);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::KDF));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::KEYSTORE));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::KEYSTORE));
}

TEST_F(LoggingTest, StreamMacroReachesSink) {
    Capture();
    Logger::Instance().SetLevel(LogLevel::Debug);

    LOG_INFO(LogCategory::KEYSTORE) << "record " << 42 << " loaded";
    LOG_TRACE(LogCategory::KEYSTORE) << "below threshold";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "record 42 loaded");
    EXPECT_EQ(captured_[0].category, LogCategory::KEYSTORE);
    EXPECT_EQ(captured_[0].level, LogLevel::Info);
    EXPECT_GT(captured_[0].line, 0);
}

TEST_F(LoggingTest, SinkLevelFilters) {
    Capture(LogLevel::Warn);
    Logger::Instance().SetLevel(LogLevel::Trace);

    LOG_INFO(LogCategory::TOOL) << "quiet";
    LOG_WARN(LogCategory::TOOL) << "loud";

    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message, "loud");
}

TEST_F(LoggingTest, ScopedLogTimerLogsStartAndCompletion) {
    Capture();
    Logger::Instance().SetLevel(LogLevel::Debug);

    {
        ScopedLogTimer timer(LogCategory::KDF, "pbkdf2 c=2");
        EXPECT_GE(timer.ElapsedMillis(), 0);
    }

    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[0].message, "Starting: pbkdf2 c=2");
    EXPECT_EQ(captured_[1].message.rfind("Completed: pbkdf2 c=2 in ", 0), 0u);
}

TEST_F(LoggingTest, ConsoleFormat) {
    ConsoleSink::Config config;
    config.useColors = false;
    config.showTimestamp = false;
    ConsoleSink sink(config);

    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::KEYSTORE;
    entry.message = "MAC mismatch";
    EXPECT_EQ(sink.Format(entry), "[WARN ] [keystore] MAC mismatch");

    entry.category = LogCategory::DEFAULT;
    EXPECT_EQ(sink.Format(entry), "[WARN ] MAC mismatch");
}

TEST_F(LoggingTest, ConfigureLoggingInstallsSinks) {
    LogSettings settings;
    settings.level = LogLevel::Debug;
    settings.printToConsole = true;
    settings.categories = {LogCategory::KDF};

    ASSERT_TRUE(ConfigureLogging(settings));
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 1u);
    EXPECT_EQ(logger.GetLevel(), LogLevel::Debug);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::KDF));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::KEYSTORE));
}

TEST_F(LoggingTest, ConfigureLoggingWritesFile) {
    char path[] = "/tmp/keyseal_log_test_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);

    LogSettings settings;
    settings.level = LogLevel::Info;
    settings.printToConsole = false;
    settings.logFile = path;
    ASSERT_TRUE(ConfigureLogging(settings));

    LOG_INFO(LogCategory::TOOL) << "written to file";
    Logger::Instance().Flush();
    Logger::Instance().ClearSinks();

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("written to file"), std::string::npos);
    std::remove(path);
}

TEST_F(LoggingTest, ConfigureLoggingFailsOnBadFile) {
    LogSettings settings;
    settings.printToConsole = false;
    settings.logFile = "/nonexistent-dir/keyseal.log";
    EXPECT_FALSE(ConfigureLogging(settings));
}

TEST_F(LoggingTest, FixedWidthAndBasename) {
    EXPECT_EQ(FixedWidth("WARN", 5), "WARN ");
    EXPECT_EQ(FixedWidth("TOOLONG", 5), "TOOLO");
    EXPECT_EQ(GetBasename("/a/b/keystore.cpp"), "keystore.cpp");
    EXPECT_EQ(GetBasename("keystore.cpp"), "keystore.cpp");
}

// ============================================================================
// Filesystem Tests
// ============================================================================

class FilesystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir[] = "/tmp/keyseal_fs_test_XXXXXX";
        if (mkdtemp(dir) == nullptr) {
            throw std::runtime_error("Failed to create temp directory");
        }
        dir_ = dir;
    }

    void TearDown() override {
        for (const auto& file : files_) {
            std::remove(file.c_str());
        }
        rmdir(dir_.c_str());
    }

    std::string PathFor(const std::string& name) {
        files_.push_back(dir_ + "/" + name);
        return files_.back();
    }

    std::string dir_;
    std::vector<std::string> files_;
};

TEST_F(FilesystemTest, WriteThenRead) {
    std::string path = PathFor("data.txt");
    ASSERT_TRUE(fs::SecureWriteFile(path, "hello"));

    EXPECT_TRUE(fs::Exists(path));
    EXPECT_TRUE(fs::IsFile(path));
    EXPECT_EQ(fs::FileSize(path), 5u);
    EXPECT_EQ(fs::ReadFile(path), std::string("hello"));
}

TEST_F(FilesystemTest, WrittenFileIsOwnerOnly) {
    std::string path = PathFor("secret.txt");
    ASSERT_TRUE(fs::SecureWriteFile(path, "x"));

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(FilesystemTest, ExclusiveCreateUnlessOverwrite) {
    std::string path = PathFor("once.txt");
    ASSERT_TRUE(fs::SecureWriteFile(path, "first"));
    EXPECT_FALSE(fs::SecureWriteFile(path, "second"));
    EXPECT_EQ(fs::ReadFile(path), std::string("first"));

    EXPECT_TRUE(fs::SecureWriteFile(path, "2nd", true));
    EXPECT_EQ(fs::ReadFile(path), std::string("2nd"));
}

TEST_F(FilesystemTest, ReadRespectsLimit) {
    std::string path = PathFor("big.txt");
    ASSERT_TRUE(fs::SecureWriteFile(path, std::string(100, 'a')));
    EXPECT_FALSE(fs::ReadFile(path, 99).has_value());
    EXPECT_TRUE(fs::ReadFile(path, 100).has_value());
}

TEST_F(FilesystemTest, MissingAndDirectoryPaths) {
    EXPECT_FALSE(fs::Exists(dir_ + "/missing"));
    EXPECT_FALSE(fs::ReadFile(dir_ + "/missing").has_value());
    EXPECT_FALSE(fs::FileSize(dir_ + "/missing").has_value());

    EXPECT_TRUE(fs::Exists(dir_));
    EXPECT_FALSE(fs::IsFile(dir_));
    EXPECT_FALSE(fs::ReadFile(dir_).has_value());
}

// ============================================================================
// Thread Pool Tests
// ============================================================================

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool_ = std::make_unique<ThreadPool>(4);
    }

    void TearDown() override {
        pool_.reset();
    }

    std::unique_ptr<ThreadPool> pool_;
};

TEST_F(ThreadPoolTest, Construction) {
    EXPECT_TRUE(pool_->IsRunning());
    EXPECT_EQ(pool_->ThreadCount(), 4u);
    EXPECT_EQ(pool_->Name(), "pool");
}

TEST_F(ThreadPoolTest, SubmitAndWait) {
    std::atomic<int> counter{0};

    auto future = pool_->Submit([&counter]() {
        counter++;
        return 42;
    });

    EXPECT_EQ(future.get(), 42);
    EXPECT_EQ(counter.load(), 1);
}

TEST_F(ThreadPoolTest, SubmitWithArguments) {
    auto future = pool_->Submit([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_EQ(future.get(), 42);
}

TEST_F(ThreadPoolTest, MultipleTasks) {
    const int numTasks = 100;
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < numTasks; ++i) {
        futures.push_back(pool_->Submit([&counter]() {
            counter++;
        }));
    }

    WaitAll(futures);
    EXPECT_EQ(counter.load(), numTasks);
}

TEST_F(ThreadPoolTest, WaitAllCollectsResults) {
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(AsyncOn(*pool_, [i]() { return i * i; }));
    }

    std::vector<int> results = WaitAll(futures);
    EXPECT_EQ(results, (std::vector<int>{0, 1, 4, 9, 16}));
}

TEST_F(ThreadPoolTest, ExceptionsPropagateThroughFuture) {
    auto future = pool_->Submit([]() -> int {
        throw std::runtime_error("task failed");
    });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives and keeps serving tasks
    EXPECT_EQ(pool_->Submit([]() { return 1; }).get(), 1);
}

TEST_F(ThreadPoolTest, WaitBlocksUntilIdle) {
    std::atomic<int> completed{0};
    for (int i = 0; i < 8; ++i) {
        pool_->Submit([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            completed++;
        });
    }

    pool_->Wait();
    EXPECT_EQ(completed.load(), 8);
    EXPECT_EQ(pool_->PendingTasks(), 0u);
    EXPECT_EQ(pool_->ActiveTasks(), 0u);
}

TEST_F(ThreadPoolTest, ShutdownDrainsQueue) {
    std::atomic<int> completed{0};
    for (int i = 0; i < 10; ++i) {
        pool_->Submit([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            completed++;
        });
    }

    pool_->Shutdown();
    EXPECT_FALSE(pool_->IsRunning());
    EXPECT_EQ(completed.load(), 10);
    EXPECT_THROW(pool_->Submit([]() {}), std::runtime_error);
}

TEST_F(ThreadPoolTest, QueueLimit) {
    ThreadPool::Config config;
    config.numThreads = 1;
    config.maxQueueSize = 1;
    config.name = "small";
    ThreadPool smallPool(config);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::promise<void> started;

    auto blocker = smallPool.Submit([gate, &started]() {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    auto queued = smallPool.Submit([]() {});
    EXPECT_THROW(smallPool.Submit([]() {}), std::runtime_error);

    release.set_value();
    blocker.get();
    queued.get();
}

TEST_F(ThreadPoolTest, DeferredStart) {
    ThreadPool::Config config;
    config.numThreads = 2;
    config.startImmediately = false;
    ThreadPool pool(config);

    EXPECT_FALSE(pool.IsRunning());
    EXPECT_THROW(pool.Submit([]() {}), std::runtime_error);

    pool.Start();
    EXPECT_TRUE(pool.IsRunning());
    EXPECT_EQ(pool.Submit([]() { return 5; }).get(), 5);
}

TEST(GlobalThreadPoolTest, InitAndShutdown) {
    ThreadPool::Config config;
    config.numThreads = 3;
    config.name = "kdf";
    InitGlobalThreadPool(config);

    EXPECT_EQ(GetGlobalThreadPool().Name(), "kdf");
    EXPECT_EQ(GetGlobalThreadPool().ThreadCount(), 3u);
    EXPECT_EQ(Async([]() { return 7; }).get(), 7);

    ShutdownGlobalThreadPool();

    // Recreated lazily with defaults
    EXPECT_EQ(GetGlobalThreadPool().Name(), "global");
    ShutdownGlobalThreadPool();
}

} // namespace
} // namespace util
} // namespace keyseal
