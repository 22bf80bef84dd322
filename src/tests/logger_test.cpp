#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include <chrono>
#include <vector>
#include "logger/logger.hpp"

using namespace docrep::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = std::filesystem::temp_directory_path() /
            ("docrep_logs_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
        log_file = log_dir / "docrep-test.log";

        // Initialize logging
        init_logging(log_file.string(), boost::log::trivial::trace, false);
    }

    void TearDown() override {
        // Ensure all logs are written
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        
        // Clean up log files
        std::error_code ec;
        std::filesystem::remove_all(log_dir, ec);
    }

    bool log_contains(const std::string& text, int max_retries = 3) {
        for (int retry = 0; retry < max_retries; ++retry) {
            // Force flush and wait with backoff
            boost::log::core::get()->flush();
            std::this_thread::sleep_for(std::chrono::milliseconds(20 * (retry + 1)));

            for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
                std::ifstream file(entry.path(), std::ios::in | std::ios::binary);
                if (!file.is_open()) {
                    continue;
                }
                std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
                if (content.find(text) != std::string::npos) {
                    return true;
                }
            }
        }
        return false;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    LOG_INFO << "Test info message";
    LOG_ERROR << "Test error message";
    BOOST_LOG_TRIVIAL(warning) << "Test trivial message";
    
    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("Test trivial message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, LevelFiltering) {
    set_log_level(boost::log::trivial::warning);
    LOG_DEBUG << "Hidden debug message";
    LOG_WARN << "Visible warning message";

    EXPECT_TRUE(log_contains("Visible warning message"));
    EXPECT_FALSE(log_contains("Hidden debug message", 1));
}

TEST_F(LoggerTest, MultiThreadedLogging) {
    const int num_threads = 4;
    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            LOG_INFO << "Message from thread " << i;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (int i = 0; i < num_threads; ++i) {
        EXPECT_TRUE(log_contains("Message from thread " + std::to_string(i)));
    }
}

TEST(LoggerNames, ParseSeverity) {
    EXPECT_EQ(parse_severity("debug"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("warn"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("bogus"), boost::log::trivial::info);
    EXPECT_STREQ(docrep::logging::to_string(boost::log::trivial::error), "ERROR");
}
