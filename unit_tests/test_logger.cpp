#include "gtest/gtest.h"
#include "logger.h"
#include "test_utils.h"
#include <string>
#include <vector>
#include <filesystem>
#include <regex>        // Для проверки формата логов
#include <algorithm>    // Для std::any_of

// Проверка формата строки: [время] [УРОВЕНЬ] [pid] [модуль] сообщение
static bool check_log_format(const std::string& log_line, const std::string& level_str,
                             const std::string& module, const std::string& message_part) {
    std::regex line_regex(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[([A-Z]+)\] \[\d+\] (.*)$)");
    std::smatch match;
    if (!std::regex_match(log_line, match, line_regex)) {
        return false;
    }
    if (match[1].str() != level_str) {
        return false;
    }
    const std::string rest = match[2].str();
    if (!module.empty() && rest.rfind("[" + module + "] ", 0) != 0) {
        return false;
    }
    return rest.find(message_part) != std::string::npos;
}

static bool any_line_contains(const std::vector<std::string>& lines, const std::string& part) {
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(part) != std::string::npos;
    });
}

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::filesystem::path log_path_;

    void SetUp() override {
        test_dir_ = make_unique_test_dir("undeny_logger_test_");
        log_path_ = test_dir_ / "undeny.log";
    }

    void TearDown() override {
        Logger::shutdown();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }
};

TEST_F(LoggerTest, Init_WithFile_WritesFormattedLines) {
    ASSERT_TRUE(Logger::init(LogLevel::DEBUG, log_path_.string(), false));
    EXPECT_TRUE(Logger::isFileSinkOpen());

    Logger::info("Служба остановлена", "Service");
    Logger::warn("Предупреждение без модуля");
    Logger::shutdown();

    auto lines = read_file_lines(log_path_);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(check_log_format(lines[0], "INFO", "Service", "Служба остановлена")) << lines[0];
    EXPECT_TRUE(check_log_format(lines[1], "WARNING", "", "Предупреждение без модуля")) << lines[1];
}

TEST_F(LoggerTest, Init_AppendsToExistingFile) {
    write_file_bytes(log_path_, "предыдущий запуск\n");
    ASSERT_TRUE(Logger::init(LogLevel::INFO, log_path_.string(), false));
    Logger::info("новый запуск", "Runner");
    Logger::shutdown();

    auto lines = read_file_lines(log_path_);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "предыдущий запуск");
    EXPECT_TRUE(check_log_format(lines[1], "INFO", "Runner", "новый запуск"));
}

TEST_F(LoggerTest, Init_UnopenablePath_ReturnsFalse) {
    // Директорию нельзя открыть как файл журнала
    EXPECT_FALSE(Logger::init(LogLevel::INFO, test_dir_.string(), false));
    EXPECT_FALSE(Logger::isFileSinkOpen());

    EXPECT_FALSE(Logger::init(LogLevel::INFO, (test_dir_ / "нет" / "такой" / "директории.log").string(), false));
    EXPECT_FALSE(Logger::isFileSinkOpen());
}

TEST_F(LoggerTest, LevelFiltering) {
    ASSERT_TRUE(Logger::init(LogLevel::WARN, log_path_.string(), false));
    Logger::debug("debug-сообщение");
    Logger::info("info-сообщение");
    Logger::warn("warn-сообщение");
    Logger::error("error-сообщение");

    Logger::setLevel(LogLevel::NONE);
    Logger::error("скрытая ошибка");
    Logger::shutdown();

    auto lines = read_file_lines(log_path_);
    EXPECT_EQ(lines.size(), 2u);
    EXPECT_FALSE(any_line_contains(lines, "debug-сообщение"));
    EXPECT_FALSE(any_line_contains(lines, "info-сообщение"));
    EXPECT_TRUE(any_line_contains(lines, "warn-сообщение"));
    EXPECT_TRUE(any_line_contains(lines, "error-сообщение"));
    EXPECT_FALSE(any_line_contains(lines, "скрытая ошибка"));
}

TEST_F(LoggerTest, SetLevelAndGetLevel) {
    ASSERT_TRUE(Logger::init(LogLevel::INFO, "", false));
    EXPECT_EQ(Logger::getLevel(), LogLevel::INFO);
    Logger::setLevel(LogLevel::DEBUG);
    EXPECT_EQ(Logger::getLevel(), LogLevel::DEBUG);
}

TEST_F(LoggerTest, Reinit_SwitchesFile) {
    const auto second_log = test_dir_ / "second.log";
    ASSERT_TRUE(Logger::init(LogLevel::INFO, log_path_.string(), false));
    Logger::info("в первый файл");
    ASSERT_TRUE(Logger::init(LogLevel::INFO, second_log.string(), false));
    Logger::info("во второй файл");
    Logger::shutdown();

    EXPECT_TRUE(any_line_contains(read_file_lines(log_path_), "в первый файл"));
    EXPECT_FALSE(any_line_contains(read_file_lines(log_path_), "во второй файл"));
    EXPECT_TRUE(any_line_contains(read_file_lines(second_log), "во второй файл"));
}

TEST(LoggerLevelParsingTest, ParseLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parseLevel("Warn", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parseLevel("ERROR", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_TRUE(Logger::parseLevel("none", level));
    EXPECT_EQ(level, LogLevel::NONE);

    level = LogLevel::INFO;
    EXPECT_FALSE(Logger::parseLevel("VERBOSE", level));
    EXPECT_FALSE(Logger::parseLevel("", level));
    EXPECT_EQ(level, LogLevel::INFO);
}

TEST(LoggerLevelParsingTest, LevelToString) {
    EXPECT_EQ(Logger::levelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelToString(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelToString(LogLevel::WARN), "WARNING");
    EXPECT_EQ(Logger::levelToString(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelToString(LogLevel::NONE), "NONE");
}
