/*!
 * \file logger.cpp
 * \author Fedor Zilnitskiy
 * \brief Реализация статического класса Logger.
 */
#include "logger.h"

#include <ctime>    // Для std::time_t, std::tm, localtime_r
#include <unistd.h> // Для getpid

// Инициализация статических членов класса Logger
LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::log_mutex_;
std::ofstream Logger::log_file_stream_;
bool Logger::use_file_ = false;
bool Logger::echo_to_console_ = true;
bool Logger::initialized_ = false;


bool Logger::init(LogLevel initial_level, const std::string& log_file_path, bool echo_to_console) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    // Переинициализация: закрываем предыдущий файл лога
    if (log_file_stream_.is_open()) {
        log_file_stream_.close();
    }
    log_file_stream_.clear();
    use_file_ = false;

    current_level_ = initial_level;
    echo_to_console_ = echo_to_console;
    initialized_ = true;

    if (log_file_path.empty()) {
        return true;
    }

    log_file_stream_.open(log_file_path, std::ios::app);
    if (!log_file_stream_.is_open()) {
        std::cerr << "[" << get_timestamp() << "] [INITIALIZATION] [ОШИБКА] [" << getpid() << "] "
                  << "Не удалось открыть файл лога: " << log_file_path << std::endl;
        return false;
    }
    use_file_ = true;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_file_stream_.is_open()) {
        log_file_stream_.flush();
        log_file_stream_.close();
    }
    use_file_ = false;
    initialized_ = false;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    current_level_ = level;
}

LogLevel Logger::getLevel() noexcept {
    return current_level_;
}

bool Logger::isFileSinkOpen() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return use_file_ && log_file_stream_.is_open();
}

bool Logger::parseLevel(const std::string& text, LogLevel& level) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (upper == "INFO")  { level = LogLevel::INFO;  return true; }
    if (upper == "WARN" || upper == "WARNING") { level = LogLevel::WARN; return true; }
    if (upper == "ERROR") { level = LogLevel::ERROR; return true; }
    if (upper == "NONE")  { level = LogLevel::NONE;  return true; }
    return false;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::NONE:  return "NONE";
    }
    return "UNKNOWN";
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t_now = std::chrono::system_clock::to_time_t(now);

    std::tm timeinfo_tm{};
    localtime_r(&t_now, &timeinfo_tm);

    std::ostringstream oss;
    oss << std::put_time(&timeinfo_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

void Logger::log_internal(LogLevel level, const std::string& level_str, const std::string& module, const std::string& message) {
    if (!initialized_) {
        // До init() выводятся только ошибки, и только в stderr
        if (level >= LogLevel::ERROR) {
            std::cerr << "[" << get_timestamp() << "] [" << level_str << "] [" << getpid() << "] "
                      << (!module.empty() ? "[" + module + "] " : "")
                      << message << std::endl;
        }
        return;
    }

    if (current_level_ == LogLevel::NONE || level < current_level_) {
        return;
    }

    std::string formatted_message = "[" + get_timestamp() + "] [" + level_str + "] " +
                                    "[" + std::to_string(getpid()) + "] " +
                                    (!module.empty() ? "[" + module + "] " : "") +
                                    message;

    if (use_file_ && log_file_stream_.is_open()) {
        // std::endl: каждая запись сразу попадает в файл
        log_file_stream_ << formatted_message << std::endl;
    }

    if (echo_to_console_) {
        if (level == LogLevel::ERROR || level == LogLevel::WARN) {
            std::cerr << formatted_message << std::endl;
        } else {
            std::cout << formatted_message << std::endl;
        }
    }
}

void Logger::debug(const std::string& message, const std::string& module) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(LogLevel::DEBUG, "DEBUG", module, message);
}

void Logger::info(const std::string& message, const std::string& module) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(LogLevel::INFO, "INFO", module, message);
}

void Logger::warn(const std::string& message, const std::string& module) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(LogLevel::WARN, "WARNING", module, message);
}

void Logger::error(const std::string& message, const std::string& module) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_internal(LogLevel::ERROR, "ERROR", module, message);
}
