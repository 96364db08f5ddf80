#include "logger.h"
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace voxlink {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "?????";
    }
}

// "2025-01-31 12:00:00.123"
std::string wall_clock() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file) : min_level_(min_level) {
        open_file(output_file);
    }

    void reconfigure(LogLevel min_level, const std::string& output_file) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = min_level;
        if (output_file != file_path_) {
            file_.close();
            open_file(output_file);
        }
    }

    bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

    void write(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) return;

        std::string line = std::string("[") + level_tag(level) + "] " + wall_clock() + ": " + message;
        std::ostream& console = level >= LogLevel::WARN ? std::cerr : std::cout;
        console << line << '\n';
        console.flush();

        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

private:
    // Caller holds mutex_ (or is the constructor)
    void open_file(const std::string& path) {
        file_path_ = path;
        if (path.empty()) return;
        file_.open(path, std::ios::app);
        if (!file_.is_open()) {
            std::cerr << "Warning: Failed to open log file: " << path << std::endl;
            file_path_.clear();
        }
    }

    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::ofstream file_;
    std::string file_path_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::configure(LogLevel min_level, const std::string& output_file) {
    if (impl_) {
        impl_->reconfigure(min_level, output_file);
    } else {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        impl_->write(level, message);
        return;
    }
    // Not initialized (tests, early startup): unfiltered console output
    std::ostream& console = level >= LogLevel::WARN ? std::cerr : std::cout;
    console << message << std::endl;
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::event(Severity severity, const std::string& message) {
    switch (severity) {
        case Severity::Error:
            log(LogLevel::ERROR, message);
            break;
        case Severity::Success:
            log(LogLevel::INFO, "(ok) " + message);
            break;
        default:
            log(LogLevel::INFO, message);
            break;
    }
}

bool Logger::is_enabled(LogLevel level) {
    if (!impl_) return level >= LogLevel::INFO;
    return impl_->enabled(level);
}

LogLevel Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

} // namespace voxlink
