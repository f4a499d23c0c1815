#include "logger.h"
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <regex>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>

namespace voxgate {

namespace {

const char* level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // anonymous namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file)
        : min_level_(min_level), file_stream_(nullptr) {
        if (!output_file.empty()) {
            file_stream_ = std::make_unique<std::ofstream>(output_file, std::ios::app);
            if (!file_stream_->is_open()) {
                std::cerr << "[WARN ] could not open log file " << output_file
                          << "; logging to console only" << std::endl;
                file_stream_.reset();
            }
        }
    }

    ~Impl() {
        if (file_stream_ && file_stream_->is_open()) {
            file_stream_->close();
        }
    }

    void log(LogLevel level, const std::string& message) {
        if (level < min_level_.load()) {
            return;
        }

        // [LEVEL] 2026-01-01 12:00:00.123: message
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream oss;
        oss << "[" << level_string(level) << "] "
            << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << millis
            << ": " << message;
        const std::string formatted = oss.str();

        std::lock_guard<std::mutex> lock(mutex_);

        // Console: stderr for ERROR, stdout otherwise
        if (level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }

        if (file_stream_ && file_stream_->is_open()) {
            *file_stream_ << formatted << std::endl;
            file_stream_->flush();
        }
    }

    void set_level(LogLevel level) { min_level_.store(level); }

    LogLevel get_level() const { return min_level_.load(); }

private:
    std::mutex mutex_;
    std::atomic<LogLevel> min_level_;
    std::unique_ptr<std::ofstream> file_stream_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    std::string safe = redact(message);
    if (impl_) {
        impl_->log(level, safe);
    } else {
        // Fallback to console if not initialized
        if (level >= LogLevel::ERROR) {
            std::cerr << safe << std::endl;
        } else {
            std::cout << safe << std::endl;
        }
    }
}

std::string Logger::redact(const std::string& message) {
    // marker[:=]value (or "marker": value)  ->  marker=[REDACTED]
    static const std::regex kv_pattern(
        R"((secret|password|passphrase|token|api_key|voice_key|key|ciphertext|nonce)("?\s*[:=]\s*)("[^"]*"|[^\s,;}]+))",
        std::regex::icase);
    return std::regex_replace(message, kv_pattern, "$1$2[REDACTED]");
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

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    if (impl_) {
        return impl_->get_level();
    }
    return LogLevel::INFO;
}

} // namespace voxgate
