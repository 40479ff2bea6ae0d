#include <clipstash/util/logger.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace clipstash {

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

FileLogger::FileLogger(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    out_.open(path, std::ios::out | std::ios::app);
}

void FileLogger::log(LogLevel level, const std::string& message) {
    if (level < min_level_.load()) return;

    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream line;
    line << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setw(3) << std::setfill('0') << millis
         << " [" << log_level_name(level) << "] " << message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) return;
    out_ << line.str() << '\n';
    out_.flush();
}

}  // namespace clipstash
