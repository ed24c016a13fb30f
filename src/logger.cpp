#include "logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>

namespace cloudless {

bool parse_log_level(const std::string& text, LogLevel& out_level) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        out_level = LogLevel::DEBUG;
    } else if (lowered == "info") {
        out_level = LogLevel::INFO;
    } else if (lowered == "warn" || lowered == "warning") {
        out_level = LogLevel::WARN;
    } else if (lowered == "error") {
        out_level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO) {
    is_terminal_ = isatty(fileno(stdout));
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_sink_.is_open()) {
        file_sink_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_sink_.open(path, std::ios::out | std::ios::app);
    return file_sink_.is_open();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::ostringstream prefix;
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local_tm;
    localtime_r(&time_t, &local_tm);
    prefix << "[" << std::put_time(&local_tm, "%H:%M:%S");
    prefix << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

    std::ostringstream plain;
    plain << prefix.str() << "[" << get_level_string(level) << "]";
    if (!module.empty()) {
        plain << " [" << module << "]";
    }
    plain << " " << message << "\n";

    std::string line;
    if (is_terminal_) {
        std::ostringstream colored;
        colored << prefix.str() << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();
        if (!module.empty()) {
            colored << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
        }
        colored << " " << message << "\n";
        line = colored.str();
    } else {
        line = plain.str();
    }

    if (level >= LogLevel::ERROR) {
        std::cerr << line;
        std::cerr.flush();
    } else {
        std::cout << line;
        std::cout.flush();
    }

    if (file_sink_.is_open()) {
        file_sink_ << plain.str();
        file_sink_.flush();
    }
}

const char* Logger::get_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_color_code(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

std::string Logger::get_module_color(const std::string& module) const {
    static const char* colors[] = {
        "\033[35m",
        "\033[94m",
        "\033[95m",
        "\033[96m",
        "\033[93m",
        "\033[92m",
        "\033[90m",
        "\033[34m",
        "\033[38;5;208m",
        "\033[38;5;141m",
        "\033[38;5;51m"
    };
    size_t color_count = sizeof(colors) / sizeof(colors[0]);
    return colors[hash_string(module) % color_count];
}

std::string Logger::get_reset_code() const {
    return "\033[0m";
}

// djb2
uint32_t Logger::hash_string(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }
    return hash;
}

} // namespace cloudless
