#include "logger.hpp"
#include <mutex>
#include <memory>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

enum Level { LevelInfo = 0, LevelWarn = 1, LevelError = 2 };

struct State {
    std::mutex mutex;
    int level = LevelInfo;
    std::unique_ptr<std::ofstream> file;
};

State& state() {
    static State s;
    return s;
}

const char* tag(int level) {
    switch (level) {
        case LevelWarn:  return "[WARN]";
        case LevelError: return "[ERROR]";
        default:         return "[INFO]";
    }
}

std::string now_timestamp() {
    using namespace std::chrono;
    std::time_t tt = system_clock::to_time_t(system_clock::now());
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &tt);
#else
    localtime_r(&tt, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void write_line(int level, const std::string& msg) {
    State& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    // errors are never filtered
    if (level < LevelError && level < s.level) return;

    const std::string line = "[" + now_timestamp() + "] " + tag(level) + " " + msg + "\n";

    if (level == LevelError) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }

    if (s.file) {
        (*s.file) << line;
        s.file->flush();
    }
}

} // namespace

namespace logger {

void set_log_file(const std::string& path) {
    State& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file) {
        s.file->flush();
        s.file.reset();
    }
    if (path.empty()) return;
    auto f = std::make_unique<std::ofstream>(std::filesystem::u8path(path), std::ios::app);
    // unopenable file: console only
    if (f->is_open()) s.file = std::move(f);
}

void set_level(int level) {
    if (level < LevelInfo) level = LevelInfo;
    if (level > LevelError) level = LevelError;
    State& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
}

void info(const std::string& msg) { write_line(LevelInfo, msg); }
void warn(const std::string& msg) { write_line(LevelWarn, msg); }
void error(const std::string& msg) { write_line(LevelError, msg); }

} // namespace logger
