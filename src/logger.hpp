#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <utility>

namespace logger {

// Initialize logging to optionally write to a file in addition to stdout.
void set_log_file(const std::string& path);   // empty path disables file logging
void set_level(int level);                    // 0=INFO,1=WARN,2=ERROR

// Log APIs
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

// Destination for diagnostics raised by the document engine.
// Engine functions take a Sink* and stay silent when it is null.
class Sink {
public:
    virtual ~Sink() = default;
    virtual void info(const std::string& msg) = 0;
    virtual void warn(const std::string& msg) = 0;
    virtual void error(const std::string& msg) = 0;
};

// Forwards to the process-wide logger above, prefixing every line.
class GlobalSink : public Sink {
public:
    explicit GlobalSink(std::string prefix = {}) : prefix_(std::move(prefix)) {}
    void info(const std::string& msg) override { logger::info(prefix_ + msg); }
    void warn(const std::string& msg) override { logger::warn(prefix_ + msg); }
    void error(const std::string& msg) override { logger::error(prefix_ + msg); }

private:
    std::string prefix_;
};

// Keeps "LEVEL msg" lines in memory.
class MemorySink : public Sink {
public:
    void info(const std::string& msg) override { push("INFO " + msg); }
    void warn(const std::string& msg) override { push("WARN " + msg); }
    void error(const std::string& msg) override { push("ERROR " + msg); }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

private:
    void push(std::string line) {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.push_back(std::move(line));
    }

    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

} // namespace logger
