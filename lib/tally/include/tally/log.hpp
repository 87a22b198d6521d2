#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace Ballot::Tally {

/**
 * @class Logger
 * @brief Process-wide levelled logger writing one line per message to a
 *        sink (stderr by default).
 *
 * Callers must never pass secret key material in a message.
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error,
        Off
    };

    static Logger& instance();

    void set_level(Level level) { min_level_.store(level); }
    [[nodiscard]] Level level() const { return min_level_.load(); }
    [[nodiscard]] bool is_enabled(Level level) const { return level >= min_level_.load(); }

    // 测试时可以重定向到 std::ostringstream；nullptr 恢复 stderr
    void set_sink(std::ostream* sink);

    void log(Level level, std::string_view message);

    void debug(std::string_view message) { log(Level::Debug, message); }
    void info(std::string_view message) { log(Level::Info, message); }
    void warning(std::string_view message) { log(Level::Warning, message); }
    void error(std::string_view message) { log(Level::Error, message); }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    static std::string_view level_name(Level level);

    std::mutex mutex_;
    std::ostream* sink_ = nullptr;
    std::atomic<Level> min_level_ { Level::Warning };
};

inline Logger& logger() { return Logger::instance(); }

} // namespace Ballot::Tally
