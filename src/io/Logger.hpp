#pragma once
#include <unordered_set>
#include <mutex>
#include <memory>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

class Logger {
public:
    using level = spdlog::level::level_enum;

    class ConsoleLevelGuard {
        Logger& logger;
        spdlog::level::level_enum prev;

        public:
        ConsoleLevelGuard(Logger& logger, spdlog::level::level_enum new_level)
            : logger(logger), prev(logger.console_level()) {
                logger.set_console_level(new_level);
            }

        ~ConsoleLevelGuard() {
            logger.set_console_level(prev);
        }
    };

    // Constructor: accepts a shared pointer to an spdlog logger
    explicit Logger(std::shared_ptr<spdlog::logger> logger)
        : m_logger(std::move(logger)) {
            m_logger->set_pattern("%^[%L] %v%$");
        }

    void set_verbosity(int verbosity);
    void set_banner(const std::string banner){ m_banner = banner; }
    void set_arguments(int argc, char* argv[]);
    void set_arguments(const std::vector<std::string>&);

    bool should_log(level lvl) const { return m_logger->should_log(lvl); }
    level get_level() const { return m_logger->level(); }

    template <typename... Args>
    inline void log(spdlog::level::level_enum lvl, fmt::format_string<Args...> format, Args &&... args) {
        m_logger->log(lvl, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void trace(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->trace(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void debug(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->debug(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void info(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->info(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void warn(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->warn(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void error(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->error(format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    inline void critical(fmt::format_string<Args...> format, Args&&... args) {
        m_logger->critical(format, std::forward<Args>(args)...);
    }

    // warn only the first time this format string is seen
    template <typename... Args>
    void warn_once(fmt::format_string<Args...> format, Args&&... args) {
        std::lock_guard<std::mutex> lock(m_mtx);

        const auto sv = fmt::string_view(format);
        if (m_warned.insert(std::string(sv.data(), sv.size())).second) {
            m_logger->warn(format, std::forward<Args>(args)...);
        }
    }

    // add a second output stream to the logger
    bool add_file(const std::filesystem::path& fname);

    // show the banner and arguments
    void start();

    // get/set console level
    spdlog::level::level_enum console_level() const;
    void set_console_level(spdlog::level::level_enum level);
    void with_console_level(spdlog::level::level_enum level, std::function<void()> func){
        ConsoleLevelGuard guard(*this, level);
        func(); // guard restores the level on exceptions too
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;                  // Wrapped spdlog logger
    std::unordered_set<std::string> m_warned;
    mutable std::mutex m_mtx;
    std::string m_banner;
    std::filesystem::path m_fname;
    std::vector<std::string> m_arguments;
};

// Custom formatter for std::filesystem::path, which is not supported by spdlog by default
template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const std::filesystem::path& path, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(path.string(), ctx);
    }
};
