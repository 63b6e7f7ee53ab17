/**
 * @file ilogger.hpp
 * @brief Injectable logger used by the delegate and its collaborators
 *
 * Components hold a std::shared_ptr<ILogger>. The engine injects a
 * LoggerService bound to the process-wide logger_adapter; tests inject a
 * recording implementation, and NullLogger is the default.
 */

#pragma once

#include <rbac/compat/format.hpp>
#include <rbac/integration/logger_adapter.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace rbac::di {

/**
 * @brief Logger seam with one virtual sink
 *
 * Implementations provide write() and is_enabled(); the *_fmt helpers only
 * format when the level is enabled.
 *
 * Thread Safety: implementations must accept concurrent write() calls.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(integration::log_level level, std::string_view message) = 0;

    [[nodiscard]] virtual bool is_enabled(integration::log_level level) const noexcept = 0;

    template <typename... Args>
    void debug_fmt(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(integration::log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info_fmt(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(integration::log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn_fmt(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(integration::log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error_fmt(rbac::compat::format_string<Args...> fmt, Args&&... args) {
        write_fmt(integration::log_level::error, fmt, std::forward<Args>(args)...);
    }

protected:
    ILogger() = default;
    ILogger(const ILogger&) = default;
    ILogger& operator=(const ILogger&) = default;

private:
    template <typename... Args>
    void write_fmt(integration::log_level level,
                   rbac::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(level)) {
            write(level, rbac::compat::format(fmt, std::forward<Args>(args)...));
        }
    }
};

/// Discards everything
class NullLogger final : public ILogger {
public:
    void write(integration::log_level /*level*/, std::string_view /*message*/) override {}

    [[nodiscard]] bool is_enabled(integration::log_level /*level*/) const noexcept override {
        return false;
    }
};

/**
 * @brief Forwards to integration::logger_adapter
 *
 * Disabled until logger_adapter::initialize() has run.
 */
class LoggerService final : public ILogger {
public:
    void write(integration::log_level level, std::string_view message) override {
        integration::logger_adapter::log(level, std::string{message});
    }

    [[nodiscard]] bool is_enabled(integration::log_level level) const noexcept override {
        return integration::logger_adapter::is_level_enabled(level);
    }
};

[[nodiscard]] inline std::shared_ptr<ILogger> null_logger() {
    static auto instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace rbac::di
