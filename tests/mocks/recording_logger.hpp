/**
 * @file recording_logger.hpp
 * @brief ILogger that keeps every message for later inspection
 */

#pragma once

#include <rbac/di/ilogger.hpp>

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rbac::di::testing {

class recording_logger final : public ILogger {
public:
    void write(integration::log_level level, std::string_view message) override {
        record(level, message);
    }

    [[nodiscard]] bool is_enabled(
        integration::log_level /*level*/) const noexcept override {
        return true;
    }

    [[nodiscard]] auto messages(integration::log_level level) const
        -> std::vector<std::string> {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& [lvl, message] : entries_) {
            if (lvl == level) {
                result.push_back(message);
            }
        }
        return result;
    }

    /**
     * @brief True if a message at level contains text
     */
    [[nodiscard]] bool contains(integration::log_level level,
                                std::string_view text) const {
        auto found = messages(level);
        return std::any_of(found.begin(), found.end(),
                           [text](const std::string& message) {
                               return message.find(text) != std::string::npos;
                           });
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    void record(integration::log_level level, std::string_view message) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace_back(level, std::string(message));
    }

    mutable std::mutex mutex_;
    std::vector<std::pair<integration::log_level, std::string>> entries_;
};

}  // namespace rbac::di::testing
