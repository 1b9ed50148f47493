#pragma once

/// @file mock_logger.hpp
/// @brief kcenon ILogger that records every message, for log assertions.

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cas::test {

namespace kci = kcenon::common::interfaces;

struct LogRecord {
    kci::log_level level;
    std::string message;
};

class MockLogger : public kci::ILogger {
public:
    kcenon::common::VoidResult log(kci::log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(kci::log_level level, std::string_view message,
                                   const kci::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(kci::log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(kci::log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kci::log_level get_level() const override { return kci::log_level::trace; }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return records_.size();
    }

    /// True if any recorded message contains every given fragment.
    bool contains(std::initializer_list<std::string_view> fragments) const {
        std::lock_guard lock(mutex_);
        for (const auto& record : records_) {
            bool all = true;
            for (auto fragment : fragments) {
                if (record.message.find(fragment) == std::string::npos) {
                    all = false;
                    break;
                }
            }
            if (all) {
                return true;
            }
        }
        return false;
    }

    bool wasFlushed() const { return flushed_.load(std::memory_order_acquire); }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        flushed_.store(false, std::memory_order_relaxed);
    }

    /// Make a fresh MockLogger the registry default and return it.
    static std::shared_ptr<MockLogger> install() {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        registry.clear();
        auto logger = std::make_shared<MockLogger>();
        registry.set_default_logger(logger);
        return logger;
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<bool> flushed_{false};
};

}  // namespace cas::test
