#include "muxpool/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace muxpool {

    namespace {
        std::mutex& logger_mutex() {
            static std::mutex mu;
            return mu;
        }

        std::shared_ptr<spdlog::logger>& logger_slot() {
            static std::shared_ptr<spdlog::logger> slot;
            return slot;
        }

        std::shared_ptr<spdlog::logger> create_locked() {
            auto& slot = logger_slot();
            if (slot) return slot;

            slot = spdlog::get(LoggerManager::kLoggerName);
            if (!slot) {
                try {
                    slot = spdlog::stdout_color_mt(LoggerManager::kLoggerName);
                } catch (const spdlog::spdlog_ex&) {
                    // Registered concurrently by the application.
                    slot = spdlog::get(LoggerManager::kLoggerName);
                }
            }
            return slot;
        }
    }  // namespace

    void LoggerManager::init(const LoggingConfiguration& config) {
        std::lock_guard<std::mutex> lk(logger_mutex());
        auto lg = create_locked();
        lg->set_level(spdlog::level::from_str(config.level));
        lg->set_pattern(config.pattern);
    }

    std::shared_ptr<spdlog::logger> LoggerManager::get() {
        std::lock_guard<std::mutex> lk(logger_mutex());
        return create_locked();
    }

    void LoggerManager::set(std::shared_ptr<spdlog::logger> logger) {
        std::lock_guard<std::mutex> lk(logger_mutex());
        logger_slot() = std::move(logger);
    }

}  // namespace muxpool
