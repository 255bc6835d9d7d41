#pragma once

#include <memory>
#include <spdlog/spdlog.h>

#include "muxpool/config.hpp"

namespace muxpool {

    /**
     * @brief Owner of the library's spdlog logger.
     *
     * All components log through one named logger ("muxpool") so an
     * application can route, silence or re-level it with the usual spdlog
     * registry calls. The logger is created on first use with a colored
     * stdout sink.
     */
    class LoggerManager {
       public:
        static constexpr const char* kLoggerName = "muxpool";

        /// @brief Apply level and pattern. Safe to call more than once.
        static void init(const LoggingConfiguration& config);

        /// @brief The shared logger, created on demand.
        static std::shared_ptr<spdlog::logger> get();

        /// @brief Replace the logger, e.g. with one using a test sink.
        static void set(std::shared_ptr<spdlog::logger> logger);
    };

    /// @brief Shorthand used throughout the library. The returned pointer
    /// keeps the logger alive across a concurrent LoggerManager::set().
    inline std::shared_ptr<spdlog::logger> logger() {
        return LoggerManager::get();
    }

}  // namespace muxpool
