// include/TCAT/ExtensionConfig.hpp
#pragma once

#include "TCAT/Error.h"
#include <cstdint>
#include <memory>
#include <expected>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/logger.h>

namespace TCAT {

inline constexpr uint32_t kDefaultTimeoutMs = 20;
inline constexpr uint32_t kDefaultCommandPollIntervalMs = 50;
inline constexpr uint32_t kDefaultCommandPollCount = 10;

/**
 * @brief Per-section transaction timeouts in milliseconds
 */
struct SectionTimeouts {
    uint32_t sectionTable{kDefaultTimeoutMs};
    uint32_t global{kDefaultTimeoutMs};
    uint32_t caps{kDefaultTimeoutMs};
    uint32_t router{kDefaultTimeoutMs};
    uint32_t streamFormat{kDefaultTimeoutMs};
    uint32_t peak{kDefaultTimeoutMs};
    uint32_t currentConfig{kDefaultTimeoutMs};
    uint32_t command{kDefaultTimeoutMs};
    uint32_t application{kDefaultTimeoutMs};
    uint32_t standalone{kDefaultTimeoutMs};

    bool operator==(const SectionTimeouts& other) const = default;
};

struct ExtensionConfig {
    SectionTimeouts timeouts;
    uint32_t commandPollIntervalMs{kDefaultCommandPollIntervalMs};
    uint32_t commandPollCount{kDefaultCommandPollCount};
    std::shared_ptr<spdlog::logger> logger; ///< nullptr: default logger
};

/**
 * @brief Read configuration from JSON
 *
 * Recognized keys: "timeouts" (object of section name to milliseconds, with the names
 * section_table, global, caps, router, stream_format, peak, current_config, command,
 * application, standalone), "command_poll_interval_ms", "command_poll_count" and "logger"
 * (name of a registered spdlog logger). Missing keys keep their defaults.
 *
 * @return Configuration, or BadArgument when a value has the wrong type
 */
std::expected<ExtensionConfig, ProtocolError> loadExtensionConfig(const nlohmann::json& j);

} // namespace TCAT
