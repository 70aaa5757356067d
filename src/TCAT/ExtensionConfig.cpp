// src/TCAT/ExtensionConfig.cpp
#include "TCAT/ExtensionConfig.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <utility>

using json = nlohmann::json;

namespace TCAT {

std::expected<ExtensionConfig, ProtocolError> loadExtensionConfig(const json& j)
{
    ExtensionConfig config;

    if (!j.is_object()) {
        spdlog::error("Extension configuration is not a JSON object");
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    try {
        if (j.contains("timeouts")) {
            const auto& t = j.at("timeouts");
            if (!t.is_object()) {
                spdlog::error("'timeouts' is not an object");
                return std::unexpected(makeError(ExtensionError::BadArgument));
            }

            const std::array<std::pair<const char*, uint32_t*>, 10> fields = {{
                {"section_table", &config.timeouts.sectionTable},
                {"global", &config.timeouts.global},
                {"caps", &config.timeouts.caps},
                {"router", &config.timeouts.router},
                {"stream_format", &config.timeouts.streamFormat},
                {"peak", &config.timeouts.peak},
                {"current_config", &config.timeouts.currentConfig},
                {"command", &config.timeouts.command},
                {"application", &config.timeouts.application},
                {"standalone", &config.timeouts.standalone},
            }};

            for (const auto& [name, field] : fields) {
                if (!t.contains(name))
                    continue;
                if (!t.at(name).is_number_unsigned()) {
                    spdlog::error("Timeout '{}' is not an unsigned number", name);
                    return std::unexpected(makeError(ExtensionError::BadArgument));
                }
                *field = t.at(name).get<uint32_t>();
            }
        }

        if (j.contains("command_poll_interval_ms"))
            config.commandPollIntervalMs = j.at("command_poll_interval_ms").get<uint32_t>();
        if (j.contains("command_poll_count"))
            config.commandPollCount = j.at("command_poll_count").get<uint32_t>();

        if (j.contains("logger")) {
            auto name = j.at("logger").get<std::string>();
            config.logger = spdlog::get(name);
            if (!config.logger)
                spdlog::warn("Logger '{}' not registered, using default logger", name);
        }
    } catch (const json::exception& e) {
        spdlog::error("Invalid extension configuration: {}", e.what());
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    return config;
}

} // namespace TCAT
