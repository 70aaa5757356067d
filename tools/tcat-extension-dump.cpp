/**
 * @file tcat-extension-dump.cpp
 * @brief Dump the TCAT extension state of one FireWire node as JSON.
 */

#include "TCAT/FwCdevTransactionPort.hpp"
#include "TCAT/TcatExtension.hpp"
#include "TCAT/ExtensionConfig.hpp"
#include "TCAT/JsonHelpers.hpp"
#include "TCAT/ModelRegistry.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using json = nlohmann::json;

namespace {

struct Options {
    std::string devicePath;
    std::optional<std::string> modelFile;
    std::optional<std::string> configFile;
    std::optional<std::string> resolveFile;
    std::optional<size_t> applicationLength;
    bool standalone{false};
    bool verbose{false};
};

void printUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " <cdev-path> [--model-file FILE] [--config FILE]"
              << " [--resolve FILE] [--standalone] [--application LENGTH] [--verbose]\n";
}

std::optional<Options> parseArgs(int argc, char* argv[])
{
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--model-file" && i + 1 < argc) {
            opts.modelFile = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            opts.configFile = argv[++i];
        } else if (arg == "--resolve" && i + 1 < argc) {
            opts.resolveFile = argv[++i];
        } else if (arg == "--standalone") {
            opts.standalone = true;
        } else if (arg == "--application" && i + 1 < argc) {
            std::string length = argv[++i];
            if (length.empty() || length.size() > 6 || length.find_first_not_of("0123456789") != std::string::npos)
                return std::nullopt;
            opts.applicationLength = std::stoul(length);
        } else if (!arg.empty() && arg[0] != '-' && opts.devicePath.empty()) {
            opts.devicePath = arg;
        } else {
            return std::nullopt;
        }
    }
    if (opts.devicePath.empty())
        return std::nullopt;
    return opts;
}

std::optional<json> readJsonFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open {}", path);
        return std::nullopt;
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        spdlog::error("{} is not valid JSON", path);
        return std::nullopt;
    }
    return j;
}

std::optional<TCAT::ExtensionConfig> readConfigFile(const std::string& path)
{
    auto j = readJsonFile(path);
    if (!j)
        return std::nullopt;
    auto config = TCAT::loadExtensionConfig(*j);
    if (!config) {
        spdlog::error("Invalid configuration in {}: {}", path, config.error().message());
        return std::nullopt;
    }
    return *config;
}

} // namespace

int main(int argc, char* argv[])
{
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage(argv[0]);
        return 2;
    }

    // JSON goes to stdout, logs to stderr
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("tcat", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(opts->verbose ? spdlog::level::debug : spdlog::level::info);

    TCAT::ExtensionConfig config;
    if (opts->configFile) {
        auto loaded = readConfigFile(*opts->configFile);
        if (!loaded)
            return 1;
        config = *loaded;
    }
    if (!config.logger)
        config.logger = logger;

    auto registry = TCAT::ModelRegistry::withBuiltins();
    if (opts->modelFile) {
        auto count = registry.loadFromFile(*opts->modelFile);
        if (!count) {
            spdlog::error("Cannot load models from {}: {}", *opts->modelFile, count.error().message());
            return 1;
        }
        spdlog::info("Loaded {} model(s) from {}", *count, *opts->modelFile);
    }

    TCAT::FwCdevTransactionPort port;
    if (auto res = port.open(opts->devicePath); !res) {
        spdlog::error("Cannot open {}: {}", opts->devicePath, TCAT::make_error_code(res.error()).message());
        return 1;
    }

    auto identity = port.identity();
    if (!identity) {
        spdlog::error("Cannot identify node: {}", TCAT::make_error_code(identity.error()).message());
        return 1;
    }

    TCAT::ModelSpec spec;
    if (auto known = registry.lookup(identity->vendorId, identity->modelId)) {
        spec = *known;
        spdlog::info("Model: {}", spec.name);
    } else {
        spdlog::warn("No routing table for vendor 0x{:06x} model 0x{:x}; routes are shown raw",
                     identity->vendorId, identity->modelId);
        spec.name = "Unknown";
        spec.vendorId = identity->vendorId;
        spec.modelId = identity->modelId;
    }

    TCAT::TcatExtension extension(port, spec, config);
    port.setBusResetCallback([&extension]() { extension.handleBusReset(); });

    if (auto res = extension.bootstrap(); !res) {
        spdlog::error("Bootstrap failed: {}", res.error().message());
        return 1;
    }

    json out = extension.toJson();
    out["guid"] = TCAT::JsonHelpers::hexString(identity->guid, 16);

    if (extension.caps() && extension.caps()->general.peakAvail) {
        auto peaks = extension.readPeakLevels();
        if (peaks)
            out["peaks"] = TCAT::JsonHelpers::serializePeakLevels(*peaks);
        else
            spdlog::warn("Peak levels unavailable: {}", peaks.error().message());
    }

    if (opts->standalone) {
        auto params = extension.readStandalone();
        if (!params) {
            spdlog::error("Cannot read standalone parameters: {}", params.error().message());
            return 1;
        }
        out["standalone"] = TCAT::JsonHelpers::serializeStandalone(*params);
    }

    if (opts->applicationLength) {
        auto data = extension.readApplication(0, *opts->applicationLength);
        if (!data) {
            spdlog::error("Cannot read application section: {}", data.error().message());
            return 1;
        }
        out["application"] = TCAT::JsonHelpers::serializeHexBytes(*data);
    }

    if (opts->resolveFile) {
        auto j = readJsonFile(*opts->resolveFile);
        if (!j)
            return 1;
        auto assignments = TCAT::JsonHelpers::parseRoutingAssignments(*j);
        if (!assignments) {
            spdlog::error("Invalid assignments in {}", *opts->resolveFile);
            return 1;
        }
        auto resolved = extension.resolveRouting(*assignments);
        if (!resolved) {
            spdlog::error("Cannot resolve routing: {}", resolved.error().message());
            return 1;
        }
        out["resolved"] = TCAT::JsonHelpers::serializeResolvedRouting(*resolved);
    }

    std::cout << out.dump(2) << std::endl;
    return 0;
}
