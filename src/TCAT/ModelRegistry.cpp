// src/TCAT/ModelRegistry.cpp
#include "TCAT/ModelRegistry.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

using json = nlohmann::json;

namespace TCAT {

namespace {
    Input in(SrcBlkId id, uint8_t offset, uint8_t count, std::optional<std::string> label = std::nullopt)
    {
        return Input{id, offset, count, std::move(label), false};
    }

    Output out(DstBlkId id, uint8_t offset, uint8_t count, std::optional<std::string> label = std::nullopt)
    {
        return Output{id, offset, count, std::move(label), false};
    }

    std::vector<SrcBlk> fixedRange(SrcBlkId id, uint8_t first, uint8_t count)
    {
        std::vector<SrcBlk> srcs;
        for (uint8_t ch = first; ch < first + count; ++ch)
            srcs.push_back({id, ch});
        return srcs;
    }

    ModelSpec saffirePro14()
    {
        ModelSpec spec;
        spec.name = "Saffire Pro 14";
        spec.vendorId = kVendorFocusrite;
        spec.modelId = 0x09;
        spec.inputs = {in(SrcBlkId::Ins0, 0, 4), in(SrcBlkId::Aes, 6, 2, "S/PDIF")};
        spec.outputs = {out(DstBlkId::Ins0, 0, 4), out(DstBlkId::Aes, 6, 2, "S/PDIF")};
        spec.fixed = fixedRange(SrcBlkId::Ins0, 0, 2);
        return spec;
    }

    ModelSpec saffirePro24()
    {
        ModelSpec spec;
        spec.name = "Saffire Pro 24";
        spec.vendorId = kVendorFocusrite;
        spec.modelId = 0x07;
        spec.inputs = {
            in(SrcBlkId::Ins0, 2, 2, "Mic"),
            in(SrcBlkId::Ins0, 0, 2, "Line"),
            in(SrcBlkId::Aes, 6, 2, "S/PDIF-coax"),
            // ADAT and optical S/PDIF share one interface
            in(SrcBlkId::Adat, 0, 8),
            in(SrcBlkId::Aes, 4, 2, "S/PDIF-opt"),
        };
        spec.outputs = {out(DstBlkId::Ins0, 0, 6), out(DstBlkId::Aes, 6, 2, "S/PDIF-coax")};
        spec.fixed = {{SrcBlkId::Ins0, 2}, {SrcBlkId::Ins0, 3}, {SrcBlkId::Ins0, 0}, {SrcBlkId::Ins0, 1}};
        return spec;
    }

    ModelSpec saffirePro24Dsp()
    {
        ModelSpec spec;
        spec.name = "Saffire Pro 24 DSP";
        spec.vendorId = kVendorFocusrite;
        spec.modelId = 0x08;
        // Channel strip and reverb move to Ins0 4/6 at middle rate
        spec.inputs = {
            in(SrcBlkId::Ins0, 2, 2, "Mic"),
            in(SrcBlkId::Ins0, 0, 2, "Line"),
            in(SrcBlkId::Ins0, 8, 2, "Ch-strip"),
            in(SrcBlkId::Ins0, 14, 2, "Reverb"),
            in(SrcBlkId::Aes, 6, 2, "S/PDIF-coax"),
            in(SrcBlkId::Adat, 0, 8),
            in(SrcBlkId::Aes, 4, 2, "S/PDIF-opt"),
        };
        spec.outputs = {
            out(DstBlkId::Ins0, 0, 6),
            out(DstBlkId::Aes, 6, 2, "S/PDIF-coax"),
            out(DstBlkId::Ins0, 8, 2, "Ch-strip"),
            out(DstBlkId::Ins0, 14, 2, "Reverb"),
        };
        spec.fixed = {{SrcBlkId::Ins0, 2}, {SrcBlkId::Ins0, 3}, {SrcBlkId::Ins0, 0}, {SrcBlkId::Ins0, 1}};
        return spec;
    }

    ModelSpec saffirePro26()
    {
        ModelSpec spec;
        spec.name = "Saffire Pro 26";
        spec.vendorId = kVendorFocusrite;
        spec.modelId = 0x12;
        spec.inputs = {
            in(SrcBlkId::Ins0, 0, 6),
            in(SrcBlkId::Aes, 4, 2, "S/PDIF-coax"),
            in(SrcBlkId::Adat, 0, 8),
            in(SrcBlkId::Aes, 6, 2, "S/PDIF-opt"),
        };
        spec.outputs = {
            out(DstBlkId::Ins0, 0, 6),
            out(DstBlkId::Aes, 4, 2, "S/PDIF-coax"),
            out(DstBlkId::Adat, 0, 8),
        };
        spec.fixed = fixedRange(SrcBlkId::Ins0, 0, 6);
        return spec;
    }

    ModelSpec liquidSaffire56()
    {
        ModelSpec spec;
        spec.name = "Liquid Saffire 56";
        spec.vendorId = kVendorFocusrite;
        spec.modelId = 0x06;
        spec.inputs = {
            in(SrcBlkId::Ins0, 0, 2),
            in(SrcBlkId::Ins1, 2, 6),
            in(SrcBlkId::Adat, 0, 8),
            in(SrcBlkId::Aes, 0, 2, "S/PDIF-coax"),
            in(SrcBlkId::Adat, 8, 8),
            in(SrcBlkId::Aes, 6, 2, "S/PDIF-opt"),
        };
        spec.outputs = {
            out(DstBlkId::Ins0, 0, 2),
            out(DstBlkId::Ins1, 0, 8),
            out(DstBlkId::Adat, 0, 8),
            out(DstBlkId::Aes, 0, 2, "S/PDIF-coax"),
            out(DstBlkId::Adat, 8, 8),
            out(DstBlkId::Aes, 6, 2, "S/PDIF-opt"),
        };
        spec.fixed = fixedRange(SrcBlkId::Ins1, 0, 8);
        auto aes = fixedRange(SrcBlkId::Aes, 0, 2);
        auto adat = fixedRange(SrcBlkId::Adat, 0, 16);
        spec.fixed.insert(spec.fixed.end(), aes.begin(), aes.end());
        spec.fixed.insert(spec.fixed.end(), adat.begin(), adat.end());
        return spec;
    }

    ModelSpec mbox3Pro()
    {
        ModelSpec spec;
        spec.name = "Mbox 3 Pro";
        spec.vendorId = kVendorAvid;
        spec.modelId = 0x04;
        spec.inputs = {
            in(SrcBlkId::Ins0, 0, 6),
            in(SrcBlkId::Ins1, 0, 2, "Reverb"),
            in(SrcBlkId::Aes, 0, 2),
        };
        spec.outputs = {
            out(DstBlkId::Ins0, 0, 6),
            out(DstBlkId::Ins1, 0, 4, "Headphone"),
            out(DstBlkId::Ins1, 4, 2, "Reverb"),
            out(DstBlkId::Aes, 0, 2),
        };
        spec.fixed = fixedRange(SrcBlkId::Ins0, 0, 4);
        return spec;
    }

    ModelSpec profire2626()
    {
        ModelSpec spec;
        spec.name = "ProFire 2626";
        spec.vendorId = kVendorMaudio;
        spec.modelId = 0x10;
        spec.inputs = {
            in(SrcBlkId::Ins1, 0, 8),
            in(SrcBlkId::Adat, 0, 8),
            in(SrcBlkId::Adat, 8, 8),
            in(SrcBlkId::Aes, 0, 2),
        };
        spec.outputs = {
            out(DstBlkId::Ins1, 0, 8),
            out(DstBlkId::Adat, 0, 8),
            out(DstBlkId::Adat, 8, 8),
            out(DstBlkId::Aes, 0, 2),
        };
        spec.fixed = fixedRange(SrcBlkId::Ins1, 0, 8);
        // Tdif selects the second optical interface
        spec.clockSources = {ClockSource::Aes1, ClockSource::Aes4, ClockSource::Adat,
                             ClockSource::Tdif, ClockSource::WordClock, ClockSource::Internal};
        return spec;
    }

    ModelSpec profire610()
    {
        ModelSpec spec;
        spec.name = "ProFire 610";
        spec.vendorId = kVendorMaudio;
        spec.modelId = 0x11;
        spec.inputs = {in(SrcBlkId::Ins0, 0, 4), in(SrcBlkId::Aes, 0, 2)};
        spec.outputs = {out(DstBlkId::Ins0, 0, 8), out(DstBlkId::Aes, 0, 2)};
        spec.fixed = fixedRange(SrcBlkId::Ins0, 0, 2);
        spec.clockSources = {ClockSource::Aes1, ClockSource::Internal};
        return spec;
    }

    template <typename BlkId, typename Port>
    std::expected<std::vector<Port>, ProtocolError> parsePorts(const json& arr,
                                                               std::expected<BlkId, ProtocolError> (*fromString)(const std::string&))
    {
        std::vector<Port> ports;
        if (!arr.is_array()) {
            spdlog::error("Port list is not an array");
            return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
        }

        for (const auto& item : arr) {
            auto blockName = item.at("block").get<std::string>();
            auto id = fromString(blockName);
            if (!id) {
                spdlog::error("Unknown block '{}' in model file", blockName);
                return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
            }

            unsigned offset = item.at("offset").get<unsigned>();
            unsigned count = item.at("count").get<unsigned>();
            if (offset + count > 16) {
                spdlog::error("Port {} offset {} count {} exceeds 16 channels", blockName, offset, count);
                return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
            }

            Port port;
            port.id = *id;
            port.offset = static_cast<uint8_t>(offset);
            port.count = static_cast<uint8_t>(count);
            if (item.contains("label") && !item.at("label").is_null())
                port.label = item.at("label").get<std::string>();
            port.optional = item.value("optional", false);
            ports.push_back(std::move(port));
        }
        return ports;
    }

    template <typename Port>
    json portsToJson(const std::vector<Port>& ports, std::string (*toString)(decltype(Port::id)))
    {
        json arr = json::array();
        for (const auto& port : ports) {
            json p;
            p["block"] = toString(port.id);
            p["offset"] = port.offset;
            p["count"] = port.count;
            if (port.label)
                p["label"] = *port.label;
            if (port.optional)
                p["optional"] = true;
            arr.push_back(p);
        }
        return arr;
    }
}

std::vector<ModelSpec> builtinModelSpecs()
{
    return {
        saffirePro14(),
        saffirePro24(),
        saffirePro24Dsp(),
        saffirePro26(),
        liquidSaffire56(),
        mbox3Pro(),
        profire2626(),
        profire610(),
    };
}

std::expected<ModelSpec, ProtocolError> parseModelSpec(const json& j)
{
    try {
        if (!j.is_object()) {
            spdlog::error("Model record is not an object");
            return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
        }

        ModelSpec spec;
        spec.name = j.at("name").get<std::string>();
        spec.vendorId = j.at("vendor_id").get<uint32_t>();
        spec.modelId = j.at("model_id").get<uint32_t>();

        auto inputs = parsePorts<SrcBlkId, Input>(j.at("inputs"), &srcBlkIdFromString);
        if (!inputs)
            return std::unexpected(inputs.error());
        spec.inputs = std::move(*inputs);

        auto outputs = parsePorts<DstBlkId, Output>(j.at("outputs"), &dstBlkIdFromString);
        if (!outputs)
            return std::unexpected(outputs.error());
        spec.outputs = std::move(*outputs);

        for (const auto& item : j.value("fixed", json::array())) {
            auto blockName = item.at("block").get<std::string>();
            auto id = srcBlkIdFromString(blockName);
            unsigned ch = item.at("channel").get<unsigned>();
            if (!id || ch > 0x0f) {
                spdlog::error("Invalid fixed entry {}:{}", blockName, ch);
                return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
            }
            spec.fixed.push_back({*id, static_cast<uint8_t>(ch)});
        }

        for (const auto& item : j.value("clock_sources", json::array())) {
            auto name = item.get<std::string>();
            auto src = clockSourceFromString(name);
            if (!src) {
                spdlog::error("Unknown clock source '{}' in model file", name);
                return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
            }
            spec.clockSources.push_back(*src);
        }

        auto valid = validateModelSpec(spec);
        if (!valid)
            return std::unexpected(valid.error());
        return spec;
    } catch (const json::exception& e) {
        spdlog::error("Malformed model record: {}", e.what());
        return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
    }
}

json modelSpecToJson(const ModelSpec& spec)
{
    json j;
    j["name"] = spec.name;
    j["vendor_id"] = spec.vendorId;
    j["model_id"] = spec.modelId;
    j["inputs"] = portsToJson(spec.inputs, &srcBlkIdToString);
    j["outputs"] = portsToJson(spec.outputs, &dstBlkIdToString);

    json fixed = json::array();
    for (const auto& src : spec.fixed)
        fixed.push_back({{"block", srcBlkIdToString(src.id)}, {"channel", src.ch}});
    j["fixed"] = fixed;

    json sources = json::array();
    for (auto src : spec.clockSources)
        sources.push_back(clockSourceToString(src));
    j["clock_sources"] = sources;
    return j;
}

ModelRegistry ModelRegistry::withBuiltins()
{
    ModelRegistry registry;
    for (auto& spec : builtinModelSpecs())
        registry.registerModel(std::move(spec));
    return registry;
}

void ModelRegistry::registerModel(ModelSpec spec)
{
    auto key = std::make_pair(spec.vendorId, spec.modelId);
    spdlog::debug("Registering model '{}' (0x{:06x}, 0x{:x})", spec.name, spec.vendorId, spec.modelId);
    models_[key] = std::move(spec);
}

std::expected<ModelSpec, ProtocolError> ModelRegistry::lookup(uint32_t vendorId, uint32_t modelId) const
{
    auto it = models_.find({vendorId, modelId});
    if (it == models_.end()) {
        spdlog::warn("No model registered for vendor 0x{:06x} model 0x{:x}", vendorId, modelId);
        return std::unexpected(makeError(ExtensionError::ModelNotFound));
    }
    return it->second;
}

std::expected<size_t, ProtocolError> ModelRegistry::loadFromJson(const json& j)
{
    std::vector<ModelSpec> parsed;
    if (j.is_array()) {
        for (const auto& item : j) {
            auto spec = parseModelSpec(item);
            if (!spec)
                return std::unexpected(spec.error());
            parsed.push_back(std::move(*spec));
        }
    } else {
        auto spec = parseModelSpec(j);
        if (!spec)
            return std::unexpected(spec.error());
        parsed.push_back(std::move(*spec));
    }

    for (auto& spec : parsed)
        registerModel(std::move(spec));
    return parsed.size();
}

std::expected<size_t, ProtocolError> ModelRegistry::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open model file {}", path);
        return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
    }

    try {
        json j = json::parse(file);
        return loadFromJson(j);
    } catch (const json::exception& e) {
        spdlog::error("Failed to parse model file {}: {}", path, e.what());
        return std::unexpected(makeError(ExtensionError::InvalidModelSpec));
    }
}

std::vector<ModelSpec> ModelRegistry::models() const
{
    std::vector<ModelSpec> result;
    for (const auto& [key, spec] : models_)
        result.push_back(spec);
    return result;
}

} // namespace TCAT
