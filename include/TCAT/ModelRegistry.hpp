// include/TCAT/ModelRegistry.hpp
#pragma once

#include "TCAT/Error.h"
#include "TCAT/Tcd22xxSpec.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <expected>
#include <nlohmann/json_fwd.hpp>

namespace TCAT {

// Vendor OUIs from the configuration ROM
inline constexpr uint32_t kVendorFocusrite = 0x00130e;
inline constexpr uint32_t kVendorAvid = 0x00a07e;
inline constexpr uint32_t kVendorMaudio = 0x000d6c;

/**
 * @brief Routing tables of the models known at build time
 */
std::vector<ModelSpec> builtinModelSpecs();

/**
 * @brief Decode one model record
 *
 * Schema: {"name", "vendor_id", "model_id", "inputs": [{"block", "offset", "count", "label"?,
 * "optional"?}], "outputs": [...], "fixed": [{"block", "channel"}], "clock_sources": [...]}
 *
 * @return Model or InvalidModelSpec
 */
std::expected<ModelSpec, ProtocolError> parseModelSpec(const nlohmann::json& j);

nlohmann::json modelSpecToJson(const ModelSpec& spec);

/**
 * @brief Lookup of model specifications keyed by (vendor OUI, model id)
 */
class ModelRegistry {
public:
    ModelRegistry() = default;

    /**
     * @brief Registry pre-populated with builtinModelSpecs()
     */
    static ModelRegistry withBuiltins();

    /**
     * @brief Add a model, replacing any record with the same identifiers
     */
    void registerModel(ModelSpec spec);

    std::expected<ModelSpec, ProtocolError> lookup(uint32_t vendorId, uint32_t modelId) const;

    /**
     * @brief Register the models of a JSON document
     * @param j One model object or an array of them. Nothing is registered when any record is invalid.
     * @return Number of models registered, or InvalidModelSpec
     */
    std::expected<size_t, ProtocolError> loadFromJson(const nlohmann::json& j);

    std::expected<size_t, ProtocolError> loadFromFile(const std::string& path);

    size_t size() const { return models_.size(); }
    std::vector<ModelSpec> models() const;

private:
    std::map<std::pair<uint32_t, uint32_t>, ModelSpec> models_;
};

} // namespace TCAT
