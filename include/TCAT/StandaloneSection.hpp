// include/TCAT/StandaloneSection.hpp
#pragma once

#include "TCAT/Error.h"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/Sections.hpp"
#include <cstdint>
#include <expected>

namespace TCAT {

/**
 * @brief Parameters the device uses when running without a host
 *
 * Fields are kept as raw quadlets; their meaning is firmware specific.
 */
struct StandaloneParameters {
    uint32_t clockSource{0};
    uint32_t aes{0};
    uint32_t adat{0};
    uint32_t wordClock{0};
    uint32_t internal{0};

    bool operator==(const StandaloneParameters& other) const = default;
};

class StandaloneSection {
public:
    StandaloneSection(RegisterIo& io, const ExtensionSections& sections, uint32_t timeoutMs);

    std::expected<StandaloneParameters, ProtocolError> read();
    std::expected<void, ProtocolError> write(const StandaloneParameters& params);

private:
    RegisterIo& io_;
    ExtensionSections sections_;
    uint32_t timeoutMs_;
};

} // namespace TCAT
