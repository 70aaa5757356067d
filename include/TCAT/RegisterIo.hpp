// include/TCAT/RegisterIo.hpp
#pragma once

#include "TCAT/ITransactionPort.h"
#include "TCAT/Error.h"
#include <cstdint>
#include <cstddef>
#include <vector>
#include <expected>

namespace TCAT {

/**
 * @brief Frame-splitting register accessor on top of a transaction port
 *
 * Every transfer is split into frames of at most TCAT_MAX_FRAME_SIZE bytes. Quadlet values are
 * big-endian on the wire.
 */
class RegisterIo {
public:
    explicit RegisterIo(ITransactionPort& port);

    /**
     * @brief Read a contiguous byte range
     * @param offset Offset relative to the TCAT base, quadlet aligned
     * @param length Number of bytes, multiple of 4
     * @param timeoutMs Timeout applied to each frame
     */
    std::expected<std::vector<uint8_t>, TransportError> readBlock(uint64_t offset, size_t length, uint32_t timeoutMs);

    /**
     * @brief Write a contiguous byte range
     * @param offset Offset relative to the TCAT base, quadlet aligned
     * @param data Payload, length multiple of 4
     * @param timeoutMs Timeout applied to each frame
     */
    std::expected<void, TransportError> writeBlock(uint64_t offset, const std::vector<uint8_t>& data, uint32_t timeoutMs);

    std::expected<uint32_t, TransportError> readQuadlet(uint64_t offset, uint32_t timeoutMs);
    std::expected<void, TransportError> writeQuadlet(uint64_t offset, uint32_t value, uint32_t timeoutMs);

    ITransactionPort& port() { return port_; }

private:
    ITransactionPort& port_;
};

// Big-endian helpers shared by the section codecs
inline uint32_t readBe32(const uint8_t* raw) {
    return (static_cast<uint32_t>(raw[0]) << 24) | (static_cast<uint32_t>(raw[1]) << 16) |
           (static_cast<uint32_t>(raw[2]) << 8) | static_cast<uint32_t>(raw[3]);
}

inline void writeBe32(uint8_t* raw, uint32_t value) {
    raw[0] = static_cast<uint8_t>(value >> 24);
    raw[1] = static_cast<uint8_t>(value >> 16);
    raw[2] = static_cast<uint8_t>(value >> 8);
    raw[3] = static_cast<uint8_t>(value);
}

/**
 * @brief Reverse byte order inside each quadlet. Text fields are stored this way.
 */
void swapQuadletBytes(uint8_t* raw, size_t length);

} // namespace TCAT
