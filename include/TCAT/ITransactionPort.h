// include/TCAT/ITransactionPort.h
#pragma once

#include <cstdint>
#include <vector>
#include <expected>
#include "TCAT/Error.h"

namespace TCAT {

/**
 * @brief Asynchronous read/write primitive towards one FireWire node
 *
 * Offsets are relative to TCAT_BASE_ADDRESS; implementations add the base. One call is one
 * request on the bus: a 4-byte length maps to a quadlet request, anything longer to a block
 * request. Callers must serialize calls against one port.
 */
class ITransactionPort {
public:
    virtual ~ITransactionPort() = default;

    /**
     * @brief Read bytes from the node
     * @param offset Byte offset relative to the TCAT base
     * @param length Number of bytes, a multiple of 4
     * @param timeoutMs Time to wait for the response
     * @return Response payload or transport failure
     */
    virtual std::expected<std::vector<uint8_t>, TransportError> read(uint64_t offset, size_t length,
                                                                     uint32_t timeoutMs) = 0;

    /**
     * @brief Write bytes to the node
     * @param offset Byte offset relative to the TCAT base
     * @param data Payload, length a multiple of 4
     * @param timeoutMs Time to wait for the response
     * @return Success or transport failure
     */
    virtual std::expected<void, TransportError> write(uint64_t offset, const std::vector<uint8_t>& data,
                                                      uint32_t timeoutMs) = 0;
};

} // namespace TCAT
