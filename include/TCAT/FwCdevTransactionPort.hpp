// include/TCAT/FwCdevTransactionPort.hpp
#pragma once

#include "TCAT/ITransactionPort.h"
#include "TCAT/Error.h"
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <expected>

struct fw_cdev_event_bus_reset;

namespace TCAT {

/**
 * @brief Identity fields from the configuration ROM of a node
 */
struct NodeIdentity {
    uint64_t guid{0};
    uint32_t vendorId{0};   ///< Root directory key 0x03
    uint32_t modelId{0};    ///< Root directory key 0x17
};

/**
 * @brief Transaction port over a Linux firewire character device (/dev/fw*)
 *
 * Every request is sent with the bus generation seen last. A bus reset event read from the
 * device completes the pending request with TransportError::BusReset, updates the generation
 * and invokes the bus reset callback.
 */
class FwCdevTransactionPort : public ITransactionPort {
public:
    FwCdevTransactionPort() = default;
    ~FwCdevTransactionPort() override;

    FwCdevTransactionPort(const FwCdevTransactionPort&) = delete;
    FwCdevTransactionPort& operator=(const FwCdevTransactionPort&) = delete;

    /**
     * @brief Open the node device and fetch the configuration ROM and bus generation
     * @param path Character device of the node, e.g. /dev/fw1
     */
    std::expected<void, TransportError> open(const std::string& path);
    void close();
    bool isOpen() const { return fd_ >= 0; }

    uint32_t generation() const { return generation_; }
    const std::vector<uint32_t>& configRom() const { return configRom_; }

    /**
     * @brief Parse GUID, vendor and model from the cached configuration ROM
     */
    std::expected<NodeIdentity, TransportError> identity() const;

    void setBusResetCallback(std::function<void()> callback) { busResetCallback_ = std::move(callback); }

    std::expected<std::vector<uint8_t>, TransportError> read(uint64_t offset, size_t length,
                                                             uint32_t timeoutMs) override;
    std::expected<void, TransportError> write(uint64_t offset, const std::vector<uint8_t>& data,
                                              uint32_t timeoutMs) override;

private:
    std::expected<std::vector<uint8_t>, TransportError> transact(uint32_t tcode, uint64_t offset,
                                                                 size_t length, const uint8_t* payload,
                                                                 uint32_t timeoutMs);
    std::expected<std::vector<uint8_t>, TransportError> awaitResponse(uint64_t closure, uint32_t timeoutMs);
    void onBusReset(const fw_cdev_event_bus_reset& reset);

    int fd_{-1};
    std::string path_;
    uint32_t generation_{0};
    uint64_t nextClosure_{1};
    std::vector<uint32_t> configRom_;
    std::function<void()> busResetCallback_;
};

} // namespace TCAT
