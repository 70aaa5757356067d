// src/TCAT/FwCdevTransactionPort.cpp
#include "TCAT/FwCdevTransactionPort.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>
#include <linux/firewire-cdev.h>
#include <linux/firewire-constants.h>
#include <sys/ioctl.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <utility>

namespace TCAT {

namespace {
    // Client ABI version announced with GET_INFO; 6 and later switch to RESPONSE2 events
    constexpr uint32_t kCdevAbiVersion = 5;
    constexpr size_t kConfigRomQuadlets = 256;
    constexpr uint32_t kRomKeyVendor = 0x03;
    constexpr uint32_t kRomKeyModel = 0x17;

    TransportError rcodeToError(uint32_t rcode)
    {
        switch (rcode) {
            case RCODE_COMPLETE: return TransportError::Success;
            case RCODE_BUSY: return TransportError::Busy;
            case RCODE_ADDRESS_ERROR: return TransportError::AddressError;
            case RCODE_GENERATION: return TransportError::BusReset;
            case RCODE_CANCELLED: return TransportError::Timeout;
            default: return TransportError::IOError;
        }
    }
}

FwCdevTransactionPort::~FwCdevTransactionPort()
{
    close();
}

std::expected<void, TransportError> FwCdevTransactionPort::open(const std::string& path)
{
    close();

    int fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        spdlog::error("FwCdevTransactionPort::open - cannot open {}: {}", path, std::strerror(errno));
        return std::unexpected(TransportError::NotOpen);
    }

    std::vector<uint32_t> rom(kConfigRomQuadlets, 0);
    fw_cdev_event_bus_reset reset{};
    fw_cdev_get_info info{};
    info.version = kCdevAbiVersion;
    info.rom_length = static_cast<uint32_t>(rom.size() * sizeof(uint32_t));
    info.rom = reinterpret_cast<uintptr_t>(rom.data());
    info.bus_reset = reinterpret_cast<uintptr_t>(&reset);
    info.bus_reset_closure = 0;

    if (::ioctl(fd, FW_CDEV_IOC_GET_INFO, &info) < 0) {
        spdlog::error("FwCdevTransactionPort::open - GET_INFO failed on {}: {}", path, std::strerror(errno));
        ::close(fd);
        return std::unexpected(TransportError::IOError);
    }

    // rom_length now holds the full ROM size, which may exceed the buffer
    size_t romQuadlets = std::min<size_t>(info.rom_length / sizeof(uint32_t), rom.size());
    rom.resize(romQuadlets);

    fd_ = fd;
    path_ = path;
    generation_ = reset.generation;
    configRom_ = std::move(rom);

    spdlog::info("Opened {} (node 0x{:x}, generation {}, ROM {} quadlets)", path_, reset.node_id,
                 generation_, configRom_.size());
    return {};
}

void FwCdevTransactionPort::close()
{
    if (fd_ < 0)
        return;
    ::close(fd_);
    spdlog::debug("Closed {}", path_);
    fd_ = -1;
    configRom_.clear();
}

std::expected<NodeIdentity, TransportError> FwCdevTransactionPort::identity() const
{
    if (configRom_.empty()) {
        spdlog::error("FwCdevTransactionPort::identity - no configuration ROM");
        return std::unexpected(TransportError::NotOpen);
    }

    // Bus info block: header quadlet, then info_length quadlets; GUID in quadlets 3 and 4
    size_t infoLength = configRom_[0] >> 24;
    size_t rootIndex = 1 + infoLength;
    if (infoLength < 4 || rootIndex >= configRom_.size()) {
        spdlog::error("FwCdevTransactionPort::identity - minimal or truncated configuration ROM");
        return std::unexpected(TransportError::ShortResponse);
    }

    NodeIdentity id;
    id.guid = (static_cast<uint64_t>(configRom_[3]) << 32) | configRom_[4];

    size_t rootLength = configRom_[rootIndex] >> 16;
    size_t end = std::min(rootIndex + 1 + rootLength, configRom_.size());
    for (size_t i = rootIndex + 1; i < end; ++i) {
        uint32_t key = configRom_[i] >> 24;
        uint32_t value = configRom_[i] & 0x00ffffff;
        if (key == kRomKeyVendor)
            id.vendorId = value;
        else if (key == kRomKeyModel)
            id.modelId = value;
    }

    spdlog::debug("Node GUID 0x{:016x}, vendor 0x{:06x}, model 0x{:06x}", id.guid, id.vendorId, id.modelId);
    return id;
}

std::expected<std::vector<uint8_t>, TransportError> FwCdevTransactionPort::read(uint64_t offset, size_t length,
                                                                                uint32_t timeoutMs)
{
    if (length == 0 || (length % TCAT_QUADLET_SIZE) != 0) {
        spdlog::error("FwCdevTransactionPort::read - invalid length {}", length);
        return std::unexpected(TransportError::BadArgument);
    }
    uint32_t tcode = length == TCAT_QUADLET_SIZE ? TCODE_READ_QUADLET_REQUEST : TCODE_READ_BLOCK_REQUEST;
    return transact(tcode, offset, length, nullptr, timeoutMs);
}

std::expected<void, TransportError> FwCdevTransactionPort::write(uint64_t offset, const std::vector<uint8_t>& data,
                                                                 uint32_t timeoutMs)
{
    if (data.empty() || (data.size() % TCAT_QUADLET_SIZE) != 0) {
        spdlog::error("FwCdevTransactionPort::write - invalid length {}", data.size());
        return std::unexpected(TransportError::BadArgument);
    }
    uint32_t tcode = data.size() == TCAT_QUADLET_SIZE ? TCODE_WRITE_QUADLET_REQUEST : TCODE_WRITE_BLOCK_REQUEST;
    auto res = transact(tcode, offset, data.size(), data.data(), timeoutMs);
    if (!res)
        return std::unexpected(res.error());
    return {};
}

std::expected<std::vector<uint8_t>, TransportError> FwCdevTransactionPort::transact(uint32_t tcode, uint64_t offset,
                                                                                    size_t length, const uint8_t* payload,
                                                                                    uint32_t timeoutMs)
{
    if (fd_ < 0) {
        spdlog::error("FwCdevTransactionPort - request at 0x{:x} on closed port", offset);
        return std::unexpected(TransportError::NotOpen);
    }

    uint64_t closure = nextClosure_++;

    fw_cdev_send_request request{};
    request.tcode = tcode;
    request.length = static_cast<uint32_t>(length);
    request.offset = TCAT_BASE_ADDRESS + offset;
    request.closure = closure;
    request.data = reinterpret_cast<uintptr_t>(payload);
    request.generation = generation_;

    spdlog::debug("SEND_REQUEST tcode {} offset 0x{:x} length {} generation {}", tcode, offset, length, generation_);

    if (::ioctl(fd_, FW_CDEV_IOC_SEND_REQUEST, &request) < 0) {
        spdlog::error("FwCdevTransactionPort - SEND_REQUEST failed for offset 0x{:x}: {}", offset, std::strerror(errno));
        return std::unexpected(TransportError::IOError);
    }

    auto response = awaitResponse(closure, timeoutMs);
    if (!response)
        return std::unexpected(response.error());

    // Write responses carry no payload
    if (payload == nullptr && response->size() < length) {
        spdlog::error("FwCdevTransactionPort - short response at offset 0x{:x}: {} of {} bytes", offset,
                      response->size(), length);
        return std::unexpected(TransportError::ShortResponse);
    }
    if (payload == nullptr)
        response->resize(length);
    return response;
}

std::expected<std::vector<uint8_t>, TransportError> FwCdevTransactionPort::awaitResponse(uint64_t closure,
                                                                                         uint32_t timeoutMs)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeoutMs);

    // Room for the largest response event; uint64_t storage keeps the event aligned
    std::vector<uint64_t> buffer((sizeof(fw_cdev_event) + TCAT_MAX_FRAME_SIZE) / sizeof(uint64_t) + 1);

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (remaining < 0)
            remaining = 0;

        pollfd pfd{fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            spdlog::error("FwCdevTransactionPort - poll failed: {}", std::strerror(errno));
            return std::unexpected(TransportError::IOError);
        }
        if (ready == 0) {
            spdlog::error("FwCdevTransactionPort - no response within {} ms", timeoutMs);
            return std::unexpected(TransportError::Timeout);
        }
        if ((pfd.revents & (POLLERR | POLLHUP)) != 0) {
            spdlog::error("FwCdevTransactionPort - node {} gone", path_);
            return std::unexpected(TransportError::IOError);
        }

        ssize_t n = ::read(fd_, buffer.data(), buffer.size() * sizeof(uint64_t));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            spdlog::error("FwCdevTransactionPort - event read failed: {}", std::strerror(errno));
            return std::unexpected(TransportError::IOError);
        }
        if (static_cast<size_t>(n) < sizeof(fw_cdev_event_common))
            continue;

        const auto* event = reinterpret_cast<const fw_cdev_event*>(buffer.data());
        switch (event->common.type) {
            case FW_CDEV_EVENT_BUS_RESET:
                onBusReset(event->bus_reset);
                return std::unexpected(TransportError::BusReset);

            case FW_CDEV_EVENT_RESPONSE: {
                const auto& response = event->response;
                if (response.closure != closure) {
                    // Late response to a request that already timed out
                    spdlog::debug("Dropping response for stale closure {}", response.closure);
                    continue;
                }
                auto error = rcodeToError(response.rcode);
                if (error != TransportError::Success) {
                    spdlog::error("FwCdevTransactionPort - response rcode 0x{:x}", response.rcode);
                    return std::unexpected(error);
                }
                size_t available = static_cast<size_t>(n) - sizeof(fw_cdev_event_response);
                size_t length = std::min<size_t>(response.length, available);
                const auto* bytes = reinterpret_cast<const uint8_t*>(response.data);
                return std::vector<uint8_t>(bytes, bytes + length);
            }

            default:
                spdlog::debug("Ignoring cdev event type {}", event->common.type);
                continue;
        }
    }
}

void FwCdevTransactionPort::onBusReset(const fw_cdev_event_bus_reset& reset)
{
    spdlog::info("Bus reset on {}: generation {} -> {}", path_, generation_, reset.generation);
    generation_ = reset.generation;
    if (busResetCallback_)
        busResetCallback_();
}

} // namespace TCAT
