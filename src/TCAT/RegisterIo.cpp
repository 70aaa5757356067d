// src/TCAT/RegisterIo.cpp
#include "TCAT/RegisterIo.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace TCAT {

RegisterIo::RegisterIo(ITransactionPort& port)
    : port_(port)
{
}

std::expected<std::vector<uint8_t>, TransportError> RegisterIo::readBlock(uint64_t offset, size_t length, uint32_t timeoutMs)
{
    if ((offset % TCAT_QUADLET_SIZE) != 0 || (length % TCAT_QUADLET_SIZE) != 0) {
        spdlog::error("Unaligned read: offset 0x{:x}, length {}", offset, length);
        return std::unexpected(TransportError::BadArgument);
    }

    std::vector<uint8_t> result;
    result.reserve(length);

    size_t done = 0;
    while (done < length) {
        size_t frameSize = std::min<size_t>(length - done, TCAT_MAX_FRAME_SIZE);
        spdlog::debug("Read frame: offset 0x{:x}, length {}", offset + done, frameSize);

        auto frame = port_.read(offset + done, frameSize, timeoutMs);
        if (!frame) {
            spdlog::error("Read failed at offset 0x{:x}: {}", offset + done,
                          make_error_code(frame.error()).message());
            return std::unexpected(frame.error());
        }
        if (frame->size() != frameSize) {
            spdlog::error("Short response at offset 0x{:x}: {} of {} bytes", offset + done,
                          frame->size(), frameSize);
            return std::unexpected(TransportError::ShortResponse);
        }

        result.insert(result.end(), frame->begin(), frame->end());
        done += frameSize;
    }

    return result;
}

std::expected<void, TransportError> RegisterIo::writeBlock(uint64_t offset, const std::vector<uint8_t>& data, uint32_t timeoutMs)
{
    if ((offset % TCAT_QUADLET_SIZE) != 0 || (data.size() % TCAT_QUADLET_SIZE) != 0) {
        spdlog::error("Unaligned write: offset 0x{:x}, length {}", offset, data.size());
        return std::unexpected(TransportError::BadArgument);
    }

    size_t done = 0;
    while (done < data.size()) {
        size_t frameSize = std::min<size_t>(data.size() - done, TCAT_MAX_FRAME_SIZE);
        spdlog::debug("Write frame: offset 0x{:x}, length {}", offset + done, frameSize);

        std::vector<uint8_t> frame(data.begin() + done, data.begin() + done + frameSize);
        auto res = port_.write(offset + done, frame, timeoutMs);
        if (!res) {
            spdlog::error("Write failed at offset 0x{:x}: {}", offset + done,
                          make_error_code(res.error()).message());
            return std::unexpected(res.error());
        }
        done += frameSize;
    }

    return {};
}

std::expected<uint32_t, TransportError> RegisterIo::readQuadlet(uint64_t offset, uint32_t timeoutMs)
{
    auto res = readBlock(offset, TCAT_QUADLET_SIZE, timeoutMs);
    if (!res)
        return std::unexpected(res.error());
    return readBe32(res->data());
}

std::expected<void, TransportError> RegisterIo::writeQuadlet(uint64_t offset, uint32_t value, uint32_t timeoutMs)
{
    std::vector<uint8_t> raw(TCAT_QUADLET_SIZE);
    writeBe32(raw.data(), value);
    return writeBlock(offset, raw, timeoutMs);
}

void swapQuadletBytes(uint8_t* raw, size_t length)
{
    for (size_t pos = 0; pos + TCAT_QUADLET_SIZE <= length; pos += TCAT_QUADLET_SIZE) {
        std::swap(raw[pos], raw[pos + 3]);
        std::swap(raw[pos + 1], raw[pos + 2]);
    }
}

} // namespace TCAT
