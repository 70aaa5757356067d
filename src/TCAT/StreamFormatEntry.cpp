// src/TCAT/StreamFormatEntry.cpp
#include "TCAT/StreamFormatEntry.hpp"
#include "TCAT/Helpers.h"
#include <spdlog/spdlog.h>

namespace TCAT {

std::expected<FormatEntry, ProtocolError> parseFormatEntry(const uint8_t* raw, size_t size)
{
    if (size < TCAT_FORMAT_ENTRY_SIZE) {
        spdlog::error("Stream format entry too short: {} bytes", size);
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }

    FormatEntry entry;
    entry.pcmCount = static_cast<uint8_t>(readBe32(raw));
    entry.midiCount = static_cast<uint8_t>(readBe32(raw + 4));
    entry.labels = Helpers::parseLabels(raw + 8, TCAT_FORMAT_LABELS_SIZE);

    uint32_t ac3 = readBe32(raw + 8 + TCAT_FORMAT_LABELS_SIZE);
    for (size_t i = 0; i < entry.enableAc3.size(); ++i)
        entry.enableAc3[i] = (ac3 & (1u << i)) != 0;

    return entry;
}

std::expected<std::vector<uint8_t>, ProtocolError> buildFormatEntry(const FormatEntry& entry)
{
    std::vector<uint8_t> raw(TCAT_FORMAT_ENTRY_SIZE, 0);
    writeBe32(&raw[0], entry.pcmCount);
    writeBe32(&raw[4], entry.midiCount);

    if (!Helpers::buildLabels(entry.labels, &raw[8], TCAT_FORMAT_LABELS_SIZE)) {
        spdlog::error("Stream format labels exceed {} bytes", TCAT_FORMAT_LABELS_SIZE);
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    uint32_t ac3 = 0;
    for (size_t i = 0; i < entry.enableAc3.size(); ++i) {
        if (entry.enableAc3[i])
            ac3 |= 1u << i;
    }
    writeBe32(&raw[8 + TCAT_FORMAT_LABELS_SIZE], ac3);

    return raw;
}

std::expected<StreamFormats, ProtocolError> parseStreamFormats(const std::vector<uint8_t>& raw,
                                                               const ExtensionCaps& caps)
{
    if (raw.size() < 8) {
        spdlog::error("Stream format block too short: {} bytes", raw.size());
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }

    uint32_t txCount = readBe32(&raw[0]);
    uint32_t rxCount = readBe32(&raw[4]);
    if (txCount > caps.general.maxTxStreams || rxCount > caps.general.maxRxStreams) {
        spdlog::error("Unexpected stream counts: tx {} (max {}), rx {} (max {})",
                      txCount, caps.general.maxTxStreams, rxCount, caps.general.maxRxStreams);
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }
    if (raw.size() < 8 + TCAT_FORMAT_ENTRY_SIZE * (txCount + rxCount)) {
        spdlog::error("Stream format block truncated: {} bytes for {} entries", raw.size(), txCount + rxCount);
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }

    StreamFormats formats;
    size_t pos = 8;
    for (uint32_t i = 0; i < txCount + rxCount; ++i) {
        auto entry = parseFormatEntry(&raw[pos], raw.size() - pos);
        if (!entry)
            return std::unexpected(entry.error());
        if (i < txCount)
            formats.tx.push_back(std::move(*entry));
        else
            formats.rx.push_back(std::move(*entry));
        pos += TCAT_FORMAT_ENTRY_SIZE;
    }
    return formats;
}

std::expected<StreamFormats, ProtocolError> readStreamFormatBlock(RegisterIo& io, uint64_t offset,
                                                                  const ExtensionCaps& caps,
                                                                  ExtensionError section, uint32_t timeoutMs)
{
    spdlog::debug("Reading stream formats from offset 0x{:x}", offset);

    auto counts = io.readBlock(offset, 8, timeoutMs);
    if (!counts) {
        spdlog::error("Failed to read stream counts");
        return std::unexpected(makeTransportError(section, counts.error()));
    }

    uint32_t txCount = readBe32(&(*counts)[0]);
    uint32_t rxCount = readBe32(&(*counts)[4]);
    if (txCount > caps.general.maxTxStreams || rxCount > caps.general.maxRxStreams) {
        spdlog::error("Unexpected stream counts: tx {} (max {}), rx {} (max {})",
                      txCount, caps.general.maxTxStreams, rxCount, caps.general.maxRxStreams);
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }

    std::vector<uint8_t> raw = std::move(*counts);
    size_t entriesSize = TCAT_FORMAT_ENTRY_SIZE * (txCount + rxCount);
    if (entriesSize > 0) {
        auto entries = io.readBlock(offset + 8, entriesSize, timeoutMs);
        if (!entries) {
            spdlog::error("Failed to read stream format entries");
            return std::unexpected(makeTransportError(section, entries.error()));
        }
        raw.insert(raw.end(), entries->begin(), entries->end());
    }

    return parseStreamFormats(raw, caps);
}

StreamFormatSectionProtocol::StreamFormatSectionProtocol(RegisterIo& io, const ExtensionSections& sections,
                                                         const ExtensionCaps& caps, uint32_t timeoutMs)
    : io_(io),
      sections_(sections),
      caps_(caps),
      timeoutMs_(timeoutMs)
{
}

std::expected<StreamFormats, ProtocolError> StreamFormatSectionProtocol::read()
{
    return readStreamFormatBlock(io_, extensionOffset(sections_.streamFormat, 0), caps_,
                                 ExtensionError::StreamFormat, timeoutMs_);
}

std::expected<void, ProtocolError> StreamFormatSectionProtocol::write(const StreamFormats& formats)
{
    if (!caps_.general.dynamicStreamFormat) {
        spdlog::error("Device does not support dynamic stream format");
        return std::unexpected(makeError(ExtensionError::FeatureUnavailable));
    }
    if (formats.tx.size() != caps_.general.maxTxStreams || formats.rx.size() != caps_.general.maxRxStreams) {
        spdlog::error("Stream counts tx {} rx {} do not match capabilities tx {} rx {}",
                      formats.tx.size(), formats.rx.size(),
                      caps_.general.maxTxStreams, caps_.general.maxRxStreams);
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    std::vector<uint8_t> raw(8);
    writeBe32(&raw[0], static_cast<uint32_t>(formats.tx.size()));
    writeBe32(&raw[4], static_cast<uint32_t>(formats.rx.size()));
    for (const auto* list : {&formats.tx, &formats.rx}) {
        for (const auto& entry : *list) {
            auto data = buildFormatEntry(entry);
            if (!data)
                return std::unexpected(data.error());
            raw.insert(raw.end(), data->begin(), data->end());
        }
    }

    if (raw.size() > sections_.streamFormat.size) {
        spdlog::error("Stream format image of {} bytes exceeds section size {}", raw.size(),
                      sections_.streamFormat.size);
        return std::unexpected(makeError(ExtensionError::BadArgument));
    }

    spdlog::debug("Writing {} tx and {} rx stream formats", formats.tx.size(), formats.rx.size());
    auto res = io_.writeBlock(extensionOffset(sections_.streamFormat, 0), raw, timeoutMs_);
    if (!res) {
        spdlog::error("Failed to write stream formats");
        return std::unexpected(makeTransportError(ExtensionError::StreamFormat, res.error()));
    }
    return {};
}

} // namespace TCAT
