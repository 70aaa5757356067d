// src/TCAT/RouterEntry.cpp
#include "TCAT/RouterEntry.hpp"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/TcatDefines.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <optional>
#include <sstream>
#include <iomanip>

namespace TCAT {

namespace {
    constexpr std::array<std::pair<SrcBlkId, const char*>, 9> kSrcNames = {{
        {SrcBlkId::Aes, "Aes"},
        {SrcBlkId::Adat, "Adat"},
        {SrcBlkId::Mixer, "Mixer"},
        {SrcBlkId::Ins0, "Ins0"},
        {SrcBlkId::Ins1, "Ins1"},
        {SrcBlkId::ArmAprAudio, "ArmAprAudio"},
        {SrcBlkId::Avs0, "Avs0"},
        {SrcBlkId::Avs1, "Avs1"},
        {SrcBlkId::Mute, "Mute"},
    }};

    constexpr std::array<std::pair<DstBlkId, const char*>, 9> kDstNames = {{
        {DstBlkId::Aes, "Aes"},
        {DstBlkId::Adat, "Adat"},
        {DstBlkId::MixerTx0, "MixerTx0"},
        {DstBlkId::MixerTx1, "MixerTx1"},
        {DstBlkId::Ins0, "Ins0"},
        {DstBlkId::Ins1, "Ins1"},
        {DstBlkId::ArmApbAudio, "ArmApbAudio"},
        {DstBlkId::Avs0, "Avs0"},
        {DstBlkId::Avs1, "Avs1"},
    }};

    std::string reservedName(uint8_t val)
    {
        std::ostringstream oss;
        oss << "Reserved(0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(val) << ")";
        return oss.str();
    }

    // "Reserved(0x08)" or "Reserved(8)" spelling in model files
    std::optional<uint8_t> parseReservedName(const std::string& name)
    {
        const std::string prefix = "Reserved(";
        if (name.size() <= prefix.size() + 1 || name.compare(0, prefix.size(), prefix) != 0 || name.back() != ')')
            return std::nullopt;
        std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - 1);
        try {
            size_t used = 0;
            unsigned long val = std::stoul(digits, &used, 0);
            if (used != digits.size() || val > 0x0f)
                return std::nullopt;
            return static_cast<uint8_t>(val);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
}

bool isReserved(SrcBlkId id)
{
    for (const auto& [known, name] : kSrcNames) {
        if (known == id)
            return false;
    }
    return true;
}

bool isReserved(DstBlkId id)
{
    for (const auto& [known, name] : kDstNames) {
        if (known == id)
            return false;
    }
    return true;
}

std::string srcBlkIdToString(SrcBlkId id)
{
    for (const auto& [known, name] : kSrcNames) {
        if (known == id)
            return name;
    }
    return reservedName(static_cast<uint8_t>(id));
}

std::string dstBlkIdToString(DstBlkId id)
{
    for (const auto& [known, name] : kDstNames) {
        if (known == id)
            return name;
    }
    return reservedName(static_cast<uint8_t>(id));
}

std::expected<SrcBlkId, ProtocolError> srcBlkIdFromString(const std::string& name)
{
    for (const auto& [known, label] : kSrcNames) {
        if (name == label)
            return known;
    }
    if (auto val = parseReservedName(name))
        return static_cast<SrcBlkId>(*val);
    return std::unexpected(makeError(ExtensionError::BadArgument));
}

std::expected<DstBlkId, ProtocolError> dstBlkIdFromString(const std::string& name)
{
    for (const auto& [known, label] : kDstNames) {
        if (name == label)
            return known;
    }
    if (auto val = parseReservedName(name))
        return static_cast<DstBlkId>(*val);
    return std::unexpected(makeError(ExtensionError::BadArgument));
}

std::string toString(const SrcBlk& blk)
{
    return srcBlkIdToString(blk.id) + ":" + std::to_string(blk.ch);
}

std::string toString(const DstBlk& blk)
{
    return dstBlkIdToString(blk.id) + ":" + std::to_string(blk.ch);
}

std::expected<RouterEntry, ProtocolError> parseRouterEntry(uint32_t value)
{
    RouterEntry entry;
    entry.peak = static_cast<uint16_t>((value & TCAT_ROUTER_PEAK_MASK) >> TCAT_ROUTER_PEAK_SHIFT);
    entry.src = SrcBlk::fromByte(static_cast<uint8_t>((value & TCAT_ROUTER_SRC_MASK) >> TCAT_ROUTER_SRC_SHIFT));
    entry.dst = DstBlk::fromByte(static_cast<uint8_t>(value & TCAT_ROUTER_DST_MASK));
    return entry;
}

std::expected<uint32_t, ProtocolError> buildRouterEntry(const RouterEntry& entry)
{
    if (!entry.isValid()) {
        spdlog::error("Cannot encode router entry {} -> {} (peak 0x{:x})",
                      toString(entry.src), toString(entry.dst), entry.peak);
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }

    return (static_cast<uint32_t>(entry.peak) << TCAT_ROUTER_PEAK_SHIFT) |
           (static_cast<uint32_t>(entry.src.toByte()) << TCAT_ROUTER_SRC_SHIFT) |
           static_cast<uint32_t>(entry.dst.toByte());
}

std::expected<std::vector<RouterEntry>, ProtocolError> parseRouterEntries(const std::vector<uint8_t>& raw)
{
    if (raw.size() % TCAT_ROUTER_ENTRY_SIZE) {
        spdlog::error("Router entry block has odd length {}", raw.size());
        return std::unexpected(makeError(ExtensionError::MalformedEntry));
    }

    std::vector<RouterEntry> entries;
    entries.reserve(raw.size() / TCAT_ROUTER_ENTRY_SIZE);
    for (size_t pos = 0; pos < raw.size(); pos += TCAT_ROUTER_ENTRY_SIZE) {
        auto entry = parseRouterEntry(readBe32(&raw[pos]));
        if (!entry)
            return std::unexpected(entry.error());
        entries.push_back(*entry);
    }
    return entries;
}

std::expected<std::vector<uint8_t>, ProtocolError> buildRouterEntries(const std::vector<RouterEntry>& entries)
{
    std::vector<uint8_t> raw(entries.size() * TCAT_ROUTER_ENTRY_SIZE);
    for (size_t i = 0; i < entries.size(); ++i) {
        auto value = buildRouterEntry(entries[i]);
        if (!value)
            return std::unexpected(value.error());
        writeBe32(&raw[i * TCAT_ROUTER_ENTRY_SIZE], *value);
    }
    return raw;
}

} // namespace TCAT
