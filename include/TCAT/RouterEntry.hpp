// include/TCAT/RouterEntry.hpp
#pragma once

#include "TCAT/Error.h"
#include <cstdint>
#include <string>
#include <vector>
#include <expected>

namespace TCAT {

/**
 * @brief Source block of the router. Values without an enumerator are reserved and kept as-is.
 */
enum class SrcBlkId : uint8_t {
    Aes = 0,
    Adat = 1,
    Mixer = 2,
    Ins0 = 4,
    Ins1 = 5,
    ArmAprAudio = 10,
    Avs0 = 11,
    Avs1 = 12,
    Mute = 15
};

/**
 * @brief Destination block of the router. Values without an enumerator are reserved.
 */
enum class DstBlkId : uint8_t {
    Aes = 0,
    Adat = 1,
    MixerTx0 = 2,
    MixerTx1 = 3,
    Ins0 = 4,
    Ins1 = 5,
    ArmApbAudio = 10,
    Avs0 = 11,
    Avs1 = 12
};

bool isReserved(SrcBlkId id);
bool isReserved(DstBlkId id);
std::string srcBlkIdToString(SrcBlkId id);
std::string dstBlkIdToString(DstBlkId id);
std::expected<SrcBlkId, ProtocolError> srcBlkIdFromString(const std::string& name);
std::expected<DstBlkId, ProtocolError> dstBlkIdFromString(const std::string& name);

/**
 * @brief One source channel: 4-bit block id and 4-bit channel on the wire
 */
struct SrcBlk {
    SrcBlkId id{SrcBlkId::Mute};
    uint8_t ch{0};

    uint8_t toByte() const { return static_cast<uint8_t>((static_cast<uint8_t>(id) << 4) | (ch & 0x0f)); }
    static SrcBlk fromByte(uint8_t val) { return {static_cast<SrcBlkId>(val >> 4), static_cast<uint8_t>(val & 0x0f)}; }
    bool isValid() const { return static_cast<uint8_t>(id) <= 0x0f && ch <= 0x0f; }

    bool operator==(const SrcBlk& other) const { return id == other.id && ch == other.ch; }
    bool operator<(const SrcBlk& other) const { return toByte() < other.toByte(); }
};

/**
 * @brief One destination channel, encoded like SrcBlk
 */
struct DstBlk {
    DstBlkId id{DstBlkId::Aes};
    uint8_t ch{0};

    uint8_t toByte() const { return static_cast<uint8_t>((static_cast<uint8_t>(id) << 4) | (ch & 0x0f)); }
    static DstBlk fromByte(uint8_t val) { return {static_cast<DstBlkId>(val >> 4), static_cast<uint8_t>(val & 0x0f)}; }
    bool isValid() const { return static_cast<uint8_t>(id) <= 0x0f && ch <= 0x0f; }

    bool operator==(const DstBlk& other) const { return id == other.id && ch == other.ch; }
    bool operator<(const DstBlk& other) const { return toByte() < other.toByte(); }
};

/// Destination of placeholder entries that keep a fixed source at its table position
inline constexpr DstBlk kUnusedDstBlk{static_cast<DstBlkId>(0x0f), 0x0f};

/**
 * @brief One source-to-destination connection with its 16-bit peak level
 */
struct RouterEntry {
    DstBlk dst;
    SrcBlk src;
    uint16_t peak{0};

    bool isValid() const { return dst.isValid() && src.isValid(); }
    bool operator==(const RouterEntry& other) const = default;
};

std::string toString(const SrcBlk& blk);
std::string toString(const DstBlk& blk);

/**
 * @brief Decode one quadlet. Every bit belongs to a field, so any value decodes
 */
std::expected<RouterEntry, ProtocolError> parseRouterEntry(uint32_t value);

/**
 * @brief Encode one entry; invalid fields yield MalformedEntry
 */
std::expected<uint32_t, ProtocolError> buildRouterEntry(const RouterEntry& entry);

std::expected<std::vector<RouterEntry>, ProtocolError> parseRouterEntries(const std::vector<uint8_t>& raw);
std::expected<std::vector<uint8_t>, ProtocolError> buildRouterEntries(const std::vector<RouterEntry>& entries);

} // namespace TCAT
