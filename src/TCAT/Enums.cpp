#include "TCAT/Enums.hpp"
#include <array>
#include <sstream>
#include <iomanip>

namespace TCAT {

namespace {
    constexpr std::array<std::pair<ClockSource, const char*>, 13> kClockSourceNames = {{
        {ClockSource::Aes1, "AES1"},
        {ClockSource::Aes2, "AES2"},
        {ClockSource::Aes3, "AES3"},
        {ClockSource::Aes4, "AES4"},
        {ClockSource::AesAny, "AES-ANY"},
        {ClockSource::Adat, "ADAT"},
        {ClockSource::Tdif, "TDIF"},
        {ClockSource::WordClock, "Word-Clock"},
        {ClockSource::Arx1, "AVS-Audio-RX1"},
        {ClockSource::Arx2, "AVS-Audio-RX2"},
        {ClockSource::Arx3, "AVS-Audio-RX3"},
        {ClockSource::Arx4, "AVS-Audio-RX4"},
        {ClockSource::Internal, "Internal"},
    }};

    std::string reservedToString(uint8_t val) {
        std::ostringstream oss;
        oss << "Reserved(0x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(val) << ")";
        return oss.str();
    }
}

RateMode rateModeFromClockRate(ClockRate rate) {
    switch (rate) {
        case ClockRate::R32000:
        case ClockRate::R44100:
        case ClockRate::R48000:
        case ClockRate::AnyLow:
            return RateMode::Low;
        case ClockRate::R88200:
        case ClockRate::R96000:
        case ClockRate::AnyMid:
            return RateMode::Middle;
        case ClockRate::R176400:
        case ClockRate::R192000:
        case ClockRate::AnyHigh:
            return RateMode::High;
        default:
            return RateMode::Low;
    }
}

RateMode rateModeFromHz(uint32_t rate) {
    if (rate <= 48000)
        return RateMode::Low;
    if (rate <= 96000)
        return RateMode::Middle;
    return RateMode::High;
}

uint32_t clockRateToHz(ClockRate rate) {
    switch (rate) {
        case ClockRate::R32000: return 32000;
        case ClockRate::R44100: return 44100;
        case ClockRate::R48000: return 48000;
        case ClockRate::R88200: return 88200;
        case ClockRate::R96000: return 96000;
        case ClockRate::R176400: return 176400;
        case ClockRate::R192000: return 192000;
        default: return 0;
    }
}

std::string rateModeToString(RateMode mode) {
    switch (mode) {
        case RateMode::Low: return "low";
        case RateMode::Middle: return "middle";
        case RateMode::High: return "high";
        default: return "unknown";
    }
}

std::string clockRateToString(ClockRate rate) {
    switch (rate) {
        case ClockRate::R32000: return "32000";
        case ClockRate::R44100: return "44100";
        case ClockRate::R48000: return "48000";
        case ClockRate::R88200: return "88200";
        case ClockRate::R96000: return "96000";
        case ClockRate::R176400: return "176400";
        case ClockRate::R192000: return "192000";
        case ClockRate::AnyLow: return "Any-low";
        case ClockRate::AnyMid: return "Any-mid";
        case ClockRate::AnyHigh: return "Any-high";
        case ClockRate::None: return "None";
        default: return reservedToString(static_cast<uint8_t>(rate));
    }
}

std::string clockSourceToString(ClockSource src) {
    for (const auto& [source, name] : kClockSourceNames) {
        if (source == src)
            return name;
    }
    return reservedToString(static_cast<uint8_t>(src));
}

std::string asicTypeToString(AsicType type) {
    switch (type) {
        case AsicType::DiceII: return "DICE II";
        case AsicType::Tcd2210: return "TCD2210";
        case AsicType::Tcd2220: return "TCD2220";
        default: return "Reserved";
    }
}

std::optional<ClockSource> clockSourceFromString(const std::string& name) {
    for (const auto& [source, label] : kClockSourceNames) {
        if (name == label)
            return source;
    }
    // Accept enumerator spelling used in model files
    static constexpr std::array<std::pair<ClockSource, const char*>, 13> kAliases = {{
        {ClockSource::Aes1, "Aes1"},
        {ClockSource::Aes2, "Aes2"},
        {ClockSource::Aes3, "Aes3"},
        {ClockSource::Aes4, "Aes4"},
        {ClockSource::AesAny, "AesAny"},
        {ClockSource::Adat, "Adat"},
        {ClockSource::Tdif, "Tdif"},
        {ClockSource::WordClock, "WordClock"},
        {ClockSource::Arx1, "Arx1"},
        {ClockSource::Arx2, "Arx2"},
        {ClockSource::Arx3, "Arx3"},
        {ClockSource::Arx4, "Arx4"},
        {ClockSource::Internal, "internal"},
    }};
    for (const auto& [source, alias] : kAliases) {
        if (name == alias)
            return source;
    }
    return std::nullopt;
}

} // namespace TCAT
