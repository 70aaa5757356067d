// include/TCAT/Enums.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace TCAT {

/**
 * @brief Sampling rate regime. Selects the channel multiplexing of optical blocks.
 */
enum class RateMode : uint8_t {
    Low = 0,    // up to 48 kHz
    Middle = 1, // up to 96 kHz
    High = 2    // up to 192 kHz
};

/**
 * @brief Nominal rate of sampling clock as coded in the global section.
 *
 * Codes above None are reserved and kept as-is.
 */
enum class ClockRate : uint8_t {
    R32000 = 0x00,
    R44100 = 0x01,
    R48000 = 0x02,
    R88200 = 0x03,
    R96000 = 0x04,
    R176400 = 0x05,
    R192000 = 0x06,
    AnyLow = 0x07,
    AnyMid = 0x08,
    AnyHigh = 0x09,
    None = 0x0a
};

/**
 * @brief Source of sampling clock as coded in the global section.
 */
enum class ClockSource : uint8_t {
    Aes1 = 0x00,
    Aes2 = 0x01,
    Aes3 = 0x02,
    Aes4 = 0x03,
    AesAny = 0x04,
    Adat = 0x05,
    Tdif = 0x06,
    WordClock = 0x07,
    Arx1 = 0x08,
    Arx2 = 0x09,
    Arx3 = 0x0a,
    Arx4 = 0x0b,
    Internal = 0x0c
};

enum class AsicType : uint8_t {
    DiceII = 0,
    Tcd2210 = 1,
    Tcd2220 = 2,
    Reserved = 0xff
};

RateMode rateModeFromClockRate(ClockRate rate);
RateMode rateModeFromHz(uint32_t rate);
uint32_t clockRateToHz(ClockRate rate);

std::string rateModeToString(RateMode mode);
std::string clockRateToString(ClockRate rate);
std::string clockSourceToString(ClockSource src);
std::string asicTypeToString(AsicType type);

std::optional<ClockSource> clockSourceFromString(const std::string& name);

} // namespace TCAT
