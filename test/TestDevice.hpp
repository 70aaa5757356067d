// test/TestDevice.hpp
#pragma once

#include "FakeTransactionPort.hpp"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/Helpers.h"
#include "TCAT/RouterEntry.hpp"
#include "TCAT/Sections.hpp"
#include "TCAT/StreamFormatEntry.hpp"
#include "TCAT/TcatDefines.hpp"
#include "TCAT/Tcd22xxSpec.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace TCAT::Test {

// Section layout of the emulated device, in bytes
inline constexpr uint32_t kGlobalOffset = 0x28;
inline constexpr uint32_t kGlobalSize = TCAT_GLOBAL_EXTENDED_SIZE;

inline constexpr ExtensionSections kExtensionLayout{
    {0x48, 0x0c},     // caps
    {0x54, 0x08},     // command
    {0x5c, 0x20},     // mixer
    {0x100, 0x100},   // peak
    {0x200, 0x104},   // router
    {0x400, 0x440},   // stream format
    {0x1000, 0x6000}, // current config
    {0x7000, 0x14},   // standalone
    {0x7100, 0x100},  // application
};

inline uint64_t extAddr(const Section& section, uint32_t offset = 0)
{
    return extensionOffset(section, offset);
}

inline uint32_t routerCapsQuadlet(const RouterCaps& caps)
{
    uint32_t flags = (caps.isExposed ? TCAT_CAP_EXPOSED : 0) | (caps.isReadonly ? TCAT_CAP_READONLY : 0) |
                     (caps.isStorable ? TCAT_CAP_STORABLE : 0);
    return (static_cast<uint32_t>(caps.maximumEntryCount) << 16) | flags;
}

inline uint32_t mixerCapsQuadlet(const MixerCaps& caps)
{
    uint32_t flags = (caps.isExposed ? TCAT_CAP_EXPOSED : 0) | (caps.isReadonly ? TCAT_CAP_READONLY : 0) |
                     (caps.isStorable ? TCAT_CAP_STORABLE : 0);
    return (static_cast<uint32_t>(caps.outputCount) << 24) | (static_cast<uint32_t>(caps.inputCount) << 16) |
           (static_cast<uint32_t>(caps.outputDeviceId & 0x0f) << 8) |
           (static_cast<uint32_t>(caps.inputDeviceId & 0x0f) << 4) | flags;
}

inline uint32_t generalCapsQuadlet(const GeneralCaps& caps)
{
    uint32_t flags = (caps.dynamicStreamFormat ? TCAT_CAP_GENERAL_DYNAMIC_STREAM : 0) |
                     (caps.storageAvail ? TCAT_CAP_GENERAL_STORAGE : 0) |
                     (caps.peakAvail ? TCAT_CAP_GENERAL_PEAK : 0);
    uint32_t rx = (caps.maxRxStreams & 0x0f) | (caps.streamFormatIsStorable ? TCAT_CAP_GENERAL_STREAM_STORABLE : 0);
    return (static_cast<uint32_t>(static_cast<uint8_t>(caps.asicType)) << 16) | (rx << 8) |
           (static_cast<uint32_t>(caps.maxTxStreams & 0x0f) << 4) | flags;
}

/**
 * @brief Register content of an emulated TCD22xx device
 */
struct DeviceImage {
    ExtensionCaps caps;
    std::string nickname{"Studio"};
    uint32_t clockSelect{0x020c};   // 48 kHz, internal
    uint32_t sampleRate{48000};
    uint32_t clockCaps{0x10210006}; // 44.1/48 kHz; Aes1, Adat, Internal
    std::vector<std::string> clockSourceNames{"AES1", "AES2", "AES3", "AES4", "AES-ANY", "ADAT", "TDIF",
                                              "WC", "ARX1", "ARX2", "ARX3", "ARX4", "Internal"};
    std::vector<RouterEntry> lowRouter;
    StreamFormats lowFormats;

    DeviceImage()
    {
        caps.router = {true, false, true, 16};
        caps.general.peakAvail = true;
        caps.general.storageAvail = true;
        caps.general.maxTxStreams = 1;
        caps.general.maxRxStreams = 1;
        caps.general.asicType = AsicType::Tcd2220;
    }
};

inline void writeRouterBlock(FakeTransactionPort& port, uint64_t offset, const std::vector<RouterEntry>& entries)
{
    port.setQuadlet(offset, static_cast<uint32_t>(entries.size()));
    auto raw = buildRouterEntries(entries);
    if (raw)
        port.setBytes(offset + 4, *raw);
}

inline void writeStreamFormatBlock(FakeTransactionPort& port, uint64_t offset, const StreamFormats& formats)
{
    port.setQuadlet(offset, static_cast<uint32_t>(formats.tx.size()));
    port.setQuadlet(offset + 4, static_cast<uint32_t>(formats.rx.size()));
    uint64_t pos = offset + 8;
    for (const auto* list : {&formats.tx, &formats.rx}) {
        for (const auto& entry : *list) {
            auto raw = buildFormatEntry(entry);
            if (raw)
                port.setBytes(pos, *raw);
            pos += TCAT_FORMAT_ENTRY_SIZE;
        }
    }
}

/**
 * @brief Fill the section tables, capabilities, global section and low-rate configuration
 */
inline void populateDevice(FakeTransactionPort& port, const DeviceImage& image)
{
    port.setQuadlet(0, kGlobalOffset / 4);
    port.setQuadlet(4, kGlobalSize / 4);

    const Section* layout[] = {
        &kExtensionLayout.caps, &kExtensionLayout.cmd, &kExtensionLayout.mixer,
        &kExtensionLayout.peak, &kExtensionLayout.router, &kExtensionLayout.streamFormat,
        &kExtensionLayout.currentConfig, &kExtensionLayout.standalone, &kExtensionLayout.application,
    };
    uint64_t entry = TCAT_EXTENSION_OFFSET;
    for (const auto* section : layout) {
        port.setQuadlet(entry, section->offset / 4);
        port.setQuadlet(entry + 4, section->size / 4);
        entry += TCAT_SECTION_ENTRY_SIZE;
    }

    uint64_t caps = extAddr(kExtensionLayout.caps);
    port.setQuadlet(caps + TCAT_CAPS_ROUTER, routerCapsQuadlet(image.caps.router));
    port.setQuadlet(caps + TCAT_CAPS_MIXER, mixerCapsQuadlet(image.caps.mixer));
    port.setQuadlet(caps + TCAT_CAPS_GENERAL, generalCapsQuadlet(image.caps.general));

    std::vector<uint8_t> nickname(TCAT_GLOBAL_NICKNAME_SIZE);
    Helpers::buildLabel(image.nickname, nickname.data(), nickname.size());
    port.setBytes(kGlobalOffset + TCAT_GLOBAL_NICKNAME, nickname);
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_CLOCK_SELECT, image.clockSelect);
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_ENABLE, 1);
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_STATUS, TCAT_STATUS_SOURCE_LOCKED | (image.clockSelect & TCAT_CLOCK_RATE_MASK));
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_SAMPLE_RATE, image.sampleRate);
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_VERSION, 0x01000c00);
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_CLOCK_CAPS, image.clockCaps);

    std::vector<uint8_t> names(TCAT_GLOBAL_CLOCK_SOURCE_NAMES_SIZE);
    Helpers::buildLabels(image.clockSourceNames, names.data(), names.size());
    port.setBytes(kGlobalOffset + TCAT_GLOBAL_CLOCK_SOURCE_NAMES, names);

    writeRouterBlock(port, extAddr(kExtensionLayout.currentConfig, TCAT_CURR_CFG_LOW_ROUTER), image.lowRouter);
    writeStreamFormatBlock(port, extAddr(kExtensionLayout.currentConfig, TCAT_CURR_CFG_LOW_STREAM), image.lowFormats);
}

/**
 * @brief Clear the execute flag as soon as a command is written, with the given return value
 */
inline void emulateCommandCompletion(FakeTransactionPort& port, uint32_t returnValue = 0)
{
    uint64_t opcode = extAddr(kExtensionLayout.cmd, TCAT_CMD_OPCODE);
    uint64_t retval = extAddr(kExtensionLayout.cmd, TCAT_CMD_RETURN);
    port.onWrite = [&port, opcode, retval, returnValue](uint64_t offset, const std::vector<uint8_t>&) {
        if (offset != opcode)
            return;
        port.setQuadlet(opcode, port.quadlet(opcode) & ~static_cast<uint32_t>(TCAT_CMD_EXECUTE));
        port.setQuadlet(retval, returnValue);
    };
}

/**
 * @brief Model with eight analog inputs, four analog outputs and two pinned sources
 */
inline ModelSpec analogTestModel()
{
    ModelSpec spec;
    spec.name = "Analog Test";
    spec.vendorId = 0x00130e;
    spec.modelId = 0xf0;
    spec.inputs = {Input{SrcBlkId::Ins0, 0, 8, std::nullopt, false}};
    spec.outputs = {Output{DstBlkId::Ins0, 0, 4, std::nullopt, false}};
    spec.fixed = {{SrcBlkId::Ins0, 0}, {SrcBlkId::Ins0, 1}};
    return spec;
}

} // namespace TCAT::Test
