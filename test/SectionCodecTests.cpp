#include <gtest/gtest.h>
#include "FakeTransactionPort.hpp"
#include "TestDevice.hpp"
#include "TCAT/ExtensionCaps.hpp"
#include "TCAT/RegisterIo.hpp"
#include "TCAT/Sections.hpp"
#include "TCAT/TcatDefines.hpp"
#include <vector>

using namespace TCAT;
using namespace TCAT::Test;

TEST(SectionTableTest, ParsesGeneralSectionsInQuadletUnits) {
    std::vector<uint8_t> raw{
        0x00, 0x00, 0x00, 0x0a, 0x00, 0x00, 0x00, 0x5f,
        0x00, 0x00, 0x00, 0x69, 0x00, 0x00, 0x00, 0x8e,
        0x00, 0x00, 0x00, 0xf7, 0x00, 0x00, 0x01, 0x1a,
        0x00, 0x00, 0x02, 0x11, 0x00, 0x00, 0x00, 0x04,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    };

    auto sections = parseGeneralSections(raw);
    ASSERT_TRUE(sections.has_value());
    EXPECT_EQ(sections->global, (Section{0x28, 0x17c}));
    EXPECT_EQ(sections->txStreamFormat, (Section{0x1a4, 0x238}));
    EXPECT_EQ(sections->rxStreamFormat, (Section{0x3dc, 0x468}));
    EXPECT_EQ(sections->extSync, (Section{0x844, 0x10}));
    EXPECT_EQ(sections->reserved, (Section{0, 0}));
}

TEST(SectionTableTest, ParsesExtensionSections) {
    std::vector<uint8_t> raw(TCAT_EXTENSION_SECTIONS_SIZE, 0);
    for (size_t i = 0; i < TCAT_EXTENSION_SECTION_COUNT; ++i) {
        writeBe32(&raw[i * 8], static_cast<uint32_t>(0x10 * (i + 1)));
        writeBe32(&raw[i * 8 + 4], static_cast<uint32_t>(i + 1));
    }

    auto sections = parseExtensionSections(raw);
    ASSERT_TRUE(sections.has_value());
    EXPECT_EQ(sections->caps, (Section{0x40, 4}));
    EXPECT_EQ(sections->cmd, (Section{0x80, 8}));
    EXPECT_EQ(sections->router, (Section{0x140, 20}));
    EXPECT_EQ(sections->application, (Section{0x240, 36}));
}

TEST(SectionTableTest, ShortTablesAreSectionTableErrors) {
    auto general = parseGeneralSections(std::vector<uint8_t>(36));
    ASSERT_FALSE(general.has_value());
    EXPECT_EQ(general.error().code, ExtensionError::SectionTable);

    auto extension = parseExtensionSections(std::vector<uint8_t>(64));
    ASSERT_FALSE(extension.has_value());
    EXPECT_EQ(extension.error().code, ExtensionError::SectionTable);
}

TEST(SectionTableTest, ReaderWrapsTransportFailures) {
    FakeTransactionPort port;
    RegisterIo io(port);
    SectionTableReader reader(io, 20);

    port.failReads(TransportError::Timeout, TCAT_EXTENSION_OFFSET);
    auto general = reader.readGeneralSections();
    EXPECT_TRUE(general.has_value());

    auto extension = reader.readExtensionSections();
    ASSERT_FALSE(extension.has_value());
    EXPECT_EQ(extension.error(), makeTransportError(ExtensionError::SectionTable, TransportError::Timeout));
}

TEST(ExtensionCapsTest, DecodesCapturedCapabilityBlock) {
    std::vector<uint8_t> raw{0xff, 0x00, 0x00, 0x07, 0x23, 0x12, 0x0c, 0xe7, 0x00, 0x00, 0x1b, 0xa3};

    auto caps = parseExtensionCaps(raw);
    ASSERT_TRUE(caps.has_value());

    EXPECT_TRUE(caps->router.isExposed);
    EXPECT_TRUE(caps->router.isReadonly);
    EXPECT_TRUE(caps->router.isStorable);
    EXPECT_EQ(caps->router.maximumEntryCount, 0xff00);

    EXPECT_TRUE(caps->mixer.isExposed);
    EXPECT_TRUE(caps->mixer.isReadonly);
    EXPECT_TRUE(caps->mixer.isStorable);
    EXPECT_EQ(caps->mixer.inputDeviceId, 0x0e);
    EXPECT_EQ(caps->mixer.outputDeviceId, 0x0c);
    EXPECT_EQ(caps->mixer.inputCount, 0x12);
    EXPECT_EQ(caps->mixer.outputCount, 0x23);

    EXPECT_TRUE(caps->general.dynamicStreamFormat);
    EXPECT_TRUE(caps->general.storageAvail);
    EXPECT_FALSE(caps->general.peakAvail);
    EXPECT_EQ(caps->general.maxTxStreams, 0x0a);
    EXPECT_EQ(caps->general.maxRxStreams, 0x0b);
    EXPECT_TRUE(caps->general.streamFormatIsStorable);
    EXPECT_EQ(caps->general.asicType, AsicType::DiceII);
}

TEST(ExtensionCapsTest, ShortBlockIsCapabilityUnavailable) {
    auto caps = parseExtensionCaps(std::vector<uint8_t>(8));
    ASSERT_FALSE(caps.has_value());
    EXPECT_EQ(caps.error().code, ExtensionError::CapabilityUnavailable);
}

TEST(ExtensionCapsTest, ReaderReadsTheCapsSection) {
    FakeTransactionPort port;
    DeviceImage image;
    image.caps.general.asicType = AsicType::Tcd2210;
    populateDevice(port, image);

    RegisterIo io(port);
    CapabilityReader reader(io, 20);
    auto caps = reader.read(kExtensionLayout);
    ASSERT_TRUE(caps.has_value());
    EXPECT_EQ(*caps, image.caps);
    EXPECT_EQ(port.readCount, 1u);
}

TEST(ExtensionCapsTest, ReaderFailsOnUndersizedSectionWithoutTransaction) {
    FakeTransactionPort port;
    RegisterIo io(port);
    CapabilityReader reader(io, 20);

    ExtensionSections sections = kExtensionLayout;
    sections.caps.size = 8;
    auto caps = reader.read(sections);
    ASSERT_FALSE(caps.has_value());
    EXPECT_EQ(caps.error().code, ExtensionError::CapabilityUnavailable);
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST(ExtensionCapsTest, ReaderWrapsTransportFailure) {
    FakeTransactionPort port;
    port.failReads(TransportError::AddressError);
    RegisterIo io(port);
    CapabilityReader reader(io, 20);

    auto caps = reader.read(kExtensionLayout);
    ASSERT_FALSE(caps.has_value());
    EXPECT_EQ(caps.error(), makeTransportError(ExtensionError::CapabilityUnavailable, TransportError::AddressError));
    EXPECT_EQ(port.readCount, 1u);
}
