#include <gtest/gtest.h>
#include "FakeTransactionPort.hpp"
#include "TestDevice.hpp"
#include "TCAT/ApplicationSection.hpp"
#include "TCAT/CurrentConfigSection.hpp"
#include "TCAT/PeakSection.hpp"
#include "TCAT/RouterSection.hpp"
#include "TCAT/StandaloneSection.hpp"
#include "TCAT/StreamFormatEntry.hpp"
#include <vector>

using namespace TCAT;
using namespace TCAT::Test;

class SectionProtocolTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        populateDevice(port, image);
        port.resetCounts();
    }

    FakeTransactionPort port;
    DeviceImage image;
    RegisterIo io{port};
};

TEST_F(SectionProtocolTest, RouterWriteIsOneBlockWithCount) {
    RouterSectionProtocol router(io, kExtensionLayout, image.caps, 20);
    std::vector<RouterEntry> entries{
        {{DstBlkId::Avs0, 0}, {SrcBlkId::Ins0, 0}, 0},
        {{DstBlkId::Ins0, 0}, {SrcBlkId::Avs0, 0}, 0},
        {{DstBlkId::Ins0, 1}, {SrcBlkId::Avs0, 1}, 0},
    };

    ASSERT_TRUE(router.write(entries).has_value());
    ASSERT_EQ(port.writes.size(), 1u);
    EXPECT_EQ(port.writes[0].first, extAddr(kExtensionLayout.router));
    EXPECT_EQ(port.writes[0].second.size(), 16u);
    EXPECT_EQ(port.quadlet(extAddr(kExtensionLayout.router)), 3u);

    auto readBack = router.read();
    ASSERT_TRUE(readBack.has_value());
    EXPECT_EQ(*readBack, entries);
}

TEST_F(SectionProtocolTest, RouterWriteOverCapacityIsRejectedBeforeTransaction) {
    image.caps.router.maximumEntryCount = 2;
    RouterSectionProtocol router(io, kExtensionLayout, image.caps, 20);
    std::vector<RouterEntry> entries(3, RouterEntry{{DstBlkId::Ins0, 0}, {SrcBlkId::Avs0, 0}, 0});

    auto res = router.write(entries);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::RoutingCapacityExceeded));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(SectionProtocolTest, EmptyRouterTableNeedsOnlyTheCount) {
    RouterSectionProtocol router(io, kExtensionLayout, image.caps, 20);
    auto entries = router.read();
    ASSERT_TRUE(entries.has_value());
    EXPECT_TRUE(entries->empty());
    EXPECT_EQ(port.readCount, 1u);
}

TEST_F(SectionProtocolTest, RouterCountAboveCapabilityIsMalformed) {
    port.setQuadlet(extAddr(kExtensionLayout.router), 17);
    RouterSectionProtocol router(io, kExtensionLayout, image.caps, 20);
    auto entries = router.read();
    ASSERT_FALSE(entries.has_value());
    EXPECT_EQ(entries.error().code, ExtensionError::MalformedEntry);
}

TEST_F(SectionProtocolTest, RouterWriteFailureIsWrapped) {
    port.failWrites(TransportError::Busy);
    RouterSectionProtocol router(io, kExtensionLayout, image.caps, 20);
    auto res = router.write({});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeTransportError(ExtensionError::RouterSection, TransportError::Busy));
}

TEST_F(SectionProtocolTest, PeaksRequireCapability) {
    image.caps.general.peakAvail = false;
    PeakSectionReader reader(io, kExtensionLayout, image.caps, 20);

    auto peaks = reader.read();
    ASSERT_FALSE(peaks.has_value());
    EXPECT_EQ(peaks.error(), makeError(ExtensionError::FeatureUnavailable));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(SectionProtocolTest, PeaksReadMaximumEntryCount) {
    port.setQuadlet(extAddr(kExtensionLayout.peak), 0x07ff40b0);
    port.setQuadlet(extAddr(kExtensionLayout.peak) + 4, 0xfffe40b1);
    PeakSectionReader reader(io, kExtensionLayout, image.caps, 20);

    auto peaks = reader.read();
    ASSERT_TRUE(peaks.has_value());
    ASSERT_EQ(peaks->size(), 16u);
    EXPECT_EQ((*peaks)[0].peak, 0x07ff);
    EXPECT_EQ((*peaks)[1].peak, 0xfffe);
    EXPECT_EQ(port.reads.size(), 1u);
    EXPECT_EQ(port.reads[0].second, 64u);
}

TEST(PeakAssociationTest, PeaksFollowTableOrder) {
    std::vector<RouterEntry> table{
        {{DstBlkId::Avs0, 0}, {SrcBlkId::Ins0, 0}, 0},
        {{DstBlkId::Ins0, 0}, {SrcBlkId::Avs0, 0}, 0},
    };
    std::vector<RouterEntry> peaks{
        {{DstBlkId::Aes, 0}, {SrcBlkId::Aes, 0}, 0x100},
        {{DstBlkId::Aes, 0}, {SrcBlkId::Aes, 0}, 0x200},
        {{DstBlkId::Aes, 0}, {SrcBlkId::Aes, 0}, 0x300},
    };

    auto levels = associatePeaks(peaks, table);
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0], (PeakLevel{{SrcBlkId::Ins0, 0}, {DstBlkId::Avs0, 0}, 0x100}));
    EXPECT_EQ(levels[1], (PeakLevel{{SrcBlkId::Avs0, 0}, {DstBlkId::Ins0, 0}, 0x200}));
}

TEST_F(SectionProtocolTest, CurrentConfigUsesRateModeBlocks) {
    std::vector<RouterEntry> middle{{{DstBlkId::Ins0, 2}, {SrcBlkId::Avs0, 2}, 0}};
    writeRouterBlock(port, extAddr(kExtensionLayout.currentConfig, TCAT_CURR_CFG_MID_ROUTER), middle);

    CurrentConfigSection config(io, kExtensionLayout, image.caps, 20);
    auto entries = config.readRouterEntries(RateMode::Middle);
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ(*entries, middle);
    EXPECT_EQ(port.reads[0].first, extAddr(kExtensionLayout.currentConfig, 0x2000));

    EXPECT_EQ(CurrentConfigSection::routerOffset(RateMode::High), 0x4000u);
    EXPECT_EQ(CurrentConfigSection::streamFormatOffset(RateMode::Low), 0x1000u);
    EXPECT_EQ(CurrentConfigSection::streamFormatOffset(RateMode::High), 0x5000u);
}

TEST_F(SectionProtocolTest, CurrentStreamFormats) {
    StreamFormats formats;
    FormatEntry tx;
    tx.pcmCount = 8;
    tx.labels = {"Mic-1", "Mic-2"};
    FormatEntry rx;
    rx.pcmCount = 4;
    formats.tx = {tx};
    formats.rx = {rx};
    writeStreamFormatBlock(port, extAddr(kExtensionLayout.currentConfig, TCAT_CURR_CFG_HIGH_STREAM), formats);

    CurrentConfigSection config(io, kExtensionLayout, image.caps, 20);
    auto read = config.readStreamFormats(RateMode::High);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, formats);

    port.failReads(TransportError::Timeout);
    auto failed = config.readStreamFormats(RateMode::Low);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), makeTransportError(ExtensionError::CurrentConfig, TransportError::Timeout));
}

TEST_F(SectionProtocolTest, StreamFormatWriteNeedsDynamicFormats) {
    StreamFormatSectionProtocol protocol(io, kExtensionLayout, image.caps, 20);
    StreamFormats formats{{FormatEntry{}}, {FormatEntry{}}};

    auto res = protocol.write(formats);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::FeatureUnavailable));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(SectionProtocolTest, StreamFormatWriteNeedsFullDirections) {
    image.caps.general.dynamicStreamFormat = true;
    StreamFormatSectionProtocol protocol(io, kExtensionLayout, image.caps, 20);

    auto res = protocol.write(StreamFormats{{FormatEntry{}}, {}});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::BadArgument));
    EXPECT_EQ(port.transactionCount(), 0u);

    FormatEntry entry;
    entry.pcmCount = 2;
    entry.labels = {"L", "R"};
    StreamFormats formats{{entry}, {entry}};
    ASSERT_TRUE(protocol.write(formats).has_value());

    auto read = protocol.read();
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, formats);
}

TEST_F(SectionProtocolTest, ApplicationAccessStaysInsideSection) {
    ApplicationSection appl(io, kExtensionLayout, 20);

    std::vector<uint8_t> data{1, 2, 3, 4, 5, 6, 7, 8};
    ASSERT_TRUE(appl.write(0xf8, data).has_value());
    EXPECT_EQ(port.bytes(extAddr(kExtensionLayout.application, 0xf8), 8), data);

    auto read = appl.read(0xf8, 8);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, data);

    port.resetCounts();
    auto outside = appl.read(0xfc, 8);
    ASSERT_FALSE(outside.has_value());
    EXPECT_EQ(outside.error(), makeError(ExtensionError::BadArgument));
    auto unaligned = appl.write(0x02, data);
    ASSERT_FALSE(unaligned.has_value());
    EXPECT_EQ(unaligned.error(), makeError(ExtensionError::BadArgument));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(SectionProtocolTest, ApplicationFailureIsWrapped) {
    port.failReads(TransportError::AddressError);
    ApplicationSection appl(io, kExtensionLayout, 20);

    auto read = appl.read(0, 4);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), makeTransportError(ExtensionError::ApplSection, TransportError::AddressError));
}

TEST_F(SectionProtocolTest, StandaloneParameters) {
    StandaloneSection standalone(io, kExtensionLayout, 20);
    StandaloneParameters params{0x05, 0x01, 0x02, 0x00010000, 0x07};

    ASSERT_TRUE(standalone.write(params).has_value());
    ASSERT_EQ(port.writes.size(), 1u);
    EXPECT_EQ(port.writes[0].second.size(), static_cast<size_t>(TCAT_STANDALONE_SIZE));

    auto read = standalone.read();
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, params);
}

TEST_F(SectionProtocolTest, SmallStandaloneSectionIsRejected) {
    ExtensionSections sections = kExtensionLayout;
    sections.standalone.size = 8;
    StandaloneSection standalone(io, sections, 20);

    auto read = standalone.read();
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), makeError(ExtensionError::StandaloneSection));
    EXPECT_EQ(port.transactionCount(), 0u);
}
