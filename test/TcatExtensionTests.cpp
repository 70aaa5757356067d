#include <gtest/gtest.h>
#include "FakeTransactionPort.hpp"
#include "TestDevice.hpp"
#include "TCAT/TcatExtension.hpp"
#include <nlohmann/json.hpp>

using namespace TCAT;
using namespace TCAT::Test;

class TcatExtensionTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        FormatEntry tx;
        tx.pcmCount = 8;
        FormatEntry rx;
        rx.pcmCount = 4;
        image.lowFormats.tx = {tx};
        image.lowFormats.rx = {rx};
        image.lowRouter = {
            {kUnusedDstBlk, {SrcBlkId::Ins0, 0}, 0},
            {kUnusedDstBlk, {SrcBlkId::Ins0, 1}, 0},
            {{DstBlkId::Avs0, 0}, {SrcBlkId::Ins0, 2}, 0},
        };

        config.commandPollIntervalMs = 0;
        config.commandPollCount = 3;
    }

    std::unique_ptr<TcatExtension> bootstrapped()
    {
        populateDevice(port, image);
        auto ext = std::make_unique<TcatExtension>(port, analogTestModel(), config);
        auto res = ext->bootstrap();
        EXPECT_TRUE(res.has_value());
        port.resetCounts();
        return ext;
    }

    FakeTransactionPort port;
    DeviceImage image;
    ExtensionConfig config;
};

TEST_F(TcatExtensionTest, BootstrapCachesDeviceState) {
    auto ext = bootstrapped();

    EXPECT_TRUE(ext->isBootstrapped());
    ASSERT_TRUE(ext->caps().has_value());
    EXPECT_EQ(*ext->caps(), image.caps);
    EXPECT_EQ(ext->extensionSections()->router, kExtensionLayout.router);
    EXPECT_EQ(ext->globalParameters()->nickname, "Studio");
    EXPECT_EQ(ext->state().rateMode, RateMode::Low);
    EXPECT_EQ(ext->state().formats, image.lowFormats);
    EXPECT_EQ(ext->state().table, image.lowRouter);
    // 8 analog outputs of the stream plus 4 physical outputs
    EXPECT_EQ(ext->state().available.dsts.size(), 12u);
}

TEST_F(TcatExtensionTest, BootstrapFailureLeavesSessionInvalid) {
    populateDevice(port, image);
    port.failReads(TransportError::Timeout, TCAT_EXTENSION_OFFSET);
    TcatExtension ext(port, analogTestModel(), config);

    auto res = ext.bootstrap();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeTransportError(ExtensionError::SectionTable, TransportError::Timeout));
    EXPECT_FALSE(ext.isBootstrapped());
    EXPECT_FALSE(ext.caps().has_value());
}

TEST_F(TcatExtensionTest, BootstrapRejectsModelOutsideBlockBounds) {
    populateDevice(port, image);
    ModelSpec spec = analogTestModel();
    spec.inputs.push_back(Input{SrcBlkId::Ins1, 250, 10, std::nullopt, false});
    TcatExtension ext(port, spec, config);

    auto res = ext.bootstrap();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::InvalidModelSpec));
    EXPECT_EQ(port.transactionCount(), 0u);
    EXPECT_FALSE(ext.isBootstrapped());
}

TEST_F(TcatExtensionTest, OperationsFailAfterBusResetUntilBootstrap) {
    auto ext = bootstrapped();
    ext->handleBusReset();

    EXPECT_FALSE(ext->isBootstrapped());
    EXPECT_EQ(ext->readGlobalParameters().error(), makeError(ExtensionError::StaleCapabilities));
    EXPECT_EQ(ext->proposeRouting({}).error(), makeError(ExtensionError::StaleCapabilities));
    EXPECT_EQ(ext->readPeakLevels().error(), makeError(ExtensionError::StaleCapabilities));
    EXPECT_EQ(ext->setClockSource(ClockSource::Internal).error(), makeError(ExtensionError::StaleCapabilities));
    EXPECT_EQ(port.transactionCount(), 0u);
    // Cached values stay readable
    EXPECT_TRUE(ext->caps().has_value());

    ASSERT_TRUE(ext->bootstrap().has_value());
    EXPECT_TRUE(ext->readGlobalParameters().has_value());
}

TEST_F(TcatExtensionTest, UnavailableClockSourceIsRejectedBeforeTransaction) {
    auto ext = bootstrapped();

    auto res = ext->setClockSource(ClockSource::WordClock);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::InvalidClockSource));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(TcatExtensionTest, ClockSourceKeepsRate) {
    auto ext = bootstrapped();

    ASSERT_TRUE(ext->setClockSource(ClockSource::Adat).has_value());
    EXPECT_EQ(port.quadlet(kGlobalOffset + TCAT_GLOBAL_CLOCK_SELECT), 0x0205u);
    EXPECT_EQ(ext->globalParameters()->clockConfig, (ClockConfig{ClockRate::R48000, ClockSource::Adat}));
}

TEST_F(TcatExtensionTest, ClockRateMustBeAvailable) {
    auto ext = bootstrapped();

    auto res = ext->setClockRate(ClockRate::R96000);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::BadArgument));
    EXPECT_EQ(port.transactionCount(), 0u);

    ASSERT_TRUE(ext->setClockRate(ClockRate::R44100).has_value());
    EXPECT_EQ(port.quadlet(kGlobalOffset + TCAT_GLOBAL_CLOCK_SELECT), 0x010cu);
}

TEST_F(TcatExtensionTest, ClockRateChangeLoadsNewRateMode) {
    image.clockCaps = 0x10210016; // adds 96 kHz
    auto ext = bootstrapped();
    emulateCommandCompletion(port);

    std::vector<RouterEntry> middle{
        {kUnusedDstBlk, {SrcBlkId::Ins0, 0}, 0},
        {kUnusedDstBlk, {SrcBlkId::Ins0, 1}, 0},
    };
    writeRouterBlock(port, extAddr(kExtensionLayout.currentConfig, TCAT_CURR_CFG_MID_ROUTER), middle);
    // The device reports the new rate once the clock is accepted
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_SAMPLE_RATE, 96000);

    ASSERT_TRUE(ext->setClockRate(ClockRate::R96000).has_value());
    EXPECT_EQ(port.quadlet(kGlobalOffset + TCAT_GLOBAL_CLOCK_SELECT), 0x040cu);
    EXPECT_EQ(ext->state().rateMode, RateMode::Middle);
    EXPECT_EQ(ext->state().table, middle);
    EXPECT_EQ(ext->globalParameters()->clockConfig, (ClockConfig{ClockRate::R96000, ClockSource::Internal}));
    EXPECT_EQ(ext->globalParameters()->currentRate, 96000u);

    auto routing = ext->proposeRouting({});
    ASSERT_TRUE(routing.has_value());
    EXPECT_EQ(routing->rateMode, RateMode::Middle);
    EXPECT_EQ(port.writes.back().second, (std::vector<uint8_t>{0x80, 0x02, 0x00, 0x01}));
}

TEST_F(TcatExtensionTest, ClockRateRefreshFailureKeepsRateState) {
    auto ext = bootstrapped();
    port.failReads(TransportError::Timeout, extAddr(kExtensionLayout.currentConfig));

    auto res = ext->setClockRate(ClockRate::R44100);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ExtensionError::CurrentConfig);
    EXPECT_EQ(ext->state().table, image.lowRouter);
    EXPECT_EQ(ext->globalParameters()->clockConfig, (ClockConfig{ClockRate::R48000, ClockSource::Internal}));
}

TEST_F(TcatExtensionTest, ProposeRoutingWritesRouterAndLoadsIt) {
    auto ext = bootstrapped();
    emulateCommandCompletion(port);

    RoutingAssignments assignments{
        {{DstBlkId::Ins0, 0}, {SrcBlkId::Avs0, 0}},
        {{DstBlkId::Avs0, 3}, {SrcBlkId::Ins0, 5}},
    };
    auto routing = ext->proposeRouting(assignments);
    ASSERT_TRUE(routing.has_value());
    ASSERT_EQ(routing->entries.size(), 4u);

    ASSERT_EQ(port.writes.size(), 2u);
    EXPECT_EQ(port.writes[0].first, extAddr(kExtensionLayout.router));
    EXPECT_EQ(port.quadlet(extAddr(kExtensionLayout.router)), 4u);
    EXPECT_EQ(port.writes[1].first, extAddr(kExtensionLayout.cmd, TCAT_CMD_OPCODE));
    EXPECT_EQ(port.writes[1].second, (std::vector<uint8_t>{0x80, 0x01, 0x00, 0x01}));

    EXPECT_EQ(ext->state().table, routing->entries);
}

TEST_F(TcatExtensionTest, ResolveRoutingWritesNothing) {
    auto ext = bootstrapped();

    auto routing = ext->resolveRouting({{{DstBlkId::Ins0, 0}, {SrcBlkId::Avs0, 0}}});
    ASSERT_TRUE(routing.has_value());
    EXPECT_EQ(routing->entries.size(), 3u);
    EXPECT_EQ(port.transactionCount(), 0u);
    EXPECT_EQ(ext->state().table, image.lowRouter);

    ext->handleBusReset();
    EXPECT_EQ(ext->resolveRouting({}).error(), makeError(ExtensionError::StaleCapabilities));
}

TEST_F(TcatExtensionTest, ReadonlyRouterIsUnavailable) {
    image.caps.router.isReadonly = true;
    auto ext = bootstrapped();

    auto res = ext->proposeRouting({});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::FeatureUnavailable));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(TcatExtensionTest, FailedRouterWriteKeepsCachedTable) {
    auto ext = bootstrapped();
    port.failWrites(TransportError::Busy);

    auto res = ext->proposeRouting({{{DstBlkId::Ins0, 0}, {SrcBlkId::Avs0, 0}}});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeTransportError(ExtensionError::RouterSection, TransportError::Busy));
    EXPECT_EQ(ext->state().table, image.lowRouter);
}

TEST_F(TcatExtensionTest, CommandTimeoutKeepsCachedTable) {
    auto ext = bootstrapped();

    auto res = ext->proposeRouting({{{DstBlkId::Ins0, 0}, {SrcBlkId::Avs0, 0}}});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeTransportError(ExtensionError::CmdSection, TransportError::Timeout));
    EXPECT_EQ(ext->state().table, image.lowRouter);
}

TEST_F(TcatExtensionTest, ProposeStreamFormatsWritesSectionAndLoadsIt) {
    image.caps.general.dynamicStreamFormat = true;
    auto ext = bootstrapped();
    emulateCommandCompletion(port);

    StreamFormats formats = image.lowFormats;
    formats.tx[0].pcmCount = 2;
    ASSERT_TRUE(ext->proposeStreamFormats(formats).has_value());

    EXPECT_EQ(port.writes.front().first, extAddr(kExtensionLayout.streamFormat));
    EXPECT_EQ(port.quadlet(extAddr(kExtensionLayout.streamFormat, 8)), 2u);
    EXPECT_EQ(port.writes.back().first, extAddr(kExtensionLayout.cmd, TCAT_CMD_OPCODE));
    EXPECT_EQ(port.writes.back().second, (std::vector<uint8_t>{0x80, 0x01, 0x00, 0x02}));

    EXPECT_EQ(ext->state().formats, formats);
    // 2 analog outputs of the stream plus 4 physical outputs
    EXPECT_EQ(ext->state().available.dsts.size(), 6u);
}

TEST_F(TcatExtensionTest, StreamFormatsNeedDynamicCapability) {
    auto ext = bootstrapped();

    auto res = ext->proposeStreamFormats(image.lowFormats);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::FeatureUnavailable));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(TcatExtensionTest, StreamFormatCommandTimeoutKeepsCachedFormats) {
    image.caps.general.dynamicStreamFormat = true;
    auto ext = bootstrapped();

    StreamFormats formats = image.lowFormats;
    formats.tx[0].pcmCount = 2;
    auto res = ext->proposeStreamFormats(formats);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeTransportError(ExtensionError::CmdSection, TransportError::Timeout));
    EXPECT_EQ(ext->state().formats, image.lowFormats);
}

TEST_F(TcatExtensionTest, ProposeConfigurationResolvesAgainstNewFormats) {
    image.caps.general.dynamicStreamFormat = true;
    auto ext = bootstrapped();
    emulateCommandCompletion(port);

    StreamFormats formats = image.lowFormats;
    formats.tx[0].pcmCount = 2;
    RoutingAssignments assignments{
        {{DstBlkId::Avs0, 1}, {SrcBlkId::Ins0, 3}},
        {{DstBlkId::Avs0, 5}, {SrcBlkId::Ins0, 4}},
    };

    auto routing = ext->proposeConfiguration(assignments, formats);
    ASSERT_TRUE(routing.has_value());
    EXPECT_EQ(routing->entries.size(), 3u);
    ASSERT_EQ(routing->dropped.size(), 1u);
    EXPECT_EQ(routing->dropped[0].dst, (DstBlk{DstBlkId::Avs0, 5}));

    EXPECT_EQ(port.quadlet(extAddr(kExtensionLayout.router)), 3u);
    EXPECT_EQ(port.quadlet(extAddr(kExtensionLayout.streamFormat, 8)), 2u);
    EXPECT_EQ(port.writes.back().second, (std::vector<uint8_t>{0x80, 0x01, 0x00, 0x03}));
    EXPECT_EQ(ext->state().formats, formats);
    EXPECT_EQ(ext->state().table, routing->entries);
}

TEST_F(TcatExtensionTest, ProposeConfigurationNeedsWritableRouter) {
    image.caps.general.dynamicStreamFormat = true;
    image.caps.router.isReadonly = true;
    auto ext = bootstrapped();

    auto res = ext->proposeConfiguration({}, image.lowFormats);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::FeatureUnavailable));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(TcatExtensionTest, PeaksPairWithCachedTable) {
    auto ext = bootstrapped();
    port.setQuadlet(extAddr(kExtensionLayout.peak, 8), 0x0400ff2b);

    auto levels = ext->readPeakLevels();
    ASSERT_TRUE(levels.has_value());
    ASSERT_EQ(levels->size(), 3u);
    EXPECT_EQ((*levels)[2], (PeakLevel{{SrcBlkId::Ins0, 2}, {DstBlkId::Avs0, 0}, 0x0400}));
}

TEST_F(TcatExtensionTest, PeaksNeedCapability) {
    image.caps.general.peakAvail = false;
    auto ext = bootstrapped();

    auto levels = ext->readPeakLevels();
    ASSERT_FALSE(levels.has_value());
    EXPECT_EQ(levels.error(), makeError(ExtensionError::FeatureUnavailable));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(TcatExtensionTest, RateChangeNotificationReloadsConfiguration) {
    auto ext = bootstrapped();

    std::vector<RouterEntry> middle{
        {kUnusedDstBlk, {SrcBlkId::Ins0, 0}, 0},
        {kUnusedDstBlk, {SrcBlkId::Ins0, 1}, 0},
    };
    writeRouterBlock(port, extAddr(kExtensionLayout.currentConfig, TCAT_CURR_CFG_MID_ROUTER), middle);
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_SAMPLE_RATE, 96000);

    ASSERT_TRUE(ext->handleNotification(TCAT_NOTIFY_CLOCK_ACCEPTED).has_value());
    EXPECT_EQ(ext->state().rateMode, RateMode::Middle);
    EXPECT_EQ(ext->state().table, middle);
    EXPECT_TRUE(ext->state().formats.tx.empty());
    EXPECT_EQ(ext->globalParameters()->currentRate, 96000u);
}

TEST_F(TcatExtensionTest, PolledNotificationIsHandled) {
    auto ext = bootstrapped();
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_NOTIFICATION, TCAT_NOTIFY_CLOCK_ACCEPTED);
    port.setQuadlet(kGlobalOffset + TCAT_GLOBAL_SAMPLE_RATE, 176400);

    auto bits = ext->pollNotification();
    ASSERT_TRUE(bits.has_value());
    EXPECT_EQ(*bits, static_cast<uint32_t>(TCAT_NOTIFY_CLOCK_ACCEPTED));
    EXPECT_EQ(ext->state().rateMode, RateMode::High);
    EXPECT_EQ(ext->globalParameters()->currentRate, 176400u);
}

TEST_F(TcatExtensionTest, UnrelatedNotificationIsIgnored) {
    auto ext = bootstrapped();
    ASSERT_TRUE(ext->handleNotification(0x00010000).has_value());
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(TcatExtensionTest, FlashCommands) {
    auto ext = bootstrapped();
    emulateCommandCompletion(port);

    std::vector<RouterEntry> stored{{kUnusedDstBlk, {SrcBlkId::Ins0, 0}, 0}, {kUnusedDstBlk, {SrcBlkId::Ins0, 1}, 0}};
    writeRouterBlock(port, extAddr(kExtensionLayout.currentConfig, TCAT_CURR_CFG_LOW_ROUTER), stored);

    ASSERT_TRUE(ext->loadConfigFromFlash().has_value());
    EXPECT_EQ(ext->state().table, stored);
    ASSERT_TRUE(ext->storeConfigToFlash().has_value());
    EXPECT_EQ(port.quadlet(extAddr(kExtensionLayout.cmd, TCAT_CMD_OPCODE)), 0x00000005u);
}

TEST_F(TcatExtensionTest, NonZeroReturnIsCommandFailure) {
    auto ext = bootstrapped();
    emulateCommandCompletion(port, 1);

    auto res = ext->storeConfigToFlash();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), makeError(ExtensionError::CommandFailed));
}

TEST_F(TcatExtensionTest, MissingStorageCapability) {
    image.caps.general.storageAvail = false;
    auto ext = bootstrapped();

    EXPECT_EQ(ext->loadConfigFromFlash().error(), makeError(ExtensionError::FeatureUnavailable));
    EXPECT_EQ(port.transactionCount(), 0u);
}

TEST_F(TcatExtensionTest, CurrentRoutingIsDecoded) {
    auto ext = bootstrapped();

    auto routing = ext->readCurrentRouting();
    ASSERT_TRUE(routing.has_value());
    ASSERT_EQ(routing->routes.size(), 3u);
    EXPECT_TRUE(routing->routes[0].isRaw());
    EXPECT_EQ(routing->routes[2].srcLabel, "Analog-A-3");
    EXPECT_EQ(routing->routes[2].dstLabel, "Stream-1");
}

TEST_F(TcatExtensionTest, OptionalBlocksTakeEffectOnNextResolution) {
    ModelSpec spec = analogTestModel();
    spec.outputs.push_back(Output{DstBlkId::Aes, 0, 2, std::nullopt, true});
    populateDevice(port, image);
    TcatExtension ext(port, spec, config);
    ASSERT_TRUE(ext.bootstrap().has_value());
    emulateCommandCompletion(port);

    RoutingAssignments assignments{{{DstBlkId::Aes, 0}, {SrcBlkId::Avs0, 0}}};
    auto absent = ext.proposeRouting(assignments);
    ASSERT_TRUE(absent.has_value());
    EXPECT_EQ(absent->dropped.size(), 1u);

    PresentBlocks present;
    present.outputs.insert(DstBlkId::Aes);
    ext.setPresentBlocks(present);
    auto installed = ext.proposeRouting(assignments);
    ASSERT_TRUE(installed.has_value());
    EXPECT_TRUE(installed->dropped.empty());
    EXPECT_EQ(installed->entries.size(), 3u);
}

TEST_F(TcatExtensionTest, ApplicationAndStandaloneAccess) {
    auto ext = bootstrapped();

    ASSERT_TRUE(ext->writeApplication(0, {0xde, 0xad, 0xbe, 0xef}).has_value());
    EXPECT_EQ(ext->readApplication(0, 4).value(), (std::vector<uint8_t>{0xde, 0xad, 0xbe, 0xef}));
    EXPECT_EQ(ext->readApplication(0x100, 4).error(), makeError(ExtensionError::BadArgument));

    StandaloneParameters params{0x0c, 0, 0, 0, 0x02};
    ASSERT_TRUE(ext->writeStandalone(params).has_value());
    EXPECT_EQ(ext->readStandalone().value(), params);
}

TEST_F(TcatExtensionTest, NicknameUpdatesCache) {
    auto ext = bootstrapped();
    ASSERT_TRUE(ext->setNickname("Rack A").has_value());
    EXPECT_EQ(ext->globalParameters()->nickname, "Rack A");

    EXPECT_EQ(ext->setNickname(std::string(80, 'x')).error(), makeError(ExtensionError::BadArgument));
    EXPECT_EQ(ext->globalParameters()->nickname, "Rack A");
}

TEST_F(TcatExtensionTest, JsonSnapshot) {
    auto ext = bootstrapped();
    auto j = ext->toJson();

    EXPECT_EQ(j["model"], "Analog Test");
    EXPECT_EQ(j["bootstrapped"], true);
    EXPECT_TRUE(j.contains("caps"));
    EXPECT_TRUE(j.contains("global"));
    EXPECT_EQ(j["rateMode"], rateModeToString(RateMode::Low));
    EXPECT_EQ(j["routing"]["routes"].size(), 3u);
}
