#include <gtest/gtest.h>
#include "TCAT/FwCdevTransactionPort.hpp"
#include <vector>

using namespace TCAT;

TEST(FwCdevTransactionPortTest, ClosedPortRejectsRequests) {
    FwCdevTransactionPort port;
    EXPECT_FALSE(port.isOpen());

    auto read = port.read(0x0, 4, 20);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), TransportError::NotOpen);

    auto write = port.write(0x0, std::vector<uint8_t>(8), 20);
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error(), TransportError::NotOpen);
}

TEST(FwCdevTransactionPortTest, InvalidLengthsAreRejected) {
    FwCdevTransactionPort port;

    EXPECT_EQ(port.read(0x0, 0, 20).error(), TransportError::BadArgument);
    EXPECT_EQ(port.read(0x0, 6, 20).error(), TransportError::BadArgument);
    EXPECT_EQ(port.write(0x0, {}, 20).error(), TransportError::BadArgument);
    EXPECT_EQ(port.write(0x0, std::vector<uint8_t>(3), 20).error(), TransportError::BadArgument);
}

TEST(FwCdevTransactionPortTest, MissingDeviceCannotBeOpened) {
    FwCdevTransactionPort port;
    auto res = port.open("/nonexistent/fw0");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), TransportError::NotOpen);
    EXPECT_FALSE(port.isOpen());
}

TEST(FwCdevTransactionPortTest, NonFirewireDeviceFailsInfoQuery) {
    FwCdevTransactionPort port;
    auto res = port.open("/dev/null");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), TransportError::IOError);
    EXPECT_FALSE(port.isOpen());
}

TEST(FwCdevTransactionPortTest, IdentityNeedsConfigurationRom) {
    FwCdevTransactionPort port;
    auto id = port.identity();
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error(), TransportError::NotOpen);
    EXPECT_TRUE(port.configRom().empty());
}
