#include <gtest/gtest.h>
#include "xbee_io_device.hpp"
#include "logger.hpp"

#include <type_traits>
#include <utility>
#include <vector>

class RecordingSender : public RemoteAtSender {
public:
    bool sendRemoteAt(const RemoteCommand& command) override {
        sent.push_back(command);
        return accept;
    }
    std::vector<RemoteCommand> sent;
    bool accept = true;
};

static IoFrame ioSampleFrame(const std::vector<uint8_t>& payload) {
    IoFrame frame;
    frame.tsn = 0x10;
    frame.frame_type = IoFrameRouter::FRAME_TYPE_CLUSTER;
    frame.is_reply = false;
    frame.command_id = IO_SAMPLE_COMMAND;
    frame.payload = payload;
    return frame;
}

class XBeeIoDeviceTest : public ::testing::Test {
protected:
    XBeeIoDeviceTest() : device_(config_, &sender_) {
        device_.onEndpointUpdate([this](const PinUpdate& update) {
            updates_.push_back(update);
        });
        device_.onPassthroughCommand([this](EndpointId endpoint, uint16_t command) {
            passthrough_.push_back(std::make_pair(endpoint, command));
        });
    }

    ConfigManager config_;
    RecordingSender sender_;
    XBeeIoDevice device_;
    std::vector<PinUpdate> updates_;
    std::vector<std::pair<EndpointId, uint16_t>> passthrough_;
};

TEST_F(XBeeIoDeviceTest, SampleUpdatesEndpoints) {
    // Pins 0 and 10 enabled, pin 10 high
    FrameRouteResult result = device_.onFrame(ioSampleFrame({0x04, 0x01, 0x00, 0x04, 0x00}));
    EXPECT_EQ(result.status, FrameRouteStatus::DECODED);

    std::vector<PinUpdate> expected = {{0xD0, 0}, {0xDA, 1}};
    EXPECT_EQ(updates_, expected);
}

TEST_F(XBeeIoDeviceTest, MalformedSampleUpdatesNothing) {
    FrameRouteResult result = device_.onFrame(ioSampleFrame({0x04, 0x01, 0x00}));
    EXPECT_EQ(result.status, FrameRouteStatus::MALFORMED_SAMPLE);
    EXPECT_TRUE(updates_.empty());
}

TEST_F(XBeeIoDeviceTest, UnknownCommandUpdatesNothing) {
    IoFrame frame = ioSampleFrame({0x00, 0x01, 0x00, 0x00, 0x01});
    frame.frame_type = IoFrameRouter::FRAME_TYPE_GENERAL;
    FrameRouteResult result = device_.onFrame(frame);
    EXPECT_EQ(result.status, FrameRouteStatus::UNKNOWN_COMMAND);
    EXPECT_TRUE(updates_.empty());
}

TEST_F(XBeeIoDeviceTest, OnCommandSendsRemoteAt) {
    PinCommandResult result = device_.setPinState(0xD3, 1);
    ASSERT_TRUE(result.isAccepted());
    ASSERT_EQ(sender_.sent.size(), 1u);
    EXPECT_EQ(sender_.sent[0].pin_name, "D3");
    EXPECT_EQ(sender_.sent[0].opcode, DIO_PIN_HIGH);
    EXPECT_TRUE(sender_.sent[0].apply_changes);
    EXPECT_TRUE(sender_.sent[0].encrypted);
    EXPECT_TRUE(passthrough_.empty());
}

TEST_F(XBeeIoDeviceTest, RejectedSendStillAccepted) {
    sender_.accept = false;
    PinCommandResult result = device_.setPinState(0xD3, 0);
    EXPECT_TRUE(result.isAccepted());
    ASSERT_EQ(sender_.sent.size(), 1u);
    EXPECT_EQ(sender_.sent[0].opcode, DIO_PIN_LOW);
}

TEST_F(XBeeIoDeviceTest, NonPinCommandIsPassedThrough) {
    PinCommandResult result = device_.setPinState(0xD3, 2);
    EXPECT_EQ(result.status, PinCommandStatus::UNSUPPORTED_COMMAND);
    EXPECT_TRUE(sender_.sent.empty());
    ASSERT_EQ(passthrough_.size(), 1u);
    EXPECT_EQ(passthrough_[0].first, 0xD3);
    EXPECT_EQ(passthrough_[0].second, 2);
}

TEST_F(XBeeIoDeviceTest, UnknownEndpointIsPassedThrough) {
    PinCommandResult result = device_.setPinState(0x9999, 1);
    EXPECT_EQ(result.status, PinCommandStatus::UNSUPPORTED_ENDPOINT);
    EXPECT_TRUE(sender_.sent.empty());
    ASSERT_EQ(passthrough_.size(), 1u);
    EXPECT_EQ(passthrough_[0].first, 0x9999);
}

TEST(XBeeIoDevice, WithoutSenderCommandIsStillAccepted) {
    ConfigManager config;
    XBeeIoDevice device(config);
    PinCommandResult result = device.setPinState(0xDA, 1);
    EXPECT_TRUE(result.isAccepted());
    EXPECT_EQ(result.remote.pin_name, "P0");
}

TEST(XBeeIoDevice, WithoutCallbacksFramesAreHandled) {
    ConfigManager config;
    XBeeIoDevice device(config);
    FrameRouteResult result = device.onFrame(ioSampleFrame({0x00, 0x01, 0x00, 0x00, 0x01}));
    EXPECT_EQ(result.status, FrameRouteStatus::DECODED);
    EXPECT_EQ(device.setPinState(0xD0, 7).status, PinCommandStatus::UNSUPPORTED_COMMAND);
}

TEST(XBeeIoDevice, IsNotCopyable) {
    EXPECT_FALSE(std::is_copy_constructible<XBeeIoDevice>::value);
    EXPECT_FALSE(std::is_copy_assignable<XBeeIoDevice>::value);
}

TEST_F(XBeeIoDeviceTest, HeaderFallbackFrameUpdatesEndpoints) {
    // Report 00 03 00 00 01 split by the header parser into tsn 00, command 03
    IoFrame frame = ioSampleFrame({0x00, 0x00, 0x01});
    frame.tsn = 0x00;
    frame.command_id = 0x03;
    FrameRouteResult result = device_.onFrame(frame);
    EXPECT_EQ(result.status, FrameRouteStatus::DECODED);

    std::vector<PinUpdate> expected = {{0xD0, 1}, {0xD1, 0}};
    EXPECT_EQ(updates_, expected);
}

TEST(XBeeIoDevice, AppliesLoggingConfig) {
    ConfigManager config("{\"logging\":{\"log_level\":\"ERROR\"}}");
    XBeeIoDevice device(config);
    EXPECT_EQ(Logger::level(), Logger::ERROR);

    ConfigManager defaults;
    XBeeIoDevice restored(defaults);
    EXPECT_EQ(Logger::level(), Logger::INFO);
}
