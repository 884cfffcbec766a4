#include "fake_gateway.hpp"
#include "homeduino_client.hpp"
#include "homeduino_error.hpp"
#include "test_support.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

class HomeduinoClientTest : public ::testing::Test
{
protected:
    std::shared_ptr<FakeGateway> gateway = std::make_shared<FakeGateway>();
    std::shared_ptr<FakeCodec> codec = std::make_shared<FakeCodec>();
    ClientSettings settings = fastSettings();
    std::unique_ptr<HomeduinoClient> client;

    HomeduinoClient &makeClient()
    {
        auto gw = gateway;
        client = std::make_unique<HomeduinoClient>(settings, codec, [gw]{ return gw; });
        return *client;
    }
};

TEST_F(HomeduinoClientTest, ConnectsAndEnablesReceiveInterrupt)
{
    auto &c = makeClient();
    EXPECT_EQ(c.state(), ConnectionState::Disconnected);
    ASSERT_TRUE(c.connect(false));
    EXPECT_TRUE(c.isConnected());
    EXPECT_TRUE(c.isReady());
    EXPECT_EQ(c.state(), ConnectionState::Ready);
    ASSERT_FALSE(gateway->commands().empty());
    EXPECT_EQ(gateway->commands().front(), "RF receive 0");
    EXPECT_FALSE(c.supervisorRunning());
}

TEST_F(HomeduinoClientTest, PassesSerialSettingsToTransport)
{
    settings.baudRate = 57600;
    settings.parity = Parity::Odd;
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_EQ(gateway->lastSettings().baudRate, 57600);
    EXPECT_EQ(gateway->lastSettings().parity, Parity::Odd);
}

TEST_F(HomeduinoClientTest, SecondConnectIsRejected)
{
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_FALSE(c.connect(false));
    EXPECT_EQ(gateway->opens(), 1);
}

TEST_F(HomeduinoClientTest, OpenFailureReturnsFalse)
{
    gateway->failOpen = true;
    auto &c = makeClient();
    EXPECT_FALSE(c.connect(false));
    EXPECT_FALSE(c.isConnected());
    EXPECT_EQ(c.state(), ConnectionState::Disconnected);
}

TEST_F(HomeduinoClientTest, SilentDeviceTimesOut)
{
    gateway->announceReady = false;
    gateway->answerPing = false;
    auto &c = makeClient();
    EXPECT_THROW(c.connect(false), ResponseTimeoutError);
    EXPECT_FALSE(c.isConnected());
    EXPECT_FALSE(c.awaitingResponse());
    EXPECT_FALSE(gateway->isOpen());
}

TEST_F(HomeduinoClientTest, PingProbeStandsInForMissingReady)
{
    gateway->announceReady = false;
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_TRUE(c.isReady());
    EXPECT_EQ(gateway->countCommands("PING "), 1u);
    EXPECT_EQ(gateway->countCommands("RF receive 0"), 1u);
}

TEST_F(HomeduinoClientTest, RefusedReceiveInterruptFailsConnect)
{
    gateway->setResponder([](const std::string &command) -> std::optional<std::vector<std::string>> {
        if (hdcmd::startsWith(command, "RF receive"))
            return std::vector<std::string>{"ERR invalid interrupt"};
        return std::nullopt;
    });
    auto &c = makeClient();
    EXPECT_FALSE(c.connect(false));
    EXPECT_FALSE(c.isConnected());
}

TEST_F(HomeduinoClientTest, NoReceivePinSkipsInterrupt)
{
    settings.receivePin.reset();
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_EQ(gateway->countCommands("RF receive"), 0u);
}

TEST_F(HomeduinoClientTest, RfSendBuildsPaddedCommand)
{
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_TRUE(c.rfSend("switch1", {{"state", "on"}}));
    EXPECT_EQ(gateway->commands().back(), "RF send 4 3 260 2680 1275 10550 0 0 0 0 0201");
}

TEST_F(HomeduinoClientTest, RfSendRefusalReturnsFalse)
{
    gateway->setResponder([](const std::string &command) -> std::optional<std::vector<std::string>> {
        if (hdcmd::startsWith(command, "RF send"))
            return std::vector<std::string>{"ERR busy"};
        return std::nullopt;
    });
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_FALSE(c.rfSend("switch1", {{"state", "off"}}));
}

TEST_F(HomeduinoClientTest, RfSendWithoutSendPin)
{
    settings.sendPin.reset();
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_FALSE(c.rfSend("switch1", {{"state", "on"}}));
    EXPECT_EQ(gateway->countCommands("RF send"), 0u);
}

TEST_F(HomeduinoClientTest, RfSendUnknownProtocolThrows)
{
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_THROW(c.rfSend("doorbell7", {}), std::invalid_argument);
}

TEST_F(HomeduinoClientTest, RfSendsAreSpacedByInterval)
{
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    ASSERT_TRUE(c.rfSend("switch1", {{"state", "on"}}));
    ASSERT_TRUE(c.rfSend("switch1", {{"state", "off"}}));

    std::vector<FakeGateway::Written> sends;
    for (const auto &w : gateway->written())
        if (hdcmd::startsWith(w.command, "RF send")) sends.push_back(w);
    ASSERT_EQ(sends.size(), 2u);
    EXPECT_GE(sends[1].at - sends[0].at, std::chrono::milliseconds(settings.rfSendIntervalMs));
}

TEST_F(HomeduinoClientTest, PingEchoesToken)
{
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_TRUE(c.ping());

    gateway->answerPing = false;
    EXPECT_THROW(c.ping(), ResponseTimeoutError);
    EXPECT_FALSE(c.awaitingResponse());
}

TEST_F(HomeduinoClientTest, PinOperations)
{
    gateway->setDigital(7, 1);
    gateway->setAnalog(3, 512);
    gateway->setDht(5, "ACK 23.5 51.0");
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));

    EXPECT_TRUE(c.pinMode(7, PinMode::Output));
    EXPECT_EQ(gateway->commands().back(), "PM 7 1");
    EXPECT_TRUE(c.digitalWrite(7, true));
    EXPECT_EQ(gateway->commands().back(), "DW 7 1");
    EXPECT_FALSE(c.isPinBusy(7));
    EXPECT_EQ(c.digitalRead(7), std::optional<int>(1));
    EXPECT_EQ(c.analogRead(3), std::optional<int>(512));

    auto reading = c.dhtRead(DhtType::Dht22, 5);
    ASSERT_TRUE(reading.has_value());
    EXPECT_DOUBLE_EQ(reading->temperature, 23.5);
    EXPECT_DOUBLE_EQ(reading->humidity, 51.0);
    EXPECT_EQ(gateway->commands().back(), "DHT 22 5");
}

TEST_F(HomeduinoClientTest, DeviceErrorsYieldEmptyResults)
{
    gateway->setResponder([](const std::string &command) -> std::optional<std::vector<std::string>> {
        if (hdcmd::startsWith(command, "RF")) return std::nullopt;
        return std::vector<std::string>{"ERR invalid pin"};
    });
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    EXPECT_FALSE(c.pinMode(99, PinMode::Input));
    EXPECT_FALSE(c.digitalWrite(99, false));
    EXPECT_FALSE(c.digitalRead(99).has_value());
    EXPECT_FALSE(c.analogRead(99).has_value());
    EXPECT_FALSE(c.dhtRead(DhtType::Dht11, 99).has_value());
}

TEST_F(HomeduinoClientTest, CommandsBeforeConnectThrow)
{
    auto &c = makeClient();
    EXPECT_THROW(c.ping(), DisconnectedError);
    EXPECT_THROW(c.send("DR 7"), DisconnectedError);
}

TEST_F(HomeduinoClientTest, ReceivedRfReachesCallbacks)
{
    codec->result = {DecodedProtocol{"switch1", {{"id", "9"}, {"state", "on"}}}};
    auto &c = makeClient();
    std::atomic<int> any{0};
    std::atomic<int> specific{0};
    c.addRfReceiveCallback([&](const DecodedProtocol &) { ++any; });
    c.addRfReceiveCallback("switch1", [&](const DecodedProtocol &match) {
        if (match.values.at("state") == "on") ++specific;
    });
    ASSERT_TRUE(c.connect(false));

    gateway->inject("RF receive 260 2680 1275 10550 0 0 0 0 01020102\r\n");
    ASSERT_TRUE(waitUntil([&]{ return any == 1 && specific == 1; }));
    auto calls = codec->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].pulseSequence, "01020102");
    EXPECT_EQ(calls[0].pulseLengths, (std::vector<int>{260, 2680, 1275, 10550, 0, 0, 0, 0}));
}

TEST_F(HomeduinoClientTest, IncomingLinesRefreshLastMessageTime)
{
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    auto before = c.lastMessageReceivedAt();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gateway->inject("KP 3\r\n");
    EXPECT_TRUE(waitUntil([&]{ return c.lastMessageReceivedAt() > before; }));
}

TEST_F(HomeduinoClientTest, UnpluggedLinkCanBeReopened)
{
    auto &c = makeClient();
    ASSERT_TRUE(c.connect(false));
    gateway->unplug();
    ASSERT_TRUE(waitUntil([&]{ return !c.isConnected(); }));
    EXPECT_EQ(c.state(), ConnectionState::Disconnected);
    EXPECT_FALSE(c.isReady());
    EXPECT_THROW(c.ping(), DisconnectedError);

    ASSERT_TRUE(c.connect(false));
    EXPECT_EQ(gateway->opens(), 2);
    EXPECT_TRUE(c.ping());
}

TEST_F(HomeduinoClientTest, PinModesReplayedOnReconnect)
{
    auto &c = makeClient();
    c.addDhtReadCallback(DhtType::Dht22, 5, [](int, const DhtReading &) {});
    ASSERT_TRUE(c.connect(false));
    EXPECT_EQ(gateway->countCommands("PM 5 2"), 1u);

    c.addDigitalReadCallback(7, [](int, int) {});
    EXPECT_EQ(gateway->countCommands("PM 7 0"), 1u);

    EXPECT_TRUE(c.reconnect());
    c.disconnect();
    EXPECT_EQ(gateway->countCommands("PM 5 2"), 2u);
    EXPECT_EQ(gateway->countCommands("PM 7 0"), 2u);
}

TEST_F(HomeduinoClientTest, DisconnectClearsState)
{
    auto &c = makeClient();
    c.disconnect();
    ASSERT_TRUE(c.connect(false));
    c.disconnect();
    EXPECT_FALSE(c.isConnected());
    EXPECT_FALSE(c.isReady());
    EXPECT_FALSE(gateway->isOpen());
    EXPECT_EQ(c.state(), ConnectionState::Disconnected);
}

TEST_F(HomeduinoClientTest, DisconnectStopsSupervisor)
{
    settings.pingIntervalMs = 50;
    auto &c = makeClient();
    std::atomic<int> analogCalls{0};
    c.addAnalogReadCallback(3, [&](int, int) { ++analogCalls; });
    ASSERT_TRUE(c.connect());
    EXPECT_TRUE(c.supervisorRunning());
    ASSERT_TRUE(waitUntil([&]{ return gateway->countCommands("AR 3") >= 3; }));
    EXPECT_EQ(analogCalls, 1);

    c.disconnect();
    EXPECT_FALSE(c.supervisorRunning());
    size_t sent = gateway->commands().size();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(gateway->commands().size(), sent);
}

TEST_F(HomeduinoClientTest, InputCallbackCanDisconnect)
{
    settings.pingIntervalMs = 50;
    auto &c = makeClient();
    std::atomic<bool> fired{false};
    std::atomic<bool> done{false};
    c.addDigitalReadCallback(7, [&](int, int) {
        if (fired.exchange(true)) return;
        c.disconnect();
        done = true;
    });
    ASSERT_TRUE(c.connect());
    ASSERT_TRUE(waitUntil([&]{ return done.load(); }));

    EXPECT_FALSE(c.isConnected());
    EXPECT_FALSE(c.supervisorRunning());
    EXPECT_FALSE(gateway->isOpen());
    size_t sent = gateway->commands().size();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(gateway->commands().size(), sent);

    ASSERT_TRUE(c.connect());
    EXPECT_TRUE(c.supervisorRunning());
}

TEST_F(HomeduinoClientTest, InputCallbackCanReconnect)
{
    settings.pingIntervalMs = 50;
    auto &c = makeClient();
    std::atomic<bool> fired{false};
    std::atomic<int> result{0};
    c.addAnalogReadCallback(3, [&](int, int) {
        if (fired.exchange(true)) return;
        result = c.reconnect() ? 1 : 2;
    });
    ASSERT_TRUE(c.connect());
    ASSERT_TRUE(waitUntil([&]{ return result != 0; }));

    EXPECT_EQ(result, 1);
    EXPECT_TRUE(c.isConnected());
    EXPECT_TRUE(c.supervisorRunning());
    EXPECT_EQ(gateway->opens(), 2);
    EXPECT_TRUE(waitUntil([&]{ return gateway->countCommands("AR 3") >= 3; }));
}

TEST_F(HomeduinoClientTest, RfCallbackCanSendCommands)
{
    codec->result = {DecodedProtocol{"switch1", {{"state", "on"}}}};
    auto &c = makeClient();
    std::atomic<int> result{0};
    c.addRfReceiveCallback([&](const DecodedProtocol &) {
        try
        {
            result = c.digitalWrite(13, true) ? 1 : 2;
        }
        catch (const std::exception &)
        {
            result = 3;
        }
    });
    ASSERT_TRUE(c.connect(false));

    gateway->inject("RF receive 300 600 1200 2400 0 0 0 0 0101010101\r\n");
    ASSERT_TRUE(waitUntil([&]{ return result != 0; }));
    EXPECT_EQ(result, 1);
    EXPECT_EQ(gateway->countCommands("DW 13 1"), 1u);
    EXPECT_FALSE(c.awaitingResponse());
}

TEST_F(HomeduinoClientTest, RfCallbackCanDisconnect)
{
    codec->result = {DecodedProtocol{"switch1", {{"state", "on"}}}};
    auto &c = makeClient();
    std::atomic<bool> done{false};
    c.addRfReceiveCallback([&](const DecodedProtocol &) {
        c.disconnect();
        done = true;
    });
    ASSERT_TRUE(c.connect(false));

    gateway->inject("RF receive 300 600 1200 2400 0 0 0 0 0101010101\r\n");
    ASSERT_TRUE(waitUntil([&]{ return done.load(); }));
    EXPECT_FALSE(c.isConnected());
    EXPECT_EQ(c.state(), ConnectionState::Disconnected);
    EXPECT_FALSE(gateway->isOpen());

    ASSERT_TRUE(c.connect(false));
    EXPECT_TRUE(c.ping());
}

TEST_F(HomeduinoClientTest, RfProtocolsAreNaturallySorted)
{
    codec->protocols = {"switch10", "pir1", "switch2", "dimmer3"};
    auto &c = makeClient();
    EXPECT_EQ(c.rfProtocols(), (std::vector<std::string>{"dimmer3", "pir1", "switch2", "switch10"}));

    HomeduinoClient noCodec(settings, nullptr, [this]{ return gateway; });
    EXPECT_TRUE(noCodec.rfProtocols().empty());
}
