#include "correlator_rig.hpp"
#include "homeduino_error.hpp"
#include "rf_send_pacer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

static const std::string kRfCommand = "RF send 4 3 260 2680 1275 10550 0 0 0 0 0201";

TEST(RfSendPacer, BackToBackRfSendsAreSpacedByMinimumInterval)
{
    CorrelatorRig rig;
    ASSERT_TRUE(rig.waitReady());
    RfSendPacer pacer(rig.correlator, std::chrono::milliseconds(150), std::chrono::milliseconds(10));

    EXPECT_EQ(pacer.send(kRfCommand, true), "ACK");
    EXPECT_EQ(pacer.send(kRfCommand, true), "ACK");

    auto written = rig.gateway->written();
    ASSERT_EQ(written.size(), 2u);
    EXPECT_GE(written[1].at - written[0].at, std::chrono::milliseconds(150));
}

TEST(RfSendPacer, ConcurrentRfSendersAreAlsoSpaced)
{
    CorrelatorRig rig(200, 2000);
    ASSERT_TRUE(rig.waitReady());
    RfSendPacer pacer(rig.correlator, std::chrono::milliseconds(100), std::chrono::milliseconds(5));

    std::thread a([&]{ pacer.send(kRfCommand, true); });
    std::thread b([&]{ pacer.send(kRfCommand, true); });
    a.join();
    b.join();

    auto written = rig.gateway->written();
    ASSERT_EQ(written.size(), 2u);
    EXPECT_GE(written[1].at - written[0].at, std::chrono::milliseconds(100));
}

TEST(RfSendPacer, OtherCommandsAreNotDelayed)
{
    CorrelatorRig rig;
    ASSERT_TRUE(rig.waitReady());
    RfSendPacer pacer(rig.correlator, std::chrono::milliseconds(500), std::chrono::milliseconds(10));

    pacer.send(kRfCommand, true);
    auto before = std::chrono::steady_clock::now();
    EXPECT_EQ(pacer.send("DW 3 1", false), "ACK");
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::milliseconds(400));
}

TEST(RfSendPacer, ClockAdvancesWhenSendFails)
{
    CorrelatorRig rig(100, 100);
    ASSERT_TRUE(rig.waitReady());
    rig.gateway->setResponder([](const std::string &){
        return std::optional<std::vector<std::string>>(std::vector<std::string>{});
    });
    RfSendPacer pacer(rig.correlator, std::chrono::milliseconds(200), std::chrono::milliseconds(10));

    EXPECT_FALSE(pacer.lastDeparture().has_value());
    EXPECT_THROW(pacer.send(kRfCommand, true), ResponseTimeoutError);
    ASSERT_TRUE(pacer.lastDeparture().has_value());

    auto failedAt = *pacer.lastDeparture();
    EXPECT_THROW(pacer.send(kRfCommand, true), ResponseTimeoutError);
    auto written = rig.gateway->written();
    ASSERT_EQ(written.size(), 2u);
    EXPECT_GE(written[1].at - failedAt, std::chrono::milliseconds(200));
}
