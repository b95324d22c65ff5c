#include <gtest/gtest.h>

#include <string>

#include "ActionManager.h"
#include "FakeDevices.h"

namespace {

size_t count(const std::string& hay, const std::string& needle)
{
    size_t n = 0;
    for (size_t p = hay.find(needle); p != std::string::npos;
         p = hay.find(needle, p + needle.size()))
        ++n;
    return n;
}

}  // namespace

TEST(ShowProx, PrintsReadingUntilClickReleased)
{
    Rig rig;
    rig.sensor.prox = 7;
    rig.knob.push(false);
    rig.knob.push(true);
    rig.knob.push(false);

    showProx(rig.ctx);

    EXPECT_EQ(rig.console.out,
              "VCNL4040 Proximity (click to go back):\r\n"
              "\r proximity:      7  "
              "\r proximity:      7  "
              "\r proximity:      7  "
              "\r\n");
    EXPECT_EQ(rig.knob.pos, 3u);
    ASSERT_EQ(rig.pacer.sleeps.size(), 3u);
    for (size_t i = 0; i < rig.pacer.sleeps.size(); ++i)
        EXPECT_EQ(rig.pacer.sleeps[i], READOUT_POLL_MS);
    // no LED update on the tick that leaves
    EXPECT_EQ(rig.pixel.history.size(), 2u);
}

TEST(ShowProx, HeldButtonKeepsLooping)
{
    Rig rig;
    for (int i = 0; i < 5; ++i) rig.knob.push(true);
    rig.knob.push(false);

    showProx(rig.ctx);

    EXPECT_EQ(count(rig.console.out, "\r proximity:"), 6u);
}

TEST(ShowLux, PrintsAmbientLux)
{
    Rig rig;
    rig.sensor.ambient = 312;
    rig.knob.push(true);
    rig.knob.push(false);

    showLux(rig.ctx);

    EXPECT_EQ(rig.console.out,
              "VCNL4040 Ambient Lux (click to go back):\r\n"
              "\r lux:    312  "
              "\r lux:    312  "
              "\r\n");
}

TEST(SetThresh, KnobAdjustsAndClampsLive)
{
    Rig rig;
    rig.sensor.prox = 10;
    rig.knob.push(false, 3);      // 4 -> 7
    rig.knob.push(false, 100);    // 7 -> 60
    rig.knob.push(true, 0);
    rig.knob.push(false, 0);      // save

    setThresh(rig.ctx);

    EXPECT_EQ(rig.ctx.state.threshold, THRESH_MAX);
    EXPECT_EQ(rig.console.out,
              "Proximity threshold, range 2..60 (click to save):\r\n"
              "\r threshold:      4  "
              "\r threshold:      7  "
              "\r threshold:     60  "
              "\r threshold:     60  "
              "\r\n");

    // 10 >= 7 lights up, 10 < 60 goes dark
    ASSERT_EQ(rig.pixel.history.size(), 3u);
    EXPECT_EQ(rig.pixel.history[0].g, LED_NEAR.g);
    EXPECT_EQ(rig.pixel.history[0].b, LED_NEAR.b);
    EXPECT_TRUE(rig.pixel.lastIs(LED_FAR));

    for (size_t i = 0; i < rig.pacer.sleeps.size(); ++i)
        EXPECT_EQ(rig.pacer.sleeps[i], THRESH_POLL_MS);
}

TEST(SetThresh, NeverBelowMinimum)
{
    Rig rig;
    rig.knob.push(false, -1);
    rig.knob.push(false, -40);
    rig.knob.push(true);
    rig.knob.push(false);

    setThresh(rig.ctx);

    EXPECT_EQ(rig.ctx.state.threshold, THRESH_MIN);
}

TEST(SetThresh, DeltaOnReleaseTickIsDropped)
{
    Rig rig;
    rig.knob.push(true, 0);
    rig.knob.push(false, 5);

    setThresh(rig.ctx);

    EXPECT_EQ(rig.ctx.state.threshold, THRESH_DEFAULT);
}

TEST(DoAction, RunsSelectedItemAndRequestsNewLine)
{
    Rig rig;
    rig.ctx.state.newline = false;
    rig.ctx.state.selection = MENU_SHOW_LUX;
    rig.knob.push(true);
    rig.knob.push(false);

    doAction(rig.ctx);

    EXPECT_EQ(rig.console.out.compare(0, 2, "\r\n"), 0);
    EXPECT_NE(rig.console.out.find("VCNL4040 Ambient Lux"), std::string::npos);
    EXPECT_TRUE(rig.ctx.state.newline);
}

TEST(DoAction, ReportsMissingAction)
{
    const MenuItem broken[] = {
        { "Broken", nullptr },
    };
    Rig rig;
    rig.ctx.items     = broken;
    rig.ctx.itemCount = 1;
    rig.ctx.state.newline = false;

    doAction(rig.ctx);

    EXPECT_EQ(rig.console.out, "\r\nBroken menu action is not callable\r\n");
    EXPECT_TRUE(rig.ctx.state.newline);
    EXPECT_EQ(rig.knob.pos, 0u);
}
