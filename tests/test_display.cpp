#include <gtest/gtest.h>

#include <string>

#include "DisplayManager.h"
#include "FakeDevices.h"

TEST(ShowMenu, FirstDrawStartsNewLineAndHighlightsSelection)
{
    Rig rig;
    showMenu(rig.ctx, "Main");

    EXPECT_EQ(rig.console.out,
              "\r\n\rMain: "
              "\x1b[7m Show Proximity \x1b[0m"
              " Show Lux "
              " Set Threshold ");
    EXPECT_FALSE(rig.ctx.state.newline);
}

TEST(ShowMenu, RedrawOverwritesSameRow)
{
    Rig rig;
    showMenu(rig.ctx, "Main");
    rig.console.out.clear();

    rig.ctx.state.selection = MENU_SET_THRESH;
    showMenu(rig.ctx, "Main");

    EXPECT_EQ(rig.console.out,
              "\rMain: "
              " Show Proximity "
              " Show Lux "
              "\x1b[7m Set Threshold \x1b[0m");
}

TEST(ShowMenu, UsesPrefix)
{
    Rig rig;
    rig.ctx.state.newline = false;
    showMenu(rig.ctx, "Setup");
    EXPECT_EQ(rig.console.out.compare(0, 9, "\rSetup: \x1b"), 0);
}

TEST(ShowReadout, SpaceFlagWidthSix)
{
    Rig rig;
    showReadout(rig.ctx, "proximity", 7);
    EXPECT_EQ(rig.console.out, "\r proximity:      7  ");

    rig.console.out.clear();
    showReadout(rig.ctx, "lux", 123456);
    EXPECT_EQ(rig.console.out, "\r lux:  123456  ");

    rig.console.out.clear();
    showReadout(rig.ctx, "lux", 65535);
    EXPECT_EQ(rig.console.out, "\r lux:  65535  ");
}

TEST(ConsolePrint, TruncatesLongLines)
{
    FakeConsole con;
    std::string big(300, 'x');
    con.print("%s", big.c_str());
    EXPECT_EQ(con.out.size(), Console::PRINT_BUF_LEN - 1u);
}
