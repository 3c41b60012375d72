/*
    Copyright 2023 The rpi-controls Authors

    This file is part of rpi-controls.

    rpi-controls is free software: you can redistribute it and/or modify it
    under the terms of the GNU General Public License as published by the Free
    Software Foundation, either version 3 of the License, or (at your option)
    any later version.

    rpi-controls is distributed in the hope that it will be useful, but
    WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY
    or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for
    more details.

    You should have received a copy of the GNU General Public License along with
    rpi-controls.  If not, see <https://www.gnu.org/licenses/>.
*/

#include <gtest/gtest.h>
#include <random>
#include <string>

#include "../src/GestureDetector.h"

namespace {

using rpicontrols::GestureDetector;
using Gestures = GestureDetector::Gestures;

const GestureDetector::Gesture PRESS = GestureDetector::PRESS;
const GestureDetector::Gesture RELEASE = GestureDetector::RELEASE;
const GestureDetector::Gesture LONG_PRESS = GestureDetector::LONG_PRESS;
const GestureDetector::Gesture CLICK = GestureDetector::CLICK;
const GestureDetector::Gesture DOUBLE_CLICK = GestureDetector::DOUBLE_CLICK;

/*---------------------------------------------------------------------------*/

class TestingScript
{
public:
    struct ScriptPoint
    {
        uint32_t _tm;
        bool _button_state;
        Gestures _expected_gestures;

        ScriptPoint(uint32_t tm, bool button_state, Gestures expected_gestures = Gestures())
            : _tm(tm)
            , _button_state(button_state)
            , _expected_gestures(expected_gestures)
        { }
    };

    ScriptPoint const* _script_points;
    std::string _name;
    int _num_points;

    TestingScript(char const* name, ScriptPoint const script_points[], int num_points)
        : _script_points(script_points)
        , _name(name)
        , _num_points(num_points)
    { }

    void execute(GestureDetector& detector)
    {
        for (int i = 0; i < _num_points; ++i)
        {
            ScriptPoint const& sp = _script_points[i];
            auto actual_gestures = detector.update(sp._button_state, sp._tm);

            SCOPED_TRACE(_name + " i:" + std::to_string(i));
            EXPECT_EQ(sp._expected_gestures, actual_gestures);
        }
    }
};

using ScriptPoint = TestingScript::ScriptPoint;

/*---------------------------------------------------------------------------*/

#define ARRAY_SIZE(A) sizeof(A)/sizeof(A[0])
#define RUN_SCRIPT(NAME,DETECTOR) TestingScript(#NAME, NAME ## _script, ARRAY_SIZE(NAME ## _script)).execute(DETECTOR);

// With the default timings.
const uint32_t DEBOUNCE = GestureDetector::DEFAULT_DEBOUNCE_MS;
const uint32_t LONG_PRESS_MS = GestureDetector::DEFAULT_LONG_PRESS_MS;
const uint32_t DOUBLE_CLICK_MS = GestureDetector::DEFAULT_DOUBLE_CLICK_MS;

class TestGestureDetector : public testing::Test
{
protected:
    std::mt19937 _rng;

    void SetUp() override
    {
        _rng.seed(123456);
    }
};

TEST_F(TestGestureDetector, TestInitialState)
{
    GestureDetector detector;
    EXPECT_FALSE(detector.state());
    EXPECT_FALSE(detector.long_pressed());

    EXPECT_EQ(0u, detector.duration(0));
    EXPECT_EQ(12345u, detector.duration(12345));

    EXPECT_EQ(DEBOUNCE, detector.debounce_ms());
    EXPECT_EQ(LONG_PRESS_MS, detector.long_press_ms());
    EXPECT_EQ(DOUBLE_CLICK_MS, detector.double_click_ms());
}

TEST_F(TestGestureDetector, TestFirstReading)
{
    // Test with first reading true
    {
        GestureDetector detector;
        EXPECT_TRUE(detector.update(true, 1).empty());
    }

    // Test with first reading false
    {
        GestureDetector detector;
        EXPECT_TRUE(detector.update(false, 1).empty());
    }
}

TEST_F(TestGestureDetector, TestRapidPresses)
{
    GestureDetector detector;

    // Test presses and releases that are all shorter than debounce delay
    std::uniform_int_distribution<uint32_t> sub_debounce_delay(1, DEBOUNCE - 1);

    uint32_t tm = 0;
    uint32_t end_tm = 120 * 1000;

    bool state = true;
    while (tm < end_tm) {
        auto gestures = detector.update(state, tm);
        EXPECT_TRUE(gestures.empty());
        tm += sub_debounce_delay(_rng);
        state = !state;
    }
    EXPECT_FALSE(detector.state());
}

TEST_F(TestGestureDetector, TestBouncingEdges)
{
    GestureDetector detector;

    ScriptPoint bouncing_click_script[] = {
        // Contacts bounce before settling pressed
        { 0, true },
        { 5, false },
        { 8, true },
        // Not yet stable for the debounce time since the last bounce
        { 8 + DEBOUNCE - 1, true },
        { 8 + DEBOUNCE, true, { PRESS } },
        // And bounce again on release
        { 100, false },
        { 103, true },
        { 105, false },
        { 105 + DEBOUNCE - 1, false },
        { 105 + DEBOUNCE, false, { RELEASE } },
        // Click is delivered once the double click window of the press ends
        { 8 + DEBOUNCE + DOUBLE_CLICK_MS - 1, false },
        { 8 + DEBOUNCE + DOUBLE_CLICK_MS, false, { CLICK } },
    };

    RUN_SCRIPT(bouncing_click, detector);
}

TEST_F(TestGestureDetector, TestSinglePressAndRelease)
{
    // Test of a press shorter than the long press time
    {
        GestureDetector detector;

        uint32_t press_tm = 0;
        uint32_t release_tm = press_tm + 200;
        uint32_t clicked_tm = press_tm + DEBOUNCE + DOUBLE_CLICK_MS;

        ScriptPoint click_script[] = {
            // Button pressed and held for debounce timeout
            { press_tm, true },
            { press_tm + DEBOUNCE, true, { PRESS } },
            // Button released and left released for debounce timeout
            // No click should be delivered before the double click timeout
            { release_tm, false },
            { release_tm + DEBOUNCE, false, { RELEASE } },
            { clicked_tm - 1, false },
            // Click should be delivered after the double click timeout
            { clicked_tm, false, { CLICK } },
            { clicked_tm + 1000, false },
        };

        RUN_SCRIPT(click, detector);
    }

    // Test of a press longer than the long press time
    {
        GestureDetector detector;

        uint32_t press_tm = 0;
        uint32_t long_press_tm = press_tm + DEBOUNCE + LONG_PRESS_MS;
        uint32_t release_tm = long_press_tm + 100;

        ScriptPoint hold_script[] = {
            // Button pressed and held for debounce timeout
            { press_tm, true },
            { press_tm + DEBOUNCE, true, { PRESS } },
            { long_press_tm - 1, true },
            // Button still pressed at the long press time
            { long_press_tm, true, { LONG_PRESS } },
            { release_tm, false },
            // A long press is released but never clicked
            { release_tm + DEBOUNCE, false, { RELEASE } },
            { release_tm + DEBOUNCE + DOUBLE_CLICK_MS + 1, false },
        };

        RUN_SCRIPT(hold, detector);
    }
}

TEST_F(TestGestureDetector, TestLongPressedState)
{
    GestureDetector detector;
    detector.set_debounce_ms(0);
    detector.set_long_press_ms(100);

    detector.update(true, 0);
    EXPECT_TRUE(detector.state());
    EXPECT_FALSE(detector.long_pressed());

    EXPECT_EQ(Gestures({ LONG_PRESS }), detector.update(true, 100));
    EXPECT_TRUE(detector.long_pressed());

    EXPECT_EQ(Gestures({ RELEASE }), detector.update(false, 150));
    EXPECT_FALSE(detector.state());
    EXPECT_FALSE(detector.long_pressed());
}

TEST_F(TestGestureDetector, TestMissedDeadlinesComeFirst)
{
    // Without readings between the press and the release, the long press
    // is reported before the release.
    GestureDetector detector;
    detector.set_debounce_ms(0);

    ScriptPoint late_release_script[] = {
        { 0, true, { PRESS } },
        { LONG_PRESS_MS + 200, false, { LONG_PRESS, RELEASE } },
    };

    RUN_SCRIPT(late_release, detector);
}

TEST_F(TestGestureDetector, TestSlowClick)
{
    // A press longer than the double click time, shorter than the long press
    // time, is clicked as soon as it is released.
    GestureDetector detector;
    detector.set_long_press_ms(DOUBLE_CLICK_MS * 2);

    uint32_t release_tm = DOUBLE_CLICK_MS + 100;

    ScriptPoint slow_click_script[] = {
        { 0, true },
        { DEBOUNCE, true, { PRESS } },
        { release_tm, false },
        { release_tm + DEBOUNCE, false, { RELEASE, CLICK } },
    };

    RUN_SCRIPT(slow_click, detector);
}

TEST_F(TestGestureDetector, TestDoublePressAndRelease)
{
    // Two clicks within the double click timeout
    {
        GestureDetector detector;

        uint32_t first_press_tm = 0;
        uint32_t first_release_tm = first_press_tm + 100;
        uint32_t second_press_tm = first_release_tm + 100;
        uint32_t second_release_tm = second_press_tm + 100;

        ScriptPoint double_click_script[] = {
            // Button pressed and held for debounce timeout
            { first_press_tm, true },
            { first_press_tm + DEBOUNCE, true, { PRESS } },
            // Button released before the long press time
            { first_release_tm, false },
            { first_release_tm + DEBOUNCE, false, { RELEASE } },
            // Button pressed again and held for debounce timeout
            { second_press_tm, true },
            { second_press_tm + DEBOUNCE, true, { PRESS } },
            // Second release within the window completes the double click
            { second_release_tm, false },
            { second_release_tm + DEBOUNCE, false, { RELEASE, DOUBLE_CLICK } },
            // And no click follows
            { first_press_tm + DEBOUNCE + DOUBLE_CLICK_MS + 1000, false },
        };

        RUN_SCRIPT(double_click, detector);
    }

    // Two clicks separated by more than the double click timeout
    {
        GestureDetector detector;

        uint32_t first_press_tm = 0;
        uint32_t first_release_tm = first_press_tm + 100;
        uint32_t first_clicked_tm = first_press_tm + DEBOUNCE + DOUBLE_CLICK_MS;

        uint32_t second_press_tm = first_clicked_tm + 80;
        uint32_t second_release_tm = second_press_tm + 100;
        uint32_t second_clicked_tm = second_press_tm + DEBOUNCE + DOUBLE_CLICK_MS;

        ScriptPoint two_clicks_script[] = {
            { first_press_tm, true },
            { first_press_tm + DEBOUNCE, true, { PRESS } },
            { first_release_tm, false },
            { first_release_tm + DEBOUNCE, false, { RELEASE } },
            { first_clicked_tm, false, { CLICK } },
            { second_press_tm, true },
            { second_press_tm + DEBOUNCE, true, { PRESS } },
            { second_release_tm, false },
            { second_release_tm + DEBOUNCE, false, { RELEASE } },
            { second_clicked_tm, false, { CLICK } },
        };

        RUN_SCRIPT(two_clicks, detector);
    }

    // A long press followed by a click
    {
        GestureDetector detector;

        uint32_t first_press_tm = 0;
        uint32_t long_press_tm = first_press_tm + DEBOUNCE + LONG_PRESS_MS;
        uint32_t first_release_tm = long_press_tm + 10;

        uint32_t second_press_tm = first_release_tm + DEBOUNCE + 10;
        uint32_t second_release_tm = second_press_tm + 100;
        uint32_t clicked_tm = second_press_tm + DEBOUNCE + DOUBLE_CLICK_MS;

        ScriptPoint press_click_script[] = {
            { first_press_tm, true },
            { first_press_tm + DEBOUNCE, true, { PRESS } },
            { long_press_tm, true, { LONG_PRESS } },
            { first_release_tm, false },
            { first_release_tm + DEBOUNCE, false, { RELEASE } },
            // The long press does not pair with the next click
            { second_press_tm, true },
            { second_press_tm + DEBOUNCE, true, { PRESS } },
            { second_release_tm, false },
            { second_release_tm + DEBOUNCE, false, { RELEASE } },
            { clicked_tm, false, { CLICK } },
        };

        RUN_SCRIPT(press_click, detector);
    }
}

TEST_F(TestGestureDetector, TestSecondPressOutlastsWindow)
{
    // The first click is delivered when the window closes on the held second
    // press, which then counts as a first press on its own.
    {
        GestureDetector detector;

        uint32_t first_press_tm = 0;
        uint32_t window_end_tm = first_press_tm + DEBOUNCE + DOUBLE_CLICK_MS;
        uint32_t second_press_tm = 400;
        uint32_t second_release_tm = 600;

        ScriptPoint late_release_script[] = {
            { first_press_tm, true },
            { first_press_tm + DEBOUNCE, true, { PRESS } },
            { 100, false },
            { 100 + DEBOUNCE, false, { RELEASE } },
            { second_press_tm, true },
            { second_press_tm + DEBOUNCE, true, { PRESS } },
            { window_end_tm - 1, true },
            { window_end_tm, true, { CLICK } },
            { second_release_tm, false },
            { second_release_tm + DEBOUNCE, false, { RELEASE } },
            { second_press_tm + DEBOUNCE + DOUBLE_CLICK_MS, false, { CLICK } },
        };

        RUN_SCRIPT(late_release, detector);
    }

    // And the held second press can still become a long press
    {
        GestureDetector detector;

        uint32_t second_press_tm = 400;
        uint32_t long_press_tm = second_press_tm + DEBOUNCE + LONG_PRESS_MS;

        ScriptPoint click_then_hold_script[] = {
            { 0, true },
            { DEBOUNCE, true, { PRESS } },
            { 100, false },
            { 100 + DEBOUNCE, false, { RELEASE } },
            { second_press_tm, true },
            { second_press_tm + DEBOUNCE, true, { PRESS } },
            { DEBOUNCE + DOUBLE_CLICK_MS, true, { CLICK } },
            { long_press_tm - 1, true },
            { long_press_tm, true, { LONG_PRESS } },
            { long_press_tm + 50, false },
            { long_press_tm + 50 + DEBOUNCE, false, { RELEASE } },
            { long_press_tm + 2000, false },
        };

        RUN_SCRIPT(click_then_hold, detector);
    }
}

TEST_F(TestGestureDetector, TestSecondPressLongPress)
{
    // With a long press shorter than the double click window, the held
    // second press becomes a long press before the window closes.
    GestureDetector detector;
    detector.set_debounce_ms(0);
    detector.set_long_press_ms(200);
    detector.set_double_click_ms(1000);

    ScriptPoint hold_second_press_script[] = {
        { 10, true, { PRESS } },
        { 50, false, { RELEASE } },
        { 100, true, { PRESS } },
        { 299, true },
        { 300, true, { CLICK, LONG_PRESS } },
        { 900, true },
        { 910, false, { RELEASE } },
        { 3000, false },
    };

    RUN_SCRIPT(hold_second_press, detector);
}

TEST_F(TestGestureDetector, TestSecondPressLongPressedState)
{
    GestureDetector detector;
    detector.set_debounce_ms(0);
    detector.set_long_press_ms(200);
    detector.set_double_click_ms(1000);

    detector.update(true, 10);
    detector.update(false, 50);
    detector.update(true, 100);
    EXPECT_FALSE(detector.long_pressed());

    detector.update(true, 300);
    EXPECT_TRUE(detector.long_pressed());
}

TEST_F(TestGestureDetector, TestTriplePressAndRelease)
{
    // Double click and separate click
    GestureDetector detector;

    uint32_t third_press_tm = 240;

    ScriptPoint double_plus_click_script[] = {
        { 0, true },
        { DEBOUNCE, true, { PRESS } },
        { 60, false },
        { 60 + DEBOUNCE, false, { RELEASE } },
        { 120, true },
        { 120 + DEBOUNCE, true, { PRESS } },
        { 180, false },
        { 180 + DEBOUNCE, false, { RELEASE, DOUBLE_CLICK } },
        // The third click starts a new sequence
        { third_press_tm, true },
        { third_press_tm + DEBOUNCE, true, { PRESS } },
        { 300, false },
        { 300 + DEBOUNCE, false, { RELEASE } },
        { third_press_tm + DEBOUNCE + DOUBLE_CLICK_MS, false, { CLICK } },
    };

    RUN_SCRIPT(double_plus_click, detector);
}

TEST_F(TestGestureDetector, TestInvertedPolarity)
{
    // Button reads false when pushed
    GestureDetector detector(false);

    EXPECT_TRUE(detector.update(true, 0).empty());
    EXPECT_FALSE(detector.state());

    ScriptPoint pressed_when_off_script[] = {
        { 10, false },
        { 10 + DEBOUNCE, false, { PRESS } },
        { 100, true },
        { 100 + DEBOUNCE, true, { RELEASE } },
        { 10 + DEBOUNCE + DOUBLE_CLICK_MS, true, { CLICK } },
    };

    RUN_SCRIPT(pressed_when_off, detector);
}

TEST_F(TestGestureDetector, TestResetHeld)
{
    GestureDetector detector;
    detector.reset(true, 0);
    EXPECT_TRUE(detector.state());
    EXPECT_FALSE(detector.long_pressed());

    ScriptPoint held_script[] = {
        // Held since before the reset, so never a long press
        { 100, true },
        { LONG_PRESS_MS * 2, true },
        { 1100, false },
        // Nor a click
        { 1100 + DEBOUNCE, false, { RELEASE } },
        { 3000, false },
        // Later gestures are recognized as usual
        { 3100, true },
        { 3100 + DEBOUNCE, true, { PRESS } },
        { 3200, false },
        { 3200 + DEBOUNCE, false, { RELEASE } },
        { 3100 + DEBOUNCE + DOUBLE_CLICK_MS, false, { CLICK } },
    };

    RUN_SCRIPT(held, detector);
}

TEST_F(TestGestureDetector, TestResetForgetsPendingClick)
{
    GestureDetector detector;
    detector.set_debounce_ms(0);

    EXPECT_EQ(Gestures({ PRESS }), detector.update(true, 0));
    EXPECT_EQ(Gestures({ RELEASE }), detector.update(false, 50));

    detector.reset(false, 60);
    EXPECT_TRUE(detector.update(false, DOUBLE_CLICK_MS + 100).empty());
    EXPECT_EQ(0u, detector.duration(60));
}

TEST_F(TestGestureDetector, TestClockWraparound)
{
    GestureDetector detector;

    uint32_t base_tm = 0xffffff00u;

    ScriptPoint wraparound_script[] = {
        { base_tm, true },
        { base_tm + DEBOUNCE, true, { PRESS } },
        { base_tm + 100, false },
        { base_tm + 100 + DEBOUNCE, false, { RELEASE } },
        // Past zero
        { base_tm + DEBOUNCE + DOUBLE_CLICK_MS - 1, false },
        { base_tm + DEBOUNCE + DOUBLE_CLICK_MS, false, { CLICK } },
    };

    RUN_SCRIPT(wraparound, detector);
}

TEST_F(TestGestureDetector, TestDescribeGesture)
{
    EXPECT_STREQ("press", GestureDetector::describe_gesture(PRESS));
    EXPECT_STREQ("release", GestureDetector::describe_gesture(RELEASE));
    EXPECT_STREQ("long press", GestureDetector::describe_gesture(LONG_PRESS));
    EXPECT_STREQ("click", GestureDetector::describe_gesture(CLICK));
    EXPECT_STREQ("double click", GestureDetector::describe_gesture(DOUBLE_CLICK));
}

/*---------------------------------------------------------------------------*/

} // anonymous namespace
