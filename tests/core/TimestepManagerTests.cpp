/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE TimestepManagerTests
#include <boost/test/unit_test.hpp>

#include "core/TimestepManager.hpp"

using namespace Bulwark;

BOOST_AUTO_TEST_SUITE(TimestepManagerTestSuite)

BOOST_AUTO_TEST_CASE(FastModeRunsOneStepPerFrame) {
    TimestepManager timestep(60.0f, 0.02f);
    timestep.setPacingEnabled(false);

    for (int frame = 0; frame < 5; ++frame) {
        timestep.startFrame();
        int updates = 0;
        while (timestep.shouldUpdate()) {
            ++updates;
        }
        timestep.endFrame();
        BOOST_CHECK_EQUAL(updates, 1);
    }
    BOOST_CHECK_EQUAL(timestep.getTotalUpdates(), 5u);
}

BOOST_AUTO_TEST_CASE(FirstPacedFrameDoesNotUpdate) {
    TimestepManager timestep;
    BOOST_CHECK(timestep.isPacingEnabled());
    timestep.startFrame();
    BOOST_CHECK(!timestep.shouldUpdate());
}

BOOST_AUTO_TEST_CASE(SettersRejectNonPositiveValues) {
    TimestepManager timestep(30.0f, 0.05f);
    BOOST_CHECK_CLOSE(timestep.getUpdateFrequencyHz(), 20.0f, 0.001f);

    timestep.setTargetFPS(0.0f);
    timestep.setFixedTimestep(-1.0f);
    BOOST_CHECK_EQUAL(timestep.getTargetFPS(), 30.0f);
    BOOST_CHECK_EQUAL(timestep.getUpdateDeltaTime(), 0.05f);

    timestep.setFixedTimestep(0.01f);
    BOOST_CHECK_CLOSE(timestep.getUpdateFrequencyHz(), 100.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(ConstructorFallsBackToDefaults) {
    TimestepManager timestep(-5.0f, 0.0f);
    BOOST_CHECK_EQUAL(timestep.getTargetFPS(), 60.0f);
    BOOST_CHECK_CLOSE(timestep.getUpdateDeltaTime(), 1.0f / 60.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
