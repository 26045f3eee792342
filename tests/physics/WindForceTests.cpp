/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WindForceTests
#include <boost/test/unit_test.hpp>

#include "physics/PhysicsConstants.hpp"
#include "physics/WindForce.hpp"
#include <cmath>

using namespace Snowfall;

namespace {

WindSettings enabledWind(WindDirection direction, float strength, float gustFrequency = 3.0f) {
    WindSettings settings;
    settings.enabled = true;
    settings.direction = direction;
    settings.strength = strength;
    settings.gustFrequency = gustFrequency;
    return settings;
}

} // namespace

BOOST_AUTO_TEST_SUITE(WindBoundTests)

BOOST_AUTO_TEST_CASE(ForceAndLiftStayBounded) {
    const float strengths[] = {0.1f, 0.5f, 1.0f, 2.5f};
    const float frequencies[] = {0.1f, 1.0f, 3.0f, 10.0f};
    const float steps[] = {0.001f, 1.0f / 60.0f, 0.1f, 0.5f};

    for (float strength : strengths) {
        for (float frequency : frequencies) {
            for (float step : steps) {
                WindForce wind(enabledWind(WindDirection::Random, strength, frequency));
                for (int i = 0; i < 600; ++i) {
                    wind.update(step);
                    BOOST_REQUIRE_LE(std::fabs(wind.getCurrentForce()), strength + 1e-5f);
                    BOOST_REQUIRE_LE(std::fabs(wind.getCurrentLift()),
                                     PhysicsConstants::WIND_LIFT_RATIO * strength + 1e-5f);
                    BOOST_REQUIRE_LE(std::fabs(wind.getRawSignal()), 1.0f);
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(LiftNeverPushesDown) {
    WindForce wind(enabledWind(WindDirection::Random, 1.0f));
    for (int i = 0; i < 300; ++i) {
        wind.update(1.0f / 60.0f);
        BOOST_REQUIRE_GE(wind.getCurrentLift(), 0.0f);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(WindDirectionTests)

BOOST_AUTO_TEST_CASE(LeftWindBlowsLeft) {
    WindForce wind(enabledWind(WindDirection::Left, 1.0f));
    for (int i = 0; i < 120; ++i) {
        wind.update(1.0f / 60.0f);
        BOOST_REQUIRE_LE(wind.getCurrentForce(), 0.0f);
    }
    BOOST_CHECK_LT(wind.getCurrentForce(), 0.0f);
}

BOOST_AUTO_TEST_CASE(RightWindBlowsRight) {
    WindForce wind(enabledWind(WindDirection::Right, 1.0f));
    for (int i = 0; i < 120; ++i) {
        wind.update(1.0f / 60.0f);
        BOOST_REQUIRE_GE(wind.getCurrentForce(), 0.0f);
    }
    BOOST_CHECK_GT(wind.getCurrentForce(), 0.0f);
}

BOOST_AUTO_TEST_CASE(DisabledWindDecaysToZero) {
    WindForce wind(enabledWind(WindDirection::Right, 1.0f));
    for (int i = 0; i < 120; ++i) {
        wind.update(1.0f / 60.0f);
    }
    const float before = std::fabs(wind.getCurrentForce());

    WindSettings off = wind.getSettings();
    off.enabled = false;
    wind.setSettings(off);
    for (int i = 0; i < 300; ++i) {
        wind.update(1.0f / 60.0f);
    }
    BOOST_CHECK_LT(std::fabs(wind.getCurrentForce()), before);
    BOOST_CHECK_LT(std::fabs(wind.getCurrentForce()), 1e-3f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(WindApplicationTests)

BOOST_AUTO_TEST_CASE(SmallFlakesArePushedHarder) {
    WindForce wind(enabledWind(WindDirection::Right, 1.0f));
    for (int i = 0; i < 60; ++i) {
        wind.update(1.0f / 60.0f);
    }
    const Vector2D small = wind.accelerationFor(10.0f);
    const Vector2D large = wind.accelerationFor(40.0f);
    BOOST_CHECK_GT(small.getX(), large.getX());
    BOOST_CHECK_CLOSE(small.getX() / large.getX(), 2.0f, 0.01);
}

BOOST_AUTO_TEST_CASE(GrabbedParticleIgnoresWind) {
    WindForce wind(enabledWind(WindDirection::Right, 1.0f));
    for (int i = 0; i < 60; ++i) {
        wind.update(1.0f / 60.0f);
    }
    Particle particle;
    particle.isGrabbed = true;
    wind.apply(particle, 1.0f / 60.0f);
    BOOST_CHECK_EQUAL(particle.velocity.getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(ResetClearsState) {
    WindForce wind(enabledWind(WindDirection::Left, 1.0f));
    for (int i = 0; i < 60; ++i) {
        wind.update(1.0f / 60.0f);
    }
    wind.reset();
    BOOST_CHECK_EQUAL(wind.getCurrentForce(), 0.0f);
    BOOST_CHECK_EQUAL(wind.getCurrentLift(), 0.0f);
    BOOST_CHECK_EQUAL(wind.getElapsed(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()
