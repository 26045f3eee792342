/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionResolverTests
#include <boost/test/unit_test.hpp>

#include "physics/CollisionBody.hpp"
#include "physics/CollisionResolver.hpp"
#include "physics/PhysicsConstants.hpp"
#include <cmath>

using namespace Snowfall;

namespace {

CollisionBody makeBody(float x, float y, float radius, float vx = 0.0f, float vy = 0.0f) {
    CollisionBody body;
    body.position = Vector2D(x, y);
    body.velocity = Vector2D(vx, vy);
    body.radius = radius;
    return body;
}

constexpr float DT = 1.0f / 60.0f;

} // namespace

BOOST_AUTO_TEST_SUITE(ImpulseTests)

BOOST_AUTO_TEST_CASE(HeadOnEqualMassReversesAndReduces) {
    const float v = 50.0f;
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f, v, 0.0f),
                           makeBody(19.0f, 0.0f, 10.0f, -v, 0.0f)};
    CollisionResolver resolver;

    BOOST_CHECK_EQUAL(resolver.resolve(bodies, DT), 1u);

    const float va = bodies[0].velocity.getX();
    const float vb = bodies[1].velocity.getX();
    // Bodies now separate
    BOOST_CHECK_LT(va, 0.0f);
    BOOST_CHECK_GT(vb, 0.0f);
    // Restitution < 1 loses energy
    BOOST_CHECK_LE(std::fabs(va), v);
    BOOST_CHECK_LE(std::fabs(vb), v);
    BOOST_CHECK_CLOSE(std::fabs(va), v * PhysicsConstants::RESTITUTION, 0.1);
}

BOOST_AUTO_TEST_CASE(ImpulseIsClampedToMaximum) {
    const float v = 5000.0f;
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f, v, 0.0f),
                           makeBody(19.0f, 0.0f, 10.0f, -v, 0.0f)};
    CollisionResolver resolver;
    resolver.resolve(bodies, DT);

    const float change = std::fabs(bodies[0].velocity.getX() - v);
    BOOST_CHECK_LE(change, PhysicsConstants::MAX_COLLISION_IMPULSE + 0.01f);
}

BOOST_AUTO_TEST_CASE(SeparatingPairGetsNoImpulse) {
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f, -20.0f, 0.0f),
                           makeBody(15.0f, 0.0f, 10.0f, 20.0f, 0.0f)};
    CollisionResolver resolver;
    resolver.resolve(bodies, DT);

    BOOST_CHECK_CLOSE(bodies[0].velocity.getX(), -20.0f, 0.001);
    BOOST_CHECK_CLOSE(bodies[1].velocity.getX(), 20.0f, 0.001);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SeparationTests)

BOOST_AUTO_TEST_CASE(OverlapIsCorrectedToContactDistance) {
    CollisionBodies bodies{makeBody(100.0f, 100.0f, 10.0f), makeBody(108.0f, 106.0f, 12.0f)};
    CollisionResolver resolver;
    resolver.resolve(bodies, DT);

    const float distance = Vector2D::distance(bodies[0].position, bodies[1].position);
    BOOST_CHECK_GE(distance, 22.0f - PhysicsConstants::EPSILON * 10.0f);
}

BOOST_AUTO_TEST_CASE(CoincidentCentersAreSeparated) {
    CollisionBodies bodies{makeBody(50.0f, 50.0f, 5.0f), makeBody(50.0f, 50.0f, 5.0f)};
    CollisionResolver resolver;
    BOOST_CHECK_EQUAL(resolver.resolve(bodies, DT), 1u);

    const float distance = Vector2D::distance(bodies[0].position, bodies[1].position);
    BOOST_CHECK_CLOSE(distance, 10.0f, 0.01);
    BOOST_CHECK(std::isfinite(bodies[0].position.getX()));
}

BOOST_AUTO_TEST_CASE(ThreeBodyChainEndsFullySeparated) {
    // Correcting 1-2 pushes body 1 back into body 0 unless overlaps are relaxed
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f), makeBody(15.0f, 0.0f, 10.0f),
                           makeBody(30.0f, 0.0f, 10.0f)};
    CollisionResolver resolver;
    BOOST_CHECK_EQUAL(resolver.resolve(bodies, DT), 2u);

    for (size_t i = 0; i < bodies.size(); ++i) {
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            const float distance = Vector2D::distance(bodies[i].position, bodies[j].position);
            BOOST_TEST_CONTEXT("pair " << i << "-" << j) {
                BOOST_CHECK_GE(distance, 20.0f - PhysicsConstants::EPSILON * 10.0f);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(PackedClusterEndsFullySeparated) {
    CollisionBodies bodies{makeBody(100.0f, 100.0f, 8.0f), makeBody(106.0f, 100.0f, 8.0f),
                           makeBody(103.0f, 105.0f, 8.0f), makeBody(103.0f, 95.0f, 8.0f)};
    CollisionResolver resolver;
    resolver.resolve(bodies, DT);

    for (size_t i = 0; i < bodies.size(); ++i) {
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            const float distance = Vector2D::distance(bodies[i].position, bodies[j].position);
            BOOST_TEST_CONTEXT("pair " << i << "-" << j) {
                BOOST_CHECK_GE(distance, 16.0f - 0.05f);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(DistantPairIsUntouched) {
    // collisionSize 10 each -> radius 5, minimum distance 10, centers 25 apart
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 5.0f, 3.0f, 1.0f),
                           makeBody(25.0f, 0.0f, 5.0f, -2.0f, 4.0f)};
    CollisionResolver resolver;

    BOOST_CHECK_EQUAL(resolver.resolve(bodies, DT), 0u);
    BOOST_CHECK_EQUAL(bodies[0].velocity.getX(), 3.0f);
    BOOST_CHECK_EQUAL(bodies[0].velocity.getY(), 1.0f);
    BOOST_CHECK_EQUAL(bodies[1].velocity.getX(), -2.0f);
    BOOST_CHECK_EQUAL(bodies[1].velocity.getY(), 4.0f);
    BOOST_CHECK_EQUAL(bodies[1].position.getX(), 25.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PinnedBodyTests)

BOOST_AUTO_TEST_CASE(PinnedBodyNeverMoves) {
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f), makeBody(12.0f, 0.0f, 10.0f, -30.0f, 0.0f)};
    bodies[0].type = BodyType::IMMOVABLE;
    CollisionResolver resolver;
    resolver.resolve(bodies, DT);

    BOOST_CHECK_EQUAL(bodies[0].position.getX(), 0.0f);
    BOOST_CHECK_EQUAL(bodies[0].velocity.getX(), 0.0f);
    // Free partner takes the full impulse and is pushed clear
    BOOST_CHECK_GT(bodies[1].velocity.getX(), 0.0f);
    BOOST_CHECK_GE(bodies[1].position.getX(), 20.0f - 0.001f);
}

BOOST_AUTO_TEST_CASE(ChainAgainstPinnedBodyMovesOnlyFreeBodies) {
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f), makeBody(15.0f, 0.0f, 10.0f),
                           makeBody(30.0f, 0.0f, 10.0f)};
    bodies[0].type = BodyType::IMMOVABLE;
    CollisionResolver resolver;
    resolver.resolve(bodies, DT);

    BOOST_CHECK_EQUAL(bodies[0].position.getX(), 0.0f);
    BOOST_CHECK_GE(bodies[1].position.getX(), 20.0f - 0.01f);
    BOOST_CHECK_GE(bodies[2].position.getX() - bodies[1].position.getX(), 20.0f - 0.01f);
}

BOOST_AUTO_TEST_CASE(TwoPinnedBodiesAreSkipped) {
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f), makeBody(5.0f, 0.0f, 10.0f)};
    bodies[0].type = BodyType::GRABBED;
    bodies[1].type = BodyType::IMMOVABLE;
    CollisionResolver resolver;

    BOOST_CHECK_EQUAL(resolver.resolve(bodies, DT), 0u);
    BOOST_CHECK_EQUAL(bodies[1].position.getX(), 5.0f);
}

BOOST_AUTO_TEST_CASE(WriteBackSkipsPinnedParticles) {
    Particle particle;
    particle.rest = Vector2D(10.0f, 10.0f);
    particle.isGrabbed = true;

    CollisionBody body = CollisionBody::fromParticle(particle);
    BOOST_CHECK(body.type == BodyType::GRABBED);
    body.position = Vector2D(99.0f, 99.0f);
    body.swayLimit = 0.0f;
    body.writeBack(particle);

    BOOST_CHECK_EQUAL(particle.rest.getX(), 10.0f);
    BOOST_CHECK_EQUAL(particle.swayLimit, 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SettingsTests)

BOOST_AUTO_TEST_CASE(DisabledCollisionsLeaveBodiesAlone) {
    CollisionSettings settings;
    settings.enabled = false;
    CollisionResolver resolver(settings);

    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f, 10.0f, 0.0f), makeBody(5.0f, 0.0f, 10.0f)};
    BOOST_CHECK_EQUAL(resolver.resolve(bodies, DT), 0u);
    BOOST_CHECK_EQUAL(bodies[0].position.getX(), 0.0f);
    BOOST_CHECK_EQUAL(bodies[1].position.getX(), 5.0f);
    BOOST_CHECK_EQUAL(bodies[0].velocity.getX(), 10.0f);
}

BOOST_AUTO_TEST_CASE(CheckRadiusSkipsFarPairs) {
    CollisionSettings settings;
    settings.checkRadius = 5.0f;
    CollisionResolver resolver(settings);

    // Overlapping by radius, but farther apart than the check radius
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 10.0f), makeBody(8.0f, 0.0f, 10.0f)};
    BOOST_CHECK_EQUAL(resolver.resolve(bodies, DT), 0u);
}

BOOST_AUTO_TEST_CASE(SwayLimitShrinksWhenSwingWouldOverlap) {
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 5.0f), makeBody(12.0f, 0.0f, 5.0f)};
    // Next frame A's swing carries it about 12 px right, onto B
    bodies[0].sway = 30.0f;
    bodies[0].freq = 1.0f;
    bodies[0].phase = 0.41f;
    CollisionResolver resolver;
    resolver.limitSway(bodies, DT);

    BOOST_CHECK_LT(bodies[0].swayLimit, 1.0f);
    BOOST_CHECK_GE(bodies[0].swayLimit, 0.0f);
}

BOOST_AUTO_TEST_CASE(SwayLimitResetsForGrabbedBodies) {
    CollisionBodies bodies{makeBody(0.0f, 0.0f, 5.0f)};
    bodies[0].type = BodyType::GRABBED;
    bodies[0].swayLimit = 1.0f;
    CollisionResolver resolver;
    resolver.limitSway(bodies, DT);
    BOOST_CHECK_EQUAL(bodies[0].swayLimit, 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()
