#include <JumpDash/Game/Character.hpp>
#include <gtest/gtest.h>
#include <vector>

using namespace JumpDash::Game;

class CharacterTest : public ::testing::Test {
protected:
    CharacterTest()
        : layout(config)
        , character(config, layout, &events) {
    }

    // Tick until the character is back on the ground, with a safety cap
    int tickUntilLanded(int maxTicks = 200) {
        int ticks = 0;
        do {
            character.Update();
            ++ticks;
        } while (character.IsJumping() && ticks < maxTicks);
        return ticks;
    }

    GameConfig config;
    PlayfieldLayout layout;
    EventBus events;
    Character character;
};

TEST_F(CharacterTest, StartsAtRestOnGround) {
    EXPECT_FLOAT_EQ(character.GetY(), config.groundLevel);
    EXPECT_FLOAT_EQ(character.GetVelocityY(), 0.0f);
    EXPECT_FALSE(character.IsJumping());
    EXPECT_TRUE(character.IsGrounded());
    EXPECT_EQ(character.GetCoyoteCounter(), config.coyoteFrames);
}

TEST_F(CharacterTest, GroundedUpdateStaysPut) {
    for (int i = 0; i < 10; ++i) {
        character.Update();
    }
    EXPECT_FLOAT_EQ(character.GetY(), config.groundLevel);
    EXPECT_FLOAT_EQ(character.GetVelocityY(), 0.0f);
    EXPECT_EQ(character.GetCoyoteCounter(), config.coyoteFrames);
}

TEST_F(CharacterTest, JumpFromGroundSetsImpulse) {
    int jumped = 0;
    events.Subscribe(GameEvent::Jumped, [&]() { ++jumped; });

    character.Jump();

    EXPECT_FLOAT_EQ(character.GetVelocityY(), config.jumpPower);
    EXPECT_TRUE(character.IsJumping());
    EXPECT_EQ(character.GetCoyoteCounter(), 0);
    EXPECT_EQ(jumped, 1);
}

TEST_F(CharacterTest, FirstAirborneTickIntegratesGravity) {
    character.Jump();
    character.Update();

    float expectedVelocity = config.jumpPower + config.gravity;
    EXPECT_FLOAT_EQ(character.GetVelocityY(), expectedVelocity);
    EXPECT_FLOAT_EQ(character.GetY(), config.groundLevel + expectedVelocity);
}

TEST_F(CharacterTest, GraceWindowAllowsSecondJump) {
    character.Jump();
    character.Update();

    // Still on the baseline when the tick began, so the window was refilled
    ASSERT_TRUE(character.IsJumping());
    ASSERT_GT(character.GetCoyoteCounter(), 0);

    character.Jump();
    EXPECT_FLOAT_EQ(character.GetVelocityY(), config.jumpPower);
    EXPECT_TRUE(character.IsJumping());
    EXPECT_EQ(character.GetCoyoteCounter(), 0);
}

TEST_F(CharacterTest, AirborneJumpWithoutGraceIsIgnored) {
    character.Jump();
    character.Update();
    for (int i = 0; i < 20 && character.GetCoyoteCounter() > 0; ++i) {
        character.Update();
    }

    ASSERT_TRUE(character.IsJumping());
    ASSERT_EQ(character.GetCoyoteCounter(), 0);

    float y = character.GetY();
    float velocity = character.GetVelocityY();

    int jumped = 0;
    events.Subscribe(GameEvent::Jumped, [&]() { ++jumped; });
    character.Jump();

    EXPECT_FLOAT_EQ(character.GetY(), y);
    EXPECT_FLOAT_EQ(character.GetVelocityY(), velocity);
    EXPECT_TRUE(character.IsJumping());
    EXPECT_EQ(jumped, 0);
}

TEST_F(CharacterTest, LandingClampsAndSignalsOnce) {
    int landed = 0;
    events.Subscribe(GameEvent::Landed, [&]() { ++landed; });

    std::vector<std::pair<float, float>> landings;
    character.SetLandingCallback([&](float x, float y) { landings.emplace_back(x, y); });

    character.Jump();
    int ticks = tickUntilLanded();

    EXPECT_LT(ticks, 200);
    EXPECT_FALSE(character.IsJumping());
    EXPECT_FLOAT_EQ(character.GetY(), config.groundLevel);
    EXPECT_FLOAT_EQ(character.GetVelocityY(), 0.0f);
    EXPECT_EQ(landed, 1);

    ASSERT_EQ(landings.size(), 1u);
    AABB box = character.GetBoundingBox();
    EXPECT_FLOAT_EQ(landings[0].first, box.Left());
    EXPECT_FLOAT_EQ(landings[0].second, box.Top());

    // Further grounded ticks do not signal again
    character.Update();
    EXPECT_EQ(landed, 1);
}

TEST_F(CharacterTest, NeverBelowGroundAndStillWhenGrounded) {
    // Jump whenever allowed, and also mash jump mid-air
    for (int i = 0; i < 500; ++i) {
        if (i % 7 == 0) {
            character.Jump();
        }
        character.Update();

        ASSERT_GE(character.GetY(), config.groundLevel) << "tick " << i;
        if (character.IsGrounded()) {
            ASSERT_FLOAT_EQ(character.GetVelocityY(), 0.0f) << "tick " << i;
        }
        ASSERT_GE(character.GetCoyoteCounter(), 0);
    }
}

TEST_F(CharacterTest, GraceCounterRefillsOnLanding) {
    character.Jump();
    tickUntilLanded();

    // First grounded tick refills the window
    character.Update();
    EXPECT_EQ(character.GetCoyoteCounter(), config.coyoteFrames);
}

TEST_F(CharacterTest, ResetRestoresRest) {
    character.Jump();
    character.Update();
    character.Reset();

    EXPECT_FLOAT_EQ(character.GetY(), config.groundLevel);
    EXPECT_FLOAT_EQ(character.GetVelocityY(), 0.0f);
    EXPECT_FALSE(character.IsJumping());
    EXPECT_EQ(character.GetCoyoteCounter(), config.coyoteFrames);
}

TEST_F(CharacterTest, BoundingBoxFollowsHeight) {
    AABB grounded = character.GetBoundingBox();
    EXPECT_FLOAT_EQ(grounded.Left(), config.characterX);
    EXPECT_FLOAT_EQ(grounded.Right(), config.characterX + config.characterWidth);
    EXPECT_FLOAT_EQ(grounded.Bottom(), config.playfieldHeight - config.groundLevel);
    EXPECT_FLOAT_EQ(grounded.Top(), grounded.Bottom() - config.characterHeight);

    character.Jump();
    character.Update();
    EXPECT_LT(character.GetBoundingBox().Bottom(), grounded.Bottom());
}
