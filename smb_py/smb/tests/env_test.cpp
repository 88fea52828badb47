#include "env.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "fake_console.hpp"

using namespace SMB;

namespace {

EnvConfig singleStage(int world, int stage)
{
    EnvConfig config;
    config.has_target = true;
    config.target_world = world;
    config.target_stage = stage;
    return config;
}

void expectStartOfStage(const StepInfo& info, int world, int stage)
{
    EXPECT_EQ(info.coins, 0);
    EXPECT_FALSE(info.flag_get);
    EXPECT_EQ(info.life, 2);
    EXPECT_EQ(info.score, 0);
    EXPECT_EQ(info.stage, stage);
    EXPECT_EQ(info.status, "small");
    EXPECT_EQ(info.time, 400);
    EXPECT_EQ(info.world, world);
    EXPECT_EQ(info.x_pos, 40);
    EXPECT_EQ(info.y_pos, 79);
    EXPECT_EQ(info.x_speed, 0);
    EXPECT_EQ(info.y_speed, 0);
}

void construct(Console& console, const EnvConfig& config)
{
    SuperMarioBrosEnv env(console, config);
}

bool sameInfo(const StepInfo& lhs, const StepInfo& rhs)
{
    return lhs.coins == rhs.coins && lhs.flag_get == rhs.flag_get && lhs.life == rhs.life
        && lhs.score == rhs.score && lhs.stage == rhs.stage && lhs.status == rhs.status
        && lhs.time == rhs.time && lhs.world == rhs.world && lhs.x_pos == rhs.x_pos
        && lhs.y_pos == rhs.y_pos && lhs.x_speed == rhs.x_speed && lhs.y_speed == rhs.y_speed;
}

} // namespace

TEST(EnvTest, SingleStageResetThenNoopStep)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console, singleStage(1, 1));
    EXPECT_TRUE(env.is_single_stage_env());

    const Observation observation = env.reset();
    EXPECT_EQ(observation.size(), static_cast<size_t>(SCREEN_HEIGHT * SCREEN_WIDTH * SCREEN_CHANNELS));

    const StepResult result = env.step(Button::NOOP);
    expectStartOfStage(result.info, 1, 1);
    EXPECT_EQ(result.reward, 0.0);
    EXPECT_FALSE(result.terminated);
    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(env.get_steps(), 1);
}

TEST(EnvTest, FullGameResetThenNoopStep)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console);
    EXPECT_FALSE(env.is_single_stage_env());

    env.reset();
    const StepResult result = env.step(Button::NOOP);
    expectStartOfStage(result.info, 1, 1);
    EXPECT_FALSE(result.terminated);
}

TEST(EnvTest, SingleStageStartsAtTheTarget)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console, singleStage(4, 2));
    EXPECT_EQ(env.get_target().area, 3);

    env.reset();
    const StepResult result = env.step(Button::NOOP);
    expectStartOfStage(result.info, 4, 2);
    EXPECT_EQ(env.game_state().area, 3);
}

TEST(EnvTest, MovingRightEarnsTheDistance)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console, singleStage(1, 1));
    env.reset();

    for (int i = 1; i <= 3; i++) {
        const StepResult result = env.step(Button::RIGHT);
        EXPECT_EQ(result.reward, 2.0);
        EXPECT_EQ(result.info.x_pos, 40 + 2 * i);
        EXPECT_EQ(result.info.x_speed, 2);
        EXPECT_EQ(result.info.y_speed, 0);
    }
}

TEST(EnvTest, ClockTickCostsOnePoint)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console, singleStage(1, 1));
    env.reset();

    // the start screen ends one frame after the first tick
    const int ticks = ScriptedGame::TICK_FRAMES;
    double total = 0;
    StepResult result;
    for (int i = 0; i < ticks - 1; i++) {
        result = env.step(Button::NOOP);
        total += result.reward;
    }
    EXPECT_EQ(total, -1.0);
    EXPECT_EQ(result.info.time, 399);
}

TEST(EnvTest, DyingEndsASingleStageEpisode)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console, singleStage(1, 1));
    env.reset();

    console.ram[RAM::Y_VIEWPORT] = 2;
    const StepResult result = env.step(Button::NOOP);
    EXPECT_TRUE(result.terminated);
    EXPECT_FALSE(result.truncated);
    EXPECT_EQ(result.reward, -25.0);
    EXPECT_TRUE(env.is_done());
    // no skipping once the episode is over
    EXPECT_EQ(decode_player_state(console), PlayerState::Normal);

    EXPECT_THROW(env.step(Button::NOOP), std::logic_error);
}

TEST(EnvTest, DyingInTheFullGameSkipsTheAnimation)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console);
    env.reset();

    console.ram[RAM::PLAYER_STATE] = static_cast<SMB_Byte>(PlayerState::Dying);
    const StepResult result = env.step(Button::NOOP);
    EXPECT_FALSE(result.terminated);
    EXPECT_EQ(result.reward, -25.0);
    EXPECT_TRUE(is_dead(console));
}

TEST(EnvTest, GameOverEndsTheFullGame)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console);
    env.reset();

    console.ram[RAM::LIFE] = RAM::LIFE_GAME_OVER;
    const StepResult result = env.step(Button::NOOP);
    EXPECT_TRUE(result.terminated);
    EXPECT_EQ(result.info.life, 255);
}

TEST(EnvTest, FlagpoleEndsASingleStageEpisode)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console, singleStage(1, 1));
    env.reset();

    console.ram[RAM::ENEMY_TYPES[2]] = RAM::ENEMY_FLAGPOLE;
    console.ram[RAM::PLAYER_FLOAT_STATE] = RAM::FLOAT_STATE_FLAGPOLE;
    const StepResult result = env.step(Button::NOOP);
    EXPECT_TRUE(result.terminated);
    EXPECT_TRUE(result.info.flag_get);
}

TEST(EnvTest, EndOfWorldIsSkippedInTheFullGame)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console);
    env.reset();

    console.ram[RAM::GAME_MODE] = RAM::GAME_MODE_END_OF_WORLD;
    const StepResult result = env.step(Button::NOOP);
    EXPECT_TRUE(result.info.flag_get);
    EXPECT_FALSE(result.terminated);

    const GameState state = env.game_state();
    EXPECT_FALSE(state.is_world_over);
    EXPECT_EQ(state.world, 2);
    EXPECT_EQ(state.time, 401);
}

TEST(EnvTest, MaxEpisodeStepsTruncates)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    EnvConfig config = singleStage(1, 1);
    config.max_episode_steps = 3;
    SuperMarioBrosEnv env(console, config);
    env.reset();

    EXPECT_FALSE(env.step(Button::NOOP).truncated);
    EXPECT_FALSE(env.step(Button::NOOP).truncated);
    const StepResult result = env.step(Button::NOOP);
    EXPECT_TRUE(result.truncated);
    EXPECT_FALSE(result.terminated);
    EXPECT_THROW(env.step(Button::NOOP), std::logic_error);

    env.reset();
    EXPECT_EQ(env.get_steps(), 0);
    EXPECT_FALSE(env.step(Button::NOOP).truncated);
}

TEST(EnvTest, TruncateFunctionSeesRewardAndInfo)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    EnvConfig config = singleStage(1, 1);
    std::vector<double> rewards;
    config.truncate_function = [&rewards](const SuperMarioBrosEnv& env, double reward, const StepInfo& info) {
        EXPECT_TRUE(env.is_single_stage_env());
        rewards.push_back(reward);
        return info.x_pos >= 44;
    };
    SuperMarioBrosEnv env(console, config);
    env.reset();

    EXPECT_FALSE(env.step(Button::RIGHT).truncated);
    EXPECT_TRUE(env.step(Button::RIGHT).truncated);
    EXPECT_EQ(rewards, (std::vector<double>{2.0, 2.0}));
}

TEST(EnvTest, TrajectoriesAreDeterministic)
{
    const SMB_Byte actions[] = {
        Button::RIGHT, Button::RIGHT, Button::NOOP, Button::RIGHT | Button::A,
        Button::LEFT, Button::RIGHT, Button::NOOP, Button::RIGHT,
    };

    FakeConsole firstConsole;
    ScriptedGame firstGame;
    firstGame.attach(firstConsole);
    SuperMarioBrosEnv first(firstConsole, singleStage(1, 1));

    FakeConsole secondConsole;
    ScriptedGame secondGame;
    secondGame.attach(secondConsole);
    SuperMarioBrosEnv second(secondConsole, singleStage(1, 1));

    EXPECT_EQ(first.reset(), second.reset());
    for (int repeat = 0; repeat < 5; repeat++) {
        for (SMB_Byte action : actions) {
            const StepResult a = first.step(action);
            const StepResult b = second.step(action);
            EXPECT_EQ(a.reward, b.reward);
            EXPECT_EQ(a.terminated, b.terminated);
            EXPECT_TRUE(sameInfo(a.info, b.info));
            EXPECT_TRUE(first.game_state() == second.game_state());
        }
    }
    EXPECT_EQ(firstConsole.actions, secondConsole.actions);
}

TEST(EnvTest, ResetStartsAFreshEpisode)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console, singleStage(1, 1));
    env.reset();
    for (int i = 0; i < 10; i++)
        env.step(Button::RIGHT);

    console.ram[RAM::Y_VIEWPORT] = 2;
    EXPECT_TRUE(env.step(Button::NOOP).terminated);

    env.reset();
    EXPECT_EQ(console.resets, 2);
    EXPECT_FALSE(env.is_done());
    const StepResult result = env.step(Button::NOOP);
    expectStartOfStage(result.info, 1, 1);
    EXPECT_EQ(result.reward, 0.0);
}

TEST(EnvTest, BackToBackResetsStartTheSameStage)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console, singleStage(4, 2));

    const Observation first = env.reset();
    const Observation second = env.reset();
    EXPECT_EQ(console.resets, 2);
    EXPECT_EQ(first, second);
    EXPECT_EQ(env.get_steps(), 0);

    const StepResult result = env.step(Button::NOOP);
    expectStartOfStage(result.info, 4, 2);
    EXPECT_EQ(result.reward, 0.0);
}

TEST(EnvTest, TruncateFunctionCanInspectTheGameState)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    EnvConfig config = singleStage(1, 1);
    config.truncate_function = [](const SuperMarioBrosEnv& env, double, const StepInfo& info) {
        const GameState state = env.game_state();
        EXPECT_EQ(state.x_position, info.x_pos);
        return state.score > 1000000;
    };
    SuperMarioBrosEnv env(console, config);
    env.reset();

    EXPECT_FALSE(env.step(Button::NOOP).truncated);
    for (int i = 0; i < RAM::SCORE_DIGITS; i++)
        console.ram[RAM::SCORE + i] = 200;
    const StepResult result = env.step(Button::NOOP);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.info.score, INT64_C(200200200200200200));
}

TEST(EnvTest, LifecycleMisuseThrows)
{
    FakeConsole console;
    ScriptedGame game;
    game.attach(console);
    SuperMarioBrosEnv env(console);

    EXPECT_THROW(env.step(Button::NOOP), std::logic_error);

    env.reset(42u);
    env.close();
    EXPECT_TRUE(console.closed);
    EXPECT_THROW(env.close(), std::logic_error);
    EXPECT_THROW(env.reset(), std::logic_error);
    EXPECT_THROW(env.step(Button::NOOP), std::logic_error);
}

TEST(EnvTest, InvalidConfigurationThrows)
{
    FakeConsole console;
    EXPECT_THROW(construct(console, singleStage(9, 1)), std::invalid_argument);
    EXPECT_THROW(construct(console, singleStage(1, 5)), std::invalid_argument);

    EnvConfig lostLevels;
    lostLevels.lost_levels = true;
    lostLevels.rom_mode = RomMode::Pixel;
    EXPECT_THROW(construct(console, lostLevels), std::invalid_argument);

    EnvConfig negativeSteps;
    negativeSteps.max_episode_steps = -1;
    EXPECT_THROW(construct(console, negativeSteps), std::invalid_argument);
}

TEST(EnvTest, RewardRangeIsDeclared)
{
    EXPECT_EQ(SuperMarioBrosEnv::reward_range().first, -15.0);
    EXPECT_EQ(SuperMarioBrosEnv::reward_range().second, 15.0);
}
