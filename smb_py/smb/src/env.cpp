//  Program:      smb-py
//  File:         env.cpp
//  Description:  An episodic environment for Super Mario Bros.
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#include <stdexcept>
#include "env.hpp"
#include "log.hpp"

namespace SMB {

namespace {

TargetConfig resolve_target(const EnvConfig& config) {
    // validate the variant even though the console was built by the caller
    rom_filename(config.lost_levels, config.rom_mode);
    if (!config.has_target)
        return TargetConfig::full_game();
    return decode_target(config.target_world, config.target_stage, config.lost_levels);
}

}  // namespace

SuperMarioBrosEnv::SuperMarioBrosEnv(Console& console, const EnvConfig& config) :
    console(console),
    config(config),
    target(resolve_target(config)),
    skip(console, target, config.skip_frame_limit),
    rewards(),
    x_last(0),
    y_last(0),
    steps(0),
    has_reset(false),
    done(false),
    closed(false) {
    if (config.max_episode_steps < 0)
        throw std::invalid_argument("max_episode_steps must be positive, got " +
            std::to_string(config.max_episode_steps));
    if (target.single_stage)
        devlog::info<grp::env>("playing world {} stage {} (area {}) of {}",
            target.world, target.stage, target.area,
            rom_filename(config.lost_levels, config.rom_mode));
    else
        devlog::info<grp::env>("playing the full game of {}",
            rom_filename(config.lost_levels, config.rom_mode));
}

GameState SuperMarioBrosEnv::game_state() const {
    return decode_game_state(console);
}

StepInfo SuperMarioBrosEnv::get_info(const GameState& state) const {
    StepInfo info;
    info.coins = state.coins;
    info.flag_get = state.flag_get;
    info.life = state.life;
    info.score = state.score;
    info.stage = state.stage;
    info.status = status_name(state.status);
    info.time = state.time;
    info.world = state.world;
    info.x_pos = state.x_position;
    info.y_pos = state.y_position;
    info.x_speed = state.x_position - x_last;
    info.y_speed = state.y_position - y_last;
    return info;
}

bool SuperMarioBrosEnv::get_terminated(const GameState& state) const {
    if (is_single_stage_env())
        return state.is_dying || state.is_dead || state.flag_get;
    return state.is_game_over;
}

bool SuperMarioBrosEnv::get_truncated(double reward, const StepInfo& info) const {
    if (config.max_episode_steps > 0 && steps >= config.max_episode_steps)
        return true;
    if (config.truncate_function)
        return config.truncate_function(*this, reward, info);
    return false;
}

Observation SuperMarioBrosEnv::reset() {
    if (closed)
        throw std::logic_error("cannot reset a closed environment");
    rewards.reset_time(0);
    console.reset();
    skip.skip_start_screen();
    const GameState state = decode_game_state(console);
    rewards.reset_time(state.time);
    x_last = state.x_position;
    y_last = state.y_position;
    steps = 0;
    has_reset = true;
    done = false;
    devlog::debug<grp::env>("reset to world {} stage {} with {} time at x {}",
        state.world, state.stage, state.time, state.x_position);
    return console.screen();
}

Observation SuperMarioBrosEnv::reset(uint64_t seed) {
    devlog::debug<grp::env>("reset with seed {}", seed);
    return reset();
}

StepResult SuperMarioBrosEnv::step(SMB_Byte action) {
    if (closed)
        throw std::logic_error("cannot step a closed environment");
    if (!has_reset)
        throw std::logic_error("cannot step before the environment is reset! call `reset`");
    if (done)
        throw std::logic_error("cannot step in a done environment! call `reset`");

    x_last = decode_x_position(console);
    y_last = decode_y_position(console);
    console.frame_advance(action);
    const GameState state = decode_game_state(console);

    StepResult result;
    result.reward = rewards.reward(state, x_last);
    result.terminated = get_terminated(state);
    result.info = get_info(state);
    steps++;
    result.truncated = get_truncated(result.reward, result.info);
    done = result.terminated || result.truncated;
    // a reset is coming if the episode is over, no need to skip anything
    if (!done)
        skip.after_step();
    else
        devlog::debug<grp::env>("episode over after {} steps (terminated={}, truncated={})",
            steps, result.terminated, result.truncated);
    result.observation = console.screen();
    return result;
}

void SuperMarioBrosEnv::close() {
    if (closed)
        throw std::logic_error("env has already been closed");
    console.close();
    closed = true;
}

}  // namespace SMB
