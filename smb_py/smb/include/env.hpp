//  Program:      smb-py
//  File:         env.hpp
//  Description:  An episodic environment for Super Mario Bros.
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_ENV_HPP
#define SMB_ENV_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include "common.hpp"
#include "console.hpp"
#include "game_state.hpp"
#include "reward.hpp"
#include "skip_controller.hpp"
#include "target.hpp"

namespace SMB {

/// Auxiliary information returned by a step.
struct StepInfo {
    int coins;
    bool flag_get;
    int life;
    /// up to 18 digits when the score bytes hold values above 9
    int64_t score;
    int stage;
    /// "small", "tall", or "fireball"
    std::string status;
    int time;
    int world;
    int x_pos;
    int y_pos;
    /// the change in x_pos over the step
    int x_speed;
    /// the change in y_pos over the step
    int y_speed;
};

/// The result of a step.
struct StepResult {
    /// the screen after the step
    Observation observation;
    double reward;
    /// the episode ended in the game (death, flag, or game over)
    bool terminated;
    /// the episode was cut short by the step limit or truncate function
    bool truncated;
    StepInfo info;
};

class SuperMarioBrosEnv;

/// Decide if an episode should be truncated after a step.
///
/// Called with the environment, the reward of the step and its info.
typedef std::function<bool(const SuperMarioBrosEnv&, double, const StepInfo&)> TruncateFunction;

/// Options of an environment, fixed at construction.
struct EnvConfig {
    /// the graphical variant of the ROM the console runs
    RomMode rom_mode = RomMode::Vanilla;
    /// whether the console runs the lost levels instead of the original game
    bool lost_levels = false;
    /// whether to play the single stage (target_world, target_stage)
    bool has_target = false;
    int target_world = 0;
    int target_stage = 0;
    /// the number of steps after which an episode is truncated, 0 for no limit
    int max_episode_steps = 0;
    /// an optional extra truncation condition
    TruncateFunction truncate_function;
    /// the most frames a skip loop may run before giving up, 0 for no limit
    unsigned skip_frame_limit = SkipController::DEFAULT_FRAME_LIMIT;
};

/// An environment for playing Super Mario Bros. one frame per step.
class SuperMarioBrosEnv {
 private:
    /// the emulator the game runs in
    Console& console;
    /// the options of the environment
    EnvConfig config;
    /// the single stage to play, if any
    TargetConfig target;
    /// the skip sequences over the console
    SkipController skip;
    /// the reward terms, including the clock at the last step
    RewardEngine rewards;
    /// the x position before the last step
    int x_last;
    /// the y position before the last step
    int y_last;
    /// the number of steps since the last reset
    int steps;
    /// whether reset was called since construction
    bool has_reset;
    /// whether the episode ended and reset is required
    bool done;
    /// whether the console was closed
    bool closed;

    /// Build the info record of a step.
    StepInfo get_info(const GameState& state) const;

    /// Return true if the episode is over in the game.
    bool get_terminated(const GameState& state) const;

    /// Return true if the step limit or truncate function cuts the episode.
    bool get_truncated(double reward, const StepInfo& info) const;

 public:
    /// Initialize a new environment.
    ///
    /// @param console the emulator running the ROM named by
    ///        rom_filename(config.lost_levels, config.rom_mode); it must
    ///        outlive the environment
    /// @param config the options of the environment
    /// @throws std::invalid_argument if the target or the step limit is invalid
    ///
    SuperMarioBrosEnv(Console& console, const EnvConfig& config = EnvConfig());

    /// Return the nominal range of the reward of a step.
    static std::pair<double, double> reward_range() { return REWARD_RANGE; }

    /// Return true if this environment plays a single stage.
    inline bool is_single_stage_env() const { return target.single_stage; }

    /// Return the stage this environment plays.
    inline const TargetConfig& get_target() const { return target; }

    /// Return the options of this environment.
    inline const EnvConfig& get_config() const { return config; }

    /// Return the number of steps since the last reset.
    inline int get_steps() const { return steps; }

    /// Return true if the episode is over and a reset is required.
    inline bool is_done() const { return done; }

    /// Decode the current RAM.
    GameState game_state() const;

    /// Reset the console and skip to the first controllable frame.
    ///
    /// @return the first screen of the episode
    /// @throws std::logic_error if the environment was closed
    /// @throws StuckEmulatorError if the start screen can't be skipped
    ///
    Observation reset();

    /// Reset with a seed. The game is deterministic, the seed is only logged.
    Observation reset(uint64_t seed);

    /// Run one frame with the given joypad bitmask.
    ///
    /// @param action the bitmask of pressed buttons
    /// @return the screen, reward, termination and truncation flags, and info
    /// @throws std::logic_error if the environment needs a reset or was closed
    /// @throws StuckEmulatorError if a skip loop doesn't finish
    ///
    StepResult step(SMB_Byte action);

    /// Close the console.
    ///
    /// @throws std::logic_error if the environment was already closed
    ///
    void close();
};

}  // namespace SMB

#endif  // SMB_ENV_HPP
