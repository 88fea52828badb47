//  Program:      smb-py
//  File:         reward.hpp
//  Description:  The reward earned between two consecutive game states
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_REWARD_HPP
#define SMB_REWARD_HPP

#include <utility>
#include "game_state.hpp"

namespace SMB {

/// the nominal (not enforced) range of the reward of one step
const std::pair<double, double> REWARD_RANGE(-15.0, 15.0);

/// Rewards progress to the right and punishes the clock and dying.
class RewardEngine {
 private:
    /// the time left at the last evaluation of the time penalty
    int time_last;

 public:
    /// the largest x movement between two steps that still counts as movement
    static const int MAX_X_DELTA = 5;
    /// the reward for dying
    static const int DEATH_PENALTY = -25;

    RewardEngine() : time_last(0) { }

    /// Set the time the next time penalty is measured against.
    inline void reset_time(int time) { time_last = time; }

    /// Return the time the next time penalty is measured against.
    inline int get_time_last() const { return time_last; }

    /// Return the reward for moving from last_x to x.
    ///
    /// After a death or a reset x jumps back, deltas beyond MAX_X_DELTA are
    /// treated as such a discontinuity and earn nothing.
    ///
    static int x_reward(int x, int last_x);

    /// Return the reward for the clock ticking and remember the time.
    ///
    /// The clock only runs down; a positive delta comes from a reset and
    /// earns nothing. The time is remembered either way.
    ///
    int time_penalty(int time);

    /// Return DEATH_PENALTY if the player is dying or dead, 0 otherwise.
    static int death_penalty(const GameState& state);

    /// Return the full reward of a step.
    ///
    /// @param state the state after the step
    /// @param last_x the x position before the step
    ///
    int reward(const GameState& state, int last_x);
};

}  // namespace SMB

#endif  // SMB_REWARD_HPP
