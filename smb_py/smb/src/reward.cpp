//  Program:      smb-py
//  File:         reward.cpp
//  Description:  The reward earned between two consecutive game states
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#include "reward.hpp"

namespace SMB {

const int RewardEngine::MAX_X_DELTA;
const int RewardEngine::DEATH_PENALTY;

int RewardEngine::x_reward(int x, int last_x) {
    const int delta = x - last_x;
    if (delta < -MAX_X_DELTA || delta > MAX_X_DELTA)
        return 0;
    return delta;
}

int RewardEngine::time_penalty(int time) {
    const int delta = time - time_last;
    time_last = time;
    if (delta > 0)
        return 0;
    return delta;
}

int RewardEngine::death_penalty(const GameState& state) {
    if (state.is_dying || state.is_dead)
        return DEATH_PENALTY;
    return 0;
}

int RewardEngine::reward(const GameState& state, int last_x) {
    return x_reward(state.x_position, last_x) + time_penalty(state.time) + death_penalty(state);
}

}  // namespace SMB
