//  Program:      smb-py
//  File:         game_state.hpp
//  Description:  Decoding of Super Mario Bros. RAM into game state
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_GAME_STATE_HPP
#define SMB_GAME_STATE_HPP

#include <cstdint>
#include <string>
#include "common.hpp"
#include "console.hpp"
#include "ram_map.hpp"

namespace SMB {

/// The power-up status of the player.
enum class PlayerStatus {
    Small,
    Tall,
    Fireball
};

/// Return the name of a status as reported in the step info ("small", ...).
const char* status_name(PlayerStatus status);

/// The semantic state of the game at one frame.
struct GameState {
    /// the world (1 to 8, 1 to 12 on the lost levels)
    int world;
    /// the stage in the world (1 to 4)
    int stage;
    /// the area in the world (1 to 5)
    int area;
    /// world_index * 4 + stage_index, zero based
    int level;
    /// the horizontal position in the stage
    int x_position;
    /// the number of pixels from the left of the screen
    int left_x_position;
    /// the vertical position, above the floor is positive
    int y_position;
    /// the raw viewport indicator
    SMB_Byte y_viewport;
    PlayerStatus status;
    PlayerState player_state;
    /// the remaining lives, 0xFF once the game is over
    int life;
    int64_t score;
    int coins;
    int time;
    bool is_dying;
    bool is_dead;
    bool is_game_over;
    bool is_busy;
    bool is_world_over;
    bool is_stage_over;
    /// the player reached a flag or finished a world
    bool flag_get;
};

bool operator==(const GameState& lhs, const GameState& rhs);
inline bool operator!=(const GameState& lhs, const GameState& rhs) { return !(lhs == rhs); }

/// Read a counter stored as one decimal digit per byte.
///
/// @param console the console to read RAM from
/// @param address the address of the most significant digit
/// @param length the number of digits
/// @return the integer value of the digits read left to right
///
int64_t read_digits(const Console& console, SMB_Address address, int length);

int decode_world(const Console& console);
int decode_stage(const Console& console);
int decode_area(const Console& console);
int decode_level(const Console& console);
int64_t decode_score(const Console& console);
int decode_time(const Console& console);
int decode_coins(const Console& console);
int decode_life(const Console& console);

/// Return the horizontal position (page * 256 + x).
int decode_x_position(const Console& console);

/// Return the number of pixels between the player and the left of the screen.
int decode_left_x_position(const Console& console);

/// Return the vertical position keyed by the viewport indicator.
///
/// Above the viewport the position overflows past 255, below it the position
/// goes negative.
///
int decode_y_position(const Console& console);

PlayerStatus decode_player_status(const Console& console);
PlayerState decode_player_state(const Console& console);

bool is_dying(const Console& console);
bool is_dead(const Console& console);
bool is_game_over(const Console& console);
bool is_busy(const Console& console);
bool is_world_over(const Console& console);

/// Return true if the player is sliding down the flagpole or beating Bowser.
///
/// The float state alone also reads 3 on a vine, so a Bowser or flagpole
/// enemy has to be present in one of the enemy slots.
///
bool is_stage_over(const Console& console);

bool flag_get(const Console& console);

/// Decode every field of the game state from the current RAM.
GameState decode_game_state(const Console& console);

}  // namespace SMB

#endif  // SMB_GAME_STATE_HPP
