//  Program:      smb-py
//  File:         game_state.cpp
//  Description:  Decoding of Super Mario Bros. RAM into game state
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#include <algorithm>
#include <string>
#include "game_state.hpp"

namespace SMB {

const char* status_name(PlayerStatus status) {
    switch (status) {
        case PlayerStatus::Small: return "small";
        case PlayerStatus::Tall: return "tall";
        case PlayerStatus::Fireball: return "fireball";
    }
    return "fireball";
}

bool operator==(const GameState& lhs, const GameState& rhs) {
    return lhs.world == rhs.world
        && lhs.stage == rhs.stage
        && lhs.area == rhs.area
        && lhs.level == rhs.level
        && lhs.x_position == rhs.x_position
        && lhs.left_x_position == rhs.left_x_position
        && lhs.y_position == rhs.y_position
        && lhs.y_viewport == rhs.y_viewport
        && lhs.status == rhs.status
        && lhs.player_state == rhs.player_state
        && lhs.life == rhs.life
        && lhs.score == rhs.score
        && lhs.coins == rhs.coins
        && lhs.time == rhs.time
        && lhs.is_dying == rhs.is_dying
        && lhs.is_dead == rhs.is_dead
        && lhs.is_game_over == rhs.is_game_over
        && lhs.is_busy == rhs.is_busy
        && lhs.is_world_over == rhs.is_world_over
        && lhs.is_stage_over == rhs.is_stage_over
        && lhs.flag_get == rhs.flag_get;
}

int64_t read_digits(const Console& console, SMB_Address address, int length) {
    // each byte is rendered in decimal and the text is parsed as a whole, so
    // an out of range byte shifts the digits instead of carrying
    std::string digits;
    for (int i = 0; i < length; i++)
        digits += std::to_string(console.read(static_cast<SMB_Address>(address + i)));
    return std::stoll(digits);
}

int decode_world(const Console& console) {
    return console.read(RAM::WORLD) + 1;
}

int decode_stage(const Console& console) {
    return console.read(RAM::STAGE) + 1;
}

int decode_area(const Console& console) {
    return console.read(RAM::AREA) + 1;
}

int decode_level(const Console& console) {
    return console.read(RAM::WORLD) * 4 + console.read(RAM::STAGE);
}

int64_t decode_score(const Console& console) {
    return read_digits(console, RAM::SCORE, RAM::SCORE_DIGITS);
}

int decode_time(const Console& console) {
    return static_cast<int>(read_digits(console, RAM::TIME, RAM::TIME_DIGITS));
}

int decode_coins(const Console& console) {
    return static_cast<int>(read_digits(console, RAM::COINS, RAM::COINS_DIGITS));
}

int decode_life(const Console& console) {
    return console.read(RAM::LIFE);
}

int decode_x_position(const Console& console) {
    return console.read(RAM::X_PAGE) * 0x100 + console.read(RAM::X_POSITION);
}

int decode_left_x_position(const Console& console) {
    return (console.read(RAM::X_POSITION) - console.read(RAM::SCREEN_LEFT_X)) & 0xFF;
}

int decode_y_position(const Console& console) {
    const int viewport = console.read(RAM::Y_VIEWPORT);
    const int pixel = console.read(RAM::Y_PIXEL);
    // above the viewport (the score board area)
    if (viewport < 1)
        return 255 + (255 - pixel);
    // below the viewport (falling into a pit)
    if (viewport > 1)
        return -pixel - 1;
    // distance from the bottom of the screen
    return 255 - pixel;
}

PlayerStatus decode_player_status(const Console& console) {
    switch (console.read(RAM::PLAYER_STATUS)) {
        case 0: return PlayerStatus::Small;
        case 1: return PlayerStatus::Tall;
        default: return PlayerStatus::Fireball;
    }
}

PlayerState decode_player_state(const Console& console) {
    return static_cast<PlayerState>(console.read(RAM::PLAYER_STATE));
}

bool is_dying(const Console& console) {
    return decode_player_state(console) == PlayerState::Dying
        || console.read(RAM::Y_VIEWPORT) > 1;
}

bool is_dead(const Console& console) {
    return decode_player_state(console) == PlayerState::Dead;
}

bool is_game_over(const Console& console) {
    return console.read(RAM::LIFE) == RAM::LIFE_GAME_OVER;
}

bool is_busy(const Console& console) {
    const PlayerState state = decode_player_state(console);
    return std::find(BUSY_STATES.begin(), BUSY_STATES.end(), state) != BUSY_STATES.end();
}

bool is_world_over(const Console& console) {
    return console.read(RAM::GAME_MODE) == RAM::GAME_MODE_END_OF_WORLD;
}

bool is_stage_over(const Console& console) {
    for (SMB_Address address : RAM::ENEMY_TYPES) {
        const SMB_Byte enemy = console.read(address);
        if (std::find(RAM::STAGE_OVER_ENEMIES.begin(), RAM::STAGE_OVER_ENEMIES.end(), enemy)
                != RAM::STAGE_OVER_ENEMIES.end())
            return console.read(RAM::PLAYER_FLOAT_STATE) == RAM::FLOAT_STATE_FLAGPOLE;
    }
    return false;
}

bool flag_get(const Console& console) {
    return is_world_over(console) || is_stage_over(console);
}

GameState decode_game_state(const Console& console) {
    GameState state;
    state.world = decode_world(console);
    state.stage = decode_stage(console);
    state.area = decode_area(console);
    state.level = decode_level(console);
    state.x_position = decode_x_position(console);
    state.left_x_position = decode_left_x_position(console);
    state.y_position = decode_y_position(console);
    state.y_viewport = console.read(RAM::Y_VIEWPORT);
    state.status = decode_player_status(console);
    state.player_state = decode_player_state(console);
    state.life = decode_life(console);
    state.score = decode_score(console);
    state.coins = decode_coins(console);
    state.time = decode_time(console);
    state.is_dying = is_dying(console);
    state.is_dead = is_dead(console);
    state.is_game_over = is_game_over(console);
    state.is_busy = is_busy(console);
    state.is_world_over = is_world_over(console);
    state.is_stage_over = is_stage_over(console);
    state.flag_get = state.is_world_over || state.is_stage_over;
    return state;
}

}  // namespace SMB
