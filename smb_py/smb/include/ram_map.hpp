//  Program:      smb-py
//  File:         ram_map.hpp
//  Description:  Addresses and codes of Super Mario Bros. work RAM
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_RAM_MAP_HPP
#define SMB_RAM_MAP_HPP

#include <array>
#include "common.hpp"

namespace SMB {

namespace RAM {

/// the size of the NES work RAM
const SMB_Address SIZE = 0x0800;

/// world index, zero based
const SMB_Address WORLD = 0x075F;
/// stage index within the world, zero based
const SMB_Address STAGE = 0x075C;
/// area index within the world, zero based
const SMB_Address AREA = 0x0760;

/// score as 6 single digit bytes
const SMB_Address SCORE = 0x07DE;
const int SCORE_DIGITS = 6;
/// time left as 3 single digit bytes
const SMB_Address TIME = 0x07F8;
const int TIME_DIGITS = 3;
/// coins as 2 single digit bytes
const SMB_Address COINS = 0x07ED;
const int COINS_DIGITS = 2;

/// lives remaining, 0xFF once the last life is lost
const SMB_Address LIFE = 0x075A;

/// the page (screen) the player is on
const SMB_Address X_PAGE = 0x006D;
/// the x pixel of the player within the page
const SMB_Address X_POSITION = 0x0086;
/// the x pixel of the left edge of the screen
const SMB_Address SCREEN_LEFT_X = 0x071C;
/// the y pixel of the player
const SMB_Address Y_PIXEL = 0x03B8;
/// 0 above the viewport, 1 inside, > 1 below (falling into a pit)
const SMB_Address Y_VIEWPORT = 0x00B5;

/// power-up status (0 small, 1 tall, 2 fireball)
const SMB_Address PLAYER_STATUS = 0x0756;
/// the player's engine routine, see PlayerState
const SMB_Address PLAYER_STATE = 0x000E;
/// 3 while sliding down the flagpole (and while climbing a vine)
const SMB_Address PLAYER_FLOAT_STATE = 0x001D;
const SMB_Byte FLOAT_STATE_FLAGPOLE = 3;

/// 0 demo, 1 standard, 2 end of world
const SMB_Address GAME_MODE = 0x0770;
const SMB_Byte GAME_MODE_END_OF_WORLD = 2;

/// the enemy type held by each of the five enemy slots
const std::array<SMB_Address, 5> ENEMY_TYPES = {{
    0x0016, 0x0017, 0x0018, 0x0019, 0x001A
}};
/// Bowser
const SMB_Byte ENEMY_BOWSER = 0x2D;
/// the flagpole flag
const SMB_Byte ENEMY_FLAGPOLE = 0x31;
/// enemies whose presence means the stage is ending (as opposed to a vine)
const std::array<SMB_Byte, 2> STAGE_OVER_ENEMIES = {{ENEMY_BOWSER, ENEMY_FLAGPOLE}};

/// delay before a freshly loaded stage becomes controllable
const SMB_Address PRELEVEL_TIMER = 0x07A0;
/// timer of the area change animation (pipes, flagpole, ...)
const SMB_Address CHANGE_AREA_TIMER = 0x06DE;

/// the value of LIFE once the game is over
const SMB_Byte LIFE_GAME_OVER = 0xFF;

}  // namespace RAM

/// The player's engine routine stored at RAM::PLAYER_STATE.
enum class PlayerState : SMB_Byte {
    LeftmostOfScreen = 0x00,
    ClimbingVine = 0x01,
    EnteringReversedLPipe = 0x02,
    GoingDownPipe = 0x03,
    AutoWalk = 0x04,
    AutoWalkEnd = 0x05,
    Dead = 0x06,
    EnteringArea = 0x07,
    Normal = 0x08,
    CannotMove = 0x09,
    Dying = 0x0B,
    PaletteCycling = 0x0C
};

/// player states in which input has no effect on the game
const std::array<PlayerState, 7> BUSY_STATES = {{
    PlayerState::LeftmostOfScreen,
    PlayerState::ClimbingVine,
    PlayerState::EnteringReversedLPipe,
    PlayerState::GoingDownPipe,
    PlayerState::AutoWalk,
    PlayerState::AutoWalkEnd,
    PlayerState::EnteringArea
}};

}  // namespace SMB

#endif  // SMB_RAM_MAP_HPP
