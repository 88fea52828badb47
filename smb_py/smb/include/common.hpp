//  Program:      smb-py
//  File:         common.hpp
//  Description:  This file defines common types used in the project
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_COMMON_HPP
#define SMB_COMMON_HPP

#include <cstdint>
#include <vector>

namespace SMB {

/// A shortcut for a byte
typedef uint8_t SMB_Byte;
/// A shortcut for a memory address (16-bit)
typedef uint16_t SMB_Address;
/// A single frame of the screen as packed RGB bytes (row major)
typedef std::vector<SMB_Byte> Observation;

/// the height of the NES screen in pixels
const int SCREEN_HEIGHT = 240;
/// the width of the NES screen in pixels
const int SCREEN_WIDTH = 256;
/// the number of color channels in an observation
const int SCREEN_CHANNELS = 3;

/// Bits of the NES joypad as they appear in an action bitmask.
namespace Button {
    const SMB_Byte A = 0x01;
    const SMB_Byte B = 0x02;
    const SMB_Byte SELECT = 0x04;
    const SMB_Byte START = 0x08;
    const SMB_Byte UP = 0x10;
    const SMB_Byte DOWN = 0x20;
    const SMB_Byte LEFT = 0x40;
    const SMB_Byte RIGHT = 0x80;
    /// no buttons pressed
    const SMB_Byte NOOP = 0x00;
}  // namespace Button

}  // namespace SMB

#endif  // SMB_COMMON_HPP
