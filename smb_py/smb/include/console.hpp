//  Program:      smb-py
//  File:         console.hpp
//  Description:  The capability interface the environment needs from an emulator
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_CONSOLE_HPP
#define SMB_CONSOLE_HPP

#include "common.hpp"

namespace SMB {

/// An emulated NES as seen by the environment.
///
/// The console owns RAM; the environment reads it every frame and writes to
/// a handful of addresses to skip cutscenes. Implementations are adapters
/// over a concrete emulator.
class Console {
 public:
    virtual ~Console() = default;

    /// Read a byte of RAM.
    ///
    /// @param address the 16-bit address to read from
    /// @return the byte at the given address
    ///
    virtual SMB_Byte read(SMB_Address address) const = 0;

    /// Write a byte of RAM.
    ///
    /// @param address the 16-bit address to write to
    /// @param value the byte to write
    ///
    virtual void write(SMB_Address address, SMB_Byte value) = 0;

    /// Run exactly one frame with the given joypad bitmask on player 1.
    virtual void frame_advance(SMB_Byte action) = 0;

    /// Power cycle the console.
    virtual void reset() = 0;

    /// Release the emulator.
    virtual void close() = 0;

    /// Return a copy of the current screen as SCREEN_HEIGHT x SCREEN_WIDTH x 3 RGB.
    virtual Observation screen() const = 0;
};

}  // namespace SMB

#endif  // SMB_CONSOLE_HPP
