//  Program:      smb-py
//  File:         target.hpp
//  Description:  ROM variants and the stage targeted by a single stage env
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_TARGET_HPP
#define SMB_TARGET_HPP

#include <string>

namespace SMB {

/// The graphical variants of the Super Mario Bros. ROM.
enum class RomMode {
    Vanilla,
    Downsample,
    Pixel,
    Rectangle
};

/// Parse a ROM mode by name ("vanilla", "downsample", "pixel", "rectangle").
///
/// @throws std::invalid_argument if the name is unknown
///
RomMode parse_rom_mode(const std::string& name);

/// Return the lower case name of a ROM mode.
const char* rom_mode_name(RomMode mode);

/// Return the file name of the ROM for a game and variant.
///
/// @param lost_levels whether to name the Lost Levels ROM instead of the original
/// @param mode the graphical variant
/// @throws std::invalid_argument if the Lost Levels have no such variant
///
std::string rom_filename(bool lost_levels, RomMode mode);

/// The stage a single stage environment plays, or the whole game.
struct TargetConfig {
    /// whether a single stage is targeted
    bool single_stage;
    /// the world (1 based)
    int world;
    /// the stage (1 based)
    int stage;
    /// the area in the world (1 based), accounts for intro areas
    int area;

    /// Return a target that plays the full game.
    static TargetConfig full_game() { return TargetConfig{false, 0, 0, 0}; }
};

/// Resolve a (world, stage) pair into a validated target.
///
/// @param world the world to play (1 to 8). The lost levels accept 1 to 12,
///        but worlds 5 and up are rejected as unsupported
/// @param stage the stage to play (1 to 4)
/// @param lost_levels whether the target is in the lost levels
/// @return the target including the area RAM uses for that stage
/// @throws std::invalid_argument if the pair is out of range or unsupported
///
TargetConfig decode_target(int world, int stage, bool lost_levels);

}  // namespace SMB

#endif  // SMB_TARGET_HPP
