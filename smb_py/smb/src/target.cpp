//  Program:      smb-py
//  File:         target.cpp
//  Description:  ROM variants and the stage targeted by a single stage env
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#include <stdexcept>
#include "log.hpp"
#include "target.hpp"

namespace SMB {

RomMode parse_rom_mode(const std::string& name) {
    if (name == "vanilla") return RomMode::Vanilla;
    if (name == "downsample") return RomMode::Downsample;
    if (name == "pixel") return RomMode::Pixel;
    if (name == "rectangle") return RomMode::Rectangle;
    throw std::invalid_argument("rom_mode (" + name + ") not in "
        "{'vanilla', 'downsample', 'pixel', 'rectangle'}");
}

const char* rom_mode_name(RomMode mode) {
    switch (mode) {
        case RomMode::Vanilla: return "vanilla";
        case RomMode::Downsample: return "downsample";
        case RomMode::Pixel: return "pixel";
        case RomMode::Rectangle: return "rectangle";
    }
    return "vanilla";
}

std::string rom_filename(bool lost_levels, RomMode mode) {
    if (lost_levels) {
        // the lost levels ROM only ships in two flavors
        switch (mode) {
            case RomMode::Vanilla: return "super-mario-bros-2.nes";
            case RomMode::Downsample: return "super-mario-bros-2-downsample.nes";
            default:
                throw std::invalid_argument(std::string("lost levels has no ") +
                    rom_mode_name(mode) + " ROM");
        }
    }
    switch (mode) {
        case RomMode::Vanilla: return "super-mario-bros.nes";
        case RomMode::Downsample: return "super-mario-bros-downsample.nes";
        case RomMode::Pixel: return "super-mario-bros-pixel.nes";
        case RomMode::Rectangle: return "super-mario-bros-rectangle.nes";
    }
    throw std::invalid_argument("unknown rom mode");
}

TargetConfig decode_target(int world, int stage, bool lost_levels) {
    const int max_world = lost_levels ? 12 : 8;
    if (world < 1 || world > max_world)
        throw std::invalid_argument("target world must be in {1, ..., " +
            std::to_string(max_world) + "}, got " + std::to_string(world));
    if (stage < 1 || stage > 4)
        throw std::invalid_argument("target stage must be in {1, ..., 4}, got " +
            std::to_string(stage));

    // the area counts the intro area (the pipe into the stage) that some
    // second stages start with
    int area = stage;
    if (lost_levels) {
        if (world >= 5)
            throw std::invalid_argument("lost levels worlds 5 or greater are not supported, got " +
                std::to_string(world));
        if ((world == 1 || world == 3) && stage >= 2)
            area++;
    } else if ((world == 1 || world == 2 || world == 4 || world == 7) && stage >= 2) {
        area++;
    }

    devlog::debug<grp::target>("world {} stage {} resolves to area {}", world, stage, area);
    return TargetConfig{true, world, stage, area};
}

}  // namespace SMB
