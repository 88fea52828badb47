//  Program:      smb-py
//  File:         skip_controller.hpp
//  Description:  Fast forwarding through frames the agent can't act in
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#ifndef SMB_SKIP_CONTROLLER_HPP
#define SMB_SKIP_CONTROLLER_HPP

#include <stdexcept>
#include <string>
#include "common.hpp"
#include "console.hpp"
#include "target.hpp"

namespace SMB {

/// Raised when a skip loop runs past its frame limit.
class StuckEmulatorError : public std::runtime_error {
 public:
    explicit StuckEmulatorError(const std::string& what) : std::runtime_error(what) { }
};

/// Drives the console through menus, deaths and transitions.
///
/// Nothing is remembered between calls; every loop re-reads RAM to decide
/// when to stop.
class SkipController {
 private:
    /// the console to advance and hack
    Console& console;
    /// the stage to force into RAM in single stage mode
    TargetConfig target;
    /// the most frames a single skip loop may run, 0 for no limit
    unsigned frame_limit;

    /// Advance one frame on behalf of a skip loop.
    ///
    /// @param action the joypad bitmask to hold for the frame
    /// @param loop the name of the loop, for the error message
    /// @param frames the number of frames the loop ran so far
    /// @throws StuckEmulatorError if frames exceeds the frame limit
    ///
    void advance(SMB_Byte action, const char* loop, unsigned& frames);

 public:
    /// the default frame limit of a skip loop
    static const unsigned DEFAULT_FRAME_LIMIT = 100000;

    /// Initialize a new skip controller.
    ///
    /// @param console the console to drive, must outlive the controller
    /// @param target the stage to force in single stage mode
    /// @param frame_limit the most frames a skip loop may run, 0 for no limit
    ///
    SkipController(
        Console& console,
        const TargetConfig& target,
        unsigned frame_limit = DEFAULT_FRAME_LIMIT
    );

    /// Write the target stage into RAM so it loads instead of the next one.
    void write_stage();

    /// Force the pre-level timer to 0.
    void runout_prelevel_timer();

    /// Collapse an area change animation to its last tick.
    void skip_change_area();

    /// Cut a death animation short by forcing the player dead for a frame.
    void kill_player();

    /// Press start until the stage starts and idle until the clock runs.
    void skip_start_screen();

    /// Skip the cutscene at the end of a world.
    void skip_end_of_world();

    /// Run out the pre-level timer until the player can act again.
    void skip_occupied_states();

    /// Skip whatever the last step led into.
    void after_step();
};

}  // namespace SMB

#endif  // SMB_SKIP_CONTROLLER_HPP
