//  Program:      smb-py
//  File:         skip_controller.cpp
//  Description:  Fast forwarding through frames the agent can't act in
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#include "game_state.hpp"
#include "log.hpp"
#include "ram_map.hpp"
#include "skip_controller.hpp"

namespace SMB {

const unsigned SkipController::DEFAULT_FRAME_LIMIT;

SkipController::SkipController(
    Console& console,
    const TargetConfig& target,
    unsigned frame_limit
) : console(console), target(target), frame_limit(frame_limit) { }

void SkipController::advance(SMB_Byte action, const char* loop, unsigned& frames) {
    if (frame_limit != 0 && frames >= frame_limit) {
        devlog::error<grp::skip>("{} ran {} frames without finishing", loop, frames);
        throw StuckEmulatorError(std::string(loop) + " exceeded " +
            std::to_string(frame_limit) + " frames, the emulator is stuck");
    }
    console.frame_advance(action);
    frames++;
}

void SkipController::write_stage() {
    if (!target.single_stage)
        return;
    console.write(RAM::WORLD, static_cast<SMB_Byte>(target.world - 1));
    console.write(RAM::STAGE, static_cast<SMB_Byte>(target.stage - 1));
    console.write(RAM::AREA, static_cast<SMB_Byte>(target.area - 1));
}

void SkipController::runout_prelevel_timer() {
    console.write(RAM::PRELEVEL_TIMER, 0);
}

void SkipController::skip_change_area() {
    const SMB_Byte timer = console.read(RAM::CHANGE_AREA_TIMER);
    if (timer > 1 && timer < 255)
        console.write(RAM::CHANGE_AREA_TIMER, 1);
}

void SkipController::kill_player() {
    console.write(RAM::PLAYER_STATE, static_cast<SMB_Byte>(PlayerState::Dead));
    console.frame_advance(Button::NOOP);
}

void SkipController::skip_start_screen() {
    unsigned frames = 0;
    // press and release start to leave the title screen
    advance(Button::START, "start screen", frames);
    advance(Button::NOOP, "start screen", frames);
    // keep pressing start until the stage is loaded and the clock is set
    while (decode_time(console) == 0) {
        advance(Button::START, "start screen", frames);
        write_stage();
        advance(Button::NOOP, "start screen", frames);
        runout_prelevel_timer();
    }
    // idle until the clock ticks for the first time
    int time_last = decode_time(console);
    while (decode_time(console) >= time_last) {
        time_last = decode_time(console);
        advance(Button::START, "start screen", frames);
        advance(Button::NOOP, "start screen", frames);
    }
    devlog::debug<grp::skip>("start screen skipped in {} frames", frames);
}

void SkipController::skip_end_of_world() {
    if (!is_world_over(console))
        return;
    unsigned frames = 0;
    const int time = decode_time(console);
    while (decode_time(console) == time)
        advance(Button::NOOP, "end of world", frames);
    devlog::debug<grp::skip>("end of world skipped in {} frames", frames);
}

void SkipController::skip_occupied_states() {
    unsigned frames = 0;
    while (is_busy(console) || is_world_over(console)) {
        runout_prelevel_timer();
        advance(Button::NOOP, "occupied state", frames);
    }
    if (frames > 0)
        devlog::trace<grp::skip>("occupied states skipped in {} frames", frames);
}

void SkipController::after_step() {
    if (is_dying(console))
        kill_player();
    // the end of world cutscene has to go before the other skips
    if (!target.single_stage)
        skip_end_of_world();
    skip_change_area();
    skip_occupied_states();
}

}  // namespace SMB
