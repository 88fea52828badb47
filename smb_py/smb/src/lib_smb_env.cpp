//  Program:      smb-py
//  File:         lib_smb_env.cpp
//  Description:  file describes the outward facing pybind11 API for Python
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//
#include "common.hpp"
#include "console.hpp"
#include "env.hpp"
#include "log.hpp"
#include "ram_map.hpp"
#include "target.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

namespace py = pybind11;

// =============================================================================
// NESEmulatorConsole - the Console interface over a nes_py NESEmulator
// =============================================================================
//
// Uses the zero-copy views the emulator hands out:
//   - memory_buffer()   - 0x800 bytes of work RAM, read and written in place
//   - controller(0)     - the joypad byte of player 1
//   - step() / reset()  - frame advance and power cycle
//   - screen_buffer()   - HEIGHT x WIDTH x 3 RGB view, copied per observation
//
// =============================================================================

class NESEmulatorConsole : public SMB::Console {
public:
    explicit NESEmulatorConsole(py::object emulator) : emulator_(std::move(emulator)) {
        memory_ = emulator_.attr("memory_buffer")().cast<py::array_t<uint8_t>>();
        controller_ = emulator_.attr("controller")(0).cast<py::array_t<uint8_t>>();
        if (memory_.ndim() != 1 || memory_.shape(0) < SMB::RAM::SIZE) {
            throw std::runtime_error(
                "memory_buffer() must be a flat view of at least " +
                std::to_string(SMB::RAM::SIZE) + " bytes"
            );
        }
        SMB::devlog::debug<SMB::grp::console>("attached to emulator with {} bytes of RAM",
            memory_.shape(0));
    }

    SMB::SMB_Byte read(SMB::SMB_Address address) const override {
        check_address(address);
        return *memory_.data(address);
    }

    void write(SMB::SMB_Address address, SMB::SMB_Byte value) override {
        check_address(address);
        *memory_.mutable_data(address) = value;
    }

    void frame_advance(SMB::SMB_Byte action) override {
        check_open();
        *controller_.mutable_data(0) = action;
        emulator_.attr("step")();
    }

    void reset() override {
        check_open();
        emulator_.attr("reset")();
    }

    void close() override {
        check_open();
        memory_ = py::array_t<uint8_t>();
        controller_ = py::array_t<uint8_t>();
        emulator_ = py::none();
    }

    SMB::Observation screen() const override {
        check_open();
        auto frame = emulator_.attr("screen_buffer")().cast<py::array_t<uint8_t>>();
        if (frame.ndim() != 3
                || frame.shape(0) != SMB::SCREEN_HEIGHT
                || frame.shape(1) != SMB::SCREEN_WIDTH
                || frame.shape(2) != SMB::SCREEN_CHANNELS) {
            throw std::runtime_error("screen_buffer() must be HEIGHT x WIDTH x 3");
        }
        // the view may use a negative channel stride (BGR -> RGB), copy by index
        auto pixels = frame.unchecked<3>();
        SMB::Observation observation(SMB::SCREEN_HEIGHT * SMB::SCREEN_WIDTH * SMB::SCREEN_CHANNELS);
        size_t i = 0;
        for (ssize_t h = 0; h < SMB::SCREEN_HEIGHT; h++)
            for (ssize_t w = 0; w < SMB::SCREEN_WIDTH; w++)
                for (ssize_t c = 0; c < SMB::SCREEN_CHANNELS; c++)
                    observation[i++] = pixels(h, w, c);
        return observation;
    }

private:
    void check_open() const {
        if (emulator_.is_none())
            throw std::logic_error("the emulator has been closed");
    }

    void check_address(SMB::SMB_Address address) const {
        check_open();
        if (address >= memory_.shape(0)) {
            throw std::out_of_range(
                "RAM address " + std::to_string(address) +
                " out of range [0, " + std::to_string(memory_.shape(0)) + ")"
            );
        }
    }

    py::object emulator_;
    py::array_t<uint8_t> memory_;
    py::array_t<uint8_t> controller_;
};

// =============================================================================
// PySuperMarioBrosEnv - owns the console adapter and the environment
// =============================================================================

inline py::dict info_to_dict(const SMB::StepInfo& info) {
    py::dict result;
    result["coins"] = info.coins;
    result["flag_get"] = info.flag_get;
    result["life"] = info.life;
    result["score"] = info.score;
    result["stage"] = info.stage;
    result["status"] = info.status;
    result["time"] = info.time;
    result["world"] = info.world;
    result["x_pos"] = info.x_pos;
    result["y_pos"] = info.y_pos;
    result["x_speed"] = info.x_speed;
    result["y_speed"] = info.y_speed;
    return result;
}

inline py::dict state_to_dict(const SMB::GameState& state) {
    py::dict result;
    result["world"] = state.world;
    result["stage"] = state.stage;
    result["area"] = state.area;
    result["level"] = state.level;
    result["x_position"] = state.x_position;
    result["left_x_position"] = state.left_x_position;
    result["y_position"] = state.y_position;
    result["y_viewport"] = state.y_viewport;
    result["status"] = SMB::status_name(state.status);
    result["player_state"] = static_cast<int>(state.player_state);
    result["life"] = state.life;
    result["score"] = state.score;
    result["coins"] = state.coins;
    result["time"] = state.time;
    result["is_dying"] = state.is_dying;
    result["is_dead"] = state.is_dead;
    result["is_game_over"] = state.is_game_over;
    result["is_busy"] = state.is_busy;
    result["is_world_over"] = state.is_world_over;
    result["is_stage_over"] = state.is_stage_over;
    result["flag_get"] = state.flag_get;
    return result;
}

inline py::array_t<uint8_t> observation_to_array(const SMB::Observation& observation) {
    // no base object, so the data is copied into a new array
    return py::array_t<uint8_t>(
        {SMB::SCREEN_HEIGHT, SMB::SCREEN_WIDTH, SMB::SCREEN_CHANNELS},
        observation.data()
    );
}

class PySuperMarioBrosEnv {
public:
    PySuperMarioBrosEnv(
        py::object emulator,
        const std::string& rom_mode,
        bool lost_levels,
        py::object target,
        py::object max_episode_steps,
        py::object truncate_function
    ) : console_(std::make_unique<NESEmulatorConsole>(std::move(emulator))) {
        SMB::EnvConfig config;
        config.rom_mode = SMB::parse_rom_mode(rom_mode);
        config.lost_levels = lost_levels;
        if (!target.is_none()) {
            if (!py::isinstance<py::tuple>(target))
                throw py::type_error("target must be of type tuple");
            auto world_stage = target.cast<std::pair<int, int>>();
            config.has_target = true;
            config.target_world = world_stage.first;
            config.target_stage = world_stage.second;
        }
        if (!max_episode_steps.is_none()) {
            config.max_episode_steps = max_episode_steps.cast<int>();
            if (config.max_episode_steps <= 0)
                throw std::invalid_argument("max_episode_steps must be positive");
        }
        if (!truncate_function.is_none()) {
            auto function = truncate_function.cast<py::function>();
            // called back with this wrapper as `self`, not the inner C++ env
            config.truncate_function = [this, function](
                const SMB::SuperMarioBrosEnv&, double reward, const SMB::StepInfo& info
            ) {
                py::object self = py::cast(this, py::return_value_policy::reference);
                return function(self, reward, info_to_dict(info)).cast<bool>();
            };
        }
        env_ = std::make_unique<SMB::SuperMarioBrosEnv>(*console_, config);
        // ready to step without an explicit reset
        env_->reset();
    }

    bool is_single_stage_env() const { return env_->is_single_stage_env(); }

    py::dict game_state() const { return state_to_dict(env_->game_state()); }

    py::array_t<uint8_t> reset(py::object seed) {
        if (seed.is_none())
            return observation_to_array(env_->reset());
        return observation_to_array(env_->reset(seed.cast<uint64_t>()));
    }

    py::tuple step(uint8_t action) {
        SMB::StepResult result = env_->step(action);
        return py::make_tuple(
            observation_to_array(result.observation),
            result.reward,
            result.terminated,
            result.truncated,
            info_to_dict(result.info)
        );
    }

    void close() { env_->close(); }

private:
    std::unique_ptr<NESEmulatorConsole> console_;
    std::unique_ptr<SMB::SuperMarioBrosEnv> env_;
};

PYBIND11_MODULE(smb_env, m) {
    py::register_exception<SMB::StuckEmulatorError>(m, "StuckEmulatorError", PyExc_RuntimeError);

    m.def(
        "rom_filename",
        [](bool lost_levels, const std::string& rom_mode) {
            return SMB::rom_filename(lost_levels, SMB::parse_rom_mode(rom_mode));
        },
        py::arg("lost_levels") = false,
        py::arg("rom_mode") = "vanilla",
        "Return the file name of the ROM to load into the NESEmulator"
    );

    m.def(
        "set_log_level",
        [](const std::string& level) { SMB::devlog::set_level(SMB::devlog::parse_level(level)); },
        py::arg("level"),
        "Set the minimum level of log messages: trace, debug, info, warn, error, or off"
    );

    py::class_<PySuperMarioBrosEnv>(m, "SuperMarioBrosEnv", py::dynamic_attr())
        .def(
            py::init<py::object, const std::string&, bool, py::object, py::object, py::object>(),
            py::arg("emulator"),
            py::arg("rom_mode") = "vanilla",
            py::arg("lost_levels") = false,
            py::arg("target") = py::none(),
            py::arg("max_episode_steps") = py::none(),
            py::arg("truncate_function") = py::none(),
            R"doc(
Create an environment for playing Super Mario Bros.

The emulator is reset and the start screen skipped on construction, so step
can be called right away. Instances accept new attributes, which lets a
truncate_function keep its own state on `self`.

Args:
    emulator: a nes_py NESEmulator running the ROM named by rom_filename()
    rom_mode: the ROM variant: vanilla, downsample, pixel, or rectangle
    lost_levels: whether the ROM is Super Mario Bros. Lost Levels
    target: an optional (world, stage) tuple to play as a single stage
    max_episode_steps: the number of steps after which episodes are truncated
    truncate_function: an optional callable (self, reward, info) -> bool
)doc")

        .def_property_readonly_static("reward_range", [](py::object) {
            return py::make_tuple(SMB::REWARD_RANGE.first, SMB::REWARD_RANGE.second);
        })
        .def_property_readonly("is_single_stage_env", &PySuperMarioBrosEnv::is_single_stage_env,
            "Return True if this environment plays a single stage")
        .def_property_readonly("game_state", &PySuperMarioBrosEnv::game_state,
            "Return the game state decoded from the current RAM as a dict")

        .def("reset", &PySuperMarioBrosEnv::reset,
             py::arg("seed") = py::none(),
             "Reset the emulator, skip the start screen, and return the first observation")

        .def("step", &PySuperMarioBrosEnv::step,
             py::arg("action"),
             R"doc(
Run one frame of the NES with the given action.

Args:
    action: the bitmap of pressed buttons

Returns:
    a tuple of (observation, reward, terminated, truncated, info) where info
    holds coins, flag_get, life, score, stage, status, time, world, x_pos,
    y_pos, x_speed, and y_speed
)doc")

        .def("close", &PySuperMarioBrosEnv::close, "Close the environment")
    ;
};
