//  Program:      smb-py
//  File:         log.cpp
//  Description:  Leveled development logging by group on top of fmt
//
//  Copyright (c) 2019 Christian Kauten. All rights reserved.
//

#include <cstdio>
#include <stdexcept>
#include "log.hpp"

namespace SMB {
namespace devlog {

namespace {

Level& threshold() {
    static Level current = Level::warn;
    return current;
}

}  // namespace

Level level() { return threshold(); }

void set_level(Level level) { threshold() = level; }

Level parse_level(const std::string& name) {
    if (name == "trace") return Level::trace;
    if (name == "debug") return Level::debug;
    if (name == "info") return Level::info;
    if (name == "warn") return Level::warn;
    if (name == "error") return Level::error;
    if (name == "off") return Level::off;
    throw std::invalid_argument("unknown log level: " + name);
}

const char* level_name(Level level) {
    switch (level) {
        case Level::trace: return "trace";
        case Level::debug: return "debug";
        case Level::info: return "info";
        case Level::warn: return "warn";
        case Level::error: return "error";
        case Level::off: return "off";
    }
    return "unk";
}

namespace detail {

void write(Level level, const char* group, fmt::string_view format, fmt::format_args args) {
    fmt::print(stderr, "{:5s} | {:16s} | ", level_name(level), group);
    fmt::vprint(stderr, format, args);
    std::fputc('\n', stderr);
}

}  // namespace detail

}  // namespace devlog
}  // namespace SMB
