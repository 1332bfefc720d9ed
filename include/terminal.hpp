#pragma once
#include <string>

/**
 * Minimal ANSI color helper for the pktcraft CLI.
 *
 * term::g_enabled is cleared by --no-color (or when stdout is not a
 * terminal); every helper then returns plain text.
 */

namespace term {

inline bool g_enabled = true;

enum class Color {
    Reset,
    Bold,
    Red,
    Green,
    Yellow,
    Cyan,
    Gray
};

inline const char* code(Color c) {
    if (!g_enabled) return "";
    switch (c) {
        case Color::Reset:  return "\x1b[0m";
        case Color::Bold:   return "\x1b[1m";
        case Color::Red:    return "\x1b[31m";
        case Color::Green:  return "\x1b[32m";
        case Color::Yellow: return "\x1b[33m";
        case Color::Cyan:   return "\x1b[36m";
        case Color::Gray:   return "\x1b[90m";
    }
    return "";
}

inline std::string paint(const std::string& s, Color c) {
    if (!g_enabled) return s;
    return std::string(code(c)) + s + code(Color::Reset);
}

} // namespace term
