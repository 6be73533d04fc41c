#include "ecp/control/Command.hpp"

#include <cctype>

namespace ecp::control {

namespace {

struct TokenEntry {
    Command command;
    std::string_view token;
};

// Spellings match what the devices accept; some keys use underscores.
constexpr std::array<TokenEntry, kCommandCount> kTokens{{
    {Command::Power,       "Power"},
    {Command::PowerOn,     "Poweron"},
    {Command::PowerOff,    "Poweroff"},
    {Command::Home,        "Home"},
    {Command::Info,        "Info"},
    {Command::Back,        "Back"},
    {Command::Up,          "Up"},
    {Command::Down,        "Down"},
    {Command::Left,        "Left"},
    {Command::Right,       "Right"},
    {Command::Select,      "Select"},
    {Command::Play,        "Play"},
    {Command::VolumeUp,    "VolumeUp"},
    {Command::VolumeDown,  "VolumeDown"},
    {Command::VolumeMute,  "VolumeMute"},
    {Command::ChannelUp,   "Channel_up"},
    {Command::ChannelDown, "Channel_down"},
    {Command::Search,      "Search"},
    {Command::Enter,       "Enter"},
    {Command::Backspace,   "Backspace"},
    {Command::FindRemote,  "Find_remote"},
    {Command::Replay,      "Replay"},
    {Command::Reverse,     "Reverse"},
    {Command::Forward,     "Forward"},
}};

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string_view toToken(Command command) {
    for (const auto& entry : kTokens) {
        if (entry.command == command) {
            return entry.token;
        }
    }
    return {};
}

std::optional<Command> commandFromToken(std::string_view token) {
    for (const auto& entry : kTokens) {
        if (equalsIgnoreCase(entry.token, token)) {
            return entry.command;
        }
    }
    return std::nullopt;
}

const std::array<Command, kCommandCount>& allCommands() {
    static const std::array<Command, kCommandCount> commands = [] {
        std::array<Command, kCommandCount> out{};
        for (std::size_t i = 0; i < kTokens.size(); ++i) {
            out[i] = kTokens[i].command;
        }
        return out;
    }();
    return commands;
}

} // namespace ecp::control
