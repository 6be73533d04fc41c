#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace ecp::control {

/// Named keys accepted by `/keypress/<token>`.
enum class Command {
    Power,
    PowerOn,
    PowerOff,
    Home,
    Info,
    Back,
    Up,
    Down,
    Left,
    Right,
    Select,
    Play,
    VolumeUp,
    VolumeDown,
    VolumeMute,
    ChannelUp,
    ChannelDown,
    Search,
    Enter,
    Backspace,
    FindRemote,
    Replay,
    Reverse,
    Forward,
};

constexpr std::size_t kCommandCount = 24;

/// Token sent on the wire, e.g. "VolumeUp" or "Channel_up".
std::string_view toToken(Command command);

/// Case-insensitive reverse lookup. Unknown tokens yield nothing.
std::optional<Command> commandFromToken(std::string_view token);

/// Every command, in declaration order.
const std::array<Command, kCommandCount>& allCommands();

} // namespace ecp::control
