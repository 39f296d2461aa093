#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace shared::proto {

// Connection phases. Each has its own packet id space.
//
//   Handshake -> Status                 (terminal: one response/ping exchange)
//   Handshake -> Login -> Play
//   Handshake -> Login -> Configuration -> Play   (protocol 764+)
enum class ProtocolState : std::uint8_t {
    Handshake = 0,
    Status = 1,
    Login = 2,
    Configuration = 3,
    Play = 4,
};

constexpr std::size_t kProtocolStateCount = 5;

const char* to_string(ProtocolState state);

bool can_transition(ProtocolState from, ProtocolState to);

// Maps the handshake's next-state field (1 = Status, 2 = Login).
std::optional<ProtocolState> state_from_intent(std::int32_t intent);

class ProtocolStateMachine {
public:
    ProtocolState current() const { return state_; }

    // Throws CodecError(InvalidEncoding) on an illegal move.
    void transition(ProtocolState to);

    bool is_terminal() const { return state_ == ProtocolState::Status; }

private:
    ProtocolState state_{ProtocolState::Handshake};
};

} // namespace shared::proto
