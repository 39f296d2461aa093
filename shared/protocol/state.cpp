#include "state.hpp"

#include "../io/codec_error.hpp"

#include <string>

namespace shared::proto {

const char* to_string(ProtocolState state) {
    switch (state) {
        case ProtocolState::Handshake: return "handshake";
        case ProtocolState::Status: return "status";
        case ProtocolState::Login: return "login";
        case ProtocolState::Configuration: return "configuration";
        case ProtocolState::Play: return "play";
    }
    return "?";
}

bool can_transition(ProtocolState from, ProtocolState to) {
    switch (from) {
        case ProtocolState::Handshake:
            return to == ProtocolState::Status || to == ProtocolState::Login;
        case ProtocolState::Status:
            return false;
        case ProtocolState::Login:
            return to == ProtocolState::Configuration || to == ProtocolState::Play;
        case ProtocolState::Configuration:
            return to == ProtocolState::Play;
        case ProtocolState::Play:
            return false;
    }
    return false;
}

std::optional<ProtocolState> state_from_intent(std::int32_t intent) {
    if (intent == 1) return ProtocolState::Status;
    if (intent == 2) return ProtocolState::Login;
    return std::nullopt;
}

void ProtocolStateMachine::transition(ProtocolState to) {
    if (!can_transition(state_, to)) {
        throw shared::io::CodecError(shared::io::ErrorKind::InvalidEncoding,
                                     std::string("illegal state transition ") + to_string(state_) + " -> " + to_string(to));
    }
    state_ = to;
}

} // namespace shared::proto
