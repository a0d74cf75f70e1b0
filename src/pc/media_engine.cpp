#include "pc/media_engine.hpp"

namespace naivecall {

std::string ToString(SdpType type) {
    switch (type) {
    case SdpType::OFFER:
        return "offer";
    case SdpType::ANSWER:
        return "answer";
    default:
        return "unknown";
    }
}

std::string MediaTransport::ToString(State state) {
    switch (state) {
    case State::NEW:
        return "new";
    case State::CONNECTING:
        return "connecting";
    case State::CONNECTED:
        return "connected";
    case State::DISCONNECTED:
        return "disconnected";
    case State::FAILED:
        return "failed";
    case State::CLOSED:
        return "closed";
    default:
        return "unknown";
    }
}

std::ostream& operator<<(std::ostream& out, SdpType type) {
    out << ToString(type);
    return out;
}

std::ostream& operator<<(std::ostream& out, MediaTransport::State state) {
    out << MediaTransport::ToString(state);
    return out;
}

} // namespace naivecall
