/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TELEGRAM_HPP
#define TELEGRAM_HPP

#include "utils/UniqueID.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <ostream>
#include <utility>
#include <variant>

namespace Kickoff {

enum class MessageType : uint8_t {
    GO_HOME,
    RECEIVE_BALL,
    SUPPORT_ATTACKER,
    PASS_TO_ME
};

inline const char* toString(MessageType type) {
    switch (type) {
    case MessageType::GO_HOME:
        return "GO_HOME";
    case MessageType::RECEIVE_BALL:
        return "RECEIVE_BALL";
    case MessageType::SUPPORT_ATTACKER:
        return "SUPPORT_ATTACKER";
    case MessageType::PASS_TO_ME:
        return "PASS_TO_ME";
    }
    return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& os, MessageType type) {
    return os << toString(type);
}

// Nothing, a pitch position, or another entity
using MessagePayload = std::variant<std::monostate, Vector2D, UniqueID::IDType>;

// Read-only once built; fields are set through the constructor only
class Telegram {
public:
    Telegram() = default;
    Telegram(UniqueID::IDType sender, UniqueID::IDType receiver, MessageType type,
             MessagePayload payload = {})
        : m_sender(sender), m_receiver(receiver), m_type(type), m_payload(std::move(payload)) {}

    UniqueID::IDType getSender() const { return m_sender; }
    UniqueID::IDType getReceiver() const { return m_receiver; }
    MessageType getType() const { return m_type; }
    const MessagePayload& getPayload() const { return m_payload; }

    const Vector2D* getPosition() const { return std::get_if<Vector2D>(&m_payload); }
    const UniqueID::IDType* getEntityId() const {
        return std::get_if<UniqueID::IDType>(&m_payload);
    }

private:
    UniqueID::IDType m_sender{UniqueID::INVALID_ID};
    UniqueID::IDType m_receiver{UniqueID::INVALID_ID};
    MessageType m_type{MessageType::GO_HOME};
    MessagePayload m_payload{};
};

} // namespace Kickoff

#endif // TELEGRAM_HPP
