/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/MessageDispatcher.hpp"
#include "core/Logger.hpp"
#include <format>
#include <stdexcept>

namespace Kickoff {

void MessageDispatcher::registerEntity(Entity& entity) {
    if (m_entities.find(entity.getID()) != m_entities.end()) {
        MESSAGE_ERROR(std::format("Entity already registered: {}", entity.getID()));
        throw std::invalid_argument(
            std::format("MessageDispatcher - entity {} already registered", entity.getID()));
    }
    m_entities.emplace(entity.getID(), &entity);
}

bool MessageDispatcher::removeEntity(EntityID id) {
    return m_entities.erase(id) > 0;
}

void MessageDispatcher::clear() {
    m_entities.clear();
}

Entity* MessageDispatcher::getEntity(EntityID id) const {
    auto it = m_entities.find(id);
    return it == m_entities.end() ? nullptr : it->second;
}

bool MessageDispatcher::sendMessage(EntityID sender, EntityID receiver, MessageType type,
                                    MessagePayload payload) {
    if (!isRegistered(sender)) {
        MESSAGE_WARN(std::format("{} from unregistered sender {} dropped", toString(type), sender));
        return false;
    }

    Entity* target = getEntity(receiver);
    if (target == nullptr) {
        MESSAGE_WARN(std::format("{} to unregistered receiver {} dropped", toString(type), receiver));
        return false;
    }

    const Telegram telegram{sender, receiver, type, std::move(payload)};
    if (!target->handleMessage(telegram)) {
        MESSAGE_WARN(std::format("{} from {} not handled by {}", toString(type), sender, receiver));
        return false;
    }
    return true;
}

} // namespace Kickoff
