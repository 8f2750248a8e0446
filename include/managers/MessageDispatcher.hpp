/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MESSAGE_DISPATCHER_HPP
#define MESSAGE_DISPATCHER_HPP

#include "entities/Entity.hpp"
#include "events/Telegram.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>

namespace Kickoff {

/**
 * @brief Synchronous point-to-point telegram delivery
 *
 * One dispatcher per match, owned by the Pitch. Entities register
 * themselves by id; sendMessage() builds a Telegram and calls the
 * receiver's handleMessage() before returning. Nothing is queued.
 */
class MessageDispatcher {
public:
    MessageDispatcher() = default;

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    // Throws std::invalid_argument if the id is already registered
    void registerEntity(Entity& entity);
    bool removeEntity(EntityID id);
    void clear();

    Entity* getEntity(EntityID id) const;
    bool isRegistered(EntityID id) const { return getEntity(id) != nullptr; }
    size_t getEntityCount() const { return m_entities.size(); }

    /**
     * @brief Delivers a telegram immediately
     * @return true if the receiver consumed it. Unknown endpoints and
     *         unconsumed telegrams are logged and dropped.
     */
    bool sendMessage(EntityID sender, EntityID receiver, MessageType type,
                     MessagePayload payload = {});

private:
    // Non-owning, entities unregister before they are destroyed
    boost::container::flat_map<EntityID, Entity*> m_entities;
};

} // namespace Kickoff

#endif // MESSAGE_DISPATCHER_HPP
