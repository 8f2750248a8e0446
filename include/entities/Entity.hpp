/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "utils/UniqueID.hpp"
#include "utils/Vector2D.hpp"
#include <string>

namespace Kickoff {
struct Telegram;
}

// Type alias for entity ID
using EntityID = Kickoff::UniqueID::IDType;

/**
 * @brief Base class for everything that lives on the pitch.
 *
 * An entity owns its position; renderers and other entities only read it.
 * Entities that take part in messaging override handleMessage().
 */
class Entity {
 public:
  /**
   * @brief Construct a new Entity object and assign it a unique ID.
   */
  Entity() : m_id(Kickoff::UniqueID::generate()) {}

  /**
   * @brief Construct with a caller chosen id.
   *
   * Later generated ids skip past it.
   */
  explicit Entity(EntityID id) : m_id(id) { Kickoff::UniqueID::reserve(id); }

  virtual ~Entity() = default;

  Entity(const Entity&) = delete;
  Entity& operator=(const Entity&) = delete;

  /**
   * @brief Advance the entity by one simulation tick.
   * @param deltaTime Seconds since the previous tick.
   */
  virtual void update(float deltaTime) = 0;

  /**
   * @brief Deliver a telegram.
   * @return true if the message was consumed.
   */
  virtual bool handleMessage(const Kickoff::Telegram& /*telegram*/) { return false; }

  EntityID getID() const { return m_id; }

  const Vector2D& getPosition() const { return m_position; }
  void setPosition(const Vector2D& position) { m_position = position; }

  float getBoundingRadius() const { return m_boundingRadius; }
  void setBoundingRadius(float radius) { m_boundingRadius = radius; }

  const std::string& getName() const { return m_name; }
  void setName(const std::string& name) { m_name = name; }

 protected:
  Vector2D m_position{0, 0};
  float m_boundingRadius{0.0f};
  std::string m_name;

 private:
  EntityID m_id;
};

#endif  // ENTITY_HPP
