/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UNIQUE_ID_HPP
#define UNIQUE_ID_HPP

#include <atomic>
#include <cstdint>

namespace Kickoff {

/**
 * @brief Process-wide source of entity identifiers
 *
 * Entities draw an id on construction unless they are given one. Ids are
 * unique for the lifetime of the process and never reused.
 */
class UniqueID {
public:
    using IDType = uint64_t;

    static IDType generate() { return s_nextID++; }

    // Makes sure later generate() calls never hand out an id that was
    // assigned explicitly
    static void reserve(IDType id) {
        IDType current = s_nextID.load();
        while (current <= id && !s_nextID.compare_exchange_weak(current, id + 1)) {
        }
    }

    static constexpr IDType INVALID_ID = 0;

private:
    // Starts at 1 so INVALID_ID is never generated
    static inline std::atomic<IDType> s_nextID{1};
};

} // namespace Kickoff

#endif // UNIQUE_ID_HPP
