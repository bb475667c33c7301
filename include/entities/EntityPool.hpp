/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_POOL_HPP
#define ENTITY_POOL_HPP

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <vector>

namespace Bulwark {

/**
 * @brief Free list of reusable entity objects
 *
 * Objects move between the owning manager's live collection and the pool as
 * unique_ptrs, so an object is in exactly one of the two at any time.
 * release() calls T::reset() and keeps at most maxPooled objects; extras are
 * destroyed.
 *
 * Usage:
 *   EntityPool<Enemy> pool(100);
 *   std::unique_ptr<Enemy> enemy = pool.acquire();
 *   enemy->spawn(...);
 *   ...
 *   pool.release(std::move(enemy));
 */
template <typename T>
class EntityPool {
public:
    struct Stats {
        size_t created{0};
        size_t reused{0};
        size_t released{0};
        size_t discarded{0};
    };

    explicit EntityPool(size_t maxPooled) : m_maxPooled(maxPooled) {
        if (maxPooled == 0) {
            throw std::invalid_argument("EntityPool requires a capacity of at least 1");
        }
        m_free.reserve(maxPooled);
    }

    EntityPool(const EntityPool&) = delete;
    EntityPool& operator=(const EntityPool&) = delete;

    // Pre-allocates objects so the first spawns do not allocate
    void prewarm(size_t count) {
        while (m_free.size() < std::min(count, m_maxPooled)) {
            m_free.push_back(std::make_unique<T>());
            ++m_stats.created;
        }
    }

    std::unique_ptr<T> acquire() {
        if (m_free.empty()) {
            ++m_stats.created;
            return std::make_unique<T>();
        }
        std::unique_ptr<T> object = std::move(m_free.back());
        m_free.pop_back();
        ++m_stats.reused;
        return object;
    }

    void release(std::unique_ptr<T> object) {
        if (!object) {
            return;
        }
        assert(!contains(object.get()));
        object->reset();
        ++m_stats.released;
        if (m_free.size() < m_maxPooled) {
            m_free.push_back(std::move(object));
        } else {
            ++m_stats.discarded;
        }
    }

    bool contains(const T* object) const {
        return std::any_of(m_free.begin(), m_free.end(),
                           [object](const std::unique_ptr<T>& pooled) { return pooled.get() == object; });
    }

    size_t available() const { return m_free.size(); }
    size_t capacity() const { return m_maxPooled; }
    const Stats& getStats() const { return m_stats; }

    void clear() { m_free.clear(); }

private:
    std::vector<std::unique_ptr<T>> m_free;
    size_t m_maxPooled;
    Stats m_stats;
};

} // namespace Bulwark

#endif // ENTITY_POOL_HPP
