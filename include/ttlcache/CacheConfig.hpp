#pragma once

#include <ttlcache/expiration/ExpirationClock.hpp>
#include <cstddef>

/**
 * @brief Конфигурация TTL-кэша
 * 
 * Нулевые (или отрицательные) значения выключают соответствующую функцию:
 * - defaultTTL <= 0 - set()/setAll() создают бессрочные элементы
 * - cleanupInterval <= 0 - фоновой очистки нет, только cleanExpired() вручную
 * - maxSize == 0 - размер не ограничен
 * 
 * @code
 *   auto config = CacheConfig{}
 *       .withDefaultTTL(std::chrono::seconds(1))
 *       .withCleanupInterval(std::chrono::seconds(2))
 *       .withMaxSize(5);
 *   TTLCache<std::string, std::string> cache(config);
 * @endcode
 */
struct CacheConfig {
    using Duration = ExpirationClock::Duration;

    /// TTL для set()/setAll() без явного TTL
    Duration defaultTTL = Duration::zero();

    /// Интервал фоновой очистки просроченных элементов
    Duration cleanupInterval = Duration::zero();

    /// Максимальное количество элементов (0 - без ограничения)
    size_t maxSize = 0;

    CacheConfig& withDefaultTTL(Duration ttl) {
        defaultTTL = ttl;
        return *this;
    }

    CacheConfig& withCleanupInterval(Duration interval) {
        cleanupInterval = interval;
        return *this;
    }

    CacheConfig& withMaxSize(size_t size) {
        maxSize = size;
        return *this;
    }

    bool hasDefaultTTL() const {
        return defaultTTL > Duration::zero();
    }

    bool hasCleanup() const {
        return cleanupInterval > Duration::zero();
    }

    bool isBounded() const {
        return maxSize > 0;
    }
};
