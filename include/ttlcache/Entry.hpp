#pragma once

#include <ttlcache/expiration/ExpirationClock.hpp>
#include <cstdint>

/**
 * @brief Элемент хранилища: значение + абсолютное время истечения
 * @tparam V Тип значения
 * 
 * expiresAt == 0 - элемент бессрочный.
 * Элемент не изменяется после создания: set() по существующему ключу
 * заменяет его целиком.
 */
template<typename V>
struct Entry {
    V value;
    int64_t expiresAt = ExpirationClock::kNever;

    /**
     * @brief Проверить, истёк ли срок действия
     * @param now Текущее время (ExpirationClock::now())
     */
    bool isExpired(int64_t now) const {
        if (expiresAt == ExpirationClock::kNever) {
            return false;
        }
        return now > expiresAt;
    }
};
