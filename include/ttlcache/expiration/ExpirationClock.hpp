#pragma once

#include <chrono>
#include <cstdint>
#include <limits>

/**
 * @brief Источник времени для расчёта сроков истечения
 * 
 * Время хранится как int64_t - наносекунды steady_clock от его эпохи.
 * Значение 0 зарезервировано под "никогда не истекает".
 * 
 * Алгоритм:
 * - При вставке: expiresAt = now + ttl (если ttl > 0), иначе 0
 * - При проверке: now > expiresAt -> expired
 * 
 * @note steady_clock монотонный, поэтому перевод системных часов
 *       не делает элементы просроченными "задним числом".
 */
struct ExpirationClock {
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    /// Маркер бессрочного элемента
    static constexpr int64_t kNever = 0;

    /**
     * @brief Текущее время в наносекундах
     */
    static int64_t now() {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            Clock::now().time_since_epoch()).count();
    }

    /**
     * @brief Рассчитать абсолютное время истечения
     * @param ttl Время жизни (<= 0 - бессрочно)
     * @return Наносекунды или kNever
     * 
     * Огромный ttl (например Duration::max()) насыщается до INT64_MAX,
     * то есть фактически "никогда", без переполнения.
     */
    static int64_t expiresAt(Duration ttl) {
        return expiresAt(ttl, now());
    }

    static int64_t expiresAt(Duration ttl, int64_t from) {
        if (ttl <= Duration::zero()) {
            return kNever;
        }

        const int64_t delta = std::chrono::duration_cast<std::chrono::nanoseconds>(ttl).count();
        if (delta > std::numeric_limits<int64_t>::max() - from) {
            return std::numeric_limits<int64_t>::max();
        }
        return from + delta;
    }
};
