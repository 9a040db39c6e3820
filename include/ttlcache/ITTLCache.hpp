#pragma once

#include <ttlcache/expiration/ExpirationClock.hpp>
#include <optional>
#include <cstddef>
#include <unordered_map>

/**
 * @brief Базовый интерфейс TTL-кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 * 
 * Все длительности - ExpirationClock::Duration (наносекунды).
 * Нулевая или отрицательная длительность означает "без истечения",
 * а не "истекает немедленно".
 */
template <typename K, typename V>
class ITTLCache
{
public:
    using Duration = ExpirationClock::Duration;

    virtual ~ITTLCache() = default;

    /**
     * @brief Получить значение по ключу (без проверки TTL)
     * @param key Ключ
     * @return Значение, если ключ существует (даже просроченный), иначе std::nullopt
     */
    virtual std::optional<V> get(const K &key) const = 0;

    /**
     * @brief Получить значение по ключу с проверкой TTL
     * @param key Ключ
     * @return Значение, если ключ существует и не просрочен, иначе std::nullopt
     * 
     * Просроченный элемент не удаляется - его уберёт очистка или следующая запись.
     */
    virtual std::optional<V> getSafe(const K &key) const = 0;

    /**
     * @brief Получить значение или V{} если ключа нет
     */
    virtual V getValue(const K &key) const = 0;

    /**
     * @brief Поместить значение в кэш с TTL по умолчанию
     */
    virtual void set(const K &key, const V &value) = 0;

    /**
     * @brief Поместить значение в кэш с явным TTL
     * @param ttl Время жизни (<= 0 - бессрочно)
     */
    virtual void setWithTTL(const K &key, const V &value, Duration ttl) = 0;

    /**
     * @brief Поместить набор значений с TTL по умолчанию
     */
    virtual void setAll(const std::unordered_map<K, V> &values) = 0;

    /**
     * @brief Поместить набор значений с общим TTL (атомарно для читателей)
     */
    virtual void setAllWithTTL(const std::unordered_map<K, V> &values, Duration ttl) = 0;

    /**
     * @brief Удалить значение по ключу
     * @return true, если элемент был удален, иначе false
     */
    virtual bool remove(const K &key) = 0;

    virtual bool isEmpty() const = 0;

    /**
     * @brief Количество элементов, включая просроченные, но ещё не удалённые
     */
    virtual size_t size() const = 0;

    /**
     * @brief Очистить кэш
     */
    virtual void clear() = 0;

    /**
     * @brief Удалить все просроченные элементы
     * @return Количество удалённых элементов
     */
    virtual size_t cleanExpired() = 0;

    /**
     * @brief Остановить фоновую очистку и освободить хранилище
     * 
     * Повторный вызов безопасен. После close() кэш остаётся пригодным
     * к использованию, но фоновая очистка больше не работает.
     */
    virtual void close() = 0;
};
