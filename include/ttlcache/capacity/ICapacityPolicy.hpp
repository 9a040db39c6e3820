#pragma once

#include <ttlcache/Entry.hpp>
#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Интерфейс политики ёмкости
 * @tparam K Тип ключа
 * @tparam V Тип значения
 * 
 * Определяет, что происходит с хранилищем перед записью:
 * - Unbounded - ничего, хранилище растёт без ограничений
 * - BoundedArbitraryEviction - вытеснение произвольных элементов
 * 
 * Все методы вызываются из TTLCache под exclusive lock,
 * поэтому политика сама не синхронизируется.
 * 
 * Вытесненные элементы складываются в evicted (если он не nullptr),
 * чтобы кэш мог уведомить слушателей уже после снятия блокировки.
 */
template<typename K, typename V>
class ICapacityPolicy {
public:
    using Store = std::unordered_map<K, Entry<V>>;
    using Evicted = std::vector<std::pair<K, V>>;

    virtual ~ICapacityPolicy() = default;

    /**
     * @brief Подготовить место под запись одного ключа
     * @param store Хранилище кэша
     * @param key Ключ, который сейчас будет записан
     * @param evicted Куда сложить вытесненные элементы (может быть nullptr)
     */
    virtual void beforeInsert(Store& store, const K& key, Evicted* evicted) = 0;

    /**
     * @brief Подготовить место под пакетную запись
     * @param store Хранилище кэша
     * @param batchSize Размер пакета (без учёта уже существующих ключей)
     * @param evicted Куда сложить вытесненные элементы (может быть nullptr)
     */
    virtual void beforeInsertBatch(Store& store, size_t batchSize, Evicted* evicted) = 0;

    /**
     * @brief Переинициализировать хранилище пустым
     * 
     * Вызывается при создании кэша и из clear().
     */
    virtual void reset(Store& store) const = 0;

    /**
     * @brief Максимальный размер хранилища (0 - без ограничения)
     */
    virtual size_t maxSize() const = 0;
};
