#pragma once

#include "ICapacityPolicy.hpp"

/**
 * @brief Политика без ограничения размера
 * @tparam K Тип ключа
 * @tparam V Тип значения
 * 
 * Запись никогда ничего не вытесняет.
 * 
 * @note Это null-object pattern - кэш всегда работает через политику,
 *       без проверок на nullptr.
 */
template<typename K, typename V>
class Unbounded : public ICapacityPolicy<K, V> {
public:
    using typename ICapacityPolicy<K, V>::Store;
    using typename ICapacityPolicy<K, V>::Evicted;

    void beforeInsert(Store& store, const K& key, Evicted* evicted) override {
        (void)store;
        (void)key;
        (void)evicted;
    }

    void beforeInsertBatch(Store& store, size_t batchSize, Evicted* evicted) override {
        (void)store;
        (void)batchSize;
        (void)evicted;
    }

    /**
     * @brief Новое пустое хранилище без резервирования
     */
    void reset(Store& store) const override {
        Store().swap(store);
    }

    size_t maxSize() const override {
        return 0;
    }
};
