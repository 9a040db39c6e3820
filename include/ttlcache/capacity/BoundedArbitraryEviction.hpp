#pragma once

#include "ICapacityPolicy.hpp"
#include <stdexcept>

/**
 * @brief Политика ограниченного размера с вытеснением произвольных элементов
 * @tparam K Тип ключа
 * @tparam V Тип значения
 * 
 * Жертва - первый элемент, который вернёт итерация по unordered_map.
 * Порядок итерации не определён, поэтому это не LRU и не FIFO:
 * вытесняется "какой попадётся". Зато O(1) без дополнительных структур.
 * 
 * Одиночная запись:
 * - ключ уже есть - замена, ничего не вытесняем
 * - ключ новый и size + 1 > maxSize - вытесняем ровно один элемент
 * 
 * Пакетная запись:
 * - x = size + batchSize - maxSize
 * - x >= size - хранилище пересоздаётся целиком (дешевле, чем удалять по одному)
 * - иначе вытесняем ровно x элементов
 * 
 * @note batchSize не учитывает ключи пакета, уже присутствующие в хранилище,
 *       поэтому вытеснение может быть избыточным. Пакет больше maxSize
 *       не обрезается: после записи размер превысит maxSize.
 */
template<typename K, typename V>
class BoundedArbitraryEviction : public ICapacityPolicy<K, V> {
public:
    using typename ICapacityPolicy<K, V>::Store;
    using typename ICapacityPolicy<K, V>::Evicted;

    /**
     * @brief Конструктор
     * @param maxSize Максимальный размер хранилища (должен быть > 0)
     */
    explicit BoundedArbitraryEviction(size_t maxSize) : maxSize_(maxSize) {
        if (maxSize_ == 0) {
            throw std::invalid_argument("Max size must be greater than 0");
        }
    }

    void beforeInsert(Store& store, const K& key, Evicted* evicted) override {
        if (store.size() + 1 <= maxSize_) {
            return;
        }
        if (store.find(key) != store.end()) {
            return;  // Замена не увеличивает размер
        }
        evictArbitrary(store, 1, evicted);
    }

    void beforeInsertBatch(Store& store, size_t batchSize, Evicted* evicted) override {
        const size_t newSize = store.size() + batchSize;
        if (newSize <= maxSize_) {
            return;
        }

        const size_t overflow = newSize - maxSize_;
        if (store.size() <= overflow) {
            // Удаляем всё и сразу готовим место под пакет
            collectAll(store, evicted);
            Store fresh;
            fresh.reserve(batchSize);
            store.swap(fresh);
            return;
        }

        evictArbitrary(store, overflow, evicted);
    }

    /**
     * @brief Новое пустое хранилище с резервом под maxSize элементов
     */
    void reset(Store& store) const override {
        Store fresh;
        fresh.reserve(maxSize_);
        store.swap(fresh);
    }

    size_t maxSize() const override {
        return maxSize_;
    }

private:
    void evictArbitrary(Store& store, size_t count, Evicted* evicted) {
        auto it = store.begin();
        while (count > 0 && it != store.end()) {
            if (evicted) {
                evicted->emplace_back(it->first, std::move(it->second.value));
            }
            it = store.erase(it);
            --count;
        }
    }

    static void collectAll(Store& store, Evicted* evicted) {
        if (!evicted) {
            return;
        }
        evicted->reserve(evicted->size() + store.size());
        for (auto& [key, entry] : store) {
            evicted->emplace_back(key, std::move(entry.value));
        }
    }

    size_t maxSize_;
};
