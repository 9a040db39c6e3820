#pragma once

#include <algorithm>
#include <ttlcache/ITTLCache.hpp>
#include <ttlcache/CacheConfig.hpp>
#include <ttlcache/Entry.hpp>
#include <ttlcache/capacity/ICapacityPolicy.hpp>
#include <ttlcache/capacity/Unbounded.hpp>
#include <ttlcache/capacity/BoundedArbitraryEviction.hpp>
#include <ttlcache/listeners/ICacheListener.hpp>
#include <ttlcache/sweep/Sweeper.hpp>
#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>

/**
 * @brief Создать политику ёмкости по maxSize
 * @return Unbounded при maxSize == 0, иначе BoundedArbitraryEviction
 */
template<typename K, typename V>
std::unique_ptr<ICapacityPolicy<K, V>> makeCapacityPolicy(size_t maxSize) {
    if (maxSize == 0) {
        return std::make_unique<Unbounded<K, V>>();
    }
    return std::make_unique<BoundedArbitraryEviction<K, V>>(maxSize);
}

/**
 * @brief Потокобезопасный кэш с TTL на элемент и фоновой очисткой
 * @tparam K Тип ключа (должен быть hashable для unordered_map)
 * @tparam V Тип значения
 *
 * Архитектура:
 * - Данные хранятся в std::unordered_map<K, Entry<V>> - O(1) доступ
 * - Один std::shared_mutex: чтение под shared lock, запись под exclusive
 * - Политика ёмкости инжектируется через конструктор (Strategy pattern):
 *   Unbounded или BoundedArbitraryEviction. Чтение, удаление и очистка
 *   общие, различается только путь записи.
 * - Фоновая очистка (Sweeper) - опциональна, запускается в конструкторе
 * - Слушатели получают уведомления после снятия блокировки (Observer pattern)
 *
 * Два независимых механизма удаления:
 * 1. Eviction (вытеснение) - при переполнении, произвольный элемент
 * 2. Expiration (истечение) - фоновая очистка или cleanExpired()
 *
 * Ленивого удаления при чтении нет: get() возвращает и просроченные
 * элементы, getSafe() их скрывает, но не удаляет.
 *
 * Пример использования:
 * @code
 *   // TTL 1 секунда, очистка каждые 2 секунды, не более 5 элементов
 *   TTLCache<std::string, std::string> cache(
 *       std::chrono::seconds(1), std::chrono::seconds(2), 5);
 *
 *   cache.set("key", "x");
 *   cache.setWithTTL("key_1h", "x", std::chrono::hours(1));
 *
 *   if (auto value = cache.getSafe("key")) {
 *       use(*value);
 *   }
 * @endcode
 *
 * @note Деструктор вызывает close(): фоновый поток не переживает кэш.
 */
template<typename K, typename V>
class TTLCache : public ITTLCache<K, V> {
public:
    using Duration = typename ITTLCache<K, V>::Duration;
    using Store = typename ICapacityPolicy<K, V>::Store;
    using Listener = ICacheListener<K, V>;

    /**
     * @brief Конструктор
     * @param defaultTTL TTL по умолчанию (<= 0 - бессрочно)
     * @param cleanupInterval Интервал фоновой очистки (<= 0 - без фоновой очистки)
     * @param maxSize Максимальный размер (0 - без ограничения)
     */
    TTLCache(Duration defaultTTL, Duration cleanupInterval, size_t maxSize)
        : TTLCache(CacheConfig{defaultTTL, cleanupInterval, maxSize})
    {}

    /**
     * @brief Конструктор из конфигурации
     */
    explicit TTLCache(const CacheConfig& config)
        : TTLCache(config, makeCapacityPolicy<K, V>(config.maxSize))
    {}

    /**
     * @brief Конструктор с явной политикой ёмкости
     * @param config Конфигурация (maxSize игнорируется - решает политика)
     * @param capacityPolicy Политика ёмкости (ownership передаётся кэшу)
     */
    TTLCache(const CacheConfig& config,
             std::unique_ptr<ICapacityPolicy<K, V>> capacityPolicy)
        : defaultTTL_(config.defaultTTL)
        , capacityPolicy_(std::move(capacityPolicy))
    {
        if (!capacityPolicy_) {
            throw std::invalid_argument("Capacity policy cannot be null");
        }
        capacityPolicy_->reset(store_);

        if (config.hasCleanup()) {
            sweeper_ = std::make_unique<Sweeper>(
                config.cleanupInterval, [this]() { cleanExpired(); });
            sweeper_->start();
        }
    }

    ~TTLCache() override {
        close();
    }

    // Фоновый поток держит this - копирование и перемещение запрещены
    TTLCache(const TTLCache&) = delete;
    TTLCache& operator=(const TTLCache&) = delete;

    // ==================== Чтение ====================

    std::optional<V> get(const K& key) const override {
        std::shared_lock lock(mutex_);
        auto it = store_.find(key);
        if (it == store_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    std::optional<V> getSafe(const K& key) const override {
        const int64_t now = ExpirationClock::now();
        std::shared_lock lock(mutex_);
        auto it = store_.find(key);
        if (it == store_.end() || it->second.isExpired(now)) {
            return std::nullopt;
        }
        return it->second.value;
    }

    V getValue(const K& key) const override {
        std::shared_lock lock(mutex_);
        auto it = store_.find(key);
        if (it == store_.end()) {
            return V{};
        }
        return it->second.value;
    }

    bool isEmpty() const override {
        return size() == 0;
    }

    size_t size() const override {
        std::shared_lock lock(mutex_);
        return store_.size();
    }

    // ==================== Запись ====================

    void set(const K& key, const V& value) override {
        setWithTTL(key, value, defaultTTL_);
    }

    /**
     * @brief Добавить или заменить элемент с явным TTL
     *
     * Логика:
     * 1. Считаем expiresAt до захвата блокировки
     * 2. Политика ёмкости освобождает место (только для нового ключа)
     * 3. Вставляем или заменяем элемент целиком
     */
    void setWithTTL(const K& key, const V& value, Duration ttl) override {
        const int64_t expiresAt = ExpirationClock::expiresAt(ttl);
        const bool notify = hasListeners();
        Events events;

        {
            std::unique_lock lock(mutex_);
            Evicted evicted;
            capacityPolicy_->beforeInsert(store_, key, notify ? &evicted : nullptr);
            collectEvictions(evicted, events);
            writeEntry(key, value, expiresAt, notify ? &events : nullptr);
        }

        dispatch(events);
    }

    void setAll(const std::unordered_map<K, V>& values) override {
        setAllWithTTL(values, defaultTTL_);
    }

    /**
     * @brief Пакетная запись с общим expiresAt
     *
     * Весь пакет пишется под одним захватом exclusive lock:
     * читатели видят либо состояние до пакета, либо после.
     */
    void setAllWithTTL(const std::unordered_map<K, V>& values, Duration ttl) override {
        if (values.empty()) {
            return;
        }

        const int64_t expiresAt = ExpirationClock::expiresAt(ttl);
        const bool notify = hasListeners();
        Events events;

        {
            std::unique_lock lock(mutex_);
            Evicted evicted;
            capacityPolicy_->beforeInsertBatch(store_, values.size(), notify ? &evicted : nullptr);
            collectEvictions(evicted, events);
            for (const auto& [key, value] : values) {
                writeEntry(key, value, expiresAt, notify ? &events : nullptr);
            }
        }

        dispatch(events);
    }

    // ==================== Удаление ====================

    bool remove(const K& key) override {
        {
            std::unique_lock lock(mutex_);
            if (store_.erase(key) == 0) {
                return false;
            }
        }

        if (hasListeners()) {
            dispatch(Events{[key](Listener& listener) { listener.onRemove(key); }});
        }
        return true;
    }

    void clear() override {
        size_t count;
        {
            std::unique_lock lock(mutex_);
            count = store_.size();
            capacityPolicy_->reset(store_);
        }

        if (hasListeners()) {
            dispatch(Events{[count](Listener& listener) { listener.onClear(count); }});
        }
    }

    /**
     * @brief Удалить все просроченные элементы
     * @return Количество удалённых элементов
     *
     * Две фазы:
     * 1. Под shared lock собираем ключи, просроченные на момент now
     *    (now берётся один раз в начале) - читатели не блокируются
     * 2. Под exclusive lock удаляем собранные ключи
     *
     * Элемент, истёкший во время первой фазы, уйдёт на следующем цикле.
     * Ключ, заменённый свежим элементом между фазами, не удаляется.
     */
    size_t cleanExpired() override {
        const int64_t now = ExpirationClock::now();
        std::vector<K> expired;

        {
            std::shared_lock lock(mutex_);
            for (const auto& [key, entry] : store_) {
                if (entry.isExpired(now)) {
                    expired.push_back(key);
                }
            }
        }

        if (expired.empty()) {
            return 0;
        }

        const bool notify = hasListeners();
        Events events;
        size_t count = 0;

        {
            std::unique_lock lock(mutex_);
            for (const K& key : expired) {
                auto it = store_.find(key);
                // Ключ могли перезаписать между фазами: удаляем только
                // то, что по-прежнему просрочено на момент now
                if (it == store_.end() || !it->second.isExpired(now)) {
                    continue;
                }
                store_.erase(it);
                ++count;
                if (notify) {
                    events.push_back([key](Listener& listener) { listener.onExpire(key); });
                }
            }
        }

        dispatch(events);
        return count;
    }

    /**
     * @brief Остановить фоновую очистку и освободить хранилище
     *
     * Поток очистки останавливается вне блокировки хранилища:
     * он может как раз ждать её внутри cleanExpired().
     */
    void close() override {
        if (sweeper_) {
            sweeper_->stop();
        }

        size_t count;
        {
            std::unique_lock lock(mutex_);
            count = store_.size();
            Store().swap(store_);
        }

        if (hasListeners()) {
            dispatch(Events{[count](Listener& listener) { listener.onClose(count); }});
        }
    }

    // ==================== Информация ====================

    /**
     * @brief Работает ли фоновая очистка
     */
    bool cleanupRunning() const {
        return sweeper_ && sweeper_->running();
    }

    Duration defaultTTL() const {
        return defaultTTL_;
    }

    /**
     * @brief Максимальный размер (0 - без ограничения)
     */
    size_t maxSize() const {
        return capacityPolicy_->maxSize();
    }

    // ==================== Управление слушателями ====================

    /**
     * @brief Добавить слушателя событий
     */
    void addListener(std::shared_ptr<Listener> listener) {
        if (!listener) {
            return;
        }
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.push_back(std::move(listener));
        listenerCount_ = listeners_.size();
    }

    /**
     * @brief Удалить слушателя
     */
    void removeListener(std::shared_ptr<Listener> listener) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
        listenerCount_ = listeners_.size();
    }

private:
    using Evicted = typename ICapacityPolicy<K, V>::Evicted;
    /// Отложенное уведомление - выполняется после снятия блокировки
    using Event = std::function<void(Listener&)>;
    using Events = std::vector<Event>;

    /**
     * @brief Вставить или заменить элемент (вызывается под exclusive lock)
     */
    void writeEntry(const K& key, const V& value, int64_t expiresAt, Events* events) {
        auto it = store_.find(key);
        if (it == store_.end()) {
            store_.emplace(key, Entry<V>{value, expiresAt});
            if (events) {
                events->push_back([key, value](Listener& listener) {
                    listener.onInsert(key, value);
                });
            }
            return;
        }

        if (events) {
            events->push_back([key, oldValue = it->second.value, value](Listener& listener) {
                listener.onUpdate(key, oldValue, value);
            });
        }
        it->second = Entry<V>{value, expiresAt};
    }

    static void collectEvictions(Evicted& evicted, Events& events) {
        for (auto& [key, value] : evicted) {
            events.push_back([key = std::move(key), value = std::move(value)](Listener& listener) {
                listener.onEvict(key, value);
            });
        }
    }

    bool hasListeners() const {
        return listenerCount_.load() > 0;
    }

    /**
     * @brief Разослать накопленные события всем слушателям
     *
     * Список слушателей копируется под своим мьютексом, чтобы callback
     * мог добавить или удалить слушателя без взаимоблокировки.
     */
    void dispatch(const Events& events) {
        if (events.empty()) {
            return;
        }

        std::vector<std::shared_ptr<Listener>> listeners;
        {
            std::lock_guard<std::mutex> lock(listenersMutex_);
            listeners = listeners_;
        }

        for (const auto& event : events) {
            for (auto& listener : listeners) {
                notifyListener(*listener, event);
            }
        }
    }

    static void notifyListener(Listener& listener, const Event& event) {
        try {
            event(listener);
        } catch (const std::exception& e) {
            std::cerr << "[TTLCache] Listener error: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[TTLCache] Unknown listener error" << std::endl;
        }
    }

private:
    Duration defaultTTL_;
    Store store_;
    mutable std::shared_mutex mutex_;
    std::unique_ptr<ICapacityPolicy<K, V>> capacityPolicy_;

    std::vector<std::shared_ptr<Listener>> listeners_;
    std::mutex listenersMutex_;
    std::atomic<size_t> listenerCount_{0};

    /// Объявлен последним: разрушается первым, пока остальные поля ещё живы
    std::unique_ptr<Sweeper> sweeper_;
};

/**
 * @brief Фабрика кэша за интерфейсом
 * @param defaultTTL TTL по умолчанию (<= 0 - бессрочно)
 * @param cleanupInterval Интервал фоновой очистки (<= 0 - без очистки)
 * @param maxSize Максимальный размер (0 - без ограничения)
 */
template<typename K, typename V>
std::unique_ptr<ITTLCache<K, V>> makeTTLCache(
    ExpirationClock::Duration defaultTTL,
    ExpirationClock::Duration cleanupInterval,
    size_t maxSize)
{
    return std::make_unique<TTLCache<K, V>>(defaultTTL, cleanupInterval, maxSize);
}
