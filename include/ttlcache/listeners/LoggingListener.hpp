#pragma once

#include "ICacheListener.hpp"
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша в консоль
 * @tparam K Тип ключа (должен поддерживать вывод в ostream)
 * @tparam V Тип значения (должен поддерживать вывод в ostream)
 * 
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string, int>>("sessions");
 *   cache.addListener(logger);
 * 
 * Запись в поток сериализована мьютексом: события приходят
 * и из пользовательских потоков, и из потока фоновой очистки.
 */
template<typename K, typename V>
class LoggingListener : public ICacheListener<K, V> {
public:
    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя кэша)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "TTLCache", 
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onInsert(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] INSERT: " << key << " = " << value << "\n";
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] UPDATE: " << key 
            << " (" << oldValue << " -> " << newValue << ")\n";
    }

    void onEvict(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] EVICT: " << key << " = " << value << "\n";
    }

    void onRemove(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] REMOVE: " << key << "\n";
    }

    void onExpire(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] EXPIRE: " << key << "\n";
    }

    void onClear(size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] CLEAR: " << count << " elements\n";
    }

    void onClose(size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] CLOSE: " << count << " elements\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
