#include <ttlcache/TTLCache.hpp>
#include <ttlcache/listeners/LoggingListener.hpp>
#include <iostream>
#include <string>
#include <thread>

/**
 * @brief Демонстрация TTL-кэша
 *
 * Сценарии:
 * 1. Базовые операции: TTL по умолчанию, явный TTL, пакетная запись
 * 2. Ограничение размера: вытеснение произвольного элемента
 */

using namespace std::chrono_literals;

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

/**
 * @brief Демо 1: TTL 1 секунда, очистка каждые 2 секунды, максимум 5 элементов
 */
void demoBasics() {
    printSeparator("Demo 1: Default TTL, explicit TTL, background cleanup");

    TTLCache<std::string, std::string> cache(1s, 2s, 5);

    // Значение с TTL по умолчанию
    cache.set("key", "x");

    // Значение с TTL 1 час
    cache.setWithTTL("key_1h", "x", 1h);

    // Несколько значений сразу с TTL по умолчанию
    cache.setAll({
        {"key_map1", "x"},
        {"key_map2", "x"},
        {"key_map3", "x"},
    });

    if (auto value = cache.get("key")) {
        std::cout << "value: " << *value << "\n";
    }

    // Пустое значение, если ключа нет
    std::cout << "missing value: '" << cache.getValue("zzz") << "'\n";

    // Значение только если не истекло
    if (auto value = cache.getSafe("key")) {
        std::cout << "fresh value: " << *value << "\n";
    }

    std::cout << "waiting for cleanup...\n";
    std::this_thread::sleep_for(3s);
    std::cout << "number of items after cleanup: " << cache.size() << "\n";

    cache.close();
}

/**
 * @brief Демо 2: вытеснение при переполнении с логированием событий
 */
void demoBounded() {
    printSeparator("Demo 2: Size limit with arbitrary eviction");

    TTLCache<std::string, int> cache(0s, 0s, 3);
    cache.addListener(std::make_shared<LoggingListener<std::string, int>>("bounded"));

    for (int i = 0; i < 5; ++i) {
        cache.set("k" + std::to_string(i), i);
    }
    std::cout << "size after 5 writes: " << cache.size() << "\n";

    cache.setAll({{"x", 100}, {"y", 200}});
    std::cout << "size after batch: " << cache.size() << "\n";

    cache.close();
}

int main() {
    demoBasics();
    demoBounded();
    return 0;
}
