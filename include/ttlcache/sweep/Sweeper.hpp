#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

/**
 * @brief Фоновая периодическая задача (тикер + одноразовый сигнал остановки)
 * 
 * Архитектура:
 * - Один поток, который спит на condition_variable до следующего тика
 * - На каждом тике вызывает task
 * - stop() выставляет флаг, будит поток и дожидается его завершения
 * 
 * Флаг running_ хранится явно: повторный stop() не отправляет сигнал
 * второй раз, но дожидается завершения потока, если тот ещё работает.
 * 
 * Если задача выполняется дольше интервала, пропущенные тики
 * не накапливаются - следующий тик отсчитывается от текущего момента.
 * 
 * @code
 *   Sweeper sweeper(std::chrono::seconds(1), [&]() { cache.cleanExpired(); });
 *   sweeper.start();
 *   // ...
 *   sweeper.stop();
 * @endcode
 */
class Sweeper {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = Clock::duration;
    using Task = std::function<void()>;

    /**
     * @brief Конструктор
     * @param interval Интервал между вызовами (должен быть > 0)
     * @param task Задача, выполняемая на каждом тике
     */
    Sweeper(Duration interval, Task task)
        : interval_(interval)
        , task_(std::move(task))
    {
        if (interval_ <= Duration::zero()) {
            throw std::invalid_argument("Sweep interval must be positive");
        }
        if (!task_) {
            throw std::invalid_argument("Sweep task cannot be empty");
        }
    }

    ~Sweeper() {
        stop();
        std::lock_guard<std::mutex> joinLock(joinMutex_);
        if (thread_.joinable()) {
            // Разрушение из собственного потока: join невозможен
            thread_.detach();
        }
    }

    // Запрещаем копирование
    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    /**
     * @brief Запустить фоновый поток
     * @return false если поток уже запускался
     */
    bool start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ || thread_.joinable()) {
            return false;
        }
        running_ = true;
        stopRequested_ = false;
        thread_ = std::thread(&Sweeper::workerLoop, this);
        workerId_ = thread_.get_id();
        return true;
    }

    /**
     * @brief Остановить фоновый поток и дождаться завершения
     * @return true если поток работал и был остановлен этим вызовом
     * 
     * Идемпотентен. Безопасен при вызове из самой задачи:
     * тогда поток просто выйдет из цикла после возврата из task,
     * а join выполнит следующий stop() из другого потока.
     */
    bool stop() {
        bool stoppedHere = false;
        std::thread::id workerId;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_) {
                running_ = false;
                stopRequested_ = true;
                stoppedHere = true;
            }
            workerId = workerId_;
        }
        if (stoppedHere) {
            condVar_.notify_all();
        }

        // Сигнал отправляется один раз, но дождаться потока должен любой
        // вызов не из самого потока: он мог быть остановлен изнутри задачи
        // и ещё не выйти из неё.
        if (workerId != std::this_thread::get_id()) {
            std::lock_guard<std::mutex> joinLock(joinMutex_);
            if (thread_.joinable()) {
                thread_.join();
            }
        }
        return stoppedHere;
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    Duration interval() const {
        return interval_;
    }

private:
    void workerLoop() {
        std::unique_lock<std::mutex> lock(mutex_);
        auto nextTick = Clock::now() + interval_;

        while (!stopRequested_) {
            if (condVar_.wait_until(lock, nextTick, [this] { return stopRequested_; })) {
                break;
            }

            lock.unlock();
            executeTask();
            lock.lock();

            nextTick += interval_;
            auto now = Clock::now();
            if (nextTick <= now) {
                nextTick = now + interval_;
            }
        }
    }

    void executeTask() {
        try {
            task_();
        } catch (const std::exception& e) {
            std::cerr << "[Sweeper] Task error: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[Sweeper] Unknown task error" << std::endl;
        }
    }

private:
    Duration interval_;
    Task task_;
    std::thread thread_;
    std::thread::id workerId_;
    std::mutex joinMutex_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool running_ = false;
    bool stopRequested_ = false;
};
