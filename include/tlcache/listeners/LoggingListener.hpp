#pragma once

#include <tlcache/listeners/ICacheListener.hpp>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша в поток
 * @tparam V Тип значения (значения в лог не пишутся)
 *
 * Уровни:
 * - Debug — все события
 * - Error — только ошибки дискового уровня
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string>>("Images", std::cout,
 *       LoggingListener<std::string>::Level::Debug);
 *   cache.addListener(logger);
 *
 * Каждый TwoLevelCache по умолчанию пишет ошибки диска в std::cerr
 * через такой слушатель уровня Error.
 */
template<typename V>
class LoggingListener : public ICacheListener<V> {
public:
    enum class Level {
        Debug,
        Error
    };

    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя кэша)
     * @param os Поток вывода (по умолчанию std::cout)
     * @param level Минимальный уровень сообщений
     */
    explicit LoggingListener(const std::string& prefix = "TwoLevelCache",
                             std::ostream& os = std::cout,
                             Level level = Level::Debug)
        : prefix_(prefix)
        , os_(os)
        , level_(level)
    {}

    void onHit(const std::string& key) override {
        debug("HIT", key);
    }

    void onMiss(const std::string& key) override {
        debug("MISS", key);
    }

    void onCreate(const std::string& key) override {
        debug("CREATE", key);
    }

    void onPromote(const std::string& key) override {
        debug("PROMOTE", key);
    }

    void onWriteThrough(const std::string& key) override {
        debug("WRITE", key);
    }

    void onDiskRemove(const std::string& key) override {
        debug("DISK REMOVE", key);
    }

    void onEntryRemoved(RemovalCause cause, const std::string& key, const V& oldValue) override {
        (void)oldValue;
        debug(toString(cause), key);
    }

    void onDiskError(DiskOperation operation, const std::string& key,
                     const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] DISK ERROR (" << toString(operation) << "): "
            << key << " (" << message << ")\n";
    }

    Level level() const {
        return level_;
    }

private:
    void debug(const std::string& event, const std::string& key) {
        if (level_ != Level::Debug) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << event << ": " << key << "\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
    Level level_;
    std::mutex mutex_;
};
