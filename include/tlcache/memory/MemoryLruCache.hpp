#pragma once

#include <tlcache/ICache.hpp>
#include <tlcache/RemovalCause.hpp>
#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Ограниченный по весу LRU-кэш в памяти (первый уровень, L1)
 * @tparam K Тип ключа (должен быть hashable для unordered_map)
 * @tparam V Тип значения
 *
 * Структуры данных:
 * - std::list<Entry> order_ — элементы в порядке использования,
 *   front() = самый свежий (MRU), back() = самый старый (LRU)
 * - std::unordered_map<K, iterator> index_ — маппинг ключа на узел списка
 *
 * Точки расширения (переопределяются в наследнике):
 * - create()       — вычислить значение при промахе
 * - entryRemoved() — уведомление об удалении/вытеснении
 * - sizeOf()       — вес элемента (по умолчанию 1)
 *
 * create() и entryRemoved() вызываются БЕЗ удержания мьютекса:
 * они могут быть медленными и могут обращаться к кэшу повторно.
 * Вес вычисляется один раз до вставки и хранится в узле. Вес элемента
 * не должен меняться, пока элемент в кэше — это обязанность вызывающего кода.
 *
 * Пример:
 * @code
 *   class ImageCache : public MemoryLruCache<std::string, Image> {
 *   public:
 *       using MemoryLruCache::MemoryLruCache;
 *   protected:
 *       size_t sizeOf(const std::string&, const Image& image) override {
 *           return image.bytes();
 *       }
 *   };
 * @endcode
 */
template<typename K, typename V>
class MemoryLruCache : public ICache<K, V> {
public:
    /**
     * @brief Конструктор
     * @param maxSize Максимальный суммарный вес (должен быть > 0)
     */
    explicit MemoryLruCache(size_t maxSize)
        : maxSize_(maxSize)
    {
        if (maxSize_ == 0) {
            throw std::invalid_argument("MemoryLruCache maxSize must be greater than 0");
        }
    }

    MemoryLruCache(const MemoryLruCache&) = delete;
    MemoryLruCache& operator=(const MemoryLruCache&) = delete;

    /**
     * @brief Получить значение по ключу
     *
     * Логика:
     * 1. Hit — перемещаем элемент в начало списка и возвращаем
     * 2. Miss — вызываем create() без блокировки
     * 3. Если create() вернул значение, а за это время другой поток
     *    положил значение по тому же ключу — побеждает уже лежащее,
     *    созданное уходит в entryRemoved()
     */
    std::optional<V> get(const K& key) override {
        bool hit = false;
        return get(key, hit);
    }

    /**
     * @brief То же, что get(key), но сообщает, был ли hit
     * @param[out] hit true, если значение уже лежало в памяти (hitCount
     *        увеличен). При промахе false, даже если create() проиграл
     *        гонку и вернулось значение, положенное другим потоком.
     */
    std::optional<V> get(const K& key, bool& hit) {
        hit = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(key);
            if (it != index_.end()) {
                order_.splice(order_.begin(), order_, it->second);
                ++hitCount_;
                hit = true;
                return it->second->value;
            }
            ++missCount_;
        }

        std::optional<V> createdValue = create(key);
        if (!createdValue) {
            return std::nullopt;
        }
        size_t weight = sizeOf(key, *createdValue);

        std::optional<V> existing;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++createCount_;
            auto it = index_.find(key);
            if (it != index_.end()) {
                order_.splice(order_.begin(), order_, it->second);
                existing = it->second->value;
            } else {
                insertFront(key, *createdValue, weight);
            }
        }

        if (existing) {
            entryRemoved(RemovalCause::Removed, key, *createdValue, existing);
            return existing;
        }

        trimToSize(maxSize_);
        return createdValue;
    }

    /**
     * @brief Добавить или заменить значение
     * @return Предыдущее значение или std::nullopt
     *
     * Заменённое значение уходит в entryRemoved() с причиной Removed.
     */
    std::optional<V> put(const K& key, const V& value) override {
        size_t weight = sizeOf(key, value);

        std::optional<V> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++putCount_;
            auto it = index_.find(key);
            if (it != index_.end()) {
                auto node = it->second;
                previous = std::move(node->value);
                size_ -= node->weight;
                node->value = value;
                node->weight = weight;
                size_ += weight;
                order_.splice(order_.begin(), order_, node);
            } else {
                insertFront(key, value, weight);
            }
        }

        if (previous) {
            entryRemoved(RemovalCause::Removed, key, *previous, std::optional<V>(value));
        }

        trimToSize(maxSize_);
        return previous;
    }

    /**
     * @brief Принять значение, полученное извне (например, с диска)
     * @return Значение, которое в итоге лежит в кэше
     *
     * В отличие от put() не меняет счётчики и не заменяет уже лежащее
     * значение: если ключ успели записать, возвращается записанное.
     */
    V adopt(const K& key, const V& value) {
        size_t weight = sizeOf(key, value);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(key);
            if (it != index_.end()) {
                order_.splice(order_.begin(), order_, it->second);
                return it->second->value;
            }
            insertFront(key, value, weight);
        }

        trimToSize(maxSize_);
        return value;
    }

    /**
     * @brief Удалить значение по ключу
     * @return Удалённое значение или std::nullopt
     */
    std::optional<V> remove(const K& key) override {
        std::optional<V> previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(key);
            if (it == index_.end()) {
                return std::nullopt;
            }
            previous = std::move(it->second->value);
            size_ -= it->second->weight;
            order_.erase(it->second);
            index_.erase(it);
        }

        entryRemoved(RemovalCause::Removed, key, *previous, std::nullopt);
        return previous;
    }

    /**
     * @brief Удалить все элементы (причина Removed)
     */
    void evictAll() override {
        evictAll(RemovalCause::Removed);
    }

    /**
     * @brief Удалить все элементы с указанной причиной
     *
     * Уведомления идут от самого старого элемента к самому свежему.
     * С причиной Evicted каждый элемент учитывается в evictionCount().
     */
    void evictAll(RemovalCause cause) {
        std::list<Entry> drained;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            drained.swap(order_);
            index_.clear();
            size_ = 0;
            if (cause == RemovalCause::Evicted) {
                evictionCount_ += drained.size();
            }
        }

        for (auto it = drained.rbegin(); it != drained.rend(); ++it) {
            entryRemoved(cause, it->key, it->value, std::nullopt);
        }
    }

    /**
     * @brief Вытеснять LRU-элементы, пока суммарный вес больше maxSize
     * @param maxSize Целевой вес (может быть меньше ёмкости)
     */
    void trimToSize(size_t maxSize) {
        while (true) {
            std::optional<Entry> victim;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (size_ <= maxSize || order_.empty()) {
                    break;
                }
                victim = std::move(order_.back());
                order_.pop_back();
                index_.erase(victim->key);
                size_ -= victim->weight;
                ++evictionCount_;
            }

            entryRemoved(RemovalCause::Evicted, victim->key, victim->value, std::nullopt);
        }
    }

    /**
     * @brief Проверить наличие ключа (не меняет порядок и счётчики)
     */
    bool contains(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    size_t maxSize() const override {
        return maxSize_;
    }

    // ==================== Статистика ====================

    /// Сколько раз get() нашёл значение в кэше
    uint64_t hitCount() const { return hitCount_.load(); }

    /// Сколько раз get() не нашёл значение (в том числе перед create())
    uint64_t missCount() const { return missCount_.load(); }

    /// Сколько раз create() вернул значение
    uint64_t createCount() const { return createCount_.load(); }

    /// Сколько раз вызывался put()
    uint64_t putCount() const { return putCount_.load(); }

    /// Сколько элементов было вытеснено
    uint64_t evictionCount() const { return evictionCount_.load(); }

    /**
     * @brief Копия содержимого от самого старого к самому свежему
     */
    std::vector<std::pair<K, V>> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::pair<K, V>> result;
        result.reserve(order_.size());
        for (auto it = order_.rbegin(); it != order_.rend(); ++it) {
            result.emplace_back(it->key, it->value);
        }
        return result;
    }

    std::string toString() const {
        uint64_t hits = hitCount_.load();
        uint64_t misses = missCount_.load();
        uint64_t accesses = hits + misses;
        uint64_t hitPercent = accesses != 0 ? (100 * hits / accesses) : 0;

        std::ostringstream os;
        os << "MemoryLruCache[maxSize=" << maxSize_
           << ",hits=" << hits
           << ",misses=" << misses
           << ",hitRate=" << hitPercent << "%]";
        return os.str();
    }

protected:
    /**
     * @brief Вычислить значение при промахе
     * @return Значение или std::nullopt (по умолчанию)
     */
    virtual std::optional<V> create(const K& key) {
        (void)key;
        return std::nullopt;
    }

    /**
     * @brief Уведомление об удалении элемента
     * @param cause Evicted — вытеснение, Removed — put()/remove()/evictAll()
     * @param newValue Новое значение, если удаление вызвано put()
     */
    virtual void entryRemoved(RemovalCause cause, const K& key,
                              const V& oldValue, const std::optional<V>& newValue) {
        (void)cause; (void)key; (void)oldValue; (void)newValue;
    }

    /**
     * @brief Вес элемента в единицах maxSize
     */
    virtual size_t sizeOf(const K& key, const V& value) {
        (void)key; (void)value;
        return 1;
    }

private:
    struct Entry {
        K key;
        V value;
        size_t weight;
    };

    /// @note Вызывать под lock!
    void insertFront(const K& key, const V& value, size_t weight) {
        order_.push_front(Entry{key, value, weight});
        index_[key] = order_.begin();
        size_ += weight;
    }

private:
    const size_t maxSize_;
    size_t size_ = 0;

    std::list<Entry> order_;
    std::unordered_map<K, typename std::list<Entry>::iterator> index_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> hitCount_{0};
    std::atomic<uint64_t> missCount_{0};
    std::atomic<uint64_t> createCount_{0};
    std::atomic<uint64_t> putCount_{0};
    std::atomic<uint64_t> evictionCount_{0};
};
