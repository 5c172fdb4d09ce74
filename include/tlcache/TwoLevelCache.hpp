#pragma once

#include <tlcache/ICache.hpp>
#include <tlcache/RemovalCause.hpp>
#include <tlcache/memory/MemoryLruCache.hpp>
#include <tlcache/disk/DiskLruCache.hpp>
#include <tlcache/serialization/IConverter.hpp>
#include <tlcache/listeners/ICacheListener.hpp>
#include <tlcache/listeners/LoggingListener.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <new>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Двухуровневый LRU-кэш: небольшой в памяти (L1) и большой на диске (L2)
 * @tparam V Тип значения (ключи — строки)
 *
 * Архитектура:
 * - L1 — MemoryLruCache, ограничен суммарным весом, авторитетен
 * - L2 — DiskLruCache, ограничен размером в байтах, best-effort
 * - Значения попадают на диск через IConverter
 *
 * Правила согласования уровней:
 * - put()    — запись в память, затем write-through на диск
 * - get()    — память → create() → диск; найденное на диске поднимается в память
 * - remove() — удаление из памяти и с диска
 * - вытеснение из памяти (Evicted) диск не трогает: значение остаётся
 *   на диске и вернётся при следующем get()
 * - явное удаление из памяти (Removed: put поверх, remove, evictAll)
 *   удаляет копию с диска
 *
 * Любая ошибка диска (I/O, повреждённые данные, нехватка памяти при
 * декодировании) не выходит наружу: операция над диском считается
 * несостоявшейся, ошибка уходит в onDiskError() слушателей. По умолчанию
 * ошибки пишутся в std::cerr (см. errorLogger()).
 *
 * Потокобезопасность: операции с диском держат разделяемую блокировку L2,
 * close() и evictAllDisk() — эксклюзивную. Закрытие дожидается текущих
 * записей и чтений, после него операции с диском тихо пропускаются.
 *
 * Статистика (hitCount() и т.д.) — только memory-уровня: get(), который
 * нашёл значение на диске, засчитывается как miss. Полную картину по
 * обоим уровням даёт StatsListener.
 *
 * Пример:
 * @code
 *   TwoLevelCache<std::string> cache("/tmp/cache", 1, 100, 10 * 1024 * 1024,
 *       std::make_shared<BinaryConverter<std::string>>());
 *   cache.put("k1", "value");
 *   auto value = cache.get("k1");
 * @endcode
 */
template<typename V>
class TwoLevelCache : public ICache<std::string, V> {
public:
    /// Каждая запись на диске хранит одно значение
    static constexpr int VALUE_INDEX = 0;

    /**
     * @brief Конструктор только с memory-уровнем
     * @param maxSizeMem Максимальный суммарный вес элементов в памяти
     */
    explicit TwoLevelCache(size_t maxSizeMem)
        : memory_(*this, maxSizeMem)
    {
        installErrorLogger();
    }

    /**
     * @brief Конструктор с дисковым уровнем
     * @param directory Каталог для L2 (должен быть доступен на запись)
     * @param appVersion Версия формата данных; при смене версии
     *        существующий кэш на диске не откроется
     * @param maxSizeMem Максимальный суммарный вес элементов в памяти
     * @param maxSizeDisk Максимальный размер L2 в байтах
     * @param converter Преобразование значений в байты и обратно
     * @throws std::invalid_argument если maxSizeMem >= maxSizeDisk или
     *         converter == nullptr (проверяется до обращения к диску)
     */
    TwoLevelCache(const std::filesystem::path& directory, int appVersion,
                  size_t maxSizeMem, uint64_t maxSizeDisk,
                  std::shared_ptr<IConverter<V>> converter)
        : converter_(checkConfiguration(maxSizeMem, maxSizeDisk, std::move(converter)))
        , memory_(*this, maxSizeMem)
        , disk_(DiskLruCache::open(directory, appVersion, 1, maxSizeDisk))
    {
        installErrorLogger();
    }

    TwoLevelCache(const TwoLevelCache&) = delete;
    TwoLevelCache& operator=(const TwoLevelCache&) = delete;

    /**
     * @brief Получить значение по ключу
     *
     * Порядок поиска:
     * 1. Память (hit)
     * 2. create() — вызывается memory-уровнем при промахе, ДО диска;
     *    созданное значение сразу пишется на диск
     * 3. Диск — прочитанное значение поднимается в память без
     *    изменения счётчиков put/create
     *
     * Ошибка чтения или декодирования неотличима от обычного промаха.
     */
    std::optional<V> get(const std::string& key) override {
        bool hit = false;
        std::optional<V> value = memory_.get(key, hit);
        if (value) {
            if (hit) {
                notifyHit(key);
            }
            return value;
        }

        value = readFromDisk(key);
        if (value) {
            V resident = memory_.adopt(key, *value);
            notifyPromote(key);
            return resident;
        }

        notifyMiss(key);
        return std::nullopt;
    }

    /**
     * @brief Положить значение в память и записать его на диск
     * @return Предыдущее значение в памяти или std::nullopt
     *
     * Ошибка записи на диск не отменяет запись в память.
     */
    std::optional<V> put(const std::string& key, const V& value) override {
        std::optional<V> previous = memory_.put(key, value);
        writeToDisk(key, value);
        return previous;
    }

    /**
     * @brief Удалить значение из памяти и с диска
     * @return Значение, которое было в памяти, или std::nullopt
     */
    std::optional<V> remove(const std::string& key) override {
        std::optional<V> previous = memory_.remove(key);
        removeFromDisk(key);
        return previous;
    }

    /**
     * @brief Очистить оба уровня
     *
     * Память очищается с причиной Removed (каждая копия на диске
     * удаляется), затем каталог L2 удаляется целиком.
     * @throws std::filesystem::filesystem_error если каталог не удалось удалить
     */
    void evictAll() override {
        memory_.evictAll(RemovalCause::Removed);
        evictAllDisk();
    }

    /**
     * @brief Очистить только память
     *
     * Элементы уходят с причиной Evicted — копии на диске сохраняются,
     * и get() поднимет их обратно.
     */
    void evictAllMem() {
        memory_.evictAll(RemovalCause::Evicted);
    }

    /**
     * @brief Закрыть L2 и удалить его каталог со всем содержимым
     *
     * Удаляются ВСЕ файлы каталога, включая созданные не кэшем.
     * Дальше кэш работает только в памяти.
     */
    void evictAllDisk() {
        if (disk_) {
            std::unique_lock<std::shared_mutex> lock(diskMutex_);
            disk_->deleteCache();
        }
    }

    // ==================== Размеры ====================

    size_t size() const override {
        return memory_.size();
    }

    size_t maxSize() const override {
        return memory_.maxSize();
    }

    /// Суммарный вес элементов в памяти
    size_t sizeMem() const {
        return memory_.size();
    }

    size_t maxSizeMem() const {
        return memory_.maxSize();
    }

    /**
     * @brief Байт, занятых значениями на диске
     *
     * Может временно превышать maxSizeDisk() до ближайшей записи.
     */
    uint64_t sizeDisk() const {
        return disk_ ? disk_->size() : 0;
    }

    uint64_t maxSizeDisk() const {
        return disk_ ? disk_->maxSize() : 0;
    }

    // ==================== Статистика memory-уровня ====================

    uint64_t hitCount() const { return memory_.hitCount(); }
    uint64_t missCount() const { return memory_.missCount(); }
    uint64_t createCount() const { return memory_.createCount(); }
    uint64_t putCount() const { return memory_.putCount(); }
    uint64_t evictionCount() const { return memory_.evictionCount(); }

    /**
     * @brief Копия содержимого памяти от самого старого к самому свежему
     */
    std::vector<std::pair<std::string, V>> snapshot() const {
        return memory_.snapshot();
    }

    std::string toString() const {
        return memory_.toString();
    }

    // ==================== Дисковый уровень ====================

    /**
     * @brief Каталог L2 или std::nullopt для кэша только в памяти
     */
    std::optional<std::filesystem::path> directory() const {
        if (!disk_) {
            return std::nullopt;
        }
        return disk_->directory();
    }

    /**
     * @brief Закрыт ли L2 (кэш только в памяти всегда считается закрытым)
     */
    bool isClosed() const {
        return disk_ ? disk_->isClosed() : true;
    }

    /**
     * @brief Сбросить буферизованные операции L2 на диск
     */
    void flush() {
        std::shared_lock<std::shared_mutex> lock(diskMutex_);
        if (diskAvailable()) {
            disk_->flush();
        }
    }

    /**
     * @brief Закрыть L2; данные остаются на диске
     *
     * После закрытия кэш продолжает работать как кэш в памяти,
     * операции с диском пропускаются. Дожидается завершения операций
     * с диском, начатых другими потоками.
     */
    void close() {
        if (disk_) {
            std::unique_lock<std::shared_mutex> lock(diskMutex_);
            disk_->close();
        }
    }

    // ==================== Управление слушателями ====================

    void addListener(std::shared_ptr<ICacheListener<V>> listener) {
        if (!listener) {
            return;
        }
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.push_back(std::move(listener));
    }

    void removeListener(const std::shared_ptr<ICacheListener<V>>& listener) {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

    /**
     * @brief Слушатель, который пишет ошибки диска в std::cerr
     *
     * Зарегистрирован при создании; чтобы заглушить вывод:
     * @code
     *   cache.removeListener(cache.errorLogger());
     * @endcode
     */
    std::shared_ptr<LoggingListener<V>> errorLogger() const {
        return errorLogger_;
    }

protected:
    /**
     * @brief Вычислить значение при промахе памяти
     * @return Значение или std::nullopt (по умолчанию)
     *
     * Вызывается без блокировок и ДО обращения к диску. Результат
     * записывается на диск и кладётся в память. Если за время вычисления
     * другой поток положил значение по тому же ключу, созданное значение
     * отбрасывается через entryRemoved().
     */
    virtual std::optional<V> create(const std::string& key) {
        (void)key;
        return std::nullopt;
    }

    /**
     * @brief Уведомление об удалении элемента из памяти
     * @param cause Evicted — вытеснение, Removed — put()/remove()/evictAll()
     * @param newValue Новое значение, если удаление вызвано put()
     *
     * Вызывается после обработки диска, без блокировок: другие потоки
     * могут в это время работать с кэшем, в том числе с тем же ключом.
     */
    virtual void entryRemoved(RemovalCause cause, const std::string& key,
                              const V& oldValue, const std::optional<V>& newValue) {
        (void)cause; (void)key; (void)oldValue; (void)newValue;
    }

    /**
     * @brief Вес элемента в единицах maxSizeMem (по умолчанию 1)
     *
     * Вес не должен меняться, пока элемент находится в памяти.
     */
    virtual size_t sizeOf(const std::string& key, const V& value) {
        (void)key; (void)value;
        return 1;
    }

private:
    /**
     * @brief Memory-уровень, перенаправляющий свои точки расширения в кэш
     */
    class MemoryTier : public MemoryLruCache<std::string, V> {
    public:
        MemoryTier(TwoLevelCache& owner, size_t maxSize)
            : MemoryLruCache<std::string, V>(maxSize)
            , owner_(owner)
        {}

    protected:
        std::optional<V> create(const std::string& key) override {
            return owner_.createAndWriteThrough(key);
        }

        void entryRemoved(RemovalCause cause, const std::string& key,
                          const V& oldValue, const std::optional<V>& newValue) override {
            owner_.onMemoryEntryRemoved(cause, key, oldValue, newValue);
        }

        size_t sizeOf(const std::string& key, const V& value) override {
            return owner_.sizeOf(key, value);
        }

    private:
        TwoLevelCache& owner_;
    };

    static std::shared_ptr<IConverter<V>> checkConfiguration(size_t maxSizeMem, uint64_t maxSizeDisk,
                                                             std::shared_ptr<IConverter<V>> converter) {
        if (static_cast<uint64_t>(maxSizeMem) >= maxSizeDisk) {
            throw std::invalid_argument(
                "It makes more sense to have a larger second-level disk cache: maxSizeMem="
                + std::to_string(maxSizeMem) + ", maxSizeDisk=" + std::to_string(maxSizeDisk));
        }
        if (!converter) {
            throw std::invalid_argument("A converter must be submitted for the disk cache");
        }
        return converter;
    }

    void installErrorLogger() {
        errorLogger_ = std::make_shared<LoggingListener<V>>(
            "TwoLevelCache", std::cerr, LoggingListener<V>::Level::Error);
        addListener(errorLogger_);
    }

    /// L2 есть и не закрыт; вызывать под diskMutex_
    bool diskAvailable() const {
        return disk_ && !disk_->isClosed();
    }

    // ==================== Обработка событий памяти ====================

    std::optional<V> createAndWriteThrough(const std::string& key) {
        std::optional<V> created = create(key);
        if (!created) {
            return std::nullopt;
        }
        writeToDisk(key, *created);
        notifyCreate(key);
        return created;
    }

    void onMemoryEntryRemoved(RemovalCause cause, const std::string& key,
                              const V& oldValue, const std::optional<V>& newValue) {
        if (cause == RemovalCause::Removed) {
            removeFromDisk(key);
        }
        notifyEntryRemoved(cause, key, oldValue);
        entryRemoved(cause, key, oldValue, newValue);
    }

    // ==================== Операции с диском (best-effort) ====================
    //
    // Слушатели уведомляются после снятия diskMutex_: слушатель может
    // сам вызвать close().

    std::optional<V> readFromDisk(const std::string& key) {
        std::string error;
        {
            std::shared_lock<std::shared_mutex> lock(diskMutex_);
            if (!diskAvailable()) {
                return std::nullopt;
            }
            try {
                auto snapshot = disk_->get(key);
                if (!snapshot) {
                    return std::nullopt;
                }
                return converter_->fromBytes(snapshot->readAll(VALUE_INDEX));
            } catch (const std::bad_alloc& e) {
                error = std::string("out of memory while decoding: ") + e.what();
            } catch (const std::exception& e) {
                error = e.what();
            }
        }
        notifyDiskError(DiskOperation::Read, key, error);
        return std::nullopt;
    }

    void writeToDisk(const std::string& key, const V& value) {
        std::vector<std::string> errors;
        bool committed = false;
        {
            std::shared_lock<std::shared_mutex> lock(diskMutex_);
            if (!diskAvailable()) {
                return;
            }

            std::unique_ptr<DiskLruCache::Editor> editor;
            try {
                editor = disk_->edit(key);
                if (editor) {
                    converter_->toStream(value, editor->newOutputStream(VALUE_INDEX));
                    editor->commit();
                    committed = true;
                }
            } catch (const std::exception& e) {
                errors.push_back(e.what());
            }

            if (editor && !committed) {
                try {
                    editor->abortUnlessCommitted();
                } catch (const std::exception& e) {
                    errors.push_back(e.what());
                }
            }
        }

        for (const auto& error : errors) {
            notifyDiskError(DiskOperation::Write, key, error);
        }
        if (committed) {
            notifyWriteThrough(key);
        }
    }

    void removeFromDisk(const std::string& key) {
        std::string error;
        bool failed = false;
        bool removed = false;
        {
            std::shared_lock<std::shared_mutex> lock(diskMutex_);
            if (!diskAvailable()) {
                return;
            }
            try {
                removed = disk_->remove(key);
            } catch (const std::exception& e) {
                error = e.what();
                failed = true;
            }
        }

        if (failed) {
            notifyDiskError(DiskOperation::Remove, key, error);
        }
        if (removed) {
            notifyDiskRemove(key);
        }
    }

    // ==================== Уведомления слушателей ====================

    template<typename Func>
    void notify(Func&& func) {
        std::vector<std::shared_ptr<ICacheListener<V>>> listeners;
        {
            std::lock_guard<std::mutex> lock(listenersMutex_);
            if (listeners_.empty()) return;
            listeners = listeners_;
        }
        for (auto& listener : listeners) {
            func(*listener);
        }
    }

    void notifyHit(const std::string& key) {
        notify([&](ICacheListener<V>& listener) { listener.onHit(key); });
    }

    void notifyMiss(const std::string& key) {
        notify([&](ICacheListener<V>& listener) { listener.onMiss(key); });
    }

    void notifyCreate(const std::string& key) {
        notify([&](ICacheListener<V>& listener) { listener.onCreate(key); });
    }

    void notifyPromote(const std::string& key) {
        notify([&](ICacheListener<V>& listener) { listener.onPromote(key); });
    }

    void notifyWriteThrough(const std::string& key) {
        notify([&](ICacheListener<V>& listener) { listener.onWriteThrough(key); });
    }

    void notifyDiskRemove(const std::string& key) {
        notify([&](ICacheListener<V>& listener) { listener.onDiskRemove(key); });
    }

    void notifyEntryRemoved(RemovalCause cause, const std::string& key, const V& oldValue) {
        notify([&](ICacheListener<V>& listener) { listener.onEntryRemoved(cause, key, oldValue); });
    }

    void notifyDiskError(DiskOperation operation, const std::string& key, const std::string& message) {
        notify([&](ICacheListener<V>& listener) { listener.onDiskError(operation, key, message); });
    }

private:
    std::shared_ptr<IConverter<V>> converter_;
    MemoryTier memory_;
    std::unique_ptr<DiskLruCache> disk_;
    mutable std::shared_mutex diskMutex_;

    std::vector<std::shared_ptr<ICacheListener<V>>> listeners_;
    std::shared_ptr<LoggingListener<V>> errorLogger_;
    mutable std::mutex listenersMutex_;
};
