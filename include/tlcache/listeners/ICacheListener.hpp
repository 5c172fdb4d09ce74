#pragma once

#include <tlcache/RemovalCause.hpp>
#include <cstddef>
#include <string>

/**
 * @brief Операция с дисковым уровнем (для отчёта об ошибках)
 */
enum class DiskOperation {
    Read,
    Write,
    Remove
};

inline std::string toString(DiskOperation operation) {
    switch (operation) {
        case DiskOperation::Read: return "read";
        case DiskOperation::Write: return "write";
        case DiskOperation::Remove: return "remove";
    }
    return "unknown";
}

/**
 * @brief Интерфейс слушателя событий двухуровневого кэша
 * @tparam V Тип значения
 *
 * Ключи всегда строковые. Методы вызываются синхронно в потоке,
 * выполняющем операцию, без удержания блокировок кэша.
 */
template<typename V>
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    /// Значение найдено в памяти
    virtual void onHit(const std::string& key) { (void)key; }

    /// Значения нет ни в памяти, ни на диске
    virtual void onMiss(const std::string& key) { (void)key; }

    /// Значение вычислено через create()
    virtual void onCreate(const std::string& key) { (void)key; }

    /// Значение прочитано с диска и поднято в память
    virtual void onPromote(const std::string& key) { (void)key; }

    /// Значение записано на диск
    virtual void onWriteThrough(const std::string& key) { (void)key; }

    /// Копия удалена с диска
    virtual void onDiskRemove(const std::string& key) { (void)key; }

    virtual void onEntryRemoved(RemovalCause cause, const std::string& key, const V& oldValue) {
        (void)cause; (void)key; (void)oldValue;
    }

    /// Операция с диском не удалась и была пропущена
    virtual void onDiskError(DiskOperation operation, const std::string& key,
                             const std::string& message) {
        (void)operation; (void)key; (void)message;
    }
};
