#pragma once

#include <optional>
#include <cstddef>

/**
 * @brief Базовый интерфейс кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Размер кэша измеряется в абстрактных единицах веса,
 * а не в количестве элементов (по умолчанию вес элемента = 1).
 */
template <typename K, typename V>
class ICache
{
public:
    virtual ~ICache() = default;

    /**
     * @brief Получить значение по ключу
     * @param key Ключ
     * @return Значение, если ключ существует, иначе std::nullopt
     */
    virtual std::optional<V> get(const K &key) = 0;

    /**
     * @brief Поместить значение в кэш
     * @param key Ключ
     * @param value Значение
     * @return Предыдущее значение для ключа или std::nullopt
     */
    virtual std::optional<V> put(const K &key, const V &value) = 0;

    /**
     * @brief Удалить значение по ключу
     * @param key Ключ
     * @return Удалённое значение или std::nullopt
     */
    virtual std::optional<V> remove(const K &key) = 0;

    /**
     * @brief Удалить все элементы
     */
    virtual void evictAll() = 0;

    /**
     * @brief Суммарный вес элементов в кэше
     */
    virtual size_t size() const = 0;

    /**
     * @brief Максимальный суммарный вес
     */
    virtual size_t maxSize() const = 0;
};
