#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

/**
 * @brief Интерфейс преобразования значения в байты и обратно
 * @tparam V Тип значения
 *
 * Кэш не смотрит внутрь значений: на диск попадает только то,
 * что записал конвертер. Преобразование должно быть обратимым
 * без потерь — fromBytes(toStream(v)) == v.
 *
 * Вызывается синхронно в потоке, выполняющем операцию кэша.
 */
template<typename V>
class IConverter {
public:
    virtual ~IConverter() = default;

    /**
     * @brief Восстановить значение из байтов
     * @throws std::runtime_error если данные повреждены или в чужом формате
     */
    virtual V fromBytes(const std::vector<uint8_t>& bytes) = 0;

    /**
     * @brief Записать значение в поток
     * @throws std::runtime_error если поток не принимает запись
     */
    virtual void toStream(const V& value, std::ostream& out) = 0;
};
