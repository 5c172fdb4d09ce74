#pragma once

#include <tlcache/serialization/IConverter.hpp>
#include <cstring>
#include <limits>
#include <string>
#include <type_traits>
#include <stdexcept>

/**
 * @brief Бинарный конвертер значений кэша
 * @tparam V Тип значения
 *
 * Формат:
 * [4 байта: magic "TLCV"]
 * [4 байта: размер данных N]
 * [N байт: данные]
 *
 * Все числа — little-endian.
 *
 * Поддерживаемые типы:
 * - Примитивные типы (int, double, etc.) — через memcpy
 * - std::string
 * - std::vector<uint8_t> — произвольный бинарный блоб
 *
 * Для сложных типов нужна своя реализация IConverter.
 */
template<typename V>
class BinaryConverter : public IConverter<V> {
public:
    static constexpr uint32_t MAGIC = 0x56434C54;  // "TLCV" в little-endian
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr uint64_t MAX_PAYLOAD_SIZE = std::numeric_limits<uint32_t>::max();

    /**
     * @brief Проверить, что размер данных помещается в 4-байтовое поле длины
     * @throws std::length_error если size > MAX_PAYLOAD_SIZE
     */
    static void checkPayloadSize(uint64_t size) {
        if (size > MAX_PAYLOAD_SIZE) {
            throw std::length_error("Value is too large: " + std::to_string(size) +
                                    " bytes, max " + std::to_string(MAX_PAYLOAD_SIZE));
        }
    }

    V fromBytes(const std::vector<uint8_t>& bytes) override {
        if (bytes.size() < HEADER_SIZE) {
            throw std::runtime_error("Invalid value: too small");
        }

        size_t offset = 0;

        uint32_t magic = readUint32(bytes, offset);
        if (magic != MAGIC) {
            throw std::runtime_error("Invalid value: wrong magic number");
        }

        uint32_t size = readUint32(bytes, offset);
        if (bytes.size() - offset != size) {
            throw std::runtime_error("Invalid value: expected " + std::to_string(size) +
                                     " bytes, got " + std::to_string(bytes.size() - offset));
        }

        V value{};
        decode(bytes.data() + offset, size, value);
        return value;
    }

    void toStream(const V& value, std::ostream& out) override {
        std::vector<uint8_t> payload = encode(value);
        checkPayloadSize(payload.size());

        std::vector<uint8_t> data;
        data.reserve(HEADER_SIZE + payload.size());
        appendUint32(data, MAGIC);
        appendUint32(data, static_cast<uint32_t>(payload.size()));
        data.insert(data.end(), payload.begin(), payload.end());

        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        if (!out) {
            throw std::runtime_error("Failed to write value to stream");
        }
    }

private:
    // ==================== Утилиты ====================

    static void appendUint32(std::vector<uint8_t>& data, uint32_t value) {
        data.push_back(static_cast<uint8_t>(value & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        data.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    }

    static uint32_t readUint32(const std::vector<uint8_t>& data, size_t& offset) {
        if (offset + 4 > data.size()) {
            throw std::runtime_error("Unexpected end of data");
        }

        uint32_t value = static_cast<uint32_t>(data[offset]) |
                        (static_cast<uint32_t>(data[offset + 1]) << 8) |
                        (static_cast<uint32_t>(data[offset + 2]) << 16) |
                        (static_cast<uint32_t>(data[offset + 3]) << 24);
        offset += 4;
        return value;
    }

    // ==================== Сериализация типов ====================

    template<typename T>
    static typename std::enable_if<std::is_arithmetic<T>::value, std::vector<uint8_t>>::type
    encode(const T& value) {
        std::vector<uint8_t> result(sizeof(T));
        std::memcpy(result.data(), &value, sizeof(T));
        return result;
    }

    static std::vector<uint8_t> encode(const std::string& value) {
        return std::vector<uint8_t>(value.begin(), value.end());
    }

    static std::vector<uint8_t> encode(const std::vector<uint8_t>& value) {
        return value;
    }

    // ==================== Десериализация типов ====================

    template<typename T>
    static typename std::enable_if<std::is_arithmetic<T>::value>::type
    decode(const uint8_t* data, size_t size, T& value) {
        if (size != sizeof(T)) {
            throw std::runtime_error("Invalid value: expected " + std::to_string(sizeof(T)) +
                                     " bytes for arithmetic type, got " + std::to_string(size));
        }
        std::memcpy(&value, data, sizeof(T));
    }

    static void decode(const uint8_t* data, size_t size, std::string& value) {
        value.assign(reinterpret_cast<const char*>(data), size);
    }

    static void decode(const uint8_t* data, size_t size, std::vector<uint8_t>& value) {
        value.assign(data, data + size);
    }
};
