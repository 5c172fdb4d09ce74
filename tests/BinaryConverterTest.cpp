#include <gtest/gtest.h>
#include <tlcache/serialization/BinaryConverter.hpp>
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief Тесты для BinaryConverter
 *
 * Проверяем:
 * - Формат заголовка (magic + длина)
 * - Преобразование строк, чисел и бинарных блобов
 * - Отказ на повреждённых данных
 * - Ошибку записи в неисправный поток
 */

namespace {

template<typename V>
std::vector<uint8_t> toBytes(const V& value) {
    BinaryConverter<V> converter;
    std::ostringstream out;
    converter.toStream(value, out);
    std::string data = out.str();
    return std::vector<uint8_t>(data.begin(), data.end());
}

}  // namespace

// ==================== Формат ====================

TEST(BinaryConverterTest, WritesHeaderAndPayload) {
    auto bytes = toBytes<std::string>("hi");

    std::vector<uint8_t> expected = {'T', 'L', 'C', 'V', 2, 0, 0, 0, 'h', 'i'};
    EXPECT_EQ(bytes, expected);
}

TEST(BinaryConverterTest, EmptyStringHasOnlyHeader) {
    auto bytes = toBytes<std::string>("");

    EXPECT_EQ(bytes.size(), BinaryConverter<std::string>::HEADER_SIZE);

    BinaryConverter<std::string> converter;
    EXPECT_EQ(converter.fromBytes(bytes), "");
}

// ==================== Типы ====================

TEST(BinaryConverterTest, StringValue) {
    BinaryConverter<std::string> converter;
    std::string value = "Hello, \xD0\xBC\xD0\xB8\xD1\x80";

    EXPECT_EQ(converter.fromBytes(toBytes(value)), value);
}

TEST(BinaryConverterTest, IntValue) {
    BinaryConverter<int> converter;

    EXPECT_EQ(converter.fromBytes(toBytes(-42)), -42);
    EXPECT_EQ(toBytes(7).size(), BinaryConverter<int>::HEADER_SIZE + sizeof(int));
}

TEST(BinaryConverterTest, DoubleValue) {
    BinaryConverter<double> converter;

    EXPECT_DOUBLE_EQ(converter.fromBytes(toBytes(3.14159)), 3.14159);
}

TEST(BinaryConverterTest, BinaryBlob) {
    BinaryConverter<std::vector<uint8_t>> converter;
    std::vector<uint8_t> blob = {0x00, 0xFF, 0x10, 0x00, 0x7F};

    EXPECT_EQ(converter.fromBytes(toBytes(blob)), blob);
}

// ==================== Повреждённые данные ====================

TEST(BinaryConverterTest, TooShortThrows) {
    BinaryConverter<std::string> converter;

    EXPECT_THROW(converter.fromBytes({'T', 'L', 'C'}), std::runtime_error);
    EXPECT_THROW(converter.fromBytes({}), std::runtime_error);
}

TEST(BinaryConverterTest, WrongMagicThrows) {
    BinaryConverter<std::string> converter;
    auto bytes = toBytes<std::string>("value");
    bytes[0] = 'X';

    EXPECT_THROW(converter.fromBytes(bytes), std::runtime_error);
}

TEST(BinaryConverterTest, TruncatedPayloadThrows) {
    BinaryConverter<std::string> converter;
    auto bytes = toBytes<std::string>("value");
    bytes.pop_back();

    EXPECT_THROW(converter.fromBytes(bytes), std::runtime_error);
}

TEST(BinaryConverterTest, TrailingBytesThrow) {
    BinaryConverter<std::string> converter;
    auto bytes = toBytes<std::string>("value");
    bytes.push_back('!');

    EXPECT_THROW(converter.fromBytes(bytes), std::runtime_error);
}

TEST(BinaryConverterTest, ArithmeticSizeMismatchThrows) {
    BinaryConverter<int64_t> converter;
    auto bytes = toBytes<int32_t>(5);

    EXPECT_THROW(converter.fromBytes(bytes), std::runtime_error);
}

// ==================== Ошибки записи ====================

TEST(BinaryConverterTest, BrokenStreamThrows) {
    BinaryConverter<std::string> converter;
    std::ostringstream out;
    out.setstate(std::ios::badbit);

    EXPECT_THROW(converter.toStream("value", out), std::runtime_error);
}

TEST(BinaryConverterTest, PayloadLargerThanLengthFieldIsRejected) {
    using Converter = BinaryConverter<std::vector<uint8_t>>;

    EXPECT_NO_THROW(Converter::checkPayloadSize(Converter::MAX_PAYLOAD_SIZE));
    EXPECT_THROW(Converter::checkPayloadSize(Converter::MAX_PAYLOAD_SIZE + 1), std::length_error);
}
