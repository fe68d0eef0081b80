#include <gtest/gtest.h>
#include <cachekit/serialization/BinaryCodec.hpp>
#include "TestEntities.hpp"

#include <cstdint>
#include <limits>

/**
 * @brief Тесты для BinaryWriter / BinaryReader
 *
 * Проверяем:
 * - Раскладку байтов varint, zig-zag, строк, optional
 * - Восстановление значений всех поддерживаемых типов
 * - Отказ на обрезанных и некорректных данных
 */

// ==================== Раскладка байтов ====================

TEST(BinaryCodecTest, VarintLayout) {
    BinaryWriter w;
    w.write(uint32_t{1});
    w.write(uint32_t{300});

    EXPECT_EQ(w.bytes(), (Bytes{0x01, 0xAC, 0x02}));
}

TEST(BinaryCodecTest, ZigZagLayout) {
    BinaryWriter w;
    w.write(int32_t{0});
    w.write(int32_t{-1});
    w.write(int32_t{1});
    w.write(int64_t{-2});

    EXPECT_EQ(w.bytes(), (Bytes{0x00, 0x01, 0x02, 0x03}));
}

TEST(BinaryCodecTest, StringAndOptionalLayout) {
    BinaryWriter w;
    w.write(std::string("hi"));
    w.write(std::optional<uint8_t>());
    w.write(std::optional<uint8_t>(5));

    EXPECT_EQ(w.bytes(), (Bytes{0x02, 'h', 'i', 0x00, 0x01, 0x05}));
}

TEST(BinaryCodecTest, StringLiteralIsNotBool) {
    BinaryWriter w;
    w.write("ab");

    EXPECT_EQ(w.bytes(), (Bytes{0x02, 'a', 'b'}));
}

TEST(BinaryCodecTest, DoubleIsLittleEndian) {
    BinaryWriter w;
    w.write(1.5);

    EXPECT_EQ(w.bytes(), (Bytes{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF8, 0x3F}));
}

// ==================== Чтение ====================

TEST(BinaryCodecTest, ReadsBackScalars) {
    BinaryWriter w;
    w.write(std::numeric_limits<uint64_t>::max());
    w.write(std::numeric_limits<int64_t>::min());
    w.write(true);
    w.write(-0.25f);
    w.write(std::string(""));

    Bytes bytes = w.release();
    BinaryReader r(bytes);

    EXPECT_EQ(r.read<uint64_t>(), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(r.read<int64_t>(), std::numeric_limits<int64_t>::min());
    EXPECT_TRUE(r.read<bool>());
    EXPECT_FLOAT_EQ(r.read<float>(), -0.25f);
    EXPECT_EQ(r.read<std::string>(), "");
    EXPECT_TRUE(r.atEnd());
}

TEST(BinaryCodecTest, ReadsBackNestedEntity) {
    Product product;
    product.id = -17;
    product.title = "Notebook";
    product.price = 3.75;
    product.tags = {"paper", "a5"};
    product.description = "ruled";

    BinaryWriter w;
    w.write(product);

    Bytes bytes = w.release();
    BinaryReader r(bytes);
    Product decoded = r.read<Product>();

    EXPECT_EQ(decoded, product);
    EXPECT_TRUE(r.atEnd());
}

TEST(BinaryCodecTest, ReleaseEmptiesWriter) {
    BinaryWriter w;
    w.write(uint8_t{7});

    Bytes first = w.release();
    EXPECT_EQ(first.size(), 1u);
    EXPECT_TRUE(w.bytes().empty());
}

// ==================== Ошибки формата ====================

TEST(BinaryCodecTest, TruncatedStringThrows) {
    Bytes bytes{0x05, 'a', 'b'};
    BinaryReader r(bytes);

    try {
        r.read<std::string>();
        FAIL() << "expected CacheError";
    } catch (const CacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Deserialization);
    }
}

TEST(BinaryCodecTest, OutOfRangeIntegerThrows) {
    BinaryWriter w;
    w.write(uint32_t{300});

    Bytes bytes = w.release();
    BinaryReader r(bytes);
    uint8_t value = 0;
    EXPECT_THROW(r.read(value), CacheError);
}

TEST(BinaryCodecTest, InvalidBoolByteThrows) {
    Bytes bytes{0x02};
    BinaryReader r(bytes);
    bool value = false;
    EXPECT_THROW(r.read(value), CacheError);
}

TEST(BinaryCodecTest, OverlongVarintThrows) {
    Bytes bytes(11, 0xFF);
    BinaryReader r(bytes);
    EXPECT_THROW(r.readVarint(), CacheError);
}

TEST(BinaryCodecTest, VectorCountBeyondDataThrows) {
    Bytes bytes{0x64, 0x01};
    BinaryReader r(bytes);
    std::vector<uint8_t> values;
    EXPECT_THROW(r.read(values), CacheError);
}

TEST(BinaryCodecTest, ReadPastEndThrows) {
    BinaryReader r(nullptr, 0);
    EXPECT_TRUE(r.atEnd());
    EXPECT_THROW(r.readByte(), CacheError);
}
