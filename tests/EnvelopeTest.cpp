#include <gtest/gtest.h>
#include <cachekit/entity/CacheEntity.hpp>
#include <cachekit/serialization/Envelope.hpp>
#include "TestEntities.hpp"

#include <limits>
#include <stdexcept>

/**
 * @brief Тесты для конверта записи кэша
 *
 * Проверяем:
 * - Заголовок "CKIT" + версия схемы (u32 little-endian)
 * - Эталонные байты продолжают декодироваться
 * - Детерминированность кодирования
 * - Отказ на чужой сигнатуре, другой версии, обрезке и хвосте
 */

// ==================== Вспомогательные функции ====================

namespace {

const Bytes kUserGolden = {
    'C', 'K', 'I', 'T', 0x01, 0x00, 0x00, 0x00,
    0x02, '4', '2',
    0x05, 'A', 'l', 'i', 'c', 'e'
};

const Bytes kProductGolden = {
    'C', 'K', 'I', 'T', 0x01, 0x00, 0x00, 0x00,
    0x0E,                                           // id = 7 (zig-zag)
    0x03, 'P', 'e', 'n',
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xF8, 0x3F, // 1.5
    0x02, 0x01, 'a', 0x01, 'b',
    0x00                                            // description отсутствует
};

Product makePen() {
    Product product;
    product.id = 7;
    product.title = "Pen";
    product.price = 1.5;
    product.tags = {"a", "b"};
    return product;
}

ErrorKind decodeErrorKind(const Bytes& bytes) {
    try {
        decodeFromCache<User>(bytes);
    } catch (const CacheError& e) {
        return e.kind();
    }
    return ErrorKind::Other;
}

} // namespace

// ==================== Кодирование ====================

TEST(EnvelopeTest, HeaderLayout) {
    Bytes bytes = encodeForCache(makeUser("1", "Bob"));

    ASSERT_GE(bytes.size(), kEnvelopeHeaderSize);
    EXPECT_EQ(bytes[0], 'C');
    EXPECT_EQ(bytes[1], 'K');
    EXPECT_EQ(bytes[2], 'I');
    EXPECT_EQ(bytes[3], 'T');
    EXPECT_EQ(bytes[4], 0x01);
    EXPECT_EQ(bytes[5], 0x00);
    EXPECT_EQ(bytes[6], 0x00);
    EXPECT_EQ(bytes[7], 0x00);
}

TEST(EnvelopeTest, EncodesGoldenBytes) {
    EXPECT_EQ(encodeForCache(makeUser("42", "Alice")), kUserGolden);
    EXPECT_EQ(encodeForCache(makePen()), kProductGolden);
}

TEST(EnvelopeTest, DecodesGoldenBytes) {
    EXPECT_EQ(decodeFromCache<User>(kUserGolden), makeUser("42", "Alice"));
    EXPECT_EQ(decodeFromCache<Product>(kProductGolden), makePen());
}

TEST(EnvelopeTest, EncodingIsDeterministic) {
    Product product = makePen();
    product.description = "blue ink";

    EXPECT_EQ(encodeForCache(product), encodeForCache(product));
}

TEST(EnvelopeTest, RoundTripPreservesUnicodeAndExtremes) {
    Product product;
    product.id = std::numeric_limits<int64_t>::min();
    product.title = "Ручка \xF0\x9F\x96\x8A";
    product.price = -0.0;
    product.description = std::string();

    Product decoded = decodeFromCache<Product>(encodeForCache(product));
    EXPECT_EQ(decoded, product);
}

TEST(EnvelopeTest, WorksForPlainValues) {
    Bytes bytes = encodeEnvelope(std::string("plain"));
    EXPECT_EQ(decodeEnvelope<std::string>(bytes), "plain");
}

// ==================== Отказ ====================

TEST(EnvelopeTest, WrongSignatureIsInvalidEntry) {
    Bytes bytes = kUserGolden;
    bytes[0] = 'X';

    EXPECT_EQ(decodeErrorKind(bytes), ErrorKind::InvalidCacheEntry);
}

TEST(EnvelopeTest, OtherVersionIsVersionMismatch) {
    Bytes bytes = kUserGolden;
    bytes[4] = 0xE7;  // 999 = 0x03E7
    bytes[5] = 0x03;

    try {
        decodeFromCache<User>(bytes);
        FAIL() << "expected VersionMismatchError";
    } catch (const VersionMismatchError& e) {
        EXPECT_EQ(e.expected(), 1u);
        EXPECT_EQ(e.found(), 999u);
    }
}

TEST(EnvelopeTest, HalfTruncatedIsDeserializationError) {
    Bytes user(kUserGolden.begin(), kUserGolden.begin() + kUserGolden.size() / 2);
    EXPECT_EQ(decodeErrorKind(user), ErrorKind::Deserialization);

    Bytes product(kProductGolden.begin(), kProductGolden.begin() + kProductGolden.size() / 2);
    EXPECT_THROW(decodeFromCache<Product>(product), CacheError);
}

TEST(EnvelopeTest, ShorterThanHeaderIsDeserializationError) {
    EXPECT_EQ(decodeErrorKind(Bytes{}), ErrorKind::Deserialization);
    EXPECT_EQ(decodeErrorKind(Bytes{'C', 'K', 'I'}), ErrorKind::Deserialization);
}

TEST(EnvelopeTest, TrailingBytesAreRejected) {
    Bytes bytes = kUserGolden;
    bytes.push_back(0x00);

    EXPECT_EQ(decodeErrorKind(bytes), ErrorKind::Deserialization);
}

TEST(EnvelopeTest, EncoderFailureBecomesSerializationError) {
    struct Broken {
        void writeTo(BinaryWriter&) const { throw std::runtime_error("boom"); }
    };

    try {
        encodeEnvelope(Broken{});
        FAIL() << "expected CacheError";
    } catch (const CacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Serialization);
        EXPECT_EQ(e.detail(), "boom");
    }
}
