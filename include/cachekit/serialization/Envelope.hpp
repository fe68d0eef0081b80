#pragma once

#include <cachekit/CacheError.hpp>
#include <cachekit/Types.hpp>
#include <cachekit/serialization/BinaryCodec.hpp>

#include <array>
#include <exception>
#include <string>

/**
 * @brief Версионированный конверт для всех записей кэша
 *
 * Формат записи:
 * [4 байта: сигнатура "CKIT"]
 * [4 байта: версия схемы, little-endian]
 * [N байт: полезная нагрузка в формате BinaryWriter]
 *
 * Проверки при чтении (строго в этом порядке):
 * 1. Длина >= 8 байт, иначе Deserialization
 * 2. Сигнатура == "CKIT", иначе InvalidCacheEntry
 * 3. Версия == kCurrentSchemaVersion, иначе VersionMismatch
 * 4. Нагрузка читается целиком, иначе Deserialization
 *
 * Запись, не прошедшая любую проверку, не используется даже частично.
 * Вызывающий код должен трактовать ошибку как "удалить и пересчитать".
 *
 * @note При любом несовместимом изменении полей сущности нужно увеличить
 *       kCurrentSchemaVersion: старые записи будут отвергнуты, а не
 *       прочитаны с мусором.
 */

/// Сигнатура "CKIT"
constexpr std::array<uint8_t, 4> kCacheMagic = {'C', 'K', 'I', 'T'};

/// Текущая версия схемы записей
constexpr uint32_t kCurrentSchemaVersion = 1;

/// Размер заголовка конверта: сигнатура + версия
constexpr size_t kEnvelopeHeaderSize = 8;

/**
 * @brief Упаковать значение в конверт
 * @tparam T Тип с методом writeTo(BinaryWriter&)
 * @throws CacheError(Serialization) если writeTo бросил исключение
 */
template<typename T>
Bytes encodeEnvelope(const T& value) {
    BinaryWriter writer;
    writer.writeRaw(kCacheMagic.data(), kCacheMagic.size());
    writer.writeFixed32(kCurrentSchemaVersion);

    try {
        writer.write(value);
    } catch (const CacheError& e) {
        throw CacheError(ErrorKind::Serialization, e.detail());
    } catch (const std::exception& e) {
        throw CacheError(ErrorKind::Serialization, e.what());
    }

    return writer.release();
}

/**
 * @brief Распаковать значение из конверта
 * @tparam T Тип со статическим readFrom(BinaryReader&)
 * @throws CacheError(Deserialization | InvalidCacheEntry), VersionMismatchError
 */
template<typename T>
T decodeEnvelope(const Bytes& bytes) {
    if (bytes.size() < kEnvelopeHeaderSize) {
        throw CacheError(ErrorKind::Deserialization,
                         "entry too short: " + std::to_string(bytes.size()) + " bytes");
    }

    BinaryReader reader(bytes);

    std::array<uint8_t, 4> magic{};
    for (auto& byte : magic) {
        byte = reader.readByte();
    }
    if (magic != kCacheMagic) {
        throw CacheError(ErrorKind::InvalidCacheEntry,
                         "invalid magic: expected \"CKIT\", got \"" +
                         std::string(magic.begin(), magic.end()) + "\"");
    }

    uint32_t version = reader.readFixed32();
    if (version != kCurrentSchemaVersion) {
        throw VersionMismatchError(kCurrentSchemaVersion, version);
    }

    T value{};
    try {
        reader.read(value);
    } catch (const CacheError&) {
        throw;
    } catch (const std::exception& e) {
        throw CacheError(ErrorKind::Deserialization, e.what());
    }

    if (!reader.atEnd()) {
        throw CacheError(ErrorKind::Deserialization,
                         std::to_string(reader.remaining()) + " trailing bytes after payload");
    }
    return value;
}
