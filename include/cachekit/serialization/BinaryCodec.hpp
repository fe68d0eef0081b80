#pragma once

#include <cachekit/CacheError.hpp>
#include <cachekit/Types.hpp>

#include <cstring>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

/**
 * @brief Компактный бинарный формат полезной нагрузки
 *
 * Кодирование:
 * - беззнаковые целые: varint (LEB128, 7 бит на байт)
 * - знаковые целые: zig-zag, затем varint
 * - bool: один байт 0/1
 * - float/double: IEEE-754, little-endian, фиксированная ширина
 * - std::string: varint-длина + байты
 * - std::vector<T>: varint-количество + элементы
 * - std::optional<T>: байт присутствия + значение
 * - вложенные сущности: через их writeTo()/readFrom()
 *
 * Формат детерминирован: одно и то же значение всегда даёт одни и те же
 * байты. Порядок полей задаёт сама сущность.
 */
class BinaryWriter {
public:
    BinaryWriter() = default;

    /**
     * @brief Беззнаковые целые (кроме bool)
     */
    template<typename T>
    typename std::enable_if<std::is_integral<T>::value && std::is_unsigned<T>::value &&
                            !std::is_same<T, bool>::value>::type
    write(T value) {
        writeVarint(static_cast<uint64_t>(value));
    }

    /**
     * @brief Знаковые целые (zig-zag)
     */
    template<typename T>
    typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value>::type
    write(T value) {
        int64_t v = static_cast<int64_t>(value);
        writeVarint((static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63));
    }

    void write(bool value) {
        data_.push_back(value ? 1 : 0);
    }

    void write(float value) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        writeFixed32(bits);
    }

    void write(double value) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        writeFixed64(bits);
    }

    void write(const std::string& value) {
        writeVarint(value.size());
        data_.insert(data_.end(), value.begin(), value.end());
    }

    // Без этой перегрузки литерал уходит в write(bool)
    void write(const char* value) {
        write(std::string(value));
    }

    template<typename T>
    void write(const std::vector<T>& values) {
        writeVarint(values.size());
        for (const auto& value : values) {
            write(value);
        }
    }

    template<typename T>
    void write(const std::optional<T>& value) {
        write(value.has_value());
        if (value.has_value()) {
            write(*value);
        }
    }

    /**
     * @brief Вложенная сущность с методом writeTo(BinaryWriter&)
     */
    template<typename T>
    auto write(const T& value) -> decltype(value.writeTo(std::declval<BinaryWriter&>()), void()) {
        value.writeTo(*this);
    }

    void writeVarint(uint64_t value) {
        while (value >= 0x80) {
            data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
            value >>= 7;
        }
        data_.push_back(static_cast<uint8_t>(value));
    }

    void writeFixed32(uint32_t value) {
        data_.push_back(static_cast<uint8_t>(value & 0xFF));
        data_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        data_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        data_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    }

    void writeFixed64(uint64_t value) {
        writeFixed32(static_cast<uint32_t>(value & 0xFFFFFFFFu));
        writeFixed32(static_cast<uint32_t>(value >> 32));
    }

    void writeRaw(const uint8_t* data, size_t size) {
        data_.insert(data_.end(), data, data + size);
    }

    const Bytes& bytes() const { return data_; }

    /**
     * @brief Забрать накопленный буфер (writer становится пустым)
     */
    Bytes release() {
        Bytes result = std::move(data_);
        data_.clear();
        return result;
    }

private:
    Bytes data_;
};

/**
 * @brief Чтение формата BinaryWriter
 *
 * Не владеет буфером: данные должны жить дольше reader'а.
 * Любое нарушение формата (конец данных, слишком длинный varint,
 * значение вне диапазона типа) бросает CacheError(Deserialization).
 */
class BinaryReader {
public:
    BinaryReader(const uint8_t* data, size_t size)
        : data_(data)
        , size_(size)
    {}

    explicit BinaryReader(const Bytes& data)
        : BinaryReader(data.data(), data.size())
    {}

    template<typename T>
    typename std::enable_if<std::is_integral<T>::value && std::is_unsigned<T>::value &&
                            !std::is_same<T, bool>::value>::type
    read(T& value) {
        uint64_t raw = readVarint();
        if (raw > std::numeric_limits<T>::max()) {
            fail("integer out of range");
        }
        value = static_cast<T>(raw);
    }

    template<typename T>
    typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value>::type
    read(T& value) {
        uint64_t raw = readVarint();
        int64_t decoded = static_cast<int64_t>(raw >> 1) ^ -static_cast<int64_t>(raw & 1);
        if (decoded < std::numeric_limits<T>::min() || decoded > std::numeric_limits<T>::max()) {
            fail("integer out of range");
        }
        value = static_cast<T>(decoded);
    }

    void read(bool& value) {
        uint8_t byte = readByte();
        if (byte > 1) {
            fail("invalid bool byte " + std::to_string(byte));
        }
        value = byte == 1;
    }

    void read(float& value) {
        uint32_t bits = readFixed32();
        std::memcpy(&value, &bits, sizeof(value));
    }

    void read(double& value) {
        uint64_t bits = readFixed64();
        std::memcpy(&value, &bits, sizeof(value));
    }

    void read(std::string& value) {
        uint64_t length = readVarint();
        require(length);
        value.assign(reinterpret_cast<const char*>(data_ + offset_), static_cast<size_t>(length));
        offset_ += static_cast<size_t>(length);
    }

    template<typename T>
    void read(std::vector<T>& values) {
        uint64_t count = readVarint();
        // Каждый элемент занимает хотя бы байт — отсекаем мусорные счётчики
        if (count > remaining()) {
            fail("element count " + std::to_string(count) + " exceeds remaining data");
        }
        values.clear();
        values.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            T value{};
            read(value);
            values.push_back(std::move(value));
        }
    }

    template<typename T>
    void read(std::optional<T>& value) {
        bool present = false;
        read(present);
        if (!present) {
            value.reset();
            return;
        }
        T inner{};
        read(inner);
        value = std::move(inner);
    }

    /**
     * @brief Вложенная сущность со статическим readFrom(BinaryReader&)
     */
    template<typename T>
    auto read(T& value) -> decltype(T::readFrom(std::declval<BinaryReader&>()), void()) {
        value = T::readFrom(*this);
    }

    /**
     * @brief Прочитать значение типа T
     * @code
     *   auto name = reader.read<std::string>();
     * @endcode
     */
    template<typename T>
    T read() {
        T value{};
        read(value);
        return value;
    }

    uint64_t readVarint() {
        uint64_t result = 0;
        for (int shift = 0; shift < 64; shift += 7) {
            uint8_t byte = readByte();
            if (shift == 63 && byte > 1) {
                fail("varint overflows 64 bits");
            }
            result |= static_cast<uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) {
                return result;
            }
        }
        fail("varint too long");
        return 0;
    }

    uint32_t readFixed32() {
        require(4);
        uint32_t value = static_cast<uint32_t>(data_[offset_]) |
                        (static_cast<uint32_t>(data_[offset_ + 1]) << 8) |
                        (static_cast<uint32_t>(data_[offset_ + 2]) << 16) |
                        (static_cast<uint32_t>(data_[offset_ + 3]) << 24);
        offset_ += 4;
        return value;
    }

    uint64_t readFixed64() {
        uint64_t low = readFixed32();
        uint64_t high = readFixed32();
        return low | (high << 32);
    }

    uint8_t readByte() {
        require(1);
        return data_[offset_++];
    }

    size_t position() const { return offset_; }
    size_t remaining() const { return size_ - offset_; }
    bool atEnd() const { return offset_ == size_; }

private:
    void require(uint64_t count) const {
        if (count > remaining()) {
            fail("unexpected end of data at offset " + std::to_string(offset_));
        }
    }

    [[noreturn]] static void fail(const std::string& message) {
        throw CacheError(ErrorKind::Deserialization, message);
    }

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};
