#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Запись примитивов в буфер (little-endian)
 *
 * double пишется через битовое представление uint64, строки -
 * [4 байта длины][байты].
 */
class ByteWriter {
public:
    void appendUint8(uint8_t value) {
        data_.push_back(value);
    }

    void appendUint32(uint32_t value) {
        data_.push_back(static_cast<uint8_t>(value & 0xFF));
        data_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        data_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        data_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    }

    void appendUint64(uint64_t value) {
        appendUint32(static_cast<uint32_t>(value & 0xFFFFFFFFu));
        appendUint32(static_cast<uint32_t>(value >> 32));
    }

    void appendInt64(int64_t value) {
        appendUint64(static_cast<uint64_t>(value));
    }

    void appendDouble(double value) {
        uint64_t bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        appendUint64(bits);
    }

    void appendString(const std::string& value) {
        appendUint32(static_cast<uint32_t>(value.size()));
        data_.insert(data_.end(), value.begin(), value.end());
    }

    void appendBytes(const std::vector<uint8_t>& bytes) {
        appendUint32(static_cast<uint32_t>(bytes.size()));
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    const std::vector<uint8_t>& data() const { return data_; }
    std::vector<uint8_t> release() { return std::move(data_); }

private:
    std::vector<uint8_t> data_;
};

/**
 * @brief Чтение примитивов из буфера
 *
 * Любой выход за границы буфера - std::runtime_error.
 * Вызывающий код (DiskCache) трактует это как повреждённую запись.
 */
class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& data)
        : data_(data)
    {}

    uint8_t readUint8() {
        require(1);
        return data_[offset_++];
    }

    uint32_t readUint32() {
        require(4);
        uint32_t value = static_cast<uint32_t>(data_[offset_]) |
                        (static_cast<uint32_t>(data_[offset_ + 1]) << 8) |
                        (static_cast<uint32_t>(data_[offset_ + 2]) << 16) |
                        (static_cast<uint32_t>(data_[offset_ + 3]) << 24);
        offset_ += 4;
        return value;
    }

    uint64_t readUint64() {
        uint64_t low = readUint32();
        uint64_t high = readUint32();
        return low | (high << 32);
    }

    int64_t readInt64() {
        return static_cast<int64_t>(readUint64());
    }

    double readDouble() {
        uint64_t bits = readUint64();
        double value = 0.0;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    std::string readString() {
        uint32_t size = readUint32();
        require(size);
        std::string value(data_.begin() + offset_, data_.begin() + offset_ + size);
        offset_ += size;
        return value;
    }

    std::vector<uint8_t> readBytes() {
        uint32_t size = readUint32();
        require(size);
        std::vector<uint8_t> value(data_.begin() + offset_, data_.begin() + offset_ + size);
        offset_ += size;
        return value;
    }

    /**
     * @brief Проверить заголовок формата
     * @throws std::runtime_error при неверном magic или версии
     */
    void expectHeader(uint32_t magic, uint32_t version) {
        if (readUint32() != magic) {
            throw std::runtime_error("Invalid cache payload: wrong magic number");
        }
        uint32_t actual = readUint32();
        if (actual != version) {
            throw std::runtime_error("Unsupported cache payload version: " +
                                     std::to_string(actual));
        }
    }

    bool atEnd() const { return offset_ == data_.size(); }
    size_t remaining() const { return data_.size() - offset_; }

private:
    void require(size_t count) const {
        if (count > data_.size() - offset_) {
            throw std::runtime_error("Unexpected end of data");
        }
    }

    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
};
