#pragma once

#include <etfdata/model/InfoRecord.hpp>
#include <etfdata/serialization/ByteBuffer.hpp>
#include <etfdata/serialization/ISerializer.hpp>
#include <etfdata/time/TimeFormat.hpp>

/**
 * @brief Сериализатор записи info
 *
 * [magic "ETFI"][версия][symbol][updatedAt][N][N пар ключ-значение]
 */
class InfoSerializer : public ISerializer<InfoRecord> {
public:
    static constexpr uint32_t MAGIC = 0x49465445;  // "ETFI"
    static constexpr uint32_t VERSION = 1;

    std::vector<uint8_t> serialize(const InfoRecord& value) const override {
        ByteWriter out;
        out.appendUint32(MAGIC);
        out.appendUint32(VERSION);
        out.appendString(value.symbol);
        out.appendInt64(TimeFormat::toMillis(value.updatedAt));
        out.appendUint32(static_cast<uint32_t>(value.fields.size()));
        for (const auto& [key, field] : value.fields) {
            out.appendString(key);
            out.appendString(field);
        }
        return out.release();
    }

    InfoRecord deserialize(const std::vector<uint8_t>& data) const override {
        ByteReader in(data);
        in.expectHeader(MAGIC, VERSION);

        InfoRecord record;
        record.symbol = in.readString();
        record.updatedAt = TimeFormat::fromMillis(in.readInt64());
        uint32_t count = in.readUint32();
        for (uint32_t i = 0; i < count; ++i) {
            std::string key = in.readString();
            record.fields[key] = in.readString();
        }
        if (!in.atEnd()) {
            throw std::runtime_error("Invalid info payload: trailing bytes");
        }
        return record;
    }
};
