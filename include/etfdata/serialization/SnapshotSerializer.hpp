#pragma once

#include <etfdata/model/InstrumentSnapshot.hpp>
#include <etfdata/serialization/ByteBuffer.hpp>
#include <etfdata/serialization/ISerializer.hpp>
#include <etfdata/time/TimeFormat.hpp>

/**
 * @brief Сериализатор снимка инструмента (плоская запись)
 *
 * Формат:
 * [4 байта: magic "ETFS"]
 * [4 байта: версия]
 * [symbol][name][currency]           - строки с длиной
 * [lastPrice][previousClose][changePercent] - double
 * [volume]                           - int64
 * [1 байт: есть marketCap][marketCap]
 * [observedAt]                       - мс от эпохи
 * [1 байт: metadataOnly]
 */
class SnapshotSerializer : public ISerializer<InstrumentSnapshot> {
public:
    static constexpr uint32_t MAGIC = 0x53465445;  // "ETFS" в little-endian
    static constexpr uint32_t VERSION = 1;

    std::vector<uint8_t> serialize(const InstrumentSnapshot& value) const override {
        ByteWriter out;
        out.appendUint32(MAGIC);
        out.appendUint32(VERSION);
        out.appendString(value.symbol);
        out.appendString(value.name);
        out.appendString(value.currency);
        out.appendDouble(value.lastPrice);
        out.appendDouble(value.previousClose);
        out.appendDouble(value.changePercent);
        out.appendInt64(value.volume);
        out.appendUint8(value.marketCap ? 1 : 0);
        out.appendDouble(value.marketCap.value_or(0.0));
        out.appendInt64(TimeFormat::toMillis(value.observedAt));
        out.appendUint8(value.metadataOnly ? 1 : 0);
        return out.release();
    }

    InstrumentSnapshot deserialize(const std::vector<uint8_t>& data) const override {
        ByteReader in(data);
        in.expectHeader(MAGIC, VERSION);

        InstrumentSnapshot snapshot;
        snapshot.symbol = in.readString();
        snapshot.name = in.readString();
        snapshot.currency = in.readString();
        snapshot.lastPrice = in.readDouble();
        snapshot.previousClose = in.readDouble();
        snapshot.changePercent = in.readDouble();
        snapshot.volume = in.readInt64();
        bool hasCap = in.readUint8() != 0;
        double cap = in.readDouble();
        if (hasCap) {
            snapshot.marketCap = cap;
        }
        snapshot.observedAt = TimeFormat::fromMillis(in.readInt64());
        snapshot.metadataOnly = in.readUint8() != 0;

        if (!in.atEnd()) {
            throw std::runtime_error("Invalid snapshot payload: trailing bytes");
        }
        return snapshot;
    }
};
