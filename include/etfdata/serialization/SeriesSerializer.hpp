#pragma once

#include <etfdata/model/HistoricalSeries.hpp>
#include <etfdata/serialization/ByteBuffer.hpp>
#include <etfdata/serialization/ISerializer.hpp>
#include <etfdata/time/TimeFormat.hpp>

/**
 * @brief Колоночный сериализатор исторической серии
 *
 * Серии - основной объём кэша, поэтому данные лежат по колонкам:
 *
 * [4 байта: magic "ETFH"]
 * [4 байта: версия]
 * Метаданные:
 *   [symbol][period]          - строки
 *   [start][end]              - мс от эпохи (0 для пустой серии)
 *   [4 байта: число баров N]
 * Колонки (по N значений):
 *   timestamp (int64), open, high, low, close (double), volume (int64)
 *
 * Время записи лежит в конверте DiskCache. Свежесть всё равно
 * определяется по mtime файла, а не по этому полю.
 */
class SeriesSerializer : public ISerializer<HistoricalSeries> {
public:
    static constexpr uint32_t MAGIC = 0x48465445;  // "ETFH"
    static constexpr uint32_t VERSION = 1;

    std::vector<uint8_t> serialize(const HistoricalSeries& value) const override {
        const auto& bars = value.bars();

        ByteWriter out;
        out.appendUint32(MAGIC);
        out.appendUint32(VERSION);
        out.appendString(value.symbol());
        out.appendString(value.period());
        out.appendInt64(value.startTime() ? TimeFormat::toMillis(*value.startTime()) : 0);
        out.appendInt64(value.endTime() ? TimeFormat::toMillis(*value.endTime()) : 0);
        out.appendUint32(static_cast<uint32_t>(bars.size()));

        for (const auto& bar : bars) out.appendInt64(TimeFormat::toMillis(bar.timestamp));
        for (const auto& bar : bars) out.appendDouble(bar.open);
        for (const auto& bar : bars) out.appendDouble(bar.high);
        for (const auto& bar : bars) out.appendDouble(bar.low);
        for (const auto& bar : bars) out.appendDouble(bar.close);
        for (const auto& bar : bars) out.appendInt64(bar.volume);

        return out.release();
    }

    HistoricalSeries deserialize(const std::vector<uint8_t>& data) const override {
        ByteReader in(data);
        in.expectHeader(MAGIC, VERSION);

        std::string symbol = in.readString();
        std::string period = in.readString();
        in.readInt64();  // start
        in.readInt64();  // end
        uint32_t count = in.readUint32();

        // 6 колонок по 8 байт
        if (static_cast<uint64_t>(count) * 48 != in.remaining()) {
            throw std::runtime_error("Invalid series payload: column size mismatch");
        }

        std::vector<PriceBar> bars(count);
        for (auto& bar : bars) bar.timestamp = TimeFormat::fromMillis(in.readInt64());
        for (auto& bar : bars) bar.open = in.readDouble();
        for (auto& bar : bars) bar.high = in.readDouble();
        for (auto& bar : bars) bar.low = in.readDouble();
        for (auto& bar : bars) bar.close = in.readDouble();
        for (auto& bar : bars) bar.volume = in.readInt64();

        // Конструктор перепроверит порядок меток
        try {
            return HistoricalSeries(std::move(symbol), std::move(period), std::move(bars));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("Invalid series payload: ") + e.what());
        }
    }
};
