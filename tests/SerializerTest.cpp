#include <gtest/gtest.h>
#include <etfdata/serialization/InfoSerializer.hpp>
#include <etfdata/serialization/SeriesSerializer.hpp>
#include <etfdata/serialization/SnapshotSerializer.hpp>
#include "TestSupport.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

/**
 * @brief Тесты для сериализаторов записей кэша
 *
 * Проверяем:
 * - Восстановление всех полей снимка, серии и справочной записи
 * - Колоночный формат серии (NaN сохраняется)
 * - Отказ на чужом magic, другой версии и обрезанных данных
 */

// ==================== Снимок ====================

TEST(SerializerTest, SnapshotKeepsAllFields) {
    InstrumentSnapshot s;
    s.symbol = "510300";
    s.name = "沪深300ETF";
    s.lastPrice = 3.912;
    s.previousClose = 3.88;
    s.changePercent = 0.82;
    s.volume = 123456789;
    s.marketCap = 1.7e11;
    s.currency = "CNY";
    s.observedAt = TimeFormat::makeTime(2024, 3, 15, 10, 30);
    s.metadataOnly = false;

    SnapshotSerializer serializer;
    auto restored = serializer.deserialize(serializer.serialize(s));

    EXPECT_EQ(restored.symbol, "510300");
    EXPECT_EQ(restored.name, "沪深300ETF");
    EXPECT_DOUBLE_EQ(restored.lastPrice, 3.912);
    EXPECT_DOUBLE_EQ(restored.previousClose, 3.88);
    EXPECT_DOUBLE_EQ(restored.changePercent, 0.82);
    EXPECT_EQ(restored.volume, 123456789);
    ASSERT_TRUE(restored.marketCap.has_value());
    EXPECT_DOUBLE_EQ(*restored.marketCap, 1.7e11);
    EXPECT_EQ(restored.currency, "CNY");
    EXPECT_EQ(restored.observedAt, s.observedAt);
    EXPECT_FALSE(restored.metadataOnly);
}

TEST(SerializerTest, SnapshotWithoutMarketCapAndMetadataOnly) {
    InstrumentSnapshot s;
    s.symbol = "159915";
    s.metadataOnly = true;

    SnapshotSerializer serializer;
    auto restored = serializer.deserialize(serializer.serialize(s));

    EXPECT_FALSE(restored.marketCap.has_value());
    EXPECT_TRUE(restored.metadataOnly);
}

// ==================== Серия ====================

TEST(SerializerTest, SeriesKeepsBarsAndNaN) {
    auto series = testsupport::makeSeries("510500", 5, 5.0, "180d");
    auto bars = series.bars();
    bars[2].close = std::numeric_limits<double>::quiet_NaN();
    HistoricalSeries withGap("510500", "180d", bars);

    SeriesSerializer serializer;
    auto restored = serializer.deserialize(serializer.serialize(withGap));

    EXPECT_EQ(restored.symbol(), "510500");
    EXPECT_EQ(restored.period(), "180d");
    ASSERT_EQ(restored.size(), 5u);
    EXPECT_EQ(restored.bars()[4].timestamp, bars[4].timestamp);
    EXPECT_DOUBLE_EQ(restored.bars()[4].close, bars[4].close);
    EXPECT_EQ(restored.bars()[4].volume, bars[4].volume);
    EXPECT_TRUE(std::isnan(restored.bars()[2].close));
}

TEST(SerializerTest, EmptySeries) {
    HistoricalSeries empty("588000", "60d", {});

    SeriesSerializer serializer;
    auto restored = serializer.deserialize(serializer.serialize(empty));

    EXPECT_TRUE(restored.empty());
    EXPECT_EQ(restored.symbol(), "588000");
}

// ==================== Справочная запись ====================

TEST(SerializerTest, InfoRecordKeepsFields) {
    InfoRecord record;
    record.symbol = "512880";
    record.fields["name"] = "证券ETF";
    record.fields["scale"] = "380亿";
    record.updatedAt = TimeFormat::makeTime(2024, 1, 2);

    InfoSerializer serializer;
    auto restored = serializer.deserialize(serializer.serialize(record));

    EXPECT_EQ(restored.symbol, "512880");
    EXPECT_EQ(restored.fields, record.fields);
    EXPECT_EQ(restored.updatedAt, record.updatedAt);
    EXPECT_EQ(restored.fieldOr("missing", "x"), "x");
}

// ==================== Повреждённые данные ====================

TEST(SerializerTest, RejectsForeignMagic) {
    SnapshotSerializer snapshots;
    SeriesSerializer series;

    InstrumentSnapshot s;
    s.symbol = "510300";
    auto data = snapshots.serialize(s);

    EXPECT_THROW(series.deserialize(data), std::runtime_error);
}

TEST(SerializerTest, RejectsOtherVersion) {
    InfoSerializer serializer;
    InfoRecord record;
    record.symbol = "510300";
    auto data = serializer.serialize(record);

    // Версия идёт сразу за magic, little-endian
    data[4] = static_cast<uint8_t>(InfoSerializer::VERSION + 1);

    EXPECT_THROW(serializer.deserialize(data), std::runtime_error);
}

TEST(SerializerTest, RejectsTruncatedSeries) {
    SeriesSerializer serializer;
    auto data = serializer.serialize(testsupport::makeSeries("510300", 10));
    data.resize(data.size() - 7);

    EXPECT_THROW(serializer.deserialize(data), std::runtime_error);
}

TEST(SerializerTest, RejectsEmptyBuffer) {
    SnapshotSerializer serializer;

    EXPECT_THROW(serializer.deserialize({}), std::runtime_error);
}
