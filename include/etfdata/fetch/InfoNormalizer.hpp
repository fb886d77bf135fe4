#pragma once

#include <etfdata/model/InfoRecord.hpp>
#include <etfdata/provider/ProviderErrors.hpp>
#include <etfdata/provider/RawTable.hpp>

#include <map>
#include <string>

/**
 * @brief Приведение справочных данных к InfoRecord
 *
 * Провайдер отдаёт пары item/value с китайскими названиями полей.
 * Известные поля переименовываются (基金名称 -> name, ...), остальные
 * сохраняются как есть. Всегда заполнены name и currency.
 */
class InfoNormalizer {
public:
    static InfoRecord normalize(const std::string& symbol, const RawTable& raw,
                                const std::string& currency, IClock::TimePoint updatedAt) {
        auto item = raw.findColumn({"item", "项目", "key", "field"});
        auto value = raw.findColumn({"value", "值"});
        if (!item || !value) {
            throw ProviderError("Instrument info: missing item/value columns");
        }
        if (raw.empty()) {
            throw ProviderError("Instrument info: empty response for " + symbol);
        }

        static const std::map<std::string, std::string> renames = {
            {"基金代码", "code"},
            {"基金名称", "name"},
            {"基金全称", "full_name"},
            {"基金类型", "fund_type"},
            {"基金公司", "company"},
            {"基金经理", "manager"},
            {"成立时间", "established"},
            {"最新规模", "scale"},
        };

        InfoRecord record;
        record.symbol = symbol;
        record.updatedAt = updatedAt;

        for (const auto& row : raw.rows()) {
            const std::string& key = row[*item];
            if (key.empty()) continue;
            auto it = renames.find(key);
            record.fields[it == renames.end() ? key : it->second] = row[*value];
        }

        if (record.fields["name"].empty()) {
            record.fields["name"] = "Fund-" + symbol;
        }
        record.fields["currency"] = currency;
        return record;
    }
};
