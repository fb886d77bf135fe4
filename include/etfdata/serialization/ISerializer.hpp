#pragma once

#include <cstdint>
#include <vector>

/**
 * @brief Интерфейс сериализатора значения кэша
 * @tparam V Тип значения
 *
 * deserialize() бросает std::runtime_error на любых некорректных данных.
 */
template<typename V>
class ISerializer {
public:
    virtual ~ISerializer() = default;

    virtual std::vector<uint8_t> serialize(const V& value) const = 0;
    virtual V deserialize(const std::vector<uint8_t>& data) const = 0;
};
