#pragma once

#include <cstdint>
#include <cstddef>

namespace websession::ports::output {

/**
 * @brief Источник криптографически стойких случайных байт
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Заполнить буфер случайными байтами
     * @throws domain::IdentifierGenerationError если источник недоступен
     */
    virtual void fill(uint8_t* buffer, size_t size) = 0;
};

} // namespace websession::ports::output
