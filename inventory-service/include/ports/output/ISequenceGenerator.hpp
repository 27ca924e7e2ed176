#pragma once

#include <cstdint>
#include <string>

namespace inventory::ports::output {

/**
 * @brief Атомарно возрастающая именованная последовательность
 *
 * Значения уникальны между всеми экземплярами сервиса,
 * использующими одно хранилище последовательности.
 */
class ISequenceGenerator {
public:
    virtual ~ISequenceGenerator() = default;

    /// Следующее значение (начиная с 1)
    virtual int64_t next(const std::string& sequenceName) = 0;
};

} // namespace inventory::ports::output
