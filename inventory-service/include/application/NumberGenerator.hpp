#pragma once

#include "domain/Timestamp.hpp"
#include "ports/output/ISequenceGenerator.hpp"
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

namespace inventory::application {

/**
 * @brief Генератор номеров документов: {prefix}{yyMMdd}{counter}
 *
 * Счётчик берётся из внешней последовательности (по одной на префикс),
 * поэтому несколько экземпляров сервиса не выдают одинаковых номеров.
 * Счётчик дополняется нулями минимум до 4 цифр.
 */
class NumberGenerator {
public:
    explicit NumberGenerator(std::shared_ptr<ports::output::ISequenceGenerator> sequence)
        : sequence_(std::move(sequence)) {}

    std::string generate(const std::string& prefix) const {
        return generate(prefix, domain::Timestamp::now());
    }

    std::string generate(const std::string& prefix, const domain::Timestamp& at) const {
        const int64_t counter = sequence_->next(sequenceName(prefix));

        std::ostringstream ss;
        ss << prefix << at.toDateStamp() << std::setw(4) << std::setfill('0') << counter;
        return ss.str();
    }

    static std::string sequenceName(const std::string& prefix) {
        return "doc_number_" + prefix + "_seq";
    }

private:
    std::shared_ptr<ports::output::ISequenceGenerator> sequence_;
};

} // namespace inventory::application
