#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace ledger::settings::env {

inline std::string getOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? value : defaultValue;
}

/**
 * @throws std::runtime_error если переменная не задана или пуста
 */
inline std::string getRequired(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string("Required env variable not set: ") + name);
    }
    return value;
}

/**
 * @brief Целое в диапазоне [min, max], без хвостов вида "10min"
 * @throws std::invalid_argument с именем переменной в тексте
 */
inline int parseInt(const char* name, const std::string& raw, int min, int max) {
    size_t pos = 0;
    long value = 0;
    try {
        value = std::stol(raw, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid number in ") + name + ": '" + raw + "'");
    }
    if (pos != raw.size() || value < min || value > max) {
        throw std::invalid_argument(std::string("Invalid number in ") + name + ": '" + raw +
                                    "' (expected " + std::to_string(min) + ".." + std::to_string(max) + ")");
    }
    return static_cast<int>(value);
}

} // namespace ledger::settings::env
