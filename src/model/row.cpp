/**
 * @file row.cpp
 * @brief Реализация строки табличных данных
 */

#include "row.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace drilltrace::model {

bool isBlank(const CellValue& value) noexcept {
    if (std::holds_alternative<std::monostate>(value)) {
        return true;
    }
    if (const auto* number = std::get_if<double>(&value)) {
        return std::isnan(*number);
    }
    const auto& str = std::get<std::string>(value);
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::optional<double> toNumber(const CellValue& value) {
    if (const auto* number = std::get_if<double>(&value)) {
        if (!std::isfinite(*number)) {
            return std::nullopt;
        }
        return *number;
    }
    const auto* str = std::get_if<std::string>(&value);
    if (str == nullptr) {
        return std::nullopt;
    }

    std::string cleaned = trim(*str);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    double parsed = std::strtod(cleaned.c_str(), &end);
    if (end == cleaned.c_str() || *end != '\0' || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

std::string toText(const CellValue& value) {
    if (const auto* str = std::get_if<std::string>(&value)) {
        return *str;
    }
    if (const auto* number = std::get_if<double>(&value)) {
        if (std::isnan(*number)) {
            return {};
        }
        std::ostringstream ss;
        ss << std::setprecision(15) << *number;
        return ss.str();
    }
    return {};
}

Row::Row(std::initializer_list<Entry> entries) {
    entries_.reserve(entries.size());
    for (const auto& [name, value] : entries) {
        set(name, value);
    }
}

bool Row::contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
}

const CellValue* Row::find(std::string_view name) const noexcept {
    for (const auto& entry : entries_) {
        if (entry.first == name) {
            return &entry.second;
        }
    }
    return nullptr;
}

CellValue Row::get(std::string_view name) const {
    const auto* value = find(name);
    return value != nullptr ? *value : CellValue{};
}

std::optional<double> Row::number(std::string_view name) const {
    const auto* value = find(name);
    return value != nullptr ? toNumber(*value) : std::nullopt;
}

std::string Row::text(std::string_view name) const {
    const auto* value = find(name);
    return value != nullptr ? toText(*value) : std::string{};
}

bool Row::hasValue(std::string_view name) const noexcept {
    const auto* value = find(name);
    return value != nullptr && !isBlank(*value);
}

void Row::set(std::string name, CellValue value) {
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(name), std::move(value));
}

bool Row::setIfAbsent(std::string name, CellValue value) {
    if (contains(name)) {
        return false;
    }
    entries_.emplace_back(std::move(name), std::move(value));
    return true;
}

bool Row::erase(std::string_view name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const Entry& entry) { return entry.first == name; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::vector<std::string> Row::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

bool tableHasColumn(const Table& table, std::string_view name) noexcept {
    return std::any_of(table.begin(), table.end(),
                       [name](const Row& row) { return row.contains(name); });
}

} // namespace drilltrace::model
