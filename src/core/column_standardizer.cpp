/**
 * @file column_standardizer.cpp
 * @brief Реализация приведения имён колонок
 */

#include "column_standardizer.hpp"
#include "model/datamodel.hpp"
#include "model/text_utils.hpp"
#include <cctype>

namespace drilltrace::core {

std::string normalizeFieldName(std::string_view name) {
    auto lowered = utf8ToLower(trim(stripBom(name)));

    std::string normalized;
    normalized.reserve(lowered.size());
    bool in_space = false;

    for (char c : lowered) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) {
                normalized += '_';
                in_space = true;
            }
        } else {
            normalized += c;
            in_space = false;
        }
    }
    return normalized;
}

ColumnLookup buildColumnLookup(const ColumnOverrides& overrides) {
    ColumnLookup lookup;
    for (const auto& entry : defaultColumnMap()) {
        lookup[entry.canonical] = entry.canonical;
        for (const auto& alias : entry.aliases) {
            lookup.emplace(alias, entry.canonical);
        }
    }

    for (const auto& [source, canonical] : overrides) {
        auto key = normalizeFieldName(source);
        auto target = normalizeFieldName(canonical);
        if (key.empty() || target.empty()) {
            continue;
        }
        lookup[key] = target;
    }
    return lookup;
}

Row applyColumnLookup(const Row& row, const ColumnLookup& lookup) {
    Row result;
    for (const auto& [name, value] : row) {
        auto normalized = normalizeFieldName(name);
        auto it = lookup.find(normalized);
        std::string target = it != lookup.end() ? it->second : normalized;
        result.setIfAbsent(std::move(target), value);
    }
    return result;
}

Row standardizeColumns(const Row& row, const ColumnOverrides& overrides) {
    return applyColumnLookup(row, buildColumnLookup(overrides));
}

Table standardizeTable(const Table& table, const ColumnOverrides& overrides) {
    auto lookup = buildColumnLookup(overrides);

    Table result;
    result.reserve(table.size());
    for (const auto& row : table) {
        result.push_back(applyColumnLookup(row, lookup));
    }
    return result;
}

} // namespace drilltrace::core
