/**
 * @file hole_key.cpp
 * @brief Реализация определения идентификатора скважины
 */

#include "hole_key.hpp"
#include "column_standardizer.hpp"
#include "model/text_utils.hpp"
#include <algorithm>

namespace drilltrace::core {

std::string normalizeHoleIdValue(const CellValue& value) {
    if (isBlank(value)) {
        return {};
    }
    return trim(toText(value));
}

std::vector<std::string> holeIdCandidates(const std::optional<std::string>& preferred) {
    std::vector<std::string> candidates;
    auto add = [&candidates](const std::string& name) {
        if (!name.empty() &&
            std::find(candidates.begin(), candidates.end(), name) == candidates.end()) {
            candidates.push_back(name);
        }
    };

    if (preferred.has_value()) {
        add(trim(*preferred));
    }
    add(fields::kHoleId);
    add("holeId");
    add("id");
    add(fields::kPrimaryId);
    return candidates;
}

Canonicalized<Row> canonicalizeHoleIdRows(Table rows, const std::optional<std::string>& preferred) {
    return canonicalizeHoleIds(std::move(rows), preferred, "canonicalizeHoleIdRows");
}

std::string toString(PrimaryKeyKind kind) {
    switch (kind) {
        case PrimaryKeyKind::CompanyHoleId: return "company_hole_id";
        case PrimaryKeyKind::HoleId: return "hole_id";
        case PrimaryKeyKind::CollarId: return "collar_id";
        case PrimaryKeyKind::Anumber: return "anumber";
        case PrimaryKeyKind::Custom: return "custom";
    }
    return "company_hole_id";
}

std::optional<PrimaryKeyKind> parsePrimaryKeyKind(std::string_view str) {
    auto key = normalizeFieldName(str);
    key.erase(std::remove(key.begin(), key.end(), '_'), key.end());

    if (key == "companyholeid") return PrimaryKeyKind::CompanyHoleId;
    if (key == "holeid") return PrimaryKeyKind::HoleId;
    if (key == "collarid") return PrimaryKeyKind::CollarId;
    if (key == "anumber") return PrimaryKeyKind::Anumber;
    if (key == "custom") return PrimaryKeyKind::Custom;
    return std::nullopt;
}

std::string primaryFieldFromConfig(const PrimaryKeyConfig& config) {
    switch (config.kind) {
        case PrimaryKeyKind::Custom: {
            auto custom = normalizeFieldName(config.custom_key);
            return custom.empty() ? "companyholeid" : custom;
        }
        case PrimaryKeyKind::HoleId: return "holeid";
        case PrimaryKeyKind::CollarId: return "collarid";
        case PrimaryKeyKind::Anumber: return "anumber";
        case PrimaryKeyKind::CompanyHoleId: break;
    }
    return "companyholeid";
}

std::string resolvePrimaryId(const Row& row, std::string_view primary_field) {
    auto primary = normalizeFieldName(primary_field);
    if (primary.empty()) {
        primary = "companyholeid";
    }

    const std::vector<std::string> candidates = {
        primary, "companyholeid", "company_hole_id", fields::kDatasourceHoleId,
        "holeid", fields::kHoleId, "collarid", fields::kCollarId, fields::kAnumber, "id",
    };

    for (const auto& key : candidates) {
        for (const auto& [name, value] : row) {
            if (normalizeFieldName(name) != key) {
                continue;
            }
            auto id = normalizeHoleIdValue(value);
            if (!id.empty()) {
                return id;
            }
        }
    }
    return {};
}

Table assignPrimaryIds(Table rows, const PrimaryKeyConfig& config) {
    auto primary_field = primaryFieldFromConfig(config);
    for (auto& row : rows) {
        row.set(fields::kPrimaryId, resolvePrimaryId(row, primary_field));
    }
    return rows;
}

} // namespace drilltrace::core
