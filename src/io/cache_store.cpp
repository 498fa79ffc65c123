/**
 * @file cache_store.cpp
 * @brief Реализация кэша в хранилище ключ-значение
 */

#include "cache_store.hpp"
#include "file_utils.hpp"
#include "json_rows.hpp"
#include "model/data_errors.hpp"
#include "model/datamodel.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace drilltrace::io {

using json = nlohmann::ordered_json;

namespace {

constexpr int kCacheFormatVersion = 1;

json wrapPayload(json rows) {
    json payload;
    payload["version"] = kCacheFormatVersion;
    payload["rows"] = std::move(rows);
    return payload;
}

// nullopt для повреждённой записи или другой версии формата
std::optional<json> parsePayload(const std::string& text) {
    json payload = json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return std::nullopt;
    }
    auto version = payload.find("version");
    if (version == payload.end() || !version->is_number_integer() ||
        version->get<int>() != kCacheFormatVersion || !payload.contains("rows")) {
        return std::nullopt;
    }
    return payload;
}

std::optional<core::SkippedHole> skippedFromJson(const json& item) {
    if (!item.is_object()) {
        return std::nullopt;
    }
    auto hole_id = item.find("hole_id");
    auto reason_text = item.find("reason");
    if (hole_id == item.end() || !hole_id->is_string() ||
        reason_text == item.end() || !reason_text->is_string()) {
        return std::nullopt;
    }
    auto reason = core::parseSkipReason(reason_text->get<std::string>());
    if (!reason) {
        return std::nullopt;
    }
    return core::SkippedHole{hole_id->get<std::string>(), *reason};
}

} // namespace

// === MemoryKeyValueStore ===

std::optional<std::string> MemoryKeyValueStore::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    entries_[key] = value;
    return true;
}

// === FileKeyValueStore ===

FileKeyValueStore::FileKeyValueStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path FileKeyValueStore::pathFor(const std::string& key) const {
    std::string name;
    name.reserve(key.size());
    for (unsigned char c : key) {
        name += (std::isalnum(c) || c == '-' || c == '_' || c == '.') ? static_cast<char>(c) : '_';
    }
    return directory_ / (name + ".json");
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) const {
    auto path = pathFor(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    try {
        return readTextFile(path);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
}

bool FileKeyValueStore::set(const std::string& key, const std::string& value) {
    try {
        atomicWrite(pathFor(key), value);
        return true;
    } catch (const std::runtime_error&) {
        return false;
    }
}

// === Кэш данных ===

std::string desurveyCacheKey(const DesurveyConfig& config, std::string_view fingerprint) {
    std::ostringstream ss;
    ss << kDesurveyCacheKey << ':' << toString(config.method)
       << ':' << std::setprecision(10) << config.step
       << ':' << config.hole_id_column.value_or("")
       << ':' << fingerprint;
    return ss.str();
}

bool saveCachedTable(IKeyValueStore& store, const std::string& key, const Table& table) {
    return store.set(key, wrapPayload(tableToJson(table)).dump());
}

std::optional<Table> loadCachedTable(const IKeyValueStore& store, const std::string& key) {
    auto text = store.get(key);
    if (!text) {
        return std::nullopt;
    }
    auto payload = parsePayload(*text);
    if (!payload) {
        return std::nullopt;
    }
    try {
        return tableFromJson((*payload)["rows"]);
    } catch (const DataError&) {
        return std::nullopt;
    }
}

bool saveCachedDesurvey(IKeyValueStore& store, const std::string& key, const core::DesurveyResult& result) {
    auto payload = wrapPayload(tracesToJson(result.points));
    payload["alias_column"] = result.alias_column;
    payload["skipped"] = json::array();
    for (const auto& skipped : result.skipped) {
        payload["skipped"].push_back({{"hole_id", skipped.hole_id},
                                      {"reason", core::toString(skipped.reason)}});
    }
    return store.set(key, payload.dump());
}

std::optional<core::DesurveyResult> loadCachedDesurvey(const IKeyValueStore& store, const std::string& key) {
    auto text = store.get(key);
    if (!text) {
        return std::nullopt;
    }
    auto payload = parsePayload(*text);
    if (!payload) {
        return std::nullopt;
    }

    // Запись без списка пропущенных скважин считается неполной
    auto skipped = payload->find("skipped");
    if (skipped == payload->end() || !skipped->is_array()) {
        return std::nullopt;
    }

    core::DesurveyResult result;
    for (const auto& item : *skipped) {
        auto hole = skippedFromJson(item);
        if (!hole) {
            return std::nullopt;
        }
        result.skipped.push_back(std::move(*hole));
    }

    auto alias = payload->find("alias_column");
    result.alias_column = alias != payload->end() && alias->is_string()
        ? alias->get<std::string>()
        : std::string(fields::kHoleId);

    try {
        result.points = tracesFromJson((*payload)["rows"]);
    } catch (const DataError&) {
        return std::nullopt;
    }
    return result;
}

} // namespace drilltrace::io
