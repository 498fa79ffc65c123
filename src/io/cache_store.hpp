/**
 * @file cache_store.hpp
 * @brief Кэш таблиц и траекторий в хранилище ключ-значение
 *
 * Хранилище передаётся вызывающей стороной. Повреждённая или
 * несовместимая запись читается как отсутствующая.
 */

#pragma once

#include "core/desurvey.hpp"
#include "model/records.hpp"
#include "model/row.hpp"
#include "model/types.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace drilltrace::io {

using namespace drilltrace::model;

inline constexpr const char* kCollarsCacheKey = "drilltrace-collars-cache-v1";
inline constexpr const char* kSurveyCacheKey = "drilltrace-survey-cache-v1";
inline constexpr const char* kDesurveyCacheKey = "drilltrace-desurvey-cache-v2";

/**
 * @brief Интерфейс хранилища ключ-значение
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;

    /**
     * @return false если запись не удалась
     */
    virtual bool set(const std::string& key, const std::string& value) = 0;
};

/**
 * @brief Хранилище в памяти
 */
class MemoryKeyValueStore : public IKeyValueStore {
public:
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;

private:
    std::map<std::string, std::string> entries_;
};

/**
 * @brief Хранилище в каталоге: один файл на ключ
 */
class FileKeyValueStore : public IKeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path directory);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    bool set(const std::string& key, const std::string& value) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    [[nodiscard]] std::filesystem::path pathFor(const std::string& key) const;

    std::filesystem::path directory_;
};

/**
 * @brief Ключ траекторий для конкретных параметров расчёта
 */
[[nodiscard]] std::string desurveyCacheKey(const DesurveyConfig& config, std::string_view fingerprint);

bool saveCachedTable(IKeyValueStore& store, const std::string& key, const Table& table);
[[nodiscard]] std::optional<Table> loadCachedTable(const IKeyValueStore& store, const std::string& key);

/**
 * @brief Результат построения траекторий целиком: точки, пропущенные
 * скважины и колонка идентификатора
 */
bool saveCachedDesurvey(IKeyValueStore& store, const std::string& key, const core::DesurveyResult& result);
[[nodiscard]] std::optional<core::DesurveyResult> loadCachedDesurvey(
    const IKeyValueStore& store, const std::string& key);

} // namespace drilltrace::io
