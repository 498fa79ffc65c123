/**
 * @file main.cpp
 * @brief Точка входа утилиты drilltrace
 *
 * Загружает таблицы устьев, инклинометрии и интервалов из JSON,
 * строит траектории, привязывает интервалы и сохраняет результат.
 */

#include "core/desurvey.hpp"
#include "core/hole_key.hpp"
#include "core/interval_validation.hpp"
#include "core/spatial_attach.hpp"
#include "io/cache_store.hpp"
#include "io/config_io.hpp"
#include "io/json_rows.hpp"
#include "io/loaders.hpp"
#include "model/data_errors.hpp"
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

using namespace drilltrace::model;
using namespace drilltrace::core;
using namespace drilltrace::io;

struct CliOptions {
    std::filesystem::path collars;
    std::filesystem::path surveys;
    std::optional<std::filesystem::path> assays;
    std::optional<std::filesystem::path> geology;
    std::optional<std::filesystem::path> structures;
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> cache_dir;
    std::filesystem::path out;

    std::optional<std::string> method;
    std::optional<double> step;
    std::optional<std::string> hole_id_column;
    bool quiet = false;
};

void printUsage() {
    std::cout <<
        "Использование: drilltrace --collars <rows.json> --surveys <rows.json> --out <result.json>\n"
        "                  [--assays <rows.json>] [--geology <rows.json>] [--structures <rows.json>]\n"
        "                  [--config <cfg.json>]\n"
        "                  [--method tangential|balanced_tangential|minimum_curvature]\n"
        "                  [--step <м>] [--hole-id-col <колонка>] [--cache-dir <каталог>] [--quiet]\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Не указано значение для " + std::string(arg));
            }
            return argv[++i];
        };

        if (arg == "--collars") {
            options.collars = next();
        } else if (arg == "--surveys") {
            options.surveys = next();
        } else if (arg == "--assays") {
            options.assays = next();
        } else if (arg == "--geology") {
            options.geology = next();
        } else if (arg == "--structures") {
            options.structures = next();
        } else if (arg == "--config") {
            options.config = next();
        } else if (arg == "--cache-dir") {
            options.cache_dir = next();
        } else if (arg == "--out") {
            options.out = next();
        } else if (arg == "--method") {
            options.method = next();
        } else if (arg == "--step") {
            options.step = std::stod(next());
        } else if (arg == "--hole-id-col") {
            options.hole_id_column = next();
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else {
            throw std::invalid_argument("Неизвестный параметр: " + std::string(arg));
        }
    }

    if (options.collars.empty() || options.surveys.empty() || options.out.empty()) {
        throw std::invalid_argument("Нужны параметры --collars, --surveys и --out");
    }
    return options;
}

AppConfig resolveConfig(const CliOptions& cli) {
    AppConfig config = cli.config ? loadConfig(*cli.config) : AppConfig{};

    if (cli.method) {
        auto method = parseDesurveyMethod(*cli.method);
        if (!method) {
            throw InvalidValueError("drilltrace", "неизвестный метод '" + *cli.method + "'");
        }
        config.desurvey.method = *method;
    }
    if (cli.step) {
        if (!(*cli.step > 0.0)) {
            throw InvalidValueError("drilltrace", "шаг должен быть положительным");
        }
        config.desurvey.step = *cli.step;
    }
    if (cli.hole_id_column) {
        config.desurvey.hole_id_column = cli.hole_id_column;
    }
    return config;
}

/**
 * @brief Чтение, фильтр по проекту и первичный ключ
 */
Table readSource(const std::filesystem::path& path, const AppConfig& config, const LoadOptions& options) {
    auto rows = filterByProject(loadTable(readTableJson(path), options), config.project_id);
    if (config.primary_key) {
        rows = assignPrimaryIds(std::move(rows), *config.primary_key);
    }
    return rows;
}

void reportQa(std::string_view label, const ValidationResult& result, bool quiet) {
    if (quiet || result.is_valid) {
        return;
    }
    std::cerr << "Предупреждение [" << label << "]: замечаний " << result.errors.size() << std::endl;
    for (const auto& err : result.errors) {
        std::cerr << "  " << err.toString() << std::endl;
    }
}

std::string describeError(const std::exception& e) {
    std::string message = e.what();
    if (const auto* wrapped = dynamic_cast<const ContextWrappedError*>(&e)) {
        if (wrapped->cause()) {
            try {
                std::rethrow_exception(wrapped->cause());
            } catch (const std::exception& cause) {
                message += "\n  причина: " + std::string(cause.what());
            }
        }
    }
    return message;
}

int run(const CliOptions& cli) {
    auto config = resolveConfig(cli);

    LoadOptions load_options;
    load_options.column_overrides = config.column_map;
    load_options.hole_id_column = config.desurvey.hole_id_column;

    auto collar_rows = readSource(cli.collars, config, load_options);
    auto survey_rows = readSource(cli.surveys, config, load_options);
    reportQa("surveys", validateSurveys(survey_rows), cli.quiet);

    auto collars = loadCollars(collar_rows, load_options);
    auto surveys = loadSurveys(survey_rows, load_options);

    std::unique_ptr<IKeyValueStore> cache;
    std::string cache_key;
    if (cli.cache_dir) {
        cache = std::make_unique<FileKeyValueStore>(*cli.cache_dir);
        auto fingerprint = std::to_string(std::hash<std::string>{}(
            tableToJson(collar_rows).dump() + tableToJson(survey_rows).dump()));
        cache_key = desurveyCacheKey(config.desurvey, fingerprint);
    }

    DesurveyResult traces;
    std::optional<DesurveyResult> cached;
    if (cache) {
        cached = loadCachedDesurvey(*cache, cache_key);
    }
    if (cached) {
        traces = std::move(*cached);
        if (!cli.quiet) {
            std::cout << "Траектории загружены из кэша" << std::endl;
        }
    } else {
        traces = desurvey(collars, surveys, config.desurvey,
            [quiet = cli.quiet](double progress, std::string_view hole_id) {
                if (!quiet) {
                    std::cout << "[" << static_cast<int>(progress * 100.0) << "%] " << hole_id << std::endl;
                }
            });
        if (cache && !saveCachedDesurvey(*cache, cache_key, traces)) {
            std::cerr << "Предупреждение: не удалось сохранить кэш в " << cli.cache_dir->string() << std::endl;
        }
    }

    for (const auto& skipped : traces.skipped) {
        std::cerr << "Скважина пропущена: " << skipped.hole_id
                  << " (" << toString(skipped.reason) << ")" << std::endl;
    }

    nlohmann::ordered_json output;
    output["method"] = toString(config.desurvey.method);
    output["traces"] = tracesToJson(traces.points);

    if (cli.assays) {
        auto rows = readSource(*cli.assays, config, load_options);
        reportQa("assays", validateIntervals(rows), cli.quiet);
        auto assays = attachAssayPositions(loadAssays(rows, load_options), traces.points,
                                           config.desurvey.hole_id_column);
        output["assays"] = intervalsToJson(assays);
    }
    if (cli.geology) {
        auto rows = readSource(*cli.geology, config, load_options);
        reportQa("geology", validateIntervals(rows), cli.quiet);
        auto geology = attachAssayPositions(loadGeology(rows, load_options), traces.points,
                                            config.desurvey.hole_id_column);
        output["geology"] = intervalsToJson(geology);
    }
    if (cli.structures) {
        auto rows = readSource(*cli.structures, config, load_options);
        auto structures = loadStructures(rows, load_options);
        reportQa("structures", validateStructuralMeasurements(structures.measurements), cli.quiet);
        auto attached = attachAssayPositions(std::move(structures.measurements), traces.points,
                                             config.desurvey.hole_id_column);
        output["structures"] = intervalsToJson(attached);
    }

    output["skipped"] = nlohmann::ordered_json::array();
    for (const auto& skipped : traces.skipped) {
        output["skipped"].push_back({{"hole_id", skipped.hole_id},
                                     {"reason", toString(skipped.reason)}});
    }

    writeJsonFile(cli.out, output);
    if (!cli.quiet) {
        std::cout << "Построено точек: " << traces.points.size()
                  << ", результат: " << cli.out.string() << std::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string_view(argv[1]) == "--help" || std::string_view(argv[1]) == "-h")) {
        printUsage();
        return 0;
    }

    try {
        return run(parseArgs(argc, argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "Ошибка параметров: " << e.what() << std::endl;
        printUsage();
        return 2;
    } catch (const DataError& e) {
        std::cerr << "Ошибка данных: " << describeError(e) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
