/// @file main.cpp
/// @brief tracelens-compile entry point
///
/// Reads one request document, compiles it and prints the query as JSON on
/// stdout. Logs go to stderr.

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include <CLI/CLI.hpp>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include "analytics/aggregation_builder.h"
#include "analytics/request_json.h"
#include "common/config.h"
#include "common/logging.h"

namespace {

using tracelens::analytics::AggregationBuilder;

absl::StatusOr<std::string> ReadRequest(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream file(path);
    if (!file) {
        return absl::NotFoundError(absl::StrCat("Cannot open request file: ", path));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

absl::StatusOr<nlohmann::json> Compile(const AggregationBuilder& builder,
                                       const std::string& kind,
                                       const std::string& document) {
    namespace analytics = tracelens::analytics;

    if (kind == "timeseries") {
        auto request = analytics::ParseTimeseriesRequest(document);
        if (!request.ok()) return request.status();
        auto query = builder.BuildTimeseriesQuery(*request);
        if (!query.ok()) return query.status();
        return analytics::BuiltQueryToJson(*query);
    }
    if (kind == "filter-options") {
        auto request = analytics::ParseFilterOptionsRequest(document);
        if (!request.ok()) return request.status();
        auto query = builder.BuildFilterOptionsQuery(*request);
        if (!query.ok()) return query.status();
        return analytics::BuiltQueryToJson(*query);
    }

    auto request = analytics::ParseDocumentsRequest(document);
    if (!request.ok()) return request.status();
    if (kind == "top-documents") {
        auto query = builder.BuildTopDocumentsQuery(*request);
        if (!query.ok()) return query.status();
        return analytics::TopDocumentsQueryToJson(*query);
    }
    auto query = builder.BuildFeedbacksQuery(*request);
    if (!query.ok()) return query.status();
    return analytics::BuiltQueryToJson(*query);
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"tracelens-compile - compile analytics requests to ClickHouse SQL"};

    std::string request_path;
    std::string config_path;
    std::string log_level;
    std::string kind = "timeseries";
    bool pretty = false;

    app.add_option("-r,--request", request_path, "Request JSON file ('-' or omitted for stdin)");
    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("-k,--kind", kind, "Request kind")
        ->check(CLI::IsMember({"timeseries", "filter-options", "top-documents", "feedbacks"}));
    app.add_flag("--pretty", pretty, "Indent the JSON output");

    CLI11_PARSE(app, argc, argv);

    tracelens::LogConfig log_config;
    log_config.name = "tracelens-compile";
    log_config.level = tracelens::LogLevel::kWarn;
    tracelens::InitLogging(log_config);

    std::optional<std::filesystem::path> file;
    if (!config_path.empty()) {
        file = config_path;
    }
    auto config = tracelens::Config::LoadLayered(file);
    if (!config.ok()) {
        TRACELENS_LOG_ERROR("Failed to load config: {}", config.status().message());
        return 1;
    }

    // The command line wins over logging.level from the config.
    const std::string level_name =
        log_level.empty() ? config->GetString("logging.level", "") : log_level;
    if (!level_name.empty()) {
        auto level = tracelens::ParseLogLevel(level_name);
        if (!level.has_value()) {
            TRACELENS_LOG_ERROR("Unknown log level '{}'", level_name);
            return 1;
        }
        tracelens::SetLogLevel(*level);
    }

    auto document = ReadRequest(request_path);
    if (!document.ok()) {
        TRACELENS_LOG_ERROR("{}", document.status().message());
        return 1;
    }

    AggregationBuilder builder(tracelens::analytics::CompilerOptions::FromConfig(*config));
    auto output = Compile(builder, kind, *document);
    if (!output.ok()) {
        TRACELENS_LOG_ERROR("Failed to compile {} request: {}", kind, output.status().ToString());
        tracelens::ShutdownLogging();
        return 1;
    }

    std::cout << output->dump(pretty ? 2 : -1) << std::endl;
    tracelens::ShutdownLogging();
    return 0;
}
