#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "model/GitStats.hpp"
#include "util/Expected.hpp"

/**
 * @brief JSON form of the raw and analysis bundles
 *
 * Field names are camelCase. codeFrequency rows are [week, additions, -deletions]
 * and raw punch-card cells are [day, hour, commits]. Signatures carry both the
 * Unix timestamp (read back on decode) and an ISO-8601 "date" for consumers.
 */
namespace gitpulse {

void to_json(nlohmann::json& j, const Signature& sig);
void from_json(const nlohmann::json& j, Signature& sig);
void to_json(nlohmann::json& j, const CommitSummary& commit);
void from_json(const nlohmann::json& j, CommitSummary& commit);
void to_json(nlohmann::json& j, const FileDelta& file);
void from_json(const nlohmann::json& j, FileDelta& file);
void to_json(nlohmann::json& j, const CommitDetail& detail);
void from_json(const nlohmann::json& j, CommitDetail& detail);
void to_json(nlohmann::json& j, const ContributorSeries& series);
void from_json(const nlohmann::json& j, ContributorSeries& series);
void to_json(nlohmann::json& j, const CommitActivityWeek& week);
void from_json(const nlohmann::json& j, CommitActivityWeek& week);
void to_json(nlohmann::json& j, const CodeFrequencyRow& row);
void from_json(const nlohmann::json& j, CodeFrequencyRow& row);
void to_json(nlohmann::json& j, const PunchCardCell& cell);
void from_json(const nlohmann::json& j, PunchCardCell& cell);
void to_json(nlohmann::json& j, const RawDataBundle& raw);
void from_json(const nlohmann::json& j, RawDataBundle& raw);

void to_json(nlohmann::json& j, const AnalysisBundle& analysis);

namespace json {

/// Compact encoding used when the bundle crosses the worker boundary
std::string encodeRaw(const RawDataBundle& raw, int indent = -1);

Expected<RawDataBundle> decodeRaw(const std::string& text);

Expected<RawDataBundle> readRawFile(const std::filesystem::path& path);

std::string encodeAnalysis(const AnalysisBundle& analysis, int indent = -1);

/// Write @p text to @p path, or to stdout when @p path is empty
Expected<void> writeOutput(const std::filesystem::path& path, const std::string& text);

}

}
