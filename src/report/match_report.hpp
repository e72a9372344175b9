// match_report.hpp (Match Report Writers)
// Serializers for a finished MatchAnalysis. Each writer names its files after
// the match id, so reports of several matches can share one directory:
//
//   <out>/<match_id>.json          whole bundle (JSON writer)
//   <out>/<match_id>/<name>.csv    one table per non-empty collection
//   <out>/<match_id>_summary.txt   human readable digest

#pragma once

#include "record_fields.hpp"

#include "../analysis/match_analyzer.hpp"

#include <json/json.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace roundstat::report {

/*
=================
MatchReportWriter

One output format. Write reports failures through the error string and
never throws.
=================
*/
class MatchReportWriter {
public:
	virtual ~MatchReportWriter() = default;
	virtual std::string_view Name() const = 0;
	virtual bool Write(const analysis::MatchAnalysis& analysis, const std::filesystem::path& outDir, std::string& error) const = 0;
};

std::unique_ptr<MatchReportWriter> MakeJsonReportWriter();
std::unique_ptr<MatchReportWriter> MakeCsvReportWriter();
std::unique_ptr<MatchReportWriter> MakeSummaryReportWriter();

/*
=============
EnsureDirectory

Creates the directory and its parents when missing.
=============
*/
bool EnsureDirectory(const std::filesystem::path& directory, std::string& error);

/*
=============
WriteTextFile

Replaces the file with the given contents.
=============
*/
bool WriteTextFile(const std::filesystem::path& path, std::string_view contents, std::string& error);

/*
=============
MatchAnalysisToJson

The whole bundle as one document: "metadata" plus one array per collection.
Optional values are written as null.
=============
*/
Json::Value MatchAnalysisToJson(const analysis::MatchAnalysis& analysis);

std::string MatchAnalysisToJsonText(const analysis::MatchAnalysis& analysis);

/*
=============
CsvTableText

Header row plus one line per record, text cells quoted where needed and
null cells left empty.
=============
*/
std::string CsvTableText(const RecordCollection& collection);

std::string RenderSummary(const analysis::MatchAnalysis& analysis);

} // namespace roundstat::report
