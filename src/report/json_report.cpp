/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

json_report.cpp implementation.*/

#include "match_report.hpp"

#include "../shared/logger.hpp"

#include <exception>

namespace roundstat::report {

namespace {

using json = Json::Value;

json FieldsToJson(const FieldList& fields) {
	json object(Json::objectValue);
	for (const auto& [name, value] : fields)
		object[std::string(name)] = value;
	return object;
}

class JsonReportWriter final : public MatchReportWriter {
public:
	std::string_view Name() const override { return "json"; }

	bool Write(const analysis::MatchAnalysis& analysis, const std::filesystem::path& outDir, std::string& error) const override {
		if (!EnsureDirectory(outDir, error))
			return false;

		const std::filesystem::path path = outDir / (analysis.metadata.matchId + ".json");
		try {
			if (!WriteTextFile(path, MatchAnalysisToJsonText(analysis), error))
				return false;
		}
		catch (const std::exception& e) {
			error = "exception while writing JSON (" + path.string() + "): " + e.what();
			return false;
		}

		Logf(LogLevel::Info, "match JSON written to {}", path.string());
		return true;
	}
};

} // namespace

json MatchAnalysisToJson(const analysis::MatchAnalysis& analysis) {
	json root(Json::objectValue);
	root["metadata"] = FieldsToJson(MetadataFields(analysis.metadata));

	for (const RecordCollection& collection : CollectRecords(analysis)) {
		json rows(Json::arrayValue);
		for (const FieldList& row : collection.rows)
			rows.append(FieldsToJson(row));
		root[std::string(collection.name)] = std::move(rows);
	}

	return root;
}

std::string MatchAnalysisToJsonText(const analysis::MatchAnalysis& analysis) {
	Json::StreamWriterBuilder writer;
	writer["indentation"] = "  ";
	writer["precision"] = 2;
	writer["precisionType"] = "decimal";
	return Json::writeString(writer, MatchAnalysisToJson(analysis));
}

std::unique_ptr<MatchReportWriter> MakeJsonReportWriter() {
	return std::make_unique<JsonReportWriter>();
}

} // namespace roundstat::report
