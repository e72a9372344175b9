/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

csv_report.cpp implementation.*/

#include "match_report.hpp"

#include "../shared/logger.hpp"
#include "../shared/text_utils.hpp"

namespace roundstat::report {

namespace {

void AppendRow(std::string& out, const FieldList& fields, bool header) {
	bool first = true;
	for (const auto& [name, value] : fields) {
		if (!first)
			out.push_back(',');
		first = false;

		if (header)
			out += CsvEscape(name);
		else
			out += CsvEscape(FieldText(value));
	}
	out += "\r\n";
}

class CsvReportWriter final : public MatchReportWriter {
public:
	std::string_view Name() const override { return "csv"; }

	bool Write(const analysis::MatchAnalysis& analysis, const std::filesystem::path& outDir, std::string& error) const override {
		const std::filesystem::path tableDir = outDir / analysis.metadata.matchId;
		if (!EnsureDirectory(tableDir, error))
			return false;

		int written = 0;
		for (const RecordCollection& collection : CollectRecords(analysis)) {
			if (collection.rows.empty())
				continue;

			const std::filesystem::path path = tableDir / (std::string(collection.name) + ".csv");
			if (!WriteTextFile(path, CsvTableText(collection), error))
				return false;

			Logf(LogLevel::Debug, "saved {}.csv ({} rows)", collection.name, collection.rows.size());
			++written;
		}

		Logf(LogLevel::Info, "{} CSV tables written to {}", written, tableDir.string());
		return true;
	}
};

} // namespace

std::string CsvTableText(const RecordCollection& collection) {
	std::string out;
	if (collection.rows.empty())
		return out;

	AppendRow(out, collection.rows.front(), true);
	for (const FieldList& row : collection.rows)
		AppendRow(out, row, false);
	return out;
}

std::unique_ptr<MatchReportWriter> MakeCsvReportWriter() {
	return std::make_unique<CsvReportWriter>();
}

} // namespace roundstat::report
