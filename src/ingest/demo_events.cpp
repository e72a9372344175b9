/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

demo_events.cpp implementation.*/

#include "demo_events.hpp"

#include "../shared/logger.hpp"

#include <exception>
#include <fstream>
#include <limits>
#include <memory>
#include <utility>

namespace roundstat::ingest {

namespace {

/*
=============
CopyRows

Appends the object rows of a JSON array; anything else in the array is
skipped and reported.
=============
*/
void CopyRows(const Json::Value& array, std::string_view tableName, RawTable& out) {
	if (array.isNull())
		return;

	if (!array.isArray()) {
		Logf(LogLevel::Warn, "event table '{}' is not an array, treating it as empty", tableName);
		return;
	}

	out.reserve(out.size() + array.size());
	int skipped = 0;
	for (const auto& row : array) {
		if (!row.isObject()) {
			++skipped;
			continue;
		}
		out.push_back(row);
	}

	if (skipped > 0)
		Logf(LogLevel::Warn, "event table '{}': skipped {} non-object rows", tableName, skipped);
}

std::string StringMember(const Json::Value& object, const char* key) {
	const Json::Value& value = object[key];
	return value.isString() ? value.asString() : std::string();
}

} // namespace

const RawTable& DemoEventTables::Table(std::string_view kind) const {
	static const RawTable kEmpty;

	auto it = events.find(kind);
	if (it == events.end())
		return kEmpty;
	return it->second;
}

bool DemoEventTables::HasRows(std::string_view kind) const {
	return !Table(kind).empty();
}

bool ParseDemoEvents(const Json::Value& root, DemoEventTables& out, std::string& error) {
	if (!root.isObject()) {
		error = "event dump root must be a JSON object";
		return false;
	}

	DemoEventTables tables;

	const Json::Value& header = root["header"];
	if (header.isObject()) {
		tables.header.demoFile = StringMember(header, "demo_file");
		tables.header.mapName = StringMember(header, "map_name");
		tables.header.serverName = StringMember(header, "server_name");
		const Json::Value& tickRate = header["tickrate"];
		if (tickRate.isNumeric()) {
			const double rate = tickRate.asDouble();
			if (rate > 0.0 && rate < static_cast<double>(std::numeric_limits<int>::max()))
				tables.header.tickRate = static_cast<int>(rate + 0.5);
			else
				Logf(LogLevel::Warn, "event dump header tickrate {} is out of range, ignoring it", rate);
		}
	}
	else if (!header.isNull()) {
		Log(LogLevel::Warn, "event dump 'header' is not an object, ignoring it");
	}

	const Json::Value& events = root["events"];
	if (!events.isNull() && !events.isObject()) {
		error = "event dump 'events' must be a JSON object";
		return false;
	}

	if (events.isObject()) {
		for (const auto& name : events.getMemberNames())
			CopyRows(events[name], name, tables.events[name]);
	}

	CopyRows(root["players"], "players", tables.players);
	CopyRows(root["player_snapshots"], "player_snapshots", tables.playerSnapshots);

	out = std::move(tables);
	return true;
}

bool ParseDemoEventsText(std::string_view text, DemoEventTables& out, std::string& error) {
	Json::CharReaderBuilder builder;
	const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

	Json::Value root;
	std::string errs;
	if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
		error = "JSON parsing failed: " + errs;
		return false;
	}

	return ParseDemoEvents(root, out, error);
}

bool LoadDemoEvents(const std::filesystem::path& path, DemoEventTables& out, std::string& error) {
	try {
		std::ifstream file(path, std::ifstream::binary);
		if (!file.is_open()) {
			error = "failed to open event dump '" + path.string() + "'";
			return false;
		}

		Json::Value root;
		Json::CharReaderBuilder builder;
		std::string errs;
		if (!Json::parseFromStream(builder, file, &root, &errs)) {
			error = "JSON parsing failed for '" + path.string() + "': " + errs;
			return false;
		}

		if (!ParseDemoEvents(root, out, error)) {
			error = path.string() + ": " + error;
			return false;
		}

		if (out.header.demoFile.empty())
			out.header.demoFile = path.filename().string();

		Logf(LogLevel::Debug, "loaded event dump '{}' ({} event tables)", path.string(), out.events.size());
		return true;
	}
	catch (const std::exception& e) {
		error = "exception while reading event dump '" + path.string() + "': " + e.what();
	}

	return false;
}

} // namespace roundstat::ingest
