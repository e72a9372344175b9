// record_fields.hpp (Exported Record Layout)
// Stable field names and value encoding for every exported record. The JSON
// and CSV writers both walk these lists, so a column added here shows up in
// both outputs under the same name.

#pragma once

#include "../analysis/match_analyzer.hpp"

#include <json/json.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace roundstat::report {

using Field = std::pair<std::string_view, Json::Value>;
using FieldList = std::vector<Field>;

struct RecordCollection {
	std::string_view name;
	std::vector<FieldList> rows;
};

/*
=============
RoundTo

Rounds half away from zero to the given number of decimals.
=============
*/
double RoundTo(double value, int decimals);

FieldList MetadataFields(const match::MatchMetadata& metadata);
FieldList PlayerFields(const match::Player& player);
FieldList PlayerStatsFields(const match::PlayerMatchStats& stats);
FieldList RoundFields(const match::Round& round);
FieldList RoundStatsFields(const match::RoundStats& stats);
FieldList KillFields(const match::Kill& kill);
FieldList DamageFields(const match::Damage& damage);
FieldList GrenadeFields(const match::Grenade& grenade);
FieldList BombEventFields(const match::BombEvent& event);
FieldList EconomyFields(const match::EconomySnapshot& snapshot);
FieldList ClutchFields(const match::Clutch& clutch);

/*
=============
CollectRecords

Every row collection of an analysis, in export order, already encoded.
Metadata is not included; it is a single record.
=============
*/
std::vector<RecordCollection> CollectRecords(const analysis::MatchAnalysis& analysis);

/*
=============
FieldText

Plain text rendering of one encoded value; null renders empty.
=============
*/
std::string FieldText(const Json::Value& value);

} // namespace roundstat::report
