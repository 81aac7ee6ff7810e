#pragma once
#include <string>
#include <string_view>
#include "delim_scanner/dsv_config.hpp"
#include "delim_scanner/record_view.hpp"

namespace ds {

struct ParsePolicy;

// Appends `s` as a quoted JSON string.
void json_escape(std::string& out, std::string_view s);

// One record as a JSON line (no trailing newline). With a header the record
// is an object keyed by column name (surplus fields get "_<index>" keys),
// otherwise an array. A non-null policy emits numbers, bools and nulls
// unquoted.
std::string record_to_json(const RecordView& rv, const ParsePolicy* policy = nullptr);

// {"error":{"line":..,"column":..,"state":..,"offset":..,"input":..,"span":..}}
std::string error_to_json(const ErrorInfo& e);

}
