/* report.cpp - human-readable and JSON renderings of locate results.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "report.hpp"
#include <sstream>
#include <string>

std::string format_element_path(const std::vector<path_step>& path) {
	std::ostringstream oss;
	bool first = true;
	for (const auto& step : path) {
		if (!first) {
			oss << '/';
		}
		oss << step.tag_name << '[' << step.ordinal << ']';
		first = false;
	}
	return oss.str();
}

std::string format_index_path(const std::vector<size_t>& path) {
	std::ostringstream oss;
	bool first = true;
	for (const size_t ordinal : path) {
		if (!first) {
			oss << '/';
		}
		oss << ordinal;
		first = false;
	}
	return oss.str();
}

std::string format_report(const locate_result& result) {
	if (!result.found()) {
		return "Query not found.\n";
	}
	const auto& address = *result.address;
	std::ostringstream oss;
	oss << "Matching file: " << address.matched_file << '\n';
	oss << "Spine index: " << result.spine_position.ordinal << '/' << address.spine_index << '\n';
	oss << "Spine entry: " << address.spine_index << " of " << address.spine_total << '\n';
	oss << "File index: " << format_index_path(address.index_path) << '\n';
	oss << "Element path: " << format_element_path(address.element_path) << '\n';
	oss << "Match start: " << address.match_start << '\n';
	oss << "Match end: " << address.match_end << '\n';
	return oss.str();
}

nlohmann::json to_json(const locate_result& result) {
	nlohmann::json j;
	j["archive"] = result.archive_path;
	j["package"] = result.package_path;
	j["spine_xml_position"] = {{"ordinal", result.spine_position.ordinal}, {"total", result.spine_position.total}};
	if (!result.found()) {
		j["address"] = nullptr;
		return j;
	}
	const auto& address = *result.address;
	nlohmann::json element_path = nlohmann::json::array();
	for (const auto& step : address.element_path) {
		element_path.push_back({{"tag", step.tag_name}, {"ordinal", step.ordinal}});
	}
	j["address"] = {
		{"spine_index", address.spine_index},
		{"spine_total", address.spine_total},
		{"matched_file", address.matched_file},
		{"element_path", element_path},
		{"index_path", address.index_path},
		{"match_start", address.match_start},
		{"match_end", address.match_end},
	};
	return j;
}

nlohmann::json to_json(const locate_exception& error) {
	return {
		{"error", error_code_name(error.get_error_code())},
		{"message", error.get_message().utf8_string()},
		{"file", error.get_file_path().utf8_string()},
		{"detail", error.get_detail().utf8_string()},
	};
}
