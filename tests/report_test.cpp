/* report_test.cpp - tests for result presentation.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "report.hpp"
#include <gtest/gtest.h>
#include <string>

namespace {
locate_result sample_result() {
	locate_result result;
	result.archive_path = "book.epub";
	result.package_path = "OEBPS/content.opf";
	result.spine_position = {3, 3};
	structural_address address;
	address.spine_index = 2;
	address.spine_total = 2;
	address.matched_file = "OEBPS/ch2.xhtml";
	address.element_path = {{"[document]", 1}, {"html", 1}, {"body", 1}, {"div", 1}, {"p", 2}};
	address.index_path = {1, 1, 1, 2};
	address.match_start = 6;
	address.match_end = 11;
	result.address = address;
	return result;
}
} // namespace

TEST(report, formats_paths) {
	EXPECT_EQ(format_element_path({{"html", 1}, {"body", 1}, {"p", 3}}), "html[1]/body[1]/p[3]");
	EXPECT_EQ(format_index_path({1, 3}), "1/3");
	EXPECT_EQ(format_element_path({}), "");
	EXPECT_EQ(format_index_path({}), "");
}

TEST(report, human_readable_match) {
	const std::string text = format_report(sample_result());
	EXPECT_NE(text.find("Matching file: OEBPS/ch2.xhtml\n"), std::string::npos);
	EXPECT_NE(text.find("Spine index: 3/2\n"), std::string::npos);
	EXPECT_NE(text.find("Spine entry: 2 of 2\n"), std::string::npos);
	EXPECT_NE(text.find("File index: 1/1/1/2\n"), std::string::npos);
	EXPECT_NE(text.find("Element path: [document][1]/html[1]/body[1]/div[1]/p[2]\n"), std::string::npos);
	EXPECT_NE(text.find("Match start: 6\n"), std::string::npos);
	EXPECT_NE(text.find("Match end: 11\n"), std::string::npos);
}

TEST(report, human_readable_not_found) {
	locate_result result = sample_result();
	result.address.reset();
	EXPECT_EQ(format_report(result), "Query not found.\n");
}

TEST(report, json_match) {
	const auto j = to_json(sample_result());
	EXPECT_EQ(j["package"], "OEBPS/content.opf");
	EXPECT_EQ(j["spine_xml_position"]["ordinal"], 3);
	EXPECT_EQ(j["address"]["spine_index"], 2);
	EXPECT_EQ(j["address"]["matched_file"], "OEBPS/ch2.xhtml");
	EXPECT_EQ(j["address"]["element_path"][4]["tag"], "p");
	EXPECT_EQ(j["address"]["element_path"][4]["ordinal"], 2);
	EXPECT_EQ(j["address"]["element_path"][0]["tag"], "[document]");
	EXPECT_EQ(j["address"]["index_path"], nlohmann::json({1, 1, 1, 2}));
	EXPECT_EQ(j["address"]["match_end"], 11);
}

TEST(report, json_not_found_and_error) {
	locate_result result = sample_result();
	result.address.reset();
	EXPECT_TRUE(to_json(result)["address"].is_null());
	const locate_exception error(locate_error_code::unresolved_spine_item, "Spine references an id missing from the manifest", "OEBPS/content.opf", "cX");
	const auto j = to_json(error);
	EXPECT_EQ(j["error"], "unresolved_spine_item");
	EXPECT_EQ(j["detail"], "cX");
	EXPECT_EQ(j["file"], "OEBPS/content.opf");
	EXPECT_EQ(error.get_display_message(), "OEBPS/content.opf: Spine references an id missing from the manifest (cX)");
}
