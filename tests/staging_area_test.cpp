/* staging_area_test.cpp - tests for archive extraction and cleanup.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_builder.hpp"
#include "locate_exception.hpp"
#include "staging_area.hpp"
#include <Poco/File.h>
#include <gtest/gtest.h>
#include <string>
#include <wx/filefn.h>

namespace {
locate_error_code staging_error(const std::string& archive, const temp_dir& parent) {
	try {
		const staging_area staging(wxString::FromUTF8(archive), wxString::FromUTF8(parent.path()));
	} catch (const locate_exception& e) {
		return e.get_error_code();
	}
	ADD_FAILURE() << "expected staging to fail";
	return locate_error_code::invalid_query;
}
} // namespace

TEST(staging_area, extracts_entries_and_removes_them) {
	temp_dir work;
	temp_dir parent;
	const std::string archive = work.file("book.epub");
	epub_builder().container("OEBPS/content.opf").add("OEBPS/text/ch1.xhtml", "<p>hi</p>").write(archive);
	wxString root;
	{
		const staging_area staging(wxString::FromUTF8(archive), wxString::FromUTF8(parent.path()));
		root = staging.root();
		EXPECT_EQ(staging.entry_count(), 3u);
		EXPECT_TRUE(wxDirExists(root));
		EXPECT_TRUE(wxFileExists(root + "/META-INF/container.xml"));
		EXPECT_TRUE(wxFileExists(root + "/OEBPS/text/ch1.xhtml"));
		EXPECT_EQ(parent.list().size(), 1u);
	}
	EXPECT_FALSE(wxDirExists(root));
	EXPECT_TRUE(parent.list().empty());
}

TEST(staging_area, missing_archive) {
	temp_dir parent;
	EXPECT_EQ(staging_error(parent.file("absent.epub"), parent), locate_error_code::staging_failure);
	EXPECT_TRUE(parent.list().empty());
}

TEST(staging_area, not_a_zip_file) {
	temp_dir work;
	temp_dir parent;
	work.write("book.epub", "this is plain text, not a zip container");
	log_capture log;
	EXPECT_EQ(staging_error(work.file("book.epub"), parent), locate_error_code::staging_failure);
	EXPECT_TRUE(parent.list().empty());
}

TEST(staging_area, entry_escaping_root_is_rejected) {
	temp_dir work;
	temp_dir parent;
	const std::string archive = work.file("book.epub");
	epub_builder().container("content.opf").add("OEBPS/../../escaped.txt", "boom").write(archive);
	EXPECT_EQ(staging_error(archive, parent), locate_error_code::staging_failure);
	EXPECT_TRUE(parent.list().empty());
	EXPECT_FALSE(Poco::File(parent.file("escaped.txt")).exists());
}

TEST(staging_area, missing_parent_directory_is_not_created) {
	temp_dir work;
	const std::string archive = work.file("book.epub");
	epub_builder().container("OEBPS/content.opf").write(archive);
	const std::string missing = work.file("no/such/parent");
	try {
		const staging_area staging(wxString::FromUTF8(archive), wxString::FromUTF8(missing));
		FAIL() << "expected staging_failure";
	} catch (const locate_exception& e) {
		EXPECT_EQ(e.get_error_code(), locate_error_code::staging_failure);
		EXPECT_EQ(e.get_file_path(), wxString::FromUTF8(missing));
	}
	EXPECT_FALSE(Poco::File(work.file("no")).exists());
}
