/* config_manager_test.cpp - tests for INI backed settings.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "epub_builder.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <string>

TEST(config_manager, writes_defaults_on_initialize) {
	temp_dir dir;
	const wxString path = wxString::FromUTF8(dir.file("spinepoint.ini"));
	{
		config_manager config;
		ASSERT_TRUE(config.initialize(path));
		EXPECT_EQ(config.get_path(), path);
		EXPECT_FALSE(config.get(config_manager::verbose));
		EXPECT_EQ(config.get(config_manager::output_format), "text");
		EXPECT_EQ(config.get(config_manager::document_dialect), "auto");
		EXPECT_TRUE(config.get(config_manager::staging_directory).IsEmpty());
	}
	std::string content;
	ASSERT_TRUE(read_file(path, content));
	EXPECT_NE(content.find("[app]"), std::string::npos);
	EXPECT_NE(content.find("document_dialect=auto"), std::string::npos);
}

TEST(config_manager, keeps_existing_values) {
	temp_dir dir;
	dir.write("custom.ini", "[app]\noutput_format=json\nverbose=1\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(wxString::FromUTF8(dir.file("custom.ini"))));
	EXPECT_EQ(config.get(config_manager::output_format), "json");
	EXPECT_TRUE(config.get(config_manager::verbose));
	EXPECT_EQ(config.get(config_manager::document_dialect), "auto");
}

TEST(config_manager, persists_changes) {
	temp_dir dir;
	const wxString path = wxString::FromUTF8(dir.file("spinepoint.ini"));
	{
		config_manager config;
		ASSERT_TRUE(config.initialize(path));
		config.set(config_manager::document_dialect, wxString("html"));
	}
	config_manager reopened;
	ASSERT_TRUE(reopened.initialize(path));
	EXPECT_EQ(reopened.get(config_manager::document_dialect), "html");
}

TEST(config_manager, uninitialized_returns_defaults) {
	const config_manager config;
	EXPECT_FALSE(config.is_initialized());
	EXPECT_EQ(config.get(config_manager::output_format), "text");
}
