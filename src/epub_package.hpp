/* epub_package.hpp - container, package descriptor and spine resolution.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "markup_tree.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <wx/string.h>

struct manifest_item {
	std::string href;
	std::string media_type;
};

// Position of <spine> among the package element's direct children.
struct spine_xml_position {
	int ordinal{-1};
	size_t total{0};
};

struct package_document {
	std::string path;
	std::string base_dir;
	std::map<std::string, manifest_item> manifest;
	std::vector<std::string> spine;
	spine_xml_position spine_position;
};

struct spine_document {
	std::string id;
	std::string path;
	std::string media_type;
};

[[nodiscard]] std::string join_path(const std::string& base_dir, const std::string& relative);
// True when path names an entry below root_dir. Both must already be normalized.
[[nodiscard]] bool is_within(const std::string& path, const std::string& root_dir);
[[nodiscard]] std::string resolve_package_path(const wxString& staging_root);
[[nodiscard]] package_document parse_package(const std::string& package_path);
[[nodiscard]] package_document parse_package_content(const std::string& content, const std::string& package_path);
[[nodiscard]] spine_xml_position find_spine_position(const markup_tree& tree);
[[nodiscard]] std::vector<spine_document> resolve_spine(const package_document& package, const std::string& root_dir);
