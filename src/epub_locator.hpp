/* epub_locator.hpp - end-to-end locate pipeline.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "epub_package.hpp"
#include "text_locator.hpp"
#include <optional>
#include <string>
#include <wx/string.h>

struct locate_options {
	document_dialect dialect{document_dialect::automatic};
	wxString staging_directory;
};

struct locate_result {
	std::string archive_path;
	std::string package_path;
	spine_xml_position spine_position;
	std::optional<structural_address> address;

	[[nodiscard]] bool found() const noexcept {
		return address.has_value();
	}
};

// Stages the archive, recovers its reading order and searches it for query.
// Throws locate_exception on any structural or I/O failure; the staging
// directory is gone by the time this returns or throws.
[[nodiscard]] locate_result locate_in_epub(const wxString& archive_path, const std::string& query, const locate_options& options = {});
