/* epub_locator.cpp - end-to-end locate pipeline.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_locator.hpp"
#include "locate_exception.hpp"
#include "staging_area.hpp"
#include <Poco/Path.h>
#include <string>
#include <wx/log.h>

namespace {
// Paths under the staging root are reported relative to the archive, since the root is deleted on return.
std::string archive_relative(const std::string& path, const wxString& staging_root) {
	Poco::Path root(staging_root.utf8_string());
	root.makeDirectory();
	const std::string prefix = root.toString();
	if (path.rfind(prefix, 0) == 0) {
		return Poco::Path(path.substr(prefix.size())).toString(Poco::Path::PATH_UNIX);
	}
	return path;
}
} // namespace

locate_result locate_in_epub(const wxString& archive_path, const std::string& query, const locate_options& options) {
	if (query.empty()) {
		throw locate_exception(locate_error_code::invalid_query, "Query must not be empty", archive_path);
	}
	const staging_area staging(archive_path, options.staging_directory);
	locate_result result;
	result.archive_path = archive_path.utf8_string();
	const std::string package_path = resolve_package_path(staging.root());
	const package_document package = parse_package(package_path);
	result.package_path = archive_relative(package_path, staging.root());
	result.spine_position = package.spine_position;
	const auto documents = resolve_spine(package, staging.root().utf8_string());
	wxLogVerbose("Searching %zu spine documents using the %s dialect", documents.size(), dialect_name(options.dialect));
	result.address = locate_text(documents, query, options.dialect);
	if (result.found()) {
		result.address->matched_file = archive_relative(result.address->matched_file, staging.root());
	} else {
		wxLogVerbose("Query not found in %s", archive_path);
	}
	return result;
}
