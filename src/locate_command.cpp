/* locate_command.cpp - one lookup from request to exit status.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "locate_command.hpp"
#include "constants.hpp"
#include "locate_exception.hpp"
#include "report.hpp"
#include <exception>
#include <wx/log.h>

std::optional<locate_options> build_options(const locate_request& request, const config_manager& config) {
	const wxString dialect = request.dialect_override.IsEmpty() ? config.get(config_manager::document_dialect) : request.dialect_override;
	const auto parsed = parse_dialect(dialect.utf8_string());
	if (!parsed) {
		wxLogError("Unknown document dialect '%s'; expected auto, xml or html", dialect);
		return std::nullopt;
	}
	locate_options options;
	options.dialect = *parsed;
	options.staging_directory = config.get(config_manager::staging_directory);
	return options;
}

bool use_json(const locate_request& request, const config_manager& config) {
	if (request.json_output) {
		return true;
	}
	const wxString format = config.get(config_manager::output_format);
	if (format != "text" && format != "json") {
		wxLogWarning("Unknown output format '%s'; using text", format);
	}
	return format == "json";
}

int run_locate(const locate_request& request, const config_manager& config, std::string& output) {
	output.clear();
	const auto options = build_options(request, config);
	if (!options) {
		return EXIT_FAILURE_STATUS;
	}
	const bool json = use_json(request, config);
	try {
		const locate_result result = locate_in_epub(request.archive_path, request.query.utf8_string(), *options);
		output = json ? to_json(result).dump(2) + "\n" : format_report(result);
		return result.found() ? EXIT_MATCH_FOUND : EXIT_NOT_FOUND;
	} catch (const locate_exception& e) {
		if (json) {
			output = to_json(e).dump(2) + "\n";
		}
		wxLogError("%s", e.get_display_message());
	} catch (const std::exception& e) {
		wxLogError("%s", wxString::FromUTF8(e.what()));
	}
	return EXIT_FAILURE_STATUS;
}
