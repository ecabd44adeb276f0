/* locate_command.hpp - one lookup from request to exit status.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "config_manager.hpp"
#include "epub_locator.hpp"
#include <optional>
#include <string>
#include <wx/string.h>

// What the command line asked for. Empty overrides defer to the configuration.
struct locate_request {
	wxString archive_path;
	wxString query;
	wxString dialect_override;
	bool json_output{false};
};

[[nodiscard]] std::optional<locate_options> build_options(const locate_request& request, const config_manager& config);
[[nodiscard]] bool use_json(const locate_request& request, const config_manager& config);

// Runs the lookup and renders the result, or the error record in JSON mode,
// into output. Returns the process exit status.
[[nodiscard]] int run_locate(const locate_request& request, const config_manager& config, std::string& output);
