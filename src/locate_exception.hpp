/* locate_exception.hpp - error type shared by every locate stage.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <wx/string.h>

enum class locate_error_code {
	staging_failure,
	missing_container,
	malformed_container,
	malformed_package,
	unresolved_spine_item,
	document_unreadable,
	invalid_query,
};

class locate_exception : public std::runtime_error {
public:
	locate_exception(locate_error_code code, const wxString& msg) : std::runtime_error(msg.utf8_string()), message{msg}, error_code{code} {
	}
	locate_exception(locate_error_code code, const wxString& msg, const wxString& fp, const wxString& det = wxEmptyString) : std::runtime_error(msg.utf8_string()), message{msg}, file_path{fp}, detail{det}, error_code{code} {
	}

	[[nodiscard]] locate_error_code get_error_code() const noexcept {
		return error_code;
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	// Offending id or element name, if any.
	[[nodiscard]] const wxString& get_detail() const noexcept {
		return detail;
	}

	[[nodiscard]] wxString get_display_message() const {
		wxString result = file_path.IsEmpty() ? message : wxString::Format("%s: %s", file_path, message);
		if (!detail.IsEmpty()) {
			result += wxString::Format(" (%s)", detail);
		}
		return result;
	}

private:
	wxString message;
	wxString file_path;
	wxString detail;
	locate_error_code error_code;
};

[[nodiscard]] const char* error_code_name(locate_error_code code) noexcept;
