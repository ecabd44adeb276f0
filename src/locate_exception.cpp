/* locate_exception.cpp - error code names.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "locate_exception.hpp"

const char* error_code_name(locate_error_code code) noexcept {
	switch (code) {
		case locate_error_code::staging_failure:
			return "staging_failure";
		case locate_error_code::missing_container:
			return "missing_container";
		case locate_error_code::malformed_container:
			return "malformed_container";
		case locate_error_code::malformed_package:
			return "malformed_package";
		case locate_error_code::unresolved_spine_item:
			return "unresolved_spine_item";
		case locate_error_code::document_unreadable:
			return "document_unreadable";
		case locate_error_code::invalid_query:
			return "invalid_query";
	}
	return "unknown";
}
