/* staging_area.hpp - scoped extraction of an EPUB container.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <Poco/TemporaryFile.h>
#include <cstddef>
#include <wx/string.h>

// Extracts every entry of a zip archive into a fresh temporary directory.
// The directory and everything in it is removed when the object is destroyed.
class staging_area {
public:
	explicit staging_area(const wxString& archive_path, const wxString& parent_dir = wxEmptyString);
	~staging_area() = default;
	staging_area(const staging_area&) = delete;
	staging_area& operator=(const staging_area&) = delete;
	staging_area(staging_area&&) = delete;
	staging_area& operator=(staging_area&&) = delete;

	[[nodiscard]] wxString root() const;

	[[nodiscard]] size_t entry_count() const noexcept {
		return entries;
	}

private:
	Poco::TemporaryFile directory;
	size_t entries{0};

	void extract(const wxString& archive_path);
};
