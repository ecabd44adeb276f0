/* epub_builder.hpp - helpers for building test publications.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <Poco/TemporaryFile.h>
#include <string>
#include <utility>
#include <vector>
#include <wx/log.h>
#include <wx/string.h>

class temp_dir {
public:
	temp_dir();
	~temp_dir() = default;
	temp_dir(const temp_dir&) = delete;
	temp_dir& operator=(const temp_dir&) = delete;

	[[nodiscard]] std::string path() const;
	[[nodiscard]] std::string file(const std::string& relative) const;
	[[nodiscard]] std::vector<std::string> list() const;
	void write(const std::string& relative, const std::string& content) const;

private:
	Poco::TemporaryFile dir;
};

class epub_builder {
public:
	epub_builder& add(const std::string& name, const std::string& content);
	epub_builder& container(const std::string& package_path);
	void write(const std::string& path) const;

private:
	std::vector<std::pair<std::string, std::string>> entries;
};

// Collects log output for the lifetime of the object.
class log_capture {
public:
	log_capture();
	~log_capture();
	log_capture(const log_capture&) = delete;
	log_capture& operator=(const log_capture&) = delete;

	[[nodiscard]] wxString text() const;

private:
	wxLogBuffer buffer;
	wxLog* previous;
};

[[nodiscard]] std::string container_xml(const std::string& package_path);
[[nodiscard]] std::string package_opf(const std::vector<std::pair<std::string, std::string>>& manifest, const std::vector<std::string>& spine);
[[nodiscard]] std::string xhtml(const std::string& body);
