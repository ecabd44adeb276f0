/* epub_builder.cpp - helpers for building test publications.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_builder.hpp"
#include <Poco/File.h>
#include <Poco/Path.h>
#include <fstream>
#include <stdexcept>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

temp_dir::temp_dir() {
	dir.createDirectories();
}

std::string temp_dir::path() const {
	return dir.path();
}

std::string temp_dir::file(const std::string& relative) const {
	Poco::Path result(dir.path());
	result.makeDirectory();
	result.resolve(Poco::Path(relative, Poco::Path::PATH_UNIX));
	return result.toString();
}

std::vector<std::string> temp_dir::list() const {
	std::vector<std::string> names;
	dir.list(names);
	return names;
}

void temp_dir::write(const std::string& relative, const std::string& content) const {
	const std::string full = file(relative);
	Poco::File(Poco::Path(full).parent()).createDirectories();
	std::ofstream out(full, std::ios::binary);
	if (!out) {
		throw std::runtime_error("Failed to write " + full);
	}
	out << content;
}

epub_builder& epub_builder::add(const std::string& name, const std::string& content) {
	entries.emplace_back(name, content);
	return *this;
}

epub_builder& epub_builder::container(const std::string& package_path) {
	return add("META-INF/container.xml", container_xml(package_path));
}

void epub_builder::write(const std::string& path) const {
	wxFileOutputStream out(wxString::FromUTF8(path));
	if (!out.IsOk()) {
		throw std::runtime_error("Failed to create " + path);
	}
	wxZipOutputStream zip(out);
	zip.PutNextEntry("mimetype");
	zip.Write("application/epub+zip", 20);
	for (const auto& [name, content] : entries) {
		zip.PutNextEntry(wxString::FromUTF8(name));
		zip.Write(content.data(), content.size());
	}
	if (!zip.Close() || !out.Close()) {
		throw std::runtime_error("Failed to finish " + path);
	}
}

log_capture::log_capture() : previous(wxLog::SetActiveTarget(&buffer)) {
}

log_capture::~log_capture() {
	wxLog::SetActiveTarget(previous);
}

wxString log_capture::text() const {
	return buffer.GetBuffer();
}

std::string container_xml(const std::string& package_path) {
	return "<?xml version=\"1.0\"?>\n"
		   "<container version=\"1.0\" xmlns=\"urn:oasis:names:tc:opendocument:xmlns:container\">\n"
		   "  <rootfiles>\n"
		   "    <rootfile full-path=\"" +
		package_path +
		"\" media-type=\"application/oebps-package+xml\"/>\n"
		"  </rootfiles>\n"
		"</container>\n";
}

std::string package_opf(const std::vector<std::pair<std::string, std::string>>& manifest, const std::vector<std::string>& spine) {
	std::string opf = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
					  "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\" unique-identifier=\"uid\">\n"
					  "  <metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\"><dc:title>Test</dc:title></metadata>\n"
					  "  <manifest>\n";
	for (const auto& [id, href] : manifest) {
		opf += "    <item id=\"" + id + "\" href=\"" + href + "\" media-type=\"application/xhtml+xml\"/>\n";
	}
	opf += "  </manifest>\n  <spine>\n";
	for (const auto& idref : spine) {
		opf += "    <itemref idref=\"" + idref + "\"/>\n";
	}
	opf += "  </spine>\n</package>\n";
	return opf;
}

std::string xhtml(const std::string& body) {
	return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
		   "<html xmlns=\"http://www.w3.org/1999/xhtml\">\n"
		   "<head><title>Chapter</title></head>\n"
		   "<body>" +
		body + "</body>\n</html>\n";
}
