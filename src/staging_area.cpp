/* staging_area.cpp - zip extraction into a self-deleting directory.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "staging_area.hpp"
#include "locate_exception.hpp"
#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/Path.h>
#include <memory>
#include <string>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
std::string temp_parent(const wxString& parent_dir) {
	return parent_dir.IsEmpty() ? Poco::Path::temp() : parent_dir.utf8_string();
}

bool is_inside(const wxFileName& target, const wxString& root) {
	const wxString full = target.GetFullPath();
	return full.StartsWith(root) && full.length() > root.length();
}
} // namespace

staging_area::staging_area(const wxString& archive_path, const wxString& parent_dir) : directory(temp_parent(parent_dir)) {
	const Poco::File parent(temp_parent(parent_dir));
	try {
		if (!parent.exists() || !parent.isDirectory()) {
			throw locate_exception(locate_error_code::staging_failure, "Staging parent directory does not exist", wxString::FromUTF8(parent.path()));
		}
		directory.createDirectory();
	} catch (const Poco::Exception& e) {
		throw locate_exception(locate_error_code::staging_failure, "Failed to create staging directory", wxString::FromUTF8(directory.path()), wxString::FromUTF8(e.displayText()));
	}
	extract(archive_path);
	wxLogVerbose("Extracted %zu entries from %s into %s", entries, archive_path, root());
}

wxString staging_area::root() const {
	return wxString::FromUTF8(directory.path());
}

void staging_area::extract(const wxString& archive_path) {
	if (!wxFileExists(archive_path)) {
		throw locate_exception(locate_error_code::staging_failure, "Archive not found", archive_path);
	}
	wxFileInputStream file_stream(archive_path);
	if (!file_stream.IsOk()) {
		throw locate_exception(locate_error_code::staging_failure, "Failed to open archive", archive_path);
	}
	wxZipInputStream zip(file_stream);
	if (!zip.IsOk()) {
		throw locate_exception(locate_error_code::staging_failure, "Archive is not a readable zip container", archive_path);
	}
	wxFileName root_dir = wxFileName::DirName(root());
	root_dir.Normalize(wxPATH_NORM_DOTS | wxPATH_NORM_ABSOLUTE);
	const wxString root_path = root_dir.GetPath(wxPATH_GET_VOLUME | wxPATH_GET_SEPARATOR);
	std::unique_ptr<wxZipEntry> entry;
	while (entry.reset(zip.GetNextEntry()), entry != nullptr) {
		const wxString name = entry->GetName(wxPATH_UNIX);
		wxFileName target = entry->IsDir() ? wxFileName::DirName(root_path + name, wxPATH_UNIX) : wxFileName(root_path + name, wxPATH_UNIX);
		target.Normalize(wxPATH_NORM_DOTS | wxPATH_NORM_ABSOLUTE);
		if (!is_inside(target, root_path)) {
			throw locate_exception(locate_error_code::staging_failure, "Archive entry escapes the staging directory", archive_path, name);
		}
		if (entry->IsDir()) {
			if (!wxFileName::Mkdir(target.GetFullPath(), wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
				throw locate_exception(locate_error_code::staging_failure, "Failed to create directory", archive_path, name);
			}
			continue;
		}
		if (!wxFileName::Mkdir(target.GetPath(), wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
			throw locate_exception(locate_error_code::staging_failure, "Failed to create directory", archive_path, name);
		}
		wxFileOutputStream out(target.GetFullPath());
		if (!out.IsOk()) {
			throw locate_exception(locate_error_code::staging_failure, "Failed to write extracted entry", archive_path, name);
		}
		out.Write(zip);
		if (zip.GetLastError() == wxSTREAM_READ_ERROR || !out.Close()) {
			throw locate_exception(locate_error_code::staging_failure, "Corrupt archive entry", archive_path, name);
		}
		++entries;
	}
	if (zip.GetLastError() != wxSTREAM_EOF) {
		throw locate_exception(locate_error_code::staging_failure, "Archive is corrupt or truncated", archive_path);
	}
}
