/* config_manager.cpp - INI backed settings.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include <wx/filename.h>
#include <wx/stdpaths.h>
#include <wx/string.h>

namespace {
inline bool read_config_value(wxFileConfig* cfg, const wxString& key, bool default_val) {
	return cfg->ReadBool(key, default_val);
}

inline wxString read_config_value(wxFileConfig* cfg, const wxString& key, const wxString& default_val) {
	return cfg->Read(key, default_val);
}
} // namespace

config_manager::~config_manager() {
	if (config) {
		shutdown();
	}
}

bool config_manager::initialize(const wxString& path) {
	config_path = path.IsEmpty() ? get_default_path() : path;
	config = std::make_unique<wxFileConfig>(APP_NAME, "", config_path, "", wxCONFIG_USE_LOCAL_FILE);
	if (!config) {
		return false;
	}
	load_defaults();
	return true;
}

void config_manager::shutdown() {
	if (!config) {
		return;
	}
	config->Flush();
	config.reset();
}

wxString config_manager::get_default_path() {
	const wxString appdata_dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(appdata_dir)) {
		wxFileName::Mkdir(appdata_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL);
	}
	return appdata_dir + wxFileName::GetPathSeparator() + APP_NAME.Lower() + ".ini";
}

void config_manager::load_defaults() {
	auto set_default_if_missing = [this](const auto& setting) {
		config->SetPath("/app");
		if (!config->HasEntry(setting.key)) {
			config->Write(setting.key, setting.default_value);
		}
		config->SetPath("/");
	};
	set_default_if_missing(verbose);
	set_default_if_missing(output_format);
	set_default_if_missing(document_dialect);
	set_default_if_missing(staging_directory);
}

template <typename T>
T config_manager::get_app_setting(const wxString& key, const T& default_value) const {
	if (!config) {
		return default_value;
	}
	config->SetPath("/app");
	const T result = read_config_value(config.get(), key, default_value);
	config->SetPath("/");
	return result;
}

template <typename T>
void config_manager::set_app_setting(const wxString& key, const T& value) {
	if (!config) {
		return;
	}
	config->SetPath("/app");
	config->Write(key, value);
	config->SetPath("/");
}

template bool config_manager::get_app_setting<bool>(const wxString&, const bool&) const;
template wxString config_manager::get_app_setting<wxString>(const wxString&, const wxString&) const;
template void config_manager::set_app_setting<bool>(const wxString&, const bool&);
template void config_manager::set_app_setting<wxString>(const wxString&, const wxString&);
