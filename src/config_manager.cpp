/* config_manager.cpp - manages reading and writing of the application settings.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>

namespace {
constexpr int CONFIG_VERSION_CURRENT = 1;
}

config_manager::~config_manager() {
	shutdown();
}

bool config_manager::initialize(const wxString& path) {
	const wxString config_path = path.IsEmpty() ? get_config_path() : path;
	config = std::make_unique<wxFileConfig>(APP_NAME, wxEmptyString, config_path, wxEmptyString, wxCONFIG_USE_LOCAL_FILE);
	wxLogVerbose("Reading settings from %s", config_path);
	write_missing_defaults();
	return true;
}

void config_manager::flush() {
	if (config && !config->Flush()) {
		wxLogWarning("Could not write settings file");
	}
}

void config_manager::shutdown() {
	flush();
	config.reset();
}

// Next to the executable for portable installs, otherwise the per-user data directory.
wxString config_manager::get_config_path() {
	const wxString file_name = APP_NAME + ".ini";
	const wxFileName exe_dir(wxStandardPaths::Get().GetExecutablePath());
	if (wxFileName::IsDirWritable(exe_dir.GetPath())) {
		return wxFileName(exe_dir.GetPath(), file_name).GetFullPath();
	}
	const wxString data_dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(data_dir) && !wxFileName::Mkdir(data_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL)) {
		wxLogWarning("Could not create %s", data_dir);
	}
	return wxFileName(data_dir, file_name).GetFullPath();
}

void config_manager::write_missing_defaults() {
	const auto fill = [this](const auto& setting) {
		const wxConfigPathChanger section(config.get(), section_key(setting.key));
		if (!config->HasEntry(setting.key)) {
			config->Write(setting.key, setting.default_value);
		}
	};
	fill(restore_session);
	fill(save_session);
	fill(jump_scroll_lines);
	fill(verbose_logging);
	if (get(config_version) != CONFIG_VERSION_CURRENT) {
		set(config_version, CONFIG_VERSION_CURRENT);
	}
}
