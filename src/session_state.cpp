/* session_state.cpp - persisted reading session.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "session_state.hpp"
#include "constants.hpp"
#include <optional>
#include <wx/fileconf.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/wfstream.h>

namespace {
const wxString OFFSETS_GROUP = "/offsets";

int read_required_int(const wxFileConfig& cfg, const wxString& key, const wxString& path) {
	long value{0};
	if (!cfg.Read(key, &value)) {
		throw session_error(wxString::Format(_("Session file has no valid '%s' entry"), key), path);
	}
	return static_cast<int>(value);
}
} // namespace

wxString get_session_path(const wxString& document_path) {
	const wxFileName document{document_path};
	return wxFileName(document.GetPath(), "." + document.GetFullName() + SESSION_FILE_SUFFIX).GetFullPath();
}

std::optional<session_state> load_session(const wxString& document_path) {
	const wxString path = get_session_path(document_path);
	if (!wxFileName::FileExists(path)) {
		wxLogVerbose("No session file at %s", path);
		return std::nullopt;
	}
	wxFileInputStream in(path);
	if (!in.IsOk()) {
		throw session_error(_("Failed to open session file"), path);
	}
	wxFileConfig cfg(in);
	session_state state;
	state.page = read_required_int(cfg, "page", path);
	state.width = read_required_int(cfg, "width", path);
	if (cfg.HasGroup(OFFSETS_GROUP)) {
		cfg.SetPath(OFFSETS_GROUP);
		wxString key;
		long cookie{0};
		bool has_entry = cfg.GetFirstEntry(key, cookie);
		while (has_entry) {
			long chapter{0};
			long offset{0};
			if (!key.ToLong(&chapter) || !cfg.Read(key, &offset)) {
				throw session_error(wxString::Format(_("Invalid offset entry '%s'"), key), path);
			}
			if (offset > 0) {
				state.offsets[static_cast<int>(chapter)] = static_cast<int>(offset);
			}
			has_entry = cfg.GetNextEntry(key, cookie);
		}
		cfg.SetPath("/");
	}
	wxLogVerbose("Loaded session from %s: page %d, width %d, %zu offsets", path, state.page, state.width, state.offsets.size());
	return state;
}

void save_session(const wxString& document_path, const session_state& state) {
	const wxString path = get_session_path(document_path);
	wxFileConfig cfg(wxEmptyString, wxEmptyString, wxEmptyString, wxEmptyString, 0);
	cfg.Write("version", SESSION_FORMAT_VERSION);
	cfg.Write("page", state.page);
	cfg.Write("width", state.width);
	cfg.SetPath(OFFSETS_GROUP);
	for (const auto& [chapter, offset] : state.offsets) {
		if (offset > 0) {
			cfg.Write(wxString::Format("%d", chapter), offset);
		}
	}
	cfg.SetPath("/");
	wxFileOutputStream out(path);
	if (!out.IsOk() || !cfg.Save(out) || !out.Close()) {
		throw session_error(_("Failed to write session file"), path);
	}
	wxLogVerbose("Saved session to %s", path);
}
