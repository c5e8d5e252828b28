/* app.cpp - wxApp implementation code.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "command_line.hpp"
#include "constants.hpp"
#include "document.hpp"
#include "epub_document.hpp"
#include "session_state.hpp"
#include <memory>
#include <optional>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/msgout.h>
#include <wx/translation.h>

bool app::OnInit() {
	if (!wxApp::OnInit()) {
		return false;
	}
	if (!config_mgr.initialize()) {
		wxMessageBox(_("Failed to initialize configuration"), _("Error"), wxICON_ERROR);
		return false;
	}
	if (verbose || config_mgr.get(config_manager::verbose_logging)) {
		wxLog::SetVerbose(true);
	}
	wxFileName file_path{document_arg};
	file_path.Normalize(wxPATH_NORM_ABSOLUTE);
	const wxString path = file_path.GetFullPath();
	if (!wxFileName::FileExists(path)) {
		wxLogError("File not found: %s", path);
		wxMessageBox(wxString::Format(_("File not found: %s"), path), _("Error"), wxICON_ERROR);
		return false;
	}
	return open_book(path);
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxApp::OnExit();
}

void app::OnInitCmdLine(wxCmdLineParser& parser) {
	describe_command_line(parser);
}

bool app::OnCmdLineParsed(wxCmdLineParser& parser) {
	verbose = parser.Found("verbose");
	document_arg = parser.GetParam(0);
	return true;
}

bool app::open_book(const wxString& path) {
	bool opened = false;
	try {
		const auto document = std::make_unique<epub_document>(path);
		std::optional<session_state> session;
		if (config_mgr.get(config_manager::restore_session)) {
			session = load_session(path);
		}
		frame = new main_window(path);
		frame->open_book(*document, session);
		opened = true;
	} catch (const parser_exception& e) {
		wxLogError("%s", e.get_display_message());
		wxMessageBox(e.get_display_message(), _("Failed to open book"), wxICON_ERROR);
	} catch (const session_error& e) {
		wxLogError("%s", e.get_display_message());
		wxMessageBox(e.get_display_message(), _("Failed to restore session"), wxICON_ERROR);
	}
	if (!opened) {
		if (frame != nullptr) {
			frame->Destroy();
			frame = nullptr;
		}
		return false;
	}
	frame->Show(true);
	return true;
}

wxIMPLEMENT_APP_NO_MAIN(app);

int main(int argc, char** argv) {
	wxMessageOutputStderr output;
	if (const auto exit_code = check_command_line(argc, argv, output)) {
		return *exit_code;
	}
	return wxEntry(argc, argv) == 0 ? 0 : EXIT_RUNTIME_FAILURE;
}
