/* command_line.cpp - command line arguments shared by main() and the app.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "command_line.hpp"
#include "constants.hpp"
#include <wx/translation.h>

void describe_command_line(wxCmdLineParser& parser) {
	parser.SetLogo(wxString::Format("%s %s", APP_NAME, APP_VERSION));
	parser.AddSwitch("h", "help", _("Show this help message"), wxCMD_LINE_OPTION_HELP);
	parser.AddSwitch("v", "verbose", _("Log diagnostic messages"));
	parser.AddParam(_("book.epub"), wxCMD_LINE_VAL_STRING);
}

std::optional<int> check_command_line(int argc, char** argv, wxMessageOutput& output) {
	wxMessageOutput* const previous = wxMessageOutput::Set(&output);
	wxCmdLineParser parser(argc, argv);
	describe_command_line(parser);
	const int result = parser.Parse();
	wxMessageOutput::Set(previous);
	if (result < 0) {
		return 0;
	}
	if (result > 0) {
		return EXIT_USAGE;
	}
	return std::nullopt;
}
