/* session_state.hpp - persisted reading session.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include <map>
#include <optional>
#include <stdexcept>
#include <wx/string.h>

struct session_state {
	int page{TOC_INDEX};
	// Chapter index to scroll offset. Only offsets greater than zero are kept.
	std::map<int, int> offsets;
	int width{DEFAULT_WIDTH};

	bool operator==(const session_state&) const = default;
};

class session_error : public std::runtime_error {
public:
	session_error(const wxString& msg, const wxString& fp) : std::runtime_error(msg.ToStdString()), message{msg}, file_path{fp} {
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	[[nodiscard]] wxString get_display_message() const {
		return wxString::Format("%s: %s", file_path, message);
	}

private:
	wxString message;
	wxString file_path;
};

// The session lives beside the book as a hidden file, e.g. dir/.book.epub.folio.ini.
[[nodiscard]] wxString get_session_path(const wxString& document_path);
// Returns nullopt when no session file exists. Throws session_error when one exists but can't be used.
[[nodiscard]] std::optional<session_state> load_session(const wxString& document_path);
// Throws session_error on failure.
void save_session(const wxString& document_path, const session_state& state);
