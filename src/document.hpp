/* document.hpp - document source interface.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <wx/string.h>

enum class error_severity {
	error,
	warning
};

class parser_exception : public std::runtime_error {
public:
	parser_exception(const wxString& msg, error_severity sev = error_severity::error) : std::runtime_error(msg.ToStdString()), message{msg}, severity{sev} {
	}
	parser_exception(const wxString& msg, const wxString& fp, error_severity sev = error_severity::error) : std::runtime_error(msg.ToStdString()), message{msg}, file_path{fp}, severity{sev} {
	}

	[[nodiscard]] error_severity get_severity() const noexcept {
		return severity;
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] wxString get_display_message() const {
		if (file_path.IsEmpty()) {
			return message;
		}
		return wxString::Format("%s: %s", file_path, message);
	}

private:
	wxString message;
	wxString file_path;
	error_severity severity;
};

struct toc_entry {
	wxString name;
	std::string url;
};

// Read-only view of an opened book. Chapter lookups may move internal state, hence non-const.
class document_source {
public:
	virtual ~document_source() = default;
	[[nodiscard]] virtual wxString title() const = 0;
	// Empty when the book does not name one.
	[[nodiscard]] virtual wxString author() const = 0;
	[[nodiscard]] virtual const std::vector<toc_entry>& table_of_contents() const = 0;
	[[nodiscard]] virtual wxString chapter_content(const std::string& url) = 0;
};
