/* document_locator.cpp - url lookup over a step-only spine cursor.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "document_locator.hpp"
#include "document.hpp"
#include <string>
#include <string_view>
#include <wx/log.h>
#include <wx/string.h>

namespace {
void step(spine_cursor& cursor, bool forward) {
	if (!(forward ? cursor.next() : cursor.previous())) {
		throw parser_exception(wxString::Format("Spine cursor failed to move %s from %s", forward ? "forward" : "backward", wxString::FromUTF8(cursor.current_url())));
	}
}
} // namespace

bool locate_url(spine_cursor& cursor, std::string_view url) {
	// Net displacement from the starting position, used to walk back on failure.
	long displacement = 0;
	while (true) {
		if (cursor.current_url() == url) {
			return true;
		}
		if (cursor.is_first()) {
			break;
		}
		step(cursor, false);
		--displacement;
	}
	while (!cursor.is_last()) {
		step(cursor, true);
		++displacement;
		if (cursor.current_url() == url) {
			return true;
		}
	}
	wxLogVerbose("Spine has no entry for %s", wxString::FromUTF8(url.data(), url.size()));
	for (; displacement > 0; --displacement) {
		step(cursor, false);
	}
	for (; displacement < 0; ++displacement) {
		step(cursor, true);
	}
	return false;
}
