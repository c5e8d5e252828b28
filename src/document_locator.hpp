/* document_locator.hpp - url lookup over a step-only spine cursor.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>
#include <string_view>

class spine_cursor {
public:
	virtual ~spine_cursor() = default;
	[[nodiscard]] virtual std::string current_url() const = 0;
	[[nodiscard]] virtual bool is_first() const = 0;
	[[nodiscard]] virtual bool is_last() const = 0;
	virtual bool next() = 0;
	virtual bool previous() = 0;
};

// Parks the cursor on url and returns true, scanning backward first and then forward.
// When url is not in the spine the cursor is put back where it started and false is returned.
// Throws parser_exception if the cursor refuses a step in the middle of a scan.
[[nodiscard]] bool locate_url(spine_cursor& cursor, std::string_view url);
