/* html_to_text.hpp - HTML to plain text converter header.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <lexbor/html/html.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Flattens an XHTML chapter into lines of plain text. Block elements become
// paragraphs separated by one empty line; <br> and list items start a new line.
class html_to_text {
public:
	html_to_text();
	~html_to_text() = default;
	html_to_text(const html_to_text&) = delete;
	html_to_text& operator=(const html_to_text&) = delete;
	html_to_text(html_to_text&&) = default;
	html_to_text& operator=(html_to_text&&) = default;
	[[nodiscard]] bool convert(std::string_view html);
	[[nodiscard]] const std::vector<std::string>& get_lines() const noexcept {
		return lines;
	}
	[[nodiscard]] std::string get_text() const;
	void clear() noexcept;

private:
	enum class pending_break {
		none,
		line,
		paragraph,
	};

	struct document_deleter {
		void operator()(lxb_html_document_t* document) const noexcept {
			lxb_html_document_destroy(document);
		}
	};

	std::unique_ptr<lxb_html_document_t, document_deleter> doc;
	std::vector<std::string> lines;
	std::string line;
	pending_break next_break{pending_break::none};
	int pre_depth{0};

	void walk(lxb_dom_node_t* node, bool in_body);
	void append_text(std::string_view text);
	void request_break(pending_break kind);
	void apply_pending_break();
	void end_line();
	[[nodiscard]] static std::string_view tag_of(lxb_dom_node_t* node) noexcept;
	[[nodiscard]] static std::string text_of(lxb_dom_node_t* node);
};
