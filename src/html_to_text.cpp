/* html_to_text.cpp - HTML to plain text converter implementation.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "html_to_text.hpp"
#include "utils.hpp"
#include <algorithm>
#include <array>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/dom/interfaces/node.h>
#include <lexbor/html/parser.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {
constexpr std::array<std::string_view, 31> paragraph_tags = {
	"address",
	"article",
	"aside",
	"blockquote",
	"dd",
	"div",
	"dl",
	"dt",
	"figcaption",
	"figure",
	"footer",
	"h1",
	"h2",
	"h3",
	"h4",
	"h5",
	"h6",
	"header",
	"hr",
	"main",
	"nav",
	"ol",
	"p",
	"pre",
	"section",
	"table",
	"tbody",
	"tfoot",
	"thead",
	"ul",
	"td",
};

constexpr std::array<std::string_view, 4> hidden_tags = {"head", "script", "style", "template"};

template <size_t N>
bool one_of(const std::array<std::string_view, N>& tags, std::string_view tag) {
	return std::ranges::find(tags, tag) != tags.end();
}
} // namespace

html_to_text::html_to_text() : doc{lxb_html_document_create()} {
	if (doc == nullptr) {
		throw std::runtime_error("lexbor could not allocate a document");
	}
}

bool html_to_text::convert(std::string_view html) {
	clear();
	lxb_html_document_clean(doc.get());
	if (lxb_html_document_parse(doc.get(), reinterpret_cast<const lxb_char_t*>(html.data()), html.size()) != LXB_STATUS_OK) {
		return false;
	}
	walk(lxb_dom_interface_node(doc.get()), false);
	end_line();
	while (!lines.empty() && lines.back().empty()) {
		lines.pop_back();
	}
	return true;
}

std::string html_to_text::get_text() const {
	std::string text;
	for (const auto& l : lines) {
		text += l;
		text += '\n';
	}
	return text;
}

void html_to_text::clear() noexcept {
	lines.clear();
	line.clear();
	next_break = pending_break::none;
	pre_depth = 0;
}

void html_to_text::walk(lxb_dom_node_t* node, bool in_body) {
	if (node->type == LXB_DOM_NODE_TYPE_TEXT) {
		if (in_body) {
			append_text(text_of(node));
		}
		return;
	}
	const std::string_view tag = tag_of(node);
	if (one_of(hidden_tags, tag)) {
		return;
	}
	if (tag == "body") {
		in_body = true;
	}
	const bool paragraph = one_of(paragraph_tags, tag);
	if (paragraph) {
		request_break(pending_break::paragraph);
	} else if (tag == "li" || tag == "tr") {
		request_break(pending_break::line);
	}
	if (tag == "pre") {
		++pre_depth;
	}
	for (auto* child = node->first_child; child != nullptr; child = child->next) {
		walk(child, in_body);
	}
	if (tag == "pre") {
		if (!line.empty()) {
			end_line();
		}
		--pre_depth;
	}
	if (tag == "br") {
		apply_pending_break();
		// A second break in a row leaves an empty line.
		if (line.empty() && pre_depth == 0 && !lines.empty()) {
			lines.emplace_back();
		} else {
			end_line();
		}
	} else if (paragraph) {
		request_break(pending_break::paragraph);
	} else if (tag == "li" || tag == "tr") {
		request_break(pending_break::line);
	}
}

void html_to_text::append_text(std::string_view text) {
	const std::string cleaned = remove_soft_hyphens(text);
	if (pre_depth > 0) {
		apply_pending_break();
		size_t start = 0;
		for (size_t nl = cleaned.find('\n'); nl != std::string::npos; nl = cleaned.find('\n', start)) {
			line += cleaned.substr(start, nl - start);
			end_line();
			start = nl + 1;
		}
		line += cleaned.substr(start);
		return;
	}
	std::string collapsed = collapse_whitespace(cleaned);
	if (collapsed.empty() || collapsed == " ") {
		if (!collapsed.empty() && !line.empty() && line.back() != ' ') {
			line += ' ';
		}
		return;
	}
	apply_pending_break();
	if (line.empty() && collapsed.front() == ' ') {
		collapsed.erase(0, 1);
	}
	line += collapsed;
}

void html_to_text::apply_pending_break() {
	if (next_break == pending_break::none) {
		return;
	}
	if (!line.empty()) {
		end_line();
	}
	if (next_break == pending_break::paragraph && !lines.empty() && !lines.back().empty()) {
		lines.emplace_back();
	}
	next_break = pending_break::none;
}

void html_to_text::request_break(pending_break kind) {
	if (kind > next_break) {
		next_break = kind;
	}
}

void html_to_text::end_line() {
	if (pre_depth == 0) {
		line = trim_string(line);
	}
	if (!line.empty() || pre_depth > 0) {
		lines.push_back(std::move(line));
	}
	line.clear();
}

std::string_view html_to_text::tag_of(lxb_dom_node_t* node) noexcept {
	if (node->type != LXB_DOM_NODE_TYPE_ELEMENT) {
		return {};
	}
	size_t len{0};
	const auto* name = lxb_dom_element_local_name(lxb_dom_interface_element(node), &len);
	return name != nullptr ? std::string_view{reinterpret_cast<const char*>(name), len} : std::string_view{};
}

std::string html_to_text::text_of(lxb_dom_node_t* node) {
	size_t len{0};
	const auto* text = lxb_dom_node_text_content(node, &len);
	if (text == nullptr || len == 0) {
		return {};
	}
	return {reinterpret_cast<const char*>(text), len};
}
