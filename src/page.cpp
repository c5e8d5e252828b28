/* page.cpp - chapter and table of contents pages.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "page.hpp"
#include "constants.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <variant>
#include <wx/string.h>

chapter::chapter(text_surface& surf, std::string url, int index, const wxString& text, const wxString& progress_label, update_queue queue_fn) : surface{surf}, url_{std::move(url)}, index_{index}, progress{progress_label}, queue{std::move(queue_fn)} {
	surface.set_text(text);
	surface.set_status(progress);
	surface.set_before_repaint([this] {
		queue([this] {
			update_progress();
		});
	});
}

void chapter::set_width(int width) {
	surface.set_width(width);
	last_seen_offset = -1;
}

int chapter::get_offset() const {
	return surface.get_scroll_offset();
}

void chapter::set_offset(int offset) {
	surface.scroll_to(std::max(offset, 0));
}

void chapter::update_progress() {
	const int offset = surface.get_scroll_offset();
	const int height = surface.get_visible_height();
	if (offset == last_seen_offset && height == last_seen_height) {
		return;
	}
	last_seen_offset = offset;
	last_seen_height = height;
	const int total = surface.get_total_line_count();
	if (total <= 0) {
		surface.set_status(progress);
		return;
	}
	const int last_visible = std::min(offset + height, total);
	surface.set_status(wxString::Format("%s - lines %d-%d/%d", progress, offset + 1, last_visible, total));
}

table_of_contents::table_of_contents(list_surface& lst, std::string url) : list{lst}, url_{std::move(url)} {
}

int table_of_contents::index() const noexcept {
	return TOC_INDEX;
}

void table_of_contents::set_width(int width) {
	list.set_width(width);
}

void table_of_contents::set_selected(int idx) {
	list.set_current_index(idx);
}

int table_of_contents::selected() const {
	return list.get_current_index();
}

void table_of_contents::select_previous() {
	const int current = list.get_current_index();
	if (current <= 0) {
		return;
	}
	list.set_current_index(current - 1);
}

void table_of_contents::select_next() {
	const int current = list.get_current_index();
	if (current + 1 >= list.get_item_count()) {
		return;
	}
	list.set_current_index(current + 1);
}

int page_index(const page& p) {
	return std::visit([](const auto* pg) { return pg->index(); }, p);
}

const std::string& page_url(const page& p) {
	return std::visit([](const auto* pg) -> const std::string& { return pg->url(); }, p);
}

void set_page_width(const page& p, int width) {
	std::visit([width](auto* pg) { pg->set_width(width); }, p);
}

wxString format_progress_label(const wxString& name, int index, int count) {
	const double percent = count > 0 ? 100.0 * index / count : 0.0;
	return wxString::Format("\"%s\" (%.2f%%)", wxString(name).Trim(false).Trim(true), percent);
}
