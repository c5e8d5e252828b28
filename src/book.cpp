/* book.cpp - navigation engine over the pages of one book.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "book.hpp"
#include "constants.hpp"
#include "document.hpp"
#include "key_bindings.hpp"
#include "page.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

book::book(surface_host& surfaces, int scroll_stride) : host{surfaces}, jump_lines{scroll_stride} {
}

void book::load(document_source& doc, const std::optional<session_state>& session) {
	title = doc.title();
	author = doc.author();
	const auto& entries = doc.table_of_contents();
	if (entries.empty()) {
		throw parser_exception(_("The book has no table of contents"));
	}
	auto& list = host.add_toc_surface(TOC_URL);
	for (size_t i = 0; i < entries.size(); ++i) {
		list.add_item(entries[i].name, [this, idx = static_cast<int>(i)] {
			activate_toc_entry(idx);
		});
	}
	set_toc(std::make_unique<table_of_contents>(list, TOC_URL));
	// Saved offsets only make sense at the width they were saved at.
	if (session && session->width >= MIN_WIDTH) {
		width = session->width;
	}
	toc->set_width(width);
	const int count = static_cast<int>(entries.size());
	for (int i = 0; i < count; ++i) {
		const auto& entry = entries[static_cast<size_t>(i)];
		const wxString text = doc.chapter_content(entry.url);
		auto& surface = host.add_chapter_surface(entry.url);
		auto ch = std::make_unique<chapter>(surface, entry.url, i, text, format_progress_label(entry.name, i, count), [this](std::function<void()> fn) {
			host.queue_update(std::move(fn));
		});
		ch->set_width(width);
		if (session) {
			const auto it = session->offsets.find(i);
			if (it != session->offsets.end() && it->second > 0) {
				ch->set_offset(it->second);
			}
		}
		add_chapter(std::move(ch));
	}
	wxLogVerbose("Built %d chapters for \"%s\"", count, title);
	if (session) {
		load_state(*session);
	} else {
		go_to_page(TOC_INDEX);
	}
}

void book::set_toc(std::unique_ptr<table_of_contents> contents) {
	toc = std::move(contents);
	register_page(toc.get());
}

void book::add_chapter(std::unique_ptr<chapter> ch) {
	chapters.push_back(std::move(ch));
	register_page(chapters.back().get());
}

void book::register_page(const page& p) {
	const auto& url = page_url(p);
	if (pages_map.contains(url)) {
		throw parser_exception(wxString::Format(_("Page %s was added twice"), wxString::FromUTF8(url)));
	}
	pages.push_back(p);
	pages_map.emplace(url, p);
}

std::optional<page> book::find_page(const std::string& url) const {
	const auto it = pages_map.find(url);
	if (it == pages_map.end()) {
		return std::nullopt;
	}
	return it->second;
}

wxString book::heading() const {
	if (author.IsEmpty()) {
		return title;
	}
	return wxString::Format(_("%s by %s"), title, author);
}

std::string book::index_to_url(int idx) const {
	if (idx == TOC_INDEX) {
		return toc->url();
	}
	return chapters.at(static_cast<size_t>(idx))->url();
}

bool book::is_valid_page(int idx) const noexcept {
	return toc != nullptr && idx >= TOC_INDEX && idx < chapter_count();
}

void book::go_to_page(int idx) {
	if (!is_valid_page(idx)) {
		return;
	}
	const std::string url = index_to_url(idx);
	current = idx;
	if (idx != TOC_INDEX) {
		toc->set_selected(idx);
	}
	host.switch_to(url);
}

void book::activate_toc_entry(int idx) {
	go_to_page(idx);
}

void book::next_chapter() {
	if (current + 1 >= chapter_count()) {
		return;
	}
	go_to_page(current + 1);
}

void book::previous_chapter() {
	if (current - 1 < TOC_INDEX) {
		return;
	}
	go_to_page(current - 1);
}

void book::toggle_menu() {
	if (on_toc()) {
		go_to_page(menu_context);
		return;
	}
	menu_context = current;
	go_to_page(TOC_INDEX);
}

void book::menu_down() {
	if (!on_toc()) {
		return;
	}
	toc->select_next();
}

void book::menu_up() {
	if (!on_toc()) {
		return;
	}
	toc->select_previous();
}

void book::mark() {
	if (on_toc()) {
		return;
	}
	mark_chapter = current;
	mark_line = chapters[static_cast<size_t>(current)]->get_offset();
}

void book::jump_to_mark() {
	if (mark_chapter == NO_MARK || mark_line == NO_MARK) {
		return;
	}
	auto& marked = *chapters[static_cast<size_t>(mark_chapter)];
	if (marked.get_offset() != mark_line) {
		marked.set_offset(mark_line);
	}
	if (current != mark_chapter) {
		go_to_page(mark_chapter);
	}
}

void book::jump_scroll() {
	if (on_toc()) {
		return;
	}
	auto& ch = *chapters[static_cast<size_t>(current)];
	ch.set_offset(ch.get_offset() + jump_lines);
}

void book::set_width(int w) {
	if (w < MIN_WIDTH) {
		return;
	}
	width = w;
	for (const auto& p : pages) {
		set_page_width(p, w);
	}
}

void book::perform(book_action action) {
	switch (action) {
		case book_action::quit:
			host.quit();
			break;
		case book_action::next_chapter:
			next_chapter();
			break;
		case book_action::previous_chapter:
			previous_chapter();
			break;
		case book_action::toggle_menu:
			toggle_menu();
			break;
		case book_action::menu_down:
			menu_down();
			break;
		case book_action::menu_up:
			menu_up();
			break;
		case book_action::mark:
			mark();
			break;
		case book_action::jump_to_mark:
			jump_to_mark();
			break;
		case book_action::jump_scroll:
			jump_scroll();
			break;
		case book_action::widen:
			set_width(width + WIDTH_STEP);
			break;
		case book_action::narrow:
			set_width(width - WIDTH_STEP);
			break;
		case book_action::reset_width:
			set_width(DEFAULT_WIDTH);
			break;
	}
}

bool book::handle_key(int key) {
	const auto action = find_action_for_key(key);
	if (!action) {
		return false;
	}
	perform(*action);
	return true;
}

session_state book::state() const {
	session_state result;
	result.page = on_toc() ? menu_context : current;
	result.width = width;
	for (const auto& ch : chapters) {
		const int offset = ch->get_offset();
		if (offset <= 0) {
			continue;
		}
		result.offsets[ch->index()] = offset;
	}
	return result;
}

void book::load_state(const session_state& state) {
	int page_idx = state.page;
	if (!is_valid_page(page_idx)) {
		wxLogWarning("Saved page %d is out of range, opening the table of contents instead", page_idx);
		page_idx = TOC_INDEX;
	}
	current = page_idx;
	menu_context = page_idx;
	set_width(state.width >= MIN_WIDTH ? state.width : DEFAULT_WIDTH);
	go_to_page(page_idx);
}
