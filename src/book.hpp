/* book.hpp - navigation engine over the pages of one book.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "constants.hpp"
#include "key_bindings.hpp"
#include "page.hpp"
#include "session_state.hpp"
#include "surfaces.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <wx/string.h>

class document_source;

class book {
public:
	explicit book(surface_host& surfaces, int scroll_stride = JUMP_SCROLL_LINES);
	~book() = default;
	book(const book&) = delete;
	book& operator=(const book&) = delete;
	book(book&&) = delete;
	book& operator=(book&&) = delete;

	// Builds the TOC and one chapter per TOC entry, then shows the saved page or the TOC.
	// Saved offsets are applied while the chapters are built. Throws parser_exception.
	void load(document_source& doc, const std::optional<session_state>& session);
	void set_toc(std::unique_ptr<table_of_contents> contents);
	void add_chapter(std::unique_ptr<chapter> ch);
	[[nodiscard]] std::optional<page> find_page(const std::string& url) const;
	[[nodiscard]] std::string index_to_url(int idx) const;

	void go_to_page(int idx);
	// Called when TOC entry idx is chosen from the list.
	void activate_toc_entry(int idx);
	void next_chapter();
	void previous_chapter();
	void toggle_menu();
	void menu_down();
	void menu_up();
	void mark();
	void jump_to_mark();
	void jump_scroll();
	void set_width(int w);
	void perform(book_action action);
	// Returns false when key has no binding so the caller can pass it on.
	[[nodiscard]] bool handle_key(int key);

	[[nodiscard]] session_state state() const;
	void load_state(const session_state& state);

	[[nodiscard]] const wxString& get_title() const noexcept {
		return title;
	}

	// Title line shown above the pages, with the author when the book names one.
	[[nodiscard]] wxString heading() const;

	[[nodiscard]] int get_current() const noexcept {
		return current;
	}

	[[nodiscard]] int get_width() const noexcept {
		return width;
	}

	[[nodiscard]] int get_menu_context() const noexcept {
		return menu_context;
	}

	[[nodiscard]] int get_mark_chapter() const noexcept {
		return mark_chapter;
	}

	[[nodiscard]] int get_mark_line() const noexcept {
		return mark_line;
	}

	[[nodiscard]] int chapter_count() const noexcept {
		return static_cast<int>(chapters.size());
	}

	[[nodiscard]] chapter& get_chapter(int idx) const {
		return *chapters.at(static_cast<size_t>(idx));
	}

	[[nodiscard]] table_of_contents& get_toc() const {
		return *toc;
	}

private:
	surface_host& host;
	int jump_lines;
	wxString title;
	wxString author;
	std::unique_ptr<table_of_contents> toc;
	std::vector<std::unique_ptr<chapter>> chapters;
	std::vector<page> pages;
	std::map<std::string, page> pages_map;
	int mark_chapter{NO_MARK};
	int mark_line{NO_MARK};
	int width{DEFAULT_WIDTH};
	int current{TOC_INDEX};
	int menu_context{TOC_INDEX};

	void register_page(const page& p);
	[[nodiscard]] bool is_valid_page(int idx) const noexcept;
	[[nodiscard]] bool on_toc() const noexcept {
		return current == TOC_INDEX;
	}
};
