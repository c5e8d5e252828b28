/* page.hpp - chapter and table of contents pages.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "surfaces.hpp"
#include <functional>
#include <string>
#include <variant>
#include <wx/string.h>

using update_queue = std::function<void(std::function<void()>)>;

class chapter {
public:
	chapter(text_surface& surf, std::string url, int index, const wxString& text, const wxString& progress_label, update_queue queue_fn);
	~chapter() = default;
	chapter(const chapter&) = delete;
	chapter& operator=(const chapter&) = delete;
	chapter(chapter&&) = delete;
	chapter& operator=(chapter&&) = delete;

	[[nodiscard]] int index() const noexcept {
		return index_;
	}

	[[nodiscard]] const std::string& url() const noexcept {
		return url_;
	}

	void set_width(int width);
	[[nodiscard]] int get_offset() const;
	void set_offset(int offset);
	// Recomputes the "lines a-b/n" status. Does nothing if neither the offset nor the visible height moved.
	void update_progress();

private:
	text_surface& surface;
	std::string url_;
	int index_;
	wxString progress;
	update_queue queue;
	int last_seen_offset{-1};
	int last_seen_height{-1};
};

class table_of_contents {
public:
	table_of_contents(list_surface& lst, std::string url);
	~table_of_contents() = default;
	table_of_contents(const table_of_contents&) = delete;
	table_of_contents& operator=(const table_of_contents&) = delete;
	table_of_contents(table_of_contents&&) = delete;
	table_of_contents& operator=(table_of_contents&&) = delete;

	[[nodiscard]] int index() const noexcept;

	[[nodiscard]] const std::string& url() const noexcept {
		return url_;
	}

	void set_width(int width);
	void set_selected(int idx);
	[[nodiscard]] int selected() const;
	void select_previous();
	void select_next();

private:
	list_surface& list;
	std::string url_;
};

// Non-owning handle to either kind of page; the book owns the pages themselves.
using page = std::variant<table_of_contents*, chapter*>;

[[nodiscard]] int page_index(const page& p);
[[nodiscard]] const std::string& page_url(const page& p);
void set_page_width(const page& p, int width);
[[nodiscard]] wxString format_progress_label(const wxString& name, int index, int count);
