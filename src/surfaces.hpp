/* surfaces.hpp - presentation interfaces used by the reading engine.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <functional>
#include <string>
#include <wx/string.h>

// A scrollable block of wrapped text with a one-line status area beneath it.
class text_surface {
public:
	virtual ~text_surface() = default;
	virtual void set_text(const wxString& text) = 0;
	[[nodiscard]] virtual int get_scroll_offset() const = 0;
	virtual void scroll_to(int offset) = 0;
	[[nodiscard]] virtual int get_visible_height() const = 0;
	[[nodiscard]] virtual int get_total_line_count() const = 0;
	virtual void set_status(const wxString& status) = 0;
	virtual void set_width(int columns) = 0;
	// Called every time the surface is about to repaint.
	virtual void set_before_repaint(std::function<void()> hook) = 0;
};

class list_surface {
public:
	virtual ~list_surface() = default;
	virtual void add_item(const wxString& label, std::function<void()> on_select) = 0;
	virtual void set_current_index(int index) = 0;
	[[nodiscard]] virtual int get_current_index() const = 0;
	[[nodiscard]] virtual int get_item_count() const = 0;
	virtual void set_width(int columns) = 0;
};

// Owns the page widgets. Surfaces it hands out stay alive as long as the host does.
class surface_host {
public:
	virtual ~surface_host() = default;
	[[nodiscard]] virtual list_surface& add_toc_surface(const std::string& url) = 0;
	[[nodiscard]] virtual text_surface& add_chapter_surface(const std::string& url) = 0;
	virtual void switch_to(const std::string& url) = 0;
	// Runs fn later on the thread that dispatches input.
	virtual void queue_update(std::function<void()> fn) = 0;
	virtual void quit() = 0;
};
