/* controls.hpp - custom UI control declarations.
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
#include <vector>
#include <wx/listbox.h>
#include <wx/panel.h>
#include <wx/stattext.h>
#include <wx/vscroll.h>
#include <wx/wx.h>

// Returns true when the key was consumed.
using key_handler = std::function<bool(int)>;

class text_canvas : public wxVScrolledWindow {
public:
	explicit text_canvas(wxWindow* parent);
	void set_lines(std::vector<wxString> wrapped);
	void set_before_repaint(std::function<void()> hook);
	void set_key_handler(key_handler handler);
	[[nodiscard]] int get_char_width() const;
	[[nodiscard]] int get_visible_rows() const;

protected:
	wxCoord OnGetRowHeight(size_t row) const override;

private:
	std::vector<wxString> lines;
	std::function<void()> before_repaint;
	key_handler on_key;
	int row_height{0};
	int char_width{0};

	void on_paint(wxPaintEvent& event);
	void on_key_down(wxKeyEvent& event);
	void on_char(wxKeyEvent& event);
};

class chapter_view : public wxPanel, public text_surface {
public:
	explicit chapter_view(wxWindow* parent);
	void set_text(const wxString& text) override;
	[[nodiscard]] int get_scroll_offset() const override;
	void scroll_to(int offset) override;
	[[nodiscard]] int get_visible_height() const override;
	[[nodiscard]] int get_total_line_count() const override;
	void set_status(const wxString& status) override;
	void set_width(int columns) override;
	void set_before_repaint(std::function<void()> hook) override;
	void set_key_handler(key_handler handler);
	void focus_text();

private:
	text_canvas* canvas{nullptr};
	wxStaticText* status_label{nullptr};
	wxString raw_text;
	int columns{0};

	void rewrap();
};

class toc_view : public wxPanel, public list_surface {
public:
	explicit toc_view(wxWindow* parent);
	void add_item(const wxString& label, std::function<void()> on_select) override;
	void set_current_index(int index) override;
	[[nodiscard]] int get_current_index() const override;
	[[nodiscard]] int get_item_count() const override;
	void set_width(int columns) override;
	void set_key_handler(key_handler handler);
	void focus_list();

private:
	wxListBox* list{nullptr};
	std::vector<std::function<void()>> actions;
	key_handler on_key;

	void activate_selection();
	void on_char(wxKeyEvent& event);
};
