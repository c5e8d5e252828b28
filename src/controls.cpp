/* controls.cpp - custom UI control implementations.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "controls.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <algorithm>
#include <utility>
#include <wx/dcbuffer.h>
#include <wx/settings.h>

text_canvas::text_canvas(wxWindow* parent) : wxVScrolledWindow(parent, wxID_ANY, wxDefaultPosition, wxDefaultSize, wxWANTS_CHARS) {
	SetBackgroundStyle(wxBG_STYLE_PAINT);
	SetBackgroundColour(BACKGROUND_COLOUR);
	SetForegroundColour(FOREGROUND_COLOUR);
	SetFont(wxFont(wxFontInfo(12).Family(wxFONTFAMILY_TELETYPE)));
	GetTextExtent("M", &char_width, &row_height);
	SetRowCount(0);
	Bind(wxEVT_PAINT, &text_canvas::on_paint, this);
	Bind(wxEVT_KEY_DOWN, &text_canvas::on_key_down, this);
	Bind(wxEVT_CHAR, &text_canvas::on_char, this);
}

void text_canvas::set_lines(std::vector<wxString> wrapped) {
	lines = std::move(wrapped);
	SetRowCount(lines.size());
	RefreshAll();
}

void text_canvas::set_before_repaint(std::function<void()> hook) {
	before_repaint = std::move(hook);
}

void text_canvas::set_key_handler(key_handler handler) {
	on_key = std::move(handler);
}

int text_canvas::get_char_width() const {
	return char_width;
}

int text_canvas::get_visible_rows() const {
	return static_cast<int>(GetVisibleRowsEnd() - GetVisibleRowsBegin());
}

wxCoord text_canvas::OnGetRowHeight(size_t) const {
	return row_height;
}

void text_canvas::on_paint(wxPaintEvent&) {
	if (before_repaint) {
		before_repaint();
	}
	wxAutoBufferedPaintDC dc(this);
	dc.SetBackground(wxBrush(GetBackgroundColour()));
	dc.Clear();
	dc.SetFont(GetFont());
	dc.SetTextForeground(GetForegroundColour());
	const size_t end = std::min(GetVisibleRowsEnd(), lines.size());
	wxCoord y = 0;
	for (size_t row = GetVisibleRowsBegin(); row < end; ++row) {
		dc.DrawText(lines[row], 0, y);
		y += row_height;
	}
}

void text_canvas::on_key_down(wxKeyEvent& event) {
	switch (event.GetKeyCode()) {
		case WXK_UP:
			ScrollRows(-1);
			break;
		case WXK_DOWN:
			ScrollRows(1);
			break;
		case WXK_PAGEUP:
			ScrollPages(-1);
			break;
		case WXK_PAGEDOWN:
			ScrollPages(1);
			break;
		case WXK_HOME:
			ScrollToRow(0);
			break;
		case WXK_END:
			if (!lines.empty()) {
				ScrollToRow(lines.size() - 1);
			}
			break;
		default:
			event.Skip();
			return;
	}
}

void text_canvas::on_char(wxKeyEvent& event) {
	if (on_key && on_key(static_cast<int>(event.GetUnicodeKey()))) {
		return;
	}
	event.Skip();
}

chapter_view::chapter_view(wxWindow* parent) : wxPanel(parent) {
	SetBackgroundColour(BACKGROUND_COLOUR);
	canvas = new text_canvas(this);
	status_label = new wxStaticText(this, wxID_ANY, wxEmptyString, wxDefaultPosition, wxDefaultSize, wxST_NO_AUTORESIZE | wxALIGN_CENTRE_HORIZONTAL);
	status_label->SetForegroundColour(FOREGROUND_COLOUR);
	auto* sizer = new wxBoxSizer(wxVERTICAL);
	sizer->Add(canvas, 1, wxALIGN_CENTER_HORIZONTAL);
	sizer->Add(status_label, 0, wxEXPAND | wxTOP | wxBOTTOM, DIALOG_PADDING / 2);
	SetSizer(sizer);
}

void chapter_view::set_text(const wxString& text) {
	raw_text = text;
	rewrap();
}

int chapter_view::get_scroll_offset() const {
	return static_cast<int>(canvas->GetVisibleRowsBegin());
}

void chapter_view::scroll_to(int offset) {
	if (canvas->GetRowCount() == 0) {
		return;
	}
	const size_t last = canvas->GetRowCount() - 1;
	canvas->ScrollToRow(std::min(static_cast<size_t>(std::max(offset, 0)), last));
}

int chapter_view::get_visible_height() const {
	return canvas->get_visible_rows();
}

int chapter_view::get_total_line_count() const {
	return static_cast<int>(canvas->GetRowCount());
}

void chapter_view::set_status(const wxString& status) {
	status_label->SetLabel(status);
}

void chapter_view::set_width(int cols) {
	columns = cols;
	const int scrollbar = wxSystemSettings::GetMetric(wxSYS_VSCROLL_X, canvas);
	canvas->SetMinSize(wxSize(columns * canvas->get_char_width() + scrollbar, -1));
	rewrap();
	Layout();
}

void chapter_view::set_before_repaint(std::function<void()> hook) {
	canvas->set_before_repaint(std::move(hook));
}

void chapter_view::set_key_handler(key_handler handler) {
	canvas->set_key_handler(std::move(handler));
}

void chapter_view::focus_text() {
	canvas->SetFocus();
}

void chapter_view::rewrap() {
	if (columns <= 0) {
		return;
	}
	const int offset = get_scroll_offset();
	canvas->set_lines(wrap_text(raw_text, columns));
	scroll_to(offset);
}

toc_view::toc_view(wxWindow* parent) : wxPanel(parent) {
	SetBackgroundColour(BACKGROUND_COLOUR);
	list = new wxListBox(this, wxID_ANY, wxDefaultPosition, wxDefaultSize, 0, nullptr, wxLB_SINGLE | wxWANTS_CHARS);
	list->SetBackgroundColour(BACKGROUND_COLOUR);
	list->SetForegroundColour(FOREGROUND_COLOUR);
	list->SetFont(wxFont(wxFontInfo(12).Family(wxFONTFAMILY_TELETYPE)));
	auto* sizer = new wxBoxSizer(wxVERTICAL);
	sizer->Add(list, 1, wxALIGN_CENTER_HORIZONTAL | wxBOTTOM, DIALOG_PADDING);
	SetSizer(sizer);
	list->Bind(wxEVT_LISTBOX_DCLICK, [this](wxCommandEvent&) {
		activate_selection();
	});
	list->Bind(wxEVT_CHAR, &toc_view::on_char, this);
}

void toc_view::add_item(const wxString& label, std::function<void()> on_select) {
	list->Append(label);
	actions.push_back(std::move(on_select));
	if (list->GetCount() == 1) {
		list->SetSelection(0);
	}
}

void toc_view::set_current_index(int index) {
	const int count = get_item_count();
	if (count == 0) {
		return;
	}
	const int clamped = std::clamp(index, 0, count - 1);
	list->SetSelection(clamped);
	list->EnsureVisible(clamped);
}

int toc_view::get_current_index() const {
	const int selection = list->GetSelection();
	return selection == wxNOT_FOUND ? 0 : selection;
}

int toc_view::get_item_count() const {
	return static_cast<int>(list->GetCount());
}

void toc_view::set_width(int columns) {
	int char_width{0};
	int char_height{0};
	list->GetTextExtent("M", &char_width, &char_height);
	const int scrollbar = wxSystemSettings::GetMetric(wxSYS_VSCROLL_X, list);
	list->SetMinSize(wxSize(columns * char_width + scrollbar, -1));
	Layout();
}

void toc_view::set_key_handler(key_handler handler) {
	on_key = std::move(handler);
}

void toc_view::focus_list() {
	list->SetFocus();
}

void toc_view::activate_selection() {
	const int selection = list->GetSelection();
	if (selection == wxNOT_FOUND || static_cast<size_t>(selection) >= actions.size()) {
		return;
	}
	actions[static_cast<size_t>(selection)]();
}

void toc_view::on_char(wxKeyEvent& event) {
	const int key = event.GetKeyCode();
	if (key == WXK_RETURN || key == WXK_NUMPAD_ENTER) {
		activate_selection();
		return;
	}
	if (on_key && on_key(static_cast<int>(event.GetUnicodeKey()))) {
		return;
	}
	event.Skip();
}
