/* main_window.cpp - primary user interface implementation.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "main_window.hpp"
#include "app.hpp"
#include "config_manager.hpp"
#include "constants.hpp"
#include "controls.hpp"
#include "document.hpp"
#include <utility>
#include <wx/log.h>
#include <wx/translation.h>

main_window::main_window(const wxString& path) : wxFrame(nullptr, wxID_ANY, APP_NAME, wxDefaultPosition, wxSize(900, 700)), document_path{path} {
	main_panel = new wxPanel(this);
	main_panel->SetBackgroundColour(BACKGROUND_COLOUR);
	title_label = new wxStaticText(main_panel, wxID_ANY, wxEmptyString, wxDefaultPosition, wxDefaultSize, wxST_NO_AUTORESIZE | wxALIGN_CENTRE_HORIZONTAL);
	title_label->SetForegroundColour(FOREGROUND_COLOUR);
	title_label->SetFont(title_label->GetFont().Bold());
	page_book = new wxSimplebook(main_panel, wxID_ANY);
	page_book->SetBackgroundColour(BACKGROUND_COLOUR);
	auto* const sizer = new wxBoxSizer(wxVERTICAL);
	sizer->Add(title_label, 0, wxEXPAND | wxTOP, DIALOG_PADDING);
	sizer->AddSpacer(title_label->GetCharHeight() * (TITLE_ROWS - 1));
	sizer->Add(page_book, 1, wxEXPAND);
	main_panel->SetSizer(sizer);
	const int jump_lines = wxGetApp().get_config_manager().get(config_manager::jump_scroll_lines);
	reader = std::make_unique<book>(*this, jump_lines > 0 ? jump_lines : JUMP_SCROLL_LINES);
	Bind(wxEVT_CLOSE_WINDOW, &main_window::on_close_window, this);
}

void main_window::open_book(document_source& doc, const std::optional<session_state>& session) {
	reader->load(doc, session);
	title_label->SetLabel(reader->heading());
	SetTitle(wxString::Format("%s - %s", reader->get_title(), APP_NAME));
	main_panel->Layout();
}

list_surface& main_window::add_toc_surface(const std::string& url) {
	auto* const view = new toc_view(page_book);
	view->set_key_handler([this](int key) {
		return on_key(key);
	});
	add_page(view, url);
	return *view;
}

text_surface& main_window::add_chapter_surface(const std::string& url) {
	auto* const view = new chapter_view(page_book);
	view->set_key_handler([this](int key) {
		return on_key(key);
	});
	add_page(view, url);
	return *view;
}

void main_window::add_page(wxWindow* view, const std::string& url) {
	page_book->AddPage(view, wxString::FromUTF8(url));
	page_numbers[url] = static_cast<int>(page_book->GetPageCount()) - 1;
}

void main_window::switch_to(const std::string& url) {
	const auto it = page_numbers.find(url);
	if (it == page_numbers.end()) {
		wxLogError("No page for %s", wxString::FromUTF8(url));
		return;
	}
	page_book->ChangeSelection(static_cast<size_t>(it->second));
	wxWindow* const view = page_book->GetPage(static_cast<size_t>(it->second));
	if (auto* const text = dynamic_cast<chapter_view*>(view)) {
		text->focus_text();
	} else if (auto* const contents = dynamic_cast<toc_view*>(view)) {
		contents->focus_list();
	}
}

void main_window::queue_update(std::function<void()> fn) {
	CallAfter(std::move(fn));
}

void main_window::quit() {
	Close();
}

bool main_window::on_key(int key) {
	return reader->handle_key(key);
}

void main_window::save_reading_session() {
	if (!wxGetApp().get_config_manager().get(config_manager::save_session)) {
		return;
	}
	if (reader->chapter_count() == 0) {
		return;
	}
	try {
		save_session(document_path, reader->state());
	} catch (const session_error& e) {
		wxLogError("%s", e.get_display_message());
		wxMessageBox(e.get_display_message(), _("Error"), wxICON_ERROR);
	}
}

void main_window::on_close_window(wxCloseEvent& event) {
	save_reading_session();
	event.Skip();
}
