/* main_window.hpp - primary user interface header file.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "book.hpp"
#include "session_state.hpp"
#include "surfaces.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <wx/simplebook.h>
#include <wx/wx.h>

class document_source;

class main_window : public wxFrame, public surface_host {
public:
	explicit main_window(const wxString& path);
	~main_window() override = default;
	main_window(const main_window&) = delete;
	main_window& operator=(const main_window&) = delete;
	main_window(main_window&&) = delete;
	main_window& operator=(main_window&&) = delete;

	// Builds every page of doc and shows the saved page. Throws parser_exception.
	void open_book(document_source& doc, const std::optional<session_state>& session);

	[[nodiscard]] list_surface& add_toc_surface(const std::string& url) override;
	[[nodiscard]] text_surface& add_chapter_surface(const std::string& url) override;
	void switch_to(const std::string& url) override;
	void queue_update(std::function<void()> fn) override;
	void quit() override;

private:
	wxString document_path;
	wxPanel* main_panel{nullptr};
	wxStaticText* title_label{nullptr};
	wxSimplebook* page_book{nullptr};
	std::map<std::string, int> page_numbers;
	std::unique_ptr<book> reader;

	[[nodiscard]] bool on_key(int key);
	void add_page(wxWindow* view, const std::string& url);
	void save_reading_session();
	void on_close_window(wxCloseEvent& event);
};
