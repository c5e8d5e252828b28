/* epub_document.hpp - epub document source header.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "document.hpp"
#include "document_locator.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <pugixml.hpp>
#include <wx/string.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

struct manifest_item {
	std::string path;
	std::string media_type;
};

class epub_document : public document_source {
public:
	// Opens the container and reads metadata, spine and navigation. Throws parser_exception.
	explicit epub_document(const wxString& path);
	~epub_document() override = default;
	epub_document(const epub_document&) = delete;
	epub_document& operator=(const epub_document&) = delete;
	epub_document(epub_document&&) = delete;
	epub_document& operator=(epub_document&&) = delete;

	[[nodiscard]] wxString title() const override {
		return title_;
	}

	[[nodiscard]] wxString author() const override {
		return author_;
	}

	[[nodiscard]] const std::vector<toc_entry>& table_of_contents() const override {
		return toc;
	}

	[[nodiscard]] wxString chapter_content(const std::string& url) override;

private:
	class spine_iterator : public spine_cursor {
	public:
		explicit spine_iterator(const std::vector<std::string>& items) : spine_items{items} {
		}

		[[nodiscard]] std::string current_url() const override;
		[[nodiscard]] bool is_first() const override;
		[[nodiscard]] bool is_last() const override;
		bool next() override;
		bool previous() override;

	private:
		const std::vector<std::string>& spine_items;
		size_t position{0};
	};

	wxString file_path;
	std::unique_ptr<wxFileInputStream> file_stream;
	std::map<std::string, std::unique_ptr<wxZipEntry>> zip_entries;
	std::map<std::string, manifest_item> manifest_items;
	std::vector<std::string> spine_items;
	std::vector<toc_entry> toc;
	spine_iterator cursor{spine_items};
	std::string opf_dir;
	std::string toc_ncx_id;
	std::string nav_doc_id;
	wxString title_;
	wxString author_;

	[[nodiscard]] std::string read_entry(const std::string& filename);
	[[nodiscard]] std::string find_opf_path();
	void parse_opf(const std::string& filename);
	void parse_toc();
	void parse_epub2_ncx(const manifest_item& ncx);
	void parse_ncx_nav_point(pugi::xml_node nav_point, int depth);
	void parse_epub3_nav(const manifest_item& nav);
	void parse_epub3_nav_list(pugi::xml_node ol_element, const std::string& nav_base_dir, int depth);
	void add_toc_entry(const wxString& name, const std::string& resolved_url, int depth);
	[[nodiscard]] wxString read_current_chapter();
};
