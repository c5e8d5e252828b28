/* epub_document.cpp - epub document source implementation.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "epub_document.hpp"
#include "document_locator.hpp"
#include "html_to_text.hpp"
#include "utils.hpp"
#include <algorithm>
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <utility>
#include <vector>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
constexpr int TOC_INDENT = 2;

std::string parent_dir(const std::string& path) {
	const auto slash = path.find_last_of('/');
	return slash == std::string::npos ? std::string() : path.substr(0, slash);
}

std::string local_name(const char* qualified) {
	std::string name = qualified;
	const auto pos = name.find(':');
	return pos == std::string::npos ? name : name.substr(pos + 1);
}
} // namespace

std::string epub_document::spine_iterator::current_url() const {
	return position < spine_items.size() ? spine_items[position] : std::string();
}

bool epub_document::spine_iterator::is_first() const {
	return position == 0;
}

bool epub_document::spine_iterator::is_last() const {
	return spine_items.empty() || position + 1 == spine_items.size();
}

bool epub_document::spine_iterator::next() {
	if (is_last()) {
		return false;
	}
	++position;
	return true;
}

bool epub_document::spine_iterator::previous() {
	if (is_first()) {
		return false;
	}
	--position;
	return true;
}

epub_document::epub_document(const wxString& path) : file_path{path}, file_stream{std::make_unique<wxFileInputStream>(path)} {
	if (!file_stream->IsOk()) {
		throw parser_exception(_("Failed to open EPUB file"), file_path);
	}
	wxZipInputStream zip_index(*file_stream);
	while (wxZipEntry* entry = zip_index.GetNextEntry()) {
		const std::string name = entry->GetName(wxPATH_UNIX).ToStdString();
		zip_entries[name] = std::unique_ptr<wxZipEntry>(entry);
	}
	if (zip_entries.empty()) {
		throw parser_exception(_("File is not a valid EPUB archive"), file_path);
	}
	const std::string opf_filename = find_opf_path();
	opf_dir = parent_dir(opf_filename);
	parse_opf(opf_filename);
	if (spine_items.empty()) {
		throw parser_exception(_("EPUB spine is empty"), file_path);
	}
	parse_toc();
	if (title_.IsEmpty()) {
		title_ = wxFileName(file_path).GetFullName();
	}
	wxLogVerbose("Opened %s: %zu spine items, %zu table of contents entries", file_path, spine_items.size(), toc.size());
}

std::string epub_document::read_entry(const std::string& filename) {
	wxZipEntry* entry = find_zip_entry(filename, zip_entries);
	if (entry == nullptr) {
		throw parser_exception(wxString::Format(_("Missing archive entry: %s"), wxString::FromUTF8(filename)), file_path);
	}
	file_stream->SeekI(0);
	wxZipInputStream zis(*file_stream);
	if (!zis.OpenEntry(*entry)) {
		throw parser_exception(wxString::Format(_("Failed to open archive entry: %s"), wxString::FromUTF8(filename)), file_path);
	}
	return read_zip_entry(zis);
}

std::string epub_document::find_opf_path() {
	const std::string container_content = read_entry("META-INF/container.xml");
	pugi::xml_document doc;
	if (!doc.load_buffer(container_content.data(), container_content.size())) {
		throw parser_exception(_("Invalid container.xml"), file_path);
	}
	const auto rootfile = doc.child("container").child("rootfiles").child("rootfile");
	std::string opf_filename = rootfile.attribute("full-path").as_string();
	if (opf_filename.empty()) {
		throw parser_exception(_("container.xml does not name a package document"), file_path);
	}
	return opf_filename;
}

void epub_document::parse_opf(const std::string& filename) {
	const std::string opf_content = read_entry(filename);
	pugi::xml_document doc;
	if (!doc.load_buffer(opf_content.data(), opf_content.size())) {
		throw parser_exception(_("Invalid OPF"), file_path);
	}
	auto package = doc.child("package");
	if (package == nullptr) {
		package = doc.first_child();
	}
	if (auto metadata = package.child("metadata")) {
		for (auto child : metadata.children()) {
			const std::string name = local_name(child.name());
			if (name == "title" && title_.IsEmpty()) {
				title_ = wxString::FromUTF8(trim_string(child.text().as_string()));
			} else if (name == "creator" && author_.IsEmpty()) {
				author_ = wxString::FromUTF8(trim_string(child.text().as_string()));
			}
		}
	}
	auto manifest = package.child("manifest");
	if (manifest == nullptr) {
		throw parser_exception(_("No manifest"), file_path);
	}
	for (auto item_node : manifest.children("item")) {
		const std::string href = item_node.attribute("href").as_string();
		const std::string id = item_node.attribute("id").as_string();
		const std::string media_type = item_node.attribute("media-type").as_string();
		const std::string properties = item_node.attribute("properties").as_string();
		manifest_item item;
		item.path = join_path(opf_dir, url_decode(href));
		item.media_type = media_type;
		manifest_items.emplace(id, std::move(item));
		if (media_type == "application/x-dtbncx+xml") {
			toc_ncx_id = id;
		} else if (properties.find("nav") != std::string::npos) {
			nav_doc_id = id;
		}
	}
	auto spine = package.child("spine");
	if (spine == nullptr) {
		throw parser_exception(_("No spine"), file_path);
	}
	if (toc_ncx_id.empty()) {
		toc_ncx_id = spine.attribute("toc").as_string();
	}
	for (auto itemref : spine.children("itemref")) {
		const auto it = manifest_items.find(itemref.attribute("idref").as_string());
		if (it == manifest_items.end()) {
			wxLogWarning("Spine references unknown manifest id %s", wxString::FromUTF8(itemref.attribute("idref").as_string()));
			continue;
		}
		spine_items.push_back(it->second.path);
	}
}

void epub_document::parse_toc() {
	if (!nav_doc_id.empty()) {
		if (const auto it = manifest_items.find(nav_doc_id); it != manifest_items.end()) {
			parse_epub3_nav(it->second);
		}
	}
	if (toc.empty() && !toc_ncx_id.empty()) {
		if (const auto it = manifest_items.find(toc_ncx_id); it != manifest_items.end()) {
			parse_epub2_ncx(it->second);
		}
	}
	if (!toc.empty()) {
		return;
	}
	wxLogVerbose("No navigation document in %s, listing spine items instead", file_path);
	for (size_t i = 0; i < spine_items.size(); ++i) {
		toc.push_back({wxString::Format(_("Section %zu"), i + 1), spine_items[i]});
	}
}

void epub_document::parse_epub2_ncx(const manifest_item& ncx) {
	const std::string ncx_content = read_entry(ncx.path);
	pugi::xml_document doc;
	if (!doc.load_buffer(ncx_content.data(), ncx_content.size())) {
		wxLogWarning("Couldn't parse table of contents in %s", file_path);
		return;
	}
	auto nav_map = doc.child("ncx").child("navMap");
	for (auto nav_point : nav_map.children("navPoint")) {
		parse_ncx_nav_point(nav_point, 0);
	}
}

void epub_document::parse_ncx_nav_point(pugi::xml_node nav_point, int depth) {
	const wxString name = wxString::FromUTF8(trim_string(nav_point.child("navLabel").child("text").text().as_string()));
	const std::string src = nav_point.child("content").attribute("src").as_string();
	if (!src.empty()) {
		// NCX hrefs are relative to the NCX file, which may live outside the OPF directory.
		const auto ncx_it = manifest_items.find(toc_ncx_id);
		const std::string base = ncx_it != manifest_items.end() ? parent_dir(ncx_it->second.path) : opf_dir;
		add_toc_entry(name, join_path(base, url_decode(strip_fragment(src))), depth);
	}
	for (auto child : nav_point.children("navPoint")) {
		parse_ncx_nav_point(child, depth + 1);
	}
}

void epub_document::parse_epub3_nav(const manifest_item& nav) {
	const std::string nav_content = read_entry(nav.path);
	pugi::xml_document doc;
	if (!doc.load_buffer(nav_content.data(), nav_content.size())) {
		wxLogWarning("Couldn't parse navigation document in %s", file_path);
		return;
	}
	pugi::xml_node toc_nav;
	for (auto nav_node : doc.select_nodes("//*[local-name()='nav']")) {
		if (std::string(nav_node.node().attribute("epub:type").as_string()) == "toc") {
			toc_nav = nav_node.node();
			break;
		}
	}
	if (toc_nav == nullptr) {
		toc_nav = doc.find_node([](pugi::xml_node n) { return local_name(n.name()) == "nav"; });
	}
	if (toc_nav == nullptr) {
		return;
	}
	if (auto ol = toc_nav.child("ol")) {
		parse_epub3_nav_list(ol, parent_dir(nav.path), 0);
	}
}

void epub_document::parse_epub3_nav_list(pugi::xml_node ol_element, const std::string& nav_base_dir, int depth) {
	for (auto li : ol_element.children("li")) {
		if (auto a = li.child("a")) {
			const std::string href = a.attribute("href").as_string();
			if (!href.empty()) {
				const wxString name = wxString::FromUTF8(trim_string(collapse_whitespace(a.text().as_string())));
				add_toc_entry(name, join_path(nav_base_dir, url_decode(strip_fragment(href))), depth);
			}
		}
		if (auto ol = li.child("ol")) {
			parse_epub3_nav_list(ol, nav_base_dir, depth + 1);
		}
	}
}

void epub_document::add_toc_entry(const wxString& name, const std::string& resolved_url, int depth) {
	const bool duplicate = std::ranges::any_of(toc, [&](const toc_entry& entry) {
		return entry.url == resolved_url;
	});
	if (duplicate) {
		return;
	}
	const wxString label = wxString(' ', static_cast<size_t>(depth * TOC_INDENT)) + (name.IsEmpty() ? _("Untitled") : name);
	toc.push_back({label, resolved_url});
}

wxString epub_document::chapter_content(const std::string& url) {
	if (!locate_url(cursor, url)) {
		throw parser_exception(wxString::Format(_("Table of contents entry %s is not part of the book"), wxString::FromUTF8(url)), file_path);
	}
	return read_current_chapter();
}

wxString epub_document::read_current_chapter() {
	const std::string content = read_entry(cursor.current_url());
	html_to_text converter;
	if (!converter.convert(content)) {
		throw parser_exception(wxString::Format(_("Failed to convert %s to text"), wxString::FromUTF8(cursor.current_url())), file_path);
	}
	return wxString::FromUTF8(converter.get_text());
}
