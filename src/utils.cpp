/* utils.cpp - various helper functions that didn't belong anywhere else.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <cctype>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>
#include <wx/string.h>
#include <wx/tokenzr.h>
#include <wx/zipstrm.h>

namespace {
// Width in bytes of the whitespace at pos: 1 for ASCII space, 2 for a UTF-8 no-break space, else 0.
size_t space_width(std::string_view text, size_t pos) {
	const auto ch = static_cast<unsigned char>(text[pos]);
	if (std::isspace(ch) != 0) {
		return 1;
	}
	if (ch == 0xC2 && pos + 1 < text.size() && static_cast<unsigned char>(text[pos + 1]) == 0xA0) {
		return 2;
	}
	return 0;
}
} // namespace

std::string collapse_whitespace(std::string_view input) {
	std::string result;
	result.reserve(input.size());
	size_t pos = 0;
	while (pos < input.size()) {
		const size_t width = space_width(input, pos);
		if (width == 0) {
			result += input[pos++];
			continue;
		}
		if (result.empty() || result.back() != ' ') {
			result += ' ';
		}
		pos += width;
	}
	return result;
}

std::string trim_string(const std::string& str) {
	const std::string_view text{str};
	size_t first = 0;
	while (first < text.size()) {
		const size_t width = space_width(text, first);
		if (width == 0) {
			break;
		}
		first += width;
	}
	size_t last = text.size();
	while (last > first) {
		if (space_width(text, last - 1) == 1) {
			--last;
		} else if (last - first >= 2 && space_width(text, last - 2) == 2) {
			last -= 2;
		} else {
			break;
		}
	}
	return str.substr(first, last - first);
}

std::string remove_soft_hyphens(std::string_view input) {
	constexpr std::string_view soft_hyphen = "\xC2\xAD";
	std::string result;
	result.reserve(input.size());
	size_t pos = 0;
	for (size_t found = input.find(soft_hyphen); found != std::string_view::npos; found = input.find(soft_hyphen, pos)) {
		result.append(input.substr(pos, found - pos));
		pos = found + soft_hyphen.size();
	}
	result.append(input.substr(pos));
	return result;
}

std::string url_decode(std::string_view encoded) {
	auto hex = [](char c) -> int {
		if (c >= '0' && c <= '9') {
			return c - '0';
		}
		if (c >= 'a' && c <= 'f') {
			return c - 'a' + 10;
		}
		if (c >= 'A' && c <= 'F') {
			return c - 'A' + 10;
		}
		return -1;
	};
	std::string out;
	out.reserve(encoded.size());
	for (size_t i = 0; i < encoded.size(); ++i) {
		const char c = encoded[i];
		if (c == '%') {
			if (i + 2 < encoded.size()) {
				const int hi = hex(encoded[i + 1]);
				const int lo = hex(encoded[i + 2]);
				if (hi >= 0 && lo >= 0) {
					out.push_back(static_cast<char>((hi << 4) | lo));
					i += 2;
					continue;
				}
			}
			out.push_back('%');
		} else {
			out.push_back(c);
		}
	}
	return out;
}

std::string strip_fragment(std::string_view href) {
	const auto hash_pos = href.find('#');
	return std::string{hash_pos == std::string_view::npos ? href : href.substr(0, hash_pos)};
}

std::string join_path(const std::string& base_dir, const std::string& relative) {
	const std::string combined = base_dir.empty() || (!relative.empty() && relative.front() == '/') ? relative : base_dir + "/" + relative;
	std::vector<std::string> parts;
	size_t start = 0;
	while (start <= combined.size()) {
		auto slash = combined.find('/', start);
		if (slash == std::string::npos) {
			slash = combined.size();
		}
		const std::string part = combined.substr(start, slash - start);
		if (part == "..") {
			if (!parts.empty()) {
				parts.pop_back();
			}
		} else if (!part.empty() && part != ".") {
			parts.push_back(part);
		}
		start = slash + 1;
	}
	std::string result;
	for (const auto& part : parts) {
		if (!result.empty()) {
			result += '/';
		}
		result += part;
	}
	return result;
}

std::vector<wxString> wrap_text(const wxString& text, int width) {
	std::vector<wxString> lines;
	const size_t columns = width > 0 ? static_cast<size_t>(width) : 1;
	wxString content = text;
	if (content.EndsWith("\n")) {
		content.RemoveLast();
	}
	wxStringTokenizer paragraphs(content, "\n", wxTOKEN_RET_EMPTY_ALL);
	while (paragraphs.HasMoreTokens()) {
		const wxString paragraph = paragraphs.GetNextToken();
		wxStringTokenizer words(paragraph, " \t", wxTOKEN_STRTOK);
		if (!words.HasMoreTokens()) {
			lines.emplace_back();
			continue;
		}
		wxString line;
		while (words.HasMoreTokens()) {
			wxString word = words.GetNextToken();
			while (word.length() > columns) {
				if (!line.IsEmpty()) {
					lines.push_back(line);
					line.clear();
				}
				lines.push_back(word.Left(columns));
				word = word.Mid(columns);
			}
			if (word.IsEmpty()) {
				continue;
			}
			if (line.IsEmpty()) {
				line = word;
			} else if (line.length() + 1 + word.length() <= columns) {
				line << ' ' << word;
			} else {
				lines.push_back(line);
				line = word;
			}
		}
		if (!line.IsEmpty()) {
			lines.push_back(line);
		}
	}
	return lines;
}

std::string read_zip_entry(wxZipInputStream& zip) {
	std::string content;
	if (const auto size = zip.GetSize(); size > 0) {
		content.reserve(static_cast<size_t>(size));
	}
	char chunk[4096];
	while (!zip.Eof()) {
		const size_t got = zip.Read(chunk, sizeof(chunk)).LastRead();
		if (got == 0) {
			break;
		}
		content.append(chunk, got);
	}
	return content;
}

wxZipEntry* find_zip_entry(const std::string& filename, const std::map<std::string, std::unique_ptr<wxZipEntry>>& entries) {
	for (const auto& name : {filename, url_decode(filename)}) {
		if (const auto it = entries.find(name); it != entries.end()) {
			return it->second.get();
		}
	}
	return nullptr;
}
