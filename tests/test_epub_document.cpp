/* test_epub_document.cpp - EPUB container parsing tests.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "document.hpp"
#include "epub_document.hpp"
#include <cstring>
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/utils.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
const char* const CONTAINER_XML = R"(<?xml version="1.0"?>
<container version="1.0" xmlns="urn:oasis:names:tc:opendocument:xmlns:container">
  <rootfiles><rootfile full-path="OEBPS/content.opf" media-type="application/oebps-package+xml"/></rootfiles>
</container>)";

std::string chapter_xhtml(const std::string& heading, const std::string& body) {
	return "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head><title>" + heading + "</title></head><body><h1>" + heading + "</h1><p>" + body + "</p></body></html>";
}

std::string opf(const std::string& metadata, const std::string& manifest, const std::string& spine_attrs = "") {
	return R"(<?xml version="1.0"?>
<package xmlns="http://www.idpf.org/2007/opf" version="3.0">
  <metadata xmlns:dc="http://purl.org/dc/elements/1.1/">)" + metadata + R"(</metadata>
  <manifest>)" + manifest + R"(
    <item id="ch1" href="text/ch1.xhtml" media-type="application/xhtml+xml"/>
    <item id="ch2" href="text/chapter%202.xhtml" media-type="application/xhtml+xml"/>
    <item id="ch3" href="text/ch3.xhtml" media-type="application/xhtml+xml"/>
  </manifest>
  <spine)" + spine_attrs + R"(><itemref idref="ch1"/><itemref idref="ch2"/><itemref idref="ch3"/></spine>
</package>)";
}

std::map<std::string, std::string> chapter_files() {
	return {
		{"OEBPS/text/ch1.xhtml", chapter_xhtml("One", "The first chapter.")},
		{"OEBPS/text/chapter 2.xhtml", chapter_xhtml("Two", "The second chapter.")},
		{"OEBPS/text/ch3.xhtml", chapter_xhtml("Three", "The third chapter.")},
	};
}
} // namespace

class EpubDocumentTest : public ::testing::Test {
protected:
	wxString path;

	void SetUp() override {
		const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
		path = wxFileName(wxFileName::GetTempDir(), wxString::Format("folio_%lu_%s.epub", wxGetProcessId(), info->name())).GetFullPath();
	}

	void TearDown() override {
		if (wxFileName::FileExists(path)) {
			wxRemoveFile(path);
		}
	}

	void write_epub(const std::map<std::string, std::string>& files) const {
		wxFileOutputStream out(path);
		ASSERT_TRUE(out.IsOk());
		wxZipOutputStream zip(out);
		zip.PutNextEntry("mimetype");
		zip.Write("application/epub+zip", 20);
		zip.PutNextEntry("META-INF/container.xml");
		zip.Write(CONTAINER_XML, strlen(CONTAINER_XML));
		for (const auto& [name, content] : files) {
			zip.PutNextEntry(wxString::FromUTF8(name));
			zip.Write(content.data(), content.size());
		}
		ASSERT_TRUE(zip.Close());
		ASSERT_TRUE(out.Close());
	}
};

TEST_F(EpubDocumentTest, ReadsEpub3Navigation) {
	auto files = chapter_files();
	files["OEBPS/content.opf"] = opf("<dc:title>Sample Book</dc:title><dc:creator>A. Writer</dc:creator>", R"(<item id="nav" href="nav.xhtml" media-type="application/xhtml+xml" properties="nav"/>)");
	files["OEBPS/nav.xhtml"] = R"(<html xmlns="http://www.w3.org/1999/xhtml" xmlns:epub="http://www.idpf.org/2007/ops"><body>
<nav epub:type="toc"><ol>
  <li><a href="text/ch1.xhtml">One</a>
    <ol><li><a href="text/chapter%202.xhtml#part">Two</a></li></ol>
  </li>
  <li><a href="text/ch1.xhtml#again">One again</a></li>
  <li><a href="text/ch3.xhtml">Three</a></li>
</ol></nav></body></html>)";
	write_epub(files);

	epub_document doc(path);
	EXPECT_EQ(doc.title(), "Sample Book");
	EXPECT_EQ(doc.author(), "A. Writer");
	const auto& toc = doc.table_of_contents();
	ASSERT_EQ(toc.size(), 3u);
	EXPECT_EQ(toc[0].name, "One");
	EXPECT_EQ(toc[0].url, "OEBPS/text/ch1.xhtml");
	EXPECT_EQ(toc[1].name, "  Two");
	EXPECT_EQ(toc[1].url, "OEBPS/text/chapter 2.xhtml");
	EXPECT_EQ(toc[2].url, "OEBPS/text/ch3.xhtml");
}

TEST_F(EpubDocumentTest, ChapterContentIsPlainText) {
	auto files = chapter_files();
	files["OEBPS/content.opf"] = opf("<dc:title>Sample Book</dc:title>", "");
	write_epub(files);

	epub_document doc(path);
	EXPECT_EQ(doc.chapter_content("OEBPS/text/ch3.xhtml"), "Three\n\nThe third chapter.\n");
	EXPECT_EQ(doc.chapter_content("OEBPS/text/ch1.xhtml"), "One\n\nThe first chapter.\n");
	EXPECT_EQ(doc.chapter_content("OEBPS/text/chapter 2.xhtml"), "Two\n\nThe second chapter.\n");
}

TEST_F(EpubDocumentTest, UnknownChapterThrows) {
	auto files = chapter_files();
	files["OEBPS/content.opf"] = opf("<dc:title>Sample Book</dc:title>", "");
	write_epub(files);

	epub_document doc(path);
	wxLogNull no_log;
	EXPECT_THROW(static_cast<void>(doc.chapter_content("OEBPS/text/missing.xhtml")), parser_exception);
	EXPECT_EQ(doc.chapter_content("OEBPS/text/ch1.xhtml"), "One\n\nThe first chapter.\n");
}

TEST_F(EpubDocumentTest, FallsBackToNcx) {
	auto files = chapter_files();
	files["OEBPS/content.opf"] = opf("<dc:title>Old Book</dc:title>", R"(<item id="ncx" href="toc.ncx" media-type="application/x-dtbncx+xml"/>)", R"( toc="ncx")");
	files["OEBPS/toc.ncx"] = R"(<?xml version="1.0"?>
<ncx xmlns="http://www.daisy.org/z3986/2005/ncx/" version="2005-1"><navMap>
  <navPoint id="p1"><navLabel><text>First</text></navLabel><content src="text/ch1.xhtml"/></navPoint>
  <navPoint id="p3"><navLabel><text> Third </text></navLabel><content src="text/ch3.xhtml#top"/></navPoint>
</navMap></ncx>)";
	write_epub(files);

	epub_document doc(path);
	const auto& toc = doc.table_of_contents();
	ASSERT_EQ(toc.size(), 2u);
	EXPECT_EQ(toc[0].name, "First");
	EXPECT_EQ(toc[1].name, "Third");
	EXPECT_EQ(toc[1].url, "OEBPS/text/ch3.xhtml");
}

TEST_F(EpubDocumentTest, ListsSpineWithoutNavigation) {
	auto files = chapter_files();
	files["OEBPS/content.opf"] = opf("", "");
	write_epub(files);

	epub_document doc(path);
	EXPECT_EQ(doc.title(), wxFileName(path).GetFullName());
	const auto& toc = doc.table_of_contents();
	ASSERT_EQ(toc.size(), 3u);
	EXPECT_EQ(toc[0].name, "Section 1");
	EXPECT_EQ(toc[2].name, "Section 3");
	EXPECT_EQ(toc[1].url, "OEBPS/text/chapter 2.xhtml");
}

TEST_F(EpubDocumentTest, MissingPackageThrows) {
	write_epub(chapter_files());
	EXPECT_THROW(epub_document doc(path), parser_exception);
}

TEST(EpubDocumentOpenTest, MissingFileThrows) {
	wxLogNull no_log;
	EXPECT_THROW(epub_document doc("/nonexistent/folio/book.epub"), parser_exception);
}
