/* test_session_state.cpp - session file tests.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "session_state.hpp"
#include <cstring>
#include <gtest/gtest.h>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/utils.h>
#include <wx/wfstream.h>

class SessionFileTest : public ::testing::Test {
protected:
	wxString book_path;

	void SetUp() override {
		const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
		book_path = wxFileName(wxFileName::GetTempDir(), wxString::Format("folio_%lu_%s.epub", wxGetProcessId(), info->name())).GetFullPath();
		remove_session();
	}

	void TearDown() override {
		remove_session();
	}

	void remove_session() const {
		const wxString path = get_session_path(book_path);
		if (wxFileName::FileExists(path)) {
			wxRemoveFile(path);
		}
	}

	void write_session(const char* content) const {
		wxFileOutputStream out(get_session_path(book_path));
		ASSERT_TRUE(out.IsOk());
		out.Write(content, strlen(content));
		ASSERT_TRUE(out.Close());
	}
};

TEST_F(SessionFileTest, PathIsHiddenFileBesideBook) {
	const wxFileName session{get_session_path("/books/novel.epub")};
	EXPECT_EQ(session.GetFullName(), ".novel.epub.folio.ini");
	EXPECT_EQ(session.GetPath(wxPATH_GET_VOLUME, wxPATH_UNIX), "/books");
}

TEST_F(SessionFileTest, MissingFileMeansNoSession) {
	EXPECT_FALSE(load_session(book_path).has_value());
}

TEST_F(SessionFileTest, SaveThenLoadReproducesState) {
	session_state state;
	state.page = 3;
	state.width = 75;
	state.offsets = {{0, 12}, {3, 140}};
	save_session(book_path, state);
	const auto loaded = load_session(book_path);
	ASSERT_TRUE(loaded.has_value());
	EXPECT_EQ(*loaded, state);
}

TEST_F(SessionFileTest, TocPageRoundTrips) {
	session_state state;
	state.page = -1;
	save_session(book_path, state);
	const auto loaded = load_session(book_path);
	ASSERT_TRUE(loaded.has_value());
	EXPECT_EQ(loaded->page, -1);
	EXPECT_EQ(loaded->width, DEFAULT_WIDTH);
	EXPECT_TRUE(loaded->offsets.empty());
}

TEST_F(SessionFileTest, ZeroOffsetsAreNotWritten) {
	session_state state;
	state.page = 0;
	state.offsets = {{0, 0}, {1, 5}};
	save_session(book_path, state);
	const auto loaded = load_session(book_path);
	ASSERT_TRUE(loaded.has_value());
	EXPECT_EQ(loaded->offsets.size(), 1u);
	EXPECT_EQ(loaded->offsets.at(1), 5);
}

TEST_F(SessionFileTest, MissingPageThrows) {
	write_session("version=1\nwidth=80\n");
	EXPECT_THROW(static_cast<void>(load_session(book_path)), session_error);
}

TEST_F(SessionFileTest, MissingWidthThrows) {
	write_session("page=2\n");
	EXPECT_THROW(static_cast<void>(load_session(book_path)), session_error);
}

TEST_F(SessionFileTest, BadOffsetEntryThrows) {
	write_session("page=2\nwidth=80\n[offsets]\nfirst=10\n");
	EXPECT_THROW(static_cast<void>(load_session(book_path)), session_error);
}

TEST_F(SessionFileTest, HandWrittenFileLoads) {
	write_session("version=1\npage=1\nwidth=60\n[offsets]\n1=33\n4=7\n");
	const auto loaded = load_session(book_path);
	ASSERT_TRUE(loaded.has_value());
	EXPECT_EQ(loaded->page, 1);
	EXPECT_EQ(loaded->width, 60);
	EXPECT_EQ(loaded->offsets.at(1), 33);
	EXPECT_EQ(loaded->offsets.at(4), 7);
}

TEST(SessionErrorTest, DisplayMessageNamesFile) {
	const session_error error("broken", "/tmp/.x.epub.folio.ini");
	EXPECT_EQ(error.get_display_message(), "/tmp/.x.epub.folio.ini: broken");
	EXPECT_EQ(error.get_file_path(), "/tmp/.x.epub.folio.ini");
}
