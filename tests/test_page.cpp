/* test_page.cpp - chapter and table of contents page tests.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "constants.hpp"
#include "fakes.hpp"
#include "page.hpp"
#include <gtest/gtest.h>
#include <string>

namespace {
wxString numbered_lines(int count) {
	wxString text;
	for (int i = 0; i < count; ++i) {
		text << "line " << i << '\n';
	}
	return text;
}
} // namespace

class ChapterTest : public ::testing::Test {
protected:
	fake_host host;
	fake_text_surface surface;
	chapter ch{surface, "ch.xhtml", 1, numbered_lines(100), "\"Two\" (25.00%)", [this](std::function<void()> fn) {
		host.queue_update(std::move(fn));
	}};
};

TEST_F(ChapterTest, ShowsLabelBeforeFirstUpdate) {
	EXPECT_EQ(surface.status, "\"Two\" (25.00%)");
	EXPECT_EQ(surface.total_lines, 100);
	EXPECT_EQ(ch.index(), 1);
	EXPECT_EQ(ch.url(), "ch.xhtml");
}

TEST_F(ChapterTest, RepaintQueuesProgressUpdate) {
	surface.repaint();
	ASSERT_EQ(host.queued.size(), 1u);
	host.run_queued();
	EXPECT_EQ(surface.status, "\"Two\" (25.00%) - lines 1-20/100");
}

TEST_F(ChapterTest, ProgressRecomputesOncePerOffset) {
	surface.repaint();
	surface.repaint();
	surface.repaint();
	const int before = surface.status_updates;
	host.run_queued();
	EXPECT_EQ(surface.status_updates, before + 1);
	surface.repaint();
	host.run_queued();
	EXPECT_EQ(surface.status_updates, before + 1);
	ch.set_offset(30);
	surface.repaint();
	host.run_queued();
	EXPECT_EQ(surface.status_updates, before + 2);
	EXPECT_EQ(surface.status, "\"Two\" (25.00%) - lines 31-50/100");
}

TEST_F(ChapterTest, ResizeRefreshesVisibleRange) {
	surface.repaint();
	host.run_queued();
	EXPECT_EQ(surface.status, "\"Two\" (25.00%) - lines 1-20/100");
	surface.visible_height = 35;
	surface.repaint();
	host.run_queued();
	EXPECT_EQ(surface.status, "\"Two\" (25.00%) - lines 1-35/100");
}

TEST_F(ChapterTest, OffsetPastEndClampsToLastRow) {
	ch.set_offset(500);
	EXPECT_EQ(ch.get_offset(), 99);
}

TEST_F(ChapterTest, LastLineIsClampedToTotal) {
	ch.set_offset(90);
	surface.repaint();
	host.run_queued();
	EXPECT_EQ(surface.status, "\"Two\" (25.00%) - lines 91-100/100");
}

TEST_F(ChapterTest, WidthChangeInvalidatesMemo) {
	surface.repaint();
	host.run_queued();
	const int before = surface.status_updates;
	ch.set_width(60);
	EXPECT_EQ(surface.width, 60);
	surface.repaint();
	host.run_queued();
	EXPECT_EQ(surface.status_updates, before + 1);
}

TEST_F(ChapterTest, NegativeOffsetIsClamped) {
	ch.set_offset(-5);
	EXPECT_EQ(ch.get_offset(), 0);
}

TEST(ChapterEmptyTest, EmptyChapterShowsLabelOnly) {
	fake_host host;
	fake_text_surface surface;
	chapter ch{surface, "empty.xhtml", 0, wxEmptyString, "\"Empty\" (0.00%)", [&host](std::function<void()> fn) {
		host.queue_update(std::move(fn));
	}};
	surface.repaint();
	host.run_queued();
	EXPECT_EQ(surface.status, "\"Empty\" (0.00%)");
}

TEST(TableOfContentsTest, SelectionMovesWithinBounds) {
	fake_list_surface list;
	list.add_item("One", [] {});
	list.add_item("Two", [] {});
	list.add_item("Three", [] {});
	table_of_contents toc{list, TOC_URL};
	EXPECT_EQ(toc.index(), TOC_INDEX);
	EXPECT_EQ(toc.url(), TOC_URL);
	toc.select_previous();
	EXPECT_EQ(toc.selected(), 0);
	toc.select_next();
	toc.select_next();
	EXPECT_EQ(toc.selected(), 2);
	toc.select_next();
	EXPECT_EQ(toc.selected(), 2);
	toc.set_selected(1);
	EXPECT_EQ(toc.selected(), 1);
}

TEST(PageVariantTest, DispatchesToBothShapes) {
	fake_list_surface list;
	table_of_contents toc{list, TOC_URL};
	fake_text_surface surface;
	chapter ch{surface, "c.xhtml", 3, "text\n", "label", [](std::function<void()>) {}};
	const page toc_page{&toc};
	const page chapter_page{&ch};
	EXPECT_EQ(page_index(toc_page), TOC_INDEX);
	EXPECT_EQ(page_index(chapter_page), 3);
	EXPECT_EQ(page_url(toc_page), TOC_URL);
	EXPECT_EQ(page_url(chapter_page), "c.xhtml");
	set_page_width(toc_page, 42);
	set_page_width(chapter_page, 42);
	EXPECT_EQ(list.width, 42);
	EXPECT_EQ(surface.width, 42);
}

TEST(ProgressLabelTest, FormatsNameAndPercent) {
	EXPECT_EQ(format_progress_label("  Intro ", 0, 4), "\"Intro\" (0.00%)");
	EXPECT_EQ(format_progress_label("Middle", 1, 3), "\"Middle\" (33.33%)");
	EXPECT_EQ(format_progress_label("End", 2, 4), "\"End\" (50.00%)");
}
