/* test_key_bindings.cpp - key map tests.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "key_bindings.hpp"
#include <gtest/gtest.h>
#include <set>

TEST(KeyBindingsTest, MapsReaderKeys) {
	EXPECT_EQ(find_action_for_key('q'), book_action::quit);
	EXPECT_EQ(find_action_for_key('l'), book_action::next_chapter);
	EXPECT_EQ(find_action_for_key('h'), book_action::previous_chapter);
	EXPECT_EQ(find_action_for_key('/'), book_action::toggle_menu);
	EXPECT_EQ(find_action_for_key('j'), book_action::menu_down);
	EXPECT_EQ(find_action_for_key('k'), book_action::menu_up);
	EXPECT_EQ(find_action_for_key('m'), book_action::mark);
	EXPECT_EQ(find_action_for_key('\''), book_action::jump_to_mark);
	EXPECT_EQ(find_action_for_key(' '), book_action::jump_scroll);
	EXPECT_EQ(find_action_for_key('+'), book_action::widen);
	EXPECT_EQ(find_action_for_key('-'), book_action::narrow);
	EXPECT_EQ(find_action_for_key('='), book_action::reset_width);
}

TEST(KeyBindingsTest, UnmappedKeysHaveNoAction) {
	EXPECT_FALSE(find_action_for_key('Q').has_value());
	EXPECT_FALSE(find_action_for_key('x').has_value());
	EXPECT_FALSE(find_action_for_key(0).has_value());
}

TEST(KeyBindingsTest, EveryKeyIsBoundOnce) {
	std::set<int> keys;
	for (const auto& binding : get_key_bindings()) {
		EXPECT_TRUE(keys.insert(binding.key).second) << "key bound twice: " << binding.key;
	}
	EXPECT_EQ(keys.size(), 12u);
}
