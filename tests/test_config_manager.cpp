/* test_config_manager.cpp - application settings tests.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include <gtest/gtest.h>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/utils.h>

class ConfigManagerTest : public ::testing::Test {
protected:
	wxString path;

	void SetUp() override {
		path = wxFileName(wxFileName::GetTempDir(), wxString::Format("folio_%lu_settings.ini", wxGetProcessId())).GetFullPath();
		if (wxFileName::FileExists(path)) {
			wxRemoveFile(path);
		}
	}

	void TearDown() override {
		if (wxFileName::FileExists(path)) {
			wxRemoveFile(path);
		}
	}
};

TEST_F(ConfigManagerTest, UninitializedReturnsDefaults) {
	const config_manager config;
	EXPECT_FALSE(config.is_initialized());
	EXPECT_TRUE(config.get(config_manager::restore_session));
	EXPECT_EQ(config.get(config_manager::jump_scroll_lines), 80);
}

TEST_F(ConfigManagerTest, NewFileGetsDefaults) {
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_TRUE(config.get(config_manager::restore_session));
	EXPECT_TRUE(config.get(config_manager::save_session));
	EXPECT_FALSE(config.get(config_manager::verbose_logging));
	EXPECT_EQ(config.get(config_manager::jump_scroll_lines), 80);
	EXPECT_EQ(config.get(config_manager::config_version), 1);
}

TEST_F(ConfigManagerTest, ChangesSurviveReopen) {
	{
		config_manager config;
		ASSERT_TRUE(config.initialize(path));
		config.set(config_manager::save_session, false);
		config.set(config_manager::jump_scroll_lines, 40);
		config.shutdown();
	}
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_FALSE(config.get(config_manager::save_session));
	EXPECT_EQ(config.get(config_manager::jump_scroll_lines), 40);
	EXPECT_TRUE(config.get(config_manager::restore_session));
}
