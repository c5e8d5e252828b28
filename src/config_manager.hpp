/* config_manager.hpp - manages reading and writing of the application settings.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <memory>
#include <type_traits>
#include <wx/confbase.h>
#include <wx/fileconf.h>
#include <wx/string.h>

template <typename T>
struct app_setting {
	const char* key;
	T default_value;
};

// Reader preferences kept in Folio.ini under [app]. Reading sessions are stored separately, beside each book.
class config_manager {
public:
	static constexpr app_setting<bool> restore_session{"restore_session", true};
	static constexpr app_setting<bool> save_session{"save_session", true};
	static constexpr app_setting<int> jump_scroll_lines{"jump_scroll_lines", 80};
	static constexpr app_setting<bool> verbose_logging{"verbose_logging", false};
	static constexpr app_setting<int> config_version{"version", 0};

	config_manager() = default;
	~config_manager();
	config_manager(const config_manager&) = delete;
	config_manager& operator=(const config_manager&) = delete;
	config_manager(config_manager&&) = default;
	config_manager& operator=(config_manager&&) = default;
	// Opens path, or Folio.ini in the default location when path is empty.
	bool initialize(const wxString& path = wxEmptyString);
	void flush();
	void shutdown();

	[[nodiscard]] bool is_initialized() const {
		return config != nullptr;
	}

	template <typename T>
	[[nodiscard]] T get(const app_setting<T>& setting) const {
		if (!config) {
			return setting.default_value;
		}
		const wxConfigPathChanger section(config.get(), section_key(setting.key));
		if constexpr (std::is_same_v<T, bool>) {
			return config->ReadBool(setting.key, setting.default_value);
		} else {
			return static_cast<T>(config->ReadLong(setting.key, setting.default_value));
		}
	}

	template <typename T>
	void set(const app_setting<T>& setting, const T& value) {
		if (!config) {
			return;
		}
		const wxConfigPathChanger section(config.get(), section_key(setting.key));
		config->Write(setting.key, value);
	}

private:
	std::unique_ptr<wxFileConfig> config;

	[[nodiscard]] static wxString section_key(const char* key) {
		return wxString("/app/") + key;
	}
	[[nodiscard]] static wxString get_config_path();
	void write_missing_defaults();
};
