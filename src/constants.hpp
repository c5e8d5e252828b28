/* constants.hpp - contains app-wide constants.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <wx/colour.h>
#include <wx/string.h>

inline const wxString APP_NAME = "Folio";
inline const wxString APP_VERSION = "0.1";
inline const wxString SESSION_FILE_SUFFIX = ".folio.ini";
inline const char* const TOC_URL = "TOC";

inline constexpr int TOC_INDEX = -1;
inline constexpr int NO_MARK = -1;
inline constexpr int DEFAULT_WIDTH = 80;
inline constexpr int MIN_WIDTH = 5;
inline constexpr int WIDTH_STEP = 5;
inline constexpr int JUMP_SCROLL_LINES = 80;
inline constexpr int SESSION_FORMAT_VERSION = 1;

inline constexpr int EXIT_USAGE = 2;
inline constexpr int EXIT_RUNTIME_FAILURE = 1;

inline constexpr int DIALOG_PADDING = 10;
inline constexpr int TITLE_ROWS = 2;

inline const wxColour BACKGROUND_COLOUR{0x00, 0x28, 0x33};
inline const wxColour FOREGROUND_COLOUR{0xD0, 0xD0, 0xD0};
