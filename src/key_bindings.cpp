/* key_bindings.cpp - fixed mapping from keys to reader actions.
 *
 * Folio.
 * Copyright (c) 2025 Folio contributors.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "key_bindings.hpp"
#include <algorithm>
#include <optional>
#include <span>

namespace {
constexpr key_binding bindings[] = {
	{'q', book_action::quit},
	{'l', book_action::next_chapter},
	{'h', book_action::previous_chapter},
	{'/', book_action::toggle_menu},
	{'j', book_action::menu_down},
	{'k', book_action::menu_up},
	{'m', book_action::mark},
	{'\'', book_action::jump_to_mark},
	{' ', book_action::jump_scroll},
	{'+', book_action::widen},
	{'-', book_action::narrow},
	{'=', book_action::reset_width},
};
} // namespace

std::span<const key_binding> get_key_bindings() noexcept {
	return bindings;
}

std::optional<book_action> find_action_for_key(int key) noexcept {
	const auto* it = std::ranges::find(bindings, key, &key_binding::key);
	if (it == std::end(bindings)) {
		return std::nullopt;
	}
	return it->action;
}
