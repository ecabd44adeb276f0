/* utils.hpp - utility functions header file.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <wx/stream.h>
#include <wx/string.h>

[[nodiscard]] std::string url_decode(std::string_view encoded);
[[nodiscard]] std::string convert_to_utf8(const std::string& input);
[[nodiscard]] std::string read_stream(wxInputStream& stream);
[[nodiscard]] bool read_file(const wxString& path, std::string& content);
// Number of code points in a UTF-8 string.
[[nodiscard]] size_t utf8_length(std::string_view input) noexcept;
[[nodiscard]] std::string strip_fragment(std::string_view href);
