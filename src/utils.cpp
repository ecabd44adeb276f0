/* utils.cpp - miscellaneous helpers.
 *
 * Spinepoint.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include <sstream>
#include <string>
#include <string_view>
#include <wx/filefn.h>
#include <wx/strconv.h>
#include <wx/string.h>
#include <wx/wfstream.h>

namespace {
constexpr unsigned char UTF8_CONTINUATION_MASK = 0xC0;
constexpr unsigned char UTF8_CONTINUATION_BITS = 0x80;
} // namespace

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
		char c = encoded[i];
		if (c == '%') {
			if (i + 2 < encoded.size()) {
				int hi = hex(encoded[i + 1]);
				int lo = hex(encoded[i + 2]);
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

std::string convert_to_utf8(const std::string& input) {
	const auto* data = reinterpret_cast<const unsigned char*>(input.data());
	const size_t len = input.length();
	if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
		return input.substr(3);
	}
	// Content documents are UTF-8 or UTF-16; anything without a UTF-16 mark is passed through.
	if (len < 2 || !((data[0] == 0xFF && data[1] == 0xFE) || (data[0] == 0xFE && data[1] == 0xFF))) {
		return input;
	}
	wxMBConvUTF16LE little_endian;
	wxMBConvUTF16BE big_endian;
	const wxMBConv& conv = data[0] == 0xFF ? static_cast<const wxMBConv&>(little_endian) : big_endian;
	const wxString content(input.data() + 2, conv, len - 2);
	return content.empty() ? input : content.utf8_string();
}

std::string read_stream(wxInputStream& stream) {
	constexpr int buffer_size = 4096;
	std::ostringstream buffer;
	char buf[buffer_size];
	while (stream.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(stream.LastRead()));
	}
	return buffer.str();
}

bool read_file(const wxString& path, std::string& content) {
	if (!wxFileExists(path)) {
		return false;
	}
	wxFileInputStream file_stream(path);
	if (!file_stream.IsOk()) {
		return false;
	}
	content = read_stream(file_stream);
	return file_stream.GetLastError() == wxSTREAM_NO_ERROR || file_stream.GetLastError() == wxSTREAM_EOF;
}

size_t utf8_length(std::string_view input) noexcept {
	size_t count = 0;
	for (const char ch : input) {
		if ((static_cast<unsigned char>(ch) & UTF8_CONTINUATION_MASK) != UTF8_CONTINUATION_BITS) {
			++count;
		}
	}
	return count;
}

std::string strip_fragment(std::string_view href) {
	const size_t hash_pos = href.find('#');
	return std::string(hash_pos == std::string_view::npos ? href : href.substr(0, hash_pos));
}
