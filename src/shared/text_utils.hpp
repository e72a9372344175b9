#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace roundstat {

inline char ToLowerASCII(char c) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 'A' && uc <= 'Z') {
                return static_cast<char>(uc - 'A' + 'a');
        }
        return static_cast<char>(uc);
}

inline char ToUpperASCII(char c) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 'a' && uc <= 'z') {
                return static_cast<char>(uc - 'a' + 'A');
        }
        return static_cast<char>(uc);
}

inline std::string ToUpperCopy(std::string_view text) {
        std::string normalized;
        normalized.reserve(text.size());
        for (char ch : text) {
                normalized.push_back(ToUpperASCII(ch));
        }
        return normalized;
}

/*
=============
TrimNonEmpty

Returns a trimmed view of the input when non-empty after whitespace removal.
=============
*/
inline std::optional<std::string_view> TrimNonEmpty(std::string_view raw)
{
	const size_t start = raw.find_first_not_of(" \t\r\n");
	if (start == std::string_view::npos)
		return std::nullopt;

	const size_t end = raw.find_last_not_of(" \t\r\n");
	return raw.substr(start, end - start + 1);
}

/*
=============
ParseInt64

Attempts to parse the whole string view into a signed integer.
=============
*/
inline std::optional<int64_t> ParseInt64(std::string_view str) {
	const std::optional<std::string_view> trimmed = TrimNonEmpty(str);
	if (!trimmed)
		return std::nullopt;

	int64_t value;
	auto [ptr, ec] = std::from_chars(trimmed->data(), trimmed->data() + trimmed->size(), value);
	if (ec == std::errc() && ptr == trimmed->data() + trimmed->size()) {
		return value;
	}
	return std::nullopt;
}

/*
=============
ParseDouble

Attempts to parse the whole string view into a double.
=============
*/
inline std::optional<double> ParseDouble(std::string_view str) {
	const std::optional<std::string_view> trimmed = TrimNonEmpty(str);
	if (!trimmed)
		return std::nullopt;

	double value;
	auto [ptr, ec] = std::from_chars(trimmed->data(), trimmed->data() + trimmed->size(), value);
	if (ec == std::errc() && ptr == trimmed->data() + trimmed->size()) {
		return value;
	}
	return std::nullopt;
}

/*
=============
CsvEscape

Quotes a text cell when it contains separators, quotes or line breaks.
=============
*/
inline std::string CsvEscape(std::string_view input) {
	if (input.find_first_of(",\"\r\n") == std::string_view::npos)
		return std::string(input);

	std::string output;
	output.reserve(input.size() + 2);
	output.push_back('"');
	for (char c : input) {
		if (c == '"')
			output.push_back('"');
		output.push_back(c);
	}
	output.push_back('"');
	return output;
}

} // namespace roundstat
