#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <string_view>

namespace fragline {

/*
=============
TrimView

Returns the input without leading and trailing whitespace.
=============
*/
inline std::string_view TrimView(std::string_view raw)
{
	const size_t start = raw.find_first_not_of(" \t\r\n");
	if (start == std::string_view::npos)
		return {};

	const size_t end = raw.find_last_not_of(" \t\r\n");
	return raw.substr(start, end - start + 1);
}

/*
=============
TrimNonEmpty

Returns a trimmed view of the input when non-empty after whitespace removal.
=============
*/
inline std::optional<std::string_view> TrimNonEmpty(std::string_view raw)
{
	const std::string_view trimmed = TrimView(raw);
	if (trimmed.empty())
		return std::nullopt;

	return trimmed;
}

/*
=============
ParseInt

Parses the whole view as a base-10 integer.
=============
*/
template<typename T>
inline std::optional<T> ParseInt(std::string_view text)
{
	T value{};
	const char* begin = text.data();
	const char* end = text.data() + text.size();
	const auto result = std::from_chars(begin, end, value);
	if (result.ec != std::errc() || result.ptr != end || text.empty())
		return std::nullopt;

	return value;
}

/*
=============
ParseDouble

Parses the whole view as a floating point value. The decimal separator is
always '.', whatever the global locale says.
=============
*/
inline std::optional<double> ParseDouble(std::string_view text)
{
	double value = 0.0;
	const char* begin = text.data();
	const char* end = text.data() + text.size();
	const auto result = std::from_chars(begin, end, value, std::chars_format::fixed);
	if (result.ec != std::errc() || result.ptr != end || text.empty())
		return std::nullopt;

	return value;
}

} // namespace fragline
