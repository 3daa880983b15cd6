#include "log_time.hpp"

#include "../shared/string_utils.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fragline {
namespace {

/*
=============
ToUtcSeconds

Converts a broken-down UTC time into seconds since the epoch.
=============
*/
std::time_t ToUtcSeconds(std::tm& tm)
{
#if defined(_WIN32)
	return _mkgmtime(&tm);
#else
	return timegm(&tm);
#endif
}

} // namespace

std::optional<Timestamp> ParseIsoTimestamp(std::string_view value)
{
	if (value.size() < 19)
		return std::nullopt;

	std::tm tm = {};
	std::istringstream stream{ std::string(value.substr(0, 19)) };
	stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
	if (stream.fail())
		return std::nullopt;

	const std::time_t seconds = ToUtcSeconds(tm);
	if (seconds < 0)
		return std::nullopt;

	size_t pos = 19;
	int64_t nanos = 0;
	if (pos < value.size() && value[pos] == '.') {
		++pos;
		int digits = 0;
		while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
			if (digits < 9) {
				nanos = nanos * 10 + (value[pos] - '0');
				++digits;
			}
			++pos;
		}
		if (digits == 0)
			return std::nullopt;
		for (; digits < 9; ++digits)
			nanos *= 10;
	}

	int64_t offsetSeconds = 0;
	if (pos < value.size()) {
		const char marker = value[pos];
		if (marker == 'Z' || marker == 'z') {
			++pos;
		}
		else if (marker == '+' || marker == '-') {
			if (value.size() - pos != 6 || value[pos + 3] != ':')
				return std::nullopt;
			const auto hours = ParseInt<int>(value.substr(pos + 1, 2));
			const auto minutes = ParseInt<int>(value.substr(pos + 4, 2));
			if (!hours || !minutes)
				return std::nullopt;
			offsetSeconds = (*hours * 3600 + *minutes * 60) * (marker == '+' ? 1 : -1);
			pos = value.size();
		}
		if (pos != value.size())
			return std::nullopt;
	}

	Timestamp result = std::chrono::system_clock::from_time_t(seconds);
	result += std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
	result -= std::chrono::seconds(offsetSeconds);
	return result;
}

std::string FormatIsoTimestamp(Timestamp timestamp)
{
	const auto whole = std::chrono::floor<std::chrono::seconds>(timestamp);
	const int64_t nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(timestamp - whole).count();
	const std::time_t seconds = std::chrono::system_clock::to_time_t(whole);

	std::tm tm = {};
#if defined(_WIN32)
	gmtime_s(&tm, &seconds);
#else
	gmtime_r(&seconds, &tm);
#endif

	std::ostringstream out;
	out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
	if (nanos > 0) {
		std::ostringstream fraction;
		fraction << std::setw(9) << std::setfill('0') << nanos;
		std::string digits = fraction.str();
		digits.erase(digits.find_last_not_of('0') + 1);
		out << '.' << digits;
	}
	out << 'Z';
	return out.str();
}

} // namespace fragline
