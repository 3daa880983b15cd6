#pragma once

#include "events.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fragline {

/*
=============
ParseIsoTimestamp

Parses "YYYY-MM-DDTHH:MM:SS" with an optional fractional part of up to nine
digits and an optional "Z" or "+HH:MM"/"-HH:MM" suffix into a UTC time
point.
=============
*/
std::optional<Timestamp> ParseIsoTimestamp(std::string_view value);

/*
=============
FormatIsoTimestamp

Formats a time point as UTC ISO-8601 with a "Z" suffix. Fractional seconds
are printed only when present, without trailing zeros.
=============
*/
std::string FormatIsoTimestamp(Timestamp timestamp);

} // namespace fragline
