#pragma once

#include "events.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fragline {

inline constexpr size_t kDefaultAccoladeThreshold = 6;

/*
=================
AccoladeAccumulator

Collects the end-of-game ACCOLADE lines that precede a GAME_OVER. A game
counts as complete only when at least `threshold` accolades parsed; a line
that fails the grammar is skipped and simply does not count.
=================
*/
class AccoladeAccumulator {
public:
	explicit AccoladeAccumulator(size_t threshold = kDefaultAccoladeThreshold);

	// Parses lines[start, end) in log order.
	std::vector<AccoladeRecord> Collect(const std::vector<std::string>& lines, size_t start, size_t end) const;

	bool IsComplete(const std::vector<AccoladeRecord>& accolades) const;
	size_t Threshold() const { return threshold_; }

private:
	size_t threshold_;
};

} // namespace fragline
