#include "analysis/core/overlap.hpp"

#include <algorithm>
#include <cassert>
#include <iterator>

namespace sensamap::analysis::core {

double areaOf(const LogRecord& log, const double cellArea) {
	return static_cast<double>(log.cells.size()) * cellArea;
}

CellSet intersectCells(const std::vector<LogRecord>& records, const std::vector<std::size_t>& members) {
	assert(!members.empty());

	CellSet common = records[members.front()].cells;
	CellSet scratch;
	for (std::size_t i = 1; i < members.size() && !common.empty(); ++i) {
		const CellSet& cells = records[members[i]].cells;

		scratch.clear();
		std::set_intersection(common.begin(), common.end(), cells.begin(), cells.end(), std::back_inserter(scratch));
		common.swap(scratch);
	}
	return common;
}

double overlapArea(const std::vector<LogRecord>& records, const std::vector<std::size_t>& members, const double cellArea) {
	return static_cast<double>(intersectCells(records, members).size()) * cellArea;
}

} // namespace sensamap::analysis::core
