#pragma once

#include "analysis/core/logRecord.hpp"

#include <cstddef>
#include <vector>

namespace sensamap::analysis::core {

//! Marked area of a single log: number of cells times the area of one cell.
double areaOf(const LogRecord& log, double cellArea = 1.0);

/*! Cells marked by every member of a subset.
 * \param [in] records Canonical records of the batch.
 * \param [in] members Indices into records. Must not be empty and must be in range.
 * \return     Sorted intersection of the members' cell sets.
 */
CellSet intersectCells(const std::vector<LogRecord>& records, const std::vector<std::size_t>& members);

//! Area of the cells common to all members (see intersectCells). Equals areaOf() for a single member.
double overlapArea(const std::vector<LogRecord>& records, const std::vector<std::size_t>& members, double cellArea = 1.0);

} // namespace sensamap::analysis::core
