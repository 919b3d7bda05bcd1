#pragma once

#include <compare>
#include <vector>

namespace sensamap {

//! Single square of the discretised marking grid.
struct GridCell {
	int row; //!< Row index, 0 at the top of the image.
	int col; //!< Column index, 0 at the left of the image.

	auto operator<=>(const GridCell&) const = default;
};

//! Sorted list of unique grid cells.
using CellSet = std::vector<GridCell>;

} // namespace sensamap
