#pragma once

#include "analysis/core/logRecord.hpp"
#include "analysis/core/stability.hpp"

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace sensamap::analysis::core {

//! Drawing parameters shared by all renderers.
struct RenderConfig {
	int cellPx{16};                               //!< Edge length of one grid cell in the output image [px].
	int maxCanvasPx{4096};                        //!< Longest image edge. Cells shrink below cellPx to stay within it [px].
	int borderPx{1};                              //!< Outline thickness of a filled cell [px].
	cv::Scalar background{255, 255, 255};        //!< BGR colour of unmarked cells.
	cv::Scalar heatBorder{51, 51, 51};            //!< BGR outline of heatmap cells.
	cv::Scalar intersectionFill{180, 130, 70};    //!< BGR fill of intersection cells (steel blue).
	cv::Scalar intersectionBorder{118, 82, 26};   //!< BGR outline of intersection cells.
	int reportTilePx{360};                        //!< Edge length of an image tile in buildReport().
};

//! How many logs of the batch marked a cell.
struct CellCount {
	GridCell cell;
	std::size_t count;
};

//! Inclusive bounding box of marked cells in grid coordinates.
struct CellBounds {
	int minRow;
	int maxRow;
	int minCol;
	int maxCol;

	std::int64_t rows() const { return std::int64_t{maxRow} - minRow + 1; }
	std::int64_t cols() const { return std::int64_t{maxCol} - minCol + 1; }
};

//! Number of logs marking each cell, for every cell marked at least once. Sorted by cell.
std::vector<CellCount> countPerCell(const std::vector<LogRecord>& records);

//! Bounding box over all marked cells of the batch. Empty if no log marked anything.
std::optional<CellBounds> markedBounds(const std::vector<LogRecord>& records);

//! Heatmap colour for t in [0, 1] (clamped): light blue (low) -> dark blue (high). BGR.
cv::Scalar heatColour(double t);

/*! Heatmap of the batch: each marked cell is coloured by how many logs marked it (most marked -> darkest).
 *  The image covers the bounding box of all marked cells (see markedBounds), one config.cellPx square per cell.
 *  Large boxes are scaled down so neither edge exceeds config.maxCanvasPx. A cell is always at least one pixel.
 * \return CV_8UC3 image. 1x1 background image if nothing is marked.
 */
cv::Mat renderHeatmap(const std::vector<LogRecord>& records, const RenderConfig& config = RenderConfig{});

/*! Cells marked by every listed member, drawn with the same geometry as renderHeatmap().
 * \param [in] members Indices into records. Empty -> all records.
 * \return     CV_8UC3 image. 1x1 background image if nothing is marked.
 */
cv::Mat renderIntersection(const std::vector<LogRecord>& records, const std::vector<std::size_t>& members,
                           const RenderConfig& config = RenderConfig{});

//! Heatmap and best-combination intersection side by side, with a header summarising the result.
cv::Mat buildReport(const std::vector<LogRecord>& records, const StabilityResult& result, const RenderConfig& config = RenderConfig{});

} // namespace sensamap::analysis::core
