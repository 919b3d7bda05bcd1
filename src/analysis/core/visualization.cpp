#include "analysis/core/visualization.hpp"

#include "analysis/core/overlap.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <map>
#include <numeric>
#include <string>

namespace sensamap::analysis::core {

std::vector<CellCount> countPerCell(const std::vector<LogRecord>& records) {
	std::map<GridCell, std::size_t> counts;
	for (const LogRecord& record: records) {
		for (const GridCell& cell: record.cells) {
			++counts[cell];
		}
	}

	std::vector<CellCount> result;
	result.reserve(counts.size());
	for (const auto& [cell, count]: counts) {
		result.push_back({cell, count});
	}
	return result;
}

std::optional<CellBounds> markedBounds(const std::vector<LogRecord>& records) {
	std::optional<CellBounds> bounds;
	for (const LogRecord& record: records) {
		for (const GridCell& cell: record.cells) {
			if (!bounds) {
				bounds = CellBounds{cell.row, cell.row, cell.col, cell.col};
				continue;
			}
			bounds->minRow = std::min(bounds->minRow, cell.row);
			bounds->maxRow = std::max(bounds->maxRow, cell.row);
			bounds->minCol = std::min(bounds->minCol, cell.col);
			bounds->maxCol = std::max(bounds->maxCol, cell.col);
		}
	}
	return bounds;
}

cv::Scalar heatColour(double t) {
	t = std::clamp(t, 0.0, 1.0);
	const int r = static_cast<int>(240.0 * (1.0 - t) + 33.0 * t);
	const int g = static_cast<int>(248.0 * (1.0 - t) + 150.0 * t);
	const int b = static_cast<int>(255.0 * (1.0 - t) + 243.0 * t);
	return {static_cast<double>(b), static_cast<double>(g), static_cast<double>(r)};
}

//! Pixel layout of the bounding box on the canvas.
struct CanvasGeometry {
	CellBounds bounds;
	double scale; //!< Pixels per cell. Below 1 for very large boxes.
	int width;
	int height;
};

static int canvasExtent(const std::int64_t cells, const double scale, const int maxPx) {
	const auto px = static_cast<std::int64_t>(std::ceil(static_cast<double>(cells) * scale));
	return static_cast<int>(std::clamp<std::int64_t>(px, 1, maxPx));
}

static CanvasGeometry makeGeometry(const CellBounds& bounds, const RenderConfig& config) {
	const int maxPx      = std::max(1, config.maxCanvasPx);
	const double longest = static_cast<double>(std::max(bounds.rows(), bounds.cols()));
	const double scale   = std::min(static_cast<double>(std::max(1, config.cellPx)), static_cast<double>(maxPx) / longest);
	return {bounds, scale, canvasExtent(bounds.cols(), scale, maxPx), canvasExtent(bounds.rows(), scale, maxPx)};
}

//! Blank canvas covering the bounding box. 1x1 if there are no bounds.
static cv::Mat makeCanvas(const std::optional<CanvasGeometry>& geometry, const RenderConfig& config) {
	if (!geometry) {
		return cv::Mat(1, 1, CV_8UC3, config.background);
	}
	return cv::Mat(geometry->height, geometry->width, CV_8UC3, config.background);
}

static int pixelEdge(const std::int64_t offset, const double scale) {
	return static_cast<int>(std::floor(static_cast<double>(offset) * scale));
}

//! Canvas rectangle of a cell. Never empty and never outside the canvas.
static cv::Rect cellRect(const CanvasGeometry& geometry, const GridCell& cell) {
	const std::int64_t dx = std::int64_t{cell.col} - geometry.bounds.minCol;
	const std::int64_t dy = std::int64_t{cell.row} - geometry.bounds.minRow;

	const int x0 = std::min(pixelEdge(dx, geometry.scale), geometry.width - 1);
	const int y0 = std::min(pixelEdge(dy, geometry.scale), geometry.height - 1);
	const int x1 = std::clamp(pixelEdge(dx + 1, geometry.scale), x0 + 1, geometry.width);
	const int y1 = std::clamp(pixelEdge(dy + 1, geometry.scale), y0 + 1, geometry.height);
	return cv::Rect(x0, y0, x1 - x0, y1 - y0);
}

static void drawCell(cv::Mat& canvas, const CanvasGeometry& geometry, const GridCell& cell, const cv::Scalar& fill, const cv::Scalar& border,
                     const RenderConfig& config) {
	const cv::Rect rect = cellRect(geometry, cell);
	cv::rectangle(canvas, rect, fill, cv::FILLED);
	// Outlines only where they leave some fill visible.
	if (config.borderPx > 0 && rect.width > 2 * config.borderPx && rect.height > 2 * config.borderPx) {
		cv::rectangle(canvas, rect, border, config.borderPx);
	}
}

static std::optional<CanvasGeometry> layout(const std::vector<LogRecord>& records, const RenderConfig& config) {
	const auto bounds = markedBounds(records);
	if (!bounds) {
		return std::nullopt;
	}
	return makeGeometry(*bounds, config);
}

cv::Mat renderHeatmap(const std::vector<LogRecord>& records, const RenderConfig& config) {
	const auto geometry = layout(records, config);
	cv::Mat canvas      = makeCanvas(geometry, config);
	if (!geometry) {
		return canvas;
	}

	const std::vector<CellCount> counts = countPerCell(records);
	const std::size_t maxCount =
	        std::accumulate(counts.begin(), counts.end(), std::size_t{0}, [](std::size_t m, const CellCount& c) { return std::max(m, c.count); });

	for (const CellCount& entry: counts) {
		const double t = static_cast<double>(entry.count) / static_cast<double>(maxCount);
		drawCell(canvas, *geometry, entry.cell, heatColour(t), config.heatBorder, config);
	}
	return canvas;
}

cv::Mat renderIntersection(const std::vector<LogRecord>& records, const std::vector<std::size_t>& members, const RenderConfig& config) {
	const auto geometry = layout(records, config);
	cv::Mat canvas      = makeCanvas(geometry, config);
	if (!geometry) {
		return canvas;
	}

	std::vector<std::size_t> selection = members;
	if (selection.empty()) {
		selection.resize(records.size());
		std::iota(selection.begin(), selection.end(), std::size_t{0});
	}

	for (const GridCell& cell: intersectCells(records, selection)) {
		drawCell(canvas, *geometry, cell, config.intersectionFill, config.intersectionBorder, config);
	}
	return canvas;
}

//! Scale an image into a square tile below a label bar. Nearest neighbour keeps the cell edges sharp.
static void placeTile(cv::Mat& mosaic, const cv::Rect& area, const cv::Mat& image, const std::string& label) {
	static constexpr int LABEL_H = 28;
	static constexpr int PAD     = 4;

	cv::Mat cell = mosaic(area);
	cv::rectangle(cell, cv::Rect(0, 0, cell.cols, LABEL_H), cv::Scalar(0, 0, 0), cv::FILLED);
	cv::putText(cell, label, cv::Point(PAD, 20), cv::FONT_HERSHEY_SIMPLEX, 0.55, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);

	const int availW = std::max(1, cell.cols - 2 * PAD);
	const int availH = std::max(1, cell.rows - LABEL_H - 2 * PAD);
	const double scale =
	        std::min(static_cast<double>(availW) / static_cast<double>(image.cols), static_cast<double>(availH) / static_cast<double>(image.rows));
	const int w = std::clamp(static_cast<int>(std::lround(image.cols * scale)), 1, availW);
	const int h = std::clamp(static_cast<int>(std::lround(image.rows * scale)), 1, availH);

	cv::Mat resized;
	cv::resize(image, resized, cv::Size(w, h), 0.0, 0.0, cv::INTER_NEAREST);

	const int x0 = PAD + (availW - w) / 2;
	const int y0 = LABEL_H + PAD + (availH - h) / 2;
	resized.copyTo(cell(cv::Rect(x0, y0, w, h)));
}

cv::Mat buildReport(const std::vector<LogRecord>& records, const StabilityResult& result, const RenderConfig& config) {
	static constexpr int HEADER_H = 34;
	static const cv::Scalar BG(20, 20, 20);

	const int tile = std::max(64, config.reportTilePx);
	cv::Mat mosaic(HEADER_H + tile, 2 * tile, CV_8UC3, BG);

	std::string header;
	if (result.success()) {
		header = std::format("k={}  stability {:.1f}%  overlap {:g}  best day {:g}", result.k, result.stabilityScore * 100.0, result.stableOverlapArea,
		                     result.bestDayArea);
	} else {
		header = std::format("Error: {}", toString(result.error));
	}
	cv::putText(mosaic, header, cv::Point(8, HEADER_H - 10), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);

	placeTile(mosaic, cv::Rect(0, HEADER_H, tile, tile), renderHeatmap(records, config), std::format("Heatmap ({} logs)", records.size()));

	const std::string label = result.bestCombination.empty() ? std::string("Intersection (all)")
	                                                         : std::format("Intersection ({} logs)", result.bestCombination.size());
	placeTile(mosaic, cv::Rect(tile, HEADER_H, tile, tile), renderIntersection(records, result.bestIndices, config), label);

	return mosaic;
}

} // namespace sensamap::analysis::core
