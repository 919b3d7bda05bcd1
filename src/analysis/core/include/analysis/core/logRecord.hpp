#pragma once

#include "model/gridCell.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sensamap::analysis::core {

//! Physical size of one grid cell in image pixels.
struct SegmentSize {
	double w; //!< Cell width [px].
	double h; //!< Cell height [px].

	bool operator==(const SegmentSize&) const = default;
};

//! One exported marking session as it was decoded from storage. Nothing is validated yet.
struct RawLog {
	std::string logId;         //!< Identifier the user typed at export time. Not unique.
	std::string filename;      //!< Storage name of the log. Used as reference key in results.
	std::string imageFilename; //!< Name of the marked image file as sent by the exporter.
	std::string imagePath;     //!< Image the marking was done on.
	std::string exportedAt;
	int coarseness{0}; //!< Grid divisions per axis.

	std::vector<int> rows; //!< Row coordinates of the marked cells (parallel to cols).
	std::vector<int> cols; //!< Column coordinates of the marked cells (parallel to rows).

	std::optional<SegmentSize> segmentSize{}; //!< Cell size in pixels, if the exporter recorded it.
};

//! Validated trial with canonical cell set. Read-only input to the stability computation.
struct LogRecord {
	std::string logId;
	std::string filename;
	std::string imagePath;
	std::string exportedAt;
	int coarseness{0};
	CellSet cells{}; //!< Sorted, duplicate-free cells within [0, coarseness)^2.
	std::optional<SegmentSize> segmentSize{};
};

} // namespace sensamap::analysis::core
