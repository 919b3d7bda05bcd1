#include "analysis/core/cellSetExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <optional>

namespace sensamap::analysis::core {

static ExtractionResult fail(const AnalysisError error, std::string reason) {
	return {error, std::move(reason), {}};
}

static std::string describe(const RawLog& log) {
	return log.filename.empty() ? std::format("log '{}'", log.logId) : std::format("'{}'", log.filename);
}

bool isValidSegmentSize(const SegmentSize& size) {
	return size.w > 0.0 && size.h > 0.0 && std::isfinite(size.w) && std::isfinite(size.h);
}

//! Shape checks that do not depend on the rest of the batch.
static std::optional<ExtractionResult> checkShape(const RawLog& log) {
	if (log.coarseness < 1) {
		return fail(AnalysisError::MalformedLog, std::format("{} has invalid coarseness {}.", describe(log), log.coarseness));
	}
	if (log.segmentSize && !isValidSegmentSize(*log.segmentSize)) {
		return fail(AnalysisError::MalformedLog,
		            std::format("{} has a cell size of {}x{} px. Both edges must be positive.", describe(log), log.segmentSize->w, log.segmentSize->h));
	}
	if (log.rows.size() != log.cols.size()) {
		return fail(AnalysisError::MalformedLog,
		            std::format("{} has {} row but {} column coordinates.", describe(log), log.rows.size(), log.cols.size()));
	}
	return std::nullopt;
}

ExtractionResult extractLog(const RawLog& log) {
	if (auto failure = checkShape(log)) {
		return std::move(*failure);
	}

	CellSet cells;
	cells.reserve(log.rows.size());
	for (std::size_t i = 0; i < log.rows.size(); ++i) {
		const GridCell cell{log.rows[i], log.cols[i]};
		if (cell.row < 0 || cell.row >= log.coarseness || cell.col < 0 || cell.col >= log.coarseness) {
			return fail(AnalysisError::CellOutOfRange,
			            std::format("{} marks cell ({}, {}) outside the {}x{} grid.", describe(log), cell.row, cell.col, log.coarseness, log.coarseness));
		}
		cells.push_back(cell);
	}

	std::sort(cells.begin(), cells.end());
	cells.erase(std::unique(cells.begin(), cells.end()), cells.end());

	ExtractionResult result{};
	result.records.push_back(LogRecord{log.logId, log.filename, log.imagePath, log.exportedAt, log.coarseness, std::move(cells), log.segmentSize});
	return result;
}

ExtractionResult extractBatch(const std::vector<RawLog>& batch) {
	if (batch.empty()) {
		return fail(AnalysisError::EmptyBatch, "Select at least one log.");
	}

	for (const RawLog& log: batch) {
		if (auto failure = checkShape(log)) {
			return std::move(*failure);
		}
	}

	// Every log is compared against the first one.
	const RawLog& reference = batch.front();
	const SegmentSize* segmentSize = reference.segmentSize ? &*reference.segmentSize : nullptr;
	for (const RawLog& log: batch) {
		if (log.imagePath != reference.imagePath) {
			return fail(AnalysisError::ImageMismatch,
			            std::format("{} was marked on '{}' but {} on '{}'.", describe(log), log.imagePath, describe(reference), reference.imagePath));
		}
		if (log.coarseness != reference.coarseness) {
			return fail(AnalysisError::CoarsenessMismatch,
			            std::format("{} uses coarseness {} but {} uses {}.", describe(log), log.coarseness, describe(reference), reference.coarseness));
		}
		if (log.segmentSize) {
			if (segmentSize == nullptr) {
				segmentSize = &*log.segmentSize;
			} else if (*segmentSize != *log.segmentSize) {
				return fail(AnalysisError::CellSizeMismatch, std::format("{} uses a cell size of {}x{} px instead of {}x{} px.", describe(log),
				                                                         log.segmentSize->w, log.segmentSize->h, segmentSize->w, segmentSize->h));
			}
		}
	}

	ExtractionResult result{};
	result.records.reserve(batch.size());
	for (const RawLog& log: batch) {
		ExtractionResult single = extractLog(log);
		if (!single.success()) {
			return single;
		}
		result.records.push_back(std::move(single.records.front()));
	}
	return result;
}

double cellAreaFromSegmentSize(const std::vector<LogRecord>& records) {
	const auto it = std::find_if(records.begin(), records.end(), [](const LogRecord& r) { return r.segmentSize.has_value(); });
	if (it == records.end()) {
		return 1.0;
	}
	return it->segmentSize->w * it->segmentSize->h;
}

} // namespace sensamap::analysis::core
