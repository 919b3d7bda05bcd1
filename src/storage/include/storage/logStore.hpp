#pragma once

#include "analysis/core/analysisError.hpp"
#include "analysis/core/logRecord.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sensamap::storage {

//! One log available in the store.
struct LogEntry {
	std::filesystem::path path; //!< Full path of the file.
	std::string filename;       //!< Name relative to the store directory (reference key).
	std::string logId;          //!< log_id read from the file.
};

//! Result of loading one or more logs.
struct LoadResult {
	analysis::core::AnalysisError error{analysis::core::AnalysisError::None};
	std::string reason{};
	std::vector<analysis::core::RawLog> logs{}; //!< Loaded logs in request order. Empty on failure.

	bool success() const { return error == analysis::core::AnalysisError::None; }
};

//! Result of writing a log into the store.
struct SaveResult {
	bool success{false};
	std::string filename{}; //!< Stored name on success.
	std::string reason{};   //!< Why writing failed.
};

/*! Directory of exported marking logs (one JSON file per trial).
 *  The store only reads and writes files. Validation of the batch is done by the analysis (extractBatch).
 */
class LogStore {
public:
	explicit LogStore(std::filesystem::path directory);

	const std::filesystem::path& directory() const { return m_directory; }

	//! All *.json logs sorted by filename. Files that cannot be decoded are skipped with a warning.
	std::vector<LogEntry> list() const;

	//! Load a single log. LogUnavailable if it cannot be read, MalformedLog if it cannot be decoded.
	LoadResult load(const std::string& filename) const;

	//! Load all requested logs in order. Fails on the first log that cannot be loaded. Never drops a log.
	LoadResult loadBatch(const std::vector<std::string>& filenames) const;

	/*! Store a new log under a generated name (see makeFilename). exported_at is set to the timestamp.
	 * \param [in] log       Log to store. logId and imageFilename are used for the name.
	 * \param [in] timestamp Export time, formatted as %Y%m%d_%H%M%S.
	 */
	SaveResult save(const analysis::core::RawLog& log, const std::string& timestamp) const;

	//! Store with the current local time as timestamp.
	SaveResult save(const analysis::core::RawLog& log) const;

	//! Copy an external log file into the store after checking that it decodes. Keeps the file name.
	//! Fails if the store already holds a log with that name.
	SaveResult importFile(const std::filesystem::path& source) const;

	//! Storage name of an exported log: <logId>_<imageFilename with ".svg" -> "_svg">_<timestamp>.json
	static std::string makeFilename(const std::string& logId, const std::string& imageFilename, const std::string& timestamp);

	//! Format a point in time as %Y%m%d_%H%M%S (local time).
	static std::string formatTimestamp(std::chrono::system_clock::time_point time);

private:
	std::optional<std::filesystem::path> resolve(const std::string& filename) const; //!< Path inside the store or nothing if it escapes.
	bool ensureDirectory(std::string& reason) const;

private:
	std::filesystem::path m_directory; //!< Root directory of the logs.
};

} // namespace sensamap::storage
