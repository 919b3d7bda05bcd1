#pragma once

#include "analysis/core/analysisError.hpp"
#include "analysis/core/logRecord.hpp"
#include "analysis/core/stability.hpp"

#include <json/value.h>

#include <string>

// JSON shape of an exported log:
// { "log_id": "...", "filename": "<image file>",
//   "feedbackLocation": { "image_path": "...", "exported_at": "...", "coarseness": 80,
//                         "chosenPoints": { "row": [..], "col": [..] },
//                         "segment_size_px": { "w": 6.4, "h": 6.4 } } }   <- segment_size_px is optional
namespace sensamap::storage {

//! Result of decoding one log.
struct ParseResult {
	analysis::core::AnalysisError error{analysis::core::AnalysisError::None};
	std::string reason{};
	analysis::core::RawLog log{};

	bool success() const { return error == analysis::core::AnalysisError::None; }
};

/*! Decode a log from its JSON text.
 * \param [in] text        JSON document.
 * \param [in] storageName Name the log is stored under. Becomes RawLog::filename. If empty, the "filename" field is used.
 * \return     ParseResult with MalformedLog and a reason if the document does not have the expected shape.
 */
ParseResult parseLog(const std::string& text, const std::string& storageName = {});

//! Encode a log into the JSON shape read by parseLog(). Indented by two spaces.
std::string serializeLog(const analysis::core::RawLog& log);

//! Analysis response: status "ok" with the result fields, or status "error" with error code and detail.
Json::Value toResponseJson(const analysis::core::StabilityResult& result);

//! Pretty print a JSON value (two space indentation).
std::string writeJson(const Json::Value& value);

} // namespace sensamap::storage
