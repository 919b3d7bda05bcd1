#include "storage/logCodec.hpp"

#include "analysis/core/cellSetExtractor.hpp"

#include <json/json.h>

#include <format>
#include <memory>

namespace sensamap::storage {

using analysis::core::AnalysisError;
using analysis::core::RawLog;

static ParseResult malformed(std::string reason) {
	ParseResult result{};
	result.error  = AnalysisError::MalformedLog;
	result.reason = std::move(reason);
	return result;
}

//! Read an array of integers. False if the value is not an array or contains anything else.
static bool readIntArray(const Json::Value& value, std::vector<int>& out) {
	if (!value.isArray()) {
		return false;
	}
	out.clear();
	out.reserve(value.size());
	for (const Json::Value& item: value) {
		if (!item.isInt()) {
			return false;
		}
		out.push_back(item.asInt());
	}
	return true;
}

//! String member or empty if the member is missing. False if it exists but is not a string.
static bool readOptionalString(const Json::Value& object, const char* key, std::string& out) {
	const Json::Value& value = object[key];
	if (value.isNull()) {
		out.clear();
		return true;
	}
	if (!value.isString()) {
		return false;
	}
	out = value.asString();
	return true;
}

ParseResult parseLog(const std::string& text, const std::string& storageName) {
	const std::string name = storageName.empty() ? std::string("log") : std::format("'{}'", storageName);

	Json::CharReaderBuilder builder;
	const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

	Json::Value root;
	std::string errors;
	if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
		return malformed(std::format("{} is not valid JSON: {}", name, errors));
	}
	if (!root.isObject()) {
		return malformed(std::format("{} is not a JSON object.", name));
	}

	const Json::Value& logId = root["log_id"];
	if (!logId.isString()) {
		return malformed(std::format("{} has no log_id.", name));
	}

	const Json::Value& location = root["feedbackLocation"];
	if (!location.isObject()) {
		return malformed(std::format("{} has no feedbackLocation.", name));
	}

	const Json::Value& imagePath = location["image_path"];
	if (!imagePath.isString()) {
		return malformed(std::format("{} has no image_path.", name));
	}

	const Json::Value& coarseness = location["coarseness"];
	if (!coarseness.isInt()) {
		return malformed(std::format("{} has no integer coarseness.", name));
	}

	const Json::Value& points = location["chosenPoints"];
	if (!points.isObject()) {
		return malformed(std::format("{} has no chosenPoints.", name));
	}

	ParseResult result{};
	RawLog& log = result.log;
	if (!readIntArray(points["row"], log.rows) || !readIntArray(points["col"], log.cols)) {
		return malformed(std::format("{} has invalid chosenPoints row/col lists.", name));
	}

	if (!readOptionalString(root, "filename", log.imageFilename) || !readOptionalString(location, "exported_at", log.exportedAt)) {
		return malformed(std::format("{} has a non-string filename or exported_at.", name));
	}

	if (log.imageFilename.empty()) {
		log.imageFilename = storageName;
	}

	log.logId      = logId.asString();
	log.filename   = storageName.empty() ? log.imageFilename : storageName;
	log.imagePath  = imagePath.asString();
	log.coarseness = coarseness.asInt();

	if (location.isMember("segment_size_px")) {
		const Json::Value& size = location["segment_size_px"];
		if (!size.isObject() || !size["w"].isNumeric() || !size["h"].isNumeric()) {
			return malformed(std::format("{} has an invalid segment_size_px.", name));
		}
		log.segmentSize = analysis::core::SegmentSize{size["w"].asDouble(), size["h"].asDouble()};
		if (!analysis::core::isValidSegmentSize(*log.segmentSize)) {
			return malformed(std::format("{} has a non-positive segment_size_px.", name));
		}
	}

	return result;
}

std::string serializeLog(const RawLog& log) {
	Json::Value rows(Json::arrayValue);
	for (const int r: log.rows) {
		rows.append(r);
	}
	Json::Value cols(Json::arrayValue);
	for (const int c: log.cols) {
		cols.append(c);
	}

	Json::Value location(Json::objectValue);
	location["image_path"]          = log.imagePath;
	location["exported_at"]         = log.exportedAt;
	location["coarseness"]          = log.coarseness;
	location["chosenPoints"]["row"] = std::move(rows);
	location["chosenPoints"]["col"] = std::move(cols);
	if (log.segmentSize) {
		location["segment_size_px"]["w"] = log.segmentSize->w;
		location["segment_size_px"]["h"] = log.segmentSize->h;
	}

	Json::Value root(Json::objectValue);
	root["log_id"]           = log.logId;
	root["filename"]         = log.imageFilename;
	root["feedbackLocation"] = std::move(location);
	return writeJson(root);
}

Json::Value toResponseJson(const analysis::core::StabilityResult& result) {
	Json::Value response(Json::objectValue);
	if (!result.success()) {
		response["status"] = "error";
		response["error"]  = std::string(analysis::core::toString(result.error));
		response["detail"] = result.reason;
		return response;
	}

	Json::Value combination(Json::arrayValue);
	for (const std::string& filename: result.bestCombination) {
		combination.append(filename);
	}

	response["status"]              = "ok";
	response["stability_score"]     = result.stabilityScore;
	response["stable_overlap_area"] = result.stableOverlapArea;
	response["best_day_area"]       = result.bestDayArea;
	response["max_area_file"]       = result.maxAreaFile;
	response["best_combination"]    = std::move(combination);
	return response;
}

std::string writeJson(const Json::Value& value) {
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "  ";
	return Json::writeString(builder, value);
}

} // namespace sensamap::storage
