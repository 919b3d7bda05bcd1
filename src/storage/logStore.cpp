#include "storage/logStore.hpp"

#include "storage/logCodec.hpp"

#include <algorithm>
#include <ctime>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace sensamap::storage {

using analysis::core::AnalysisError;
using analysis::core::RawLog;

static std::optional<std::string> readFile(const std::filesystem::path& path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		return std::nullopt;
	}
	std::ostringstream content;
	content << file.rdbuf();
	if (file.bad()) {
		return std::nullopt;
	}
	return content.str();
}

static bool writeFile(const std::filesystem::path& path, const std::string& content) {
	std::ofstream file(path, std::ios::binary | std::ios::trunc);
	if (!file) {
		return false;
	}
	file << content;
	file.flush();
	return static_cast<bool>(file);
}

static LoadResult loadFailure(const AnalysisError error, std::string reason) {
	LoadResult result{};
	result.error  = error;
	result.reason = std::move(reason);
	return result;
}

LogStore::LogStore(std::filesystem::path directory) : m_directory{std::move(directory)} {
}

std::vector<LogEntry> LogStore::list() const {
	std::vector<LogEntry> entries;

	std::error_code ec;
	if (!std::filesystem::is_directory(m_directory, ec)) {
		return entries;
	}

	// An I/O error ends the listing early. Reported below.
	for (std::filesystem::directory_iterator it(m_directory, ec), end; !ec && it != end; it.increment(ec)) {
		const std::filesystem::directory_entry& item = *it;

		std::error_code entryEc;
		if (!item.is_regular_file(entryEc) || item.path().extension() != ".json") {
			continue;
		}

		const std::string filename = item.path().filename().string();
		const auto content         = readFile(item.path());
		if (!content) {
			std::cerr << "[Warning] Could not read log " << item.path() << ". Skipped.\n";
			continue;
		}

		const ParseResult parsed = parseLog(*content, filename);
		if (!parsed.success()) {
			std::cerr << "[Warning] " << parsed.reason << " Skipped.\n";
			continue;
		}
		entries.push_back({item.path(), filename, parsed.log.logId});
	}
	if (ec) {
		std::cerr << "[Warning] Listing " << m_directory << " stopped early: " << ec.message() << "\n";
	}

	std::sort(entries.begin(), entries.end(), [](const LogEntry& a, const LogEntry& b) { return a.filename < b.filename; });
	return entries;
}

LoadResult LogStore::load(const std::string& filename) const {
	const auto path = resolve(filename);
	if (!path) {
		return loadFailure(AnalysisError::LogUnavailable, std::format("'{}' is not a log in the store.", filename));
	}

	const auto content = readFile(*path);
	if (!content) {
		return loadFailure(AnalysisError::LogUnavailable, std::format("Could not read log '{}'.", filename));
	}

	ParseResult parsed = parseLog(*content, filename);
	if (!parsed.success()) {
		return loadFailure(parsed.error, std::move(parsed.reason));
	}

	LoadResult result{};
	result.logs.push_back(std::move(parsed.log));
	return result;
}

LoadResult LogStore::loadBatch(const std::vector<std::string>& filenames) const {
	LoadResult result{};
	result.logs.reserve(filenames.size());
	for (const std::string& filename: filenames) {
		LoadResult single = load(filename);
		if (!single.success()) {
			return single;
		}
		result.logs.push_back(std::move(single.logs.front()));
	}
	return result;
}

SaveResult LogStore::save(const RawLog& log, const std::string& timestamp) const {
	SaveResult result{};
	if (!ensureDirectory(result.reason)) {
		return result;
	}

	RawLog stored     = log;
	stored.exportedAt = timestamp;
	stored.filename   = makeFilename(log.logId, log.imageFilename, timestamp);

	const auto path = resolve(stored.filename);
	if (!path) {
		result.reason = std::format("Generated name '{}' is not a valid file name.", stored.filename);
		return result;
	}
	if (!writeFile(*path, serializeLog(stored))) {
		result.reason = std::format("Could not write {}.", path->string());
		return result;
	}

	result.success  = true;
	result.filename = stored.filename;
	return result;
}

SaveResult LogStore::save(const RawLog& log) const {
	return save(log, formatTimestamp(std::chrono::system_clock::now()));
}

SaveResult LogStore::importFile(const std::filesystem::path& source) const {
	SaveResult result{};

	const auto content = readFile(source);
	if (!content) {
		result.reason = std::format("Could not read {}.", source.string());
		return result;
	}

	const std::string filename = source.filename().string();
	const ParseResult parsed   = parseLog(*content, filename);
	if (!parsed.success()) {
		result.reason = parsed.reason;
		return result;
	}

	if (!ensureDirectory(result.reason)) {
		return result;
	}

	const auto target = resolve(filename);
	if (!target || target->extension() != ".json") {
		result.reason = std::format("'{}' is not a valid log file name.", filename);
		return result;
	}
	std::error_code ec;
	if (std::filesystem::exists(*target, ec) || ec) {
		result.reason = ec ? std::format("Could not check {}: {}", target->string(), ec.message())
		                   : std::format("A log named '{}' already exists.", filename);
		return result;
	}
	if (!writeFile(*target, *content)) {
		result.reason = std::format("Could not write {}.", target->string());
		return result;
	}

	result.success  = true;
	result.filename = filename;
	return result;
}

std::string LogStore::makeFilename(const std::string& logId, const std::string& imageFilename, const std::string& timestamp) {
	std::string image = imageFilename;
	for (std::size_t pos = image.find(".svg"); pos != std::string::npos; pos = image.find(".svg", pos + 4u)) {
		image.replace(pos, 4u, "_svg");
	}
	return std::format("{}_{}_{}.json", logId, image, timestamp);
}

std::string LogStore::formatTimestamp(const std::chrono::system_clock::time_point time) {
	const std::time_t t = std::chrono::system_clock::to_time_t(time);
	std::tm local{};
	localtime_r(&t, &local);

	char buffer[32];
	const std::size_t length = std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
	return std::string(buffer, length);
}

std::optional<std::filesystem::path> LogStore::resolve(const std::string& filename) const {
	const std::filesystem::path name(filename);
	if (filename.empty() || name.is_absolute() || name.has_parent_path() || name == "." || name == "..") {
		return std::nullopt;
	}
	return m_directory / name;
}

bool LogStore::ensureDirectory(std::string& reason) const {
	std::error_code ec;
	std::filesystem::create_directories(m_directory, ec);
	if (ec) {
		reason = std::format("Could not create {}: {}", m_directory.string(), ec.message());
		return false;
	}
	return true;
}

} // namespace sensamap::storage
