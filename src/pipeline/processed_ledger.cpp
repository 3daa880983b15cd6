#include "processed_ledger.hpp"

#include "../parser/log_time.hpp"
#include "../shared/logger.hpp"

#include <json/json.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

namespace fragline {

bool ProcessedLedger::AlreadyProcessed(EventType type, Timestamp timestamp) const
{
	return entries_.count(Key{ type, timestamp }) != 0;
}

bool ProcessedLedger::MarkProcessed(EventType type, Timestamp timestamp)
{
	return entries_.insert(Key{ type, timestamp }).second;
}

/*
=============
ProcessedLedger::Load
=============
*/
bool ProcessedLedger::Load(const std::string& path)
{
	std::error_code ec;
	if (!std::filesystem::exists(path, ec)) {
		Logf(LogLevel::Info, "Ledger ", path, " does not exist yet; starting empty");
		return true;
	}

	std::ifstream in(path);
	if (!in.is_open()) {
		Logf(LogLevel::Error, "Failed to open ledger ", path);
		return false;
	}

	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errs;
	if (!Json::parseFromStream(builder, in, &root, &errs)) {
		Logf(LogLevel::Error, "Ledger parse error in ", path, ": ", errs);
		return false;
	}

	if (!root.isObject() || !root.isMember("processed") || !root["processed"].isArray()) {
		Logf(LogLevel::Error, "Ledger ", path, " must contain a 'processed' array");
		return false;
	}

	size_t loaded = 0, skipped = 0;
	for (const auto& entry : root["processed"]) {
		if (!entry.isObject() || !entry["type"].isString() || !entry["time"].isString()) {
			skipped++;
			continue;
		}

		const auto type = EventTypeFromName(entry["type"].asString());
		const auto time = ParseIsoTimestamp(entry["time"].asString());
		if (!type || !time) {
			skipped++;
			continue;
		}

		MarkProcessed(*type, *time);
		loaded++;
	}

	if (skipped)
		Logf(LogLevel::Warn, "Ledger ", path, ": skipped ", skipped, " malformed entries");
	Logf(LogLevel::Debug, "Ledger ", path, ": loaded ", loaded, " entries");
	return true;
}

/*
=============
ProcessedLedger::Save
=============
*/
bool ProcessedLedger::Save(const std::string& path) const
{
	Json::Value root(Json::objectValue);
	Json::Value& processed = root["processed"] = Json::Value(Json::arrayValue);
	for (const auto& [type, timestamp] : entries_) {
		Json::Value entry(Json::objectValue);
		entry["type"] = std::string(EventTypeName(type));
		entry["time"] = FormatIsoTimestamp(timestamp);
		processed.append(entry);
	}

	try {
		std::ofstream out(path, std::ios::trunc);
		if (!out.is_open()) {
			const std::error_code ec(errno, std::system_category());
			Logf(LogLevel::Error, "Failed to write ledger ", path, " (", ec.message(), ")");
			return false;
		}

		Json::StreamWriterBuilder writerBuilder;
		writerBuilder["indentation"] = "\t";
		std::unique_ptr<Json::StreamWriter> writer(writerBuilder.newStreamWriter());
		writer->write(root, &out);
		out << '\n';
		out.close();
		if (!out) {
			Logf(LogLevel::Error, "Failed to flush ledger ", path);
			return false;
		}
	}
	catch (const std::exception& e) {
		Logf(LogLevel::Error, "Exception while writing ledger ", path, ": ", e.what());
		return false;
	}

	Logf(LogLevel::Debug, "Ledger written to ", path, " with ", entries_.size(), " entries");
	return true;
}

} // namespace fragline
