#include "data_loader.hpp"

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flightrec::replay {

using flightrec::storage::Namespace;

namespace {

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::string BaseName(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

} // namespace

DatabaseDataLoader::DatabaseDataLoader(storage::RecordStorePtr store, ToolCallMatcher matcher)
    : store_(std::move(store)), matcher_(std::move(matcher)) {
  if (!store_) {
    throw std::invalid_argument("data loader requires a record store");
  }
}

std::optional<flightrec::v1::ReplayScenario> DatabaseDataLoader::LoadSessionData(const std::string& session_id) const {
  const auto paths = store_->ListRecords(Namespace::kReplay, [](const std::string& name) { return StartsWith(name, "scenario-"); });

  for (const auto& path : paths) {
    try {
      auto scenario = store_->Read<flightrec::v1::ReplayScenario>(path);
      if (scenario.session_id() == session_id) {
        FLIGHTREC_LOG_INFO("replay scenario found", {observability::StringField("session_id", session_id),
                                                     observability::StringField("path", path),
                                                     observability::IntField("records", scenario.records_size())});
        return scenario;
      }
    } catch (const util::Corrupt& e) {
      FLIGHTREC_LOG_WARN("skipping corrupt scenario file", {observability::StringField("path", path), observability::StringField("error", e.what())});
    } catch (const util::NotFound&) {
      FLIGHTREC_LOG_WARN("scenario file vanished during scan", {observability::StringField("path", path)});
    } catch (const util::StorageIO& e) {
      FLIGHTREC_LOG_WARN("scenario file read failed", {observability::StringField("path", path), observability::StringField("error", e.what())});
    }
  }
  return std::nullopt;
}

std::optional<flightrec::v1::Interaction> DatabaseDataLoader::LoadRecordDetail(const flightrec::v1::AuditIndexEntry& record) const {
  if (record.file_path().empty()) {
    FLIGHTREC_LOG_WARN("record has no file path", {observability::StringField("record_id", record.record_id())});
    return std::nullopt;
  }

  // Layer and audit records share the fields read here.
  flightrec::v1::LayerIoRecord detail;
  try {
    store_->ReadRecord(record.file_path(), &detail);
  } catch (const util::NotFound&) {
    FLIGHTREC_LOG_WARN("record file missing", {observability::StringField("record_id", record.record_id()),
                                               observability::StringField("path", record.file_path())});
    return std::nullopt;
  } catch (const util::Corrupt& e) {
    FLIGHTREC_LOG_WARN("record file unreadable", {observability::StringField("record_id", record.record_id()),
                                                  observability::StringField("error", e.what())});
    return std::nullopt;
  } catch (const util::StorageIO& e) {
    FLIGHTREC_LOG_WARN("record file read failed", {observability::StringField("record_id", record.record_id()),
                                                   observability::StringField("error", e.what())});
    return std::nullopt;
  }

  flightrec::v1::Interaction interaction;
  *interaction.mutable_timestamp() = detail.has_timestamp() ? detail.timestamp() : record.timestamp();
  interaction.set_record_id(record.record_id());
  interaction.set_layer(record.layer());
  interaction.set_operation(record.operation());
  *interaction.mutable_data()     = detail.data();
  *interaction.mutable_metadata() = detail.metadata();
  return interaction;
}

std::optional<flightrec::v1::ToolCallResult> DatabaseDataLoader::FindToolCallResult(const std::string& tool_call_id,
                                                                                     const std::string& tool_name) const {
  std::optional<flightrec::v1::ToolCallResult> by_name;

  for (const auto& path : store_->ListRecords(Namespace::kLayers)) {
    flightrec::v1::LayerIoRecord record;
    try {
      store_->ReadRecord(path, &record);
    } catch (const util::Corrupt& e) {
      FLIGHTREC_LOG_DEBUG("skipping unreadable layer record", {observability::StringField("path", path), observability::StringField("error", e.what())});
      continue;
    } catch (const util::NotFound&) {
      continue;
    } catch (const util::StorageIO& e) {
      FLIGHTREC_LOG_WARN("layer record read failed", {observability::StringField("path", path), observability::StringField("error", e.what())});
      continue;
    }

    for (const auto& result : matcher_.FindToolResults(record.data(), /*recursive=*/true)) {
      const bool id_match   = !tool_call_id.empty() && ToolCallMatcher::ResultCallId(result) == tool_call_id;
      const bool name_match = !tool_name.empty() && ToolCallMatcher::ResultName(result) == tool_name;
      if (!id_match && (!name_match || by_name)) {
        continue;
      }

      flightrec::v1::ToolCallResult found;
      *found.mutable_result() = result;
      found.set_source_file(BaseName(path));
      *found.mutable_timestamp() = record.timestamp();

      if (id_match) {
        return found;
      }
      by_name = std::move(found);
    }
  }
  return by_name;
}

} // namespace flightrec::replay
