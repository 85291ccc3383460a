#pragma once

#include <optional>
#include <string>

#include "flightrec/v1/records.pb.h"
#include "flightrec/v1/replay.pb.h"
#include "internal/replay/tool_call_matcher.hpp"
#include "internal/storage/record_store.hpp"

namespace flightrec::replay {

/*
  Read side of the record store used during replay.

  Loading is forgiving: a missing or unreadable record is logged and
  reported as std::nullopt so one bad file cannot abort a whole replay.
  Only failures to list a namespace propagate (util::StorageIO).
*/
class DatabaseDataLoader {
 public:
  DatabaseDataLoader(storage::RecordStorePtr store, ToolCallMatcher matcher);

  // First scenario (by file name) under replay/ recorded for the session.
  std::optional<flightrec::v1::ReplayScenario> LoadSessionData(const std::string& session_id) const;

  // Timeline entry for one ledger reference; timestamp falls back to the
  // ledger's when the detail file carries none.
  std::optional<flightrec::v1::Interaction> LoadRecordDetail(const flightrec::v1::AuditIndexEntry& record) const;

  // Scans layers/ for a recorded result: an id match wins over a name match.
  std::optional<flightrec::v1::ToolCallResult> FindToolCallResult(const std::string& tool_call_id, const std::string& tool_name) const;

 private:
  storage::RecordStorePtr store_;
  ToolCallMatcher         matcher_;
};

} // namespace flightrec::replay
