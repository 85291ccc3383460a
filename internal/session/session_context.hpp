#pragma once

#include <memory>
#include <string>

#include "internal/storage/record_store.hpp"
#include "internal/util/time.hpp"

namespace flightrec::session {

/*
  Identity of one recording session.

  Every Recorder / AuditTrailBuilder is bound to exactly one context and
  stamps its session id on everything it writes.
*/
struct SessionContext {
  std::string                       session_id;
  util::TimePoint                   start_time;
  std::shared_ptr<storage::RecordStore> store;
};

// Creates a fresh session over the store and makes sure its namespaces exist.
SessionContext OpenSession(std::shared_ptr<storage::RecordStore> store);

} // namespace flightrec::session
