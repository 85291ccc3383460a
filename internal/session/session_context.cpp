#include "session_context.hpp"

#include <stdexcept>

#include "internal/util/uuid.hpp"

namespace flightrec::session {

SessionContext OpenSession(std::shared_ptr<storage::RecordStore> store) {
  if (!store) {
    throw std::invalid_argument("session requires a record store");
  }
  store->EnsureNamespaces();

  SessionContext ctx;
  ctx.session_id = util::NewId();
  ctx.start_time = util::NowMillis();
  ctx.store      = std::move(store);
  return ctx;
}

} // namespace flightrec::session
