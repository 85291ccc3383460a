#pragma once

#include "flightrec/v1/audit.pb.h"

namespace flightrec::audit {

using flightrec::v1::TraceStatus;

constexpr bool IsTerminal(TraceStatus status) {
  return status == flightrec::v1::TRACE_STATUS_SUCCESS || status == flightrec::v1::TRACE_STATUS_ERROR ||
         status == flightrec::v1::TRACE_STATUS_WARNING;
}

// started → {success, error, warning}; terminal states never move again.
constexpr bool CanTransition(TraceStatus from, TraceStatus to) {
  if (from != flightrec::v1::TRACE_STATUS_STARTED) {
    return false;
  }
  return IsTerminal(to);
}

} // namespace flightrec::audit
