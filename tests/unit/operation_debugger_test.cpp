#include "internal/session/operation_debugger.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/session/session_context.hpp"
#include "internal/storage/record_store.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace {

using flightrec::audit::AuditTrailBuilder;
using flightrec::recorder::Recorder;
using flightrec::session::OperationDebugger;
using flightrec::storage::Namespace;
using flightrec::storage::RecordStore;

struct Harness {
  std::shared_ptr<RecordStore>       store;
  std::shared_ptr<Recorder>          recorder;
  std::shared_ptr<AuditTrailBuilder> audit;
  std::unique_ptr<OperationDebugger> debugger;
};

Harness MakeHarness(const std::string& test_name) {
  Harness h;
  h.store = std::make_shared<RecordStore>(std::filesystem::temp_directory_path() / "flightrec_operation_debugger_tests" /
                                          (test_name + "-" + flightrec::util::NewId()));
  const auto context = flightrec::session::OpenSession(h.store);
  h.recorder         = std::make_shared<Recorder>(context);
  h.audit            = std::make_shared<AuditTrailBuilder>(context);
  h.debugger         = std::make_unique<OperationDebugger>(h.recorder, h.audit);
  return h;
}

google::protobuf::Value ParseValue(const std::string& json) {
  google::protobuf::Value value;
  flightrec::util::FromJson(json, &value);
  return value;
}

void TestSuccessfulCallIsFullyCaptured() {
  auto h = MakeHarness("success");

  std::string trace_id;
  const auto  output =
      h.debugger->Track("router", "route", ParseValue(R"({"model":"gpt-4"})"), [&](const google::protobuf::Value& input, const std::string& id) {
        trace_id = id;
        auto out = input;
        (*out.mutable_struct_value()->mutable_fields())["provider"].set_string_value("openai");
        return out;
      });
  assert(flightrec::util::FindField(output, "provider") != nullptr);
  assert(!trace_id.empty());

  const auto trace = h.audit->GetTrace(trace_id);
  assert(trace.layer() == "router");
  assert(trace.operation() == "route");
  assert(trace.status() == flightrec::v1::TRACE_STATUS_SUCCESS);
  assert(flightrec::util::ValuesEqual(trace.output_data(), output));

  const auto summary = h.recorder->GetSessionSummary();
  assert(summary.total_records() == 2);
  assert(summary.audit_trail(0).operation() == "input");
  assert(summary.audit_trail(1).operation() == "output");

  assert(h.store->ListRecords(Namespace::kPerformance).size() == 1);
  assert(h.audit->GetAuditSummary().transformation_stats().total_transformations() == 1);
}

void TestNestedCallsLinkTraces() {
  auto h = MakeHarness("nested");

  std::string inner_id;
  h.debugger->Track("router", "route", ParseValue(R"({"q":1})"), [&](const google::protobuf::Value& input, const std::string& parent) {
    return h.debugger->Track(
        "provider", "call", input,
        [&](const google::protobuf::Value& v, const std::string& id) {
          inner_id = id;
          return v;
        },
        parent);
  });

  const auto inner = h.audit->GetTrace(inner_id);
  assert(!inner.parent_trace_id().empty());
  const auto outer = h.audit->GetTrace(inner.parent_trace_id());
  assert(outer.layer() == "router");
  assert(outer.children_size() == 1 && outer.children(0) == inner_id);

  const auto lineage = h.audit->BuildDataLineage(outer.trace_id());
  assert(lineage.data_flow_size() == 2);
}

void TestFailureIsRecordedAndRethrown() {
  auto h = MakeHarness("failure");

  std::string trace_id;
  bool        threw = false;
  try {
    h.debugger->Track("provider", "complete", ParseValue(R"({"prompt":"hi"})"),
                      [&](const google::protobuf::Value&, const std::string& id) -> google::protobuf::Value {
                        trace_id = id;
                        throw std::runtime_error("upstream timeout");
                      });
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "upstream timeout";
  }
  assert(threw);

  const auto trace = h.audit->GetTrace(trace_id);
  assert(trace.status() == flightrec::v1::TRACE_STATUS_ERROR);
  const auto* message = flightrec::util::FindField(trace.output_data(), "message");
  assert(message != nullptr && message->string_value() == "upstream timeout");

  const auto summary = h.recorder->GetSessionSummary();
  assert(summary.total_records() == 2);
  const auto& error_entry = summary.audit_trail(1);
  assert(error_entry.operation() == "error");

  const auto record = h.store->Read<flightrec::v1::LayerIoRecord>(error_entry.file_path());
  assert(record.metadata().fields().at("error").string_value() == "upstream timeout");
  assert(record.metadata().fields().at("method").string_value() == "complete");

  assert(h.store->ListRecords(Namespace::kPerformance).size() == 1);
}

// Each thread must see the trace of its own call, never a neighbour's.
void TestConcurrentCallsSeeTheirOwnTrace() {
  auto h = MakeHarness("concurrent");

  constexpr int kThreads        = 4;
  constexpr int kCallsPerThread = 10;

  std::vector<std::vector<std::string>> seen(kThreads);
  std::vector<std::thread>              workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      const auto layer = "worker-" + std::to_string(t);
      for (int i = 0; i < kCallsPerThread; ++i) {
        h.debugger->Track(layer, "step", ParseValue(R"({"i":1})"), [&](const google::protobuf::Value& input, const std::string& id) {
          seen[t].push_back(id);
          return input;
        });
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  std::set<std::string> unique;
  for (int t = 0; t < kThreads; ++t) {
    assert(seen[t].size() == kCallsPerThread);
    for (const auto& id : seen[t]) {
      assert(h.audit->GetTrace(id).layer() == "worker-" + std::to_string(t));
      unique.insert(id);
    }
  }
  assert(unique.size() == kThreads * kCallsPerThread);
  assert(h.recorder->GetSessionSummary().total_records() == 2 * kThreads * kCallsPerThread);
}

void TestMismatchedSessionsRejected() {
  auto       h     = MakeHarness("mismatch");
  const auto other = std::make_shared<AuditTrailBuilder>(flightrec::session::OpenSession(h.store));

  bool threw = false;
  try {
    OperationDebugger debugger(h.recorder, other);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestSuccessfulCallIsFullyCaptured();
  TestNestedCallsLinkTraces();
  TestFailureIsRecordedAndRethrown();
  TestConcurrentCallsSeeTheirOwnTrace();
  TestMismatchedSessionsRejected();

  std::cout << "flightrec_unit_operation_debugger: pass\n";
  return 0;
}
