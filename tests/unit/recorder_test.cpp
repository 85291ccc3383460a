#include "internal/recorder/recorder.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/session/session_context.hpp"
#include "internal/storage/record_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace {

using flightrec::recorder::IoOperation;
using flightrec::recorder::Recorder;
using flightrec::recorder::RecorderOptions;
using flightrec::storage::Namespace;
using flightrec::storage::RecordStore;

std::shared_ptr<RecordStore> FreshStore(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "flightrec_recorder_tests" / (test_name + "-" + flightrec::util::NewId());
  return std::make_shared<RecordStore>(root);
}

google::protobuf::Value ParseValue(const std::string& json) {
  google::protobuf::Value value;
  flightrec::util::FromJson(json, &value);
  return value;
}

void TestSessionFileWrittenAtConstruction() {
  auto     store = FreshStore("session_file");
  Recorder recorder(flightrec::session::OpenSession(store));

  const auto path = store->NamespacePath(Namespace::kSessions) / ("session-" + recorder.SessionId() + ".json");
  assert(std::filesystem::exists(path));

  const auto record = store->Read<flightrec::v1::SessionRecord>(path.string());
  assert(record.session_id() == recorder.SessionId());
  assert(record.root_path() == store->Root().string());
  assert(!record.has_end_time());
}

void TestRecordLayerIoRedactsAndIndexes() {
  auto     store = FreshStore("layer_io");
  Recorder recorder(flightrec::session::OpenSession(store));

  google::protobuf::Struct metadata;
  (*metadata.mutable_fields())["method"].set_string_value("route");

  const auto id = recorder.RecordLayerIO("router", IoOperation::kInput, ParseValue(R"({"apiKey":"sk-123","prompt":"hi"})"), metadata);

  const auto summary = recorder.GetSessionSummary();
  assert(summary.total_records() == 1);
  const auto& entry = summary.audit_trail(0);
  assert(entry.record_id() == id);
  assert(entry.layer() == "router");
  assert(entry.operation() == "input");

  const auto record = store->Read<flightrec::v1::LayerIoRecord>(entry.file_path());
  assert(record.session_id() == recorder.SessionId());
  assert(record.operation() == "input");
  assert(flightrec::util::FindField(record.data(), "apiKey")->string_value() == "[REDACTED]");
  assert(flightrec::util::FindField(record.data(), "prompt")->string_value() == "hi");
  assert(record.metadata().fields().at("method").string_value() == "route");
  assert(record.metadata().fields().at("dataSize").number_value() == static_cast<double>(flightrec::util::JsonSize(record.data())));
}

void TestPayloadBudgetTruncatesAfterRedaction() {
  auto            store = FreshStore("budget");
  RecorderOptions options;
  options.max_payload_bytes = 24;
  Recorder recorder(flightrec::session::OpenSession(store), options);

  recorder.RecordLayerIO("provider", IoOperation::kOutput,
                         ParseValue(R"({"password":"hunter2-hunter2-hunter2","text":"a long response body that exceeds the budget"})"));

  const auto  summary = recorder.GetSessionSummary();
  const auto  record  = store->Read<flightrec::v1::LayerIoRecord>(summary.audit_trail(0).file_path());
  const auto* preview = flightrec::util::FindField(record.data(), "preview");

  assert(flightrec::util::FindField(record.data(), "truncated")->bool_value());
  assert(flightrec::util::FindField(record.data(), "originalSize")->number_value() > 24);
  assert(preview != nullptr && preview->string_value().size() == 24);
  assert(preview->string_value().find("hunter2") == std::string::npos);
  assert(record.metadata().fields().at("truncated").bool_value());
}

bool IsValidUtf8(const std::string& s) {
  std::size_t i = 0;
  while (i < s.size()) {
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t len = lead < 0x80 ? 1 : (lead >> 5) == 0x6 ? 2 : (lead >> 4) == 0xE ? 3 : (lead >> 3) == 0x1E ? 4 : 0;
    if (len == 0 || i + len > s.size()) {
      return false;
    }
    for (std::size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
        return false;
      }
    }
    i += len;
  }
  return true;
}

void TestPayloadPreviewKeepsWholeCharacters() {
  for (uint64_t budget = 12; budget <= 20; ++budget) {
    auto            store = FreshStore("budget_utf8");
    RecorderOptions options;
    options.max_payload_bytes = budget;
    Recorder recorder(flightrec::session::OpenSession(store), options);

    recorder.RecordLayerIO("provider", IoOperation::kOutput, ParseValue(R"({"text":"€€€€€€€€€€€€"})"));

    const auto  summary = recorder.GetSessionSummary();
    const auto  record  = store->Read<flightrec::v1::LayerIoRecord>(summary.audit_trail(0).file_path());
    const auto* preview = flightrec::util::FindField(record.data(), "preview");

    assert(preview != nullptr);
    assert(preview->string_value().size() <= budget);
    assert(preview->string_value().size() + 3 > budget);
    assert(IsValidUtf8(preview->string_value()));
  }
}

void TestAuditTrailEntryJoinsLedger() {
  auto     store = FreshStore("audit_trail");
  Recorder recorder(flightrec::session::OpenSession(store));

  const auto data_id  = recorder.RecordLayerIO("transformer", IoOperation::kOutput, ParseValue(R"({"model":"gpt-4"})"));
  const auto audit_id = recorder.RecordAuditTrail("transformer", "provider", data_id, ParseValue(R"({"model":"gpt-4","token":"t"})"));

  const auto summary = recorder.GetSessionSummary();
  assert(summary.total_records() == 2);
  const auto& entry = summary.audit_trail(1);
  assert(entry.record_id() == audit_id);
  assert(entry.layer() == "transformer->provider");
  assert(entry.operation() == "audit");
  assert(std::filesystem::path(entry.file_path()).filename().string().rfind("audit-", 0) == 0);

  const auto record = store->Read<flightrec::v1::AuditTrailRecord>(entry.file_path());
  assert(record.data_id() == data_id);
  assert(flightrec::util::FindField(record.data(), "token")->string_value() == "[REDACTED]");
}

void TestPerformanceMetricsPersisted() {
  auto     store = FreshStore("performance");
  Recorder recorder(flightrec::session::OpenSession(store));

  const auto start = flightrec::util::NowMillis();
  const auto end   = start + std::chrono::milliseconds(42);

  google::protobuf::Struct metrics;
  (*metrics.mutable_fields())["tokens"].set_number_value(128);

  const auto record = recorder.RecordPerformanceMetrics("provider", "sendRequest", start, end, metrics);
  assert(record.duration_ms() == 42);
  assert(record.resource_usage().pid() > 0);
  assert(record.metrics().fields().at("tokens").number_value() == 128);

  const auto files = store->ListRecords(Namespace::kPerformance);
  assert(files.size() == 1);
  assert(store->Read<flightrec::v1::PerformanceRecord>(files[0]).record_id() == record.record_id());

  bool threw = false;
  try {
    (void)recorder.RecordPerformanceMetrics("provider", "sendRequest", end, start);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestCreateReplayScenario() {
  auto     store = FreshStore("scenario");
  Recorder recorder(flightrec::session::OpenSession(store));

  const auto a = recorder.RecordLayerIO("router", IoOperation::kInput, ParseValue(R"({"step":1})"));
  const auto b = recorder.RecordLayerIO("router", IoOperation::kOutput, ParseValue(R"({"step":2})"));

  const auto path = recorder.CreateReplayScenario("basic flow", {b, a});
  assert(std::filesystem::path(path).filename().string().rfind("scenario-basic flow-", 0) == 0);

  const auto scenario = store->Read<flightrec::v1::ReplayScenario>(path);
  assert(scenario.session_id() == recorder.SessionId());
  assert(scenario.scenario_name() == "basic flow");
  assert(std::filesystem::path(path).filename().string().find(scenario.scenario_id()) != std::string::npos);
  assert(scenario.records_size() == 2);
  assert(scenario.records(0).record_id() == b);
  assert(scenario.records(1).record_id() == a);
  assert(scenario.records(1).operation() == "input");

  bool threw = false;
  try {
    (void)recorder.CreateReplayScenario("broken", {a, "not-a-record"});
  } catch (const flightrec::util::RecordNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestSessionSummaryClosesSessionFile() {
  auto     store = FreshStore("summary");
  Recorder recorder(flightrec::session::OpenSession(store));

  recorder.RecordLayerIO("router", IoOperation::kError, ParseValue(R"({"message":"boom"})"));
  const auto summary = recorder.GetSessionSummary();

  assert(summary.session_id() == recorder.SessionId());
  assert(!flightrec::util::Before(summary.end_time(), summary.start_time()));

  const auto record =
      store->Read<flightrec::v1::SessionRecord>((store->NamespacePath(Namespace::kSessions) / ("session-" + recorder.SessionId() + ".json")).string());
  assert(record.has_end_time());
  assert(record.record_count() == 1);
}

} // namespace

int main() {
  TestSessionFileWrittenAtConstruction();
  TestRecordLayerIoRedactsAndIndexes();
  TestPayloadBudgetTruncatesAfterRedaction();
  TestPayloadPreviewKeepsWholeCharacters();
  TestAuditTrailEntryJoinsLedger();
  TestPerformanceMetricsPersisted();
  TestCreateReplayScenario();
  TestSessionSummaryClosesSessionFile();

  std::cout << "flightrec_unit_recorder: pass\n";
  return 0;
}
