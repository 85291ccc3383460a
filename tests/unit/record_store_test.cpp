#include "internal/storage/record_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "flightrec/v1/records.pb.h"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace {

using flightrec::storage::Namespace;
using flightrec::storage::RecordStore;

std::filesystem::path FreshRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "flightrec_record_store_tests" / (test_name + "-" + flightrec::util::NewId());
  std::filesystem::create_directories(root);
  return root;
}

flightrec::v1::LayerIoRecord MakeRecord(const std::string& layer) {
  flightrec::v1::LayerIoRecord record;
  record.set_record_id(flightrec::util::NewId());
  record.set_session_id("session-a");
  record.set_layer(layer);
  record.set_operation("input");
  (*record.mutable_data()->mutable_struct_value()->mutable_fields())["prompt"].set_string_value("hi");
  return record;
}

void WriteRaw(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path);
  out << contents;
}

void TestEnsureNamespacesIsIdempotent() {
  RecordStore store(FreshRoot("namespaces"));
  store.EnsureNamespaces();
  store.EnsureNamespaces();

  for (auto ns : flightrec::storage::AllNamespaces()) {
    assert(std::filesystem::is_directory(store.NamespacePath(ns)));
  }
  assert(std::filesystem::is_directory(store.Root() / "transformations"));
  assert(std::filesystem::is_directory(store.Root() / "indexes"));
}

void TestWriteThenReadRecord() {
  RecordStore store(FreshRoot("write_read"));
  store.EnsureNamespaces();

  const auto record = MakeRecord("router");
  const auto path   = store.WriteRecord(Namespace::kLayers, "layer-router-input-" + record.record_id(), record);

  assert(std::filesystem::path(path).parent_path() == store.NamespacePath(Namespace::kLayers));
  assert(std::filesystem::path(path).extension() == ".json");
  assert(store.Exists(path));

  const auto loaded = store.Read<flightrec::v1::LayerIoRecord>(path);
  assert(loaded.record_id() == record.record_id());
  assert(loaded.layer() == "router");
  assert(flightrec::util::ValuesEqual(loaded.data(), record.data()));
}

void TestPutRecordReplacesInPlace() {
  RecordStore store(FreshRoot("put"));
  store.EnsureNamespaces();

  flightrec::v1::SessionRecord session;
  session.set_session_id("s1");
  session.set_record_count(1);
  const auto first = store.PutRecord(Namespace::kSessions, "session-s1.json", session);

  session.set_record_count(7);
  const auto second = store.PutRecord(Namespace::kSessions, "session-s1.json", session);

  assert(first == second);
  assert(store.Read<flightrec::v1::SessionRecord>(second).record_count() == 7);
  assert(store.ListRecords(Namespace::kSessions).size() == 1);
}

void TestReadMissingAndCorruptFiles() {
  RecordStore store(FreshRoot("missing_corrupt"));
  store.EnsureNamespaces();

  bool not_found = false;
  try {
    (void)store.Read<flightrec::v1::LayerIoRecord>((store.NamespacePath(Namespace::kLayers) / "nope.json").string());
  } catch (const flightrec::util::NotFound&) {
    not_found = true;
  }
  assert(not_found && "missing record must report NotFound");

  const auto corrupt_path = store.NamespacePath(Namespace::kLayers) / "corrupt.json";
  WriteRaw(corrupt_path, "{ this is not json");

  bool corrupt = false;
  try {
    (void)store.Read<flightrec::v1::LayerIoRecord>(corrupt_path.string());
  } catch (const flightrec::util::Corrupt& e) {
    corrupt = std::string(e.what()).find("corrupt.json") != std::string::npos;
  }
  assert(corrupt && "unparsable record must report Corrupt with its path");
}

void TestListRecordsFiltersAndSorts() {
  RecordStore store(FreshRoot("list"));
  store.EnsureNamespaces();

  const auto dir = store.NamespacePath(Namespace::kReplay);
  WriteRaw(dir / "scenario-b.json", "{}");
  WriteRaw(dir / "scenario-a.json", "{}");
  WriteRaw(dir / "dynamic-replay-x.json", "{}");
  WriteRaw(dir / "scenario-c.json.tmp-123", "{}");
  WriteRaw(dir / "notes.txt", "x");

  const auto all = store.ListRecords(Namespace::kReplay);
  assert(all.size() == 3);

  const auto scenarios = store.ListRecords(Namespace::kReplay, [](const std::string& name) { return name.rfind("scenario-", 0) == 0; });
  assert(scenarios.size() == 2);
  assert(std::filesystem::path(scenarios[0]).filename() == "scenario-a.json");
  assert(std::filesystem::path(scenarios[1]).filename() == "scenario-b.json");
}

void TestListRecordsOnMissingNamespaceIsEmpty() {
  RecordStore store(FreshRoot("list_missing"));
  assert(store.ListRecords(Namespace::kTraces).empty());
}

void TestFileNameHintMustNotEscapeNamespace() {
  RecordStore store(FreshRoot("hint"));
  store.EnsureNamespaces();

  bool threw = false;
  try {
    (void)store.WriteRecord(Namespace::kLayers, "../escape", MakeRecord("router"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(store.Root() / "escape"));
}

void TestNoTemporaryFilesLeftBehind() {
  RecordStore store(FreshRoot("tmp"));
  store.EnsureNamespaces();

  for (int i = 0; i < 5; ++i) {
    const auto record = MakeRecord("layer" + std::to_string(i));
    (void)store.WriteRecord(Namespace::kLayers, "layer-" + record.record_id(), record);
  }

  std::size_t files = 0;
  for (const auto& entry : std::filesystem::directory_iterator(store.NamespacePath(Namespace::kLayers))) {
    assert(entry.path().extension() == ".json");
    ++files;
  }
  assert(files == 5);
}

} // namespace

int main() {
  TestEnsureNamespacesIsIdempotent();
  TestWriteThenReadRecord();
  TestPutRecordReplacesInPlace();
  TestReadMissingAndCorruptFiles();
  TestListRecordsFiltersAndSorts();
  TestListRecordsOnMissingNamespaceIsEmpty();
  TestFileNameHintMustNotEscapeNamespace();
  TestNoTemporaryFilesLeftBehind();

  std::cout << "flightrec_unit_record_store: pass\n";
  return 0;
}
