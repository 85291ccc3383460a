#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <arrow/filesystem/filesystem.h>
#include <google/protobuf/message.h>

namespace flightrec::storage {

/*
  Storage namespaces under the record store root.
  Each maps to one fixed subdirectory.
*/
enum class Namespace {
  kSessions,
  kLayers,
  kAudit,
  kPerformance,
  kReplay,
  kTraces,
  kLineage,
  kTransformations,
  kIndexes,
};

std::string_view NamespaceDir(Namespace ns);
const std::vector<Namespace>& AllNamespaces();

/*
  Durable file-per-record store.

  Properties:
    - one JSON file per record
    - atomic replace writes (tmp → close → rename)
    - reads report NotFound / Corrupt, writes report StorageIO

  All IO goes through an Arrow filesystem so the store can be pointed at
  any Arrow-supported backend; the default is the local filesystem.
*/
class RecordStore {
 public:
  using NamePredicate = std::function<bool(const std::string& file_name)>;

  explicit RecordStore(std::filesystem::path root, std::shared_ptr<arrow::fs::FileSystem> fs = nullptr);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path NamespacePath(Namespace ns) const;

  // Idempotent; safe to call concurrently.
  void EnsureNamespaces();

  // Writes a new file named "<hint>-<unix millis>.json" and returns its path.
  std::string WriteRecord(Namespace ns, const std::string& file_name_hint, const google::protobuf::Message& record);

  // Writes (or atomically replaces) "<file_name>" and returns its path.
  std::string PutRecord(Namespace ns, const std::string& file_name, const google::protobuf::Message& record);

  void ReadRecord(const std::string& path, google::protobuf::Message* record) const;

  template <typename T>
  T Read(const std::string& path) const {
    T record;
    ReadRecord(path, &record);
    return record;
  }

  bool Exists(const std::string& path) const;

  // Paths of the .json records in a namespace, sorted by file name.
  std::vector<std::string> ListRecords(Namespace ns, const NamePredicate& predicate = {}) const;

 private:
  std::string WriteAtomically(const std::filesystem::path& final_path, const std::string& contents);

  std::filesystem::path                  root_;
  std::shared_ptr<arrow::fs::FileSystem> fs_;
};

using RecordStorePtr = std::shared_ptr<RecordStore>;

} // namespace flightrec::storage
