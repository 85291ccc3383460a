#include "record_store.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/io/interfaces.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace flightrec::storage {

using namespace flightrec::storage::common;

std::string_view NamespaceDir(Namespace ns) {
  switch (ns) {
    case Namespace::kSessions:
      return "sessions";
    case Namespace::kLayers:
      return "layers";
    case Namespace::kAudit:
      return "audit";
    case Namespace::kPerformance:
      return "performance";
    case Namespace::kReplay:
      return "replay";
    case Namespace::kTraces:
      return "traces";
    case Namespace::kLineage:
      return "lineage";
    case Namespace::kTransformations:
      return "transformations";
    case Namespace::kIndexes:
      return "indexes";
  }
  throw std::invalid_argument("unknown storage namespace");
}

const std::vector<Namespace>& AllNamespaces() {
  static const std::vector<Namespace> kAll = {Namespace::kSessions, Namespace::kLayers,  Namespace::kAudit,
                                              Namespace::kPerformance, Namespace::kReplay,  Namespace::kTraces,
                                              Namespace::kLineage,  Namespace::kTransformations, Namespace::kIndexes};
  return kAll;
}

RecordStore::RecordStore(std::filesystem::path root, std::shared_ptr<arrow::fs::FileSystem> fs)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal()),
      fs_(fs ? std::move(fs) : std::make_shared<arrow::fs::LocalFileSystem>()) {
}

std::filesystem::path RecordStore::NamespacePath(Namespace ns) const {
  return root_ / std::string(NamespaceDir(ns));
}

/*
  CreateDir(recursive) succeeds when the directory already exists,
  so concurrent callers do not race.
*/
void RecordStore::EnsureNamespaces() {
  Unwrap(fs_->CreateDir(root_.string(), /*recursive=*/true));
  for (auto ns : AllNamespaces()) {
    Unwrap(fs_->CreateDir(NamespacePath(ns).string(), /*recursive=*/true));
  }
}

std::string RecordStore::WriteRecord(Namespace ns, const std::string& file_name_hint, const google::protobuf::Message& record) {
  ValidateFileName(file_name_hint);
  const auto file_name = file_name_hint + "-" + std::to_string(util::ToUnixMillis(util::Now())) + ".json";
  return WriteAtomically(RecordPath(NamespacePath(ns), file_name), util::ToJson(record));
}

std::string RecordStore::PutRecord(Namespace ns, const std::string& file_name, const google::protobuf::Message& record) {
  return WriteAtomically(RecordPath(NamespacePath(ns), file_name), util::ToJson(record));
}

/*
  Atomic write:
      write tmp → close → rename

  The tmp name is unique per call so concurrent writers of the same
  record never share a tmp file; it does not end in .json so listings
  never see it.
*/
std::string RecordStore::WriteAtomically(const std::filesystem::path& final_path, const std::string& contents) {
  observability::SpanScope span("record_store.write");
  span.SetAttribute("path", final_path.string());

  const auto tmp_path = final_path.string() + ".tmp-" + util::NewId();

  try {
    {
      auto out = Unwrap(fs_->OpenOutputStream(tmp_path));
      Unwrap(out->Write(contents.data(), static_cast<int64_t>(contents.size())));
      Unwrap(out->Close());
    }
    Unwrap(fs_->Move(tmp_path, final_path.string()));
  } catch (const util::StorageIO& e) {
    span.RecordException(e.what());
    auto cleanup = fs_->DeleteFile(tmp_path);
    if (!cleanup.ok()) {
      FLIGHTREC_LOG_DEBUG("tmp record not removed", {observability::StringField("path", tmp_path),
                                                      observability::StringField("status", cleanup.ToString())});
    }
    throw util::StorageIO("failed to write " + final_path.string() + ": " + e.what());
  }

  return final_path.string();
}

void RecordStore::ReadRecord(const std::string& path, google::protobuf::Message* record) const {
  auto info = Unwrap(fs_->GetFileInfo(path));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("record file " + path + " not found");
  }

  auto file   = Unwrap(fs_->OpenInputFile(path));
  auto buffer = ReadAll(file);
  Unwrap(file->Close());

  try {
    util::FromJson(buffer->ToString(), record);
  } catch (const util::Corrupt& e) {
    throw util::Corrupt(path + ": " + e.what());
  }
}

bool RecordStore::Exists(const std::string& path) const {
  auto info = fs_->GetFileInfo(path);
  return info.ok() && info->type() == arrow::fs::FileType::File;
}

std::vector<std::string> RecordStore::ListRecords(Namespace ns, const NamePredicate& predicate) const {
  arrow::fs::FileSelector selector;
  selector.base_dir        = NamespacePath(ns).string();
  selector.recursive       = false;
  selector.allow_not_found = true;

  auto infos = Unwrap(fs_->GetFileInfo(selector));

  std::vector<std::string> paths;
  paths.reserve(infos.size());
  for (const auto& info : infos) {
    if (info.type() != arrow::fs::FileType::File) {
      continue;
    }
    const auto name = info.base_name();
    if (!HasJsonExtension(name)) {
      continue;
    }
    if (predicate && !predicate(name)) {
      continue;
    }
    paths.push_back(info.path());
  }

  std::sort(paths.begin(), paths.end());
  return paths;
}

} // namespace flightrec::storage
