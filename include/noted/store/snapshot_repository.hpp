#pragma once

#include <exception>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "noted/common.hpp"
#include "noted/core/id_generator.hpp"
#include "noted/core/tiny_id.hpp"
#include "noted/persist/format.hpp"
#include "noted/persist/persistence.hpp"
#include "noted/util/filesystem.hpp"

namespace noted::store {

// In-memory collection keyed by TinyId, snapshotted to a single file.
// T must be convertible to and from nlohmann::json.
template <typename T>
class SnapshotRepository {
 public:
  SnapshotRepository(std::filesystem::path snapshot_path, persist::Format format,
                     core::IdGenerator generator = core::IdGenerator())
      : snapshot_path_(std::move(snapshot_path)),
        format_(format),
        generator_(std::move(generator)) {}

  // Store under a freshly generated id
  Result<core::TinyId> insert(T value) {
    auto id = generator_.generateUnique(
        [this](const core::TinyId& candidate) { return entries_.contains(candidate); });
    if (!id.has_value()) {
      return id;
    }
    entries_.emplace(*id, std::move(value));
    return id;
  }

  // Insert or replace under a known id
  void put(const core::TinyId& id, T value) {
    entries_.insert_or_assign(id, std::move(value));
  }

  Result<T> get(const core::TinyId& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      return makeErrorResult<T>(ErrorCode::kNotFound, "No entry with id " + id.toString());
    }
    return it->second;
  }

  bool contains(const core::TinyId& id) const { return entries_.contains(id); }

  Result<void> remove(const core::TinyId& id) {
    if (entries_.erase(id) == 0) {
      return makeErrorResult<void>(ErrorCode::kNotFound, "No entry with id " + id.toString());
    }
    return {};
  }

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // All ids in byte order
  std::vector<core::TinyId> ids() const {
    std::vector<core::TinyId> result;
    result.reserve(entries_.size());
    for (const auto& [id, value] : entries_) {
      result.push_back(id);
    }
    return result;
  }

  const std::filesystem::path& snapshotPath() const { return snapshot_path_; }
  persist::Format format() const { return format_; }

  // Write the whole collection as [{"id": ..., "value": ...}, ...]
  Result<void> save() const {
    nlohmann::json snapshot = nlohmann::json::array();
    try {
      for (const auto& [id, value] : entries_) {
        snapshot.push_back({{"id", id}, {"value", value}});
      }
    } catch (const nlohmann::json::exception& e) {
      return makeErrorResult<void>(ErrorCode::kEncodeError, e.what());
    } catch (const std::exception& e) {
      return makeErrorResult<void>(ErrorCode::kEncodeError, e.what());
    }
    return persist::Persistence::save(snapshot, snapshot_path_, format_);
  }

  // Replace the contents with the snapshot on disk. On failure the
  // in-memory contents are unchanged.
  Result<void> load() {
    auto snapshot = persist::Persistence::load<nlohmann::json>(snapshot_path_, format_);
    if (!snapshot.has_value()) {
      return std::unexpected(snapshot.error());
    }

    auto parsed = parseEntries(*snapshot);
    if (!parsed.has_value()) {
      return std::unexpected(parsed.error());
    }

    entries_ = std::move(*parsed);
    return {};
  }

  // load(), treating a missing snapshot file as an empty collection
  Result<void> open() {
    if (!util::FileSystem::exists(snapshot_path_)) {
      entries_.clear();
      return {};
    }
    return load();
  }

 private:
  static Result<std::map<core::TinyId, T>> parseEntries(const nlohmann::json& snapshot) {
    using Entries = std::map<core::TinyId, T>;

    if (!snapshot.is_array()) {
      return makeErrorResult<Entries>(ErrorCode::kDecodeError, "Snapshot is not an array");
    }

    Entries entries;
    try {
      for (const auto& item : snapshot) {
        auto id = item.at("id").get<core::TinyId>();
        if (!entries.emplace(id, item.at("value").get<T>()).second) {
          return makeErrorResult<Entries>(ErrorCode::kDecodeError,
                                          "Duplicate id in snapshot: " + id.toString());
        }
      }
    } catch (const nlohmann::json::exception& e) {
      return makeErrorResult<Entries>(ErrorCode::kDecodeError, e.what());
    } catch (const std::exception& e) {
      return makeErrorResult<Entries>(ErrorCode::kDecodeError, e.what());
    }
    return entries;
  }

  std::filesystem::path snapshot_path_;
  persist::Format format_;
  core::IdGenerator generator_;
  std::map<core::TinyId, T> entries_;
};

}  // namespace noted::store
