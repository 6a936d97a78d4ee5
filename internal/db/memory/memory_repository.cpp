#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace transfer::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

MemoryRepository::ProcessMap MemoryRepository::Visible(const MemoryTransaction& tx) const {
  ProcessMap rows;
  {
    std::scoped_lock lock(mutex_);
    rows = committed_;
  }
  for (const auto& [id, record] : tx.Writes()) {
    rows[id] = record;
  }
  return rows;
}

Result MemoryRepository::InsertProcess(Transaction& t, const model::TransferProcessRecord& r) {
  auto& tx = TX(t);
  if (tx.Writes().contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  {
    std::scoped_lock lock(mutex_);
    if (committed_.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  }
  tx.Writes()[r.id] = r;
  tx.Inserted().insert(r.id);
  return Result::Ok();
}

std::optional<model::TransferProcessRecord> MemoryRepository::GetProcess(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (auto it = tx.Writes().find(id); it != tx.Writes().end()) return it->second;

  std::scoped_lock lock(mutex_);
  auto             it = committed_.find(id);
  if (it == committed_.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateProcess(Transaction& t, const model::TransferProcessRecord& r) {
  auto& tx = TX(t);
  if (!tx.Writes().contains(r.id)) {
    std::scoped_lock lock(mutex_);
    if (!committed_.contains(r.id)) return Result::Err(ErrorCode::NotFound, r.id);
  }
  tx.Writes()[r.id] = r;
  return Result::Ok();
}

std::vector<model::TransferProcessRecord> MemoryRepository::ListProcesses(Transaction& t) {
  auto                                      rows = Visible(TX(t));
  std::vector<model::TransferProcessRecord> records;
  records.reserve(rows.size());
  for (auto& [_, record] : rows) {
    records.push_back(std::move(record));
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return records;
}

std::vector<model::TransferProcessRecord> MemoryRepository::NextForState(Transaction& t, int32_t state, std::size_t limit) {
  std::vector<model::TransferProcessRecord> matches;
  for (auto& [_, record] : Visible(TX(t))) {
    if (record.state == state) matches.push_back(std::move(record));
  }

  std::sort(matches.begin(), matches.end(), [](const auto& a, const auto& b) {
    if (a.state_timestamp_ms != b.state_timestamp_ms) return a.state_timestamp_ms < b.state_timestamp_ms;
    return a.id < b.id;
  });
  if (matches.size() > limit) matches.resize(limit);
  return matches;
}

} // namespace transfer::db::memory
