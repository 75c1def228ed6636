#include <leasegate/common/critical.hpp>
#include <leasegate/state/journal.hpp>

#include <iterator>

namespace leasegate::state {

journal::journal(storage_t& storage) : storage_{storage} {}

std::optional<leasegate::schema::bytes_t> journal::get_raw(
    const leasegate::schema::bytes_t& key) const {
  auto it = overlay_.find(key);
  if (it != std::end(overlay_)) {
    return it->second;
  }
  return storage_.get_raw(leasegate::schema::make_bytes_view(key));
}

void journal::put_raw(const leasegate::schema::bytes_t& key,
                      leasegate::schema::bytes_t value) {
  auto it = overlay_.find(key);
  if (it == std::end(overlay_)) {
    undo_.push_back(undo_entry{.key = key, .previous = std::nullopt});
    overlay_.emplace(key, std::move(value));
    return;
  }
  undo_.push_back(undo_entry{.key = key, .previous = it->second});
  it->second = std::move(value);
}

bool journal::put_raw_if_absent(const leasegate::schema::bytes_t& key,
                                leasegate::schema::bytes_t value) {
  if (get_raw(key).has_value()) {
    return false;
  }
  put_raw(key, std::move(value));
  return true;
}

void journal::emit(leasegate::schema::transaction_event_t event) {
  events_.push_back(std::move(event));
}

std::vector<leasegate::schema::transaction_event_t> journal::events_since(
    const checkpoint& from) const {
  if (from.event_count > events_.size()) {
    leasegate::common::critical("journal checkpoint is ahead of event log");
  }
  return {std::next(std::begin(events_),
                    static_cast<std::ptrdiff_t>(from.event_count)),
          std::end(events_)};
}

checkpoint journal::mark() const {
  return checkpoint{.undo_depth = undo_.size(), .event_count = events_.size()};
}

void journal::revert_to(const checkpoint& to) {
  if (to.undo_depth > undo_.size() || to.event_count > events_.size()) {
    leasegate::common::critical("journal checkpoint is ahead of journal");
  }
  while (undo_.size() > to.undo_depth) {
    auto& entry = undo_.back();
    if (entry.previous) {
      overlay_[entry.key] = std::move(*entry.previous);
    } else {
      overlay_.erase(entry.key);
    }
    undo_.pop_back();
  }
  events_.resize(to.event_count);
}

const leasegate::storage::write_set_t& journal::pending_writes() const {
  return overlay_;
}

void journal::persist(const leasegate::storage::committed_state& state) {
  storage_.commit(overlay_, state);
  discard();
}

void journal::discard() {
  overlay_.clear();
  undo_.clear();
  events_.clear();
}

}  // namespace leasegate::state
