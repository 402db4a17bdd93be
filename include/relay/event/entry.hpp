#pragma once

#include "relay/core/key.hpp"
#include "relay/exec/executor.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace relay {

template <typename Sig> using Handler = std::function<Sig>;

template <typename Sig> struct HandlerEntry {
  Handler<Sig> handler;
  Key key;
  /// Null means run inline on the firing thread.
  std::shared_ptr<IExecutor> executor;
};

template <typename Sig> using EntryList = std::vector<HandlerEntry<Sig>>;

/// Removes every entry registered under `key`.
template <typename Sig>
auto erase_key(EntryList<Sig> &entries, const Key &key) -> std::size_t {
  return std::erase_if(entries,
                       [&key](const auto &entry) { return entry.key == key; });
}

/// Direct executors are stored as null so dispatch can skip the virtual call.
[[nodiscard]] inline auto
normalize_executor(std::shared_ptr<IExecutor> executor)
    -> std::shared_ptr<IExecutor> {
  if (is_direct(executor.get())) {
    return nullptr;
  }
  return executor;
}

/// View over a registry's live entry list. Elements are handed out by value
/// so a handler that unregisters itself mid-dispatch does not pull the entry
/// out from under the caller.
template <typename Sig> class LiveEntries {
public:
  explicit LiveEntries(const EntryList<Sig> *entries) noexcept
      : entries_(entries) {}

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_->size();
  }
  [[nodiscard]] auto operator[](std::size_t i) const -> HandlerEntry<Sig> {
    return (*entries_)[i];
  }

private:
  const EntryList<Sig> *entries_;
};

/// View over an immutable published snapshot.
template <typename Sig> class SnapshotEntries {
public:
  explicit SnapshotEntries(std::shared_ptr<const EntryList<Sig>> entries)
      : entries_(std::move(entries)) {}

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return entries_->size();
  }
  [[nodiscard]] auto operator[](std::size_t i) const
      -> const HandlerEntry<Sig> & {
    return (*entries_)[i];
  }

private:
  std::shared_ptr<const EntryList<Sig>> entries_;
};

} // namespace relay
