#ifndef SHADE_TRACKING_WEAK_IDENTITY_MAP_HPP
#define SHADE_TRACKING_WEAK_IDENTITY_MAP_HPP

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <utility>

namespace SHADE {
namespace Tracking {

/**
 * @brief Identity-keyed association that never extends the key's lifetime
 *
 * Keys are compared by object address, entries hold only a weak reference
 * to the keyed instance. An entry whose instance has been destroyed is
 * treated as absent, even when a new object later reuses the address.
 */
template <typename Value> class WeakIdentityMap {
public:
  using Instance = std::shared_ptr<void>;

  /// Insert or overwrite. A null instance is rejected.
  bool Insert(const Instance &instance, Value value) {
    if (!instance) {
      return false;
    }
    fEntries[instance.get()] = Entry{instance, std::move(value)};
    return true;
  }

  Value *Find(const Instance &instance) {
    auto it = Locate(instance);
    return it == fEntries.end() ? nullptr : &it->second.value;
  }

  const Value *Find(const Instance &instance) const {
    auto it = const_cast<WeakIdentityMap *>(this)->Locate(instance);
    return it == fEntries.end() ? nullptr : &it->second.value;
  }

  bool Contains(const Instance &instance) const {
    return Find(instance) != nullptr;
  }

  /// Remove the entry for instance and hand back its value
  bool Take(const Instance &instance, Value &out) {
    auto it = Locate(instance);
    if (it == fEntries.end()) {
      return false;
    }
    out = std::move(it->second.value);
    fEntries.erase(it);
    return true;
  }

  bool Erase(const Instance &instance) {
    auto it = Locate(instance);
    if (it == fEntries.end()) {
      return false;
    }
    fEntries.erase(it);
    return true;
  }

  /// Drop entries whose instance no longer exists
  size_t Purge() {
    size_t removed = 0;
    for (auto it = fEntries.begin(); it != fEntries.end();) {
      if (it->second.ref.expired()) {
        it = fEntries.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  /// Visit live entries as fn(const Instance&, Value&)
  template <typename Fn> void ForEach(Fn &&fn) {
    for (auto &kv : fEntries) {
      Instance locked = kv.second.ref.lock();
      if (locked) {
        fn(locked, kv.second.value);
      }
    }
  }

  /// Remove live or dead entries for which pred(const Value&) is true
  template <typename Pred> size_t EraseIf(Pred &&pred) {
    size_t removed = 0;
    for (auto it = fEntries.begin(); it != fEntries.end();) {
      if (pred(it->second.value)) {
        it = fEntries.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  /// Number of stored entries, including ones not yet purged
  size_t Size() const { return fEntries.size(); }

  void Clear() { fEntries.clear(); }

private:
  struct Entry {
    std::weak_ptr<void> ref;
    Value value;
  };
  using Storage = std::unordered_map<const void *, Entry>;

  typename Storage::iterator Locate(const Instance &instance) {
    if (!instance) {
      return fEntries.end();
    }
    auto it = fEntries.find(instance.get());
    if (it == fEntries.end()) {
      return it;
    }
    // Same address but a different (or dead) object is not a match
    const auto &ref = it->second.ref;
    if (ref.expired() || ref.owner_before(instance) ||
        instance.owner_before(ref)) {
      return fEntries.end();
    }
    return it;
  }

  Storage fEntries;
};

} // namespace Tracking
} // namespace SHADE

#endif // SHADE_TRACKING_WEAK_IDENTITY_MAP_HPP
