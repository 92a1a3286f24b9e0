#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace parcelday {

// Thrown by HashTable::get when the key is absent.
class KeyNotFoundError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Separate-chaining hash table used for every id-keyed index in the simulator.
//
// Buckets are small vectors of (key, value) pairs. After an insert pushes the
// entry count above bucket_count * load_factor the bucket array doubles and all
// entries are rehashed, so put() is amortized O(1).
//
// Iteration walks buckets in index order and each bucket in insertion order.
// Iterators, and pointers returned by find()/get(), are invalidated by any
// put() of a new key, remove(), pop() or clear(). Overwriting an existing key
// and mutating values in place keep them valid.
template <typename K, typename V, typename Hash = std::hash<K>>
class HashTable {
 public:
  using key_type = K;
  using mapped_type = V;
  using value_type = std::pair<K, V>;

  static constexpr std::size_t kDefaultBuckets = 16;
  static constexpr double kDefaultLoadFactor = 0.75;

  template <bool Const>
  class BasicIterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = HashTable::value_type;
    using difference_type = std::ptrdiff_t;
    using pointer = std::conditional_t<Const, const value_type*, value_type*>;
    using reference = std::conditional_t<Const, const value_type&, value_type&>;
    using Buckets = std::conditional_t<Const, const std::vector<std::vector<value_type>>,
                                       std::vector<std::vector<value_type>>>;

    BasicIterator() = default;
    BasicIterator(Buckets* buckets, std::size_t outer, std::size_t inner)
        : buckets_(buckets), outer_(outer), inner_(inner) {
      skip_empty();
    }

    reference operator*() const { return (*buckets_)[outer_][inner_]; }
    pointer operator->() const { return &(*buckets_)[outer_][inner_]; }

    BasicIterator& operator++() {
      ++inner_;
      skip_empty();
      return *this;
    }
    BasicIterator operator++(int) {
      BasicIterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const BasicIterator& o) const {
      return buckets_ == o.buckets_ && outer_ == o.outer_ && inner_ == o.inner_;
    }
    bool operator!=(const BasicIterator& o) const { return !(*this == o); }

   private:
    void skip_empty() {
      if (!buckets_) return;
      while (outer_ < buckets_->size() && inner_ >= (*buckets_)[outer_].size()) {
        ++outer_;
        inner_ = 0;
      }
    }

    Buckets* buckets_{nullptr};
    std::size_t outer_{0};
    std::size_t inner_{0};
  };

  using iterator = BasicIterator<false>;
  using const_iterator = BasicIterator<true>;

  explicit HashTable(std::size_t bucket_count = kDefaultBuckets, double load_factor = kDefaultLoadFactor)
      : buckets_(bucket_count), load_factor_(load_factor) {
    if (bucket_count == 0) throw std::invalid_argument("HashTable bucket count must be positive");
    if (!(load_factor > 0.0)) throw std::invalid_argument("HashTable load factor must be positive");
  }

  // Inserts or overwrites.
  void put(const K& key, V value) {
    auto& bucket = buckets_[index_for(key)];
    for (auto& kv : bucket) {
      if (kv.first == key) {
        kv.second = std::move(value);
        return;
      }
    }
    bucket.emplace_back(key, std::move(value));
    ++size_;
    if (is_full()) grow();
  }

  V& get(const K& key) {
    if (V* v = find(key)) return *v;
    throw KeyNotFoundError("HashTable: key not found");
  }

  const V& get(const K& key) const {
    if (const V* v = find(key)) return *v;
    throw KeyNotFoundError("HashTable: key not found");
  }

  V* find(const K& key) {
    for (auto& kv : buckets_[index_for(key)]) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  const V* find(const K& key) const {
    for (const auto& kv : buckets_[index_for(key)]) {
      if (kv.first == key) return &kv.second;
    }
    return nullptr;
  }

  bool contains(const K& key) const { return find(key) != nullptr; }

  // No-op if absent.
  void remove(const K& key) { (void)pop(key); }

  std::optional<V> pop(const K& key) {
    auto& bucket = buckets_[index_for(key)];
    for (auto it = bucket.begin(); it != bucket.end(); ++it) {
      if (it->first == key) {
        std::optional<V> out(std::move(it->second));
        bucket.erase(it);
        --size_;
        return out;
      }
    }
    return std::nullopt;
  }

  void clear() {
    for (auto& bucket : buckets_) bucket.clear();
    size_ = 0;
  }

  std::size_t length() const { return size_; }
  bool empty() const { return size_ == 0; }
  std::size_t bucket_count() const { return buckets_.size(); }
  double load_factor() const { return load_factor_; }

  std::vector<K> keys() const {
    std::vector<K> out;
    out.reserve(size_);
    for (const auto& kv : *this) out.push_back(kv.first);
    return out;
  }

  std::vector<V> values() const {
    std::vector<V> out;
    out.reserve(size_);
    for (const auto& kv : *this) out.push_back(kv.second);
    return out;
  }

  iterator begin() { return iterator(&buckets_, 0, 0); }
  iterator end() { return iterator(&buckets_, buckets_.size(), 0); }
  const_iterator begin() const { return const_iterator(&buckets_, 0, 0); }
  const_iterator end() const { return const_iterator(&buckets_, buckets_.size(), 0); }

 private:
  std::size_t index_for(const K& key) const { return Hash{}(key) % buckets_.size(); }

  bool is_full() const {
    return static_cast<double>(size_) > static_cast<double>(buckets_.size()) * load_factor_;
  }

  void grow() {
    std::vector<std::vector<value_type>> next(buckets_.size() * 2);
    for (auto& bucket : buckets_) {
      for (auto& kv : bucket) {
        next[Hash{}(kv.first) % next.size()].push_back(std::move(kv));
      }
    }
    buckets_ = std::move(next);
  }

  std::vector<std::vector<value_type>> buckets_;
  double load_factor_{kDefaultLoadFactor};
  std::size_t size_{0};
};

} // namespace parcelday
