#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace gitquery {

/**
 * @brief Per-record-type customization point for RecordCollection
 *
 * Each record type specializes this with:
 *   static const std::string& key(const T&);  // lookup / search key
 *   static constexpr bool kSortedByKey;       // stable-sort on construction
 */
template <typename T>
struct RecordTraits;

/**
 * @brief Lazy, restartable view over the records matching a predicate
 *
 * Shares the collection's immutable storage, so a view stays valid after
 * the collection is moved or destroyed. Every begin() rescans.
 */
template <typename T>
class FilteredView {
public:
    using Predicate = std::function<bool(const T&)>;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        const_iterator(const FilteredView* view, size_t pos) : view(view), pos(pos) { skipRejected(); }

        reference operator*() const { return (*view->records)[pos]; }
        pointer operator->() const { return &(*view->records)[pos]; }

        const_iterator& operator++() {
            ++pos;
            skipRejected();
            return *this;
        }
        const_iterator operator++(int) {
            const_iterator prev = *this;
            ++(*this);
            return prev;
        }

        bool operator==(const const_iterator& other) const { return view == other.view && pos == other.pos; }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        void skipRejected() {
            while (pos < view->records->size() && !view->predicate((*view->records)[pos])) {
                ++pos;
            }
        }

        const FilteredView* view;
        size_t pos;
    };

    FilteredView(std::shared_ptr<const std::vector<T>> records, Predicate predicate)
        : records(std::move(records)), predicate(std::move(predicate)) {}

    const_iterator begin() const { return const_iterator(this, 0); }
    const_iterator end() const { return const_iterator(this, records->size()); }

    bool empty() const { return begin() == end(); }
    size_t size() const { return static_cast<size_t>(std::distance(begin(), end())); }

    /// First matching record, or nullptr
    const T* first() const {
        const_iterator it = begin();
        return it == end() ? nullptr : &*it;
    }

    /// Copy the matching records out
    std::vector<T> toVector() const { return std::vector<T>(begin(), end()); }

private:
    std::shared_ptr<const std::vector<T>> records;
    Predicate predicate;
};

/**
 * @brief Ordered, immutable collection of decoded records
 *
 * One instantiation per record type (StatusReport, CommitLog, BranchList,
 * TagList, StashList, DiffReport, RemoteList). Insertion order is kept
 * unless RecordTraits<T>::kSortedByKey, in which case records are
 * stable-sorted by key once at construction. Nothing mutates a collection
 * afterwards, so copies and views share one record store; type-specific
 * queries are free functions next to each record.
 */
template <typename T>
class RecordCollection {
public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;
    using Predicate = typename FilteredView<T>::Predicate;

    RecordCollection() : records(std::make_shared<const std::vector<T>>()) {}

    explicit RecordCollection(std::vector<T> items) {
        if (RecordTraits<T>::kSortedByKey) {
            std::stable_sort(items.begin(), items.end(), [](const T& a, const T& b) {
                return RecordTraits<T>::key(a) < RecordTraits<T>::key(b);
            });
        }
        records = std::make_shared<const std::vector<T>>(std::move(items));
    }

    // No move operations: a moved-from collection keeps its records
    RecordCollection(const RecordCollection&) = default;
    RecordCollection& operator=(const RecordCollection&) = default;

    size_t size() const { return records->size(); }
    bool empty() const { return records->empty(); }

    const_iterator begin() const { return records->begin(); }
    const_iterator end() const { return records->end(); }

    const std::vector<T>& all() const { return *records; }

    /// Record at position i, or nullptr when out of range
    const T* at(size_t i) const { return i < records->size() ? &(*records)[i] : nullptr; }
    const T* first() const { return records->empty() ? nullptr : &records->front(); }
    const T* last() const { return records->empty() ? nullptr : &records->back(); }

    /// First record whose key equals `key` exactly, or nullptr
    const T* find(const std::string& key) const {
        for (const T& record : *records) {
            if (RecordTraits<T>::key(record) == key) return &record;
        }
        return nullptr;
    }

    /// All records whose key contains `substring` (case sensitive)
    FilteredView<T> findContaining(const std::string& substring) const {
        return filter([substring](const T& record) {
            return RecordTraits<T>::key(record).find(substring) != std::string::npos;
        });
    }

    FilteredView<T> filter(Predicate predicate) const {
        return FilteredView<T>(records, std::move(predicate));
    }

    size_t count(const Predicate& predicate) const {
        return static_cast<size_t>(std::count_if(records->begin(), records->end(), predicate));
    }

private:
    std::shared_ptr<const std::vector<T>> records;
};

}
