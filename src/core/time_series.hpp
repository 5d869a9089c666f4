/**
 * TimeSeries: ordered, duplicate-free series of dated records.
 *
 * Records are kept strictly ascending by key. Merging a batch walks the
 * existing entries once per incoming record: an equal key replaces the
 * slot in place, otherwise the record is inserted before the first greater
 * key (or appended). Entries not touched by a batch keep their relative
 * order, and the invariant holds after every merge.
 *
 * Keys come from a traits type:
 *   struct Traits {
 *       using key_type = ...;                       // totally ordered
 *       static key_type key(const T& record);
 *   };
 *
 * Per-body series hold tens to a few hundred records, so the linear
 * merge is fine.
 */

#ifndef SOLCAT_TIME_SERIES_HPP
#define SOLCAT_TIME_SERIES_HPP

#include "core/state_vector.hpp"
#include "physics/orbital_elements.hpp"
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace solcat {

template <typename T, typename Traits>
class TimeSeries {
public:
    using value_type = T;
    using key_type = typename Traits::key_type;
    using const_iterator = typename std::vector<T>::const_iterator;

    TimeSeries() = default;

    static key_type key_of(const T& record) { return Traits::key(record); }

    /**
     * @brief Fold an unordered batch into the series
     *
     * The batch is stable-sorted by key first, so within one batch the
     * later of two equal-key records wins, as does a later batch over
     * an earlier one.
     */
    void merge(std::vector<T> incoming) {
        std::stable_sort(incoming.begin(), incoming.end(),
                         [](const T& lhs, const T& rhs) {
                             return Traits::key(lhs) < Traits::key(rhs);
                         });

        for (auto& record : incoming) {
            merge_one(std::move(record));
        }
    }

    void merge(const TimeSeries& other) {
        merge(other.entries_);
    }

    /**
     * @brief Insert or replace a single record
     */
    void merge_one(T record) {
        const key_type key = Traits::key(record);

        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            const key_type existing = Traits::key(*it);
            if (existing == key) {
                *it = std::move(record);
                return;
            }
            if (key < existing) {
                entries_.insert(it, std::move(record));
                return;
            }
        }
        entries_.push_back(std::move(record));
    }

    const T* find(const key_type& key) const {
        for (const auto& record : entries_) {
            if (Traits::key(record) == key) return &record;
        }
        return nullptr;
    }

    // Any record at this epoch, regardless of the rest of the key
    bool contains_epoch(double epoch) const {
        for (const auto& record : entries_) {
            if (record.epoch == epoch) return true;
        }
        return false;
    }

    bool is_strictly_ascending() const {
        for (size_t i = 1; i < entries_.size(); i++) {
            if (!(Traits::key(entries_[i - 1]) < Traits::key(entries_[i]))) {
                return false;
            }
        }
        return true;
    }

    // Replace the contents wholesale (identity reconciliation only)
    void assign(std::vector<T> records) {
        entries_.clear();
        merge(std::move(records));
    }

    void clear() { entries_.clear(); }

    const std::vector<T>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const T& operator[](size_t index) const { return entries_[index]; }
    const T& front() const { return entries_.front(); }
    const T& back() const { return entries_.back(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<T> entries_;
};

// ─────────────────────────────────────────────────────────────
// Key traits
// ─────────────────────────────────────────────────────────────

// Element sets: (epoch, ref_id), one orbit per center per epoch
struct ElementKeyTraits {
    using key_type = std::pair<double, std::string>;
    static key_type key(const OsculatingElements& elem) {
        return key_type(elem.epoch, elem.ref_id);
    }
};

struct StateVectorKeyTraits {
    using key_type = double;
    static key_type key(const StateVector& vec) { return vec.epoch; }
};

using ElementSeries = TimeSeries<OsculatingElements, ElementKeyTraits>;
using StateVectorSeries = TimeSeries<StateVector, StateVectorKeyTraits>;

} // namespace solcat

#endif // SOLCAT_TIME_SERIES_HPP
