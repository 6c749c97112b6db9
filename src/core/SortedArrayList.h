#pragma once
#include "Common.h"
#include <functional>
#include <iterator>

namespace UtilToolkit
{
    /**
     * @brief An array-backed list that keeps its elements ordered on every insert.
     *
     * Insertion finds its slot by binary search; an element equal to existing
     * ones goes after them, so insertion order is kept among equals.
     * Writing at a chosen position would break the ordering, so the type has
     * no positional add or set.
     */
    template <typename T, typename Compare = std::less<T>>
    class SortedArrayList
    {
    public:
        using value_type = T;
        using size_type = std::size_t;
        using const_iterator = typename std::vector<T>::const_iterator;
        using iterator = const_iterator;

        SortedArrayList() = default;
        explicit SortedArrayList(Compare comparator) : comparator_(std::move(comparator)) {}

        /**
         * @brief Inserts value at its sorted position.
         * @return The index it was inserted at.
         */
        size_type add(T value)
        {
            size_type index = findInsertionPoint(value);
            elements_.insert(elements_.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
            return index;
        }

        /**
         * @brief Inserts every value, keeping the list ordered.
         */
        template <typename Range>
        void addAll(const Range& values)
        {
            std::vector<T> incoming(std::begin(values), std::end(values));
            if (incoming.empty())
            {
                return;
            }
            std::stable_sort(incoming.begin(), incoming.end(), comparator_);
            std::vector<T> merged;
            merged.reserve(elements_.size() + incoming.size());
            std::merge(elements_.begin(), elements_.end(), incoming.begin(), incoming.end(),
                       std::back_inserter(merged), comparator_);
            elements_.swap(merged);
        }

        const T& get(size_type index) const
        {
            checkIndex(index, elements_.size());
            return elements_[index];
        }

        const T& operator[](size_type index) const { return elements_[index]; }

        const T& first() const
        {
            checkIndex(0, elements_.size());
            return elements_.front();
        }

        const T& last() const
        {
            checkIndex(0, elements_.size());
            return elements_.back();
        }

        T remove(size_type index)
        {
            checkIndex(index, elements_.size());
            T removed = std::move(elements_[index]);
            elements_.erase(elements_.begin() + static_cast<std::ptrdiff_t>(index));
            return removed;
        }

        /**
         * @brief Removes one element equivalent to value.
         * @return true if an element was removed.
         */
        bool removeValue(const T& value)
        {
            std::ptrdiff_t index = indexOf(value);
            if (index < 0)
            {
                return false;
            }
            elements_.erase(elements_.begin() + index);
            return true;
        }

        /**
         * @brief Binary search for value.
         * @return Index of the first equivalent element, or -1.
         */
        std::ptrdiff_t indexOf(const T& value) const
        {
            auto it = std::lower_bound(elements_.begin(), elements_.end(), value, comparator_);
            if (it == elements_.end() || comparator_(value, *it))
            {
                return -1;
            }
            return it - elements_.begin();
        }

        bool contains(const T& value) const { return indexOf(value) >= 0; }

        /**
         * @brief The index add() would place value at (after any equivalent elements).
         */
        size_type findInsertionPoint(const T& value) const
        {
            auto it = std::upper_bound(elements_.begin(), elements_.end(), value, comparator_);
            return static_cast<size_type>(it - elements_.begin());
        }

        size_type size() const { return elements_.size(); }
        bool empty() const { return elements_.empty(); }
        void clear() { elements_.clear(); }

        const_iterator begin() const { return elements_.begin(); }
        const_iterator end() const { return elements_.end(); }

    private:
        Compare comparator_;
        std::vector<T> elements_;
    };

} // namespace UtilToolkit
