#pragma once
#include "Common.h"
#include <iterator>
#include <type_traits>

namespace UtilToolkit
{
    /**
     * @brief A live reversed view over a random-access list.
     *
     * Holds a reference to the backing list, never a copy. Index i of the
     * view is index (size - 1 - i) of the backing list, so changes through
     * either side are visible on the other.
     */
    template <typename List>
    class ReverseList
    {
        static_assert(std::is_base_of<std::random_access_iterator_tag,
                          typename std::iterator_traits<typename List::iterator>::iterator_category>::value,
                      "ReverseList needs a random-access backing list");

    public:
        using value_type = typename List::value_type;
        using size_type = std::size_t;
        using iterator = typename List::reverse_iterator;
        using const_iterator = typename List::const_reverse_iterator;

        explicit ReverseList(List& backing) : backing_(backing) {}

        size_type size() const { return backing_.size(); }
        bool empty() const { return backing_.empty(); }

        value_type& get(size_type index)
        {
            checkIndex(index, backing_.size());
            return backing_[reverseIndex(index)];
        }

        const value_type& get(size_type index) const
        {
            checkIndex(index, backing_.size());
            return backing_[reverseIndex(index)];
        }

        /**
         * @brief Replaces the element at index and returns the previous value.
         */
        value_type set(size_type index, value_type value)
        {
            checkIndex(index, backing_.size());
            value_type& slot = backing_[reverseIndex(index)];
            value_type previous = std::move(slot);
            slot = std::move(value);
            return previous;
        }

        /**
         * @brief Appends to the view, which inserts at the front of the backing list.
         */
        void add(value_type value)
        {
            backing_.insert(backing_.begin(), std::move(value));
        }

        /**
         * @brief Inserts so that the value ends up at position index of the view.
         */
        void add(size_type index, value_type value)
        {
            if (index > backing_.size())
            {
                throw std::out_of_range("Index: " + std::to_string(index) + ", Size: " + std::to_string(backing_.size()));
            }
            backing_.insert(backing_.begin() + static_cast<std::ptrdiff_t>(backing_.size() - index), std::move(value));
        }

        /**
         * @brief Removes the element at index and returns it.
         */
        value_type remove(size_type index)
        {
            checkIndex(index, backing_.size());
            auto it = backing_.begin() + static_cast<std::ptrdiff_t>(reverseIndex(index));
            value_type removed = std::move(*it);
            backing_.erase(it);
            return removed;
        }

        void clear() { backing_.clear(); }

        iterator begin() { return backing_.rbegin(); }
        iterator end() { return backing_.rend(); }
        const_iterator begin() const { return backing_.crbegin(); }
        const_iterator end() const { return backing_.crend(); }

        /**
         * @brief The list this view reads and writes.
         */
        List& backing() const { return backing_; }

    private:
        size_type reverseIndex(size_type index) const { return backing_.size() - 1 - index; }

        List& backing_;
    };

} // namespace UtilToolkit
