#pragma once
#include "Common.h"
#include "CopyOnWriteList.h"
#include "FixedSizeList.h"
#include "ImmutableList.h"
#include "ReverseList.h"
#include "SortedArrayList.h"
#include "SynchronizedList.h"
#include <array>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <list>
#include <optional>
#include <random>
#include <unordered_map>

namespace UtilToolkit
{
    /**
     * @brief Helpers for working with lists.
     *
     * 1. Common checks (empty / not empty, first / last element).
     * 2. Construction shortcuts for the standard and toolkit list types.
     * 3. Read-only lists: empty, singleton, unmodifiable view.
     * 4. sort / binarySearch / shuffle / reverse.
     * 5. Conversion between lists and arrays.
     * 6. List-level set operations: equality, union, intersection.
     *
     * Functions taking a pointer treat nullptr as an empty list.
     */
    class ListUtil
    {
    public:
        // --- Predicates and Accessors ---

        /**
         * @brief True if the list has no elements.
         */
        template <typename List>
        static bool isEmpty(const List& list)
        {
            return list.empty();
        }

        /**
         * @brief True if the list is null or has no elements.
         */
        template <typename List>
        static bool isEmpty(List* list)
        {
            return list == nullptr || list->empty();
        }

        static bool isEmpty(std::nullptr_t) { return true; }

        template <typename List>
        static bool isNotEmpty(const List& list)
        {
            return !list.empty();
        }

        template <typename List>
        static bool isNotEmpty(List* list)
        {
            return list != nullptr && !list->empty();
        }

        static bool isNotEmpty(std::nullptr_t) { return false; }

        /**
         * @brief The first element, or nullopt if the list is empty.
         */
        template <typename List>
        static std::optional<typename List::value_type> getFirst(const List& list)
        {
            if (list.empty())
            {
                return std::nullopt;
            }
            return *std::begin(list);
        }

        template <typename List>
        static std::optional<typename List::value_type> getFirst(List* list)
        {
            if (isEmpty(list))
            {
                return std::nullopt;
            }
            return *std::begin(*list);
        }

        /**
         * @brief The last element, or nullopt if the list is empty.
         */
        template <typename List>
        static std::optional<typename List::value_type> getLast(const List& list)
        {
            if (list.empty())
            {
                return std::nullopt;
            }
            return *std::prev(std::end(list));
        }

        template <typename List>
        static std::optional<typename List::value_type> getLast(List* list)
        {
            if (isEmpty(list))
            {
                return std::nullopt;
            }
            return *std::prev(std::end(*list));
        }

        // --- Construction ---

        template <typename T>
        static std::vector<T> newArrayList()
        {
            return std::vector<T>();
        }

        template <typename T>
        static std::vector<T> newArrayList(std::initializer_list<T> elements)
        {
            return std::vector<T>(elements);
        }

        template <typename Iterator>
        static std::vector<typename std::iterator_traits<Iterator>::value_type> newArrayList(Iterator first, Iterator last)
        {
            return std::vector<typename std::iterator_traits<Iterator>::value_type>(first, last);
        }

        /**
         * @brief An empty vector with room for initialCapacity elements before it reallocates.
         */
        template <typename T>
        static std::vector<T> newArrayListWithCapacity(std::size_t initialCapacity)
        {
            std::vector<T> list;
            list.reserve(initialCapacity);
            return list;
        }

        template <typename T>
        static std::list<T> newLinkedList()
        {
            return std::list<T>();
        }

        /**
         * @brief A list that sorts itself on insert, by operator< of T.
         */
        template <typename T>
        static SortedArrayList<T> newSortedArrayList()
        {
            return SortedArrayList<T>();
        }

        /**
         * @brief A list that sorts itself on insert, by the given comparator.
         */
        template <typename T, typename Compare>
        static SortedArrayList<T, Compare> newSortedArrayList(Compare comparator)
        {
            return SortedArrayList<T, Compare>(std::move(comparator));
        }

        template <typename T>
        static CopyOnWriteList<T> newCopyOnWriteArrayList()
        {
            return CopyOnWriteList<T>();
        }

        template <typename T>
        static CopyOnWriteList<T> newCopyOnWriteArrayList(std::initializer_list<T> elements)
        {
            return CopyOnWriteList<T>(elements);
        }

        /**
         * @brief Wraps list so each call on the wrapper runs under a single mutex.
         * Iteration is not covered; see SynchronizedList.
         */
        template <typename T>
        static SynchronizedList<T> synchronizedList(std::vector<T>& list)
        {
            return SynchronizedList<T>(list);
        }

        // --- Read-only Lists ---

        template <typename T>
        static ImmutableList<T> emptyList()
        {
            return ImmutableList<T>::sharedEmpty();
        }

        /**
         * @brief A read-only view of list, or the empty list if list is null.
         */
        template <typename T>
        static ImmutableList<T> emptyListIfNull(const std::vector<T>* list)
        {
            return list == nullptr ? ImmutableList<T>::sharedEmpty() : ImmutableList<T>::view(*list);
        }

        template <typename T>
        static ImmutableList<T> singletonList(T value)
        {
            std::vector<T> elements;
            elements.push_back(std::move(value));
            return ImmutableList<T>::owning(std::move(elements));
        }

        /**
         * @brief A read-only view over list. Later changes to list show through the view.
         */
        template <typename T>
        static ImmutableList<T> unmodifiableList(const std::vector<T>& list)
        {
            return ImmutableList<T>::view(list);
        }

        template <typename T>
        static ImmutableList<T> unmodifiableList(const std::vector<T>&& list) = delete;

        // --- Sort, Search, Shuffle, Reverse ---

        /**
         * @brief Stable in-place sort by operator<.
         */
        template <typename List>
        static void sort(List& list)
        {
            std::stable_sort(std::begin(list), std::end(list));
        }

        template <typename List, typename Compare>
        static void sort(List& list, Compare comparator)
        {
            std::stable_sort(std::begin(list), std::end(list), comparator);
        }

        template <typename T>
        static void sort(std::list<T>& list)
        {
            list.sort();
        }

        template <typename T, typename Compare>
        static void sort(std::list<T>& list, Compare comparator)
        {
            list.sort(comparator);
        }

        /**
         * @brief Binary search in a list sorted by operator<.
         * @return Index of key if present, otherwise -(insertion point) - 1.
         * The result is undefined if the list is not sorted.
         */
        template <typename List, typename T>
        static std::ptrdiff_t binarySearch(const List& list, const T& key)
        {
            return binarySearch(list, key, std::less<>());
        }

        /**
         * @brief Binary search in a list sorted by comparator.
         * @return Index of key if present, otherwise -(insertion point) - 1.
         */
        template <typename List, typename T, typename Compare>
        static std::ptrdiff_t binarySearch(const List& list, const T& key, Compare comparator)
        {
            auto first = std::begin(list);
            auto last = std::end(list);
            auto it = std::lower_bound(first, last, key, comparator);
            std::ptrdiff_t index = std::distance(first, it);
            if (it != last && !comparator(key, *it))
            {
                return index;
            }
            return -index - 1;
        }

        /**
         * @brief Random permutation using this thread's engine (see threadRandom()).
         */
        template <typename List>
        static void shuffle(List& list)
        {
            std::shuffle(std::begin(list), std::end(list), threadRandom());
        }

        /**
         * @brief Random permutation using the caller's generator.
         */
        template <typename List, typename Generator>
        static void shuffle(List& list, Generator&& random)
        {
            std::shuffle(std::begin(list), std::end(list), random);
        }

        /**
         * @brief The engine used by shuffle(list). One per thread, seeded from std::random_device.
         */
        static std::mt19937& threadRandom();

        /**
         * @brief A reversed view of list. No copy is made; both sides see each other's changes.
         */
        template <typename List>
        static ReverseList<List> reverse(List& list)
        {
            return ReverseList<List>(list);
        }

        /**
         * @brief Reversing a reversed view gives back the original list.
         */
        template <typename List>
        static List& reverse(ReverseList<List>& view)
        {
            return view.backing();
        }

        // --- Array Conversion ---

        /**
         * @brief Copies any list into a new contiguous array.
         */
        template <typename List>
        static std::vector<typename List::value_type> toArray(const List& list)
        {
            return std::vector<typename List::value_type>(std::begin(list), std::end(list));
        }

        /**
         * @brief A fixed-size list writing through to array.
         */
        template <typename T, std::size_t N>
        static FixedSizeList<T> asList(T (&array)[N])
        {
            return FixedSizeList<T>(array, N);
        }

        template <typename T, std::size_t N>
        static FixedSizeList<T> asList(std::array<T, N>& array)
        {
            return FixedSizeList<T>(array.data(), N);
        }

        template <typename T>
        static FixedSizeList<T> asList(std::vector<T>& array)
        {
            return FixedSizeList<T>(array.data(), array.size());
        }

        template <typename T>
        static FixedSizeList<T> asList(T* data, std::size_t size)
        {
            return FixedSizeList<T>(data, size);
        }

        /**
         * @brief A read-only list of first followed by the elements of rest.
         */
        template <typename T>
        static ImmutableList<T> asList(T first, const std::vector<T>& rest)
        {
            std::vector<T> elements;
            elements.reserve(rest.size() + 1);
            elements.push_back(std::move(first));
            elements.insert(elements.end(), rest.begin(), rest.end());
            return ImmutableList<T>::owning(std::move(elements));
        }

        // --- Set Operations ---

        /**
         * @brief True if both lists have the same size and equal elements in the same order.
         */
        template <typename List1, typename List2>
        static bool isEqual(const List1& list1, const List2& list2)
        {
            if (static_cast<const void*>(&list1) == static_cast<const void*>(&list2))
            {
                return true;
            }
            if (list1.size() != list2.size())
            {
                return false;
            }
            return std::equal(std::begin(list1), std::end(list1), std::begin(list2));
        }

        /**
         * @brief As above, where two nulls are equal and a null never equals a list.
         */
        template <typename List1, typename List2>
        static bool isEqual(List1* list1, List2* list2)
        {
            if (list1 == nullptr || list2 == nullptr)
            {
                return list1 == nullptr && list2 == nullptr;
            }
            return isEqual(*list1, *list2);
        }

        template <typename List>
        static bool isEqual(std::nullptr_t, List* list) { return list == nullptr; }

        template <typename List>
        static bool isEqual(List* list, std::nullptr_t) { return list == nullptr; }

        static bool isEqual(std::nullptr_t, std::nullptr_t) { return true; }

        /**
         * @brief list1 followed by list2, keeping duplicates.
         */
        template <typename List1, typename List2>
        static std::vector<typename List1::value_type> unionOf(const List1& list1, const List2& list2)
        {
            std::vector<typename List1::value_type> result;
            result.reserve(list1.size() + list2.size());
            result.insert(result.end(), std::begin(list1), std::end(list1));
            result.insert(result.end(), std::begin(list2), std::end(list2));
            return result;
        }

        /**
         * @brief Elements present in both lists.
         *
         * Counts the smaller list, then walks the larger one in order; every
         * match uses up one count. A value therefore appears
         * min(occurrences in list1, occurrences in list2) times, in the order
         * of the larger list. Requires std::hash<T>.
         */
        template <typename T>
        static std::vector<T> intersection(const std::vector<T>& list1, const std::vector<T>& list2)
        {
            const std::vector<T>* smaller = &list1;
            const std::vector<T>* larger = &list2;
            if (list1.size() > list2.size())
            {
                smaller = &list2;
                larger = &list1;
            }

            std::unordered_map<T, std::size_t> remaining;
            for (const auto& e : *smaller)
            {
                ++remaining[e];
            }

            std::vector<T> result;
            for (const auto& e : *larger)
            {
                auto it = remaining.find(e);
                if (it != remaining.end())
                {
                    result.push_back(e);
                    if (--it->second == 0)
                    {
                        remaining.erase(it);
                    }
                }
            }
            return result;
        }
    };

} // namespace UtilToolkit
