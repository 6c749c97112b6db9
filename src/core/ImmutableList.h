#pragma once
#include "Common.h"
#include <memory>

namespace UtilToolkit
{
    /**
     * @brief A read-only list.
     *
     * Either a view over a list owned by someone else (unmodifiableList,
     * emptyListIfNull) or a small list owning its own storage (emptyList,
     * singletonList, asList(first, rest)). The mutators exist so that code
     * written against a writable list still compiles, but every one of them
     * throws UnsupportedOperationException.
     */
    template <typename T>
    class ImmutableList
    {
    public:
        using value_type = T;
        using size_type = std::size_t;
        using const_iterator = typename std::vector<T>::const_iterator;
        using iterator = const_iterator;

        /**
         * @brief Creates a read-only view over a list the caller keeps alive.
         */
        static ImmutableList view(const std::vector<T>& list)
        {
            return ImmutableList(nullptr, &list);
        }

        /**
         * @brief Creates a read-only list owning the given elements.
         */
        static ImmutableList owning(std::vector<T> elements)
        {
            auto storage = std::make_shared<const std::vector<T>>(std::move(elements));
            const std::vector<T>* data = storage.get();
            return ImmutableList(std::move(storage), data);
        }

        /**
         * @brief The shared empty list. All empty lists of one element type use the same storage.
         */
        static ImmutableList sharedEmpty()
        {
            static const std::vector<T> kEmpty;
            return ImmutableList(nullptr, &kEmpty);
        }

        // --- Read access ---

        size_type size() const { return data_->size(); }
        bool empty() const { return data_->empty(); }

        const T& get(size_type index) const
        {
            checkIndex(index, data_->size());
            return (*data_)[index];
        }

        const T& operator[](size_type index) const { return (*data_)[index]; }

        bool contains(const T& value) const
        {
            return std::find(data_->begin(), data_->end(), value) != data_->end();
        }

        const_iterator begin() const { return data_->begin(); }
        const_iterator end() const { return data_->end(); }

        /**
         * @brief Copies the elements into a new writable vector.
         */
        std::vector<T> toVector() const { return *data_; }

        // --- Rejected writes ---

        [[noreturn]] void add(const T&) { throw UnsupportedOperationException("add"); }
        [[noreturn]] void set(size_type, const T&) { throw UnsupportedOperationException("set"); }
        [[noreturn]] void remove(size_type) { throw UnsupportedOperationException("remove"); }
        [[noreturn]] void clear() { throw UnsupportedOperationException("clear"); }

    private:
        ImmutableList(std::shared_ptr<const std::vector<T>> storage, const std::vector<T>* data)
            : storage_(std::move(storage)), data_(data) {}

        std::shared_ptr<const std::vector<T>> storage_;
        const std::vector<T>* data_;
    };

} // namespace UtilToolkit
