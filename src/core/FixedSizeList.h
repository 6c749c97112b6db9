#pragma once
#include "Common.h"

namespace UtilToolkit
{
    /**
     * @brief A fixed-size list backed by an array owned by the caller.
     *
     * Writes go straight through to the backing array and changes made to
     * the array are seen by the list. The type has no add/remove: the size
     * is fixed for its whole lifetime. The caller keeps the array alive.
     *
     * FixedSizeList<int>, FixedSizeList<long> and FixedSizeList<double> are
     * the primitive-backed lists; they store nothing but the pointer and size.
     */
    template <typename T>
    class FixedSizeList
    {
    public:
        using value_type = T;
        using size_type = std::size_t;
        using iterator = T*;
        using const_iterator = const T*;

        FixedSizeList(T* data, size_type size) : data_(data), size_(size) {}

        size_type size() const { return size_; }
        bool empty() const { return size_ == 0; }

        T& get(size_type index)
        {
            checkIndex(index, size_);
            return data_[index];
        }

        const T& get(size_type index) const
        {
            checkIndex(index, size_);
            return data_[index];
        }

        T& operator[](size_type index) { return data_[index]; }
        const T& operator[](size_type index) const { return data_[index]; }

        /**
         * @brief Replaces the element at index and returns the previous value.
         */
        T set(size_type index, T value)
        {
            checkIndex(index, size_);
            T previous = std::move(data_[index]);
            data_[index] = std::move(value);
            return previous;
        }

        /**
         * @brief Position of the first element equal to value, or -1.
         */
        std::ptrdiff_t indexOf(const T& value) const
        {
            const T* it = std::find(data_, data_ + size_, value);
            return it == data_ + size_ ? -1 : it - data_;
        }

        bool contains(const T& value) const { return indexOf(value) >= 0; }

        iterator begin() { return data_; }
        iterator end() { return data_ + size_; }
        const_iterator begin() const { return data_; }
        const_iterator end() const { return data_ + size_; }

        T* data() { return data_; }
        const T* data() const { return data_; }

    private:
        T* data_;
        size_type size_;
    };

} // namespace UtilToolkit
