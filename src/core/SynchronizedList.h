#pragma once
#include "Common.h"
#include <mutex>

namespace UtilToolkit
{
    /**
     * @brief Wraps a list so that each individual call runs under one mutex.
     *
     * Only single calls are atomic. Iterating (begin/end) is not locked: a
     * caller walking the list while other threads write must hold mutex()
     * for the whole walk, e.g.
     *
     *     std::lock_guard<std::mutex> lock(synced.mutex());
     *     for (const auto& v : synced) { ... }
     */
    template <typename T>
    class SynchronizedList
    {
    public:
        using value_type = T;
        using size_type = std::size_t;

        explicit SynchronizedList(std::vector<T>& backing) : backing_(backing) {}

        SynchronizedList(const SynchronizedList&) = delete;
        SynchronizedList& operator=(const SynchronizedList&) = delete;

        void add(T value)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            backing_.push_back(std::move(value));
        }

        /**
         * @brief Returns a copy of the element; a reference would escape the lock.
         */
        T get(size_type index) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            checkIndex(index, backing_.size());
            return backing_[index];
        }

        T set(size_type index, T value)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            checkIndex(index, backing_.size());
            T previous = std::move(backing_[index]);
            backing_[index] = std::move(value);
            return previous;
        }

        T remove(size_type index)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            checkIndex(index, backing_.size());
            T removed = std::move(backing_[index]);
            backing_.erase(backing_.begin() + static_cast<std::ptrdiff_t>(index));
            return removed;
        }

        bool contains(const T& value) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return std::find(backing_.begin(), backing_.end(), value) != backing_.end();
        }

        size_type size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return backing_.size();
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return backing_.empty();
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            backing_.clear();
        }

        /**
         * @brief The lock every call takes. Hold it to iterate safely.
         */
        std::mutex& mutex() const { return mutex_; }

        typename std::vector<T>::iterator begin() { return backing_.begin(); }
        typename std::vector<T>::iterator end() { return backing_.end(); }
        typename std::vector<T>::const_iterator begin() const { return backing_.begin(); }
        typename std::vector<T>::const_iterator end() const { return backing_.end(); }

    private:
        std::vector<T>& backing_;
        mutable std::mutex mutex_;
    };

} // namespace UtilToolkit
