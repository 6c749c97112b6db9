#pragma once
#include "Common.h"
#include <initializer_list>
#include <memory>
#include <mutex>

namespace UtilToolkit
{
    /**
     * @brief A thread-safe list where every write copies the underlying array.
     *
     * Readers never block writers: they atomically load the current
     * immutable snapshot and keep reading it even if a writer publishes a
     * newer one meanwhile. Only writers take the mutex. Suited to lists that are read far
     * more often than they are changed (listener registries and the like).
     */
    template <typename T>
    class CopyOnWriteList
    {
    public:
        using value_type = T;
        using size_type = std::size_t;
        using Snapshot = std::shared_ptr<const std::vector<T>>;

        CopyOnWriteList() : array_(std::make_shared<const std::vector<T>>()) {}

        CopyOnWriteList(std::initializer_list<T> elements)
            : array_(std::make_shared<const std::vector<T>>(elements)) {}

        CopyOnWriteList(const CopyOnWriteList&) = delete;
        CopyOnWriteList& operator=(const CopyOnWriteList&) = delete;

        /**
         * @brief The current contents. The returned array never changes; iterate it freely.
         */
        Snapshot snapshot() const
        {
            return std::atomic_load(&array_);
        }

        size_type size() const { return snapshot()->size(); }
        bool empty() const { return snapshot()->empty(); }

        T get(size_type index) const
        {
            Snapshot current = snapshot();
            checkIndex(index, current->size());
            return (*current)[index];
        }

        bool contains(const T& value) const
        {
            Snapshot current = snapshot();
            return std::find(current->begin(), current->end(), value) != current->end();
        }

        void add(T value)
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            auto next = std::make_shared<std::vector<T>>();
            next->reserve(array_->size() + 1);
            next->assign(array_->begin(), array_->end());
            next->push_back(std::move(value));
            publish(std::move(next));
        }

        void addAll(const std::vector<T>& values)
        {
            if (values.empty())
            {
                return;
            }
            std::lock_guard<std::mutex> lock(writeMutex_);
            auto next = std::make_shared<std::vector<T>>();
            next->reserve(array_->size() + values.size());
            next->assign(array_->begin(), array_->end());
            next->insert(next->end(), values.begin(), values.end());
            publish(std::move(next));
        }

        /**
         * @brief Appends value unless an equal element is already present.
         * @return true if the value was added.
         */
        bool addIfAbsent(const T& value)
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            if (std::find(array_->begin(), array_->end(), value) != array_->end())
            {
                return false;
            }
            auto next = std::make_shared<std::vector<T>>(*array_);
            next->push_back(value);
            publish(std::move(next));
            return true;
        }

        T set(size_type index, T value)
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            checkIndex(index, array_->size());
            auto next = std::make_shared<std::vector<T>>(*array_);
            T previous = std::move((*next)[index]);
            (*next)[index] = std::move(value);
            publish(std::move(next));
            return previous;
        }

        T remove(size_type index)
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            checkIndex(index, array_->size());
            auto next = std::make_shared<std::vector<T>>(*array_);
            T removed = std::move((*next)[index]);
            next->erase(next->begin() + static_cast<std::ptrdiff_t>(index));
            publish(std::move(next));
            return removed;
        }

        /**
         * @brief Removes the first element equal to value.
         * @return true if an element was removed.
         */
        bool removeValue(const T& value)
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            auto it = std::find(array_->begin(), array_->end(), value);
            if (it == array_->end())
            {
                return false;
            }
            auto next = std::make_shared<std::vector<T>>();
            next->reserve(array_->size() - 1);
            next->insert(next->end(), array_->begin(), it);
            next->insert(next->end(), it + 1, array_->end());
            publish(std::move(next));
            return true;
        }

        void clear()
        {
            std::lock_guard<std::mutex> lock(writeMutex_);
            publish(std::make_shared<const std::vector<T>>());
        }

    private:
        // Callers hold writeMutex_.
        void publish(Snapshot next)
        {
            std::atomic_store(&array_, std::move(next));
        }

        std::mutex writeMutex_;
        Snapshot array_;
    };

} // namespace UtilToolkit
