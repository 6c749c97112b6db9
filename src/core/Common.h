#pragma once

#include <iostream>
#include <string>
#include <vector>
#include <filesystem>
#include <algorithm>
#include <stdexcept>

// --- C++ Namespace Setup ---

namespace fs = std::filesystem;

/**
 * @brief Global definitions and exception types for the Util Toolkit.
 */
namespace UtilToolkit
{
    /**
     * @brief Base exception for errors raised by the toolkit itself
     * (as opposed to errors propagated from the standard library).
     */
    class UtilToolException : public std::runtime_error {
    public:
        explicit UtilToolException(const std::string& message)
            : std::runtime_error("UtilTool Error: " + message) {}
    };

    /**
     * @brief Thrown when a mutator is called on a read-only list.
     */
    class UnsupportedOperationException : public UtilToolException {
    public:
        explicit UnsupportedOperationException(const std::string& operation)
            : UtilToolException("unsupported operation '" + operation + "' on a read-only list") {}
    };

    /**
     * @brief Throws std::out_of_range when index is not a valid position in a list of the given size.
     */
    inline void checkIndex(std::size_t index, std::size_t size)
    {
        if (index >= size)
        {
            throw std::out_of_range("Index: " + std::to_string(index) + ", Size: " + std::to_string(size));
        }
    }

} // namespace UtilToolkit
