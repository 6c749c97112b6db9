#pragma once
#include "Common.h"
#include <cstdint>
#include <fstream>

namespace UtilToolkit
{
    /**
     * @brief Helpers for reading, writing and moving files.
     *
     * All text is UTF-8 and is read and written as raw bytes (no newline
     * translation). Failures reported by the operating system are thrown as
     * std::filesystem::filesystem_error carrying the original error code.
     */
    class FileUtil
    {
    public:
        // --- Reading ---

        /**
         * @brief Reads the whole file into a byte array.
         */
        static std::vector<std::uint8_t> toByteArray(const fs::path& file);

        /**
         * @brief Reads the whole file into a string.
         */
        static std::string toString(const fs::path& file);

        /**
         * @brief Reads the file line by line.
         *
         * Lines end at "\n", "\r\n" or "\r"; terminators are not included.
         * A final terminator does not produce an extra empty line.
         */
        static std::vector<std::string> toLines(const fs::path& file);

        // --- Writing ---

        /**
         * @brief Writes data to file, replacing whatever was there.
         */
        static void write(const std::string& data, const fs::path& file);

        /**
         * @brief Appends data to file, creating it if needed.
         */
        static void append(const std::string& data, const fs::path& file);

        // --- Copy / Move ---

        /**
         * @brief Copies all bytes of from into to, overwriting to.
         * @throws UtilToolException if from and to are the same file.
         */
        static void copy(const fs::path& from, const fs::path& to);

        /**
         * @brief Moves a file. Renames when possible; across filesystems it
         * copies and then deletes the source.
         * @throws UtilToolException if from and to are the same file.
         */
        static void move(const fs::path& from, const fs::path& to);

        /**
         * @brief Moves a file by copying it and then deleting the source.
         *
         * If the source cannot be deleted, the copy at to is removed again
         * before the error is rethrown, so the file is never left in both places.
         */
        static void moveByCopy(const fs::path& from, const fs::path& to);

        // --- Creation ---

        /**
         * @brief Creates an empty file, or updates the modification time of an existing one.
         */
        static void touch(const fs::path& file);

        /**
         * @brief Creates a new directory under the system temp directory.
         *
         * The name is "<epoch millis>-<n>"; n counts up from 0 until a name
         * that does not exist yet is found, so several calls within the same
         * millisecond still get distinct directories.
         * @return The path of the created directory.
         */
        static fs::path createTempDir();

        /**
         * @brief Creates every missing directory above file.
         */
        static void createParentDirs(const fs::path& file);

        // --- Streams ---

        /**
         * @brief Opens file for buffered UTF-8 reading. The caller owns the stream.
         */
        static std::ifstream newReader(const fs::path& file);

        /**
         * @brief Opens file for buffered UTF-8 writing, truncating it. The caller owns the stream.
         */
        static std::ofstream newWriter(const fs::path& file);

    private:
        /**
         * @brief Builds the error for a stream that failed to open, from errno.
         */
        static fs::filesystem_error openError(const std::string& what, const fs::path& file);

        static void writeMode(const std::string& data, const fs::path& file, std::ios::openmode mode);

        static void checkNotSameFile(const fs::path& from, const fs::path& to);
    };

} // namespace UtilToolkit
