#include "FileUtil.h"
#include "utils/Definitions.h"
#include <cerrno>
#include <chrono>
#include <iterator>
#include <sstream>
#include <system_error>

namespace UtilToolkit
{
    // --- Helpers ---

    fs::filesystem_error FileUtil::openError(const std::string& what, const fs::path& file)
    {
        int err = errno;
        if (err == 0)
        {
            err = EIO;
        }
        return fs::filesystem_error(what, file, std::error_code(err, std::generic_category()));
    }

    void FileUtil::writeMode(const std::string& data, const fs::path& file, std::ios::openmode mode)
    {
        std::ofstream out(file, mode | std::ios::out | std::ios::binary);
        if (!out.is_open())
        {
            throw openError("cannot open file for writing", file);
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.close();
        if (out.fail())
        {
            throw openError("cannot write file", file);
        }
    }

    void FileUtil::checkNotSameFile(const fs::path& from, const fs::path& to)
    {
        if (fs::exists(from) && fs::exists(to) && fs::equivalent(from, to))
        {
            throw UtilToolException("Source '" + from.string() + "' and destination '" + to.string() + "' must be different");
        }
    }

    // --- Reading ---

    std::vector<std::uint8_t> FileUtil::toByteArray(const fs::path& file)
    {
        std::ifstream in(file, std::ios::in | std::ios::binary);
        if (!in.is_open())
        {
            throw openError("cannot open file for reading", file);
        }
        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            throw openError("cannot read file", file);
        }
        return bytes;
    }

    std::string FileUtil::toString(const fs::path& file)
    {
        std::ifstream in = newReader(file);
        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
        {
            throw openError("cannot read file", file);
        }
        return ss.str();
    }

    std::vector<std::string> FileUtil::toLines(const fs::path& file)
    {
        const std::string text = toString(file);
        std::vector<std::string> lines;
        std::string line;

        for (std::size_t i = 0; i < text.size(); ++i)
        {
            char c = text[i];
            if (c == '\n' || c == '\r')
            {
                lines.push_back(line);
                line.clear();
                // "\r\n" is one terminator
                if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                {
                    ++i;
                }
            }
            else
            {
                line.push_back(c);
            }
        }
        if (!line.empty())
        {
            lines.push_back(line);
        }
        return lines;
    }

    // --- Writing ---

    void FileUtil::write(const std::string& data, const fs::path& file)
    {
        writeMode(data, file, std::ios::trunc);
    }

    void FileUtil::append(const std::string& data, const fs::path& file)
    {
        writeMode(data, file, std::ios::app);
    }

    // --- Copy / Move ---

    void FileUtil::copy(const fs::path& from, const fs::path& to)
    {
        checkNotSameFile(from, to);
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    }

    void FileUtil::move(const fs::path& from, const fs::path& to)
    {
        checkNotSameFile(from, to);

        std::error_code ec;
        fs::rename(from, to, ec);
        if (!ec)
        {
            return;
        }
        if (ec != std::errc::cross_device_link)
        {
            throw fs::filesystem_error("cannot move file", from, to, ec);
        }

        std::cout << "Rename across filesystems not possible, copying '" << from.string() << "' to '" << to.string() << "'." << std::endl;
        moveByCopy(from, to);
    }

    void FileUtil::moveByCopy(const fs::path& from, const fs::path& to)
    {
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
        try
        {
            fs::remove(from);
        }
        catch (const fs::filesystem_error&)
        {
            std::error_code cleanupError;
            fs::remove(to, cleanupError);
            if (cleanupError)
            {
                std::cerr << "Failed to remove copy '" << to.string() << "': " << cleanupError.message() << std::endl;
            }
            throw;
        }
    }

    // --- Creation ---

    void FileUtil::touch(const fs::path& file)
    {
        if (!fs::is_directory(file))
        {
            // app mode creates a missing file and never truncates an existing one
            std::ofstream out(file, std::ios::out | std::ios::app | std::ios::binary);
            if (!out.is_open())
            {
                throw openError("cannot touch file", file);
            }
        }
        fs::last_write_time(file, fs::file_time_type::clock::now());
    }

    fs::path FileUtil::createTempDir()
    {
        fs::path baseDir = fs::temp_directory_path();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::string baseName = std::to_string(millis) + Definitions::TEMP_DIR_SEPARATOR;

        for (int counter = 0; counter < Definitions::TEMP_DIR_ATTEMPTS; counter++)
        {
            fs::path tempDir = baseDir / (baseName + std::to_string(counter));
            if (fs::create_directory(tempDir))
            {
                std::cout << "Created directory: '" << tempDir.string() << "'." << std::endl;
                return tempDir;
            }
        }
        throw UtilToolException("Failed to create directory within " + std::to_string(Definitions::TEMP_DIR_ATTEMPTS)
            + " attempts (tried " + baseName + "0 to " + baseName + std::to_string(Definitions::TEMP_DIR_ATTEMPTS - 1) + ")");
    }

    void FileUtil::createParentDirs(const fs::path& file)
    {
        fs::path directory = fs::absolute(file).parent_path();
        if (directory.empty() || fs::is_directory(directory))
        {
            return;
        }
        fs::create_directories(directory);
        std::cout << "Created directory: '" << directory.string() << "'." << std::endl;
    }

    // --- Streams ---

    std::ifstream FileUtil::newReader(const fs::path& file)
    {
        std::ifstream in(file, std::ios::in | std::ios::binary);
        if (!in.is_open())
        {
            throw openError("cannot open file for reading", file);
        }
        return in;
    }

    std::ofstream FileUtil::newWriter(const fs::path& file)
    {
        std::ofstream out(file, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open())
        {
            throw openError("cannot open file for writing", file);
        }
        return out;
    }

} // namespace UtilToolkit
