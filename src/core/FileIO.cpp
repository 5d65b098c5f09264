#include "core/FileIO.h"

#include <fstream>
#include <system_error>
#include <utility>

namespace outpost::core {

namespace {

void SetError(std::string* outError, const std::string& what, const std::filesystem::path& path,
              const std::error_code& ec = {})
{
    if (!outError)
        return;
    *outError = what + " '" + path.string() + "'";
    if (ec)
    {
        *outError += ": ";
        *outError += ec.message();
        *outError += " (code ";
        *outError += std::to_string(ec.value());
        *outError += ")";
    }
}

} // namespace

bool ReadFileToString(const std::filesystem::path& path, std::string& out, std::string* outError) noexcept
{
    try
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            SetError(outError, "Failed to read file", path, ec);
            return false;
        }

        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            SetError(outError, "Failed to open file", path);
            return false;
        }

        std::string bytes;
        bytes.resize(static_cast<std::size_t>(size));
        if (size > 0 && !in.read(bytes.data(), static_cast<std::streamsize>(size)))
        {
            SetError(outError, "Failed to read file", path);
            return false;
        }

        out = std::move(bytes);
        return true;
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
}

bool WriteFileAtomic(const std::filesystem::path& path, const std::string& bytes, std::string* outError) noexcept
{
    try
    {
        std::error_code ec;
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec)
            {
                SetError(outError, "Failed to create directory for", path, ec);
                return false;
            }
        }

        std::filesystem::path tmp = path;
        tmp += ".tmp";

        {
            std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
            if (!f)
            {
                SetError(outError, "Failed to open", tmp);
                return false;
            }
            f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            f.flush();
            if (!f)
            {
                SetError(outError, "Failed to write", tmp);
                f.close();
                std::filesystem::remove(tmp, ec);
                return false;
            }
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec)
        {
            SetError(outError, "Failed to replace", path, ec);
            std::error_code rmEc;
            std::filesystem::remove(tmp, rmEc);
            return false;
        }
        return true;
    }
    catch (const std::exception& e)
    {
        if (outError) *outError = e.what();
        return false;
    }
}

} // namespace outpost::core
