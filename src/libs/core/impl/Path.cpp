/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Reel.
 *
 * Reel is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Reel is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Reel.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "core/Path.hpp"

#include "core/ILogger.hpp"

namespace reel::core::pathUtils
{
    bool ensureDirectory(const std::filesystem::path& dir)
    {
        std::error_code ec;
        if (std::filesystem::exists(dir, ec))
            return std::filesystem::is_directory(dir, ec);

        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            REEL_LOG(UTILS, ERROR, "Cannot create directory '" << dir.string() << "': " << ec.message());
            return false;
        }

        return true;
    }

    bool removeFile(const std::filesystem::path& file)
    {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec)
        {
            REEL_LOG(UTILS, ERROR, "Cannot remove file '" << file.string() << "': " << ec.message());
            return false;
        }

        return true;
    }

    void clearDirectory(const std::filesystem::path& dir)
    {
        std::error_code ec;
        for (const std::filesystem::directory_entry& entry : std::filesystem::directory_iterator{ dir, ec })
        {
            std::error_code removeEc;
            std::filesystem::remove_all(entry.path(), removeEc);
            if (removeEc)
                REEL_LOG(UTILS, ERROR, "Cannot remove '" << entry.path().string() << "': " << removeEc.message());
        }

        if (ec)
            REEL_LOG(UTILS, ERROR, "Cannot iterate directory '" << dir.string() << "': " << ec.message());
    }

    std::optional<std::uintmax_t> getFileSize(const std::filesystem::path& file)
    {
        std::error_code ec;
        const std::uintmax_t size{ std::filesystem::file_size(file, ec) };
        if (ec)
            return std::nullopt;

        return size;
    }
} // namespace reel::core::pathUtils
