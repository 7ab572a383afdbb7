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

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace reel::core::pathUtils
{
    // Make sure the given path is a directory
    // Create it (and its parents) if needed
    bool ensureDirectory(const std::filesystem::path& dir);

    // Returns false if the file still exists afterwards, never throws
    bool removeFile(const std::filesystem::path& file);

    // Remove every entry of the directory, keep the directory itself
    void clearDirectory(const std::filesystem::path& dir);

    std::optional<std::uintmax_t> getFileSize(const std::filesystem::path& file);
} // namespace reel::core::pathUtils
