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

#include <filesystem>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "database/IDb.hpp"
#include "services/transcoding/ITranscodingService.hpp"

#include "Fakes.hpp"

namespace reel::transcoding::tests
{
    class TranscodingServiceTest : public ::testing::Test
    {
    public:
        TranscodingServiceTest();
        ~TranscodingServiceTest() override;

        ITranscodingService& startService();
        void stopService();

        // Polls until the job is terminated (10s max)
        JobStatus waitForTerminated(db::TranscodeJobId jobId);

        std::size_t getTmpFileCount() const;

        const std::filesystem::path tmpDir;
        std::unique_ptr<db::IDb> db;
        FakeMediaProber prober;
        FakeEncoder encoder;
        TranscodingSettings settings;
        boost::asio::io_context ioContext;
        std::unique_ptr<ITranscodingService> service;
    };
} // namespace reel::transcoding::tests
