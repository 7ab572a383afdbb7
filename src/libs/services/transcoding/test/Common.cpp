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

#include "Common.hpp"

#include <atomic>
#include <thread>

#include <unistd.h>

#include "database/Session.hpp"

namespace reel::transcoding::tests
{
    namespace
    {
        std::filesystem::path createTmpDirPath()
        {
            static std::atomic<unsigned> counter{};
            return std::filesystem::temp_directory_path() / ("reel-transcoding-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter++));
        }
    } // namespace

    TranscodingServiceTest::TranscodingServiceTest()
        : tmpDir{ createTmpDirPath() }
    {
        std::filesystem::create_directories(tmpDir);

        db = db::createDb(tmpDir / "reel.db");
        {
            db::Session session{ *db };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        settings.cachePath = tmpDir / "cache";
        settings.tmpPath = tmpDir / "tmp";
        settings.maxConcurrentTranscodes = 2;
        settings.transcodeTimeout = std::chrono::seconds{ 30 };
        settings.progressInterval = std::chrono::milliseconds{ 10 };
        settings.cacheTtl = std::chrono::hours{ 24 };
        settings.janitorPeriod = std::chrono::seconds{ 0 };
    }

    TranscodingServiceTest::~TranscodingServiceTest()
    {
        // let held encodes go
        encoder.release();
        stopService();
        db.reset();

        std::error_code ec;
        std::filesystem::remove_all(tmpDir, ec);
    }

    ITranscodingService& TranscodingServiceTest::startService()
    {
        service = createTranscodingService(ioContext, *db, encoder, prober, settings);
        return *service;
    }

    void TranscodingServiceTest::stopService()
    {
        service.reset();
    }

    JobStatus TranscodingServiceTest::waitForTerminated(db::TranscodeJobId jobId)
    {
        const auto deadline{ std::chrono::steady_clock::now() + std::chrono::seconds{ 10 } };
        while (true)
        {
            JobStatus status{ service->getStatus(jobId) };
            if (isTerminal(status.state) || std::chrono::steady_clock::now() > deadline)
                return status;

            std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
        }
    }

    std::size_t TranscodingServiceTest::getTmpFileCount() const
    {
        std::error_code ec;
        std::size_t count{};
        for (std::filesystem::directory_iterator it{ settings.tmpPath, ec }, end; !ec && it != end; it.increment(ec))
            count += 1;

        return count;
    }
} // namespace reel::transcoding::tests
