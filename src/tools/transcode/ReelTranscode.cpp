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

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>

#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include "av/IEncoder.hpp"
#include "av/IMediaProber.hpp"
#include "core/Exception.hpp"
#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "database/IDb.hpp"
#include "database/Session.hpp"
#include "services/transcoding/ITranscodingService.hpp"

namespace reel
{
    namespace
    {
        std::string_view errorKindToString(db::TranscodeErrorKind kind)
        {
            switch (kind)
            {
            case db::TranscodeErrorKind::None:
                return "none";
            case db::TranscodeErrorKind::EncodeProcessFailed:
                return "encode process failed";
            case db::TranscodeErrorKind::EncodeTimeout:
                return "encode timeout";
            case db::TranscodeErrorKind::CacheIoError:
                return "cache I/O error";
            case db::TranscodeErrorKind::Interrupted:
                return "interrupted";
            }
            return "unknown";
        }

        std::ostream& operator<<(std::ostream& os, const transcoding::JobStatus& status)
        {
            os << "Job " << status.jobId.toString() << ": media " << status.mediaId.toString()
               << ", requested " << transcoding::toString(status.requestedQuality) << ", resolved " << transcoding::toString(status.resolvedQuality) << "\n";

            std::visit([&](const auto& state) {
                using T = std::decay_t<decltype(state)>;

                if constexpr (std::is_same_v<T, transcoding::JobPending>)
                    os << "\tState: pending\n";
                else if constexpr (std::is_same_v<T, transcoding::JobProcessing>)
                    os << "\tState: processing (" << state.progress << "%)\n";
                else if constexpr (std::is_same_v<T, transcoding::JobCompleted>)
                    os << "\tState: completed\n\tOutput: " << state.outputPath.string() << "\n";
                else if constexpr (std::is_same_v<T, transcoding::JobFailed>)
                    os << "\tState: failed (" << errorKindToString(state.kind) << ")\n\tError: " << state.message << "\n";
            },
                status.state);

            os << "\tCreated: " << core::stringUtils::toISO8601String(status.createdAt) << "\n";
            if (status.startedAt.isValid())
                os << "\tStarted: " << core::stringUtils::toISO8601String(status.startedAt) << "\n";
            if (status.completedAt.isValid())
                os << "\tCompleted: " << core::stringUtils::toISO8601String(status.completedAt) << "\n";

            return os;
        }

        transcoding::JobStatus waitForJob(transcoding::ITranscodingService& service, db::TranscodeJobId jobId, std::chrono::milliseconds pollPeriod)
        {
            unsigned lastProgress{};
            while (true)
            {
                transcoding::JobStatus status{ service.getStatus(jobId) };
                if (transcoding::isTerminal(status.state))
                    return status;

                if (const auto* processing{ std::get_if<transcoding::JobProcessing>(&status.state) }; processing && processing->progress != lastProgress)
                {
                    lastProgress = processing->progress;
                    std::cout << "Progress: " << lastProgress << "%" << std::endl;
                }

                std::this_thread::sleep_for(pollPeriod);
            }
        }

        db::MediaId getMediaId(const boost::program_options::variables_map& vm)
        {
            if (!vm.count("media-id"))
                throw core::ReelException{ "Missing --media-id" };

            return db::MediaId{ vm["media-id"].as<long long>() };
        }

        std::string getOption(const boost::program_options::variables_map& vm, const std::string& name)
        {
            if (!vm.count(name))
                throw core::ReelException{ "Missing --" + name };

            return vm[name].as<std::string>();
        }
    } // namespace
} // namespace reel

int main(int argc, char* argv[])
{
    try
    {
        using namespace reel;
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("conf,c", program_options::value<std::string>()->default_value("/etc/reel.conf"), "Reel config file")
            ("media-id,m", program_options::value<long long>(), "Media identifier")
            ("input,i", program_options::value<std::string>(), "Source media file")
            ("quality,q", program_options::value<std::string>(), "Quality tier (240p, 360p, 480p, 720p, 1080p, 4k)")
            ("job-id,j", program_options::value<long long>(), "Job identifier")
            ("ttl-hours", program_options::value<unsigned>(), "Evict renditions not accessed for this many hours (defaults to 'cache-ttl-hours')")
            ("older-than-hours", program_options::value<unsigned>()->default_value(24), "Drop terminated jobs older than this many hours");
        // clang-format on

        program_options::options_description hiddenOptions{ "Hidden options" };
        hiddenOptions.add_options()("command", program_options::value<std::string>(), "command");

        program_options::options_description allOptions;
        allOptions.add(options).add(hiddenOptions);

        program_options::positional_options_description positional;
        positional.add("command", 1);

        program_options::variables_map vm;
        program_options::store(program_options::command_line_parser(argc, argv).options(allOptions).positional(positional).run(), vm);
        program_options::notify(vm);

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] <command>\n\n"
               << "Commands:\n"
               << "\ttranscode\tTranscode --input as --media-id in --quality, wait for completion\n"
               << "\tstream\t\tTell how --media-id in --quality would be streamed, transcode if needed\n"
               << "\tstatus\t\tDisplay the status of --job-id\n"
               << "\tcached\t\tDisplay the cached rendition of --media-id in --quality\n"
               << "\tqualities\tList the cached qualities of --media-id\n"
               << "\tpurge\t\tEvict expired renditions\n"
               << "\tprune\t\tDrop old terminated jobs\n\n"
               << options << "\n";
        } };

        if (vm.count("help"))
        {
            displayUsage(std::cout);
            return EXIT_SUCCESS;
        }

        if (!vm.count("command"))
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }
        const std::string command{ vm["command"].as<std::string>() };

        core::Service<core::IConfig> config{ core::createConfig(vm["conf"].as<std::string>()) };
        core::Service<core::logging::ILogger> logger{ core::logging::createLogger(core::logging::parseSeverity(config->getString("log-min-severity", "info")), config->getPath("log-file", "")) };

        REEL_LOG(MAIN, INFO, "Running command '" << command << "'");

        const transcoding::TranscodingSettings settings{ transcoding::loadTranscodingSettings(*config) };

        // runs the cache janitor
        boost::asio::io_context ioContext;
        core::IOContextRunner ioContextRunner{ ioContext, 1, "Janitor" };

        const std::filesystem::path workingDir{ config->getPath("working-dir", "/var/reel") };
        std::filesystem::create_directories(workingDir);

        // each worker, the janitor and this thread may access the database
        auto database{ db::createDb(workingDir / "reel.db", settings.maxConcurrentTranscodes + 2) };
        {
            db::Session session{ *database };
            session.prepareTablesIfNeeded();
            session.createIndexesIfNeeded();
        }

        auto childProcessManager{ core::createChildProcessManager(ioContext) };
        auto encoder{ av::createFFmpegEncoder(*childProcessManager, config->getPath("ffmpeg-file", "/usr/bin/ffmpeg")) };
        auto prober{ av::createMediaProber() };

        auto service{ transcoding::createTranscodingService(ioContext, *database, *encoder, *prober, settings) };

        int res{ EXIT_SUCCESS };
        if (command == "transcode")
        {
            const db::TranscodeJobId jobId{ service->submit(getMediaId(vm), getOption(vm, "input"), getOption(vm, "quality")) };
            std::cout << "Submitted job " << jobId.toString() << std::endl;

            const transcoding::JobStatus status{ waitForJob(*service, jobId, settings.progressInterval) };
            std::cout << status;
            if (!std::holds_alternative<transcoding::JobCompleted>(status.state))
                res = EXIT_FAILURE;
        }
        else if (command == "stream")
        {
            const transcoding::StreamTarget target{ service->resolveStream(getMediaId(vm), getOption(vm, "input"), getOption(vm, "quality")) };
            if (const auto* cached{ std::get_if<transcoding::StreamCached>(&target) })
            {
                std::cout << "Cached: " << cached->path.string() << std::endl;
            }
            else if (const auto* direct{ std::get_if<transcoding::StreamDirect>(&target) })
            {
                std::cout << "Direct: " << direct->path.string() << std::endl;
            }
            else
            {
                const db::TranscodeJobId jobId{ std::get<transcoding::StreamTranscoding>(target).jobId };
                std::cout << "Transcoding, job " << jobId.toString() << std::endl;

                const transcoding::JobStatus status{ waitForJob(*service, jobId, settings.progressInterval) };
                std::cout << status;
                if (!std::holds_alternative<transcoding::JobCompleted>(status.state))
                    res = EXIT_FAILURE;
            }
        }
        else if (command == "status")
        {
            if (!vm.count("job-id"))
                throw core::ReelException{ "Missing --job-id" };

            std::cout << service->getStatus(db::TranscodeJobId{ vm["job-id"].as<long long>() });
        }
        else if (command == "cached")
        {
            if (const std::optional<std::filesystem::path> path{ service->getCachedPath(getMediaId(vm), getOption(vm, "quality")) })
            {
                std::cout << path->string() << std::endl;
            }
            else
            {
                std::cout << "Not cached" << std::endl;
                res = EXIT_FAILURE;
            }
        }
        else if (command == "qualities")
        {
            for (const transcoding::QualityTier quality : service->getAvailableQualities(getMediaId(vm)))
                std::cout << transcoding::toString(quality) << std::endl;
        }
        else if (command == "purge")
        {
            const std::chrono::seconds ttl{ vm.count("ttl-hours") ? std::chrono::hours{ vm["ttl-hours"].as<unsigned>() } : settings.cacheTtl };
            std::cout << "Evicted " << service->purgeOlderThan(ttl) << " renditions" << std::endl;
        }
        else if (command == "prune")
        {
            std::cout << "Dropped " << service->pruneJobs(std::chrono::hours{ vm["older-than-hours"].as<unsigned>() }) << " jobs" << std::endl;
        }
        else
        {
            std::cerr << "Unknown command '" << command << "'\n\n";
            displayUsage(std::cerr);
            res = EXIT_FAILURE;
        }

        return res;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Caught exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
