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

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include <unistd.h>

#include <boost/asio/io_context.hpp>

#include "av/Exception.hpp"
#include "av/IEncoder.hpp"
#include "core/IChildProcessManager.hpp"

namespace reel::av::tests
{
    namespace
    {
        // Directory holding a fake encoder script, removed on destruction
        class FakeEncoderDirectory
        {
        public:
            FakeEncoderDirectory()
                : _path{ std::filesystem::temp_directory_path() / ("reel-av-test-" + std::to_string(::getpid()) + "-" + std::to_string(_counter++)) }
            {
                std::filesystem::create_directories(_path);
            }

            ~FakeEncoderDirectory()
            {
                std::error_code ec;
                std::filesystem::remove_all(_path, ec);
            }

            FakeEncoderDirectory(const FakeEncoderDirectory&) = delete;
            FakeEncoderDirectory& operator=(const FakeEncoderDirectory&) = delete;

            std::filesystem::path writeScript(std::string_view body) const
            {
                const std::filesystem::path scriptPath{ _path / "ffmpeg" };
                {
                    std::ofstream script{ scriptPath, std::ios::trunc };
                    script << "#!/bin/sh\n"
                           << body;
                }
                std::filesystem::permissions(scriptPath, std::filesystem::perms::owner_all);
                return scriptPath;
            }

            const std::filesystem::path& getPath() const { return _path; }

        private:
            static inline std::size_t _counter{};
            const std::filesystem::path _path;
        };

        EncodeParameters makeParameters(const std::filesystem::path& dir)
        {
            EncodeParameters parameters;
            parameters.inputFile = dir / "input.mkv";
            parameters.outputFile = dir / "output.mp4";
            parameters.videoBitrate = 2'500'000;
            parameters.audioBitrate = 192'000;
            parameters.width = 1280;
            parameters.height = 720;
            parameters.qualityFactor = 23;
            return parameters;
        }

        std::string readFile(const std::filesystem::path& path)
        {
            std::ifstream ifs{ path };
            std::ostringstream oss;
            oss << ifs.rdbuf();
            return oss.str();
        }
    } // namespace

    TEST(FFmpegEncoder, missingExecutable)
    {
        boost::asio::io_context ioContext;
        auto childProcessManager{ core::createChildProcessManager(ioContext) };

        EXPECT_THROW(createFFmpegEncoder(*childProcessManager, "/non/existent/ffmpeg"), Exception);
    }

    TEST(FFmpegEncoder, success)
    {
        boost::asio::io_context ioContext;
        auto childProcessManager{ core::createChildProcessManager(ioContext) };

        FakeEncoderDirectory dir;
        const std::filesystem::path argsFile{ dir.getPath() / "args.txt" };
        const std::filesystem::path ffmpeg{ dir.writeScript(
            "for arg in \"$@\"; do echo \"$arg\" >> '" + argsFile.string() + "'; done\n"
            "echo out_time_us=N/A\n"
            "echo out_time_us=1500000\n"
            "echo progress=end\n"
            "for arg in \"$@\"; do last=\"$arg\"; done\n"
            "echo fake > \"$last\"\n"
            "exit 0\n") };

        auto encoder{ createFFmpegEncoder(*childProcessManager, ffmpeg) };
        const EncodeParameters parameters{ makeParameters(dir.getPath()) };
        auto process{ encoder->encode(parameters) };

        ASSERT_TRUE(process->waitFor(std::chrono::seconds{ 10 }));
        ASSERT_TRUE(process->getExitCode().has_value());
        EXPECT_EQ(*process->getExitCode(), 0);
        ASSERT_TRUE(process->getProgressTime().has_value());
        EXPECT_EQ(*process->getProgressTime(), std::chrono::milliseconds{ 1500 });
        EXPECT_TRUE(std::filesystem::exists(parameters.outputFile));
        EXPECT_EQ(process->getErrorOutputTail(), "");

        const std::string args{ readFile(argsFile) };
        EXPECT_NE(args.find("-c:v\nlibx264\n"), std::string::npos);
        EXPECT_NE(args.find("-c:a\naac\n"), std::string::npos);
        EXPECT_NE(args.find("-b:v\n2500000\n"), std::string::npos);
        EXPECT_NE(args.find("-b:a\n192000\n"), std::string::npos);
        EXPECT_NE(args.find("-s\n1280x720\n"), std::string::npos);
        EXPECT_NE(args.find("-crf\n23\n"), std::string::npos);
        EXPECT_NE(args.find("-preset\nfast\n"), std::string::npos);
        EXPECT_NE(args.find("-movflags\n+faststart\n"), std::string::npos);
        EXPECT_NE(args.find("-i\n" + parameters.inputFile.string() + "\n"), std::string::npos);
    }

    TEST(FFmpegEncoder, failure)
    {
        boost::asio::io_context ioContext;
        auto childProcessManager{ core::createChildProcessManager(ioContext) };

        FakeEncoderDirectory dir;
        const std::filesystem::path ffmpeg{ dir.writeScript(
            "echo 'first line' >&2\n"
            "echo 'input.mkv: Invalid data found when processing input' >&2\n"
            "exit 1\n") };

        auto encoder{ createFFmpegEncoder(*childProcessManager, ffmpeg) };
        auto process{ encoder->encode(makeParameters(dir.getPath())) };

        ASSERT_TRUE(process->waitFor(std::chrono::seconds{ 10 }));
        ASSERT_TRUE(process->getExitCode().has_value());
        EXPECT_EQ(*process->getExitCode(), 1);
        EXPECT_FALSE(process->getProgressTime().has_value());
        EXPECT_NE(process->getErrorOutputTail().find("Invalid data found when processing input"), std::string::npos);
    }

    TEST(FFmpegEncoder, kill)
    {
        boost::asio::io_context ioContext;
        auto childProcessManager{ core::createChildProcessManager(ioContext) };

        FakeEncoderDirectory dir;
        const std::filesystem::path ffmpeg{ dir.writeScript("exec sleep 30\n") };

        auto encoder{ createFFmpegEncoder(*childProcessManager, ffmpeg) };
        auto process{ encoder->encode(makeParameters(dir.getPath())) };

        EXPECT_FALSE(process->waitFor(std::chrono::milliseconds{ 100 }));
        process->kill();
        ASSERT_TRUE(process->waitFor(std::chrono::seconds{ 10 }));
        EXPECT_FALSE(process->getExitCode().has_value());
    }
} // namespace reel::av::tests
