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

#include "MediaProber.hpp"

extern "C"
{
#define __STDC_CONSTANT_MACROS
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include <array>

#include "core/ILogger.hpp"

#include "av/Exception.hpp"

namespace reel::av
{
    namespace
    {
        std::string averror_to_string(int error)
        {
            std::array<char, 128> buf = { 0 };

            if (::av_strerror(error, buf.data(), buf.size()) == 0)
                return buf.data();

            return "Unknown error";
        }

        class ProbeException : public Exception
        {
        public:
            ProbeException(const std::filesystem::path& file, std::string_view step, int avError)
                : Exception{ "Cannot " + std::string{ step } + " '" + file.string() + "': " + averror_to_string(avError) }
            {
            }
        };

        // RAII holder for the demuxer context
        class FormatContext
        {
        public:
            FormatContext(const std::filesystem::path& file)
            {
                int error{ ::avformat_open_input(&_context, file.c_str(), nullptr, nullptr) };
                if (error < 0)
                    throw ProbeException{ file, "open", error };

                error = ::avformat_find_stream_info(_context, nullptr);
                if (error < 0)
                {
                    ::avformat_close_input(&_context);
                    throw ProbeException{ file, "find stream information on", error };
                }
            }

            ~FormatContext()
            {
                ::avformat_close_input(&_context);
            }

            FormatContext(const FormatContext&) = delete;
            FormatContext& operator=(const FormatContext&) = delete;

            AVFormatContext* operator->() const { return _context; }
            AVFormatContext* get() const { return _context; }

        private:
            AVFormatContext* _context{};
        };

        std::string getCodecName(AVCodecID codecId)
        {
            const AVCodecDescriptor* descriptor{ ::avcodec_descriptor_get(codecId) };
            return descriptor ? descriptor->name : "unknown";
        }

        const AVStream* findBestStream(const FormatContext& context, AVMediaType type)
        {
            const int index{ ::av_find_best_stream(context.get(), type,
                -1, // Auto
                -1, // Auto
                nullptr,
                0) };

            if (index < 0)
                return nullptr;

            const AVStream* stream{ context->streams[index] };
            if (!stream->codecpar)
                return nullptr;

            // cover art is exposed as a video stream
            if (type == AVMEDIA_TYPE_VIDEO && (stream->disposition & AV_DISPOSITION_ATTACHED_PIC))
                return nullptr;

            return stream;
        }
    } // namespace

    std::unique_ptr<IMediaProber> createMediaProber()
    {
        return std::make_unique<MediaProber>();
    }

    MediaInfo MediaProber::probe(const std::filesystem::path& file) const
    {
        REEL_LOG(AV, DEBUG, "Probing " << file);

        const FormatContext context{ file };

        MediaInfo info;
        info.containerName = context->iformat->name;
        info.bitrate = context->bit_rate > 0 ? static_cast<std::size_t>(context->bit_rate) : 0;
        if (context->duration != AV_NOPTS_VALUE && context->duration > 0)
            info.duration = std::chrono::milliseconds{ context->duration * 1'000 / AV_TIME_BASE };

        if (const AVStream * stream{ findBestStream(context, AVMEDIA_TYPE_VIDEO) })
        {
            VideoStreamInfo& video{ info.video.emplace() };
            video.width = static_cast<std::size_t>(stream->codecpar->width);
            video.height = static_cast<std::size_t>(stream->codecpar->height);
            video.bitrate = stream->codecpar->bit_rate > 0 ? static_cast<std::size_t>(stream->codecpar->bit_rate) : 0;
            video.codecName = getCodecName(stream->codecpar->codec_id);
        }

        if (const AVStream * stream{ findBestStream(context, AVMEDIA_TYPE_AUDIO) })
        {
            AudioStreamInfo& audio{ info.audio.emplace() };
            audio.bitrate = stream->codecpar->bit_rate > 0 ? static_cast<std::size_t>(stream->codecpar->bit_rate) : 0;
#if LIBAVCODEC_VERSION_INT >= AV_VERSION_INT(59, 24, 100)
            audio.channelCount = static_cast<std::size_t>(stream->codecpar->ch_layout.nb_channels);
#else
            audio.channelCount = static_cast<std::size_t>(stream->codecpar->channels);
#endif
            audio.sampleRate = static_cast<std::size_t>(stream->codecpar->sample_rate);
            audio.codecName = getCodecName(stream->codecpar->codec_id);
        }

        REEL_LOG(AV, DEBUG, "Probed " << file << ": container = " << info.containerName << ", duration = " << info.duration.count() << "ms"
                                      << (info.video ? ", video = " + std::to_string(info.video->width) + "x" + std::to_string(info.video->height) + " " + info.video->codecName : std::string{}));

        return info;
    }
} // namespace reel::av
