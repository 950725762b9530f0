/*
 * Copyright (C) 2025 The Audex authors
 *
 * This file is part of Audex.
 *
 * Audex is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Audex is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Audex.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include "core/IChildProcessManager.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/Service.hpp"
#include "core/String.hpp"
#include "core/Utils.hpp"

#include "av/Exception.hpp"
#include "av/ToolLocator.hpp"

#include "extractor/EventChannel.hpp"
#include "extractor/Exception.hpp"
#include "extractor/FileScanner.hpp"
#include "extractor/IJobDispatcher.hpp"
#include "extractor/JobConfig.hpp"

namespace audex::extract
{
    namespace
    {
        namespace program_options = boost::program_options;

        constexpr int exitCodeFailure{ 1 };
        constexpr int exitCodePrecondition{ 2 };

        const std::filesystem::path defaultConfigFilePath{ "/etc/audex.conf" };

        // Config file values, when a config file is used
        class Settings
        {
        public:
            Settings(core::IConfig* config)
                : _config{ config } {}

            std::string getString(std::string_view setting, std::string_view def) const { return std::string{ _config ? _config->getString(setting, def) : def }; }
            std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) const { return _config ? _config->getPath(setting, def) : def; }
            unsigned long getULong(std::string_view setting, unsigned long def) const { return _config ? _config->getULong(setting, def) : def; }

        private:
            core::IConfig* _config;
        };

        core::logging::Severity getLogMinSeverity(const Settings& settings)
        {
            const std::string minSeverity{ core::stringUtils::stringToLower(settings.getString("log-min-severity", "warning")) };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw extractor::ConfigException{ "Invalid config value for 'log-min-severity'" };
        }

        template<typename T>
        std::optional<T> getOptionalValue(const program_options::variables_map& vm, const char* name)
        {
            if (vm.count(name))
                return vm[name].as<T>();

            return std::nullopt;
        }

        unsigned getPositiveValue(const program_options::variables_map& vm, const char* name)
        {
            return extractor::toPositiveValue(vm[name].as<long>(), std::string{ "--" } + name);
        }

        extractor::JobConfig createJobConfig(const program_options::variables_map& vm, const Settings& settings)
        {
            extractor::JobConfig config;

            config.inputRoot = std::filesystem::absolute(vm["input"].as<std::string>()).lexically_normal();

            std::filesystem::path outputRoot{ settings.getPath("output-dir", "audio_out") };
            if (vm.count("output"))
                outputRoot = vm["output"].as<std::string>();
            config.outputRoot = std::filesystem::absolute(outputRoot).lexically_normal();

            config.workers = settings.getULong("workers", extractor::getDefaultWorkerCount());

            if (const auto presetName{ getOptionalValue<std::string>(vm, "preset") })
            {
                const std::optional<extractor::Preset> preset{ extractor::presetFromString(*presetName) };
                if (!preset)
                    throw extractor::ConfigException{ "Unknown preset '" + *presetName + "'" };

                extractor::applyPreset(config, *preset);
            }

            // explicit options override the preset
            if (const auto modeName{ getOptionalValue<std::string>(vm, "mode") })
            {
                const std::optional<av::TranscodeMode> mode{ av::transcodeModeFromString(*modeName) };
                if (!mode)
                    throw extractor::ConfigException{ "Unknown mode '" + *modeName + "', expected one of copy, mp3, aac, wav" };

                config.transcode.mode = *mode;
            }

            if (vm["recursive"].as<bool>() && vm["no-recursive"].as<bool>())
                throw extractor::ConfigException{ "--recursive and --no-recursive are mutually exclusive" };
            if (vm["recursive"].as<bool>())
                config.recursive = true;
            else if (vm["no-recursive"].as<bool>())
                config.recursive = false;

            if (vm["flatten"].as<bool>())
                config.preserveTree = false;

            if (vm.count("stream-index") && vm.count("language"))
                throw extractor::ConfigException{ "--stream-index and --language are mutually exclusive" };
            if (vm.count("stream-index"))
            {
                const long index{ vm["stream-index"].as<long>() };
                if (index < 0)
                    throw extractor::ConfigException{ "--stream-index must not be negative" };

                config.transcode.stream = av::StreamSelector::fromIndex(static_cast<std::size_t>(index));
            }
            else if (vm.count("language"))
            {
                const std::string language{ core::stringUtils::stringTrim(vm["language"].as<std::string>()) };
                const std::optional<av::StreamSelector> stream{ av::StreamSelector::fromLanguage(language) };
                if (!stream)
                    throw extractor::ConfigException{ "Invalid language code '" + language + "', expected an ISO-639-2 code (ex: eng, jpn)" };

                config.transcode.stream = *stream;
            }

            if (vm["loudnorm"].as<bool>())
                config.transcode.loudnessNormalization = true;
            if (vm["gpu"].as<bool>())
                config.transcode.hardwareAcceleration = true;
            if (vm.count("sample-rate"))
                config.transcode.sampleRate = getPositiveValue(vm, "sample-rate");
            if (vm.count("bitrate"))
                config.transcode.bitrate = getPositiveValue(vm, "bitrate");

            if (vm.count("workers"))
                config.workers = static_cast<std::size_t>(std::max(1L, vm["workers"].as<long>()));
            config.workers = std::max<std::size_t>(1, config.workers);

            return config;
        }

        void displayEvent(const extractor::Event& event)
        {
            std::visit(core::utils::overloads{
                           [](const extractor::LogEvent& log) { std::cout << log.message << std::endl; },
                           [](const extractor::StatusEvent& status) { std::cout << "  " << status.text << std::endl; },
                           [](const extractor::ProgressEvent&) {},
                           [](const extractor::TaskResult&) {},
                           [](const extractor::BatchSummary& summary) {
                               std::cout << "Processed " << summary.completed << "/" << summary.total << " files" << std::endl;
                           },
                       },
                       event);
        }

        // Displays the events until the channel is closed
        class EventConsumer
        {
        public:
            EventConsumer(extractor::EventChannel& channel)
                : _channel{ channel }
                , _thread{ [this] {
                    while (const std::optional<extractor::Event> event{ _channel.pop() })
                        displayEvent(*event);
                } }
            {
            }

            ~EventConsumer()
            {
                _channel.close();
                _thread.join();
            }

            EventConsumer(const EventConsumer&) = delete;
            EventConsumer& operator=(const EventConsumer&) = delete;

        private:
            extractor::EventChannel& _channel;
            std::thread _thread;
        };

        int runBatch(const extractor::JobConfig& config, const av::FFmpegTools& tools, core::IChildProcessManager& childProcessManager)
        {
            const std::vector<extractor::InputFile> files{ extractor::scanInputFiles(config.inputRoot, config.recursive) };
            if (files.empty())
            {
                std::cout << "No video files found in '" << config.inputRoot.string() << "'" << std::endl;
                return EXIT_SUCCESS;
            }

            auto dispatcher{ extractor::createJobDispatcher(childProcessManager, tools) };

            boost::asio::io_context ioContext;
            boost::asio::signal_set signals{ ioContext, SIGINT, SIGTERM };
            std::function<void(const boost::system::error_code&, int)> onSignal{ [&](const boost::system::error_code& ec, int signalNumber) {
                if (ec)
                    return;

                AUDEX_LOG(MAIN, INFO, "Received signal " << signalNumber << ", cancelling...");
                std::cout << "Cancelling..." << std::endl;
                dispatcher->cancel();
                signals.async_wait(onSignal);
            } };
            signals.async_wait(onSignal);
            core::IOContextRunner signalRunner{ ioContext, 1, "Signals" };

            extractor::EventChannel channel;
            const EventConsumer consumer{ channel };

            const extractor::BatchSummary summary{ dispatcher->run(files, config, channel) };
            signals.cancel();

            return (summary.cancelled || summary.failed > 0) ? exitCodeFailure : EXIT_SUCCESS;
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        try
        {
            // clang-format off
            program_options::options_description options{ "Options" };
            options.add_options()
                ("help,h", "Display this help message")
                ("conf", program_options::value<std::string>(), "Configuration file (defaults to /etc/audex.conf if it exists)")
                ("input,i", program_options::value<std::string>()->default_value("."), "Input directory, containing video files")
                ("output,o", program_options::value<std::string>(), "Output directory (defaults to ./audio_out)")
                ("mode", program_options::value<std::string>(), "Transcode mode: copy, mp3, aac, wav (defaults to copy)")
                ("recursive", program_options::bool_switch(), "Scan sub directories (default)")
                ("no-recursive", program_options::bool_switch(), "Only scan the input directory itself")
                ("flatten", program_options::bool_switch(), "Write all outputs directly in the output directory, instead of mirroring the input tree")
                ("stream-index", program_options::value<long>(), "Zero based index of the audio stream to extract (defaults to 0)")
                ("language", program_options::value<std::string>(), "ISO-639-2 language of the audio stream to extract (ex: eng, jpn)")
                ("loudnorm", program_options::bool_switch(), "Apply EBU R128 loudness normalization")
                ("sample-rate", program_options::value<long>(), "Output sample rate, in Hz")
                ("bitrate", program_options::value<long>(), "Output bitrate, in kbps")
                ("gpu", program_options::bool_switch(), "Use CUDA hardware accelerated decoding")
                ("workers", program_options::value<long>(), "Number of files processed in parallel")
                ("preset", program_options::value<std::string>(), "Apply a preset before other options: music-gpu");
            // clang-format on

            program_options::variables_map vm;
            program_options::store(program_options::parse_command_line(argc, argv, options), vm);
            program_options::notify(vm);

            if (vm.count("help"))
            {
                std::cout << "Usage: " << argv[0] << " [options]" << std::endl;
                std::cout << options << std::endl;
                return EXIT_SUCCESS;
            }

            core::Service<core::IConfig> config;
            if (vm.count("conf"))
                config.assign(core::createConfig(vm["conf"].as<std::string>()));
            else if (std::filesystem::exists(defaultConfigFilePath))
                config.assign(core::createConfig(defaultConfigFilePath));

            const Settings settings{ config.get() };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(settings), settings.getPath("log-file", "")) };

            const extractor::JobConfig jobConfig{ createJobConfig(vm, settings) };
            extractor::validateJobConfig(jobConfig);

            auto childProcessManager{ core::createChildProcessManager() };
            const av::FFmpegTools tools{ av::locateTools(*childProcessManager, settings.getPath("ffmpeg-file", ""), settings.getPath("ffprobe-file", "")) };

            AUDEX_LOG(MAIN, INFO, "Extracting audio from '" << jobConfig.inputRoot.string() << "' to '" << jobConfig.outputRoot.string() << "'");

            return runBatch(jobConfig, tools, *childProcessManager);
        }
        catch (const program_options::error& e)
        {
            std::cerr << "Invalid option: " << e.what() << std::endl;
            return exitCodePrecondition;
        }
        catch (const extractor::ConfigException& e)
        {
            std::cerr << "Error: " << e.what() << std::endl;
            return exitCodePrecondition;
        }
        catch (const av::ToolNotFoundException& e)
        {
            std::cerr << "Error: " << e.what() << ". Please install FFmpeg and check your PATH." << std::endl;
            return exitCodePrecondition;
        }
        catch (const core::AudexException& e)
        {
            AUDEX_LOG(MAIN, FATAL, "Caught exception: " << e.what());
            std::cerr << "Error: " << e.what() << std::endl;
            return exitCodePrecondition;
        }
        catch (const std::exception& e)
        {
            AUDEX_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            return exitCodeFailure;
        }
    }
} // namespace audex::extract

int main(int argc, char* argv[])
{
    return audex::extract::main(argc, argv);
}
