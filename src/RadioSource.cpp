/*
 * Copyright 2017, Andrej Kislovskij
 *
 * This is PUBLIC DOMAIN software so use at your own risk as it comes
 * with no warranties. This code is yours to share, use and modify without
 * any restrictions or obligations.
 *
 * For more information see conwrap/LICENSE or refer refer to http://unlicense.org
 *
 * Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)
 */

#include <atomic>
#include <chrono>
#include <conwrap2/Processor.hpp>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cxxopts.hpp>
#include <exception>
#include <fstream>
#include <functional>
#include <future>
#include <g3log/logworker.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "radio/Container.hpp"
#include "radio/Exception.hpp"
#include "radio/http/Client.hpp"
#include "radio/http/Header.hpp"
#include "radio/log/ConsoleSink.hpp"
#include "radio/log/log.hpp"
#include "radio/source/ConsumerMode.hpp"
#include "radio/source/OutputDelegate.hpp"
#include "radio/source/RemoteSource.hpp"


using namespace radio;
using namespace radio::source;

using Client       = http::Client;
using Source       = RemoteSource<Client>;
using SourceBundle = Container<Client, Source>;


static std::atomic<bool> running{true};


void signalHandler(int sig)
{
	running = false;
}


void printVersionInfo()
{
	std::cout << "RadioSource version " << VERSION << std::endl;
}


void printLicenseInfo()
{
	printVersionInfo();

	std::cout << std::endl;
	std::cout << "Copyright 2017, Andrej Kislovskij" << std::endl;
	std::cout << std::endl;
	std::cout << "This is PUBLIC DOMAIN software so use at your own risk as it comes" << std::endl;
	std::cout << "with no warranties. This code is yours to share, use and modify without" << std::endl;
	std::cout << "any restrictions or obligations." << std::endl;
	std::cout << std::endl;
	std::cout << "For more information see conwrap/LICENSE or refer refer to http://unlicense.org" << std::endl;
	std::cout << std::endl;
	std::cout << "Author: gimesketvirtadieni at gmail dot com (Andrej Kislovskij)" << std::endl;
	std::cout << std::endl;
	std::cout << "RadioSource relies on the following libraries:" << std::endl;
	std::cout << "-> Concurrent Wrapper for asynchronous tasks (Public Domain)" << std::endl;
	std::cout << "-> Logging library 'g3log' (Public Domain)" << std::endl;
	std::cout << "-> Networking TS implementation 'std::experimental::net' (Boost Software License)" << std::endl;
	std::cout << "-> Command line options parser 'cxxopts' (MIT)" << std::endl;
	std::cout << "-> Vocabulary types library 'type_safe' (MIT)" << std::endl;
	std::cout << "-> Unit testing library 'googletest' (BSD-3-Clause)" << std::endl;
	std::cout << std::endl;
	std::cout << "Important note: used dependencies may rely on other dependencies shipped with correspondent license." << std::endl;
	std::cout << std::endl;
}


auto parseHeaders(const std::vector<std::string>& values)
{
	http::Headers headers;

	for (auto& value : values)
	{
		auto colon{value.find(':')};
		if (colon == std::string::npos || colon == 0)
		{
			throw cxxopts::OptionException("Invalid header '" + value + "', expected format is 'Name: value'");
		}
		headers.insert_or_assign(http::trim(value.substr(0, colon)), http::trim(value.substr(colon + 1)));
	}

	return headers;
}


int main(int argc, char *argv[])
{
	// initializing log and adding custom sink
	auto logWorkerPtr = g3::LogWorker::createLogWorker();
	g3::initializeLogging(logWorkerPtr.get());
	g3::only_change_at_initialization::addLogLevel(ERROR);
	logWorkerPtr->addSink(std::make_unique<radio::log::ConsoleSink>(), &radio::log::ConsoleSink::print);

	try
	{
		// defining supported options
		cxxopts::Options options("RadioSource", "RadioSource - Receives internet radio streams and audio files with ICY metadata stripped\n");
		options
			.custom_help("[options]")
			.add_options()
				("b,buffersize", "Read buffer size in bytes", cxxopts::value<std::size_t>()->default_value("65536"), "<bytes>")
				("H,header", "Additional request header", cxxopts::value<std::vector<std::string>>(), "<'Name: value'>")
				("h,help", "Print this help message", cxxopts::value<bool>())
				("l,license", "Print license details", cxxopts::value<bool>())
				("m,mode", "Consumer mode", cxxopts::value<std::string>()->default_value("pull"), "<pull|push>")
				("o,output", "Output file, '-' stands for standard output", cxxopts::value<std::string>()->default_value("-"), "<file>")
				("s,seek", "Byte offset to start from", cxxopts::value<std::uint64_t>()->default_value("0"), "<bytes>")
				("u,url", "Stream URL", cxxopts::value<std::string>(), "<url>")
				("v,version", "Print version details", cxxopts::value<bool>());

		// parsing provided options
		auto result = options.parse(argc, argv);

		if (result.count("help"))
		{
			std::cout << options.help() << std::endl;
		}
		else if (result.count("license"))
		{
			printLicenseInfo();
		}
		else if (result.count("version"))
		{
			printVersionInfo();
		}
		else
		{
			if (!result.count("url"))
			{
				throw cxxopts::OptionException("Stream URL must be provided");
			}

			// setting mandatory parameters
			auto url        = result["url"].as<std::string>();
			auto bufferSize = result["buffersize"].as<std::size_t>();
			auto mode       = result["mode"].as<std::string>();
			auto output     = result["output"].as<std::string>();
			auto seekOffset = result["seek"].as<std::uint64_t>();

			// setting optional parameters
			http::Headers headers;
			if (result.count("header"))
			{
				headers = parseHeaders(result["header"].as<std::vector<std::string>>());
			}

			// validating parameters
			ConsumerMode consumerMode;
			if (mode == "pull")
			{
				consumerMode = ConsumerMode::Pull;
			}
			else if (mode == "push")
			{
				consumerMode = ConsumerMode::Push;
			}
			else
			{
				throw cxxopts::OptionException("Invalid consumer mode, only 'pull' or 'push' values are supported");
			}

			// fails early on malformed input
			http::URL::parse(url);

			std::ofstream fileStream;
			if (output != "-")
			{
				fileStream.open(output, std::ios::binary);
				if (!fileStream.is_open())
				{
					throw Exception("Could not open output file " + output);
				}
			}
			std::ostream& outputStream{output != "-" ? fileStream : std::cout};

			auto delegatePtr{std::make_shared<OutputDelegate>(outputStream, seekOffset)};

			// creating Container object within Processor with HTTP client and source
			std::atomic<Source*> sourcePtr{nullptr};
			conwrap2::Processor<std::unique_ptr<ContainerBase>> processor{[&](auto processorProxy)
			{
				auto clientPtr{std::make_unique<Client>(processorProxy)};
				auto remotePtr{std::make_unique<Source>(processorProxy, std::ref(*clientPtr), delegatePtr, consumerMode, bufferSize)};

				sourcePtr = remotePtr.get();
				return std::unique_ptr<ContainerBase>
				{
					new SourceBundle{std::move(clientPtr), std::move(remotePtr), url, headers}
				};
			}};
			LOG(INFO) << "Consumer mode is " << mode;

			// start receiving
			processor.process([](auto context)
			{
				try
				{
					LOG(INFO) << "Starting RadioSource...";
					context.getResource()->start();
					LOG(INFO) << "RadioSource was started";
				}
				catch (const Exception& error)
				{
					LOG(ERROR) << error;
					running = false;
				}
				catch (const std::exception& error)
				{
					LOG(ERROR) << error.what();
					running = false;
				}
			});

			// registering signal handler
			signal(SIGHUP, signalHandler);
			signal(SIGTERM, signalHandler);
			signal(SIGINT, signalHandler);

			// waiting for the end of stream or Control^C
			std::vector<std::uint8_t> buffer(16384);
			while (running)
			{
				// finish flag is taken before reading so the tail of the stream is not missed
				auto finished{delegatePtr->isFinished()};
				auto size{std::size_t{0}};

				if (consumerMode == ConsumerMode::Pull && sourcePtr && delegatePtr->isReadable())
				{
					size = sourcePtr.load()->read(buffer.data(), buffer.size());
					outputStream.write(reinterpret_cast<const char*>(buffer.data()), size);
				}

				if (!size)
				{
					if (finished)
					{
						break;
					}
					std::this_thread::sleep_for(std::chrono::milliseconds{20});
				}
			}
			outputStream.flush();

			// stop receiving
			auto stopped = std::promise<bool>{};
			processor.process([&](auto context)
			{
				LOG(INFO) << "Stopping RadioSource...";
				context.getResource()->stop();
				LOG(INFO) << "RadioSource was stopped";
				stopped.set_value(true);
			});
			stopped.get_future().wait();

			if (delegatePtr->isFailed())
			{
				return 1;
			}
		}
	}
	catch (const cxxopts::OptionException& e)
	{
		std::cout << "Wrong option(s) provided: " << e.what() << std::endl;
		return 1;
	}
	catch (const Exception& error)
	{
		LOG(ERROR) << error;
		return 1;
	}
	catch (const std::exception& error)
	{
		LOG(ERROR) << error.what();
		return 1;
	}

	return 0;
}
