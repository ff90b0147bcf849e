/**
 * @file examples/chunked_upload/chunked_upload.cpp
 * @brief Uploads a file to an existing upload session
 *
 * (c) 2026 by the Cumulus SDK authors
 *
 * This file is part of the Cumulus SDK - Client Access Engine.
 *
 * The Cumulus SDK is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <future>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

#include <cumulus/common/task_executor.h>
#include <cumulus/http/curl_http_transport.h>
#include <cumulus/log_level.h>
#include <cumulus/logging.h>
#include <cumulus/upload/chunked_uploader.h>
#include <cumulus/upload/logger.h>
#include <cumulus/upload/session_api_client.h>

using namespace cumulus;
using namespace cumulus::upload;

static void usage(const char* program)
{
    std::cerr << "usage: " << program
              << " [--base URL] [--log-level LEVEL] [--parallelism N] [--token TOKEN] [--verbose]"
              << " SESSION.json FILE\n"
              << "\n"
              << "The access token is read from CUMULUS_ACCESS_TOKEN unless --token is given.\n";
}

static bool readFile(const std::string& path, std::string& content)
{
    std::ifstream stream(path, std::ios::binary);

    if (!stream)
        return false;

    content.assign(std::istreambuf_iterator<char>(stream),
                   std::istreambuf_iterator<char>());

    return !stream.bad();
}

static int upload(UploadSessionClient& client,
                  common::TaskExecutor& executor,
                  const UploadSession& session,
                  std::unique_ptr<std::istream> stream,
                  m_off_t totalSize,
                  const ChunkedUploadOptions& options,
                  const std::string& path)
{
    try
    {
        auto source = UploadSource::fromStream(
          std::make_shared<IStreamByteStream>(std::move(stream),
                                              static_cast<std::size_t>(session.mPartSize)));

        auto uploader = ChunkedUploader::create(client,
                                                executor,
                                                session,
                                                std::move(source),
                                                totalSize,
                                                options);

        // Satisfied by the upload's final event.
        auto settled = std::make_shared<std::promise<void>>();
        auto settledOnce = std::make_shared<std::once_flag>();
        auto finished = settled->get_future();

        std::weak_ptr<ChunkedUploader> weak = uploader;

        uploader->addObserver([settled, settledOnce, weak](const UploadEvent& event) {
            if (auto* uploaded = std::get_if<PartUploaded>(&event))
            {
                LOG_info << "Uploaded part " << uploaded->mCompleted
                         << "/" << uploaded->mTotal
                         << " at offset " << uploaded->mPart.mOffset;
            }
            else if (auto* failed = std::get_if<PartFailed>(&event))
            {
                LOG_warn << "Part at offset " << failed->mPart.mOffset
                         << " failed after " << failed->mAttempts
                         << " attempt(s): " << errorstring(failed->mError);

                // Give up and delete the session.
                if (auto uploader = weak.lock())
                    uploader->abort();
            }
            else if (auto* abortFailed = std::get_if<AbortFailed>(&event))
            {
                LOG_warn << "Couldn't delete the session: " << errorstring(abortFailed->mError);
            }

            if (terminal(event))
                std::call_once(*settledOnce, [&settled]() { settled->set_value(); });
        });

        uploader->start();

        auto result = uploader->result().get();

        finished.wait();

        if (!result)
        {
            LOG_err << "Upload failed: " << errorstring(result.error());
            return EXIT_FAILURE;
        }

        std::cout << result->mID << " " << result->mName << " " << result->mSHA1 << std::endl;
    }
    catch (std::exception& exception)
    {
        LOG_err << "Couldn't upload " << path << ": " << exception.what();
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    SessionApiClientOptions clientOptions;
    ChunkedUploadOptions uploadOptions;
    std::string token;

    if (auto* value = std::getenv("CUMULUS_ACCESS_TOKEN"))
        token = value;

    int i = 1;

    for ( ; i < argc && !std::strncmp(argv[i], "--", 2); ++i)
    {
        std::string option = argv[i];

        if (option == "--verbose")
        {
            SimpleLogger::setLogLevel(logDebug);
            upload::logger().logLevel(logDebug);
            continue;
        }

        if (i + 1 >= argc)
            return usage(argv[0]), EXIT_FAILURE;

        std::string value = argv[++i];

        if (option == "--base")
            clientOptions.mBaseURL = value;
        else if (option == "--log-level")
        {
            auto level = toLogLevel(value);

            if (!level)
                return usage(argv[0]), EXIT_FAILURE;

            SimpleLogger::setLogLevel(*level);
            upload::logger().logLevel(*level);
        }
        else if (option == "--parallelism")
            uploadOptions.mParallelism = static_cast<std::size_t>(std::strtoul(value.c_str(), nullptr, 10));
        else if (option == "--token")
            token = value;
        else
            return usage(argv[0]), EXIT_FAILURE;
    }

    if (argc - i != 2)
        return usage(argv[0]), EXIT_FAILURE;

    g_externalLogger.setLogToConsole(true);

    std::string descriptor;

    if (!readFile(argv[i], descriptor))
    {
        LOG_err << "Couldn't read session descriptor: " << argv[i];
        return EXIT_FAILURE;
    }

    auto session = UploadSession::fromJSON(descriptor);

    if (!session)
    {
        LOG_err << "Invalid session descriptor: " << errorstring(session.error());
        return EXIT_FAILURE;
    }

    auto path = std::string(argv[i + 1]);
    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary | std::ios::ate);

    if (!*stream)
    {
        LOG_err << "Couldn't open " << path;
        return EXIT_FAILURE;
    }

    auto totalSize = static_cast<m_off_t>(stream->tellg());

    stream->seekg(0);

    clientOptions.mTokenProvider = [token]() { return token; };

    // Reset explicitly below so that no worker outlives the client.
    auto executor = std::make_unique<common::TaskExecutor>(common::TaskExecutorFlags(),
                                                           upload::logger());

    http::CurlHttpTransport transport(*executor, "cumulus_upload/1.0");
    SessionApiClient client(transport, *executor, clientOptions);

    auto status = upload(client,
                         *executor,
                         *session,
                         std::move(stream),
                         totalSize,
                         uploadOptions,
                         path);

    // Wait for any requests still in flight.
    executor.reset();

    return status;
}
