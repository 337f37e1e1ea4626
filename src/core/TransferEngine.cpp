#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>
#include <optional>

#include "core/TransferEngine.hpp"
#include "core/ThroughputMeter.hpp"
#include "aux/FileWriter.hpp"
#include "util/file.hpp"
#include "util/http.hpp"

namespace fs = std::filesystem;

namespace
{
    // State shared with the libcurl callbacks for one attempt
    struct TransferContext
    {
        TransferTask *task{nullptr};
        FileWriter *writer{nullptr};
        ThroughputMeter meter;

        std::uint64_t resumeOffset{0};
        std::uint64_t received{0};
        std::uint64_t total{0};
        std::uint64_t lastEmittedBytes{0};

        http::StatusLine status;
        std::optional<std::uint64_t> contentLength;
        bool established{false};
        bool rangeNotSatisfiable{false};
        Error failure;

        explicit TransferContext(std::chrono::milliseconds interval) : meter(interval) {}

        void emitProgress(ThroughputMeter::Clock::time_point now)
        {
            double rate = meter.recordEmission(now, received);
            ProgressSnapshot snapshot = makeSnapshot(TransferStatus::DOWNLOADING, received, total);
            snapshot.throughputBytesPerSec = rate;
            snapshot.estimatedSecondsRemaining = ThroughputMeter::estimateSecondsRemaining(total, received, rate);
            task->publish(snapshot);
            lastEmittedBytes = received;
        }

        // Called once the final response headers are complete
        bool establishResponse()
        {
            if (status.code == 416 && resumeOffset > 0)
            {
                rangeNotSatisfiable = true;
                return false;
            }

            if (status.code != 200 && status.code != 206)
            {
                failure = Error{ErrorKind::PROTOCOL, status.text};
                return false;
            }

            if (status.code == 200 && resumeOffset > 0)
            {
                // Server ignored the range, the body starts at byte 0
                spdlog::info("Server ignored range request for {}, restarting from 0", task->getUrl());
                if (!writer->truncate())
                {
                    failure = Error{ErrorKind::IO, writer->getLastError()};
                    return false;
                }
                resumeOffset = 0;
                received = 0;
            }

            total = contentLength ? *contentLength + resumeOffset : 0;
            established = true;

            meter.reset(ThroughputMeter::Clock::now(), received);
            ProgressSnapshot snapshot = makeSnapshot(TransferStatus::DOWNLOADING, received, total);
            snapshot.message = "Downloading...";
            task->publish(snapshot);
            lastEmittedBytes = received;
            return true;
        }
    };

    // Tracks the status line and Content-Length of each response; a blank
    // line ends a header block, intermediate 1xx/3xx blocks are ignored
    size_t curlHeaderCallback(char *buffer, size_t size, size_t nitems, void *userdata)
    {
        auto *ctx = static_cast<TransferContext *>(userdata);
        size_t length = size * nitems;
        std::string line(buffer, length);

        if (auto status = http::parseStatusLine(line))
        {
            ctx->status = *status;
            ctx->contentLength.reset();
            return length;
        }

        if (line == "\r\n" || line == "\n")
        {
            long code = ctx->status.code;
            if ((code >= 100 && code < 200) || (code >= 300 && code < 400) || ctx->established)
                return length;

            return ctx->establishResponse() ? length : 0;
        }

        if (auto header = http::parseHeaderLine(line))
        {
            if (header->first == "content-length")
            {
                try
                {
                    ctx->contentLength = std::stoull(header->second);
                }
                catch (const std::exception &)
                {
                    ctx->contentLength.reset();
                }
            }
        }
        return length;
    }

    // Appends a body chunk to the destination and emits throttled progress
    size_t curlWriteCallback(void *ptr, size_t size, size_t nmemb, void *userdata)
    {
        auto *ctx = static_cast<TransferContext *>(userdata);
        size_t totalBytes = size * nmemb;

        if (ctx->task->isCancelled())
            return 0;

        if (!ctx->established && !ctx->establishResponse())
            return 0;

        if (!ctx->writer->write(static_cast<const char *>(ptr), totalBytes))
        {
            ctx->failure = Error{ErrorKind::IO, ctx->writer->getLastError()};
            return 0;
        }

        ctx->received += totalBytes;

        auto now = ThroughputMeter::Clock::now();
        if (ctx->meter.shouldEmit(now, ctx->received, ctx->total))
            ctx->emitProgress(now);

        return totalBytes;
    }

    // Also runs while the connection is idle, so cancellation is noticed promptly
    int curlProgressCallback(void *clientp,
                             curl_off_t /* dltotal */,
                             curl_off_t /* dlnow */,
                             curl_off_t /* ultotal */,
                             curl_off_t /* ulnow */)
    {
        auto *ctx = static_cast<TransferContext *>(clientp);
        return ctx->task->isCancelled() ? 1 : 0;
    }

    Error classifyCurlError(CURLcode code, const char *errorBuffer)
    {
        std::string message = (errorBuffer && errorBuffer[0]) ? errorBuffer : curl_easy_strerror(code);
        switch (code)
        {
        case CURLE_OPERATION_TIMEDOUT:
            return Error{ErrorKind::TIMEOUT, message};
        case CURLE_WRITE_ERROR:
            return Error{ErrorKind::IO, message};
        default:
            return Error{ErrorKind::NETWORK, message};
        }
    }

    // Brings an existing partial file in line with the requested offset
    std::uint64_t prepareResume(const std::string &destination, std::uint64_t requested)
    {
        if (requested == 0)
            return 0;

        std::uint64_t existing = fileSize(destination);
        if (existing < requested)
        {
            spdlog::warn("Partial file {} holds {} bytes, resuming from there instead of {}",
                         destination, existing, requested);
            return existing;
        }

        if (existing > requested)
        {
            std::error_code ec;
            fs::resize_file(destination, requested, ec);
            if (ec)
            {
                spdlog::warn("Cannot shrink {} to resume offset: {}", destination, ec.message());
                return 0;
            }
        }
        return requested;
    }
}

TransferEngine::TransferEngine(const TransferSettings &settings) : _settings(settings)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

TransferEngine::~TransferEngine()
{
    curl_global_cleanup();
}

void TransferEngine::transfer(TransferTask &task, const TransferRequest &request) const
{
    ProgressSnapshot pending = makeSnapshot(TransferStatus::PENDING, 0, 0);
    pending.message = "Starting download...";
    task.publish(pending);

    try
    {
        Outcome outcome = download(task, request.resumeFromByte);
        if (outcome.restartFromZero)
        {
            spdlog::info("Range not satisfiable for {}, downloading from the start", task.getUrl());
            outcome = download(task, 0);
        }
        finish(task, request, outcome);
    }
    catch (const std::exception &e)
    {
        ProgressSnapshot latest = task.getLatestSnapshot();
        task.publish(makeFailedSnapshot(Error{ErrorKind::IO, e.what()}, latest.bytesReceived, latest.bytesTotal));
    }
}

// Runs the HTTP exchange, publishing DOWNLOADING snapshots but never a terminal one
TransferEngine::Outcome TransferEngine::download(TransferTask &task, std::uint64_t resumeFromByte) const
{
    Outcome outcome;

    if (task.isCancelled())
    {
        outcome.cancelled = true;
        return outcome;
    }

    const std::string &destination = task.getDestination();
    std::string dirError;
    fs::path parent = fs::path(destination).parent_path();
    if (!parent.empty() && !ensureDirectory(parent.string(), dirError))
    {
        outcome.error = Error{ErrorKind::IO, dirError};
        return outcome;
    }

    std::uint64_t resumeFrom = prepareResume(destination, resumeFromByte);

    CURL *curlHandle = curl_easy_init();
    if (!curlHandle)
    {
        outcome.error = Error{ErrorKind::NETWORK, "cannot initialise libcurl"};
        return outcome;
    }

    // Append when resuming so earlier bytes survive, otherwise start fresh
    FileWriter writer(destination, resumeFrom > 0);
    if (!writer.isOpen())
    {
        curl_easy_cleanup(curlHandle);
        outcome.error = Error{ErrorKind::IO, writer.getLastError()};
        return outcome;
    }

    TransferContext ctx(_settings.progressInterval);
    ctx.task = &task;
    ctx.writer = &writer;
    ctx.resumeOffset = resumeFrom;
    ctx.received = resumeFrom;

    char errorBuffer[CURL_ERROR_SIZE] = {0};
    std::string range = std::to_string(resumeFrom) + "-";

    curl_easy_setopt(curlHandle, CURLOPT_URL, task.getUrl().c_str());
    curl_easy_setopt(curlHandle, CURLOPT_WRITEFUNCTION, curlWriteCallback);
    curl_easy_setopt(curlHandle, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curlHandle, CURLOPT_HEADERFUNCTION, curlHeaderCallback);
    curl_easy_setopt(curlHandle, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curlHandle, CURLOPT_NOPROGRESS, 0L); // Enable the progress callback
    curl_easy_setopt(curlHandle, CURLOPT_XFERINFOFUNCTION, curlProgressCallback);
    curl_easy_setopt(curlHandle, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curlHandle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_NOSIGNAL, 1L); // Worker threads, no SIGALRM
    curl_easy_setopt(curlHandle, CURLOPT_USERAGENT, SSM_USER_AGENT);
    curl_easy_setopt(curlHandle, CURLOPT_ERRORBUFFER, errorBuffer);
    curl_easy_setopt(curlHandle, CURLOPT_CONNECTTIMEOUT, _settings.connectTimeoutSec);

    // Read timeout: abort when under 1 byte/sec for the whole window
    curl_easy_setopt(curlHandle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curlHandle, CURLOPT_LOW_SPEED_TIME, _settings.readTimeoutSec);

    if (resumeFrom > 0)
    {
        // Sends "Range: bytes=<n>-"
        curl_easy_setopt(curlHandle, CURLOPT_RANGE, range.c_str());
        spdlog::info("Resuming {} from byte {}", task.getUrl(), resumeFrom);
    }

    CURLcode res = curl_easy_perform(curlHandle);

    if (res == CURLE_OK && !ctx.established && !ctx.failure)
    {
        // Empty bodies never reach the write callback
        long code = 0;
        curl_easy_getinfo(curlHandle, CURLINFO_RESPONSE_CODE, &code);
        if (ctx.status.code == 0)
        {
            ctx.status.code = code;
            ctx.status.text = "HTTP " + std::to_string(code);
        }
        ctx.establishResponse();
    }

    curl_easy_cleanup(curlHandle);

    outcome.bytesReceived = ctx.received;
    outcome.bytesTotal = ctx.total;

    if (task.isCancelled())
    {
        outcome.cancelled = true;
    }
    else if (ctx.rangeNotSatisfiable)
    {
        outcome.restartFromZero = true;
    }
    else if (ctx.failure)
    {
        outcome.error = ctx.failure;
    }
    else if (res != CURLE_OK)
    {
        outcome.error = classifyCurlError(res, errorBuffer);
    }
    else if (ctx.total > 0 && ctx.received != ctx.total)
    {
        outcome.error = Error{ErrorKind::NETWORK,
                              "connection closed after " + std::to_string(ctx.received) +
                                  " of " + std::to_string(ctx.total) + " bytes"};
    }
    else if (!writer.close())
    {
        outcome.error = Error{ErrorKind::IO, writer.getLastError()};
    }
    else if (ctx.lastEmittedBytes != ctx.received)
    {
        // Size was unknown, the end of the body is the last byte
        ctx.emitProgress(ThroughputMeter::Clock::now());
    }

    if (outcome.restartFromZero)
    {
        writer.close();
        std::string error;
        if (!removeTree(destination, error))
            outcome.error = Error{ErrorKind::IO, error};
    }

    return outcome;
}

// Publishes the terminal snapshot, extracting and handing off first when requested
void TransferEngine::finish(TransferTask &task, const TransferRequest &request, const Outcome &outcome) const
{
    if (outcome.cancelled)
    {
        ProgressSnapshot cancelled = makeSnapshot(TransferStatus::CANCELLED, outcome.bytesReceived, outcome.bytesTotal);
        cancelled.message = "Download cancelled";
        task.publish(cancelled);
        spdlog::info("Transfer of {} cancelled at {} bytes", task.getUrl(), outcome.bytesReceived);
        return;
    }

    if (outcome.error || outcome.restartFromZero)
    {
        Error error = outcome.error;
        if (!error)
            error = Error{ErrorKind::PROTOCOL, "HTTP 416 Range Not Satisfiable"};
        spdlog::warn("Transfer of {} failed ({}): {}", task.getUrl(), errorKindName(error.kind), error.message);
        task.publish(makeFailedSnapshot(error, outcome.bytesReceived, outcome.bytesTotal));
        return;
    }

    if (request.extract)
    {
        ProgressSnapshot extracting = makeSnapshot(TransferStatus::EXTRACTING, outcome.bytesReceived, outcome.bytesTotal);
        extracting.message = "Extracting...";
        task.publish(extracting);

        Status extracted = _extractor.extractFile(task.getDestination(), request.extractTo, &task.cancelFlag());
        if (!extracted)
        {
            Error error{extracted.error().kind, "Failed to extract file: " + extracted.error().message};
            task.publish(makeFailedSnapshot(error, outcome.bytesReceived, outcome.bytesTotal));
            return;
        }

        if (request.onExtracted)
        {
            Status adopted = request.onExtracted(request.extractTo);
            if (!adopted)
            {
                task.publish(makeFailedSnapshot(adopted.error(), outcome.bytesReceived, outcome.bytesTotal));
                return;
            }
        }

        // The archive is only dropped once the extracted package has been accepted
        std::error_code ec;
        fs::remove(task.getDestination(), ec);
        if (ec)
            spdlog::warn("Cannot delete archive {}: {}", task.getDestination(), ec.message());
    }

    ProgressSnapshot completed = makeSnapshot(TransferStatus::COMPLETED, outcome.bytesReceived, outcome.bytesTotal);
    completed.message = "Download completed";
    task.publish(completed);
    spdlog::info("Transfer of {} completed ({} bytes)", task.getUrl(), outcome.bytesReceived);
}
