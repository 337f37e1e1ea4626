#ifndef TRANSFERENGINE_HPP
#define TRANSFERENGINE_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <functional>

#include "core/Error.hpp"
#include "core/TransferTask.hpp"
#include "core/ArchiveExtractor.hpp"

struct TransferSettings
{
    long connectTimeoutSec{30};
    long readTimeoutSec{60}; // Longest stretch without receiving a byte
    std::chrono::milliseconds progressInterval{500};
};

struct TransferRequest
{
    std::uint64_t resumeFromByte{0};
    bool extract{false};
    std::string extractTo;

    // Runs after a successful extraction, a failure fails the transfer and keeps the archive
    std::function<Status(const std::string &directory)> onExtracted;
};

// Performs one HTTP GET attempt for a task, streaming the body to the
// task's destination and publishing progress on the task's channel.
// Every call ends with exactly one terminal snapshot.
class TransferEngine
{
public:
    explicit TransferEngine(const TransferSettings &settings);
    ~TransferEngine();

    TransferEngine(const TransferEngine &) = delete;
    TransferEngine &operator=(const TransferEngine &) = delete;

    void transfer(TransferTask &task, const TransferRequest &request) const;

private:
    struct Outcome
    {
        Error error;
        bool cancelled{false};
        bool restartFromZero{false};
        std::uint64_t bytesReceived{0};
        std::uint64_t bytesTotal{0};
    };

    TransferSettings _settings;
    ArchiveExtractor _extractor;

    Outcome download(TransferTask &task, std::uint64_t resumeFromByte) const;
    void finish(TransferTask &task, const TransferRequest &request, const Outcome &outcome) const;
};

#endif
