#ifndef TRANSFERTYPES_HPP
#define TRANSFERTYPES_HPP

#include <cstdint>
#include <string>
#include <optional>

#include "core/Error.hpp"

enum class TransferStatus
{
    PENDING,
    DOWNLOADING,
    EXTRACTING,
    COMPLETED,
    FAILED,
    CANCELLED
};

struct ProgressSnapshot
{
    TransferStatus status{TransferStatus::PENDING};
    std::uint64_t bytesReceived{0};
    std::uint64_t bytesTotal{0}; // 0 when the server did not report a size
    double fractionComplete{0.0};
    double throughputBytesPerSec{0.0};
    std::optional<double> estimatedSecondsRemaining;
    std::optional<std::string> errorMessage;
    ErrorKind errorKind{ErrorKind::NONE};
    std::string message;
};

bool isTerminalStatus(TransferStatus status);

// Forward-only ordering of the lifecycle, terminal states share the last rank
bool isLegalTransition(TransferStatus from, TransferStatus to);

const char *statusName(TransferStatus status);

ProgressSnapshot makeSnapshot(TransferStatus status,
                              std::uint64_t bytesReceived,
                              std::uint64_t bytesTotal);

ProgressSnapshot makeFailedSnapshot(const Error &error,
                                    std::uint64_t bytesReceived = 0,
                                    std::uint64_t bytesTotal = 0);

#endif
