#include "core/TransferTypes.hpp"
#include "core/Error.hpp"

const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NONE:
        return "none";
    case ErrorKind::NETWORK:
        return "network";
    case ErrorKind::TIMEOUT:
        return "timeout";
    case ErrorKind::PROTOCOL:
        return "protocol";
    case ErrorKind::IO:
        return "io";
    case ErrorKind::ARCHIVE:
        return "archive";
    case ErrorKind::MANIFEST:
        return "manifest";
    case ErrorKind::CONCURRENCY_LIMIT:
        return "concurrency limit";
    case ErrorKind::NOT_FOUND:
        return "not found";
    case ErrorKind::NOT_READY:
        return "not ready";
    }
    return "unknown";
}

bool isTerminalStatus(TransferStatus status)
{
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

bool isLegalTransition(TransferStatus from, TransferStatus to)
{
    if (isTerminalStatus(from))
        return false;

    switch (to)
    {
    case TransferStatus::PENDING:
        return false;
    case TransferStatus::DOWNLOADING:
        // Repeated DOWNLOADING snapshots carry the streaming progress
        return from == TransferStatus::PENDING || from == TransferStatus::DOWNLOADING;
    case TransferStatus::EXTRACTING:
        return from == TransferStatus::DOWNLOADING;
    case TransferStatus::COMPLETED:
        return from == TransferStatus::DOWNLOADING || from == TransferStatus::EXTRACTING;
    case TransferStatus::CANCELLED:
        return from == TransferStatus::PENDING || from == TransferStatus::DOWNLOADING;
    case TransferStatus::FAILED:
        return true;
    }
    return false;
}

const char *statusName(TransferStatus status)
{
    switch (status)
    {
    case TransferStatus::PENDING:
        return "pending";
    case TransferStatus::DOWNLOADING:
        return "downloading";
    case TransferStatus::EXTRACTING:
        return "extracting";
    case TransferStatus::COMPLETED:
        return "completed";
    case TransferStatus::FAILED:
        return "failed";
    case TransferStatus::CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

ProgressSnapshot makeSnapshot(TransferStatus status,
                              std::uint64_t bytesReceived,
                              std::uint64_t bytesTotal)
{
    ProgressSnapshot snapshot;
    snapshot.status = status;
    snapshot.bytesReceived = bytesReceived;
    snapshot.bytesTotal = bytesTotal;
    if (bytesTotal > 0)
    {
        snapshot.fractionComplete = static_cast<double>(bytesReceived) / static_cast<double>(bytesTotal);
        if (snapshot.fractionComplete > 1.0)
            snapshot.fractionComplete = 1.0;
    }
    return snapshot;
}

ProgressSnapshot makeFailedSnapshot(const Error &error,
                                    std::uint64_t bytesReceived,
                                    std::uint64_t bytesTotal)
{
    ProgressSnapshot snapshot = makeSnapshot(TransferStatus::FAILED, bytesReceived, bytesTotal);
    snapshot.errorKind = error.kind == ErrorKind::NONE ? ErrorKind::IO : error.kind;
    snapshot.errorMessage = error.message;
    return snapshot;
}
