#include "UpgradeTypes.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace upgrade
{

int DownloadProgress::percentComplete() const
{
    if (totalBytes == 0)
        return 0;
    if (bytesReceived >= totalBytes)
        return 100;
    return static_cast<int>((bytesReceived * 100) / totalBytes);
}

DownloadProgress DownloadProgress::compute(std::uint64_t received, std::uint64_t total,
                                           std::chrono::milliseconds elapsed)
{
    DownloadProgress progress;
    progress.bytesReceived = received;
    progress.totalBytes = total;
    progress.elapsed = elapsed;

    // Cumulative average from transfer start, so early ETAs run optimistic
    const double seconds = elapsed.count() / 1000.0;
    progress.speedBytesPerSecond = seconds > 0.0 ? static_cast<double>(received) / seconds : 0.0;

    if (total > 0 && received < total && progress.speedBytesPerSecond > 0.0)
    {
        const double remainingSeconds = static_cast<double>(total - received) / progress.speedBytesPerSecond;
        progress.eta = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(remainingSeconds * 1000.0)));
    }

    return progress;
}

std::string DownloadProgress::formatBytes(std::uint64_t bytes)
{
    static const char* sizes[] = { "B", "KB", "MB", "GB", "TB" };
    double len = static_cast<double>(bytes);
    int order = 0;
    while (len >= 1024.0 && order < 4)
    {
        ++order;
        len /= 1024.0;
    }

    std::ostringstream oss;
    oss << std::setprecision(2) << std::fixed << len;
    std::string text = oss.str();

    // "0.##" formatting: drop trailing zeros and a dangling point
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.')
        text.pop_back();

    return text + " " + sizes[order];
}

std::string DownloadProgress::toString() const
{
    if (totalBytes == 0)
        return "Starting download...";

    std::ostringstream oss;
    oss << percentComplete() << "% - " << formatBytes(bytesReceived) << " / " << formatBytes(totalBytes) << " ("
        << std::fixed << std::setprecision(2) << speedMBps() << " MB/s, ETA: " << (eta.count() + 500) / 1000 << "s)";
    return oss.str();
}

const char* toString(PipelineState state)
{
    switch (state)
    {
    case PipelineState::Idle:
        return "Idle";
    case PipelineState::DetectingState:
        return "DetectingState";
    case PipelineState::FreshInstall:
        return "FreshInstall";
    case PipelineState::Upgrading:
        return "Upgrading";
    case PipelineState::Reconfiguring:
        return "Reconfiguring";
    case PipelineState::ResolvingRelease:
        return "ResolvingRelease";
    case PipelineState::Validating:
        return "Validating";
    case PipelineState::Downloading:
        return "Downloading";
    case PipelineState::HandingOff:
        return "HandingOff";
    case PipelineState::Applying:
        return "Applying";
    case PipelineState::Committing:
        return "Committing";
    case PipelineState::Succeeded:
        return "Succeeded";
    case PipelineState::HandedOff:
        return "HandedOff";
    case PipelineState::Failed:
        return "Failed";
    }
    return "Unknown";
}

const char* toString(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::None:
        return "None";
    case FailureKind::Transient:
        return "Transient";
    case FailureKind::Data:
        return "Data";
    case FailureKind::StateStore:
        return "StateStore";
    case FailureKind::Protocol:
        return "Protocol";
    case FailureKind::Rejected:
        return "Rejected";
    case FailureKind::Integrity:
        return "Integrity";
    case FailureKind::Install:
        return "Install";
    case FailureKind::Cancelled:
        return "Cancelled";
    case FailureKind::Configuration:
        return "Configuration";
    }
    return "Unknown";
}

} // namespace upgrade
