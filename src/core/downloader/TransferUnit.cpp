/**
 * TransferUnit.cpp
 *
 * Streams one HTTP response into the destination file.
 */

#include "TransferUnit.hpp"
#include "../Logger.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

namespace modelfetch::core::downloader {

namespace {

std::string lastErrnoMessage() {
    int code = errno;
    if (code == 0) {
        return "I/O error";
    }
    return std::generic_category().message(code) + " (errno " + std::to_string(code) + ")";
}

/**
 * Sink writing the body to disk. Records the first failure it sees so the
 * attempt reports the real cause rather than the transport's "aborted".
 */
class FileSink : public TransferSink {
public:
    FileSink(TransferState& state,
             uint64_t rangeStart,
             Clock& clock,
             std::chrono::milliseconds interval,
             const std::function<bool()>& interrupted,
             const TransferUnit::ProgressFn& onProgress)
        : m_state(state)
        , m_rangeStart(rangeStart)
        , m_clock(clock)
        , m_interval(interval)
        , m_interrupted(interrupted)
        , m_onProgress(onProgress) {}

    bool onHead(const ResponseHead& head) override {
        m_headSeen = true;

        if (!head.isSuccess()) {
            m_failure = TransferOutcome::failure(
                DownloadErrorKind::HttpStatus,
                "HTTP " + std::to_string(head.statusCode),
                head.statusCode);
            return false;
        }

        if (m_rangeStart > 0 && head.isPartialContent() &&
            head.contentRangeStart >= 0 && static_cast<uint64_t>(head.contentRangeStart) != m_rangeStart) {
            // Appending would corrupt the file; the next attempt starts over
            m_failure = TransferOutcome::failure(
                DownloadErrorKind::Network,
                "server sent range starting at " + std::to_string(head.contentRangeStart) +
                    ", requested " + std::to_string(m_rangeStart));
            m_state.restart();
            return false;
        }

        std::ios::openmode mode = std::ios::binary;
        if (m_rangeStart > 0 && head.isPartialContent()) {
            mode |= std::ios::app;
            if (head.contentRangeTotal >= 0) {
                m_state.totalBytes = head.contentRangeTotal;
            } else if (head.contentLength >= 0) {
                m_state.totalBytes = static_cast<int64_t>(m_rangeStart) + head.contentLength;
            } else {
                m_state.totalBytes = -1;
            }
            LOG_DEBUG("Resuming {} at byte {}", m_state.destinationPath, m_rangeStart);
        } else {
            if (m_rangeStart > 0) {
                LOG_INFO("Server ignored range request for {}, restarting from zero",
                         m_state.destinationPath);
            }
            m_state.restart();
            mode |= std::ios::trunc;
            m_state.totalBytes = head.contentLength;
        }

        errno = 0;
        m_file.open(m_state.destinationPath, mode);
        if (!m_file.is_open()) {
            m_failure = TransferOutcome::failure(
                DownloadErrorKind::Filesystem,
                "filesystem error: cannot open " + m_state.destinationPath + ": " + lastErrnoMessage());
            return false;
        }
        m_state.fileTouched = true;

        report(true);
        return true;
    }

    bool onData(const char* data, size_t length) override {
        if (m_interrupted && m_interrupted()) {
            return false;
        }

        errno = 0;
        if (!m_file.write(data, static_cast<std::streamsize>(length))) {
            m_failure = TransferOutcome::failure(
                DownloadErrorKind::Filesystem,
                "filesystem error: write to " + m_state.destinationPath + " failed: " + lastErrnoMessage());
            return false;
        }

        m_state.hasher.update(data, length);
        m_state.bytesOnDisk += length;
        LOG_TRACE("{}: +{} bytes ({} total)", m_state.destinationPath, length, m_state.bytesOnDisk);

        report(false);
        return true;
    }

    bool shouldAbort() const override {
        return m_interrupted && m_interrupted();
    }

    /**
     * Flush and close; a failure here is a filesystem error like any write
     */
    void finish() {
        if (!m_file.is_open()) {
            return;
        }
        errno = 0;
        m_file.flush();
        bool ok = static_cast<bool>(m_file);
        m_file.close();
        if (!m_failure && (!ok || m_file.fail())) {
            m_failure = TransferOutcome::failure(
                DownloadErrorKind::Filesystem,
                "filesystem error: flush of " + m_state.destinationPath + " failed: " + lastErrnoMessage());
        }
    }

    void report(bool force) {
        if (!m_onProgress) return;
        auto now = m_clock.now();
        if (force || !m_lastReport || now - *m_lastReport >= m_interval) {
            m_lastReport = now;
            m_onProgress(m_state.bytesOnDisk, m_state.totalBytes);
        }
    }

    bool headSeen() const { return m_headSeen; }
    const std::optional<TransferOutcome>& failure() const { return m_failure; }

private:
    TransferState& m_state;
    uint64_t m_rangeStart;
    Clock& m_clock;
    std::chrono::milliseconds m_interval;
    const std::function<bool()>& m_interrupted;
    const TransferUnit::ProgressFn& m_onProgress;

    std::ofstream m_file;
    bool m_headSeen{false};
    std::optional<TransferOutcome> m_failure;
    std::optional<Clock::TimePoint> m_lastReport;
};

} // namespace

TransferUnit::TransferUnit(HttpTransport& transport, Clock& clock,
                           std::chrono::milliseconds progressInterval)
    : m_transport(transport)
    , m_clock(clock)
    , m_progressInterval(progressInterval) {
}

TransferOutcome TransferUnit::run(TransferRequest request,
                                  TransferState& state,
                                  const std::function<bool()>& interrupted,
                                  const ProgressFn& onProgress) {
    std::filesystem::path destination(state.destinationPath);

    if (destination.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            return TransferOutcome::failure(
                DownloadErrorKind::Filesystem,
                "filesystem error: cannot create directory " +
                    destination.parent_path().string() + ": " + ec.message());
        }
    }

    request.rangeStart = 0;
    if (state.resumeSupport && state.bytesOnDisk > 0) {
        request.rangeStart = state.bytesOnDisk;
    } else {
        state.restart();
    }

    FileSink sink(state, request.rangeStart, m_clock, m_progressInterval, interrupted, onProgress);
    TransportResult transport = m_transport.get(request, sink);
    sink.finish();

    if (sink.failure()) {
        return *sink.failure();
    }

    switch (transport.status) {
        case TransportStatus::Aborted:
            if (interrupted && interrupted()) {
                return TransferOutcome::failure(DownloadErrorKind::Interrupted, "interrupted");
            }
            return TransferOutcome::failure(DownloadErrorKind::Network,
                                            transport.errorMessage.empty() ? "transfer aborted"
                                                                           : transport.errorMessage);
        case TransportStatus::TimedOut:
            return TransferOutcome::failure(DownloadErrorKind::Timeout,
                                            transport.errorMessage.empty() ? "timeout"
                                                                           : transport.errorMessage);
        case TransportStatus::NetworkError:
            return TransferOutcome::failure(DownloadErrorKind::Network, transport.errorMessage);
        case TransportStatus::Completed:
            break;
    }

    if (!sink.headSeen()) {
        return TransferOutcome::failure(DownloadErrorKind::Network, "no response received");
    }

    if (state.totalBytes >= 0 && state.bytesOnDisk != static_cast<uint64_t>(state.totalBytes)) {
        return TransferOutcome::failure(
            DownloadErrorKind::Network,
            "incomplete body: received " + std::to_string(state.bytesOnDisk) +
                " of " + std::to_string(state.totalBytes) + " bytes");
    }

    sink.report(true);
    return TransferOutcome::completed(state.bytesOnDisk, state.totalBytes, state.hasher.hexDigest());
}

} // namespace modelfetch::core::downloader
