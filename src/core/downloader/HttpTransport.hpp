#pragma once

/**
 * HttpTransport.hpp
 *
 * Seam between the transfer logic and the HTTP library. The transfer unit
 * only sees response heads and body chunks; the production implementation
 * is CprTransport, tests plug in a scripted transport.
 */

#include <string>
#include <map>
#include <chrono>
#include <cstdint>

namespace modelfetch::core::downloader {

/**
 * One GET request
 */
struct TransferRequest {
    std::string url;
    std::map<std::string, std::string> headers;
    std::string userAgent;
    std::chrono::milliseconds timeout{300000};

    // Non-zero asks for "Range: bytes=<rangeStart>-"
    uint64_t rangeStart{0};
};

/**
 * Status line and the headers the transfer cares about
 */
struct ResponseHead {
    long statusCode{0};

    // Content-Length of this response body, -1 if absent
    int64_t contentLength{-1};

    // From "Content-Range: bytes <start>-b/<total>", -1 if absent
    int64_t contentRangeStart{-1};
    int64_t contentRangeTotal{-1};

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
    bool isPartialContent() const { return statusCode == 206; }
};

/**
 * Receiver of a streamed response
 */
class TransferSink {
public:
    virtual ~TransferSink() = default;

    /**
     * Called once before the first body chunk (or at the end for an empty body)
     * @return false to abort the request
     */
    virtual bool onHead(const ResponseHead& head) = 0;

    /**
     * @return false to abort the request
     */
    virtual bool onData(const char* data, size_t length) = 0;

    /**
     * Polled by the transport while waiting on the network
     */
    virtual bool shouldAbort() const = 0;
};

/**
 * How the transport call ended
 */
enum class TransportStatus {
    Completed,   // full response received; check the head for the HTTP status
    Aborted,     // the sink asked to stop
    TimedOut,
    NetworkError
};

struct TransportResult {
    TransportStatus status{TransportStatus::Completed};
    long statusCode{0};
    std::string errorMessage;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Perform a blocking GET, streaming the body into @p sink
     */
    virtual TransportResult get(const TransferRequest& request, TransferSink& sink) = 0;
};

} // namespace modelfetch::core::downloader
