// ModelFetch - HTTP transport
// Streaming GET over cpr (which wraps libcurl)

#pragma once

#include "HttpTransport.hpp"

#include <string>

namespace modelfetch::core::downloader {

/**
 * @brief HttpTransport backed by cpr
 *
 * Body chunks are handed to the sink as libcurl delivers them; nothing is
 * buffered beyond one chunk. Redirects are followed.
 */
class CprTransport : public HttpTransport {
public:
    CprTransport() = default;

    CprTransport(const CprTransport&) = delete;
    CprTransport& operator=(const CprTransport&) = delete;

    TransportResult get(const TransferRequest& request, TransferSink& sink) override;

    /**
     * Parse one raw header line into @p head. Status lines start a new head,
     * so after redirects only the final response is kept.
     */
    static void parseHeaderLine(const std::string& line, ResponseHead& head);
};

} // namespace modelfetch::core::downloader
