/**
 * CprTransport.cpp
 *
 * HTTP transport implementation using cpr.
 */

#include "CprTransport.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <cpr/cpr.h>

namespace modelfetch::core::downloader {

using utils::StringUtils;

void CprTransport::parseHeaderLine(const std::string& line, ResponseHead& head) {
    std::string trimmed = StringUtils::trim(line);
    if (trimmed.empty()) {
        return;
    }

    if (StringUtils::startsWith(trimmed, "HTTP/")) {
        head = ResponseHead{};
        auto space = trimmed.find(' ');
        if (space != std::string::npos) {
            head.statusCode = StringUtils::parseInt(trimmed.substr(space + 1, 3), 0);
        }
        return;
    }

    auto colon = trimmed.find(':');
    if (colon == std::string::npos) {
        return;
    }

    std::string name = StringUtils::toLower(StringUtils::trim(trimmed.substr(0, colon)));
    std::string value = StringUtils::trim(trimmed.substr(colon + 1));

    if (name == "content-length") {
        head.contentLength = StringUtils::parseLong(value, -1);
    } else if (name == "content-range") {
        // bytes 500-999/1000
        auto slash = value.rfind('/');
        if (slash != std::string::npos) {
            head.contentRangeTotal = StringUtils::parseLong(value.substr(slash + 1), -1);
        }
        auto dash = value.find('-');
        if (StringUtils::startsWith(value, "bytes ") && dash != std::string::npos) {
            head.contentRangeStart = StringUtils::parseLong(StringUtils::trim(value.substr(6, dash - 6)), -1);
        }
    }
}

TransportResult CprTransport::get(const TransferRequest& request, TransferSink& sink) {
    TransportResult result;

    ResponseHead head;
    bool headDelivered = false;
    bool aborted = false;

    auto deliverHead = [&]() -> bool {
        if (headDelivered) return true;
        headDelivered = true;
        return sink.onHead(head);
    };

    cpr::Header headers;
    for (const auto& [key, value] : request.headers) {
        headers[key] = value;
    }
    if (request.rangeStart > 0) {
        headers["Range"] = "bytes=" + std::to_string(request.rangeStart) + "-";
    }

    LOG_TRACE("GET {} (range start {})", request.url, request.rangeStart);

    cpr::Response response = cpr::Get(
        cpr::Url{request.url},
        headers,
        cpr::Timeout{request.timeout},
        cpr::UserAgent{request.userAgent},
        cpr::HeaderCallback([&](const auto& line, intptr_t /*userdata*/) -> bool {
            parseHeaderLine(std::string(line.data(), line.size()), head);
            return true;
        }),
        cpr::WriteCallback([&](const auto& data, intptr_t /*userdata*/) -> bool {
            if (sink.shouldAbort() || !deliverHead() ||
                !sink.onData(data.data(), data.size())) {
                aborted = true;
                return false;
            }
            return true;
        }),
        cpr::ProgressCallback([&](cpr::cpr_off_t /*downloadTotal*/, cpr::cpr_off_t /*downloadNow*/,
                                  cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                  intptr_t /*userdata*/) -> bool {
            if (sink.shouldAbort()) {
                aborted = true;
                return false;
            }
            return true;
        })
    );

    result.statusCode = head.statusCode != 0 ? head.statusCode : response.status_code;

    if (aborted) {
        result.status = TransportStatus::Aborted;
        result.errorMessage = "transfer aborted";
        return result;
    }

    if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        result.status = TransportStatus::TimedOut;
        result.errorMessage = "timeout after " + std::to_string(request.timeout.count()) +
                              " ms: " + response.error.message;
        return result;
    }

    if (response.error) {
        result.status = TransportStatus::NetworkError;
        result.errorMessage = response.error.message.empty()
            ? std::string("network error")
            : response.error.message;
        return result;
    }

    // Empty body: the sink has not seen the head yet
    if (!deliverHead()) {
        result.status = TransportStatus::Aborted;
        result.errorMessage = "transfer aborted";
        return result;
    }

    result.status = TransportStatus::Completed;
    return result;
}

} // namespace modelfetch::core::downloader
