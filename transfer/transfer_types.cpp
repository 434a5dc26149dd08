// ============================================================
// transfer_types.cpp -- Names for the enums in transfer_types.hpp
// ============================================================

#include "transfer_types.hpp"
#include "../common/utils.hpp"

const char* scheme_name(Scheme s) {
    switch (s) {
        case Scheme::HTTP:    return "HTTP";
        case Scheme::HTTPS:   return "HTTPS";
        case Scheme::S3:      return "S3";
        case Scheme::FTP:     return "FTP";
        case Scheme::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

Scheme scheme_from_name(const std::string& name) {
    std::string n = utils::to_upper(utils::trim(name));
    if (n == "HTTP")  return Scheme::HTTP;
    if (n == "HTTPS") return Scheme::HTTPS;
    if (n == "S3")    return Scheme::S3;
    if (n == "FTP")   return Scheme::FTP;
    return Scheme::UNKNOWN;
}

Scheme scheme_of_url(const std::string& url) {
    auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0) return Scheme::UNKNOWN;
    return scheme_from_name(url.substr(0, pos));
}

const char* failure_name(FailureKind k) {
    switch (k) {
        case FailureKind::NO_VALID_ENDPOINT:       return "no-valid-endpoint";
        case FailureKind::ENDPOINT_UNREACHABLE:    return "endpoint-unreachable";
        case FailureKind::CHECKSUM_MISMATCH:       return "checksum-mismatch";
        case FailureKind::EXTRACTION_FAILED:       return "extraction-failed";
        case FailureKind::UPLOAD_FAILED:           return "upload-failed";
        case FailureKind::INCOMPLETE_SAMPLE_GROUP: return "incomplete-sample-group";
    }
    return "?";
}

const char* state_name(EntryState s) {
    switch (s) {
        case EntryState::PENDING:           return "PENDING";
        case EntryState::ENDPOINT_SELECTED: return "ENDPOINT_SELECTED";
        case EntryState::DOWNLOADED:        return "DOWNLOADED";
        case EntryState::VERIFIED:          return "VERIFIED";
        case EntryState::EXTRACTED:         return "EXTRACTED";
        case EntryState::UPLOADED:          return "UPLOADED";
        case EntryState::DONE:              return "DONE";
        case EntryState::FAILED:            return "FAILED";
        case EntryState::CANCELLED:         return "CANCELLED";
    }
    return "?";
}
