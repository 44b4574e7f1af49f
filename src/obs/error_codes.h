#pragma once

namespace cloudpulse {
namespace obs {

inline constexpr const char* kErrHttpBadRequest = "E_HTTP_BAD_REQUEST";
inline constexpr const char* kErrHttpJsonParseError = "E_HTTP_JSON_PARSE_ERROR";
inline constexpr const char* kErrHttpMissingField = "E_HTTP_MISSING_FIELD";

inline constexpr const char* kErrInvalidWindow = "E_INVALID_WINDOW";

inline constexpr const char* kErrStoreListFailed = "E_STORE_LIST_FAILED";
inline constexpr const char* kErrStoreGetFailed = "E_STORE_GET_FAILED";
inline constexpr const char* kErrStoreNotFound = "E_STORE_NOT_FOUND";
inline constexpr const char* kErrRecordParseFailed = "E_RECORD_PARSE_FAILED";
inline constexpr const char* kErrRollupWriteFailed = "E_ROLLUP_WRITE_FAILED";

inline constexpr const char* kErrDbConnectFailed = "E_DB_CONNECT_FAILED";

inline constexpr const char* kErrInternal = "E_INTERNAL";

} // namespace obs
} // namespace cloudpulse
