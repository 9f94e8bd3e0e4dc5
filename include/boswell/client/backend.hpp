#pragma once
#include "boswell/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace boswell::client
{

enum class HttpMethod
{
    Get,
    Post
};

const char* to_string(HttpMethod method);

/// One logical call against the Boswell backend.
struct BackendRequest
{
    std::string endpoint; ///< Path below the base URL, e.g. "/head"
    HttpMethod method{HttpMethod::Get};
    QueryParams query;       ///< GET only
    std::optional<Json> body; ///< POST only
};

struct BackendError
{
    std::string error;   ///< "HTTP <code>"; code 0 for transport failures
    std::string details; ///< Raw response body or transport error text
};

/// Tagged outcome of a backend call: the decoded response, or a BackendError.
class BackendResult
{
  public:
    static BackendResult success(Json value)
    {
        return BackendResult(std::move(value));
    }
    static BackendResult failure(BackendError error)
    {
        return BackendResult(std::move(error));
    }

    bool ok() const
    {
        return std::holds_alternative<Json>(data_);
    }
    const Json& value() const
    {
        return std::get<Json>(data_);
    }
    const BackendError& error() const
    {
        return std::get<BackendError>(data_);
    }

    /// The value handed back to the caller: the response itself, or {"error", "details"}.
    Json to_json() const;

  private:
    explicit BackendResult(Json value) : data_(std::move(value)) {}
    explicit BackendResult(BackendError error) : data_(std::move(error)) {}

    std::variant<Json, BackendError> data_;
};

/// Outbound side of the gateway. Implementations never throw from call().
class BackendClient
{
  public:
    virtual ~BackendClient() = default;
    virtual BackendResult call(const BackendRequest& request) const = 0;
};

/**
 * Backend client over HTTP(S) using cpp-httplib.
 *
 * One attempt per call, no retries. Connect, read and write are each bounded
 * by `timeout_seconds`. Any 2xx status is a success and the body is decoded as
 * JSON when possible, otherwise returned as a JSON string. Every other status,
 * and any transport failure, becomes a BackendError.
 *
 * @param base_url Base URL including an optional path prefix, e.g.
 *                 "https://example.com/boswell/v2". Throws ValidationError if
 *                 malformed, or if it is https:// and TLS support was not built in.
 */
class HttpBackendClient : public BackendClient
{
  public:
    explicit HttpBackendClient(std::string base_url, int timeout_seconds = 30);

    BackendResult call(const BackendRequest& request) const override;

    const std::string& base_url() const
    {
        return base_url_;
    }
    int timeout_seconds() const
    {
        return timeout_seconds_;
    }

  private:
    std::string base_url_;
    std::string scheme_;
    std::string host_;
    int port_{80};
    std::string base_path_;
    int timeout_seconds_;
};

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode_component(const std::string& value);

/// "k1=v1&k2=v2" in the given order; empty for no parameters.
std::string build_query_string(const QueryParams& params);

} // namespace boswell::client
