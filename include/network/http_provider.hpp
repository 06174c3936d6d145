#ifndef ZGS_HTTP_PROVIDER_HPP
#define ZGS_HTTP_PROVIDER_HPP

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace zgs {
namespace network {

// JSON-RPC request/response seam shared by node and indexer clients
class Provider {
public:
    virtual ~Provider() = default;

    // Returns the "result" member, which may be null. Throws
    // NodeUnavailableError on transport failure and RpcError when the
    // response carries an error object.
    virtual nlohmann::json request(const std::string& method,
                                   const nlohmann::json& params = nlohmann::json()) = 0;

    virtual const std::string& url() const = 0;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Splits scheme://host[:port][/target], defaults to http and "/"
ParsedUrl parse_url(const std::string& url);

// Request envelope {"jsonrpc":"2.0","id":1,"method":...,"params":...}
nlohmann::json make_rpc_request(const std::string& method, const nlohmann::json& params);

// Extracts the result from a response envelope, throws RpcError on error
nlohmann::json unwrap_rpc_response(const nlohmann::json& response);

class HttpProvider : public Provider {
public:
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

    explicit HttpProvider(const std::string& url,
                          std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    nlohmann::json request(const std::string& method,
                           const nlohmann::json& params = nlohmann::json()) override;

    const std::string& url() const override { return url_; }

private:
    // POSTs the body and returns the response body
    std::string post(const std::string& body);

    std::string url_;
    ParsedUrl parsed_;
    std::chrono::milliseconds timeout_;
};

} // namespace network
} // namespace zgs

#endif // ZGS_HTTP_PROVIDER_HPP
