#pragma once

/**
 * @file MatchGateway.hpp
 * @brief Contract with the identity matching / enrollment service, and its HTTP client
 */

#include "FaceTypes.hpp"

#include <string>

namespace presence {

struct MatchRequest {
    Descriptor descriptor;
    float liveness_score = 0.0f;
};

/**
 * @brief Nearest-identity lookup for a live descriptor
 */
class MatchGateway {
public:
    virtual ~MatchGateway() = default;

    /**
     * @return Candidate or explicit no-match
     * @throws PresenceError(GatewayNetworkError | GatewayRejected | GatewayConflict)
     */
    virtual MatchResult match(const MatchRequest& request) = 0;

    /**
     * @brief true if the service answered the health endpoint with 2xx
     */
    virtual bool health() = 0;
};

/**
 * @brief Persistence of a new identity
 */
class EnrollmentStore {
public:
    virtual ~EnrollmentStore() = default;

    /**
     * @throws PresenceError(GatewayConflict) for a duplicate identity or face
     * @throws PresenceError(GatewayNetworkError | GatewayRejected)
     */
    virtual void enroll(const EnrollmentRequest& request) = 0;
};

struct GatewayConfig {
    std::string base_url = "http://localhost:3001";
    std::string token = "";  // sent as "Authorization: Bearer <token>" when set
    int timeout_ms = 10000;
};

/**
 * @brief Split base URL (scheme://host[:port][/prefix])
 */
struct ServiceEndpoint {
    bool tls = false;
    std::string host;
    int port = 80;
    std::string path_prefix;  // no trailing slash
};

/**
 * @throws PresenceError(InvalidInput) for a scheme other than http/https or an empty host
 */
ServiceEndpoint parse_base_url(const std::string& url);

/**
 * @brief Status code and raw body of one exchange with the service
 */
struct HttpResponse {
    int status = 0;
    std::string body;
};

std::string build_match_body(const MatchRequest& request);
std::string build_enroll_body(const EnrollmentRequest& request);

/**
 * @brief Map a /api/mark-attendance response to a MatchResult
 *
 *   2xx success:true   -> candidate
 *   2xx success:false  -> no-match (error text)
 *   404                -> no-match
 *   409                -> GatewayConflict
 *   other 4xx          -> GatewayRejected
 *   5xx / bad body     -> GatewayNetworkError
 */
MatchResult interpret_match_response(const HttpResponse& response);

/**
 * @brief Map a /api/register response; returns normally on success
 */
void interpret_enroll_response(const HttpResponse& response);

/**
 * @brief libcurl client for the matching service (http or https)
 *
 * One easy handle per request. Certificate and host name are verified
 * for https.
 */
class HttpGateway : public MatchGateway, public EnrollmentStore {
public:
    explicit HttpGateway(const GatewayConfig& config);
    ~HttpGateway() override;

    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;

    MatchResult match(const MatchRequest& request) override;
    bool health() override;
    void enroll(const EnrollmentRequest& request) override;

    const ServiceEndpoint& endpoint() const { return endpoint_; }

private:
    GatewayConfig config_;
    ServiceEndpoint endpoint_;

    std::string url_for(const std::string& path) const;

    /**
     * @throws PresenceError(GatewayNetworkError) on any transport failure
     */
    HttpResponse send_request(const std::string& method, const std::string& path,
                              const std::string& body);
};

} // namespace presence
