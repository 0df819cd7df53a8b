#include "MatchGateway.hpp"
#include "PresenceError.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <mutex>

namespace presence {

namespace {

// Identity ids may come back as numbers from some backends
std::string json_to_text(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

std::string error_text(const nlohmann::json& body, const std::string& fallback) {
    if (body.is_object() && body.contains("error")) {
        std::string text = json_to_text(body["error"]);
        if (!text.empty()) return text;
    }
    return fallback;
}

/**
 * @brief JSON body of a 2xx answer; anything unparsable is a transport fault
 */
nlohmann::json parse_success_body(const HttpResponse& response) {
    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw PresenceError(ErrorKind::GatewayNetworkError,
                            "Unparsable response (HTTP " + std::to_string(response.status) + "): " + e.what());
    }
}

/**
 * @brief JSON body of an error answer, or an empty object (HTML error pages)
 */
nlohmann::json parse_error_body(const HttpResponse& response) {
    nlohmann::json body = nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded()) {
        return nlohmann::json::object();
    }
    return body;
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

/**
 * @brief The "success" flag; absent counts as the given default
 * @throws PresenceError(GatewayNetworkError) if it is not a boolean
 */
bool read_success(const nlohmann::json& body, bool absent_value) {
    if (!body.is_object() || !body.contains("success")) {
        return absent_value;
    }
    const nlohmann::json& flag = body.at("success");
    if (!flag.is_boolean()) {
        throw PresenceError(ErrorKind::GatewayNetworkError,
                            "Malformed response: 'success' is " + std::string(flag.type_name()));
    }
    return flag.get<bool>();
}

size_t curl_write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::once_flag curl_init_flag;

/**
 * @brief Shared non-2xx handling for both endpoints (404 is left to the caller)
 */
void raise_for_status(const HttpResponse& response, const nlohmann::json& body) {
    const int status = response.status;

    if (status >= 500) {
        throw PresenceError(ErrorKind::GatewayNetworkError,
                            "Matching service error (HTTP " + std::to_string(status) + "): " +
                            error_text(body, "server error"));
    }

    if (status == 409) {
        const std::string text = error_text(body, "Conflict");
        std::string existing_user = body.is_object() ? json_to_text(body.value("existingUser", nlohmann::json())) : "";
        std::string existing_id = body.is_object() ? json_to_text(body.value("existingUserId", nlohmann::json())) : "";

        if (text == "User ID already taken") {
            throw PresenceError(ConflictKind::DuplicateIdentity, text, existing_user);
        }
        if (text == "Face already registered") {
            std::string owner = existing_user;
            if (!existing_id.empty()) {
                owner = owner.empty() ? existing_id : owner + " (" + existing_id + ")";
            }
            throw PresenceError(ConflictKind::DuplicateFace, text, owner);
        }
        throw PresenceError(ConflictKind::Other, text, existing_user);
    }

    if (status >= 400) {
        throw PresenceError(ErrorKind::GatewayRejected,
                            "Request rejected (HTTP " + std::to_string(status) + "): " +
                            error_text(body, "rejected"));
    }

    if (status < 200 || status >= 300) {
        throw PresenceError(ErrorKind::GatewayNetworkError,
                            "Unexpected HTTP status " + std::to_string(status));
    }
}

} // namespace

// ============================================================================
// Wire format
// ============================================================================

ServiceEndpoint parse_base_url(const std::string& url) {
    ServiceEndpoint ep;
    std::string rest;

    if (url.rfind("https://", 0) == 0) {
        ep.tls = true;
        ep.port = 443;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        rest = url.substr(7);
    } else {
        throw PresenceError(ErrorKind::InvalidInput, "gateway.base_url must start with http:// or https://");
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        ep.path_prefix = rest.substr(slash);
        while (!ep.path_prefix.empty() && ep.path_prefix.back() == '/') {
            ep.path_prefix.pop_back();
        }
    }

    size_t colon = authority.find(':');
    if (colon != std::string::npos) {
        const std::string port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        try {
            ep.port = std::stoi(port);
        } catch (const std::exception&) {
            throw PresenceError(ErrorKind::InvalidInput, "Invalid port in gateway.base_url: " + port);
        }
        if (ep.port <= 0 || ep.port > 65535) {
            throw PresenceError(ErrorKind::InvalidInput, "Invalid port in gateway.base_url: " + port);
        }
    }

    if (authority.empty()) {
        throw PresenceError(ErrorKind::InvalidInput, "gateway.base_url has no host");
    }
    ep.host = authority;
    return ep;
}

std::string build_match_body(const MatchRequest& request) {
    nlohmann::json body = {
        {"embedding", request.descriptor},
        {"livenessScore", request.liveness_score}
    };
    return body.dump();
}

std::string build_enroll_body(const EnrollmentRequest& request) {
    nlohmann::json body = {
        {"userId", request.identity_id},
        {"name", request.display_name},
        {"embedding", request.descriptor}
    };
    return body.dump();
}

MatchResult interpret_match_response(const HttpResponse& response) {
    MatchResult result;

    if (response.status == 404) {
        result.no_match_reason = error_text(parse_error_body(response), "No match found");
        return result;
    }

    if (!is_success_status(response.status)) {
        raise_for_status(response, parse_error_body(response));
    }

    nlohmann::json body = parse_success_body(response);
    if (!read_success(body, false)) {
        result.no_match_reason = error_text(body, "No match found");
        return result;
    }

    try {
        MatchCandidate candidate;
        candidate.identity_id = json_to_text(body.at("userId"));
        candidate.display_name = json_to_text(body.value("name", nlohmann::json()));
        candidate.confidence = body.value("confidence", 0.0f);
        candidate.distance = body.value("distance", 0.0f);

        if (candidate.identity_id.empty()) {
            throw PresenceError(ErrorKind::GatewayNetworkError, "Match response without userId");
        }
        candidate.confidence = std::max(0.0f, std::min(1.0f, candidate.confidence));
        candidate.distance = std::max(0.0f, candidate.distance);
        result.candidate = candidate;
    } catch (const nlohmann::json::exception& e) {
        throw PresenceError(ErrorKind::GatewayNetworkError, std::string("Malformed match response: ") + e.what());
    }
    return result;
}

void interpret_enroll_response(const HttpResponse& response) {
    if (response.status == 404) {
        throw PresenceError(ErrorKind::GatewayRejected, "Registration endpoint not found (HTTP 404)");
    }

    if (!is_success_status(response.status)) {
        raise_for_status(response, parse_error_body(response));
    }

    nlohmann::json body = parse_success_body(response);
    if (!read_success(body, true)) {
        throw PresenceError(ErrorKind::GatewayRejected, error_text(body, "Registration failed"));
    }
}

// ============================================================================
// HttpGateway
// ============================================================================

HttpGateway::HttpGateway(const GatewayConfig& config)
    : config_(config), endpoint_(parse_base_url(config.base_url)) {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    std::cout << "[Gateway] Matching service at " << (endpoint_.tls ? "https://" : "http://")
              << endpoint_.host << ":" << endpoint_.port << endpoint_.path_prefix << std::endl;
}

HttpGateway::~HttpGateway() = default;

std::string HttpGateway::url_for(const std::string& path) const {
    return std::string(endpoint_.tls ? "https://" : "http://") + endpoint_.host + ":" +
           std::to_string(endpoint_.port) + endpoint_.path_prefix + path;
}

HttpResponse HttpGateway::send_request(const std::string& method, const std::string& path,
                                       const std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw PresenceError(ErrorKind::GatewayNetworkError, "Failed to initialize CURL");
    }

    const std::string url = url_for(path);
    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    // Set headers
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (method == "POST") {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }
    const std::string auth = "Authorization: Bearer " + config_.token;
    if (!config_.token.empty()) {
        headers = curl_slist_append(headers, auth.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw PresenceError(ErrorKind::GatewayNetworkError,
                            method + " " + url + " failed: " + curl_easy_strerror(res));
    }

    std::cout << "[Gateway] " << method << " " << endpoint_.path_prefix << path << " -> " << status << std::endl;

    HttpResponse response;
    response.status = static_cast<int>(status);
    response.body = std::move(response_body);
    return response;
}

MatchResult HttpGateway::match(const MatchRequest& request) {
    std::cout << "📤 [Gateway] Matching descriptor (" << request.descriptor.size() << " dims, liveness "
              << request.liveness_score << ")" << std::endl;

    MatchResult result = interpret_match_response(
        send_request("POST", "/api/mark-attendance", build_match_body(request)));

    if (result.matched()) {
        std::cout << "✅ [Gateway] Candidate " << result.candidate->display_name << " ("
                  << result.candidate->identity_id << "), confidence " << result.candidate->confidence
                  << std::endl;
    } else {
        std::cout << "⚠ [Gateway] No match: " << result.no_match_reason << std::endl;
    }
    return result;
}

void HttpGateway::enroll(const EnrollmentRequest& request) {
    std::cout << "📤 [Gateway] Registering " << request.identity_id << " (" << request.display_name << ")"
              << std::endl;
    interpret_enroll_response(send_request("POST", "/api/register", build_enroll_body(request)));
    std::cout << "✅ [Gateway] Registered " << request.identity_id << std::endl;
}

bool HttpGateway::health() {
    try {
        HttpResponse response = send_request("GET", "/api/health", "");
        return is_success_status(response.status);
    } catch (const PresenceError& e) {
        std::cerr << "⚠ [Gateway] Health check failed: " << e.what() << std::endl;
        return false;
    }
}

} // namespace presence
