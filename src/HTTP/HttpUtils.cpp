//
// Created by lewis on 3/11/20.
//

#include "HttpUtils.h"
#include "../Lib/Errors.h"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

auto getHeader(SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string {
    // Header names are case-insensitive
    auto ptr = headers.find(header);
    if (ptr != headers.end()) {
        return ptr->second;
    }

    // Return an empty string
    return {};
}

auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap &query_fields, const std::string& what) -> std::string {
    auto ptr = query_fields.find(what);
    std::string result;
    if (ptr != query_fields.end()) {
        result = ptr->second;
    }
    return result;
}

auto readJsonBody(const std::shared_ptr<HttpServerImpl::Request>& request) -> nlohmann::json {
    auto content = request->content.string();
    if (content.empty()) {
        return nlohmann::json::object();
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(content);
    } catch (nlohmann::json::parse_error& exception) {
        throw eValidationError(std::string("Request body is not valid JSON: ") + exception.what());
    }

    if (!body.is_object()) {
        throw eValidationError("Request body must be a JSON object");
    }

    return body;
}

auto getJsonString(const nlohmann::json& body, const std::string& field) -> std::string {
    if (!body.contains(field) || body[field].is_null()) {
        return {};
    }

    const auto& value = body[field];
    if (value.is_string()) {
        return value.get<std::string>();
    }

    if (value.is_number()) {
        return value.dump();
    }

    throw eValidationError(field + " must be a string");
}

auto getJsonNumber(const nlohmann::json& body, const std::string& field, double defaultValue) -> double {
    if (!body.contains(field) || body[field].is_null()) {
        return defaultValue;
    }

    const auto& value = body[field];
    if (value.is_number()) {
        return value.get<double>();
    }

    if (value.is_string()) {
        auto text = boost::algorithm::trim_copy(value.get<std::string>());
        if (text.empty()) {
            return defaultValue;
        }

        try {
            std::size_t consumed = 0;
            auto number = std::stod(text, &consumed);
            if (consumed == text.size()) {
                return number;
            }
        } catch (std::logic_error&) {
            // Reported below
        }
    }

    throw eValidationError(field + " must be a number");
}

auto getJsonStringList(const nlohmann::json& body, const std::string& field) -> std::vector<std::string> {
    std::vector<std::string> result;
    if (!body.contains(field) || body[field].is_null()) {
        return result;
    }

    std::vector<std::string> items;
    const auto& value = body[field];
    if (value.is_string()) {
        auto text = value.get<std::string>();
        boost::split(items, text, boost::is_any_of(","));
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw eValidationError(field + " must only contain strings");
            }
            items.push_back(item.get<std::string>());
        }
    } else {
        throw eValidationError(field + " must be a string or an array of strings");
    }

    for (auto& item : items) {
        boost::algorithm::trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

auto statusForError(const eServiceError& error) -> SimpleWeb::StatusCode {
    switch (error.kind()) {
        case eErrorKind::validation:
        case eErrorKind::missingArtifact:
        case eErrorKind::noChunks:
            return SimpleWeb::StatusCode::client_error_bad_request;
        case eErrorKind::sessionState:
            return SimpleWeb::StatusCode::client_error_conflict;
        case eErrorKind::storage:
        case eErrorKind::unavailable:
        case eErrorKind::rasterization:
        case eErrorKind::conversion:
        case eErrorKind::spawn:
            return SimpleWeb::StatusCode::server_error_internal_server_error;
    }
    return SimpleWeb::StatusCode::server_error_internal_server_error;
}

void writeJsonResponse(const std::shared_ptr<HttpServerImpl::Response>& response,
                       SimpleWeb::StatusCode status, const nlohmann::json& body) {
    SimpleWeb::CaseInsensitiveMultimap headers;
    headers.emplace("Content-Type", "application/json");

    // Messages can echo caller input, which is not guaranteed to be valid UTF-8
    response->write(status, body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), headers);
}

void writeErrorResponse(const std::shared_ptr<HttpServerImpl::Response>& response, std::exception& exception) {
    dumpExceptions(exception);

    nlohmann::json result;
    auto status = SimpleWeb::StatusCode::server_error_internal_server_error;

    if (auto* serviceError = dynamic_cast<eServiceError*>(&exception)) {
        status = statusForError(*serviceError);
        result["error"] = serviceError->what();
        result["code"] = serviceError->code();
    } else {
        // Details of unexpected failures stay in the log
        result["error"] = "Internal server error";
        result["code"] = "InternalError";
    }

    writeJsonResponse(response, status, result);
}

void writeUsageHint(const std::shared_ptr<HttpServerImpl::Response>& response, const std::string& message) {
    nlohmann::json result;
    result["ok"] = true;
    result["message"] = message;

    writeJsonResponse(response, SimpleWeb::StatusCode::success_ok, result);
}
