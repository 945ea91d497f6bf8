//
// Created by lewis on 3/11/20.
//

#ifndef DOCCONV_SERVER_HTTPUTILS_H
#define DOCCONV_SERVER_HTTPUTILS_H

#include "../Lib/Errors.h"
#include "HttpServer.h"
#include <exception>
#include <string>
#include <vector>

auto getHeader(SimpleWeb::CaseInsensitiveMultimap& headers, const std::string &header) -> std::string;
auto getQueryParamAsString(SimpleWeb::CaseInsensitiveMultimap& query_fields, const std::string& what) -> std::string;

// Parses the request body as a JSON object. An empty body is an empty object.
auto readJsonBody(const std::shared_ptr<HttpServerImpl::Request>& request) -> nlohmann::json;

// Reads an optional string field. Numbers are accepted and converted, anything else is a validation error.
auto getJsonString(const nlohmann::json& body, const std::string& field) -> std::string;

// Reads an optional numeric field that may also be sent as a numeric string
auto getJsonNumber(const nlohmann::json& body, const std::string& field, double defaultValue) -> double;

// Reads an optional list that may be a JSON array of strings or a comma separated string. Blank items are dropped.
auto getJsonStringList(const nlohmann::json& body, const std::string& field) -> std::vector<std::string>;

// Maps an error kind to the HTTP status reported to the client
auto statusForError(const eServiceError& error) -> SimpleWeb::StatusCode;

void writeJsonResponse(const std::shared_ptr<HttpServerImpl::Response>& response,
                       SimpleWeb::StatusCode status, const nlohmann::json& body);

// Logs the exception and writes the structured {"error", "code"} body with the matching status
void writeErrorResponse(const std::shared_ptr<HttpServerImpl::Response>& response, std::exception& exception);

// Answers GET on an operation path with a usage hint instead of doing any work
void writeUsageHint(const std::shared_ptr<HttpServerImpl::Response>& response, const std::string& message);

#endif //DOCCONV_SERVER_HTTPUTILS_H
