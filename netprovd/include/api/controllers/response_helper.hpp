#pragma once

#include "oatpp/web/server/api/ApiController.hpp"

#include "api/dto.hpp"
#include "api/dto_mapping.hpp"
#include "core/errors.hpp"

#include <cstdio>

/**
 * Response Helper Mixin
 * Add this as a base class to any controller that maps engine errors onto
 * HTTP responses.
 */
class ResponseHelper {
protected:
    // Helper to add CORS headers to any response
    template<class DtoType>
    std::shared_ptr<oatpp::web::protocol::http::outgoing::Response> createDtoResponseWithCors(
        const oatpp::web::protocol::http::Status& status,
        const DtoType& dto,
        oatpp::web::server::api::ApiController* controller)
    {
        auto response = controller->createDtoResponse(status, dto);
        response->putHeader("Access-Control-Allow-Origin", "*");
        response->putHeader("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        response->putHeader("Access-Control-Allow-Headers", "Content-Type");
        response->putHeader("Connection", "close");
        return response;
    }

    // Map a raw JSON body onto a request DTO; anything unreadable is a 400
    template<class DtoType>
    oatpp::Object<DtoType> parseBody(const oatpp::String& body, oatpp::web::server::api::ApiController* controller) {
        if (!body || body->empty()) {
            throw netprov::api::MalformedRequest("Request body is empty");
        }
        oatpp::Object<DtoType> dto;
        try {
            dto = controller->getDefaultObjectMapper()->readFromString<oatpp::Object<DtoType>>(body);
        } catch (const std::exception& e) {
            throw netprov::api::MalformedRequest(std::string("Malformed JSON body: ") + e.what());
        }
        if (!dto) {
            throw netprov::api::MalformedRequest("Request body must be a JSON object");
        }
        return dto;
    }

    // Run an endpoint body and turn engine errors into structured error responses
    template<class Handler>
    std::shared_ptr<oatpp::web::protocol::http::outgoing::Response> respond(const char* route, oatpp::web::server::api::ApiController* controller, Handler&& handler) {
        try {
            return handler();
        } catch (const netprov::api::MalformedRequest& e) {
            printf("[API] %s - bad request: %s\n", route, e.what());
            fflush(stdout);
            return createDtoResponseWithCors(oatpp::web::protocol::http::Status::CODE_400,
                                             netprov::api::toErrorDto("MalformedRequest", e.what()), controller);
        } catch (const netprov::core::ProvisionError& e) {
            printf("[API] %s - %s: %s\n", route, netprov::core::to_string(e.error_kind()).c_str(), e.what());
            fflush(stdout);
            return createDtoResponseWithCors(netprov::api::httpStatusFor(e), netprov::api::toErrorDto(e), controller);
        } catch (const std::exception& e) {
            printf("[API] %s - internal error: %s\n", route, e.what());
            fflush(stdout);
            return createDtoResponseWithCors(oatpp::web::protocol::http::Status::CODE_500,
                                             netprov::api::toErrorDto("InternalError", e.what()), controller);
        }
    }
};
