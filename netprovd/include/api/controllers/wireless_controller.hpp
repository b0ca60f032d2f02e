#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "api/dto.hpp"
#include "api/controllers/response_helper.hpp"
#include "services/reconciler.hpp"
#include "services/status_projector.hpp"

#include OATPP_CODEGEN_BEGIN(ApiController)

/**
 * Wireless Controller - Access point provisioning endpoints
 */
class WirelessController : public oatpp::web::server::api::ApiController, public ResponseHelper {
private:
    std::shared_ptr<netprov::services::Reconciler> m_reconciler;
    std::shared_ptr<netprov::services::StatusProjector> m_projector;

public:
    WirelessController(const std::shared_ptr<ObjectMapper>& objectMapper,
                       std::shared_ptr<netprov::services::Reconciler> reconciler,
                       std::shared_ptr<netprov::services::StatusProjector> projector)
        : oatpp::web::server::api::ApiController(objectMapper)
        , m_reconciler(reconciler)
        , m_projector(projector) {}

    static std::shared_ptr<WirelessController> createShared(
        const std::shared_ptr<ObjectMapper>& objectMapper,
        std::shared_ptr<netprov::services::Reconciler> reconciler,
        std::shared_ptr<netprov::services::StatusProjector> projector
    ) {
        return std::make_shared<WirelessController>(objectMapper, reconciler, projector);
    }

    ENDPOINT_INFO(getWireless) {
        info->summary = "List access points";
        info->description = "Stored access point configurations merged with their live interface state";
        info->addResponse<Object<WirelessListDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addTag("Wireless");
    }
    ENDPOINT("GET", "/api/wireless", getWireless) {
        return respond("GET /api/wireless", this, [&] {
            auto dto = WirelessListDto::createShared();
            dto->wireless = oatpp::Vector<Object<WirelessDto>>::createShared();
            for (const auto& status : m_projector->wireless()) {
                dto->wireless->push_back(netprov::api::toDto(status));
            }
            return createDtoResponseWithCors(Status::CODE_200, dto, this);
        });
    }

    ENDPOINT_INFO(createWireless) {
        info->summary = "Create an access point";
        info->description = "Validate, write hostapd configuration and start the access point on a wifi interface";
        info->addConsumes<Object<WirelessRequestDto>>("application/json");
        info->addResponse<Object<WirelessDto>>(Status::CODE_201, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_400, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
        info->addTag("Wireless");
    }
    ENDPOINT("POST", "/api/wireless", createWireless,
             BODY_STRING(String, body)) {
        return respond("POST /api/wireless", this, [&] {
            auto request = netprov::api::fromRequest(parseBody<WirelessRequestDto>(body, this));
            auto created = m_reconciler->create(request);
            return createDtoResponseWithCors(Status::CODE_201, netprov::api::toCreatedDto(created), this);
        });
    }

    ENDPOINT_INFO(deleteWireless) {
        info->summary = "Delete an access point";
        info->description = "Stop hostapd, remove its configuration and restore the interface";
        info->addResponse<Object<StatusDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
        info->addTag("Wireless");
    }
    ENDPOINT("DELETE", "/api/wireless/{interface}", deleteWireless,
             PATH(String, interface)) {
        return respond("DELETE /api/wireless", this, [&] {
            auto key = netprov::api::toStdString(interface);
            m_reconciler->destroy(netprov::model::ObjectKind::WIRELESS, key);

            auto dto = StatusDto::createShared();
            dto->status = "ok";
            dto->message = ("Access point on " + key + " removed").c_str();
            return createDtoResponseWithCors(Status::CODE_200, dto, this);
        });
    }
};

#include OATPP_CODEGEN_END(ApiController)
