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
 * Hotspot Controller - Captive portal hotspot endpoints
 */
class HotspotController : public oatpp::web::server::api::ApiController, public ResponseHelper {
private:
    std::shared_ptr<netprov::services::Reconciler> m_reconciler;
    std::shared_ptr<netprov::services::StatusProjector> m_projector;

public:
    HotspotController(const std::shared_ptr<ObjectMapper>& objectMapper,
                       std::shared_ptr<netprov::services::Reconciler> reconciler,
                       std::shared_ptr<netprov::services::StatusProjector> projector)
        : oatpp::web::server::api::ApiController(objectMapper)
        , m_reconciler(reconciler)
        , m_projector(projector) {}

    static std::shared_ptr<HotspotController> createShared(
        const std::shared_ptr<ObjectMapper>& objectMapper,
        std::shared_ptr<netprov::services::Reconciler> reconciler,
        std::shared_ptr<netprov::services::StatusProjector> projector
    ) {
        return std::make_shared<HotspotController>(objectMapper, reconciler, projector);
    }

    ENDPOINT_INFO(getHotspots) {
        info->summary = "List hotspots";
        info->description = "Stored hotspots merged with their live interface state";
        info->addResponse<Object<HotspotListDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addTag("Hotspots");
    }
    ENDPOINT("GET", "/api/hotspots", getHotspots) {
        return respond("GET /api/hotspots", this, [&] {
            auto dto = HotspotListDto::createShared();
            dto->hotspots = oatpp::Vector<Object<HotspotDto>>::createShared();
            for (const auto& status : m_projector->hotspots()) {
                dto->hotspots->push_back(netprov::api::toDto(status));
            }
            return createDtoResponseWithCors(Status::CODE_200, dto, this);
        });
    }

    ENDPOINT_INFO(createHotspot) {
        info->summary = "Create a hotspot";
        info->description = "Assign the gateway address, start dnsmasq and install the portal redirect and shaping";
        info->addConsumes<Object<HotspotRequestDto>>("application/json");
        info->addResponse<Object<HotspotDto>>(Status::CODE_201, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_400, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
        info->addTag("Hotspots");
    }
    ENDPOINT("POST", "/api/hotspots", createHotspot,
             BODY_STRING(String, body)) {
        return respond("POST /api/hotspots", this, [&] {
            auto request = netprov::api::fromRequest(parseBody<HotspotRequestDto>(body, this));
            auto created = m_reconciler->create(request);
            return createDtoResponseWithCors(Status::CODE_201, netprov::api::toCreatedDto(created), this);
        });
    }

    ENDPOINT_INFO(deleteHotspot) {
        info->summary = "Delete a hotspot";
        info->description = "Remove shaping, redirect, DHCP server and gateway address";
        info->addResponse<Object<StatusDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
        info->addTag("Hotspots");
    }
    ENDPOINT("DELETE", "/api/hotspots/{interface}", deleteHotspot,
             PATH(String, interface)) {
        return respond("DELETE /api/hotspots", this, [&] {
            auto key = netprov::api::toStdString(interface);
            m_reconciler->destroy(netprov::model::ObjectKind::HOTSPOT, key);

            auto dto = StatusDto::createShared();
            dto->status = "ok";
            dto->message = ("Hotspot on " + key + " removed").c_str();
            return createDtoResponseWithCors(Status::CODE_200, dto, this);
        });
    }
};

#include OATPP_CODEGEN_END(ApiController)
