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
 * VLAN Controller - 802.1Q sub-interface endpoints
 */
class VlanController : public oatpp::web::server::api::ApiController, public ResponseHelper {
private:
    std::shared_ptr<netprov::services::Reconciler> m_reconciler;
    std::shared_ptr<netprov::services::StatusProjector> m_projector;

public:
    VlanController(const std::shared_ptr<ObjectMapper>& objectMapper,
                       std::shared_ptr<netprov::services::Reconciler> reconciler,
                       std::shared_ptr<netprov::services::StatusProjector> projector)
        : oatpp::web::server::api::ApiController(objectMapper)
        , m_reconciler(reconciler)
        , m_projector(projector) {}

    static std::shared_ptr<VlanController> createShared(
        const std::shared_ptr<ObjectMapper>& objectMapper,
        std::shared_ptr<netprov::services::Reconciler> reconciler,
        std::shared_ptr<netprov::services::StatusProjector> projector
    ) {
        return std::make_shared<VlanController>(objectMapper, reconciler, projector);
    }

    ENDPOINT_INFO(getVlans) {
        info->summary = "List VLANs";
        info->description = "Stored VLANs merged with their live link state";
        info->addResponse<Object<VlanListDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addTag("VLAN");
    }
    ENDPOINT("GET", "/api/vlan", getVlans) {
        return respond("GET /api/vlan", this, [&] {
            auto dto = VlanListDto::createShared();
            dto->vlans = oatpp::Vector<Object<VlanDto>>::createShared();
            for (const auto& status : m_projector->vlans()) {
                dto->vlans->push_back(netprov::api::toDto(status));
            }
            return createDtoResponseWithCors(Status::CODE_200, dto, this);
        });
    }

    ENDPOINT_INFO(createVlan) {
        info->summary = "Create a VLAN";
        info->description = "Create the tagged link <parent>.<id> and bring it up; the name is derived";
        info->addConsumes<Object<VlanRequestDto>>("application/json");
        info->addResponse<Object<VlanDto>>(Status::CODE_201, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_400, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
        info->addTag("VLAN");
    }
    ENDPOINT("POST", "/api/vlan", createVlan,
             BODY_STRING(String, body)) {
        return respond("POST /api/vlan", this, [&] {
            auto request = netprov::api::fromRequest(parseBody<VlanRequestDto>(body, this));
            auto created = m_reconciler->create(request);
            return createDtoResponseWithCors(Status::CODE_201, netprov::api::toCreatedDto(created), this);
        });
    }

    ENDPOINT_INFO(deleteVlan) {
        info->summary = "Delete a VLAN";
        info->description = "Delete the VLAN link; refused while hotspots, access points or bridges use it";
        info->addResponse<Object<StatusDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
        info->addTag("VLAN");
    }
    ENDPOINT("DELETE", "/api/vlan/{name}", deleteVlan,
             PATH(String, name)) {
        return respond("DELETE /api/vlan", this, [&] {
            auto key = netprov::api::toStdString(name);
            m_reconciler->destroy(netprov::model::ObjectKind::VLAN, key);

            auto dto = StatusDto::createShared();
            dto->status = "ok";
            dto->message = ("VLAN " + key + " removed").c_str();
            return createDtoResponseWithCors(Status::CODE_200, dto, this);
        });
    }
};

#include OATPP_CODEGEN_END(ApiController)
