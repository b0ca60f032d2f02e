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
 * Bridge Controller - Layer 2 bridge endpoints
 */
class BridgeController : public oatpp::web::server::api::ApiController, public ResponseHelper {
private:
    std::shared_ptr<netprov::services::Reconciler> m_reconciler;
    std::shared_ptr<netprov::services::StatusProjector> m_projector;

public:
    BridgeController(const std::shared_ptr<ObjectMapper>& objectMapper,
                       std::shared_ptr<netprov::services::Reconciler> reconciler,
                       std::shared_ptr<netprov::services::StatusProjector> projector)
        : oatpp::web::server::api::ApiController(objectMapper)
        , m_reconciler(reconciler)
        , m_projector(projector) {}

    static std::shared_ptr<BridgeController> createShared(
        const std::shared_ptr<ObjectMapper>& objectMapper,
        std::shared_ptr<netprov::services::Reconciler> reconciler,
        std::shared_ptr<netprov::services::StatusProjector> projector
    ) {
        return std::make_shared<BridgeController>(objectMapper, reconciler, projector);
    }

    ENDPOINT_INFO(getBridges) {
        info->summary = "List bridges";
        info->description = "Stored bridges merged with their live link state";
        info->addResponse<Object<BridgeListDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addTag("Bridge");
    }
    ENDPOINT("GET", "/api/bridge", getBridges) {
        return respond("GET /api/bridge", this, [&] {
            auto dto = BridgeListDto::createShared();
            dto->bridges = oatpp::Vector<Object<BridgeDto>>::createShared();
            for (const auto& status : m_projector->bridges()) {
                dto->bridges->push_back(netprov::api::toDto(status));
            }
            return createDtoResponseWithCors(Status::CODE_200, dto, this);
        });
    }

    ENDPOINT_INFO(createBridge) {
        info->summary = "Create a bridge";
        info->description = "Create the bridge, enslave its members and bring it up";
        info->addConsumes<Object<BridgeRequestDto>>("application/json");
        info->addResponse<Object<BridgeDto>>(Status::CODE_201, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_400, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
        info->addTag("Bridge");
    }
    ENDPOINT("POST", "/api/bridge", createBridge,
             BODY_STRING(String, body)) {
        return respond("POST /api/bridge", this, [&] {
            auto request = netprov::api::fromRequest(parseBody<BridgeRequestDto>(body, this));
            auto created = m_reconciler->create(request);
            return createDtoResponseWithCors(Status::CODE_201, netprov::api::toCreatedDto(created), this);
        });
    }

    ENDPOINT_INFO(deleteBridge) {
        info->summary = "Delete a bridge";
        info->description = "Release the members and delete the bridge link";
        info->addResponse<Object<StatusDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_502, "application/json");
        info->addTag("Bridge");
    }
    ENDPOINT("DELETE", "/api/bridge/{name}", deleteBridge,
             PATH(String, name)) {
        return respond("DELETE /api/bridge", this, [&] {
            auto key = netprov::api::toStdString(name);
            m_reconciler->destroy(netprov::model::ObjectKind::BRIDGE, key);

            auto dto = StatusDto::createShared();
            dto->status = "ok";
            dto->message = ("Bridge " + key + " removed").c_str();
            return createDtoResponseWithCors(Status::CODE_200, dto, this);
        });
    }
};

#include OATPP_CODEGEN_END(ApiController)
