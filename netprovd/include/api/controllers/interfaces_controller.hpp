#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "api/dto.hpp"
#include "api/controllers/response_helper.hpp"
#include "services/status_projector.hpp"

#include OATPP_CODEGEN_BEGIN(ApiController)

/**
 * Interfaces Controller - Live link discovery endpoints
 */
class InterfacesController : public oatpp::web::server::api::ApiController, public ResponseHelper {
private:
    std::shared_ptr<netprov::services::StatusProjector> m_projector;

public:
    InterfacesController(const std::shared_ptr<ObjectMapper>& objectMapper,
                         std::shared_ptr<netprov::services::StatusProjector> projector)
        : oatpp::web::server::api::ApiController(objectMapper)
        , m_projector(projector) {}

    static std::shared_ptr<InterfacesController> createShared(
        const std::shared_ptr<ObjectMapper>& objectMapper,
        std::shared_ptr<netprov::services::StatusProjector> projector
    ) {
        return std::make_shared<InterfacesController>(objectMapper, projector);
    }

    ENDPOINT_INFO(getInterfaces) {
        info->summary = "List network interfaces";
        info->description = "Live links known to the kernel, loopback excluded";
        info->addResponse<Object<InterfaceListDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addTag("Interfaces");
    }
    ENDPOINT("GET", "/api/interfaces", getInterfaces) {
        return respond("GET /api/interfaces", this, [&] {
            return createDtoResponseWithCors(Status::CODE_200, netprov::api::toDto(m_projector->interfaces()), this);
        });
    }

    ENDPOINT_INFO(getInterfaceDiagnostics) {
        info->summary = "List every network interface";
        info->description = "Diagnostics listing, loopback included";
        info->addResponse<Object<InterfaceListDto>>(Status::CODE_200, "application/json");
        info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
        info->addTag("Interfaces");
    }
    ENDPOINT("GET", "/api/interfaces/diagnostics", getInterfaceDiagnostics) {
        return respond("GET /api/interfaces/diagnostics", this, [&] {
            return createDtoResponseWithCors(Status::CODE_200, netprov::api::toDto(m_projector->diagnostics()), this);
        });
    }
};

#include OATPP_CODEGEN_END(ApiController)
