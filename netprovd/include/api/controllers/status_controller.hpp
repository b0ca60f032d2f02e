#pragma once

#include "oatpp/web/server/api/ApiController.hpp"
#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/macro/component.hpp"
#include "api/dto.hpp"
#include "api/controllers/response_helper.hpp"
#include "services/progress_channel.hpp"
#include "services/reconciler.hpp"
#include "services/status_projector.hpp"
#include <chrono>
#include <cstdlib>

#include OATPP_CODEGEN_BEGIN(ApiController)

/**
 * Status Controller
 * Engine overview, progress events and the forget escape hatch for degraded objects
 */
class StatusController : public oatpp::web::server::api::ApiController, public ResponseHelper {
private:
  std::chrono::steady_clock::time_point m_startTime;
  std::shared_ptr<netprov::services::Reconciler> m_reconciler;
  std::shared_ptr<netprov::services::StatusProjector> m_projector;
  std::shared_ptr<netprov::services::ProgressChannel> m_progress;

public:
  StatusController(const std::shared_ptr<ObjectMapper>& objectMapper,
          std::shared_ptr<netprov::services::Reconciler> reconciler,
          std::shared_ptr<netprov::services::StatusProjector> projector,
          std::shared_ptr<netprov::services::ProgressChannel> progress)
    : oatpp::web::server::api::ApiController(objectMapper)
    , m_startTime(std::chrono::steady_clock::now())
    , m_reconciler(reconciler)
    , m_projector(projector)
    , m_progress(progress) {}

  static std::shared_ptr<StatusController> createShared(
    const std::shared_ptr<ObjectMapper>& objectMapper,
    std::shared_ptr<netprov::services::Reconciler> reconciler,
    std::shared_ptr<netprov::services::StatusProjector> projector,
    std::shared_ptr<netprov::services::ProgressChannel> progress
  ) {
    return std::make_shared<StatusController>(objectMapper, reconciler, projector, progress);
  }

  // GET /api/status
  ENDPOINT_INFO(getStatus) {
    info->summary = "Get engine status";
    info->description = "Object counts per kind, live interface totals and the list of degraded objects";
    info->addResponse<Object<StatusOverviewDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_500, "application/json");
    info->addTag("Status");
  }
  ENDPOINT("GET", "/api/status", getStatus) {
    return respond("GET /api/status", this, [&] {
      auto dto = netprov::api::toDto(m_projector->overview());
      auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - m_startTime);
      dto->uptime = static_cast<v_int64>(uptime.count());
      return createDtoResponseWithCors(Status::CODE_200, dto, this);
    });
  }

  // GET /api/events?since=N
  ENDPOINT_INFO(getEvents) {
    info->summary = "Poll progress events";
    info->description = "Retained progress events with a sequence number greater than 'since' (default 0)";
    info->queryParams.add<String>("since").required = false;
    info->addResponse<Object<EventListDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_400, "application/json");
    info->addTag("Status");
  }
  ENDPOINT("GET", "/api/events", getEvents, REQUEST(std::shared_ptr<IncomingRequest>, request)) {
    return respond("GET /api/events", this, [&] {
      uint64_t since = 0;
      auto sinceParam = request->getQueryParameter("since");
      if (sinceParam && !sinceParam->empty()) {
        char* end = nullptr;
        since = std::strtoull(sinceParam->c_str(), &end, 10);
        if (*end != '\0' || sinceParam->front() == '-') {
          throw netprov::api::MalformedRequest("'since' must be a non-negative integer");
        }
      }

      auto dto = EventListDto::createShared();
      dto->events = oatpp::Vector<Object<EventDto>>::createShared();
      for (const auto& event : m_progress->since(since)) {
        dto->events->push_back(netprov::api::toDto(event));
      }
      dto->last_sequence = static_cast<v_uint64>(m_progress->last_sequence());
      return createDtoResponseWithCors(Status::CODE_200, dto, this);
    });
  }

  // POST /api/forget/{kind}/{key}
  ENDPOINT_INFO(forgetObject) {
    info->summary = "Forget a degraded object";
    info->description = "Drop a stored object whose interface is gone, without touching the host";
    info->addResponse<Object<StatusDto>>(Status::CODE_200, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_400, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_404, "application/json");
    info->addResponse<Object<ErrorDto>>(Status::CODE_409, "application/json");
    info->addTag("Status");
  }
  ENDPOINT("POST", "/api/forget/{kind}/{key}", forgetObject,
           PATH(String, kind),
           PATH(String, key)) {
    return respond("POST /api/forget", this, [&] {
      auto objectKind = netprov::model::parse_object_kind(netprov::api::toStdString(kind));
      if (!objectKind) {
        throw netprov::api::MalformedRequest("Unknown object kind '" + netprov::api::toStdString(kind) + "'");
      }
      auto objectKey = netprov::api::toStdString(key);
      m_reconciler->forget(*objectKind, objectKey);

      auto dto = StatusDto::createShared();
      dto->status = "ok";
      dto->message = (netprov::model::qualified_key(*objectKind, objectKey) + " forgotten").c_str();
      return createDtoResponseWithCors(Status::CODE_200, dto, this);
    });
  }
};

#include OATPP_CODEGEN_END(ApiController)
