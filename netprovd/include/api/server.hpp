#pragma once

#include "oatpp/web/server/HttpConnectionHandler.hpp"
#include "oatpp/web/server/HttpRouter.hpp"
#include "oatpp/network/tcp/server/ConnectionProvider.hpp"
#include "oatpp/network/Server.hpp"
#include "oatpp/parser/json/mapping/ObjectMapper.hpp"
#include "oatpp-swagger/Controller.hpp"
#include "oatpp-swagger/Resources.hpp"
#include "api/controllers/interfaces_controller.hpp"
#include "api/controllers/wireless_controller.hpp"
#include "api/controllers/hotspot_controller.hpp"
#include "api/controllers/vlan_controller.hpp"
#include "api/controllers/bridge_controller.hpp"
#include "api/controllers/status_controller.hpp"
#include "services/progress_channel.hpp"
#include "services/reconciler.hpp"
#include "services/status_projector.hpp"
#include <memory>
#include <thread>
#include <chrono>
#include <vector>
#include <atomic>

class ApiServer {
private:
  std::shared_ptr<oatpp::network::tcp::server::ConnectionProvider> m_connectionProvider;
  std::shared_ptr<oatpp::web::server::HttpConnectionHandler> m_connectionHandler;
  std::vector<std::thread> m_workerThreads;
  std::atomic<bool> m_running;
  std::shared_ptr<netprov::services::Reconciler> m_reconciler;
  std::shared_ptr<netprov::services::StatusProjector> m_projector;
  std::shared_ptr<netprov::services::ProgressChannel> m_progress;
  static constexpr size_t NUM_WORKER_THREADS = 4;

public:
  ApiServer(std::shared_ptr<netprov::services::Reconciler> reconciler,
            std::shared_ptr<netprov::services::StatusProjector> projector,
            std::shared_ptr<netprov::services::ProgressChannel> progress)
    : m_running(false), m_reconciler(reconciler), m_projector(projector), m_progress(progress) {}

  ~ApiServer() {
    stop();
  }

  void start(const std::string& host = "0.0.0.0", uint16_t port = 8090) {
    if (m_running.exchange(true)) {
      return;
    }

    // Create ObjectMapper
    auto objectMapper = oatpp::parser::json::mapping::ObjectMapper::createShared();

    // Create Router
    auto router = oatpp::web::server::HttpRouter::createShared();

    // Create API Controllers
    auto interfacesController = InterfacesController::createShared(objectMapper, m_projector);
    router->addController(interfacesController);

    auto wirelessController = WirelessController::createShared(objectMapper, m_reconciler, m_projector);
    router->addController(wirelessController);

    auto hotspotController = HotspotController::createShared(objectMapper, m_reconciler, m_projector);
    router->addController(hotspotController);

    auto vlanController = VlanController::createShared(objectMapper, m_reconciler, m_projector);
    router->addController(vlanController);

    auto bridgeController = BridgeController::createShared(objectMapper, m_reconciler, m_projector);
    router->addController(bridgeController);

    auto statusController = StatusController::createShared(objectMapper, m_reconciler, m_projector, m_progress);
    router->addController(statusController);

    // Create Swagger documentation info
    auto docInfo = oatpp::swagger::DocumentInfo::createShared();
    docInfo->header = oatpp::swagger::DocumentHeader::createShared();
    docInfo->header->title = "Network Provisioning Engine API";
    docInfo->header->description = "Access points, hotspots, VLANs and bridges on a Linux host";
    docInfo->header->version = "1.0.0";

    // Create Swagger UI controller with embedded resources
    #ifdef OATPP_SWAGGER_RES_PATH
    auto swaggerResources = oatpp::swagger::Resources::streamResources(OATPP_SWAGGER_RES_PATH);
    #else
    auto swaggerResources = oatpp::swagger::Resources::streamResources(nullptr);
    #endif

    // Combine endpoints from all controllers for Swagger
    auto apiEndpoints = interfacesController->getEndpoints();
    apiEndpoints.append(wirelessController->getEndpoints());
    apiEndpoints.append(hotspotController->getEndpoints());
    apiEndpoints.append(vlanController->getEndpoints());
    apiEndpoints.append(bridgeController->getEndpoints());
    apiEndpoints.append(statusController->getEndpoints());

    auto swaggerController = oatpp::swagger::Controller::createShared(
      apiEndpoints,
      docInfo,
      swaggerResources
    );
    router->addController(swaggerController);

    // Create connection provider
    m_connectionProvider = oatpp::network::tcp::server::ConnectionProvider::createShared(
      {host, port, oatpp::network::Address::IP_4}
    );

    m_connectionHandler = oatpp::web::server::HttpConnectionHandler::createShared(router);

    printf("[API] HTTP Server starting on http://%s:%d\n", host.c_str(), port);
    printf("[API] API endpoints: http://%s:%d/api/*\n", host.c_str(), port);
    printf("[API] Swagger UI: http://%s:%d/swagger/ui\n", host.c_str(), port);
    printf("[API] OpenAPI JSON: http://%s:%d/api-docs/oas-3.0.0.json\n", host.c_str(), port);

    // Provisioning calls block on external commands, so several workers
    // keep reads responsive while an apply is running
    for (size_t i = 0; i < NUM_WORKER_THREADS; ++i) {
      m_workerThreads.emplace_back([this]() {
        while (m_running) {
          auto connection = m_connectionProvider->get();
          if (connection) {
            m_connectionHandler->handleConnection(connection, nullptr);
          } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
          }
        }
      });
    }

    printf("[API] HTTP Server started with %zu worker threads\n", NUM_WORKER_THREADS);
  }

  void stop() {
    if (m_running.exchange(false)) {
      // Stop accepting new connections
      if (m_connectionProvider) {
        m_connectionProvider->stop();
      }

      for (auto& thread : m_workerThreads) {
        if (thread.joinable()) {
          thread.join();
        }
      }
      m_workerThreads.clear();

      printf("[API] HTTP Server stopped\n");
    }
  }

  bool isRunning() const {
    return m_running;
  }
};
