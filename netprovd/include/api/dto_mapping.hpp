#pragma once

#include "oatpp/web/protocol/http/Http.hpp"

#include "api/dto.hpp"
#include "core/errors.hpp"
#include "model/network_objects.hpp"
#include "services/progress_channel.hpp"
#include "services/status_projector.hpp"

#include <stdexcept>
#include <string>

namespace netprov {
namespace api {

/**
 * Request body failed to map onto a typed record; reported as 400
 */
class MalformedRequest : public std::runtime_error {
public:
    explicit MalformedRequest(const std::string& message) : std::runtime_error(message) {}
};

inline std::string toStdString(const oatpp::String& value) {
    return value ? std::string(value->c_str()) : std::string();
}

inline oatpp::String optionalString(const std::optional<std::string>& value) {
    return value ? oatpp::String(value->c_str()) : oatpp::String(nullptr);
}

inline oatpp::Vector<oatpp::String> toStringVector(const std::vector<std::string>& values) {
    auto out = oatpp::Vector<oatpp::String>::createShared();
    for (const auto& value : values) {
        out->push_back(value.c_str());
    }
    return out;
}

inline void requireField(bool present, const char* name) {
    if (!present) {
        throw MalformedRequest(std::string("Missing required field '") + name + "'");
    }
}

// Live link state rendered for an object: "degraded", "missing", "up" or "down"
template<typename Config>
std::string objectStatus(const services::ObjectStatus<Config>& status) {
    if (status.degraded) {
        return "degraded";
    }
    if (!status.live) {
        return "missing";
    }
    return model::to_string(status.live->status);
}

inline oatpp::Object<InterfaceDto> toDto(const model::Interface& link) {
    auto dto = InterfaceDto::createShared();
    dto->name = link.name.c_str();
    dto->type = model::to_string(link.type).c_str();
    dto->status = model::to_string(link.status).c_str();
    dto->ip = optionalString(link.ip);
    dto->mac = link.mac.c_str();
    dto->master = optionalString(link.master);
    return dto;
}

inline oatpp::Object<InterfaceListDto> toDto(const std::vector<model::Interface>& links) {
    auto dto = InterfaceListDto::createShared();
    dto->interfaces = oatpp::Vector<oatpp::Object<InterfaceDto>>::createShared();
    for (const auto& link : links) {
        dto->interfaces->push_back(toDto(link));
    }
    return dto;
}

// Requests

inline model::WirelessConfig fromRequest(const oatpp::Object<WirelessRequestDto>& body) {
    requireField(body->interface != nullptr, "interface");
    requireField(body->ssid != nullptr, "ssid");

    model::WirelessConfig config;
    config.interface = toStdString(body->interface);
    config.ssid = toStdString(body->ssid);
    config.password = toStdString(body->password);
    if (body->channel) {
        config.channel = *body->channel;
    }
    if (body->hw_mode) {
        config.hw_mode = toStdString(body->hw_mode);
    }
    config.bridge = toStdString(body->bridge);
    return config;
}

inline model::HotspotInstance fromRequest(const oatpp::Object<HotspotRequestDto>& body) {
    requireField(body->interface != nullptr, "interface");
    requireField(body->ip_address != nullptr, "ip_address");
    requireField(body->dhcp_range != nullptr, "dhcp_range");

    auto range = model::DhcpRange::parse(toStdString(body->dhcp_range));
    if (!range) {
        throw MalformedRequest("dhcp_range must be written 'low,high'");
    }

    model::HotspotInstance hotspot;
    hotspot.interface = toStdString(body->interface);
    hotspot.ip_address = toStdString(body->ip_address);
    hotspot.dhcp_range = *range;
    if (body->bandwidth_limit) {
        hotspot.bandwidth_limit = *body->bandwidth_limit;
    }
    if (body->enabled) {
        hotspot.enabled = *body->enabled;
    }
    return hotspot;
}

inline model::VlanConfig fromRequest(const oatpp::Object<VlanRequestDto>& body) {
    requireField(body->id != nullptr, "id");
    requireField(body->parentInterface != nullptr, "parentInterface");

    model::VlanConfig vlan;
    vlan.id = *body->id;
    vlan.parent_interface = toStdString(body->parentInterface);
    return vlan;
}

inline model::BridgeConfig fromRequest(const oatpp::Object<BridgeRequestDto>& body) {
    requireField(body->name != nullptr, "name");
    requireField(body->members != nullptr, "members");

    model::BridgeConfig bridge;
    bridge.name = toStdString(body->name);
    for (const auto& member : *body->members) {
        requireField(member != nullptr, "members[]");
        bridge.members.push_back(toStdString(member));
    }
    if (body->stp) {
        bridge.stp = *body->stp;
    }
    return bridge;
}

// Stored objects, with or without a live projection

template<typename Dto, typename Config>
void applyStatus(Dto& dto, const services::ObjectStatus<Config>& status) {
    dto->status = objectStatus(status).c_str();
    dto->degraded = status.degraded;
    dto->missing_interfaces = toStringVector(status.missing_interfaces);
    dto->applied_at = static_cast<v_int64>(status.config.meta.applied_at);
}

inline oatpp::Object<WirelessDto> toDto(const services::ObjectStatus<model::WirelessConfig>& status) {
    const auto& config = status.config;
    auto dto = WirelessDto::createShared();
    dto->interface = config.interface.c_str();
    dto->ssid = config.ssid.c_str();
    dto->secured = !config.is_open();
    dto->channel = config.channel;
    dto->hw_mode = config.hw_mode.c_str();
    dto->bridge = config.bridge.empty() ? oatpp::String(nullptr) : oatpp::String(config.bridge.c_str());
    applyStatus(dto, status);
    return dto;
}

inline oatpp::Object<HotspotDto> toDto(const services::ObjectStatus<model::HotspotInstance>& status) {
    const auto& hotspot = status.config;
    auto dto = HotspotDto::createShared();
    dto->interface = hotspot.interface.c_str();
    dto->ip_address = hotspot.ip_address.c_str();
    dto->dhcp_range = hotspot.dhcp_range.to_string().c_str();
    dto->bandwidth_limit = hotspot.bandwidth_limit;
    dto->enabled = hotspot.enabled;
    applyStatus(dto, status);
    return dto;
}

inline oatpp::Object<VlanDto> toDto(const services::ObjectStatus<model::VlanConfig>& status) {
    const auto& vlan = status.config;
    auto dto = VlanDto::createShared();
    dto->id = vlan.id;
    dto->parentInterface = vlan.parent_interface.c_str();
    dto->name = vlan.name.c_str();
    applyStatus(dto, status);
    return dto;
}

inline oatpp::Object<BridgeDto> toDto(const services::ObjectStatus<model::BridgeConfig>& status) {
    const auto& bridge = status.config;
    auto dto = BridgeDto::createShared();
    dto->name = bridge.name.c_str();
    dto->members = toStringVector(bridge.members);
    dto->stp = bridge.stp;
    applyStatus(dto, status);
    return dto;
}

// Freshly created objects are live by construction
template<typename Config>
auto toCreatedDto(const Config& config) {
    services::ObjectStatus<Config> status;
    status.config = config;
    auto dto = toDto(status);
    dto->status = "applied";
    return dto;
}

// Errors

inline oatpp::web::protocol::http::Status httpStatusFor(const core::ProvisionError& error) {
    using Status = oatpp::web::protocol::http::Status;
    switch (error.error_kind()) {
    case core::ErrorKind::VALIDATION_CONFLICT:
    case core::ErrorKind::DEPENDENCY_EXISTS:
        return Status::CODE_409;
    case core::ErrorKind::INTERFACE_NOT_FOUND:
    case core::ErrorKind::OBJECT_NOT_FOUND:
        return Status::CODE_404;
    case core::ErrorKind::DRIVER_FAILURE:
        return Status::CODE_502;
    case core::ErrorKind::ROLLBACK_FAILURE:
    case core::ErrorKind::STORE_FAILURE:
        return Status::CODE_500;
    }
    return Status::CODE_500;
}

inline oatpp::Object<ErrorDto> toErrorDto(const core::ProvisionError& error) {
    auto dto = ErrorDto::createShared();
    dto->status = "error";
    dto->error = core::to_string(error.error_kind()).c_str();
    dto->message = error.what();
    dto->kind = model::to_string(error.object_kind()).c_str();
    dto->key = error.key().c_str();
    if (!error.step().empty()) {
        dto->step = error.step().c_str();
    }
    if (!error.cause().empty()) {
        dto->cause = error.cause().c_str();
    }
    if (auto dependency = dynamic_cast<const core::DependencyExists*>(&error)) {
        dto->dependents = toStringVector(dependency->dependents());
    }
    dto->operatorAttention = error.operator_attention();
    return dto;
}

inline oatpp::Object<ErrorDto> toErrorDto(const std::string& error, const std::string& message) {
    auto dto = ErrorDto::createShared();
    dto->status = "error";
    dto->error = error.c_str();
    dto->message = message.c_str();
    dto->operatorAttention = false;
    return dto;
}

// Status and progress

inline oatpp::Object<StatusOverviewDto> toDto(const services::StatusOverview& overview) {
    auto dto = StatusOverviewDto::createShared();
    dto->engine_id = overview.engine_id.c_str();
    dto->interfaces_total = static_cast<v_int32>(overview.interfaces_total);
    dto->interfaces_up = static_cast<v_int32>(overview.interfaces_up);
    dto->counts = oatpp::Fields<oatpp::Int32>::createShared();
    for (const auto& count : overview.counts) {
        dto->counts->push_back({count.first.c_str(), static_cast<v_int32>(count.second)});
    }
    dto->degraded = toStringVector(overview.degraded);
    dto->last_event = static_cast<v_uint64>(overview.last_event);
    return dto;
}

inline oatpp::Object<EventDto> toDto(const services::ProgressEvent& event) {
    auto dto = EventDto::createShared();
    dto->sequence = static_cast<v_uint64>(event.sequence);
    dto->operation_id = event.operation_id.c_str();
    dto->kind = model::to_string(event.kind).c_str();
    dto->key = event.key.c_str();
    dto->state = event.state.c_str();
    dto->message = event.message.c_str();
    dto->severity = services::to_string(event.severity).c_str();
    dto->timestamp = static_cast<v_int64>(event.timestamp);
    return dto;
}

} // namespace api
} // namespace netprov
