#pragma once

#include "oatpp/core/macro/codegen.hpp"
#include "oatpp/core/Types.hpp"

#include OATPP_CODEGEN_BEGIN(DTO)

class StatusDto : public oatpp::DTO {
  DTO_INIT(StatusDto, DTO)

  DTO_FIELD_INFO(status) {
    info->required = true;
  }
  DTO_FIELD(String, status);

  DTO_FIELD_INFO(message) {
    info->required = true;
  }
  DTO_FIELD(String, message);
};

class ErrorDto : public oatpp::DTO {
  DTO_INIT(ErrorDto, DTO)

  DTO_FIELD(String, status);   // always "error"
  DTO_FIELD(String, error);    // "ValidationConflict", "DriverFailure", ...
  DTO_FIELD(String, message);
  DTO_FIELD(String, kind);     // object kind, absent for malformed bodies
  DTO_FIELD(String, key);
  DTO_FIELD(String, step);
  DTO_FIELD(String, cause);
  DTO_FIELD(Vector<String>, dependents);
  DTO_FIELD(Boolean, operatorAttention);
};

// Interface DTOs
class InterfaceDto : public oatpp::DTO {
  DTO_INIT(InterfaceDto, DTO)

  DTO_FIELD(String, name);
  DTO_FIELD(String, type);    // "ethernet", "wifi", "bridge", "vlan", "loopback"
  DTO_FIELD(String, status);  // "up" or "down"
  DTO_FIELD(String, ip);
  DTO_FIELD(String, mac);
  DTO_FIELD(String, master);
};

class InterfaceListDto : public oatpp::DTO {
  DTO_INIT(InterfaceListDto, DTO)

  DTO_FIELD(Vector<Object<InterfaceDto>>, interfaces);
};

// Wireless DTOs
class WirelessRequestDto : public oatpp::DTO {
  DTO_INIT(WirelessRequestDto, DTO)

  DTO_FIELD_INFO(interface) {
    info->required = true;
  }
  DTO_FIELD(String, interface);

  DTO_FIELD_INFO(ssid) {
    info->required = true;
  }
  DTO_FIELD(String, ssid);

  DTO_FIELD(String, password);
  DTO_FIELD(Int32, channel);
  DTO_FIELD(String, hw_mode);
  DTO_FIELD(String, bridge);
};

class WirelessDto : public oatpp::DTO {
  DTO_INIT(WirelessDto, DTO)

  DTO_FIELD(String, interface);
  DTO_FIELD(String, ssid);
  DTO_FIELD(Boolean, secured);  // the passphrase is never echoed back
  DTO_FIELD(Int32, channel);
  DTO_FIELD(String, hw_mode);
  DTO_FIELD(String, bridge);
  DTO_FIELD(String, status);
  DTO_FIELD(Boolean, degraded);
  DTO_FIELD(Vector<String>, missing_interfaces);
  DTO_FIELD(Int64, applied_at);
};

class WirelessListDto : public oatpp::DTO {
  DTO_INIT(WirelessListDto, DTO)

  DTO_FIELD(Vector<Object<WirelessDto>>, wireless);
};

// Hotspot DTOs
class HotspotRequestDto : public oatpp::DTO {
  DTO_INIT(HotspotRequestDto, DTO)

  DTO_FIELD_INFO(interface) {
    info->required = true;
  }
  DTO_FIELD(String, interface);

  DTO_FIELD_INFO(ip_address) {
    info->required = true;
  }
  DTO_FIELD(String, ip_address);

  DTO_FIELD_INFO(dhcp_range) {
    info->required = true;
  }
  DTO_FIELD(String, dhcp_range);  // "low,high"

  DTO_FIELD(Int32, bandwidth_limit);
  DTO_FIELD(Boolean, enabled);
};

class HotspotDto : public oatpp::DTO {
  DTO_INIT(HotspotDto, DTO)

  DTO_FIELD(String, interface);
  DTO_FIELD(String, ip_address);
  DTO_FIELD(String, dhcp_range);
  DTO_FIELD(Int32, bandwidth_limit);
  DTO_FIELD(Boolean, enabled);
  DTO_FIELD(String, status);
  DTO_FIELD(Boolean, degraded);
  DTO_FIELD(Vector<String>, missing_interfaces);
  DTO_FIELD(Int64, applied_at);
};

class HotspotListDto : public oatpp::DTO {
  DTO_INIT(HotspotListDto, DTO)

  DTO_FIELD(Vector<Object<HotspotDto>>, hotspots);
};

// VLAN DTOs
class VlanRequestDto : public oatpp::DTO {
  DTO_INIT(VlanRequestDto, DTO)

  DTO_FIELD_INFO(id) {
    info->required = true;
  }
  DTO_FIELD(Int32, id);

  DTO_FIELD_INFO(parentInterface) {
    info->required = true;
  }
  DTO_FIELD(String, parentInterface);
};

class VlanDto : public oatpp::DTO {
  DTO_INIT(VlanDto, DTO)

  DTO_FIELD(Int32, id);
  DTO_FIELD(String, parentInterface);
  DTO_FIELD(String, name);
  DTO_FIELD(String, status);
  DTO_FIELD(Boolean, degraded);
  DTO_FIELD(Vector<String>, missing_interfaces);
  DTO_FIELD(Int64, applied_at);
};

class VlanListDto : public oatpp::DTO {
  DTO_INIT(VlanListDto, DTO)

  DTO_FIELD(Vector<Object<VlanDto>>, vlans);
};

// Bridge DTOs
class BridgeRequestDto : public oatpp::DTO {
  DTO_INIT(BridgeRequestDto, DTO)

  DTO_FIELD_INFO(name) {
    info->required = true;
  }
  DTO_FIELD(String, name);

  DTO_FIELD_INFO(members) {
    info->required = true;
  }
  DTO_FIELD(Vector<String>, members);

  DTO_FIELD(Boolean, stp);
};

class BridgeDto : public oatpp::DTO {
  DTO_INIT(BridgeDto, DTO)

  DTO_FIELD(String, name);
  DTO_FIELD(Vector<String>, members);
  DTO_FIELD(Boolean, stp);
  DTO_FIELD(String, status);
  DTO_FIELD(Boolean, degraded);
  DTO_FIELD(Vector<String>, missing_interfaces);
  DTO_FIELD(Int64, applied_at);
};

class BridgeListDto : public oatpp::DTO {
  DTO_INIT(BridgeListDto, DTO)

  DTO_FIELD(Vector<Object<BridgeDto>>, bridges);
};

// Status and progress DTOs
class StatusOverviewDto : public oatpp::DTO {
  DTO_INIT(StatusOverviewDto, DTO)

  DTO_FIELD(String, engine_id);
  DTO_FIELD(Int32, interfaces_total);
  DTO_FIELD(Int32, interfaces_up);
  DTO_FIELD(Fields<Int32>, counts);
  DTO_FIELD(Vector<String>, degraded);
  DTO_FIELD(UInt64, last_event);
  DTO_FIELD(Int64, uptime);  // seconds
};

class EventDto : public oatpp::DTO {
  DTO_INIT(EventDto, DTO)

  DTO_FIELD(UInt64, sequence);
  DTO_FIELD(String, operation_id);
  DTO_FIELD(String, kind);
  DTO_FIELD(String, key);
  DTO_FIELD(String, state);
  DTO_FIELD(String, message);
  DTO_FIELD(String, severity);
  DTO_FIELD(Int64, timestamp);
};

class EventListDto : public oatpp::DTO {
  DTO_INIT(EventListDto, DTO)

  DTO_FIELD(Vector<Object<EventDto>>, events);
  DTO_FIELD(UInt64, last_sequence);
};

#include OATPP_CODEGEN_END(DTO)
