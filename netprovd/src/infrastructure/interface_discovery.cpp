/**
 * Interface Discovery
 * Enumerates kernel links and classifies them for the segment drivers
 */

#include "infrastructure/interface_discovery.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ifaddrs.h>
#include <map>
#include <net/if.h>
#include <netinet/in.h>

namespace netprov
{
    namespace infrastructure
    {

        std::vector<model::Interface> InterfaceSource::list_interfaces() const
        {
            auto all = list_all();
            all.erase(std::remove_if(all.begin(), all.end(),
                                     [](const model::Interface &iface) {
                                         return iface.type == model::InterfaceType::LOOPBACK;
                                     }),
                      all.end());
            return all;
        }

        std::optional<model::Interface> InterfaceSource::find(const std::string &name) const
        {
            for (auto &iface : list_all())
            {
                if (iface.name == name)
                {
                    return iface;
                }
            }
            return std::nullopt;
        }

        LinuxInterfaceDiscovery::LinuxInterfaceDiscovery(const std::filesystem::path &sysfs_net,
                                                         const std::filesystem::path &proc_vlan)
            : sysfs_net_(sysfs_net), proc_vlan_(proc_vlan), logger_(core::get_logger("InterfaceDiscovery"))
        {
        }

        std::vector<model::Interface> LinuxInterfaceDiscovery::list_all() const
        {
            struct LinkEntry
            {
                unsigned int flags = 0;
                std::optional<std::string> ip;
            };

            std::vector<std::string> order;
            std::map<std::string, LinkEntry> links;

            struct ifaddrs *ifaddr, *ifa;
            if (getifaddrs(&ifaddr) == -1)
            {
                logger_->warning("Failed to get network interfaces",
                                 core::LogContext().add("error", strerror(errno)));
                return {};
            }

            for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
            {
                if (ifa->ifa_name == nullptr)
                    continue;

                std::string name = ifa->ifa_name;
                auto inserted = links.emplace(name, LinkEntry{});
                if (inserted.second)
                {
                    order.push_back(name);
                }
                auto &entry = inserted.first->second;
                entry.flags |= ifa->ifa_flags;

                if (ifa->ifa_addr != nullptr && ifa->ifa_addr->sa_family == AF_INET && !entry.ip)
                {
                    auto *addr = reinterpret_cast<struct sockaddr_in *>(ifa->ifa_addr);
                    char ip_str[INET_ADDRSTRLEN];
                    if (inet_ntop(AF_INET, &addr->sin_addr, ip_str, INET_ADDRSTRLEN) != nullptr)
                    {
                        entry.ip = std::string(ip_str);
                    }
                }
            }
            freeifaddrs(ifaddr);

            std::vector<model::Interface> result;
            result.reserve(order.size());
            for (const auto &name : order)
            {
                const auto &entry = links[name];

                model::Interface iface;
                iface.name = name;
                iface.type = classify(name, (entry.flags & IFF_LOOPBACK) != 0);
                iface.admin_up = (entry.flags & IFF_UP) != 0;
                iface.status = read_status(name, iface.admin_up);
                iface.ip = entry.ip;
                iface.mac = read_attribute(name, "address");
                iface.master = read_master(name);
                result.push_back(std::move(iface));
            }

            return result;
        }

        model::InterfaceType LinuxInterfaceDiscovery::classify(const std::string &name, bool loopback) const
        {
            std::error_code ec;
            auto dir = sysfs_net_ / name;

            if (loopback || name == "lo")
            {
                return model::InterfaceType::LOOPBACK;
            }
            if (std::filesystem::exists(dir / "wireless", ec) || std::filesystem::exists(dir / "phy80211", ec))
            {
                return model::InterfaceType::WIFI;
            }
            if (std::filesystem::exists(dir / "bridge", ec))
            {
                return model::InterfaceType::BRIDGE;
            }
            if (std::filesystem::exists(proc_vlan_ / name, ec) || name.find('.') != std::string::npos)
            {
                return model::InterfaceType::VLAN;
            }
            // Radios whose driver does not expose the wireless directory
            if (name.rfind("wlan", 0) == 0 || name.rfind("wlx", 0) == 0 || name.rfind("wlp", 0) == 0)
            {
                return model::InterfaceType::WIFI;
            }
            return model::InterfaceType::ETHERNET;
        }

        model::LinkStatus LinuxInterfaceDiscovery::read_status(const std::string &name, bool flags_up) const
        {
            auto operstate = read_attribute(name, "operstate");
            if (operstate.empty())
            {
                return flags_up ? model::LinkStatus::UP : model::LinkStatus::DOWN;
            }
            // Virtual links without carrier detection report "unknown"
            return (operstate == "up" || operstate == "unknown") ? model::LinkStatus::UP
                                                                 : model::LinkStatus::DOWN;
        }

        std::string LinuxInterfaceDiscovery::read_attribute(const std::string &name,
                                                            const std::string &attribute) const
        {
            std::ifstream stream(sysfs_net_ / name / attribute);
            std::string value;
            if (stream && std::getline(stream, value))
            {
                return value;
            }
            return "";
        }

        std::optional<std::string> LinuxInterfaceDiscovery::read_master(const std::string &name) const
        {
            std::error_code ec;
            auto link = std::filesystem::read_symlink(sysfs_net_ / name / "master", ec);
            if (ec)
            {
                return std::nullopt;
            }
            return link.filename().string();
        }

    } // namespace infrastructure
} // namespace netprov
