#ifndef NETPROV_SERVICES_CONFLICT_VALIDATOR_HPP
#define NETPROV_SERVICES_CONFLICT_VALIDATOR_HPP

#include <string>
#include <vector>

#include "model/network_objects.hpp"

namespace netprov
{
    namespace services
    {

        /**
         * Admission verdict for one proposed object
         */
        struct ValidationResult
        {
            enum class Outcome
            {
                OK,
                CONFLICT,
                INTERFACE_MISSING
            };

            Outcome outcome = Outcome::OK;
            std::string reason;
            std::string interface; // set for INTERFACE_MISSING

            static ValidationResult ok() { return {}; }
            static ValidationResult conflict(const std::string &reason);
            static ValidationResult interface_missing(const std::string &name);

            bool is_ok() const { return outcome == Outcome::OK; }
        };

        /**
         * Side-effect-free admission rules. Each check is a pure function of
         * the proposed object, the stored desired state and the live links
         * (loopback included). Request-shape checks run first, then:
         * referenced interfaces, uniqueness, hotspot addressing, bridge
         * membership. The first failure wins.
         */
        class ConflictValidator
        {
        public:
            ValidationResult check(const model::WirelessConfig &config, const model::DesiredState &state,
                                   const std::vector<model::Interface> &links) const;
            ValidationResult check(const model::HotspotInstance &hotspot, const model::DesiredState &state,
                                   const std::vector<model::Interface> &links) const;
            ValidationResult check(const model::VlanConfig &vlan, const model::DesiredState &state,
                                   const std::vector<model::Interface> &links) const;
            ValidationResult check(const model::BridgeConfig &bridge, const model::DesiredState &state,
                                   const std::vector<model::Interface> &links) const;

            /**
             * Throw ValidationConflict or InterfaceNotFound for a rejected result.
             */
            static void raise_if_rejected(const ValidationResult &result, model::ObjectKind kind,
                                          const std::string &key);

            static bool valid_channel(const std::string &hw_mode, int channel);
            static bool valid_interface_name(const std::string &name);
        };

    } // namespace services
} // namespace netprov

#endif // NETPROV_SERVICES_CONFLICT_VALIDATOR_HPP
