#ifndef NETPROV_INFRASTRUCTURE_CONFIG_DIGEST_HPP
#define NETPROV_INFRASTRUCTURE_CONFIG_DIGEST_HPP

#include <string>

namespace netprov
{
    namespace infrastructure
    {

        /**
         * Hex SHA-256 of rendered daemon configuration or a command plan.
         * Two objects with the same digest produce the same external state.
         */
        std::string config_digest(const std::string &rendered);

    } // namespace infrastructure
} // namespace netprov

#endif // NETPROV_INFRASTRUCTURE_CONFIG_DIGEST_HPP
