#include "infrastructure/config_digest.hpp"

#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace netprov
{
    namespace infrastructure
    {

        std::string config_digest(const std::string &rendered)
        {
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256(reinterpret_cast<const unsigned char *>(rendered.data()), rendered.size(), hash);

            std::ostringstream oss;
            for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
            {
                oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
            }
            return oss.str();
        }

    } // namespace infrastructure
} // namespace netprov
