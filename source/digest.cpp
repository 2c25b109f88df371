#include "nzbstream/digest.hpp"
#include "nzbstream/logger.hpp"
#include "nzbstream/util.hpp"
#include <openssl/evp.h>

namespace nzbstream {

std::string sha256Hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr) != 1) {
        logError("SHA-256 digest failed", "NZB");
        return {};
    }
    return util::hexEncode(md, len);
}

} // namespace nzbstream
