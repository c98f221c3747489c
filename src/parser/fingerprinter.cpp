#include "parser/fingerprinter.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace sqlgate {

std::string QueryFingerprinter::fingerprint(std::string_view sql) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(sql.data(), sql.size(), digest, &digest_len,
                   EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(digest_len) * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += kHex[digest[i] >> 4];
        out += kHex[digest[i] & 0x0F];
    }
    return out;
}

} // namespace sqlgate
