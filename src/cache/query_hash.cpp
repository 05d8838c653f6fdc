#include "query_hash.hpp"
#include "core/resolve_error.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>

namespace querylens::cache {

std::string query_hash(std::string_view sql) {
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw core::ResolveError(core::ResolveErrorKind::CacheIo, "EVP_MD_CTX_new failed");
    }
    
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) ||
        !EVP_DigestUpdate(ctx.get(), sql.data(), sql.size()) ||
        !EVP_DigestFinal_ex(ctx.get(), digest, &digest_length)) {
        throw core::ResolveError(core::ResolveErrorKind::CacheIo, "SHA-256 digest failed");
    }
    
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_length; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(digest[i]);
    }
    return oss.str();
}

} // namespace querylens::cache
