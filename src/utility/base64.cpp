#include "./base64.hpp"

#include <openssl/evp.h>

std::string utility::base64_encode(chx::media::binary_view view) {
    std::string __ret;
    __ret.resize(base64_encode_length(view));
    if (!view.empty()) {
        EVP_EncodeBlock(reinterpret_cast<unsigned char*>(__ret.data()),
                        view.data(), static_cast<int>(view.size()));
    }
    return __ret;
}
