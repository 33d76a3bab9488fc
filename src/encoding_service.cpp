#include "encoding_service.h"
#include "production_logger.h"
#include <mbedtls/base64.h>

namespace {
    size_t calculateDecodedSize(const char* encoded, size_t len) {
        while (len > 0 && encoded[len - 1] == '=') {
            len--;
        }
        return (len * 3) / 4;
    }
}

bool decodeBase64(const char* encoded, size_t encodedLength, std::vector<uint8_t>& output) {
    output.clear();
    if (encoded == nullptr || encodedLength == 0) {
        return false;
    }

    output.resize(calculateDecodedSize(encoded, encodedLength) + 3);
    size_t decodedLength = 0;
    int ret = mbedtls_base64_decode(output.data(), output.size(), &decodedLength,
                                    (const unsigned char*)encoded, encodedLength);
    if (ret != 0) {
        output.clear();
        VB_LOG_WARNING(LOG_CODEC, "Base64 decoding failed", "mbedtls=" + String(ret));
        return false;
    }
    output.resize(decodedLength);
    return true;
}

std::vector<uint8_t> decodeBase64ToVector(const String& encoded) {
    std::vector<uint8_t> result;
    decodeBase64(encoded.c_str(), encoded.length(), result);
    return result;
}

size_t calculateBase64EncodedSize(size_t inputLength) {
    return ((inputLength + 2) / 3) * 4 + 1;
}

String encodeBase64ToString(const uint8_t* data, size_t length) {
    if (data == nullptr || length == 0) {
        return String();
    }

    std::vector<unsigned char> buffer(calculateBase64EncodedSize(length));
    size_t encodedLength = 0;
    int ret = mbedtls_base64_encode(buffer.data(), buffer.size(), &encodedLength, data, length);
    if (ret != 0) {
        VB_LOG_ERROR(LOG_CODEC, "Base64 encoding failed", "mbedtls=" + String(ret));
        return String();
    }
    buffer[encodedLength] = '\0';
    return String((const char*)buffer.data());
}

String encodeBase64ToString(const std::vector<uint8_t>& data) {
    return encodeBase64ToString(data.data(), data.size());
}
