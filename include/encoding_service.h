#ifndef ENCODING_SERVICE_H
#define ENCODING_SERVICE_H

#include <Arduino.h>
#include <vector>

// Base64 for audio payloads on the realtime and telephony sockets (mbedtls backend)

// Decoding. Empty or malformed input yields an empty vector / false.
bool decodeBase64(const char* encoded, size_t encodedLength, std::vector<uint8_t>& output);
std::vector<uint8_t> decodeBase64ToVector(const String& encoded);

// Encoding
size_t calculateBase64EncodedSize(size_t inputLength);
String encodeBase64ToString(const uint8_t* data, size_t length);
String encodeBase64ToString(const std::vector<uint8_t>& data);

#endif // ENCODING_SERVICE_H
