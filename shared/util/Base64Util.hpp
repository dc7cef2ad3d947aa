#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>

namespace shared::util {

/**
 * Base64 and hex encoding using OpenSSL.
 */
class Base64Util {
public:
    /**
     * Encode binary data to standard Base64 (with padding, no newlines).
     */
    static std::string encode(const std::vector<uint8_t>& data) {
        return encode(data.data(), data.size());
    }

    static std::string encode(const uint8_t* data, size_t length) {
        if (length == 0) {
            return "";
        }

        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new(BIO_s_mem());
        if (!b64 || !mem) {
            BIO_free(b64);
            BIO_free(mem);
            throw std::runtime_error("Base64 BIO allocation failed");
        }
        b64 = BIO_push(b64, mem);

        BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
        if (BIO_write(b64, data, static_cast<int>(length)) <= 0 || BIO_flush(b64) != 1) {
            BIO_free_all(b64);
            throw std::runtime_error("Base64 encoding failed");
        }

        BUF_MEM* bufferPtr = nullptr;
        BIO_get_mem_ptr(b64, &bufferPtr);

        std::string result(bufferPtr->data, bufferPtr->length);
        BIO_free_all(b64);

        return result;
    }

    /**
     * Encode to the URL-safe alphabet (RFC 4648 section 5) without '=' padding.
     */
    static std::string encodeUrlSafeNoPad(const uint8_t* data, size_t length) {
        std::string result = encode(data, length);
        while (!result.empty() && result.back() == '=') {
            result.pop_back();
        }
        for (char& c : result) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        return result;
    }

    static std::string encodeUrlSafeNoPad(const std::vector<uint8_t>& data) {
        return encodeUrlSafeNoPad(data.data(), data.size());
    }

    /**
     * Decode standard Base64.
     */
    static std::vector<uint8_t> decode(const std::string& encoded) {
        if (encoded.empty()) {
            return {};
        }

        std::vector<uint8_t> result((encoded.length() * 3) / 4 + 3);

        BIO* b64 = BIO_new(BIO_f_base64());
        BIO* mem = BIO_new_mem_buf(encoded.c_str(), static_cast<int>(encoded.length()));
        if (!b64 || !mem) {
            BIO_free(b64);
            BIO_free(mem);
            throw std::runtime_error("Base64 BIO allocation failed");
        }
        mem = BIO_push(b64, mem);

        BIO_set_flags(mem, BIO_FLAGS_BASE64_NO_NL);
        int actualLength = BIO_read(mem, result.data(), static_cast<int>(result.size()));
        BIO_free_all(mem);

        if (actualLength < 0) {
            throw std::runtime_error("Base64 decoding failed");
        }

        result.resize(static_cast<size_t>(actualLength));
        return result;
    }

    /**
     * Decode URL-safe Base64, with or without padding.
     */
    static std::vector<uint8_t> decodeUrlSafe(const std::string& encoded) {
        std::string standard = encoded;
        for (char& c : standard) {
            if (c == '-') c = '+';
            else if (c == '_') c = '/';
        }
        while (standard.size() % 4 != 0) {
            standard += '=';
        }
        return decode(standard);
    }

    /**
     * Lowercase hex.
     */
    static std::string toHex(const uint8_t* data, size_t length) {
        static const char hexChars[] = "0123456789abcdef";
        std::string result;
        result.reserve(length * 2);

        for (size_t i = 0; i < length; ++i) {
            result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
            result.push_back(hexChars[data[i] & 0x0F]);
        }

        return result;
    }

    static std::string toHex(const std::vector<uint8_t>& data) {
        return toHex(data.data(), data.size());
    }
};

} // namespace shared::util
