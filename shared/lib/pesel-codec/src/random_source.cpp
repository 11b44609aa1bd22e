/**
 * @file random_source.cpp
 * @brief OpenSSL RAND_bytes backed random source
 */

#include "pesel/codec/random_source.h"
#include "exceptions.h"

#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>

namespace pesel::codec {

int OpenSslRandomSource::uniform(int bound) {
    if (bound < 1 || bound > 256) {
        throw std::invalid_argument("Random bound must be 1-256, got " + std::to_string(bound));
    }

    // Largest multiple of bound that fits in a byte; bytes above it are redrawn
    const int limit = 256 - (256 % bound);

    while (true) {
        unsigned char byte = 0;
        if (RAND_bytes(&byte, 1) != 1) {
            unsigned long err = ERR_get_error();
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            throw common::RandomSourceException(std::string("RAND_bytes failed: ") + buf);
        }
        if (byte < limit) {
            return byte % bound;
        }
    }
}

} // namespace pesel::codec
