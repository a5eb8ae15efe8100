#pragma once

#include "ports/output/IRandomSource.hpp"
#include "domain/errors/SessionErrors.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <climits>
#include <string>

namespace websession::adapters::secondary {

/**
 * @brief Источник случайных байт на основе OpenSSL RAND_bytes
 */
class OpenSslRandomSource : public ports::output::IRandomSource {
public:
    void fill(uint8_t* buffer, size_t size) override {
        if (size > static_cast<size_t>(INT_MAX)) {
            throw domain::IdentifierGenerationError("Requested too many random bytes");
        }
        if (RAND_bytes(buffer, static_cast<int>(size)) != 1) {
            char reason[256];
            ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
            throw domain::IdentifierGenerationError(
                std::string("RAND_bytes failed: ") + reason);
        }
    }
};

} // namespace websession::adapters::secondary
