#pragma once

#include "domain/SessionId.hpp"
#include "domain/errors/SessionErrors.hpp"
#include "ports/output/IRandomSource.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace websession::application {

/**
 * @brief Генератор идентификаторов сессий
 *
 * Берёт idByteLength байт из CSPRNG и кодирует их в base64url без паддинга.
 * Thread-safe, если thread-safe источник случайности.
 */
class IdentifierGenerator {
public:
    IdentifierGenerator(std::shared_ptr<ports::output::IRandomSource> randomSource,
                        size_t byteLength = domain::SessionId::DEFAULT_BYTE_LENGTH)
        : randomSource_(std::move(randomSource))
        , byteLength_(byteLength)
    {
        if (!randomSource_) {
            throw std::invalid_argument("IdentifierGenerator requires a random source");
        }
        if (byteLength_ < domain::SessionId::MIN_BYTE_LENGTH) {
            throw std::invalid_argument(
                "Session id length must be at least " +
                std::to_string(domain::SessionId::MIN_BYTE_LENGTH) + " bytes");
        }
    }

    /**
     * @brief Сгенерировать новый идентификатор
     * @throws domain::IdentifierGenerationError если источник случайности недоступен
     */
    domain::SessionId generate() const {
        std::vector<uint8_t> bytes(byteLength_);
        randomSource_->fill(bytes.data(), bytes.size());
        return domain::SessionId(encodeBase64Url(bytes));
    }

    size_t byteLength() const { return byteLength_; }

    /**
     * @brief base64url без паддинга (RFC 4648 §5)
     */
    static std::string encodeBase64Url(const std::vector<uint8_t>& bytes) {
        std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
        int written = EVP_EncodeBlock(out.data(), bytes.data(), static_cast<int>(bytes.size()));

        std::string token(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
        while (!token.empty() && token.back() == '=') {
            token.pop_back();
        }
        for (auto& c : token) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        return token;
    }

private:
    std::shared_ptr<ports::output::IRandomSource> randomSource_;
    size_t byteLength_;
};

} // namespace websession::application
