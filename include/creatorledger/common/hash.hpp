#pragma once

#include "error.hpp"

#include <cstdint>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace creatorledger {

    /// SHA-256 of raw content bytes, hex encoded. Suitable as a content_hash reference.
    inline dp::Result<std::string, dp::Error> hashContent(const std::vector<uint8_t> &content) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        auto result = crypto.hash(content);
        if (!result.success) {
            return dp::Result<std::string, dp::Error>::err(dp::Error::io_error("SHA256 hashing failed"));
        }
        return dp::Result<std::string, dp::Error>::ok(keylock::keylock::to_hex(result.data));
    }

    inline dp::Result<std::string, dp::Error> hashContent(const std::string &content) {
        return hashContent(std::vector<uint8_t>(content.begin(), content.end()));
    }

} // namespace creatorledger
