#include "gltf2mesh/Hasher.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <memory>

namespace gltf2mesh {

    namespace {
        using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        DigestContext newContext() {
            DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
            if (!ctx) {
                throw std::runtime_error("Failed to create hash context");
            }
            if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
                throw std::runtime_error("Failed to initialize SHA256 hash");
            }
            return ctx;
        }

        void update(EVP_MD_CTX* ctx, const void* data, size_t size) {
            if (EVP_DigestUpdate(ctx, data, size) != 1) {
                throw std::runtime_error("Failed to update hash");
            }
        }

        std::string finish(EVP_MD_CTX* ctx) {
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hashLen = 0;
            if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
                throw std::runtime_error("Failed to finalize hash");
            }

            std::ostringstream oss;
            for (unsigned int i = 0; i < hashLen; ++i) {
                oss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
            }
            return oss.str();
        }
    }

    std::string Hasher::sha256(const std::vector<uint8_t>& data) {
        auto ctx = newContext();
        update(ctx.get(), data.data(), data.size());
        return finish(ctx.get());
    }

    std::string Hasher::sha256_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Unable to open file for hashing: " + path);
        }

        auto ctx = newContext();

        char buffer[4096];
        while (file.read(buffer, sizeof(buffer))) {
            update(ctx.get(), buffer, static_cast<size_t>(file.gcount()));
        }

        // Ultima lettura parziale
        if (file.gcount() > 0) {
            update(ctx.get(), buffer, static_cast<size_t>(file.gcount()));
        }

        return finish(ctx.get());
    }

} // namespace gltf2mesh
