#include "gltf2mesh/BufferResolver.hpp"
#include "gltf2mesh/PathResolver.hpp"
#include "gltf2mesh/Base64.hpp"
#include "gltf2mesh/Errors.hpp"
#include "gltf2mesh/Logger.hpp"

namespace gltf2mesh {

    BufferResolver::BufferResolver(ResourceFetcher& fetcher, std::string basePath)
            : fetcher(fetcher), basePath(std::move(basePath)) {}

    std::string BufferResolver::resolvePath(const std::string& uri) const {
        if (PathResolver::isDataUri(uri) || HttpFetcher::isHttpUrl(uri)) {
            return uri;
        }
        return PathResolver::resolve(uri, basePath);
    }

    std::vector<uint8_t> BufferResolver::resolve(const Buffer& buffer, const std::vector<uint8_t>* embeddedBin) const {
        std::vector<uint8_t> bytes;
        std::string label;

        if (!buffer.uri) {
            label = "<glb-bin>";
            if (!embeddedBin) {
                throw BufferLoadError(label, "buffer has no uri and the asset has no BIN chunk");
            }
            bytes = *embeddedBin;
        } else {
            const std::string& uri = *buffer.uri;
            size_t payload = PathResolver::dataUriPayloadOffset(uri);
            if (payload != std::string::npos) {
                label = uri.substr(0, payload);
                try {
                    bytes = Base64::decode(uri, payload);
                } catch (const MalformedDataError& e) {
                    throw BufferLoadError(label, e.what());
                }
            } else {
                label = resolvePath(uri);
                try {
                    bytes = fetcher.fetch(label).body;
                } catch (const std::exception& e) {
                    Logger::error("Buffer fetch failed for " + label + ": " + e.what());
                    throw BufferLoadError(uri, e.what());
                }
            }
        }

        if (bytes.size() < buffer.byteLength) {
            throw BufferCompletenessError("Buffer " + label + " has " + std::to_string(bytes.size()) +
                                          " bytes, declared byteLength is " + std::to_string(buffer.byteLength));
        }

        Logger::debug("Resolved buffer " + label + " (" + std::to_string(bytes.size()) + " bytes)");
        return bytes;
    }

} // namespace gltf2mesh
