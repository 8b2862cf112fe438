#include "gltf2mesh/Summary.hpp"

using json = nlohmann::json;

namespace gltf2mesh {

    json Summary::toJson(const Geometry& geometry) {
        json attributes = json::object();
        for (const auto& entry : geometry.attributes) {
            const VertexAttribute& attribute = entry.second;
            attributes[attributeName(entry.first)] = {
                    {"semantic", semanticName(entry.first)},
                    {"componentCount", attribute.componentCount},
                    {"type", toString(attribute.elementType())},
                    {"normalized", attribute.normalized}
            };
        }

        json out = {
                {"mode", toString(geometry.mode)},
                {"vertexCount", geometry.vertexCount()},
                {"attributes", attributes}
        };

        if (geometry.indices) {
            out["indices"] = {
                    {"width", geometry.indices->width()},
                    {"count", geometry.indices->size()}
            };
        } else {
            out["indices"] = nullptr;
        }

        if (geometry.boundingBox) {
            out["boundingBox"] = {
                    {"min", geometry.boundingBox->min},
                    {"max", geometry.boundingBox->max}
            };
        } else {
            out["boundingBox"] = nullptr;
        }
        return out;
    }

    json Summary::toJson(const LoadResult& result) {
        json meshes = json::array();
        for (size_t m = 0; m < result.meshes.size(); ++m) {
            json primitives = json::array();
            for (const auto& geometry : result.meshes[m]) {
                primitives.push_back(toJson(geometry));
            }
            meshes.push_back({
                    {"name", m < result.meshNames.size() ? result.meshNames[m] : std::string()},
                    {"primitives", primitives}
            });
        }

        return {
                {"source", result.sourceUrl},
                {"sha256", result.documentSha256},
                {"meshes", meshes}
        };
    }

} // namespace gltf2mesh
