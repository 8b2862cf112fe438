#include "gltf2mesh/DocumentParser.hpp"
#include "gltf2mesh/Errors.hpp"
#include "gltf2mesh/Logger.hpp"

using json = nlohmann::json;

namespace gltf2mesh {

    namespace {
        std::string at(const std::string& array, size_t index) {
            return array + "[" + std::to_string(index) + "]";
        }

        const json& require(const json& object, const char* key, const std::string& path) {
            auto it = object.find(key);
            if (it == object.end()) {
                throw LoadError("Missing required member " + path + "." + key);
            }
            return *it;
        }

        const json* arrayOrNull(const json& root, const char* key) {
            auto it = root.find(key);
            if (it == root.end()) {
                return nullptr;
            }
            if (!it->is_array()) {
                throw LoadError(std::string("Expected '") + key + "' to be an array");
            }
            return &*it;
        }

        std::vector<std::string> extensionNames(const json& object) {
            std::vector<std::string> names;
            auto it = object.find("extensions");
            if (it != object.end() && it->is_object()) {
                for (auto ext = it->begin(); ext != it->end(); ++ext) {
                    names.push_back(ext.key());
                }
            }
            return names;
        }

        Buffer parseBuffer(const json& node, const std::string& path) {
            Buffer buffer;
            if (node.contains("uri")) {
                buffer.uri = node.at("uri").get<std::string>();
            }
            buffer.byteLength = require(node, "byteLength", path).get<size_t>();
            return buffer;
        }

        BufferView parseBufferView(const json& node, const std::string& path) {
            BufferView view;
            view.buffer = require(node, "buffer", path).get<size_t>();
            view.byteLength = require(node, "byteLength", path).get<size_t>();
            view.byteOffset = node.value("byteOffset", size_t{0});
            if (node.contains("byteStride")) {
                view.byteStride = node.at("byteStride").get<size_t>();
            }
            return view;
        }

        Accessor parseAccessor(const json& node, const std::string& path) {
            Accessor accessor;
            if (node.contains("bufferView")) {
                accessor.bufferView = node.at("bufferView").get<size_t>();
            }
            accessor.byteOffset = node.value("byteOffset", size_t{0});
            accessor.componentType = require(node, "componentType", path).get<int>();
            accessor.count = require(node, "count", path).get<size_t>();
            accessor.type = node.value("type", std::string());
            accessor.normalized = node.value("normalized", false);
            if (node.contains("min")) {
                accessor.min = node.at("min").get<std::vector<double>>();
            }
            if (node.contains("max")) {
                accessor.max = node.at("max").get<std::vector<double>>();
            }

            auto ext = node.find("extensions");
            if (ext != node.end() && ext->contains(extensions::WEB3D_QUANTIZED_ATTRIBUTES)) {
                const json& quantized = ext->at(extensions::WEB3D_QUANTIZED_ATTRIBUTES);
                if (quantized.contains("decodeMatrix")) {
                    accessor.decodeMatrix = quantized.at("decodeMatrix").get<std::vector<double>>();
                }
            }
            return accessor;
        }

        Primitive parsePrimitive(const json& node, const std::string& path) {
            Primitive primitive;
            const json& attributes = require(node, "attributes", path);
            for (auto it = attributes.begin(); it != attributes.end(); ++it) {
                primitive.attributes[it.key()] = it.value().get<size_t>();
            }
            if (node.contains("indices")) {
                primitive.indices = node.at("indices").get<size_t>();
            }
            if (node.contains("mode")) {
                primitive.mode = node.at("mode").get<int>();
            }
            primitive.extensions = extensionNames(node);
            return primitive;
        }

        Mesh parseMesh(const json& node, const std::string& path) {
            Mesh mesh;
            mesh.name = node.value("name", std::string());
            const json& primitives = require(node, "primitives", path);
            for (size_t i = 0; i < primitives.size(); ++i) {
                mesh.primitives.push_back(parsePrimitive(primitives[i], at(path + ".primitives", i)));
            }
            return mesh;
        }

        template <typename T, typename Fn>
        void parseArray(const json& root, const char* key, std::vector<T>& out, Fn parseItem) {
            const json* items = arrayOrNull(root, key);
            if (!items) {
                return;
            }
            out.reserve(items->size());
            for (size_t i = 0; i < items->size(); ++i) {
                out.push_back(parseItem((*items)[i], at(key, i)));
            }
        }
    }

    Document DocumentParser::parse(const std::string& jsonText) {
        json root;
        try {
            root = json::parse(jsonText);
        } catch (const json::parse_error& e) {
            throw LoadError(std::string("JSON Parse error: ") + e.what());
        }
        return parse(root);
    }

    Document DocumentParser::parse(const json& root) {
        if (!root.is_object()) {
            throw LoadError("glTF root must be a JSON object");
        }

        auto asset = root.find("asset");
        if (asset != root.end()) {
            std::string version = asset->value("version", std::string());
            if (version.empty() || version[0] != '2') {
                throw LoadError("Only glTF 2.0 is supported, got version '" + version + "'");
            }
        }

        Document document;
        try {
            parseArray(root, "buffers", document.buffers, parseBuffer);
            parseArray(root, "bufferViews", document.bufferViews, parseBufferView);
            parseArray(root, "accessors", document.accessors, parseAccessor);
            parseArray(root, "meshes", document.meshes, parseMesh);
        } catch (const json::exception& e) {
            throw LoadError(std::string("Invalid glTF document: ") + e.what());
        }

        Logger::debug("Parsed glTF document: " + std::to_string(document.buffers.size()) + " buffers, " +
                      std::to_string(document.bufferViews.size()) + " buffer views, " +
                      std::to_string(document.accessors.size()) + " accessors, " +
                      std::to_string(document.meshes.size()) + " meshes");
        return document;
    }

} // namespace gltf2mesh
