#pragma once
#include <stdexcept>
#include <string>
#include <cstddef>

namespace gltf2mesh {

/**
 * @class Error
 * @brief Base di tutti gli errori di caricamento glTF
 *
 * kind() restituisce una categoria stabile, usata dal server
 * nel campo "kind" delle risposte di errore.
 */
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& message) : std::runtime_error(message) {}

        virtual const char* kind() const noexcept { return "error"; }
    };

    // URL mancante, content type non glTF, JSON o GLB non validi
    class LoadError : public Error {
    public:
        explicit LoadError(const std::string& message) : Error(message) {}

        const char* kind() const noexcept override { return "load"; }
    };

    class BufferLoadError : public Error {
    public:
        BufferLoadError(const std::string& uri, const std::string& cause)
                : Error("Can not load buffer by given uri: " + uri + " (" + cause + ")"),
                  uri_(uri), cause_(cause) {}

        const std::string& uri() const { return uri_; }
        const std::string& cause() const { return cause_; }

        const char* kind() const noexcept override { return "buffer"; }

    private:
        std::string uri_;
        std::string cause_;
    };

    class BufferCompletenessError : public Error {
    public:
        explicit BufferCompletenessError(const std::string& message) : Error(message) {}

        const char* kind() const noexcept override { return "buffer_completeness"; }
    };

    class UnsupportedFeatureError : public Error {
    public:
        UnsupportedFeatureError(const std::string& feature, size_t meshIndex, size_t primitiveIndex)
                : Error(feature + " is not supported. Mesh: " + std::to_string(meshIndex) +
                        ", primitive " + std::to_string(primitiveIndex)),
                  feature_(feature), meshIndex_(meshIndex), primitiveIndex_(primitiveIndex) {}

        const std::string& feature() const { return feature_; }
        size_t meshIndex() const { return meshIndex_; }
        size_t primitiveIndex() const { return primitiveIndex_; }

        const char* kind() const noexcept override { return "unsupported"; }

    private:
        std::string feature_;
        size_t meshIndex_;
        size_t primitiveIndex_;
    };

    // Base64 non valido, letture fuori dal buffer view, decodeMatrix errata, indici fuori range
    class MalformedDataError : public Error {
    public:
        explicit MalformedDataError(const std::string& message) : Error(message) {}

        const char* kind() const noexcept override { return "malformed"; }
    };

} // namespace gltf2mesh
