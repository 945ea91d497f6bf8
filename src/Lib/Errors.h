//
// Error taxonomy shared by the storage, codec, process and pipeline layers
//

#ifndef DOCCONV_SERVER_ERRORS_H
#define DOCCONV_SERVER_ERRORS_H

#include <stdexcept>
#include <string>

enum class eErrorKind {
    validation,
    missingArtifact,
    noChunks,
    sessionState,
    storage,
    unavailable,
    rasterization,
    conversion,
    spawn
};

class eServiceError : public std::runtime_error {
public:
    eServiceError(eErrorKind kind, const std::string& message) : std::runtime_error(message), errorKind(kind) {}

    [[nodiscard]] auto kind() const -> eErrorKind { return errorKind; }

    // Machine readable name reported to clients in the "code" field
    [[nodiscard]] auto code() const -> std::string {
        switch (errorKind) {
            case eErrorKind::validation:
                return "ValidationError";
            case eErrorKind::missingArtifact:
                return "MissingArtifactError";
            case eErrorKind::noChunks:
                return "NoChunksError";
            case eErrorKind::sessionState:
                return "SessionStateError";
            case eErrorKind::storage:
                return "StorageError";
            case eErrorKind::unavailable:
                return "UnavailableError";
            case eErrorKind::rasterization:
                return "RasterizationError";
            case eErrorKind::conversion:
                return "ConversionError";
            case eErrorKind::spawn:
                return "SpawnError";
        }
        return "InternalError";
    }

    // True for errors caused by the caller rather than the server or its environment
    [[nodiscard]] auto isClientError() const -> bool {
        return errorKind == eErrorKind::validation
            || errorKind == eErrorKind::missingArtifact
            || errorKind == eErrorKind::noChunks
            || errorKind == eErrorKind::sessionState;
    }

private:
    eErrorKind errorKind;
};

class eValidationError : public eServiceError {
public:
    explicit eValidationError(const std::string& message) : eServiceError(eErrorKind::validation, message) {}
};

class eMissingArtifactError : public eServiceError {
public:
    explicit eMissingArtifactError(const std::string& message) : eServiceError(eErrorKind::missingArtifact, message) {}
};

class eNoChunksError : public eServiceError {
public:
    explicit eNoChunksError(const std::string& message) : eServiceError(eErrorKind::noChunks, message) {}
};

class eSessionStateError : public eServiceError {
public:
    explicit eSessionStateError(const std::string& message) : eServiceError(eErrorKind::sessionState, message) {}
};

class eStorageError : public eServiceError {
public:
    explicit eStorageError(const std::string& message) : eServiceError(eErrorKind::storage, message) {}
};

class eUnavailableError : public eServiceError {
public:
    explicit eUnavailableError(const std::string& message) : eServiceError(eErrorKind::unavailable, message) {}
};

class eRasterizationError : public eServiceError {
public:
    explicit eRasterizationError(const std::string& message) : eServiceError(eErrorKind::rasterization, message) {}
};

class eConversionError : public eServiceError {
public:
    explicit eConversionError(const std::string& message) : eServiceError(eErrorKind::conversion, message) {}
};

class eSpawnError : public eServiceError {
public:
    explicit eSpawnError(const std::string& message) : eServiceError(eErrorKind::spawn, message) {}
};

// Raised by a streaming sink when the client has gone away, cancelling any remaining work
class eClientDisconnected : public std::runtime_error {
public:
    explicit eClientDisconnected(const std::string& message) : std::runtime_error(message) {}
};

#endif //DOCCONV_SERVER_ERRORS_H
