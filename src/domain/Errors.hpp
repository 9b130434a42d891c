/**
 * @file Errors.hpp
 * @brief Error taxonomy of the routing and retrieval engine.
 *
 * Every error carries a machine-readable kind so that the orchestrator can
 * report it without exposing internals to the end user.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace agentrouter::domain {

enum class ErrorKind {
    EmbeddingProvider,
    CorpusUnavailable,
    ClassificationParse,
    Transport,
    AgentUnreachable,
    AgentAuth,
    MalformedResponse,
    DeadlineExceeded,
    Configuration
};

inline const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmbeddingProvider: return "embedding_provider";
        case ErrorKind::CorpusUnavailable: return "corpus_unavailable";
        case ErrorKind::ClassificationParse: return "classification_parse";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::AgentUnreachable: return "agent_unreachable";
        case ErrorKind::AgentAuth: return "agent_auth";
        case ErrorKind::MalformedResponse: return "malformed_response";
        case ErrorKind::DeadlineExceeded: return "timeout";
        case ErrorKind::Configuration: return "configuration";
    }
    return "unknown";
}

/**
 * @class AgentRouterError
 * @brief Base of all engine errors.
 */
class AgentRouterError : public std::runtime_error {
public:
    AgentRouterError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }
    const char* kindName() const { return ErrorKindName(m_kind); }

private:
    ErrorKind m_kind;
};

/** @brief The embedding provider failed; the text gets no score contribution. */
class EmbeddingProviderError : public AgentRouterError {
public:
    explicit EmbeddingProviderError(const std::string& message)
        : AgentRouterError(ErrorKind::EmbeddingProvider, message) {}
};

/** @brief The document store could not be listed. */
class CorpusUnavailableError : public AgentRouterError {
public:
    explicit CorpusUnavailableError(const std::string& message)
        : AgentRouterError(ErrorKind::CorpusUnavailable, message) {}
};

/** @brief Classifier output did not match the expected schema. */
class ClassificationParseError : public AgentRouterError {
public:
    explicit ClassificationParseError(const std::string& message)
        : AgentRouterError(ErrorKind::ClassificationParse, message) {}
};

/**
 * @class TransportError
 * @brief Connection-level failure of one outbound attempt. Retryable.
 */
class TransportError : public AgentRouterError {
public:
    TransportError(const std::string& message, bool timedOut)
        : AgentRouterError(ErrorKind::Transport, message), m_timedOut(timedOut) {}

    bool timedOut() const { return m_timedOut; }

private:
    bool m_timedOut;
};

/** @brief Transport failures persisted after the whole retry budget. */
class AgentUnreachableError : public AgentRouterError {
public:
    explicit AgentUnreachableError(const std::string& message)
        : AgentRouterError(ErrorKind::AgentUnreachable, message) {}
};

/** @brief The target refused our identity (401/403) or no identity was available. Never retried. */
class AgentAuthError : public AgentRouterError {
public:
    AgentAuthError(const std::string& message, int status)
        : AgentRouterError(ErrorKind::AgentAuth, message), m_status(status) {}

    /** @brief HTTP status, or 0 when signing failed before sending. */
    int status() const { return m_status; }

private:
    int m_status;
};

class MalformedResponseError : public AgentRouterError {
public:
    explicit MalformedResponseError(const std::string& message)
        : AgentRouterError(ErrorKind::MalformedResponse, message) {}
};

/** @brief The inbound request's own deadline expired. */
class DeadlineExceededError : public AgentRouterError {
public:
    explicit DeadlineExceededError(const std::string& message)
        : AgentRouterError(ErrorKind::DeadlineExceeded, message) {}
};

class ConfigurationError : public AgentRouterError {
public:
    explicit ConfigurationError(const std::string& message)
        : AgentRouterError(ErrorKind::Configuration, message) {}
};

} // namespace agentrouter::domain
