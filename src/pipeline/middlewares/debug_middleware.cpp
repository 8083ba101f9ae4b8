#include "debug_middleware.h"
#include "core/log_manager.h"

Result<ChatRequest> DebugMiddleware::onRequest(ChatRequest request) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Request: model=%1, messages=%2, stream=%3, params=%4")
            .arg(request.model)
            .arg(request.messages.size())
            .arg(request.stream ? QStringLiteral("true") : QStringLiteral("false"))
            .arg(request.sampling.isEmpty() ? QStringLiteral("none") : QStringLiteral("set")));
    }
    return request;
}

Result<StandardResponse> DebugMiddleware::onResponse(StandardResponse response) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Response: id=%1, finish=%2, tokens=%3/%4")
            .arg(response.id, response.finishReason)
            .arg(response.usage.promptTokens)
            .arg(response.usage.completionTokens));
    }
    return response;
}

Result<StandardChunk> DebugMiddleware::onChunk(StandardChunk chunk) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Chunk: id=%1, delta=%2, finish=%3")
            .arg(chunk.id)
            .arg(chunk.deltaContent ? chunk.deltaContent->size() : 0)
            .arg(chunk.finishReason.value_or(QStringLiteral("null"))));
    }
    return chunk;
}
