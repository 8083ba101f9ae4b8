#pragma once
#include "pipeline/middleware.h"

class DebugMiddleware : public IPipelineMiddleware {
public:
    explicit DebugMiddleware(bool enabled = false) : m_enabled(enabled) {}
    QString name() const override { return "debug"; }
    Result<ChatRequest> onRequest(ChatRequest request) override;
    Result<StandardResponse> onResponse(StandardResponse response) override;
    Result<StandardChunk> onChunk(StandardChunk chunk) override;

private:
    bool m_enabled;
};
