#pragma once
#include "semantic/ports.h"
#include "semantic/request.h"
#include "semantic/response.h"

class IPipelineMiddleware {
public:
    virtual ~IPipelineMiddleware() = default;
    virtual QString name() const = 0;

    virtual Result<ChatRequest> onRequest(ChatRequest request) {
        return request;
    }
    virtual Result<StandardResponse> onResponse(StandardResponse response) {
        return response;
    }
    virtual Result<StandardChunk> onChunk(StandardChunk chunk) {
        return chunk;
    }
};
