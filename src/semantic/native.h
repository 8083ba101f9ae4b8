#pragma once
#include "constraints.h"
#include <QList>
#include <QString>
#include <optional>

using NativeParameters = SamplingParameters;

struct NativeMessage {
    QString role;
    QString content;
    QString name;
};

// Exactly one of prompt / messages is used on the wire.
struct NativeRequest {
    std::optional<QString> prompt;
    QList<NativeMessage> messages;
    NativeParameters parameters;
};

struct NativeModelUsage {
    QString modelId;
    int inputTokens = 0;
    int outputTokens = 0;
};

struct NativeOutput {
    QString text;
    QString finishReason;
    QString sessionId;
};

// One completed backend call, or one streamed frame. In a stream the text is
// everything produced so far, not the increment.
struct NativeResponse {
    NativeOutput output;
    QList<NativeModelUsage> usage;
    QString requestId;
};

struct NativeError {
    QString code;
    QString message;
    QString requestId;
};
