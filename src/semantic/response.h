#pragma once
#include <QString>
#include <optional>

struct UsageEntry {
    int promptTokens = 0;
    int completionTokens = 0;
    int totalTokens = 0;
};

struct StandardResponse {
    QString id;
    qint64 created = 0;
    QString model;
    QString content;
    QString finishReason;
    UsageEntry usage;
};

struct StandardChunk {
    QString id;
    qint64 created = 0;
    QString model;
    std::optional<QString> deltaContent;
    std::optional<QString> finishReason;
    std::optional<UsageEntry> usage;
};
