#pragma once
#include "constraints.h"
#include <QList>
#include <QMap>
#include <QString>

struct ChatMessage {
    QString role;
    QString content;
    QString name;
};

struct ChatRequest {
    QString model;
    QList<ChatMessage> messages;
    SamplingParameters sampling;
    bool stream = false;
    QString user;
    // Transport hints carried from the inbound connection (client Accept
    // header, request path, peer address).
    QMap<QString, QString> metadata;
};
