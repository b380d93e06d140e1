#pragma once
#include "message.h"
#include "types.h"
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QString>
#include <optional>

struct FunctionDecl {
    QString name;
    QString description;
    QJsonObject parameters;
};

struct ToolDecl {
    QString type = QStringLiteral("function");
    FunctionDecl function;
};

struct Prediction {
    QString type = QStringLiteral("content");
    QString content;
};

struct RequestOptions {
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> maxTokens;
    std::optional<int> n;
    QList<FunctionDecl> functions;
    std::optional<QString> functionCallName;
    QList<ToolDecl> tools;
    QString toolChoice;
    std::optional<Prediction> prediction;
    std::optional<QString> secretKey;
    bool stream = true;
};

// Free-form properties forwarded to telemetry. Never consulted for control
// flow, except for the request-id lookup done once per call.
using TelemetryProperties = QMap<QString, QString>;
