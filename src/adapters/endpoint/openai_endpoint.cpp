#include "openai_endpoint.h"
#include "completion_accumulator.h"
#include "sse_decoder.h"
#include "core/cancellation.h"
#include "core/log_manager.h"
#include "fetch/response_classifier.h"
#include <QJsonDocument>

namespace {
const QString kLogCategory = QStringLiteral("endpoint");
}

OpenAIEndpoint::OpenAIEndpoint(EndpointConfig config)
    : m_config(std::move(config))
{
}

// ---------------------------------------------------------------------------
// Request body
// ---------------------------------------------------------------------------

QJsonObject OpenAIEndpoint::createRequestBody(const EndpointRequest& request) const
{
    QJsonObject body;
    body[QStringLiteral("model")] = m_config.model;
    body[QStringLiteral("messages")] = buildMessages(request.messages);
    buildOptions(body, request.postOptions);
    return body;
}

QJsonArray OpenAIEndpoint::buildMessages(const QList<ChatMessage>& messages) const
{
    QJsonArray out;
    for (const auto& message : messages) {
        QJsonObject msg;
        msg[QStringLiteral("role")] = chatRoleName(message.role);
        if (!message.name.isEmpty())
            msg[QStringLiteral("name")] = message.name;

        QJsonArray contentArr;
        QJsonArray toolCalls;
        QString reasoning;
        QString toolCallId;
        bool plainText = true;

        for (const auto& part : message.content) {
            switch (part.kind) {
            case PartKind::Text:
                contentArr.append(buildContentPart(part));
                break;
            case PartKind::Image:
                // Images are not forwarded to models without vision support.
                if (m_config.supportsVision) {
                    contentArr.append(buildContentPart(part));
                    plainText = false;
                }
                break;
            case PartKind::ToolCall: {
                QJsonObject fn;
                fn[QStringLiteral("name")] = part.toolCall.name;
                fn[QStringLiteral("arguments")] = part.toolCall.arguments;
                QJsonObject tc;
                tc[QStringLiteral("id")] = part.toolCall.callId;
                tc[QStringLiteral("type")] = QStringLiteral("function");
                tc[QStringLiteral("function")] = fn;
                toolCalls.append(tc);
                break;
            }
            case PartKind::ToolResult:
                if (toolCallId.isEmpty())
                    toolCallId = part.toolCallId;
                contentArr.append(buildContentPart(part));
                break;
            case PartKind::Thinking:
                reasoning += part.text;
                break;
            }
        }

        if (plainText) {
            QString text;
            for (const QJsonValue& p : contentArr)
                text += p.toObject().value(QStringLiteral("text")).toString();
            msg[QStringLiteral("content")] = text;
        } else {
            msg[QStringLiteral("content")] = contentArr;
        }

        if (!toolCalls.isEmpty())
            msg[QStringLiteral("tool_calls")] = toolCalls;
        if (!toolCallId.isEmpty())
            msg[QStringLiteral("tool_call_id")] = toolCallId;
        if (!reasoning.isEmpty())
            msg[QStringLiteral("reasoning_content")] = reasoning;

        out.append(msg);
    }
    return out;
}

QJsonObject OpenAIEndpoint::buildContentPart(const ContentPart& part) const
{
    QJsonObject obj;
    if (part.kind != PartKind::Image) {
        obj[QStringLiteral("type")] = QStringLiteral("text");
        obj[QStringLiteral("text")] = part.text;
        return obj;
    }

    QJsonObject imageUrl;
    if (!part.image.url.isEmpty()) {
        imageUrl[QStringLiteral("url")] = part.image.url;
    } else {
        imageUrl[QStringLiteral("url")] = QStringLiteral("data:") + part.image.mimeType
                                          + QStringLiteral(";base64,")
                                          + QString::fromLatin1(part.image.inlineData.toBase64());
    }
    if (!part.image.detail.isEmpty())
        imageUrl[QStringLiteral("detail")] = part.image.detail;
    obj[QStringLiteral("type")] = QStringLiteral("image_url");
    obj[QStringLiteral("image_url")] = imageUrl;
    return obj;
}

void OpenAIEndpoint::buildOptions(QJsonObject& body, const RequestOptions& options) const
{
    if (options.temperature.has_value())
        body[QStringLiteral("temperature")] = options.temperature.value();
    if (options.topP.has_value())
        body[QStringLiteral("top_p")] = options.topP.value();
    if (options.maxTokens.has_value())
        body[QStringLiteral("max_tokens")] = options.maxTokens.value();
    if (options.n.has_value())
        body[QStringLiteral("n")] = options.n.value();

    if (!options.tools.isEmpty()) {
        QJsonArray tools;
        for (const auto& tool : options.tools) {
            QJsonObject fn;
            fn[QStringLiteral("name")] = tool.function.name;
            if (!tool.function.description.isEmpty())
                fn[QStringLiteral("description")] = tool.function.description;
            fn[QStringLiteral("parameters")] = tool.function.parameters;
            QJsonObject obj;
            obj[QStringLiteral("type")] = tool.type;
            obj[QStringLiteral("function")] = fn;
            tools.append(obj);
        }
        body[QStringLiteral("tools")] = tools;
    }

    if (!options.toolChoice.isEmpty()) {
        if (options.toolChoice == QStringLiteral("auto") || options.toolChoice == QStringLiteral("none")
            || options.toolChoice == QStringLiteral("required")) {
            body[QStringLiteral("tool_choice")] = options.toolChoice;
        } else {
            QJsonObject fn;
            fn[QStringLiteral("name")] = options.toolChoice;
            QJsonObject choice;
            choice[QStringLiteral("type")] = QStringLiteral("function");
            choice[QStringLiteral("function")] = fn;
            body[QStringLiteral("tool_choice")] = choice;
        }
    }

    if (!options.functions.isEmpty()) {
        QJsonArray functions;
        for (const auto& function : options.functions) {
            QJsonObject fn;
            fn[QStringLiteral("name")] = function.name;
            if (!function.description.isEmpty())
                fn[QStringLiteral("description")] = function.description;
            fn[QStringLiteral("parameters")] = function.parameters;
            functions.append(fn);
        }
        body[QStringLiteral("functions")] = functions;
    }
    if (options.functionCallName.has_value()) {
        QJsonObject call;
        call[QStringLiteral("name")] = options.functionCallName.value();
        body[QStringLiteral("function_call")] = call;
    }

    if (options.prediction.has_value()) {
        QJsonObject prediction;
        prediction[QStringLiteral("type")] = options.prediction->type;
        prediction[QStringLiteral("content")] = options.prediction->content;
        body[QStringLiteral("prediction")] = prediction;
    }

    body[QStringLiteral("stream")] = options.stream;
    if (options.stream) {
        QJsonObject streamOptions;
        streamOptions[QStringLiteral("include_usage")] = true;
        body[QStringLiteral("stream_options")] = streamOptions;
    }
}

// ---------------------------------------------------------------------------
// Streamed response
// ---------------------------------------------------------------------------

TransportResult<QList<ChatCompletion>> OpenAIEndpoint::processResponse(IRawResponse& response,
                                                                       int expectedChoices,
                                                                       const FinishedCallback& finishedCb,
                                                                       const CancellationToken& token)
{
    SseDecoder decoder;
    CompletionAccumulator accumulator(expectedChoices);
    accumulator.setRequestIds(ResponseClassifier::requestIdFromHeaders(response.headers()));

    for (;;) {
        auto chunk = response.read(token);
        if (!chunk.has_value())
            return std::unexpected(chunk.error());

        const bool endOfBody = !chunk->has_value();
        const QList<SseEvent> events = endOfBody ? decoder.finish() : decoder.feed(**chunk);

        for (const SseEvent& event : events) {
            QJsonParseError parseError;
            const QJsonDocument doc = QJsonDocument::fromJson(event.data, &parseError);
            if (!doc.isObject()) {
                LOG_CAT_WARNING(kLogCategory, QStringLiteral("Skipping undecodable stream chunk: %1")
                                                  .arg(parseError.errorString()));
                continue;
            }

            for (const ChoiceUpdate& update : accumulator.apply(doc.object())) {
                if (!finishedCb)
                    continue;
                const std::optional<int> trimAt =
                    finishedCb(accumulator.text(update.index), update.index, update.delta);
                if (trimAt.has_value())
                    accumulator.trim(update.index, *trimAt);
            }

            if (token.isCancellationRequested())
                return std::unexpected(TransportError::aborted(QStringLiteral("stream cancelled")));
        }

        if (accumulator.hasTrimmed() && accumulator.allFinished()) {
            // Nothing more is wanted from this stream.
            response.destroy();
            break;
        }
        if (endOfBody || decoder.isDone())
            break;
    }

    if (!accumulator.streamError().isEmpty())
        LOG_CAT_ERROR(kLogCategory, QStringLiteral("Stream reported an error: %1").arg(accumulator.streamError()));

    return accumulator.finalize();
}
