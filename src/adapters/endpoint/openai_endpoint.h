#pragma once
#include "approx_tokenizer.h"
#include "chat/ports.h"
#include "config/config_types.h"
#include <QJsonArray>

// IChatEndpoint for OpenAI-compatible chat-completions servers. Builds the
// JSON request body and decodes the streamed SSE response into candidate
// completions, forwarding every delta to the finished callback on the way.
class OpenAIEndpoint : public IChatEndpoint {
public:
    explicit OpenAIEndpoint(EndpointConfig config);

    QString model() const override { return m_config.model; }
    QString apiType() const override { return m_config.apiType; }
    QString url() const override { return m_config.url(); }
    int maxOutputTokens() const override { return m_config.maxOutputTokens; }
    int modelMaxPromptTokens() const override { return m_config.modelMaxPromptTokens; }
    bool supportsVision() const override { return m_config.supportsVision; }
    const ITokenizer& tokenizer() const override { return m_tokenizer; }

    QJsonObject createRequestBody(const EndpointRequest& request) const override;
    TransportResult<QList<ChatCompletion>> processResponse(IRawResponse& response,
                                                           int expectedChoices,
                                                           const FinishedCallback& finishedCb,
                                                           const CancellationToken& token) override;

protected:
    QJsonArray buildMessages(const QList<ChatMessage>& messages) const;
    QJsonObject buildContentPart(const ContentPart& part) const;
    void buildOptions(QJsonObject& body, const RequestOptions& options) const;

private:
    EndpointConfig m_config;
    ApproxTokenizer m_tokenizer;
};
