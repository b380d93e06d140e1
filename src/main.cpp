#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QNetworkInformation>
#include <QStandardPaths>
#include <QTextStream>
#include <QTimer>

#include "adapters/auth/config_token_auth.h"
#include "adapters/endpoint/openai_endpoint.h"
#include "adapters/telemetry/log_request_logger.h"
#include "adapters/telemetry/log_telemetry_sink.h"
#include "adapters/transport/connection_pool.h"
#include "adapters/transport/qt_transport.h"
#include "config/config_store.h"
#include "core/cancellation.h"
#include "core/log_manager.h"
#include "fetch/fetcher.h"

namespace {

QString describeFailure(const ChatResponse& response)
{
    switch (response.type) {
    case ChatResponseType::Success:
        return QString();
    case ChatResponseType::RateLimited:
    case ChatResponseType::QuotaExceeded:
    case ChatResponseType::ExtensionBlocked: {
        QString text = QStringLiteral("%1: %2").arg(chatResponseTypeName(response.type), response.reason);
        if (response.retryAfter.has_value())
            text += QStringLiteral(" (retry after %1)").arg(response.retryAfter->toString(Qt::ISODate));
        else if (response.retryAfterSeconds.has_value())
            text += QStringLiteral(" (retry in %1 s)").arg(*response.retryAfterSeconds);
        return text;
    }
    case ChatResponseType::Filtered:
    case ChatResponseType::PromptFiltered:
        return QStringLiteral("%1 (%2): %3")
            .arg(chatResponseTypeName(response.type),
                 filterCategoryName(response.category.value_or(FilterCategory::Unspecified)),
                 response.reason);
    case ChatResponseType::Length:
        return QStringLiteral("Response hit the token limit. Partial output:\n%1").arg(response.truncatedValue);
    case ChatResponseType::AgentUnauthorized:
        return QStringLiteral("Authorization required: %1").arg(response.authorizationUrl);
    case ChatResponseType::NetworkError:
        return response.reasonDetail.isEmpty()
            ? response.reason
            : QStringLiteral("%1 (%2)").arg(response.reason, response.reasonDetail);
    default:
        return QStringLiteral("%1: %2").arg(chatResponseTypeName(response.type), response.reason);
    }
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("chatfetch"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Streams a chat completion from an OpenAI-compatible endpoint."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Config file."), QStringLiteral("file"));
    const QCommandLineOption systemOption(QStringLiteral("system"), QStringLiteral("System message."), QStringLiteral("text"));
    const QCommandLineOption countOption(QStringLiteral("n"), QStringLiteral("Number of candidates."), QStringLiteral("count"), QStringLiteral("1"));
    const QCommandLineOption maxTokensOption(QStringLiteral("max-tokens"), QStringLiteral("Maximum response tokens."), QStringLiteral("n"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout-ms"), QStringLiteral("Cancel the request after this many milliseconds."), QStringLiteral("ms"));
    parser.addOptions({configOption, systemOption, countOption, maxTokensOption, timeoutOption});
    parser.addPositionalArgument(QStringLiteral("prompt"), QStringLiteral("User prompt."));
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QString prompt = parser.positionalArguments().join(QLatin1Char(' '));
    if (prompt.isEmpty()) {
        err << "No prompt given.\n";
        parser.showHelp(2);
    }

    // --- 1. Config + Log ---
    ConfigStore configStore;
    configStore.load(parser.value(configOption));
    const FetchConfig config = configStore.fetchConfig();

    QString logDir = config.runtime.logDir;
    if (logDir.isEmpty())
        logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/logs");
    LogManager::instance().initialize(logDir);
    LogManager::instance().setMinimumLevel(config.runtime.debugLogging ? LogManager::Debug : LogManager::Info);
    LogManager::instance().setEchoToStderr(config.runtime.debugLogging);
    LOG_INFO(QStringLiteral("chatfetch %1 starting, config %2").arg(app.applicationVersion(), configStore.filePath()));

    if (!config.isValid()) {
        err << "Config " << configStore.filePath() << " needs endpoint.base_url and endpoint.model.\n";
        return 2;
    }

    // Lets the transport tell an offline machine apart from a bad host.
    QNetworkInformation::loadDefaultBackend();

    // --- 2. Transports ---
    ConnectionPool pooled(config.runtime.connectionPoolSize, true);
    ConnectionPool fresh(1, false);

    QtTransportOptions defaultOptions;
    defaultOptions.id = QStringLiteral("qt-pooled");
    defaultOptions.http2Allowed = config.runtime.enableHttp2;
    QtTransport transport(pooled, defaultOptions);

    QtTransportOptions alternateOptions = defaultOptions;
    alternateOptions.id = QStringLiteral("qt-fresh");
    alternateOptions.http2Allowed = false;
    QtTransport alternateTransport(fresh, alternateOptions);

    // --- 3. Collaborators ---
    OpenAIEndpoint endpoint(config.endpoint);
    ConfigTokenAuth auth(configStore);
    LogTelemetrySink telemetry;
    LogRequestLogger requestLogger;

    // --- 4. Fetcher ---
    Fetcher fetcher;
    fetcher.setTransport(&transport);
    fetcher.setAlternateTransport(&alternateTransport);
    fetcher.setAuth(&auth);
    fetcher.setTelemetry(&telemetry);
    fetcher.setRequestLogger(&requestLogger);
    fetcher.setHardToolLimit(config.runtime.hardToolLimit);
    fetcher.setConversationDefaults(config.runtime.temperature, config.runtime.topP);
    QObject::connect(&fetcher, &Fetcher::chatRequestMade, [](const MadeRequestEvent& event) {
        LOG_CAT_DEBUG(QStringLiteral("app"), QStringLiteral("request made to %1 (%2 prompt tokens)")
                                                 .arg(event.model)
                                                 .arg(event.tokenCount));
    });

    // --- 5. Request ---
    const int candidates = qMax(1, parser.value(countOption).toInt());

    FetchOptions options;
    options.debugName = QStringLiteral("cli");
    options.endpoint = &endpoint;
    if (parser.isSet(systemOption))
        options.messages.append(ChatMessage::system(parser.value(systemOption)));
    options.messages.append(ChatMessage::user(prompt));
    options.requestOptions.n = candidates;
    if (parser.isSet(maxTokensOption))
        options.requestOptions.maxTokens = parser.value(maxTokensOption).toInt();
    options.location = ChatLocation::Terminal;
    options.sourceId = QStringLiteral("chatfetch");
    options.enableRetryOnFilter = config.runtime.enableRetryOnFilter;
    options.enableRetryOnError = config.runtime.enableRetryOnError;

    // Candidate 0 streams live; the others are printed once complete.
    bool streamed = false;
    options.finishedCb = [&out, &streamed](const QString&, int index, const ResponseDelta& delta) -> std::optional<int> {
        if (!delta.retryReason.isEmpty()) {
            if (streamed)
                out << "\n[retrying: " << delta.retryReason << "]\n";
            out.flush();
            return std::nullopt;
        }
        if (index == 0 && !delta.text.isEmpty()) {
            streamed = true;
            out << delta.text;
            out.flush();
        }
        return std::nullopt;
    };

    CancellationToken token;
    // The transport never times out on its own; the deadline is a cancellation.
    const int timeoutMs = parser.isSet(timeoutOption)
        ? qMax(1, parser.value(timeoutOption).toInt())
        : config.runtime.requestTimeout;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(&timeout, &QTimer::timeout, &token, &CancellationToken::cancel);
    timeout.start(timeoutMs);

    const ChatResponse response = fetcher.fetchMany(options, token);

    if (!response.isSuccess()) {
        if (streamed)
            out << "\n";
        out.flush();
        err << describeFailure(response) << "\n";
        LOG_WARNING(QStringLiteral("request %1 ended as %2").arg(response.requestId, chatResponseTypeName(response.type)));
        return 1;
    }

    if (!streamed && !response.value.isEmpty())
        out << response.value.first();
    out << "\n";
    for (int i = 1; i < response.value.size(); ++i)
        out << "--- candidate " << i << " ---\n" << response.value.at(i) << "\n";
    out.flush();
    return 0;
}
