#include <QTest>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include "config/config_store.h"
#include "config/config_types.h"

class TestConfigStore : public QObject {
    Q_OBJECT

private:
    static void writeJson(const QString& path, const QByteArray& content) {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(content);
    }

private slots:
    void testMissingFileKeepsDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");

        ConfigStore store;
        QVERIFY(!store.load(path));

        auto runtime = store.runtimeConfig();
        QCOMPARE(runtime.requestTimeout, 120000);
        QCOMPARE(runtime.hardToolLimit, 128);
        QCOMPARE(runtime.enableRetryOnFilter, true);
        QCOMPARE(store.endpointConfig().route, QStringLiteral("/chat/completions"));
        QVERIFY(!store.fetchConfig().isValid());
    }

    void testLoadSnakeAndCamelKeys() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");
        writeJson(path, R"({
            "endpoint": { "baseUrl": "https://api.example.com/v1", "model": "gpt-4o",
                          "max_output_tokens": 2048, "supportsVision": true },
            "auth": { "api_key": "sk-plain" },
            "runtime": { "request_timeout_ms": 5000, "hardToolLimit": 64, "top_p": 0.5 }
        })");

        ConfigStore store;
        QSignalSpy spy(&store, &ConfigStore::configChanged);
        QVERIFY(store.load(path));
        QCOMPARE(spy.count(), 1);

        auto config = store.fetchConfig();
        QVERIFY(config.isValid());
        QCOMPARE(config.endpoint.url(), QStringLiteral("https://api.example.com/v1/chat/completions"));
        QCOMPARE(config.endpoint.maxOutputTokens, 2048);
        QCOMPARE(config.endpoint.supportsVision, true);
        QCOMPARE(config.auth.apiKey, QStringLiteral("sk-plain"));
        QCOMPARE(config.runtime.requestTimeout, 5000);
        QCOMPARE(config.runtime.hardToolLimit, 64);
        QCOMPARE(config.runtime.topP, 0.5);
    }

    void testMalformedFileIgnored() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");
        writeJson(path, "{ not json");

        ConfigStore store;
        QVERIFY(!store.load(path));
        QCOMPARE(store.runtimeConfig().connectionPoolSize, 10);
    }

    void testSaveAndReload() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");

        {
            ConfigStore store;
            store.load(path);

            QVariantMap ep;
            ep[QStringLiteral("base_url")] = QStringLiteral("https://llm.local/");
            ep[QStringLiteral("model")] = QStringLiteral("local-model");
            store.setEndpointOptions(ep);
            store.setApiKey(QStringLiteral("my-secret-key"));

            QVERIFY(store.save());
        }

        QFile raw(path);
        QVERIFY(raw.open(QIODevice::ReadOnly));
        const QByteArray content = raw.readAll();
        QVERIFY(!content.contains("my-secret-key"));
        QVERIFY(content.contains("ENC:"));

        {
            ConfigStore store2;
            QVERIFY(store2.load(path));
            QCOMPARE(store2.apiKey(), QStringLiteral("my-secret-key"));
            QCOMPARE(store2.endpointConfig().model, QStringLiteral("local-model"));
            QCOMPARE(store2.endpointConfig().url(), QStringLiteral("https://llm.local/chat/completions"));
        }
    }

    void testReloadPicksUpRotatedKey() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");
        writeJson(path, R"({"auth":{"api_key":"old"}})");

        ConfigStore store;
        QVERIFY(store.load(path));
        QCOMPARE(store.apiKey(), QStringLiteral("old"));

        writeJson(path, R"({"auth":{"api_key":"new"}})");
        QVERIFY(store.reload());
        QCOMPARE(store.apiKey(), QStringLiteral("new"));
    }

    void testRuntimeOptionsClamped() {
        ConfigStore store;

        QVariantMap opts;
        opts[QStringLiteral("debugLogging")] = true;
        opts[QStringLiteral("connection_pool_size")] = 15;
        opts[QStringLiteral("requestTimeoutMs")] = 10;
        opts[QStringLiteral("temperature")] = 5.0;
        opts[QStringLiteral("hard_tool_limit")] = 0;
        store.setRuntimeOptions(opts);

        auto config = store.runtimeConfig();
        QCOMPARE(config.debugLogging, true);
        QCOMPARE(config.connectionPoolSize, 15);
        QCOMPARE(config.requestTimeout, 1000);
        QCOMPARE(config.temperature, 2.0);
        QCOMPARE(config.hardToolLimit, 1);
        QCOMPARE(store.runtimeOptions().value(QStringLiteral("connectionPoolSize")).toInt(), 15);
    }

    void testApiKeyEncoding() {
        const QString encoded = ConfigStore::encodeApiKey(QStringLiteral("sk-abc"));
        QVERIFY(encoded.startsWith(QStringLiteral("ENC:")));
        QCOMPARE(ConfigStore::decodeApiKey(encoded), QStringLiteral("sk-abc"));
        QCOMPARE(ConfigStore::decodeApiKey(QStringLiteral("plain")), QStringLiteral("plain"));
        QVERIFY(ConfigStore::encodeApiKey(QString()).isEmpty());
    }

    void testUrlDoesNotDoubleAppendRoute() {
        EndpointConfig ep;
        ep.baseUrl = QStringLiteral("https://api.example.com/v1/chat/completions");
        QCOMPARE(ep.url(), QStringLiteral("https://api.example.com/v1/chat/completions"));
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"
