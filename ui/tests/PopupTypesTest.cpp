#include <QtTest/QtTest>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "models/PopupTypes.hpp"

class PopupTypesTest : public QObject {
    Q_OBJECT

private slots:
    void defaultsMatchFreshInstall();
    void mergeAppliesOnlyPresentKeys();
    void mergeClampsTimeout();
    void mergeRejectsUnknownKeysAndSources();
    void mergeAcceptsOnlyExplicitBooleans();
    void emptyCustomIdMeansNone();
    void onlyNormalTemplatesAreSelectable();
    void requestParsesHostLine();
    void requestWithoutIdIsRejected();
    void requestRejectsInvalidJson();
    void responseWireFormat();
};

void PopupTypesTest::defaultsMatchFreshInstall()
{
    const TimeoutAutoSubmitConfig config;
    QVERIFY(!config.enabled);
    QCOMPARE(config.timeoutSeconds, 300);
    QCOMPARE(config.promptSource, PromptSource::Continue);
    QVERIFY(!config.customPromptId.has_value());
    QVERIFY(config.manualPrompt.isEmpty());

    const QVariantMap map = config.toVariantMap();
    QCOMPARE(map.value(QStringLiteral("prompt_source")).toString(), QStringLiteral("continue"));
    QVERIFY(map.value(QStringLiteral("custom_prompt_id")).isNull());
}

void PopupTypesTest::mergeAppliesOnlyPresentKeys()
{
    TimeoutAutoSubmitConfig config;
    config.manualPrompt = QStringLiteral("keep me");

    QVERIFY(config.mergeFrom({{QStringLiteral("enabled"), true}}));
    QVERIFY(config.enabled);
    QCOMPARE(config.timeoutSeconds, 300);
    QCOMPARE(config.manualPrompt, QStringLiteral("keep me"));

    QVERIFY(!config.mergeFrom({{QStringLiteral("enabled"), true}}));
}

void PopupTypesTest::mergeClampsTimeout()
{
    TimeoutAutoSubmitConfig config;
    config.mergeFrom({{QStringLiteral("timeout_seconds"), 1}});
    QCOMPARE(config.timeoutSeconds, 5);
    config.mergeFrom({{QStringLiteral("timeout_seconds"), 99999}});
    QCOMPARE(config.timeoutSeconds, 3600);
    config.mergeFrom({{QStringLiteral("timeout_seconds"), 42}});
    QCOMPARE(config.timeoutSeconds, 42);
}

void PopupTypesTest::mergeRejectsUnknownKeysAndSources()
{
    TimeoutAutoSubmitConfig config;
    QStringList rejected;
    const bool changed = config.mergeFrom({{QStringLiteral("prompt_source"), QStringLiteral("telepathy")},
                                           {QStringLiteral("colour"), QStringLiteral("red")}},
                                          &rejected);
    QVERIFY(!changed);
    QCOMPARE(config.promptSource, PromptSource::Continue);
    rejected.sort();
    QCOMPARE(rejected, QStringList({QStringLiteral("colour"), QStringLiteral("prompt_source")}));

    QVERIFY(config.mergeFrom({{QStringLiteral("prompt_source"), QStringLiteral("MANUAL")}}));
    QCOMPARE(config.promptSource, PromptSource::Manual);
}

void PopupTypesTest::mergeAcceptsOnlyExplicitBooleans()
{
    TimeoutAutoSubmitConfig config;
    QStringList rejected;
    QVERIFY(!config.mergeFrom({{QStringLiteral("enabled"), QStringLiteral("maybe")}}, &rejected));
    QVERIFY(!config.enabled);
    QCOMPARE(rejected, QStringList{QStringLiteral("enabled")});

    rejected.clear();
    QVERIFY(!config.mergeFrom({{QStringLiteral("enabled"), 7}}, &rejected));
    QVERIFY(!config.mergeFrom({{QStringLiteral("enabled"), QVariantList{true}}}, &rejected));
    QVERIFY(!config.enabled);
    QCOMPARE(rejected.size(), 2);

    QVERIFY(config.mergeFrom({{QStringLiteral("enabled"), QStringLiteral(" True ")}}));
    QVERIFY(config.enabled);
    QVERIFY(config.mergeFrom({{QStringLiteral("enabled"), QStringLiteral("off")}}));
    QVERIFY(!config.enabled);
    QVERIFY(config.mergeFrom({{QStringLiteral("enabled"), 1}}));
    QVERIFY(config.enabled);
    QVERIFY(config.mergeFrom({{QStringLiteral("enabled"), false}}));
    QVERIFY(!config.enabled);
}

void PopupTypesTest::emptyCustomIdMeansNone()
{
    TimeoutAutoSubmitConfig config;
    config.mergeFrom({{QStringLiteral("custom_prompt_id"), QStringLiteral("  tpl-1 ")}});
    QCOMPARE(config.customPromptId.value_or(QString()), QStringLiteral("tpl-1"));

    config.mergeFrom({{QStringLiteral("custom_prompt_id"), QString()}});
    QVERIFY(!config.customPromptId.has_value());

    config.mergeFrom({{QStringLiteral("custom_prompt_id"), QStringLiteral("tpl-2")}});
    config.mergeFrom({{QStringLiteral("custom_prompt_id"), QVariant()}});
    QVERIFY(!config.customPromptId.has_value());
}

void PopupTypesTest::onlyNormalTemplatesAreSelectable()
{
    const QList<PromptTemplate> templates{
        {QStringLiteral("a"), QStringLiteral("Review"), QStringLiteral("Review the diff"), QStringLiteral("normal")},
        {QStringLiteral("b"), QStringLiteral("If tests"), QStringLiteral("Run tests"), QStringLiteral("conditional")},
        {QStringLiteral("c"), QStringLiteral("Ship"), QStringLiteral("Ship it"), QStringLiteral("Normal")},
    };

    const QList<PromptTemplate> selectable = selectablePromptTemplates(templates);
    QCOMPARE(selectable.size(), 2);
    QCOMPARE(selectable.at(0).id, QStringLiteral("a"));
    QCOMPARE(selectable.at(1).id, QStringLiteral("c"));

    QVERIFY(findSelectablePromptTemplate(templates, QStringLiteral("a")).has_value());
    QVERIFY(!findSelectablePromptTemplate(templates, QStringLiteral("b")).has_value());
    QVERIFY(!findSelectablePromptTemplate(templates, QStringLiteral("missing")).has_value());
    QVERIFY(!findSelectablePromptTemplate(templates, QString()).has_value());
}

void PopupTypesTest::requestParsesHostLine()
{
    const QByteArray line = R"({"id":" req-1 ","message":"Pick one","predefined_options":["A","B"],"is_markdown":true})";
    QString error;
    const auto request = PopupRequest::fromJsonBytes(line, &error);
    QVERIFY2(request.has_value(), qPrintable(error));
    QCOMPARE(request->id, QStringLiteral("req-1"));
    QCOMPARE(request->message, QStringLiteral("Pick one"));
    QVERIFY(request->hasPredefinedOptions);
    QCOMPARE(request->predefinedOptions, QStringList({QStringLiteral("A"), QStringLiteral("B")}));
    QVERIFY(request->isMarkdown);

    const auto noOptions = PopupRequest::fromJsonBytes(R"({"id":"req-2","message":"x","predefined_options":null})");
    QVERIFY(noOptions.has_value());
    QVERIFY(!noOptions->hasPredefinedOptions);
    QVERIFY(!noOptions->isMarkdown);
    QVERIFY(noOptions->toJson().value(QStringLiteral("predefined_options")).isNull());
}

void PopupTypesTest::requestWithoutIdIsRejected()
{
    QString error;
    QVERIFY(!PopupRequest::fromJsonBytes(R"({"message":"hi"})", &error).has_value());
    QVERIFY(error.contains(QStringLiteral("id")));
    QVERIFY(!PopupRequest::fromJsonBytes(R"({"id":"   ","message":"hi"})").has_value());
    QVERIFY(!PopupRequest::fromJsonBytes(R"({"id":7,"message":"hi"})").has_value());
}

void PopupTypesTest::requestRejectsInvalidJson()
{
    QString error;
    QVERIFY(!PopupRequest::fromJsonBytes("{not json", &error).has_value());
    QVERIFY(!error.isEmpty());
    QVERIFY(!PopupRequest::fromJsonBytes("[1,2]", &error).has_value());
    QVERIFY(error.contains(QStringLiteral("object")));
}

void PopupTypesTest::responseWireFormat()
{
    const PopupResponse accepted = PopupResponse::accepted(QStringLiteral("r"), QStringLiteral("go"),
                                                           {QStringLiteral("A")}, true);
    const QJsonObject payload = QJsonDocument::fromJson(accepted.toWireString().toUtf8()).object();
    QCOMPARE(payload.value(QStringLiteral("user_input")).toString(), QStringLiteral("go"));
    QCOMPARE(payload.value(QStringLiteral("selected_options")).toArray().size(), 1);
    QCOMPARE(payload.value(QStringLiteral("auto_submitted")).toBool(), true);
    QVERIFY(!accepted.toWireString().contains(QLatin1Char('\n')));

    const PopupResponse cancelled = PopupResponse::cancelled(QStringLiteral("r"));
    QVERIFY(cancelled.isCancelled());
    const QJsonObject cancelPayload = QJsonDocument::fromJson(cancelled.toWireString().toUtf8()).object();
    QCOMPARE(cancelPayload.value(QStringLiteral("cancelled")).toBool(), true);
    QCOMPARE(cancelPayload.value(QStringLiteral("auto_submitted")).toBool(), false);
    QVERIFY(!cancelPayload.contains(QStringLiteral("user_input")));
}

QTEST_MAIN(PopupTypesTest)
#include "PopupTypesTest.moc"
