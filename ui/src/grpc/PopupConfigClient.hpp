#pragma once

#include <QList>
#include <QString>
#include <QtGlobal>

#include <memory>
#include <mutex>

#include "models/PopupTypes.hpp"
#include "popup_config.grpc.pb.h"

class PopupConfigClientInterface {
public:
    struct AutoSubmitConfigResult {
        bool                    ok = false;
        TimeoutAutoSubmitConfig config;
        QString                 errorMessage;
    };

    struct PromptConfigResult {
        bool                  ok = false;
        QList<PromptTemplate> prompts;
        QString               continuePrompt;
        QString               errorMessage;
    };

    virtual ~PopupConfigClientInterface() = default;

    virtual void setEndpoint(const QString& endpoint) = 0;

    // Blocking calls; controllers run them on a worker thread.
    virtual AutoSubmitConfigResult fetchTimeoutAutoSubmitConfig() = 0;
    virtual bool storeTimeoutAutoSubmitConfig(const TimeoutAutoSubmitConfig& config,
                                              QString* errorMessage = nullptr) = 0;
    virtual PromptConfigResult fetchCustomPromptConfig() = 0;
};

class PopupConfigClient final : public PopupConfigClientInterface {
public:
    PopupConfigClient();
    ~PopupConfigClient() override;

    void setEndpoint(const QString& endpoint) override;
    QString endpoint() const;

    AutoSubmitConfigResult fetchTimeoutAutoSubmitConfig() override;
    bool storeTimeoutAutoSubmitConfig(const TimeoutAutoSubmitConfig& config,
                                      QString* errorMessage = nullptr) override;
    PromptConfigResult fetchCustomPromptConfig() override;

    bool hasChannelForTesting() const;

private:
    void ensureStub();
    void resetChannelLocked();
    std::unique_ptr<grpc::ClientContext> buildContext() const;

    mutable std::mutex m_mutex;
    QString            m_endpoint;

    std::shared_ptr<grpc::Channel>                                 m_channel;
    std::unique_ptr<hengjing::popup::v1::PopupConfigService::Stub> m_stub;
};

//! Keeps the configuration in memory for the session; used when no host endpoint is configured.
class InProcessPopupConfigClient final : public PopupConfigClientInterface {
public:
    InProcessPopupConfigClient() = default;

    void setEndpoint(const QString& endpoint) override { Q_UNUSED(endpoint); }

    AutoSubmitConfigResult fetchTimeoutAutoSubmitConfig() override;
    bool storeTimeoutAutoSubmitConfig(const TimeoutAutoSubmitConfig& config,
                                      QString* errorMessage = nullptr) override;
    PromptConfigResult fetchCustomPromptConfig() override;

    void setPromptTemplates(const QList<PromptTemplate>& prompts);

private:
    mutable std::mutex      m_mutex;
    TimeoutAutoSubmitConfig m_config;
    QList<PromptTemplate>   m_prompts;
};
