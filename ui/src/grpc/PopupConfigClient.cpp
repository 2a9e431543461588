#include "PopupConfigClient.hpp"

#include <QLoggingCategory>

#include <google/protobuf/empty.pb.h>
#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>

Q_LOGGING_CATEGORY(lcPopupConfigClient, "hengjing.popup.config.grpc")

namespace {

constexpr auto kCallDeadline = std::chrono::seconds(5);

namespace pb = hengjing::popup::v1;

PromptSource fromProto(pb::PromptSource source)
{
    switch (source) {
    case pb::PROMPT_SOURCE_CUSTOM:
        return PromptSource::Custom;
    case pb::PROMPT_SOURCE_MANUAL:
        return PromptSource::Manual;
    case pb::PROMPT_SOURCE_CONTINUE:
    default:
        return PromptSource::Continue;
    }
}

pb::PromptSource toProto(PromptSource source)
{
    switch (source) {
    case PromptSource::Custom:
        return pb::PROMPT_SOURCE_CUSTOM;
    case PromptSource::Manual:
        return pb::PROMPT_SOURCE_MANUAL;
    case PromptSource::Continue:
        break;
    }
    return pb::PROMPT_SOURCE_CONTINUE;
}

TimeoutAutoSubmitConfig fromProto(const pb::TimeoutAutoSubmitConfig& message)
{
    TimeoutAutoSubmitConfig config;
    config.enabled = message.enabled();
    config.timeoutSeconds = clampAutoSubmitTimeoutSeconds(message.timeout_seconds());
    config.promptSource = fromProto(message.prompt_source());
    const QString customId = QString::fromStdString(message.custom_prompt_id()).trimmed();
    if (!customId.isEmpty())
        config.customPromptId = customId;
    config.manualPrompt = QString::fromStdString(message.manual_prompt());
    return config;
}

pb::TimeoutAutoSubmitConfig toProto(const TimeoutAutoSubmitConfig& config)
{
    pb::TimeoutAutoSubmitConfig message;
    message.set_enabled(config.enabled);
    message.set_timeout_seconds(clampAutoSubmitTimeoutSeconds(config.timeoutSeconds));
    message.set_prompt_source(toProto(config.promptSource));
    if (config.customPromptId)
        message.set_custom_prompt_id(config.customPromptId->toStdString());
    message.set_manual_prompt(config.manualPrompt.toStdString());
    return message;
}

QString noConnectionMessage()
{
    return QStringLiteral("No connection to PopupConfigService");
}

} // namespace

PopupConfigClient::PopupConfigClient() = default;

PopupConfigClient::~PopupConfigClient() = default;

void PopupConfigClient::setEndpoint(const QString& endpoint)
{
    const QString sanitized = endpoint.trimmed();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (sanitized == m_endpoint) {
        return;
    }
    m_endpoint = sanitized;
    resetChannelLocked();
}

QString PopupConfigClient::endpoint() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_endpoint;
}

bool PopupConfigClient::hasChannelForTesting() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<bool>(m_channel);
}

PopupConfigClient::AutoSubmitConfigResult PopupConfigClient::fetchTimeoutAutoSubmitConfig()
{
    ensureStub();
    std::unique_ptr<grpc::ClientContext> context;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_stub) {
            return {false, {}, noConnectionMessage()};
        }
        context = buildContext();
    }

    google::protobuf::Empty request;
    pb::TimeoutAutoSubmitConfig response;
    const grpc::Status status = m_stub->GetTimeoutAutoSubmitConfig(context.get(), request, &response);
    if (!status.ok()) {
        qCWarning(lcPopupConfigClient) << "GetTimeoutAutoSubmitConfig failed"
                                       << QString::fromStdString(status.error_message());
        return {false, {}, QString::fromStdString(status.error_message())};
    }

    AutoSubmitConfigResult result;
    result.ok = true;
    result.config = fromProto(response);
    return result;
}

bool PopupConfigClient::storeTimeoutAutoSubmitConfig(const TimeoutAutoSubmitConfig& config,
                                                     QString* errorMessage)
{
    ensureStub();
    std::unique_ptr<grpc::ClientContext> context;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_stub) {
            if (errorMessage)
                *errorMessage = noConnectionMessage();
            return false;
        }
        context = buildContext();
    }

    const pb::TimeoutAutoSubmitConfig request = toProto(config);
    google::protobuf::Empty response;
    const grpc::Status status = m_stub->SetTimeoutAutoSubmitConfig(context.get(), request, &response);
    if (!status.ok()) {
        if (errorMessage)
            *errorMessage = QString::fromStdString(status.error_message());
        return false;
    }
    return true;
}

PopupConfigClient::PromptConfigResult PopupConfigClient::fetchCustomPromptConfig()
{
    ensureStub();
    std::unique_ptr<grpc::ClientContext> context;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_stub) {
            return {false, {}, {}, noConnectionMessage()};
        }
        context = buildContext();
    }

    google::protobuf::Empty request;
    pb::CustomPromptConfig response;
    const grpc::Status status = m_stub->GetCustomPromptConfig(context.get(), request, &response);
    if (!status.ok()) {
        return {false, {}, {}, QString::fromStdString(status.error_message())};
    }

    PromptConfigResult result;
    result.ok = true;
    result.continuePrompt = QString::fromStdString(response.continue_prompt());
    result.prompts.reserve(response.prompts_size());
    for (const auto& prompt : response.prompts()) {
        PromptTemplate entry;
        entry.id = QString::fromStdString(prompt.id());
        entry.name = QString::fromStdString(prompt.name());
        entry.content = QString::fromStdString(prompt.content());
        entry.kind = QString::fromStdString(prompt.kind());
        if (entry.id.trimmed().isEmpty()) {
            qCDebug(lcPopupConfigClient) << "Skipping prompt template without id" << entry.name;
            continue;
        }
        result.prompts.append(entry);
    }
    return result;
}

void PopupConfigClient::ensureStub()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_endpoint.trimmed().isEmpty()) {
        return;
    }

    // The host config service only listens on loopback.
    if (!m_channel) {
        m_channel = grpc::CreateChannel(m_endpoint.toStdString(), grpc::InsecureChannelCredentials());
    }

    if (!m_stub && m_channel) {
        m_stub = pb::PopupConfigService::NewStub(m_channel);
    }
}

void PopupConfigClient::resetChannelLocked()
{
    m_stub.reset();
    m_channel.reset();
}

std::unique_ptr<grpc::ClientContext> PopupConfigClient::buildContext() const
{
    auto context = std::make_unique<grpc::ClientContext>();
    context->set_deadline(std::chrono::system_clock::now() + kCallDeadline);
    return context;
}

PopupConfigClientInterface::AutoSubmitConfigResult InProcessPopupConfigClient::fetchTimeoutAutoSubmitConfig()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    AutoSubmitConfigResult result;
    result.ok = true;
    result.config = m_config;
    return result;
}

bool InProcessPopupConfigClient::storeTimeoutAutoSubmitConfig(const TimeoutAutoSubmitConfig& config,
                                                              QString* errorMessage)
{
    Q_UNUSED(errorMessage);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = config;
    m_config.timeoutSeconds = clampAutoSubmitTimeoutSeconds(config.timeoutSeconds);
    return true;
}

PopupConfigClientInterface::PromptConfigResult InProcessPopupConfigClient::fetchCustomPromptConfig()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    PromptConfigResult result;
    result.ok = true;
    result.prompts = m_prompts;
    return result;
}

void InProcessPopupConfigClient::setPromptTemplates(const QList<PromptTemplate>& prompts)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_prompts = prompts;
}
