#include "notification.hpp"
#include "backup_metadata.hpp"
#include <curl/curl.h>
#include <chrono>
#include <exception>

namespace {

size_t writeCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

std::string eventTypeName(NotificationEventType type) {
    return type == NotificationEventType::Success ? "success" : "failure";
}

} // namespace

Json::Value toJson(const NotificationEvent& event) {
    Json::Value json;
    json["eventType"] = eventTypeName(event.type);
    json["jobName"] = event.jobName;
    json["summary"] = event.summary;
    json["timestamp"] = formatTimestamp(std::chrono::system_clock::now());
    return json;
}

WebhookNotificationStrategy::WebhookNotificationStrategy(const std::string& url, long timeoutSeconds)
    : url(url), timeoutSeconds(timeoutSeconds) {}

std::expected<void, std::string> WebhookNotificationStrategy::notify(const NotificationEvent& event) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string body = Json::writeString(builder, toJson(event));

    struct curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("Failed to send webhook notification: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        return std::unexpected("Webhook " + url + " answered HTTP " + std::to_string(status));
    }
    return {};
}

EmailNotificationStrategy::EmailNotificationStrategy(const std::string& emailTo, const BackupLog& log)
    : emailTo(emailTo), log(log) {}

std::expected<void, std::string> EmailNotificationStrategy::notify(const NotificationEvent& event) {
    std::string subject = event.type == NotificationEventType::Success
        ? "Backup job " + event.jobName + " succeeded"
        : "Backup job " + event.jobName + " failed";
    log.logMessage("Email notification to " + emailTo + ": " + subject + ": " + event.summary);
    return {};
}

Notifier::Notifier(const NotificationSettings& settings, const BackupLog& log)
    : settings(settings), log(log) {
    if (settings.webhook && !settings.webhook->empty()) {
        strategies.push_back(std::make_unique<WebhookNotificationStrategy>(*settings.webhook));
    }
    if (settings.email && !settings.email->empty()) {
        strategies.push_back(std::make_unique<EmailNotificationStrategy>(*settings.email, log));
    }
}

void Notifier::addStrategy(std::unique_ptr<NotificationStrategy> strategy) {
    strategies.push_back(std::move(strategy));
}

bool Notifier::dispatch(const NotificationEvent& event) {
    if (!settings.enabled) {
        return false;
    }
    if (event.type == NotificationEventType::Success && !settings.onSuccess) {
        return false;
    }
    if (event.type == NotificationEventType::Failure && !settings.onFailure) {
        return false;
    }
    for (const auto& strategy : strategies) {
        try {
            auto sent = strategy->notify(event);
            if (!sent) {
                log.logWarning("Notification for " + event.jobName + " not delivered: " + sent.error());
            }
        } catch (const std::exception& e) {
            log.logWarning("Notification for " + event.jobName + " not delivered: " + e.what());
        } catch (...) {
            log.logWarning("Notification for " + event.jobName + " not delivered: unknown error");
        }
    }
    return true;
}
