/**
 * @file notification.hpp
 * @brief Defines notification strategies for VaultKeeper.
 *
 * Provides interfaces and implementations for reporting job outcomes to operators via
 * an HTTP webhook or the log-only email channel. Delivery is fire-and-forget: a failed
 * notification is logged and never fails the job that triggered it.
 *
 * @note Requires libcurl for webhook delivery.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <vector>
#include <memory>
#include <expected>
#include <json/json.h>
#include "backup_config.hpp"
#include "backup_log.hpp"

/**
 * @brief Kind of job outcome being reported.
 */
enum class NotificationEventType {
    Success,
    Failure
};

/**
 * @brief A job outcome.
 */
struct NotificationEvent {
    NotificationEventType type = NotificationEventType::Success; ///< Outcome.
    std::string jobName;                                         ///< Scheduler job name.
    std::string summary;                                         ///< Human readable details.
};

/**
 * @brief Serializes an event as {"eventType", "jobName", "summary", "timestamp"}.
 */
Json::Value toJson(const NotificationEvent& event);

/**
 * @brief Interface for notification strategies.
 *
 * Defines the contract for delivering job outcomes.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param event Outcome to deliver.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const NotificationEvent& event) = 0;
};

/**
 * @brief Webhook notification strategy.
 *
 * POSTs the event as a JSON document to a configured URL.
 */
class WebhookNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a webhook notification strategy.
     *
     * @param url Endpoint receiving the POST.
     * @param timeoutSeconds Transfer timeout.
     */
    explicit WebhookNotificationStrategy(const std::string& url, long timeoutSeconds = 10);

    /**
     * @brief Sends the event to the webhook.
     *
     * HTTP status codes of 400 and above are reported as errors.
     */
    std::expected<void, std::string> notify(const NotificationEvent& event) override;

private:
    std::string url;       ///< Endpoint URL.
    long timeoutSeconds;   ///< Transfer timeout.
};

/**
 * @brief Email notification strategy.
 *
 * No mail transport is wired in; the message that would be sent is written to the log.
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs an email notification strategy.
     *
     * @param emailTo Recipient address.
     * @param log Log sink receiving the message.
     */
    EmailNotificationStrategy(const std::string& emailTo, const BackupLog& log);

    std::expected<void, std::string> notify(const NotificationEvent& event) override;

private:
    std::string emailTo;  ///< Recipient email address.
    const BackupLog& log; ///< Log sink.
};

/**
 * @brief Routes job outcomes to the configured strategies.
 *
 * Applies the enabled/onSuccess/onFailure toggles and swallows delivery failures after
 * logging them.
 */
class Notifier {
public:
    /**
     * @brief Constructs a notifier with strategies built from the settings.
     *
     * A webhook strategy is added when settings.webhook is set, an email strategy when
     * settings.email is set.
     */
    Notifier(const NotificationSettings& settings, const BackupLog& log);

    /**
     * @brief Adds a delivery strategy.
     */
    void addStrategy(std::unique_ptr<NotificationStrategy> strategy);

    /**
     * @brief Delivers an event to every strategy if the toggles allow it.
     *
     * A strategy that fails or throws is logged as a warning and the rest still run.
     *
     * @return bool True if the event passed the toggles and was handed to the strategies.
     */
    bool dispatch(const NotificationEvent& event);

private:
    NotificationSettings settings;
    const BackupLog& log;
    std::vector<std::unique_ptr<NotificationStrategy>> strategies;
};

#endif // NOTIFICATION_HPP
