#include "marksync/data/StoreTask.hpp"

#include <algorithm>

namespace marksync {
namespace data {

QString storeStatusToString(StoreStatus status)
{
    switch (status) {
    case StoreStatus::Completed:
        return QStringLiteral("completed");
    case StoreStatus::Deleted:
        return QStringLiteral("deleted");
    case StoreStatus::Recurring:
        return QStringLiteral("recurring");
    case StoreStatus::Unknown:
        return QStringLiteral("unknown");
    case StoreStatus::Pending:
    default:
        return QStringLiteral("pending");
    }
}

StoreStatus storeStatusFromString(const QString &value)
{
    const QString normalized = value.toLower();
    if (normalized == QLatin1String("pending")) {
        return StoreStatus::Pending;
    }
    if (normalized == QLatin1String("completed")) {
        return StoreStatus::Completed;
    }
    if (normalized == QLatin1String("deleted")) {
        return StoreStatus::Deleted;
    }
    if (normalized == QLatin1String("recurring")) {
        return StoreStatus::Recurring;
    }
    return StoreStatus::Unknown;
}

StoreTask::StoreTask(QUuid id, QHash<QString, QString> properties)
    : m_id(id)
    , m_properties(std::move(properties))
{
}

QUuid StoreTask::id() const
{
    return m_id;
}

const QHash<QString, QString> &StoreTask::properties() const
{
    return m_properties;
}

std::optional<QString> StoreTask::value(const QString &name) const
{
    const auto it = m_properties.constFind(name);
    if (it == m_properties.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool StoreTask::hasValue(const QString &name) const
{
    return m_properties.contains(name);
}

void StoreTask::setValue(const QString &name, const std::optional<QString> &value, StoreOperations &operations)
{
    const auto current = this->value(name);
    if (current == value) {
        return;
    }

    StoreOperation operation;
    operation.kind = StoreOperation::Kind::Update;
    operation.taskId = m_id;
    operation.property = name;
    operation.oldValue = current;
    operation.value = value;
    operation.timestamp = QDateTime::currentDateTimeUtc();
    operations.push_back(std::move(operation));

    applyUpdate(name, value);
}

StoreStatus StoreTask::status() const
{
    return storeStatusFromString(value(QLatin1String(property::Status)).value_or(QString()));
}

void StoreTask::setStatus(StoreStatus status, StoreOperations &operations)
{
    setValue(QLatin1String(property::Status), storeStatusToString(status), operations);
}

QString StoreTask::description() const
{
    return value(QLatin1String(property::Description)).value_or(QString());
}

void StoreTask::setDescription(const QString &description, StoreOperations &operations)
{
    setValue(QLatin1String(property::Description), description, operations);
}

std::optional<QDateTime> StoreTask::timestamp(const QString &name) const
{
    const auto raw = value(name);
    if (!raw) {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 seconds = raw->toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return QDateTime::fromSecsSinceEpoch(seconds, Qt::UTC);
}

void StoreTask::setTimestamp(const QString &name, const std::optional<QDateTime> &timestamp, StoreOperations &operations)
{
    if (!timestamp || !timestamp->isValid()) {
        setValue(name, std::nullopt, operations);
        return;
    }
    setValue(name, QString::number(timestamp->toSecsSinceEpoch()), operations);
}

QStringList StoreTask::tags() const
{
    const QString prefix = QLatin1String(property::TagPrefix);
    QStringList result;
    for (auto it = m_properties.constBegin(); it != m_properties.constEnd(); ++it) {
        if (it.key().startsWith(prefix)) {
            result << it.key().mid(prefix.size());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool StoreTask::hasTag(const QString &tag) const
{
    return hasValue(QLatin1String(property::TagPrefix) + tag);
}

void StoreTask::setTag(const QString &tag, bool present, StoreOperations &operations)
{
    const QString name = QLatin1String(property::TagPrefix) + tag;
    if (present) {
        setValue(name, QString(""), operations);
    } else {
        setValue(name, std::nullopt, operations);
    }
}

QString StoreTask::priority() const
{
    return value(QLatin1String(property::Priority)).value_or(QString());
}

std::optional<QString> StoreTask::project() const
{
    return value(QLatin1String(property::Project));
}

void StoreTask::addAnnotation(const QDateTime &when, const QString &text, StoreOperations &operations)
{
    const QString name = QLatin1String(property::AnnotationPrefix) + QString::number(when.toSecsSinceEpoch());
    setValue(name, text, operations);
}

QStringList StoreTask::annotations() const
{
    const QString prefix = QLatin1String(property::AnnotationPrefix);
    QStringList keys;
    for (auto it = m_properties.constBegin(); it != m_properties.constEnd(); ++it) {
        if (it.key().startsWith(prefix)) {
            keys << it.key();
        }
    }
    std::sort(keys.begin(), keys.end());

    QStringList result;
    for (const QString &key : keys) {
        result << m_properties.value(key);
    }
    return result;
}

void StoreTask::applyUpdate(const QString &name, const std::optional<QString> &value)
{
    if (value) {
        m_properties.insert(name, *value);
    } else {
        m_properties.remove(name);
    }
}

bool applyOperations(QHash<QUuid, StoreTask> &tasks, const StoreOperations &operations, QString *errorMessage)
{
    auto fail = [errorMessage](const QString &message) {
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    };

    QHash<QUuid, StoreTask> staged = tasks;
    for (const StoreOperation &operation : operations) {
        if (operation.taskId.isNull()) {
            return fail(QStringLiteral("Operation without task identifier"));
        }
        switch (operation.kind) {
        case StoreOperation::Kind::Create:
            if (staged.contains(operation.taskId)) {
                return fail(QStringLiteral("Task %1 already exists")
                                .arg(operation.taskId.toString(QUuid::WithoutBraces)));
            }
            staged.insert(operation.taskId, StoreTask(operation.taskId));
            break;
        case StoreOperation::Kind::Update: {
            auto it = staged.find(operation.taskId);
            if (it == staged.end()) {
                return fail(QStringLiteral("Task %1 does not exist")
                                .arg(operation.taskId.toString(QUuid::WithoutBraces)));
            }
            it->applyUpdate(operation.property, operation.value);
            break;
        }
        }
    }
    tasks.swap(staged);
    return true;
}

} // namespace data
} // namespace marksync
