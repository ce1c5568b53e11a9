#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <optional>
#include <vector>

namespace marksync {
namespace data {

enum class StoreStatus
{
    Pending,
    Completed,
    Deleted,
    Recurring,
    Unknown,
};

QString storeStatusToString(StoreStatus status);
StoreStatus storeStatusFromString(const QString &value);

namespace property {
constexpr auto Status = "status";
constexpr auto Description = "description";
constexpr auto Due = "due";
constexpr auto Wait = "wait";
constexpr auto Scheduled = "scheduled";
constexpr auto Created = "created";
constexpr auto End = "end";
constexpr auto Priority = "priority";
constexpr auto Project = "project";
constexpr auto TagPrefix = "tag_";
constexpr auto AnnotationPrefix = "annotation_";
} // namespace property

struct StoreOperation
{
    enum class Kind
    {
        Create,
        Update,
    };

    Kind kind = Kind::Update;
    QUuid taskId;
    QString property;
    std::optional<QString> oldValue;
    std::optional<QString> value;
    QDateTime timestamp;
};

using StoreOperations = std::vector<StoreOperation>;

// A store record as a bag of string properties. Setters record an operation
// for every property they actually change; nothing is persisted until the
// operations are committed to a TaskStore.
class StoreTask
{
public:
    StoreTask() = default;
    explicit StoreTask(QUuid id, QHash<QString, QString> properties = {});

    QUuid id() const;
    const QHash<QString, QString> &properties() const;

    std::optional<QString> value(const QString &name) const;
    bool hasValue(const QString &name) const;
    void setValue(const QString &name, const std::optional<QString> &value, StoreOperations &operations);

    StoreStatus status() const;
    void setStatus(StoreStatus status, StoreOperations &operations);

    QString description() const;
    void setDescription(const QString &description, StoreOperations &operations);

    std::optional<QDateTime> timestamp(const QString &name) const;
    void setTimestamp(const QString &name, const std::optional<QDateTime> &timestamp, StoreOperations &operations);

    QStringList tags() const;
    bool hasTag(const QString &tag) const;
    void setTag(const QString &tag, bool present, StoreOperations &operations);

    QString priority() const;
    std::optional<QString> project() const;

    void addAnnotation(const QDateTime &when, const QString &text, StoreOperations &operations);
    QStringList annotations() const;

    // Applies a committed update without recording it.
    void applyUpdate(const QString &name, const std::optional<QString> &value);

private:
    QUuid m_id;
    QHash<QString, QString> m_properties;
};

// All-or-nothing application of an operation group onto a task map.
bool applyOperations(QHash<QUuid, StoreTask> &tasks, const StoreOperations &operations, QString *errorMessage = nullptr);

} // namespace data
} // namespace marksync
