#include <QtTest/QtTest>

#include "marksync/text/LineParser.hpp"
#include "marksync/text/TaskRenderer.hpp"

using namespace marksync;
using namespace marksync::text;

class TaskRendererTest : public QObject
{
    Q_OBJECT

private slots:
    void rendersMinimalTask();
    void rendersCanonicalOrder();
    void rendersAnchor();
    void roundTripsRenderedTasks();
    void normalizesLegacyAnchor();
};

void TaskRendererTest::rendersMinimalTask()
{
    data::TaskRecord task;
    task.description = QStringLiteral("Simple text");
    QCOMPARE(renderTask(task), QStringLiteral("- [ ] Simple text"));

    task.status = data::TaskStatus::Complete;
    QCOMPARE(renderTask(task), QStringLiteral("- [x] Simple text"));

    task.status = data::TaskStatus::Canceled;
    QCOMPARE(renderTask(task), QStringLiteral("- [-] Simple text"));
}

void TaskRendererTest::rendersCanonicalOrder()
{
    data::TaskRecord task;
    task.status = data::TaskStatus::Complete;
    task.description = QStringLiteral("Write #report");
    task.tags = QStringList { QStringLiteral("report") };
    task.priority = data::TaskPriority::High;
    task.done = QDate(2025, 5, 21);
    task.created = QDate(2025, 5, 1);
    task.due = QDate(2025, 5, 20);
    task.project = QStringLiteral("Work");

    QCOMPARE(renderTask(task),
             QString::fromUtf8("- [x] Write #report 🔨 Work 📅 2025-05-20 ➕ 2025-05-01 ✅ 2025-05-21 ⏫"));
}

void TaskRendererTest::rendersAnchor()
{
    const QUuid id(QStringLiteral("{a80c42ce-dd29-4dc7-8582-34f36fcf8b80}"));
    QCOMPARE(renderAnchor(id), QString::fromUtf8("[[id: a80c42ce-dd29-4dc7-8582-34f36fcf8b80|⚔️]]"));

    data::TaskRecord task;
    task.description = QStringLiteral("Anchored");
    task.priority = data::TaskPriority::Lowest;
    task.identifier = id;
    QCOMPARE(renderTask(task),
             QString::fromUtf8("- [ ] Anchored ⏬ [[id: a80c42ce-dd29-4dc7-8582-34f36fcf8b80|⚔️]]"));
}

void TaskRendererTest::roundTripsRenderedTasks()
{
    data::TaskRecord full;
    full.identifier = QUuid::createUuid();
    full.status = data::TaskStatus::Canceled;
    full.description = QString::fromUtf8("Plan #home/garden party 🥪");
    full.tags = QStringList { QStringLiteral("home"), QStringLiteral("garden") };
    full.due = QDate(2025, 6, 7);
    full.scheduled = QDate(2025, 6, 1);
    full.start = QDate(2025, 5, 30);
    full.created = QDate(2025, 5, 1);
    full.done = QDate(2025, 6, 8);
    full.canceled = QDate(2025, 6, 9);
    full.priority = data::TaskPriority::Highest;
    full.project = QString::fromUtf8("Garden 🌻");

    data::TaskRecord bare;
    bare.description = QStringLiteral("Nothing else");

    data::TaskRecord emptyProject;
    emptyProject.description = QStringLiteral("Project marker only");
    emptyProject.project = QString("");

    const QList<data::TaskRecord> tasks { full, bare, emptyProject };
    for (const data::TaskRecord &task : tasks) {
        const QString line = renderTask(task);
        const auto parsed = parseLine(line);
        QVERIFY2(parsed.has_value(), qPrintable(line));
        QVERIFY2(*parsed == task, qPrintable(line));
        QCOMPARE(renderTask(*parsed), line);
    }

    for (int value = int(data::TaskPriority::Lowest); value <= int(data::TaskPriority::Highest); ++value) {
        data::TaskRecord task;
        task.description = QStringLiteral("Priority");
        task.priority = static_cast<data::TaskPriority>(value);
        const auto parsed = parseLine(renderTask(task));
        QVERIFY(parsed.has_value());
        QVERIFY(parsed->priority == task.priority);
    }
}

void TaskRendererTest::normalizesLegacyAnchor()
{
    const auto task = parseLine(
        QString::fromUtf8("  - [ ] Legacy [[uuid: 96bb3816-aedd-4033-8ff6-4746a700aac8|⚔️]]"));
    QVERIFY(task.has_value());
    QCOMPARE(renderTask(*task),
             QString::fromUtf8("- [ ] Legacy [[id: 96bb3816-aedd-4033-8ff6-4746a700aac8|⚔️]]"));
}

QTEST_GUILESS_MAIN(TaskRendererTest)
#include "TaskRendererTest.moc"
