#include <QtTest/QtTest>

#include <vector>

#include "marksync/text/LineParser.hpp"

using namespace marksync;
using namespace marksync::text;

namespace {
struct BankEntry
{
    const char *line;
    std::optional<data::TaskRecord> expected;
};

data::TaskRecord makeTask(data::TaskStatus status, const QString &description)
{
    data::TaskRecord task;
    task.status = status;
    task.description = description;
    return task;
}
} // namespace

class LineParserTest : public QObject
{
    Q_OBJECT

private slots:
    void taskBank();
    void simpleText();
    void completedWithDueDate();
    void canceledWithAnchor();
    void unparsableDateKeepsOtherFields();
    void everyMarkerAtOnce();
    void rejectsNonTasks();
    void rejectsMetadataWithoutDescription();
    void preambleStatuses();
    void splitKeepsEmojiInDescription();
    void malformedIdentifierIsDropped();
    void tagsSplitOnSlash();
};

void LineParserTest::taskBank()
{
    std::vector<BankEntry> bank;

    bank.push_back({ "- [ ] This is some simple text",
                     makeTask(data::TaskStatus::Pending, QStringLiteral("This is some simple text")) });

    data::TaskRecord due = makeTask(data::TaskStatus::Pending, QStringLiteral("Task with due date"));
    due.due = QDate(2025, 5, 19);
    bank.push_back({ "- [ ] Task with due date 📅 2025-05-19", due });

    data::TaskRecord created = makeTask(data::TaskStatus::Complete, QStringLiteral("Task with due date and creation date"));
    created.due = QDate(2025, 5, 27);
    created.created = QDate(2025, 5, 19);
    bank.push_back({ "- [x] Task with due date and creation date 📅 2025-05-27 ➕ 2025-05-19", created });

    data::TaskRecord anchored = makeTask(data::TaskStatus::Pending, QStringLiteral("Task with existing uuid"));
    anchored.identifier = QUuid(QStringLiteral("{a80c42ce-dd29-4dc7-8582-34f36fcf8b80}"));
    bank.push_back({ "- [ ] Task with existing uuid [[uuid: a80c42ce-dd29-4dc7-8582-34f36fcf8b80|⚔️]]", anchored });

    bank.push_back({ "- [ ] Task with invalid uuid [[uuid: uh-oh|⚔️]]",
                     makeTask(data::TaskStatus::Pending, QStringLiteral("Task with invalid uuid")) });

    data::TaskRecord tagged = makeTask(data::TaskStatus::Pending, QStringLiteral("Task with #some/tags"));
    tagged.tags = QStringList { QStringLiteral("some"), QStringLiteral("tags") };
    bank.push_back({ "- [ ] Task with #some/tags", tagged });

    data::TaskRecord project = makeTask(data::TaskStatus::Canceled, QStringLiteral("Task with a project"));
    project.project = QString::fromUtf8("Project text 🙂");
    bank.push_back({ " - [-] Task with a project 🔨 Project text 🙂", project });

    bank.push_back({ "Just a paragraph", std::nullopt });

    for (const BankEntry &entry : bank) {
        const QString line = QString::fromUtf8(entry.line);
        const auto parsed = parseLine(line);
        QVERIFY2(parsed.has_value() == entry.expected.has_value(), qPrintable(line));
        if (parsed) {
            QVERIFY2(*parsed == *entry.expected, qPrintable(line));
        }
    }
}

void LineParserTest::simpleText()
{
    const auto task = parseLine(QStringLiteral("- [ ] Simple text"));
    QVERIFY(task.has_value());
    QCOMPARE(task->description, QStringLiteral("Simple text"));
    QVERIFY(task->status == data::TaskStatus::Pending);
    QVERIFY(task->identifier.isNull());
    QVERIFY(!task->due.isValid());
    QVERIFY(!task->scheduled.isValid());
    QVERIFY(!task->start.isValid());
    QVERIFY(!task->created.isValid());
    QVERIFY(!task->done.isValid());
    QVERIFY(!task->canceled.isValid());
    QVERIFY(task->priority == data::TaskPriority::Normal);
    QVERIFY(!task->project.has_value());
    QVERIFY(task->tags.isEmpty());
}

void LineParserTest::completedWithDueDate()
{
    const auto task = parseLine(QString::fromUtf8("- [x] Buy milk 📅 2025-05-19"));
    QVERIFY(task.has_value());
    QVERIFY(task->status == data::TaskStatus::Complete);
    QCOMPARE(task->description, QStringLiteral("Buy milk"));
    QCOMPARE(task->due, QDate(2025, 5, 19));
}

void LineParserTest::canceledWithAnchor()
{
    const auto task = parseLine(QString::fromUtf8("- [-] Old task [[id: a80c42ce-dd29-4dc7-8582-34f36fcf8b80|⚔]]"));
    QVERIFY(task.has_value());
    QVERIFY(task->status == data::TaskStatus::Canceled);
    QCOMPARE(task->description, QStringLiteral("Old task"));
    QCOMPARE(task->identifier, QUuid(QStringLiteral("{a80c42ce-dd29-4dc7-8582-34f36fcf8b80}")));
}

void LineParserTest::unparsableDateKeepsOtherFields()
{
    const auto task = parseLine(QString::fromUtf8(
        "- [ ] Test task stuff 📅25 [[uuid: 96bb3816-aedd-4033-8ff6-4746a700aac8|⚔️]]"));
    QVERIFY(task.has_value());
    QCOMPARE(task->description, QStringLiteral("Test task stuff"));
    QVERIFY(!task->due.isValid());
    QCOMPARE(task->identifier, QUuid(QStringLiteral("{96bb3816-aedd-4033-8ff6-4746a700aac8}")));
}

void LineParserTest::everyMarkerAtOnce()
{
    const QString text = QString::fromUtf8(
        "Test #task stuff #project/tag 📅 2025-05-19 ⏳ 2025-05-19 🛫 2025-05-19 ➕ 2025-05-19 ✅ 2025-05-19 "
        "❌ 2025-05-19 🔨 This is a project 🔺⏫🔼🔽⏬️ [[uuid: 96bb3816-aedd-4033-8ff6-4746a700aac8|⚔️]]");

    const TaskParts parts = splitTaskParts(text);
    QCOMPARE(parts.identifier, QUuid(QStringLiteral("{96bb3816-aedd-4033-8ff6-4746a700aac8}")));
    QCOMPARE(parts.description, QStringLiteral("Test #task stuff #project/tag"));
    QCOMPARE(parts.metadata,
             QString::fromUtf8("📅 2025-05-19 ⏳ 2025-05-19 🛫 2025-05-19 ➕ 2025-05-19 ✅ 2025-05-19 "
                               "❌ 2025-05-19 🔨 This is a project 🔺⏫🔼🔽⏬️"));

    const auto task = parseLine(QStringLiteral("- [ ] ") + text);
    QVERIFY(task.has_value());
    const QDate date(2025, 5, 19);
    QCOMPARE(task->due, date);
    QCOMPARE(task->scheduled, date);
    QCOMPARE(task->start, date);
    QCOMPARE(task->created, date);
    QCOMPARE(task->done, date);
    QCOMPARE(task->canceled, date);
    QCOMPARE(*task->project, QStringLiteral("This is a project"));
    QVERIFY(task->priority == data::TaskPriority::Lowest);
    QCOMPARE(task->tags, (QStringList { QStringLiteral("task"), QStringLiteral("project"), QStringLiteral("tag") }));
}

void LineParserTest::rejectsNonTasks()
{
    QVERIFY(!parseLine(QString()).has_value());
    QVERIFY(!parseLine(QStringLiteral("This contains no task")).has_value());
    QVERIFY(!parseLine(QStringLiteral("- [?] Unknown marker")).has_value());
    QVERIFY(!parseLine(QStringLiteral("-[ ] Missing space")).has_value());
    QVERIFY(!parseLine(QStringLiteral("- [ ]")).has_value());
}

void LineParserTest::rejectsMetadataWithoutDescription()
{
    QVERIFY(!parseLine(QString::fromUtf8("- [ ] 📅 2025-05-19")).has_value());
    QVERIFY(!parseLine(QString::fromUtf8("- [ ]    [[id: a80c42ce-dd29-4dc7-8582-34f36fcf8b80|⚔️]]")).has_value());

    const TaskParts parts = splitTaskParts(QString::fromUtf8("📅 2025-05-19"));
    QCOMPARE(parts.description, QString());
    QCOMPARE(parts.metadata, QString::fromUtf8("📅 2025-05-19"));
}

void LineParserTest::preambleStatuses()
{
    QString pending = QStringLiteral("    - [ ] Complete this test");
    QVERIFY(parsePreamble(pending) == data::TaskStatus::Pending);
    QCOMPARE(pending, QStringLiteral("Complete this test"));

    QString complete = QStringLiteral("- [x] Done");
    QVERIFY(parsePreamble(complete) == data::TaskStatus::Complete);

    QString canceled = QStringLiteral("- [-] Dropped");
    QVERIFY(parsePreamble(canceled) == data::TaskStatus::Canceled);

    QString empty;
    QVERIFY(!parsePreamble(empty).has_value());
    QCOMPARE(empty, QString());

    QString plain = QStringLiteral("This contains no task");
    QVERIFY(!parsePreamble(plain).has_value());
    QCOMPARE(plain, QStringLiteral("This contains no task"));
}

void LineParserTest::splitKeepsEmojiInDescription()
{
    const TaskParts parts = splitTaskParts(QString::fromUtf8("Make a  🥪 📅 2025-05-19"));
    QCOMPARE(parts.description, QString::fromUtf8("Make a  🥪"));
    QCOMPARE(parts.metadata, QString::fromUtf8("📅 2025-05-19"));
    QVERIFY(parts.identifier.isNull());

    const TaskParts trivial = splitTaskParts(QString());
    QVERIFY(trivial.description.isEmpty());
    QVERIFY(trivial.metadata.isEmpty());
}

void LineParserTest::malformedIdentifierIsDropped()
{
    const TaskParts parts = splitTaskParts(QString::fromUtf8("Test task stuff [[uuid: abcd|⚔️]]"));
    QVERIFY(parts.identifier.isNull());
    QCOMPARE(parts.description, QStringLiteral("Test task stuff"));

    QVERIFY(!parseIdentifier(QStringLiteral("abcd")).has_value());
    QVERIFY(!parseIdentifier(QStringLiteral("zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz")).has_value());
    QVERIFY(parseIdentifier(QStringLiteral("96bb3816-aedd-4033-8ff6-4746a700aac8")).has_value());
}

void LineParserTest::tagsSplitOnSlash()
{
    QCOMPARE(parseTags(QStringLiteral("#These/are/some_tags and #tags")),
             (QStringList { QStringLiteral("These"), QStringLiteral("are"), QStringLiteral("some_tags"),
                            QStringLiteral("tags") }));
    QCOMPARE(parseTags(QStringLiteral("#a #a/b #/ ok")), (QStringList { QStringLiteral("a"), QStringLiteral("b") }));
    QVERIFY(parseTags(QStringLiteral("no tags here")).isEmpty());
}

QTEST_GUILESS_MAIN(LineParserTest)
#include "LineParserTest.moc"
