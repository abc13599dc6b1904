// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QtTest/QtTest>
#include "FilterEngine.h"

class TestFilterEngine : public QObject {
    Q_OBJECT

private:
    static QVector<Entry> sampleSet()
    {
        return EntryUtils::classifyLines({
            QStringLiteral("/home/user/doc.txt"),
            QStringLiteral("/home/user/Photos/"),
            QStringLiteral("/home/user/Photos/beach.JPG"),
            QStringLiteral("/home/user/Projects/report-2024.pdf"),
            QStringLiteral("/home/user/Projects/Report-draft.odt"),
            QStringLiteral("/srv/archive/report.tar.gz"),
        });
    }

    static QStringList names(const QVector<Entry>& entries)
    {
        QStringList out;
        for (const Entry& e : entries) out << e.name;
        return out;
    }

private slots:
    void testMatchAllWithoutTokensIsIdentity()
    {
        const QVector<Entry> raw = sampleSet();
        const QVector<Entry> out = FilterEngine::filter(raw, CategoryMatcher::matchAll(), {}, true);
        QCOMPARE(out, raw);
    }

    void testTokensAreAnded()
    {
        const QVector<Entry> out = FilterEngine::filter(
            sampleSet(), CategoryMatcher::matchAll(),
            {QStringLiteral("report"), QStringLiteral("projects")}, true);
        QCOMPARE(names(out), (QStringList{QStringLiteral("report-2024.pdf"), QStringLiteral("Report-draft.odt")}));
    }

    void testTokensMatchParentPath()
    {
        const QVector<Entry> out = FilterEngine::filter(
            sampleSet(), CategoryMatcher::matchAll(), {QStringLiteral("srv/")}, true);
        QCOMPARE(names(out), QStringList{QStringLiteral("report.tar.gz")});
    }

    void testCaseSensitivity()
    {
        const QVector<Entry> sensitive = FilterEngine::filter(
            sampleSet(), CategoryMatcher::matchAll(), {QStringLiteral("Report")}, false);
        QCOMPARE(names(sensitive), QStringList{QStringLiteral("Report-draft.odt")});

        const QVector<Entry> insensitive = FilterEngine::filter(
            sampleSet(), CategoryMatcher::matchAll(), {QStringLiteral("Report")}, true);
        QCOMPARE(insensitive.size(), 3);
    }

    void testCategoryAppliesFirst()
    {
        const QVector<Entry> out = FilterEngine::filter(
            sampleSet(), Categories::matcherFor(CategoryId::Documents), {QStringLiteral("report")}, true);
        QCOMPARE(names(out), (QStringList{QStringLiteral("report-2024.pdf"), QStringLiteral("Report-draft.odt")}));

        const QVector<Entry> dirs = FilterEngine::filter(
            sampleSet(), Categories::matcherFor(CategoryId::Directories), {}, true);
        QCOMPARE(names(dirs), QStringList{QStringLiteral("Photos")});
    }

    void testFilteringComposes()
    {
        const QVector<Entry> raw = sampleSet();
        const CategoryMatcher& c = Categories::matcherFor(CategoryId::AllCategories);
        const QStringList t1{QStringLiteral("home")};
        const QStringList t2{QStringLiteral("report")};

        const QVector<Entry> twoPasses = FilterEngine::filter(FilterEngine::filter(raw, c, t1, true), c, t2, true);
        const QVector<Entry> onePass = FilterEngine::filter(raw, c, t1 + t2, true);
        QCOMPARE(twoPasses, onePass);
    }

    void testRefinePattern()
    {
        QString err;
        const auto re = FilterEngine::compileRefinePattern(QStringLiteral("\\.(pdf|odt)$"), true, &err);
        QVERIFY(re.has_value());
        QVERIFY(err.isEmpty());

        const QVector<Entry> out = FilterEngine::filter(sampleSet(), CategoryMatcher::matchAll(), {}, true, &*re);
        QCOMPARE(out.size(), 2);
    }

    void testInvalidRefinePatternReportsError()
    {
        QString err;
        const auto re = FilterEngine::compileRefinePattern(QStringLiteral("(["), true, &err);
        QVERIFY(!re.has_value());
        QVERIFY(!err.isEmpty());
    }

    void testEmptyInput()
    {
        QVERIFY(FilterEngine::filter({}, Categories::matcherFor(CategoryId::Images), {QStringLiteral("x")}, true).isEmpty());
    }

    void testCasePolicyAutomatic()
    {
        QVERIFY(CasePolicy::autoCaseInsensitive(QStringLiteral("report")));
        QVERIFY(!CasePolicy::autoCaseInsensitive(QStringLiteral("Report")));
        QVERIFY(CasePolicy::autoCaseInsensitive(QStringLiteral("2024 ~/x")));
    }

    void testCasePolicyOverrideUntilCleared()
    {
        CasePolicy policy;
        policy.queryTextChanged(QStringLiteral("Report"));
        QVERIFY(!policy.caseInsensitiveFor(QStringLiteral("Report")));

        policy.setManualOverride(true);
        policy.queryTextChanged(QStringLiteral("Reports"));
        QVERIFY(policy.caseInsensitiveFor(QStringLiteral("Reports")));

        // Clearing the query hands control back to the automatic rule.
        policy.queryTextChanged(QStringLiteral("  "));
        QVERIFY(!policy.manualOverride().has_value());
        QVERIFY(!policy.caseInsensitiveFor(QStringLiteral("Reports")));
    }
};

QTEST_GUILESS_MAIN(TestFilterEngine)
#include "test_filter_engine.moc"
