#include <QtTest>
#include <QTemporaryDir>
#include "core/plugin/LocalPluginScanner.hpp"

using pem::LocalPluginScanner;
using pem::ModeProfile;
using pem::PluginMode;

static void writeFile(const QString& path, int size)
{
    QFile f(path);
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write(QByteArray(size, 'x'));
    f.close();
}

class TestLocalPluginScanner : public QObject {
    Q_OBJECT
private slots:
    void testClassifiesEnabledAndDisabled();
    void testSizeFromFileLength();
    void testIgnoresUnrelatedEntries();
    void testHotPEDisabledNeverEnabled();
    void testCreatesMissingDirectory();
    void testNotADirectoryIsIo();
    void testDuplicatesCollapsed();
    void testRepeatedScanIsStable();
};

void TestLocalPluginScanner::testClassifiesEnabledAndDisabled()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    writeFile(tmp.filePath("MyTool_1.0_alice_A_cool_tool.ce"), 10);
    writeFile(tmp.filePath("Other_2.0_bob_desc.CBK"), 10);

    auto result = LocalPluginScanner::scan(tmp.path(), ModeProfile::forMode(PluginMode::CloudPE));
    QVERIFY(result.ok());
    QCOMPARE(result.value.enabled.size(), 1);
    QCOMPARE(result.value.disabled.size(), 1);
    QCOMPARE(result.value.enabled[0].name, QString("MyTool"));
    QCOMPARE(result.value.enabled[0].description, QString("A_cool_tool"));
    QCOMPARE(result.value.enabled[0].file, QString("MyTool_1.0_alice_A_cool_tool.ce"));
    QCOMPARE(result.value.disabled[0].author, QString("bob"));
}

void TestLocalPluginScanner::testSizeFromFileLength()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("Chrome_120_team.7z"), 1536);

    auto result = LocalPluginScanner::scan(tmp.path(), ModeProfile::forMode(PluginMode::Edgeless));
    QVERIFY(result.ok());
    QCOMPARE(result.value.enabled.size(), 1);
    QCOMPARE(result.value.enabled[0].size, QString("1.50 KB"));
}

void TestLocalPluginScanner::testIgnoresUnrelatedEntries()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("readme.txt"), 1);
    writeFile(tmp.filePath("short_1.ce"), 1);                 // too few tokens
    QVERIFY(QDir().mkpath(tmp.filePath("Sub_1.0_dir_x.ce")));  // directory, not a file
    writeFile(tmp.filePath("Real_1.0_me_desc.ce"), 1);

    auto result = LocalPluginScanner::scan(tmp.path(), ModeProfile::forMode(PluginMode::CloudPE));
    QVERIFY(result.ok());
    QCOMPARE(result.value.enabled.size(), 1);
    QCOMPARE(result.value.enabled[0].name, QString("Real"));
    QVERIFY(result.value.disabled.isEmpty());
}

void TestLocalPluginScanner::testHotPEDisabledNeverEnabled()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("Drivers_bob_2.1_net.hpm.off"), 1);
    writeFile(tmp.filePath("Shell_carol_1.0.HPM"), 1);
    writeFile(tmp.filePath("Old_dan_0.1.HPM.OFF"), 1);      // compound suffix is case-sensitive

    auto result = LocalPluginScanner::scan(tmp.path(), ModeProfile::forMode(PluginMode::HotPE));
    QVERIFY(result.ok());
    QCOMPARE(result.value.enabled.size(), 1);
    QCOMPARE(result.value.enabled[0].name, QString("Shell"));
    QCOMPARE(result.value.disabled.size(), 1);
    QCOMPARE(result.value.disabled[0].name, QString("Drivers"));
    QCOMPARE(result.value.disabled[0].description, QString("net"));
}

void TestLocalPluginScanner::testCreatesMissingDirectory()
{
    QTemporaryDir tmp;
    const QString dir = tmp.filePath("boot/ce-apps");
    QVERIFY(!QDir(dir).exists());

    auto result = LocalPluginScanner::scan(dir, ModeProfile::forMode(PluginMode::CloudPE));
    QVERIFY(result.ok());
    QVERIFY(QDir(dir).exists());
    QVERIFY(result.value.enabled.isEmpty());
}

void TestLocalPluginScanner::testNotADirectoryIsIo()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("ce-apps"), 1);

    auto result = LocalPluginScanner::scan(tmp.filePath("ce-apps"), ModeProfile::forMode(PluginMode::CloudPE));
    QVERIFY(!result.ok());
    QCOMPARE(result.status.kind, pem::ErrorKind::Io);
}

void TestLocalPluginScanner::testDuplicatesCollapsed()
{
    QTemporaryDir tmp;
    // One plugin, the enabled copies differing only in extension case
    writeFile(tmp.filePath("Tool_1.0_me.7z"), 5);
    writeFile(tmp.filePath("Tool_1.0_me.7zf"), 5);
    writeFile(tmp.filePath("Tool_1.0_me.7Z"), 5);

    auto result = LocalPluginScanner::scan(tmp.path(), ModeProfile::forMode(PluginMode::Edgeless));
    QVERIFY(result.ok());
    QCOMPARE(result.value.enabled.size(), 1);
    QCOMPARE(result.value.disabled.size(), 1);
}

void TestLocalPluginScanner::testRepeatedScanIsStable()
{
    QTemporaryDir tmp;
    writeFile(tmp.filePath("Zeta_2.0_zed_last.ce"), 3);
    writeFile(tmp.filePath("Alpha_1.0_al_first.ce"), 2048);
    writeFile(tmp.filePath("Mid_1.5_mo_x.CBK"), 7);
    writeFile(tmp.filePath("notes.txt"), 1);

    const ModeProfile& profile = ModeProfile::forMode(PluginMode::CloudPE);
    auto first = LocalPluginScanner::scan(tmp.path(), profile);
    auto second = LocalPluginScanner::scan(tmp.path(), profile);
    QVERIFY(first.ok());
    QVERIFY(second.ok());

    auto files = [](const QList<pem::Plugin>& plugins) {
        QStringList out;
        for (const auto& p : plugins)
            out << p.file + "|" + p.dedupKey();
        return out;
    };
    QCOMPARE(first.value.enabled.size(), 2);
    QCOMPARE(first.value.disabled.size(), 1);
    QCOMPARE(files(second.value.enabled), files(first.value.enabled));
    QCOMPARE(files(second.value.disabled), files(first.value.disabled));
}

QTEST_MAIN(TestLocalPluginScanner)
#include "test_local_plugin_scanner.moc"
