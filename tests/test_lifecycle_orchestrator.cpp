#include <QtTest>
#include <QTemporaryDir>
#include <QThreadPool>
#include <memory>
#include "core/plugin/FilenameCodec.hpp"
#include "core/plugin/LifecycleOrchestrator.hpp"
#include "core/plugin/PluginRegistry.hpp"
#include "core/services/BootRootSelection.hpp"
#include "support/MockHttpServer.hpp"

using pem::LifecycleOrchestrator;
using pem::ModeProfile;
using pem::OperationKind;
using pem::Plugin;
using pem::PluginMode;
using pem::PluginStatus;

struct Outcome {
    QString identity;
    OperationKind kind;
    bool ok;
    QString message;
};

// Orchestrator wired to a temporary boot root and a local HTTP server.
// Completion signals are collected on the test thread.
struct Fixture {
    explicit Fixture(PluginMode mode = PluginMode::CloudPE)
        : profile(ModeProfile::forMode(mode))
        , bootRoot(root.path())
    {
        server.start();
        pool.setMaxThreadCount(4);
        orchestrator = std::make_unique<LifecycleOrchestrator>(profile, &registry, &bootRoot, &pool);
        QObject::connect(orchestrator.get(), &LifecycleOrchestrator::operationFinished, &receiver,
                         [this](const QString& identity, OperationKind kind, bool ok, const QString& message) {
                             outcomes.append({identity, kind, ok, message});
                         });
    }

    ~Fixture()
    {
        server.release();
        orchestrator.reset();
    }

    Plugin remote(const QString& version = "2.0", const QString& path = "/mytool")
    {
        Plugin p;
        p.name = "MyTool";
        p.version = version;
        p.author = "alice";
        p.description = "A cool tool";
        p.size = "7 B";
        p.link = server.url(path);
        return p;
    }

    QString pluginDir() const { return profile.pluginDirectory(root.path()); }
    QString pluginPath(const QString& fileName) const { return QDir(pluginDir()).filePath(fileName); }

    void writePlugin(const QString& fileName, const QByteArray& content = "old")
    {
        QDir().mkpath(pluginDir());
        QFile f(pluginPath(fileName));
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(content);
    }

    QTemporaryDir root;
    ModeProfile profile;
    MockHttpServer server;
    pem::BootRootSelection bootRoot;
    pem::PluginRegistry registry;
    QThreadPool pool;
    QObject receiver;
    QList<Outcome> outcomes;
    std::unique_ptr<LifecycleOrchestrator> orchestrator;
};

class TestLifecycleOrchestrator : public QObject {
    Q_OBJECT
private slots:
    void testInstallDownloadsCanonicalFile();
    void testInstallWithoutBootRootIsNotFound();
    void testDuplicateStartRejected();
    void testProgressVisibleWhileRunning();
    void testUpdateReplacesOldVersion();
    void testUpdateAbortsWhenDeleteFails();
    void testUpdateInstalledUsesCatalog();
    void testUpdateInstalledWithoutCatalogEntry();
    void testFailedDownloadLeavesNoFile();
    void testEnableDisableRoundTrip();
    void testEnableMissingFileIsNotFound();
    void testRemove();
    void testDownloadToDirectory();
};

void TestLifecycleOrchestrator::testInstallDownloadsCanonicalFile()
{
    Fixture fx;
    fx.server.setRoute("/mytool", "payload");
    const Plugin remote = fx.remote();

    QCOMPARE(fx.registry.statusOf(remote), PluginStatus::NotInstalled);
    QVERIFY(fx.orchestrator->install(remote));
    QTRY_COMPARE(fx.outcomes.size(), 1);

    const Outcome& outcome = fx.outcomes.first();
    QVERIFY2(outcome.ok, qPrintable(outcome.message));
    QCOMPARE(outcome.identity, remote.identityKey());
    QCOMPARE(outcome.kind, OperationKind::Install);

    const QString path = fx.pluginPath("MyTool_2.0_alice_A_cool_tool.ce");
    QVERIFY(QFile::exists(path));
    QFile f(path);
    QVERIFY(f.open(QIODevice::ReadOnly));
    QCOMPARE(f.readAll(), QByteArray("payload"));

    // Rescan and task removal happened before the completion signal
    QCOMPARE(fx.registry.enabledPlugins().size(), 1);
    QCOMPARE(fx.registry.statusOf(remote), PluginStatus::Installed);
    QCOMPARE(fx.orchestrator->runningCount(), 0);
    QVERIFY(!fx.orchestrator->isRunning(remote.identityKey(), OperationKind::Install));
}

void TestLifecycleOrchestrator::testInstallWithoutBootRootIsNotFound()
{
    Fixture fx;
    fx.bootRoot.setRoot({});

    QVERIFY(fx.orchestrator->install(fx.remote()));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY(!fx.outcomes.first().ok);
    QVERIFY(fx.outcomes.first().message.contains("boot root"));
    QCOMPARE(fx.server.requestCount(), 0);
}

void TestLifecycleOrchestrator::testDuplicateStartRejected()
{
    Fixture fx;
    fx.server.setRoute("/mytool", "payload");
    fx.server.setHeld(true);
    const Plugin remote = fx.remote();

    QVERIFY(fx.orchestrator->update(remote));
    QVERIFY(!fx.orchestrator->update(remote));
    QCOMPARE(fx.orchestrator->runningCount(), 1);
    QVERIFY(fx.orchestrator->isRunning(remote.identityKey(), OperationKind::Update));

    // A different kind for the same plugin is its own task
    QVERIFY(fx.orchestrator->downloadTo(remote, fx.root.filePath("downloads")));
    QCOMPARE(fx.orchestrator->runningCount(), 2);

    QTRY_COMPARE(fx.server.requestCount("/mytool"), 2);
    fx.server.release();

    QTRY_COMPARE(fx.outcomes.size(), 2);
    QVERIFY(fx.outcomes[0].ok);
    QVERIFY(fx.outcomes[1].ok);
    QCOMPARE(fx.orchestrator->runningCount(), 0);
    QCOMPARE(fx.server.requestCount("/mytool"), 2);
}

void TestLifecycleOrchestrator::testProgressVisibleWhileRunning()
{
    Fixture fx;
    fx.server.setRoute("/mytool", "payload");
    fx.server.setHeld(true);
    const Plugin remote = fx.remote();

    QVERIFY(!fx.orchestrator->progress(remote.identityKey(), OperationKind::Install).has_value());
    QVERIFY(fx.orchestrator->install(remote));
    QVERIFY(fx.orchestrator->progress(remote.identityKey(), OperationKind::Install).has_value());

    QTRY_COMPARE(fx.server.requestCount(), 1);
    fx.server.release();
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY(!fx.orchestrator->progress(remote.identityKey(), OperationKind::Install).has_value());
}

void TestLifecycleOrchestrator::testUpdateReplacesOldVersion()
{
    Fixture fx;
    fx.server.setRoute("/mytool", "new version");
    fx.writePlugin("MyTool_1.0_alice_old_build.ce");
    QVERIFY(fx.orchestrator->rescan().ok());

    const Plugin remote = fx.remote();
    QCOMPARE(fx.registry.statusOf(remote), PluginStatus::UpdateAvailable);

    QVERIFY(fx.orchestrator->update(remote));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY2(fx.outcomes.first().ok, qPrintable(fx.outcomes.first().message));

    QVERIFY(!QFile::exists(fx.pluginPath("MyTool_1.0_alice_old_build.ce")));
    QVERIFY(QFile::exists(fx.pluginPath("MyTool_2.0_alice_A_cool_tool.ce")));
    QCOMPARE(fx.registry.enabledPlugins().size(), 1);
    QCOMPARE(fx.registry.enabledPlugins().first().version, QString("2.0"));
    QCOMPARE(fx.registry.statusOf(remote), PluginStatus::Installed);
}

void TestLifecycleOrchestrator::testUpdateAbortsWhenDeleteFails()
{
    Fixture fx;
    fx.server.setRoute("/mytool", "new version");
    const QString oldName = "MyTool_1.0_alice_old.ce";
    fx.writePlugin(oldName);
    QVERIFY(fx.orchestrator->rescan().ok());

    // Swap the file for a non-empty directory of the same name so deleting it fails
    QVERIFY(QFile::remove(fx.pluginPath(oldName)));
    QVERIFY(QDir().mkpath(fx.pluginPath(oldName)));
    QFile blocker(fx.pluginPath(oldName) + "/keep");
    QVERIFY(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    QVERIFY(fx.orchestrator->update(fx.remote()));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY(!fx.outcomes.first().ok);
    QVERIFY(fx.outcomes.first().message.contains("cannot delete"));

    // Never downloaded, so never two versions side by side
    QCOMPARE(fx.server.requestCount(), 0);
    QVERIFY(!QFile::exists(fx.pluginPath("MyTool_2.0_alice_A_cool_tool.ce")));
    QCOMPARE(fx.orchestrator->runningCount(), 0);
}

void TestLifecycleOrchestrator::testUpdateInstalledUsesCatalog()
{
    Fixture fx;
    fx.server.setRoute("/mytool", "new version");
    fx.writePlugin("MyTool_1.0_alice_old.ce");
    QVERIFY(fx.orchestrator->rescan().ok());

    pem::PluginCategory category;
    category.className = "Tools";
    category.plugins << fx.remote();
    fx.registry.replaceCatalog({category});

    const Plugin local = fx.registry.enabledPlugins().first();
    QVERIFY(fx.registry.hasUpdate(local));
    QVERIFY(fx.orchestrator->updateInstalled(local));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY2(fx.outcomes.first().ok, qPrintable(fx.outcomes.first().message));
    QCOMPARE(fx.outcomes.first().kind, OperationKind::Update);
    QVERIFY(!fx.registry.hasUpdate(fx.registry.enabledPlugins().first()));
}

void TestLifecycleOrchestrator::testUpdateInstalledWithoutCatalogEntry()
{
    Fixture fx;
    fx.writePlugin("MyTool_1.0_alice_old.ce");
    QVERIFY(fx.orchestrator->rescan().ok());

    QVERIFY(fx.orchestrator->updateInstalled(fx.registry.enabledPlugins().first()));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY(!fx.outcomes.first().ok);
    QVERIFY(fx.outcomes.first().message.contains("no catalog entry"));
    QVERIFY(QFile::exists(fx.pluginPath("MyTool_1.0_alice_old.ce")));
}

void TestLifecycleOrchestrator::testFailedDownloadLeavesNoFile()
{
    Fixture fx;
    QVERIFY(fx.orchestrator->install(fx.remote("2.0", "/missing")));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY(!fx.outcomes.first().ok);

    QVERIFY(!QFile::exists(fx.pluginPath("MyTool_2.0_alice_A_cool_tool.ce")));
    QVERIFY(fx.registry.enabledPlugins().isEmpty());
}

void TestLifecycleOrchestrator::testEnableDisableRoundTrip()
{
    Fixture fx(PluginMode::HotPE);
    const QString enabledName = "Drivers_bob_2.1_net.HPM";
    fx.writePlugin(enabledName);
    QVERIFY(fx.orchestrator->rescan().ok());
    QCOMPARE(fx.registry.enabledPlugins().size(), 1);

    QVERIFY(fx.orchestrator->disable(fx.registry.enabledPlugins().first()));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY2(fx.outcomes[0].ok, qPrintable(fx.outcomes[0].message));
    QCOMPARE(fx.outcomes[0].kind, OperationKind::Disable);
    QVERIFY(QFile::exists(fx.pluginPath("Drivers_bob_2.1_net.hpm.off")));
    QVERIFY(fx.registry.enabledPlugins().isEmpty());
    QCOMPARE(fx.registry.disabledPlugins().size(), 1);

    QVERIFY(fx.orchestrator->enable(fx.registry.disabledPlugins().first()));
    QTRY_COMPARE(fx.outcomes.size(), 2);
    QVERIFY2(fx.outcomes[1].ok, qPrintable(fx.outcomes[1].message));
    QVERIFY(QFile::exists(fx.pluginPath(enabledName)));
    QCOMPARE(fx.registry.enabledPlugins().size(), 1);
    QVERIFY(fx.registry.disabledPlugins().isEmpty());
}

void TestLifecycleOrchestrator::testEnableMissingFileIsNotFound()
{
    Fixture fx;
    Plugin ghost;
    ghost.name = "Ghost";
    ghost.author = "me";
    ghost.file = "Ghost_1.0_me_x.CBK";

    QVERIFY(fx.orchestrator->enable(ghost));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY(!fx.outcomes.first().ok);
    QVERIFY(fx.outcomes.first().message.contains("file not found"));
    QCOMPARE(fx.orchestrator->runningCount(), 0);
}

void TestLifecycleOrchestrator::testRemove()
{
    Fixture fx(PluginMode::Edgeless);
    fx.writePlugin("Chrome_120.0_team.7zf");
    QVERIFY(fx.orchestrator->rescan().ok());
    const Plugin local = fx.registry.disabledPlugins().first();

    QVERIFY(fx.orchestrator->remove(local).ok());
    QVERIFY(!QFile::exists(fx.pluginPath("Chrome_120.0_team.7zf")));
    // remove() leaves rescanning to the caller
    QCOMPARE(fx.registry.disabledPlugins().size(), 1);

    auto again = fx.orchestrator->remove(local);
    QCOMPARE(again.kind, pem::ErrorKind::NotFound);

    QVERIFY(fx.orchestrator->rescan().ok());
    QVERIFY(fx.registry.disabledPlugins().isEmpty());
}

void TestLifecycleOrchestrator::testDownloadToDirectory()
{
    Fixture fx;
    fx.server.setRoute("/mytool", "payload");
    const QString downloads = fx.root.filePath("downloads");
    fx.orchestrator->setDefaultDownloadDirectory(downloads);

    QVERIFY(fx.orchestrator->downloadTo(fx.remote()));
    QTRY_COMPARE(fx.outcomes.size(), 1);
    QVERIFY2(fx.outcomes.first().ok, qPrintable(fx.outcomes.first().message));
    QCOMPARE(fx.outcomes.first().kind, OperationKind::Download);

    QVERIFY(QFile::exists(downloads + "/MyTool_2.0_alice_A_cool_tool.ce"));
    // Outside the plugin folder: nothing installed
    QVERIFY(fx.registry.enabledPlugins().isEmpty());
}

QTEST_MAIN(TestLifecycleOrchestrator)
#include "test_lifecycle_orchestrator.moc"
