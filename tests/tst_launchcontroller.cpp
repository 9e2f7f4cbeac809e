#include <QTest>

#include "FakePlatformServices.h"
#include "LaunchController.h"

static SessionProfile profileFor(const QString &host, const QString &port,
                                 SessionMode mode = SessionMode::Ssh)
{
    SessionProfile p;
    p.name = "t";
    p.hostname = host;
    p.port = port;
    p.mode = mode;
    return p;
}

static LaunchController::Options emulatorOptions()
{
    LaunchController::Options o;
    o.host.kind = TerminalHost::Emulator;
    o.probeTimeoutSeconds = 3;
    return o;
}

class TestLaunchController : public QObject
{
    Q_OBJECT

private slots:
    void locateRecordsClientPaths()
    {
        FakePlatformServices fake;
        LaunchController ctl(fake, emulatorOptions());

        QVERIFY(ctl.locateClients());
        QVERIFY(ctl.clientAvailable(SessionMode::Ssh));
        QVERIFY(ctl.clientAvailable(SessionMode::Telnet));
        QVERIFY(ctl.terminalAvailable());
        QCOMPARE(ctl.clients().ssh, QString("/usr/bin/ssh"));
        QCOMPARE(ctl.options().host.terminalPath, QString("/usr/bin/xterm"));
    }

    void missingTelnetIsNotFatal()
    {
        FakePlatformServices fake;
        fake.executables.remove("telnet");
        LaunchController ctl(fake, emulatorOptions());

        QVERIFY(ctl.locateClients());
        QVERIFY(!ctl.clientAvailable(SessionMode::Telnet));

        Error err;
        QVERIFY(!ctl.launch(profileFor("router", "23", SessionMode::Telnet), "bob", nullptr, &err));
        QCOMPARE(err.kind, ErrorKind::NotFound);
        QVERIFY(fake.spawned.isEmpty());

        QVERIFY(ctl.launch(profileFor("host1", "22"), "bob", nullptr, &err));
        QCOMPARE(fake.spawned.size(), 1);
    }

    void missingSshIsNotFound()
    {
        FakePlatformServices fake;
        fake.executables.remove("ssh");
        LaunchController ctl(fake, emulatorOptions());

        Error err;
        QVERIFY(!ctl.locateClients(&err));
        QCOMPARE(err.kind, ErrorKind::NotFound);
        QVERIFY(!ctl.clientAvailable(SessionMode::Ssh));

        QVERIFY(!ctl.launch(profileFor("host1", "22"), "bob", nullptr, &err));
        QCOMPARE(err.kind, ErrorKind::NotFound);
        QVERIFY(fake.probes.isEmpty());
    }

    void missingTerminalBlocksLaunch()
    {
        FakePlatformServices fake;
        fake.executables.remove("xterm");
        LaunchController ctl(fake, emulatorOptions());

        Error err;
        QVERIFY(!ctl.locateClients(&err));
        QCOMPARE(err.kind, ErrorKind::NotFound);
        QVERIFY(!ctl.terminalAvailable());

        QVERIFY(!ctl.launch(profileFor("host1", "22"), "bob", nullptr, &err));
        QCOMPARE(err.kind, ErrorKind::NotFound);
        QVERIFY(fake.spawned.isEmpty());
    }

    void nativeHostNeedsNoTerminalLookup()
    {
        FakePlatformServices fake;
        fake.executables.remove("xterm");

        LaunchController::Options o;
        o.host.kind = TerminalHost::Native;
        LaunchController ctl(fake, o);

        QVERIFY(ctl.locateClients());
        QVERIFY(ctl.terminalAvailable());

        LaunchSpec spec;
        QVERIFY(ctl.launch(profileFor("host1", "22"), "bob", &spec));
        QCOMPARE(spec.program, QString("osascript"));
    }

    void launchChecksReachabilityThenSpawns()
    {
        FakePlatformServices fake;
        LaunchController ctl(fake, emulatorOptions());
        QVERIFY(ctl.locateClients());

        LaunchSpec spec;
        Error err;
        QVERIFY(ctl.launch(profileFor("10.0.0.5", "2222"), "user", &spec, &err));
        QVERIFY(!err.isSet());

        QCOMPARE(fake.probes.size(), 1);
        QCOMPARE(fake.probes.at(0).host, QString("10.0.0.5"));
        QCOMPARE(int(fake.probes.at(0).port), 2222);
        QCOMPARE(fake.probes.at(0).timeoutSeconds, 3);

        QCOMPARE(fake.spawned.size(), 1);
        QCOMPARE(fake.spawned.at(0).program, QString("/usr/bin/xterm"));
        QCOMPARE(spec.remoteCommand, QString("/usr/bin/ssh -p 2222 user@10.0.0.5"));
    }

    void unreachableHostSkipsSpawn_data()
    {
        QTest::addColumn<int>("kind");
        QTest::newRow("unreachable") << int(ErrorKind::Unreachable);
        QTest::newRow("timeout")     << int(ErrorKind::Timeout);
    }

    void unreachableHostSkipsSpawn()
    {
        QFETCH(int, kind);

        FakePlatformServices fake;
        fake.probeResult = ErrorKind(kind);
        LaunchController ctl(fake, emulatorOptions());
        QVERIFY(ctl.locateClients());

        Error err;
        QVERIFY(!ctl.launch(profileFor("10.0.0.5", "22"), "user", nullptr, &err));
        QCOMPARE(int(err.kind), kind);
        QCOMPARE(fake.probes.size(), 1);
        QVERIFY(fake.spawned.isEmpty());
    }

    void skippedReachabilityCheckGoesStraightToSpawn()
    {
        FakePlatformServices fake;
        fake.probeResult = ErrorKind::Timeout;

        LaunchController::Options o = emulatorOptions();
        o.skipProbe = true;
        LaunchController ctl(fake, o);
        QVERIFY(ctl.locateClients());

        QVERIFY(ctl.launch(profileFor("10.0.0.5", "22"), "user"));
        QVERIFY(fake.probes.isEmpty());
        QCOMPARE(fake.spawned.size(), 1);
    }

    void inputErrorsStopBeforeReachabilityCheck_data()
    {
        QTest::addColumn<QString>("host");
        QTest::addColumn<QString>("port");
        QTest::addColumn<int>("kind");

        QTest::newRow("no host")   << QString() << QString("22") << int(ErrorKind::Validation);
        QTest::newRow("bad user")  << QString("@host1") << QString("22") << int(ErrorKind::Format);
        QTest::newRow("no port")   << QString("host1") << QString() << int(ErrorKind::Validation);
        QTest::newRow("text port") << QString("host1") << QString("ssh") << int(ErrorKind::Validation);
    }

    void inputErrorsStopBeforeReachabilityCheck()
    {
        QFETCH(QString, host);
        QFETCH(QString, port);
        QFETCH(int, kind);

        FakePlatformServices fake;
        LaunchController ctl(fake, emulatorOptions());
        QVERIFY(ctl.locateClients());

        Error err;
        QVERIFY(!ctl.launch(profileFor(host, port), "bob", nullptr, &err));
        QCOMPARE(int(err.kind), kind);
        QVERIFY(fake.probes.isEmpty());
        QVERIFY(fake.spawned.isEmpty());
    }

    void spawnFailureIsReported()
    {
        FakePlatformServices fake;
        fake.spawnSucceeds = false;
        LaunchController ctl(fake, emulatorOptions());
        QVERIFY(ctl.locateClients());

        Error err;
        QVERIFY(!ctl.launch(profileFor("host1", "22"), "bob", nullptr, &err));
        QCOMPARE(err.kind, ErrorKind::Io);
    }

    void prepareDoesNotTouchPlatform()
    {
        FakePlatformServices fake;
        LaunchController ctl(fake, emulatorOptions());

        LaunchSpec spec;
        QVERIFY(ctl.prepare(profileFor("alice@host1", "22"), "bob", &spec));
        QCOMPARE(spec.user, QString("alice"));
        QCOMPARE(spec.remoteCommand, QString("ssh -p 22 alice@host1"));
        QVERIFY(fake.probes.isEmpty());
        QVERIFY(fake.spawned.isEmpty());
    }
};

QTEST_GUILESS_MAIN(TestLaunchController)
#include "tst_launchcontroller.moc"
