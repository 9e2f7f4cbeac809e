// Logger.cpp
#include "Logger.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTextStream>
#include <QMutex>
#include <QMutexLocker>
#include <QAtomicInt>
#include <QDebug>

#include <cstdio>     // fprintf
#include <cstdlib>    // abort

// =====================================================
// Process-wide state
// =====================================================

static QFile*     g_file  = nullptr;   // owned here
static QMutex     g_mutex;             // guards g_file / g_path
static QString    g_path;
static QAtomicInt g_level(1);          // 0=Errors only, 1=Normal, 2=Debug
static QAtomicInt g_echo(0);

// A record emitted while formatting a record is dropped.
static thread_local bool g_inHandler = false;

static const char* levelTag(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// 0: WARN and above, 1: INFO and above, 2: everything
static bool allowMessage(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();
    if (type == QtFatalMsg || type == QtCriticalMsg || type == QtWarningMsg)
        return true;
    if (type == QtInfoMsg)
        return lvl >= 1;
    return lvl >= 2;
}

// One record = one physical line.
static QString oneLine(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

static QString formatRecord(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");

    QString line = QString("%1 [%2] ").arg(ts, QLatin1String(levelTag(type)));
    if (ctx.file && ctx.function) {
        line += QString("%1:%2 %3 - ")
                    .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                    .arg(ctx.line)
                    .arg(QString::fromUtf8(ctx.function));
    }
    line += oneLine(msg);
    return line;
}

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (!allowMessage(type) || g_inHandler) {
        if (type == QtFatalMsg) abort();
        return;
    }
    g_inHandler = true;

    const QString record = formatRecord(type, ctx, msg);

    {
        QMutexLocker lock(&g_mutex);

        const bool toFile = g_file && g_file->isOpen();
        if (toFile) {
            QTextStream out(g_file);
            out.setCodec("UTF-8");
            out << record << "\n";
            out.flush();
        }

        if (!toFile || g_echo.loadAcquire()) {
            std::fprintf(stderr, "%s\n", record.toUtf8().constData());
            std::fflush(stderr);
        }
    }

    g_inHandler = false;
    if (type == QtFatalMsg) abort();
}

// =====================================================
// Size-based rotation: log -> .1 -> .2 -> .3
// =====================================================
static void rotateIfNeeded(const QString& path, qint64 maxBytes = 2 * 1024 * 1024, int keep = 3)
{
    const QFileInfo fi(path);
    if (!fi.exists() || fi.size() < maxBytes)
        return;

    QFile::remove(path + "." + QString::number(keep));
    for (int i = keep - 1; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        if (QFileInfo::exists(older))
            QFile::rename(older, path + "." + QString::number(i + 1));
    }
    QFile::rename(path, path + ".1");
}

// Must be called with g_mutex held.
static void closeLocked()
{
    if (!g_file) return;
    if (g_file->isOpen()) g_file->close();
    delete g_file;
    g_file = nullptr;
}

namespace Logger {

void install(const QString& appName, const QString& overridePath)
{
    const QString chosen = overridePath.trimmed().isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)
              + "/logs/" + appName + ".log"
        : QDir::cleanPath(overridePath.trimmed());

    QDir().mkpath(QFileInfo(chosen).absolutePath());
    rotateIfNeeded(chosen);

    {
        QMutexLocker lock(&g_mutex);
        closeLocked();

        g_path = chosen;
        g_file = new QFile(g_path);
        if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "Logger: failed to open log file: %s\n",
                         g_path.toUtf8().constData());
            std::fflush(stderr);
            closeLocked();
        }
    }

    qInstallMessageHandler(handler);
    qInfo().noquote() << QString("Logger initialized: %1").arg(chosen);
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

void setEchoToStderr(bool on)
{
    g_echo.storeRelease(on ? 1 : 0);
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

void shutdown()
{
    QMutexLocker lock(&g_mutex);
    closeLocked();
}

} // namespace Logger
